#include "character_physics.hpp"
#include "common/physics_constants.hpp"
#include <algorithm>
#include <cmath>

namespace volley {

namespace {

bool blocked(const GeometryQuery& geometry, const glm::vec3& center) {
    glm::vec3 half(character::HITBOX_HALF);
    return geometry.overlaps(Aabb::from_center(center, half));
}

void apply_horizontal_input(CharacterState& state, const CharacterInput& input, float dt) {
    float fwd_x = std::sin(input.camera_yaw);
    float fwd_z = std::cos(input.camera_yaw);
    float right_x = -std::cos(input.camera_yaw);
    float right_z = std::sin(input.camera_yaw);

    float move_x = fwd_x * input.forward + right_x * input.right;
    float move_z = fwd_z * input.forward + right_z * input.right;
    float move_len = std::sqrt(move_x * move_x + move_z * move_z);

    if (move_len > 0.01f) {
        float control = state.is_grounded ? 1.0f : character::AIR_CONTROL;
        state.velocity.x += (move_x / move_len) * character::ACCELERATION * dt * control;
        state.velocity.z += (move_z / move_len) * character::ACCELERATION * dt * control;

        float max_speed = character::MAX_SPEED;
        if (input.sprint) max_speed *= character::SPRINT_MULTIPLIER;
        if (state.water_depth > 0.0f && state.is_grounded) max_speed *= character::WADE_MULTIPLIER;

        float speed = std::sqrt(state.velocity.x * state.velocity.x + state.velocity.z * state.velocity.z);
        if (speed > max_speed) {
            float scale = max_speed / speed;
            state.velocity.x *= scale;
            state.velocity.z *= scale;
        }
    } else if (state.is_grounded) {
        float speed = std::sqrt(state.velocity.x * state.velocity.x + state.velocity.z * state.velocity.z);
        if (speed > 0.01f) {
            float scale = std::max(0.0f, speed - character::FRICTION * dt) / speed;
            state.velocity.x *= scale;
            state.velocity.z *= scale;
        } else {
            state.velocity.x = 0.0f;
            state.velocity.z = 0.0f;
        }
    }
}

// Axis-separated move; a grounded character may climb up to STEP_HEIGHT.
void move_with_geometry(CharacterState& state, float dt, const GeometryQuery& geometry) {
    glm::vec3 target = state.position + state.velocity * dt;

    glm::vec3 probe(target.x, state.position.y, state.position.z);
    if (!blocked(geometry, probe)) {
        state.position.x = target.x;
    } else if (state.is_grounded &&
               !blocked(geometry, {target.x, state.position.y + character::STEP_HEIGHT, state.position.z})) {
        state.position.x = target.x;
        state.position.y += character::STEP_HEIGHT;
    } else {
        state.velocity.x = 0.0f;
    }

    probe = {state.position.x, target.y, state.position.z};
    if (!blocked(geometry, probe)) {
        state.position.y = target.y;
    } else {
        if (state.velocity.y < 0.0f) state.is_grounded = true;
        state.velocity.y = 0.0f;
    }

    probe = {state.position.x, state.position.y, target.z};
    if (!blocked(geometry, probe)) {
        state.position.z = target.z;
    } else if (state.is_grounded &&
               !blocked(geometry, {state.position.x, state.position.y + character::STEP_HEIGHT, target.z})) {
        state.position.z = target.z;
        state.position.y += character::STEP_HEIGHT;
    } else {
        state.velocity.z = 0.0f;
    }

    glm::vec3 ground_probe = state.position;
    ground_probe.y -= character::GROUND_PROBE;
    state.is_grounded = blocked(geometry, ground_probe);
}

void clamp_axis(float& pos, float& vel) {
    if (pos > physics::PLAY_AREA_HALF_EXTENT) {
        pos = physics::PLAY_AREA_HALF_EXTENT;
        vel = 0.0f;
    } else if (pos < -physics::PLAY_AREA_HALF_EXTENT) {
        pos = -physics::PLAY_AREA_HALF_EXTENT;
        vel = 0.0f;
    }
}

} // namespace

void step_character(CharacterState& state, const CharacterInput& input, float dt,
                    const GeometryQuery* geometry) {
    apply_horizontal_input(state, input, dt);

    // Jump fires once per press
    if (!input.jump && state.has_jumped) {
        state.has_jumped = false;
    }
    if (input.jump && state.is_grounded && !state.has_jumped) {
        state.velocity.y = character::JUMP_VELOCITY;
        state.has_jumped = true;
        state.is_grounded = false;
    }

    if (!state.is_grounded) {
        state.velocity.y += physics::GRAVITY * dt;
    }

    if (geometry) {
        move_with_geometry(state, dt, *geometry);
    } else {
        state.position += state.velocity * dt;
        if (state.position.y <= physics::GROUND_HEIGHT) {
            state.position.y = physics::GROUND_HEIGHT;
            state.velocity.y = 0.0f;
            state.is_grounded = true;
        }
    }

    clamp_axis(state.position.x, state.velocity.x);
    clamp_axis(state.position.z, state.velocity.z);

    state.yaw = input.camera_yaw;
}

} // namespace volley
