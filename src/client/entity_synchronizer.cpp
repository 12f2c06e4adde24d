#include "entity_synchronizer.hpp"
#include <SDL3/SDL_log.h>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace volley::client {

using namespace volley::protocol;

EntitySynchronizer::EntitySynchronizer(const GeometryQuery* geometry, SyncSettings settings)
    : geometry_(geometry), settings_(settings) {
    if (settings_.fixed_timestep <= 0.0f || settings_.interpolation_window <= 0.0f) {
        throw std::invalid_argument("EntitySynchronizer: timestep and interpolation window must be positive");
    }
    if (settings_.input_buffer_size == 0) {
        throw std::invalid_argument("EntitySynchronizer: input buffer must hold at least one input");
    }
}

CharacterInput EntitySynchronizer::to_character_input(const InputSample& input) {
    CharacterInput ci;
    ci.forward = static_cast<float>(input.forward);
    ci.right = static_cast<float>(input.right);
    ci.camera_yaw = input.camera_yaw;
    ci.jump = input.jump;
    ci.sprint = input.sprint;
    return ci;
}

entt::entity EntitySynchronizer::find(uint32_t id) const {
    auto it = network_to_entity_.find(id);
    return it != network_to_entity_.end() ? it->second : entt::null;
}

entt::entity EntitySynchronizer::create_entity(uint32_t id, const glm::vec3& position) {
    if (find(id) != entt::null) {
        remove(id);
    }
    auto entity = registry_.create();
    registry_.emplace<ecs::NetworkId>(entity, id);
    registry_.emplace<ecs::RenderPose>(entity, ecs::RenderPose{position});
    registry_.emplace<ecs::WaterState>(entity);
    network_to_entity_[id] = entity;
    return entity;
}

entt::entity EntitySynchronizer::create_local(uint32_t id, const glm::vec3& position) {
    if (local_id_ && *local_id_ != id) {
        remove(*local_id_);
    }
    auto entity = create_entity(id, position);
    registry_.emplace<ecs::LocalPlayer>(entity);
    auto& prediction = registry_.emplace<ecs::Prediction>(entity);
    prediction.character.position = position;
    prediction.prev_position = position;
    local_id_ = id;
    SDL_Log("EntitySynchronizer: local entity %u", id);
    return entity;
}

entt::entity EntitySynchronizer::create_remote(uint32_t id, const glm::vec3& position) {
    if (local_id_ && *local_id_ == id) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EntitySynchronizer: %u is the local entity", id);
        return find(id);
    }
    auto entity = create_entity(id, position);
    registry_.emplace<ecs::RemotePlayer>(entity);
    auto& interp = registry_.emplace<ecs::Interpolation>(entity);
    interp.prev_position = position;
    interp.target_position = position;
    return entity;
}

bool EntitySynchronizer::remove(uint32_t id) {
    auto it = network_to_entity_.find(id);
    if (it == network_to_entity_.end()) return false;
    registry_.destroy(it->second);
    network_to_entity_.erase(it);
    if (local_id_ && *local_id_ == id) local_id_.reset();
    return true;
}

void EntitySynchronizer::clear() {
    registry_.clear();
    network_to_entity_.clear();
    local_id_.reset();
}

void EntitySynchronizer::set_local_input(const InputSample& input) {
    if (!local_id_) return;
    auto& prediction = registry_.get<ecs::Prediction>(find(*local_id_));

    prediction.pending_inputs.push_back(
        ecs::PendingInput{input, prediction.character.has_jumped, prediction.character.is_grounded});
    while (prediction.pending_inputs.size() > settings_.input_buffer_size) {
        prediction.pending_inputs.pop_front();
    }
    prediction.current_input = input;
}

void EntitySynchronizer::apply_snapshot(const TransformSnapshot& snapshot) {
    auto entity = find(snapshot.entity_id);
    if (entity == entt::null) return;

    auto& water = registry_.get<ecs::WaterState>(entity);
    water.in_water = snapshot.is_in_water;
    water.head_underwater = snapshot.is_head_underwater;
    water.breath_remaining = snapshot.breath_remaining;
    water.depth = snapshot.water_depth;
    water.exhausted = snapshot.is_exhausted;

    if (registry_.all_of<ecs::Prediction>(entity)) {
        reconcile_local(entity, snapshot);
    } else {
        retarget_remote(entity, snapshot);
    }
}

void EntitySynchronizer::reconcile_local(entt::entity entity, const TransformSnapshot& snapshot) {
    auto& prediction = registry_.get<ecs::Prediction>(entity);
    auto& character = prediction.character;

    auto& pending = prediction.pending_inputs;
    while (!pending.empty() && pending.front().input.sequence <= snapshot.last_processed_input) {
        pending.pop_front();
    }

    glm::vec3 old_predicted = character.position;

    // Rotation and head pitch stay client-authoritative
    character.position = snapshot.position;
    character.velocity = snapshot.velocity;
    character.water_depth = snapshot.water_depth;
    if (!pending.empty()) {
        character.has_jumped = pending.front().has_jumped;
        character.is_grounded = pending.front().is_grounded;
    }

    for (const auto& entry : pending) {
        step_character(character, to_character_input(entry.input), settings_.fixed_timestep, geometry_);
    }

    glm::vec3 delta = old_predicted - character.position;
    if (glm::length(delta) > settings_.snap_distance) {
        prediction.error_offset = glm::vec3(0.0f);
        prediction.prev_position = character.position;
        prediction.smooth_y = character.position.y;
        SDL_Log("EntitySynchronizer: local entity snapped %.2f units", glm::length(delta));
    } else {
        // Shift the interpolation origin too so the rendered pose does not move
        prediction.prev_position -= delta;
        prediction.error_offset += delta;
    }
}

void EntitySynchronizer::retarget_remote(entt::entity entity, const TransformSnapshot& snapshot) {
    auto& interp = registry_.get<ecs::Interpolation>(entity);
    auto& pose = registry_.get<ecs::RenderPose>(entity);

    interp.target_head_pitch = snapshot.head_pitch;

    if (glm::length(snapshot.position - pose.position) > settings_.snap_distance) {
        pose.position = snapshot.position;
        pose.rotation = snapshot.rotation;
        pose.head_pitch = snapshot.head_pitch;
        interp.prev_position = interp.target_position = snapshot.position;
        interp.prev_rotation = interp.target_rotation = snapshot.rotation;
        interp.progress = 1.0f;
        return;
    }

    interp.prev_position = pose.position;
    interp.prev_rotation = pose.rotation;
    interp.target_position = snapshot.position;
    interp.target_rotation = snapshot.rotation;
    interp.progress = 0.0f;
}

void EntitySynchronizer::fixed_update(float dt) {
    auto local_view = registry_.view<ecs::Prediction>();
    for (auto entity : local_view) {
        auto& prediction = local_view.get<ecs::Prediction>(entity);
        auto& character = prediction.character;
        prediction.prev_position = character.position;

        CharacterInput input;
        input.camera_yaw = character.yaw;
        if (prediction.current_input) {
            input = to_character_input(*prediction.current_input);
            prediction.head_pitch = prediction.current_input->camera_pitch;
            prediction.current_input.reset();
        }

        step_character(character, input, dt, geometry_);
    }

    auto remote_view = registry_.view<ecs::Interpolation>();
    for (auto entity : remote_view) {
        auto& interp = remote_view.get<ecs::Interpolation>(entity);
        interp.progress = std::min(1.0f, interp.progress + dt / settings_.interpolation_window);
    }
}

void EntitySynchronizer::update(float frame_dt, float alpha) {
    auto local_view = registry_.view<ecs::Prediction, ecs::RenderPose>();
    for (auto entity : local_view) {
        update_local(local_view.get<ecs::Prediction>(entity), local_view.get<ecs::RenderPose>(entity),
                     frame_dt, alpha);
    }

    auto remote_view = registry_.view<ecs::Interpolation, ecs::RenderPose>();
    for (auto entity : remote_view) {
        update_remote(remote_view.get<ecs::Interpolation>(entity), remote_view.get<ecs::RenderPose>(entity),
                      alpha);
    }
}

void EntitySynchronizer::update_local(ecs::Prediction& prediction, ecs::RenderPose& pose,
                                      float frame_dt, float alpha) {
    // Exponential decay never changes the offset's sign
    prediction.error_offset *= std::exp(-settings_.error_decay_rate * frame_dt);
    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(prediction.error_offset[axis]) < settings_.error_epsilon) {
            prediction.error_offset[axis] = 0.0f;
        }
    }

    const auto& current = prediction.character.position;
    const auto& prev = prediction.prev_position;
    glm::vec3 blended = glm::mix(prev, current, alpha);

    if (!prediction.smooth_y_initialized) {
        prediction.smooth_y = blended.y;
        prediction.smooth_y_initialized = true;
    }
    if (blended.y < prediction.smooth_y) {
        prediction.smooth_y = blended.y;
    } else if (blended.y > prediction.smooth_y) {
        prediction.smooth_y += std::min(blended.y - prediction.smooth_y, settings_.max_rise_speed * frame_dt);
    }

    pose.position = glm::vec3(blended.x, prediction.smooth_y, blended.z) + prediction.error_offset;
    pose.rotation = glm::angleAxis(prediction.character.yaw, glm::vec3(0.0f, 1.0f, 0.0f));
    pose.head_pitch = prediction.head_pitch;
}

void EntitySynchronizer::update_remote(ecs::Interpolation& interp, ecs::RenderPose& pose, float alpha) {
    float t = std::min(1.0f, interp.progress + alpha * settings_.fixed_timestep / settings_.interpolation_window);
    pose.position = glm::mix(interp.prev_position, interp.target_position, t);
    pose.rotation = glm::slerp(interp.prev_rotation, interp.target_rotation, t);
    pose.head_pitch = interp.target_head_pitch;
}

std::optional<glm::vec3> EntitySynchronizer::position(uint32_t id) const {
    auto entity = find(id);
    if (entity == entt::null) return std::nullopt;
    if (const auto* prediction = registry_.try_get<ecs::Prediction>(entity)) {
        return prediction->character.position;
    }
    return registry_.get<ecs::Interpolation>(entity).target_position;
}

std::optional<glm::vec3> EntitySynchronizer::render_position(uint32_t id) const {
    auto entity = find(id);
    if (entity == entt::null) return std::nullopt;
    return registry_.get<ecs::RenderPose>(entity).position;
}

std::optional<ecs::WaterState> EntitySynchronizer::water_state(uint32_t id) const {
    auto entity = find(id);
    if (entity == entt::null) return std::nullopt;
    return registry_.get<ecs::WaterState>(entity);
}

glm::vec3 EntitySynchronizer::error_offset() const {
    if (!local_id_) return glm::vec3(0.0f);
    return registry_.get<ecs::Prediction>(find(*local_id_)).error_offset;
}

size_t EntitySynchronizer::pending_input_count() const {
    if (!local_id_) return 0;
    return registry_.get<ecs::Prediction>(find(*local_id_)).pending_inputs.size();
}

} // namespace volley::client
