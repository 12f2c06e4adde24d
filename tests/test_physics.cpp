#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "common/character_physics.hpp"
#include "common/physics_constants.hpp"
#include "common/projectile_physics.hpp"
#include <glm/gtc/constants.hpp>
#include <cmath>

using namespace volley;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float DT = static_cast<float>(physics::FIXED_TIMESTEP);

float horizontal_speed(const CharacterState& s) {
    return std::sqrt(s.velocity.x * s.velocity.x + s.velocity.z * s.velocity.z);
}

}

TEST_CASE("Characters settle on flat ground", "[physics]") {
    CharacterState state;
    state.position.y = 2.0f;

    for (int i = 0; i < 120; ++i) step_character(state, {}, DT, nullptr);

    REQUIRE(state.is_grounded);
    REQUIRE(state.position.y == physics::GROUND_HEIGHT);
    REQUIRE(state.velocity.y == 0.0f);
}

TEST_CASE("Movement is camera relative and speed capped", "[physics]") {
    CharacterState state;
    CharacterInput input;
    input.forward = 1.0f;

    SECTION("Yaw 0 walks along +z") {
        for (int i = 0; i < 120; ++i) step_character(state, input, DT, nullptr);
        REQUIRE(state.position.z > 5.0f);
        REQUIRE_THAT(state.position.x, WithinAbs(0.0, 1e-4));
        REQUIRE(horizontal_speed(state) <= character::MAX_SPEED + 1e-3f);
    }

    SECTION("Yaw pi/2 walks along +x") {
        input.camera_yaw = glm::half_pi<float>();
        for (int i = 0; i < 120; ++i) step_character(state, input, DT, nullptr);
        REQUIRE(state.position.x > 5.0f);
        REQUIRE(state.yaw == input.camera_yaw);
    }

    SECTION("Sprint raises the cap") {
        input.sprint = true;
        for (int i = 0; i < 120; ++i) step_character(state, input, DT, nullptr);
        REQUIRE(horizontal_speed(state) > character::MAX_SPEED);
        REQUIRE(horizontal_speed(state) <= character::MAX_SPEED * character::SPRINT_MULTIPLIER + 1e-3f);
    }

    SECTION("Shallow water slows walking") {
        state.water_depth = 0.5f;
        for (int i = 0; i < 120; ++i) step_character(state, input, DT, nullptr);
        REQUIRE(horizontal_speed(state) <= character::MAX_SPEED * character::WADE_MULTIPLIER + 1e-3f);
    }
}

TEST_CASE("Friction stops a grounded character", "[physics]") {
    CharacterState state;
    state.is_grounded = true;
    state.velocity = {6.0f, 0.0f, 0.0f};

    for (int i = 0; i < 60; ++i) step_character(state, {}, DT, nullptr);
    REQUIRE(horizontal_speed(state) == 0.0f);
}

TEST_CASE("Jump fires once per press", "[physics]") {
    CharacterState state;
    step_character(state, {}, DT, nullptr);
    REQUIRE(state.is_grounded);

    CharacterInput held;
    held.jump = true;
    step_character(state, held, DT, nullptr);
    REQUIRE(state.position.y > 0.0f);

    // Still holding after landing: no second jump
    for (int i = 0; i < 120; ++i) step_character(state, held, DT, nullptr);
    REQUIRE(state.is_grounded);
    REQUIRE(state.position.y == 0.0f);

    step_character(state, {}, DT, nullptr);
    step_character(state, held, DT, nullptr);
    REQUIRE(state.position.y > 0.0f);
}

TEST_CASE("Play area edges stop the character", "[physics]") {
    CharacterState state;
    state.is_grounded = true;
    state.position.x = physics::PLAY_AREA_HALF_EXTENT - 0.01f;
    state.velocity.x = 100.0f;

    step_character(state, {}, DT, nullptr);

    REQUIRE(state.position.x == physics::PLAY_AREA_HALF_EXTENT);
    REQUIRE(state.velocity.x == 0.0f);
}

TEST_CASE("Characters collide with level geometry", "[physics]") {
    BoxWorld level;
    level.add_box({{-20.0f, -1.0f, -20.0f}, {40.0f, 0.0f, 20.0f}});

    SECTION("Landing on a floor box") {
        CharacterState state;
        state.position = {0.0f, 3.0f, 0.0f};
        for (int i = 0; i < 180; ++i) step_character(state, {}, DT, &level);

        REQUIRE(state.is_grounded);
        REQUIRE(state.position.y >= character::HITBOX_HALF);
        REQUIRE(state.position.y < character::HITBOX_HALF + character::GROUND_PROBE);
    }

    SECTION("Walking up a low ledge") {
        level.add_box({{2.0f, 0.0f, -20.0f}, {40.0f, 0.4f, 20.0f}});

        CharacterState state;
        state.position = {0.0f, character::HITBOX_HALF + 0.01f, 0.0f};
        CharacterInput input;
        input.forward = 1.0f;
        input.camera_yaw = glm::half_pi<float>();
        for (int i = 0; i < 120; ++i) step_character(state, input, DT, &level);

        REQUIRE(state.position.x > 4.0f);
        REQUIRE(state.position.y > 0.4f + character::HITBOX_HALF - 0.01f);
    }

    SECTION("Walls higher than a step block movement") {
        level.add_box({{2.0f, 0.0f, -20.0f}, {3.0f, 5.0f, 20.0f}});

        CharacterState state;
        state.position = {0.0f, character::HITBOX_HALF + 0.01f, 0.0f};
        CharacterInput input;
        input.forward = 1.0f;
        input.camera_yaw = glm::half_pi<float>();
        for (int i = 0; i < 120; ++i) step_character(state, input, DT, &level);

        REQUIRE(state.position.x < 2.0f - character::HITBOX_HALF + 0.01f);
    }
}

TEST_CASE("Projectiles fly flat until gravity starts", "[physics]") {
    ProjectileState p;
    p.direction = {1.0f, 0.0f, 0.0f};
    p.speed = 10.0f;
    p.lifetime = 10.0f;
    p.gravity_start_distance = 5.0f;

    for (int i = 0; i < 4; ++i) step_projectile(p, 0.1f);
    REQUIRE(p.position.y == 0.0f);
    REQUIRE_THAT(p.distance_traveled, WithinAbs(4.0, 1e-4));

    for (int i = 0; i < 3; ++i) step_projectile(p, 0.1f);
    REQUIRE(p.position.y < 0.0f);
    REQUIRE_THAT(p.lifetime, WithinAbs(9.3, 1e-4));
}

TEST_CASE("Ray against box", "[physics]") {
    glm::vec3 center(0.0f, 0.0f, 5.0f);

    auto hit = ray_vs_aabb({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, 10.0f, center, 0.5f);
    REQUIRE(hit.hit);
    REQUIRE_THAT(hit.distance, WithinAbs(4.5, 1e-5));

    REQUIRE_FALSE(ray_vs_aabb({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, 4.0f, center, 0.5f).hit);
    REQUIRE_FALSE(ray_vs_aabb({2.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, 10.0f, center, 0.5f).hit);
}
