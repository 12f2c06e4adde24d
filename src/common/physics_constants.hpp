#pragma once

namespace volley {

// Shared with the server. Prediction is only deterministic while both sides
// use identical values.
namespace physics {

constexpr float GRAVITY = -20.0f;
constexpr float GROUND_HEIGHT = 0.0f;
constexpr double FIXED_TIMESTEP = 1.0 / 60.0;
constexpr double MAX_FRAME_DELTA = 0.25;
constexpr float PLAY_AREA_HALF_EXTENT = 270.0f;

} // namespace physics

namespace character {

constexpr float ACCELERATION = 35.0f;
constexpr float MAX_SPEED = 8.0f;
constexpr float SPRINT_MULTIPLIER = 1.5f;
constexpr float WADE_MULTIPLIER = 0.5f;
constexpr float FRICTION = 15.0f;
constexpr float AIR_CONTROL = 0.3f;
constexpr float JUMP_VELOCITY = 8.0f;
constexpr float STEP_HEIGHT = 0.6f;
constexpr float GROUND_PROBE = 0.05f;
constexpr float HITBOX_HALF = 0.5f;
constexpr float HEAD_OFFSET_Y = 0.8f;  // head box center above the character position
constexpr float HEAD_HALF = 0.3f;

} // namespace character

namespace projectile {

constexpr float GRAVITY = -9.8f;
constexpr float DEFAULT_LIFETIME = 2.0f;
constexpr float DEFAULT_GRAVITY_START_DISTANCE = 50.0f;
constexpr int SUBSTEPS = 4;
constexpr float SPAWN_OFFSET = 0.75f;

} // namespace projectile

} // namespace volley
