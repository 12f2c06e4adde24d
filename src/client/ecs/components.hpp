#pragma once

#include "common/character_physics.hpp"
#include "protocol/player_input.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <deque>
#include <optional>

namespace volley::client::ecs {

// Coordinate system: Y-up. x,z form the horizontal ground plane.

struct NetworkId {
    uint32_t id = 0;
};

struct LocalPlayer {};
struct RemotePlayer {};

// Pose handed to rendering, recomputed once per frame
struct RenderPose {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float head_pitch = 0.0f;
};

struct WaterState {
    bool in_water = false;
    bool head_underwater = false;
    float breath_remaining = 0.0f;
    float depth = 0.0f;
    bool exhausted = false;
};

// An input sent to the server, with the jump and ground flags the character
// had before the input was applied
struct PendingInput {
    protocol::InputSample input;
    bool has_jumped = false;
    bool is_grounded = false;
};

// Local entity only. The character is simulated every physics step and
// reconciled against the server by replaying unacknowledged inputs.
struct Prediction {
    CharacterState character;
    glm::vec3 prev_position{0.0f};   // position at the start of the last step
    glm::vec3 error_offset{0.0f};    // visual correction, decays toward zero
    float smooth_y = 0.0f;
    bool smooth_y_initialized = false;
    float head_pitch = 0.0f;

    std::optional<protocol::InputSample> current_input;
    std::deque<PendingInput> pending_inputs;  // sent, not yet acknowledged
};

// Remote entities only. Blends between the last rendered pose and the newest
// snapshot over the interpolation window.
struct Interpolation {
    glm::vec3 prev_position{0.0f};
    glm::vec3 target_position{0.0f};
    glm::quat prev_rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::quat target_rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float target_head_pitch = 0.0f;
    float progress = 1.0f;  // advanced per physics step
};

} // namespace volley::client::ecs
