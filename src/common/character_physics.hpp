#pragma once

#include "common/geometry_query.hpp"
#include <glm/glm.hpp>

namespace volley {

struct CharacterState {
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    float yaw = 0.0f;
    bool is_grounded = false;
    bool has_jumped = false;    // jump held since last takeoff
    float water_depth = 0.0f;   // last server value; shallow water slows walking
};

struct CharacterInput {
    float forward = 0.0f;
    float right = 0.0f;
    float camera_yaw = 0.0f;
    bool jump = false;
    bool sprint = false;
};

// Advance one character by dt. Identical to the server's step so that replayed
// inputs reproduce the server's result. A null geometry means flat ground at y = 0.
void step_character(CharacterState& state, const CharacterInput& input, float dt,
                    const GeometryQuery* geometry);

} // namespace volley
