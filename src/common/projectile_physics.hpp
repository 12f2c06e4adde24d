#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace volley {

struct ProjectileState {
    uint32_t owner_id = 0;
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f, 0.0f, 1.0f};
    float speed = 0.0f;
    float velocity_y = 0.0f;
    float lifetime = 0.0f;
    float distance_traveled = 0.0f;
    float gravity_start_distance = 0.0f;
};

// Straight horizontal flight; vertical velocity starts from direction.y * speed
// and gravity only engages once the horizontal distance reaches
// gravity_start_distance.
void step_projectile(ProjectileState& p, float dt);

struct RayHit {
    bool hit = false;
    float distance = 0.0f;
};

// Slab test of a normalized ray segment [0, length] against a cube.
RayHit ray_vs_aabb(const glm::vec3& origin, const glm::vec3& dir, float length,
                   const glm::vec3& center, float half);

} // namespace volley
