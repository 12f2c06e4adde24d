#include "projectile_physics.hpp"
#include "common/physics_constants.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace volley {

void step_projectile(ProjectileState& p, float dt) {
    float dx = p.direction.x * p.speed * dt;
    float dz = p.direction.z * p.speed * dt;
    p.position.x += dx;
    p.position.z += dz;
    p.distance_traveled += std::sqrt(dx * dx + dz * dz);

    p.position.y += p.velocity_y * dt;
    if (p.distance_traveled >= p.gravity_start_distance) {
        p.velocity_y += projectile::GRAVITY * dt;
    }

    p.lifetime -= dt;
}

RayHit ray_vs_aabb(const glm::vec3& origin, const glm::vec3& dir, float length,
                   const glm::vec3& center, float half) {
    float tmin = 0.0f;
    float tmax = length;

    for (int axis = 0; axis < 3; ++axis) {
        float lo = center[axis] - half;
        float hi = center[axis] + half;
        if (std::abs(dir[axis]) < 1e-8f) {
            if (origin[axis] < lo || origin[axis] > hi) return {};
            continue;
        }
        float inv = 1.0f / dir[axis];
        float t1 = (lo - origin[axis]) * inv;
        float t2 = (hi - origin[axis]) * inv;
        if (t1 > t2) std::swap(t1, t2);
        tmin = std::max(tmin, t1);
        tmax = std::min(tmax, t2);
        if (tmin > tmax) return {};
    }

    return {true, tmin};
}

} // namespace volley
