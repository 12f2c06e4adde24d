#include "fire_control.hpp"
#include "common/physics_constants.hpp"
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <utility>

namespace volley::client {

using namespace volley::protocol;

FireControl::FireControl(WeaponStats weapon, uint32_t seed)
    : weapon_(std::move(weapon)), rng_(seed) {
}

bool FireControl::ready(double now_ms) const {
    return !last_fire_ms_ || now_ms - *last_fire_ms_ >= weapon_.cooldown_ms();
}

glm::vec3 FireControl::apply_spread(const glm::vec3& dir) {
    if (weapon_.min_accuracy <= 0.0f) return dir;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    float cone = unit(rng_) * weapon_.min_accuracy;
    float spin = unit(rng_) * glm::two_pi<float>();

    // Any vector perpendicular to dir, rotated around it by spin
    glm::vec3 ref = std::abs(dir.y) < 0.9f ? glm::vec3(0.0f, 1.0f, 0.0f) : glm::vec3(1.0f, 0.0f, 0.0f);
    glm::vec3 perp = glm::normalize(glm::cross(dir, ref));
    glm::vec3 rotated = perp * std::cos(spin) + glm::cross(perp, dir) * std::sin(spin);

    return glm::normalize(dir * std::cos(cone) + rotated * std::sin(cone));
}

std::optional<ShootRequest> FireControl::fire(double now_ms, uint32_t owner_id, const glm::vec3& muzzle,
                                              const glm::vec3& aim, ProjectileSynchronizer& projectiles) {
    if (!ready(now_ms)) return std::nullopt;
    if (glm::length(aim) < 0.001f) return std::nullopt;

    glm::vec3 base = glm::normalize(aim);
    glm::vec3 dir = apply_spread(base);

    ProjectileSpawn spawn;
    spawn.owner_id = owner_id;
    spawn.position = muzzle + dir * projectile::SPAWN_OFFSET;
    spawn.direction = dir;
    spawn.speed = weapon_.projectile_speed;
    projectiles.spawn_predicted(spawn, weapon_.gravity_start_distance);

    last_fire_ms_ = now_ms;

    ShootRequest request;
    request.timestamp = now_ms;
    request.direction = base;
    request.spawn_position = spawn.position;
    return request;
}

} // namespace volley::client
