#pragma once

#include "client/projectile_synchronizer.hpp"
#include "common/weapon_stats.hpp"
#include "protocol/projectile_messages.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <random>

namespace volley::client {

// Gates local shots on the weapon's fire rate and spawns the prediction for
// each accepted shot. The cooldown is what keeps one prediction per owner in
// flight.
class FireControl {
public:
    explicit FireControl(WeaponStats weapon, uint32_t seed = std::random_device{}());

    const WeaponStats& weapon() const { return weapon_; }

    bool ready(double now_ms) const;

    /**
     * Fire if the cooldown allows. Spawns the predicted projectile and returns
     * the request to send to the server.
     */
    std::optional<protocol::ShootRequest> fire(double now_ms, uint32_t owner_id, const glm::vec3& muzzle,
                                               const glm::vec3& aim, ProjectileSynchronizer& projectiles);

private:
    glm::vec3 apply_spread(const glm::vec3& dir);

    WeaponStats weapon_;
    std::optional<double> last_fire_ms_;
    std::mt19937 rng_;
};

} // namespace volley::client
