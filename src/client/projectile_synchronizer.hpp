#pragma once

#include "common/physics_constants.hpp"
#include "common/projectile_physics.hpp"
#include "protocol/projectile_messages.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace volley::client {

class EntitySynchronizer;

// Negative ids are local placeholders, non-negative ids come from the server
using ProjectileId = int64_t;

struct ProjectileRecord {
    ProjectileId id = 0;
    ProjectileState state;
    bool is_predicted = false;
    double spawn_time = 0.0;  // simulation seconds
};

struct ProjectileSettings {
    float lifetime = projectile::DEFAULT_LIFETIME;
    float gravity_start_distance = projectile::DEFAULT_GRAVITY_START_DISTANCE;
    double match_window = 0.5;  // seconds a prediction waits for its confirmation
    int substeps = projectile::SUBSTEPS;
};

struct ProjectileHit {
    ProjectileId projectile = 0;
    uint32_t entity_id = 0;
    bool headshot = false;
};

/**
 * Client-side projectiles, both speculative and server-confirmed.
 *
 * A local shot spawns a predicted projectile immediately. The fire-rate
 * cooldown keeps at most one prediction per owner in flight, so the next
 * server spawn (or spawn batch) from that owner confirms it: the prediction
 * is destroyed and the authoritative projectile(s) take its place. A
 * prediction left unconfirmed for the match window is discarded.
 *
 * Local hits only despawn; damage is the server's call.
 */
class ProjectileSynchronizer {
public:
    using HitHandler = std::function<void(const ProjectileHit&)>;

    explicit ProjectileSynchronizer(const EntitySynchronizer& entities, ProjectileSettings settings = {});

    /** Returns the placeholder id. entity_id of the spawn is ignored. */
    ProjectileId spawn_predicted(const protocol::ProjectileSpawn& spawn,
                                 std::optional<float> gravity_start_distance = std::nullopt);
    /** Returns false when the id already exists. */
    bool spawn_from_server(const protocol::ProjectileSpawn& spawn);
    /** Returns the number of projectiles created. */
    size_t spawn_batch_from_server(const protocol::ProjectileSpawnBatch& batch);

    /** Removes a projectile. Returns its last position, or nothing if unknown. */
    std::optional<glm::vec3> destroy(ProjectileId id);
    void clear();

    void fixed_update(float dt);

    void set_hit_handler(HitHandler handler) { hit_handler_ = std::move(handler); }

    size_t size() const { return projectiles_.size(); }
    size_t predicted_count() const;
    size_t recent_predicted_count() const { return recent_predicted_.size(); }
    const ProjectileRecord* find(ProjectileId id) const;
    double now() const { return now_; }

    template<typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& [id, record] : projectiles_) fn(record);
    }

private:
    ProjectileId create(ProjectileId id, const protocol::ProjectileSpawn& spawn, bool predicted,
                        float gravity_start_distance);
    bool confirm_prediction(uint32_t owner_id);
    std::optional<ProjectileHit> sweep(const ProjectileRecord& record, const glm::vec3& from) const;
    void prune_expired_predictions();

    const EntitySynchronizer& entities_;
    ProjectileSettings settings_;
    std::map<ProjectileId, ProjectileRecord> projectiles_;
    std::vector<ProjectileId> recent_predicted_;  // oldest first
    ProjectileId next_predicted_id_ = -1;
    double now_ = 0.0;
    HitHandler hit_handler_;
};

} // namespace volley::client
