#include "projectile_synchronizer.hpp"
#include "client/entity_synchronizer.hpp"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <stdexcept>

namespace volley::client {

using namespace volley::protocol;

namespace {
constexpr double WINDOW_EPSILON = 1e-6;
}

ProjectileSynchronizer::ProjectileSynchronizer(const EntitySynchronizer& entities, ProjectileSettings settings)
    : entities_(entities), settings_(settings) {
    if (settings_.substeps < 1) {
        throw std::invalid_argument("ProjectileSynchronizer: at least one collision substep required");
    }
}

ProjectileId ProjectileSynchronizer::create(ProjectileId id, const ProjectileSpawn& spawn, bool predicted,
                                            float gravity_start_distance) {
    ProjectileRecord record;
    record.id = id;
    record.is_predicted = predicted;
    record.spawn_time = now_;
    record.state.owner_id = spawn.owner_id;
    record.state.position = spawn.position;
    record.state.direction = spawn.direction;
    record.state.speed = spawn.speed;
    record.state.velocity_y = spawn.direction.y * spawn.speed;
    record.state.lifetime = settings_.lifetime;
    record.state.gravity_start_distance = gravity_start_distance;
    projectiles_[id] = record;
    return id;
}

ProjectileId ProjectileSynchronizer::spawn_predicted(const ProjectileSpawn& spawn,
                                                     std::optional<float> gravity_start_distance) {
    ProjectileId id = next_predicted_id_--;
    create(id, spawn, true, gravity_start_distance.value_or(settings_.gravity_start_distance));
    recent_predicted_.push_back(id);
    return id;
}

bool ProjectileSynchronizer::confirm_prediction(uint32_t owner_id) {
    for (auto it = recent_predicted_.begin(); it != recent_predicted_.end(); ++it) {
        auto proj = projectiles_.find(*it);
        if (proj == projectiles_.end() || proj->second.state.owner_id != owner_id) continue;
        projectiles_.erase(proj);
        recent_predicted_.erase(it);
        return true;
    }
    return false;
}

bool ProjectileSynchronizer::spawn_from_server(const ProjectileSpawn& spawn) {
    confirm_prediction(spawn.owner_id);

    ProjectileId id = static_cast<ProjectileId>(spawn.entity_id);
    if (projectiles_.count(id)) return false;
    create(id, spawn, false, settings_.gravity_start_distance);
    return true;
}

size_t ProjectileSynchronizer::spawn_batch_from_server(const ProjectileSpawnBatch& batch) {
    if (batch.spawns.empty()) return 0;

    // One shot, one prediction, however many pellets the server rolled
    confirm_prediction(batch.spawns.front().owner_id);

    size_t created = 0;
    for (const auto& spawn : batch.spawns) {
        ProjectileId id = static_cast<ProjectileId>(spawn.entity_id);
        if (projectiles_.count(id)) continue;
        create(id, spawn, false, settings_.gravity_start_distance);
        ++created;
    }
    return created;
}

std::optional<glm::vec3> ProjectileSynchronizer::destroy(ProjectileId id) {
    auto it = projectiles_.find(id);
    if (it == projectiles_.end()) return std::nullopt;
    glm::vec3 position = it->second.state.position;
    projectiles_.erase(it);
    if (id < 0) {
        recent_predicted_.erase(std::remove(recent_predicted_.begin(), recent_predicted_.end(), id),
                                recent_predicted_.end());
    }
    return position;
}

void ProjectileSynchronizer::clear() {
    projectiles_.clear();
    recent_predicted_.clear();
}

void ProjectileSynchronizer::fixed_update(float dt) {
    now_ += dt;

    std::vector<ProjectileId> to_remove;
    std::vector<ProjectileHit> hits;

    for (auto& [id, record] : projectiles_) {
        glm::vec3 prev = record.state.position;
        step_projectile(record.state, dt);

        if (record.state.lifetime <= 0.0f) {
            to_remove.push_back(id);
            continue;
        }

        if (auto hit = sweep(record, prev)) {
            to_remove.push_back(id);
            hits.push_back(*hit);
        }
    }

    for (ProjectileId id : to_remove) {
        destroy(id);
    }
    if (hit_handler_) {
        for (const auto& hit : hits) hit_handler_(hit);
    }

    prune_expired_predictions();
}

void ProjectileSynchronizer::prune_expired_predictions() {
    auto it = recent_predicted_.begin();
    while (it != recent_predicted_.end()) {
        auto proj = projectiles_.find(*it);
        if (proj == projectiles_.end()) {
            it = recent_predicted_.erase(it);
            continue;
        }
        if (now_ - proj->second.spawn_time + WINDOW_EPSILON >= settings_.match_window) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                         "ProjectileSynchronizer: prediction %lld unconfirmed, discarded",
                         static_cast<long long>(*it));
            projectiles_.erase(proj);
            it = recent_predicted_.erase(it);
            continue;
        }
        ++it;
    }
}

std::optional<ProjectileHit> ProjectileSynchronizer::sweep(const ProjectileRecord& record,
                                                            const glm::vec3& from) const {
    glm::vec3 travel = record.state.position - from;
    if (glm::length(travel) < 0.0001f) return std::nullopt;

    std::optional<ProjectileHit> result;
    for (int s = 0; s < settings_.substeps && !result; ++s) {
        glm::vec3 start = from + travel * (static_cast<float>(s) / settings_.substeps);
        glm::vec3 end = from + travel * (static_cast<float>(s + 1) / settings_.substeps);
        glm::vec3 seg = end - start;
        float length = glm::length(seg);
        if (length < 0.0001f) continue;
        glm::vec3 dir = seg / length;

        entities_.for_each_hitbox([&](uint32_t entity_id, const glm::vec3& body) {
            if (result || entity_id == record.state.owner_id) return;

            // The body box is the collision box, centered on the character position
            glm::vec3 head = body + glm::vec3(0.0f, character::HEAD_OFFSET_Y, 0.0f);

            // Head first, same priority as the server
            if (ray_vs_aabb(start, dir, length, head, character::HEAD_HALF).hit) {
                result = ProjectileHit{record.id, entity_id, true};
            } else if (ray_vs_aabb(start, dir, length, body, character::HITBOX_HALF).hit) {
                result = ProjectileHit{record.id, entity_id, false};
            }
        });
    }
    return result;
}

size_t ProjectileSynchronizer::predicted_count() const {
    return static_cast<size_t>(std::count_if(projectiles_.begin(), projectiles_.end(),
        [](const auto& entry) { return entry.second.is_predicted; }));
}

const ProjectileRecord* ProjectileSynchronizer::find(ProjectileId id) const {
    auto it = projectiles_.find(id);
    return it != projectiles_.end() ? &it->second : nullptr;
}

} // namespace volley::client
