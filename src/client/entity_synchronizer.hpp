#pragma once

#include "client/ecs/components.hpp"
#include "common/geometry_query.hpp"
#include "common/physics_constants.hpp"
#include "protocol/player_input.hpp"
#include "protocol/transform_snapshot.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace volley::client {

struct SyncSettings {
    float fixed_timestep = static_cast<float>(physics::FIXED_TIMESTEP);
    float interpolation_window = 0.05f;  // seconds to blend toward a new remote snapshot
    float snap_distance = 4.0f;          // corrections beyond this are teleports
    float error_decay_rate = 10.0f;      // 1/s
    float error_epsilon = 0.001f;
    float max_rise_speed = 4.0f;         // visual Y climb rate, units/s
    size_t input_buffer_size = 64;
};

/**
 * Owns the per-entity transform table and is its only writer.
 *
 * The local entity is predicted every physics step from the input captured
 * for that step. Server snapshots for it rewind to the server state, replay
 * the inputs the server has not yet processed and fold the difference into
 * a decaying visual error offset. Remote entities are never simulated; they
 * interpolate between the last rendered pose and the newest snapshot.
 */
class EntitySynchronizer {
public:
    explicit EntitySynchronizer(const GeometryQuery* geometry = nullptr, SyncSettings settings = {});

    entt::entity create_local(uint32_t id, const glm::vec3& position = glm::vec3(0.0f));
    entt::entity create_remote(uint32_t id, const glm::vec3& position = glm::vec3(0.0f));
    bool remove(uint32_t id);
    void clear();

    /** Input for the coming physics step. Also buffered for replay. */
    void set_local_input(const protocol::InputSample& input);

    void apply_snapshot(const protocol::TransformSnapshot& snapshot);

    void fixed_update(float dt);
    void update(float frame_dt, float alpha);

    bool contains(uint32_t id) const { return network_to_entity_.count(id) > 0; }
    size_t size() const { return network_to_entity_.size(); }
    std::optional<uint32_t> local_id() const { return local_id_; }

    // Simulated position (local) or latest snapshot target (remote)
    std::optional<glm::vec3> position(uint32_t id) const;
    std::optional<glm::vec3> render_position(uint32_t id) const;
    std::optional<ecs::WaterState> water_state(uint32_t id) const;
    glm::vec3 error_offset() const;
    size_t pending_input_count() const;

    // fn(uint32_t id, const glm::vec3& position) for every tracked entity
    template<typename Fn>
    void for_each_hitbox(Fn&& fn) const {
        auto view = registry_.view<const ecs::NetworkId, const ecs::RenderPose>();
        for (auto entity : view) {
            fn(view.get<const ecs::NetworkId>(entity).id, view.get<const ecs::RenderPose>(entity).position);
        }
    }

    const entt::registry& registry() const { return registry_; }
    const SyncSettings& settings() const { return settings_; }

private:
    entt::entity find(uint32_t id) const;
    entt::entity create_entity(uint32_t id, const glm::vec3& position);
    void reconcile_local(entt::entity entity, const protocol::TransformSnapshot& snapshot);
    void retarget_remote(entt::entity entity, const protocol::TransformSnapshot& snapshot);
    void update_local(ecs::Prediction& prediction, ecs::RenderPose& pose, float frame_dt, float alpha);
    void update_remote(ecs::Interpolation& interp, ecs::RenderPose& pose, float alpha);

    static CharacterInput to_character_input(const protocol::InputSample& input);

    entt::registry registry_;
    std::unordered_map<uint32_t, entt::entity> network_to_entity_;
    std::optional<uint32_t> local_id_;
    const GeometryQuery* geometry_;
    SyncSettings settings_;
};

} // namespace volley::client
