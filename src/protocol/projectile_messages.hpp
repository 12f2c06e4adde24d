#pragma once

#include "protocol/opcode.hpp"
#include "protocol/serializable.hpp"
#include <glm/glm.hpp>
#include <stdexcept>
#include <vector>

namespace volley::protocol {

struct ProjectileSpawn : Serializable<ProjectileSpawn> {
    static constexpr Opcode opcode = Opcode::ProjectileSpawn;

    uint32_t entity_id = 0;
    uint32_t owner_id = 0;
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f, 0.0f, 1.0f};
    float speed = 0.0f;

    static constexpr size_t serialized_size() { return 36; }

    void serialize_impl(BufferWriter& w) const {
        w.write(entity_id);
        w.write(owner_id);
        w.write(position.x); w.write(position.y); w.write(position.z);
        w.write(direction.x); w.write(direction.y); w.write(direction.z);
        w.write(speed);
    }

    void deserialize_impl(BufferReader& r) {
        entity_id = r.read<uint32_t>();
        owner_id = r.read<uint32_t>();
        position.x = r.read<float>(); position.y = r.read<float>(); position.z = r.read<float>();
        direction.x = r.read<float>(); direction.y = r.read<float>(); direction.z = r.read<float>();
        speed = r.read<float>();
    }
};

// All pellets of one multi-pellet shot, same owner.
struct ProjectileSpawnBatch : Serializable<ProjectileSpawnBatch> {
    static constexpr Opcode opcode = Opcode::ProjectileSpawnBatch;
    static constexpr size_t MAX_ENTRIES = 255;

    std::vector<ProjectileSpawn> spawns;

    size_t serialized_size() const { return 1 + spawns.size() * ProjectileSpawn::serialized_size(); }

    void serialize_impl(BufferWriter& w) const {
        if (spawns.size() > MAX_ENTRIES) {
            throw std::length_error("ProjectileSpawnBatch: too many entries");
        }
        w.write(static_cast<uint8_t>(spawns.size()));
        for (const auto& spawn : spawns) {
            spawn.serialize(w);
        }
    }

    void deserialize_impl(BufferReader& r) {
        uint8_t count = r.read<uint8_t>();
        spawns.resize(count);
        for (auto& spawn : spawns) {
            spawn.deserialize(r);
        }
    }
};

struct ProjectileDestroy : Serializable<ProjectileDestroy> {
    static constexpr Opcode opcode = Opcode::ProjectileDestroy;

    uint32_t entity_id = 0;

    static constexpr size_t serialized_size() { return 4; }

    void serialize_impl(BufferWriter& w) const { w.write(entity_id); }
    void deserialize_impl(BufferReader& r) { entity_id = r.read<uint32_t>(); }
};

// Client -> server fire request. The server validates and answers with
// ProjectileSpawn or ProjectileSpawnBatch.
struct ShootRequest : Serializable<ShootRequest> {
    static constexpr Opcode opcode = Opcode::ShootRequest;

    double timestamp = 0.0;
    glm::vec3 direction{0.0f, 0.0f, 1.0f};
    glm::vec3 spawn_position{0.0f};

    static constexpr size_t serialized_size() { return 32; }

    void serialize_impl(BufferWriter& w) const {
        w.write(timestamp);
        w.write(direction.x); w.write(direction.y); w.write(direction.z);
        w.write(spawn_position.x); w.write(spawn_position.y); w.write(spawn_position.z);
    }

    void deserialize_impl(BufferReader& r) {
        timestamp = r.read<double>();
        direction.x = r.read<float>(); direction.y = r.read<float>(); direction.z = r.read<float>();
        spawn_position.x = r.read<float>(); spawn_position.y = r.read<float>(); spawn_position.z = r.read<float>();
    }
};

} // namespace volley::protocol
