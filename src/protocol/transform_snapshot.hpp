#pragma once

#include "protocol/opcode.hpp"
#include "protocol/serializable.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace volley::protocol {

// Authoritative per-entity state broadcast by the server every tick.
struct TransformSnapshot : Serializable<TransformSnapshot> {
    static constexpr Opcode opcode = Opcode::TransformUpdate;

    uint32_t entity_id = 0;
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};  // glm stores w first
    glm::vec3 velocity{0.0f};
    float head_pitch = 0.0f;
    uint32_t last_processed_input = 0;

    // Water state, server-simulated only
    bool is_in_water = false;
    bool is_head_underwater = false;
    float breath_remaining = 0.0f;
    float water_depth = 0.0f;
    bool is_exhausted = false;

    static constexpr size_t serialized_size() { return 63; }

    void serialize_impl(BufferWriter& w) const {
        w.write(entity_id);
        w.write(position.x); w.write(position.y); w.write(position.z);
        // x, y, z, w on the wire
        w.write(rotation.x); w.write(rotation.y); w.write(rotation.z); w.write(rotation.w);
        w.write(velocity.x); w.write(velocity.y); w.write(velocity.z);
        w.write(head_pitch);
        w.write(last_processed_input);
        w.write_bool(is_in_water);
        w.write_bool(is_head_underwater);
        w.write(breath_remaining);
        w.write(water_depth);
        w.write_bool(is_exhausted);
    }

    void deserialize_impl(BufferReader& r) {
        entity_id = r.read<uint32_t>();
        position.x = r.read<float>(); position.y = r.read<float>(); position.z = r.read<float>();
        rotation.x = r.read<float>(); rotation.y = r.read<float>();
        rotation.z = r.read<float>(); rotation.w = r.read<float>();
        velocity.x = r.read<float>(); velocity.y = r.read<float>(); velocity.z = r.read<float>();
        head_pitch = r.read<float>();
        last_processed_input = r.read<uint32_t>();
        is_in_water = r.read_bool();
        is_head_underwater = r.read_bool();
        breath_remaining = r.read<float>();
        water_depth = r.read<float>();
        is_exhausted = r.read_bool();
    }
};

} // namespace volley::protocol
