#pragma once

#include "protocol/opcode.hpp"
#include "protocol/serializable.hpp"
#include <algorithm>
#include <cmath>

namespace volley::protocol {

// One captured input, sent once per physics step.
struct InputSample : Serializable<InputSample> {
    static constexpr Opcode opcode = Opcode::PlayerInput;

    uint32_t sequence = 0;
    float delta_time = 0.0f;
    int8_t forward = 0;  // -1, 0 or 1
    int8_t right = 0;
    float camera_yaw = 0.0f;
    float camera_pitch = 0.0f;
    bool jump = false;
    bool sprint = false;
    bool dive = false;
    double timestamp = 0.0;  // client send time, milliseconds

    static constexpr size_t serialized_size() { return 29; }

    // Rounds an analog axis to the wire's -1/0/1
    static int8_t to_axis(float v) {
        return static_cast<int8_t>(std::lround(std::clamp(v, -1.0f, 1.0f)));
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(sequence);
        w.write(delta_time);
        w.write(forward);
        w.write(right);
        w.write(camera_yaw);
        w.write(camera_pitch);
        w.write_bool(jump);
        w.write_bool(sprint);
        w.write_bool(dive);
        w.write(timestamp);
    }

    void deserialize_impl(BufferReader& r) {
        sequence = r.read<uint32_t>();
        delta_time = r.read<float>();
        forward = r.read<int8_t>();
        right = r.read<int8_t>();
        camera_yaw = r.read<float>();
        camera_pitch = r.read<float>();
        jump = r.read_bool();
        sprint = r.read_bool();
        dive = r.read_bool();
        timestamp = r.read<double>();
    }
};

} // namespace volley::protocol
