#pragma once

#include "protocol/serializable.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace volley::protocol {

// Stream transports carry one message per frame: [opcode:u8][payload_size:u32]
// followed by the payload. The opcode byte is kept so a frame's body is the
// message exactly as the datagram transports would carry it.
struct FrameHeader : Serializable<FrameHeader> {
    uint8_t opcode = 0;
    uint32_t payload_size = 0;

    static constexpr size_t serialized_size() { return sizeof(uint8_t) + sizeof(uint32_t); }

    void serialize_impl(BufferWriter& w) const {
        w.write(opcode);
        w.write(payload_size);
    }

    void deserialize_impl(BufferReader& r) {
        opcode = r.read<uint8_t>();
        payload_size = r.read<uint32_t>();
    }
};

constexpr uint32_t MAX_FRAME_PAYLOAD = 1u << 20;

// Wrap an encoded message (opcode + payload) into a frame
inline std::vector<uint8_t> build_frame(std::span<const uint8_t> message) {
    std::vector<uint8_t> data;
    if (message.empty()) return data;
    data.reserve(FrameHeader::serialized_size() + message.size() - 1);
    BufferWriter w(data);
    FrameHeader hdr;
    hdr.opcode = message[0];
    hdr.payload_size = static_cast<uint32_t>(message.size() - 1);
    hdr.serialize(w);
    w.write_bytes(message.subspan(1));
    return data;
}

constexpr uint16_t DEFAULT_PORT = 7777;

} // namespace volley::protocol
