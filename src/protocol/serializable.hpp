#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace volley::protocol {

// CRTP base for the fixed-schema binary messages.
// Derived must implement:
//   size_t serialized_size() const (or static constexpr), opcode excluded
//   void serialize_impl(BufferWriter& w) const
//   void deserialize_impl(BufferReader& r)
template<typename Derived>
struct Serializable {
    void serialize(BufferWriter& w) const {
        static_cast<const Derived*>(this)->serialize_impl(w);
    }

    void deserialize(std::span<const uint8_t> data) {
        BufferReader r(data);
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    void deserialize(BufferReader& r) {
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    // Opcode byte followed by the payload, ready for Transport::send
    std::vector<uint8_t> encode() const {
        std::vector<uint8_t> data;
        data.reserve(1 + static_cast<const Derived*>(this)->serialized_size());
        BufferWriter w(data);
        w.write(static_cast<uint8_t>(Derived::opcode));
        serialize(w);
        return data;
    }
};

} // namespace volley::protocol
