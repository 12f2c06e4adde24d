#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>

namespace volley::protocol {

// Bounds-checked little-endian reader over a received payload.
// Every read past the end throws std::out_of_range; the connection treats
// that as a malformed message and drops it.
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

    void check_bounds(size_t n) const {
        if (offset_ + n > data_.size()) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

public:
    BufferReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    T read() {
        check_bounds(sizeof(T));
        T val;
        std::memcpy(&val, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return val;
    }

    bool read_bool() { return read<uint8_t>() != 0; }

    // Everything left in the buffer as text (JSON payloads carry no length prefix)
    std::string read_remaining_string() {
        std::string str(reinterpret_cast<const char*>(data_.data() + offset_), remaining_size());
        offset_ = data_.size();
        return str;
    }

    size_t offset() const { return offset_; }
    size_t remaining_size() const { return data_.size() - offset_; }
};

} // namespace volley::protocol
