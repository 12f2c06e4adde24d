#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace volley::protocol {

// Little-endian writer with two modes:
//   BufferWriter(span) - fixed buffer, bounds-checked, no allocations
//   BufferWriter(vec)  - append mode, grows the vector on each write
class BufferWriter {
    uint8_t* data_ = nullptr;
    size_t capacity_ = 0;
    size_t offset_ = 0;
    std::vector<uint8_t>* vec_ = nullptr;  // null for span mode

    void ensure(size_t n) {
        if (vec_) {
            if (vec_->size() < offset_ + n) {
                vec_->resize(offset_ + n);
            }
            data_ = vec_->data();
            capacity_ = vec_->size();
        } else if (offset_ + n > capacity_) {
            throw std::out_of_range("BufferWriter: write past end of buffer");
        }
    }

public:
    explicit BufferWriter(std::span<uint8_t> buf)
        : data_(buf.data()), capacity_(buf.size()), offset_(0), vec_(nullptr) {}

    explicit BufferWriter(std::vector<uint8_t>& buf)
        : data_(buf.data()), capacity_(buf.size()), offset_(buf.size()), vec_(&buf) {}

    template<typename T>
    void write(const T& val) {
        ensure(sizeof(T));
        std::memcpy(data_ + offset_, &val, sizeof(T));
        offset_ += sizeof(T);
    }

    void write_bool(bool b) { write<uint8_t>(b ? 1 : 0); }

    void write_bytes(std::span<const uint8_t> bytes) {
        if (bytes.empty()) return;
        ensure(bytes.size());
        std::memcpy(data_ + offset_, bytes.data(), bytes.size());
        offset_ += bytes.size();
    }

    // Raw text, no prefix or terminator
    void write_string(std::string_view str) {
        write_bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()));
    }

    size_t offset() const { return offset_; }
};

} // namespace volley::protocol
