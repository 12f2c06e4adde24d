#pragma once

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>

namespace volley::client {

// Bounded FIFO. A push into a full queue evicts the oldest entry.
template<typename T>
class DeferredQueue {
public:
    explicit DeferredQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("DeferredQueue: capacity must be positive");
        }
    }

    // Returns true if an older entry had to be dropped
    bool push(T value) {
        bool evicted = false;
        if (items_.size() >= capacity_) {
            items_.pop_front();
            evicted = true;
        }
        items_.push_back(std::move(value));
        return evicted;
    }

    T pop() {
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    const T& front() const { return items_.front(); }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() { items_.clear(); }

private:
    size_t capacity_;
    std::deque<T> items_;
};

} // namespace volley::client
