#pragma once

#include "engine/input_state.hpp"
#include "protocol/player_input.hpp"
#include <cstdint>
#include <deque>
#include <functional>

namespace volley::client {

class EntitySynchronizer;
class NetworkClient;

/**
 * The only producer of input sequence numbers. Registered as the scheduler's
 * fixed-tick hook: every physics step samples the device once, stamps the
 * next sequence number, hands the sample to local prediction and sends it.
 */
class InputCapture {
public:
    using Clock = std::function<double()>;  // milliseconds

    InputCapture(engine::InputSource& source, EntitySynchronizer& entities, NetworkClient& connection,
                 Clock clock, size_t history_size = 64);

    protocol::InputSample capture(float dt);

    uint32_t last_sequence() const { return next_sequence_ - 1; }
    const engine::InputState& last_state() const { return last_state_; }
    const std::deque<protocol::InputSample>& history() const { return history_; }

private:
    engine::InputSource& source_;
    EntitySynchronizer& entities_;
    NetworkClient& connection_;
    Clock clock_;
    size_t history_size_;

    uint32_t next_sequence_ = 1;
    engine::InputState last_state_;
    std::deque<protocol::InputSample> history_;
};

} // namespace volley::client
