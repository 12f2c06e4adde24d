#pragma once

#include "client/deferred_queue.hpp"
#include "client/dispatch_table.hpp"
#include "client/transport.hpp"
#include "protocol/protocol.hpp"
#include <asio.hpp>
#include <cstdint>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace volley::client {

struct ConnectionSettings {
    size_t max_deferred_queue = 256;
    int drain_budget = 0;              // 0: drain through a posted fallback instead
    int debug_latency_ms = 0;          // one-way, applied to both directions
    int reconnect_max_attempts = 5;
    int reconnect_base_delay_ms = 1000;
};

constexpr int MAX_DEBUG_LATENCY_MS = 5000;
constexpr int MAX_RECONNECT_ATTEMPTS = 30;
constexpr int MAX_RECONNECT_DELAY_MS = 3'600'000;

// base * 2^(attempt - 1), saturating at MAX_RECONNECT_DELAY_MS
int reconnect_delay_ms(int base_delay_ms, int attempt);

/**
 * One server connection. Owned explicitly by whoever runs the frame loop;
 * there is no global instance.
 *
 * Inbound binary messages are decoded as they arrive but their handlers are
 * deferred into a bounded queue. With a drain budget the owner calls drain()
 * once per frame; without one a single fallback drain is posted to the
 * io_context per burst. JSON and error messages dispatch immediately.
 *
 * Everything runs on the thread that polls the io_context.
 */
class NetworkClient {
public:
    struct Stats {
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t messages_sent = 0;
        uint64_t messages_received = 0;
        uint64_t evicted = 0;
        uint64_t malformed = 0;
        uint64_t reconnect_attempts = 0;
        size_t queue_depth = 0;
    };

    NetworkClient(asio::io_context& io_context, std::unique_ptr<Transport> transport,
                  ConnectionSettings settings = {});
    ~NetworkClient();

    NetworkClient(const NetworkClient&) = delete;
    NetworkClient& operator=(const NetworkClient&) = delete;

    /** Subscriptions. Must be complete before connect(). */
    DispatchTable& dispatch() { return dispatch_; }

    /** Start the connection. Freezes the dispatch table. */
    void connect(const std::string& host, uint16_t port);

    /** User-initiated close. Never triggers reconnection. */
    void disconnect();

    bool is_connected() const { return connected_; }
    // True once reconnect attempts are exhausted
    bool gave_up() const { return gave_up_; }

    /** Remember the room and join it now and after every reconnect. */
    void join_room(const std::string& room_id, std::optional<nlohmann::json> lobby_config = std::nullopt);
    const std::string& room_id() const { return room_id_; }

    void send_input(const protocol::InputSample& input);
    void send_shoot(const protocol::ShootRequest& shoot);
    void send_json(protocol::Opcode opcode, const nlohmann::json& payload);

    /** Run up to drain_budget deferred handlers (all of them when the budget is 0). */
    size_t drain();
    size_t drain_all();

    void set_latency_ms(int latency_ms);
    int latency_ms() const { return settings_.debug_latency_ms; }

    const ConnectionSettings& settings() const { return settings_; }
    const std::vector<int>& reconnect_delays() const { return reconnect_delays_; }
    Stats stats() const;

private:
    void handle_open();
    void handle_close(const std::string& reason);
    void handle_message(std::vector<uint8_t> message);
    void process_message(const std::vector<uint8_t>& message);
    void process_binary(uint8_t opcode, std::span<const uint8_t> payload);
    void process_json(uint8_t opcode, std::span<const uint8_t> payload);
    void process_error(std::span<const uint8_t> payload);
    void enqueue(InboundMessage message);
    void schedule_fallback_drain();
    void schedule_reconnect();
    void send_raw(std::vector<uint8_t> message);
    void transmit(const std::vector<uint8_t>& message);
    void send_room_join();

    template<typename Fn>
    void after_delay(int delay_ms, Fn fn);

    asio::io_context& io_context_;
    std::unique_ptr<Transport> transport_;
    ConnectionSettings settings_;
    DispatchTable dispatch_;
    DeferredQueue<InboundMessage> queue_;

    std::string host_;
    uint16_t port_ = 0;
    bool connected_ = false;
    bool user_closed_ = false;
    bool gave_up_ = false;
    int reconnect_attempt_ = 0;
    uint64_t reconnect_generation_ = 0;  // bumped by connect() and disconnect()
    std::vector<int> reconnect_delays_;
    bool fallback_drain_pending_ = false;

    std::string room_id_;
    std::optional<nlohmann::json> lobby_config_;

    // Latency and reconnect timers; cancelled only on destruction
    std::list<std::shared_ptr<asio::steady_timer>> timers_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    Stats stats_;
};

} // namespace volley::client
