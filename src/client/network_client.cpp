#include "network_client.hpp"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace volley::client {

using namespace volley::protocol;

namespace {

template<typename T>
T decode(std::span<const uint8_t> payload) {
    T msg;
    msg.deserialize(payload);
    return msg;
}

} // namespace

int reconnect_delay_ms(int base_delay_ms, int attempt) {
    int shift = std::clamp(attempt - 1, 0, MAX_RECONNECT_ATTEMPTS - 1);
    int64_t delay = static_cast<int64_t>(std::max(base_delay_ms, 0)) << shift;
    return static_cast<int>(std::min<int64_t>(delay, MAX_RECONNECT_DELAY_MS));
}

NetworkClient::NetworkClient(asio::io_context& io_context, std::unique_ptr<Transport> transport,
                             ConnectionSettings settings)
    : io_context_(io_context),
      transport_(std::move(transport)),
      settings_(settings),
      queue_(settings.max_deferred_queue) {
    if (!transport_) {
        throw std::invalid_argument("NetworkClient: transport is required");
    }
    if (settings_.drain_budget < 0 || settings_.reconnect_max_attempts < 0 ||
        settings_.reconnect_base_delay_ms < 0) {
        throw std::invalid_argument("NetworkClient: negative connection setting");
    }
    if (settings_.reconnect_max_attempts > MAX_RECONNECT_ATTEMPTS ||
        settings_.reconnect_base_delay_ms > MAX_RECONNECT_DELAY_MS) {
        throw std::invalid_argument("NetworkClient: reconnect settings out of range");
    }
    set_latency_ms(settings_.debug_latency_ms);

    transport_->set_handlers(
        [this]() { handle_open(); },
        [this](std::vector<uint8_t> message) { handle_message(std::move(message)); },
        [this](const std::string& reason) { handle_close(reason); });
}

NetworkClient::~NetworkClient() {
    alive_.reset();
    for (auto& timer : timers_) {
        timer->cancel();
    }
    timers_.clear();
    user_closed_ = true;
    transport_->close();
}

template<typename Fn>
void NetworkClient::after_delay(int delay_ms, Fn fn) {
    auto timer = std::make_shared<asio::steady_timer>(io_context_, std::chrono::milliseconds(delay_ms));
    auto it = timers_.insert(timers_.end(), timer);
    std::weak_ptr<bool> alive = alive_;
    timer->async_wait([this, alive, it, timer, fn = std::move(fn)](asio::error_code ec) mutable {
        if (alive.expired()) return;
        timers_.erase(it);
        if (ec) return;
        fn();
    });
}

void NetworkClient::connect(const std::string& host, uint16_t port) {
    dispatch_.freeze();
    host_ = host;
    port_ = port;
    user_closed_ = false;
    gave_up_ = false;
    reconnect_attempt_ = 0;
    ++reconnect_generation_;
    SDL_Log("NetworkClient: connecting to %s:%u", host.c_str(), port);
    transport_->open(host_, port_);
}

void NetworkClient::disconnect() {
    user_closed_ = true;
    ++reconnect_generation_;
    if (connected_) {
        SDL_Log("NetworkClient: disconnected from %s:%u", host_.c_str(), port_);
    }
    connected_ = false;
    transport_->close();
}

void NetworkClient::handle_open() {
    connected_ = true;
    gave_up_ = false;
    reconnect_attempt_ = 0;
    SDL_Log("NetworkClient: connection open");
    send_room_join();
    dispatch_.dispatch_open();
}

void NetworkClient::handle_close(const std::string& reason) {
    connected_ = false;
    if (user_closed_) return;

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: connection lost (%s)", reason.c_str());

    if (reconnect_attempt_ < settings_.reconnect_max_attempts) {
        schedule_reconnect();
        dispatch_.dispatch_close(true);
    } else {
        gave_up_ = true;
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "NetworkClient: giving up after %d reconnect attempts", reconnect_attempt_);
        dispatch_.dispatch_close(false);
    }
}

void NetworkClient::schedule_reconnect() {
    ++reconnect_attempt_;
    int delay_ms = reconnect_delay_ms(settings_.reconnect_base_delay_ms, reconnect_attempt_);
    reconnect_delays_.push_back(delay_ms);
    ++stats_.reconnect_attempts;

    SDL_Log("NetworkClient: reconnect attempt %d/%d in %d ms",
            reconnect_attempt_, settings_.reconnect_max_attempts, delay_ms);
    dispatch_.dispatch_reconnect_scheduled(reconnect_attempt_, delay_ms);

    // A connect() or disconnect() in the meantime supersedes this attempt
    after_delay(delay_ms, [this, generation = reconnect_generation_]() {
        if (user_closed_ || generation != reconnect_generation_) return;
        transport_->open(host_, port_);
    });
}

void NetworkClient::join_room(const std::string& room_id, std::optional<nlohmann::json> lobby_config) {
    room_id_ = room_id;
    lobby_config_ = std::move(lobby_config);
    if (connected_) {
        send_room_join();
    }
}

void NetworkClient::send_room_join() {
    if (room_id_.empty()) return;
    RoomJoin join{room_id_, lobby_config_};
    send_raw(encode_json(Opcode::RoomJoin, join));
    SDL_Log("NetworkClient: joining room '%s'", room_id_.c_str());
}

void NetworkClient::send_input(const InputSample& input) {
    if (!connected_) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: input %u dropped, not connected",
                     input.sequence);
        return;
    }
    send_raw(input.encode());
}

void NetworkClient::send_shoot(const ShootRequest& shoot) {
    if (!connected_) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: shoot dropped, not connected");
        return;
    }
    send_raw(shoot.encode());
}

void NetworkClient::send_json(Opcode opcode, const nlohmann::json& payload) {
    if (channel_of(opcode) != Channel::Json) {
        throw std::invalid_argument("NetworkClient::send_json: opcode is not on the JSON channel");
    }
    if (!connected_) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: message 0x%02X dropped, not connected",
                    static_cast<unsigned>(opcode));
        return;
    }
    send_raw(encode_json(opcode, payload));
}

void NetworkClient::send_raw(std::vector<uint8_t> message) {
    if (settings_.debug_latency_ms > 0) {
        after_delay(settings_.debug_latency_ms, [this, message = std::move(message)]() {
            transmit(message);
        });
    } else {
        transmit(message);
    }
}

void NetworkClient::transmit(const std::vector<uint8_t>& message) {
    // A delayed send can outlive the connection it was queued on
    if (!transport_->is_open()) return;
    stats_.bytes_sent += message.size();
    ++stats_.messages_sent;
    transport_->send(message);
}

void NetworkClient::handle_message(std::vector<uint8_t> message) {
    if (settings_.debug_latency_ms > 0) {
        after_delay(settings_.debug_latency_ms, [this, message = std::move(message)]() {
            process_message(message);
        });
    } else {
        process_message(message);
    }
}

void NetworkClient::process_message(const std::vector<uint8_t>& message) {
    stats_.bytes_received += message.size();
    ++stats_.messages_received;

    if (message.empty()) {
        ++stats_.malformed;
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: empty message");
        return;
    }

    uint8_t opcode = message[0];
    auto payload = std::span<const uint8_t>(message).subspan(1);

    switch (channel_of(opcode)) {
        case Channel::Binary:
            process_binary(opcode, payload);
            break;
        case Channel::Json:
            process_json(opcode, payload);
            break;
        case Channel::Error:
            process_error(payload);
            break;
    }
}

void NetworkClient::process_binary(uint8_t opcode, std::span<const uint8_t> payload) {
    try {
        switch (static_cast<Opcode>(opcode)) {
            case Opcode::TransformUpdate:
                enqueue(decode<TransformSnapshot>(payload));
                break;
            case Opcode::ProjectileSpawn:
                enqueue(decode<ProjectileSpawn>(payload));
                break;
            case Opcode::ProjectileSpawnBatch:
                enqueue(decode<ProjectileSpawnBatch>(payload));
                break;
            case Opcode::ProjectileDestroy:
                enqueue(decode<ProjectileDestroy>(payload));
                break;
            default:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: unexpected binary opcode 0x%02X",
                            static_cast<unsigned>(opcode));
                break;
        }
    } catch (const std::out_of_range& e) {
        ++stats_.malformed;
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: truncated binary message 0x%02X (%zu bytes): %s",
                    static_cast<unsigned>(opcode), payload.size(), e.what());
    }
}

void NetworkClient::process_json(uint8_t opcode, std::span<const uint8_t> payload) {
    nlohmann::json j;
    try {
        BufferReader r(payload);
        j = nlohmann::json::parse(r.read_remaining_string());
    } catch (const nlohmann::json::exception& e) {
        ++stats_.malformed;
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: malformed JSON for opcode 0x%02X: %s",
                    static_cast<unsigned>(opcode), e.what());
        return;
    }

    if (!dispatch_.dispatch_json(opcode, j)) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: no handler for opcode 0x%02X",
                     static_cast<unsigned>(opcode));
    }
}

void NetworkClient::process_error(std::span<const uint8_t> payload) {
    ErrorEnvelope error;
    try {
        BufferReader r(payload);
        error = nlohmann::json::parse(r.read_remaining_string()).get<ErrorEnvelope>();
    } catch (const nlohmann::json::exception& e) {
        ++stats_.malformed;
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: malformed error envelope: %s", e.what());
        return;
    }

    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: server error [%s] %s",
                 error.code.c_str(), error.message.c_str());
    dispatch_.dispatch_error(error);
}

void NetworkClient::enqueue(InboundMessage message) {
    if (queue_.push(std::move(message))) {
        ++stats_.evicted;
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: deferred queue full, evicted oldest");
    }
    schedule_fallback_drain();
}

void NetworkClient::schedule_fallback_drain() {
    if (settings_.drain_budget > 0 || fallback_drain_pending_) return;
    fallback_drain_pending_ = true;
    std::weak_ptr<bool> alive = alive_;
    asio::post(io_context_, [this, alive]() {
        if (alive.expired()) return;
        fallback_drain_pending_ = false;
        drain_all();
    });
}

size_t NetworkClient::drain() {
    if (settings_.drain_budget <= 0) return drain_all();

    size_t count = 0;
    while (!queue_.empty() && count < static_cast<size_t>(settings_.drain_budget)) {
        InboundMessage message = queue_.pop();
        dispatch_.dispatch(message);
        ++count;
    }
    return count;
}

size_t NetworkClient::drain_all() {
    size_t count = 0;
    while (!queue_.empty()) {
        InboundMessage message = queue_.pop();
        dispatch_.dispatch(message);
        ++count;
    }
    return count;
}

void NetworkClient::set_latency_ms(int latency_ms) {
    int clamped = std::clamp(latency_ms, 0, MAX_DEBUG_LATENCY_MS);
    if (clamped != latency_ms) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "NetworkClient: latency %d ms clamped to %d ms",
                    latency_ms, clamped);
    }
    settings_.debug_latency_ms = clamped;
}

NetworkClient::Stats NetworkClient::stats() const {
    Stats s = stats_;
    s.queue_depth = queue_.size();
    return s;
}

} // namespace volley::client
