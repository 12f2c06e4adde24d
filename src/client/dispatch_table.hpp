#pragma once

#include "protocol/protocol.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace volley::client {

// A decoded high-frequency message waiting in the deferred queue
using InboundMessage = std::variant<protocol::TransformSnapshot,
                                    protocol::ProjectileSpawn,
                                    protocol::ProjectileSpawnBatch,
                                    protocol::ProjectileDestroy>;

/**
 * Opcode -> subscriber lists, filled during setup and frozen once the
 * connection starts. Dispatch only reads the lists, so a handler can never
 * add or remove subscribers mid-dispatch. A handler that throws is logged
 * and the remaining handlers still run.
 */
class DispatchTable {
public:
    template<typename Msg>
    using Handler = std::function<void(const Msg&)>;
    using JsonHandler = std::function<void(const nlohmann::json&)>;
    using ErrorHandler = std::function<void(const protocol::ErrorEnvelope&)>;
    using OpenHandler = std::function<void()>;
    using CloseHandler = std::function<void(bool will_reconnect)>;
    using ReconnectHandler = std::function<void(int attempt, int delay_ms)>;

    void on_transform(Handler<protocol::TransformSnapshot> handler);
    void on_projectile_spawn(Handler<protocol::ProjectileSpawn> handler);
    void on_projectile_spawn_batch(Handler<protocol::ProjectileSpawnBatch> handler);
    void on_projectile_destroy(Handler<protocol::ProjectileDestroy> handler);
    void on_json(protocol::Opcode opcode, JsonHandler handler);
    void on_error(ErrorHandler handler);
    void on_open(OpenHandler handler);
    void on_close(CloseHandler handler);
    void on_reconnect_scheduled(ReconnectHandler handler);

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    void dispatch(const InboundMessage& message) const;
    // Returns false when nobody subscribed to the opcode
    bool dispatch_json(uint8_t opcode, const nlohmann::json& payload) const;
    void dispatch_error(const protocol::ErrorEnvelope& error) const;
    void dispatch_open() const;
    void dispatch_close(bool will_reconnect) const;
    void dispatch_reconnect_scheduled(int attempt, int delay_ms) const;

private:
    void check_mutable(const char* what) const;

    template<typename Fn, typename... Args>
    static void invoke_all(const std::vector<Fn>& handlers, const char* what, const Args&... args);

    bool frozen_ = false;
    std::vector<Handler<protocol::TransformSnapshot>> transform_handlers_;
    std::vector<Handler<protocol::ProjectileSpawn>> spawn_handlers_;
    std::vector<Handler<protocol::ProjectileSpawnBatch>> batch_handlers_;
    std::vector<Handler<protocol::ProjectileDestroy>> destroy_handlers_;
    std::unordered_map<uint8_t, std::vector<JsonHandler>> json_handlers_;
    std::vector<ErrorHandler> error_handlers_;
    std::vector<OpenHandler> open_handlers_;
    std::vector<CloseHandler> close_handlers_;
    std::vector<ReconnectHandler> reconnect_handlers_;
};

} // namespace volley::client
