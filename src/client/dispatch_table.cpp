#include "dispatch_table.hpp"
#include <SDL3/SDL_log.h>
#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace volley::client {

using namespace volley::protocol;

template<typename Fn, typename... Args>
void DispatchTable::invoke_all(const std::vector<Fn>& handlers, const char* what, const Args&... args) {
    for (const auto& handler : handlers) {
        try {
            handler(args...);
        } catch (const std::exception& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DispatchTable: %s handler threw: %s", what, e.what());
        }
    }
}

void DispatchTable::check_mutable(const char* what) const {
    if (frozen_) {
        throw std::logic_error(std::string("DispatchTable: cannot subscribe to ") + what +
                               " after the connection has started");
    }
}

void DispatchTable::on_transform(Handler<TransformSnapshot> handler) {
    check_mutable("transform");
    transform_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_projectile_spawn(Handler<ProjectileSpawn> handler) {
    check_mutable("projectile spawn");
    spawn_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_projectile_spawn_batch(Handler<ProjectileSpawnBatch> handler) {
    check_mutable("projectile spawn batch");
    batch_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_projectile_destroy(Handler<ProjectileDestroy> handler) {
    check_mutable("projectile destroy");
    destroy_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_json(Opcode opcode, JsonHandler handler) {
    if (channel_of(opcode) != Channel::Json) {
        throw std::invalid_argument("DispatchTable: opcode is not on the JSON channel");
    }
    check_mutable("json opcode");
    json_handlers_[static_cast<uint8_t>(opcode)].push_back(std::move(handler));
}

void DispatchTable::on_error(ErrorHandler handler) {
    check_mutable("error");
    error_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_open(OpenHandler handler) {
    check_mutable("open");
    open_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_close(CloseHandler handler) {
    check_mutable("close");
    close_handlers_.push_back(std::move(handler));
}

void DispatchTable::on_reconnect_scheduled(ReconnectHandler handler) {
    check_mutable("reconnect");
    reconnect_handlers_.push_back(std::move(handler));
}

void DispatchTable::dispatch(const InboundMessage& message) const {
    std::visit([this](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, TransformSnapshot>) {
            invoke_all(transform_handlers_, "transform", msg);
        } else if constexpr (std::is_same_v<T, ProjectileSpawn>) {
            invoke_all(spawn_handlers_, "projectile spawn", msg);
        } else if constexpr (std::is_same_v<T, ProjectileSpawnBatch>) {
            invoke_all(batch_handlers_, "projectile spawn batch", msg);
        } else {
            invoke_all(destroy_handlers_, "projectile destroy", msg);
        }
    }, message);
}

bool DispatchTable::dispatch_json(uint8_t opcode, const nlohmann::json& payload) const {
    auto it = json_handlers_.find(opcode);
    if (it == json_handlers_.end()) return false;
    invoke_all(it->second, "json", payload);
    return true;
}

void DispatchTable::dispatch_error(const ErrorEnvelope& error) const {
    invoke_all(error_handlers_, "error", error);
}

void DispatchTable::dispatch_open() const {
    invoke_all(open_handlers_, "open");
}

void DispatchTable::dispatch_close(bool will_reconnect) const {
    invoke_all(close_handlers_, "close", will_reconnect);
}

void DispatchTable::dispatch_reconnect_scheduled(int attempt, int delay_ms) const {
    invoke_all(reconnect_handlers_, "reconnect", attempt, delay_ms);
}

} // namespace volley::client
