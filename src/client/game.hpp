#pragma once

#include "client/bot_input.hpp"
#include "client/client_config.hpp"
#include "client/entity_synchronizer.hpp"
#include "client/fire_control.hpp"
#include "client/input_capture.hpp"
#include "client/network_client.hpp"
#include "client/projectile_synchronizer.hpp"
#include "engine/application.hpp"
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace volley::client {

/**
 * Headless client session: one connection, one room, the synchronizers and
 * a scripted input source, all driven by the engine's fixed-step loop.
 */
class Game : public engine::Application {
public:
    explicit Game(ClientConfig config);
    ~Game() override;

protected:
    bool on_init() override;
    void on_shutdown() override;
    void on_update(float dt) override;

private:
    void subscribe();
    void register_hooks();

    void on_room_state(const nlohmann::json& payload);
    void on_player_joined(const nlohmann::json& payload);
    void on_player_left(const nlohmann::json& payload);
    void on_disconnected(bool will_reconnect);

    void handle_fire();
    void log_stats(float dt);

    static double now_ms();

    ClientConfig config_;

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;

    EntitySynchronizer entities_;
    ProjectileSynchronizer projectiles_;
    BotInputSource bot_;
    FireControl fire_;
    std::unique_ptr<NetworkClient> network_;
    std::unique_ptr<InputCapture> input_;

    float stats_timer_ = 0.0f;
};

} // namespace volley::client
