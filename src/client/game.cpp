#include "game.hpp"
#include "client/tcp_transport.hpp"
#include "protocol/protocol.hpp"
#include <SDL3/SDL.h>
#include <cmath>
#include <utility>

namespace volley::client {

using namespace volley::protocol;

namespace {
constexpr float EYE_HEIGHT = 1.6f;
constexpr float STATS_INTERVAL = 5.0f;
}

Game::Game(ClientConfig config)
    : engine::Application(config.simulation().fixed_timestep, config.simulation().max_frame_delta),
      config_(std::move(config)),
      work_guard_(asio::make_work_guard(io_context_)),
      entities_(nullptr, SyncSettings{static_cast<float>(config_.simulation().fixed_timestep)}),
      projectiles_(entities_),
      fire_(config_.weapon(config_.selected_weapon())) {
}

Game::~Game() = default;

double Game::now_ms() {
    return static_cast<double>(SDL_GetTicksNS()) / 1e6;
}

bool Game::on_init() {
    set_frame_rate_cap(config_.simulation().frame_rate_cap);

    network_ = std::make_unique<NetworkClient>(io_context_, std::make_unique<TcpTransport>(io_context_),
                                               config_.connection());
    input_ = std::make_unique<InputCapture>(bot_, entities_, *network_, &Game::now_ms);

    subscribe();
    register_hooks();

    SDL_Log("Game: weapon %s (%.0f ms cooldown)", fire_.weapon().name.c_str(), fire_.weapon().cooldown_ms());

    const auto& server = config_.server();
    network_->join_room(server.room);
    network_->connect(server.host, server.port);
    return true;
}

void Game::on_shutdown() {
    if (network_) {
        network_->disconnect();
    }
    work_guard_.reset();
}

void Game::subscribe() {
    auto& dispatch = network_->dispatch();

    dispatch.on_transform([this](const TransformSnapshot& snapshot) {
        entities_.apply_snapshot(snapshot);
    });
    dispatch.on_projectile_spawn([this](const ProjectileSpawn& spawn) {
        projectiles_.spawn_from_server(spawn);
    });
    dispatch.on_projectile_spawn_batch([this](const ProjectileSpawnBatch& batch) {
        projectiles_.spawn_batch_from_server(batch);
    });
    dispatch.on_projectile_destroy([this](const ProjectileDestroy& destroy) {
        projectiles_.destroy(static_cast<ProjectileId>(destroy.entity_id));
    });

    dispatch.on_json(Opcode::RoomState, [this](const nlohmann::json& j) { on_room_state(j); });
    dispatch.on_json(Opcode::PlayerJoined, [this](const nlohmann::json& j) { on_player_joined(j); });
    dispatch.on_json(Opcode::PlayerLeft, [this](const nlohmann::json& j) { on_player_left(j); });

    dispatch.on_error([](const ErrorEnvelope& error) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Game: server rejected request: %s", error.code.c_str());
    });
    dispatch.on_close([this](bool will_reconnect) { on_disconnected(will_reconnect); });

    projectiles_.set_hit_handler([](const ProjectileHit& hit) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Game: projectile %lld hit %u%s",
                     static_cast<long long>(hit.projectile), hit.entity_id, hit.headshot ? " (head)" : "");
    });
}

void Game::register_hooks() {
    auto& sched = scheduler();

    sched.add_fixed_tick_hook([this](float dt) {
        input_->capture(dt);
        handle_fire();
    });
    sched.add_physics_hook([this](float dt) {
        entities_.fixed_update(dt);
        projectiles_.fixed_update(dt);
    });
    if (config_.connection().drain_budget > 0) {
        sched.add_drain_hook([this]() { network_->drain(); });
    }
    sched.add_interpolation_hook([this](float frame_dt, float alpha) {
        entities_.update(frame_dt, alpha);
    });
    sched.add_timer_hook([this](float frame_dt) { log_stats(frame_dt); });
}

void Game::on_update(float /*dt*/) {
    io_context_.poll();

    if (network_->gave_up()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Game: server unreachable, exiting");
        quit();
    }
}

void Game::on_room_state(const nlohmann::json& payload) {
    auto state = payload.get<RoomState>();

    entities_.clear();
    projectiles_.clear();
    entities_.create_local(state.my_entity_id);
    for (const auto& player : state.players) {
        if (player.entity_id != state.my_entity_id) {
            entities_.create_remote(player.entity_id);
        }
    }
    SDL_Log("Game: joined room '%s' as entity %u with %zu players", state.room_id.c_str(),
            state.my_entity_id, state.players.size());
}

void Game::on_player_joined(const nlohmann::json& payload) {
    auto joined = payload.get<PlayerJoined>();
    if (entities_.local_id() == joined.player.entity_id) return;
    entities_.create_remote(joined.player.entity_id);
    SDL_Log("Game: player %s joined (entity %u)", joined.player.id.c_str(), joined.player.entity_id);
}

void Game::on_player_left(const nlohmann::json& payload) {
    auto left = payload.get<PlayerLeft>();
    if (entities_.remove(left.entity_id)) {
        SDL_Log("Game: player %s left (entity %u)", left.player_id.c_str(), left.entity_id);
    }
}

void Game::on_disconnected(bool will_reconnect) {
    if (will_reconnect) {
        SDL_Log("Game: connection lost, waiting for reconnect");
    } else {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Game: disconnected for good");
    }
}

void Game::handle_fire() {
    const auto& state = input_->last_state();
    auto local = entities_.local_id();
    if (!state.fire || !local || !network_->is_connected()) return;

    auto position = entities_.position(*local);
    if (!position) return;

    float cos_pitch = std::cos(state.camera_pitch);
    glm::vec3 aim(std::sin(state.camera_yaw) * cos_pitch, -std::sin(state.camera_pitch),
                  std::cos(state.camera_yaw) * cos_pitch);
    glm::vec3 muzzle = *position + glm::vec3(0.0f, EYE_HEIGHT, 0.0f);

    if (auto request = fire_.fire(now_ms(), *local, muzzle, aim, projectiles_)) {
        network_->send_shoot(*request);
    }
}

void Game::log_stats(float dt) {
    stats_timer_ += dt;
    if (stats_timer_ < STATS_INTERVAL) return;
    stats_timer_ = 0.0f;

    auto s = network_->stats();
    SDL_Log("Game: fps=%.0f steps=%llu seq=%u pending=%zu entities=%zu projectiles=%zu "
            "sent=%llu recv=%llu queue=%zu evicted=%llu malformed=%llu",
            fps(), static_cast<unsigned long long>(scheduler().total_steps()), input_->last_sequence(),
            entities_.pending_input_count(), entities_.size(), projectiles_.size(),
            static_cast<unsigned long long>(s.messages_sent), static_cast<unsigned long long>(s.messages_received),
            s.queue_depth, static_cast<unsigned long long>(s.evicted), static_cast<unsigned long long>(s.malformed));
}

} // namespace volley::client
