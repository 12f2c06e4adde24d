#include "client_config.hpp"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace volley::client {

bool ClientConfig::load(const std::string& data_dir) {
    bool ok = true;
    ok = load_client(data_dir + "/client.json") && ok;
    ok = load_weapons(data_dir + "/weapons.json") && ok;
    return ok;
}

bool ClientConfig::load_client(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] Failed to open %s", path.c_str());
        return false;
    }

    // Nothing is committed until the whole file validates
    ServerEndpoint server = server_;
    SimulationConfig simulation = simulation_;
    ConnectionSettings connection = connection_;
    std::string selected_weapon = selected_weapon_;
    try {
        json j = json::parse(f);
        server.host = j.value("host", server.host);
        server.port = j.value("port", server.port);
        server.room = j.value("room", server.room);

        simulation.fixed_timestep = j.value("fixed_timestep", simulation.fixed_timestep);
        simulation.max_frame_delta = j.value("max_frame_delta", simulation.max_frame_delta);
        simulation.frame_rate_cap = j.value("frame_rate_cap", simulation.frame_rate_cap);

        connection.drain_budget = j.value("drain_budget", connection.drain_budget);
        connection.debug_latency_ms = j.value("debug_latency_ms", connection.debug_latency_ms);
        connection.max_deferred_queue = j.value("max_deferred_queue", connection.max_deferred_queue);
        connection.reconnect_max_attempts = j.value("reconnect_max_attempts", connection.reconnect_max_attempts);
        connection.reconnect_base_delay_ms = j.value("reconnect_base_delay_ms", connection.reconnect_base_delay_ms);

        selected_weapon = j.value("weapon", selected_weapon);
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] Error parsing %s: %s", path.c_str(), e.what());
        return false;
    }

    if (simulation.fixed_timestep <= 0.0 || simulation.max_frame_delta < simulation.fixed_timestep) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] %s: invalid timestep settings", path.c_str());
        return false;
    }
    if (connection.max_deferred_queue == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] %s: max_deferred_queue must be positive",
                     path.c_str());
        return false;
    }
    if (connection.drain_budget < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] %s: negative connection setting", path.c_str());
        return false;
    }
    if (connection.reconnect_max_attempts < 0 || connection.reconnect_max_attempts > MAX_RECONNECT_ATTEMPTS ||
        connection.reconnect_base_delay_ms < 0 || connection.reconnect_base_delay_ms > MAX_RECONNECT_DELAY_MS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "[ClientConfig] %s: reconnect settings out of range (at most %d attempts, %d ms base delay)",
                     path.c_str(), MAX_RECONNECT_ATTEMPTS, MAX_RECONNECT_DELAY_MS);
        return false;
    }

    server_ = std::move(server);
    simulation_ = simulation;
    connection_ = connection;
    selected_weapon_ = std::move(selected_weapon);
    return true;
}

bool ClientConfig::load_weapons(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] Failed to open %s", path.c_str());
        return false;
    }
    try {
        json j = json::parse(f);
        std::vector<WeaponStats> weapons;
        for (const auto& w : j.at("weapons")) {
            WeaponStats stats;
            stats.name = w.at("name").get<std::string>();
            stats.fire_rate = w.value("fire_rate", stats.fire_rate);
            stats.projectile_speed = w.value("projectile_speed", stats.projectile_speed);
            stats.gravity_start_distance = w.value("gravity_start_distance", stats.gravity_start_distance);
            stats.min_accuracy = w.value("min_accuracy", stats.min_accuracy);
            stats.pellets_per_shot = w.value("pellets_per_shot", stats.pellets_per_shot);
            if (stats.fire_rate <= 0.0f) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] %s: weapon '%s' has no fire rate, skipped",
                            path.c_str(), stats.name.c_str());
                continue;
            }
            weapons.push_back(stats);
        }
        if (weapons.empty()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] %s: no weapons defined", path.c_str());
            return false;
        }
        weapons_ = std::move(weapons);
        return true;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[ClientConfig] Error parsing %s: %s", path.c_str(), e.what());
        return false;
    }
}

const WeaponStats& ClientConfig::weapon(const std::string& name) const {
    for (const auto& w : weapons_) {
        if (w.name == name) return w;
    }
    return weapons_.front();
}

} // namespace volley::client
