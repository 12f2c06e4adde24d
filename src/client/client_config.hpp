#pragma once

#include "client/network_client.hpp"
#include "common/physics_constants.hpp"
#include "common/weapon_stats.hpp"
#include "protocol/frame.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace volley::client {

struct ServerEndpoint {
    std::string host = "localhost";
    uint16_t port = protocol::DEFAULT_PORT;
    std::string room = "lobby";
};

struct SimulationConfig {
    double fixed_timestep = physics::FIXED_TIMESTEP;  // must match the server
    double max_frame_delta = physics::MAX_FRAME_DELTA;
    int frame_rate_cap = 120;
};

class ClientConfig {
public:
    bool load(const std::string& data_dir);

    const ServerEndpoint& server() const { return server_; }
    ServerEndpoint& server() { return server_; }
    const SimulationConfig& simulation() const { return simulation_; }
    const ConnectionSettings& connection() const { return connection_; }

    const std::vector<WeaponStats>& weapons() const { return weapons_; }
    // Falls back to the first weapon when the name is unknown
    const WeaponStats& weapon(const std::string& name) const;
    const std::string& selected_weapon() const { return selected_weapon_; }

private:
    bool load_client(const std::string& path);
    bool load_weapons(const std::string& path);

    ServerEndpoint server_;
    SimulationConfig simulation_;
    ConnectionSettings connection_;
    std::vector<WeaponStats> weapons_ = default_weapon_table();
    std::string selected_weapon_ = "pistol";
};

} // namespace volley::client
