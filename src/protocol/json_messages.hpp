#pragma once

#include "protocol/buffer_writer.hpp"
#include "protocol/opcode.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace volley::protocol {

// Typed views of the low-frequency messages the sync layer itself consumes.
// Every other JSON opcode is handed to subscribers as raw nlohmann::json.

struct RoomJoin {
    std::string room_id;
    std::optional<nlohmann::json> config;  // lobby config, only when creating a lobby
};

struct PlayerInfo {
    std::string id;
    uint32_t entity_id = 0;
    std::string color;
    int kills = 0;
    int deaths = 0;
};

struct RoomState {
    std::string room_id;
    std::vector<PlayerInfo> players;
    uint32_t my_entity_id = 0;
    std::string owner_id;
};

struct PlayerJoined {
    PlayerInfo player;
};

struct PlayerLeft {
    std::string player_id;
    uint32_t entity_id = 0;
};

struct ErrorEnvelope {
    std::string code;
    std::string message;
};

inline void to_json(nlohmann::json& j, const RoomJoin& m) {
    j = nlohmann::json{{"roomId", m.room_id}};
    if (m.config) j["config"] = *m.config;
}

inline void from_json(const nlohmann::json& j, RoomJoin& m) {
    m.room_id = j.at("roomId").get<std::string>();
    if (j.contains("config")) m.config = j.at("config");
}

inline void to_json(nlohmann::json& j, const PlayerInfo& m) {
    j = nlohmann::json{{"id", m.id}, {"entityId", m.entity_id}, {"color", m.color},
                       {"kills", m.kills}, {"deaths", m.deaths}};
}

inline void from_json(const nlohmann::json& j, PlayerInfo& m) {
    m.id = j.value("id", std::string{});
    m.entity_id = j.at("entityId").get<uint32_t>();
    m.color = j.value("color", std::string{});
    m.kills = j.value("kills", 0);
    m.deaths = j.value("deaths", 0);
}

inline void to_json(nlohmann::json& j, const RoomState& m) {
    j = nlohmann::json{{"roomId", m.room_id}, {"players", m.players},
                       {"myEntityId", m.my_entity_id}, {"ownerId", m.owner_id}};
}

inline void from_json(const nlohmann::json& j, RoomState& m) {
    m.room_id = j.value("roomId", std::string{});
    m.players = j.value("players", std::vector<PlayerInfo>{});
    m.my_entity_id = j.at("myEntityId").get<uint32_t>();
    m.owner_id = j.value("ownerId", std::string{});
}

inline void to_json(nlohmann::json& j, const PlayerJoined& m) {
    j = nlohmann::json{{"player", m.player}};
}

inline void from_json(const nlohmann::json& j, PlayerJoined& m) {
    m.player = j.at("player").get<PlayerInfo>();
}

inline void to_json(nlohmann::json& j, const PlayerLeft& m) {
    j = nlohmann::json{{"playerId", m.player_id}, {"entityId", m.entity_id}};
}

inline void from_json(const nlohmann::json& j, PlayerLeft& m) {
    m.player_id = j.value("playerId", std::string{});
    m.entity_id = j.at("entityId").get<uint32_t>();
}

inline void to_json(nlohmann::json& j, const ErrorEnvelope& m) {
    j = nlohmann::json{{"code", m.code}, {"message", m.message}};
}

inline void from_json(const nlohmann::json& j, ErrorEnvelope& m) {
    m.code = j.value("code", std::string{});
    m.message = j.value("message", std::string{});
}

// Opcode byte followed by the dumped JSON text
inline std::vector<uint8_t> encode_json(Opcode opcode, const nlohmann::json& payload) {
    std::vector<uint8_t> data;
    BufferWriter w(data);
    w.write(static_cast<uint8_t>(opcode));
    w.write_string(payload.dump());
    return data;
}

} // namespace volley::protocol
