#pragma once

#include <cstdint>

namespace volley::protocol {

// First byte of every message. Values up to 0x0F carry fixed-schema binary
// payloads; 0x10..0xFE carry UTF-8 JSON; 0xFF is the JSON error envelope.
enum class Opcode : uint8_t {
    // High frequency, binary
    TransformUpdate = 0x01,
    PlayerInput = 0x02,
    ShootRequest = 0x03,
    ProjectileSpawn = 0x04,
    ProjectileDestroy = 0x05,
    ProjectileSpawnBatch = 0x06,

    // Room
    RoomJoin = 0x10,
    RoomLeave = 0x11,
    RoomState = 0x12,

    // Players and combat
    PlayerJoined = 0x20,
    PlayerLeft = 0x21,
    EntityDamage = 0x22,
    EntityDeath = 0x23,

    // Items and economy
    ItemSpawn = 0x30,
    ItemUpdate = 0x31,
    ItemPickup = 0x32,
    ItemDrop = 0x33,
    ItemTossLand = 0x34,
    ReloadRequest = 0x35,
    ExplosionSpawn = 0x36,
    StaminaUpdate = 0x37,
    BuffApplied = 0x38,
    BuffExpired = 0x39,
    ArmorUpdate = 0x3A,
    HelmetUpdate = 0x3B,
    MaterialsUpdate = 0x3C,
    ItemDropSound = 0x3D,
    ReloadStarted = 0x3E,
    FootstepEvent = 0x3F,

    // Level content
    TreeSpawn = 0x40,
    RockSpawn = 0x41,
    BushSpawn = 0x42,
    FootstepSound = 0x43,

    // Building
    BlockPlace = 0x50,
    BlockRemove = 0x51,
    BlockPlaced = 0x52,
    BlockRemoved = 0x53,
    BuildingInitialState = 0x54,
    BuildingCreate = 0x55,
    BuildingCreated = 0x56,
    BuildingTransform = 0x57,
    BuildingTransformed = 0x58,
    BuildingDestroy = 0x59,
    BuildingDestroyed = 0x5A,

    // Ladders
    LadderPlace = 0x60,
    LadderSpawned = 0x61,
    LadderDestroy = 0x62,
    LadderDestroyed = 0x63,

    // Lobby, chat and rounds
    ChatMessage = 0x70,
    ChatBroadcast = 0x71,
    LobbyConfig = 0x72,
    LobbyConfigUpdate = 0x73,
    LobbyStart = 0x74,
    LobbyStarting = 0x75,
    KillFeed = 0x76,
    RoundState = 0x77,
    ScoreUpdate = 0x78,
    LobbyStartCountdown = 0x79,
    LobbyStartCancel = 0x7A,
    GameLoading = 0x7B,
    ClientReady = 0x7C,
    PlayersReadyUpdate = 0x7D,
    GameBegin = 0x7E,

    DummySpawn = 0x80,

    Error = 0xFF,
};

enum class Channel : uint8_t {
    Binary,
    Json,
    Error,
};

constexpr uint8_t MAX_BINARY_OPCODE = 0x0F;

constexpr Channel channel_of(uint8_t opcode) {
    if (opcode <= MAX_BINARY_OPCODE) return Channel::Binary;
    if (opcode == static_cast<uint8_t>(Opcode::Error)) return Channel::Error;
    return Channel::Json;
}

constexpr Channel channel_of(Opcode opcode) {
    return channel_of(static_cast<uint8_t>(opcode));
}

} // namespace volley::protocol
