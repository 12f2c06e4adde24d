#include <catch2/catch_test_macros.hpp>
#include "client/network_client.hpp"
#include "fake_transport.hpp"
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace volley::client;
using namespace volley::protocol;
using volley::test::FakeTransport;

namespace {

std::vector<uint8_t> json_message(uint8_t opcode, const std::string& text) {
    std::vector<uint8_t> message{opcode};
    message.insert(message.end(), text.begin(), text.end());
    return message;
}

std::vector<uint8_t> transform_message(uint32_t entity_id) {
    TransformSnapshot snapshot;
    snapshot.entity_id = entity_id;
    return snapshot.encode();
}

// Owns the io_context and wires a client to a fake transport
struct Harness {
    explicit Harness(ConnectionSettings settings = {}) {
        auto transport = std::make_unique<FakeTransport>();
        fake = transport.get();
        client = std::make_unique<NetworkClient>(io, std::move(transport), settings);
    }

    asio::io_context io;
    FakeTransport* fake = nullptr;
    std::unique_ptr<NetworkClient> client;
};

}

TEST_CASE("NetworkClient joins its room on every open", "[network]") {
    ConnectionSettings settings;
    settings.reconnect_base_delay_ms = 1;
    Harness h(settings);

    h.client->join_room("arena");
    h.client->connect("example.test", 7777);

    REQUIRE(h.client->is_connected());
    REQUIRE(h.fake->last_host == "example.test");
    auto joins = h.fake->sent_with_opcode(0x10);
    REQUIRE(joins.size() == 1);
    auto j = nlohmann::json::parse(std::string(joins[0].begin() + 1, joins[0].end()));
    REQUIRE(j["roomId"] == "arena");

    h.fake->drop("reset by peer");
    REQUIRE_FALSE(h.client->is_connected());
    h.io.run();

    REQUIRE(h.client->is_connected());
    REQUIRE(h.fake->open_calls == 2);
    REQUIRE(h.fake->sent_with_opcode(0x10).size() == 2);
}

TEST_CASE("NetworkClient backs off exponentially and gives up", "[network]") {
    ConnectionSettings settings;
    settings.reconnect_max_attempts = 3;
    settings.reconnect_base_delay_ms = 1;
    Harness h(settings);

    std::vector<bool> closes;
    std::vector<int> scheduled;
    h.client->dispatch().on_close([&](bool will_reconnect) { closes.push_back(will_reconnect); });
    h.client->dispatch().on_reconnect_scheduled([&](int attempt, int) { scheduled.push_back(attempt); });

    h.fake->refuse = true;
    h.client->connect("localhost", 7777);
    h.io.run();

    REQUIRE(h.client->gave_up());
    REQUIRE(h.fake->open_calls == 4);
    REQUIRE(h.client->reconnect_delays() == std::vector<int>{1, 2, 4});
    REQUIRE(scheduled == std::vector<int>{1, 2, 3});
    REQUIRE(closes == std::vector<bool>{true, true, true, false});
    REQUIRE(h.client->stats().reconnect_attempts == 3);
}

TEST_CASE("A successful reconnect resets the attempt counter", "[network]") {
    ConnectionSettings settings;
    settings.reconnect_max_attempts = 2;
    settings.reconnect_base_delay_ms = 1;
    Harness h(settings);

    h.client->connect("localhost", 7777);
    for (int i = 0; i < 3; ++i) {
        h.fake->drop("flaky");
        h.io.restart();
        h.io.run();
        REQUIRE(h.client->is_connected());
    }

    REQUIRE_FALSE(h.client->gave_up());
    REQUIRE(h.client->reconnect_delays() == std::vector<int>{1, 1, 1});
}

TEST_CASE("User disconnect never reconnects", "[network]") {
    ConnectionSettings settings;
    settings.reconnect_base_delay_ms = 1;
    Harness h(settings);
    int closes = 0;
    h.client->dispatch().on_close([&](bool) { ++closes; });

    h.client->connect("localhost", 7777);
    h.client->disconnect();
    h.io.run();

    REQUIRE_FALSE(h.client->is_connected());
    REQUIRE(h.fake->open_calls == 1);
    REQUIRE(h.client->reconnect_delays().empty());
    REQUIRE(closes == 0);
}

TEST_CASE("Reconnect delays grow without overflowing", "[network]") {
    int previous = 0;
    for (int attempt = 1; attempt <= MAX_RECONNECT_ATTEMPTS; ++attempt) {
        int delay = reconnect_delay_ms(1000, attempt);
        REQUIRE(delay > 0);
        REQUIRE(delay <= MAX_RECONNECT_DELAY_MS);
        if (previous < MAX_RECONNECT_DELAY_MS) {
            REQUIRE(delay > previous);
        } else {
            REQUIRE(delay == MAX_RECONNECT_DELAY_MS);
        }
        previous = delay;
    }
    REQUIRE(reconnect_delay_ms(1000, 23) == MAX_RECONNECT_DELAY_MS);
    REQUIRE(reconnect_delay_ms(MAX_RECONNECT_DELAY_MS, MAX_RECONNECT_ATTEMPTS) == MAX_RECONNECT_DELAY_MS);
    REQUIRE(reconnect_delay_ms(1, 3) == 4);
}

TEST_CASE("Reconnect settings are bounded", "[network]") {
    ConnectionSettings settings;
    settings.reconnect_max_attempts = MAX_RECONNECT_ATTEMPTS + 1;
    REQUIRE_THROWS_AS(Harness(settings), std::invalid_argument);

    settings.reconnect_max_attempts = MAX_RECONNECT_ATTEMPTS;
    settings.reconnect_base_delay_ms = MAX_RECONNECT_DELAY_MS + 1;
    REQUIRE_THROWS_AS(Harness(settings), std::invalid_argument);
}

TEST_CASE("Disconnect cancels a pending reconnect", "[network]") {
    ConnectionSettings settings;
    settings.reconnect_base_delay_ms = 1;
    Harness h(settings);

    h.fake->refuse = true;
    h.client->connect("localhost", 7777);
    REQUIRE(h.client->reconnect_delays().size() == 1);

    h.client->disconnect();
    h.fake->refuse = false;
    h.client->connect("localhost", 7777);
    REQUIRE(h.client->is_connected());
    REQUIRE(h.fake->open_calls == 2);

    // The attempt scheduled before disconnect() must not reopen the live connection
    h.io.run();
    REQUIRE(h.client->is_connected());
    REQUIRE(h.fake->open_calls == 2);
}

TEST_CASE("Connecting freezes subscriptions", "[network]") {
    Harness h;
    h.client->connect("localhost", 7777);
    REQUIRE_THROWS_AS(h.client->dispatch().on_transform([](const TransformSnapshot&) {}), std::logic_error);
}

TEST_CASE("Malformed inbound messages are counted and dropped", "[network]") {
    Harness h;
    int transforms = 0;
    int rooms = 0;
    h.client->dispatch().on_transform([&](const TransformSnapshot&) { ++transforms; });
    h.client->dispatch().on_json(Opcode::RoomState, [&](const nlohmann::json&) { ++rooms; });
    h.client->connect("localhost", 7777);

    SECTION("Invalid JSON") {
        REQUIRE_NOTHROW(h.fake->deliver(json_message(0x12, "{\"roomId\": ")));
        REQUIRE(rooms == 0);
        REQUIRE(h.client->stats().malformed == 1);
    }

    SECTION("Truncated binary payload") {
        auto message = transform_message(1);
        message.resize(20);
        REQUIRE_NOTHROW(h.fake->deliver(message));
        h.io.poll();
        REQUIRE(transforms == 0);
        REQUIRE(h.client->stats().malformed == 1);
        REQUIRE(h.client->stats().queue_depth == 0);
    }

    SECTION("Empty message") {
        REQUIRE_NOTHROW(h.fake->deliver({}));
        REQUIRE(h.client->stats().malformed == 1);
    }

    SECTION("The connection keeps working afterwards") {
        h.fake->deliver(json_message(0x12, "not json"));
        h.fake->deliver(json_message(0x12, R"({"roomId": "r", "myEntityId": 1})"));
        REQUIRE(rooms == 1);
    }
}

TEST_CASE("JSON messages dispatch as soon as they arrive", "[network]") {
    Harness h;
    std::string room;
    h.client->dispatch().on_json(Opcode::RoomState, [&](const nlohmann::json& j) {
        room = j.at("roomId").get<std::string>();
    });
    h.client->connect("localhost", 7777);

    h.fake->deliver(json_message(0x12, R"({"roomId": "lobby", "myEntityId": 3, "players": []})"));
    REQUIRE(room == "lobby");
}

TEST_CASE("Error envelopes reach the error subscribers", "[network]") {
    Harness h;
    std::vector<std::string> codes;
    h.client->dispatch().on_error([&](const ErrorEnvelope& e) { codes.push_back(e.code); });
    h.client->connect("localhost", 7777);

    h.fake->deliver(json_message(0xFF, R"({"code": "ROOM_FULL", "message": "Room is full"})"));
    REQUIRE(codes == std::vector<std::string>{"ROOM_FULL"});
}

TEST_CASE("Binary messages wait for a drain", "[network]") {
    SECTION("With a budget, drain() runs at most that many handlers") {
        ConnectionSettings settings;
        settings.drain_budget = 2;
        Harness h(settings);
        std::vector<uint32_t> seen;
        h.client->dispatch().on_transform([&](const TransformSnapshot& s) { seen.push_back(s.entity_id); });
        h.client->connect("localhost", 7777);

        for (uint32_t id = 1; id <= 5; ++id) h.fake->deliver(transform_message(id));
        h.io.poll();

        REQUIRE(seen.empty());
        REQUIRE(h.client->stats().queue_depth == 5);
        REQUIRE(h.client->drain() == 2);
        REQUIRE(seen == std::vector<uint32_t>{1, 2});
        REQUIRE(h.client->drain_all() == 3);
        REQUIRE(seen == std::vector<uint32_t>{1, 2, 3, 4, 5});
    }

    SECTION("Without a budget, one posted drain empties the queue") {
        Harness h;
        std::vector<uint32_t> seen;
        h.client->dispatch().on_transform([&](const TransformSnapshot& s) { seen.push_back(s.entity_id); });
        h.client->connect("localhost", 7777);

        for (uint32_t id = 1; id <= 3; ++id) h.fake->deliver(transform_message(id));
        REQUIRE(seen.empty());

        REQUIRE(h.io.poll() == 1);
        REQUIRE(seen == std::vector<uint32_t>{1, 2, 3});
    }
}

TEST_CASE("A full deferred queue drops the oldest message", "[network]") {
    ConnectionSettings settings;
    settings.drain_budget = 10;
    settings.max_deferred_queue = 2;
    Harness h(settings);
    std::vector<uint32_t> seen;
    h.client->dispatch().on_transform([&](const TransformSnapshot& s) { seen.push_back(s.entity_id); });
    h.client->connect("localhost", 7777);

    for (uint32_t id = 1; id <= 3; ++id) h.fake->deliver(transform_message(id));
    REQUIRE(h.client->stats().evicted == 1);

    h.client->drain();
    REQUIRE(seen == std::vector<uint32_t>{2, 3});
}

TEST_CASE("Simulated latency delays both directions", "[network]") {
    ConnectionSettings settings;
    settings.debug_latency_ms = 20;
    Harness h(settings);
    int transforms = 0;
    h.client->dispatch().on_transform([&](const TransformSnapshot&) { ++transforms; });

    h.client->join_room("lobby");
    auto start = std::chrono::steady_clock::now();
    h.client->connect("localhost", 7777);

    InputSample input;
    input.sequence = 1;
    h.client->send_input(input);
    h.fake->deliver(transform_message(8));

    REQUIRE(h.fake->sent.empty());
    REQUIRE(transforms == 0);

    h.io.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= std::chrono::milliseconds(20));
    REQUIRE(h.fake->sent.size() == 2);
    REQUIRE(h.fake->sent[0][0] == 0x10);
    REQUIRE(h.fake->sent[1][0] == 0x02);
    REQUIRE(transforms == 1);
}

TEST_CASE("Latency setting is clamped", "[network]") {
    Harness h;
    h.client->set_latency_ms(60000);
    REQUIRE(h.client->latency_ms() == MAX_DEBUG_LATENCY_MS);
    h.client->set_latency_ms(-10);
    REQUIRE(h.client->latency_ms() == 0);
}

TEST_CASE("Sends require an open connection", "[network]") {
    Harness h;

    InputSample input;
    h.client->send_input(input);
    h.client->send_shoot(ShootRequest{});
    REQUIRE(h.fake->sent.empty());

    h.client->connect("localhost", 7777);
    h.client->send_input(input);
    h.client->send_shoot(ShootRequest{});
    h.client->send_json(Opcode::ChatMessage, {{"text", "hi"}});

    REQUIRE(h.fake->sent.size() == 3);
    REQUIRE(h.client->stats().messages_sent == 3);

    REQUIRE_THROWS_AS(h.client->send_json(Opcode::PlayerInput, nlohmann::json::object()), std::invalid_argument);
}
