#pragma once

#include "client/transport.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace volley::test {

// In-memory transport. Opens synchronously unless told to refuse, records
// every sent message and lets the test inject inbound traffic.
class FakeTransport : public client::Transport {
public:
    void open(const std::string& host, uint16_t port) override {
        ++open_calls;
        last_host = host;
        last_port = port;
        if (refuse) {
            notify_close("connection refused");
            return;
        }
        open_ = true;
        notify_open();
    }

    void send(std::vector<uint8_t> message) override {
        sent.push_back(std::move(message));
    }

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

    void deliver(std::vector<uint8_t> message) { notify_message(std::move(message)); }

    // Remote end went away
    void drop(const std::string& reason) {
        open_ = false;
        notify_close(reason);
    }

    std::vector<std::vector<uint8_t>> sent_with_opcode(uint8_t opcode) const {
        std::vector<std::vector<uint8_t>> out;
        for (const auto& m : sent) {
            if (!m.empty() && m[0] == opcode) out.push_back(m);
        }
        return out;
    }

    bool refuse = false;
    int open_calls = 0;
    std::string last_host;
    uint16_t last_port = 0;
    std::vector<std::vector<uint8_t>> sent;

private:
    bool open_ = false;
};

} // namespace volley::test
