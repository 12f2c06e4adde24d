#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace volley::client {

/**
 * Message-oriented duplex link to the server. Each delivered or sent buffer
 * is one logical message: opcode byte followed by its payload. How messages
 * are framed on the wire is the implementation's business.
 *
 * All callbacks fire on the thread that polls the owning io_context.
 */
class Transport {
public:
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(std::vector<uint8_t>)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~Transport() = default;

    void set_handlers(OpenHandler on_open, MessageHandler on_message, CloseHandler on_close) {
        on_open_ = std::move(on_open);
        on_message_ = std::move(on_message);
        on_close_ = std::move(on_close);
    }

    // Start connecting. Success fires the open handler; failure fires the
    // close handler.
    virtual void open(const std::string& host, uint16_t port) = 0;

    virtual void send(std::vector<uint8_t> message) = 0;

    // Local close. Does not fire the close handler.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

protected:
    void notify_open() { if (on_open_) on_open_(); }
    void notify_message(std::vector<uint8_t> message) { if (on_message_) on_message_(std::move(message)); }
    void notify_close(const std::string& reason) { if (on_close_) on_close_(reason); }

private:
    OpenHandler on_open_;
    MessageHandler on_message_;
    CloseHandler on_close_;
};

} // namespace volley::client
