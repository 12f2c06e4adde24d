#pragma once

#include "client/transport.hpp"
#include "protocol/frame.hpp"
#include <asio.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace volley::client {

// Transport over a single TCP stream, one length-prefixed frame per message.
class TcpTransport : public Transport {
public:
    using tcp = asio::ip::tcp;

    explicit TcpTransport(asio::io_context& io_context);
    ~TcpTransport() override;

    void open(const std::string& host, uint16_t port) override;
    void send(std::vector<uint8_t> message) override;
    void close() override;
    bool is_open() const override { return open_; }

private:
    void read_header(uint64_t session);
    void read_payload(uint64_t session);
    void do_write(uint64_t session);
    void fail(uint64_t session, const std::string& reason);

    asio::io_context& io_context_;
    tcp::resolver resolver_;
    tcp::socket socket_;

    // Bumped on every open/close so handlers of a dead socket do nothing
    uint64_t session_ = 0;
    bool open_ = false;

    std::array<uint8_t, protocol::FrameHeader::serialized_size()> header_buffer_{};
    protocol::FrameHeader current_header_;
    std::vector<uint8_t> payload_buffer_;

    std::deque<std::vector<uint8_t>> write_queue_;
    bool writing_ = false;
};

} // namespace volley::client
