#include "tcp_transport.hpp"
#include <SDL3/SDL_log.h>
#include <string>
#include <utility>

namespace volley::client {

using namespace volley::protocol;

TcpTransport::TcpTransport(asio::io_context& io_context)
    : io_context_(io_context), resolver_(io_context), socket_(io_context) {
}

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::open(const std::string& host, uint16_t port) {
    close();
    uint64_t session = ++session_;

    resolver_.async_resolve(host, std::to_string(port),
        [this, session](asio::error_code ec, tcp::resolver::results_type endpoints) {
            if (session != session_) return;
            if (ec) {
                fail(session, "resolve failed: " + ec.message());
                return;
            }
            asio::async_connect(socket_, endpoints,
                [this, session](asio::error_code ec, const tcp::endpoint& endpoint) {
                    if (session != session_) return;
                    if (ec) {
                        fail(session, "connect failed: " + ec.message());
                        return;
                    }
                    asio::error_code opt_ec;
                    socket_.set_option(tcp::no_delay(true), opt_ec);
                    open_ = true;
                    SDL_Log("TcpTransport: connected to %s:%u",
                            endpoint.address().to_string().c_str(), endpoint.port());
                    read_header(session);
                    notify_open();
                });
        });
}

void TcpTransport::send(std::vector<uint8_t> message) {
    if (!open_ || message.empty()) return;
    write_queue_.push_back(build_frame(message));
    if (!writing_) {
        writing_ = true;
        do_write(session_);
    }
}

void TcpTransport::close() {
    ++session_;
    open_ = false;
    writing_ = false;
    write_queue_.clear();
    resolver_.cancel();
    asio::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void TcpTransport::fail(uint64_t session, const std::string& reason) {
    if (session != session_) return;
    close();
    notify_close(reason);
}

void TcpTransport::read_header(uint64_t session) {
    asio::async_read(socket_, asio::buffer(header_buffer_),
        [this, session](asio::error_code ec, std::size_t /*length*/) {
            if (session != session_) return;
            if (ec) {
                fail(session, ec == asio::error::eof ? "closed by server" : "read error: " + ec.message());
                return;
            }
            current_header_.deserialize(header_buffer_);
            if (current_header_.payload_size > MAX_FRAME_PAYLOAD) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TcpTransport: frame of %u bytes exceeds limit",
                             current_header_.payload_size);
                fail(session, "oversized frame");
                return;
            }
            payload_buffer_.assign(1 + current_header_.payload_size, 0);
            payload_buffer_[0] = current_header_.opcode;
            if (current_header_.payload_size == 0) {
                notify_message(std::move(payload_buffer_));
                if (session == session_) read_header(session);
            } else {
                read_payload(session);
            }
        });
}

void TcpTransport::read_payload(uint64_t session) {
    asio::async_read(socket_, asio::buffer(payload_buffer_.data() + 1, current_header_.payload_size),
        [this, session](asio::error_code ec, std::size_t /*length*/) {
            if (session != session_) return;
            if (ec) {
                fail(session, "payload read error: " + ec.message());
                return;
            }
            notify_message(std::move(payload_buffer_));
            // The handler may have closed or reopened us
            if (session == session_) read_header(session);
        });
}

void TcpTransport::do_write(uint64_t session) {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, session](asio::error_code ec, std::size_t /*length*/) {
            if (session != session_) return;
            if (ec) {
                fail(session, "write error: " + ec.message());
                return;
            }
            write_queue_.pop_front();
            do_write(session);
        });
}

} // namespace volley::client
