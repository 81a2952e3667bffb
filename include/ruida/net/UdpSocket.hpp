#pragma once
#include "ruida/net/NetConfig.hpp"
#include "ruida/net/Deadline.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace ruida::net {

/**
 * UdpSocket
 *
 * Datagram socket with deadline-bounded `send_to` / `recv_from`, built on
 * the same `with_deadline` pattern used for the serial port.
 */
class UdpSocket {
public:
    explicit UdpSocket(asio::io_context& io) : sock_(io) {}

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind_any(std::uint16_t port) {
        error_code ec;
        sock_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) return ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    // Send a datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        auto ex = sock_.get_executor();
        return with_deadline(ex, timeout,
            [&](auto cb){ sock_.async_send_to(asio::buffer(data, n), ep, 0, cb); },
            [&]{ error_code ignore; sock_.cancel(ignore); });
    }

    // Receive one datagram, with timeout. Returns ec + fills out_ep + out_n.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        auto ex = sock_.get_executor();
        // The handler may run after a timeout returned; it must not touch out_n.
        auto received = std::make_shared<std::size_t>(0);
        out_n = 0;
        auto ec = with_deadline(ex, timeout,
            [&](auto cb){
                sock_.async_receive_from(asio::buffer(data, max), out_ep, 0,
                    [received, cb](const error_code& op_ec, std::size_t n){
                        *received = n; cb(op_ec);
                    });
            },
            [&]{ error_code ignore; sock_.cancel(ignore); });
        if (!ec) {
            out_n = *received;
        }
        return ec;
    }

    /// Bytes the kernel already holds for this socket.
    std::size_t available() {
        error_code ec;
        auto n = sock_.available(ec);
        return ec ? 0 : n;
    }

    udp::socket& raw() { return sock_; }
    bool is_open() const { return sock_.is_open(); }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    udp::socket sock_;
};

} // namespace ruida::net
