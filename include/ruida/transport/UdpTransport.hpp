#pragma once

#include <memory>
#include <mutex>

#include "ruida/config/RuidaConfig.hpp"
#include "ruida/net/NetConfig.hpp"
#include "ruida/net/UdpSocket.hpp"
#include "ruida/transport/Transport.hpp"

namespace ruida::transport {

/**
 * @brief Packet transport over UDP.
 *
 * Binds the host listen port (40200 by default) and sends every packet to
 * the controller's device port (50200). The last datagram source is kept so
 * callers can check which peer answered.
 */
class UdpTransport : public Transport {
public:
    explicit UdpTransport(config::UdpTransportConfig cfg);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    expected<void> open() override;
    void close() override;

    expected<protocol::Bytes> read(std::size_t n) override;
    expected<void> write(const protocol::Bytes& data) override;
    expected<std::size_t> purge() override;

    void setTimeout(std::chrono::milliseconds timeout) override { cfg_.timeout = timeout; }
    std::chrono::milliseconds timeout() const override { return cfg_.timeout; }

    bool isOpen() const override;
    Kind kind() const override { return Kind::Packet; }
    std::string location() const override;

    const net::udp::endpoint& lastSender() const { return lastSender_; }

private:
    config::UdpTransportConfig cfg_;
    std::shared_ptr<net::asio::io_context> io_;
    std::unique_ptr<net::UdpSocket> socket_;
    net::udp::endpoint remote_;
    net::udp::endpoint lastSender_;
};

} // namespace ruida::transport
