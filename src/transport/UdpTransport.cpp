#include "ruida/transport/UdpTransport.hpp"

#include "ruida/log/Log.hpp"
#include "ruida/net/NetService.hpp"
#include "ruida/net/Resolve.hpp"

#include <array>

namespace ruida::transport {

namespace {
constexpr std::size_t DATAGRAM_CAPACITY = config::RUIDA_MAX_PAYLOAD + protocol::CHECKSUM_SIZE;
}

UdpTransport::UdpTransport(config::UdpTransportConfig cfg)
: cfg_(std::move(cfg))
, io_(net::shared_io_context()) {}

UdpTransport::~UdpTransport() {
    close();
}

expected<void> UdpTransport::open() {
    if (isOpen()) {
        return {};
    }

    net::udp::endpoint remote;
    if (auto ec = net::resolve(*io_, cfg_.host, cfg_.remotePort, remote)) {
        logError("[UdpTransport] cannot resolve ", cfg_.host, ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    auto socket = std::make_unique<net::UdpSocket>(*io_);
    if (auto ec = socket->open_v4()) {
        logError("[UdpTransport] open failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (auto ec = socket->bind_any(cfg_.localPort)) {
        logError("[UdpTransport] bind to port ", cfg_.localPort, " failed: ", ec.message(), "\n");
        socket->close();
        return unexpected(ec);
    }

    remote_ = remote;
    socket_ = std::move(socket);
    logInfo("[UdpTransport] listening on ", cfg_.localPort, ", sending to ",
            remote_.address().to_string(), ":", remote_.port(), "\n");
    return {};
}

void UdpTransport::close() {
    if (!socket_) {
        return;
    }
    socket_->close();
    socket_.reset();
    logInfo("[UdpTransport] closed\n");
}

bool UdpTransport::isOpen() const {
    return socket_ && socket_->is_open();
}

expected<protocol::Bytes> UdpTransport::read(std::size_t /*n*/) {
    if (!isOpen()) {
        return unexpected(make_error_code(core::Errc::transport_closed));
    }
    std::array<std::uint8_t, DATAGRAM_CAPACITY> buffer{};
    std::size_t received = 0;
    net::udp::endpoint sender;
    if (auto ec = socket_->recv_from(buffer.data(), buffer.size(), sender, received, cfg_.timeout)) {
        return unexpected(ec);
    }
    lastSender_ = sender;
    return protocol::Bytes(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(received));
}

expected<void> UdpTransport::write(const protocol::Bytes& data) {
    if (!isOpen()) {
        return unexpected(make_error_code(core::Errc::transport_closed));
    }
    if (auto ec = socket_->send_to(data.data(), data.size(), remote_, cfg_.timeout)) {
        logError("[UdpTransport] send failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    return {};
}

expected<std::size_t> UdpTransport::purge() {
    if (!isOpen()) {
        return unexpected(make_error_code(core::Errc::transport_closed));
    }
    std::size_t dropped = 0;
    std::array<std::uint8_t, DATAGRAM_CAPACITY> buffer{};
    while (socket_->available() > 0) {
        net::error_code ec;
        net::udp::endpoint sender;
        dropped += socket_->raw().receive_from(net::asio::buffer(buffer), sender, 0, ec);
        if (ec) {
            return unexpected(ec);
        }
    }
    return dropped;
}

std::string UdpTransport::location() const {
    return "udp " + cfg_.host;
}

} // namespace ruida::transport
