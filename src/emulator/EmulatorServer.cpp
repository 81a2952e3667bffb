#include "ruida/emulator/EmulatorServer.hpp"

#include "ruida/log/Log.hpp"
#include "ruida/net/NetService.hpp"

#include <array>

namespace ruida::emulator {

namespace {
constexpr std::size_t DATAGRAM_CAPACITY = config::RUIDA_MAX_PAYLOAD + protocol::CHECKSUM_SIZE;
constexpr std::chrono::milliseconds RECEIVE_POLL{250};
constexpr std::chrono::milliseconds REPLY_TIMEOUT{250};
}

UdpEndpoint::UdpEndpoint(std::string name, unsigned short port, Handler handler)
: core::Worker(std::move(name))
, port_(port)
, handler_(std::move(handler))
, io_(net::shared_io_context()) {}

UdpEndpoint::~UdpEndpoint() {
    stop();
    if (socket_) {
        socket_->close();
    }
}

expected<void> UdpEndpoint::open() {
    auto socket = std::make_unique<net::UdpSocket>(*io_);
    if (auto ec = socket->open_v4()) {
        logError("[", name(), "] open failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (auto ec = socket->bind_any(port_)) {
        logError("[", name(), "] bind to port ", port_, " failed: ", ec.message(), "\n");
        socket->close();
        return unexpected(ec);
    }
    socket_ = std::move(socket);
    logInfo("[", name(), "] listening on udp port ", port_, "\n");
    return {};
}

void UdpEndpoint::run() {
    std::array<std::uint8_t, DATAGRAM_CAPACITY> buffer{};
    while (running) {
        net::udp::endpoint sender;
        std::size_t received = 0;
        auto ec = socket_->recv_from(buffer.data(), buffer.size(), sender, received, RECEIVE_POLL);
        if (ec) {
            if (!core::isTimeout(ec) && ec != net::asio::error::operation_aborted) {
                logError("[", name(), "] receive failed: ", ec.message(), "\n");
            }
            continue;
        }
        if (received == 0) {
            continue;
        }

        handler_(buffer.data(), received, [this, sender](const protocol::Bytes& wire) {
            if (auto sendEc = socket_->send_to(wire.data(), wire.size(), sender, REPLY_TIMEOUT)) {
                logError("[", name(), "] reply to ", sender.address().to_string(),
                         " failed: ", sendEc.message(), "\n");
            }
        });
    }
}

EmulatorServer::EmulatorServer(Emulator& emulator)
: emulator_(emulator) {}

EmulatorServer::~EmulatorServer() {
    stop();
}

expected<void> EmulatorServer::start(unsigned short port, unsigned short jogPort) {
    stop();

    auto device = std::make_unique<UdpEndpoint>("RuidaDevice", port,
        [this](const std::uint8_t* data, std::size_t size, const Emulator::ReplySink& reply) {
            emulator_.checksumWrite(data, size, reply);
        });
    auto jog = std::make_unique<UdpEndpoint>("RuidaJog", jogPort,
        [this](const std::uint8_t* data, std::size_t size, const Emulator::ReplySink& reply) {
            emulator_.realtimeWrite(data, size, reply);
        });

    if (auto opened = device->open(); !opened) {
        return opened;
    }
    if (auto opened = jog->open(); !opened) {
        return opened;
    }

    emulator_.start();
    device_ = std::move(device);
    jog_ = std::move(jog);
    device_->start();
    jog_->start();
    return {};
}

void EmulatorServer::stop() {
    if (device_) {
        device_->stop();
        device_.reset();
    }
    if (jog_) {
        jog_->stop();
        jog_.reset();
    }
    emulator_.stop();
    emulator_.commit();
}

} // namespace ruida::emulator
