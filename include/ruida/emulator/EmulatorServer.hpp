#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "ruida/config/RuidaConfig.hpp"
#include "ruida/core/Expected.hpp"
#include "ruida/core/Worker.hpp"
#include "ruida/emulator/Emulator.hpp"
#include "ruida/net/UdpSocket.hpp"

namespace ruida::emulator {

/**
 * @brief One bound UDP port feeding datagrams into a handler.
 *
 * Replies go back to whichever endpoint sent the datagram being handled.
 */
class UdpEndpoint : public core::Worker {
public:
    using Handler = std::function<void(const std::uint8_t* data, std::size_t size,
                                       const Emulator::ReplySink& reply)>;

    UdpEndpoint(std::string name, unsigned short port, Handler handler);
    ~UdpEndpoint() override;

    expected<void> open();
    unsigned short port() const { return port_; }

protected:
    void run() override;

private:
    unsigned short port_;
    Handler handler_;
    std::shared_ptr<net::asio::io_context> io_;
    std::unique_ptr<net::UdpSocket> socket_;
};

/**
 * @brief Serves an Emulator on the device port and the jog port.
 *
 * Device-port packets carry a checksum and are acknowledged or refused;
 * jog-port packets are executed as they arrive.
 */
class EmulatorServer {
public:
    explicit EmulatorServer(Emulator& emulator);
    ~EmulatorServer();

    EmulatorServer(const EmulatorServer&) = delete;
    EmulatorServer& operator=(const EmulatorServer&) = delete;

    expected<void> start(unsigned short port = config::RUIDA_DEVICE_PORT,
                         unsigned short jogPort = config::RUIDA_JOG_DEVICE_PORT);
    void stop();

private:
    Emulator& emulator_;
    std::unique_ptr<UdpEndpoint> device_;
    std::unique_ptr<UdpEndpoint> jog_;
};

} // namespace ruida::emulator
