#pragma once

#include <memory>

#include "ruida/config/RuidaConfig.hpp"
#include "ruida/net/NetConfig.hpp"
#include "ruida/transport/Transport.hpp"

namespace ruida::transport {

/**
 * @brief Stream transport over a USB serial port.
 *
 * Uses hardware flow control. The controller never acknowledges on this
 * link, so the session skips straight to reading reply frames.
 */
class SerialTransport : public Transport {
public:
    explicit SerialTransport(config::SerialTransportConfig cfg);
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    expected<void> open() override;
    void close() override;

    /// Blocks until exactly @p n bytes arrived or the timeout expired.
    expected<protocol::Bytes> read(std::size_t n) override;
    expected<void> write(const protocol::Bytes& data) override;
    expected<std::size_t> purge() override;

    void setTimeout(std::chrono::milliseconds timeout) override { cfg_.timeout = timeout; }
    std::chrono::milliseconds timeout() const override { return cfg_.timeout; }

    bool isOpen() const override;
    Kind kind() const override { return Kind::Stream; }
    std::string location() const override { return "usb " + cfg_.device; }

private:
    config::SerialTransportConfig cfg_;
    std::shared_ptr<net::asio::io_context> io_;
    std::unique_ptr<net::asio::serial_port> port_;
};

} // namespace ruida::transport
