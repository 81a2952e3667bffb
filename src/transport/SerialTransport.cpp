#include "ruida/transport/SerialTransport.hpp"

#include "ruida/log/Log.hpp"
#include "ruida/net/Deadline.hpp"
#include "ruida/net/NetService.hpp"

#include <array>
#include <memory>

namespace ruida::transport {

namespace asio = net::asio;

namespace {
constexpr std::chrono::milliseconds PURGE_POLL{10};
}

SerialTransport::SerialTransport(config::SerialTransportConfig cfg)
: cfg_(std::move(cfg))
, io_(net::shared_io_context()) {}

SerialTransport::~SerialTransport() {
    close();
}

expected<void> SerialTransport::open() {
    if (isOpen()) {
        return {};
    }

    auto port = std::make_unique<asio::serial_port>(*io_);
    net::error_code ec;
    port->open(cfg_.device, ec);
    if (ec) {
        logError("[SerialTransport] cannot open ", cfg_.device, ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    using base = asio::serial_port_base;
    port->set_option(base::baud_rate(cfg_.baudRate), ec);
    if (!ec) port->set_option(base::character_size(8), ec);
    if (!ec) port->set_option(base::parity(base::parity::none), ec);
    if (!ec) port->set_option(base::stop_bits(base::stop_bits::one), ec);
    if (!ec) {
        port->set_option(base::flow_control(cfg_.hardwareFlowControl
                                                ? base::flow_control::hardware
                                                : base::flow_control::none), ec);
    }
    if (ec) {
        logError("[SerialTransport] cannot configure ", cfg_.device, ": ", ec.message(), "\n");
        net::error_code ignore;
        port->close(ignore);
        return unexpected(ec);
    }

    port_ = std::move(port);
    logInfo("[SerialTransport] opened ", cfg_.device, " at ", cfg_.baudRate, " baud\n");
    return {};
}

void SerialTransport::close() {
    if (!port_) {
        return;
    }
    net::error_code ignore;
    port_->cancel(ignore);
    port_->close(ignore);
    port_.reset();
    logInfo("[SerialTransport] closed ", cfg_.device, "\n");
}

bool SerialTransport::isOpen() const {
    return port_ && port_->is_open();
}

expected<protocol::Bytes> SerialTransport::read(std::size_t n) {
    if (!isOpen()) {
        return unexpected(make_error_code(core::Errc::transport_closed));
    }
    protocol::Bytes data(n);
    auto ec = net::with_deadline(port_->get_executor(), cfg_.timeout,
        [&](auto completion) {
            asio::async_read(*port_, asio::buffer(data),
                [completion](const net::error_code& op_ec, std::size_t) { completion(op_ec); });
        },
        [&] { net::error_code ignore; port_->cancel(ignore); });
    if (ec) {
        return unexpected(ec);
    }
    return data;
}

expected<void> SerialTransport::write(const protocol::Bytes& data) {
    if (!isOpen()) {
        return unexpected(make_error_code(core::Errc::transport_closed));
    }
    auto ec = net::with_deadline(port_->get_executor(), cfg_.timeout,
        [&](auto completion) {
            asio::async_write(*port_, asio::buffer(data),
                [completion](const net::error_code& op_ec, std::size_t) { completion(op_ec); });
        },
        [&] { net::error_code ignore; port_->cancel(ignore); });
    if (ec) {
        logError("[SerialTransport] write failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    return {};
}

expected<std::size_t> SerialTransport::purge() {
    if (!isOpen()) {
        return unexpected(make_error_code(core::Errc::transport_closed));
    }
    // Serial ports expose no pending-byte count; drain until a short read times out.
    std::size_t dropped = 0;
    std::array<std::uint8_t, 256> buffer{};
    for (;;) {
        auto got = std::make_shared<std::size_t>(0);
        auto ec = net::with_deadline(port_->get_executor(), PURGE_POLL,
            [&](auto completion) {
                port_->async_read_some(asio::buffer(buffer),
                    [got, completion](const net::error_code& op_ec, std::size_t n) {
                        *got = n;
                        completion(op_ec);
                    });
            },
            [&] { net::error_code ignore; port_->cancel(ignore); });
        if (core::isTimeout(ec)) {
            return dropped;
        }
        if (ec) {
            return unexpected(ec);
        }
        dropped += *got;
    }
}

} // namespace ruida::transport
