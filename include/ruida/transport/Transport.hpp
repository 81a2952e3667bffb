#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "ruida/core/Expected.hpp"
#include "ruida/protocol/Codec.hpp"

namespace ruida::transport {

/**
 * @brief Duplex byte channel to a controller.
 *
 * Two families exist:
 * - Packet: one write is one datagram, replies are whole datagrams, the
 *   controller acknowledges every packet and payloads carry a checksum.
 * - Stream: a continuous byte stream with hardware flow control, no
 *   acknowledgements and no checksum.
 *
 * Reads block up to the configured timeout and fail with a code comparing
 * equal to `std::errc::timed_out` on expiry. Instances are driven by a single
 * thread (the session's handshake thread).
 */
class Transport {
public:
    enum class Kind { Packet, Stream };

    virtual ~Transport() = default;

    virtual expected<void> open() = 0;
    virtual void close() = 0;

    /// Packet transports return the next datagram and ignore @p n; stream
    /// transports return exactly @p n bytes.
    virtual expected<protocol::Bytes> read(std::size_t n) = 0;
    virtual expected<void> write(const protocol::Bytes& data) = 0;

    /// Discards everything already buffered inbound without blocking for new
    /// data. Returns the number of bytes dropped.
    virtual expected<std::size_t> purge() = 0;

    virtual void setTimeout(std::chrono::milliseconds timeout) = 0;
    virtual std::chrono::milliseconds timeout() const = 0;

    virtual bool isOpen() const = 0;
    virtual bool connected() const { return isOpen(); }

    virtual Kind kind() const = 0;

    /// Human readable peer, e.g. "udp 192.168.1.100" or "usb /dev/ttyUSB0".
    virtual std::string location() const = 0;
};

} // namespace ruida::transport
