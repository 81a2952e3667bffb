#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "ruida/protocol/Codec.hpp"

namespace ruida::config {

/**
 * @brief Ruida networking, framing, session and polling constants, and the
 * runtime config structs whose defaults come from them.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short RUIDA_DEVICE_PORT = 50200;      // controller listens
constexpr unsigned short RUIDA_HOST_PORT = 40200;        // replies come back here
constexpr unsigned short RUIDA_JOG_DEVICE_PORT = 50207;  // realtime/jog pair
constexpr unsigned short RUIDA_JOG_HOST_PORT = 40207;

// Framing ---------------------------------------------------------------------
constexpr std::uint8_t RUIDA_MAGIC_DEFAULT = 0x88;  // RDC644x
constexpr std::uint8_t RUIDA_MAGIC_634XG = 0x11;
constexpr std::size_t RUIDA_MAX_PAYLOAD = 1470;     // per datagram, after the checksum
constexpr std::size_t RUIDA_REPLY_FRAME = 9;        // DA 01 mem(2) value(5)
constexpr std::size_t RUIDA_CHUNK_BUDGET = 1000;

// Session ---------------------------------------------------------------------
constexpr std::size_t RUIDA_QUEUE_CAPACITY = 1u << 18;
constexpr std::chrono::milliseconds RUIDA_ATTEMPT_TIMEOUT{250};
constexpr std::chrono::milliseconds RUIDA_QUEUE_POLL{250};
constexpr int RUIDA_TRIES = 4;
constexpr int RUIDA_ENQUEUE_TRIES = 12;
constexpr std::chrono::milliseconds RUIDA_RECONNECT_SLEEP{500};

// Controller ------------------------------------------------------------------
constexpr std::chrono::milliseconds RUIDA_STATUS_TICK{200};
constexpr std::chrono::milliseconds RUIDA_NORMAL_TIMEOUT{1000};
constexpr std::chrono::milliseconds RUIDA_GROSS_TIMEOUT{40000};
constexpr std::chrono::milliseconds RUIDA_MOVE_WAIT_LIMIT{10000};
constexpr double RUIDA_POSITION_SCALE = 2.5801195035;  // calibration, re-measure per unit
constexpr std::int64_t RUIDA_POSITION_OFFSET_UM = 50;
constexpr double RUIDA_LOW_POWER_WARNING = 10.0;
constexpr double RUIDA_HIGH_POWER_WARNING = 70.0;

struct UdpTransportConfig {
    std::string host;
    unsigned short remotePort = RUIDA_DEVICE_PORT;
    unsigned short localPort = RUIDA_HOST_PORT;
    std::chrono::milliseconds timeout = RUIDA_ATTEMPT_TIMEOUT;
};

struct SerialTransportConfig {
    std::string device;
    unsigned int baudRate = 115200;
    bool hardwareFlowControl = true;
    std::chrono::milliseconds timeout = RUIDA_ATTEMPT_TIMEOUT;
};

struct SessionConfig {
    std::uint8_t magic = RUIDA_MAGIC_DEFAULT;
    protocol::ChecksumBasis checksumBasis = protocol::ChecksumBasis::Plain;
    std::size_t queueCapacity = RUIDA_QUEUE_CAPACITY;
    std::chrono::milliseconds attemptTimeout = RUIDA_ATTEMPT_TIMEOUT;
    std::chrono::milliseconds queuePoll = RUIDA_QUEUE_POLL;
    std::chrono::milliseconds reconnectSleep = RUIDA_RECONNECT_SLEEP;
    int tries = RUIDA_TRIES;
    int enqueueTries = RUIDA_ENQUEUE_TRIES;
    std::size_t replyFrameSize = RUIDA_REPLY_FRAME;
};

struct ControllerConfig {
    std::size_t chunkBudget = RUIDA_CHUNK_BUDGET;
    std::chrono::milliseconds statusTick = RUIDA_STATUS_TICK;
    std::chrono::milliseconds normalTimeout = RUIDA_NORMAL_TIMEOUT;
    std::chrono::milliseconds grossTimeout = RUIDA_GROSS_TIMEOUT;
    double positionScale = RUIDA_POSITION_SCALE;
    std::int64_t positionOffsetUm = RUIDA_POSITION_OFFSET_UM;
    bool pollStatus = true;
};

struct EmulatorConfig {
    std::uint8_t magic = RUIDA_MAGIC_DEFAULT;
    protocol::ChecksumBasis checksumBasis = protocol::ChecksumBasis::Plain;
    bool autoDetectMagic = true;
    unsigned short port = RUIDA_DEVICE_PORT;
    unsigned short jogPort = RUIDA_JOG_DEVICE_PORT;
    double defaultPower = 0.0;  // percent, until the job sets one
};

} // namespace ruida::config
