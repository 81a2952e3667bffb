#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "ruida/config/RuidaConfig.hpp"
#include "ruida/core/Driver.hpp"
#include "ruida/core/PlotCut.hpp"
#include "ruida/core/SignalBus.hpp"
#include "ruida/emulator/JobSpooler.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/Interpreter.hpp"
#include "ruida/protocol/MemoryMap.hpp"

namespace ruida::emulator {

/**
 * @brief Plays the controller side of the protocol.
 *
 * Inbound bytes are unswizzled, split into commands and interpreted with
 * the same cursor and plot-cut rules a real controller applies. Interface
 * keys, memory access and process control run immediately; everything else
 * is queued as a job on the spooler and executed in order. Committed plot
 * cuts go to the attached driver and to topics::PlotCommitted.
 *
 * A plot cut stays open across packets until a command closes it, so a
 * polyline chunked over several datagrams arrives as one cut. Head moves
 * are published on topics::Position (device micrometres), machine state
 * changes ("idle", "busy", "hold") on topics::Status and commands that fail
 * to decode on topics::EmulatorError.
 *
 * Replies are handed to the caller's sink already swizzled.
 */
class Emulator {
public:
    using ReplySink = std::function<void(const protocol::Bytes& wire)>;

    explicit Emulator(config::EmulatorConfig cfg = {},
                      core::Driver* driver = nullptr,
                      core::SignalBus* bus = nullptr);
    ~Emulator();

    Emulator(const Emulator&) = delete;
    Emulator& operator=(const Emulator&) = delete;

    /// Starts and stops the job executor.
    void start();
    void stop();

    /**
     * @brief Packet from the device port: `[checksum:2][swizzled commands]`.
     *
     * Replies ACK when the checksum matches and NAK (dropping the packet)
     * when it does not.
     */
    void checksumWrite(const std::uint8_t* data, std::size_t size, const ReplySink& reply);

    /// Packet from the jog port: swizzled, no checksum, executed at once.
    void realtimeWrite(const std::uint8_t* data, std::size_t size, const ReplySink& reply);

    /// Already unswizzled commands, e.g. from a captured file.
    void write(const protocol::Bytes& plain, const ReplySink& reply = {});

    /// Waits until every queued job has executed.
    bool waitIdle(std::chrono::milliseconds timeout);

    std::uint8_t magic() const;
    void setMagic(std::uint8_t magic);

    /// Every plot cut committed so far, oldest first.
    std::vector<core::PlotCut> plotted() const;
    void clearPlotted();

    /// The plot cut still accumulating, if any.
    std::optional<core::PlotCut> openCut() const;

    /// Closes the open plot cut, e.g. once the link goes quiet.
    void commit();

    protocol::CursorState cursor() const;
    const protocol::MemoryMap& memory() const { return memory_; }

    /// Position and state as reported through the memory map.
    core::DriverStatus driverStatus() const;

private:
    class TrackingDriver;

    void dispatch(const std::vector<protocol::Command>& commands, const ReplySink& reply);
    void runNow(const protocol::Command& command, const ReplySink& reply);
    void execute(const JobSpooler::Job& job);
    void respond(const ReplySink& reply, const protocol::Bytes& plain, const char* what);
    void onCommit(const core::PlotCut& cut);
    void publishChanges();
    void reportFailure(const protocol::DecodeError& error);

    config::EmulatorConfig cfg_;
    core::SignalBus* bus_ = nullptr;
    std::unique_ptr<TrackingDriver> tracking_;
    protocol::MemoryMap memory_;

    mutable std::mutex codecMutex_;
    protocol::Codec codec_;

    mutable std::mutex interpMutex_;
    protocol::Interpreter interpreter_;

    mutable std::mutex plotMutex_;
    std::vector<core::PlotCut> plotted_;

    std::mutex publishMutex_;
    core::DriverStatus published_;

    JobSpooler spooler_;
};

} // namespace ruida::emulator
