#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ruida/config/RuidaConfig.hpp"
#include "ruida/core/Driver.hpp"
#include "ruida/core/Expected.hpp"
#include "ruida/core/SignalBus.hpp"
#include "ruida/core/Worker.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/Program.hpp"
#include "ruida/session/Session.hpp"

namespace ruida::controller {

/// The controller publishes scene units on topics::Position.
using PositionChange = core::PositionChange;

/// Latest values read back from the controller's memory.
struct ControllerStatus {
    std::uint64_t cardId = 0;
    std::optional<std::uint32_t> machineStatus;
    std::string label = "Idle";
    double bedWidthMm = -1.0;
    double bedHeightMm = -1.0;
    std::int32_t nativeX = 0;
    std::int32_t nativeY = 0;
    std::int32_t nativeZ = 0;
    std::int32_t nativeU = 0;
    double sceneX = -1.0;
    double sceneY = -1.0;
    bool idle = true;
};

/// "Moving", "Part End", "Job Running" or "Idle".
std::string machineStatusLabel(std::uint32_t status);

/**
 * @brief Job transmission and status polling on top of a Session.
 *
 * The worker thread is the status poller: every tick it issues one memory
 * read from a fixed rotation and moves on only once the matching reply came
 * back. A bulk send holds the session's job lock for its whole duration, so
 * the poller stays off the wire until the job has drained.
 *
 * The controller installs itself as the session's receive handler; the
 * session must outlive it.
 */
class RuidaController : public core::Worker {
public:
    RuidaController(session::Session& session,
                    config::ControllerConfig cfg = {},
                    core::SignalBus* bus = nullptr);
    ~RuidaController() override;

    RuidaController(const RuidaController&) = delete;
    RuidaController& operator=(const RuidaController&) = delete;

    /**
     * @brief Chunk @p program and send it on a background thread.
     *
     * Fails with `std::errc::device_or_resource_busy` while an earlier job is
     * still being sent.
     */
    expected<void> send(const protocol::Program& program);

    /// Waits for the current bulk send to finish. Returns false on timeout.
    bool waitSent(std::chrono::milliseconds timeout);
    bool isSending() const { return sending_.load(); }

    /// Number of chunks the last send() produced.
    std::size_t lastChunkCount() const { return lastChunkCount_.load(); }

    expected<void> abort();
    expected<void> pause();
    expected<void> resume();
    bool paused() const { return paused_.load(); }

    /**
     * @brief Poll position until the head reports (x, y) to the millimetre.
     *
     * Status polling pauses meanwhile. Gives up after ten seconds.
     */
    bool waitForMove(std::int32_t x, std::int32_t y);

    /// Blocks while the machine reports motion or a running job.
    bool waitIdle(std::chrono::milliseconds timeout);

    /// Long reply timeout for operations that silence the controller (homing).
    void grossTimeout();
    void normalTimeout();

    /// Session receive path; public so tests can inject frames.
    void handleReply(const std::optional<protocol::Bytes>& reply);

    ControllerStatus status() const;

    /// Order of memory reads issued by the poller.
    static const std::vector<std::uint16_t>& statusAddresses();

protected:
    void run() override;

private:
    void sendChunks(std::vector<protocol::Bytes> chunks, bool lowPower, bool highPower);
    expected<void> realtime(void (protocol::Program::*build)());
    void pollOnce();

    void updateCardId(std::uint64_t value);
    void updateMachineStatus(std::uint32_t value);
    void updateBedX(std::uint64_t value);
    void updateBedY(std::uint64_t value);
    void updateX(std::int32_t value);
    void updateY(std::int32_t value);
    void publishPosition();

    void emit(const std::string& event);
    void joinSender();

    session::Session& session_;
    config::ControllerConfig cfg_;
    core::SignalBus* bus_ = nullptr;

    std::thread sender_;
    std::atomic<bool> sending_{false};
    std::atomic<std::size_t> lastChunkCount_{0};
    std::atomic<bool> paused_{false};
    std::mutex sendMutex_;
    std::condition_variable sendDone_;

    mutable std::mutex statusMutex_;
    ControllerStatus status_;
    std::int64_t bedXUm_ = 0;
    bool xRead_ = false;
    bool yRead_ = false;
    double lastSceneX_ = 0.0;
    double lastSceneY_ = 0.0;

    std::size_t next_ = 0;
    bool awaiting_ = false;
    std::chrono::steady_clock::time_point issuedAt_{};
};

} // namespace ruida::controller
