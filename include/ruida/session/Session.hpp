#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ruida/config/RuidaConfig.hpp"
#include "ruida/core/BoundedQueue.hpp"
#include "ruida/core/Expected.hpp"
#include "ruida/core/SignalBus.hpp"
#include "ruida/core/Worker.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/transport/Transport.hpp"

namespace ruida::session {

enum class SessionState { Idle, AckPending, ReplyPending };

/// Counters kept for diagnosis; a snapshot is returned by Session::stats().
struct SessionStats {
    std::uint64_t sends = 0;
    std::uint64_t resends = 0;
    std::uint64_t acks = 0;
    std::uint64_t naks = 0;
    std::uint64_t replies = 0;
    std::uint64_t enqs = 0;
    std::uint64_t droppedPackets = 0;
};

/**
 * @brief Handshake engine serialising all traffic to one controller.
 *
 * The Ruida controller only speaks when spoken to. Every message goes out
 * alone and the next one waits until the current exchange finished:
 *
 *   IDLE -> send -> ACK_PENDING -> ack -> [REPLY_PENDING -> data ->] IDLE
 *
 * Stream transports carry no acknowledgements and go straight from the send
 * to REPLY_PENDING or IDLE.
 *
 * Threading model:
 * - The worker thread (the handshake thread) owns every transport call.
 * - Producers only call `write()`, which enqueues on a bounded queue.
 * - `jobLock()` lets a bulk sender keep status polling off the wire.
 *
 * A packet whose acknowledgement is late is retransmitted once; if the
 * acknowledgement still does not arrive within the try count the message is
 * abandoned, the link is marked not responding and the session reconnects.
 * Callers that need the message resubmit it.
 */
class Session : public core::Worker {
public:
    /// Receives unswizzled reply frames; std::nullopt reports a reply timeout.
    using ReceiveHandler = std::function<void(const std::optional<protocol::Bytes>&)>;

    Session(std::unique_ptr<transport::Transport> transport,
            config::SessionConfig cfg = {},
            core::SignalBus* bus = nullptr);
    ~Session() override;

    void setReceiveHandler(ReceiveHandler handler);

    /**
     * @brief Queue one plain (unswizzled) message for the handshake thread.
     *
     * Fails with Errc::not_connected while the session is stopped, with
     * Errc::not_responding while the link is being re-established and with
     * Errc::queue_full once the queue stayed full for every enqueue try.
     */
    expected<void> write(protocol::Bytes message);

    /// Reply timeout as a multiple of the per-attempt timeout.
    void setReplyTimeout(std::chrono::milliseconds timeout);
    int tries() const { return tries_.load(); }

    bool connected() const;
    bool isConnecting() const { return !responding_.load(); }
    bool isBusy() const { return state_.load() != SessionState::Idle; }
    SessionState state() const { return state_.load(); }

    /// Waits until the queue is empty and the last exchange finished.
    bool flush(std::chrono::milliseconds timeout);

    /// Closes the transport; the handshake thread reconnects on its own.
    void disconnect();

    SessionStats stats() const;
    std::mutex& jobLock() { return jobMutex_; }
    const protocol::Codec& codec() const { return codec_; }
    const config::SessionConfig& config() const { return cfg_; }

protected:
    void run() override;
    void wake() override;

private:
    void connect();
    bool openTransport();
    void exchange(const protocol::Bytes& message);
    bool awaitAck(const protocol::Bytes& packet, bool& wantReply);
    void awaitReply();
    void dropLateAcks();
    void markNotResponding(const std::string& why);

    protocol::Bytes package(const protocol::Bytes& message) const;
    protocol::Bytes probeMessage() const;
    protocol::Bytes probeReply() const;
    static bool expectsReply(const protocol::Bytes& message);

    void deliver(const std::optional<protocol::Bytes>& reply);
    void emit(const std::string& event);
    void sleepFor(std::chrono::milliseconds duration);

    std::unique_ptr<transport::Transport> transport_;
    config::SessionConfig cfg_;
    core::SignalBus* bus_ = nullptr;
    protocol::Codec codec_;
    core::BoundedQueue<protocol::Bytes> queue_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> responding_{false};
    std::atomic<bool> closeRequested_{false};
    std::atomic<int> tries_;
    std::atomic<std::size_t> pending_{0};

    std::atomic<std::uint64_t> sends_{0};
    std::atomic<std::uint64_t> resends_{0};
    std::atomic<std::uint64_t> acks_{0};
    std::atomic<std::uint64_t> naks_{0};
    std::atomic<std::uint64_t> replies_{0};
    std::atomic<std::uint64_t> enqs_{0};
    std::atomic<std::uint64_t> dropped_{0};

    std::mutex handlerMutex_;
    ReceiveHandler onReceive_;
    std::mutex jobMutex_;
};

} // namespace ruida::session
