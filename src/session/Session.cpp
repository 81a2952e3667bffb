#include "ruida/session/Session.hpp"

#include "ruida/log/Log.hpp"
#include "ruida/protocol/Interpreter.hpp"
#include "ruida/protocol/MemoryMap.hpp"
#include "ruida/protocol/Opcodes.hpp"

#include <algorithm>
#include <thread>

namespace ruida::session {

using protocol::Bytes;
using transport::Transport;

namespace {
constexpr std::chrono::milliseconds SLEEP_SLICE{10};
}

Session::Session(std::unique_ptr<Transport> transport,
                 config::SessionConfig cfg,
                 core::SignalBus* bus)
: core::Worker("RuidaSession")
, transport_(std::move(transport))
, cfg_(cfg)
, bus_(bus)
, codec_(cfg.magic)
, queue_(cfg.queueCapacity)
, tries_(std::max(1, cfg.tries)) {}

Session::~Session() {
    stop();
    if (transport_) {
        transport_->close();
    }
}

void Session::wake() {
    queue_.notify();
}

void Session::setReceiveHandler(ReceiveHandler handler) {
    std::lock_guard lock(handlerMutex_);
    onReceive_ = std::move(handler);
}

bool Session::connected() const {
    return isRunning() && responding_.load();
}

void Session::setReplyTimeout(std::chrono::milliseconds timeout) {
    const auto attempt = std::max<std::chrono::milliseconds::rep>(1, cfg_.attemptTimeout.count());
    tries_ = std::max(1, static_cast<int>(timeout.count() / attempt));
}

SessionStats Session::stats() const {
    SessionStats s;
    s.sends = sends_.load();
    s.resends = resends_.load();
    s.acks = acks_.load();
    s.naks = naks_.load();
    s.replies = replies_.load();
    s.enqs = enqs_.load();
    s.droppedPackets = dropped_.load();
    return s;
}

expected<void> Session::write(Bytes message) {
    if (message.empty()) {
        return {};
    }
    for (int attempt = 0; attempt < cfg_.enqueueTries; ++attempt) {
        if (!isRunning()) {
            return unexpected(make_error_code(core::Errc::not_connected));
        }
        if (!responding_.load()) {
            return unexpected(make_error_code(core::Errc::not_responding));
        }
        ++pending_;
        if (queue_.push(message, cfg_.queuePoll)) {
            return {};
        }
        --pending_;
    }
    logWarning("[RuidaSession] send queue full, message dropped\n");
    emit("Send queue FULL");
    return unexpected(make_error_code(core::Errc::queue_full));
}

bool Session::flush(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (pending_.load() != 0 || state_.load() != SessionState::Idle) {
        if (!isRunning() || std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
}

void Session::disconnect() {
    closeRequested_ = true;
    responding_ = false;
    queue_.notify();
}

void Session::run() {
    state_ = SessionState::Idle;
    responding_ = false;

    while (running) {
        connect();
        if (!running || !responding_) {
            continue;
        }

        auto message = queue_.pop(cfg_.queuePoll);
        if (!message) {
            continue;
        }
        if (running && responding_) {
            exchange(*message);
        } else {
            logDebug("[RuidaSession] dropped ", protocol::hexDump(*message), " (link down)\n");
        }
        --pending_;
    }

    state_ = SessionState::Idle;
    responding_ = false;
    queue_.clear();
    pending_ = 0;
    transport_->close();
    emit("Disconnected");
}

bool Session::openTransport() {
    if (transport_->isOpen()) {
        return true;
    }
    if (auto opened = transport_->open(); !opened) {
        logDebug("[RuidaSession] open failed: ", opened.error().message(), "\n");
        return false;
    }
    transport_->setTimeout(cfg_.attemptTimeout);
    return true;
}

void Session::connect() {
    if (closeRequested_.exchange(false)) {
        transport_->close();
        responding_ = false;
        emit("Disconnected");
    }
    if (responding_) {
        return;
    }

    emit("Connecting");
    const Bytes probe = probeMessage();
    const Bytes packet = package(probe);
    const Bytes expectedReply = probeReply();

    while (running && !responding_) {
        if (!openTransport()) {
            sleepFor(cfg_.reconnectSleep);
            continue;
        }

        state_ = SessionState::AckPending;
        ++enqs_;
        if (transport_->write(packet)) {
            auto data = transport_->read(expectedReply.size());
            if (data && codec_.unswizzle(*data) == expectedReply) {
                responding_ = true;
                break;
            }
        }
        state_ = SessionState::Idle;

        sleepFor(cfg_.reconnectSleep);
        if (transport_->kind() == Transport::Kind::Stream) {
            // Serial devices may re-enumerate after a power cycle.
            transport_->close();
        }
    }
    state_ = SessionState::Idle;
    if (!responding_) {
        return;
    }

    // Drop anything the controller buffered while we were away.
    auto dropped = transport_->purge();
    if (!dropped) {
        logError("[RuidaSession] purge failed: ", dropped.error().message(), "\n");
        responding_ = false;
        transport_->close();
        return;
    }
    if (*dropped > 0) {
        ++dropped_;
    }

    ++pending_;
    if (!queue_.tryPush(probe)) {
        --pending_;
    }
    emit("Connected: " + transport_->location());
}

void Session::exchange(const Bytes& message) {
    bool wantReply = expectsReply(message);
    const Bytes packet = package(message);

    logDebug("[RuidaSession] TX ", protocol::hexDump(message), "\n");
    if (auto sent = transport_->write(packet); !sent) {
        markNotResponding("send failed: " + sent.error().message());
        transport_->close();
        return;
    }
    ++sends_;

    if (transport_->kind() == Transport::Kind::Packet) {
        state_ = SessionState::AckPending;
        if (!awaitAck(packet, wantReply)) {
            return;
        }
    }

    if (wantReply) {
        state_ = SessionState::ReplyPending;
        awaitReply();
    }
    state_ = SessionState::Idle;
}

bool Session::awaitAck(const Bytes& packet, bool& wantReply) {
    int remaining = tries_.load();
    bool retransmitted = false;

    while (running) {
        auto data = transport_->read(1);
        if (!data) {
            if (!core::isTimeout(data.error())) {
                markNotResponding("receive failed: " + data.error().message());
                transport_->close();
                return false;
            }
            if (--remaining <= 0) {
                markNotResponding("no acknowledgement");
                return false;
            }
            if (!retransmitted) {
                retransmitted = true;
                if (auto sent = transport_->write(packet); !sent) {
                    markNotResponding("resend failed: " + sent.error().message());
                    transport_->close();
                    return false;
                }
                ++resends_;
            }
            continue;
        }

        const Bytes reply = codec_.unswizzle(*data);
        if (reply.size() == 1) {
            switch (reply[0]) {
                case protocol::ACK:
                    ++acks_;
                    responding_ = true;
                    if (retransmitted && !wantReply) {
                        dropLateAcks();
                    }
                    return true;
                case protocol::NAK:
                    ++naks_;
                    logDebug("[RuidaSession] NAK, resending\n");
                    if (auto sent = transport_->write(packet); !sent) {
                        markNotResponding("resend failed: " + sent.error().message());
                        transport_->close();
                        return false;
                    }
                    break;
                case protocol::ENQ:
                    ++enqs_;
                    break;
                case protocol::ERR:
                    logWarning("[RuidaSession] controller rejected ", protocol::hexDump(packet), "\n");
                    ++acks_;
                    return true;
                default:
                    logDebug("[RuidaSession] unexpected token ", protocol::hexDump(reply), "\n");
                    break;
            }
        } else if (!reply.empty()) {
            emit("Reply data when expecting ACK.");
            ++replies_;
            wantReply = false;
            deliver(reply);
        }
    }
    return false;
}

void Session::awaitReply() {
    int remaining = tries_.load();

    while (running) {
        auto data = transport_->read(cfg_.replyFrameSize);
        if (data) {
            if (data->empty()) {
                continue;
            }
            const Bytes reply = codec_.unswizzle(*data);
            if (reply.size() == 1) {
                // A late ACK of an earlier retransmit, or a keep-alive.
                if (reply[0] == protocol::ACK) {
                    ++acks_;
                } else if (reply[0] == protocol::ENQ) {
                    ++enqs_;
                }
                logDebug("[RuidaSession] token ", protocol::hexDump(reply), " while expecting data\n");
                continue;
            }
            ++replies_;
            logDebug("[RuidaSession] RX ", protocol::hexDump(reply), "\n");
            deliver(reply);
            return;
        }
        if (!core::isTimeout(data.error())) {
            markNotResponding("receive failed: " + data.error().message());
            transport_->close();
            deliver(std::nullopt);
            return;
        }
        if (--remaining <= 0) {
            markNotResponding("Time out when expecting data.");
            deliver(std::nullopt);
            return;
        }
    }
}

void Session::dropLateAcks() {
    auto dropped = transport_->purge();
    if (!dropped) {
        logWarning("[RuidaSession] purge failed: ", dropped.error().message(), "\n");
        return;
    }
    if (*dropped > 0) {
        ++dropped_;
        logDebug("[RuidaSession] dropped ", *dropped, " byte(s) after a retransmit\n");
    }
}

void Session::markNotResponding(const std::string& why) {
    responding_ = false;
    state_ = SessionState::Idle;
    logError("[RuidaSession] not responding: ", why, "\n");
    emit(why);
}

Bytes Session::package(const Bytes& message) const {
    if (transport_->kind() == Transport::Kind::Packet) {
        return protocol::frame(codec_, message, cfg_.checksumBasis);
    }
    return codec_.swizzle(message);
}

Bytes Session::probeMessage() const {
    if (transport_->kind() == Transport::Kind::Packet) {
        return Bytes{protocol::ENQ};
    }
    // No bare ACK/ENQ on the stream link; a status read proves liveness.
    return protocol::memoryGet(protocol::MEM_MACHINE_STATUS);
}

Bytes Session::probeReply() const {
    if (transport_->kind() == Transport::Kind::Packet) {
        return Bytes{protocol::ACK};
    }
    return Bytes{protocol::op::MEMORY, protocol::sub::MEM_SET};
}

bool Session::expectsReply(const Bytes& message) {
    // Every DA command except a memory set answers with data.
    return message.size() > 1 && message[0] == protocol::op::MEMORY
        && message[1] != protocol::sub::MEM_SET;
}

void Session::deliver(const std::optional<Bytes>& reply) {
    ReceiveHandler handler;
    {
        std::lock_guard lock(handlerMutex_);
        handler = onReceive_;
    }
    if (handler) {
        handler(reply);
    }
}

void Session::emit(const std::string& event) {
    logInfo("[RuidaSession] ", event, "\n");
    if (bus_) {
        bus_->publish(core::topics::SessionEvents, event);
    }
}

void Session::sleepFor(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::min(SLEEP_SLICE, duration));
    }
}

} // namespace ruida::session
