#include "ruida/controller/RuidaController.hpp"

#include "ruida/log/Log.hpp"
#include "ruida/protocol/MemoryMap.hpp"
#include "ruida/protocol/Opcodes.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

namespace ruida::controller {

using namespace protocol;

std::string machineStatusLabel(std::uint32_t status) {
    if (status & MACHINE_STATUS_MOVING) return "Moving";
    if (status & MACHINE_STATUS_PART_END) return "Part End";
    if (status & MACHINE_STATUS_JOB_RUNNING) return "Job Running";
    return "Idle";
}

const std::vector<std::uint16_t>& RuidaController::statusAddresses() {
    // Position is read more often than anything else to keep the head
    // display responsive.
    static const std::vector<std::uint16_t> addresses = {
        MEM_MACHINE_STATUS,
        MEM_BED_SIZE_X,
        MEM_BED_SIZE_Y,
        MEM_CURRENT_X,
        MEM_CURRENT_Y,
        MEM_MACHINE_STATUS,
        MEM_CURRENT_X,
        MEM_CURRENT_Y,
        MEM_MACHINE_STATUS,
        MEM_CURRENT_X,
        MEM_CURRENT_Y,
        MEM_MACHINE_STATUS,
        MEM_CURRENT_X,
        MEM_CURRENT_Y,
        MEM_CARD_ID,
    };
    return addresses;
}

RuidaController::RuidaController(session::Session& session,
                                 config::ControllerConfig cfg,
                                 core::SignalBus* bus)
: core::Worker("RuidaController")
, session_(session)
, cfg_(cfg)
, bus_(bus) {
    session_.setReceiveHandler([this](const std::optional<Bytes>& reply) { handleReply(reply); });
}

RuidaController::~RuidaController() {
    stop();
    joinSender();
    session_.setReceiveHandler(nullptr);
}

// Bulk send -------------------------------------------------------------------

expected<void> RuidaController::send(const Program& program) {
    if (sending_.exchange(true)) {
        logError("[RuidaController] send rejected, a job is still being sent\n");
        return unexpected(std::make_error_code(std::errc::device_or_resource_busy));
    }
    joinSender();

    auto chunks = program.chunk(cfg_.chunkBudget);
    lastChunkCount_ = chunks.size();
    emit("Sending File...");
    emit("File in " + std::to_string(chunks.size()) + " chunk(s)");

    sender_ = std::thread(&RuidaController::sendChunks, this, std::move(chunks),
                          program.lowPowerWarning(), program.highPowerWarning());
    return {};
}

void RuidaController::sendChunks(std::vector<Bytes> chunks, bool lowPower, bool highPower) {
    bool complete = true;
    {
        std::lock_guard jobLock(session_.jobLock());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            if (auto written = session_.write(std::move(chunks[i])); !written) {
                logError("[RuidaController] chunk ", i + 1, "/", chunks.size(),
                         " not sent: ", written.error().message(), "\n");
                emit("Send aborted: " + written.error().message());
                complete = false;
                break;
            }
        }
        if (complete && !session_.flush(cfg_.grossTimeout)) {
            logError("[RuidaController] job did not drain within ", cfg_.grossTimeout.count(), "ms\n");
            complete = false;
        }
    }

    if (complete) {
        emit("File Sent.");
        if (lowPower) {
            emit("WARNING: Power less than 10% may not fire CO2.");
        }
        if (highPower) {
            emit("WARNING: Power greater than 70% reduces CO2 life.");
        }
    }

    {
        std::lock_guard lock(sendMutex_);
        sending_ = false;
    }
    sendDone_.notify_all();
}

bool RuidaController::waitSent(std::chrono::milliseconds timeout) {
    std::unique_lock lock(sendMutex_);
    return sendDone_.wait_for(lock, timeout, [this] { return !sending_.load(); });
}

void RuidaController::joinSender() {
    if (sender_.joinable() && sender_.get_id() != std::this_thread::get_id()) {
        sender_.join();
    }
}

// Realtime commands -------------------------------------------------------------

expected<void> RuidaController::realtime(void (Program::*build)()) {
    Program program(session_.codec().magic());
    (program.*build)();
    return session_.write(program.contents());
}

expected<void> RuidaController::abort() {
    logInfo("[RuidaController] abort\n");
    return realtime(&Program::stopProcess);
}

expected<void> RuidaController::pause() {
    auto sent = realtime(&Program::pauseProcess);
    if (sent) {
        paused_ = true;
    }
    return sent;
}

expected<void> RuidaController::resume() {
    auto sent = realtime(&Program::restoreProcess);
    if (sent) {
        paused_ = false;
    }
    return sent;
}

void RuidaController::grossTimeout() {
    session_.setReplyTimeout(cfg_.grossTimeout);
}

void RuidaController::normalTimeout() {
    session_.setReplyTimeout(cfg_.normalTimeout);
}

bool RuidaController::waitForMove(std::int32_t x, std::int32_t y) {
    const auto expectX = std::lround(x / 1000.0);
    const auto expectY = std::lround(y / 1000.0);
    const auto tick = cfg_.statusTick.count() > 0 ? cfg_.statusTick : config::RUIDA_STATUS_TICK;
    auto tries = config::RUIDA_MOVE_WAIT_LIMIT / tick;

    std::lock_guard jobLock(session_.jobLock());
    while (tries-- > 0) {
        {
            std::lock_guard lock(statusMutex_);
            if (std::lround(status_.nativeX / 1000.0) == expectX
                && std::lround(status_.nativeY / 1000.0) == expectY) {
                return true;
            }
        }
        for (auto address : {MEM_MACHINE_STATUS, MEM_CURRENT_X, MEM_CURRENT_Y}) {
            if (auto written = session_.write(memoryGet(address)); !written) {
                logError("[RuidaController] waitForMove: ", written.error().message(), "\n");
                return false;
            }
        }
        std::this_thread::sleep_for(tick);
    }
    logWarning("[RuidaController] head did not reach (", x, ", ", y, ")\n");
    return false;
}

bool RuidaController::waitIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        {
            std::lock_guard lock(statusMutex_);
            if (status_.idle) {
                status_.sceneX = -1.0;
                status_.sceneY = -1.0;
                return true;
            }
        }
        if (!session_.connected() || std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{25});
    }
}

// Status polling ----------------------------------------------------------------

void RuidaController::run() {
    while (running) {
        if (cfg_.pollStatus && session_.connected() && !session_.isBusy()) {
            pollOnce();
        } else if (!session_.connected()) {
            std::lock_guard lock(statusMutex_);
            status_.cardId = 0;
            awaiting_ = false;
        }
        std::this_thread::sleep_for(cfg_.statusTick);
    }
}

void RuidaController::pollOnce() {
    std::unique_lock jobLock(session_.jobLock(), std::try_to_lock);
    if (!jobLock.owns_lock()) {
        return; // a job is being sent
    }

    std::uint16_t address = 0;
    {
        std::lock_guard lock(statusMutex_);
        const auto now = std::chrono::steady_clock::now();
        if (awaiting_ && now - issuedAt_ < cfg_.normalTimeout) {
            return;
        }
        // Either the last reply arrived (next_ advanced) or it never did and
        // the same address goes out again.
        address = statusAddresses()[next_];
        awaiting_ = true;
        issuedAt_ = now;
    }

    if (auto written = session_.write(memoryGet(address)); !written) {
        logDebug("[RuidaController] status poll: ", written.error().message(), "\n");
        std::lock_guard lock(statusMutex_);
        awaiting_ = false;
    }
}

void RuidaController::handleReply(const std::optional<Bytes>& reply) {
    if (!reply) {
        std::lock_guard lock(statusMutex_);
        awaiting_ = false;   // re-issue the same address next tick
        return;
    }

    auto decoded = decodeMemoryReply(*reply);
    if (!decoded) {
        logDebug("[RuidaController] ignoring reply ", decoded.error().where, ": ",
                 decoded.error().what, "\n");
        return;
    }

    const auto value = decoded->value;
    const auto asInt32 = static_cast<std::int32_t>(static_cast<std::uint32_t>(value));
    switch (decoded->address) {
        case MEM_CARD_ID: updateCardId(value); break;
        case MEM_MACHINE_STATUS: updateMachineStatus(static_cast<std::uint32_t>(value)); break;
        case MEM_BED_SIZE_X: updateBedX(value); break;
        case MEM_BED_SIZE_Y: updateBedY(value); break;
        case MEM_CURRENT_X: updateX(asInt32); break;
        case MEM_CURRENT_Y: updateY(asInt32); break;
        case MEM_CURRENT_Z: {
            std::lock_guard lock(statusMutex_);
            status_.nativeZ = asInt32;
            break;
        }
        case MEM_CURRENT_U: {
            std::lock_guard lock(statusMutex_);
            status_.nativeU = asInt32;
            break;
        }
        default:
            break;
    }

    std::lock_guard lock(statusMutex_);
    if (awaiting_ && decoded->address == statusAddresses()[next_]) {
        awaiting_ = false;
        next_ = (next_ + 1) % statusAddresses().size();
    }
}

void RuidaController::updateCardId(std::uint64_t value) {
    {
        std::lock_guard lock(statusMutex_);
        if (status_.cardId == value) {
            return;
        }
        status_.cardId = value;
    }
    char text[32];
    std::snprintf(text, sizeof(text), "Card ID: 0x%08llx", static_cast<unsigned long long>(value));
    emit(text);
    if (bus_) {
        bus_->publish(core::topics::CardId, value);
    }
}

void RuidaController::updateMachineStatus(std::uint32_t value) {
    std::string label;
    {
        std::lock_guard lock(statusMutex_);
        if (status_.machineStatus && *status_.machineStatus == value) {
            return;
        }
        status_.machineStatus = value;
        label = machineStatusLabel(value);
        status_.label = label;
        status_.idle = label == "Idle";
    }
    emit(label);
    if (bus_) {
        bus_->publish(core::topics::Status, label);
    }
}

void RuidaController::updateBedX(std::uint64_t value) {
    std::pair<double, double> bed;
    {
        std::lock_guard lock(statusMutex_);
        const double mm = static_cast<double>(value) / 1000.0;
        bedXUm_ = static_cast<std::int64_t>(value);
        if (mm == status_.bedWidthMm) {
            return;
        }
        status_.bedWidthMm = mm;
        bed = {status_.bedWidthMm, status_.bedHeightMm};
    }
    if (bus_) {
        bus_->publish(core::topics::BedSize, bed);
    }
}

void RuidaController::updateBedY(std::uint64_t value) {
    std::pair<double, double> bed;
    {
        std::lock_guard lock(statusMutex_);
        const double mm = static_cast<double>(value) / 1000.0;
        if (mm == status_.bedHeightMm) {
            return;
        }
        status_.bedHeightMm = mm;
        bed = {status_.bedWidthMm, status_.bedHeightMm};
    }
    if (bus_) {
        bus_->publish(core::topics::BedSize, bed);
    }
}

void RuidaController::updateX(std::int32_t value) {
    {
        std::lock_guard lock(statusMutex_);
        status_.nativeX = value;
        // The offset compensates a rounding error on the controller display.
        status_.sceneX = static_cast<double>(bedXUm_ - (value - cfg_.positionOffsetUm)) * cfg_.positionScale;
        xRead_ = true;
    }
    publishPosition();
}

void RuidaController::updateY(std::int32_t value) {
    {
        std::lock_guard lock(statusMutex_);
        status_.nativeY = value;
        status_.sceneY = static_cast<double>(value + cfg_.positionOffsetUm) * cfg_.positionScale;
        yRead_ = true;
    }
    publishPosition();
}

void RuidaController::publishPosition() {
    PositionChange change;
    {
        std::lock_guard lock(statusMutex_);
        if (!xRead_ || !yRead_) {
            return;
        }
        change = {lastSceneX_, lastSceneY_, status_.sceneX, status_.sceneY};
        xRead_ = false;
        yRead_ = false;
        lastSceneX_ = status_.sceneX;
        lastSceneY_ = status_.sceneY;
    }
    if (bus_) {
        bus_->publish(core::topics::Position, change);
    }
}

ControllerStatus RuidaController::status() const {
    std::lock_guard lock(statusMutex_);
    return status_;
}

void RuidaController::emit(const std::string& event) {
    logInfo("[RuidaController] ", event, "\n");
    if (bus_) {
        bus_->publish(core::topics::SessionEvents, event);
    }
}

} // namespace ruida::controller
