#include "ruida/emulator/Emulator.hpp"

#include "ruida/log/Log.hpp"
#include "ruida/protocol/Opcodes.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace ruida::emulator {

using core::Axis;
using protocol::Bytes;
using protocol::Command;

namespace {
constexpr std::uint8_t SWIZZLED_DA_UNDER_88 = 0xD4;
constexpr std::uint8_t SWIZZLED_DA_UNDER_11 = 0x4B;
constexpr std::size_t QUERY_REPLY_PADDING = 20;
}

/**
 * Driver seen by the interpreter. Keeps the emulated head position and
 * machine state for memory reads and forwards every call to the user's
 * driver, if one is attached.
 */
class Emulator::TrackingDriver : public core::Driver {
public:
    explicit TrackingDriver(core::Driver* target) : target_(target) {}

    void plot(const core::PlotCut& cut) override {
        if (!cut.points.empty()) {
            std::lock_guard lock(mutex_);
            status_.x = cut.points.back().x;
            status_.y = cut.points.back().y;
        }
        if (target_) target_->plot(cut);
    }

    void plotStart() override {
        if (target_) target_->plotStart();
    }

    void moveAbs(Axis axis, std::int32_t um) override {
        {
            std::lock_guard lock(mutex_);
            axisRef(axis) = um;
        }
        if (target_) target_->moveAbs(axis, um);
    }

    void moveRel(Axis axis, std::int32_t um) override {
        {
            std::lock_guard lock(mutex_);
            axisRef(axis) += um;
        }
        if (target_) target_->moveRel(axis, um);
    }

    void home() override {
        {
            std::lock_guard lock(mutex_);
            status_.x = 0;
            status_.y = 0;
        }
        if (target_) target_->home();
    }

    void pause() override {
        {
            std::lock_guard lock(mutex_);
            paused_ = true;
        }
        if (target_) target_->pause();
    }

    void resume() override {
        {
            std::lock_guard lock(mutex_);
            paused_ = false;
        }
        if (target_) target_->resume();
    }

    void reset() override {
        {
            std::lock_guard lock(mutex_);
            paused_ = false;
        }
        if (target_) target_->reset();
    }

    void jog(Axis axis, int direction, bool pressed) override {
        if (target_) target_->jog(axis, direction, pressed);
    }

    void laserOn() override {
        if (target_) target_->laserOn();
    }

    void laserOff() override {
        if (target_) target_->laserOff();
    }

    core::DriverStatus status() const override {
        std::lock_guard lock(mutex_);
        core::DriverStatus s = status_;
        s.state = paused_ ? "hold" : (busy_ ? "busy" : "idle");
        return s;
    }

    /// Head position as the interpreter last left it.
    void follow(const protocol::CursorState& cursor) {
        std::lock_guard lock(mutex_);
        status_.x = cursor.x;
        status_.y = cursor.y;
        status_.z = cursor.z;
        status_.u = cursor.u;
    }

    void setBusy(bool busy) {
        std::lock_guard lock(mutex_);
        busy_ = busy;
    }

private:
    std::int32_t& axisRef(Axis axis) {
        switch (axis) {
            case Axis::X: return status_.x;
            case Axis::Y: return status_.y;
            case Axis::Z: return status_.z;
            default:      return status_.u;
        }
    }

    core::Driver* target_ = nullptr;
    mutable std::mutex mutex_;
    core::DriverStatus status_;
    bool paused_ = false;
    bool busy_ = false;
};

Emulator::Emulator(config::EmulatorConfig cfg, core::Driver* driver, core::SignalBus* bus)
: cfg_(cfg)
, bus_(bus)
, tracking_(std::make_unique<TrackingDriver>(driver))
, memory_(tracking_.get())
, codec_(cfg.magic)
, interpreter_(tracking_.get(), cfg.defaultPower)
, spooler_([this](const JobSpooler::Job& job) { execute(job); }) {
    interpreter_.setCommitHandler([this](const core::PlotCut& cut) { onCommit(cut); });
}

Emulator::~Emulator() {
    stop();
}

void Emulator::start() {
    spooler_.start();
}

void Emulator::stop() {
    spooler_.stop();
}

std::uint8_t Emulator::magic() const {
    std::lock_guard lock(codecMutex_);
    return codec_.magic();
}

void Emulator::setMagic(std::uint8_t magic) {
    std::lock_guard lock(codecMutex_);
    if (codec_.magic() == magic) {
        return;
    }
    codec_ = protocol::Codec(magic);
    char text[8];
    std::snprintf(text, sizeof(text), "0x%02x", magic);
    logInfo("[RuidaEmulator] Setting magic to ", text, "\n");
}

void Emulator::checksumWrite(const std::uint8_t* data, std::size_t size, const ReplySink& reply) {
    if (size < protocol::CHECKSUM_SIZE) {
        return;
    }
    size = std::min(size, protocol::CHECKSUM_SIZE + config::RUIDA_MAX_PAYLOAD);

    if (cfg_.autoDetectMagic && size > protocol::CHECKSUM_SIZE + 1) {
        const std::uint8_t first = data[protocol::CHECKSUM_SIZE];
        if (first == SWIZZLED_DA_UNDER_88) {
            setMagic(config::RUIDA_MAGIC_DEFAULT);
        } else if (first == SWIZZLED_DA_UNDER_11) {
            setMagic(config::RUIDA_MAGIC_634XG);
        }
    }

    protocol::Codec codec = [this] {
        std::lock_guard lock(codecMutex_);
        return codec_;
    }();

    auto plain = protocol::unframe(codec, data, size, cfg_.checksumBasis);
    if (!plain) {
        logError("[RuidaEmulator] Checksum Fail ",
                 protocol::hexDump(data + protocol::CHECKSUM_SIZE, size - protocol::CHECKSUM_SIZE), "\n");
        respond(reply, Bytes{protocol::NAK}, "Checksum Fail");
        return;
    }
    respond(reply, Bytes{protocol::ACK}, "Checksum match");
    dispatch(protocol::splitCommands(*plain), reply);
}

void Emulator::realtimeWrite(const std::uint8_t* data, std::size_t size, const ReplySink& reply) {
    const Bytes plain = [&] {
        std::lock_guard lock(codecMutex_);
        return codec_.unswizzle(data, size);
    }();
    respond(reply, Bytes{protocol::ACK}, "ACK");
    for (const auto& command : protocol::splitCommands(plain)) {
        runNow(command, reply);
    }
}

void Emulator::write(const Bytes& plain, const ReplySink& reply) {
    dispatch(protocol::splitCommands(plain), reply);
}

void Emulator::dispatch(const std::vector<Command>& commands, const ReplySink& reply) {
    JobSpooler::Job job;
    for (const auto& command : commands) {
        if (command.empty() || command[0] < 0x80) {
            logError("[RuidaEmulator] NOT A COMMAND: ", protocol::hexDump(command), "\n");
            continue;
        }
        if (protocol::isRealtime(command)) {
            runNow(command, reply);
        } else {
            job.push_back(command);
        }
    }
    if (job.empty()) {
        return;
    }
    if (!spooler_.submit(std::move(job))) {
        logInfo("[RuidaEmulator] identical job already queued, ignored\n");
    }
}

void Emulator::runNow(const Command& command, const ReplySink& reply) {
    expected<protocol::Step, protocol::DecodeError> step;
    {
        std::lock_guard lock(interpMutex_);
        step = interpreter_.process(command);
        if (step) {
            tracking_->follow(interpreter_.state());
        }
    }
    if (!step) {
        reportFailure(step.error());
        return;
    }

    switch (step->action) {
        case protocol::Action::MemoryGet: {
            const auto entry = memory_.lookup(step->address);
            logDebug("[RuidaEmulator] ", step->description, " (", entry.name, ")\n");
            respond(reply, memory_.reply(step->address), "Respond");
            break;
        }
        case protocol::Action::MemorySet:
            memory_.store(step->address, step->value);
            break;
        case protocol::Action::MemoryQuery: {
            const bool runInfo = step->selector == 0x05 || step->selector == 0x54;
            Bytes out{protocol::op::MEMORY, runInfo ? std::uint8_t{0x05} : step->selector};
            out.resize(out.size() + QUERY_REPLY_PADDING, 0x00);
            respond(reply, out, runInfo ? "Read Run Response" : "Upload Info Response");
            break;
        }
        case protocol::Action::StopProcess:
        case protocol::Action::Reset:
            spooler_.clear();
            break;
        default:
            break;
    }
    publishChanges();
}

void Emulator::execute(const JobSpooler::Job& job) {
    tracking_->setBusy(true);
    publishChanges();
    for (const auto& command : job) {
        expected<protocol::Step, protocol::DecodeError> step;
        {
            std::lock_guard lock(interpMutex_);
            step = interpreter_.process(command);
            if (step) {
                tracking_->follow(interpreter_.state());
            }
        }
        if (!step) {
            reportFailure(step.error());
            continue;
        }
        publishChanges();
    }
    if (spooler_.pending() == 0) {
        tracking_->setBusy(false);
        publishChanges();
    }
}

bool Emulator::waitIdle(std::chrono::milliseconds timeout) {
    return spooler_.waitIdle(timeout);
}

void Emulator::respond(const ReplySink& reply, const Bytes& plain, const char* what) {
    logDebug("[RuidaEmulator] <-- ", protocol::hexDump(plain), "\t(", what, ")\n");
    if (!reply) {
        return;
    }
    Bytes wire;
    {
        std::lock_guard lock(codecMutex_);
        wire = codec_.swizzle(plain);
    }
    reply(wire);
}

void Emulator::onCommit(const core::PlotCut& cut) {
    {
        std::lock_guard lock(plotMutex_);
        plotted_.push_back(cut);
    }
    if (bus_) {
        bus_->publish(core::topics::PlotCommitted, cut);
    }
}

void Emulator::publishChanges() {
    if (!bus_) {
        return;
    }
    const core::DriverStatus now = tracking_->status();
    std::optional<core::PositionChange> moved;
    std::optional<std::string> state;
    {
        std::lock_guard lock(publishMutex_);
        if (now.x != published_.x || now.y != published_.y) {
            moved = core::PositionChange{static_cast<double>(published_.x), static_cast<double>(published_.y),
                                         static_cast<double>(now.x), static_cast<double>(now.y)};
            published_.x = now.x;
            published_.y = now.y;
        }
        if (now.state != published_.state) {
            state = now.state;
            published_.state = now.state;
        }
    }
    if (moved) {
        bus_->publish(core::topics::Position, *moved);
    }
    if (state) {
        bus_->publish(core::topics::Status, *state);
    }
}

void Emulator::reportFailure(const protocol::DecodeError& error) {
    logError("[RuidaEmulator] Process Failure: ", error.where, " (", error.what, ")\n");
    if (bus_) {
        bus_->publish(core::topics::EmulatorError, error);
    }
}

std::vector<core::PlotCut> Emulator::plotted() const {
    std::lock_guard lock(plotMutex_);
    return plotted_;
}

void Emulator::clearPlotted() {
    std::lock_guard lock(plotMutex_);
    plotted_.clear();
}

std::optional<core::PlotCut> Emulator::openCut() const {
    std::lock_guard lock(interpMutex_);
    return interpreter_.openCut();
}

void Emulator::commit() {
    std::lock_guard lock(interpMutex_);
    interpreter_.commit();
}

protocol::CursorState Emulator::cursor() const {
    std::lock_guard lock(interpMutex_);
    return interpreter_.state();
}

core::DriverStatus Emulator::driverStatus() const {
    return tracking_->status();
}

} // namespace ruida::emulator
