#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "ruida/core/Driver.hpp"
#include "ruida/core/Expected.hpp"
#include "ruida/core/PlotCut.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/DecodeError.hpp"

namespace ruida::protocol {

/// Head position (µm) and the settings in force.
struct CursorState {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;
    std::int32_t u = 0;
    core::PlotSettings settings;
    double power2Min = 0.0;
    double power2Max = 0.0;
    bool programMode = false;
};

/// Side effect a decoded command asks for, beyond the new cursor state.
enum class Action {
    None,
    Travel,          ///< point is a power-0 move target
    Cut,             ///< point is a cut target
    Commit,          ///< close the open plot cut
    EndOfFile,
    StartProcess,
    StopProcess,
    Pause,
    Resume,
    HomeXY,
    MoveAxis,        ///< axis + value: absolute Z/U move
    MoveOrigin,      ///< move to the cursor's x/y
    Jog,             ///< axis + direction + pressed
    LaserOn,
    LaserOff,
    Reset,
    MemoryGet,       ///< address
    MemorySet,       ///< address + value
    MemoryQuery,     ///< selector: run info / upload info
};

/**
 * @brief Result of decoding one command against a cursor state.
 *
 * Produced by a pure function; applying it to a driver is the job of
 * Interpreter.
 */
struct Step {
    CursorState state;
    Action action = Action::None;
    std::optional<core::PlotPoint> point;
    core::Axis axis = core::Axis::X;
    int direction = 0;
    bool pressed = false;
    std::uint16_t address = 0;
    std::int64_t value = 0;
    std::uint8_t selector = 0;
    std::string description;
};

/// Decodes @p command without side effects.
expected<Step, DecodeError> decodeCommand(const CursorState& state, const Command& command);

/// Commands the emulator executes immediately instead of spooling.
bool isRealtime(const Command& command);

std::string hexDump(const std::uint8_t* data, std::size_t size);
inline std::string hexDump(const Bytes& data) { return hexDump(data.data(), data.size()); }

/**
 * @brief Applies decoded commands to a cursor and a driver, accumulating
 *        contiguous cuts into plot cuts.
 *
 * A plot cut opens at the current position on the first cut and is
 * committed (handed to the driver and the commit handler) on travel, on
 * any change of speed, power, frequency or colour, on a Z/U change, and
 * at block end or end of file.
 */
class Interpreter {
public:
    using CommitHandler = std::function<void(const core::PlotCut&)>;

    explicit Interpreter(core::Driver* driver = nullptr, double defaultPower = 0.0);

    /// Decodes and applies one command. On error nothing changes.
    expected<Step, DecodeError> process(const Command& command);

    /// Closes the open plot cut, if any.
    void commit();

    const CursorState& state() const { return state_; }
    const std::optional<core::PlotCut>& openCut() const { return cut_; }

    void setDriver(core::Driver* driver) { driver_ = driver; }
    void setDefaultPower(double percent) { defaultPower_ = percent; }
    void setCommitHandler(CommitHandler handler) { onCommit_ = std::move(handler); }

    /// Drops the open cut and returns to the origin with default settings.
    void reset();

private:
    void apply(const Step& step);
    double cutPower(const CursorState& state) const;

    core::Driver* driver_ = nullptr;
    double defaultPower_ = 0.0;
    CursorState state_;
    std::optional<core::PlotCut> cut_;
    CommitHandler onCommit_;
};

} // namespace ruida::protocol
