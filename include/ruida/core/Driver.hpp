#pragma once

#include <cstdint>
#include <string>

#include "ruida/core/PlotCut.hpp"

namespace ruida::core {

enum class Axis { X, Y, Z, U };

/// Snapshot reported by a driver; position in device micrometres.
struct DriverStatus {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;
    std::int32_t u = 0;
    std::string state = "idle";   // idle, busy, hold
    std::string detail;
};

/// Payload of topics::Position: previous and new head position.
struct PositionChange {
    double lastX = 0.0;
    double lastY = 0.0;
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Motion/laser collaborator driven by decoded commands.
 *
 * The interpreter and emulator call into this interface; they never talk
 * to hardware themselves. Every method has a no-op default so drivers only
 * override what they need.
 */
class Driver {
public:
    virtual ~Driver() = default;

    /// A committed plot cut, ready to execute.
    virtual void plot(const PlotCut& /*cut*/) {}

    /// Execute everything plotted so far.
    virtual void plotStart() {}

    virtual void moveAbs(Axis /*axis*/, std::int32_t /*um*/) {}
    virtual void moveRel(Axis /*axis*/, std::int32_t /*um*/) {}
    virtual void home() {}
    virtual void pause() {}
    virtual void resume() {}
    virtual void reset() {}

    /// Interface-panel jog key pressed/released; direction is +1 or -1.
    virtual void jog(Axis /*axis*/, int /*direction*/, bool /*pressed*/) {}

    virtual void laserOn() {}
    virtual void laserOff() {}

    virtual DriverStatus status() const { return {}; }
};

} // namespace ruida::core
