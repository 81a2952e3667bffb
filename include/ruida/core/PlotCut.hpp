#pragma once

#include <cstdint>
#include <vector>

namespace ruida::core {

// A single vertex of a plot cut, in device micrometres.
// - power : percent used to reach this point from the previous one
//           (0 for the opening vertex and for travel).
struct PlotPoint {
    std::int32_t x = 0;
    std::int32_t y = 0;
    double power = 0.0;
};

inline bool operator==(const PlotPoint& a, const PlotPoint& b) {
    return a.x == b.x && a.y == b.y && a.power == b.power;
}

// Settings in force while a plot cut accumulates.
struct PlotSettings {
    double speed = 0.0;        // mm/s
    double power = 0.0;        // percent, laser 1 min power
    double maxPower = 0.0;     // percent, laser 1 max power
    std::uint64_t frequency = 0; // Hz
    std::uint32_t color = 0;
    int layer = -1;
};

/**
 * @brief An open polyline of contiguous points at constant settings.
 *
 * The first vertex is where the head sat when cutting began; every later
 * vertex carries the power of the segment that reached it.
 */
struct PlotCut {
    PlotSettings settings;
    std::vector<PlotPoint> points;

    bool empty() const { return points.size() < 2; }
    std::size_t segmentCount() const { return points.size() < 2 ? 0 : points.size() - 1; }
};

} // namespace ruida::core
