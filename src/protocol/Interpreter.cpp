#include "ruida/protocol/Interpreter.hpp"
#include "ruida/protocol/Opcodes.hpp"
#include "ruida/log/Log.hpp"

#include <array>
#include <cstdio>
#include <sstream>

namespace ruida::protocol {

using core::Axis;
using core::PlotPoint;

namespace {

using Result = expected<Step, DecodeError>;
using Handler = Result (*)(const CursorState&, const Command&);

template <typename... Args>
std::string describe(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

unexpected_t<DecodeError> tooShort(const Command& c, std::size_t need) {
    return unexpected(DecodeError{hexDump(c),
        "needs " + std::to_string(need) + " bytes, got " + std::to_string(c.size())});
}

unexpected_t<DecodeError> unknownSelector(const Command& c) {
    return unexpected(DecodeError{hexDump(c), "unknown selector"});
}

Step from(const CursorState& s, std::string description = {}) {
    Step step;
    step.state = s;
    step.description = std::move(description);
    return step;
}

std::int32_t coord(const Command& c, std::size_t at) { return decode32(&c[at]); }
std::int32_t rel(const Command& c, std::size_t at) { return decode14(&c[at]); }

std::string pointText(const Command& c, std::size_t at) {
    return describe("(", coord(c, at), "um, ", coord(c, at + 5), "um)");
}

std::string sevenText(const Command& c, std::size_t at) {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < 7; ++i) {
        oss << (i ? ", " : "") << decode14(&c[at + 2 * i]);
    }
    oss << ")";
    return oss.str();
}

Step travel(const CursorState& s, std::int32_t x, std::int32_t y, std::string description) {
    Step step = from(s, std::move(description));
    step.action = Action::Travel;
    step.point = PlotPoint{x, y, 0.0};
    step.state.x = x;
    step.state.y = y;
    return step;
}

Step cut(const CursorState& s, std::int32_t x, std::int32_t y, std::string description) {
    Step step = from(s, std::move(description));
    step.action = Action::Cut;
    step.point = PlotPoint{x, y, s.settings.power};
    step.state.x = x;
    step.state.y = y;
    return step;
}

// 0x80 / 0xA0: single-axis moves ----------------------------------------------

Result onAxisXZ(const CursorState& s, const Command& c) {
    if (c.size() < 7) return tooShort(c, 7);
    const std::int32_t value = coord(c, 2);
    Step step = from(s);
    if (c[1] == 0x00) {
        step.state.x += value;
        step.description = describe("Axis X Move ", value);
    } else if (c[1] == 0x08) {
        step.state.z += value;
        step.description = describe("Axis Z Move ", value);
    } else {
        return unknownSelector(c);
    }
    return step;
}

Result onAxisYU(const CursorState& s, const Command& c) {
    if (c.size() < 7) return tooShort(c, 7);
    const std::int32_t value = coord(c, 2);
    Step step = from(s);
    if (c[1] == 0x00) {
        step.state.y += value;
        step.description = describe("Axis Y Move ", value);
    } else if (c[1] == 0x08) {
        step.state.u += value;
        step.description = describe("Axis U Move ", value);
    } else {
        return unknownSelector(c);
    }
    return step;
}

// 0x88 - 0x8B, 0xA8 - 0xAB: moves and cuts ------------------------------------

Result onMoveAbs(const CursorState& s, const Command& c) {
    if (c.size() < 11) return tooShort(c, 11);
    const auto x = coord(c, 1);
    const auto y = coord(c, 6);
    return travel(s, x, y, describe("Move Absolute (", x, "um, ", y, "um)"));
}

Result onMoveRel(const CursorState& s, const Command& c) {
    if (c.size() == 1) return from(s, "Move Relative (no coords)");
    if (c.size() < 5) return tooShort(c, 5);
    const auto dx = rel(c, 1);
    const auto dy = rel(c, 3);
    return travel(s, s.x + dx, s.y + dy, describe("Move Relative (", dx, "um, ", dy, "um)"));
}

Result onMoveRelX(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const auto dx = rel(c, 1);
    return travel(s, s.x + dx, s.y, describe("Move Horizontal Relative (", dx, "um)"));
}

Result onMoveRelY(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const auto dy = rel(c, 1);
    return travel(s, s.x, s.y + dy, describe("Move Vertical Relative (", dy, "um)"));
}

Result onCutAbs(const CursorState& s, const Command& c) {
    if (c.size() < 11) return tooShort(c, 11);
    const auto x = coord(c, 1);
    const auto y = coord(c, 6);
    return cut(s, x, y, describe("Cut Absolute (", x, "um, ", y, "um)"));
}

Result onCutRel(const CursorState& s, const Command& c) {
    if (c.size() < 5) return tooShort(c, 5);
    const auto dx = rel(c, 1);
    const auto dy = rel(c, 3);
    return cut(s, s.x + dx, s.y + dy, describe("Cut Relative (", dx, "um, ", dy, "um)"));
}

Result onCutRelX(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const auto dx = rel(c, 1);
    return cut(s, s.x + dx, s.y, describe("Cut Horizontal Relative (", dx, "um)"));
}

Result onCutRelY(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const auto dy = rel(c, 1);
    return cut(s, s.x, s.y + dy, describe("Cut Vertical Relative (", dy, "um)"));
}

Result onLightburnMarker(const CursorState& s, const Command& c) {
    char code[4];
    std::snprintf(code, sizeof(code), "%02x", c[0]);
    return from(s, std::string("Lightburn Swizzle Modulation ") + code);
}

// 0xA5: interface panel --------------------------------------------------------

Result onInterface(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    Step step = from(s);
    if (c[1] == 0x53) {
        if (c[2] != 0x00) return unknownSelector(c);
        step.description = "Interface Frame";
        return step;
    }
    if (c[1] != sub::KEY_DOWN && c[1] != sub::KEY_UP) return unknownSelector(c);
    const bool down = c[1] == sub::KEY_DOWN;
    const char* state = down ? "Down" : "Up";

    auto jog = [&](Axis axis, int direction, const char* label) {
        step.action = Action::Jog;
        step.axis = axis;
        step.direction = direction;
        step.pressed = down;
        step.description = describe("Interface ", label, " ", state);
    };

    switch (c[2]) {
        case key::PLUS_X:  jog(Axis::X, +1, "+X"); break;
        case key::MINUS_X: jog(Axis::X, -1, "-X"); break;
        case key::PLUS_Y:  jog(Axis::Y, +1, "+Y"); break;
        case key::MINUS_Y: jog(Axis::Y, -1, "-Y"); break;
        case key::PLUS_Z:  jog(Axis::Z, +1, "+Z"); break;
        case key::MINUS_Z: jog(Axis::Z, -1, "-Z"); break;
        case key::PLUS_U:  jog(Axis::U, +1, "+U"); break;
        case key::MINUS_U: jog(Axis::U, -1, "-U"); break;
        case key::PULSE:
            step.action = down ? Action::LaserOn : Action::LaserOff;
            step.description = describe("Interface Pulse ", state);
            break;
        case key::START_PAUSE:
            step.action = Action::Pause;
            step.description = "Interface Start/Pause";
            break;
        case key::STOP:
            step.action = Action::Reset;
            step.description = "Interface Stop";
            break;
        case key::ORIGIN:
            step.action = Action::MoveOrigin;
            step.state.x = 0;
            step.state.y = 0;
            step.description = "Interface Origin";
            break;
        case key::SPEED:      step.description = "Interface Speed"; break;
        case key::RESET:      step.description = "Interface Reset"; break;
        case key::TRACE:      step.description = "Interface Trace On/Off"; break;
        case key::ESC:        step.description = "Interface ESC"; break;
        case key::LASER_GATE: step.description = "Interface Laser Gate"; break;
        default: return unknownSelector(c);
    }
    return step;
}

// 0xC0 - 0xC8: immediate and end power -------------------------------------------

Result onPowerByte(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const double power = decodePower(&c[1]);
    switch (c[0]) {
        case op::IMD_POWER_1: return from(s, describe("Imd Power 1 (", power, ")"));
        case op::IMD_POWER_2: return from(s, describe("Imd Power 2 (", power, ")"));
        case op::IMD_POWER_3: return from(s, describe("Imd Power 3 (", power, ")"));
        case op::IMD_POWER_4: return from(s, describe("Imd Power 4 (", power, ")"));
        case op::END_POWER_1: return from(s, describe("End Power 1 (", power, ")"));
        case op::END_POWER_2: return from(s, describe("End Power 2 (", power, ")"));
        case op::END_POWER_3: return from(s, describe("End Power 3 (", power, ")"));
        case op::END_POWER_4: return from(s, describe("End Power 4 (", power, ")"));
        default: return unknownSelector(c);
    }
}

// 0xC6: power, delays and frequency -------------------------------------------

Result onPower(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    Step step = from(s);
    const std::uint8_t sel = c[1];
    switch (sel) {
        case 0x01: case 0x02: case 0x05: case 0x06: case 0x07: case 0x08:
        case 0x21: case 0x22: case 0x50: case 0x51: case 0x55: case 0x56: {
            if (c.size() < 4) return tooShort(c, 4);
            const double power = decodePower(&c[2]);
            switch (sel) {
                case 0x01:
                    step.state.settings.power = power;
                    step.description = describe("Power 1 min=", power);
                    break;
                case 0x02:
                    step.state.settings.maxPower = power;
                    step.state.settings.power = power;
                    step.description = describe("Power 1 max=", power);
                    break;
                case 0x05: step.description = describe("Power 3 min=", power); break;
                case 0x06: step.description = describe("Power 3 max=", power); break;
                case 0x07: step.description = describe("Power 4 min=", power); break;
                case 0x08: step.description = describe("Power 4 max=", power); break;
                case 0x21:
                    step.state.power2Min = power;
                    step.description = describe("Power 2 min=", power);
                    break;
                case 0x22:
                    step.state.power2Max = power;
                    step.description = describe("Power 2 max=", power);
                    break;
                case 0x50: step.description = describe("Through Power 1 (", power, ")"); break;
                case 0x51: step.description = describe("Through Power 2 (", power, ")"); break;
                case 0x55: step.description = describe("Through Power 3 (", power, ")"); break;
                default:   step.description = describe("Through Power 4 (", power, ")"); break;
            }
            return step;
        }
        case 0x10: case 0x11: case 0x12: case 0x13: case 0x15: case 0x16: {
            if (c.size() < 7) return tooShort(c, 7);
            const double ms = decodeTime(&c[2]);
            const char* label = sel == 0x10 ? "Laser Interval "
                              : sel == 0x11 ? "Add Delay "
                              : sel == 0x12 ? "Laser On Delay "
                              : sel == 0x13 ? "Laser Off Delay "
                              : sel == 0x15 ? "Laser On2 "
                              : "Laser Off2 ";
            step.description = describe(label, ms, "ms");
            return step;
        }
        case 0x31: case 0x32: case 0x35: case 0x36: case 0x37: case 0x38: case 0x41: case 0x42: {
            if (c.size() < 5) return tooShort(c, 5);
            const int part = c[2];
            const double power = decodePower(&c[3]);
            const char* label = sel == 0x31 ? ", Power 1 Min ("
                              : sel == 0x32 ? ", Power 1 Max ("
                              : sel == 0x35 ? ", Power 3 Min ("
                              : sel == 0x36 ? ", Power 3 Max ("
                              : sel == 0x37 ? ", Power 4 Min ("
                              : sel == 0x38 ? ", Power 4 Max ("
                              : sel == 0x41 ? ", Power 2 Min ("
                              : ", Power 2 Max (";
            step.description = describe(part, label, power, ")");
            return step;
        }
        case 0x60: {
            if (c.size() < 9) return tooShort(c, 9);
            const int laser = c[2];
            const int part = c[3];
            const std::uint64_t hz = decodeFrequency(&c[4]);
            step.state.settings.frequency = hz;
            step.description = describe(part, ", Laser ", laser, ", Frequency (", hz, ")");
            return step;
        }
        default:
            return unknownSelector(c);
    }
}

// 0xC9: speeds ----------------------------------------------------------------

Result onSpeed(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    Step step = from(s);
    switch (c[1]) {
        case 0x02: {
            if (c.size() < 7) return tooShort(c, 7);
            const double speed = decodeSpeed(&c[2]);
            step.state.settings.speed = speed;
            step.description = describe("Speed Laser 1 ", speed, "mm/s");
            return step;
        }
        case 0x03: {
            if (c.size() < 7) return tooShort(c, 7);
            step.description = describe("Axis Speed ", decodeSpeed(&c[2]), "mm/s");
            return step;
        }
        case 0x04: {
            if (c.size() < 8) return tooShort(c, 8);
            const double speed = decodeSpeed(&c[3]);
            step.state.settings.speed = speed;
            step.description = describe(static_cast<int>(c[2]), ", Speed ", speed, "mm/s");
            return step;
        }
        case 0x05: {
            if (c.size() < 7) return tooShort(c, 7);
            step.description = describe("Force Eng Speed ", decodeSpeed(&c[2]) / 1000.0, "mm/s");
            return step;
        }
        case 0x06: {
            if (c.size() < 7) return tooShort(c, 7);
            step.description = describe("Axis Move Speed ", decodeSpeed(&c[2]) / 1000.0, "mm/s");
            return step;
        }
        default:
            return unknownSelector(c);
    }
}

// 0xCA: layers and work modes -------------------------------------------------

Result onLayer(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    Step step = from(s);
    const std::uint8_t sel = c[1];
    if (sel == 0x03) {
        step.description = "EnLaserTube Start";
        return step;
    }
    if (sel == 0x05) {
        if (c.size() < 7) return tooShort(c, 7);
        step.state.settings.color = static_cast<std::uint32_t>(decodeU35(&c[2]));
        step.description = describe("Layer Color ", step.state.settings.color);
        return step;
    }
    if (sel == 0x06) {
        if (c.size() < 8) return tooShort(c, 8);
        step.state.settings.color = static_cast<std::uint32_t>(decodeU35(&c[3]));
        step.description = describe(static_cast<int>(c[2]), ", Color ", step.state.settings.color);
        return step;
    }
    if (sel == 0x30) {
        if (c.size() < 4) return tooShort(c, 4);
        step.description = describe("U File ID ", decode14(&c[2]));
        return step;
    }
    if (sel == 0x41) {
        if (c.size() < 4) return tooShort(c, 4);
        step.description = describe(static_cast<int>(c[2]), ", Work Mode ", static_cast<int>(c[3]));
        return step;
    }
    if (c.size() < 3) return tooShort(c, 3);
    const int value = c[2];
    switch (sel) {
        case 0x01:
            switch (c[2]) {
                case 0x00: step.description = "End Layer"; break;
                case 0x01: step.description = "Work Mode 1"; break;
                case 0x02: step.description = "Work Mode 2"; break;
                case 0x03: step.description = "Work Mode 3"; break;
                case 0x04: step.description = "Work Mode 4"; break;
                case 0x55: step.description = "Work Mode 5"; break;
                case 0x05: step.description = "Work Mode 6"; break;
                case 0x10: step.description = "Layer Device 0"; break;
                case 0x11: step.description = "Layer Device 1"; break;
                case 0x12: step.description = "Air Assist Off"; break;
                case 0x13: step.description = "Air Assist On"; break;
                case 0x14: step.description = "DbHead"; break;
                case 0x30: step.description = "EnLaser2Offset 0"; break;
                case 0x31: step.description = "EnLaser2Offset 1"; break;
                default: return unknownSelector(c);
            }
            return step;
        case 0x02:
            step.state.settings.layer = value;
            step.description = describe(value, ", Layer Number");
            return step;
        case 0x04: step.description = describe("X Sign Map ", value); return step;
        case 0x10: step.description = describe("EnExIO Start ", value); return step;
        case 0x22: step.description = describe(value, ", Max Layer"); return step;
        case 0x40: step.description = describe("ZU Map ", value); return step;
        default: return unknownSelector(c);
    }
}

// 0xCC - 0xCF, 0xD0, 0xD7: tokens ---------------------------------------------

Result onToken(const CursorState& s, const Command& c) {
    switch (c[0]) {
        case ACK: return from(s, "ACK from machine");
        case ERR: return from(s, "ERR from machine");
        case ENQ: return from(s, "Keep Alive");
        default:  return from(s, "Checksum Fail");
    }
}

Result onLightburnD0(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    if (c[1] != 0x29) return unknownSelector(c);
    return from(s, "Unknown LB Command");
}

Result onEndOfFile(const CursorState& s, const Command&) {
    Step step = from(s, "End Of File");
    step.state.programMode = false;
    step.action = Action::EndOfFile;
    return step;
}

// 0xD8: process control -------------------------------------------------------

Result onProcess(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    Step step = from(s);
    switch (c[1]) {
        case sub::START_PROCESS:
            step.state.programMode = true;
            step.action = Action::StartProcess;
            step.description = "Start Process";
            break;
        case sub::STOP_PROCESS:
            step.action = Action::StopProcess;
            step.description = "Stop Process";
            break;
        case sub::PAUSE_PROCESS:
            step.action = Action::Pause;
            step.description = "Pause Process";
            break;
        case sub::RESTORE_PROCESS:
            step.action = Action::Resume;
            step.description = "Restore Process";
            break;
        case 0x10: step.description = "Ref Point Mode 2, Machine Zero/Absolute Position"; break;
        case 0x11: step.description = "Ref Point Mode 1, Anchor Point"; break;
        case 0x12: step.description = "Ref Point Mode 0, Current Position"; break;
        case sub::HOME_XY:
            step.state.x = 0;
            step.state.y = 0;
            step.action = Action::HomeXY;
            step.description = "Home XY";
            break;
        case sub::HOME_Z:
            step.state.z = 0;
            step.description = "Home Z";
            break;
        case sub::HOME_U:
            step.state.u = 0;
            step.description = "Home U";
            break;
        case 0x2E: step.description = "FocusZ"; break;
        default: return unknownSelector(c);
    }
    return step;
}

// 0xD9: rapid moves -----------------------------------------------------------

Result onRapid(const CursorState& s, const Command& c) {
    if (c.size() == 1) return from(s, "Unknown Directional Setting");
    if (c.size() < 2) return tooShort(c, 2);
    if (c[1] == 0x0F) return from(s, "Feed Axis Move");
    if (c.size() < 3) return tooShort(c, 3);

    const std::uint8_t options = c[2];
    const char* param = options == 0x03 ? "Light"
                      : options == 0x02 ? ""
                      : options == 0x01 ? "Light/Origin"
                      : "Origin";
    const bool origin = options == 0x00 || options == 0x01;

    switch (c[1]) {
        case 0x00: case 0x50: {
            if (c.size() < 8) return tooShort(c, 8);
            const auto dx = coord(c, 3);
            return travel(s, s.x + dx, s.y, describe("Move ", param, " X: ", dx));
        }
        case 0x01: case 0x51: {
            if (c.size() < 8) return tooShort(c, 8);
            const auto dy = coord(c, 3);
            return travel(s, s.x, s.y + dy, describe("Move ", param, " Y: ", dy));
        }
        case 0x02: case 0x52:
        case 0x03: case 0x53: {
            if (c.size() < 8) return tooShort(c, 8);
            const auto delta = coord(c, 3);
            const bool isZ = c[1] == 0x02 || c[1] == 0x52;
            Step step = from(s, describe("Move ", param, isZ ? " Z: " : " U: ", delta));
            auto& axisValue = isZ ? step.state.z : step.state.u;
            if (delta != 0) {
                axisValue += delta;
                step.action = Action::MoveAxis;
                step.axis = isZ ? Axis::Z : Axis::U;
                step.value = axisValue;
            }
            return step;
        }
        case 0x10: case 0x60: {
            if (c.size() < 13) return tooShort(c, 13);
            Step step = from(s);
            step.state.x = coord(c, 3);
            step.state.y = coord(c, 8);
            step.action = origin ? Action::MoveOrigin : Action::HomeXY;
            step.description = describe("Move ", param, " XY (", step.state.x, ", ", step.state.y, ")");
            return step;
        }
        case 0x30: case 0x70: {
            if (c.size() < 18) return tooShort(c, 18);
            Step step = from(s);
            step.state.x = coord(c, 3);
            step.state.y = coord(c, 8);
            step.state.u = coord(c, 13);
            step.action = Action::MoveOrigin;
            step.description = describe("Move ", param, " XYU: ", step.state.x, " (",
                                        step.state.y, ",", step.state.u, ")");
            return step;
        }
        default:
            return unknownSelector(c);
    }
}

// 0xDA: memory ----------------------------------------------------------------

Result onMemory(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    Step step = from(s);
    step.selector = c[1];
    switch (c[1]) {
        case sub::MEM_GET: {
            if (c.size() < 4) return tooShort(c, 4);
            step.address = static_cast<std::uint16_t>(decodeU14(&c[2]));
            step.action = Action::MemoryGet;
            char text[32];
            std::snprintf(text, sizeof(text), "Get %02x %02x (mem: %04x)", c[2], c[3], step.address);
            step.description = text;
            return step;
        }
        case sub::MEM_SET: {
            if (c.size() < 14) return tooShort(c, 14);
            step.address = static_cast<std::uint16_t>(decodeU14(&c[2]));
            step.value = static_cast<std::int64_t>(decodeU35(&c[4]));
            step.action = Action::MemorySet;
            char text[32];
            std::snprintf(text, sizeof(text), "Set %02x %02x (mem: %04x)", c[2], c[3], step.address);
            step.description = describe(text, " = ", step.value, " ", decodeU35(&c[9]));
            return step;
        }
        case 0x04: step.description = "OEM On/Off, CardIO On/OFF"; return step;
        case 0x05: case 0x54:
            step.action = Action::MemoryQuery;
            step.description = "Read Run Info";
            return step;
        case 0x06: case 0x52: step.description = "Unknown/System Time."; return step;
        case 0x10: case 0x53: step.description = "Unknown Function--3"; return step;
        case 0x30: case 0x31: {
            if (c.size() < 4) return tooShort(c, 4);
            step.action = Action::MemoryQuery;
            step.description = describe("Upload Info 0x", c[1] == 0x30 ? "30" : "31",
                                        " Document ", decode14(&c[2]));
            return step;
        }
        case 0x60: {
            if (c.size() < 4) return tooShort(c, 4);
            step.description = describe("RD-FUNCTION-UNK1 ", decode14(&c[2]));
            return step;
        }
        default:
            return unknownSelector(c);
    }
}

// 0xE5, 0xE6: documents -------------------------------------------------------

Result onDocument(const CursorState& s, const Command& c) {
    if (c.size() == 1) return from(s, "Lightburn Swizzle Modulation E5");
    if (c[1] == 0x00) {
        if (c.size() < 3) return tooShort(c, 3);
        return from(s, describe("Document Page Number ", static_cast<int>(c[2])));
    }
    if (c[1] == 0x02) return from(s, "Document Data End");
    return unknownSelector(c);
}

Result onSetAbsolute(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    if (c[1] != 0x01) return unknownSelector(c);
    return from(s, "Set Absolute");
}

// 0xE7: block, array and document geometry -----------------------------------

Result onBlock(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    Step step = from(s);
    const std::uint8_t sel = c[1];
    auto need = [&](std::size_t n) { return c.size() >= n; };

    switch (sel) {
        case 0x00:
            step.action = Action::Commit;
            step.description = "Block End";
            return step;
        case 0x01: {
            std::string name;
            for (std::size_t i = 2; i < c.size() && c[i] != 0; ++i) {
                name.push_back(static_cast<char>(c[i]));
            }
            step.description = "Set Filename " + name;
            return step;
        }
        case 0x03: case 0x07: case 0x13: case 0x17: case 0x23: case 0x50: case 0x51: {
            if (!need(12)) return tooShort(c, 12);
            const char* label = sel == 0x03 ? "Process TopLeft "
                              : sel == 0x07 ? "Process BottomRight "
                              : sel == 0x13 ? "Array Min Point "
                              : sel == 0x17 ? "Array Max Point "
                              : sel == 0x23 ? "Array Add "
                              : sel == 0x50 ? "Document Min Point "
                              : "Document Max Point ";
            step.description = label + pointText(c, 2);
            return step;
        }
        case 0x04: case 0x08: {
            if (!need(16)) return tooShort(c, 16);
            step.description = (sel == 0x04 ? "Process Repeat " : "Array Repeat ") + sevenText(c, 2);
            return step;
        }
        case 0x05: case 0x0B: case 0x24: case 0x38: case 0x60: {
            if (!need(3)) return tooShort(c, 3);
            const int v = c[2];
            const char* label = sel == 0x05 ? "Array Direction "
                              : sel == 0x0B ? "Unknown 1 "
                              : sel == 0x24 ? "Array Mirror "
                              : sel == 0x38 ? "Unknown 2 "
                              : "Set Current Element Index ";
            step.description = describe(label, v);
            return step;
        }
        case 0x06: case 0x35: {
            if (!need(12)) return tooShort(c, 12);
            step.description = describe(sel == 0x06 ? "Feed Repeat (" : "Block X Size (",
                                        decodeU35(&c[2]), ", ", decodeU35(&c[7]), ")");
            return step;
        }
        case 0x09: case 0x32: {
            if (!need(7)) return tooShort(c, 7);
            step.description = describe(sel == 0x09 ? "Feed Length " : "Unknown Preamble ", decodeU35(&c[2]));
            return step;
        }
        case 0x46:
            step.description = "BY Test 0x11227766";
            return step;
        case 0x52: case 0x53: case 0x61: case 0x62: {
            if (!need(13)) return tooShort(c, 13);
            const char* label = sel == 0x52 ? ", Min Point "
                              : sel == 0x53 ? ", Max Point "
                              : sel == 0x61 ? ", Min Point Ex "
                              : ", Max Point Ex ";
            step.description = describe(static_cast<int>(c[2]), label, pointText(c, 3));
            return step;
        }
        case 0x54: case 0x55: {
            if (!need(8)) return tooShort(c, 8);
            step.description = describe(sel == 0x54 ? "Pen Offset " : "Layer Offset ",
                                        static_cast<int>(c[2]), ": ", coord(c, 3));
            return step;
        }
        default:
            return unknownSelector(c);
    }
}

// 0xE8: stored-file operations ------------------------------------------------

Result onFileOps(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    switch (c[1]) {
        case 0x00:
            if (c.size() < 6) return tooShort(c, 6);
            return from(s, describe("Delete Document ", decode14(&c[2]), " ", decode14(&c[4])));
        case 0x01:
            if (c.size() < 4) return tooShort(c, 4);
            return from(s, describe("Document Name ", decode14(&c[2])));
        case 0x02:
            return from(s, "File transfer");
        case 0x03:
            if (c.size() < 4) return tooShort(c, 4);
            return from(s, describe("Start Select Document ", decode14(&c[2])));
        case 0x04:
            return from(s, "Calculate Document Time");
        default:
            return unknownSelector(c);
    }
}

// 0xEA - 0xF2: arrays and elements --------------------------------------------

Result onArrayStart(const CursorState& s, const Command& c) {
    if (c.size() < 2) return tooShort(c, 2);
    return from(s, describe("Array Start (", static_cast<int>(c[1]), ")"));
}

Result onArrayEnd(const CursorState& s, const Command&) {
    return from(s, "Array End");
}

Result onRefPointSet(const CursorState& s, const Command&) {
    return from(s, "Ref Point Set");
}

Result onElementMax(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const int v = c[2];
    switch (c[1]) {
        case 0x00: return from(s, describe("Element Max Index (", v, ")"));
        case 0x01: return from(s, describe("Element Name Max Index (", v, ")"));
        case 0x02: return from(s, describe("Enable Block Cutting (", v, ")"));
        case 0x03:
            if (c.size() < 12) return tooShort(c, 12);
            return from(s, "Display Offset " + pointText(c, 2));
        case 0x04: return from(s, describe("Feed Auto Calc (", v, ")"));
        case 0x20:
            if (c.size() < 4) return tooShort(c, 4);
            return from(s, describe("Unknown (", v, ",", static_cast<int>(c[3]), ")"));
        default: return unknownSelector(c);
    }
}

Result onElement(const CursorState& s, const Command& c) {
    if (c.size() < 3) return tooShort(c, 3);
    const int v = c[2];
    switch (c[1]) {
        case 0x00: return from(s, describe("Element Index (", v, ")"));
        case 0x01: return from(s, describe("Element Name Index (", v, ")"));
        case 0x02: {
            if (c.size() < 12) return tooShort(c, 12);
            std::string name;
            for (std::size_t i = 2; i < 12 && c[i] != 0; ++i) {
                name.push_back(static_cast<char>(c[i]));
            }
            return from(s, "Element Name (" + name + ")");
        }
        case 0x03:
            if (c.size() < 12) return tooShort(c, 12);
            return from(s, "Element Array Min Point " + pointText(c, 2));
        case 0x04:
            if (c.size() < 12) return tooShort(c, 12);
            return from(s, "Element Array Max Point " + pointText(c, 2));
        case 0x05:
            if (c.size() < 16) return tooShort(c, 16);
            return from(s, "Element Array " + sevenText(c, 2));
        case 0x06:
            if (c.size() < 12) return tooShort(c, 12);
            return from(s, "Element Array Add " + pointText(c, 2));
        case 0x07: return from(s, describe("Element Array Mirror (", v, ")"));
        default: return unknownSelector(c);
    }
}

const std::array<Handler, 128>& handlerTable() {
    static const std::array<Handler, 128> table = [] {
        std::array<Handler, 128> t{};
        auto set = [&t](std::uint8_t opcode, Handler h) { t[opcode & 0x7Fu] = h; };
        set(op::AXIS_X_MOVE, onAxisXZ);
        set(op::MOVE_ABS_XY, onMoveAbs);
        set(op::MOVE_REL_XY, onMoveRel);
        set(op::MOVE_REL_X, onMoveRelX);
        set(op::MOVE_REL_Y, onMoveRelY);
        set(0x97, onLightburnMarker);
        set(0x9B, onLightburnMarker);
        set(0x9E, onLightburnMarker);
        set(op::AXIS_Y_MOVE, onAxisYU);
        set(op::INTERFACE, onInterface);
        set(op::CUT_ABS_XY, onCutAbs);
        set(op::CUT_REL_XY, onCutRel);
        set(op::CUT_REL_X, onCutRelX);
        set(op::CUT_REL_Y, onCutRelY);
        for (std::uint8_t o : {op::IMD_POWER_1, op::IMD_POWER_2, op::IMD_POWER_3, op::IMD_POWER_4,
                               op::END_POWER_1, op::END_POWER_2, op::END_POWER_3, op::END_POWER_4}) {
            set(o, onPowerByte);
        }
        set(op::POWER, onPower);
        set(op::SPEED, onSpeed);
        set(op::LAYER, onLayer);
        set(ACK, onToken);
        set(ERR, onToken);
        set(ENQ, onToken);
        set(NAK, onToken);
        set(op::LB_D0, onLightburnD0);
        set(op::END_OF_FILE, onEndOfFile);
        set(op::PROCESS, onProcess);
        set(op::RAPID, onRapid);
        set(op::MEMORY, onMemory);
        set(op::DOCUMENT, onDocument);
        set(op::SET_ABSOLUTE, onSetAbsolute);
        set(op::BLOCK, onBlock);
        set(op::FILE_OPS, onFileOps);
        set(op::ARRAY_START, onArrayStart);
        set(op::ARRAY_END, onArrayEnd);
        set(op::REF_POINT_SET, onRefPointSet);
        set(op::ELEMENT_MAX, onElementMax);
        set(op::ELEMENT, onElement);
        return t;
    }();
    return table;
}

bool settingsChanged(const core::PlotSettings& a, const core::PlotSettings& b) {
    return a.speed != b.speed || a.power != b.power || a.maxPower != b.maxPower
        || a.frequency != b.frequency || a.color != b.color;
}

} // namespace

std::string hexDump(const std::uint8_t* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

expected<Step, DecodeError> decodeCommand(const CursorState& state, const Command& command) {
    if (command.empty()) {
        return unexpected(DecodeError{"", "empty command"});
    }
    if (command[0] < 0x80) {
        return unexpected(DecodeError{hexDump(command), "not a command"});
    }
    const Handler handler = handlerTable()[command[0] & 0x7Fu];
    if (!handler) {
        return unexpected(DecodeError{hexDump(command), "unknown opcode"});
    }
    return handler(state, command);
}

bool isRealtime(const Command& command) {
    if (command.empty()) {
        return false;
    }
    switch (command[0]) {
        case op::INTERFACE:
        case op::MEMORY:
        case op::FILE_OPS:
        case ACK:
        case ERR:
        case ENQ:
        case NAK:
            return true;
        case op::PROCESS:
            return command.size() > 1
                && (command[1] == sub::STOP_PROCESS || command[1] == sub::PAUSE_PROCESS
                    || command[1] == sub::RESTORE_PROCESS);
        default:
            return false;
    }
}

Interpreter::Interpreter(core::Driver* driver, double defaultPower)
: driver_(driver)
, defaultPower_(defaultPower) {}

expected<Step, DecodeError> Interpreter::process(const Command& command) {
    auto step = decodeCommand(state_, command);
    if (!step) {
        return step;
    }
    logDebug("[Interpreter] ", hexDump(command), "\t(", step->description, ")\n");
    apply(*step);
    return step;
}

double Interpreter::cutPower(const CursorState& state) const {
    if (state.settings.power > 0.0) return state.settings.power;
    if (state.settings.maxPower > 0.0) return state.settings.maxPower;
    return defaultPower_;
}

void Interpreter::apply(const Step& step) {
    if (cut_ && (settingsChanged(state_.settings, step.state.settings)
                 || step.state.z != state_.z || step.state.u != state_.u)) {
        commit();
    }
    const CursorState previous = state_;
    state_ = step.state;

    switch (step.action) {
        case Action::Travel:
            commit();
            break;
        case Action::Cut: {
            const double power = cutPower(state_);
            if (power <= 0.0) {
                commit();
                break;
            }
            if (!cut_) {
                cut_ = core::PlotCut{};
                cut_->settings = state_.settings;
                cut_->settings.power = power;
                cut_->points.push_back(PlotPoint{previous.x, previous.y, 0.0});
            }
            cut_->points.push_back(PlotPoint{step.point->x, step.point->y, power});
            break;
        }
        case Action::Commit:
            commit();
            break;
        case Action::EndOfFile:
            commit();
            if (driver_) driver_->plotStart();
            break;
        case Action::StopProcess:
            commit();
            if (driver_) {
                driver_->reset();
                driver_->home();
            }
            break;
        case Action::Reset:
            commit();
            if (driver_) driver_->reset();
            break;
        case Action::Pause:
            if (driver_) driver_->pause();
            break;
        case Action::Resume:
            if (driver_) driver_->resume();
            break;
        case Action::HomeXY:
            commit();
            if (driver_) driver_->home();
            break;
        case Action::MoveAxis:
            commit();
            if (driver_) driver_->moveAbs(step.axis, static_cast<std::int32_t>(step.value));
            break;
        case Action::MoveOrigin:
            commit();
            if (driver_) {
                driver_->moveAbs(Axis::X, state_.x);
                driver_->moveAbs(Axis::Y, state_.y);
            }
            break;
        case Action::Jog:
            if (driver_) driver_->jog(step.axis, step.direction, step.pressed);
            break;
        case Action::LaserOn:
            if (driver_) driver_->laserOn();
            break;
        case Action::LaserOff:
            if (driver_) driver_->laserOff();
            break;
        case Action::StartProcess:
        case Action::MemoryGet:
        case Action::MemorySet:
        case Action::MemoryQuery:
        case Action::None:
            break;
    }
}

void Interpreter::commit() {
    if (!cut_) {
        return;
    }
    core::PlotCut done = std::move(*cut_);
    cut_.reset();
    if (done.empty()) {
        return;
    }
    if (driver_) {
        driver_->plot(done);
    }
    if (onCommit_) {
        onCommit_(done);
    }
}

void Interpreter::reset() {
    cut_.reset();
    state_ = CursorState{};
}

} // namespace ruida::protocol
