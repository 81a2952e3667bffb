#include "ruida/protocol/MemoryMap.hpp"
#include "ruida/protocol/Opcodes.hpp"

#include <algorithm>
#include <cstdio>
#include <iterator>

namespace ruida::protocol {

namespace {

struct StaticEntry {
    std::uint16_t address;
    const char* name;
    std::int64_t value;
};

// Sorted by address.
constexpr StaticEntry kTable[] = {
    {0x0002, "Laser Info", 0},
    {0x0003, "Machine Def", 0},
    {0x0004, "IOEnable", 0},
    {0x0005, "G0 Velocity", 200000},
    {0x000B, "Eng Facula", 800},
    {0x000C, "Home Velocity", 20000},
    {0x000E, "Eng Vert Velocity", 100000},
    {0x0010, "System Control Mode", 0},
    {0x0011, "Laser PWM Frequency 1", 0},
    {0x0012, "Laser Min Power 1", 0},
    {0x0013, "Laser Max Power 1", 0},
    {0x0016, "Laser Attenuation", 0},
    {0x0017, "Laser PWM Frequency 2", 0},
    {0x0018, "Laser Min Power 2", 0},
    {0x0019, "Laser Max Power 2", 0},
    {0x001A, "Laser Standby Frequency 1", 0},
    {0x001B, "Laser Standby Pulse 1", 0},
    {0x001C, "Laser Standby Frequency 2", 0},
    {0x001D, "Laser Standby Pulse 2", 0},
    {0x001E, "Auto Type Space", 0},
    {0x001F, "TriColor", 0},
    {0x0020, "Axis Control Para 1", 0x4000},
    {0x0021, "Axis Precision 1", 0},
    {0x0023, "Axis Max Velocity 1", 0},
    {0x0024, "Axis Start Velocity 1", 0},
    {0x0025, "Axis Max Acc 1", 0},
    {0x0026, "Axis Range 1, Get Frame X", 320000},
    {0x0027, "Axis Btn Start Velocity 1", 0},
    {0x0028, "Axis Btn Acc 1", 0},
    {0x0029, "Axis Estp Acc 1", 0},
    {0x002A, "Axis Home Offset 1", 0},
    {0x002B, "Axis Backlash 1", 0},
    {0x0030, "Axis Control Para 2", 0x4000},
    {0x0031, "Axis Precision 2", 0},
    {0x0033, "Axis Max Velocity 2", 0},
    {0x0034, "Axis Start Velocity 2", 0},
    {0x0035, "Axis Max Acc 2", 0},
    {0x0036, "Axis Range 2, Get Frame Y", 220000},
    {0x0037, "Axis Btn Start Velocity 2", 0},
    {0x0038, "Axis Btn Acc 2", 0},
    {0x0039, "Axis Estp Acc 2", 0},
    {0x003A, "Axis Home Offset 2", 0},
    {0x003B, "Axis Backlash 2", 0},
    {0x0040, "Axis Control Para 3", 0},
    {0x0041, "Axis Precision 3", 0},
    {0x0043, "Axis Max Velocity 3", 0},
    {0x0044, "Axis Start Velocity 3", 0},
    {0x0045, "Axis Max Acc 3", 0},
    {0x0046, "Axis Range 3, Get Frame Z", 0},
    {0x0047, "Axis Btn Start Velocity 3", 0},
    {0x0048, "Axis Btn Acc 3", 0},
    {0x0049, "Axis Estp Acc 3", 0},
    {0x004A, "Axis Home Offset 3", 0},
    {0x004B, "Axis Backlash 3", 0},
    {0x0050, "Axis Control Para 4", 0},
    {0x0051, "Axis Precision 4", 0},
    {0x0053, "Axis Max Velocity 4", 0},
    {0x0054, "Axis Start Velocity 4", 0},
    {0x0055, "Axis Max Acc 4", 0},
    {0x0056, "Axis Range 4, Get Frame U", 0},
    {0x0057, "Axis Btn Start Velocity 4", 0},
    {0x0058, "Axis Btn Acc 4", 0},
    {0x0059, "Axis Estp Acc 4", 0},
    {0x005A, "Axis Home Offset 4", 0},
    {0x005B, "Axis Backlash 4", 0},
    {0x0060, "Machine Type", 0},
    {0x0063, "Laser Min Power 3", 0},
    {0x0064, "Laser Max Power 3", 0},
    {0x0065, "Laser PWM Frequency 3", 0},
    {0x0066, "Laser Standby Frequency 3", 0},
    {0x0067, "Laser Standby Pulse 3", 0},
    {0x0068, "Laser Min Power 4", 0},
    {0x0069, "Laser Max Power 4", 0},
    {0x006A, "Laser PWM Frequency 4", 0},
    {0x006B, "Laser Standby Frequency 4", 0},
    {0x006C, "Laser Standby Pulse 4", 0},
    {0x006D, "Laser Min Power 5", 0},
    {0x006E, "Laser Max Power 5", 0},
    {0x006F, "Laser PWM Frequency 5", 0},
    {0x0070, "Laser Standby Frequency 5", 0},
    {0x0071, "Laser Standby Pulse 5", 0},
    {0x0072, "Laser Min Power 6", 0},
    {0x0073, "Laser Max Power 6", 0},
    {0x0074, "Laser PWM Frequency 6", 0},
    {0x0075, "Laser Standby Frequency 6", 0},
    {0x0076, "Laser Standby Pulse 6", 0},
    {0x0077, "Auto Type Space 2", 0},
    {0x0078, "Auto Type Space 4", 0},
    {0x0079, "Auto Type Space 5", 0},
    {0x007A, "Auto Type Space 6", 0},
    {0x0080, "RD-UNKNOWN 2", 0},
    {0x0090, "RD-UNKNOWN 3", 0},
    {0x00A0, "RD-UNKNOWN 4", 0},
    {0x00B0, "RD-UNKNOWN 5", 0},
    {0x00C0, "Offset 8 Start", 0},
    {0x00C1, "Offset 8 End", 0},
    {0x00C2, "Offset 9 Start", 0},
    {0x00C3, "Offset 9 End", 0},
    {0x00C4, "Offset 10 Start", 0},
    {0x00C5, "Offset 10 End", 0},
    {0x00C6, "Offset 7 Start", 0},
    {0x00C7, "Offset 7 End", 0},
    {0x00C8, "Axis Home Velocity 1", 0},
    {0x00C9, "Axis Home Velocity 2", 0},
    {0x00CA, "Margin 1", 0},
    {0x00CB, "Margin 2", 0},
    {0x00CC, "Margin 3", 0},
    {0x00CD, "Margin 4", 0},
    {0x00CE, "VWheelRatio", 0},
    {0x00CF, "VPunchRatio", 0},
    {0x00D0, "In Hale Zone", 0},
    {0x00D8, "VSlotRatio", 0},
    {0x00D9, "VSlot Share Home Offset", 0},
    {0x00DA, "VPunch Share Home Offset", 0},
    {0x00E7, "VWheel Share Home Offset", 0},
    {0x0100, "System Settings", 0},
    {0x0101, "Turn Velocity", 20000},
    {0x0102, "Syn Acc", 3000000},
    {0x0103, "G0 Delay", 0},
    {0x0104, "Scan Step Factor", 0},
    {0x0105, "User Para 5", 0},
    {0x0107, "Feed Delay After", 0},
    {0x0108, "User Key Fast Velocity", 0},
    {0x0109, "Turn Acc", 400000},
    {0x010A, "G0 Acc", 3000000},
    {0x010B, "Feed Delay Prior", 0},
    {0x010C, "Manual Distance", 0},
    {0x010D, "Shut Down Delay", 0},
    {0x010E, "Focus Depth", 5000},
    {0x010F, "Go Scale Blank", 0},
    {0x0115, "Dock Point X", 0},
    {0x0116, "Dock Point Y", 0},
    {0x0117, "Array Feed Repay", 0},
    {0x0119, "Rotate Off Delay", 0},
    {0x011A, "Acc Ratio", 100},
    {0x011B, "Turn Ratio", 100},
    {0x011C, "Acc G0 Ratio", 100},
    {0x011F, "Rotate Pulse", 0},
    {0x0121, "Rotate D", 0},
    {0x0122, "Eng Facula Replay", 0},
    {0x0124, "X Min Eng Velocity", 10000},
    {0x0125, "X Eng Acc", 10000000},
    {0x0126, "User Para 1", 0},
    {0x0128, "Z Home Velocity", 0},
    {0x0129, "Z Work Velocity", 0},
    {0x012A, "Z G0 Velocity", 0},
    {0x012B, "Union Home Distance", 0},
    {0x012C, "U Home Velocity", 0},
    {0x012D, "U Work Velocity", 0},
    {0x012E, "Feed Repay", 0},
    {0x0131, "Manual Fast Speed", 100000},
    {0x0132, "Manual Slow Speed", 10000},
    {0x0134, "Y Minimum Eng Velocity", 10000},
    {0x0135, "Y Eng Acc", 3000000},
    {0x0137, "Eng Acc Ratio", 100},
    {0x0138, "Sts Ahead Time", 0},
    {0x0139, "Repeat Delay", 0},
    {0x013B, "User Para 3", 0},
    {0x013D, "User Para 2", 0},
    {0x013F, "User Para 4", 0},
    {0x0140, "Axis Home Velocity 3", 0},
    {0x0141, "Axis Work Velocity 3", 0},
    {0x0142, "Axis Home Velocity 4", 0},
    {0x0143, "Axis Work Velocity 4", 0},
    {0x0144, "Axis Home Velocity 5", 0},
    {0x0145, "Axis Work Velocity 5", 0},
    {0x0146, "Axis Home Velocity 6", 0},
    {0x0147, "Axis Work Velocity 6", 0},
    {0x0148, "Axis Home Velocity 7", 0},
    {0x0149, "Axis Work Velocity 7", 0},
    {0x014A, "Axis Home Velocity 8", 0},
    {0x014B, "Axis Work Velocity 8", 0},
    {0x014C, "Laser Reset Time", 0},
    {0x014D, "Laser Start Distance", 0},
    {0x014E, "Z Pen Up Pos", 0},
    {0x014F, "Z Pen Down Pos", 0},
    {0x0150, "Offset 1 Start", 0},
    {0x0151, "Offset 1 End", 0},
    {0x0152, "Offset 2 Start", 0},
    {0x0153, "Offset 2 End", 0},
    {0x0154, "Offset 3 Start", 0},
    {0x0155, "Offset 3 End", 0},
    {0x0156, "Offset 6 Start", 0},
    {0x0157, "Offset 6 End", 0},
    {0x0158, "Offset 4 Start", 0},
    {0x0159, "Offset 4 End", 0},
    {0x015A, "Offset 5 Start", 0},
    {0x015B, "Offset 5 End", 0},
    {0x015C, "Delay 6 On", 0},
    {0x015D, "Delay 6 Off", 0},
    {0x015E, "Delay 7 On", 0},
    {0x015F, "Delay 7 Off", 0},
    {0x0160, "Inhale On Delay", 0},
    {0x0161, "Inhale Off Delay", 0},
    {0x0162, "Delay 5 On", 0},
    {0x0163, "Delay 5 Off", 0},
    {0x0164, "Delay 2 On", 0},
    {0x0165, "Delay 2 Off", 0},
    {0x0166, "VSample Distance", 0},
    {0x0169, "Offset 11 Start", 0},
    {0x016A, "Offset 11 End", 0},
    {0x016B, "Tool Up Pos 4", 0},
    {0x016C, "Tool Down Pos 4", 0},
    {0x016D, "VUp Angle", 0},
    {0x016E, "VRotatePulse", 0},
    {0x0170, "Delay 1 On", 0},
    {0x0171, "VCorner Precision", 0},
    {0x0172, "Delay 3 On", 0},
    {0x0173, "Delay 4 Off", 0},
    {0x0174, "Delay 4 On", 0},
    {0x0175, "Delay 1 Off", 0},
    {0x0176, "Delay 3 Off", 0},
    {0x0177, "Delay 9 On", 0},
    {0x0178, "Delay 9 Off", 0},
    {0x0179, "Tool Down Pos 3", 0},
    {0x017A, "Tool Up Pos 2", 0},
    {0x017B, "Tool Down Pos 2", 0},
    {0x017C, "Punch Rotate Delay", 0},
    {0x017D, "VSlot Angle", 0},
    {0x017E, "VTool Rotate Limit", 0},
    {0x017F, "Tool Up Delay", 0},
    {0x0180, "Card Language", 0},
    {0x0188, "User Key Slow Velocity", 0},
    {0x0189, "MachineID 2", 0},
    {0x018A, "MachineID 3", 0},
    {0x018B, "MachineID 4", 0},
    {0x018C, "Blow On Delay", 0},
    {0x018D, "Blow Off Delay", 0},
    {0x018F, "User Para 6, Blower", 0},
    {0x0190, "Jet Time", 0},
    {0x0191, "Color Mark Head Distance", 0},
    {0x0192, "Color Mark Mark Distance", 0},
    {0x0193, "Color Mark Camera Distance", 0},
    {0x0194, "Color Mark Sensor Offset2", 0},
    {0x0195, "Cylinder Down Delay", 0},
    {0x0196, "Cylinder Up Delay", 0},
    {0x0197, "Press Down Delay", 0},
    {0x0198, "Press Up Delay", 0},
    {0x0199, "Drop Position Start", 0},
    {0x019A, "Drop Position End", 0},
    {0x019B, "Drop Interval", 0},
    {0x019C, "Drop Time", 0},
    {0x019D, "Sharpen Delay On", 0},
    {0x019E, "Sharpen Delay Off", 0},
    {0x019F, "Sharpen Time Limit", 0},
    {0x01A0, "Sharpen Travel Limit", 0},
    {0x01A1, "Work End Time", 0},
    {0x01A2, "Color Mark Offset", 0},
    {0x01A3, "Color Mark Count", 0},
    {0x01A4, "Wheel Press Compensation", 0},
    {0x01A5, "Color Mark Filter Length", 0},
    {0x01A6, "VBlow Back On Delay", 0},
    {0x01A7, "VBlow Back Off Delay", 0},
    {0x01AC, "Y U Safe Distance", 0},
    {0x01AD, "Y U Home Distance", 0},
    {0x01AE, "VTool Preset Position X", 0},
    {0x01AF, "VTool Preset Position Y", 0},
    {0x01B1, "VTool Preset Compensation", 0},
    {0x01B2, "VTool Preset Cur Depth", 0},
    {0x0201, "Total Open Time (s)", 0},
    {0x0202, "Total Work Time (s)", 0},
    {0x0203, "Total Work Number", 0},
    {0x0208, "Previous Work Time", 0},
    {0x0211, "Total Laser Work Time", 0},
    {0x0212, "File Custom Flag / Feed Info", 0},
    {0x0217, "Total Laser Work Time 2", 0},
    {0x0218, "Total Laser Work Time 3", 0},
    {0x0219, "Total Laser Work Time 4", 0},
    {0x021A, "Total Laser Work Time 5", 0},
    {0x021F, "Ring Number", 0},
    {0x0223, "X Total Travel (m)", 0},
    {0x0224, "Position Point 0", 0},
    {0x0233, "Y Total Travel (m)", 0},
    {0x0234, "Position Point 1", 0},
    {0x0243, "Z Total Travel (m)", 0},
    {0x0253, "U Total Travel (m)", 0},
    {0x0260, "DocumentWorkNum", 0},
    {0x02C4, "Read Scan Backlash Flag", 0},
    {0x02C5, "Read Scan Backlash 1", 0},
    {0x02D5, "Read Scan Backlash 2", 0},
    {0x02FE, "Card ID", 0x65006500},
    {0x0313, "Material Thickness", 0},
    {0x031C, "File Fault", 0},
    {0x0320, "File Total Length", 0},
    {0x0321, "File Progress Len", 0},
    {0x033B, "Read Process Feed Length", 0},
    {0x0340, "Stop Time", 0},
    {0x0591, "Card Lock", 0},
    {0x05C0, "Laser Life", 0},
};

constexpr std::int64_t CARD_ID_RDC6442G = 0x65006500;
constexpr std::int64_t FLASH_SPACE = 100000000;

const StaticEntry* findStatic(std::uint16_t address) {
    auto it = std::lower_bound(std::begin(kTable), std::end(kTable), address,
                               [](const StaticEntry& e, std::uint16_t a) { return e.address < a; });
    if (it == std::end(kTable) || it->address != address) {
        return nullptr;
    }
    return it;
}

std::int64_t machineStatusOf(const core::DriverStatus& status) {
    if (status.state == "busy") return EMULATOR_STATUS_RUNNING;
    if (status.state == "hold") return EMULATOR_STATUS_PAUSED;
    return EMULATOR_STATUS_OK;
}

} // namespace

MemoryMap::MemoryMap(const core::Driver* driver)
: driver(driver) {}

void MemoryMap::setDriver(const core::Driver* newDriver) {
    std::lock_guard lock(mutex);
    driver = newDriver;
}

MemoryEntry MemoryMap::lookup(std::uint16_t address) const {
    core::DriverStatus status;
    {
        std::lock_guard lock(mutex);
        if (auto it = written.find(address); it != written.end()) {
            const StaticEntry* entry = findStatic(address);
            return {entry ? entry->name : "Written", it->second};
        }
        if (driver) {
            status = driver->status();
        }
    }

    switch (address) {
        case MEM_MACHINE_STATUS:    return {"Machine Status", machineStatusOf(status)};
        case 0x0205:                return {"Total Doc Number", 0};
        case 0x0206:                return {"Flash Space", FLASH_SPACE};
        case 0x0207:                return {"Flash Space Free", FLASH_SPACE};
        case MEM_CURRENT_X:         return {"Axis Preferred Position 1, Pos X", status.x};
        case MEM_CURRENT_Y:         return {"Axis Preferred Position 2, Pos Y", status.y};
        case MEM_CURRENT_Z:         return {"Axis Preferred Position 3, Pos Z", status.z};
        case MEM_CURRENT_U:         return {"Axis Preferred Position 4, Pos U", status.u};
        case 0x025A:                return {"Axis Preferred Position 5, Pos A", 0};
        case 0x025B:                return {"Axis Preferred Position 6, Pos B", 0};
        case 0x025C:                return {"Axis Preferred Position 7, Pos C", 0};
        case 0x025D:                return {"Axis Preferred Position 8, Pos D", 0};
        case MEM_CARD_ID:           return {"Card ID", CARD_ID_RDC6442G};
        case MEM_MAINBOARD_VERSION: return {"Mainboard Version", Bytes{'M', 'E', 'E', 'R', 'K', '4', '0', 'T', 0x00}};
        default: break;
    }

    if (const StaticEntry* entry = findStatic(address)) {
        return {entry->name, entry->value};
    }
    if (address >= 0x0181 && address <= 0x0187) {
        return {"PC Lock " + std::to_string(address - 0x0181), 0};
    }
    if (address >= 0x0261 && address < 0x02C4) {
        return {"Document Number", static_cast<std::int64_t>(address - 0x0260)};
    }
    if (address >= 0x0391 && address < 0x0420) {
        return {"Time for File " + std::to_string(address - 0x0390) + " to Run", 100};
    }
    return {"Unknown", 0};
}

void MemoryMap::store(std::uint16_t address, std::int64_t value) {
    std::lock_guard lock(mutex);
    written[address] = value;
}

Bytes MemoryMap::reply(std::uint16_t address) const {
    const MemoryEntry entry = lookup(address);
    const auto mem = encode14(address);
    Bytes out{op::MEMORY, sub::MEM_SET, mem[0], mem[1]};
    if (const auto* value = std::get_if<std::int64_t>(&entry.value)) {
        const auto groups = encode35(*value);
        out.insert(out.end(), groups.begin(), groups.end());
    } else {
        const auto& raw = std::get<Bytes>(entry.value);
        out.insert(out.end(), raw.begin(), raw.end());
    }
    return out;
}

expected<MemoryReply, DecodeError> decodeMemoryReply(const Bytes& frame) {
    if (frame.size() < 9) {
        return unexpected(DecodeError{"memory reply", "expected 9 bytes, got " + std::to_string(frame.size())});
    }
    if (frame[0] != op::MEMORY || frame[1] != sub::MEM_SET) {
        char head[16];
        std::snprintf(head, sizeof(head), "%02x %02x", frame[0], frame[1]);
        return unexpected(DecodeError{"memory reply", std::string("unexpected header ") + head});
    }
    MemoryReply reply;
    reply.address = static_cast<std::uint16_t>(decodeU14(&frame[2]));
    reply.value = decodeU35(&frame[4]);
    return reply;
}

Bytes memoryGet(std::uint16_t address) {
    const auto mem = encode14(address);
    return {op::MEMORY, sub::MEM_GET, mem[0], mem[1]};
}

} // namespace ruida::protocol
