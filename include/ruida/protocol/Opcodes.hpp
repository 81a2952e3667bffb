#pragma once

#include <cstdint>

namespace ruida::protocol {

// Single-byte tokens (plain values; they travel swizzled like everything else).
constexpr std::uint8_t ACK = 0xCC;
constexpr std::uint8_t ERR = 0xCD;
constexpr std::uint8_t ENQ = 0xCE;       // keep-alive
constexpr std::uint8_t NAK = 0xCF;       // checksum failure

// Primary opcodes used by the builder and the realtime path.
namespace op {
constexpr std::uint8_t AXIS_X_MOVE = 0x80;
constexpr std::uint8_t MOVE_ABS_XY = 0x88;
constexpr std::uint8_t MOVE_REL_XY = 0x89;
constexpr std::uint8_t MOVE_REL_X = 0x8A;
constexpr std::uint8_t MOVE_REL_Y = 0x8B;
constexpr std::uint8_t AXIS_Y_MOVE = 0xA0;
constexpr std::uint8_t INTERFACE = 0xA5;
constexpr std::uint8_t CUT_ABS_XY = 0xA8;
constexpr std::uint8_t CUT_REL_XY = 0xA9;
constexpr std::uint8_t CUT_REL_X = 0xAA;
constexpr std::uint8_t CUT_REL_Y = 0xAB;
constexpr std::uint8_t IMD_POWER_2 = 0xC0;
constexpr std::uint8_t END_POWER_2 = 0xC1;
constexpr std::uint8_t IMD_POWER_3 = 0xC2;
constexpr std::uint8_t IMD_POWER_4 = 0xC3;
constexpr std::uint8_t END_POWER_3 = 0xC4;
constexpr std::uint8_t END_POWER_4 = 0xC5;
constexpr std::uint8_t POWER = 0xC6;
constexpr std::uint8_t IMD_POWER_1 = 0xC7;
constexpr std::uint8_t END_POWER_1 = 0xC8;
constexpr std::uint8_t SPEED = 0xC9;
constexpr std::uint8_t LAYER = 0xCA;
constexpr std::uint8_t LB_D0 = 0xD0;
constexpr std::uint8_t END_OF_FILE = 0xD7;
constexpr std::uint8_t PROCESS = 0xD8;
constexpr std::uint8_t RAPID = 0xD9;
constexpr std::uint8_t MEMORY = 0xDA;
constexpr std::uint8_t DOCUMENT = 0xE5;
constexpr std::uint8_t SET_ABSOLUTE = 0xE6;
constexpr std::uint8_t BLOCK = 0xE7;
constexpr std::uint8_t FILE_OPS = 0xE8;
constexpr std::uint8_t ARRAY_START = 0xEA;
constexpr std::uint8_t ARRAY_END = 0xEB;
constexpr std::uint8_t REF_POINT_SET = 0xF0;
constexpr std::uint8_t ELEMENT_MAX = 0xF1;
constexpr std::uint8_t ELEMENT = 0xF2;
} // namespace op

// Second selector bytes.
namespace sub {
constexpr std::uint8_t MEM_GET = 0x00;
constexpr std::uint8_t MEM_SET = 0x01;

constexpr std::uint8_t START_PROCESS = 0x00;
constexpr std::uint8_t STOP_PROCESS = 0x01;
constexpr std::uint8_t PAUSE_PROCESS = 0x02;
constexpr std::uint8_t RESTORE_PROCESS = 0x03;
constexpr std::uint8_t HOME_XY = 0x2A;
constexpr std::uint8_t HOME_Z = 0x2C;
constexpr std::uint8_t HOME_U = 0x2D;

constexpr std::uint8_t KEY_DOWN = 0x50;
constexpr std::uint8_t KEY_UP = 0x51;
} // namespace sub

// Interface-panel key codes following A5 50/51.
namespace key {
constexpr std::uint8_t MINUS_X = 0x01;
constexpr std::uint8_t PLUS_X = 0x02;
constexpr std::uint8_t PLUS_Y = 0x03;
constexpr std::uint8_t MINUS_Y = 0x04;
constexpr std::uint8_t PULSE = 0x05;
constexpr std::uint8_t START_PAUSE = 0x06;
constexpr std::uint8_t ESC = 0x07;
constexpr std::uint8_t ORIGIN = 0x08;
constexpr std::uint8_t STOP = 0x09;
constexpr std::uint8_t PLUS_Z = 0x0A;
constexpr std::uint8_t MINUS_Z = 0x0B;
constexpr std::uint8_t PLUS_U = 0x0C;
constexpr std::uint8_t MINUS_U = 0x0D;
constexpr std::uint8_t TRACE = 0x0F;
constexpr std::uint8_t SPEED = 0x11;
constexpr std::uint8_t LASER_GATE = 0x12;
constexpr std::uint8_t RESET = 0x5A;
} // namespace key

// Memory addresses (already decoded from their two 7-bit groups).
constexpr std::uint16_t MEM_BED_SIZE_X = 0x0026;
constexpr std::uint16_t MEM_BED_SIZE_Y = 0x0036;
constexpr std::uint16_t MEM_MACHINE_STATUS = 0x0200;
constexpr std::uint16_t MEM_CURRENT_X = 0x0221;
constexpr std::uint16_t MEM_CURRENT_Y = 0x0231;
constexpr std::uint16_t MEM_CURRENT_Z = 0x0241;
constexpr std::uint16_t MEM_CURRENT_U = 0x0251;
constexpr std::uint16_t MEM_CARD_ID = 0x02FE;
constexpr std::uint16_t MEM_MAINBOARD_VERSION = 0x02FF;

// Machine status word bits.
constexpr std::uint32_t MACHINE_STATUS_MOVING = 0x01000000;
constexpr std::uint32_t MACHINE_STATUS_PART_END = 0x00000002;
constexpr std::uint32_t MACHINE_STATUS_JOB_RUNNING = 0x00000001;

// Values the emulator reports at MEM_MACHINE_STATUS.
constexpr std::uint32_t EMULATOR_STATUS_RUNNING = 21;
constexpr std::uint32_t EMULATOR_STATUS_OK = 22;
constexpr std::uint32_t EMULATOR_STATUS_PAUSED = 23;

} // namespace ruida::protocol
