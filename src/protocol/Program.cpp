#include "ruida/protocol/Program.hpp"
#include "ruida/protocol/Opcodes.hpp"
#include "ruida/log/Log.hpp"
#include "ruida/config/RuidaConfig.hpp"

#include <algorithm>
#include <string>

namespace ruida::protocol {

namespace {

bool fitsRelative(std::int32_t d) {
    return d >= REL14_MIN && d <= REL14_MAX;
}

// Per-laser opcode bytes, index 0 is laser 1.
constexpr std::uint8_t kImmediatePower[4] = {op::IMD_POWER_1, op::IMD_POWER_2, op::IMD_POWER_3, op::IMD_POWER_4};
constexpr std::uint8_t kEndPower[4] = {op::END_POWER_1, op::END_POWER_2, op::END_POWER_3, op::END_POWER_4};
constexpr std::uint8_t kMinPower[4] = {0x01, 0x21, 0x05, 0x07};
constexpr std::uint8_t kMaxPower[4] = {0x02, 0x22, 0x06, 0x08};
constexpr std::uint8_t kMinPowerPart[4] = {0x31, 0x41, 0x35, 0x37};
constexpr std::uint8_t kMaxPowerPart[4] = {0x32, 0x42, 0x36, 0x38};
constexpr std::uint8_t kThroughPower[4] = {0x50, 0x51, 0x55, 0x56};

bool laserIndex(int laser, std::size_t& index) {
    if (laser < 1 || laser > 4) {
        logError("[Program] laser ", laser, " out of range 1..4\n");
        return false;
    }
    index = static_cast<std::size_t>(laser - 1);
    return true;
}

} // namespace

Program::Program(std::uint8_t magic)
: codec_(magic) {}

Program::Program(std::uint8_t magic, CommandSink sink)
: codec_(magic)
, sink_(std::move(sink)) {}

void Program::clear() {
    commands_.clear();
    last_.reset();
}

std::size_t Program::byteSize() const {
    std::size_t total = 0;
    for (const auto& command : commands_) {
        total += command.size();
    }
    return total;
}

Bytes Program::contents(std::size_t first, std::size_t last) const {
    last = std::min(last, commands_.size());
    Bytes out;
    for (std::size_t i = first; i < last; ++i) {
        out.insert(out.end(), commands_[i].begin(), commands_[i].end());
    }
    return out;
}

std::uint16_t Program::checksum() const {
    std::uint32_t sum = 0;
    for (const auto& command : commands_) {
        for (std::uint8_t b : command) {
            sum += b;
        }
    }
    return static_cast<std::uint16_t>(sum & 0xFFFFu);
}

std::vector<Bytes> Program::chunk(std::size_t budget) const {
    std::vector<Bytes> chunks;
    Bytes current;
    for (const auto& command : commands_) {
        if (!current.empty() && current.size() + command.size() > budget) {
            chunks.push_back(std::move(current));
            current.clear();
        }
        current.insert(current.end(), command.begin(), command.end());
    }
    if (!current.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

std::vector<double> Program::laser1Powers() const {
    std::vector<double> powers;
    for (const auto& c : commands_) {
        if (c.size() < 2 || c[0] != op::POWER) {
            continue;
        }
        if ((c[1] == kMinPower[0] || c[1] == kMaxPower[0]) && c.size() >= 4) {
            powers.push_back(decodePower(&c[2]));
        } else if ((c[1] == kMinPowerPart[0] || c[1] == kMaxPowerPart[0]) && c.size() >= 5) {
            powers.push_back(decodePower(&c[3]));
        }
    }
    return powers;
}

bool Program::lowPowerWarning() const {
    const auto powers = laser1Powers();
    return std::any_of(powers.begin(), powers.end(),
                       [](double p) { return p > 0.0 && p < config::RUIDA_LOW_POWER_WARNING; });
}

bool Program::highPowerWarning() const {
    const auto powers = laser1Powers();
    return std::any_of(powers.begin(), powers.end(),
                       [](double p) { return p > config::RUIDA_HIGH_POWER_WARNING; });
}

void Program::writeCommand(Command command) {
    if (command.empty()) {
        return;
    }
    if (sink_) {
        sink_(codec_.swizzle(command));
        return;
    }
    commands_.push_back(std::move(command));
}

void Program::writeBlob(const std::uint8_t* data, std::size_t size,
                        std::optional<std::uint8_t> magic) {
    if (!magic) {
        std::size_t d12 = 0;
        std::size_t d89 = 0;
        for (std::size_t i = 0; i < size; ++i) {
            if (data[i] == 0x12) ++d12;
            else if (data[i] == 0x89) ++d89;
        }
        if (d89 + d12 > 10) {
            magic = d89 > d12 ? std::uint8_t{0x88} : std::uint8_t{0x11};
        }
    }
    if (magic && *magic != codec_.magic()) {
        logInfo("[Program] magic set to 0x", std::hex, static_cast<int>(*magic), std::dec, "\n");
        codec_ = Codec(*magic);
    }
    const Bytes plain = codec_.unswizzle(data, size);
    for (auto& command : splitCommands(plain)) {
        commands_.push_back(std::move(command));
    }
}

core::ByteBuffer& Program::begin(std::uint8_t opcode) {
    scratch_.clear();
    scratch_.appendUInt8(opcode);
    return scratch_;
}

core::ByteBuffer& Program::begin(std::uint8_t opcode, std::uint8_t selector) {
    begin(opcode);
    scratch_.appendUInt8(selector);
    return scratch_;
}

void Program::finish() {
    writeCommand(scratch_.take());
}

void Program::coordPair(std::uint8_t opcode, std::uint8_t selector, std::int32_t x, std::int32_t y) {
    auto& b = begin(opcode, selector);
    b.appendU35(x);
    b.appendU35(y);
    finish();
}

void Program::sevenValues(std::uint8_t opcode, std::uint8_t selector, const std::int32_t (&values)[7]) {
    auto& b = begin(opcode, selector);
    for (std::int32_t v : values) {
        b.appendU14(v);
    }
    finish();
}

// Motion ---------------------------------------------------------------------

void Program::moveAbsXY(std::int32_t x, std::int32_t y) {
    auto& b = begin(op::MOVE_ABS_XY);
    b.appendU35(x);
    b.appendU35(y);
    finish();
    last_ = std::make_pair(x, y);
}

void Program::moveRelXY(std::int32_t dx, std::int32_t dy) {
    auto& b = begin(op::MOVE_REL_XY);
    b.appendU14(dx);
    b.appendU14(dy);
    finish();
    if (last_) last_ = std::make_pair(last_->first + dx, last_->second + dy);
}

void Program::moveRelX(std::int32_t dx) {
    begin(op::MOVE_REL_X).appendU14(dx);
    finish();
    if (last_) last_->first += dx;
}

void Program::moveRelY(std::int32_t dy) {
    begin(op::MOVE_REL_Y).appendU14(dy);
    finish();
    if (last_) last_->second += dy;
}

void Program::cutAbsXY(std::int32_t x, std::int32_t y) {
    auto& b = begin(op::CUT_ABS_XY);
    b.appendU35(x);
    b.appendU35(y);
    finish();
    last_ = std::make_pair(x, y);
}

void Program::cutRelXY(std::int32_t dx, std::int32_t dy) {
    auto& b = begin(op::CUT_REL_XY);
    b.appendU14(dx);
    b.appendU14(dy);
    finish();
    if (last_) last_ = std::make_pair(last_->first + dx, last_->second + dy);
}

void Program::cutRelX(std::int32_t dx) {
    begin(op::CUT_REL_X).appendU14(dx);
    finish();
    if (last_) last_->first += dx;
}

void Program::cutRelY(std::int32_t dy) {
    begin(op::CUT_REL_Y).appendU14(dy);
    finish();
    if (last_) last_->second += dy;
}

void Program::jump(std::int32_t x, std::int32_t y, std::int32_t dx, std::int32_t dy) {
    if (dx == 0 && dy == 0) {
        return;
    }
    if (dx == 0 && fitsRelative(dy)) {
        moveRelY(dy);
    } else if (dy == 0 && fitsRelative(dx)) {
        moveRelX(dx);
    } else if (fitsRelative(dx) && fitsRelative(dy)) {
        moveRelXY(dx, dy);
    } else {
        moveAbsXY(x, y);
    }
    last_ = std::make_pair(x, y);
}

void Program::mark(std::int32_t x, std::int32_t y, std::int32_t dx, std::int32_t dy) {
    if (dx == 0 && dy == 0) {
        return;
    }
    if (dx == 0 && fitsRelative(dy)) {
        cutRelY(dy);
    } else if (dy == 0 && fitsRelative(dx)) {
        cutRelX(dx);
    } else if (fitsRelative(dx) && fitsRelative(dy)) {
        cutRelXY(dx, dy);
    } else {
        cutAbsXY(x, y);
    }
    last_ = std::make_pair(x, y);
}

void Program::moveTo(std::int32_t x, std::int32_t y) {
    if (!last_) {
        moveAbsXY(x, y);
        return;
    }
    jump(x, y, x - last_->first, y - last_->second);
}

void Program::cutTo(std::int32_t x, std::int32_t y) {
    if (!last_) {
        cutAbsXY(x, y);
        return;
    }
    mark(x, y, x - last_->first, y - last_->second);
}

void Program::axisXMove(std::int32_t x) {
    begin(op::AXIS_X_MOVE, 0x00).appendU35(x);
    finish();
}

void Program::axisYMove(std::int32_t y) {
    begin(op::AXIS_Y_MOVE, 0x00).appendU35(y);
    finish();
}

void Program::axisZMove(std::int32_t z) {
    begin(op::AXIS_X_MOVE, 0x08).appendU35(z);
    finish();
}

void Program::axisUMove(std::int32_t u) {
    begin(op::AXIS_Y_MOVE, 0x08).appendU35(u);
    finish();
}

void Program::rapidMoveX(std::int32_t x, std::uint8_t options) {
    auto& b = begin(op::RAPID, 0x00);
    b.appendUInt8(options);
    b.appendU35(x);
    finish();
}

void Program::rapidMoveY(std::int32_t y, std::uint8_t options) {
    auto& b = begin(op::RAPID, 0x01);
    b.appendUInt8(options);
    b.appendU35(y);
    finish();
}

void Program::rapidMoveZ(std::int32_t z, std::uint8_t options) {
    auto& b = begin(op::RAPID, 0x02);
    b.appendUInt8(options);
    b.appendU35(z);
    finish();
}

void Program::rapidMoveU(std::int32_t u, std::uint8_t options) {
    auto& b = begin(op::RAPID, 0x03);
    b.appendUInt8(options);
    b.appendU35(u);
    finish();
}

void Program::rapidMoveXY(std::int32_t x, std::int32_t y, std::uint8_t options) {
    auto& b = begin(op::RAPID, 0x10);
    b.appendUInt8(options);
    b.appendU35(x);
    b.appendU35(y);
    finish();
    last_ = std::make_pair(x, y);
}

void Program::rapidMoveXYU(std::int32_t x, std::int32_t y, std::int32_t u, std::uint8_t options) {
    auto& b = begin(op::RAPID, 0x30);
    b.appendUInt8(options);
    b.appendU35(x);
    b.appendU35(y);
    b.appendU35(u);
    finish();
    last_ = std::make_pair(x, y);
}

// Power ----------------------------------------------------------------------

void Program::immediatePower(int laser, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    begin(kImmediatePower[i]).appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::endPower(int laser, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    begin(kEndPower[i]).appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::minPower(int laser, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    begin(op::POWER, kMinPower[i]).appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::maxPower(int laser, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    begin(op::POWER, kMaxPower[i]).appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::minPowerPart(int laser, std::uint8_t part, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    auto& b = begin(op::POWER, kMinPowerPart[i]);
    b.appendUInt8(part);
    b.appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::maxPowerPart(int laser, std::uint8_t part, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    auto& b = begin(op::POWER, kMaxPowerPart[i]);
    b.appendUInt8(part);
    b.appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::throughPower(int laser, double percent) {
    std::size_t i = 0;
    if (!laserIndex(laser, i)) return;
    begin(op::POWER, kThroughPower[i]).appendU14(static_cast<std::int32_t>(encodePower(percent)));
    finish();
}

void Program::frequencyPart(std::uint8_t laser, std::uint8_t part, std::uint64_t hz) {
    auto& b = begin(op::POWER, 0x60);
    b.appendUInt8(laser);
    b.appendUInt8(part);
    b.appendU35(static_cast<std::int64_t>(hz));
    finish();
}

// Timing ---------------------------------------------------------------------

void Program::laserInterval(double ms) {
    begin(op::POWER, 0x10).appendU35(encodeTime(ms));
    finish();
}

void Program::addDelay(double ms) {
    begin(op::POWER, 0x11).appendU35(encodeTime(ms));
    finish();
}

void Program::laserOnDelay(double ms) {
    begin(op::POWER, 0x12).appendU35(encodeTime(ms));
    finish();
}

void Program::laserOffDelay(double ms) {
    begin(op::POWER, 0x13).appendU35(encodeTime(ms));
    finish();
}

// Speed ----------------------------------------------------------------------

void Program::speedLaser1(double mmPerSecond) {
    begin(op::SPEED, 0x02).appendU35(encodeSpeed(mmPerSecond));
    finish();
}

void Program::speedAxis(double mmPerSecond) {
    begin(op::SPEED, 0x03).appendU35(encodeSpeed(mmPerSecond));
    finish();
}

void Program::speedLaser1Part(std::uint8_t part, double mmPerSecond) {
    auto& b = begin(op::SPEED, 0x04);
    b.appendUInt8(part);
    b.appendU35(encodeSpeed(mmPerSecond));
    finish();
}

// These two carry an extra factor of 1000.
void Program::forceEngSpeed(double mmPerSecond) {
    begin(op::SPEED, 0x05).appendU35(encodeSpeed(mmPerSecond * 1000.0));
    finish();
}

void Program::speedAxisMove(double mmPerSecond) {
    begin(op::SPEED, 0x06).appendU35(encodeSpeed(mmPerSecond * 1000.0));
    finish();
}

// Layers ---------------------------------------------------------------------

void Program::layerEnd() {
    begin(op::LAYER, 0x01).appendUInt8(0x00);
    finish();
}

void Program::workMode(std::uint8_t mode) {
    begin(op::LAYER, 0x01).appendUInt8(mode);
    finish();
}

void Program::layerNumberPart(std::uint8_t part) {
    begin(op::LAYER, 0x02).appendUInt8(part);
    finish();
}

void Program::enLaserTubeStart() {
    begin(op::LAYER, 0x03);
    finish();
}

void Program::xSignMap(std::uint8_t value) {
    begin(op::LAYER, 0x04).appendUInt8(value);
    finish();
}

void Program::layerColor(std::uint32_t rgb) {
    begin(op::LAYER, 0x05).appendU35(rgb);
    finish();
}

void Program::layerColorPart(std::uint8_t part, std::uint32_t rgb) {
    auto& b = begin(op::LAYER, 0x06);
    b.appendUInt8(part);
    b.appendU35(rgb);
    finish();
}

void Program::enExIoStart(std::uint8_t value) {
    begin(op::LAYER, 0x10).appendUInt8(value);
    finish();
}

void Program::maxLayerPart(std::uint8_t part) {
    begin(op::LAYER, 0x22).appendUInt8(part);
    finish();
}

void Program::uFileId(std::uint16_t fileNumber) {
    begin(op::LAYER, 0x30).appendU14(fileNumber);
    finish();
}

void Program::zuMap(std::uint8_t value) {
    begin(op::LAYER, 0x40).appendUInt8(value);
    finish();
}

void Program::workModePart(std::uint8_t part, std::uint8_t mode) {
    auto& b = begin(op::LAYER, 0x41);
    b.appendUInt8(part);
    b.appendUInt8(mode);
    finish();
}

void Program::airAssist(bool on) {
    begin(op::LAYER, 0x01).appendUInt8(on ? 0x13 : 0x12);
    finish();
}

// Tokens ---------------------------------------------------------------------

void Program::ack() {
    begin(ACK);
    finish();
}

void Program::err() {
    begin(ERR);
    finish();
}

void Program::keepAlive() {
    begin(ENQ);
    finish();
}

// Process --------------------------------------------------------------------

void Program::endOfFile() {
    begin(op::END_OF_FILE);
    finish();
}

void Program::startProcess() {
    begin(op::PROCESS, sub::START_PROCESS);
    finish();
}

void Program::stopProcess() {
    begin(op::PROCESS, sub::STOP_PROCESS);
    finish();
}

void Program::pauseProcess() {
    begin(op::PROCESS, sub::PAUSE_PROCESS);
    finish();
}

void Program::restoreProcess() {
    begin(op::PROCESS, sub::RESTORE_PROCESS);
    finish();
}

void Program::refPointMode2() {
    begin(op::PROCESS, 0x10);
    finish();
}

void Program::refPointMode1() {
    begin(op::PROCESS, 0x11);
    finish();
}

void Program::refPointMode0() {
    begin(op::PROCESS, 0x12);
    finish();
}

void Program::homeZ() {
    begin(op::PROCESS, sub::HOME_Z);
    finish();
}

void Program::homeU() {
    begin(op::PROCESS, sub::HOME_U);
    finish();
}

void Program::homeXY() {
    begin(op::PROCESS, sub::HOME_XY);
    finish();
    last_ = std::make_pair(0, 0);
}

void Program::focusZ() {
    begin(op::PROCESS, 0x2E);
    finish();
}

// Memory ---------------------------------------------------------------------

void Program::getSetting(std::uint16_t address) {
    begin(op::MEMORY, sub::MEM_GET).appendU14(address);
    finish();
}

void Program::setSetting(std::uint16_t address, std::int64_t value0, std::int64_t value1) {
    auto& b = begin(op::MEMORY, sub::MEM_SET);
    b.appendU14(address);
    b.appendU35(value0);
    b.appendU35(value1);
    finish();
}

// Documents, arrays and elements ---------------------------------------------

void Program::documentPageNumber(std::uint8_t page) {
    begin(op::DOCUMENT, 0x00).appendUInt8(page);
    finish();
}

void Program::documentDataEnd() {
    begin(op::DOCUMENT, 0x02);
    finish();
}

void Program::setAbsolute() {
    begin(op::SET_ABSOLUTE, 0x01);
    finish();
}

void Program::blockEnd() {
    begin(op::BLOCK, 0x00);
    finish();
}

void Program::processTopLeft(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x03, x, y); }
void Program::processRepeat(const std::int32_t (&values)[7]) { sevenValues(op::BLOCK, 0x04, values); }

void Program::arrayDirection(std::uint8_t direction) {
    begin(op::BLOCK, 0x05).appendUInt8(direction);
    finish();
}

void Program::feedRepeat(std::int64_t v0, std::int64_t v1) {
    auto& b = begin(op::BLOCK, 0x06);
    b.appendU35(v0);
    b.appendU35(v1);
    finish();
}

void Program::processBottomRight(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x07, x, y); }
void Program::arrayRepeat(const std::int32_t (&values)[7]) { sevenValues(op::BLOCK, 0x08, values); }

void Program::feedLength(std::int64_t length) {
    begin(op::BLOCK, 0x09).appendU35(length);
    finish();
}

void Program::arrayMinPoint(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x13, x, y); }
void Program::arrayMaxPoint(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x17, x, y); }
void Program::arrayAdd(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x23, x, y); }

void Program::arrayMirror(std::uint8_t mirror) {
    begin(op::BLOCK, 0x24).appendUInt8(mirror);
    finish();
}

void Program::blockXSize(std::int64_t v0, std::int64_t v1) {
    auto& b = begin(op::BLOCK, 0x35);
    b.appendU35(v0);
    b.appendU35(v1);
    finish();
}

void Program::documentMinPoint(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x50, x, y); }
void Program::documentMaxPoint(std::int32_t x, std::int32_t y) { coordPair(op::BLOCK, 0x51, x, y); }

void Program::partMinPoint(std::uint8_t part, std::int32_t x, std::int32_t y) {
    auto& b = begin(op::BLOCK, 0x52);
    b.appendUInt8(part);
    b.appendU35(x);
    b.appendU35(y);
    finish();
}

void Program::partMaxPoint(std::uint8_t part, std::int32_t x, std::int32_t y) {
    auto& b = begin(op::BLOCK, 0x53);
    b.appendUInt8(part);
    b.appendU35(x);
    b.appendU35(y);
    finish();
}

void Program::penOffset(std::uint8_t axis, std::int32_t value) {
    auto& b = begin(op::BLOCK, 0x54);
    b.appendUInt8(axis);
    b.appendU35(value);
    finish();
}

void Program::layerOffset(std::uint8_t axis, std::int32_t value) {
    auto& b = begin(op::BLOCK, 0x55);
    b.appendUInt8(axis);
    b.appendU35(value);
    finish();
}

void Program::setCurrentElementIndex(std::uint8_t index) {
    begin(op::BLOCK, 0x60).appendUInt8(index);
    finish();
}

void Program::partMinPointEx(std::uint8_t part, std::int32_t x, std::int32_t y) {
    auto& b = begin(op::BLOCK, 0x61);
    b.appendUInt8(part);
    b.appendU35(x);
    b.appendU35(y);
    finish();
}

void Program::partMaxPointEx(std::uint8_t part, std::int32_t x, std::int32_t y) {
    auto& b = begin(op::BLOCK, 0x62);
    b.appendUInt8(part);
    b.appendU35(x);
    b.appendU35(y);
    finish();
}

void Program::arrayStart(std::uint8_t index) {
    begin(op::ARRAY_START).appendUInt8(index);
    finish();
}

void Program::arrayEnd() {
    begin(op::ARRAY_END);
    finish();
}

void Program::refPointSet() {
    begin(op::REF_POINT_SET);
    finish();
}

void Program::elementMaxIndex(std::uint8_t index) {
    begin(op::ELEMENT_MAX, 0x00).appendUInt8(index);
    finish();
}

void Program::elementNameMaxIndex(std::uint8_t index) {
    begin(op::ELEMENT_MAX, 0x01).appendUInt8(index);
    finish();
}

void Program::enableBlockCutting(std::uint8_t enable) {
    begin(op::ELEMENT_MAX, 0x02).appendUInt8(enable);
    finish();
}

void Program::displayOffset(std::int32_t x, std::int32_t y) { coordPair(op::ELEMENT_MAX, 0x03, x, y); }

void Program::feedAutoCalc(std::uint8_t enable) {
    begin(op::ELEMENT_MAX, 0x04).appendUInt8(enable);
    finish();
}

void Program::elementIndex(std::uint8_t index) {
    begin(op::ELEMENT, 0x00).appendUInt8(index);
    finish();
}

void Program::elementNameIndex(std::uint8_t index) {
    begin(op::ELEMENT, 0x01).appendUInt8(index);
    finish();
}

// Names are padded or cut to ten 7-bit characters.
void Program::elementName(std::string_view name) {
    std::string padded(name.substr(0, 10));
    padded.resize(10, '\0');
    begin(op::ELEMENT, 0x02).appendAscii(padded);
    finish();
}

void Program::elementArrayMinPoint(std::int32_t x, std::int32_t y) { coordPair(op::ELEMENT, 0x03, x, y); }
void Program::elementArrayMaxPoint(std::int32_t x, std::int32_t y) { coordPair(op::ELEMENT, 0x04, x, y); }
void Program::elementArray(const std::int32_t (&values)[7]) { sevenValues(op::ELEMENT, 0x05, values); }
void Program::elementArrayAdd(std::int32_t x, std::int32_t y) { coordPair(op::ELEMENT, 0x06, x, y); }

void Program::elementArrayMirror(std::uint8_t mirror) {
    begin(op::ELEMENT, 0x07).appendUInt8(mirror);
    finish();
}

// Interface panel ------------------------------------------------------------

void Program::interfaceKey(std::uint8_t keyCode, bool pressed) {
    begin(op::INTERFACE, pressed ? sub::KEY_DOWN : sub::KEY_UP).appendUInt8(keyCode);
    finish();
}

void Program::interfaceFrame() {
    begin(op::INTERFACE, 0x53).appendUInt8(0x00);
    finish();
}

} // namespace ruida::protocol
