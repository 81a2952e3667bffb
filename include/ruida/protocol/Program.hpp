#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include "ruida/core/ByteBuffer.hpp"
#include "ruida/core/Expected.hpp"
#include "ruida/protocol/Codec.hpp"

namespace ruida::protocol {

/**
 * @brief Ordered list of commands making up a job, plus one builder method
 *        per protocol operation.
 *
 * Coordinates are device micrometres, power is percent, speed is mm/s and
 * time is milliseconds.
 *
 * When constructed with a sink, each built command is swizzled and handed to
 * the sink immediately instead of being buffered (realtime single commands).
 */
class Program {
public:
    using CommandSink = std::function<void(const Bytes& swizzled)>;

    explicit Program(std::uint8_t magic = 0x88);
    Program(std::uint8_t magic, CommandSink sink);

    const Codec& codec() const { return codec_; }
    const std::vector<Command>& commands() const { return commands_; }
    bool empty() const { return commands_.empty(); }
    void clear();

    /// Total bytes over all buffered commands.
    std::size_t byteSize() const;

    /// Plain bytes of commands [first, last).
    Bytes contents(std::size_t first = 0,
                   std::size_t last = std::numeric_limits<std::size_t>::max()) const;

    /// Sum of all plain bytes mod 65536.
    std::uint16_t checksum() const;

    /// Splits at command boundaries into runs of at most @p budget bytes.
    /// A single command longer than the budget travels alone.
    std::vector<Bytes> chunk(std::size_t budget) const;

    /// Laser 1 power settings below 10% (may not fire a CO2 tube) or above
    /// 70% (shortens tube life).
    bool lowPowerWarning() const;
    bool highPowerWarning() const;

    /// Appends one already-built plain command.
    void writeCommand(Command command);

    /**
     * @brief Unswizzles a captured blob and appends its commands.
     *
     * With no magic given, the key is inferred from the counts of 0x89 and
     * 0x12 (zero under 0x88 and 0x11); with too few of either the current
     * key is kept.
     */
    void writeBlob(const std::uint8_t* data, std::size_t size,
                   std::optional<std::uint8_t> magic = std::nullopt);

    // Motion ----------------------------------------------------------------
    void moveAbsXY(std::int32_t x, std::int32_t y);
    void moveRelXY(std::int32_t dx, std::int32_t dy);
    void moveRelX(std::int32_t dx);
    void moveRelY(std::int32_t dy);
    void cutAbsXY(std::int32_t x, std::int32_t y);
    void cutRelXY(std::int32_t dx, std::int32_t dy);
    void cutRelX(std::int32_t dx);
    void cutRelY(std::int32_t dy);

    /// Travel to (x, y) from (x - dx, y - dy) using the shortest encoding.
    void jump(std::int32_t x, std::int32_t y, std::int32_t dx, std::int32_t dy);
    /// Cut to (x, y) from (x - dx, y - dy) using the shortest encoding.
    void mark(std::int32_t x, std::int32_t y, std::int32_t dx, std::int32_t dy);

    /// jump/mark from the last position this program moved to.
    void moveTo(std::int32_t x, std::int32_t y);
    void cutTo(std::int32_t x, std::int32_t y);
    std::optional<std::pair<std::int32_t, std::int32_t>> lastPosition() const { return last_; }

    void axisXMove(std::int32_t x);
    void axisYMove(std::int32_t y);
    void axisZMove(std::int32_t z);
    void axisUMove(std::int32_t u);

    /// D9 rapid family; @p options 0 origin, 1 light/origin, 2 none, 3 light.
    void rapidMoveX(std::int32_t x, std::uint8_t options = 0x02);
    void rapidMoveY(std::int32_t y, std::uint8_t options = 0x02);
    void rapidMoveZ(std::int32_t z, std::uint8_t options = 0x02);
    void rapidMoveU(std::int32_t u, std::uint8_t options = 0x02);
    void rapidMoveXY(std::int32_t x, std::int32_t y, std::uint8_t options = 0x02);
    void rapidMoveXYU(std::int32_t x, std::int32_t y, std::int32_t u, std::uint8_t options = 0x02);

    // Power (percent) -------------------------------------------------------
    void immediatePower(int laser, double percent);
    void endPower(int laser, double percent);
    void minPower(int laser, double percent);
    void maxPower(int laser, double percent);
    void minPowerPart(int laser, std::uint8_t part, double percent);
    void maxPowerPart(int laser, std::uint8_t part, double percent);
    void throughPower(int laser, double percent);
    void frequencyPart(std::uint8_t laser, std::uint8_t part, std::uint64_t hz);

    // Timing (ms) -----------------------------------------------------------
    void laserInterval(double ms);
    void addDelay(double ms);
    void laserOnDelay(double ms);
    void laserOffDelay(double ms);

    // Speed (mm/s) ----------------------------------------------------------
    void speedLaser1(double mmPerSecond);
    void speedAxis(double mmPerSecond);
    void speedLaser1Part(std::uint8_t part, double mmPerSecond);
    void forceEngSpeed(double mmPerSecond);
    void speedAxisMove(double mmPerSecond);

    // Layers ----------------------------------------------------------------
    void layerEnd();
    void workMode(std::uint8_t mode);
    void layerNumberPart(std::uint8_t part);
    void enLaserTubeStart();
    void xSignMap(std::uint8_t value);
    void layerColor(std::uint32_t rgb);
    void layerColorPart(std::uint8_t part, std::uint32_t rgb);
    void enExIoStart(std::uint8_t value);
    void maxLayerPart(std::uint8_t part);
    void uFileId(std::uint16_t fileNumber);
    void zuMap(std::uint8_t value);
    void workModePart(std::uint8_t part, std::uint8_t mode);
    void airAssist(bool on);

    // Tokens ----------------------------------------------------------------
    void ack();
    void err();
    void keepAlive();

    // Process ---------------------------------------------------------------
    void endOfFile();
    void startProcess();
    void stopProcess();
    void pauseProcess();
    void restoreProcess();
    void refPointMode2();
    void refPointMode1();
    void refPointMode0();
    void homeZ();
    void homeU();
    void homeXY();
    void focusZ();

    // Memory ----------------------------------------------------------------
    void getSetting(std::uint16_t address);
    void setSetting(std::uint16_t address, std::int64_t value0, std::int64_t value1);

    // Documents, arrays and elements ----------------------------------------
    void documentPageNumber(std::uint8_t page);
    void documentDataEnd();
    void setAbsolute();
    void blockEnd();
    void processTopLeft(std::int32_t x, std::int32_t y);
    void processRepeat(const std::int32_t (&values)[7]);
    void arrayDirection(std::uint8_t direction);
    void feedRepeat(std::int64_t v0, std::int64_t v1);
    void processBottomRight(std::int32_t x, std::int32_t y);
    void arrayRepeat(const std::int32_t (&values)[7]);
    void feedLength(std::int64_t length);
    void arrayMinPoint(std::int32_t x, std::int32_t y);
    void arrayMaxPoint(std::int32_t x, std::int32_t y);
    void arrayAdd(std::int32_t x, std::int32_t y);
    void arrayMirror(std::uint8_t mirror);
    void blockXSize(std::int64_t v0, std::int64_t v1);
    void documentMinPoint(std::int32_t x, std::int32_t y);
    void documentMaxPoint(std::int32_t x, std::int32_t y);
    void partMinPoint(std::uint8_t part, std::int32_t x, std::int32_t y);
    void partMaxPoint(std::uint8_t part, std::int32_t x, std::int32_t y);
    void penOffset(std::uint8_t axis, std::int32_t value);
    void layerOffset(std::uint8_t axis, std::int32_t value);
    void setCurrentElementIndex(std::uint8_t index);
    void partMinPointEx(std::uint8_t part, std::int32_t x, std::int32_t y);
    void partMaxPointEx(std::uint8_t part, std::int32_t x, std::int32_t y);
    void arrayStart(std::uint8_t index);
    void arrayEnd();
    void refPointSet();
    void elementMaxIndex(std::uint8_t index);
    void elementNameMaxIndex(std::uint8_t index);
    void enableBlockCutting(std::uint8_t enable);
    void displayOffset(std::int32_t x, std::int32_t y);
    void feedAutoCalc(std::uint8_t enable);
    void elementIndex(std::uint8_t index);
    void elementNameIndex(std::uint8_t index);
    void elementName(std::string_view name);
    void elementArrayMinPoint(std::int32_t x, std::int32_t y);
    void elementArrayMaxPoint(std::int32_t x, std::int32_t y);
    void elementArray(const std::int32_t (&values)[7]);
    void elementArrayAdd(std::int32_t x, std::int32_t y);
    void elementArrayMirror(std::uint8_t mirror);

    // Interface panel -------------------------------------------------------
    void interfaceKey(std::uint8_t keyCode, bool pressed);
    void interfaceFrame();

private:
    core::ByteBuffer& begin(std::uint8_t opcode);
    core::ByteBuffer& begin(std::uint8_t opcode, std::uint8_t selector);
    void finish();

    void coordPair(std::uint8_t opcode, std::uint8_t selector, std::int32_t x, std::int32_t y);
    void sevenValues(std::uint8_t opcode, std::uint8_t selector, const std::int32_t (&values)[7]);
    std::vector<double> laser1Powers() const;

    Codec codec_;
    CommandSink sink_;
    std::vector<Command> commands_;
    core::ByteBuffer scratch_;
    std::optional<std::pair<std::int32_t, std::int32_t>> last_;
};

} // namespace ruida::protocol
