#include "TestHarness.hpp"

#include "ruida/core/Driver.hpp"
#include "ruida/core/SignalBus.hpp"
#include "ruida/emulator/Emulator.hpp"
#include "ruida/emulator/JobSpooler.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/MemoryMap.hpp"
#include "ruida/protocol/Opcodes.hpp"
#include "ruida/protocol/Program.hpp"

#include <algorithm>
#include <any>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

using namespace ruida;
using namespace std::chrono_literals;
using protocol::Bytes;

namespace {

struct RecordingDriver : core::Driver {
    std::mutex mutex;
    std::vector<core::PlotCut> plots;
    std::vector<int> jogs;

    void plot(const core::PlotCut& cut) override {
        std::lock_guard lock(mutex);
        plots.push_back(cut);
    }
    void jog(core::Axis, int direction, bool pressed) override {
        std::lock_guard lock(mutex);
        jogs.push_back(pressed ? direction : 0);
    }
};

struct Replies {
    std::vector<Bytes> wire;
    emulator::Emulator::ReplySink sink() {
        return [this](const Bytes& bytes) { wire.push_back(bytes); };
    }
};

config::EmulatorConfig withPower(double percent) {
    config::EmulatorConfig cfg;
    cfg.defaultPower = percent;
    return cfg;
}

} // namespace

static void testCutBecomesCommittedPlot() {
    RecordingDriver driver;
    core::SignalBus bus;
    std::atomic<int> published{0};
    bus.subscribe(core::topics::PlotCommitted, [&](const std::any&) { ++published; });

    emulator::Emulator emu(withPower(50.0), &driver, &bus);
    emu.start();

    protocol::Program program;
    program.moveAbsXY(1000, 2000);
    program.cutAbsXY(3000, 2000);
    const protocol::Codec codec(0x88);
    const Bytes packet = protocol::frame(codec, program.contents());

    Replies replies;
    emu.checksumWrite(packet.data(), packet.size(), replies.sink());
    ASSERT_EQ(replies.wire.size(), static_cast<std::size_t>(1), "one reply");
    ASSERT_TRUE(!replies.wire.empty() && replies.wire[0] == codec.swizzle(Bytes{protocol::ACK}),
                "swizzled ACK");

    ASSERT_TRUE(emu.waitIdle(2000ms), "job executed");
    ASSERT_TRUE(emu.plotted().empty(), "cut stays open without a closing command");
    const auto open = emu.openCut();
    ASSERT_TRUE(open.has_value(), "open cut");
    if (open) {
        ASSERT_EQ(open->segmentCount(), static_cast<std::size_t>(1), "one segment");
        ASSERT_EQ(open->points[0].x, 1000, "from x");
        ASSERT_EQ(open->points[0].y, 2000, "from y");
        ASSERT_EQ(open->points[1].x, 3000, "to x");
        ASSERT_NEAR(open->points[1].power, 50.0, 1e-9, "configured power");
    }

    emu.commit();
    const auto plotted = emu.plotted();
    ASSERT_EQ(plotted.size(), static_cast<std::size_t>(1), "one committed plot");
    ASSERT_TRUE(!emu.openCut(), "nothing left open");
    ASSERT_EQ(published.load(), 1, "plot published");
    {
        std::lock_guard lock(driver.mutex);
        ASSERT_EQ(driver.plots.size(), static_cast<std::size_t>(1), "driver received the plot");
    }
    ASSERT_EQ(emu.cursor().x, 3000, "cursor at the cut end");
    ASSERT_EQ(emu.driverStatus().x, 3000, "memory position follows");
    emu.stop();
}

static void testPolylineSpansPackets() {
    emulator::Emulator emu(withPower(50.0));
    emu.start();
    const protocol::Codec codec(0x88);

    protocol::Program first;
    first.moveAbsXY(1000, 2000);
    first.cutAbsXY(3000, 2000);
    const Bytes packet1 = protocol::frame(codec, first.contents());

    protocol::Program second;
    second.cutAbsXY(3000, 4000);
    second.endOfFile();
    const Bytes packet2 = protocol::frame(codec, second.contents());

    Replies replies;
    emu.checksumWrite(packet1.data(), packet1.size(), replies.sink());
    ASSERT_TRUE(emu.waitIdle(2000ms), "first packet executed");
    emu.checksumWrite(packet2.data(), packet2.size(), replies.sink());
    ASSERT_TRUE(emu.waitIdle(2000ms), "second packet executed");

    const auto plotted = emu.plotted();
    ASSERT_EQ(plotted.size(), static_cast<std::size_t>(1), "one plot across both packets");
    if (!plotted.empty()) {
        ASSERT_EQ(plotted[0].points.size(), static_cast<std::size_t>(3), "three vertices");
        ASSERT_EQ(plotted[0].points[2].y, 4000, "second packet continues the polyline");
    }
    emu.stop();
}

static void testPublishesPositionStatusAndErrors() {
    core::SignalBus bus;
    std::mutex mutex;
    std::vector<core::PositionChange> positions;
    std::vector<std::string> states;
    std::vector<protocol::DecodeError> errors;
    bus.subscribe(core::topics::Position, [&](const std::any& payload) {
        std::lock_guard lock(mutex);
        positions.push_back(std::any_cast<core::PositionChange>(payload));
    });
    bus.subscribe(core::topics::Status, [&](const std::any& payload) {
        std::lock_guard lock(mutex);
        states.push_back(std::any_cast<std::string>(payload));
    });
    bus.subscribe(core::topics::EmulatorError, [&](const std::any& payload) {
        std::lock_guard lock(mutex);
        errors.push_back(std::any_cast<protocol::DecodeError>(payload));
    });

    emulator::Emulator emu(withPower(50.0), nullptr, &bus);
    emu.start();

    protocol::Program program;
    program.moveAbsXY(1000, 2000);
    program.cutAbsXY(3000, 2000);
    program.endOfFile();
    const protocol::Codec codec(0x88);
    const Bytes packet = protocol::frame(codec, program.contents());
    Replies replies;
    emu.checksumWrite(packet.data(), packet.size(), replies.sink());
    ASSERT_TRUE(emu.waitIdle(2000ms), "job executed");

    {
        std::lock_guard lock(mutex);
        ASSERT_EQ(positions.size(), static_cast<std::size_t>(2), "move and cut each publish");
        if (positions.size() == 2) {
            ASSERT_NEAR(positions[1].lastX, 1000.0, 1e-9, "previous x");
            ASSERT_NEAR(positions[1].x, 3000.0, 1e-9, "new x");
            ASSERT_NEAR(positions[1].y, 2000.0, 1e-9, "new y");
        }
        ASSERT_TRUE(std::find(states.begin(), states.end(), "busy") != states.end(), "busy while executing");
        ASSERT_TRUE(!states.empty() && states.back() == "idle", "idle once drained");
        ASSERT_TRUE(errors.empty(), "no errors yet");
    }

    emu.write(Bytes{protocol::op::MOVE_ABS_XY, 0x00});
    ASSERT_TRUE(emu.waitIdle(2000ms), "bad job executed");
    emu.write(Bytes{protocol::op::MEMORY});
    {
        std::lock_guard lock(mutex);
        ASSERT_EQ(errors.size(), static_cast<std::size_t>(2), "spooled and realtime failures published");
        ASSERT_TRUE(!errors.empty() && errors[0].where == "8800", "failing command named");
    }
    emu.stop();
}

static void testChecksumMismatchIsRefused() {
    emulator::Emulator emu(withPower(50.0));
    emu.start();

    protocol::Program program;
    program.moveAbsXY(0, 0);
    program.cutAbsXY(500, 0);
    const protocol::Codec codec(0x88);
    Bytes packet = protocol::frame(codec, program.contents());
    packet[1] ^= 0x01;

    Replies replies;
    emu.checksumWrite(packet.data(), packet.size(), replies.sink());
    ASSERT_EQ(replies.wire.size(), static_cast<std::size_t>(1), "one reply");
    ASSERT_TRUE(!replies.wire.empty() && replies.wire[0] == codec.swizzle(Bytes{protocol::NAK}),
                "swizzled NAK");
    ASSERT_TRUE(emu.waitIdle(500ms), "nothing queued");
    ASSERT_TRUE(emu.plotted().empty(), "packet dropped");
    emu.stop();
}

static void testMagicSwitchAndMemoryReply() {
    emulator::Emulator emu;
    emu.start();
    ASSERT_EQ(emu.magic(), static_cast<std::uint8_t>(0x88), "default magic");

    const protocol::Codec codec(0x11);
    const Bytes packet = protocol::frame(codec, protocol::memoryGet(protocol::MEM_CARD_ID));

    Replies replies;
    emu.checksumWrite(packet.data(), packet.size(), replies.sink());
    ASSERT_EQ(emu.magic(), static_cast<std::uint8_t>(0x11), "switched by the first byte");
    ASSERT_EQ(replies.wire.size(), static_cast<std::size_t>(2), "ACK then data");
    if (replies.wire.size() == 2) {
        ASSERT_TRUE(codec.unswizzle(replies.wire[0]) == Bytes{protocol::ACK}, "ACK under the new magic");
        auto decoded = protocol::decodeMemoryReply(codec.unswizzle(replies.wire[1]));
        ASSERT_TRUE(decoded && decoded->address == protocol::MEM_CARD_ID, "card id address");
        ASSERT_TRUE(decoded && decoded->value == 0x65006500u, "card id value");
    }

    const protocol::Codec back(0x88);
    const Bytes again = protocol::frame(back, protocol::memoryGet(protocol::MEM_BED_SIZE_X));
    Replies second;
    emu.checksumWrite(again.data(), again.size(), second.sink());
    ASSERT_EQ(emu.magic(), static_cast<std::uint8_t>(0x88), "switched back");
    emu.stop();
}

static void testMemorySetAndQueries() {
    emulator::Emulator emu;
    emu.start();
    const protocol::Codec codec(0x88);

    protocol::Program program;
    program.setSetting(0x0057, 4321, 0);
    program.getSetting(0x0057);
    const Bytes packet = protocol::frame(codec, program.contents());

    Replies replies;
    emu.checksumWrite(packet.data(), packet.size(), replies.sink());
    ASSERT_EQ(replies.wire.size(), static_cast<std::size_t>(2), "ACK plus one memory reply");
    if (replies.wire.size() == 2) {
        auto decoded = protocol::decodeMemoryReply(codec.unswizzle(replies.wire[1]));
        ASSERT_TRUE(decoded && decoded->value == 4321u, "stored value read back");
    }
    ASSERT_EQ(std::get<std::int64_t>(emu.memory().lookup(0x0057).value), static_cast<std::int64_t>(4321),
              "memory holds the value");

    Replies runInfo;
    emu.write(Bytes{protocol::op::MEMORY, 0x05}, runInfo.sink());
    ASSERT_EQ(runInfo.wire.size(), static_cast<std::size_t>(1), "run info answered");
    if (!runInfo.wire.empty()) {
        const Bytes plain = codec.unswizzle(runInfo.wire[0]);
        ASSERT_EQ(plain.size(), static_cast<std::size_t>(22), "header plus twenty zeros");
        ASSERT_EQ(plain[1], static_cast<std::uint8_t>(0x05), "run info selector");
    }

    Replies upload;
    emu.write(Bytes{protocol::op::MEMORY, 0x31, 0x00, 0x01}, upload.sink());
    ASSERT_TRUE(!upload.wire.empty() && codec.unswizzle(upload.wire[0])[1] == 0x31, "upload info answered");
    emu.stop();
}

static void testRealtimePort() {
    RecordingDriver driver;
    emulator::Emulator emu({}, &driver);
    emu.start();
    const protocol::Codec codec(0x88);
    const Bytes jog = codec.swizzle(Bytes{protocol::op::INTERFACE, protocol::sub::KEY_DOWN, protocol::key::PLUS_X});

    Replies replies;
    emu.realtimeWrite(jog.data(), jog.size(), replies.sink());
    ASSERT_EQ(replies.wire.size(), static_cast<std::size_t>(1), "acknowledged");
    ASSERT_TRUE(!replies.wire.empty() && replies.wire[0] == codec.swizzle(Bytes{protocol::ACK}), "swizzled ACK");
    std::lock_guard lock(driver.mutex);
    ASSERT_EQ(driver.jogs.size(), static_cast<std::size_t>(1), "jog executed at once");
    ASSERT_EQ(driver.jogs.empty() ? 0 : driver.jogs[0], 1, "+X pressed");
}

static void testCapturedFileReplay() {
    emulator::Emulator emu(withPower(30.0));
    emu.start();
    protocol::Program program;
    program.speedLaser1(20.0);
    program.moveTo(0, 0);
    program.cutTo(1000, 0);
    program.cutTo(1000, 1000);
    program.moveTo(5000, 5000);
    program.cutTo(6000, 5000);
    program.endOfFile();

    emu.write(program.contents());
    ASSERT_TRUE(emu.waitIdle(2000ms), "replayed");
    const auto plotted = emu.plotted();
    ASSERT_EQ(plotted.size(), static_cast<std::size_t>(2), "travel separates two plots");
    ASSERT_TRUE(plotted.size() == 2 && plotted[0].segmentCount() == 2, "first plot has two segments");
    emu.clearPlotted();
    ASSERT_TRUE(emu.plotted().empty(), "cleared");
}

static void testSpoolerRefusesDuplicates() {
    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> executed{0};

    emulator::JobSpooler spooler([&](const emulator::JobSpooler::Job&) {
        std::unique_lock lock(mutex);
        cv.wait(lock, [&] { return release; });
        ++executed;
    });
    spooler.start();

    const emulator::JobSpooler::Job a{protocol::Command{protocol::op::END_OF_FILE}};
    const emulator::JobSpooler::Job b{protocol::Command{protocol::op::BLOCK, 0x00}};
    ASSERT_TRUE(spooler.submit(a), "first job");
    ASSERT_TRUE(waitUntil([&] { return spooler.pending() == 0 && spooler.busy(); }), "first job executing");
    ASSERT_TRUE(spooler.submit(b), "second job queued");
    ASSERT_TRUE(!spooler.submit(b), "identical queued job refused");
    ASSERT_TRUE(spooler.submit(a), "same as the executing job is fine");
    ASSERT_EQ(spooler.pending(), static_cast<std::size_t>(2), "two waiting");

    {
        std::lock_guard lock(mutex);
        release = true;
    }
    cv.notify_all();
    ASSERT_TRUE(spooler.waitIdle(2000ms), "drained");
    ASSERT_EQ(executed.load(), 3, "three executions");

    spooler.stop();
}

int main() {
    testCutBecomesCommittedPlot();
    testPolylineSpansPackets();
    testPublishesPositionStatusAndErrors();
    testChecksumMismatchIsRefused();
    testMagicSwitchAndMemoryReply();
    testMemorySetAndQueries();
    testRealtimePort();
    testCapturedFileReplay();
    testSpoolerRefusesDuplicates();
    return finish("Emulator");
}
