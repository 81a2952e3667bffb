#include "TestHarness.hpp"
#include "ScriptedTransport.hpp"

#include "ruida/controller/RuidaController.hpp"
#include "ruida/core/SignalBus.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/Opcodes.hpp"
#include "ruida/protocol/Program.hpp"
#include "ruida/session/Session.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

using namespace ruida;
using namespace std::chrono_literals;
using protocol::Bytes;
using test::ScriptedTransport;

namespace {

config::SessionConfig fastSession() {
    config::SessionConfig cfg;
    cfg.attemptTimeout = 20ms;
    cfg.queuePoll = 10ms;
    cfg.reconnectSleep = 10ms;
    return cfg;
}

config::ControllerConfig fastController() {
    config::ControllerConfig cfg;
    cfg.statusTick = 10ms;
    cfg.normalTimeout = 200ms;
    cfg.grossTimeout = 5000ms;
    return cfg;
}

Bytes memoryFrame(std::uint16_t address, std::int64_t value) {
    const auto mem = protocol::encode14(address);
    const auto groups = protocol::encode35(value);
    Bytes frame{protocol::op::MEMORY, protocol::sub::MEM_SET, mem[0], mem[1]};
    frame.insert(frame.end(), groups.begin(), groups.end());
    return frame;
}

struct Recorder {
    std::mutex mutex;
    std::vector<std::string> events;
    std::vector<controller::PositionChange> positions;
    std::vector<std::string> statuses;

    void attach(core::SignalBus& bus) {
        bus.subscribe(core::topics::SessionEvents, [this](const std::any& payload) {
            std::lock_guard lock(mutex);
            events.push_back(std::any_cast<std::string>(payload));
        });
        bus.subscribe(core::topics::Position, [this](const std::any& payload) {
            std::lock_guard lock(mutex);
            positions.push_back(std::any_cast<controller::PositionChange>(payload));
        });
        bus.subscribe(core::topics::Status, [this](const std::any& payload) {
            std::lock_guard lock(mutex);
            statuses.push_back(std::any_cast<std::string>(payload));
        });
    }

    bool sawEvent(const std::string& event) {
        std::lock_guard lock(mutex);
        return std::find(events.begin(), events.end(), event) != events.end();
    }

    std::size_t positionCount() {
        std::lock_guard lock(mutex);
        return positions.size();
    }
};

struct FixedDriver : core::Driver {
    core::DriverStatus current;
    core::DriverStatus status() const override { return current; }
};

} // namespace

static void testChunkedSend() {
    core::SignalBus bus;
    Recorder rec;
    rec.attach(bus);

    auto owned = std::make_unique<ScriptedTransport>();
    ScriptedTransport* transport = owned.get();
    session::Session session(std::move(owned), fastSession(), &bus);
    session.start();
    ASSERT_TRUE(waitUntil([&] { return session.connected(); }), "connected");

    auto cfg = fastController();
    cfg.chunkBudget = 1000;
    controller::RuidaController controller(session, cfg, &bus);

    protocol::Program program;
    for (int i = 0; i < 500; ++i) {
        protocol::Command command(10, 0x00);
        command[0] = protocol::op::MOVE_REL_XY;
        command[9] = static_cast<std::uint8_t>(i % 100);
        program.writeCommand(command);
    }

    ASSERT_TRUE(controller.send(program).has_value(), "send started");
    ASSERT_TRUE(controller.waitSent(5000ms), "send finished");
    ASSERT_EQ(controller.lastChunkCount(), static_cast<std::size_t>(5), "five chunks");

    Bytes joined;
    std::size_t chunks = 0;
    for (const auto& plain : transport->writes()) {
        if (!plain.empty() && plain[0] == protocol::op::MOVE_REL_XY) {
            ++chunks;
            ASSERT_EQ(plain.size(), static_cast<std::size_t>(1000), "full chunk");
            joined.insert(joined.end(), plain.begin(), plain.end());
        }
    }
    ASSERT_EQ(chunks, static_cast<std::size_t>(5), "five packets on the wire");
    ASSERT_TRUE(joined == program.contents(), "chunks arrive in program order");
    ASSERT_TRUE(rec.sawEvent("Sending File..."), "sending event");
    ASSERT_TRUE(rec.sawEvent("File in 5 chunk(s)"), "chunk count event");
    ASSERT_TRUE(rec.sawEvent("File Sent."), "sent event");
    ASSERT_TRUE(!controller.isSending(), "idle afterwards");
    session.stop();
}

static void testPowerWarningsAfterSend() {
    core::SignalBus bus;
    Recorder rec;
    rec.attach(bus);

    session::Session session(std::make_unique<ScriptedTransport>(), fastSession(), &bus);
    session.start();
    ASSERT_TRUE(waitUntil([&] { return session.connected(); }), "connected");
    controller::RuidaController controller(session, fastController(), &bus);

    protocol::Program program;
    program.minPower(1, 5.0);
    program.maxPower(1, 90.0);
    program.endOfFile();
    ASSERT_TRUE(controller.send(program).has_value(), "send started");
    ASSERT_TRUE(controller.waitSent(5000ms), "send finished");
    ASSERT_TRUE(rec.sawEvent("WARNING: Power less than 10% may not fire CO2."), "low power warning");
    ASSERT_TRUE(rec.sawEvent("WARNING: Power greater than 70% reduces CO2 life."), "high power warning");
    session.stop();
}

static void testReplyDispatch() {
    core::SignalBus bus;
    Recorder rec;
    rec.attach(bus);

    session::Session session(std::make_unique<ScriptedTransport>(), fastSession());
    auto cfg = fastController();
    controller::RuidaController controller(session, cfg, &bus);

    controller.handleReply(memoryFrame(protocol::MEM_CARD_ID, 0x65006500));
    controller.handleReply(memoryFrame(protocol::MEM_BED_SIZE_X, 320000));
    controller.handleReply(memoryFrame(protocol::MEM_BED_SIZE_Y, 220000));
    controller.handleReply(memoryFrame(protocol::MEM_MACHINE_STATUS, protocol::MACHINE_STATUS_MOVING));

    auto status = controller.status();
    ASSERT_EQ(status.cardId, static_cast<std::uint64_t>(0x65006500), "card id");
    ASSERT_NEAR(status.bedWidthMm, 320.0, 1e-9, "bed width mm");
    ASSERT_NEAR(status.bedHeightMm, 220.0, 1e-9, "bed height mm");
    ASSERT_TRUE(status.label == "Moving", "moving label");
    ASSERT_TRUE(!status.idle, "not idle while moving");

    controller.handleReply(memoryFrame(protocol::MEM_CURRENT_X, 100000));
    ASSERT_EQ(rec.positionCount(), static_cast<std::size_t>(0), "x alone does not publish");
    controller.handleReply(memoryFrame(protocol::MEM_CURRENT_Y, 50000));
    ASSERT_EQ(rec.positionCount(), static_cast<std::size_t>(1), "x then y publishes");

    {
        std::lock_guard lock(rec.mutex);
        const auto& change = rec.positions.back();
        ASSERT_NEAR(change.x, (320000.0 - (100000.0 - 50.0)) * cfg.positionScale, 1e-6, "scene x");
        ASSERT_NEAR(change.y, (50000.0 + 50.0) * cfg.positionScale, 1e-6, "scene y");
        ASSERT_TRUE(!rec.statuses.empty() && rec.statuses.back() == "Moving", "status published");
    }

    controller.handleReply(memoryFrame(protocol::MEM_CURRENT_Y, 60000));
    ASSERT_EQ(rec.positionCount(), static_cast<std::size_t>(1), "needs a fresh x too");
    controller.handleReply(memoryFrame(protocol::MEM_CURRENT_X, 90000));
    ASSERT_EQ(rec.positionCount(), static_cast<std::size_t>(2), "second position");
    {
        std::lock_guard lock(rec.mutex);
        ASSERT_NEAR(rec.positions.back().lastX, rec.positions.front().x, 1e-9, "previous position carried");
    }

    controller.handleReply(memoryFrame(protocol::MEM_MACHINE_STATUS, 0));
    ASSERT_TRUE(controller.status().idle, "idle again");
    ASSERT_TRUE(controller.waitIdle(10ms), "wait idle returns at once");

    controller.handleReply(std::nullopt);
    controller.handleReply(Bytes{0xCC});
    ASSERT_EQ(controller.status().nativeX, 90000, "junk replies ignored");
}

static void testStatusPollingRotation() {
    auto owned = std::make_unique<ScriptedTransport>();
    ScriptedTransport* transport = owned.get();
    FixedDriver machine;
    machine.current.x = 12000;
    machine.current.y = 34000;
    transport->memory.setDriver(&machine);

    session::Session session(std::move(owned), fastSession());
    session.start();
    ASSERT_TRUE(waitUntil([&] { return session.connected(); }), "connected");

    controller::RuidaController controller(session, fastController());
    controller.start();
    ASSERT_TRUE(waitUntil([&] { return controller.status().cardId == 0x65006500u; }), "full rotation read");
    controller.stop();

    const auto status = controller.status();
    ASSERT_EQ(status.nativeX, 12000, "x read");
    ASSERT_EQ(status.nativeY, 34000, "y read");
    ASSERT_NEAR(status.bedWidthMm, 320.0, 1e-9, "bed read");

    std::vector<std::uint16_t> reads;
    for (const auto& plain : transport->writes()) {
        if (plain.size() == 4 && plain[0] == protocol::op::MEMORY && plain[1] == protocol::sub::MEM_GET) {
            reads.push_back(static_cast<std::uint16_t>(protocol::decodeU14(&plain[2])));
        }
    }
    const auto& rotation = controller::RuidaController::statusAddresses();
    ASSERT_TRUE(reads.size() >= rotation.size(), "one read per rotation slot");
    ASSERT_TRUE(reads.size() >= rotation.size()
                && std::equal(rotation.begin(), rotation.end(), reads.begin()),
                "reads follow the rotation");
    session.stop();
}

static void testRealtimeCommandsAndMoveWait() {
    auto owned = std::make_unique<ScriptedTransport>();
    ScriptedTransport* transport = owned.get();
    FixedDriver machine;
    machine.current.x = 10000;
    machine.current.y = 20000;
    transport->memory.setDriver(&machine);

    session::Session session(std::move(owned), fastSession());
    session.start();
    ASSERT_TRUE(waitUntil([&] { return session.connected(); }), "connected");
    controller::RuidaController controller(session, fastController());

    ASSERT_TRUE(controller.pause().has_value(), "pause sent");
    ASSERT_TRUE(controller.paused(), "paused flag");
    ASSERT_TRUE(controller.resume().has_value(), "resume sent");
    ASSERT_TRUE(!controller.paused(), "resumed");
    ASSERT_TRUE(controller.abort().has_value(), "abort sent");
    ASSERT_TRUE(session.flush(2000ms), "flushed");
    ASSERT_EQ(transport->countWrites(Bytes{protocol::op::PROCESS, protocol::sub::PAUSE_PROCESS}),
              static_cast<std::size_t>(1), "pause on the wire");
    ASSERT_EQ(transport->countWrites(Bytes{protocol::op::PROCESS, protocol::sub::RESTORE_PROCESS}),
              static_cast<std::size_t>(1), "restore on the wire");
    ASSERT_EQ(transport->countWrites(Bytes{protocol::op::PROCESS, protocol::sub::STOP_PROCESS}),
              static_cast<std::size_t>(1), "stop on the wire");

    ASSERT_TRUE(controller.waitForMove(10000, 20000), "head reported at target");

    controller.grossTimeout();
    ASSERT_EQ(session.tries(), 250, "gross timeout over 20 ms attempts");
    controller.normalTimeout();
    ASSERT_EQ(session.tries(), 10, "normal timeout over 20 ms attempts");
    session.stop();
}

int main() {
    testChunkedSend();
    testPowerWarningsAfterSend();
    testReplyDispatch();
    testStatusPollingRotation();
    testRealtimeCommandsAndMoveWait();
    return finish("RuidaController");
}
