#include "TestHarness.hpp"

#include "ruida/core/Driver.hpp"
#include "ruida/protocol/Interpreter.hpp"
#include "ruida/protocol/Opcodes.hpp"
#include "ruida/protocol/Program.hpp"

#include <vector>

using namespace ruida;
using namespace ruida::protocol;

namespace {

struct RecordingDriver : core::Driver {
    std::vector<core::PlotCut> plots;
    int plotStarts = 0;
    int homes = 0;
    int resets = 0;
    std::vector<std::pair<core::Axis, std::int32_t>> moves;
    std::vector<int> jogs;

    void plot(const core::PlotCut& cut) override { plots.push_back(cut); }
    void plotStart() override { ++plotStarts; }
    void home() override { ++homes; }
    void reset() override { ++resets; }
    void moveAbs(core::Axis axis, std::int32_t um) override { moves.emplace_back(axis, um); }
    void jog(core::Axis, int direction, bool pressed) override { jogs.push_back(pressed ? direction : 0); }
};

int run(Interpreter& interp, const Program& program) {
    int failures = 0;
    for (const auto& command : program.commands()) {
        if (!interp.process(command)) {
            ++failures;
        }
    }
    return failures;
}

} // namespace

static void testContiguousCutsFormOnePlot() {
    RecordingDriver driver;
    Interpreter interp(&driver);
    Program program;
    program.speedLaser1(100.0);
    program.minPower(1, 40.0);
    program.moveAbsXY(1000, 2000);
    program.cutAbsXY(3000, 2000);
    program.cutRelY(500);
    program.cutRelXY(-100, -100);
    program.moveRelX(100);

    ASSERT_EQ(run(interp, program), 0, "all commands decode");
    ASSERT_EQ(driver.plots.size(), static_cast<std::size_t>(1), "travel closed one plot");
    const auto& cut = driver.plots[0];
    ASSERT_EQ(cut.points.size(), static_cast<std::size_t>(4), "start vertex plus three cuts");
    ASSERT_EQ(cut.points[0].x, 1000, "starts where the head was");
    ASSERT_EQ(cut.points[0].y, 2000, "start y");
    ASSERT_NEAR(cut.points[0].power, 0.0, 1e-9, "start vertex has no power");
    ASSERT_EQ(cut.points[1].x, 3000, "absolute cut");
    ASSERT_EQ(cut.points[2].y, 2500, "relative y cut");
    ASSERT_EQ(cut.points[3].x, 2900, "relative xy cut x");
    ASSERT_EQ(cut.points[3].y, 2400, "relative xy cut y");
    ASSERT_NEAR(cut.points[1].power, 40.0, 0.01, "cut power from the min power setting");
    ASSERT_NEAR(cut.settings.speed, 100.0, 1e-9, "speed recorded");

    ASSERT_EQ(interp.state().x, 3000, "cursor x after travel");
    ASSERT_EQ(interp.state().y, 2400, "cursor y after travel");
    ASSERT_TRUE(!interp.openCut(), "nothing left open");
}

static void testSettingChangeSplitsPlot() {
    RecordingDriver driver;
    Interpreter interp(&driver);
    Program program;
    program.minPower(1, 30.0);
    program.moveAbsXY(0, 0);
    program.cutAbsXY(1000, 0);
    program.speedLaser1(50.0);
    program.cutAbsXY(2000, 0);
    program.layerColor(0xFF0000);
    program.cutAbsXY(3000, 0);
    program.axisZMove(100);
    program.cutAbsXY(4000, 0);
    program.blockEnd();

    ASSERT_EQ(run(interp, program), 0, "all commands decode");
    ASSERT_EQ(driver.plots.size(), static_cast<std::size_t>(4), "speed, colour and Z each split");
    ASSERT_EQ(driver.plots[1].points.front().x, 1000, "second plot continues from the first");
    ASSERT_NEAR(driver.plots[1].settings.speed, 50.0, 1e-9, "second plot speed");
    ASSERT_EQ(driver.plots[2].settings.color, static_cast<std::uint32_t>(0xFF0000), "third plot colour");
}

static void testZeroPowerCutIsTravel() {
    RecordingDriver driver;
    Interpreter interp(&driver);
    Program program;
    program.moveAbsXY(0, 0);
    program.cutAbsXY(1000, 1000);
    program.endOfFile();

    ASSERT_EQ(run(interp, program), 0, "all commands decode");
    ASSERT_TRUE(driver.plots.empty(), "nothing plotted without power");
    ASSERT_EQ(driver.plotStarts, 1, "end of file starts the plot");
    ASSERT_EQ(interp.state().x, 1000, "cursor still moves");

    RecordingDriver powered;
    Interpreter withDefault(&powered, 25.0);
    ASSERT_EQ(run(withDefault, program), 0, "decodes again");
    ASSERT_EQ(powered.plots.size(), static_cast<std::size_t>(1), "default power cuts");
    ASSERT_NEAR(powered.plots[0].points.back().power, 25.0, 1e-9, "default power used");
}

static void testProcessControl() {
    RecordingDriver driver;
    Interpreter interp(&driver);
    Program program;
    program.moveAbsXY(5000, 5000);
    program.homeXY();
    program.stopProcess();
    ASSERT_EQ(run(interp, program), 0, "all commands decode");
    ASSERT_EQ(driver.homes, 2, "home xy and stop both home");
    ASSERT_EQ(driver.resets, 1, "stop resets");
    ASSERT_EQ(interp.state().x, 0, "home clears x");

    Program z;
    z.rapidMoveZ(300);
    ASSERT_EQ(run(interp, z), 0, "rapid z decodes");
    ASSERT_EQ(driver.moves.size(), static_cast<std::size_t>(1), "one axis move");
    ASSERT_TRUE(!driver.moves.empty() && driver.moves[0].first == core::Axis::Z
                && driver.moves[0].second == 300, "z moved to 300");
}

static void testInterfaceKeys() {
    RecordingDriver driver;
    Interpreter interp(&driver);
    auto down = interp.process(Command{op::INTERFACE, sub::KEY_DOWN, key::PLUS_X});
    ASSERT_TRUE(down && down->action == Action::Jog, "+X key jogs");
    ASSERT_TRUE(down && down->axis == core::Axis::X && down->direction == 1 && down->pressed, "jog fields");
    auto up = interp.process(Command{op::INTERFACE, sub::KEY_UP, key::MINUS_Y});
    ASSERT_TRUE(up && !up->pressed && up->direction == -1, "key release");
    ASSERT_EQ(driver.jogs.size(), static_cast<std::size_t>(2), "driver saw both");
}

static void testMemoryCommands() {
    Interpreter interp;
    auto get = interp.process(Command{op::MEMORY, sub::MEM_GET, 0x05, 0x7E});
    ASSERT_TRUE(get && get->action == Action::MemoryGet, "memory get");
    ASSERT_EQ(get ? get->address : 0, static_cast<std::uint16_t>(MEM_CARD_ID), "address decoded");

    Program set;
    set.setSetting(0x0057, 1234, 0);
    auto stored = interp.process(set.commands()[0]);
    ASSERT_TRUE(stored && stored->action == Action::MemorySet, "memory set");
    ASSERT_EQ(stored ? stored->value : 0, static_cast<std::int64_t>(1234), "value decoded");

    auto runInfo = interp.process(Command{op::MEMORY, 0x05});
    ASSERT_TRUE(runInfo && runInfo->action == Action::MemoryQuery, "run info query");
}

static void testDecodeErrors() {
    CursorState state;
    auto empty = decodeCommand(state, Command{});
    ASSERT_TRUE(!empty && empty.error().what == "empty command", "empty");
    auto junk = decodeCommand(state, Command{0x12, 0x34});
    ASSERT_TRUE(!junk && junk.error().what == "not a command", "low opcode");
    auto unknown = decodeCommand(state, Command{0xFF, 0x01});
    ASSERT_TRUE(!unknown && unknown.error().what == "unknown opcode", "unknown opcode");
    ASSERT_TRUE(!unknown || unknown.error().where == "ff01", "hex dump of the command");
    auto shortMove = decodeCommand(state, Command{op::MOVE_ABS_XY, 0x00});
    ASSERT_TRUE(!shortMove, "truncated move");

    Interpreter interp;
    ASSERT_TRUE(interp.process(Command{op::MOVE_ABS_XY, 0, 0, 0, 0, 10, 0, 0, 0, 0, 20}), "absolute move");
    auto bad = interp.process(Command{op::MOVE_REL_X});
    ASSERT_TRUE(!bad, "truncated relative move");
    ASSERT_EQ(interp.state().x, 10, "failed command leaves the cursor alone");
}

static void testRealtimeClassification() {
    ASSERT_TRUE(isRealtime(Command{op::INTERFACE, sub::KEY_DOWN, key::PLUS_X}), "interface");
    ASSERT_TRUE(isRealtime(Command{op::MEMORY, sub::MEM_GET, 0, 0}), "memory");
    ASSERT_TRUE(isRealtime(Command{op::PROCESS, sub::STOP_PROCESS}), "stop");
    ASSERT_TRUE(isRealtime(Command{op::PROCESS, sub::PAUSE_PROCESS}), "pause");
    ASSERT_TRUE(!isRealtime(Command{op::PROCESS, sub::HOME_XY}), "home is spooled");
    ASSERT_TRUE(!isRealtime(Command{op::CUT_REL_X, 0, 1}), "cuts are spooled");
    ASSERT_TRUE(!isRealtime(Command{}), "empty");
}

int main() {
    testContiguousCutsFormOnePlot();
    testSettingChangeSplitsPlot();
    testZeroPowerCutIsTravel();
    testProcessControl();
    testInterfaceKeys();
    testMemoryCommands();
    testDecodeErrors();
    testRealtimeClassification();
    return finish("Interpreter");
}
