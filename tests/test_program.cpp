#include "TestHarness.hpp"

#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/Opcodes.hpp"
#include "ruida/protocol/Program.hpp"

#include <vector>

using namespace ruida::protocol;

static void testChunkingKeepsCommandsWhole() {
    Program program;
    for (int i = 0; i < 500; ++i) {
        Command command(10, 0x00);
        command[0] = op::MOVE_REL_XY;
        command[1] = static_cast<std::uint8_t>(i & 0x7F);
        program.writeCommand(command);
    }
    ASSERT_EQ(program.byteSize(), static_cast<std::size_t>(5000), "program size");

    const auto chunks = program.chunk(1000);
    ASSERT_EQ(chunks.size(), static_cast<std::size_t>(5), "five chunks");
    Bytes joined;
    for (const auto& chunk : chunks) {
        ASSERT_TRUE(chunk.size() <= 1000, "chunk within budget");
        ASSERT_TRUE(!chunk.empty() && chunk[0] >= 0x80, "chunk starts on an opcode");
        joined.insert(joined.end(), chunk.begin(), chunk.end());
    }
    ASSERT_TRUE(joined == program.contents(), "chunks concatenate to the program in order");

    // 7 + 7 exceeds 10, so each command travels alone.
    Program odd;
    odd.writeCommand(Command{op::MOVE_REL_XY, 1, 2, 3, 4, 5, 6});
    odd.writeCommand(Command{op::MOVE_REL_XY, 1, 2, 3, 4, 5, 6});
    odd.writeCommand(Command(12, 0x00));
    ASSERT_EQ(odd.chunk(10).size(), static_cast<std::size_t>(3), "oversize command alone");
}

static void testJumpPicksShortestEncoding() {
    Program program;
    program.moveTo(1000, 1000);
    program.moveTo(1100, 1000);
    program.moveTo(1100, 900);
    program.moveTo(1200, 1100);
    program.moveTo(50000, 1100);
    program.cutTo(50010, 1100);

    const auto& c = program.commands();
    ASSERT_EQ(c.size(), static_cast<std::size_t>(6), "one command per move");
    ASSERT_EQ(c[0][0], op::MOVE_ABS_XY, "first move has no origin");
    ASSERT_EQ(c[0].size(), static_cast<std::size_t>(11), "absolute move size");
    ASSERT_EQ(c[1][0], op::MOVE_REL_X, "x only");
    ASSERT_EQ(decode14(&c[1][1]), 100, "x delta");
    ASSERT_EQ(c[2][0], op::MOVE_REL_Y, "y only");
    ASSERT_EQ(decode14(&c[2][1]), -100, "negative y delta");
    ASSERT_EQ(c[3][0], op::MOVE_REL_XY, "both small");
    ASSERT_EQ(c[4][0], op::MOVE_ABS_XY, "delta too large for 14 bits");
    ASSERT_EQ(decode32(&c[4][1]), 50000, "absolute x");
    ASSERT_EQ(c[5][0], op::CUT_REL_X, "cut reuses the shortest form");

    auto last = program.lastPosition();
    ASSERT_TRUE(last && last->first == 50010 && last->second == 1100, "last position tracked");

    Program same;
    same.jump(10, 10, 0, 0);
    ASSERT_TRUE(same.empty(), "zero-length jump emits nothing");
}

static void testBuilders() {
    Program program;
    program.getSetting(MEM_CARD_ID);
    program.stopProcess();
    program.speedLaser1(100.0);
    program.minPower(1, 50.0);
    program.layerColor(0x00FF00);
    program.endOfFile();

    const auto& c = program.commands();
    ASSERT_TRUE(c[0] == Bytes({op::MEMORY, sub::MEM_GET, 0x05, 0x7E}), "memory get 02FE");
    ASSERT_TRUE(c[1] == Bytes({op::PROCESS, sub::STOP_PROCESS}), "stop process");
    ASSERT_EQ(c[2].size(), static_cast<std::size_t>(7), "speed command size");
    ASSERT_NEAR(decodeSpeed(&c[2][2]), 100.0, 1e-9, "speed value");
    ASSERT_NEAR(decodePower(&c[3][2]), 50.0, 0.01, "min power value");
    ASSERT_EQ(decodeU35(&c[4][2]), static_cast<std::uint64_t>(0x00FF00), "layer colour");
    ASSERT_TRUE(c[5] == Bytes({op::END_OF_FILE}), "end of file");

    for (const auto& command : c) {
        bool clean = true;
        for (std::size_t i = 1; i < command.size(); ++i) {
            clean = clean && command[i] <= 0x7F;
        }
        ASSERT_TRUE(clean, "operands are 7-bit clean");
    }
}

static void testSinkSendsImmediately() {
    std::vector<Bytes> sent;
    Program realtime(0x88, [&](const Bytes& swizzled) { sent.push_back(swizzled); });
    realtime.pauseProcess();
    ASSERT_TRUE(realtime.empty(), "nothing buffered");
    ASSERT_EQ(sent.size(), static_cast<std::size_t>(1), "one command delivered");
    ASSERT_TRUE(Codec(0x88).unswizzle(sent[0]) == Bytes({op::PROCESS, sub::PAUSE_PROCESS}),
                "delivered swizzled");
}

static void testWriteBlobDetectsMagic() {
    Program source(0x11);
    for (int i = 0; i < 10; ++i) {
        source.moveAbsXY(i, 0);
    }
    const Bytes wire = source.codec().swizzle(source.contents());

    Program loaded;
    loaded.writeBlob(wire.data(), wire.size());
    ASSERT_EQ(loaded.codec().magic(), static_cast<std::uint8_t>(0x11), "magic inferred from zeros");
    ASSERT_TRUE(loaded.commands() == source.commands(), "commands recovered");

    Program forced;
    forced.writeBlob(wire.data(), wire.size(), std::uint8_t{0x88});
    ASSERT_EQ(forced.codec().magic(), static_cast<std::uint8_t>(0x88), "explicit magic wins");
}

static void testPowerWarnings() {
    Program low;
    low.minPower(1, 5.0);
    ASSERT_TRUE(low.lowPowerWarning(), "5% warns low");
    ASSERT_TRUE(!low.highPowerWarning(), "5% not high");

    Program high;
    high.maxPowerPart(1, 0, 80.0);
    ASSERT_TRUE(high.highPowerWarning(), "80% warns high");

    Program normal;
    normal.minPower(1, 30.0);
    normal.maxPower(1, 60.0);
    normal.minPower(2, 5.0);
    ASSERT_TRUE(!normal.lowPowerWarning() && !normal.highPowerWarning(), "laser 2 ignored");
}

int main() {
    testChunkingKeepsCommandsWhole();
    testJumpPicksShortestEncoding();
    testBuilders();
    testSinkSendsImmediately();
    testWriteBlobDetectsMagic();
    testPowerWarnings();
    return finish("Program");
}
