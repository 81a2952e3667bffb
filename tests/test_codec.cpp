#include "TestHarness.hpp"

#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/Opcodes.hpp"

#include <array>
#include <cstdint>
#include <vector>

using namespace ruida::protocol;

static void testSwizzleKnownBytes() {
    ASSERT_EQ(swizzleByte(0xDA, 0x88), static_cast<std::uint8_t>(0xD4), "DA under 0x88");
    ASSERT_EQ(swizzleByte(0xDA, 0x11), static_cast<std::uint8_t>(0x4B), "DA under 0x11");
    ASSERT_EQ(swizzleByte(0x00, 0x88), static_cast<std::uint8_t>(0x89), "zero under 0x88");
    ASSERT_EQ(swizzleByte(0x00, 0x11), static_cast<std::uint8_t>(0x12), "zero under 0x11");

    // Captured card id read.
    const Bytes wire{0xD4, 0x89, 0x0D, 0xF7};
    ASSERT_TRUE(Codec(0x88).unswizzle(wire) == Bytes({op::MEMORY, sub::MEM_GET, 0x05, 0x7E}),
                "captured memory get 02fe");
}

static void testCodecTablesInvert() {
    bool ok = true;
    for (int magic = 0; magic < 256; ++magic) {
        Codec codec(static_cast<std::uint8_t>(magic));
        std::array<bool, 256> seen{};
        for (int i = 0; i < 256; ++i) {
            const auto b = static_cast<std::uint8_t>(i);
            const std::uint8_t wire = codec.swizzle(b);
            ok = ok && codec.unswizzle(wire) == b;
            ok = ok && wire == swizzleByte(b, codec.magic());
            ok = ok && unswizzleByte(wire, codec.magic()) == b;
            ok = ok && !seen[wire];
            seen[wire] = true;
        }
    }
    ASSERT_TRUE(ok, "every magic gives an invertible byte permutation");
}

static void testFourteenBitRange() {
    bool ok = true;
    for (std::uint32_t v = 0; v <= U14_MAX; ++v) {
        const auto groups = encode14(v);
        ok = ok && groups[0] <= 0x7F && groups[1] <= 0x7F;
        ok = ok && decodeU14(groups.data()) == v;
        const std::int32_t expected = v > 0x1FFF ? static_cast<std::int32_t>(v) - 0x4000
                                                 : static_cast<std::int32_t>(v);
        ok = ok && decode14(groups.data()) == expected;
    }
    ASSERT_TRUE(ok, "every 14-bit value survives both decoders");
}

static void testSevenBitGroups() {
    const auto max14 = encode14(U14_MAX);
    ASSERT_EQ(max14[0], static_cast<std::uint8_t>(0x7F), "14-bit high group");
    ASSERT_EQ(max14[1], static_cast<std::uint8_t>(0x7F), "14-bit low group");
    ASSERT_EQ(decodeU14(max14.data()), U14_MAX, "unsigned 14-bit");
    ASSERT_EQ(decode14(max14.data()), -1, "signed 14-bit wraps");

    const auto minusTen = encode14(static_cast<std::uint32_t>(-10));
    ASSERT_EQ(decode14(minusTen.data()), -10, "negative relative move");

    const auto coord = encode35(123456);
    ASSERT_EQ(decode32(coord.data()), 123456, "35-bit coordinate");
    const auto negative = encode35(-1);
    ASSERT_EQ(decode32(negative.data()), -1, "negative coordinate folds to 32 bits");
    ASSERT_EQ(decode35(negative.data()), static_cast<std::int64_t>(-1), "signed 35-bit");
    for (auto g : negative) {
        ASSERT_TRUE(g <= 0x7F, "groups stay 7-bit clean");
    }
}

static void testScalings() {
    ASSERT_EQ(encodePower(100.0), U14_MAX, "full power");
    ASSERT_EQ(encodePower(150.0), U14_MAX, "power clamps high");
    ASSERT_EQ(encodePower(-5.0), 0u, "power clamps low");
    const auto half = encode14(encodePower(50.0));
    ASSERT_NEAR(decodePower(half.data()), 50.0, 0.01, "half power");

    const auto speed = encode35(encodeSpeed(25.5));
    ASSERT_NEAR(decodeSpeed(speed.data()), 25.5, 1e-9, "speed mm/s");

    const auto time = encode35(encodeTime(2.25));
    ASSERT_NEAR(decodeTime(time.data()), 2.25, 1e-9, "time ms");
}

static void testFraming() {
    Codec codec(0x88);
    const Bytes plain{op::MEMORY, sub::MEM_GET, 0x05, 0x7E};

    for (auto basis : {ChecksumBasis::Plain, ChecksumBasis::Swizzled}) {
        Bytes packet = frame(codec, plain, basis);
        ASSERT_EQ(packet.size(), plain.size() + CHECKSUM_SIZE, "checksum prefix");
        auto back = unframe(codec, packet.data(), packet.size(), basis);
        ASSERT_TRUE(back && *back == plain, "unframe restores the payload");

        packet.back() ^= 0x01;
        auto corrupt = unframe(codec, packet.data(), packet.size(), basis);
        ASSERT_TRUE(!corrupt, "corrupted payload rejected");
        ASSERT_TRUE(!corrupt && corrupt.error() == ruida::core::Errc::checksum_mismatch,
                    "reported as checksum mismatch");
    }

    const Bytes packet = frame(codec, plain, ChecksumBasis::Plain);
    const std::uint16_t sum = checksum(plain.data(), plain.size());
    ASSERT_EQ(packet[0], static_cast<std::uint8_t>(sum >> 8), "checksum high byte first");
    ASSERT_EQ(packet[1], static_cast<std::uint8_t>(sum & 0xFF), "checksum low byte");

    std::uint8_t tiny = 0;
    ASSERT_TRUE(!unframe(codec, &tiny, 1), "packet shorter than checksum");
}

static void testSplitCommands() {
    const Bytes data{0x05, 0x06, op::MOVE_REL_X, 0x00, 0x10, ACK, op::END_OF_FILE};
    const auto commands = splitCommands(data);
    ASSERT_EQ(commands.size(), static_cast<std::size_t>(4), "leading junk plus three commands");
    ASSERT_TRUE(commands[0] == Bytes({0x05, 0x06}), "leading low bytes kept together");
    ASSERT_TRUE(commands[1] == Bytes({op::MOVE_REL_X, 0x00, 0x10}), "operands stay with opcode");
    ASSERT_TRUE(joinCommands(commands) == data, "join restores the stream");
}

static void testDetectMagic() {
    Bytes plain(200, 0x00);
    plain[0] = op::MOVE_ABS_XY;
    plain[50] = op::CUT_ABS_XY;
    for (int magic : {0x88, 0x11}) {
        Codec codec(static_cast<std::uint8_t>(magic));
        const Bytes wire = codec.swizzle(plain);
        auto found = detectMagic(wire.data(), wire.size());
        ASSERT_TRUE(found && *found == magic, "zero bytes reveal the magic");
    }
    ASSERT_TRUE(!detectMagic(nullptr, 0), "nothing to detect");
}

int main() {
    testSwizzleKnownBytes();
    testCodecTablesInvert();
    testFourteenBitRange();
    testSevenBitGroups();
    testScalings();
    testFraming();
    testSplitCommands();
    testDetectMagic();
    return finish("Codec");
}
