#include "ruida/protocol/Codec.hpp"

#include <algorithm>
#include <cmath>

namespace ruida::protocol {

std::array<std::uint8_t, 2> encode14(std::uint32_t value) noexcept {
    return {
        static_cast<std::uint8_t>((value >> 7) & 0x7Fu),
        static_cast<std::uint8_t>(value & 0x7Fu),
    };
}

std::array<std::uint8_t, 5> encode35(std::int64_t value) noexcept {
    const auto v = static_cast<std::uint64_t>(value);
    return {
        static_cast<std::uint8_t>((v >> 28) & 0x7Fu),
        static_cast<std::uint8_t>((v >> 21) & 0x7Fu),
        static_cast<std::uint8_t>((v >> 14) & 0x7Fu),
        static_cast<std::uint8_t>((v >> 7) & 0x7Fu),
        static_cast<std::uint8_t>(v & 0x7Fu),
    };
}

std::uint32_t decodeU14(const std::uint8_t* groups) noexcept {
    return (static_cast<std::uint32_t>(groups[0] & 0x7Fu) << 7)
         | static_cast<std::uint32_t>(groups[1] & 0x7Fu);
}

std::int32_t decode14(const std::uint8_t* groups) noexcept {
    const auto raw = static_cast<std::int32_t>(decodeU14(groups));
    return raw > 0x1FFF ? raw - 0x4000 : raw;
}

std::uint64_t decodeU35(const std::uint8_t* groups) noexcept {
    return (static_cast<std::uint64_t>(groups[0] & 0x7Fu) << 28)
         | (static_cast<std::uint64_t>(groups[1] & 0x7Fu) << 21)
         | (static_cast<std::uint64_t>(groups[2] & 0x7Fu) << 14)
         | (static_cast<std::uint64_t>(groups[3] & 0x7Fu) << 7)
         | static_cast<std::uint64_t>(groups[4] & 0x7Fu);
}

std::int64_t decode35(const std::uint8_t* groups) noexcept {
    const auto raw = static_cast<std::int64_t>(decodeU35(groups));
    return raw > 0x3FFFFFFFFLL ? raw - 0x800000000LL : raw;
}

std::int32_t decode32(const std::uint8_t* groups) noexcept {
    const auto low = static_cast<std::uint32_t>(decodeU35(groups) & 0xFFFFFFFFu);
    return static_cast<std::int32_t>(low);
}

std::uint32_t encodePower(double percent) noexcept {
    const double clamped = std::clamp(percent, 0.0, 100.0);
    return static_cast<std::uint32_t>(std::lround(clamped * static_cast<double>(U14_MAX) / 100.0));
}

double decodePower(const std::uint8_t* groups) noexcept {
    return static_cast<double>(decodeU14(groups)) / 163.84;
}

std::int64_t encodeSpeed(double mmPerSecond) noexcept {
    return static_cast<std::int64_t>(std::llround(mmPerSecond * 1000.0));
}

double decodeSpeed(const std::uint8_t* groups) noexcept {
    return static_cast<double>(decode35(groups)) / 1000.0;
}

std::int64_t encodeTime(double milliseconds) noexcept {
    return static_cast<std::int64_t>(std::llround(milliseconds * 1000.0));
}

double decodeTime(const std::uint8_t* groups) noexcept {
    return static_cast<double>(decodeU35(groups)) / 1000.0;
}

std::uint64_t decodeFrequency(const std::uint8_t* groups) noexcept {
    return decodeU35(groups);
}

namespace {

inline std::uint8_t swapEndBits(std::uint8_t b) noexcept {
    const std::uint8_t low = b & 0x01u;
    const std::uint8_t high = (b >> 7) & 0x01u;
    return static_cast<std::uint8_t>((b & 0x7Eu) | (low << 7) | high);
}

} // namespace

std::uint8_t swizzleByte(std::uint8_t b, std::uint8_t magic) noexcept {
    b = swapEndBits(b);
    b ^= magic;
    return static_cast<std::uint8_t>(b + 1u);
}

std::uint8_t unswizzleByte(std::uint8_t b, std::uint8_t magic) noexcept {
    b = static_cast<std::uint8_t>(b - 1u);
    b ^= magic;
    return swapEndBits(b);
}

Codec::Codec(std::uint8_t magic)
: magic_(magic) {
    for (int i = 0; i < 256; ++i) {
        const auto b = static_cast<std::uint8_t>(i);
        forward_[b] = swizzleByte(b, magic_);
        inverse_[b] = unswizzleByte(b, magic_);
    }
}

Bytes Codec::swizzle(const std::uint8_t* data, std::size_t size) const {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = forward_[data[i]];
    }
    return out;
}

Bytes Codec::unswizzle(const std::uint8_t* data, std::size_t size) const {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = inverse_[data[i]];
    }
    return out;
}

std::uint16_t checksum(const std::uint8_t* data, std::size_t size) noexcept {
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < size; ++i) {
        sum += data[i];
    }
    return static_cast<std::uint16_t>(sum & 0xFFFFu);
}

Bytes frame(const Codec& codec, const Bytes& plain, ChecksumBasis basis) {
    Bytes swizzled = codec.swizzle(plain);
    const std::uint16_t sum = basis == ChecksumBasis::Plain
        ? checksum(plain.data(), plain.size())
        : checksum(swizzled.data(), swizzled.size());

    Bytes packet;
    packet.reserve(CHECKSUM_SIZE + swizzled.size());
    packet.push_back(static_cast<std::uint8_t>(sum >> 8));
    packet.push_back(static_cast<std::uint8_t>(sum & 0xFFu));
    packet.insert(packet.end(), swizzled.begin(), swizzled.end());
    return packet;
}

expected<Bytes> unframe(const Codec& codec, const std::uint8_t* packet, std::size_t size,
                        ChecksumBasis basis) {
    if (!packet || size < CHECKSUM_SIZE) {
        return unexpected(core::make_error_code(core::Errc::checksum_mismatch));
    }
    const std::uint16_t expectedSum =
        static_cast<std::uint16_t>((packet[0] << 8) | packet[1]);
    const std::uint8_t* body = packet + CHECKSUM_SIZE;
    const std::size_t bodySize = size - CHECKSUM_SIZE;

    Bytes plain = codec.unswizzle(body, bodySize);
    const std::uint16_t actualSum = basis == ChecksumBasis::Plain
        ? checksum(plain.data(), plain.size())
        : checksum(body, bodySize);
    if (actualSum != expectedSum) {
        return unexpected(core::make_error_code(core::Errc::checksum_mismatch));
    }
    return plain;
}

std::vector<Command> splitCommands(const std::uint8_t* data, std::size_t size) {
    std::vector<Command> commands;
    Command current;
    for (std::size_t i = 0; i < size; ++i) {
        const std::uint8_t b = data[i];
        if (b >= 0x80u && !current.empty()) {
            commands.push_back(std::move(current));
            current.clear();
        }
        current.push_back(b);
    }
    if (!current.empty()) {
        commands.push_back(std::move(current));
    }
    return commands;
}

Bytes joinCommands(const std::vector<Command>& commands) {
    Bytes out;
    for (const auto& command : commands) {
        out.insert(out.end(), command.begin(), command.end());
    }
    return out;
}

std::optional<std::uint8_t> detectMagic(const std::uint8_t* swizzled, std::size_t size) {
    if (!swizzled || size == 0) {
        return std::nullopt;
    }
    std::array<std::size_t, 256> histogram{};
    for (std::size_t i = 0; i < size; ++i) {
        ++histogram[swizzled[i]];
    }
    const auto mode = static_cast<std::uint8_t>(
        std::max_element(histogram.begin(), histogram.end()) - histogram.begin());
    return static_cast<std::uint8_t>(mode - 1u);
}

} // namespace ruida::protocol
