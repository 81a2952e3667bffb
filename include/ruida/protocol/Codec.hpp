// Codec.hpp
// -----------------------------------------------------------------------------
// Pure encoding helpers for the Ruida wire protocol.
//   * 7-bit clean integer groups (14-bit and 35-bit fields).
//   * Fixed-point scalings for power, speed, time and frequency.
//   * The byte swizzle cipher, as a pair of lookup tables owned by a Codec.
//   * Packet checksum framing, command tokenizing and magic-key probing.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "ruida/core/Expected.hpp"

namespace ruida::protocol {

using Bytes = std::vector<std::uint8_t>;

/// One opcode-prefixed command. Byte 0 is >= 0x80, the rest are <= 0x7F.
using Command = std::vector<std::uint8_t>;

// 7-bit groups ---------------------------------------------------------------

constexpr std::uint32_t U14_MAX = 0x3FFF;
constexpr std::int32_t REL14_MIN = -8192;
constexpr std::int32_t REL14_MAX = 8191;

std::array<std::uint8_t, 2> encode14(std::uint32_t value) noexcept;
std::array<std::uint8_t, 5> encode35(std::int64_t value) noexcept;

/// Unsigned 14-bit value from two groups.
std::uint32_t decodeU14(const std::uint8_t* groups) noexcept;
/// Two groups reinterpreted as signed 14-bit (relative moves).
std::int32_t decode14(const std::uint8_t* groups) noexcept;
/// Unsigned 35-bit value from five groups.
std::uint64_t decodeU35(const std::uint8_t* groups) noexcept;
/// Five groups reinterpreted as signed 35-bit.
std::int64_t decode35(const std::uint8_t* groups) noexcept;
/// Five groups reinterpreted as signed 32-bit (coordinates).
std::int32_t decode32(const std::uint8_t* groups) noexcept;

// Fixed-point scalings -------------------------------------------------------

/// Percent (0..100) to 14-bit power units, 16383 == 100%.
std::uint32_t encodePower(double percent) noexcept;
double decodePower(const std::uint8_t* groups) noexcept;

/// mm/s to the 35-bit µm/s field.
std::int64_t encodeSpeed(double mmPerSecond) noexcept;
double decodeSpeed(const std::uint8_t* groups) noexcept;

/// Milliseconds to the 35-bit field (value x 1000).
std::int64_t encodeTime(double milliseconds) noexcept;
double decodeTime(const std::uint8_t* groups) noexcept;

/// Frequency is raw Hz.
std::uint64_t decodeFrequency(const std::uint8_t* groups) noexcept;

// Swizzle --------------------------------------------------------------------

/// Reference form of the cipher: swap bit 0 and bit 7, xor magic, add one.
std::uint8_t swizzleByte(std::uint8_t b, std::uint8_t magic) noexcept;
std::uint8_t unswizzleByte(std::uint8_t b, std::uint8_t magic) noexcept;

/**
 * @brief Swizzle tables for one magic key.
 *
 * Both 256-entry tables are built once in the constructor; a Codec is an
 * immutable value that callers pass around explicitly.
 */
class Codec {
public:
    explicit Codec(std::uint8_t magic = 0x88);

    std::uint8_t magic() const noexcept { return magic_; }

    std::uint8_t swizzle(std::uint8_t b) const noexcept { return forward_[b]; }
    std::uint8_t unswizzle(std::uint8_t b) const noexcept { return inverse_[b]; }

    Bytes swizzle(const std::uint8_t* data, std::size_t size) const;
    Bytes unswizzle(const std::uint8_t* data, std::size_t size) const;
    Bytes swizzle(const Bytes& data) const { return swizzle(data.data(), data.size()); }
    Bytes unswizzle(const Bytes& data) const { return unswizzle(data.data(), data.size()); }

private:
    std::uint8_t magic_;
    std::array<std::uint8_t, 256> forward_{};
    std::array<std::uint8_t, 256> inverse_{};
};

// Checksum framing -----------------------------------------------------------

/// Which bytes the packet checksum sums over.
enum class ChecksumBasis {
    Plain,     ///< unswizzled payload
    Swizzled,  ///< bytes as they appear on the wire
};

constexpr std::size_t CHECKSUM_SIZE = 2;

std::uint16_t checksum(const std::uint8_t* data, std::size_t size) noexcept;

/// [checksum:2 big-endian][swizzled payload]
Bytes frame(const Codec& codec, const Bytes& plain, ChecksumBasis basis = ChecksumBasis::Plain);

/// Validates and strips the checksum, returning the unswizzled payload.
expected<Bytes> unframe(const Codec& codec, const std::uint8_t* packet, std::size_t size,
                        ChecksumBasis basis = ChecksumBasis::Plain);

// Tokenizing -----------------------------------------------------------------

/// Splits at every byte >= 0x80. A leading run of low bytes is kept as its
/// own token so the caller can report it.
std::vector<Command> splitCommands(const std::uint8_t* data, std::size_t size);
inline std::vector<Command> splitCommands(const Bytes& data) {
    return splitCommands(data.data(), data.size());
}

Bytes joinCommands(const std::vector<Command>& commands);

/// Most frequent swizzled byte minus one; zero dominates real job data.
std::optional<std::uint8_t> detectMagic(const std::uint8_t* swizzled, std::size_t size);

} // namespace ruida::protocol
