#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ruida::core {

/**
 * @brief Append-only byte sink for building protocol commands.
 *
 * Multi-byte values are written as big-endian groups of 7 bits so that no
 * operand byte ever has its top bit set; only opcodes may.
 */
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendBytes(const std::uint8_t* data, std::size_t size);
    void appendAscii(std::string_view text);

    /// Two 7-bit groups (0..16383). Negative values wrap into 14 bits.
    void appendU14(std::int32_t value);

    /// Five 7-bit groups carrying a 32-bit value sign-extended into 35 bits.
    void appendU35(std::int64_t value);

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

    /// Moves the accumulated bytes out and leaves the buffer empty.
    std::vector<std::uint8_t> take();

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace ruida::core
