#include "ruida/core/ByteBuffer.hpp"

#include "ruida/protocol/Codec.hpp"

namespace ruida::core {

ByteBuffer::ByteBuffer() {
    buffer.reserve(32); // longest command seen is 18 bytes
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendBytes(const std::uint8_t* data, std::size_t size) {
    buffer.insert(buffer.end(), data, data + size);
}

void ByteBuffer::appendAscii(std::string_view text) {
    for (char c : text) {
        buffer.push_back(static_cast<std::uint8_t>(c) & 0x7Fu);
    }
}

void ByteBuffer::appendU14(std::int32_t value) {
    const auto groups = protocol::encode14(static_cast<std::uint32_t>(value));
    buffer.insert(buffer.end(), groups.begin(), groups.end());
}

void ByteBuffer::appendU35(std::int64_t value) {
    const auto groups = protocol::encode35(value);
    buffer.insert(buffer.end(), groups.begin(), groups.end());
}

std::vector<std::uint8_t> ByteBuffer::take() {
    std::vector<std::uint8_t> out;
    out.swap(buffer);
    buffer.reserve(32);
    return out;
}

} // namespace ruida::core
