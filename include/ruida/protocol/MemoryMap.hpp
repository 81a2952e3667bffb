#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <variant>

#include "ruida/core/Driver.hpp"
#include "ruida/core/Expected.hpp"
#include "ruida/protocol/Codec.hpp"
#include "ruida/protocol/DecodeError.hpp"

namespace ruida::protocol {

/// Named value at one controller memory address. Most are integers sent as
/// five 7-bit groups; a few (mainboard version) are raw bytes.
struct MemoryEntry {
    std::string name;
    std::variant<std::int64_t, Bytes> value;
};

/**
 * @brief Read-only view of the controller's settings memory.
 *
 * Constant entries come from a static table; machine status and the axis
 * positions are computed from the attached driver on every lookup.
 * Addresses with no known meaning report "Unknown" with value 0.
 */
class MemoryMap {
public:
    explicit MemoryMap(const core::Driver* driver = nullptr);

    void setDriver(const core::Driver* driver);

    MemoryEntry lookup(std::uint16_t address) const;

    /// Stores a value written with a memory-set command; later lookups see it.
    void store(std::uint16_t address, std::int64_t value);

    /// `DA 01 mem(2) value` reply for a memory-get of @p address.
    Bytes reply(std::uint16_t address) const;

private:
    const core::Driver* driver = nullptr;
    mutable std::mutex mutex;
    std::map<std::uint16_t, std::int64_t> written;
};

/// A parsed `DA 01` reply frame.
struct MemoryReply {
    std::uint16_t address = 0;
    std::uint64_t value = 0;
};

expected<MemoryReply, DecodeError> decodeMemoryReply(const Bytes& frame);

/// `DA 00 mem(2)`
Bytes memoryGet(std::uint16_t address);

} // namespace ruida::protocol
