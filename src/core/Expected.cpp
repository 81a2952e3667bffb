#include "ruida/core/Expected.hpp"

namespace ruida::core {

namespace {

class RuidaCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "ruida"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::not_connected:     return "not connected to the controller";
            case Errc::not_responding:    return "controller not responding";
            case Errc::queue_full:        return "send queue full";
            case Errc::checksum_mismatch: return "packet checksum mismatch";
            case Errc::transport_closed:  return "transport closed";
        }
        return "unknown ruida error";
    }
};

} // namespace

const std::error_category& ruida_category() noexcept {
    static const RuidaCategory category;
    return category;
}

} // namespace ruida::core
