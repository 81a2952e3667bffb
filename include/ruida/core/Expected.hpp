// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. The default error type is
// std::error_code; protocol-level failures live in ruida_category() below.
// Command decoding uses the richer protocol::DecodeError instead.

#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace ruida {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

namespace core {

/// Failures specific to the Ruida link. Transport timeouts are not listed:
/// they surface as asio::error::timed_out (compare with std::errc::timed_out).
enum class Errc {
    not_connected = 1,
    not_responding,
    queue_full,
    checksum_mismatch,
    transport_closed,
};

const std::error_category& ruida_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), ruida_category()};
}

inline bool isTimeout(const std::error_code& ec) noexcept {
    return ec == std::errc::timed_out;
}

} // namespace core
} // namespace ruida

namespace std {
template <>
struct is_error_code_enum<ruida::core::Errc> : true_type {};
} // namespace std
