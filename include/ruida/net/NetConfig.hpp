#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace ruida::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `ruida::net::asio` as the standalone Asio namespace.
 * - `ruida::net::udp` as the protocol alias; the Ruida link is UDP or serial only.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace ruida::net
