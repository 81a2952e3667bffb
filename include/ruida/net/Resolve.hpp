#pragma once
#include "ruida/net/NetConfig.hpp"
#include <string>

namespace ruida::net {

/**
 * resolve
 *
 * Synchronous lookup of a controller address. Given `host` (name or dotted
 * quad) and `port` it returns the first IPv4 endpoint.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    unsigned short port,
    udp::endpoint& out)
{
    error_code ec;
    udp::resolver r(io);
    auto results = r.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec) return ec;
    if (results.empty()) return asio::error::host_not_found;
    out = results.begin()->endpoint();
    return {};
}

} // namespace ruida::net
