#pragma once

#include <string>

namespace ruida::protocol {

/**
 * @brief Describes why a command could not be decoded.
 *
 * `where` names the command (hex dump), `what` the problem.
 */
struct DecodeError {
    std::string where;
    std::string what;
};

} // namespace ruida::protocol
