#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace ruida::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

/// Debug output (per-command descriptions, packet traces) is dropped unless verbose.
void setVerbose(bool enabled);
bool isVerbose();

void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);
void logDebug(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename First, typename... Rest>
using EnableIfFormatted = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !std::is_convertible<std::decay_t<First>, std::string_view>::value>;

} // namespace detail

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    logWarning(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

// Arguments are only formatted when verbose output is on.
template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!isVerbose()) {
        return;
    }
    logDebug(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

} // namespace ruida::log

namespace ruida {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logWarning;
using log::logError;
using log::logDebug;
} // namespace ruida
