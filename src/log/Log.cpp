#include "ruida/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace ruida::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<bool> verbose{false};

LogHandler currentInfo() {
    std::lock_guard lock(sinkMutex);
    return infoHandler;
}

LogHandler currentError() {
    std::lock_guard lock(sinkMutex);
    return errorHandler;
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setVerbose(bool enabled) {
    verbose.store(enabled, std::memory_order_relaxed);
}

bool isVerbose() {
    return verbose.load(std::memory_order_relaxed);
}

void logInfo(std::string_view message) {
    if (auto handler = currentInfo()) {
        handler(message);
    }
}

void logWarning(std::string_view message) {
    if (auto handler = currentError()) {
        std::string line = "[warning] ";
        line.append(message);
        handler(line);
    }
}

void logError(std::string_view message) {
    if (auto handler = currentError()) {
        handler(message);
    }
}

void logDebug(std::string_view message) {
    if (!isVerbose()) {
        return;
    }
    if (auto handler = currentInfo()) {
        handler(message);
    }
}

} // namespace ruida::log
