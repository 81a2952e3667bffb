#include "ruida/net/NetService.hpp"
#include "ruida/log/Log.hpp"

#include <exception>

namespace ruida::net {

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, workGuard_(asio::make_work_guard(*io_))
, thread_([this] { run(); }) {}

NetService::~NetService() {
    workGuard_.reset();
    io_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    logDebug("[NetService] io thread stopped\n");
}

void NetService::run() {
    logDebug("[NetService] io thread started\n");
    // A throwing handler unwinds out of run(); report it and keep serving the
    // remaining sockets. run() may be re-entered directly after an exception.
    for (;;) {
        try {
            io_->run();
            return;
        } catch (const std::exception& e) {
            logError("[NetService] handler failed: ", e.what(), "\n");
        }
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    static NetService service;
    return service.io();
}

} // namespace ruida::net
