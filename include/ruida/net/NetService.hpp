#pragma once
#include "ruida/net/NetConfig.hpp"
#include <memory>
#include <thread>

namespace ruida::net {

/**
 * @brief Owns the `asio::io_context` every transport completes on.
 *
 * UDP sockets, serial ports, emulator endpoints and deadline timers all post
 * their handlers here while the calling thread blocks in `with_deadline`.
 * A single dedicated thread drives the loop for the life of the process.
 *
 * Transports hold a `shared_ptr` to the context so it outlives their sockets.
 * The destructor releases the work guard, stops the loop and joins the thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    std::shared_ptr<asio::io_context> io() const { return io_; }

private:
    void run();

    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard_;
    std::thread thread_;
};

/// Process-wide context, started on first use.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace ruida::net
