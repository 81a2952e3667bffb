#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "ruida/core/Worker.hpp"
#include "ruida/protocol/Codec.hpp"

namespace ruida::emulator {

/**
 * @brief FIFO of received jobs executed one at a time on a worker thread.
 *
 * A job that is identical to one still waiting in the queue is refused, so a
 * retransmitted packet does not run twice.
 */
class JobSpooler : public core::Worker {
public:
    using Job = std::vector<protocol::Command>;
    using Executor = std::function<void(const Job&)>;

    explicit JobSpooler(Executor executor);
    ~JobSpooler() override;

    /// Returns false when an identical job is already queued.
    bool submit(Job job);

    /// Jobs waiting, not counting the one executing.
    std::size_t pending() const;
    bool busy() const;

    /// Blocks until no job is queued or executing.
    bool waitIdle(std::chrono::milliseconds timeout);

    /// Drops every queued job; the executing one finishes.
    void clear();

protected:
    void run() override;
    void wake() override;

private:
    Executor executor_;
    mutable std::mutex mutex_;
    std::condition_variable work_;
    std::condition_variable idle_;
    std::deque<Job> jobs_;
    bool executing_ = false;
};

} // namespace ruida::emulator
