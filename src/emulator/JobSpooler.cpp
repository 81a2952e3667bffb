#include "ruida/emulator/JobSpooler.hpp"

#include "ruida/log/Log.hpp"

#include <algorithm>

namespace ruida::emulator {

JobSpooler::JobSpooler(Executor executor)
: core::Worker("JobSpooler")
, executor_(std::move(executor)) {}

JobSpooler::~JobSpooler() {
    stop();
}

bool JobSpooler::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (std::find(jobs_.begin(), jobs_.end(), job) != jobs_.end()) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    work_.notify_one();
    return true;
}

std::size_t JobSpooler::pending() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

bool JobSpooler::busy() const {
    std::lock_guard lock(mutex_);
    return executing_ || !jobs_.empty();
}

bool JobSpooler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return !executing_ && jobs_.empty(); });
}

void JobSpooler::clear() {
    {
        std::lock_guard lock(mutex_);
        if (!jobs_.empty()) {
            logInfo("[JobSpooler] dropped ", jobs_.size(), " queued job(s)\n");
        }
        jobs_.clear();
    }
    idle_.notify_all();
}

void JobSpooler::wake() {
    {
        std::lock_guard lock(mutex_);
    }
    work_.notify_all();
}

void JobSpooler::run() {
    while (running) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            work_.wait(lock, [this] { return !running || !jobs_.empty(); });
            if (!running) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            executing_ = true;
        }

        executor_(job);

        {
            std::lock_guard lock(mutex_);
            executing_ = false;
        }
        idle_.notify_all();
    }
}

} // namespace ruida::emulator
