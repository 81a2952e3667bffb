#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace ruida::core {

/**
 * @brief Base class owning one background thread that runs a virtual loop.
 *
 * Threading model:
 * - `start()` launches a thread that calls the virtual `run()`.
 * - `run()` should check `running` (or `isRunning()`) each iteration and
 *   return promptly once it flips to false.
 * - `stop()` clears the flag, calls `wake()` so blocking waits can observe it,
 *   and joins the thread.
 *
 * Derived classes must call `stop()` from their own destructor so `run()`
 * never executes against a partially destroyed object.
 */
class Worker {
public:
    explicit Worker(std::string name);
    virtual ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// Start the worker thread. No-op if already running.
    void start();

    /// Request the thread to stop and wait for it to finish.
    void stop();

    bool isRunning() const { return running.load(); }
    const std::string& name() const { return workerName; }

protected:
    virtual void run() = 0; // the worker loop

    /// Nudge any blocking wait inside run(); called by stop().
    virtual void wake() {}

    std::atomic<bool> running{false};

private:
    std::string workerName;
    std::thread worker;
};

} // namespace ruida::core
