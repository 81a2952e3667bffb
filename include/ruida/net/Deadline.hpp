#pragma once
#include "ruida/net/NetConfig.hpp"
#include "ruida/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace ruida::net {

/**
 * @brief Block the calling thread on an async operation, bounded by a timer.
 *
 * `start_async(handler)` launches one operation whose completion calls
 * `handler(ec, ...)`. A `steady_timer` on the same executor races it; when the
 * timer wins, `cancel()` aborts the operation and the call returns
 * `asio::error::timed_out`.
 *
 * Both handlers run on the io thread, so they never overlap. `cancel()` runs
 * before the waiter is released, which keeps references it captured from the
 * caller valid. Handlers only touch the shared state, so a late completion
 * after return is harmless.
 *
 * The executor's `io_context` must be running on another thread.
 */
template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct Shared {
        std::mutex m;
        std::condition_variable cv;
        bool finished = false;
        std::error_code result;
    };

    auto shared = std::make_shared<Shared>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto finish = [shared](const std::error_code& ec) {
        {
            std::lock_guard<std::mutex> lock(shared->m);
            if (shared->finished) {
                return;
            }
            shared->result = ec;
            shared->finished = true;
        }
        shared->cv.notify_one();
    };

    start_async([finish, timer](const std::error_code& op_ec, auto&&...) {
        timer->cancel();
        finish(op_ec);
    });

    timer->expires_after(timeout);
    timer->async_wait([shared, finish, cancel, timeout](const std::error_code& timer_ec) {
        if (timer_ec == asio::error::operation_aborted) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(shared->m);
            if (shared->finished) {
                return;
            }
        }
        logDebug("[with_deadline] no completion after ", timeout.count(), "ms\n");
        cancel();
        finish(asio::error::timed_out);
    });

    std::unique_lock<std::mutex> lock(shared->m);
    shared->cv.wait(lock, [&] { return shared->finished; });
    return shared->result;
}

} // namespace ruida::net
