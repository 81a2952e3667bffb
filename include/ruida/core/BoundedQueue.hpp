#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace ruida::core {

/**
 * @brief Fixed-capacity blocking FIFO shared by producer threads and one consumer.
 *
 * Both ends wait with a timeout so callers can re-check shutdown flags;
 * `close()` wakes every waiter and makes further pushes fail.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

    /// Returns false if the queue stayed full for @p timeout or was closed.
    bool push(T value, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        if (!notFull_.wait_for(lock, timeout, [this] { return closed_ || items_.size() < capacity_; })) {
            return false;
        }
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    /// Non-blocking push used to prime the queue from the consumer thread.
    bool tryPush(T value) {
        return push(std::move(value), std::chrono::milliseconds{0});
    }

    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        if (!notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
            return std::nullopt;
        }
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        if (items_.empty()) {
            drained_.notify_all();
        }
        notFull_.notify_one();
        return value;
    }

    /// Blocks until the queue is empty or @p timeout passes.
    bool waitEmpty(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return drained_.wait_for(lock, timeout, [this] { return closed_ || items_.empty(); });
    }

    void clear() {
        std::lock_guard lock(mutex_);
        items_.clear();
        drained_.notify_all();
        notFull_.notify_all();
    }

    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
        drained_.notify_all();
    }

    void reopen() {
        std::lock_guard lock(mutex_);
        closed_ = false;
    }

    /// Wakes a blocked consumer without adding an item.
    void notify() {
        notEmpty_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::condition_variable drained_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace ruida::core
