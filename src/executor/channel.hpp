/**
 * @file channel.hpp
 * @brief Blocking MPMC channel with capacity, close and stop_token support.
 * @author Dimitris Kafetzis
 *
 * The event loop multiplexes every source (records, upload outcomes, flush
 * requests) through one Channel, so a single wait covers all of them.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace bundle_forwarder {

/**
 * @brief FIFO queue shared between producer and consumer threads.
 *
 * push() blocks while the channel is at capacity; post() ignores capacity
 * and never blocks. Both fail once the channel is closed. Consumers drain
 * remaining items after close; pop() returns nullopt only when the channel
 * is closed and empty, or the stop token fired.
 */
template <typename T>
class Channel {
public:
    /// @param capacity Maximum items accepted by push(); 0 = unbounded.
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Enqueue, waiting for room. Returns false if closed or stopped.
    bool push(T value, std::stop_token stop = {}) {
        {
            std::unique_lock lock(mutex_);
            bool ready = not_full_.wait(lock, stop, [this] {
                return closed_ || capacity_ == 0 || queue_.size() < capacity_;
            });
            if (!ready || closed_) return false;
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Enqueue regardless of capacity. Returns false if closed.
    bool post(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Dequeue, waiting indefinitely.
    std::optional<T> pop(std::stop_token stop = {}) {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, stop, [this] { return closed_ || !queue_.empty(); });
        return take_locked(lock);
    }

    /// Dequeue, waiting until @p deadline at the latest.
    template <typename Clock, typename Dur>
    std::optional<T> pop_until(std::chrono::time_point<Clock, Dur> deadline,
                               std::stop_token stop = {}) {
        std::unique_lock lock(mutex_);
        not_empty_.wait_until(lock, stop, deadline,
                              [this] { return closed_ || !queue_.empty(); });
        return take_locked(lock);
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked(lock);
    }

    /// Reject further pushes and wake every waiter.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> take_locked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    const size_t capacity_;
    std::deque<T> queue_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
};

}  // namespace bundle_forwarder
