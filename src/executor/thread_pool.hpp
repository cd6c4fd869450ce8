/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for fire-and-forget jobs.
 * @author Dimitris Kafetzis
 *
 * Backs the upload dispatcher when a concurrency cap is configured.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace bundle_forwarder {

/**
 * @brief Fixed set of workers draining a shared job queue.
 *
 * Jobs receive the worker's stop_token. The destructor finishes the jobs
 * already queued before the workers exit.
 */
class ThreadPool {
public:
    using Job = std::function<void(std::stop_token)>;

    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a job. Returns false once shutdown has begun.
    bool submit(Job job);

    /// Block until the queue is empty and no job is running.
    void wait_idle();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable idle_cv_;
    std::atomic<size_t> active_jobs_{0};
    bool shutting_down_ = false;
};

}  // namespace bundle_forwarder
