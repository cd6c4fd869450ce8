/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace bundle_forwarder {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        shutting_down_ = true;
    }
    queue_cv_.notify_all();
    // jthreads request stop and join here; workers drain the queue first
    workers_.clear();
}

bool ThreadPool::submit(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (shutting_down_) return false;
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return job_queue_.empty() && active_jobs_.load() == 0;
    });
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return shutting_down_ || !job_queue_.empty(); });

            if (job_queue_.empty()) return;

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++active_jobs_;
        }

        job(stop);

        {
            std::lock_guard lock(queue_mutex_);
            --active_jobs_;
        }
        idle_cv_.notify_all();
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace bundle_forwarder
