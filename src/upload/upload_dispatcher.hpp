/**
 * @file upload_dispatcher.hpp
 * @brief Fire-and-forget upload tasks, one per bundle.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "upload/upload_backend.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace bundle_forwarder {

/**
 * @brief Runs upload_one() for each dispatched bundle off the event loop.
 *
 * With max_concurrent == 0 every dispatch gets its own thread and nothing
 * caps the number in flight; otherwise a ThreadPool of that size queues the
 * excess. The destructor waits for every task that has started.
 */
class UploadDispatcher {
public:
    using OutcomeHandler = std::function<void(UploadOutcome)>;
    /// Starts one upload thread; may throw std::system_error like std::jthread.
    using ThreadLauncher = std::function<std::jthread(std::function<void()>)>;

    /**
     * @param launcher Used for unbounded fan-out; null = construct a std::jthread.
     */
    UploadDispatcher(IUploadBackend& backend,
                     Logger& logger,
                     OutcomeHandler on_outcome,
                     size_t max_concurrent = 0,
                     ThreadLauncher launcher = nullptr);
    ~UploadDispatcher();

    UploadDispatcher(const UploadDispatcher&) = delete;
    UploadDispatcher& operator=(const UploadDispatcher&) = delete;

    /**
     * @brief Start an asynchronous upload of @p path; its outcome is reported once.
     *
     * If no thread can be started the failure is reported as the outcome.
     */
    void dispatch(std::filesystem::path path);

    /// Block until every dispatched task has reported.
    void wait_idle();

    [[nodiscard]] size_t in_flight() const noexcept { return in_flight_.load(); }

    /**
     * @brief Upload one bundle synchronously.
     *
     * Opens @p path read-only, hands it to @p backend, closes it, and deletes
     * it only if the backend reported success. A failed delete is logged;
     * the outcome stays a success.
     */
    static UploadOutcome upload_one(IUploadBackend& backend,
                                    const std::filesystem::path& path,
                                    Logger& logger);

private:
    void run_task(const std::filesystem::path& path);
    void report_not_started(const std::filesystem::path& path, const std::string& reason);
    void reap_finished_locked();

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    IUploadBackend& backend_;
    Logger& logger_;
    OutcomeHandler on_outcome_;
    ThreadLauncher launcher_;

    std::atomic<size_t> in_flight_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace bundle_forwarder
