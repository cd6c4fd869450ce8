/**
 * @file upload_dispatcher.cpp
 * @brief UploadDispatcher implementation.
 * @author Dimitris Kafetzis
 */

#include "upload/upload_dispatcher.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace bundle_forwarder {

UploadDispatcher::UploadDispatcher(IUploadBackend& backend,
                                   Logger& logger,
                                   OutcomeHandler on_outcome,
                                   size_t max_concurrent,
                                   ThreadLauncher launcher)
    : backend_(backend)
    , logger_(logger)
    , on_outcome_(std::move(on_outcome))
    , launcher_(std::move(launcher)) {
    if (!launcher_) {
        launcher_ = [](std::function<void()> task) { return std::jthread(std::move(task)); };
    }
    if (max_concurrent > 0) {
        pool_ = std::make_unique<ThreadPool>(max_concurrent);
    }
}

UploadDispatcher::~UploadDispatcher() {
    // Pool destructor runs the jobs already queued
    pool_.reset();

    std::list<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

UploadOutcome UploadDispatcher::upload_one(IUploadBackend& backend,
                                           const std::filesystem::path& path,
                                           Logger& logger) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return UploadOutcome::failure(
            path, Error{ErrorCode::Upload,
                        "Cannot open " + path.string() + ": " + std::strerror(errno)});
    }

    UploadOutcome outcome;
    try {
        outcome = backend.upload(path, file);
    } catch (const std::exception& ex) {
        outcome = UploadOutcome::failure(
            path, Error{ErrorCode::Upload, "Backend threw while uploading "
                                           + path.string() + ": " + ex.what()});
    }
    outcome.path = path;
    file.close();

    if (outcome.ok()) {
        std::error_code ec;
        if (!std::filesystem::remove(path, ec) || ec) {
            logger.warn("Uploaded " + path.string() + " but could not remove it: "
                        + (ec ? ec.message() : std::string{"file already gone"}));
        }
    }
    return outcome;
}

void UploadDispatcher::dispatch(std::filesystem::path path) {
    in_flight_.fetch_add(1);

    if (pool_) {
        if (!pool_->submit([this, path](std::stop_token) { run_task(path); })) {
            report_not_started(path, "Dispatcher is shutting down");
        }
        return;
    }

    std::unique_lock lock(workers_mutex_);
    reap_finished_locked();
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        auto thread = launcher_([this, path, done] {
            run_task(path);
            done->store(true);
        });
        workers_.push_back(Worker{std::move(thread), std::move(done)});
    } catch (const std::system_error& err) {
        lock.unlock();
        report_not_started(path, std::string{"Cannot start upload thread: "} + err.what());
    }
}

void UploadDispatcher::report_not_started(const std::filesystem::path& path,
                                          const std::string& reason) {
    logger_.warn("Upload of " + path.string() + " not started: " + reason);
    on_outcome_(UploadOutcome::failure(path, Error{ErrorCode::Upload, reason}));
    {
        std::lock_guard lock(idle_mutex_);
        in_flight_.fetch_sub(1);
    }
    idle_cv_.notify_all();
}

void UploadDispatcher::run_task(const std::filesystem::path& path) {
    on_outcome_(upload_one(backend_, path, logger_));

    {
        std::lock_guard lock(idle_mutex_);
        in_flight_.fetch_sub(1);
    }
    idle_cv_.notify_all();
}

void UploadDispatcher::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void UploadDispatcher::wait_idle() {
    std::unique_lock lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_.load() == 0; });
}

}  // namespace bundle_forwarder
