/**
 * @file bundled_output.cpp
 * @brief BundledOutput implementation.
 * @author Dimitris Kafetzis
 */

#include "output/bundled_output.hpp"

#include "buffer/file_sink_writer.hpp"
#include "core/json.hpp"
#include "output/straggler_scanner.hpp"
#include "telemetry/json_sink.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>

#include <unistd.h>

namespace bundle_forwarder {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::unique_ptr<ILogSink> or_default(std::unique_ptr<ILogSink> sink,
                                     std::unique_ptr<ILogSink> fallback) {
    return sink ? std::move(sink) : std::move(fallback);
}

}  // namespace

// ─────────────────────────────────────────────
// BundleStatistics
// ─────────────────────────────────────────────

std::string BundleStatistics::to_json() const {
    std::ostringstream oss;
    oss << R"({"files_uploaded":)" << files_uploaded
        << R"(,"upload_errors":)" << upload_errors
        << R"(,"last_error_time":)"
        << (last_error_time ? json_string(to_iso8601(*last_error_time)) : std::string{"null"})
        << R"(,"last_error_text":)" << json_string(last_error_text)
        << R"(,"pending_uploads":)" << pending_uploads
        << R"(,"uploads_in_flight":)" << uploads_in_flight
        << R"(,"current_file_size":)" << current_file_size
        << R"(,"file_holding_area":)" << file_holding_area
        << R"(,"storage_statistics":)" << storage_statistics
        << "}";
    return oss.str();
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

BundledOutput::BundledOutput(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_default(std::move(opts.log_sink), std::make_unique<StdoutSink>()),
              opts.log_level)
    , metrics_(or_default(std::move(opts.metrics_sink), std::make_unique<NullSink>()))
    , backend_(std::move(opts.backend))
    , writer_(opts.writer ? std::move(opts.writer) : std::make_unique<FileSinkWriter>())
    , buffer_dir_(config_.buffer.default_directory)
    , events_(config_.buffer.record_queue_capacity) {
}

BundledOutput::~BundledOutput() {
    stop();
    // Waits for uploads already started; their outcomes are dropped
    dispatcher_.reset();
    writer_->close();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> BundledOutput::initialize(std::string_view connection_string) {
    if (initialized_.load()) {
        return Error{ErrorCode::Init, "Output already initialized: " + key()};
    }

    auto parts = split_connection_string(connection_string);
    if (!parts.local_directory.empty()) {
        buffer_dir_ = parts.local_directory;
    }

    if (!backend_) {
        return Error{ErrorCode::Init, "No upload backend configured"};
    }
    if (auto r = backend_->initialize(connection_string); !r) {
        return r.error().with_context("Backend initialization failed");
    }

    if (auto r = prepare_directory(); !r) {
        return r;
    }

    auto live_path = buffer_dir_ / config_.buffer.base_name;
    if (auto r = writer_->initialize(live_path); !r) {
        return r.error().with_context("Cannot open live file");
    }

    {
        std::unique_lock lock(state_mutex_);
        current_file_size_ = writer_->current_size();
    }

    dispatcher_ = std::make_unique<UploadDispatcher>(
        *backend_, logger_,
        [this](UploadOutcome outcome) {
            auto path = outcome.path;
            if (!events_.post(LoopEvent{std::move(outcome)})) {
                logger_.debug("Event loop closed; outcome for " + path.string() + " dropped");
            }
        },
        config_.upload.max_concurrent);

    recover_stragglers();

    initialized_.store(true);
    logger_.info("Initialized " + describe() + " (live file " + live_path.string() + ", "
                 + std::to_string(current_file_size()) + " bytes)");
    return Result<void>{};
}

Result<void> BundledOutput::prepare_directory() {
    std::error_code ec;
    bool created = std::filesystem::create_directories(buffer_dir_, ec);
    if (ec) {
        return Error{ErrorCode::Init,
                     "Cannot create buffer directory " + buffer_dir_.string() + ": " + ec.message()};
    }
    if (created) {
        std::filesystem::permissions(buffer_dir_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            return Error{ErrorCode::Init, "Cannot restrict permissions on "
                                          + buffer_dir_.string() + ": " + ec.message()};
        }
    }

    if (!std::filesystem::is_directory(buffer_dir_, ec)) {
        return Error{ErrorCode::Init, buffer_dir_.string() + " is not a directory"};
    }
    if (::access(buffer_dir_.c_str(), W_OK | X_OK) != 0) {
        return Error{ErrorCode::Init, "Buffer directory " + buffer_dir_.string()
                                      + " is not writable: " + std::strerror(errno)};
    }
    return Result<void>{};
}

void BundledOutput::recover_stragglers() {
    auto found = find_stragglers(buffer_dir_, config_.buffer.base_name);
    if (!found) {
        logger_.warn("Straggler scan failed: " + found.error().message);
        return;
    }
    if (found->empty()) return;

    {
        std::unique_lock lock(state_mutex_);
        for (auto& path : *found) {
            pending_.push_back(path);
        }
    }
    logger_.info("Queued " + std::to_string(found->size()) + " bundle(s) left from a previous run");
    metrics_.record_stragglers(found->size());
}

Result<void> BundledOutput::run(RecordChannel& messages, ErrorHandler on_error) {
    if (!initialized_.load()) {
        return Error{ErrorCode::Init, "Output is not initialized"};
    }
    if (events_.closed()) {
        return Error{ErrorCode::Init, "Output was stopped and cannot be restarted"};
    }
    if (running_.exchange(true)) {
        return Error{ErrorCode::Init, "Event loop already running"};
    }

    loop_thread_ = std::jthread([this, on_error = std::move(on_error)](std::stop_token stop) {
        event_loop(stop, on_error);
    });
    pump_thread_ = std::jthread([this, &messages](std::stop_token stop) {
        pump_records(messages, stop);
    });
    return Result<void>{};
}

void BundledOutput::stop() {
    // Pump first, so every record it took is queued before the loop drains
    pump_thread_.request_stop();
    if (pump_thread_.joinable()) pump_thread_.join();

    loop_thread_.request_stop();
    if (loop_thread_.joinable()) loop_thread_.join();

    events_.close();
    running_.store(false);
}

void BundledOutput::request_flush() {
    if (flush_pending_.exchange(true)) {
        logger_.debug("Flush already queued");
        return;
    }
    if (!events_.post(LoopEvent{FlushRequest{}})) {
        flush_pending_.store(false);
        logger_.warn("Flush requested after the event loop stopped");
    }
}

// ─────────────────────────────────────────────
// Record Path
// ─────────────────────────────────────────────

Result<void> BundledOutput::output(std::string_view message) {
    if (!initialized_.load()) {
        return Error{ErrorCode::Init, "Output is not initialized"};
    }

    if (current_file_size() + message.size() > config_.buffer.max_file_size_bytes) {
        if (auto r = roll_over(RolloverReason::Size); !r) {
            return r;
        }
    }

    {
        std::unique_lock lock(state_mutex_);
        current_file_size_ += message.size();
    }
    return writer_->append(message);
}

// ─────────────────────────────────────────────
// Loop Steps
// ─────────────────────────────────────────────

Result<void> BundledOutput::roll_over(RolloverReason reason) {
    if (!initialized_.load()) {
        return Error{ErrorCode::Init, "Output is not initialized"};
    }

    auto rolled = writer_->roll_over(config_.buffer.timestamp_format);
    if (!rolled) {
        return rolled.error().with_context("Rollover failed");
    }

    uint64_t size = 0;
    {
        // The bundle counts as in flight from the moment the live file is reset
        std::unique_lock lock(state_mutex_);
        size = current_file_size_;
        current_file_size_ = 0;
        in_flight_.insert(*rolled);
    }

    logger_.info("Rolled over " + rolled->string() + " (" + std::to_string(size)
                 + " bytes, " + std::string{to_string(reason)} + ")");
    metrics_.record_rollover(*rolled, size, reason);

    logger_.debug("Dispatching upload of " + rolled->string());
    dispatcher_->dispatch(*rolled);
    return Result<void>{};
}

Result<void> BundledOutput::on_tick(Timestamp now) {
    auto interval = std::chrono::seconds(config_.buffer.roll_over_interval_s);
    if (now - writer_->last_rolled_over() > interval) {
        if (auto r = roll_over(RolloverReason::Interval); !r) {
            return r;
        }
    }

    std::optional<std::filesystem::path> next;
    bool duplicate = false;
    {
        std::unique_lock lock(state_mutex_);
        if (!pending_.empty()) {
            next = std::move(pending_.front());
            pending_.pop_front();
            duplicate = !in_flight_.insert(*next).second;
        }
    }
    if (!next) return Result<void>{};

    if (duplicate) {
        logger_.warn("Upload of " + next->string() + " already in flight; not dispatching again");
        return Result<void>{};
    }
    logger_.debug("Dispatching upload of " + next->string());
    dispatcher_->dispatch(*next);
    return Result<void>{};
}

void BundledOutput::on_upload_outcome(UploadOutcome outcome) {
    size_t pending = 0;
    {
        std::unique_lock lock(state_mutex_);
        in_flight_.erase(outcome.path);
        if (outcome.ok()) {
            ++files_uploaded_;
        } else {
            ++upload_errors_;
            last_error_time_ = std::chrono::system_clock::now();
            last_error_text_ = outcome.error->message;
            pending_.push_back(outcome.path);
        }
        pending = pending_.size();
    }

    if (outcome.ok()) {
        logger_.info("Uploaded " + outcome.path.string() + " to " + backend_->describe());
    } else {
        logger_.warn("Upload of " + outcome.path.string() + " failed, will retry: "
                     + outcome.error->message);
    }
    metrics_.record_upload_outcome(outcome, pending);
}

Result<void> BundledOutput::on_flush_request() {
    flush_pending_.store(false);
    logger_.info("Forced flush requested");
    return roll_over(RolloverReason::Flush);
}

Result<bool> BundledOutput::poll_event(std::chrono::milliseconds timeout) {
    auto event = events_.pop_until(std::chrono::steady_clock::now() + timeout);
    if (!event) return false;

    if (auto r = handle_event(std::move(*event)); !r) {
        return r.error();
    }
    return true;
}

Result<void> BundledOutput::handle_event(LoopEvent event) {
    return std::visit(Overloaded{
        [this](RecordEvent& record) {
            auto result = output(record.message);
            records_in_hand_.fetch_sub(1);
            return result;
        },
        [this](UploadOutcome& outcome) {
            on_upload_outcome(std::move(outcome));
            return Result<void>{};
        },
        [this](FlushRequest&) { return on_flush_request(); },
    }, event);
}

// ─────────────────────────────────────────────
// Threads
// ─────────────────────────────────────────────

void BundledOutput::pump_records(RecordChannel& messages, std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto record = messages.pop(stop);
        if (!record) {
            if (messages.closed() && messages.size() == 0) input_closed_.store(true);
            break;
        }

        // Not cancellable: a record taken from the producer must reach the loop.
        // Only a loop that has already exited refuses it.
        records_in_hand_.fetch_add(1);
        if (!events_.push(LoopEvent{RecordEvent{std::move(*record)}})) {
            records_in_hand_.fetch_sub(1);
            logger_.warn("Event loop exited with a record still in hand; record not written");
            break;
        }
    }
    logger_.debug("Record pump exiting");
}

void BundledOutput::event_loop(std::stop_token stop, ErrorHandler on_error) {
    const auto tick = std::chrono::milliseconds(config_.buffer.tick_interval_ms);
    auto next_tick = std::chrono::steady_clock::now() + tick;
    std::optional<Error> failure;

    logger_.info("Event loop started for " + key());

    while (!stop.stop_requested()) {
        auto event = events_.pop_until(next_tick, stop);
        if (event) {
            if (auto r = handle_event(std::move(*event)); !r) {
                failure = r.error();
                break;
            }
        } else if (events_.closed()) {
            break;
        }

        // Checked after every event so a busy record stream cannot starve it
        auto now = std::chrono::steady_clock::now();
        if (now >= next_tick) {
            if (auto r = on_tick(std::chrono::system_clock::now()); !r) {
                failure = r.error();
                break;
            }
            next_tick = now + tick;
        }
    }

    // Records the pump handed over before the stop are still appended;
    // outcomes posted from here on are dropped and recovered on restart
    events_.close();
    while (!failure) {
        auto event = events_.try_pop();
        if (!event) break;
        if (auto r = handle_event(std::move(*event)); !r) {
            failure = r.error();
        }
    }

    writer_->close();
    running_.store(false);

    if (failure) {
        logger_.error("Event loop stopped on error: " + failure->message);
        if (on_error) on_error(*failure);
    } else {
        logger_.info("Event loop stopped");
    }
}

// ─────────────────────────────────────────────
// Identity & Statistics
// ─────────────────────────────────────────────

std::string BundledOutput::key() const {
    std::string backend_key = backend_ ? backend_->key() : std::string{"none"};
    return backend_key + ":" + buffer_dir_.string();
}

std::string BundledOutput::describe() const {
    std::string backend_desc = backend_ ? backend_->describe() : std::string{"No backend"};
    return backend_desc + " " + key();
}

BundleStatistics BundledOutput::statistics() const {
    BundleStatistics stats;
    {
        std::shared_lock lock(state_mutex_);
        stats.files_uploaded = files_uploaded_;
        stats.upload_errors = upload_errors_;
        stats.last_error_time = last_error_time_;
        stats.last_error_text = last_error_text_;
        stats.pending_uploads = pending_.size();
        stats.uploads_in_flight = in_flight_.size();
        stats.current_file_size = current_file_size_;
    }
    stats.file_holding_area = writer_->statistics();
    if (backend_) {
        stats.storage_statistics = backend_->statistics();
    }
    return stats;
}

size_t BundledOutput::pending_uploads() const {
    std::shared_lock lock(state_mutex_);
    return pending_.size();
}

size_t BundledOutput::uploads_in_flight() const {
    std::shared_lock lock(state_mutex_);
    return in_flight_.size();
}

uint64_t BundledOutput::current_file_size() const {
    std::shared_lock lock(state_mutex_);
    return current_file_size_;
}

bool BundledOutput::input_drained() const noexcept {
    return input_closed_.load() && records_in_hand_.load() == 0;
}

bool BundledOutput::idle() const {
    if (flush_pending_.load()) return false;
    std::shared_lock lock(state_mutex_);
    return current_file_size_ == 0 && pending_.empty() && in_flight_.empty();
}

void BundledOutput::wait_for_uploads() {
    if (dispatcher_) dispatcher_->wait_idle();
}

}  // namespace bundle_forwarder
