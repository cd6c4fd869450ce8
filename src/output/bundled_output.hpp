/**
 * @file bundled_output.hpp
 * @brief BundledOutput buffers records on disk and ships closed bundles.
 * @author Dimitris Kafetzis
 *
 * Ties the sink writer, the upload dispatcher and the straggler scanner
 * together behind a single-threaded event loop:
 *   1. Records are appended to the live file, rolling it over on size
 *   2. A periodic tick rolls over on age and dispatches one pending bundle
 *   3. Upload outcomes update statistics; failed bundles are requeued
 *   4. request_flush() forces a rollover
 *
 * Every bundle is either live, pending, in flight, or deleted after a
 * successful upload. Nothing is ever dropped on an upload failure.
 */

#pragma once

#include "buffer/sink_writer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/channel.hpp"
#include "telemetry/metrics_collector.hpp"
#include "upload/upload_backend.hpp"
#include "upload/upload_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

namespace bundle_forwarder {

/// Records handed to run(); bounded so a slow disk backpressures producers.
using RecordChannel = Channel<std::string>;

/**
 * @brief Point-in-time view of the output's delivery state.
 */
struct BundleStatistics {
    uint64_t files_uploaded = 0;
    uint64_t upload_errors = 0;
    std::optional<Timestamp> last_error_time;
    std::string last_error_text;
    size_t pending_uploads = 0;
    size_t uploads_in_flight = 0;
    uint64_t current_file_size = 0;
    std::string file_holding_area = "{}";    ///< Sink writer statistics (JSON object)
    std::string storage_statistics = "{}";   ///< Backend statistics (JSON object)

    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief Durable buffering output stage.
 *
 * The loop-step handlers (roll_over, on_tick, on_upload_outcome,
 * on_flush_request, poll_event) are what the event loop runs; they are
 * public so a caller can drive the output step by step without run().
 * They must not be called while run() is active.
 */
class BundledOutput {
public:
    using ErrorHandler = std::function<void(const Error&)>;

    struct Options {
        Config config;
        std::unique_ptr<IUploadBackend> backend;
        std::unique_ptr<ISinkWriter> writer;         ///< null = FileSinkWriter
        std::unique_ptr<ILogSink> log_sink;          ///< null = stdout
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;      ///< null = discard
    };

    explicit BundledOutput(Options opts);
    ~BundledOutput();

    // Non-copyable, non-movable
    BundledOutput(const BundledOutput&) = delete;
    BundledOutput& operator=(const BundledOutput&) = delete;

    // ── Lifecycle ────────────────────────────

    /**
     * @brief Prepare the buffer directory, backend and live file.
     * @param connection_string "[localDirectory:]backendSuffix"
     *
     * Rolled-over files already in the directory are queued for upload.
     */
    Result<void> initialize(std::string_view connection_string);

    /**
     * @brief Start the event loop on a background thread and return.
     *
     * @p messages must outlive the loop. A fatal append or rollover error
     * is passed to @p on_error and ends the loop. An output runs at most
     * once; after stop() it cannot be restarted.
     */
    Result<void> run(RecordChannel& messages, ErrorHandler on_error);

    /**
     * @brief Stop taking records from the producer and shut the loop down.
     *
     * Every record already taken from the channel passed to run() is
     * appended before the loop exits, unless a fatal error ends it first.
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Ask the loop to roll over now. Coalesces with a request already queued.
    void request_flush();

    // ── Record Path ──────────────────────────

    /// Append one record, rolling over first if it would exceed the size limit.
    Result<void> output(std::string_view message);

    // ── Loop Steps ───────────────────────────

    /// Close the live file and dispatch it.
    Result<void> roll_over(RolloverReason reason = RolloverReason::Flush);

    /// Age-based rollover check, then dispatch at most one pending bundle.
    Result<void> on_tick(Timestamp now);

    void on_upload_outcome(UploadOutcome outcome);

    Result<void> on_flush_request();

    /**
     * @brief Handle at most one queued loop event.
     * @return true if an event was handled, false if none arrived in time.
     */
    Result<bool> poll_event(std::chrono::milliseconds timeout);

    // ── Identity & Statistics ────────────────

    /// "<backend key>:<buffer directory>"
    [[nodiscard]] std::string key() const;

    /// "<backend description> <key>"
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] BundleStatistics statistics() const;

    // ── Accessors (for testing) ─────────────
    [[nodiscard]] size_t pending_uploads() const;
    [[nodiscard]] size_t uploads_in_flight() const;
    [[nodiscard]] uint64_t current_file_size() const;

    /// The record channel was closed and every record taken from it has been handled.
    [[nodiscard]] bool input_drained() const noexcept;

    /// Live file empty, no flush queued, nothing pending or in flight.
    [[nodiscard]] bool idle() const;
    [[nodiscard]] const std::filesystem::path& buffer_directory() const noexcept { return buffer_dir_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }

    /// Block until every dispatched upload has reported its outcome.
    void wait_for_uploads();

private:
    struct RecordEvent {
        std::string message;
    };
    struct FlushRequest {};
    using LoopEvent = std::variant<RecordEvent, UploadOutcome, FlushRequest>;

    Result<void> prepare_directory();
    void recover_stragglers();
    Result<void> handle_event(LoopEvent event);

    void pump_records(RecordChannel& messages, std::stop_token stop);
    void event_loop(std::stop_token stop, ErrorHandler on_error);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    std::unique_ptr<IUploadBackend> backend_;
    std::unique_ptr<ISinkWriter> writer_;
    std::filesystem::path buffer_dir_;

    Channel<LoopEvent> events_;
    std::atomic<bool> flush_pending_{false};
    std::atomic<size_t> records_in_hand_{0};   ///< Taken by the pump, not yet appended
    std::atomic<bool> input_closed_{false};

    // Loop-owned state; statistics() reads under the shared side
    mutable std::shared_mutex state_mutex_;
    std::deque<std::filesystem::path> pending_;
    std::set<std::filesystem::path> in_flight_;
    uint64_t current_file_size_ = 0;
    uint64_t files_uploaded_ = 0;
    uint64_t upload_errors_ = 0;
    std::optional<Timestamp> last_error_time_;
    std::string last_error_text_;

    std::unique_ptr<UploadDispatcher> dispatcher_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::jthread pump_thread_;
    std::jthread loop_thread_;
};

}  // namespace bundle_forwarder
