/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>

namespace bundle_forwarder {

/**
 * @brief Why the live file was closed.
 */
enum class RolloverReason : uint8_t {
    Size,
    Interval,
    Flush
};

[[nodiscard]] constexpr std::string_view to_string(RolloverReason reason) noexcept {
    switch (reason) {
        case RolloverReason::Size:     return "size";
        case RolloverReason::Interval: return "interval";
        case RolloverReason::Flush:    return "flush";
    }
    return "unknown";
}

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Called from the event loop and from the daemon's status reporter.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_rollover(const std::filesystem::path& bundle, uint64_t size_bytes,
                         RolloverReason reason);
    void record_upload_outcome(const UploadOutcome& outcome, size_t pending_uploads);
    void record_stragglers(size_t count);
    void record_statistics(std::string_view statistics_json);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace bundle_forwarder
