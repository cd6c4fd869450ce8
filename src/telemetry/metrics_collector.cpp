/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include "core/json.hpp"

#include <chrono>
#include <sstream>

namespace bundle_forwarder {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_rollover(const std::filesystem::path& bundle,
                                       uint64_t size_bytes,
                                       RolloverReason reason) {
    std::ostringstream oss;
    oss << R"({"event":"rollover")"
        << R"(,"ts":)" << json_string(to_iso8601(std::chrono::system_clock::now()))
        << R"(,"bundle":)" << json_string(bundle.filename().string())
        << R"(,"size_bytes":)" << size_bytes
        << R"(,"reason":")" << to_string(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_upload_outcome(const UploadOutcome& outcome,
                                             size_t pending_uploads) {
    std::ostringstream oss;
    oss << R"({"event":"upload_outcome")"
        << R"(,"ts":)" << json_string(to_iso8601(std::chrono::system_clock::now()))
        << R"(,"bundle":)" << json_string(outcome.path.filename().string())
        << R"(,"success":)" << (outcome.ok() ? "true" : "false");
    if (!outcome.ok()) {
        oss << R"(,"error":)" << json_string(outcome.error->message);
    }
    oss << R"(,"pending_uploads":)" << pending_uploads
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_stragglers(size_t count) {
    std::ostringstream oss;
    oss << R"({"event":"stragglers_recovered")"
        << R"(,"ts":)" << json_string(to_iso8601(std::chrono::system_clock::now()))
        << R"(,"count":)" << count
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_statistics(std::string_view statistics_json) {
    record_custom("statistics", statistics_json);
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":)" << json_string(event)
        << R"(,"ts":)" << json_string(to_iso8601(std::chrono::system_clock::now()))
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace bundle_forwarder
