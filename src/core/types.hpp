/**
 * @file types.hpp
 * @brief Fundamental types used throughout BundleForwarder.
 * @author Dimitris Kafetzis
 *
 * Defines the clock vocabulary, the upload outcome exchanged between the
 * dispatcher and BundledOutput, and the on-disk naming defaults.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace bundle_forwarder {

// ─────────────────────────────────────────────
// Clock Types
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// On-disk Defaults
// ─────────────────────────────────────────────

inline constexpr std::string_view kDefaultBufferDirectory = "/var/cb/data/event-forwarder";
inline constexpr std::string_view kDefaultBaseName = "event-forwarder";
inline constexpr std::string_view kDefaultTimestampFormat = "%Y-%m-%dT%H:%M:%S";
inline constexpr uint64_t kDefaultMaxFileSize = 10ULL * 1024 * 1024;

// ─────────────────────────────────────────────
// Upload Outcome
// ─────────────────────────────────────────────

/**
 * @brief Result of one upload attempt for one bundle.
 *
 * Produced exactly once per dispatch and consumed exactly once by the
 * BundledOutput. An empty error means the bundle was delivered.
 */
struct UploadOutcome {
    std::filesystem::path path;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    static UploadOutcome success(std::filesystem::path p) {
        return UploadOutcome{std::move(p), std::nullopt};
    }

    static UploadOutcome failure(std::filesystem::path p, Error err) {
        return UploadOutcome{std::move(p), std::move(err)};
    }
};

// ─────────────────────────────────────────────
// Time Formatting
// ─────────────────────────────────────────────

/// strftime() rendering of @p ts in UTC.
[[nodiscard]] std::string format_utc(Timestamp ts, std::string_view format);

/// ISO 8601 with millisecond precision, e.g. 2026-01-02T03:04:05.678Z.
[[nodiscard]] std::string to_iso8601(Timestamp ts);

}  // namespace bundle_forwarder
