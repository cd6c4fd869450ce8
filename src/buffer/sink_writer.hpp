/**
 * @file sink_writer.hpp
 * @brief Abstract append-only writer owning the live buffer file.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace bundle_forwarder {

/**
 * @brief Owns exactly one live file and turns it into closed bundles.
 *
 * Implementations must be safe to query (statistics, last_rolled_over,
 * current_size) from a status thread while the event loop appends.
 */
class ISinkWriter {
public:
    virtual ~ISinkWriter() = default;

    /// Open (or create) the live file at @p base_path for appending.
    virtual Result<void> initialize(const std::filesystem::path& base_path) = 0;

    virtual Result<void> append(std::string_view message) = 0;

    /**
     * @brief Close the live file, rename it to base_path + strftime suffix
     *        and open a fresh live file.
     * @return Path of the closed bundle.
     */
    virtual Result<std::filesystem::path> roll_over(std::string_view timestamp_format) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual Timestamp last_rolled_over() const = 0;
    [[nodiscard]] virtual uint64_t current_size() const = 0;

    /// JSON object describing the holding area.
    [[nodiscard]] virtual std::string statistics() const = 0;
};

}  // namespace bundle_forwarder
