/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace bundle_forwarder {

/**
 * @brief Local holding area and rollover policy.
 */
struct BufferConfig {
    std::filesystem::path default_directory{std::string{kDefaultBufferDirectory}};
    std::string base_name{kDefaultBaseName};
    uint64_t max_file_size_bytes = kDefaultMaxFileSize;
    uint32_t roll_over_interval_s = 300;
    uint32_t tick_interval_ms = 1000;
    std::string timestamp_format{kDefaultTimestampFormat};
    uint32_t record_queue_capacity = 4096;
};

struct UploadConfig {
    std::string backend = "mirror";     ///< "mirror", "tcp"
    std::string connection;             ///< [localDirectory:]backendSuffix
    uint32_t max_concurrent = 0;        ///< 0 = one thread per upload, no cap
};

struct NetworkConfig {
    uint32_t connect_timeout_ms = 5000;
    uint32_t io_timeout_ms = 30000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    uint32_t status_interval_s = 60;    ///< 0 disables periodic statistics
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    BufferConfig buffer;
    UploadConfig upload;
    NetworkConfig network;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. The result is validated.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the output cannot run with.
 */
Result<void> validate_config(const Config& config);

}  // namespace bundle_forwarder
