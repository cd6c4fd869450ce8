/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace bundle_forwarder {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [buffer]
        if (auto buffer = tbl["buffer"]; buffer.is_table()) {
            config.buffer.default_directory = buffer["default_directory"].value_or(
                std::string{kDefaultBufferDirectory});
            config.buffer.base_name = buffer["base_name"].value_or(
                std::string{kDefaultBaseName});
            config.buffer.max_file_size_bytes = static_cast<uint64_t>(
                buffer["max_file_size_bytes"].value_or(
                    static_cast<int64_t>(kDefaultMaxFileSize)));
            config.buffer.roll_over_interval_s = static_cast<uint32_t>(
                buffer["roll_over_interval_s"].value_or(int64_t{300}));
            config.buffer.tick_interval_ms = static_cast<uint32_t>(
                buffer["tick_interval_ms"].value_or(int64_t{1000}));
            config.buffer.timestamp_format = buffer["timestamp_format"].value_or(
                std::string{kDefaultTimestampFormat});
            config.buffer.record_queue_capacity = static_cast<uint32_t>(
                buffer["record_queue_capacity"].value_or(int64_t{4096}));
        }

        // [upload]
        if (auto upload = tbl["upload"]; upload.is_table()) {
            config.upload.backend = upload["backend"].value_or(std::string{"mirror"});
            config.upload.connection = upload["connection"].value_or(std::string{});
            config.upload.max_concurrent = static_cast<uint32_t>(
                upload["max_concurrent"].value_or(int64_t{0}));
        }

        // [network]
        if (auto network = tbl["network"]; network.is_table()) {
            config.network.connect_timeout_ms = static_cast<uint32_t>(
                network["connect_timeout_ms"].value_or(int64_t{5000}));
            config.network.io_timeout_ms = static_cast<uint32_t>(
                network["io_timeout_ms"].value_or(int64_t{30000}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.status_interval_s = static_cast<uint32_t>(
                telemetry["status_interval_s"].value_or(int64_t{60}));
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& buffer = config.buffer;
    if (buffer.base_name.empty()
        || buffer.base_name.find('/') != std::string::npos) {
        return Error{ErrorCode::Config,
                     "buffer.base_name must be a plain, non-empty file name"};
    }
    if (buffer.max_file_size_bytes == 0) {
        return Error{ErrorCode::Config, "buffer.max_file_size_bytes must be positive"};
    }
    if (buffer.tick_interval_ms == 0) {
        return Error{ErrorCode::Config, "buffer.tick_interval_ms must be positive"};
    }
    if (buffer.timestamp_format.empty()) {
        return Error{ErrorCode::Config, "buffer.timestamp_format must not be empty"};
    }
    if (buffer.record_queue_capacity == 0) {
        return Error{ErrorCode::Config, "buffer.record_queue_capacity must be positive"};
    }
    if (config.upload.backend != "mirror" && config.upload.backend != "tcp") {
        return Error{ErrorCode::Config, "Unknown upload backend: " + config.upload.backend};
    }
    if (auto level = parse_log_level(config.telemetry.log_level); !level) {
        return level.error();
    }
    return Result<void>{};
}

}  // namespace bundle_forwarder
