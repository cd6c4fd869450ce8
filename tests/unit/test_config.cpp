/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace bundle_forwarder;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "bf_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.buffer.default_directory, "/var/cb/data/event-forwarder");
    EXPECT_EQ(config.buffer.base_name, "event-forwarder");
    EXPECT_EQ(config.buffer.max_file_size_bytes, 10u * 1024 * 1024);
    EXPECT_EQ(config.buffer.roll_over_interval_s, 300u);
    EXPECT_EQ(config.buffer.tick_interval_ms, 1000u);
    EXPECT_EQ(config.upload.backend, "mirror");
    EXPECT_EQ(config.upload.max_concurrent, 0u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [buffer]
        default_directory = "/srv/spool"
        base_name = "events"
        max_file_size_bytes = 4096
        roll_over_interval_s = 30
        tick_interval_ms = 250
        timestamp_format = ".%Y%m%d%H%M%S"
        record_queue_capacity = 16

        [upload]
        backend = "tcp"
        connection = "/srv/spool:collector.local:7070"
        max_concurrent = 4

        [network]
        connect_timeout_ms = 1000
        io_timeout_ms = 2000

        [telemetry]
        log_dir = "/tmp/bf_logs"
        max_file_size_mb = 8
        rotate_count = 3
        log_level = "debug"
        status_interval_s = 10
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.buffer.default_directory, "/srv/spool");
    EXPECT_EQ(config.buffer.base_name, "events");
    EXPECT_EQ(config.buffer.max_file_size_bytes, 4096u);
    EXPECT_EQ(config.buffer.roll_over_interval_s, 30u);
    EXPECT_EQ(config.buffer.tick_interval_ms, 250u);
    EXPECT_EQ(config.buffer.timestamp_format, ".%Y%m%d%H%M%S");
    EXPECT_EQ(config.buffer.record_queue_capacity, 16u);
    EXPECT_EQ(config.upload.backend, "tcp");
    EXPECT_EQ(config.upload.connection, "/srv/spool:collector.local:7070");
    EXPECT_EQ(config.upload.max_concurrent, 4u);
    EXPECT_EQ(config.network.connect_timeout_ms, 1000u);
    EXPECT_EQ(config.network.io_timeout_ms, 2000u);
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/bf_logs");
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.status_interval_s, 10u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [upload]
        connection = "/tmp/buf:/tmp/mirror"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->upload.connection, "/tmp/buf:/tmp/mirror");
    // Defaults for everything else
    EXPECT_EQ(result->upload.backend, "mirror");
    EXPECT_EQ(result->buffer.base_name, "event-forwarder");
    EXPECT_EQ(result->buffer.max_file_size_bytes, 10u * 1024 * 1024);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, RejectsUnknownBackend) {
    auto path = write_toml(R"(
        [upload]
        backend = "carrier-pigeon"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("carrier-pigeon"), std::string::npos);
}

TEST_F(ConfigTest, RejectsZeroMaxFileSize) {
    auto config = default_config();
    config.buffer.max_file_size_bytes = 0;
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsBaseNameWithSlash) {
    auto config = default_config();
    config.buffer.base_name = "sub/events";
    EXPECT_FALSE(validate_config(config).has_value());

    config.buffer.base_name.clear();
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    auto config = default_config();
    config.telemetry.log_level = "chatty";
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::Config);
}
