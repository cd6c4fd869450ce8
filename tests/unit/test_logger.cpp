/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and the log sinks.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace bundle_forwarder;

namespace {

/// Keeps every line in memory; shared so the test can read after handing it over.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override {
        lines_->emplace_back(json_line);
    }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    for (std::string line; std::getline(in, line);) ++n;
    return n;
}

}  // namespace

TEST(LoggerTest, EmitsJsonLine) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Debug, "writer");

    logger.info("rolled over \"bundle\"");

    ASSERT_EQ(lines->size(), 1u);
    const auto& line = lines->front();
    EXPECT_EQ(line.rfind(R"({"level":"info","ts":")", 0), 0u);
    EXPECT_NE(line.find(R"("component":"writer")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"rolled over \"bundle\"")"), std::string::npos);
    EXPECT_EQ(line.back(), '}');
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown");
    EXPECT_EQ(lines->size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now shown");
    EXPECT_EQ(lines->size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, ConcurrentWritersProduceWholeLines) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Info);

    std::vector<std::jthread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < 100; ++i) logger.info("entry");
        });
    }
    threads.clear();

    EXPECT_EQ(lines->size(), 400u);
}

TEST(LoggerTest, SeparateStdoutSinksDoNotInterleave) {
    Logger main_logger(std::make_unique<StdoutSink>(), LogLevel::Info, "main");
    Logger output_logger(std::make_unique<StdoutSink>(), LogLevel::Info, "output");

    testing::internal::CaptureStdout();
    {
        std::vector<std::jthread> threads;
        for (Logger* logger : {&main_logger, &output_logger}) {
            threads.emplace_back([logger] {
                for (int i = 0; i < 200; ++i) {
                    logger->info(std::string(64, 'x') + " entry " + std::to_string(i));
                }
            });
        }
    }
    std::string captured = testing::internal::GetCapturedStdout();

    std::istringstream in(captured);
    size_t count = 0;
    for (std::string line; std::getline(in, line); ++count) {
        ASSERT_FALSE(line.empty());
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
    }
    EXPECT_EQ(count, 400u);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(JsonFileSinkTest, RotatesAndKeepsBoundedHistory) {
    auto dir = std::filesystem::temp_directory_path() / "bf_test_json_sink";
    std::filesystem::remove_all(dir);

    {
        // 1 MB limit, three files in total
        JsonFileSink sink(dir, "app", 1, 3);
        std::string line(1000, 'x');
        for (int i = 0; i < 3500; ++i) sink.write(line);
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(dir / "app.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "app.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "app.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir / "app.3.ndjson"));
    EXPECT_GT(count_lines(dir / "app.1.ndjson"), 1000u);

    std::filesystem::remove_all(dir);
}

TEST(JsonFileSinkTest, AppendsToExistingFile) {
    auto dir = std::filesystem::temp_directory_path() / "bf_test_json_sink_append";
    std::filesystem::remove_all(dir);

    {
        JsonFileSink sink(dir, "app");
        sink.write(R"({"n":1})");
    }
    {
        JsonFileSink sink(dir, "app");
        sink.write(R"({"n":2})");
    }

    EXPECT_EQ(count_lines(dir / "app.ndjson"), 2u);
    std::filesystem::remove_all(dir);
}
