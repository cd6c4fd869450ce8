/**
 * @file test_upload_dispatcher.cpp
 * @brief Unit tests for UploadDispatcher.
 */

#include "telemetry/json_sink.hpp"
#include "upload/mock_backend.hpp"
#include "upload/upload_dispatcher.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

using namespace bundle_forwarder;

namespace {

/// Backend that throws instead of reporting an outcome.
class ThrowingBackend : public IUploadBackend {
public:
    Result<void> initialize(std::string_view) override { return Result<void>{}; }
    UploadOutcome upload(const std::filesystem::path&, std::istream&) override {
        throw std::runtime_error("backend exploded");
    }
    std::string statistics() const override { return "{}"; }
    std::string key() const override { return "throwing"; }
    std::string describe() const override { return "Throwing backend"; }
};

}  // namespace

class UploadDispatcherTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    Logger logger_{std::make_unique<NullSink>()};
    MockUploadBackend backend_;

    std::mutex outcomes_mutex_;
    std::vector<UploadOutcome> outcomes_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "bf_test_dispatcher";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path make_bundle(const std::string& name, const std::string& contents) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path;
    }

    UploadDispatcher::OutcomeHandler collect() {
        return [this](UploadOutcome outcome) {
            std::lock_guard lock(outcomes_mutex_);
            outcomes_.push_back(std::move(outcome));
        };
    }
};

TEST_F(UploadDispatcherTest, UploadOneDeletesOnSuccess) {
    auto path = make_bundle("event-forwarder1", "payload");

    auto outcome = UploadDispatcher::upload_one(backend_, path, logger_);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.path, path);
    EXPECT_FALSE(std::filesystem::exists(path));
    ASSERT_EQ(backend_.uploads().size(), 1u);
    EXPECT_EQ(backend_.uploads()[0].contents, "payload");
}

TEST_F(UploadDispatcherTest, UploadOneKeepsFileOnFailure) {
    auto path = make_bundle("event-forwarder1", "payload");
    backend_.fail_next(1, "remote down");

    auto outcome = UploadDispatcher::upload_one(backend_, path, logger_);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->message, "remote down");
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(UploadDispatcherTest, UploadOneReportsOpenFailure) {
    auto outcome = UploadDispatcher::upload_one(backend_, dir_ / "missing", logger_);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.path, dir_ / "missing");
    EXPECT_EQ(backend_.upload_count(), 0u);
}

TEST_F(UploadDispatcherTest, UploadOneTurnsExceptionIntoFailure) {
    ThrowingBackend throwing;
    auto path = make_bundle("event-forwarder1", "payload");

    auto outcome = UploadDispatcher::upload_one(throwing, path, logger_);

    ASSERT_FALSE(outcome.ok());
    EXPECT_NE(outcome.error->message.find("backend exploded"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(UploadDispatcherTest, EachDispatchReportsExactlyOnce) {
    backend_.fail_next(2);
    {
        UploadDispatcher dispatcher(backend_, logger_, collect());
        for (int i = 0; i < 6; ++i) {
            dispatcher.dispatch(make_bundle("event-forwarder" + std::to_string(i), "x"));
        }
        dispatcher.wait_idle();
        EXPECT_EQ(dispatcher.in_flight(), 0u);
    }

    std::lock_guard lock(outcomes_mutex_);
    ASSERT_EQ(outcomes_.size(), 6u);
    size_t failures = 0;
    for (const auto& outcome : outcomes_) {
        if (!outcome.ok()) {
            ++failures;
            EXPECT_TRUE(std::filesystem::exists(outcome.path));
        } else {
            EXPECT_FALSE(std::filesystem::exists(outcome.path));
        }
    }
    EXPECT_EQ(failures, 2u);
}

TEST_F(UploadDispatcherTest, ThreadStartFailureIsReportedAsOutcome) {
    int launches = 0;
    auto launcher = [&launches](std::function<void()> task) {
        if (++launches == 1) {
            throw std::system_error(
                std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::jthread(std::move(task));
    };

    auto first = make_bundle("event-forwarder1", "one");
    auto second = make_bundle("event-forwarder2", "two");
    {
        UploadDispatcher dispatcher(backend_, logger_, collect(), 0, launcher);

        dispatcher.dispatch(first);
        dispatcher.wait_idle();
        EXPECT_EQ(dispatcher.in_flight(), 0u);
        {
            std::lock_guard lock(outcomes_mutex_);
            ASSERT_EQ(outcomes_.size(), 1u);
            EXPECT_FALSE(outcomes_[0].ok());
            EXPECT_EQ(outcomes_[0].path, first);
            EXPECT_EQ(outcomes_[0].error->code, ErrorCode::Upload);
            EXPECT_NE(outcomes_[0].error->message.find("Cannot start upload thread"),
                      std::string::npos);
        }
        EXPECT_TRUE(std::filesystem::exists(first));
        EXPECT_EQ(backend_.upload_count(), 0u);

        // The next dispatch gets a thread and goes through
        dispatcher.dispatch(second);
        dispatcher.wait_idle();
    }

    std::lock_guard lock(outcomes_mutex_);
    ASSERT_EQ(outcomes_.size(), 2u);
    EXPECT_TRUE(outcomes_[1].ok());
    EXPECT_EQ(outcomes_[1].path, second);
    EXPECT_FALSE(std::filesystem::exists(second));
    EXPECT_EQ(backend_.upload_count(), 1u);
}

TEST_F(UploadDispatcherTest, UnboundedFanOutRunsUploadsConcurrently) {
    backend_.hold_uploads(true);
    UploadDispatcher dispatcher(backend_, logger_, collect());

    for (int i = 0; i < 4; ++i) {
        dispatcher.dispatch(make_bundle("event-forwarder" + std::to_string(i), "x"));
    }
    EXPECT_EQ(dispatcher.in_flight(), 4u);

    backend_.hold_uploads(false);
    dispatcher.wait_idle();
    EXPECT_EQ(backend_.upload_count(), 4u);
}

TEST_F(UploadDispatcherTest, BoundedPoolStillDeliversEverything) {
    UploadDispatcher dispatcher(backend_, logger_, collect(), 2);

    for (int i = 0; i < 10; ++i) {
        dispatcher.dispatch(make_bundle("event-forwarder" + std::to_string(i), "x"));
    }
    dispatcher.wait_idle();

    std::lock_guard lock(outcomes_mutex_);
    EXPECT_EQ(outcomes_.size(), 10u);
    EXPECT_EQ(backend_.upload_count(), 10u);
}
