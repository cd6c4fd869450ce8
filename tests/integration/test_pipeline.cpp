/**
 * @file test_pipeline.cpp
 * @brief Integration tests exercising the full record-to-remote pipeline.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/types.hpp"
#include "network/transport.hpp"
#include "output/bundled_output.hpp"
#include "telemetry/json_sink.hpp"
#include "upload/mirror_backend.hpp"
#include "upload/mock_backend.hpp"
#include "upload/tcp_upload_backend.hpp"
#include "upload/upload_codec.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <thread>
#include <vector>

using namespace bundle_forwarder;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 10000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/// Concatenation of every file in @p dir, in name order.
std::string concat_directory(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        auto name = entry.path().filename().string();
        if (entry.is_regular_file() && name.front() != '.') files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    std::string all;
    for (const auto& f : files) all += read_file(f);
    return all;
}

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    std::filesystem::path buf_;
    std::filesystem::path mirror_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "bf_test_pipeline";
        std::filesystem::remove_all(root_);
        buf_ = root_ / "buf";
        mirror_ = root_ / "mirror";
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }

    Config make_config(uint64_t max_file_size) {
        auto config = default_config();
        config.buffer.default_directory = buf_;
        config.buffer.max_file_size_bytes = max_file_size;
        config.buffer.tick_interval_ms = 20;
        config.buffer.record_queue_capacity = 16;
        return config;
    }

    std::unique_ptr<BundledOutput> make_output(Config config,
                                               std::unique_ptr<IUploadBackend> backend) {
        BundledOutput::Options opts;
        opts.config = std::move(config);
        opts.backend = std::move(backend);
        opts.log_sink = std::make_unique<NullSink>();
        opts.log_level = LogLevel::Debug;
        return std::make_unique<BundledOutput>(std::move(opts));
    }

    size_t files_in_buffer() const {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator(buf_)) {
            if (entry.path().filename() != "event-forwarder") ++n;
        }
        return n;
    }
};

// ═══════════════════════════════════════════════
// Mirror Backend
// ═══════════════════════════════════════════════

TEST_F(PipelineTest, RecordsReachMirrorInOrder) {
    auto output = make_output(make_config(256), std::make_unique<MirrorBackend>());
    auto init = output->initialize(buf_.string() + ":" + mirror_.string());
    ASSERT_TRUE(init.has_value()) << init.error().message;

    RecordChannel records(16);
    ASSERT_TRUE(output->run(records, nullptr).has_value());

    std::string expected;
    for (int i = 0; i < 100; ++i) {
        std::string line = R"({"seq":)" + std::to_string(i) + "}\n";
        expected += line;
        ASSERT_TRUE(records.push(line));
    }

    // Flush only once every record has reached a file
    ASSERT_TRUE(eventually([&] {
        return concat_directory(buf_).size() + concat_directory(mirror_).size() == expected.size();
    }));
    output->request_flush();

    // Everything ends up in the mirror and the buffer drains
    ASSERT_TRUE(eventually([&] {
        return output->current_file_size() == 0 && output->pending_uploads() == 0
               && output->uploads_in_flight() == 0 && files_in_buffer() == 0;
    }));
    output->stop();
    output->wait_for_uploads();

    EXPECT_EQ(concat_directory(mirror_), expected);
    auto stats = output->statistics();
    EXPECT_GT(stats.files_uploaded, 1u);
    EXPECT_EQ(stats.upload_errors, 0u);
}

TEST_F(PipelineTest, RestartUploadsBundlesLeftBehind) {
    // First run: the remote is down, bundles accumulate locally
    {
        auto backend = std::make_unique<MockUploadBackend>();
        backend->set_always_fail(true, "remote down");
        auto output = make_output(make_config(64), std::move(backend));
        ASSERT_TRUE(output->initialize(buf_.string() + ":remote").has_value());

        for (int i = 0; i < 5; ++i) {
            ASSERT_TRUE(output->output(std::string(40, static_cast<char>('a' + i))).has_value());
        }
        output->wait_for_uploads();
    }
    ASSERT_EQ(files_in_buffer(), 4u);

    // Second run: mirror is reachable, stragglers go out one per tick
    auto output = make_output(make_config(64), std::make_unique<MirrorBackend>());
    ASSERT_TRUE(output->initialize(buf_.string() + ":" + mirror_.string()).has_value());
    EXPECT_EQ(output->pending_uploads(), 4u);
    EXPECT_EQ(output->current_file_size(), 40u);

    RecordChannel records;
    ASSERT_TRUE(output->run(records, nullptr).has_value());
    ASSERT_TRUE(eventually([&] { return output->statistics().files_uploaded == 4u; }));
    output->stop();

    EXPECT_EQ(files_in_buffer(), 0u);
    EXPECT_EQ(concat_directory(mirror_),
              std::string(40, 'a') + std::string(40, 'b')
              + std::string(40, 'c') + std::string(40, 'd'));
    EXPECT_EQ(read_file(buf_ / "event-forwarder"), std::string(40, 'e'));
}

// ═══════════════════════════════════════════════
// TCP Backend
// ═══════════════════════════════════════════════

TEST_F(PipelineTest, BundlesDeliveredToTcpCollectorAfterOutage) {
    TcpTransport collector;
    if (!collector.listen(0).has_value()) GTEST_SKIP() << "Could not bind";

    std::mutex received_mutex;
    std::vector<UploadRequest> received;
    std::atomic<int> refusals{2};
    collector.serve([&](const std::vector<uint8_t>& frame) {
        if (refusals.fetch_sub(1) > 0) {
            return UploadCodec::encode_response(UploadResponse{false, "warming up"});
        }
        UploadRequest request;
        if (!UploadCodec::decode_request(frame, request)) {
            return UploadCodec::encode_response(UploadResponse{false, "bad frame"});
        }
        std::lock_guard lock(received_mutex);
        received.push_back(std::move(request));
        return UploadCodec::encode_response(UploadResponse{true, {}});
    });
    std::this_thread::sleep_for(50ms);

    auto config = make_config(1 << 20);
    NetworkConfig network;
    network.connect_timeout_ms = 1000;
    network.io_timeout_ms = 2000;
    auto output = make_output(config, std::make_unique<TcpUploadBackend>(network));
    auto init = output->initialize(buf_.string() + ":127.0.0.1:"
                                   + std::to_string(collector.bound_port()));
    ASSERT_TRUE(init.has_value()) << init.error().message;

    RecordChannel records;
    ASSERT_TRUE(output->run(records, nullptr).has_value());
    ASSERT_TRUE(records.push("alpha\n"));
    ASSERT_TRUE(records.push("beta\n"));
    ASSERT_TRUE(eventually([&] { return output->current_file_size() == 11u; }));
    output->request_flush();

    ASSERT_TRUE(eventually([&] { return output->statistics().files_uploaded == 1u; }));
    output->stop();
    collector.stop_serving();

    auto stats = output->statistics();
    EXPECT_EQ(stats.upload_errors, 2u);
    EXPECT_EQ(stats.last_error_text.find("warming up") != std::string::npos, true);
    EXPECT_EQ(files_in_buffer(), 0u);

    std::lock_guard lock(received_mutex);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].bundle_name.rfind("event-forwarder", 0), 0u);
    EXPECT_EQ(std::string(received[0].data.begin(), received[0].data.end()), "alpha\nbeta\n");
}
