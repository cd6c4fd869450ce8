/**
 * @file mock_backend.hpp
 * @brief Scriptable upload backend for testing and simulation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "upload/upload_backend.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bundle_forwarder {

/**
 * @brief Records every upload and fails on demand.
 *
 * Outcomes are taken from a script of queued failures first, then from the
 * always-fail switch; everything else succeeds. Uploads can be held at a
 * gate to keep them in flight.
 */
class MockUploadBackend : public IUploadBackend {
public:
    struct Upload {
        std::filesystem::path path;
        std::string contents;
        bool succeeded;
    };

    explicit MockUploadBackend(std::string name = "mock");

    Result<void> initialize(std::string_view descriptor) override;
    UploadOutcome upload(const std::filesystem::path& path, std::istream& file) override;

    [[nodiscard]] std::string statistics() const override;
    [[nodiscard]] std::string key() const override;
    [[nodiscard]] std::string describe() const override;

    // Test helpers: configure outcomes
    void fail_next(size_t count, const std::string& message = "simulated upload failure");
    void set_always_fail(bool fail, const std::string& message = "simulated upload failure");
    void set_init_error(std::optional<std::string> message);
    void hold_uploads(bool hold);

    // Test helpers: inspect what happened
    [[nodiscard]] std::vector<Upload> uploads() const;
    [[nodiscard]] size_t upload_count() const;
    [[nodiscard]] const std::string& descriptor() const noexcept { return descriptor_; }

    /// Wait until at least @p count uploads have finished.
    bool wait_for_uploads(size_t count, std::chrono::milliseconds timeout) const;

private:
    std::string name_;
    std::string descriptor_;
    std::optional<std::string> init_error_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::deque<std::string> scripted_failures_;
    std::optional<std::string> always_fail_;
    bool held_ = false;
    std::vector<Upload> uploads_;
};

}  // namespace bundle_forwarder
