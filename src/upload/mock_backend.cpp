/**
 * @file mock_backend.cpp
 * @brief MockUploadBackend implementation with scripted outcomes for testing.
 * @author Dimitris Kafetzis
 */

#include "upload/mock_backend.hpp"

#include "core/json.hpp"

#include <iterator>
#include <sstream>

namespace bundle_forwarder {

MockUploadBackend::MockUploadBackend(std::string name)
    : name_(std::move(name)) {}

Result<void> MockUploadBackend::initialize(std::string_view descriptor) {
    descriptor_ = std::string{descriptor};
    if (init_error_) {
        return Error{ErrorCode::Init, *init_error_};
    }
    return Result<void>{};
}

UploadOutcome MockUploadBackend::upload(const std::filesystem::path& path, std::istream& file) {
    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !held_; });

    std::optional<std::string> failure;
    if (!scripted_failures_.empty()) {
        failure = scripted_failures_.front();
        scripted_failures_.pop_front();
    } else if (always_fail_) {
        failure = always_fail_;
    }

    uploads_.push_back(Upload{path, std::move(contents), !failure.has_value()});
    lock.unlock();
    cv_.notify_all();

    if (failure) {
        return UploadOutcome::failure(path, Error{ErrorCode::Upload, *failure});
    }
    return UploadOutcome::success(path);
}

std::string MockUploadBackend::statistics() const {
    std::lock_guard lock(mutex_);
    size_t ok = 0;
    for (const auto& u : uploads_) {
        if (u.succeeded) ++ok;
    }
    std::ostringstream oss;
    oss << R"({"name":)" << json_string(name_)
        << R"(,"attempts":)" << uploads_.size()
        << R"(,"succeeded":)" << ok
        << "}";
    return oss.str();
}

std::string MockUploadBackend::key() const {
    return name_;
}

std::string MockUploadBackend::describe() const {
    return "Mock backend " + name_;
}

void MockUploadBackend::fail_next(size_t count, const std::string& message) {
    std::lock_guard lock(mutex_);
    for (size_t i = 0; i < count; ++i) {
        scripted_failures_.push_back(message);
    }
}

void MockUploadBackend::set_always_fail(bool fail, const std::string& message) {
    std::lock_guard lock(mutex_);
    always_fail_ = fail ? std::optional<std::string>{message} : std::nullopt;
}

void MockUploadBackend::set_init_error(std::optional<std::string> message) {
    init_error_ = std::move(message);
}

void MockUploadBackend::hold_uploads(bool hold) {
    {
        std::lock_guard lock(mutex_);
        held_ = hold;
    }
    cv_.notify_all();
}

std::vector<MockUploadBackend::Upload> MockUploadBackend::uploads() const {
    std::lock_guard lock(mutex_);
    return uploads_;
}

size_t MockUploadBackend::upload_count() const {
    std::lock_guard lock(mutex_);
    return uploads_.size();
}

bool MockUploadBackend::wait_for_uploads(size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return uploads_.size() >= count; });
}

}  // namespace bundle_forwarder
