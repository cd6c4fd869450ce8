/**
 * @file mirror_backend.cpp
 * @brief MirrorBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "upload/mirror_backend.hpp"

#include "core/json.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace bundle_forwarder {

Result<void> MirrorBackend::initialize(std::string_view descriptor) {
    auto parts = split_connection_string(descriptor);
    if (parts.suffix.empty()) {
        return Error{ErrorCode::Config,
                     "Mirror backend needs a destination directory in \""
                     + std::string{descriptor} + "\""};
    }
    mirror_dir_ = parts.suffix;

    std::error_code ec;
    std::filesystem::create_directories(mirror_dir_, ec);
    if (ec) {
        return Error{ErrorCode::Init,
                     "Cannot create mirror directory " + mirror_dir_.string() + ": " + ec.message()};
    }
    if (::access(mirror_dir_.c_str(), W_OK) != 0) {
        return Error{ErrorCode::Init, "Mirror directory is not writable: " + mirror_dir_.string()};
    }
    return Result<void>{};
}

Result<uint64_t> MirrorBackend::copy_into_place(const std::filesystem::path& path,
                                                std::istream& file) {
    auto name = path.filename().string();
    auto target = mirror_dir_ / name;
    auto partial = mirror_dir_ / ("." + name + ".partial");

    uint64_t copied = 0;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::Upload, "Cannot create " + partial.string()};
        }

        std::array<char, 64 * 1024> buf{};
        while (file.read(buf.data(), static_cast<std::streamsize>(buf.size())) || file.gcount() > 0) {
            out.write(buf.data(), file.gcount());
            copied += static_cast<uint64_t>(file.gcount());
            if (!out) break;
        }

        if (file.bad() || !out.flush()) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(partial, ec);
            return Error{ErrorCode::Upload, "Copy of " + path.string() + " to " + partial.string() + " failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        return Error{ErrorCode::Upload,
                     "Cannot move bundle into " + target.string() + ": " + ec.message()};
    }
    return copied;
}

UploadOutcome MirrorBackend::upload(const std::filesystem::path& path, std::istream& file) {
    auto copied = copy_into_place(path, file);

    std::lock_guard lock(stats_mutex_);
    if (!copied) {
        ++failures_;
        return UploadOutcome::failure(path, copied.error());
    }
    ++files_stored_;
    bytes_stored_ += *copied;
    last_stored_ = std::chrono::system_clock::now();
    return UploadOutcome::success(path);
}

std::string MirrorBackend::statistics() const {
    std::lock_guard lock(stats_mutex_);
    std::ostringstream oss;
    oss << R"({"mirror_directory":)" << json_string(mirror_dir_.string())
        << R"(,"files_stored":)" << files_stored_
        << R"(,"bytes_stored":)" << bytes_stored_
        << R"(,"failures":)" << failures_
        << R"(,"last_stored":)"
        << (last_stored_ ? json_string(to_iso8601(*last_stored_)) : std::string{"null"})
        << "}";
    return oss.str();
}

std::string MirrorBackend::key() const {
    return "mirror:" + mirror_dir_.string();
}

std::string MirrorBackend::describe() const {
    return "Local mirror to " + mirror_dir_.string();
}

}  // namespace bundle_forwarder
