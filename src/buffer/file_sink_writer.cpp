/**
 * @file file_sink_writer.cpp
 * @brief FileSinkWriter implementation over POSIX file descriptors.
 * @author Dimitris Kafetzis
 */

#include "buffer/file_sink_writer.hpp"

#include "core/json.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace bundle_forwarder {

namespace {

Error io_error(const std::string& what, const std::filesystem::path& path, int err) {
    return Error{ErrorCode::Io, what + " " + path.string() + ": " + std::strerror(err)};
}

}  // anonymous namespace

FileSinkWriter::~FileSinkWriter() {
    close();
}

Result<void> FileSinkWriter::initialize(const std::filesystem::path& base_path) {
    std::lock_guard lock(mutex_);
    if (fd_ >= 0) {
        return Error{ErrorCode::Init, "Writer already initialized for " + base_path_.string()};
    }
    base_path_ = base_path;
    last_rolled_over_ = std::chrono::system_clock::now();
    return open_live_locked();
}

Result<void> FileSinkWriter::open_live_locked() {
    int fd = ::open(base_path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        return io_error("Cannot open live file", base_path_, errno);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return io_error("Cannot stat live file", base_path_, err);
    }

    fd_ = fd;
    current_size_ = static_cast<uint64_t>(st.st_size);
    return Result<void>{};
}

Result<void> FileSinkWriter::append(std::string_view message) {
    std::lock_guard lock(mutex_);
    if (fd_ < 0) {
        return Error{ErrorCode::Io, "Live file is not open: " + base_path_.string()};
    }

    const char* ptr = message.data();
    size_t remaining = message.size();
    while (remaining > 0) {
        auto written = ::write(fd_, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return io_error("Write failed on", base_path_, errno);
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
        current_size_ += static_cast<uint64_t>(written);
        bytes_written_ += static_cast<uint64_t>(written);
    }
    return Result<void>{};
}

std::filesystem::path FileSinkWriter::unique_target_locked(const std::string& suffix) const {
    std::filesystem::path target = base_path_.string() + suffix;
    std::error_code ec;
    for (int n = 1; std::filesystem::exists(target, ec); ++n) {
        target = base_path_.string() + suffix + "." + std::to_string(n);
    }
    return target;
}

Result<std::filesystem::path> FileSinkWriter::roll_over(std::string_view timestamp_format) {
    std::lock_guard lock(mutex_);
    if (fd_ < 0) {
        return Error{ErrorCode::Io, "Live file is not open: " + base_path_.string()};
    }

    auto now = std::chrono::system_clock::now();
    auto target = unique_target_locked(format_utc(now, timestamp_format));

    if (::close(fd_) != 0) {
        int err = errno;
        fd_ = -1;
        // The descriptor is gone either way; keep the writer usable.
        if (auto reopened = open_live_locked(); !reopened) return reopened.error();
        return io_error("Close failed on", base_path_, err);
    }
    fd_ = -1;

    if (::rename(base_path_.c_str(), target.c_str()) != 0) {
        int err = errno;
        if (auto reopened = open_live_locked(); !reopened) return reopened.error();
        return io_error("Cannot rename live file to " + target.string() + " from", base_path_, err);
    }

    if (auto opened = open_live_locked(); !opened) {
        return opened.error();
    }

    last_rolled_over_ = now;
    ++roll_overs_;
    return target;
}

void FileSinkWriter::close() {
    std::lock_guard lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Timestamp FileSinkWriter::last_rolled_over() const {
    std::lock_guard lock(mutex_);
    return last_rolled_over_;
}

uint64_t FileSinkWriter::current_size() const {
    std::lock_guard lock(mutex_);
    return current_size_;
}

std::string FileSinkWriter::statistics() const {
    std::lock_guard lock(mutex_);
    std::ostringstream oss;
    oss << R"({"file_name":)" << json_string(base_path_.string())
        << R"(,"last_rolled_over":)" << json_string(to_iso8601(last_rolled_over_))
        << R"(,"current_size":)" << current_size_
        << R"(,"bytes_written":)" << bytes_written_
        << R"(,"roll_overs":)" << roll_overs_
        << R"(,"open":)" << (fd_ >= 0 ? "true" : "false")
        << "}";
    return oss.str();
}

}  // namespace bundle_forwarder
