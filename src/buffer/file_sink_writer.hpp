/**
 * @file file_sink_writer.hpp
 * @brief POSIX append-only live file with rename-based rollover.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "buffer/sink_writer.hpp"

#include <mutex>

namespace bundle_forwarder {

/**
 * @brief Writes records straight to the live file descriptor (O_APPEND).
 *
 * Each append is a write(2) loop with no user-space buffering, so a record
 * acknowledged by append() is in the page cache before the next one is
 * accepted. Rolled files are named <base><UTC timestamp>; a second rollover
 * within the same timestamp gets a ".N" suffix instead of overwriting.
 */
class FileSinkWriter : public ISinkWriter {
public:
    FileSinkWriter() = default;
    ~FileSinkWriter() override;

    FileSinkWriter(const FileSinkWriter&) = delete;
    FileSinkWriter& operator=(const FileSinkWriter&) = delete;

    Result<void> initialize(const std::filesystem::path& base_path) override;
    Result<void> append(std::string_view message) override;
    Result<std::filesystem::path> roll_over(std::string_view timestamp_format) override;
    void close() override;

    [[nodiscard]] Timestamp last_rolled_over() const override;
    [[nodiscard]] uint64_t current_size() const override;
    [[nodiscard]] std::string statistics() const override;

    [[nodiscard]] const std::filesystem::path& base_path() const noexcept { return base_path_; }

private:
    Result<void> open_live_locked();
    std::filesystem::path unique_target_locked(const std::string& suffix) const;

    std::filesystem::path base_path_;
    int fd_ = -1;

    mutable std::mutex mutex_;
    Timestamp last_rolled_over_{};
    uint64_t current_size_ = 0;
    uint64_t bytes_written_ = 0;
    uint64_t roll_overs_ = 0;
};

}  // namespace bundle_forwarder
