/**
 * @file mirror_backend.hpp
 * @brief Backend that delivers bundles into a local (or mounted) directory.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "upload/upload_backend.hpp"

#include <mutex>
#include <optional>

namespace bundle_forwarder {

/**
 * @brief Copies each bundle to <mirror_dir>/<bundle file name>.
 *
 * Descriptor: "[localDirectory:]mirrorDirectory". The copy is written to a
 * hidden ".partial" file and renamed into place, so a reader of the mirror
 * never observes a half-written bundle.
 */
class MirrorBackend : public IUploadBackend {
public:
    Result<void> initialize(std::string_view descriptor) override;
    UploadOutcome upload(const std::filesystem::path& path, std::istream& file) override;

    [[nodiscard]] std::string statistics() const override;
    [[nodiscard]] std::string key() const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& mirror_directory() const noexcept {
        return mirror_dir_;
    }

private:
    Result<uint64_t> copy_into_place(const std::filesystem::path& path, std::istream& file);

    std::filesystem::path mirror_dir_;

    mutable std::mutex stats_mutex_;
    uint64_t files_stored_ = 0;
    uint64_t bytes_stored_ = 0;
    uint64_t failures_ = 0;
    std::optional<Timestamp> last_stored_;
};

}  // namespace bundle_forwarder
