/**
 * @file tcp_upload_backend.hpp
 * @brief Backend that ships bundles to a remote collector over TCP.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "upload/upload_backend.hpp"

#include <mutex>
#include <optional>

namespace bundle_forwarder {

/**
 * @brief One connection per bundle: send an UploadCodec request in a single
 *        transport frame, wait for the collector's response.
 *
 * Descriptor: "localDirectory:host:port". The last two ':'-separated fields
 * name the collector.
 */
class TcpUploadBackend : public IUploadBackend {
public:
    explicit TcpUploadBackend(NetworkConfig network = {});

    Result<void> initialize(std::string_view descriptor) override;
    UploadOutcome upload(const std::filesystem::path& path, std::istream& file) override;

    [[nodiscard]] std::string statistics() const override;
    [[nodiscard]] std::string key() const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

private:
    Result<void> deliver(const std::filesystem::path& path, std::istream& file, uint64_t& sent);

    NetworkConfig network_;
    std::string host_;
    uint16_t port_ = 0;

    mutable std::mutex stats_mutex_;
    uint64_t bundles_sent_ = 0;
    uint64_t bytes_sent_ = 0;
    uint64_t failures_ = 0;
    std::optional<Timestamp> last_sent_;
};

}  // namespace bundle_forwarder
