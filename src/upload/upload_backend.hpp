/**
 * @file upload_backend.hpp
 * @brief Upload backend interface and runtime factory.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace bundle_forwarder {

/**
 * @brief Abstract interface for remote bundle storage (runtime polymorphism).
 *
 * upload() is called from dispatcher threads, possibly for several bundles
 * at once, and statistics() from a status thread; implementations must be
 * thread-safe after initialize() returns.
 */
class IUploadBackend {
public:
    virtual ~IUploadBackend() = default;

    /// @param descriptor Full connection string, local directory prefix included.
    virtual Result<void> initialize(std::string_view descriptor) = 0;

    /**
     * @brief Deliver one closed bundle.
     * @param path Local path of the bundle (for naming only).
     * @param file Stream positioned at the start of the bundle.
     */
    virtual UploadOutcome upload(const std::filesystem::path& path, std::istream& file) = 0;

    /// JSON object with backend-specific counters.
    [[nodiscard]] virtual std::string statistics() const = 0;

    /// Stable identity used to tell configured outputs apart.
    [[nodiscard]] virtual std::string key() const = 0;

    /// Human-readable description.
    [[nodiscard]] virtual std::string describe() const = 0;
};

// ─────────────────────────────────────────────
// Connection String
// ─────────────────────────────────────────────

/**
 * @brief "[localDirectory:]backendSuffix" split at the first ':'.
 */
struct ConnectionString {
    std::string local_directory;   ///< Empty when no prefix was given
    std::string suffix;            ///< Remainder, or the whole string
};

[[nodiscard]] ConnectionString split_connection_string(std::string_view descriptor);

/**
 * @brief Create the backend named by config.upload.backend.
 */
Result<std::unique_ptr<IUploadBackend>> make_upload_backend(const Config& config);

}  // namespace bundle_forwarder
