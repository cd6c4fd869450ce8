/**
 * @file upload_backend.cpp
 * @brief Connection string parsing and backend factory.
 * @author Dimitris Kafetzis
 */

#include "upload/upload_backend.hpp"

#include "upload/mirror_backend.hpp"
#include "upload/tcp_upload_backend.hpp"

namespace bundle_forwarder {

ConnectionString split_connection_string(std::string_view descriptor) {
    ConnectionString parts;
    auto colon = descriptor.find(':');
    if (colon == std::string_view::npos) {
        parts.suffix = std::string{descriptor};
        return parts;
    }
    parts.local_directory = std::string{descriptor.substr(0, colon)};
    parts.suffix = std::string{descriptor.substr(colon + 1)};
    return parts;
}

Result<std::unique_ptr<IUploadBackend>> make_upload_backend(const Config& config) {
    std::unique_ptr<IUploadBackend> backend;
    if (config.upload.backend == "mirror") {
        backend = std::make_unique<MirrorBackend>();
    } else if (config.upload.backend == "tcp") {
        backend = std::make_unique<TcpUploadBackend>(config.network);
    } else {
        return Error{ErrorCode::Config, "Unknown upload backend: " + config.upload.backend};
    }
    return backend;
}

}  // namespace bundle_forwarder
