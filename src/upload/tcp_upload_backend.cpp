/**
 * @file tcp_upload_backend.cpp
 * @brief TcpUploadBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "upload/tcp_upload_backend.hpp"

#include "core/json.hpp"
#include "network/transport.hpp"
#include "upload/upload_codec.hpp"

#include <iterator>
#include <stdexcept>
#include <sstream>

namespace bundle_forwarder {

TcpUploadBackend::TcpUploadBackend(NetworkConfig network)
    : network_(network) {}

Result<void> TcpUploadBackend::initialize(std::string_view descriptor) {
    auto port_sep = descriptor.rfind(':');
    if (port_sep == std::string_view::npos || port_sep == 0) {
        return Error{ErrorCode::Config,
                     "TCP backend expects \"localDirectory:host:port\", got \""
                     + std::string{descriptor} + "\""};
    }

    auto host_begin = descriptor.rfind(':', port_sep - 1);
    host_begin = (host_begin == std::string_view::npos) ? 0 : host_begin + 1;

    auto host = descriptor.substr(host_begin, port_sep - host_begin);
    auto port_text = descriptor.substr(port_sep + 1);
    if (host.empty() || port_text.empty()) {
        return Error{ErrorCode::Config, "Missing collector host or port in \""
                                        + std::string{descriptor} + "\""};
    }

    unsigned long port = 0;
    try {
        size_t consumed = 0;
        port = std::stoul(std::string{port_text}, &consumed);
        if (consumed != port_text.size()) port = 0;
    } catch (const std::exception&) {
        port = 0;
    }
    if (port == 0 || port > 65535) {
        return Error{ErrorCode::Config, "Invalid collector port: " + std::string{port_text}};
    }

    host_ = std::string{host};
    port_ = static_cast<uint16_t>(port);
    return Result<void>{};
}

Result<void> TcpUploadBackend::deliver(const std::filesystem::path& path,
                                       std::istream& file, uint64_t& sent) {
    UploadRequest request;
    request.bundle_name = path.filename().string();
    request.data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error{ErrorCode::Upload, "Read failed on " + path.string()};
    }

    auto frame = UploadCodec::encode_request(request);
    if (frame.size() > TcpTransport::MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::Upload,
                     "Bundle " + path.string() + " exceeds the transport frame limit"};
    }

    TcpTransport transport;
    if (auto connected = transport.connect(host_, port_, network_.connect_timeout_ms); !connected) {
        return connected.error();
    }
    if (auto written = transport.send(frame, network_.io_timeout_ms); !written) {
        return written.error();
    }

    auto reply = transport.receive(network_.io_timeout_ms);
    if (!reply) {
        return reply.error();
    }

    UploadResponse response;
    if (!UploadCodec::decode_response(*reply, response)) {
        return Error{ErrorCode::Protocol, "Malformed response from " + key()};
    }
    if (!response.success) {
        return Error{ErrorCode::Upload, "Collector rejected " + request.bundle_name
                                        + ": " + response.error_message};
    }

    sent = request.data.size();
    return Result<void>{};
}

UploadOutcome TcpUploadBackend::upload(const std::filesystem::path& path, std::istream& file) {
    uint64_t sent = 0;
    auto delivered = deliver(path, file, sent);

    std::lock_guard lock(stats_mutex_);
    if (!delivered) {
        ++failures_;
        return UploadOutcome::failure(path, delivered.error());
    }
    ++bundles_sent_;
    bytes_sent_ += sent;
    last_sent_ = std::chrono::system_clock::now();
    return UploadOutcome::success(path);
}

std::string TcpUploadBackend::statistics() const {
    std::lock_guard lock(stats_mutex_);
    std::ostringstream oss;
    oss << R"({"collector":)" << json_string(host_ + ":" + std::to_string(port_))
        << R"(,"bundles_sent":)" << bundles_sent_
        << R"(,"bytes_sent":)" << bytes_sent_
        << R"(,"failures":)" << failures_
        << R"(,"last_sent":)"
        << (last_sent_ ? json_string(to_iso8601(*last_sent_)) : std::string{"null"})
        << "}";
    return oss.str();
}

std::string TcpUploadBackend::key() const {
    return "tcp:" + host_ + ":" + std::to_string(port_);
}

std::string TcpUploadBackend::describe() const {
    return "TCP collector at " + host_ + ":" + std::to_string(port_);
}

}  // namespace bundle_forwarder
