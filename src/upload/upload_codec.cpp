/**
 * @file upload_codec.cpp
 * @brief UploadCodec binary serialization for TCP bundle delivery.
 * @author Dimitris Kafetzis
 *
 * Wire format (all multi-byte values are big-endian):
 *
 * Request:
 *   [4B bundle_name_len][bundle_name bytes][8B data_len][data...]
 *
 * Response:
 *   [1B status: 0=stored, 1=error]
 *   [4B error_msg_len][error_msg bytes]
 */

#include "upload/upload_codec.hpp"

#include <cstddef>

namespace bundle_forwarder {

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void UploadCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void UploadCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint64_t UploadCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t UploadCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

std::vector<uint8_t> UploadCodec::encode_request(const UploadRequest& request) {
    std::vector<uint8_t> buf;
    buf.reserve(4 + request.bundle_name.size() + 8 + request.data.size());

    put_u32(buf, static_cast<uint32_t>(request.bundle_name.size()));
    buf.insert(buf.end(), request.bundle_name.begin(), request.bundle_name.end());

    put_u64(buf, static_cast<uint64_t>(request.data.size()));
    buf.insert(buf.end(), request.data.begin(), request.data.end());

    return buf;
}

bool UploadCodec::decode_request(const std::vector<uint8_t>& data, UploadRequest& request) {
    size_t offset = 0;

    if (data.size() < 4) return false;
    uint32_t name_len = get_u32(data.data());
    offset = 4;

    if (data.size() - offset < name_len) return false;
    request.bundle_name.assign(reinterpret_cast<const char*>(data.data() + offset), name_len);
    offset += name_len;

    if (data.size() - offset < 8) return false;
    uint64_t data_len = get_u64(data.data() + offset);
    offset += 8;

    // Length must account for exactly the rest of the frame
    if (data.size() - offset != data_len) return false;
    request.data.assign(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end());

    return true;
}

// ─────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────

std::vector<uint8_t> UploadCodec::encode_response(const UploadResponse& response) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 4 + response.error_message.size());

    buf.push_back(response.success ? 0 : 1);
    put_u32(buf, static_cast<uint32_t>(response.error_message.size()));
    buf.insert(buf.end(), response.error_message.begin(), response.error_message.end());

    return buf;
}

bool UploadCodec::decode_response(const std::vector<uint8_t>& data, UploadResponse& response) {
    if (data.size() < 5) return false;

    response.success = (data[0] == 0);
    uint32_t err_len = get_u32(data.data() + 1);

    if (data.size() - 5 != err_len) return false;
    response.error_message.assign(reinterpret_cast<const char*>(data.data() + 5), err_len);

    return true;
}

}  // namespace bundle_forwarder
