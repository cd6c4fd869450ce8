/**
 * @file upload_codec.hpp
 * @brief Binary request/response format for shipping bundles over TCP.
 * @author Dimitris Kafetzis
 *
 * Carried inside one transport frame each:
 *   Request:  [4B name_len][name][8B data_len][data...]
 *   Response: [1B status (0=ok,1=err)][4B error_len][error_msg]
 * All integers big-endian.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bundle_forwarder {

struct UploadRequest {
    std::string bundle_name;
    std::vector<uint8_t> data;
};

struct UploadResponse {
    bool success = false;
    std::string error_message;
};

struct UploadCodec {
    static std::vector<uint8_t> encode_request(const UploadRequest& request);
    static bool decode_request(const std::vector<uint8_t>& data, UploadRequest& request);

    static std::vector<uint8_t> encode_response(const UploadResponse& response);
    static bool decode_response(const std::vector<uint8_t>& data, UploadResponse& response);

    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static uint64_t get_u64(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace bundle_forwarder
