/**
 * @file json.hpp
 * @brief Minimal helpers for hand-assembled NDJSON lines.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdio>
#include <string>
#include <string_view>

namespace bundle_forwarder {

/**
 * @brief Escape @p text for use inside a JSON string literal.
 */
inline std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/// Quoted and escaped JSON string.
inline std::string json_string(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

}  // namespace bundle_forwarder
