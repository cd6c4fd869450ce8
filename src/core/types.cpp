/**
 * @file types.cpp
 * @brief UTC timestamp rendering shared by the logger, writer and statistics.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace bundle_forwarder {

std::string format_utc(Timestamp ts, std::string_view format) {
    auto time_t_val = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_val{};
    ::gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, std::string{format}.c_str());
    return oss.str();
}

std::string to_iso8601(Timestamp ts) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds{1000};

    std::ostringstream oss;
    oss << format_utc(ts, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace bundle_forwarder
