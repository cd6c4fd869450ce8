/**
 * @file straggler_scanner.cpp
 * @brief find_stragglers() implementation.
 * @author Dimitris Kafetzis
 */

#include "output/straggler_scanner.hpp"

#include <algorithm>

namespace bundle_forwarder {

bool is_rolled_bundle_name(std::string_view file_name, std::string_view base_name) {
    return file_name.size() > base_name.size()
        && file_name.substr(0, base_name.size()) == base_name;
}

Result<std::vector<std::filesystem::path>> find_stragglers(const std::filesystem::path& directory,
                                                           std::string_view base_name) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return Error{ErrorCode::Io,
                     "Cannot list " + directory.string() + ": " + ec.message()};
    }

    std::vector<std::filesystem::path> found;
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (ec) break;

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;

        auto name = it->path().filename().string();
        if (is_rolled_bundle_name(name, base_name)) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        return Error{ErrorCode::Io,
                     "Listing " + directory.string() + " stopped early: " + ec.message()};
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    return found;
}

}  // namespace bundle_forwarder
