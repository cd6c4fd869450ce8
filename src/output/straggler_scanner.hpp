/**
 * @file straggler_scanner.hpp
 * @brief Startup recovery of bundles a previous run never delivered.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace bundle_forwarder {

/**
 * @brief True for "<base_name><suffix>" with a non-empty suffix.
 */
[[nodiscard]] bool is_rolled_bundle_name(std::string_view file_name, std::string_view base_name);

/**
 * @brief List rolled-over bundles left in @p directory.
 *
 * Non-recursive. Keeps regular files whose name starts with @p base_name and
 * is longer than it; the live file itself never qualifies. Sorted by name,
 * which is oldest first for the default timestamp suffix.
 */
Result<std::vector<std::filesystem::path>> find_stragglers(const std::filesystem::path& directory,
                                                           std::string_view base_name);

}  // namespace bundle_forwarder
