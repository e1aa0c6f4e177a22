#pragma once

/** \file kv_manifest.hpp
 *  \brief Versioned line-oriented key=value state files.
 *
 * Format:
 *   header: "<name> v1"\n
 *   lines:  key=value key=value ...\n
 * Values are percent-escaped (space, '=', '%', control bytes) so arbitrary
 * segment keys survive a round trip. Files are rewritten with
 * io::write_file_atomic.
 */

#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "strata/error.hpp"

namespace strata::storage {

using KvLine = std::map<std::string, std::string, std::less<>>;

auto escape_value(std::string_view v) -> std::string;
auto unescape_value(std::string_view v) -> std::expected<std::string, core::error>;

/** \brief Missing file -> empty list. Bad header or malformed line -> data_integrity. */
auto load_kv_manifest(const std::filesystem::path& path, std::string_view header)
    -> std::expected<std::vector<KvLine>, core::error>;

auto save_kv_manifest(const std::filesystem::path& path, std::string_view header,
                      const std::vector<KvLine>& lines)
    -> std::expected<void, core::error>;

} // namespace strata::storage
