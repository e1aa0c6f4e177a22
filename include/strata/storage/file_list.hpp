#pragma once

/** \file file_list.hpp
 *  \brief Durable local file-list index of merged files.
 *
 * State file <state_dir>/file_list.manifest, header "strata-file-list v1",
 * one line per live file. record(..., is_deleted=true) removes the entry.
 */

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

#include "strata/compact/services.hpp"

namespace strata::storage {

class LocalFileList final : public compact::FileListIndex {
public:
  static auto open(const std::filesystem::path& state_dir)
      -> std::expected<std::unique_ptr<LocalFileList>, core::error>;

  auto record(std::string_view account, std::string_view file_key,
              const format::FileMeta& meta, bool is_deleted)
      -> std::expected<void, core::error> override;
  auto exists(std::string_view account, std::string_view file_key)
      -> std::expected<bool, core::error> override;
  auto list(std::string_view key_prefix)
      -> std::expected<std::vector<compact::FileListEntry>, core::error> override;

  auto get(std::string_view account, std::string_view file_key) const
      -> std::optional<format::FileMeta>;

private:
  explicit LocalFileList(std::filesystem::path path) : path_(std::move(path)) {}
  auto persist_locked() -> std::expected<void, core::error>;

  using Key = std::pair<std::string, std::string>; // (account, key)

  std::filesystem::path path_;
  mutable std::shared_mutex mutex_;
  std::map<Key, format::FileMeta> files_;
};

} // namespace strata::storage
