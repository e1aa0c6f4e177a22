#pragma once

/** \file pending_delete_store.hpp
 *  \brief File-backed Pending-Delete and Removing-Marker stores.
 *
 * Both keep their full contents in memory and rewrite their state file
 * atomically on every mutation, so the on-disk copy always reflects the last
 * acknowledged add/remove. open() reloads whatever a previous process left.
 *
 * Files:
 *   pending_delete.manifest  header "strata-pending-delete v1", lines org= account= key=
 *   removing.manifest        header "strata-removing v1", lines key=
 */

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "strata/compact/services.hpp"

namespace strata::storage {

class FilePendingDeleteStore final : public compact::PendingDeleteStore {
public:
  static auto open(const std::filesystem::path& state_dir)
      -> std::expected<std::unique_ptr<FilePendingDeleteStore>, core::error>;

  auto list() -> std::expected<std::vector<compact::PendingDelete>, core::error> override;
  auto add(std::string_view org, std::string_view account, std::string_view key)
      -> std::expected<void, core::error> override;
  auto remove(std::string_view key) -> std::expected<void, core::error> override;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
  explicit FilePendingDeleteStore(std::filesystem::path path) : path_(std::move(path)) {}
  auto persist_locked() -> std::expected<void, core::error>;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::map<std::string, compact::PendingDelete, std::less<>> entries_; // by key
};

class FileRemovingMarkerStore final : public compact::RemovingMarkerStore {
public:
  static auto open(const std::filesystem::path& state_dir)
      -> std::expected<std::unique_ptr<FileRemovingMarkerStore>, core::error>;

  auto add(std::string_view key) -> std::expected<void, core::error> override;
  auto remove(std::string_view key) -> std::expected<void, core::error> override;
  auto list() -> std::expected<std::vector<std::string>, core::error> override;

private:
  explicit FileRemovingMarkerStore(std::filesystem::path path) : path_(std::move(path)) {}
  auto persist_locked() -> std::expected<void, core::error>;

  std::filesystem::path path_;
  std::mutex mutex_;
  std::set<std::string, std::less<>> keys_;
};

} // namespace strata::storage
