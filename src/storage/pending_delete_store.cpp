#include "strata/storage/pending_delete_store.hpp"
#include "strata/storage/kv_manifest.hpp"

namespace strata::storage {

using core::error;
using core::error_code;

namespace {
constexpr std::string_view PENDING_HEADER = "strata-pending-delete v1";
constexpr std::string_view REMOVING_HEADER = "strata-removing v1";
} // namespace

auto FilePendingDeleteStore::open(const std::filesystem::path& state_dir)
    -> std::expected<std::unique_ptr<FilePendingDeleteStore>, error> {
  std::unique_ptr<FilePendingDeleteStore> store(
      new FilePendingDeleteStore(state_dir / "pending_delete.manifest"));
  auto lines = load_kv_manifest(store->path_, PENDING_HEADER);
  if (!lines) return std::unexpected(lines.error());
  for (auto& kv : *lines) {
    auto k = kv.find("key");
    if (k == kv.end() || k->second.empty()) {
      return std::unexpected(error{error_code::data_integrity, "pending delete entry without key",
                                   "storage.pending_delete"});
    }
    compact::PendingDelete e{kv["org"], kv["account"], k->second};
    store->entries_.insert_or_assign(e.key, std::move(e));
  }
  return store;
}

auto FilePendingDeleteStore::persist_locked() -> std::expected<void, error> {
  std::vector<KvLine> lines;
  lines.reserve(entries_.size());
  for (const auto& [key, e] : entries_) {
    lines.push_back(KvLine{{"org", e.org}, {"account", e.account}, {"key", e.key}});
  }
  return save_kv_manifest(path_, PENDING_HEADER, lines);
}

auto FilePendingDeleteStore::list() -> std::expected<std::vector<compact::PendingDelete>, error> {
  std::lock_guard lock(mutex_);
  std::vector<compact::PendingDelete> out;
  out.reserve(entries_.size());
  for (const auto& [_, e] : entries_) out.push_back(e);
  return out;
}

auto FilePendingDeleteStore::add(std::string_view org, std::string_view account, std::string_view key)
    -> std::expected<void, error> {
  std::lock_guard lock(mutex_);
  if (entries_.find(key) != entries_.end()) return {};
  compact::PendingDelete e{std::string(org), std::string(account), std::string(key)};
  entries_.emplace(e.key, e);
  if (auto r = persist_locked(); !r) {
    entries_.erase(e.key);
    return r;
  }
  return {};
}

auto FilePendingDeleteStore::remove(std::string_view key) -> std::expected<void, error> {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return {};
  auto saved = it->second;
  entries_.erase(it);
  if (auto r = persist_locked(); !r) {
    entries_.emplace(saved.key, saved);
    return r;
  }
  return {};
}

auto FilePendingDeleteStore::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

auto FileRemovingMarkerStore::open(const std::filesystem::path& state_dir)
    -> std::expected<std::unique_ptr<FileRemovingMarkerStore>, error> {
  std::unique_ptr<FileRemovingMarkerStore> store(
      new FileRemovingMarkerStore(state_dir / "removing.manifest"));
  auto lines = load_kv_manifest(store->path_, REMOVING_HEADER);
  if (!lines) return std::unexpected(lines.error());
  for (auto& kv : *lines) {
    auto k = kv.find("key");
    if (k == kv.end() || k->second.empty()) {
      return std::unexpected(error{error_code::data_integrity, "removing marker without key",
                                   "storage.removing"});
    }
    store->keys_.insert(k->second);
  }
  return store;
}

auto FileRemovingMarkerStore::persist_locked() -> std::expected<void, error> {
  std::vector<KvLine> lines;
  lines.reserve(keys_.size());
  for (const auto& k : keys_) lines.push_back(KvLine{{"key", k}});
  return save_kv_manifest(path_, REMOVING_HEADER, lines);
}

auto FileRemovingMarkerStore::add(std::string_view key) -> std::expected<void, error> {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = keys_.emplace(key);
  if (!inserted) return {};
  if (auto r = persist_locked(); !r) {
    keys_.erase(it);
    return r;
  }
  return {};
}

auto FileRemovingMarkerStore::remove(std::string_view key) -> std::expected<void, error> {
  std::lock_guard lock(mutex_);
  auto it = keys_.find(key);
  if (it == keys_.end()) return {};
  std::string saved = *it;
  keys_.erase(it);
  if (auto r = persist_locked(); !r) {
    keys_.insert(std::move(saved));
    return r;
  }
  return {};
}

auto FileRemovingMarkerStore::list() -> std::expected<std::vector<std::string>, error> {
  std::lock_guard lock(mutex_);
  return std::vector<std::string>(keys_.begin(), keys_.end());
}

} // namespace strata::storage
