#include "strata/storage/file_list.hpp"
#include "strata/storage/kv_manifest.hpp"

#include <charconv>
#include <mutex>

namespace strata::storage {

using core::error;
using core::error_code;

namespace {

constexpr std::string_view HEADER = "strata-file-list v1";

template <typename T>
auto parse_field(const KvLine& kv, const char* name, T& out) -> bool {
  auto it = kv.find(name);
  if (it == kv.end()) return false;
  const auto& s = it->second;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  return ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

auto LocalFileList::open(const std::filesystem::path& state_dir)
    -> std::expected<std::unique_ptr<LocalFileList>, error> {
  std::unique_ptr<LocalFileList> fl(new LocalFileList(state_dir / "file_list.manifest"));
  auto lines = load_kv_manifest(fl->path_, HEADER);
  if (!lines) return std::unexpected(lines.error());
  std::size_t n = 0;
  for (const auto& kv : *lines) {
    ++n;
    format::FileMeta m{};
    int flattened = 0;
    auto key = kv.find("key");
    auto account = kv.find("account");
    const bool ok = key != kv.end() && account != kv.end()
        && parse_field(kv, "min_ts", m.min_ts) && parse_field(kv, "max_ts", m.max_ts)
        && parse_field(kv, "records", m.records) && parse_field(kv, "original_size", m.original_size)
        && parse_field(kv, "compressed_size", m.compressed_size) && parse_field(kv, "index_size", m.index_size)
        && parse_field(kv, "flattened", flattened);
    if (!ok) {
      return std::unexpected(error{error_code::data_integrity,
                                   "file list entry " + std::to_string(n) + " malformed", "storage.file_list"});
    }
    m.flattened = flattened != 0;
    fl->files_.insert_or_assign(Key{account->second, key->second}, m);
  }
  return fl;
}

auto LocalFileList::persist_locked() -> std::expected<void, error> {
  std::vector<KvLine> lines;
  lines.reserve(files_.size());
  for (const auto& [k, m] : files_) {
    lines.push_back(KvLine{
        {"account", k.first}, {"key", k.second},
        {"min_ts", std::to_string(m.min_ts)}, {"max_ts", std::to_string(m.max_ts)},
        {"records", std::to_string(m.records)}, {"original_size", std::to_string(m.original_size)},
        {"compressed_size", std::to_string(m.compressed_size)}, {"index_size", std::to_string(m.index_size)},
        {"flattened", m.flattened ? "1" : "0"}});
  }
  return save_kv_manifest(path_, HEADER, lines);
}

auto LocalFileList::record(std::string_view account, std::string_view file_key,
                           const format::FileMeta& meta, bool is_deleted) -> std::expected<void, error> {
  if (file_key.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "empty file key", "storage.file_list"});
  }
  std::unique_lock lock(mutex_);
  Key k{std::string(account), std::string(file_key)};
  auto prev = files_.find(k);
  std::optional<format::FileMeta> saved;
  if (prev != files_.end()) saved = prev->second;
  if (is_deleted) files_.erase(k);
  else files_.insert_or_assign(k, meta);
  if (auto r = persist_locked(); !r) {
    if (saved) files_.insert_or_assign(k, *saved);
    else files_.erase(k);
    return r;
  }
  return {};
}

auto LocalFileList::exists(std::string_view account, std::string_view file_key)
    -> std::expected<bool, error> {
  std::shared_lock lock(mutex_);
  return files_.contains(Key{std::string(account), std::string(file_key)});
}

auto LocalFileList::list(std::string_view key_prefix)
    -> std::expected<std::vector<compact::FileListEntry>, error> {
  std::shared_lock lock(mutex_);
  std::vector<compact::FileListEntry> out;
  for (const auto& [k, m] : files_) {
    if (k.second.starts_with(key_prefix)) out.push_back(compact::FileListEntry{k.first, k.second, m});
  }
  return out;
}

auto LocalFileList::get(std::string_view account, std::string_view file_key) const
    -> std::optional<format::FileMeta> {
  std::shared_lock lock(mutex_);
  auto it = files_.find(Key{std::string(account), std::string(file_key)});
  if (it == files_.end()) return std::nullopt;
  return it->second;
}

} // namespace strata::storage
