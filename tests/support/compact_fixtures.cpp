#include "compact_fixtures.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include "strata/format/columnar_file.hpp"

namespace fs = std::filesystem;
using strata::core::error;
using strata::core::error_code;

namespace compact_fixtures {

TempDir::TempDir(const std::string& name) {
  static std::atomic<int> counter{0};
  path_ = fs::temp_directory_path() / "strata_tests" /
          (name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
  std::error_code ec;
  fs::remove_all(path_, ec);
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string segment_key(const std::string& org, const std::string& type, const std::string& stream, int thread,
                        const std::string& hour_dir, const std::string& name) {
  return "files/" + org + "/" + type + "/" + stream + "/" + std::to_string(thread) + "/" + hour_dir + "/" + name;
}

strata::format::Schema make_schema(const std::vector<std::string>& fields) {
  strata::format::Schema s;
  s.add(strata::format::Field{std::string(strata::format::TIMESTAMP_COL), strata::format::DataType::int64, false});
  for (const auto& f : fields) s.add(strata::format::Field{f, strata::format::DataType::utf8, true});
  return s;
}

strata::format::FileMeta write_segment(const fs::path& path, const SegmentSpec& layout) {
  strata::format::RecordBatch batch;
  batch.schema = make_schema(layout.fields);
  batch.columns.resize(batch.schema.size());
  for (std::size_t r = 0; r < layout.rows; ++r) {
    batch.columns[0].emplace_back(layout.ts_start + static_cast<std::int64_t>(r));
    for (std::size_t f = 1; f < batch.columns.size(); ++f) {
      batch.columns[f].emplace_back(layout.fields[f - 1] + " value " + std::to_string(r));
    }
  }
  fs::create_directories(path.parent_path());
  strata::format::EncodeOptions opts{};
  opts.meta = layout.meta;
  auto meta = strata::format::write_columnar_file(path, batch, opts);
  if (!meta) throw std::runtime_error("write_segment failed: " + meta.error().message);
  return *meta;
}

void write_empty_segment(const fs::path& path) {
  strata::format::RecordBatch batch;
  batch.schema = make_schema({"message"});
  batch.columns.resize(batch.schema.size());
  fs::create_directories(path.parent_path());
  auto meta = strata::format::write_columnar_file(path, batch);
  if (!meta) throw std::runtime_error("write_empty_segment failed: " + meta.error().message);
}

strata::format::FileMeta sized_meta(std::uint64_t original_size, std::uint64_t records, std::int64_t min_ts) {
  strata::format::FileMeta m{};
  m.min_ts = min_ts;
  m.max_ts = min_ts + 1000;
  m.records = records;
  m.original_size = original_size;
  return m;
}

void age_file(const fs::path& path, std::chrono::seconds age) {
  fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

// ---- InMemoryFileList

auto InMemoryFileList::record(std::string_view account, std::string_view file_key,
                              const strata::format::FileMeta& meta, bool is_deleted) -> std::expected<void, error> {
  if (fail_record) return std::unexpected(error{error_code::unavailable, "file list offline", "test.file_list"});
  if (on_record) on_record(std::string(file_key));
  std::lock_guard lk(mu_);
  if (is_deleted) {
    entries_.erase(std::string(file_key));
  } else {
    entries_[std::string(file_key)] = strata::compact::FileListEntry{std::string(account), std::string(file_key), meta};
  }
  return {};
}

auto InMemoryFileList::exists(std::string_view, std::string_view file_key) -> std::expected<bool, error> {
  std::lock_guard lk(mu_);
  return entries_.count(std::string(file_key)) > 0;
}

auto InMemoryFileList::list(std::string_view key_prefix)
    -> std::expected<std::vector<strata::compact::FileListEntry>, error> {
  std::lock_guard lk(mu_);
  std::vector<strata::compact::FileListEntry> out;
  for (const auto& [k, v] : entries_) {
    if (k.starts_with(key_prefix)) out.push_back(v);
  }
  return out;
}

std::size_t InMemoryFileList::size() const {
  std::lock_guard lk(mu_);
  return entries_.size();
}

std::optional<strata::format::FileMeta> InMemoryFileList::get(const std::string& key) const {
  std::lock_guard lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second.meta;
}

// ---- InMemoryObjectStore

auto InMemoryObjectStore::put(std::string_view, std::string_view key, std::span<const std::uint8_t> bytes)
    -> std::expected<void, error> {
  if (fail_put) return std::unexpected(error{error_code::io_failed, "object store offline", "test.storage"});
  std::lock_guard lk(mu_);
  objects_[std::string(key)] = std::vector<std::uint8_t>(bytes.begin(), bytes.end());
  return {};
}

auto InMemoryObjectStore::resolve_account_for_key(std::string_view) -> std::string { return ""; }

std::optional<std::vector<std::uint8_t>> InMemoryObjectStore::get(const std::string& key) const {
  std::lock_guard lk(mu_);
  auto it = objects_.find(key);
  if (it == objects_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> InMemoryObjectStore::keys() const {
  std::lock_guard lk(mu_);
  std::vector<std::string> out;
  for (const auto& [k, v] : objects_) out.push_back(k);
  return out;
}

// ---- StaticLocks

auto StaticLocks::is_locked(std::string_view key) -> bool {
  std::lock_guard lk(mu_);
  return keys_.find(key) != keys_.end();
}

void StaticLocks::lock(const std::string& key) {
  std::lock_guard lk(mu_);
  keys_.insert(key);
}

void StaticLocks::unlock(const std::string& key) {
  std::lock_guard lk(mu_);
  keys_.erase(key);
}

// ---- FlakyPendingStore

auto FlakyPendingStore::list() -> std::expected<std::vector<strata::compact::PendingDelete>, error> {
  std::lock_guard lk(mu_);
  return entries_;
}

auto FlakyPendingStore::add(std::string_view org, std::string_view account, std::string_view key)
    -> std::expected<void, error> {
  if (fail_add) return std::unexpected(error{error_code::io_failed, "pending store offline", "test.pending"});
  std::lock_guard lk(mu_);
  auto same = [key](const strata::compact::PendingDelete& p) { return p.key == key; };
  if (std::none_of(entries_.begin(), entries_.end(), same)) {
    entries_.push_back(strata::compact::PendingDelete{std::string(org), std::string(account), std::string(key)});
  }
  return {};
}

auto FlakyPendingStore::remove(std::string_view key) -> std::expected<void, error> {
  std::lock_guard lk(mu_);
  std::erase_if(entries_, [key](const strata::compact::PendingDelete& p) { return p.key == key; });
  return {};
}

// ---- InMemoryRemovingStore

auto InMemoryRemovingStore::add(std::string_view key) -> std::expected<void, error> {
  std::lock_guard lk(mu_);
  keys_.insert(std::string(key));
  return {};
}

auto InMemoryRemovingStore::remove(std::string_view key) -> std::expected<void, error> {
  std::lock_guard lk(mu_);
  if (auto it = keys_.find(key); it != keys_.end()) keys_.erase(it);
  return {};
}

auto InMemoryRemovingStore::list() -> std::expected<std::vector<std::string>, error> {
  std::lock_guard lk(mu_);
  return std::vector<std::string>(keys_.begin(), keys_.end());
}

// ---- ScriptedMergeService

auto ScriptedMergeService::merge(const strata::compact::MergeRequest& request)
    -> std::expected<strata::compact::MergeResult, error> {
  {
    std::lock_guard lk(mu_);
    ++calls;
    requests.push_back(request);
  }
  switch (script) {
    case MergeScript::multiple:
      return strata::compact::MergeMultiple{{{1, 2, 3}, {4, 5, 6}}};
    case MergeScript::empty_bytes:
      return strata::compact::MergeSingle{};
    case MergeScript::fail:
      return std::unexpected(error{error_code::io_failed, "scripted merge failure", "test.merge"});
    case MergeScript::passthrough:
      break;
  }
  return inner_.merge(request);
}

// ---- CountingIndexBuilder

auto CountingIndexBuilder::build(const strata::compact::IndexRequest&) -> std::expected<std::uint64_t, error> {
  ++calls;
  return size;
}

// ---- RecordingObserver

auto RecordingObserver::on_merged(const strata::compact::MergedFileEvent& event) -> std::expected<void, error> {
  {
    std::lock_guard lk(mu_);
    events.push_back(event);
  }
  if (mode == Mode::error) return std::unexpected(error{error_code::unavailable, "observer down", "test.observer"});
  if (mode == Mode::throws) throw std::runtime_error("observer exploded");
  return {};
}

// ---- Harness

Harness::Harness(const std::string& name) : dir(name) {
  config.wal_dir = dir.path() / "wal";
  config.state_dir = dir.path() / "state";
  config.file_move_thread_num = 2;
  config.worker_queue_capacity = 2;
  config.max_file_size_on_disk = 10 * strata::core::MB;
  config.compact_max_file_size = 10 * strata::core::MB;
  config.merge_retry_delay = std::chrono::milliseconds{0};
  config.clean_empty_dirs = false;
  fs::create_directories(config.wal_dir / "files");
}

strata::compact::Collaborators Harness::collaborators() {
  return strata::compact::Collaborators{streams, file_list, storage, locks, pending, removing,
                                        merger, indexer, metrics};
}

std::unique_ptr<strata::compact::Compactor> Harness::make_compactor(strata::compact::Clock now) {
  return std::make_unique<strata::compact::Compactor>(config, state, collaborators(), std::move(now));
}

} // namespace compact_fixtures
