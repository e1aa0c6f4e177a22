#include "strata/wal/scanner.hpp"
#include "strata/core/log.hpp"

#include <algorithm>
#include <cctype>

namespace strata::wal {

namespace fs = std::filesystem;

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y){
           return std::tolower(x) == std::tolower(y);
         });
}

} // namespace

SegmentScanner::SegmentScanner(ScanOptions options)
    : options_(std::move(options)), queue_(options_.channel_capacity) {
  if (options_.batch_size == 0) options_.batch_size = 1;
  if (!options_.suffix.empty() && options_.suffix.front() == '.') options_.suffix.erase(0, 1);
}

SegmentScanner::~SegmentScanner() {
  stop();
}

auto SegmentScanner::start() -> void {
  if (worker_.joinable()) return;
  worker_ = std::thread([this]{ walk(); });
}

auto SegmentScanner::next_batch() -> std::optional<std::vector<fs::path>> {
  return queue_.pop();
}

auto SegmentScanner::stop() -> void {
  if (auto dropped = queue_.cancel(); dropped > 0) {
    core::logger()->debug("[scanner] stopped with {} unread batches", dropped);
  }
  if (worker_.joinable()) worker_.join();
}

auto SegmentScanner::matches(const fs::path& p) const -> bool {
  const auto ext = p.extension().string();
  return ext.size() == options_.suffix.size() + 1 && iequals(std::string_view(ext).substr(1), options_.suffix);
}

auto SegmentScanner::walk() -> void {
  auto log = core::logger();
  std::error_code ec;
  if (!fs::exists(options_.root, ec)) {
    queue_.close();
    return;
  }
  const auto root = fs::weakly_canonical(options_.root, ec);
  if (ec) {
    log->error("[scanner] canonicalize {} failed: {}", options_.root.string(), ec.message());
    entry_errors_.fetch_add(1);
    queue_.close();
    return;
  }

  std::vector<fs::path> batch;
  batch.reserve(std::min<std::size_t>(options_.batch_size, 1024));
  bool open = true;
  std::vector<fs::path> dirs{root};
  while (!dirs.empty() && open) {
    const auto dir = std::move(dirs.back());
    dirs.pop_back();
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      log->warn("[scanner] skip directory {}: {}", dir.string(), ec.message());
      entry_errors_.fetch_add(1);
      ec.clear();
      continue;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
      if (ec) break;
      const auto& entry = *it;
      std::error_code st_ec;
      const auto status = entry.symlink_status(st_ec);
      if (st_ec) {
        log->warn("[scanner] skip entry {}: {}", entry.path().string(), st_ec.message());
        entry_errors_.fetch_add(1);
        continue;
      }
      if (fs::is_directory(status)) {
        dirs.push_back(entry.path());
        continue;
      }
      if (!fs::is_regular_file(status) || !matches(entry.path())) continue;
      batch.push_back(entry.path());
      files_found_.fetch_add(1);
      if (batch.size() >= options_.batch_size) {
        if (!queue_.push(std::move(batch))) { open = false; break; }
        batch = {};
      }
    }
    if (ec) {
      log->warn("[scanner] error reading {}: {}", dir.string(), ec.message());
      entry_errors_.fetch_add(1);
      ec.clear();
    }
  }
  if (open && !batch.empty()) (void)queue_.push(std::move(batch));
  queue_.close();
}

auto scan_segments(const ScanOptions& options) -> std::vector<fs::path> {
  SegmentScanner scanner(options);
  scanner.start();
  std::vector<fs::path> out;
  while (auto batch = scanner.next_batch()) {
    out.insert(out.end(), std::make_move_iterator(batch->begin()), std::make_move_iterator(batch->end()));
  }
  return out;
}

namespace {

// Returns true if `dir` is empty after cleaning its children.
auto clean_dir(const fs::path& dir, std::chrono::seconds min_age, bool is_root, std::size_t& removed) -> bool {
  std::error_code ec;
  bool empty = true;
  fs::directory_iterator it(dir, ec);
  if (ec) return false;
  std::vector<fs::path> subdirs;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) return false;
    if (it->is_directory(ec) && !it->is_symlink(ec)) subdirs.push_back(it->path());
    else empty = false;
  }
  for (const auto& sub : subdirs) {
    if (!clean_dir(sub, min_age, false, removed)) empty = false;
  }
  if (!empty || is_root) return false;
  const auto mtime = fs::last_write_time(dir, ec);
  if (ec || mtime > fs::file_time_type::clock::now() - min_age) return false;
  if (!fs::remove(dir, ec) || ec) return false;
  ++removed;
  return true;
}

} // namespace

auto clean_empty_dirs(const fs::path& root, std::chrono::seconds min_age) -> std::size_t {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return 0;
  std::size_t removed = 0;
  (void)clean_dir(root, min_age, true, removed);
  if (removed > 0) core::logger()->debug("[scanner] removed {} empty directories under {}", removed, root.string());
  return removed;
}

} // namespace strata::wal
