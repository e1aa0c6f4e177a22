#include "strata/compact/partition_grouper.hpp"

#include <system_error>
#include <utility>

#include "strata/core/log.hpp"
#include "strata/format/columnar_file.hpp"
#include "strata/wal/wal_path.hpp"

namespace strata::compact {

namespace fs = std::filesystem;
using core::error_code;

PartitionGrouper::PartitionGrouper(fs::path wal_root, EngineState& state, MetricsSink& metrics)
    : wal_root_(std::move(wal_root)), state_(state), metrics_(metrics) {}

auto PartitionGrouper::seed(PartitionGroup group) -> void {
  auto it = index_.find(group.partition_key);
  if (it == index_.end()) {
    index_.emplace(group.partition_key, groups_.size());
    groups_.push_back(std::move(group));
    return;
  }
  auto& dst = groups_[it->second].segments;
  for (auto& s : group.segments) dst.push_back(std::move(s));
}

auto PartitionGrouper::append(const std::string& partition, Segment segment) -> void {
  auto it = index_.find(partition);
  if (it == index_.end()) {
    index_.emplace(partition, groups_.size());
    groups_.push_back(PartitionGroup{partition, {}, {}});
    groups_.back().segments.push_back(std::move(segment));
    return;
  }
  groups_[it->second].segments.push_back(std::move(segment));
}

auto PartitionGrouper::discard_empty(const std::string& key, const fs::path& path) -> void {
  auto log = core::logger();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log->error("[grouper] remove empty segment {} failed: {}", key, ec.message());
  } else {
    log->warn("[grouper] removed empty segment {}", key);
    ++stats_.corrupt_deleted;
  }
  state_.meta_cache.erase(key);
}

auto PartitionGrouper::prepare(const std::vector<fs::path>& paths) -> void {
  auto log = core::logger();
  for (const auto& path : paths) {
    ++stats_.seen;
    auto key = wal::segment_key(wal_root_, path);
    if (!key) {
      log->warn("[grouper] {}", key.error().message);
      ++stats_.invalid_keys;
      continue;
    }
    if (state_.claims.contains(*key)) {
      ++stats_.already_claimed;
      continue;
    }

    CachedSegment entry{};
    bool fresh = false;
    if (auto cached = state_.meta_cache.get(*key)) {
      entry = *cached;
    } else {
      auto meta = format::read_file_meta(path);
      if (!meta && meta.error().code == error_code::not_found) {
        ++stats_.vanished;
        continue;
      }
      if (!meta) {
        // possibly still being written; retried on a later pass
        log->debug("[grouper] skip {}: {}", *key, meta.error().message);
        ++stats_.unreadable;
        continue;
      }
      std::error_code ec;
      auto size = fs::file_size(path, ec);
      if (ec) {
        ++stats_.vanished;
        continue;
      }
      entry = CachedSegment{*meta, size};
      fresh = true;
    }
    if (entry.meta.is_empty()) {
      discard_empty(*key, path);
      continue;
    }

    auto partition = wal::partition_key(*key);
    if (!partition) {
      log->warn("[grouper] {}", partition.error().message);
      ++stats_.invalid_keys;
      continue;
    }
    if (!state_.claims.try_claim(*key)) {
      ++stats_.already_claimed;
      continue;
    }
    if (fresh) {
      state_.meta_cache.put(*key, entry);
      if (auto prefix = wal::split_prefix(*partition)) {
        metrics_.gauge_add(metric::WAL_USED_BYTES, prefix->org, stream::to_string(prefix->stream_type),
                           static_cast<std::int64_t>(entry.file_size));
      }
    }
    ++stats_.claimed;
    append(*partition, Segment{*key, path, entry.meta, entry.file_size});
  }
}

auto PartitionGrouper::take() -> std::vector<PartitionGroup> {
  index_.clear();
  return std::exchange(groups_, {});
}

} // namespace strata::compact
