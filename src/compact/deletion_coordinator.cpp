#include "strata/compact/deletion_coordinator.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "strata/core/log.hpp"
#include "strata/wal/wal_path.hpp"

namespace strata::compact {

namespace fs = std::filesystem;
using core::error;

namespace {

struct Labels {
  std::string org;
  std::string type;
};

auto labels_for(std::string_view key) -> Labels {
  auto partition = wal::partition_key(key);
  if (!partition) return {};
  auto prefix = wal::split_prefix(*partition);
  if (!prefix) return {};
  return Labels{prefix->org, std::string(stream::to_string(prefix->stream_type))};
}

} // namespace

DeletionCoordinator::DeletionCoordinator(fs::path wal_root, EngineState& state, LockRegistry& locks,
                                         PendingDeleteStore& pending, RemovingMarkerStore& removing,
                                         ObjectStorage& storage, MetricsSink& metrics)
    : wal_root_(std::move(wal_root)), state_(state), locks_(locks), pending_(pending), removing_(removing),
      storage_(storage), metrics_(metrics) {}

auto DeletionCoordinator::remove_file(const std::string& key) -> bool {
  std::error_code ec;
  fs::remove(wal_root_ / key, ec);
  if (ec) {
    core::logger()->error("[delete] remove {} failed: {}", key, ec.message());
    return false;
  }
  return true;
}

auto DeletionCoordinator::forget(std::string_view org, std::string_view type, const std::string& key) -> void {
  if (auto entry = state_.meta_cache.erase(key)) {
    metrics_.gauge_add(metric::WAL_USED_BYTES, org, type, -static_cast<std::int64_t>(entry->file_size));
  }
  state_.claims.release(key);
}

auto DeletionCoordinator::park(std::string_view org, std::string_view type, const std::string& key) -> void {
  auto account = storage_.resolve_account_for_key(key);
  if (auto r = pending_.add(org, account, key); !r) {
    core::logger()->error("[delete] persist pending delete of {} failed, retrying next sweep: {}", key,
                          core::describe(r.error()));
    std::lock_guard lock(unpersisted_mutex_);
    auto same = [&key](const PendingDelete& p) { return p.key == key; };
    if (std::none_of(unpersisted_.begin(), unpersisted_.end(), same)) {
      unpersisted_.push_back(PendingDelete{std::string(org), std::move(account), key});
    }
  }
  metrics_.gauge_add(metric::PENDING_DELETE_FILES, org, type, 1);
}

auto DeletionCoordinator::reclaim(std::string_view org, stream::StreamType type, const Segment& segment)
    -> Outcome {
  auto log = core::logger();
  const auto type_name = stream::to_string(type);
  if (locks_.is_locked(segment.key)) {
    log->debug("[delete] {} is leased, deferring", segment.key);
    park(org, type_name, segment.key);
    return Outcome::pending;
  }
  if (auto r = removing_.add(segment.key); !r) {
    log->warn("[delete] removing marker for {}: {}", segment.key, core::describe(r.error()));
  }
  if (!remove_file(segment.key)) {
    if (auto r = removing_.remove(segment.key); !r) {
      log->warn("[delete] clear removing marker for {}: {}", segment.key, core::describe(r.error()));
    }
    park(org, type_name, segment.key);
    return Outcome::pending;
  }
  forget(org, type_name, segment.key);
  if (auto r = removing_.remove(segment.key); !r) {
    log->warn("[delete] clear removing marker for {}: {}", segment.key, core::describe(r.error()));
  }
  return Outcome::deleted;
}

auto DeletionCoordinator::delete_consumed(std::string_view org, stream::StreamType type,
                                          const std::vector<Segment>& segments) -> DeleteStats {
  DeleteStats stats{};
  const auto type_name = stream::to_string(type);
  for (const auto& s : segments) {
    if (reclaim(org, type, s) == Outcome::deleted) {
      ++stats.deleted;
    } else {
      ++stats.pending;
    }
    metrics_.counter_add(metric::WAL_READ_BYTES, org, type_name, s.file_size);
  }
  return stats;
}

auto DeletionCoordinator::delete_direct(std::string_view org, stream::StreamType type,
                                        const std::vector<Segment>& segments) -> DeleteStats {
  DeleteStats stats{};
  for (const auto& s : segments) {
    if (reclaim(org, type, s) == Outcome::deleted) {
      ++stats.deleted;
    } else {
      ++stats.pending;
    }
  }
  return stats;
}

auto DeletionCoordinator::sweep_pending() -> std::expected<DeleteStats, error> {
  auto log = core::logger();
  DeleteStats stats{};

  std::vector<PendingDelete> retry;
  {
    std::lock_guard lock(unpersisted_mutex_);
    retry.swap(unpersisted_);
  }
  for (auto& p : retry) {
    if (!locks_.is_locked(p.key) && remove_file(p.key)) {
      auto labels = labels_for(p.key);
      forget(labels.org, labels.type, p.key);
      metrics_.gauge_add(metric::PENDING_DELETE_FILES, labels.org, labels.type, -1);
      ++stats.deleted;
      continue;
    }
    if (auto r = pending_.add(p.org, p.account, p.key); !r) {
      std::lock_guard lock(unpersisted_mutex_);
      unpersisted_.push_back(std::move(p));
      ++stats.pending;
    }
  }

  auto entries = pending_.list();
  if (!entries) return std::unexpected(entries.error());
  for (const auto& p : *entries) {
    if (locks_.is_locked(p.key)) {
      ++stats.pending;
      continue;
    }
    if (auto r = removing_.add(p.key); !r) {
      log->warn("[delete] removing marker for {}: {}", p.key, core::describe(r.error()));
    }
    if (!remove_file(p.key)) {
      if (auto r = removing_.remove(p.key); !r) {
        log->warn("[delete] clear removing marker for {}: {}", p.key, core::describe(r.error()));
      }
      ++stats.pending;
      continue;
    }
    auto labels = labels_for(p.key);
    forget(labels.org, labels.type, p.key);
    if (auto r = pending_.remove(p.key); !r) {
      log->warn("[delete] drop pending entry {}: {}", p.key, core::describe(r.error()));
    }
    if (auto r = removing_.remove(p.key); !r) {
      log->warn("[delete] clear removing marker for {}: {}", p.key, core::describe(r.error()));
    }
    metrics_.gauge_add(metric::PENDING_DELETE_FILES, labels.org, labels.type, -1);
    ++stats.deleted;
  }
  if (stats.deleted > 0) log->info("[delete] swept {} pending segments, {} still pending", stats.deleted, stats.pending);
  return stats;
}

auto DeletionCoordinator::seed_claims() -> std::expected<std::size_t, error> {
  auto entries = pending_.list();
  if (!entries) return std::unexpected(entries.error());
  std::size_t n = 0;
  for (const auto& p : *entries) {
    // keys parked by recover_removing are already claimed and counted
    if (!state_.claims.try_claim(p.key)) continue;
    auto labels = labels_for(p.key);
    metrics_.gauge_add(metric::PENDING_DELETE_FILES, labels.org, labels.type, 1);
    ++n;
  }
  if (n > 0) core::logger()->info("[delete] seeded {} pending deletes into the claim set", n);
  return n;
}

auto DeletionCoordinator::recover_removing() -> std::expected<std::size_t, error> {
  auto log = core::logger();
  auto markers = removing_.list();
  if (!markers) return std::unexpected(markers.error());
  std::size_t n = 0;
  for (const auto& key : *markers) {
    if (!remove_file(key)) {
      auto labels = labels_for(key);
      if (state_.claims.try_claim(key)) park(labels.org, labels.type, key);
    } else {
      state_.meta_cache.erase(key);
      ++n;
    }
    if (auto r = removing_.remove(key); !r) {
      return std::unexpected(r.error());
    }
  }
  if (n > 0) log->info("[delete] finished {} interrupted deletions", n);
  return n;
}

auto DeletionCoordinator::unpersisted_pending() const -> std::size_t {
  std::lock_guard lock(unpersisted_mutex_);
  return unpersisted_.size();
}

} // namespace strata::compact
