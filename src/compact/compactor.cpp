#include "strata/compact/compactor.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_set>
#include <utility>

#include "strata/compact/partition_grouper.hpp"
#include "strata/core/log.hpp"
#include "strata/wal/scanner.hpp"
#include "strata/wal/wal_path.hpp"

namespace strata::compact {

namespace fs = std::filesystem;
using core::error;
using core::error_code;

Compactor::Compactor(core::CompactionConfig config, EngineState& state, Collaborators services, Clock now)
    : config_(std::move(config)),
      state_(state),
      services_(services),
      retention_(services.streams, config_.data_retention_days, std::move(now)),
      merge_(config_, services.merger, services.storage, services.indexer),
      uploader_(services.storage, services.file_list, services.metrics),
      deletion_(config_.wal_dir, state, services.locks, services.pending, services.removing, services.storage,
                services.metrics),
      pool_(config_.file_move_thread_num, config_.worker_queue_capacity) {}

auto Compactor::add_observer(MergeObserver& observer) -> void { uploader_.add_observer(observer); }

auto Compactor::start() -> std::expected<void, error> {
  auto recovered = deletion_.recover_removing();
  if (!recovered) return std::unexpected(recovered.error());
  auto seeded = deletion_.seed_claims();
  if (!seeded) return std::unexpected(seeded.error());
  core::logger()->info("[compact] started with {} workers, wal {}", pool_.num_threads(), config_.wal_dir.string());
  return {};
}

auto Compactor::release_all(const std::vector<Segment>& segments) -> void {
  for (const auto& s : segments) state_.claims.release(s.key);
}

auto Compactor::defer(PartitionGroup group, bool delayed) -> void {
  if (group.segments.empty()) return;
  group.not_before = delayed ? std::chrono::steady_clock::now() + config_.merge_retry_delay
                             : std::chrono::steady_clock::time_point{};
  counters_.deferred.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard lock(deferred_mutex_);
  deferred_.push_back(std::move(group));
}

auto Compactor::take_ready_deferred() -> std::vector<PartitionGroup> {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard lock(deferred_mutex_);
  std::vector<PartitionGroup> ready;
  std::vector<PartitionGroup> waiting;
  for (auto& g : deferred_) {
    if (g.not_before <= now) {
      ready.push_back(std::move(g));
    } else {
      waiting.push_back(std::move(g));
    }
  }
  deferred_ = std::move(waiting);
  return ready;
}

auto Compactor::deferred_groups() const -> std::size_t {
  std::lock_guard lock(deferred_mutex_);
  return deferred_.size();
}

auto Compactor::dispatch(std::vector<PartitionGroup> groups, bool draining) -> void {
  for (auto& g : groups) {
    counters_.groups.fetch_add(1, std::memory_order_relaxed);
    auto task = [this, group = std::move(g), draining](std::size_t worker) mutable {
      process_group(std::move(group), draining, worker);
    };
    if (!pool_.submit(std::move(task))) {
      core::logger()->error("[compact] worker pool is shut down, dropping dispatch");
      counters_.errors.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

auto Compactor::process_group(PartitionGroup group, bool draining, std::size_t worker) -> void {
  auto log = core::logger();
  auto prefix = wal::split_prefix(group.partition_key);
  if (!prefix) {
    log->warn("[compact:{}] {}", worker, prefix.error().message);
    release_all(group.segments);
    counters_.errors.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  auto decision = retention_.check(*prefix);
  if (!decision) {
    log->error("[compact:{}] stream schema for {}/{}/{}: {}", worker, prefix->org,
               stream::to_string(prefix->stream_type), prefix->stream_name, core::describe(decision.error()));
    release_all(group.segments);
    counters_.errors.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  if (decision->verdict != RetentionVerdict::merge) {
    log->info("[compact:{}] deleting {} segments of {} ({})", worker, group.segments.size(), group.partition_key,
              to_string(decision->verdict));
    auto d = deletion_.delete_direct(prefix->org, prefix->stream_type, group.segments);
    counters_.retention_deleted.fetch_add(d.deleted, std::memory_order_relaxed);
    counters_.pending.fetch_add(d.pending, std::memory_order_relaxed);
    return;
  }

  const auto& settings = decision->stream.settings;
  const std::size_t field_limit = settings.field_limit > 0 ? settings.field_limit : config_.file_move_fields_limit;
  const std::size_t stream_fields = settings.defined_schema_fields.empty()
                                        ? decision->stream.schema.size()
                                        : settings.defined_schema_fields.size();

  sort_by_min_ts(group.segments);
  if (!merge_.should_merge(group.segments, stream_fields, field_limit, draining)) {
    log->debug("[compact:{}] {} below merge threshold, {} segments wait", worker, group.partition_key,
               group.segments.size());
    counters_.skipped_small.fetch_add(1, std::memory_order_relaxed);
    defer(std::move(group), false);
    return;
  }

  while (!group.segments.empty()) {
    auto selection = merge_.select(group.segments, field_limit);
    if (!selection.unreadable.empty()) {
      std::unordered_set<std::string> gone;
      for (const auto& s : selection.unreadable) {
        gone.insert(s.key);
        if (auto entry = state_.meta_cache.erase(s.key)) {
          services_.metrics.gauge_add(metric::WAL_USED_BYTES, prefix->org, stream::to_string(prefix->stream_type),
                                      -static_cast<std::int64_t>(entry->file_size));
        }
        state_.claims.release(s.key);
      }
      std::erase_if(group.segments, [&gone](const Segment& s) { return gone.contains(s.key); });
    }
    if (selection.selected.empty()) break;

    auto outcome = merge_.merge(*prefix, decision->stream, std::move(selection));
    if (!outcome) {
      const auto& e = outcome.error();
      if (core::is_fatal(e)) {
        log->critical("[compact:{}] {}: {}", worker, group.partition_key, core::describe(e));
        counters_.fatal.fetch_add(1, std::memory_order_relaxed);
      } else {
        log->error("[compact:{}] merge {}: {}", worker, group.partition_key, core::describe(e));
      }
      services_.metrics.counter_add(metric::MERGE_ERRORS, prefix->org, stream::to_string(prefix->stream_type), 1);
      counters_.errors.fetch_add(1, std::memory_order_relaxed);
      defer(std::move(group), true);
      return;
    }
    if (auto r = uploader_.publish(*prefix, *outcome); !r) {
      log->error("[compact:{}] publish {}: {}", worker, outcome->file_key, core::describe(r.error()));
      services_.metrics.counter_add(metric::MERGE_ERRORS, prefix->org, stream::to_string(prefix->stream_type), 1);
      counters_.errors.fetch_add(1, std::memory_order_relaxed);
      defer(std::move(group), true);
      return;
    }
    log->info("[compact:{}] merged {} segments into {} ({} records, {} bytes)", worker, outcome->consumed.size(),
              outcome->file_key, outcome->meta.records, outcome->meta.compressed_size);
    counters_.merged_outputs.fetch_add(1, std::memory_order_relaxed);
    counters_.merged_segments.fetch_add(outcome->consumed.size(), std::memory_order_relaxed);

    auto d = deletion_.delete_consumed(prefix->org, prefix->stream_type, outcome->consumed);
    counters_.deleted.fetch_add(d.deleted, std::memory_order_relaxed);
    counters_.pending.fetch_add(d.pending, std::memory_order_relaxed);

    std::unordered_set<std::string> consumed;
    for (const auto& s : outcome->consumed) consumed.insert(s.key);
    std::erase_if(group.segments, [&consumed](const Segment& s) { return consumed.contains(s.key); });
  }
}

auto Compactor::run_pass(bool draining) -> std::expected<PassStats, error> {
  auto log = core::logger();
  counters_.reset();
  PassStats stats{};

  if (auto swept = deletion_.sweep_pending(); swept) {
    stats.deleted += swept->deleted;
  } else {
    log->error("[compact] sweep pending deletes: {}", core::describe(swept.error()));
    ++stats.errors;
  }

  const auto files_root = config_.wal_dir / "files";
  PartitionGrouper grouper(config_.wal_dir, state_, services_.metrics);
  for (auto& g : take_ready_deferred()) grouper.seed(std::move(g));

  wal::SegmentScanner scanner(wal::ScanOptions{files_root, config_.wal_file_suffix, config_.file_push_limit, 1});
  scanner.start();
  while (auto batch = scanner.next_batch()) {
    grouper.prepare(*batch);
    dispatch(grouper.take(), draining);
  }
  dispatch(grouper.take(), draining);
  pool_.wait_idle();

  const auto& g = grouper.stats();
  stats.scanned = scanner.files_found();
  stats.claimed = g.claimed;
  stats.corrupt_deleted = g.corrupt_deleted;
  stats.groups = counters_.groups.load();
  stats.merged_outputs = counters_.merged_outputs.load();
  stats.merged_segments = counters_.merged_segments.load();
  stats.deleted += counters_.deleted.load();
  stats.pending = counters_.pending.load();
  stats.deferred = counters_.deferred.load();
  stats.skipped_small = counters_.skipped_small.load();
  stats.retention_deleted = counters_.retention_deleted.load();
  stats.errors += counters_.errors.load();
  last_claimed_.store(g.claimed);

  if (config_.clean_empty_dirs) wal::clean_empty_dirs(files_root, config_.empty_dir_min_age);

  if (stats.scanned > 0 || stats.groups > 0) {
    log->info("[compact] pass: scanned {} claimed {} groups {} merged {}->{} deleted {} pending {} deferred {} errors {}",
              stats.scanned, stats.claimed, stats.groups, stats.merged_segments, stats.merged_outputs,
              stats.deleted, stats.pending, stats.deferred, stats.errors);
  }
  if (auto fatal = counters_.fatal.load(); fatal > 0) {
    return std::unexpected(error{error_code::internal,
                                 std::to_string(fatal) + " group(s) hit an internal merge error and stay deferred",
                                 "compact.compactor"});
  }
  return stats;
}

auto Compactor::has_pending_work() -> bool {
  return state_.claims.size() > 0 || deferred_groups() > 0 || last_claimed_.load() > 0 ||
         deletion_.unpersisted_pending() > 0;
}

} // namespace strata::compact
