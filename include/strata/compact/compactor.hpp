#pragma once

/** \file compactor.hpp
 *  \brief One compaction pass: sweep, scan, group, merge, publish, delete.
 *
 * A pass first retries pending deletes, then walks the WAL tree, groups newly
 * found segments by partition and dispatches each group to the worker pool.
 * A worker owns its group exclusively: it gates the group on retention, then
 * repeatedly selects, merges, publishes and deletes until the group is empty.
 *
 * Recoverable failures keep the unconsumed segments claimed and park the group
 * in a deferred list; the next pass that starts after merge_retry_delay seeds
 * the grouper with it, so new segments of the same partition join the retry.
 * Groups below the merge threshold are parked the same way without delay.
 *
 * A merge that fails with an internal error is deferred like any other
 * failure, but run_pass() then returns that error instead of the stats so the
 * caller sees a pass that cannot make progress on its own.
 *
 * run_pass() must not be called concurrently with itself.
 */

#include <atomic>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <mutex>
#include <vector>

#include "strata/compact/deletion_coordinator.hpp"
#include "strata/compact/engine_state.hpp"
#include "strata/compact/merge_engine.hpp"
#include "strata/compact/retention.hpp"
#include "strata/compact/segment.hpp"
#include "strata/compact/services.hpp"
#include "strata/compact/uploader.hpp"
#include "strata/compact/worker_pool.hpp"
#include "strata/core/config.hpp"
#include "strata/error.hpp"
#include "strata/stream/stream_registry.hpp"

namespace strata::compact {

/** \brief Everything the engine talks to; all references must outlive the compactor. */
struct Collaborators {
  stream::StreamMetadataService& streams;
  FileListIndex& file_list;
  ObjectStorage& storage;
  LockRegistry& locks;
  PendingDeleteStore& pending;
  RemovingMarkerStore& removing;
  ColumnarMergeService& merger;
  InvertedIndexBuilder& indexer;
  MetricsSink& metrics;
};

struct PassStats {
  std::size_t scanned{0};
  std::size_t claimed{0};
  std::size_t groups{0};
  std::size_t merged_outputs{0};
  std::size_t merged_segments{0};
  std::size_t deleted{0};
  std::size_t pending{0};
  std::size_t deferred{0};
  std::size_t skipped_small{0};
  std::size_t retention_deleted{0};
  std::size_t corrupt_deleted{0};
  std::size_t errors{0};
};

/** \brief What the drain controller drives. */
class PassRunner {
public:
  virtual ~PassRunner() = default;
  virtual auto run_pass(bool draining) -> std::expected<PassStats, core::error> = 0;
  /** \brief True while claimed, deferred or newly found segments remain. */
  virtual auto has_pending_work() -> bool = 0;
};

class Compactor final : public PassRunner {
public:
  Compactor(core::CompactionConfig config, EngineState& state, Collaborators services, Clock now = {});

  Compactor(const Compactor&) = delete;
  Compactor& operator=(const Compactor&) = delete;

  /** \brief Register before the first pass. */
  auto add_observer(MergeObserver& observer) -> void;

  /** \brief Finish interrupted deletions and claim pending deletes. Call once before the first pass. */
  auto start() -> std::expected<void, core::error>;

  auto run_pass(bool draining = false) -> std::expected<PassStats, core::error> override;
  auto has_pending_work() -> bool override;

  [[nodiscard]] auto deferred_groups() const -> std::size_t;
  [[nodiscard]] auto config() const noexcept -> const core::CompactionConfig& { return config_; }

private:
  struct Counters {
    std::atomic<std::size_t> groups{0};
    std::atomic<std::size_t> merged_outputs{0};
    std::atomic<std::size_t> merged_segments{0};
    std::atomic<std::size_t> deleted{0};
    std::atomic<std::size_t> pending{0};
    std::atomic<std::size_t> deferred{0};
    std::atomic<std::size_t> skipped_small{0};
    std::atomic<std::size_t> retention_deleted{0};
    std::atomic<std::size_t> errors{0};
    std::atomic<std::size_t> fatal{0};

    auto reset() -> void {
      for (auto* c : {&groups, &merged_outputs, &merged_segments, &deleted, &pending, &deferred, &skipped_small,
                      &retention_deleted, &errors, &fatal}) {
        c->store(0, std::memory_order_relaxed);
      }
    }
  };

  auto dispatch(std::vector<PartitionGroup> groups, bool draining) -> void;
  auto process_group(PartitionGroup group, bool draining, std::size_t worker) -> void;
  auto defer(PartitionGroup group, bool delayed) -> void;
  auto take_ready_deferred() -> std::vector<PartitionGroup>;
  auto release_all(const std::vector<Segment>& segments) -> void;

  core::CompactionConfig config_;
  EngineState& state_;
  Collaborators services_;
  RetentionGatekeeper retention_;
  MergeEngine merge_;
  Uploader uploader_;
  DeletionCoordinator deletion_;

  mutable std::mutex deferred_mutex_;
  std::vector<PartitionGroup> deferred_;
  Counters counters_;
  std::atomic<std::size_t> last_claimed_{0};

  WorkerPool pool_;   // declared last so workers are joined first
};

} // namespace strata::compact
