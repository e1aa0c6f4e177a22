#pragma once

/** \file deletion_coordinator.hpp
 *  \brief Reclaims WAL segments without pulling them from under active readers.
 *
 * A segment leased by a reader is parked in the pending-delete store and stays
 * claimed; sweep_pending() retries it on later passes. An unleased segment is
 * deleted under a removing marker, then forgotten by the metadata cache and the
 * claim set. A failed file delete falls back to the pending path.
 *
 * If the pending store itself cannot be written, the entry is kept in memory
 * and retried by the next sweep.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "strata/compact/engine_state.hpp"
#include "strata/compact/segment.hpp"
#include "strata/compact/services.hpp"
#include "strata/error.hpp"

namespace strata::compact {

struct DeleteStats {
  std::size_t deleted{0};
  std::size_t pending{0};

  auto operator+=(const DeleteStats& o) -> DeleteStats& {
    deleted += o.deleted;
    pending += o.pending;
    return *this;
  }
};

class DeletionCoordinator {
public:
  DeletionCoordinator(std::filesystem::path wal_root, EngineState& state, LockRegistry& locks,
                      PendingDeleteStore& pending, RemovingMarkerStore& removing, ObjectStorage& storage,
                      MetricsSink& metrics);

  /** \brief Delete segments that were merged into a recorded output; counts them as WAL reads. */
  auto delete_consumed(std::string_view org, stream::StreamType type, const std::vector<Segment>& segments)
      -> DeleteStats;

  /** \brief Delete segments dropped without merging (retention, deleted streams). */
  auto delete_direct(std::string_view org, stream::StreamType type, const std::vector<Segment>& segments)
      -> DeleteStats;

  /** \brief Retry every pending delete whose segment is no longer leased. */
  auto sweep_pending() -> std::expected<DeleteStats, core::error>;

  /** \brief Claim every pending key so no pass re-merges it. Call before the first pass. */
  auto seed_claims() -> std::expected<std::size_t, core::error>;

  /** \brief Finish deletions interrupted by a crash. Call before the first pass. */
  auto recover_removing() -> std::expected<std::size_t, core::error>;

  [[nodiscard]] auto unpersisted_pending() const -> std::size_t;

private:
  enum class Outcome { deleted, pending };

  auto reclaim(std::string_view org, stream::StreamType type, const Segment& segment) -> Outcome;
  auto park(std::string_view org, std::string_view type, const std::string& key) -> void;
  auto remove_file(const std::string& key) -> bool;
  auto forget(std::string_view org, std::string_view type, const std::string& key) -> void;

  std::filesystem::path wal_root_;
  EngineState& state_;
  LockRegistry& locks_;
  PendingDeleteStore& pending_;
  RemovingMarkerStore& removing_;
  ObjectStorage& storage_;
  MetricsSink& metrics_;

  mutable std::mutex unpersisted_mutex_;
  std::vector<PendingDelete> unpersisted_;
};

} // namespace strata::compact
