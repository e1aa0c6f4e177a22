#pragma once

/** \file partition_grouper.hpp
 *  \brief Turns scanned segment paths into claimed, partition-keyed groups.
 *
 * For every path: derive the segment key, skip keys already claimed, read the
 * footer metadata (cache first), delete segments whose footer carries empty
 * metadata, derive the partition key and claim the segment. A segment whose
 * footer cannot be read yet (a writer may still be appending) is left alone
 * and seen again on the next pass. Groups keep
 * first-seen order; segments inside a group keep scan order.
 *
 * Not thread-safe: one grouper belongs to one pass.
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "strata/compact/engine_state.hpp"
#include "strata/compact/segment.hpp"
#include "strata/compact/services.hpp"

namespace strata::compact {

struct GroupingStats {
  std::size_t seen{0};
  std::size_t claimed{0};
  std::size_t already_claimed{0};
  std::size_t vanished{0};          // file disappeared between scan and footer read
  std::size_t corrupt_deleted{0};   // footer metadata was the default value
  std::size_t unreadable{0};        // footer missing or invalid; left in place
  std::size_t invalid_keys{0};
};

class PartitionGrouper {
public:
  PartitionGrouper(std::filesystem::path wal_root, EngineState& state, MetricsSink& metrics);

  /** \brief Pre-populate a group (a deferred one); later segments of the same partition append to it. */
  auto seed(PartitionGroup group) -> void;

  /** \brief Group one scanner batch. */
  auto prepare(const std::vector<std::filesystem::path>& paths) -> void;

  /** \brief Hand over the accumulated groups in first-seen order and reset. */
  [[nodiscard]] auto take() -> std::vector<PartitionGroup>;

  [[nodiscard]] auto pending_groups() const noexcept -> std::size_t { return groups_.size(); }
  [[nodiscard]] auto stats() const noexcept -> const GroupingStats& { return stats_; }

private:
  auto append(const std::string& partition, Segment segment) -> void;
  auto discard_empty(const std::string& key, const std::filesystem::path& path) -> void;

  std::filesystem::path wal_root_;
  EngineState& state_;
  MetricsSink& metrics_;
  std::vector<PartitionGroup> groups_;
  std::unordered_map<std::string, std::size_t> index_;
  GroupingStats stats_{};
};

} // namespace strata::compact
