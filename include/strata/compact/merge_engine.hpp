#pragma once

/** \file merge_engine.hpp
 *  \brief Size- and field-bounded selection and merging of one partition's segments.
 *
 * Input segments are expected sorted by min_ts. select() takes the first
 * segment unconditionally, then keeps taking segments in order and stops at the
 * first one that would push the running original or compressed size past
 * max_file_size, or the union field count past the field limit. merge() turns
 * a selection into a single columnar output plus its metadata and optional
 * inverted index.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "strata/compact/segment.hpp"
#include "strata/compact/services.hpp"
#include "strata/core/config.hpp"
#include "strata/error.hpp"
#include "strata/format/schema.hpp"
#include "strata/stream/stream_registry.hpp"
#include "strata/wal/wal_path.hpp"

namespace strata::compact {

struct MergeSelection {
  std::vector<Segment> selected;
  std::vector<format::Schema> schemas;      // parallel to selected
  format::Schema union_schema;
  std::vector<Segment> unreadable;           // schema could not be read; treated as gone
};

struct MergeOutcome {
  std::string account;
  std::string file_key;
  format::FileMeta meta;
  std::vector<std::uint8_t> bytes;
  format::Schema schema;                     // schema actually written
  std::vector<Segment> consumed;
};

/** \brief Stable sort by min_ts, oldest first. */
auto sort_by_min_ts(std::vector<Segment>& segments) -> void;

class MergeEngine {
public:
  MergeEngine(const core::CompactionConfig& config, ColumnarMergeService& merger, ObjectStorage& storage,
              InvertedIndexBuilder& indexer);

  /** \brief Small-batch gate: false when the group is too small to merge yet.
   *
   * A group is merged when `force` is set, its total original size reaches
   * max_file_size, the stream's field count reaches `field_limit`, or any
   * segment was last written longer than max_file_retention_time ago.
   */
  [[nodiscard]] auto should_merge(const std::vector<Segment>& sorted, std::size_t stream_fields,
                                  std::size_t field_limit, bool force) const -> bool;

  /** \brief Greedy selection over `sorted`; `field_limit` 0 disables the field bound. */
  [[nodiscard]] auto select(const std::vector<Segment>& sorted, std::size_t field_limit) const
      -> MergeSelection;

  /** \brief Merge a non-empty selection into one output.
   *
   * Errors: precondition_failed for zero records, data_integrity for an empty
   * output, internal when the merge service returns more than one file. Merge
   * service and index build errors are passed through.
   */
  auto merge(const wal::PartitionPrefix& prefix, const stream::StreamSchema& stream,
             MergeSelection selection) -> std::expected<MergeOutcome, core::error>;

private:
  const core::CompactionConfig& config_;
  ColumnarMergeService& merger_;
  ObjectStorage& storage_;
  InvertedIndexBuilder& indexer_;
};

} // namespace strata::compact
