#pragma once

/** \file uploader.hpp
 *  \brief Publishes a merged output: object storage first, then the file list.
 *
 * A merged file only counts as existing once it is recorded in the file list;
 * callers must not delete inputs before publish() succeeds. Observers run
 * after the record and cannot fail the publish.
 */

#include <expected>
#include <vector>

#include "strata/compact/merge_engine.hpp"
#include "strata/compact/services.hpp"
#include "strata/error.hpp"
#include "strata/wal/wal_path.hpp"

namespace strata::compact {

class Uploader {
public:
  Uploader(ObjectStorage& storage, FileListIndex& file_list, MetricsSink& metrics);

  auto add_observer(MergeObserver& observer) -> void;

  auto publish(const wal::PartitionPrefix& prefix, const MergeOutcome& outcome)
      -> std::expected<void, core::error>;

private:
  auto notify(const MergedFileEvent& event) -> void;

  ObjectStorage& storage_;
  FileListIndex& file_list_;
  MetricsSink& metrics_;
  std::vector<MergeObserver*> observers_;
};

} // namespace strata::compact
