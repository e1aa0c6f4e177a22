#pragma once

/** \file services.hpp
 *  \brief Collaborator interfaces the compaction engine depends on.
 *
 * The engine never talks to storage, the file-list index, the lock registry or
 * the columnar encoder directly; it is handed implementations of these
 * interfaces at construction. Local implementations live under storage/,
 * lock/, merge/, index/ and metrics/.
 *
 * Thread-safety: every implementation must tolerate concurrent calls from all
 * compaction workers.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "strata/error.hpp"
#include "strata/format/file_meta.hpp"
#include "strata/format/schema.hpp"
#include "strata/stream/stream_type.hpp"

namespace strata::compact {

/** \brief Metric names emitted by the engine; labels are (org, stream_type). */
namespace metric {
inline constexpr std::string_view WAL_USED_BYTES = "ingest_wal_used_bytes";
inline constexpr std::string_view WAL_READ_BYTES = "ingest_wal_read_bytes";
inline constexpr std::string_view MERGED_FILES = "compact_merged_files";
inline constexpr std::string_view MERGED_BYTES = "compact_merged_bytes";
inline constexpr std::string_view PENDING_DELETE_FILES = "compact_pending_delete_files";
inline constexpr std::string_view MERGE_ERRORS = "compact_merge_errors";
} // namespace metric

struct FileListEntry {
  std::string account;
  std::string key;
  format::FileMeta meta;
};

/** \brief Durable index of merged files; record() is the proof a merged file exists. */
class FileListIndex {
public:
  virtual ~FileListIndex() = default;
  virtual auto record(std::string_view account, std::string_view file_key,
                      const format::FileMeta& meta, bool is_deleted)
      -> std::expected<void, core::error> = 0;
  virtual auto exists(std::string_view account, std::string_view file_key)
      -> std::expected<bool, core::error> = 0;
  virtual auto list(std::string_view key_prefix)
      -> std::expected<std::vector<FileListEntry>, core::error> = 0;
};

class ObjectStorage {
public:
  virtual ~ObjectStorage() = default;
  /** \brief Idempotent: re-putting the same key with the same bytes is safe. */
  virtual auto put(std::string_view account, std::string_view key, std::span<const std::uint8_t> bytes)
      -> std::expected<void, core::error> = 0;
  virtual auto resolve_account_for_key(std::string_view key) -> std::string = 0;
};

/** \brief Read leases taken by concurrent readers (queries) on WAL segments. */
class LockRegistry {
public:
  virtual ~LockRegistry() = default;
  virtual auto is_locked(std::string_view segment_key) -> bool = 0;
};

struct PendingDelete {
  std::string org;
  std::string account;
  std::string key;

  friend bool operator==(const PendingDelete&, const PendingDelete&) = default;
};

class PendingDeleteStore {
public:
  virtual ~PendingDeleteStore() = default;
  virtual auto list() -> std::expected<std::vector<PendingDelete>, core::error> = 0;
  /** \brief Adding a key that is already pending is a no-op. */
  virtual auto add(std::string_view org, std::string_view account, std::string_view key)
      -> std::expected<void, core::error> = 0;
  /** \brief Removing an absent key is a no-op. */
  virtual auto remove(std::string_view key) -> std::expected<void, core::error> = 0;
};

/** \brief Marks segments whose deletion is in progress so a crash mid-delete can be finished. */
class RemovingMarkerStore {
public:
  virtual ~RemovingMarkerStore() = default;
  virtual auto add(std::string_view key) -> std::expected<void, core::error> = 0;
  virtual auto remove(std::string_view key) -> std::expected<void, core::error> = 0;
  virtual auto list() -> std::expected<std::vector<std::string>, core::error> = 0;
};

struct MergeInput {
  std::string key;                 // logical key relative to the WAL root
  std::filesystem::path path;      // absolute path of the segment
  format::FileMeta meta;
};

struct MergeRequest {
  stream::StreamType stream_type{stream::StreamType::logs};
  std::string stream_name;
  format::Schema schema;                         // output schema
  std::vector<std::string> bloom_filter_fields;
  format::FileMeta meta;                         // metadata to store in the output footer
  std::vector<MergeInput> inputs;                // oldest first
};

struct MergeSingle {
  std::vector<std::uint8_t> bytes;
};

/** \brief Produced only by downsampling pipelines; the compactor rejects it. */
struct MergeMultiple {
  std::vector<std::vector<std::uint8_t>> files;
};

using MergeResult = std::variant<MergeSingle, MergeMultiple>;

class ColumnarMergeService {
public:
  virtual ~ColumnarMergeService() = default;
  virtual auto merge(const MergeRequest& request) -> std::expected<MergeResult, core::error> = 0;
};

struct IndexRequest {
  std::string account;
  std::string file_key;                          // key of the merged file
  std::vector<std::string> full_text_search_fields;
  std::vector<std::string> index_fields;
  format::Schema schema;                         // schema actually produced
  std::span<const std::uint8_t> merged_bytes;    // row source
};

class InvertedIndexBuilder {
public:
  virtual ~InvertedIndexBuilder() = default;
  /** \brief Returns the size in bytes of the stored index. */
  virtual auto build(const IndexRequest& request) -> std::expected<std::uint64_t, core::error> = 0;
};

/** \brief Fire-and-forget metrics; never on the correctness path. */
class MetricsSink {
public:
  virtual ~MetricsSink() = default;
  virtual auto gauge_add(std::string_view name, std::string_view org, std::string_view stream_type,
                         std::int64_t delta) -> void = 0;
  virtual auto counter_add(std::string_view name, std::string_view org, std::string_view stream_type,
                           std::uint64_t delta) -> void = 0;
};

struct MergedFileEvent {
  std::string org;
  stream::StreamType stream_type{stream::StreamType::logs};
  std::string stream_name;
  std::string account;
  std::string file_key;
  format::FileMeta meta;
  std::vector<std::string> consumed_keys;
};

/** \brief Post-record subscriber; failures are logged and never affect the pipeline. */
class MergeObserver {
public:
  virtual ~MergeObserver() = default;
  virtual auto on_merged(const MergedFileEvent& event) -> std::expected<void, core::error> = 0;
};

} // namespace strata::compact
