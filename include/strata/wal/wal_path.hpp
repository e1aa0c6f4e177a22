#pragma once

/** \file wal_path.hpp
 *  \brief Segment key and partition key derivation for the local WAL tree.
 *
 * Segment keys are paths relative to the WAL root, '/'-separated:
 *
 *   files/<org>/<stream_type>/<stream>/<thread_id>/<YYYY>/<MM>/<DD>/<HH>/[...]/<name>.<suffix>
 *
 * The partition key is the segment's directory with the numeric thread_id
 * component removed, so that segments written by parallel ingestion workers
 * land in the same merge group:
 *
 *   files/<org>/<stream_type>/<stream>/<YYYY>/<MM>/<DD>/<HH>/[...]
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "strata/error.hpp"
#include "strata/stream/stream_type.hpp"

namespace strata::wal {

inline constexpr std::size_t THREAD_ID_COMPONENT = 4;

struct PartitionPrefix {
  std::string org;
  stream::StreamType stream_type{stream::StreamType::logs};
  std::string stream_name;
  std::string date;          // "YYYY-MM-DD"

  friend bool operator==(const PartitionPrefix&, const PartitionPrefix&) = default;
};

/** \brief Canonicalize `file` and strip the canonical `wal_root` prefix. */
auto segment_key(const std::filesystem::path& wal_root, const std::filesystem::path& file)
    -> std::expected<std::string, core::error>;

/** \brief Directory of the key without its thread_id component. */
auto partition_key(std::string_view segment_key) -> std::expected<std::string, core::error>;

/** \brief org/stream_type/stream/date of a partition key. */
auto split_prefix(std::string_view partition_key) -> std::expected<PartitionPrefix, core::error>;

/** \brief Deterministic object-storage key for a merged file anchored at `segment_key`.
 *
 * files/<org>/<stream_type>/<stream>/<YYYY>/.../<name>.<suffix>: the segment key with its
 * thread_id removed.
 */
auto storage_file_name(std::string_view segment_key) -> std::expected<std::string, core::error>;

} // namespace strata::wal
