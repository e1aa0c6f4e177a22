#pragma once

/** \file retention.hpp
 *  \brief Decides whether a partition is merged or deleted outright.
 *
 * Checks run in order: stream being deleted, stream schema missing, partition
 * date older than the retention cutoff. The first that applies wins.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

#include "strata/error.hpp"
#include "strata/stream/stream_registry.hpp"
#include "strata/wal/wal_path.hpp"

namespace strata::compact {

using Clock = std::function<std::chrono::system_clock::time_point()>;

enum class RetentionVerdict {
  merge,
  stream_deleting,
  schema_missing,
  expired,
};

auto to_string(RetentionVerdict v) noexcept -> std::string_view;

struct RetentionDecision {
  RetentionVerdict verdict{RetentionVerdict::merge};
  stream::StreamSchema stream;    // populated unless verdict == stream_deleting
};

/** \brief "YYYY-MM-DD" (UTC) of `now` minus `days`. */
auto retention_cutoff_date(std::chrono::system_clock::time_point now, std::int64_t days) -> std::string;

class RetentionGatekeeper {
public:
  /** \param global_retention_days default when a stream sets none; 0 = never expire. */
  RetentionGatekeeper(stream::StreamMetadataService& streams, std::int64_t global_retention_days, Clock now);

  /** \brief Schema lookup failures are returned; the caller releases the group. */
  auto check(const wal::PartitionPrefix& prefix) -> std::expected<RetentionDecision, core::error>;

  /** \brief Stream setting when positive, otherwise the global default. */
  [[nodiscard]] auto effective_retention_days(const stream::StreamSettings& settings) const noexcept
      -> std::int64_t;

private:
  stream::StreamMetadataService& streams_;
  std::int64_t global_retention_days_;
  Clock now_;
};

} // namespace strata::compact
