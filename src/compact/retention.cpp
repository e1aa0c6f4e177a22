#include "strata/compact/retention.hpp"

#include <cstdio>
#include <utility>

namespace strata::compact {

auto to_string(RetentionVerdict v) noexcept -> std::string_view {
  switch (v) {
    case RetentionVerdict::merge: return "merge";
    case RetentionVerdict::stream_deleting: return "stream_deleting";
    case RetentionVerdict::schema_missing: return "schema_missing";
    case RetentionVerdict::expired: return "expired";
  }
  return "unknown";
}

auto retention_cutoff_date(std::chrono::system_clock::time_point now, std::int64_t days) -> std::string {
  using namespace std::chrono;
  const auto day = floor<std::chrono::days>(now) - std::chrono::days{days};
  const year_month_day ymd{day};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return std::string(buf);
}

RetentionGatekeeper::RetentionGatekeeper(stream::StreamMetadataService& streams,
                                         std::int64_t global_retention_days, Clock now)
    : streams_(streams), global_retention_days_(global_retention_days), now_(std::move(now)) {
  if (!now_) now_ = [] { return std::chrono::system_clock::now(); };
}

auto RetentionGatekeeper::effective_retention_days(const stream::StreamSettings& settings) const noexcept
    -> std::int64_t {
  return settings.data_retention > 0 ? settings.data_retention : global_retention_days_;
}

auto RetentionGatekeeper::check(const wal::PartitionPrefix& prefix)
    -> std::expected<RetentionDecision, core::error> {
  if (streams_.is_stream_being_deleted(prefix.org, prefix.stream_type, prefix.stream_name)) {
    return RetentionDecision{RetentionVerdict::stream_deleting, {}};
  }
  auto latest = streams_.get_latest_schema(prefix.org, prefix.stream_type, prefix.stream_name);
  if (!latest) return std::unexpected(latest.error());

  RetentionDecision out{RetentionVerdict::merge, std::move(*latest)};
  if (out.stream.schema.empty()) {
    out.verdict = RetentionVerdict::schema_missing;
    return out;
  }
  const auto days = effective_retention_days(out.stream.settings);
  if (days > 0 && prefix.date < retention_cutoff_date(now_(), days)) {
    out.verdict = RetentionVerdict::expired;
  }
  return out;
}

} // namespace strata::compact
