#pragma once

/** \file stream_type.hpp
 *  \brief Stream kinds and their path spelling.
 */

#include <optional>
#include <string_view>

namespace strata::stream {

enum class StreamType {
  logs,
  metrics,
  traces,
  metadata,
  enrichment_tables,
  filelist,
  index,
};

constexpr auto to_string(StreamType t) noexcept -> std::string_view {
  switch (t) {
    case StreamType::logs: return "logs";
    case StreamType::metrics: return "metrics";
    case StreamType::traces: return "traces";
    case StreamType::metadata: return "metadata";
    case StreamType::enrichment_tables: return "enrichment_tables";
    case StreamType::filelist: return "file_list";
    case StreamType::index: return "index";
  }
  return "logs";
}

/** \brief Unknown spellings map to nullopt; callers decide the fallback. */
constexpr auto parse_stream_type(std::string_view s) noexcept -> std::optional<StreamType> {
  if (s == "logs") return StreamType::logs;
  if (s == "metrics") return StreamType::metrics;
  if (s == "traces") return StreamType::traces;
  if (s == "metadata") return StreamType::metadata;
  if (s == "enrichment_tables") return StreamType::enrichment_tables;
  if (s == "file_list") return StreamType::filelist;
  if (s == "index") return StreamType::index;
  return std::nullopt;
}

/** \brief Whether merged files of this stream type get an inverted index. */
constexpr auto support_index(StreamType t) noexcept -> bool {
  return t == StreamType::logs || t == StreamType::traces || t == StreamType::metadata;
}

} // namespace strata::stream
