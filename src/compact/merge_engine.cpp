#include "strata/compact/merge_engine.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <system_error>
#include <variant>

#include "strata/core/log.hpp"
#include "strata/format/columnar_file.hpp"

namespace strata::compact {

namespace fs = std::filesystem;
using core::error;
using core::error_code;

namespace {

auto merged_meta(const std::vector<Segment>& segments) -> format::FileMeta {
  format::FileMeta m{};
  m.min_ts = std::numeric_limits<std::int64_t>::max();
  m.max_ts = std::numeric_limits<std::int64_t>::min();
  for (const auto& s : segments) {
    m.min_ts = std::min(m.min_ts, s.meta.min_ts);
    m.max_ts = std::max(m.max_ts, s.meta.max_ts);
    m.records += s.meta.records;
    m.original_size += s.meta.original_size;
  }
  return m;
}

auto needs_index(const format::Schema& schema, const stream::StreamSettings& settings) -> bool {
  auto present = [&schema](const std::vector<std::string>& names) {
    return std::any_of(names.begin(), names.end(), [&schema](const auto& n) { return schema.contains(n); });
  };
  return present(settings.full_text_search_keys) || present(settings.index_fields);
}

auto present_only(const std::vector<std::string>& names, const format::Schema& schema)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& n : names) {
    if (schema.contains(n)) out.push_back(n);
  }
  return out;
}

} // namespace

auto sort_by_min_ts(std::vector<Segment>& segments) -> void {
  std::stable_sort(segments.begin(), segments.end(),
                   [](const Segment& a, const Segment& b) { return a.meta.min_ts < b.meta.min_ts; });
}

MergeEngine::MergeEngine(const core::CompactionConfig& config, ColumnarMergeService& merger,
                         ObjectStorage& storage, InvertedIndexBuilder& indexer)
    : config_(config), merger_(merger), storage_(storage), indexer_(indexer) {}

auto MergeEngine::should_merge(const std::vector<Segment>& sorted, std::size_t stream_fields,
                               std::size_t field_limit, bool force) const -> bool {
  if (force) return true;
  std::uint64_t total = 0;
  for (const auto& s : sorted) total += s.meta.original_size;
  if (total >= config_.max_file_size()) return true;
  if (field_limit > 0 && stream_fields >= field_limit) return true;

  const auto stale_before = fs::file_time_type::clock::now() - config_.max_file_retention_time;
  for (const auto& s : sorted) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(s.path, ec);
    if (ec) continue;
    if (mtime <= stale_before) return true;
  }
  return false;
}

auto MergeEngine::select(const std::vector<Segment>& sorted, std::size_t field_limit) const
    -> MergeSelection {
  auto log = core::logger();
  const auto max_size = config_.max_file_size();
  MergeSelection out{};
  std::uint64_t original = 0;
  std::uint64_t compressed = 0;

  for (const auto& seg : sorted) {
    auto schema = format::read_file_schema(seg.path);
    if (!schema) {
      log->warn("[merge] skip {}: {}", seg.key, schema.error().message);
      out.unreadable.push_back(seg);
      continue;
    }
    format::Schema candidate_union = out.union_schema;
    if (field_limit > 0) {
      const format::Schema pair[] = {out.union_schema, *schema};
      candidate_union = format::union_schema(pair);
    }
    if (!out.selected.empty()) {
      if (original + seg.meta.original_size > max_size) break;
      if (compressed + seg.meta.compressed_size > max_size) break;
      if (field_limit > 0 && candidate_union.size() > field_limit) break;
    }
    original += seg.meta.original_size;
    compressed += seg.meta.compressed_size;
    out.selected.push_back(seg);
    out.schemas.push_back(std::move(*schema));
    if (field_limit > 0) out.union_schema = std::move(candidate_union);
  }
  if (field_limit == 0) out.union_schema = format::union_schema(out.schemas);
  return out;
}

auto MergeEngine::merge(const wal::PartitionPrefix& prefix, const stream::StreamSchema& stream,
                        MergeSelection selection) -> std::expected<MergeOutcome, error> {
  if (selection.selected.empty()) {
    return std::unexpected(error{error_code::precondition_failed, "empty selection", "compact.merge"});
  }
  auto meta = merged_meta(selection.selected);
  if (meta.records == 0) {
    return std::unexpected(error{error_code::precondition_failed,
                                 "selected segments hold no records (first " + selection.selected.front().key + ")",
                                 "compact.merge"});
  }

  const auto& settings = stream::get_stream_settings(stream);
  format::Schema schema = settings.defined_schema_fields.empty()
                              ? selection.union_schema
                              : stream::generate_schema_for_defined_fields(selection.union_schema, settings);

  MergeRequest request{};
  request.stream_type = prefix.stream_type;
  request.stream_name = prefix.stream_name;
  request.schema = schema;
  request.bloom_filter_fields = present_only(settings.bloom_filter_fields, schema);
  request.meta = meta;
  request.inputs.reserve(selection.selected.size());
  for (const auto& s : selection.selected) request.inputs.push_back(MergeInput{s.key, s.path, s.meta});

  auto result = merger_.merge(request);
  if (!result) return std::unexpected(result.error());
  if (std::holds_alternative<MergeMultiple>(*result)) {
    return std::unexpected(error{error_code::internal,
                                 "merge produced multiple files for " + selection.selected.front().key,
                                 "compact.merge"});
  }
  auto bytes = std::get<MergeSingle>(std::move(*result)).bytes;
  if (bytes.empty()) {
    return std::unexpected(error{error_code::data_integrity,
                                 "merged output is empty for " + selection.selected.front().key, "compact.merge"});
  }
  meta.compressed_size = bytes.size();

  auto file_key = wal::storage_file_name(selection.selected.front().key);
  if (!file_key) return std::unexpected(file_key.error());
  auto account = storage_.resolve_account_for_key(*file_key);

  if (config_.inverted_index_enabled && stream::support_index(prefix.stream_type) && needs_index(schema, settings)) {
    IndexRequest ireq{};
    ireq.account = account;
    ireq.file_key = *file_key;
    ireq.full_text_search_fields = present_only(settings.full_text_search_keys, schema);
    ireq.index_fields = present_only(settings.index_fields, schema);
    ireq.schema = schema;
    ireq.merged_bytes = bytes;
    auto size = indexer_.build(ireq);
    if (!size) return std::unexpected(size.error());
    meta.index_size = *size;
  }

  return MergeOutcome{std::move(account), std::move(*file_key), meta, std::move(bytes), std::move(schema),
                      std::move(selection.selected)};
}

} // namespace strata::compact
