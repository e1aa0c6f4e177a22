#include "strata/merge/local_merge_service.hpp"
#include "strata/format/columnar_file.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace strata::merge {

using core::error;
using core::error_code;

auto LocalMergeService::merge(const compact::MergeRequest& request)
    -> std::expected<compact::MergeResult, error> {
  if (request.inputs.empty()) {
    return std::unexpected(error{error_code::precondition_failed, "no input files", "merge.local"});
  }
  const auto& fields = request.schema.fields();
  format::RecordBatch out{};
  out.schema = request.schema;
  out.columns.resize(fields.size());

  for (const auto& in : request.inputs) {
    auto decoded = format::read_file(in.path);
    if (!decoded) {
      return std::unexpected(error{decoded.error().code,
                                   "read " + in.key + ": " + decoded.error().message, "merge.local"});
    }
    const auto& batch = decoded->batch;
    const std::size_t rows = batch.num_rows();
    for (std::size_t f = 0; f < fields.size(); ++f) {
      auto& dst = out.columns[f];
      const auto* src = batch.column(fields[f].name);
      if (!src) {
        dst.insert(dst.end(), rows, format::Value{});
        continue;
      }
      dst.reserve(dst.size() + rows);
      for (const auto& v : *src) dst.push_back(format::cast_value(v, fields[f].type));
    }
  }

  // newest first
  if (auto ts_idx = out.schema.index_of(format::TIMESTAMP_COL)) {
    const auto& ts = out.columns[*ts_idx];
    std::vector<std::size_t> order(ts.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    auto key = [&ts](std::size_t i) -> std::int64_t {
      const auto* p = std::get_if<std::int64_t>(&ts[i]);
      return p ? *p : std::numeric_limits<std::int64_t>::min();
    };
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b){ return key(a) > key(b); });
    for (auto& col : out.columns) {
      std::vector<format::Value> sorted;
      sorted.reserve(col.size());
      for (auto i : order) sorted.push_back(std::move(col[i]));
      col = std::move(sorted);
    }
  }

  format::EncodeOptions opts{};
  opts.zstd_level = zstd_level_;
  opts.bloom_filter_fields = request.bloom_filter_fields;
  opts.meta = request.meta;
  auto bytes = format::encode_batch(out, opts);
  if (!bytes) return std::unexpected(bytes.error());
  return compact::MergeResult{compact::MergeSingle{std::move(*bytes)}};
}

} // namespace strata::merge
