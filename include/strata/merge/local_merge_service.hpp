#pragma once

/** \file local_merge_service.hpp
 *  \brief ColumnarMergeService over local columnar segment files.
 *
 * Each input is decoded and projected onto the request schema (missing
 * columns become null, mismatched types are cast). Rows are ordered by
 * `_timestamp` descending and encoded into a single output carrying the
 * requested bloom filters and the caller-provided footer metadata.
 */

#include "strata/compact/services.hpp"

namespace strata::merge {

class LocalMergeService final : public compact::ColumnarMergeService {
public:
  explicit LocalMergeService(int zstd_level = 3) : zstd_level_(zstd_level) {}

  auto merge(const compact::MergeRequest& request) -> std::expected<compact::MergeResult, core::error> override;

private:
  int zstd_level_;
};

} // namespace strata::merge
