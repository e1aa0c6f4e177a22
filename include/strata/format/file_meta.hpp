#pragma once

/** \file file_meta.hpp
 *  \brief Footer metadata carried by every segment and merged file.
 */

#include <cstdint>

namespace strata::format {

struct FileMeta {
  std::int64_t min_ts{0};
  std::int64_t max_ts{0};
  std::uint64_t records{0};
  std::uint64_t original_size{0};
  std::uint64_t compressed_size{0};   // 0 until merged
  std::uint64_t index_size{0};        // 0 until an inverted index exists
  bool flattened{false};

  /** \brief Default-valued metadata marks an empty or corrupt segment. */
  [[nodiscard]] auto is_empty() const noexcept -> bool { return *this == FileMeta{}; }

  friend bool operator==(const FileMeta&, const FileMeta&) = default;
};

} // namespace strata::format
