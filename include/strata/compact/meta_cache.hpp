#pragma once

/** \file meta_cache.hpp
 *  \brief Footer metadata cache for discovered segments, keyed by segment key.
 */

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "strata/format/file_meta.hpp"

namespace strata::compact {

struct CachedSegment {
  format::FileMeta meta;
  std::uint64_t file_size{0};
};

class SegmentMetaCache {
public:
  [[nodiscard]] auto get(std::string_view key) const -> std::optional<CachedSegment>;
  auto put(std::string_view key, CachedSegment entry) -> void;
  /** \brief Returns the removed entry, if any. */
  auto erase(std::string_view key) -> std::optional<CachedSegment>;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, CachedSegment> entries_;
};

} // namespace strata::compact
