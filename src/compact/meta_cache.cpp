#include "strata/compact/meta_cache.hpp"

#include <mutex>

namespace strata::compact {

auto SegmentMetaCache::get(std::string_view key) const -> std::optional<CachedSegment> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(std::string(key));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

auto SegmentMetaCache::put(std::string_view key, CachedSegment entry) -> void {
  std::unique_lock lock(mutex_);
  entries_.insert_or_assign(std::string(key), entry);
}

auto SegmentMetaCache::erase(std::string_view key) -> std::optional<CachedSegment> {
  std::unique_lock lock(mutex_);
  auto it = entries_.find(std::string(key));
  if (it == entries_.end()) return std::nullopt;
  auto out = it->second;
  entries_.erase(it);
  return out;
}

auto SegmentMetaCache::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace strata::compact
