#include "strata/lock/file_locker.hpp"

namespace strata::lock {

Lease& Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    keys_ = std::move(other.keys_);
    other.owner_ = nullptr;
  }
  return *this;
}

auto Lease::release() -> void {
  if (owner_) {
    owner_->unlock(keys_);
    owner_ = nullptr;
  }
  keys_.clear();
}

auto SearchingFileLocker::lock(std::vector<std::string> keys) -> Lease {
  {
    std::lock_guard guard(mutex_);
    for (const auto& k : keys) ++counts_[k];
  }
  return Lease(this, std::move(keys));
}

auto SearchingFileLocker::is_locked(std::string_view segment_key) -> bool {
  std::lock_guard guard(mutex_);
  return counts_.find(std::string(segment_key)) != counts_.end();
}

auto SearchingFileLocker::locked_count() const -> std::size_t {
  std::lock_guard guard(mutex_);
  return counts_.size();
}

auto SearchingFileLocker::unlock(const std::vector<std::string>& keys) -> void {
  std::lock_guard guard(mutex_);
  for (const auto& k : keys) {
    auto it = counts_.find(k);
    if (it == counts_.end()) continue;
    if (--it->second == 0) counts_.erase(it);
  }
}

} // namespace strata::lock
