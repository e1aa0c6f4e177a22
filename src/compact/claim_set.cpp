#include "strata/compact/claim_set.hpp"

#include <mutex>

namespace strata::compact {

auto ClaimSet::try_claim(std::string_view key) -> bool {
  std::unique_lock lock(mutex_);
  return keys_.emplace(key).second;
}

auto ClaimSet::release(std::string_view key) -> bool {
  std::unique_lock lock(mutex_);
  return keys_.erase(std::string(key)) > 0;
}

auto ClaimSet::contains(std::string_view key) const -> bool {
  std::shared_lock lock(mutex_);
  return keys_.find(std::string(key)) != keys_.end();
}

auto ClaimSet::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return keys_.size();
}

auto ClaimSet::snapshot() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  return std::vector<std::string>(keys_.begin(), keys_.end());
}

} // namespace strata::compact
