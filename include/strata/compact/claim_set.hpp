#pragma once

/** \file claim_set.hpp
 *  \brief Segment keys currently owned by the compactor.
 *
 * A key is claimed from the moment it enters a merge group until the segment
 * is deleted from disk; keys awaiting a pending delete stay claimed. All
 * mutations go through one exclusive lock so try_claim() is an atomic
 * check-then-insert.
 */

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace strata::compact {

class ClaimSet {
public:
  /** \brief Insert `key` unless already present; true if this call claimed it. */
  [[nodiscard]] auto try_claim(std::string_view key) -> bool;

  /** \brief Release `key`; false if it was not claimed. */
  auto release(std::string_view key) -> bool;

  [[nodiscard]] auto contains(std::string_view key) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto snapshot() const -> std::vector<std::string>;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_set<std::string> keys_;
};

} // namespace strata::compact
