#pragma once

/** \file file_locker.hpp
 *  \brief Read leases that queries take on WAL segments while scanning them.
 *
 * Leases are reference counted per segment key: a key stays locked until
 * every Lease covering it has been released. The compactor only asks
 * is_locked(); it never takes leases itself.
 */

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "strata/compact/services.hpp"

namespace strata::lock {

class SearchingFileLocker;

/** \brief RAII read lease over a set of segment keys. */
class Lease {
public:
  Lease() = default;
  Lease(const Lease&) = delete;
  Lease& operator=(const Lease&) = delete;
  Lease(Lease&& other) noexcept : owner_(other.owner_), keys_(std::move(other.keys_)) { other.owner_ = nullptr; }
  Lease& operator=(Lease&& other) noexcept;
  ~Lease() { release(); }

  auto release() -> void;
  [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return keys_; }

private:
  friend class SearchingFileLocker;
  Lease(SearchingFileLocker* owner, std::vector<std::string> keys) : owner_(owner), keys_(std::move(keys)) {}

  SearchingFileLocker* owner_{nullptr};
  std::vector<std::string> keys_;
};

class SearchingFileLocker final : public compact::LockRegistry {
public:
  [[nodiscard]] auto lock(std::vector<std::string> keys) -> Lease;
  auto is_locked(std::string_view segment_key) -> bool override;
  [[nodiscard]] auto locked_count() const -> std::size_t;

private:
  friend class Lease;
  auto unlock(const std::vector<std::string>& keys) -> void;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::size_t> counts_;
};

} // namespace strata::lock
