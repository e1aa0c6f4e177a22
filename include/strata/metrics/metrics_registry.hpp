#pragma once

/** \file metrics_registry.hpp
 *  \brief In-process MetricsSink keeping labelled gauges and counters.
 *
 * Series are created on first touch and never removed. Updates after creation
 * are lock-free (atomic add); the map itself is guarded by a shared_mutex.
 */

#include <atomic>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>

#include "strata/compact/services.hpp"

namespace strata::metrics {

class MetricsRegistry final : public compact::MetricsSink {
public:
  auto gauge_add(std::string_view name, std::string_view org, std::string_view stream_type,
                 std::int64_t delta) -> void override;
  auto counter_add(std::string_view name, std::string_view org, std::string_view stream_type,
                   std::uint64_t delta) -> void override;

  [[nodiscard]] auto gauge(std::string_view name, std::string_view org, std::string_view stream_type) const
      -> std::int64_t;
  [[nodiscard]] auto counter(std::string_view name, std::string_view org, std::string_view stream_type) const
      -> std::uint64_t;

  /** \brief Text exposition: one `name{org="..",stream_type=".."} value` line per series. */
  [[nodiscard]] auto render() const -> std::string;

private:
  using Key = std::tuple<std::string, std::string, std::string>;

  template <typename T>
  static auto slot(std::shared_mutex& mu, std::map<Key, std::atomic<T>>& m, const Key& k) -> std::atomic<T>&;

  mutable std::shared_mutex mutex_;
  std::map<Key, std::atomic<std::int64_t>> gauges_;
  std::map<Key, std::atomic<std::uint64_t>> counters_;
};

} // namespace strata::metrics
