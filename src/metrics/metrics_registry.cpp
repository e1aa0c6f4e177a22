#include "strata/metrics/metrics_registry.hpp"

#include <mutex>

namespace strata::metrics {

template <typename T>
auto MetricsRegistry::slot(std::shared_mutex& mu, std::map<Key, std::atomic<T>>& m, const Key& k)
    -> std::atomic<T>& {
  {
    std::shared_lock lock(mu);
    auto it = m.find(k);
    if (it != m.end()) return it->second;
  }
  std::unique_lock lock(mu);
  auto [it, _] = m.try_emplace(k, T{0});
  return it->second;
}

auto MetricsRegistry::gauge_add(std::string_view name, std::string_view org, std::string_view stream_type,
                                std::int64_t delta) -> void {
  slot(mutex_, gauges_, Key{std::string(name), std::string(org), std::string(stream_type)})
      .fetch_add(delta, std::memory_order_relaxed);
}

auto MetricsRegistry::counter_add(std::string_view name, std::string_view org, std::string_view stream_type,
                                  std::uint64_t delta) -> void {
  slot(mutex_, counters_, Key{std::string(name), std::string(org), std::string(stream_type)})
      .fetch_add(delta, std::memory_order_relaxed);
}

auto MetricsRegistry::gauge(std::string_view name, std::string_view org, std::string_view stream_type) const
    -> std::int64_t {
  std::shared_lock lock(mutex_);
  auto it = gauges_.find(Key{std::string(name), std::string(org), std::string(stream_type)});
  return it == gauges_.end() ? 0 : it->second.load(std::memory_order_relaxed);
}

auto MetricsRegistry::counter(std::string_view name, std::string_view org, std::string_view stream_type) const
    -> std::uint64_t {
  std::shared_lock lock(mutex_);
  auto it = counters_.find(Key{std::string(name), std::string(org), std::string(stream_type)});
  return it == counters_.end() ? 0 : it->second.load(std::memory_order_relaxed);
}

auto MetricsRegistry::render() const -> std::string {
  std::string out;
  auto line = [&out](const Key& k, const std::string& value) {
    out.append(std::get<0>(k)).append("{org=\"").append(std::get<1>(k))
       .append("\",stream_type=\"").append(std::get<2>(k)).append("\"} ").append(value).append("\n");
  };
  std::shared_lock lock(mutex_);
  for (const auto& [k, v] : gauges_) line(k, std::to_string(v.load(std::memory_order_relaxed)));
  for (const auto& [k, v] : counters_) line(k, std::to_string(v.load(std::memory_order_relaxed)));
  return out;
}

} // namespace strata::metrics
