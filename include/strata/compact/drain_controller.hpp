#pragma once

/** \file drain_controller.hpp
 *  \brief Run/drain/stop lifecycle around repeated compaction passes.
 *
 * Running: sleep file_push_interval, then run a pass. A stop request wakes the
 * sleep and stops; a drain request wakes it and switches to Draining.
 * Draining: run passes with small batches force-flushed until the runner
 * reports no pending work, sleeping an exponential backoff (doubling up to
 * drain_backoff_max) between passes. Stopped is terminal.
 *
 * request_drain() and request_stop() are safe from any thread, but not from a
 * signal handler; deliver signals through a waiting thread.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string_view>

#include "strata/compact/compactor.hpp"
#include "strata/core/config.hpp"

namespace strata::compact {

enum class DrainState {
  running,
  draining,
  stopped,
};

auto to_string(DrainState s) noexcept -> std::string_view;

class DrainController {
public:
  /** \brief Replacement for the interruptible wait; used by tests to observe delays. */
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  DrainController(PassRunner& runner, const core::CompactionConfig& config, Sleeper sleeper = {});

  auto request_drain() -> void;
  auto request_stop() -> void;

  [[nodiscard]] auto state() const noexcept -> DrainState { return state_.load(); }
  [[nodiscard]] auto passes() const noexcept -> std::size_t { return passes_.load(); }

  /** \brief Loop until Stopped. */
  auto run() -> DrainState;

private:
  auto sleep_for(std::chrono::milliseconds d, DrainState observed) -> void;
  auto set_state(DrainState s) -> void;

  PassRunner& runner_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds backoff_initial_;
  std::chrono::milliseconds backoff_max_;
  Sleeper sleeper_;

  std::atomic<DrainState> state_{DrainState::running};
  std::atomic<std::size_t> passes_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace strata::compact
