#include "strata/compact/drain_controller.hpp"

#include <algorithm>

#include "strata/core/log.hpp"

namespace strata::compact {

using namespace std::chrono;

auto to_string(DrainState s) noexcept -> std::string_view {
  switch (s) {
    case DrainState::running: return "running";
    case DrainState::draining: return "draining";
    case DrainState::stopped: return "stopped";
  }
  return "unknown";
}

DrainController::DrainController(PassRunner& runner, const core::CompactionConfig& config, Sleeper sleeper)
    : runner_(runner),
      interval_(duration_cast<milliseconds>(config.file_push_interval)),
      backoff_initial_(config.drain_backoff_initial),
      backoff_max_(std::max(config.drain_backoff_max, config.drain_backoff_initial)),
      sleeper_(std::move(sleeper)) {}

auto DrainController::set_state(DrainState s) -> void {
  {
    std::lock_guard lk(mutex_);
    if (state_.load() == DrainState::stopped) return;
    if (s == DrainState::draining && state_.load() != DrainState::running) return;
    state_.store(s);
  }
  cv_.notify_all();
}

auto DrainController::request_drain() -> void {
  core::logger()->info("[drain] drain requested");
  set_state(DrainState::draining);
}

auto DrainController::request_stop() -> void {
  core::logger()->info("[drain] stop requested");
  set_state(DrainState::stopped);
}

auto DrainController::sleep_for(milliseconds d, DrainState observed) -> void {
  if (sleeper_) {
    sleeper_(d);
    return;
  }
  std::unique_lock lk(mutex_);
  cv_.wait_for(lk, d, [this, observed] { return state_.load() != observed; });
}

auto DrainController::run() -> DrainState {
  auto log = core::logger();
  auto backoff = backoff_initial_;
  for (;;) {
    const auto current = state_.load();
    if (current == DrainState::stopped) break;

    if (current == DrainState::running) {
      sleep_for(interval_, current);
      if (state_.load() != DrainState::running) continue;
      passes_.fetch_add(1);
      if (auto r = runner_.run_pass(false); !r) {
        log->error("[drain] pass failed: {}", core::describe(r.error()));
      }
      continue;
    }

    passes_.fetch_add(1);
    auto r = runner_.run_pass(true);
    if (!r) log->error("[drain] pass failed: {}", core::describe(r.error()));
    if (r && !runner_.has_pending_work()) {
      log->info("[drain] no pending work left after {} passes", passes_.load());
      set_state(DrainState::stopped);
      break;
    }
    sleep_for(backoff, DrainState::draining);
    backoff = std::min(backoff * 2, backoff_max_);
  }
  log->info("[drain] stopped");
  return state_.load();
}

} // namespace strata::compact
