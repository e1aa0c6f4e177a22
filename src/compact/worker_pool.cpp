#include "strata/compact/worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "strata/core/log.hpp"

namespace strata::compact {

namespace {

auto resolve_threads(std::size_t n) -> std::size_t {
  if (n != 0) return n;
  return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

WorkerPool::WorkerPool(std::size_t threads, std::size_t capacity)
    : queue_(capacity == 0 ? resolve_threads(threads) : capacity) {
  const auto n = resolve_threads(threads);
  workers_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

auto WorkerPool::submit(Task task) -> bool {
  pending_.fetch_add(1, std::memory_order_relaxed);
  if (!queue_.push(std::move(task))) {
    if (pending_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::lock_guard lk(idle_mutex_);
      idle_cv_.notify_all();
    }
    return false;
  }
  return true;
}

auto WorkerPool::wait_idle() -> void {
  std::unique_lock lk(idle_mutex_);
  idle_cv_.wait(lk, [this] { return pending_.load(std::memory_order_acquire) == 0; });
}

auto WorkerPool::shutdown() -> void {
  queue_.close();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
}

auto WorkerPool::worker_loop(std::size_t id) -> void {
  while (auto task = queue_.pop()) {
    try {
      (*task)(id);
    } catch (const std::exception& e) {
      core::logger()->error("[compact:{}] task failed: {}", id, e.what());
    }
    if (pending_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::lock_guard lk(idle_mutex_);
      idle_cv_.notify_all();
    }
  }
}

} // namespace strata::compact
