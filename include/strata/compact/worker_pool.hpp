#pragma once

/** \file worker_pool.hpp
 *  \brief Fixed set of compaction workers fed through a bounded queue.
 *
 * submit() blocks while the queue is full, which is the backpressure that
 * keeps grouping from running arbitrarily far ahead of merging. wait_idle()
 * returns once every submitted task has finished executing, not merely once
 * the queue is drained.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "strata/core/bounded_queue.hpp"

namespace strata::compact {

class WorkerPool {
public:
  /** \brief Task receives the index of the worker running it. */
  using Task = std::function<void(std::size_t worker)>;

  /** \param threads 0 = hardware concurrency. \param capacity 0 = one slot per worker. */
  explicit WorkerPool(std::size_t threads = 0, std::size_t capacity = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  /** \brief False once shutdown() has been called. */
  auto submit(Task task) -> bool;

  auto wait_idle() -> void;

  /** \brief Stop accepting work, finish queued tasks and join. */
  auto shutdown() -> void;

  [[nodiscard]] auto num_threads() const noexcept -> std::size_t { return workers_.size(); }
  [[nodiscard]] auto in_flight() const noexcept -> std::size_t { return pending_.load(std::memory_order_relaxed); }

private:
  auto worker_loop(std::size_t id) -> void;

  core::BoundedQueue<Task> queue_;
  std::vector<std::thread> workers_;
  std::atomic<std::size_t> pending_{0};
  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
};

} // namespace strata::compact
