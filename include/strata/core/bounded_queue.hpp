#pragma once

/** \file bounded_queue.hpp
 *  \brief Blocking FIFO with a fixed capacity, shared by the scanner and the worker pool.
 *
 * push() waits while the queue is full; that wait is the backpressure between
 * a producer and its consumers. Two ways to end a queue:
 *  - close(): producers are refused, consumers still receive what was queued
 *    and then get std::nullopt (worker shutdown finishes queued tasks).
 *  - cancel(): like close(), but queued items are dropped at once (an
 *    abandoned scan discards its unread batches).
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace strata::core {

template <class T>
class BoundedQueue {
public:
  /** \param capacity 0 is treated as 1. */
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  /** \brief False if the queue was closed before or while waiting for room. */
  auto push(T item) -> bool {
    std::unique_lock lk(mutex_);
    space_cv_.wait(lk, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(item));
    lk.unlock();
    item_cv_.notify_one();
    return true;
  }

  /** \brief Oldest item; nullopt once the queue is closed and empty. */
  auto pop() -> std::optional<T> {
    std::unique_lock lk(mutex_);
    item_cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    std::optional<T> out(std::move(items_.front()));
    items_.pop_front();
    lk.unlock();
    space_cv_.notify_one();
    return out;
  }

  auto close() -> void {
    {
      std::lock_guard lk(mutex_);
      closed_ = true;
    }
    wake_all();
  }

  /** \brief Close and drop whatever is still queued. Returns the number dropped. */
  auto cancel() -> std::size_t {
    std::deque<T> dropped;
    {
      std::lock_guard lk(mutex_);
      closed_ = true;
      dropped.swap(items_);
    }
    wake_all();
    return dropped.size();
  }

  [[nodiscard]] auto closed() const -> bool {
    std::lock_guard lk(mutex_);
    return closed_;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lk(mutex_);
    return items_.size();
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
  auto wake_all() -> void {
    item_cv_.notify_all();
    space_cv_.notify_all();
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable item_cv_;
  std::condition_variable space_cv_;
  std::deque<T> items_;
  bool closed_{false};
};

} // namespace strata::core
