#pragma once

/** \file scanner.hpp
 *  \brief Lazy WAL segment discovery delivered in bounded batches.
 *
 * SegmentScanner walks the tree on its own thread and hands batches of
 * absolute canonical paths to the consumer through a bounded queue, so
 * grouping can start before the walk completes. Each scanner instance is one
 * pass; a new pass constructs a new scanner.
 *
 * Error policy: a missing root yields no batches; unreadable directories and
 * entries are logged and skipped.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "strata/core/bounded_queue.hpp"

namespace strata::wal {

struct ScanOptions {
  std::filesystem::path root;
  std::string suffix{"seg"};            // matched case-insensitively, without the dot
  std::size_t batch_size{10000};
  std::size_t channel_capacity{1};
};

class SegmentScanner {
public:
  explicit SegmentScanner(ScanOptions options);
  ~SegmentScanner();

  SegmentScanner(const SegmentScanner&) = delete;
  SegmentScanner& operator=(const SegmentScanner&) = delete;

  auto start() -> void;

  /** \brief Next batch, or nullopt once the walk is finished (or stopped). */
  auto next_batch() -> std::optional<std::vector<std::filesystem::path>>;

  /** \brief Abandon the walk; pending batches are discarded. */
  auto stop() -> void;

  [[nodiscard]] auto files_found() const noexcept -> std::size_t { return files_found_.load(); }
  [[nodiscard]] auto entry_errors() const noexcept -> std::size_t { return entry_errors_.load(); }

private:
  auto walk() -> void;
  auto matches(const std::filesystem::path& p) const -> bool;

  ScanOptions options_;
  core::BoundedQueue<std::vector<std::filesystem::path>> queue_;
  std::thread worker_;
  std::atomic<std::size_t> files_found_{0};
  std::atomic<std::size_t> entry_errors_{0};
};

/** \brief Walk synchronously and return every matching path. */
auto scan_segments(const ScanOptions& options) -> std::vector<std::filesystem::path>;

/** \brief Remove empty directories under `root` (never `root` itself) whose
 *  last write is older than `min_age`, deepest first. Returns the count removed.
 */
auto clean_empty_dirs(const std::filesystem::path& root, std::chrono::seconds min_age) -> std::size_t;

} // namespace strata::wal
