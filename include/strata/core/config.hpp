#pragma once

/** \file config.hpp
 *  \brief Compaction engine configuration loaded from STRATA_* environment variables.
 *
 * Sizes are stored in bytes; the environment expresses them in megabytes.
 * Zero values fall back to the documented defaults during validation
 * (e.g. file_push_interval 0 -> 60s, file_move_thread_num 0 -> hardware
 * concurrency), mirroring how the ingestion service treats them.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "strata/error.hpp"

namespace strata::core {

inline constexpr std::uint64_t MB = 1024ull * 1024ull;

struct CompactionConfig {
  std::filesystem::path wal_dir{"./data/wal/"};
  std::filesystem::path state_dir{};            // empty -> <wal_dir>/../state
  std::filesystem::path object_store_dir{"./data/stream/"};
  std::string wal_file_suffix{"seg"};

  std::chrono::seconds file_push_interval{10};
  std::size_t file_push_limit{10000};
  std::size_t file_move_thread_num{0};
  std::size_t worker_queue_capacity{0};

  std::uint64_t max_file_size_on_disk{128 * MB};
  std::uint64_t compact_max_file_size{256 * MB};
  std::size_t file_move_fields_limit{2000};
  std::chrono::seconds max_file_retention_time{600};
  std::int64_t data_retention_days{3650};       // 0 = never expire

  bool inverted_index_enabled{true};
  int zstd_level{3};

  std::chrono::milliseconds merge_retry_delay{1000};
  std::chrono::milliseconds drain_backoff_initial{200};
  std::chrono::milliseconds drain_backoff_max{5000};

  bool clean_empty_dirs{true};
  std::chrono::seconds empty_dir_min_age{3600};

  /** \brief Effective merged-output ceiling: min(max_file_size_on_disk, compact_max_file_size). */
  [[nodiscard]] auto max_file_size() const noexcept -> std::uint64_t {
    return std::min(max_file_size_on_disk, compact_max_file_size);
  }
};

/** \brief Variable source for load_config(); nullopt means unset, an empty string is still set. */
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/** \brief EnvLookup over the process environment. Also used for STRATA_LOG_LEVEL and the tool's knobs. */
auto process_env(const char* name) -> std::optional<std::string>;

/** \brief Build a configuration from an arbitrary variable lookup, then validate it. */
auto load_config(const EnvLookup& lookup) -> std::expected<CompactionConfig, error>;

/** \brief load_config() over the process environment. */
auto load_config_from_env() -> std::expected<CompactionConfig, error>;

/** \brief Normalize zero values to defaults and reject invalid combinations. */
auto validate_config(CompactionConfig& cfg) -> std::expected<void, error>;

} // namespace strata::core
