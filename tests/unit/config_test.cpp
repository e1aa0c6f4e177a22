#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <map>
#include <optional>
#include <string>

#include "strata/core/config.hpp"

using strata::core::CompactionConfig;
using strata::core::MB;
using strata::core::error_code;
using strata::core::load_config;

namespace {

// Lookup over a fixed map so tests never touch the process environment.
auto lookup_from(std::map<std::string, std::string> vars) -> strata::core::EnvLookup {
  return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

} // namespace

TEST_CASE("defaults match the documented table", "[config]") {
  auto cfg = load_config(lookup_from({}));
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->wal_file_suffix == "seg");
  REQUIRE(cfg->file_push_interval == std::chrono::seconds(10));
  REQUIRE(cfg->file_push_limit == 10000);
  REQUIRE(cfg->max_file_size_on_disk == 128 * MB);
  REQUIRE(cfg->compact_max_file_size == 256 * MB);
  REQUIRE(cfg->max_file_size() == 128 * MB);
  REQUIRE(cfg->file_move_fields_limit == 2000);
  REQUIRE(cfg->max_file_retention_time == std::chrono::seconds(600));
  REQUIRE(cfg->data_retention_days == 3650);
  REQUIRE(cfg->inverted_index_enabled);
  REQUIRE(cfg->file_move_thread_num >= 1);
  REQUIRE(cfg->worker_queue_capacity == cfg->file_move_thread_num);
}

TEST_CASE("sizes are read in megabytes and the smaller ceiling wins", "[config]") {
  auto cfg = load_config(lookup_from({{"STRATA_MAX_FILE_SIZE_ON_DISK", "512"},
                                      {"STRATA_COMPACT_MAX_FILE_SIZE", "64"}}));
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->max_file_size_on_disk == 512 * MB);
  REQUIRE(cfg->max_file_size() == 64 * MB);
}

TEST_CASE("zero values fall back to defaults", "[config]") {
  auto cfg = load_config(lookup_from({{"STRATA_FILE_PUSH_INTERVAL", "0"},
                                      {"STRATA_FILE_PUSH_LIMIT", "0"},
                                      {"STRATA_MAX_FILE_SIZE_ON_DISK", "0"}}));
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->file_push_interval == std::chrono::seconds(60));
  REQUIRE(cfg->file_push_limit == 10000);
  REQUIRE(cfg->max_file_size_on_disk == 64 * MB);
}

TEST_CASE("state dir derives from the wal dir", "[config]") {
  auto with_slash = load_config(lookup_from({{"STRATA_WAL_DIR", "/var/lib/strata/wal/"}}));
  REQUIRE(with_slash.has_value());
  REQUIRE(with_slash->state_dir == std::filesystem::path("/var/lib/strata/state"));

  auto without_slash = load_config(lookup_from({{"STRATA_WAL_DIR", "/var/lib/strata/wal"}}));
  REQUIRE(without_slash.has_value());
  REQUIRE(without_slash->state_dir == std::filesystem::path("/var/lib/strata/state"));

  auto explicit_dir = load_config(lookup_from({{"STRATA_STATE_DIR", "/srv/state"}}));
  REQUIRE(explicit_dir.has_value());
  REQUIRE(explicit_dir->state_dir == std::filesystem::path("/srv/state"));
}

TEST_CASE("retention of one or two days is rejected, zero means forever", "[config]") {
  auto two = load_config(lookup_from({{"STRATA_COMPACT_DATA_RETENTION_DAYS", "2"}}));
  REQUIRE_FALSE(two.has_value());
  REQUIRE(two.error().code == error_code::config_invalid);

  auto zero = load_config(lookup_from({{"STRATA_COMPACT_DATA_RETENTION_DAYS", "0"}}));
  REQUIRE(zero.has_value());
  REQUIRE(zero->data_retention_days == 0);

  auto negative = load_config(lookup_from({{"STRATA_COMPACT_DATA_RETENTION_DAYS", "-5"}}));
  REQUIRE_FALSE(negative.has_value());
}

TEST_CASE("unparseable values name the variable", "[config]") {
  auto cfg = load_config(lookup_from({{"STRATA_FILE_MOVE_FIELDS_LIMIT", "lots"}}));
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == error_code::config_invalid);
  REQUIRE(cfg.error().message.find("STRATA_FILE_MOVE_FIELDS_LIMIT") != std::string::npos);

  auto flag = load_config(lookup_from({{"STRATA_INVERTED_INDEX_ENABLED", "maybe"}}));
  REQUIRE_FALSE(flag.has_value());
}

TEST_CASE("boolean and suffix parsing", "[config]") {
  auto cfg = load_config(lookup_from({{"STRATA_INVERTED_INDEX_ENABLED", "off"},
                                      {"STRATA_CLEAN_EMPTY_DIRS", "No"},
                                      {"STRATA_WAL_FILE_SUFFIX", ".parquet"}}));
  REQUIRE(cfg.has_value());
  REQUIRE_FALSE(cfg->inverted_index_enabled);
  REQUIRE_FALSE(cfg->clean_empty_dirs);
  REQUIRE(cfg->wal_file_suffix == "parquet");
}

TEST_CASE("zstd level and drain backoff are validated", "[config]") {
  auto bad_level = load_config(lookup_from({{"STRATA_ZSTD_LEVEL", "30"}}));
  REQUIRE_FALSE(bad_level.has_value());

  auto backoff = load_config(lookup_from({{"STRATA_DRAIN_BACKOFF_INITIAL_MS", "800"},
                                          {"STRATA_DRAIN_BACKOFF_MAX_MS", "100"}}));
  REQUIRE(backoff.has_value());
  REQUIRE(backoff->drain_backoff_max == backoff->drain_backoff_initial);
}

TEST_CASE("load_config_from_env reads the process environment", "[config][env]") {
  const char* key = "STRATA_FILE_MOVE_THREAD_NUM";
  setenv(key, "3", 1);
  auto v = strata::core::process_env(key);
  REQUIRE(v.has_value());
  REQUIRE(*v == "3");
  auto cfg = strata::core::load_config_from_env();
  unsetenv(key);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->file_move_thread_num == 3);
  REQUIRE_FALSE(strata::core::process_env("STRATA_TEST_PROCESS_ENV_UNSET").has_value());
}
