#include "strata/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <thread>

namespace strata::core {

namespace {

auto bad_value(const char* name, const std::string& v) -> error {
  return error{error_code::config_invalid,
               std::string("invalid value for ") + name + ": \"" + v + "\"", "core.config"};
}

auto parse_u64(const std::string& s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto parse_i64(const std::string& s, std::int64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::int64_t>(tmp);
  return true;
}

auto parse_bool(std::string s, bool& out) -> bool {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
  if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
  return false;
}

// Reads one variable into `out` through `conv`; unset leaves the default in place.
template <typename T, typename Conv>
auto read_var(const EnvLookup& lookup, const char* name, T& out, Conv conv)
    -> std::expected<void, error> {
  auto v = lookup(name);
  if (!v || v->empty()) return {};
  if (!conv(*v, out)) return std::unexpected(bad_value(name, *v));
  return {};
}

} // namespace

auto load_config(const EnvLookup& lookup) -> std::expected<CompactionConfig, error> {
  CompactionConfig cfg{};

  auto as_path = [](const std::string& s, std::filesystem::path& p){ p = s; return true; };
  auto as_string = [](const std::string& s, std::string& out){ out = s; return true; };
  auto as_size = [](const std::string& s, std::size_t& out){
    std::uint64_t v = 0; if (!parse_u64(s, v)) return false; out = static_cast<std::size_t>(v); return true;
  };
  auto as_mb = [](const std::string& s, std::uint64_t& out){
    std::uint64_t v = 0; if (!parse_u64(s, v)) return false; out = v * MB; return true;
  };
  auto as_secs = [](const std::string& s, std::chrono::seconds& out){
    std::uint64_t v = 0; if (!parse_u64(s, v)) return false; out = std::chrono::seconds(v); return true;
  };
  auto as_millis = [](const std::string& s, std::chrono::milliseconds& out){
    std::uint64_t v = 0; if (!parse_u64(s, v)) return false; out = std::chrono::milliseconds(v); return true;
  };
  auto as_i64 = [](const std::string& s, std::int64_t& out){ return parse_i64(s, out); };
  auto as_int = [](const std::string& s, int& out){
    std::int64_t v = 0; if (!parse_i64(s, v)) return false; out = static_cast<int>(v); return true;
  };
  auto as_bool = [](const std::string& s, bool& out){ return parse_bool(s, out); };

  std::expected<void, error> r;
  if (!(r = read_var(lookup, "STRATA_WAL_DIR", cfg.wal_dir, as_path))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_STATE_DIR", cfg.state_dir, as_path))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_OBJECT_STORE_DIR", cfg.object_store_dir, as_path))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_WAL_FILE_SUFFIX", cfg.wal_file_suffix, as_string))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_FILE_PUSH_INTERVAL", cfg.file_push_interval, as_secs))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_FILE_PUSH_LIMIT", cfg.file_push_limit, as_size))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_FILE_MOVE_THREAD_NUM", cfg.file_move_thread_num, as_size))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_WORKER_QUEUE_CAPACITY", cfg.worker_queue_capacity, as_size))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_MAX_FILE_SIZE_ON_DISK", cfg.max_file_size_on_disk, as_mb))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_COMPACT_MAX_FILE_SIZE", cfg.compact_max_file_size, as_mb))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_FILE_MOVE_FIELDS_LIMIT", cfg.file_move_fields_limit, as_size))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_MAX_FILE_RETENTION_TIME", cfg.max_file_retention_time, as_secs))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_COMPACT_DATA_RETENTION_DAYS", cfg.data_retention_days, as_i64))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_INVERTED_INDEX_ENABLED", cfg.inverted_index_enabled, as_bool))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_ZSTD_LEVEL", cfg.zstd_level, as_int))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_MERGE_RETRY_DELAY_MS", cfg.merge_retry_delay, as_millis))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_DRAIN_BACKOFF_INITIAL_MS", cfg.drain_backoff_initial, as_millis))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_DRAIN_BACKOFF_MAX_MS", cfg.drain_backoff_max, as_millis))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_CLEAN_EMPTY_DIRS", cfg.clean_empty_dirs, as_bool))) return std::unexpected(r.error());
  if (!(r = read_var(lookup, "STRATA_EMPTY_DIR_MIN_AGE", cfg.empty_dir_min_age, as_secs))) return std::unexpected(r.error());

  if (auto v = validate_config(cfg); !v) return std::unexpected(v.error());
  return cfg;
}

auto process_env(const char* name) -> std::optional<std::string> {
  if (name == nullptr || *name == '\0') return std::nullopt;
  const char* v = std::getenv(name);
  if (v == nullptr) return std::nullopt;
  return std::string(v);
}

auto load_config_from_env() -> std::expected<CompactionConfig, error> {
  return load_config(process_env);
}

auto validate_config(CompactionConfig& cfg) -> std::expected<void, error> {
  if (cfg.wal_dir.empty()) {
    return std::unexpected(error{error_code::config_invalid, "wal_dir must not be empty", "core.config"});
  }
  if (cfg.state_dir.empty()) {
    auto wal = cfg.wal_dir.lexically_normal();
    if (wal.filename().empty()) wal = wal.parent_path();
    cfg.state_dir = wal.parent_path() / "state";
  }
  if (cfg.wal_file_suffix.empty()) cfg.wal_file_suffix = "seg";
  if (!cfg.wal_file_suffix.empty() && cfg.wal_file_suffix.front() == '.') cfg.wal_file_suffix.erase(0, 1);

  if (cfg.file_push_interval.count() == 0) cfg.file_push_interval = std::chrono::seconds(60);
  if (cfg.file_push_limit == 0) cfg.file_push_limit = 10000;
  if (cfg.file_move_thread_num == 0) {
    cfg.file_move_thread_num = std::max(1u, std::thread::hardware_concurrency());
  }
  if (cfg.worker_queue_capacity == 0) cfg.worker_queue_capacity = cfg.file_move_thread_num;
  if (cfg.max_file_size_on_disk == 0) cfg.max_file_size_on_disk = 64 * MB;
  if (cfg.compact_max_file_size == 0) cfg.compact_max_file_size = 256 * MB;

  if (cfg.data_retention_days < 0) {
    return std::unexpected(error{error_code::config_invalid,
                                 "data_retention_days must not be negative", "core.config"});
  }
  if (cfg.data_retention_days > 0 && cfg.data_retention_days < 3) {
    return std::unexpected(error{error_code::config_invalid,
                                 "data_retention_days must be greater than 2 days", "core.config"});
  }
  if (cfg.zstd_level < 0 || cfg.zstd_level > 22) {
    return std::unexpected(error{error_code::config_invalid,
                                 "zstd_level must be within [0, 22]", "core.config"});
  }
  if (cfg.drain_backoff_initial.count() == 0) cfg.drain_backoff_initial = std::chrono::milliseconds(200);
  if (cfg.drain_backoff_max < cfg.drain_backoff_initial) cfg.drain_backoff_max = cfg.drain_backoff_initial;
  return {};
}

} // namespace strata::core
