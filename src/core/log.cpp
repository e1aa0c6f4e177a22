#include "strata/core/log.hpp"
#include "strata/core/config.hpp"

#include <mutex>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata::core {

namespace {

auto parse_level(std::string_view s) -> std::optional<spdlog::level::level_enum> {
  if (s == "trace") return spdlog::level::trace;
  if (s == "debug") return spdlog::level::debug;
  if (s == "info") return spdlog::level::info;
  if (s == "warn" || s == "warning") return spdlog::level::warn;
  if (s == "error") return spdlog::level::err;
  if (s == "critical") return spdlog::level::critical;
  if (s == "off") return spdlog::level::off;
  return std::nullopt;
}

std::once_flag g_logger_once;

} // namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
  std::call_once(g_logger_once, []{
    auto lg = spdlog::get(std::string(LOGGER_NAME));
    if (!lg) {
      lg = spdlog::stderr_color_mt(std::string(LOGGER_NAME));
    }
    lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    auto level = spdlog::level::info;
    if (auto env = process_env("STRATA_LOG_LEVEL")) {
      if (auto parsed = parse_level(*env)) level = *parsed;
    }
    lg->set_level(level);
  });
  return spdlog::get(std::string(LOGGER_NAME));
}

auto set_log_level(std::string_view level) -> std::expected<void, error> {
  auto parsed = parse_level(level);
  if (!parsed) {
    return std::unexpected(error{error_code::invalid_argument,
                                 "unknown log level '" + std::string(level) + "'", "core.log"});
  }
  logger()->set_level(*parsed);
  return {};
}

} // namespace strata::core
