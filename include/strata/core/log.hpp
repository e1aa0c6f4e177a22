#pragma once

/** \file log.hpp
 *  \brief Process-wide named spdlog logger ("strata").
 *
 * The logger is created lazily on first use with a stderr color sink. Its
 * level is taken from STRATA_LOG_LEVEL (trace|debug|info|warn|error|critical|off),
 * defaulting to info.
 */

#include <expected>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "strata/error.hpp"

namespace strata::core {

inline constexpr std::string_view LOGGER_NAME = "strata";

auto logger() -> std::shared_ptr<spdlog::logger>;

/** \brief Change the level of the shared logger; rejects unknown level names. */
auto set_log_level(std::string_view level) -> std::expected<void, error>;

} // namespace strata::core
