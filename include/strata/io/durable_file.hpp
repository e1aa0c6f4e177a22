#pragma once

/** \file durable_file.hpp
 *  \brief Crash-safe whole-file replacement and plain file reads.
 *
 * write_file_atomic(): write <path>.tmp, fsync, rename over <path>, fsync the
 * parent directory. Readers observe either the previous or the new contents,
 * never a torn file. Parent directories are created on demand.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include "strata/error.hpp"

namespace strata::io {

auto write_file_atomic(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error>;

auto write_file_atomic(const std::filesystem::path& path, std::string_view text)
    -> std::expected<void, core::error>;

auto read_file_bytes(const std::filesystem::path& path)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief fsync a directory so a preceding rename/unlink in it is durable (POSIX; no-op elsewhere). */
auto sync_directory(const std::filesystem::path& dir) -> void;

} // namespace strata::io
