#pragma once

/** \file checksum.hpp
 *  \brief CRC32C (Castagnoli, reflected 0x82F63B78) and FNV-1a 64 over byte spans.
 *
 * Thread-safety: stateless.
 */

#include <cstdint>
#include <span>
#include <string_view>

namespace strata::format {

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

auto fnv64(std::span<const std::uint8_t> bytes) -> std::uint64_t;

inline auto fnv64(std::string_view s) -> std::uint64_t {
  return fnv64(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

} // namespace strata::format
