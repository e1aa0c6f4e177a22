#include "strata/format/checksum.hpp"

#include <array>

namespace strata::format {

static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u; // reversed (reflected) polynomial
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~0u;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

auto fnv64(std::span<const std::uint8_t> bytes) -> std::uint64_t {
  std::uint64_t h = 1469598103934665603ull;
  constexpr std::uint64_t P = 1099511628211ull;
  for (auto b : bytes) { h ^= b; h *= P; }
  return h;
}

} // namespace strata::format
