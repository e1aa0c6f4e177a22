#include "strata/format/bloom_filter.hpp"
#include "strata/format/checksum.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace strata::format {

namespace {

constexpr double LN2 = 0.6931471805599453;
constexpr std::uint32_t MAX_BITS = 1u << 30;

auto round_up_pow2(std::uint64_t x) -> std::uint32_t {
  if (x <= 64) return 64;
  std::uint64_t v = x - 1;
  v |= v >> 1; v |= v >> 2; v |= v >> 4; v |= v >> 8; v |= v >> 16; v |= v >> 32;
  return static_cast<std::uint32_t>(std::min<std::uint64_t>(v + 1, MAX_BITS));
}

auto mix64(std::uint64_t x) -> std::uint64_t {
  x ^= x >> 33; x *= 0xff51afd7ed558ccdull;
  x ^= x >> 33; x *= 0xc4ceb9fe1a85ec53ull;
  x ^= x >> 33;
  return x;
}

} // namespace

auto BloomFilter::for_items(std::uint64_t expected_items, double fpp) -> BloomFilter {
  const std::uint64_t n = std::max<std::uint64_t>(expected_items, 1);
  if (!(fpp > 0.0 && fpp < 1.0)) fpp = 0.01;
  const auto bits = static_cast<std::uint64_t>(std::ceil(-static_cast<double>(n) * std::log(fpp) / (LN2 * LN2)));
  const std::uint32_t m = round_up_pow2(bits);
  const double k = (static_cast<double>(m) / static_cast<double>(n)) * LN2;
  const auto k8 = static_cast<std::uint8_t>(std::clamp(std::round(k), 2.0, 16.0));
  return BloomFilter(m, k8, std::vector<std::uint64_t>(m / 64, 0));
}

auto BloomFilter::add(std::string_view key) -> void {
  const std::uint64_t h1 = fnv64(key);
  const std::uint64_t h2 = mix64(h1) | 1ull;
  for (std::uint8_t i = 0; i < k_; ++i) {
    const std::uint32_t idx = static_cast<std::uint32_t>((h1 + i * h2) & mask_);
    words_[idx >> 6] |= (1ull << (idx & 63));
  }
}

auto BloomFilter::might_contain(std::string_view key) const -> bool {
  const std::uint64_t h1 = fnv64(key);
  const std::uint64_t h2 = mix64(h1) | 1ull;
  for (std::uint8_t i = 0; i < k_; ++i) {
    const std::uint32_t idx = static_cast<std::uint32_t>((h1 + i * h2) & mask_);
    if ((words_[idx >> 6] & (1ull << (idx & 63))) == 0) return false;
  }
  return true;
}

// Layout: magic u32 | m_bits u32 | k u8 | pad[3] | words u64[m_bits/64]
auto BloomFilter::serialize() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(12 + words_.size() * 8, 0);
  std::uint8_t* p = out.data();
  const std::uint32_t magic = MAGIC;
  std::memcpy(p, &magic, 4);
  std::memcpy(p + 4, &m_bits_, 4);
  p[8] = k_;
  if (!words_.empty()) std::memcpy(p + 12, words_.data(), words_.size() * 8);
  return out;
}

auto BloomFilter::deserialize(std::span<const std::uint8_t> bytes) -> std::expected<BloomFilter, core::error> {
  using core::error; using core::error_code;
  if (bytes.size() < 12) {
    return std::unexpected(error{error_code::data_integrity, "bloom filter too short", "format.bloom"});
  }
  std::uint32_t magic = 0, m = 0;
  std::memcpy(&magic, bytes.data(), 4);
  std::memcpy(&m, bytes.data() + 4, 4);
  const std::uint8_t k = bytes[8];
  if (magic != MAGIC) {
    return std::unexpected(error{error_code::data_integrity, "bad bloom filter magic", "format.bloom"});
  }
  if (m < 64 || (m & (m - 1)) != 0 || m > MAX_BITS || k == 0) {
    return std::unexpected(error{error_code::data_integrity, "bad bloom filter geometry", "format.bloom"});
  }
  if (bytes.size() != 12 + static_cast<std::size_t>(m / 64) * 8) {
    return std::unexpected(error{error_code::data_integrity, "bloom filter size mismatch", "format.bloom"});
  }
  std::vector<std::uint64_t> words(m / 64);
  std::memcpy(words.data(), bytes.data() + 12, words.size() * 8);
  return BloomFilter(m, k, std::move(words));
}

} // namespace strata::format
