#pragma once

/** \file bloom_filter.hpp
 *  \brief Per-column bloom filter embedded in merged files.
 *
 * Power-of-two bit array, double hashing idx_i = (h1 + i*h2) & mask over the
 * canonical text form of each value. No false negatives.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "strata/error.hpp"

namespace strata::format {

class BloomFilter {
public:
  static constexpr std::uint32_t MAGIC = 0x46425453u; // "STBF"

  /** \brief Size the filter for `expected_items` at false-positive rate `fpp`. */
  static auto for_items(std::uint64_t expected_items, double fpp = 0.01) -> BloomFilter;

  auto add(std::string_view key) -> void;
  [[nodiscard]] auto might_contain(std::string_view key) const -> bool;

  [[nodiscard]] auto bit_count() const noexcept -> std::uint32_t { return m_bits_; }
  [[nodiscard]] auto hash_count() const noexcept -> std::uint8_t { return k_; }

  auto serialize() const -> std::vector<std::uint8_t>;
  static auto deserialize(std::span<const std::uint8_t> bytes) -> std::expected<BloomFilter, core::error>;

private:
  BloomFilter(std::uint32_t m_bits, std::uint8_t k, std::vector<std::uint64_t> words)
      : m_bits_(m_bits), mask_(m_bits - 1), k_(k), words_(std::move(words)) {}

  std::uint32_t m_bits_{64};
  std::uint32_t mask_{63};
  std::uint8_t k_{2};
  std::vector<std::uint64_t> words_;
};

} // namespace strata::format
