#pragma once

/** \file inverted_index.hpp
 *  \brief Roaring-bitmap inverted index built over a merged file.
 *
 * Full-text fields are tokenized (lowercased, split on whitespace and
 * punctuation); secondary index fields are indexed by exact value. Each term
 * maps to a roaring::Roaring of row ids within the merged file.
 *
 * Serialized layout (little-endian):
 *   magic u32 "STIX" | version u32 | nfields u32
 *   per field: name | kind u8 | nterms u32 | per term: term | nbytes u32 | roaring portable bytes
 * (strings are u32 length + bytes)
 *
 * The index is stored next to the merged file: same key, extension ".idx".
 */

#include <cstdint>
#include <expected>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "roaring.hh"

#include "strata/compact/services.hpp"

namespace strata::index {

enum class TermKind : std::uint8_t {
  full_text = 1,
  exact = 2,
};

struct FieldPostings {
  TermKind kind{TermKind::exact};
  std::map<std::string, roaring::Roaring> terms;
};

class InvertedIndex {
public:
  static constexpr std::uint32_t MAGIC = 0x58495453u; // "STIX"
  static constexpr std::uint32_t VERSION = 1;

  auto add_full_text(std::string_view field, std::uint32_t row, std::string_view text) -> void;
  auto add_exact(std::string_view field, std::uint32_t row, std::string_view value) -> void;

  /** \brief Rows containing `term` in `field`; full-text lookups are lowercased. */
  [[nodiscard]] auto lookup(std::string_view field, std::string_view term) const -> roaring::Roaring;
  [[nodiscard]] auto field_count() const noexcept -> std::size_t { return fields_.size(); }

  auto serialize() const -> std::vector<std::uint8_t>;
  static auto deserialize(std::span<const std::uint8_t> bytes) -> std::expected<InvertedIndex, core::error>;

private:
  std::map<std::string, FieldPostings, std::less<>> fields_;
};

/** \brief Lowercased tokens split on whitespace and punctuation. */
auto tokenize(std::string_view text) -> std::vector<std::string>;

/** \brief "a/b/c.seg" -> "a/b/c.idx". */
auto index_key_for(std::string_view file_key) -> std::string;

class RoaringIndexBuilder final : public compact::InvertedIndexBuilder {
public:
  explicit RoaringIndexBuilder(compact::ObjectStorage& storage) : storage_(storage) {}

  auto build(const compact::IndexRequest& request) -> std::expected<std::uint64_t, core::error> override;

private:
  compact::ObjectStorage& storage_;
};

} // namespace strata::index
