#pragma once

/** \file schema.hpp
 *  \brief Field/Schema/Value model shared by WAL segments and merged outputs.
 *
 * A Schema is an ordered list of uniquely named fields. `_timestamp` is the
 * int64 event-time column (microseconds since epoch).
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::format {

inline constexpr std::string_view TIMESTAMP_COL = "_timestamp";
inline constexpr std::string_view ORIGINAL_DATA_COL = "_original";
inline constexpr std::string_view ID_COL = "_o2_id";
inline constexpr std::string_view ALL_VALUES_COL = "_all_values";

enum class DataType : std::uint8_t {
  int64 = 1,
  float64 = 2,
  boolean = 3,
  utf8 = 4,
};

auto to_string(DataType t) -> std::string_view;
auto parse_data_type(std::string_view s) -> std::optional<DataType>;

struct Field {
  std::string name;
  DataType type{DataType::utf8};
  bool nullable{true};

  friend bool operator==(const Field&, const Field&) = default;
};

class Schema {
public:
  Schema() = default;
  explicit Schema(std::vector<Field> fields) : fields_(std::move(fields)) {}

  [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }

  auto index_of(std::string_view name) const -> std::optional<std::size_t>;
  auto find(std::string_view name) const -> const Field*;
  auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

  /** \brief Appends a field unless one with the same name already exists. */
  auto add(Field f) -> bool;

  friend bool operator==(const Schema&, const Schema&) = default;

private:
  std::vector<Field> fields_;
};

/** \brief Union of field names across schemas, deduplicated and sorted by name.
 *
 * When the same name appears with different types the field widens to utf8.
 */
auto union_schema(std::span<const Schema> schemas) -> Schema;

using Value = std::variant<std::monostate, std::int64_t, double, bool, std::string>;

auto is_null(const Value& v) noexcept -> bool;

/** \brief Convert a value to the target column type; unconvertible values become null. */
auto cast_value(const Value& v, DataType target) -> Value;

/** \brief Canonical text form (used for bloom keys and index terms); null -> "". */
auto value_to_string(const Value& v) -> std::string;

/** \brief Column-major rows; columns[i] belongs to schema.fields()[i]. */
struct RecordBatch {
  Schema schema;
  std::vector<std::vector<Value>> columns;

  [[nodiscard]] auto num_rows() const noexcept -> std::size_t {
    return columns.empty() ? 0 : columns.front().size();
  }
  auto column(std::string_view name) const -> const std::vector<Value>*;
};

} // namespace strata::format
