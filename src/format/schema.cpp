#include "strata/format/schema.hpp"

#include <algorithm>
#include <charconv>
#include <map>

namespace strata::format {

auto to_string(DataType t) -> std::string_view {
  switch (t) {
    case DataType::int64: return "int64";
    case DataType::float64: return "float64";
    case DataType::boolean: return "boolean";
    case DataType::utf8: return "utf8";
  }
  return "utf8";
}

auto parse_data_type(std::string_view s) -> std::optional<DataType> {
  if (s == "int64" || s == "Int64") return DataType::int64;
  if (s == "float64" || s == "Float64") return DataType::float64;
  if (s == "boolean" || s == "bool" || s == "Boolean") return DataType::boolean;
  if (s == "utf8" || s == "string" || s == "Utf8") return DataType::utf8;
  return std::nullopt;
}

auto Schema::index_of(std::string_view name) const -> std::optional<std::size_t> {
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name) return i;
  }
  return std::nullopt;
}

auto Schema::find(std::string_view name) const -> const Field* {
  auto idx = index_of(name);
  return idx ? &fields_[*idx] : nullptr;
}

auto Schema::add(Field f) -> bool {
  if (contains(f.name)) return false;
  fields_.push_back(std::move(f));
  return true;
}

auto union_schema(std::span<const Schema> schemas) -> Schema {
  std::map<std::string, Field, std::less<>> by_name;
  for (const auto& s : schemas) {
    for (const auto& f : s.fields()) {
      auto it = by_name.find(f.name);
      if (it == by_name.end()) {
        by_name.emplace(f.name, f);
        continue;
      }
      if (it->second.type != f.type) it->second.type = DataType::utf8;
      it->second.nullable = it->second.nullable || f.nullable;
    }
  }
  std::vector<Field> fields;
  fields.reserve(by_name.size());
  for (auto& [_, f] : by_name) fields.push_back(std::move(f));
  return Schema(std::move(fields));
}

auto is_null(const Value& v) noexcept -> bool {
  return std::holds_alternative<std::monostate>(v);
}

auto value_to_string(const Value& v) -> std::string {
  struct Visitor {
    auto operator()(std::monostate) const -> std::string { return {}; }
    auto operator()(std::int64_t x) const -> std::string { return std::to_string(x); }
    auto operator()(double x) const -> std::string {
      char buf[64];
      auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), x);
      if (ec != std::errc()) return {};
      return std::string(buf, ptr);
    }
    auto operator()(bool x) const -> std::string { return x ? "true" : "false"; }
    auto operator()(const std::string& x) const -> std::string { return x; }
  };
  return std::visit(Visitor{}, v);
}

auto cast_value(const Value& v, DataType target) -> Value {
  if (is_null(v)) return v;
  switch (target) {
    case DataType::utf8:
      if (std::holds_alternative<std::string>(v)) return v;
      return value_to_string(v);
    case DataType::int64:
      if (auto p = std::get_if<std::int64_t>(&v)) return *p;
      if (auto p = std::get_if<double>(&v)) return static_cast<std::int64_t>(*p);
      if (auto p = std::get_if<bool>(&v)) return static_cast<std::int64_t>(*p ? 1 : 0);
      if (auto p = std::get_if<std::string>(&v)) {
        std::int64_t out = 0;
        auto [ptr, ec] = std::from_chars(p->data(), p->data() + p->size(), out);
        if (ec == std::errc() && ptr == p->data() + p->size()) return out;
      }
      return std::monostate{};
    case DataType::float64:
      if (auto p = std::get_if<double>(&v)) return *p;
      if (auto p = std::get_if<std::int64_t>(&v)) return static_cast<double>(*p);
      if (auto p = std::get_if<bool>(&v)) return *p ? 1.0 : 0.0;
      if (auto p = std::get_if<std::string>(&v)) {
        double out = 0;
        auto [ptr, ec] = std::from_chars(p->data(), p->data() + p->size(), out);
        if (ec == std::errc() && ptr == p->data() + p->size()) return out;
      }
      return std::monostate{};
    case DataType::boolean:
      if (auto p = std::get_if<bool>(&v)) return *p;
      if (auto p = std::get_if<std::int64_t>(&v)) return *p != 0;
      if (auto p = std::get_if<double>(&v)) return *p != 0.0;
      if (auto p = std::get_if<std::string>(&v)) {
        if (*p == "true") return true;
        if (*p == "false") return false;
      }
      return std::monostate{};
  }
  return std::monostate{};
}

auto RecordBatch::column(std::string_view name) const -> const std::vector<Value>* {
  auto idx = schema.index_of(name);
  if (!idx || *idx >= columns.size()) return nullptr;
  return &columns[*idx];
}

} // namespace strata::format
