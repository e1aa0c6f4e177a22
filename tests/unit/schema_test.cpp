#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "strata/format/schema.hpp"

using namespace strata::format;

static Schema schema_of(std::vector<Field> fields) { return Schema(std::move(fields)); }

TEST_CASE("union keeps every field once, sorted by name", "[format][schema]") {
  const Schema parts[] = {
      schema_of({{"_timestamp", DataType::int64, false}, {"msg", DataType::utf8, true}}),
      schema_of({{"_timestamp", DataType::int64, false}, {"code", DataType::int64, true}}),
      schema_of({{"msg", DataType::utf8, true}, {"host", DataType::utf8, true}}),
  };
  auto u = union_schema(parts);
  REQUIRE(u.size() == 4);
  std::vector<std::string> names;
  for (const auto& f : u.fields()) names.push_back(f.name);
  REQUIRE(names == std::vector<std::string>{"_timestamp", "code", "host", "msg"});
  REQUIRE(u.find("code")->type == DataType::int64);
}

TEST_CASE("conflicting field types widen to utf8", "[format][schema]") {
  const Schema parts[] = {
      schema_of({{"status", DataType::int64, false}}),
      schema_of({{"status", DataType::boolean, true}}),
  };
  auto u = union_schema(parts);
  REQUIRE(u.find("status")->type == DataType::utf8);
  REQUIRE(u.find("status")->nullable);
}

TEST_CASE("add rejects duplicates", "[format][schema]") {
  Schema s;
  REQUIRE(s.add(Field{"a", DataType::utf8, true}));
  REQUIRE_FALSE(s.add(Field{"a", DataType::int64, true}));
  REQUIRE(s.index_of("a") == 0u);
  REQUIRE_FALSE(s.index_of("b").has_value());
}

TEST_CASE("values cast across types", "[format][schema]") {
  REQUIRE(cast_value(Value{std::int64_t{42}}, DataType::utf8) == Value{std::string("42")});
  REQUIRE(cast_value(Value{std::string("17")}, DataType::int64) == Value{std::int64_t{17}});
  REQUIRE(is_null(cast_value(Value{std::string("x")}, DataType::int64)));
  REQUIRE(cast_value(Value{true}, DataType::float64) == Value{1.0});
  REQUIRE(cast_value(Value{std::string("false")}, DataType::boolean) == Value{false});
  REQUIRE(is_null(cast_value(Value{}, DataType::utf8)));
  REQUIRE(value_to_string(Value{2.5}) == "2.5");
}

TEST_CASE("data type names round trip", "[format][schema]") {
  for (auto t : {DataType::int64, DataType::float64, DataType::boolean, DataType::utf8}) {
    REQUIRE(parse_data_type(to_string(t)) == t);
  }
  REQUIRE_FALSE(parse_data_type("decimal").has_value());
}
