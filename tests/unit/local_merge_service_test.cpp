#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include "compact_fixtures.hpp"
#include "strata/format/columnar_file.hpp"
#include "strata/merge/local_merge_service.hpp"

using namespace strata;
using namespace compact_fixtures;

namespace {

auto input_for(const std::filesystem::path& root, const std::string& key) -> compact::MergeInput {
  auto meta = format::read_file_meta(root / key);
  REQUIRE(meta.has_value());
  return compact::MergeInput{key, root / key, *meta};
}

} // namespace

TEST_CASE("merge projects inputs onto the requested schema", "[merge][local]") {
  TempDir dir("local_merge");
  const auto a = segment_key("default", "logs", "app", 1, "2024/01/15/10", "a.seg");
  const auto b = segment_key("default", "logs", "app", 2, "2024/01/15/10", "b.seg");
  write_segment(dir.path() / a, SegmentSpec{{"message"}, 3, 1'000});
  write_segment(dir.path() / b, SegmentSpec{{"message", "level"}, 2, 5'000});

  compact::MergeRequest req{};
  req.stream_name = "app";
  req.schema = make_schema({"level", "message"});
  req.bloom_filter_fields = {"level"};
  req.meta = sized_meta(4096, 5, 1'000);
  req.inputs = {input_for(dir.path(), a), input_for(dir.path(), b)};

  merge::LocalMergeService svc(0);
  auto result = svc.merge(req);
  REQUIRE(result.has_value());
  auto* single = std::get_if<compact::MergeSingle>(&*result);
  REQUIRE(single != nullptr);

  auto decoded = format::decode_file(std::span<const std::uint8_t>(single->bytes));
  REQUIRE(decoded.has_value());
  REQUIRE(decoded->footer.schema == req.schema);
  REQUIRE(decoded->footer.meta == req.meta);
  REQUIRE(decoded->batch.num_rows() == 5);

  // newest first
  const auto* ts = decoded->batch.column("_timestamp");
  REQUIRE(ts != nullptr);
  REQUIRE(std::get<std::int64_t>(ts->front()) == 5'001);
  REQUIRE(std::get<std::int64_t>(ts->back()) == 1'000);

  // rows from `a` carry no level
  const auto* level = decoded->batch.column("level");
  REQUIRE(level != nullptr);
  REQUIRE(std::get<std::string>((*level)[0]) == "level value 1");
  REQUIRE(format::is_null(level->back()));

  const auto* bloom = decoded->bloom_filter("level");
  REQUIRE(bloom != nullptr);
  REQUIRE(bloom->might_contain("level value 0"));
  REQUIRE(decoded->bloom_filter("message") == nullptr);
}

TEST_CASE("merge casts mismatched column types", "[merge][local]") {
  TempDir dir("local_merge_cast");
  const auto key = segment_key("default", "logs", "app", 1, "2024/01/15/10", "n.seg");
  format::RecordBatch batch;
  batch.schema = make_schema({});
  batch.schema.add(format::Field{"code", format::DataType::int64, true});
  batch.columns = {{format::Value{std::int64_t{10}}}, {format::Value{std::int64_t{404}}}};
  std::filesystem::create_directories((dir.path() / key).parent_path());
  REQUIRE(format::write_columnar_file(dir.path() / key, batch).has_value());

  compact::MergeRequest req{};
  req.schema = make_schema({"code"});
  req.meta = sized_meta(64, 1, 10);
  req.inputs = {input_for(dir.path(), key)};

  merge::LocalMergeService svc(0);
  auto result = svc.merge(req);
  REQUIRE(result.has_value());
  auto decoded = format::decode_file(std::span<const std::uint8_t>(std::get<compact::MergeSingle>(*result).bytes));
  REQUIRE(decoded.has_value());
  REQUIRE(std::get<std::string>(decoded->batch.column("code")->front()) == "404");
}

TEST_CASE("merge without inputs is a precondition failure", "[merge][local]") {
  merge::LocalMergeService svc;
  compact::MergeRequest req{};
  req.schema = make_schema({"message"});
  auto result = svc.merge(req);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code == core::error_code::precondition_failed);
}

TEST_CASE("merge reports an input that disappeared", "[merge][local]") {
  TempDir dir("local_merge_missing");
  compact::MergeRequest req{};
  req.schema = make_schema({"message"});
  req.inputs = {compact::MergeInput{"gone.seg", dir.path() / "gone.seg", sized_meta(1, 1, 1)}};
  merge::LocalMergeService svc;
  auto result = svc.merge(req);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code == core::error_code::not_found);
}
