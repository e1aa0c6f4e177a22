#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "compact_fixtures.hpp"
#include "strata/format/bloom_filter.hpp"
#include "strata/format/checksum.hpp"
#include "strata/format/columnar_file.hpp"

namespace fs = std::filesystem;
using namespace strata::format;
using strata::core::error_code;

static RecordBatch sample_batch() {
  RecordBatch b;
  b.schema.add(Field{std::string(TIMESTAMP_COL), DataType::int64, false});
  b.schema.add(Field{"level", DataType::utf8, true});
  b.schema.add(Field{"latency", DataType::float64, true});
  b.schema.add(Field{"ok", DataType::boolean, true});
  b.columns.resize(4);
  const std::int64_t ts[] = {30, 10, 20};
  const char* level[] = {"info", "warn", "info"};
  for (int i = 0; i < 3; ++i) {
    b.columns[0].emplace_back(ts[i]);
    b.columns[1].emplace_back(std::string(level[i]));
    b.columns[2].emplace_back(1.5 * i);
    b.columns[3].emplace_back(i != 1);
  }
  b.columns[2][1] = Value{};
  return b;
}

TEST_CASE("encode and decode preserve values and nulls", "[format][columnar]") {
  auto batch = sample_batch();
  auto bytes = encode_batch(batch);
  REQUIRE(bytes.has_value());
  auto decoded = decode_file(*bytes);
  REQUIRE(decoded.has_value());
  REQUIRE(decoded->batch.num_rows() == 3);
  REQUIRE(decoded->footer.schema == batch.schema);
  REQUIRE(decoded->batch.columns == batch.columns);
  REQUIRE(is_null(decoded->batch.columns[2][1]));
}

TEST_CASE("footer metadata carries timestamp bounds and record count", "[format][columnar]") {
  auto meta = compute_meta(sample_batch());
  REQUIRE(meta.min_ts == 10);
  REQUIRE(meta.max_ts == 30);
  REQUIRE(meta.records == 3);
  REQUIRE(meta.original_size > 0);
  REQUIRE(meta.compressed_size == 0);
  REQUIRE_FALSE(meta.is_empty());
}

TEST_CASE("empty batch encodes default metadata", "[format][columnar]") {
  compact_fixtures::TempDir dir("columnar_empty");
  auto path = dir.path() / "empty.seg";
  compact_fixtures::write_empty_segment(path);
  auto meta = read_file_meta(path);
  REQUIRE(meta.has_value());
  REQUIRE(meta->is_empty());
}

TEST_CASE("footer reads do not need the body and honor overrides", "[format][columnar]") {
  compact_fixtures::TempDir dir("columnar_footer");
  auto path = dir.path() / "a.seg";
  compact_fixtures::SegmentSpec layout;
  layout.fields = {"message", "host"};
  layout.meta = compact_fixtures::sized_meta(40 * strata::core::MB, 4, 100);
  auto written = compact_fixtures::write_segment(path, layout);
  REQUIRE(written.original_size == 40 * strata::core::MB);

  auto meta = read_file_meta(path);
  REQUIRE(meta.has_value());
  REQUIRE(*meta == written);
  auto schema = read_file_schema(path);
  REQUIRE(schema.has_value());
  REQUIRE(schema->size() == 3);
  REQUIRE(schema->contains("host"));
}

TEST_CASE("missing and damaged files report distinct errors", "[format][columnar]") {
  compact_fixtures::TempDir dir("columnar_damaged");
  auto missing = read_file_meta(dir.path() / "nope.seg");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == error_code::not_found);

  auto path = dir.path() / "b.seg";
  compact_fixtures::write_segment(path);
  {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(-10, std::ios::end);
    f.put('\x7f');
  }
  auto damaged = read_file_meta(path);
  REQUIRE_FALSE(damaged.has_value());
  REQUIRE(damaged.error().code == error_code::data_integrity);

  auto tiny = dir.path() / "tiny.seg";
  { std::ofstream(tiny) << "xy"; }
  REQUIRE_FALSE(read_file_meta(tiny).has_value());
}

TEST_CASE("bloom filters are written for requested fields only", "[format][bloom]") {
  EncodeOptions opts;
  opts.bloom_filter_fields = {"level", "absent"};
  auto bytes = encode_batch(sample_batch(), opts);
  REQUIRE(bytes.has_value());
  auto decoded = decode_file(*bytes);
  REQUIRE(decoded.has_value());
  REQUIRE(decoded->bloom_filters.size() == 1);
  const auto* bf = decoded->bloom_filter("level");
  REQUIRE(bf != nullptr);
  REQUIRE(bf->might_contain("warn"));
  REQUIRE(bf->might_contain("info"));
  REQUIRE(decoded->bloom_filter("latency") == nullptr);
}

TEST_CASE("bloom filter has no false negatives and survives serialization", "[format][bloom]") {
  auto bf = BloomFilter::for_items(1000, 0.01);
  for (int i = 0; i < 1000; ++i) bf.add("key-" + std::to_string(i));
  auto restored = BloomFilter::deserialize(bf.serialize());
  REQUIRE(restored.has_value());
  std::size_t false_positives = 0;
  for (int i = 0; i < 1000; ++i) {
    REQUIRE(restored->might_contain("key-" + std::to_string(i)));
    if (restored->might_contain("other-" + std::to_string(i))) ++false_positives;
  }
  REQUIRE(false_positives < 60);

  std::vector<std::uint8_t> junk{1, 2, 3};
  REQUIRE_FALSE(BloomFilter::deserialize(junk).has_value());
}

TEST_CASE("checksums match reference values", "[format][checksum]") {
  const std::string check = "123456789";
  std::vector<std::uint8_t> bytes(check.begin(), check.end());
  REQUIRE(crc32c(bytes) == 0xE3069283u);
  REQUIRE(fnv64(std::string_view("")) == 0xcbf29ce484222325ull);
  REQUIRE(fnv64(std::string_view("a")) != fnv64(std::string_view("b")));
}
