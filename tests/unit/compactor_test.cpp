#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <vector>

#include "compact_fixtures.hpp"
#include "strata/format/columnar_file.hpp"

namespace fs = std::filesystem;
using namespace strata;
using namespace strata::compact;
using namespace compact_fixtures;

namespace {

constexpr const char* kHour = "2024/01/15/10";
constexpr const char* kMergedKey = "files/default/logs/app/2024/01/15/10/a.seg";

auto fixed_now() -> std::chrono::system_clock::time_point {
  using namespace std::chrono;
  return sys_days{year{2024} / January / 20} + hours{8};
}

auto write_pair(Harness& h) -> std::vector<std::string> {
  const auto a = segment_key("default", "logs", "app", 1, kHour, "a.seg");
  const auto b = segment_key("default", "logs", "app", 2, kHour, "b.seg");
  write_segment(h.seg(a), SegmentSpec{{"message"}, 4, 1'000});
  write_segment(h.seg(b), SegmentSpec{{"message", "level"}, 3, 2'000});
  return {a, b};
}

auto register_app(Harness& h, stream::StreamSettings settings = {}) -> void {
  h.streams.upsert("default", stream::StreamType::logs, "app", make_schema({"message", "level"}),
                   std::move(settings));
}

} // namespace

TEST_CASE("a draining pass merges a partition end to end", "[compact][compactor]") {
  Harness h("compactor_e2e");
  register_app(h);
  auto keys = write_pair(h);
  auto compactor = h.make_compactor(fixed_now);
  REQUIRE(compactor->start().has_value());

  auto stats = compactor->run_pass(true);
  REQUIRE(stats.has_value());
  REQUIRE(stats->scanned == 2);
  REQUIRE(stats->claimed == 2);
  REQUIRE(stats->groups == 1);
  REQUIRE(stats->merged_outputs == 1);
  REQUIRE(stats->merged_segments == 2);
  REQUIRE(stats->deleted == 2);
  REQUIRE(stats->errors == 0);

  for (const auto& k : keys) REQUIRE_FALSE(fs::exists(h.seg(k)));
  REQUIRE(h.state.claims.size() == 0);
  REQUIRE(h.state.meta_cache.size() == 0);

  auto recorded = h.file_list.get(kMergedKey);
  REQUIRE(recorded.has_value());
  REQUIRE(recorded->records == 7);
  REQUIRE(recorded->min_ts == 1'000);
  auto bytes = h.storage.get(kMergedKey);
  REQUIRE(bytes.has_value());
  REQUIRE(recorded->compressed_size == bytes->size());
  auto decoded = format::decode_file(std::span<const std::uint8_t>(*bytes));
  REQUIRE(decoded.has_value());
  REQUIRE(decoded->batch.num_rows() == 7);

  REQUIRE(h.metrics.counter(metric::MERGED_FILES, "default", "logs") == 1);
  REQUIRE(h.metrics.gauge(metric::WAL_USED_BYTES, "default", "logs") == 0);

  auto idle = compactor->run_pass(true);
  REQUIRE(idle.has_value());
  REQUIRE(idle->scanned == 0);
  REQUIRE_FALSE(compactor->has_pending_work());
}

TEST_CASE("inputs still exist when the output is recorded", "[compact][compactor]") {
  Harness h("compactor_order");
  register_app(h);
  auto keys = write_pair(h);
  std::atomic<bool> inputs_present{false};
  h.file_list.on_record = [&](const std::string&) {
    inputs_present = fs::exists(h.seg(keys[0])) && fs::exists(h.seg(keys[1]));
  };
  auto compactor = h.make_compactor(fixed_now);
  REQUIRE(compactor->run_pass(true).has_value());
  REQUIRE(inputs_present.load());
  REQUIRE(h.file_list.size() == 1);
}

TEST_CASE("a failed record keeps inputs and claims for the retry", "[compact][compactor]") {
  Harness h("compactor_record_fails");
  register_app(h);
  auto keys = write_pair(h);
  h.file_list.fail_record = true;
  auto compactor = h.make_compactor(fixed_now);

  auto failed = compactor->run_pass(true);
  REQUIRE(failed.has_value());
  REQUIRE(failed->errors == 1);
  REQUIRE(failed->merged_outputs == 0);
  REQUIRE(failed->deferred == 1);
  for (const auto& k : keys) {
    REQUIRE(fs::exists(h.seg(k)));
    REQUIRE(h.state.claims.contains(k));
  }
  REQUIRE(compactor->deferred_groups() == 1);
  REQUIRE(compactor->has_pending_work());
  REQUIRE(h.metrics.counter(metric::MERGE_ERRORS, "default", "logs") == 1);

  h.file_list.fail_record = false;
  auto retried = compactor->run_pass(true);
  REQUIRE(retried.has_value());
  REQUIRE(retried->merged_outputs == 1);
  REQUIRE(retried->merged_segments == 2);
  for (const auto& k : keys) REQUIRE_FALSE(fs::exists(h.seg(k)));
  REQUIRE(h.state.claims.size() == 0);
  REQUIRE(compactor->deferred_groups() == 0);
  REQUIRE(h.file_list.get(kMergedKey).has_value());
}

TEST_CASE("a failed upload defers the group", "[compact][compactor]") {
  Harness h("compactor_put_fails");
  register_app(h);
  auto keys = write_pair(h);
  h.storage.fail_put = true;
  auto compactor = h.make_compactor(fixed_now);
  auto stats = compactor->run_pass(true);
  REQUIRE(stats.has_value());
  REQUIRE(stats->errors == 1);
  REQUIRE(h.file_list.size() == 0);
  for (const auto& k : keys) REQUIRE(fs::exists(h.seg(k)));
}

TEST_CASE("a fatal merge result fails the pass and keeps the group deferred", "[compact][compactor]") {
  Harness h("compactor_fatal");
  register_app(h);
  auto keys = write_pair(h);
  h.merger.script = MergeScript::multiple;
  auto compactor = h.make_compactor(fixed_now);
  auto stats = compactor->run_pass(true);
  REQUIRE_FALSE(stats.has_value());
  REQUIRE(stats.error().code == core::error_code::internal);
  REQUIRE(stats.error().component == "compact.compactor");
  REQUIRE(compactor->deferred_groups() == 1);
  REQUIRE(h.storage.keys().empty());
  for (const auto& k : keys) REQUIRE(h.state.claims.contains(k));
  REQUIRE(h.metrics.counter(metric::MERGE_ERRORS, "default", "logs") == 1);

  // the pass succeeds again once the merge service behaves
  h.merger.script = MergeScript::passthrough;
  auto retried = compactor->run_pass(true);
  REQUIRE(retried.has_value());
  REQUIRE(retried->merged_segments == 2);
  REQUIRE(compactor->deferred_groups() == 0);
}

TEST_CASE("a segment unreadable at selection leaves the wal gauge", "[compact][compactor]") {
  Harness h("compactor_unreadable_gauge");
  register_app(h);
  auto keys = write_pair(h);
  // cached by an earlier pass, then overwritten with garbage
  const auto junk = segment_key("default", "logs", "app", 3, kHour, "junk.seg");
  fs::create_directories(h.seg(junk).parent_path());
  std::ofstream(h.seg(junk)) << "not a columnar file";
  h.state.meta_cache.put(junk, CachedSegment{sized_meta(64, 1, 500), 64});
  h.metrics.gauge_add(metric::WAL_USED_BYTES, "default", "logs", 64);

  auto compactor = h.make_compactor(fixed_now);
  auto stats = compactor->run_pass(true);
  REQUIRE(stats.has_value());
  REQUIRE(stats->merged_segments == 2);
  REQUIRE_FALSE(h.state.claims.contains(junk));
  REQUIRE_FALSE(h.state.meta_cache.get(junk).has_value());
  REQUIRE(fs::exists(h.seg(junk)));
  REQUIRE(h.metrics.gauge(metric::WAL_USED_BYTES, "default", "logs") == 0);
}

TEST_CASE("observer failures do not affect the merge", "[compact][compactor]") {
  Harness h("compactor_observer");
  register_app(h);
  auto keys = write_pair(h);
  RecordingObserver throwing;
  throwing.mode = RecordingObserver::Mode::throws;
  RecordingObserver erroring;
  erroring.mode = RecordingObserver::Mode::error;
  auto compactor = h.make_compactor(fixed_now);
  compactor->add_observer(throwing);
  compactor->add_observer(erroring);

  auto stats = compactor->run_pass(true);
  REQUIRE(stats.has_value());
  REQUIRE(stats->merged_outputs == 1);
  REQUIRE(stats->errors == 0);
  REQUIRE(throwing.events.size() == 1);
  REQUIRE(erroring.events.size() == 1);
  REQUIRE(erroring.events[0].file_key == kMergedKey);
  REQUIRE(erroring.events[0].consumed_keys.size() == 2);
  for (const auto& k : keys) REQUIRE_FALSE(fs::exists(h.seg(k)));
}

TEST_CASE("small groups wait for more data until draining", "[compact][compactor]") {
  Harness h("compactor_small");
  register_app(h);
  auto keys = write_pair(h);
  auto compactor = h.make_compactor(fixed_now);

  auto first = compactor->run_pass(false);
  REQUIRE(first.has_value());
  REQUIRE(first->skipped_small == 1);
  REQUIRE(first->merged_outputs == 0);
  REQUIRE(compactor->deferred_groups() == 1);
  for (const auto& k : keys) REQUIRE(h.state.claims.contains(k));

  // a later segment of the same partition joins the waiting group
  const auto c = segment_key("default", "logs", "app", 3, kHour, "c.seg");
  write_segment(h.seg(c), SegmentSpec{{"message"}, 2, 500});

  auto drained = compactor->run_pass(true);
  REQUIRE(drained.has_value());
  REQUIRE(drained->groups == 1);
  REQUIRE(drained->merged_outputs == 1);
  REQUIRE(drained->merged_segments == 3);
  REQUIRE_FALSE(fs::exists(h.seg(c)));
  // c has the oldest rows, so the output is named after it
  REQUIRE(h.file_list.get("files/default/logs/app/2024/01/15/10/c.seg").has_value());
}

TEST_CASE("expired partitions are deleted without merging", "[compact][compactor]") {
  Harness h("compactor_retention");
  stream::StreamSettings settings{};
  settings.data_retention = 2;
  register_app(h, settings);
  auto keys = write_pair(h);
  auto compactor = h.make_compactor(fixed_now);

  auto stats = compactor->run_pass(false);
  REQUIRE(stats.has_value());
  REQUIRE(stats->retention_deleted == 2);
  REQUIRE(stats->merged_outputs == 0);
  REQUIRE(h.merger.calls == 0);
  REQUIRE(h.file_list.size() == 0);
  for (const auto& k : keys) REQUIRE_FALSE(fs::exists(h.seg(k)));
  REQUIRE(h.state.claims.size() == 0);
}

TEST_CASE("segments of unknown streams are dropped", "[compact][compactor]") {
  Harness h("compactor_unknown_stream");
  auto keys = write_pair(h);
  auto compactor = h.make_compactor(fixed_now);
  auto stats = compactor->run_pass(true);
  REQUIRE(stats.has_value());
  REQUIRE(stats->retention_deleted == 2);
  REQUIRE(h.storage.keys().empty());
}

TEST_CASE("leased inputs are deleted on a later pass", "[compact][compactor]") {
  Harness h("compactor_leased");
  register_app(h);
  auto keys = write_pair(h);
  h.locks.lock(keys[0]);
  auto compactor = h.make_compactor(fixed_now);

  auto first = compactor->run_pass(true);
  REQUIRE(first.has_value());
  REQUIRE(first->merged_outputs == 1);
  REQUIRE(first->pending == 1);
  REQUIRE(fs::exists(h.seg(keys[0])));
  REQUIRE(h.state.claims.contains(keys[0]));

  // the leased segment must not be merged again
  auto second = compactor->run_pass(true);
  REQUIRE(second.has_value());
  REQUIRE(second->merged_outputs == 0);
  REQUIRE(compactor->has_pending_work());

  h.locks.unlock(keys[0]);
  auto third = compactor->run_pass(true);
  REQUIRE(third.has_value());
  REQUIRE(third->deleted == 1);
  REQUIRE_FALSE(fs::exists(h.seg(keys[0])));
  REQUIRE(h.file_list.size() == 1);
}

TEST_CASE("pending deletes survive a restart", "[compact][compactor]") {
  Harness h("compactor_restart");
  register_app(h);
  auto keys = write_pair(h);
  REQUIRE(h.pending.add("default", "", keys[0]).has_value());
  h.locks.lock(keys[0]);

  auto compactor = h.make_compactor(fixed_now);
  REQUIRE(compactor->start().has_value());
  REQUIRE(h.state.claims.contains(keys[0]));

  auto stats = compactor->run_pass(true);
  REQUIRE(stats.has_value());
  REQUIRE(stats->merged_segments == 1);
  REQUIRE(fs::exists(h.seg(keys[0])));
  REQUIRE_FALSE(fs::exists(h.seg(keys[1])));
}
