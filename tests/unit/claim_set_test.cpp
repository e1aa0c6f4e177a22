#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "strata/compact/claim_set.hpp"
#include "strata/compact/meta_cache.hpp"

using namespace strata::compact;

TEST_CASE("a key can be claimed once until released", "[compact][claims]") {
  ClaimSet claims;
  REQUIRE(claims.try_claim("files/a.seg"));
  REQUIRE_FALSE(claims.try_claim("files/a.seg"));
  REQUIRE(claims.contains("files/a.seg"));
  REQUIRE(claims.size() == 1);

  REQUIRE(claims.release("files/a.seg"));
  REQUIRE_FALSE(claims.release("files/a.seg"));
  REQUIRE_FALSE(claims.contains("files/a.seg"));
  REQUIRE(claims.try_claim("files/a.seg"));
}

TEST_CASE("concurrent claimers never win the same key twice", "[compact][claims]") {
  ClaimSet claims;
  constexpr int kThreads = 8;
  constexpr int kKeys = 500;
  std::atomic<int> wins{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]{
      for (int k = 0; k < kKeys; ++k) {
        if (claims.try_claim("key-" + std::to_string(k))) wins.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(wins.load() == kKeys);
  REQUIRE(claims.size() == static_cast<std::size_t>(kKeys));

  auto snap = claims.snapshot();
  std::sort(snap.begin(), snap.end());
  REQUIRE(std::adjacent_find(snap.begin(), snap.end()) == snap.end());
}

TEST_CASE("meta cache put, get and erase", "[compact][cache]") {
  SegmentMetaCache cache;
  strata::format::FileMeta meta{};
  meta.records = 3;
  cache.put("k", CachedSegment{meta, 42});
  REQUIRE(cache.size() == 1);
  auto got = cache.get("k");
  REQUIRE(got.has_value());
  REQUIRE(got->file_size == 42);
  REQUIRE(got->meta.records == 3);

  auto erased = cache.erase("k");
  REQUIRE(erased.has_value());
  REQUIRE_FALSE(cache.get("k").has_value());
  REQUIRE_FALSE(cache.erase("k").has_value());
}
