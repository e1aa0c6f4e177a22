#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <thread>

#include "strata/compact/worker_pool.hpp"

using strata::compact::WorkerPool;
using namespace std::chrono_literals;

TEST_CASE("wait_idle returns after every task has run", "[compact][pool]") {
  WorkerPool pool(4, 2);
  REQUIRE(pool.num_threads() == 4);
  std::atomic<int> done{0};
  for (int i = 0; i < 64; ++i) {
    REQUIRE(pool.submit([&done](std::size_t) {
      std::this_thread::sleep_for(1ms);
      done.fetch_add(1);
    }));
  }
  pool.wait_idle();
  REQUIRE(done.load() == 64);
  REQUIRE(pool.in_flight() == 0);
}

TEST_CASE("tasks see the index of their worker", "[compact][pool]") {
  WorkerPool pool(3);
  std::atomic<std::size_t> max_seen{0};
  for (int i = 0; i < 30; ++i) {
    REQUIRE(pool.submit([&max_seen](std::size_t worker) {
      auto cur = max_seen.load();
      while (worker > cur && !max_seen.compare_exchange_weak(cur, worker)) {}
    }));
  }
  pool.wait_idle();
  REQUIRE(max_seen.load() < 3);
}

TEST_CASE("a throwing task does not take down its worker", "[compact][pool]") {
  WorkerPool pool(1);
  std::atomic<int> done{0};
  REQUIRE(pool.submit([](std::size_t) { throw std::runtime_error("boom"); }));
  REQUIRE(pool.submit([&done](std::size_t) { done.fetch_add(1); }));
  pool.wait_idle();
  REQUIRE(done.load() == 1);
}

TEST_CASE("submit fails after shutdown", "[compact][pool]") {
  WorkerPool pool(2);
  std::atomic<int> done{0};
  REQUIRE(pool.submit([&done](std::size_t) { done.fetch_add(1); }));
  pool.shutdown();
  REQUIRE(done.load() == 1);
  REQUIRE_FALSE(pool.submit([](std::size_t) {}));
  pool.wait_idle();
}
