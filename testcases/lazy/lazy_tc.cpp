#include <catch2/catch.hpp>

#include "pcollections/lazy.hpp"
#include "pcollections/persistent-map.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pcollections::test {

using namespace std::string_literals;

CATCH_TEST_CASE("lazy_evaluates_once", "[lazy_evaluates_once]") {
  int calls = 0;
  lazy<int> value{[&calls]() {
    ++calls;
    return 42;
  }};

  CATCH_REQUIRE(!value.is_evaluated());
  CATCH_REQUIRE(calls == 0);
  CATCH_REQUIRE(value.get() == 42);
  CATCH_REQUIRE(value.is_evaluated());
  CATCH_REQUIRE(value() == 42);
  CATCH_REQUIRE(unlazy(value) == 42);
  CATCH_REQUIRE(calls == 1);
}

CATCH_TEST_CASE("lazy_captures_arguments", "[lazy_captures_arguments]") {
  auto prefix = "key-"s;
  lazy<std::string> value{[](const std::string& p, int n) { return p + std::to_string(n); },
                          prefix, 7};
  prefix = "changed";
  CATCH_REQUIRE(value.get() == "key-7");
}

CATCH_TEST_CASE("lazy_move_only_callable", "[lazy_move_only_callable]") {
  lazy<int> captured{[p = std::make_unique<int>(6)]() { return *p * 7; }};
  CATCH_REQUIRE(captured.get() == 42);

  lazy<std::string> from_argument{[](std::unique_ptr<std::string>& s) { return *s + "!"; },
                                  std::make_unique<std::string>("moved")};
  const auto copy = from_argument;
  CATCH_REQUIRE(copy.get() == "moved!");
  CATCH_REQUIRE(from_argument.is_evaluated());

  // Moving a lazy moves its cell
  auto moved = std::move(captured);
  CATCH_REQUIRE(moved.is_evaluated());
  CATCH_REQUIRE(moved.get() == 42);
}

CATCH_TEST_CASE("lazy_copies_share_a_cell", "[lazy_copies_share_a_cell]") {
  int calls = 0;
  lazy<int> value{[&calls]() { return ++calls; }};
  const auto copy = value;
  CATCH_REQUIRE(!copy.is_evaluated());
  CATCH_REQUIRE(value.get() == 1);
  CATCH_REQUIRE(copy.is_evaluated());
  CATCH_REQUIRE(copy.get() == 1);
  CATCH_REQUIRE(calls == 1);
}

CATCH_TEST_CASE("lazy_failures_are_not_cached", "[lazy_failures_are_not_cached]") {
  int calls = 0;
  lazy<int> value{[&calls]() {
    if (++calls < 3)
      throw std::runtime_error{"not yet"};
    return 3;
  }};

  CATCH_REQUIRE_THROWS_AS(value.get(), std::runtime_error);
  CATCH_REQUIRE(!value.is_evaluated());
  CATCH_REQUIRE_THROWS_WITH(value.get(), "not yet");
  CATCH_REQUIRE(value.get() == 3);
  CATCH_REQUIRE(value.get() == 3);
  CATCH_REQUIRE(calls == 3);
}

CATCH_TEST_CASE("lazy_ready", "[lazy_ready]") {
  const auto value = lazy<std::string>::ready("done"s);
  CATCH_REQUIRE(value.is_ready());
  CATCH_REQUIRE(value.get() == "done");
  CATCH_REQUIRE(unlazy(5) == 5);
}

CATCH_TEST_CASE("lazy_equality_and_hash", "[lazy_equality_and_hash]") {
  int calls = 0;
  lazy<int> a{[&calls]() {
    ++calls;
    return 10;
  }};
  lazy<int> b{[&calls]() {
    ++calls;
    return 10;
  }};
  const auto c = lazy<int>::ready(11);

  CATCH_REQUIRE(a == a); // same cell, nothing forced
  CATCH_REQUIRE(calls == 0);
  CATCH_REQUIRE(a == b);
  CATCH_REQUIRE(calls == 2);
  CATCH_REQUIRE(a != c);
  CATCH_REQUIRE(std::hash<lazy<int>>{}(a) == std::hash<int>{}(10));
  CATCH_REQUIRE(std::hash<lazy<int>>{}(a) == std::hash<lazy<int>>{}(b));
  CATCH_REQUIRE(calls == 2);
}

CATCH_TEST_CASE("lazy_concurrent_evaluation", "[lazy_concurrent_evaluation]") {
  constexpr int n_threads = 16;
  for (int trial = 0; trial < 20; ++trial) {
    std::atomic<int> calls{0};
    std::atomic<bool> go{false};
    lazy<std::vector<int>> value{[&calls]() {
      ++calls;
      std::this_thread::sleep_for(std::chrono::microseconds{200});
      return std::vector<int>(1000, 7);
    }};

    std::vector<const std::vector<int>*> seen(n_threads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < n_threads; ++i) {
      threads.emplace_back([&, i]() {
        while (!go.load())
          std::this_thread::yield();
        seen[i] = &value.get();
      });
    }
    go.store(true);
    for (auto& thread : threads)
      thread.join();

    CATCH_REQUIRE(calls.load() == 1);
    for (const auto* result : seen) {
      CATCH_REQUIRE(result == seen.front()); // everyone sees the one cached value
      CATCH_REQUIRE(result->size() == 1000);
    }
  }
}

CATCH_TEST_CASE("lazy_concurrent_failure_retries", "[lazy_concurrent_failure_retries]") {
  constexpr int n_threads = 8;
  std::atomic<int> calls{0};
  lazy<int> value{[&calls]() {
    if (calls.fetch_add(1) == 0)
      throw std::runtime_error{"first call fails"};
    return 1;
  }};

  std::atomic<int> failures{0};
  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < n_threads; ++i) {
    threads.emplace_back([&]() {
      try {
        if (value.get() == 1)
          ++successes;
      } catch (const std::runtime_error&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads)
    thread.join();

  // Exactly one evaluation failed; exactly one succeeded, and was shared
  CATCH_REQUIRE(failures.load() == 1);
  CATCH_REQUIRE(successes.load() == n_threads - 1);
  CATCH_REQUIRE(calls.load() == 2);
}

CATCH_TEST_CASE("lazy_single_threaded", "[lazy_single_threaded]") {
  static_assert(!lazy<int, false>::is_thread_safe);
  int calls = 0;
  lazy<int, false> value{[&calls](int x) { return x + ++calls; }, 100};
  CATCH_REQUIRE(!value.is_evaluated());
  CATCH_REQUIRE(value.get() == 101);
  CATCH_REQUIRE(value.get() == 101);
  CATCH_REQUIRE(calls == 1);
  CATCH_REQUIRE(lazy<int, false>::ready(3).get() == 3);
}

CATCH_TEST_CASE("lazy_in_persistent_map", "[lazy_in_persistent_map]") {
  int calls = 0;
  persistent_map<std::string, lazy<int>> map;
  map.insert_or_assign("a"s, lazy<int>{[&calls]() { return ++calls; }});
  map.insert_or_assign("b"s, lazy<int>::ready(0));

  const auto snapshot = map;
  map.erase("b"s);

  // Forcing through one version is seen by every version sharing the value
  CATCH_REQUIRE(map["a"].get() == 1);
  CATCH_REQUIRE(snapshot["a"].is_evaluated());
  CATCH_REQUIRE(snapshot["a"].get() == 1);
  CATCH_REQUIRE(calls == 1);
  CATCH_REQUIRE(snapshot.size() == 2);
  CATCH_REQUIRE(map.size() == 1);
}

} // namespace pcollections::test
