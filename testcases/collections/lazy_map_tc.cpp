#include <catch2/catch.hpp>

#include "pcollections/lazy-map.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace pcollections::test {

using namespace std::string_literals;

using map_type = lazy_map<std::string, int>;
using lazy_int = map_type::lazy_type;

CATCH_TEST_CASE("lazy_map_mixed_values", "[lazy_map_mixed_values]") {
  int calls = 0;
  map_type map;
  CATCH_REQUIRE(map.insert("plain"s, 1));
  CATCH_REQUIRE(map.insert("deferred"s, lazy_int{[&calls]() { return ++calls * 100; }}));
  CATCH_REQUIRE(!map.insert("plain"s, 2)); // already present
  CATCH_REQUIRE(map.size() == 2);

  CATCH_REQUIRE(!map.is_lazy("plain"s));
  CATCH_REQUIRE(map.is_ready("plain"s));
  CATCH_REQUIRE(map.is_lazy("deferred"s));
  CATCH_REQUIRE(!map.is_ready("deferred"s));
  CATCH_REQUIRE(calls == 0);

  CATCH_REQUIRE(map["plain"s] == 1);
  CATCH_REQUIRE(map["deferred"s] == 100);
  CATCH_REQUIRE(*map.at("deferred"s) == 100);
  CATCH_REQUIRE(map.get("deferred"s, 0) == 100);
  CATCH_REQUIRE(map.is_ready("deferred"s));
  CATCH_REQUIRE(map.is_lazy("deferred"s)); // still stored as a lazy
  CATCH_REQUIRE(calls == 1);
}

CATCH_TEST_CASE("lazy_map_missing_keys", "[lazy_map_missing_keys]") {
  const map_type map{{"a"s, map_type::stored_type{1}}};
  CATCH_REQUIRE(map.contains("a"s));
  CATCH_REQUIRE(map.count("b"s) == 0);
  CATCH_REQUIRE(map.at("b"s) == nullptr);
  CATCH_REQUIRE(map.get_lazy("b"s) == nullptr);
  CATCH_REQUIRE(map.get("b"s, -1) == -1);
  CATCH_REQUIRE_THROWS_AS(map["b"s], std::out_of_range);
  CATCH_REQUIRE_THROWS_WITH(map["b"s], "lazy_map::operator[]: key not found");
  CATCH_REQUIRE_THROWS_WITH(map.is_lazy("b"s), "lazy_map::is_lazy: key not found");
  CATCH_REQUIRE_THROWS_AS(map.is_ready("b"s), std::out_of_range);
}

CATCH_TEST_CASE("lazy_map_get_lazy_does_not_force", "[lazy_map_get_lazy_does_not_force]") {
  int calls = 0;
  map_type map;
  map.insert("x"s, lazy_int{[&calls]() { return ++calls; }});
  const auto* stored = map.get_lazy("x"s);
  CATCH_REQUIRE(stored != nullptr);
  CATCH_REQUIRE(std::holds_alternative<lazy_int>(*stored));
  CATCH_REQUIRE(calls == 0);
  CATCH_REQUIRE(map_type::force(*stored) == 1);
  CATCH_REQUIRE(calls == 1);
}

CATCH_TEST_CASE("lazy_map_copies_share_evaluation", "[lazy_map_copies_share_evaluation]") {
  int calls = 0;
  map_type map;
  map.insert("x"s, lazy_int{[&calls]() { return ++calls; }});
  const auto snapshot = map;
  map.insert_or_assign("y"s, 2);

  CATCH_REQUIRE(snapshot["x"s] == 1);
  CATCH_REQUIRE(map.is_ready("x"s));
  CATCH_REQUIRE(map["x"s] == 1);
  CATCH_REQUIRE(calls == 1);
  CATCH_REQUIRE(!snapshot.contains("y"s));
}

CATCH_TEST_CASE("lazy_map_failures_propagate", "[lazy_map_failures_propagate]") {
  int calls = 0;
  map_type map;
  map.insert("x"s, lazy_int{[&calls]() -> int {
               if (++calls == 1)
                 throw std::runtime_error{"boom"};
               return 5;
             }});

  CATCH_REQUIRE_THROWS_AS(map["x"s], std::runtime_error);
  CATCH_REQUIRE(!map.is_ready("x"s));
  CATCH_REQUIRE(map["x"s] == 5);
  CATCH_REQUIRE(calls == 2);
}

CATCH_TEST_CASE("lazy_map_iteration_forces", "[lazy_map_iteration_forces]") {
  int calls = 0;
  map_type map;
  for (int i = 0; i < 10; ++i)
    map.insert(std::to_string(i), lazy_int{[&calls, i]() {
                 ++calls;
                 return i * i;
               }});
  map.insert_or_assign("plain"s, -1);

  int total = 0;
  std::size_t counter = 0;
  for (auto [key, value] : map) {
    total += value;
    ++counter;
  }
  CATCH_REQUIRE(counter == 11);
  CATCH_REQUIRE(total == 285 - 1);
  CATCH_REQUIRE(calls == 10);

  // A second pass evaluates nothing
  for (auto ii = map.cbegin(); ii != map.cend(); ++ii)
    CATCH_REQUIRE((*ii).second == map[(*ii).first]);
  CATCH_REQUIRE(calls == 10);
}

CATCH_TEST_CASE("lazy_map_ready_all", "[lazy_map_ready_all]") {
  std::atomic<int> calls{0};
  map_type map;
  for (int i = 0; i < 50; ++i)
    map.insert(std::to_string(i), lazy_int{[&calls, i]() {
                 ++calls;
                 return i;
               }});

  // Readers in several threads, all sharing the map's cells
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t)
    threads.emplace_back([map]() { map.ready_all(); });
  for (auto& thread : threads)
    thread.join();

  CATCH_REQUIRE(calls.load() == 50);
  for (int i = 0; i < 50; ++i)
    CATCH_REQUIRE(map.is_ready(std::to_string(i)));
  CATCH_REQUIRE(&map.ready_all() == &map);
  CATCH_REQUIRE(calls.load() == 50);
}

CATCH_TEST_CASE("lazy_map_equality_and_hash", "[lazy_map_equality_and_hash]") {
  map_type a;
  a.insert("x"s, lazy_int{[]() { return 3; }});
  a.insert("y"s, 4);

  map_type b;
  b.insert("x"s, 3);
  b.insert("y"s, lazy_int::ready(4));

  map_type c;
  c.insert("x"s, 3);
  c.insert("y"s, 5);

  CATCH_REQUIRE(a == b); // compared by forced value
  CATCH_REQUIRE(a != c);
  CATCH_REQUIRE(a.hash_code() == b.hash_code());
  CATCH_REQUIRE(std::hash<map_type>{}(a) == b.hash_code());
  CATCH_REQUIRE(a.hash_code() != c.hash_code());
}

CATCH_TEST_CASE("lazy_map_edits", "[lazy_map_edits]") {
  map_type map;
  map.insert("a"s, 1);
  map.insert("b"s, lazy_int::ready(2));
  CATCH_REQUIRE(!map.insert_or_assign("a"s, lazy_int{[]() { return 10; }}));
  CATCH_REQUIRE(map.is_lazy("a"s));
  CATCH_REQUIRE(map["a"s] == 10);
  CATCH_REQUIRE(map.erase("b"s) == 1);
  CATCH_REQUIRE(map.erase("b"s) == 0);

  map_type other;
  swap(map, other);
  CATCH_REQUIRE(map.empty());
  CATCH_REQUIRE(other.size() == 1);

  // Batch edits
  auto session = other.transient();
  session.set("c"s, map_type::stored_type{lazy_int{[]() { return 30; }}});
  session.set("d"s, map_type::stored_type{40});
  const map_type edited{session.persistent()};
  CATCH_REQUIRE(edited.size() == 3);
  CATCH_REQUIRE(edited["c"s] == 30);
  CATCH_REQUIRE(edited["d"s] == 40);
  CATCH_REQUIRE(other.size() == 1);
  CATCH_REQUIRE(edited.to_map().size() == 3);

  other.clear();
  CATCH_REQUIRE(other.empty());
}

CATCH_TEST_CASE("lazy_map_transient", "[lazy_map_transient]") {
  int calls = 0;
  const map_type base{{"one"s, map_type::stored_type{1}}};
  auto session = base.transient();
  static_assert(std::is_same<decltype(session), transient_lazy_map<std::string, int>>::value);

  CATCH_REQUIRE(session.insert("two"s, lazy_int{[&calls]() { return ++calls + 1; }}));
  CATCH_REQUIRE(session.set("three"s, lazy_int{[&calls]() { return ++calls + 2; }}));
  CATCH_REQUIRE(!session.insert_or_assign("one"s, 10));
  CATCH_REQUIRE(session.is_lazy("two"s));
  CATCH_REQUIRE(!session.is_ready("two"s));
  CATCH_REQUIRE(std::holds_alternative<lazy_int>(*session.get_lazy("three"s)));
  CATCH_REQUIRE(calls == 0);

  // Reads force
  CATCH_REQUIRE(session["two"s] == 2);
  CATCH_REQUIRE(*session.at("two"s) == 2);
  CATCH_REQUIRE(session.get("four"s, -4) == -4);
  CATCH_REQUIRE(session.at("four"s) == nullptr);
  CATCH_REQUIRE(session.is_ready("two"s));
  CATCH_REQUIRE(calls == 1);
  CATCH_REQUIRE_THROWS_WITH(session["four"s], "transient_lazy_map::operator[]: key not found");

  std::vector<std::string> keys;
  int total = 0;
  for (auto [key, value] : session) {
    keys.push_back(key);
    total += value;
  }
  CATCH_REQUIRE(keys == (std::vector<std::string>{"one"s, "two"s, "three"s}));
  CATCH_REQUIRE(total == 10 + 2 + 4);
  CATCH_REQUIRE(calls == 2);

  CATCH_REQUIRE(session.erase("one"s) == 1);
  const lazy_map<std::string, int> result = session.persistent();
  CATCH_REQUIRE(session.is_frozen());
  CATCH_REQUIRE(result.size() == 2);
  CATCH_REQUIRE(result.is_lazy("three"s));
  CATCH_REQUIRE(result.is_ready("three"s)); // forced in the session, and the cell is shared
  CATCH_REQUIRE(result["three"s] == 4);
  CATCH_REQUIRE(base.size() == 1);
  CATCH_REQUIRE(base["one"s] == 1);
  CATCH_REQUIRE(calls == 2);
}

} // namespace pcollections::test
