#include "trie/trie-test-utils.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace pcollections::test {

using namespace std::string_literals;
using trie::test::collection_root;
using trie::test::TracedItem;

// ------------------------------------------------------------------------------------------- sets

CATCH_TEST_CASE("set_construct_and_fill", "[set_construct_and_fill]") {
  using set_type = persistent_set<int>;
  const std::vector<int> primes{2, 3, 5, 7, 11};

  const set_type from_range{std::begin(primes), std::end(primes)};
  const set_type from_ilist{{11, 7, 5, 3, 2}};
  set_type built;
  CATCH_REQUIRE(built.empty());
  built.insert(std::begin(primes), std::end(primes));

  auto holds_primes = [&primes](const set_type& set) {
    return set.size() == primes.size() &&
           std::all_of(std::begin(primes), std::end(primes),
                       [&set](int x) { return set.contains(x); });
  };
  CATCH_REQUIRE(holds_primes(from_range));
  CATCH_REQUIRE(holds_primes(from_ilist));
  CATCH_REQUIRE(holds_primes(built));
  CATCH_REQUIRE(from_range == from_ilist);

  CATCH_REQUIRE(!built.insert(7));
  CATCH_REQUIRE(built.insert(13));
  CATCH_REQUIRE(built.emplace(17));
  built.insert({17, 19, 23});
  CATCH_REQUIRE(built.size() == 9);
  CATCH_REQUIRE(built.count(19) == 1);
  CATCH_REQUIRE(built.count(4) == 0);

  built.clear();
  CATCH_REQUIRE(built.empty());
  CATCH_REQUIRE(!from_range.empty());
}

CATCH_TEST_CASE("set_item_lifetimes", "[set_item_lifetimes]") {
  using set_type = persistent_set<TracedItem, TracedItem::Hasher>;
  uint32_t counter = 0;
  {
    set_type set;
    const TracedItem kept{counter, 1};
    set.insert(kept);
    // `kept`, its copy in the set, and the two copies that record its place in the order
    CATCH_REQUIRE(counter == 4);

    auto snapshot = set;
    set.insert(TracedItem{counter, 2});
    CATCH_REQUIRE(counter == 7);
    CATCH_REQUIRE(snapshot.size() == 1);

    snapshot.clear(); // the copies of `kept` are still shared with `set`
    CATCH_REQUIRE(counter == 7);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("set_extract", "[set_extract]") {
  persistent_set<std::string> set{"p"s, "q"s};
  const auto before = set;
  const auto taken = set.extract("p"s);
  CATCH_REQUIRE(taken.has_value());
  CATCH_REQUIRE(*taken == "p"s);
  CATCH_REQUIRE(!set.extract("p"s).has_value());
  CATCH_REQUIRE(set.size() == 1);
  CATCH_REQUIRE(before.contains("p"s)); // shared storage is left alone
}

CATCH_TEST_CASE("set_value_semantics", "[set_value_semantics]") {
  using set_type = persistent_set<int>;
  set_type a{{1, 2, 3}};
  set_type b;
  CATCH_REQUIRE(a == a);
  CATCH_REQUIRE(b == b);
  CATCH_REQUIRE(a != b);

  b = a;
  CATCH_REQUIRE(b == a);
  b.erase(2);
  CATCH_REQUIRE(b != a);
  CATCH_REQUIRE(a.contains(2));
  b.insert(2);
  CATCH_REQUIRE(b == a);
  b.erase(3);
  b.insert(4); // same size, other contents
  CATCH_REQUIRE(b.size() == a.size());
  CATCH_REQUIRE(b != a);

  set_type moved{std::move(b)};
  CATCH_REQUIRE(b.empty());
  CATCH_REQUIRE(moved.contains(4));

  a.swap(a);
  CATCH_REQUIRE(a.size() == 3);
  using std::swap;
  swap(a, moved);
  CATCH_REQUIRE(a.contains(4));
  CATCH_REQUIRE(moved.contains(3));
  a.swap(b);
  CATCH_REQUIRE(a.empty());
  CATCH_REQUIRE(b.size() == 3);
}

CATCH_TEST_CASE("set_functors", "[set_functors]") {
  using set_type = persistent_set<std::string>;
  CATCH_REQUIRE(set_type::hash_function()("k"s) == std::hash<std::string>{}("k"s));
  CATCH_REQUIRE(set_type::key_eq()("k"s, "k"s));
  CATCH_REQUIRE(!set_type::key_eq()("k"s, "j"s));
  CATCH_REQUIRE(set_type::max_size() > 0);
}

CATCH_TEST_CASE("set_hash_code", "[set_hash_code]") {
  using set_type = persistent_set<std::string>;
  const set_type a{{"x"s, "y"s, "z"s}};
  const set_type b{{"z"s, "x"s, "y"s}};
  const set_type c{{"x"s, "y"s, "w"s}};
  CATCH_REQUIRE(a.hash_code() == b.hash_code());
  CATCH_REQUIRE(std::hash<set_type>{}(a) == a.hash_code());
  CATCH_REQUIRE(a.hash_code() != c.hash_code());
  CATCH_REQUIRE(set_type{}.hash_code() == set_type{}.hash_code());

  // Sets of sets
  std::unordered_set<set_type> outer{a, b, c};
  CATCH_REQUIRE(outer.size() == 2);
}

CATCH_TEST_CASE("set_erase_if", "[set_erase_if]") {
  using set_type = persistent_set<int>;
  set_type set;
  for (int i = 0; i < 100; ++i)
    set.insert(i);
  const auto odds = set.erase_if([](int x) { return x % 2 == 0; });
  CATCH_REQUIRE(set.size() == 100);
  CATCH_REQUIRE(odds.size() == 50);
  CATCH_REQUIRE(erase_if(set, [](int x) { return x >= 10; }) == 90);
  CATCH_REQUIRE(set.size() == 10);
}

CATCH_TEST_CASE("set_transient", "[set_transient]") {
  using set_type = persistent_set<int>;
  const set_type base{{1, 2, 3}};
  auto session = base.transient();
  CATCH_REQUIRE(session.insert(4));
  CATCH_REQUIRE(!session.insert(1));
  CATCH_REQUIRE(session.emplace(5));
  CATCH_REQUIRE(session.erase(2) == 1);
  CATCH_REQUIRE(session.erase(2) == 0);
  CATCH_REQUIRE(session.size() == 4);
  CATCH_REQUIRE(session.contains(5));
  CATCH_REQUIRE(session.find(2) == nullptr);

  const auto result = session.persistent();
  CATCH_REQUIRE(session.is_frozen());
  CATCH_REQUIRE_THROWS_AS(session.insert(9), frozen_transient_error);
  CATCH_REQUIRE(result == (set_type{{1, 3, 4, 5}}));
  CATCH_REQUIRE(base == (set_type{{1, 2, 3}}));

  transient_set<int, std::hash<int>, std::equal_to<int>, true> empty_session;
  CATCH_REQUIRE(empty_session.empty());
  empty_session.insert(1);
  CATCH_REQUIRE(empty_session.persistent().size() == 1);
}

CATCH_TEST_CASE("set_not_thread_safe", "[set_not_thread_safe]") {
  using set_type = persistent_set<int, std::hash<int>, std::equal_to<int>, false>;
  static_assert(!set_type::is_thread_safe);
  set_type set{{1, 2, 3}};
  auto other = set;
  other.erase(1);
  CATCH_REQUIRE(set.size() == 3);
  CATCH_REQUIRE(other.size() == 2);
}

// ------------------------------------------------------------------------------------------- maps

CATCH_TEST_CASE("map_construct_and_lookup", "[map_construct_and_lookup]") {
  using map_type = persistent_map<std::string, int>;
  const std::vector<map_type::item_type> planets{{"mercury"s, 1}, {"venus"s, 2}, {"earth"s, 3}};

  map_type map{std::begin(planets), std::end(planets)};
  CATCH_REQUIRE(planets[2].first == "earth"s); // copied, not moved
  CATCH_REQUIRE(map == (map_type{{{"earth"s, 3}, {"venus"s, 2}, {"mercury"s, 1}}}));
  CATCH_REQUIRE(map.size() < map_type::max_size());

  for (const auto& [name, order] : planets) {
    CATCH_REQUIRE(map.count(name) == 1);
    CATCH_REQUIRE(*map.find(name) == order);
    CATCH_REQUIRE(*map.at(name) == order);
    CATCH_REQUIRE(map[name] == order);
    CATCH_REQUIRE(map.get(name, -1) == order);
  }

  CATCH_REQUIRE(!map.contains("pluto"s));
  CATCH_REQUIRE(map.find("pluto"s) == nullptr);
  CATCH_REQUIRE(map.get("pluto"s, -1) == -1);
  CATCH_REQUIRE_THROWS_AS(map["pluto"s], std::out_of_range);
  CATCH_REQUIRE_THROWS_WITH(map["pluto"s], "persistent_map::operator[]: key not found");

  map.clear();
  CATCH_REQUIRE(map.empty());
  CATCH_REQUIRE(!map.contains("earth"s));
}

CATCH_TEST_CASE("map_value_semantics", "[map_value_semantics]") {
  using map_type = persistent_map<int, std::string>;
  map_type map{{{0, "a"s}, {1, "b"s}, {2, "c"s}}};
  map_type copy{map};
  map_type assigned;
  CATCH_REQUIRE(copy == map);
  CATCH_REQUIRE(assigned != map);
  assigned = map;
  CATCH_REQUIRE(assigned == map);

  copy.erase(2);
  copy.insert({3, "d"s});
  CATCH_REQUIRE(copy.size() == map.size());
  CATCH_REQUIRE(copy != map);
  CATCH_REQUIRE(map.contains(2));

  assigned.insert_or_assign(1, "B"s); // same keys, one value differs
  CATCH_REQUIRE(assigned != map);

  map_type moved{std::move(assigned)};
  CATCH_REQUIRE(assigned.empty());
  CATCH_REQUIRE(moved[1] == "B"s);
  assigned = std::move(moved);
  CATCH_REQUIRE(moved.empty());
  CATCH_REQUIRE(assigned.size() == 3);

  using std::swap;
  swap(map, moved);
  CATCH_REQUIRE(map.empty());
  CATCH_REQUIRE(moved.size() == 3);
  moved.swap(moved);
  CATCH_REQUIRE(moved[0] == "a"s);
}

CATCH_TEST_CASE("map_insert_and_erase", "[map_insert_and_erase]") {
  using map_type = persistent_map<std::string, std::string>;
  map_type map;
  map.insert({{"k0"s, "v0"s}, {"k1"s, "v1"s}, {"k2"s, "v2"s}});
  CATCH_REQUIRE(map.size() == 3);

  auto item = map_type::item_type{"k3"s, "v3"s};
  CATCH_REQUIRE(map.insert(item));
  CATCH_REQUIRE(!map.insert(map_type::item_type{"k3"s, "other"s}));
  CATCH_REQUIRE(map["k3"s] == "v3"s);

  CATCH_REQUIRE(map.erase("k3"s) == 1);
  CATCH_REQUIRE(map.erase("k3"s) == 0);
  CATCH_REQUIRE(map.insert(std::move(item)));
  CATCH_REQUIRE(item.first.empty());
  CATCH_REQUIRE(map.size() == 4);

  map_type other;
  other.insert(std::begin(map), std::end(map));
  CATCH_REQUIRE(other == map);
}

CATCH_TEST_CASE("map_erase_if", "[map_erase_if]") {
  using map_type = persistent_map<int, std::string>;
  map_type map{{{0, "a"s}, {1, "b"s}, {2, "c"s}, {3, "d"s}}};

  auto is_even = [](int key) { return key % 2 == 0; };
  const map_type odd = map.erase_if(is_even);
  CATCH_REQUIRE(map.size() == 4);
  CATCH_REQUIRE(odd.size() == 2);
  for (const auto& [key, value] : map)
    CATCH_REQUIRE(odd.contains(key) != is_even(key));

  CATCH_REQUIRE(erase_if(map, is_even) == 2);
  CATCH_REQUIRE(map == odd);
}

CATCH_TEST_CASE("map_emplace_extract", "[map_emplace_extract]") {
  using map_type = persistent_map<int, TracedItem>;
  uint32_t counter = 0;
  {
    map_type map;
    CATCH_REQUIRE(map.emplace(5, TracedItem{counter, 50}));
    CATCH_REQUIRE(!map.emplace(5, TracedItem{counter, 51}));
    CATCH_REQUIRE(counter == 1);

    const auto taken = map.extract(5);
    CATCH_REQUIRE(taken.has_value());
    CATCH_REQUIRE(taken->second.value() == 50);
    CATCH_REQUIRE(map.empty());
    CATCH_REQUIRE(!map.extract(5).has_value());
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("map_insert_or_assign", "[map_insert_or_assign]") {
  uint32_t counter = 0;
  {
    persistent_map<int, TracedItem> map;
    CATCH_REQUIRE(map.insert_or_assign(10, TracedItem{counter, 1}));
    const auto first = map;

    const TracedItem replacement{counter, 3};
    CATCH_REQUIRE(!map.insert_or_assign(10, replacement)); // existing key
    CATCH_REQUIRE(map.size() == 1);
    CATCH_REQUIRE(map[10].value() == 3);
    CATCH_REQUIRE(first[10].value() == 1);
  }
  CATCH_REQUIRE(counter == 0);

  persistent_map<std::string, std::string> names{{{"A"s, "a"s}}};
  auto key = "B"s;
  auto value = "b"s;
  CATCH_REQUIRE(names.insert_or_assign(key, std::move(value)));
  CATCH_REQUIRE(key == "B"s);
  CATCH_REQUIRE(value.empty());
  auto again = "bb"s;
  CATCH_REQUIRE(!names.insert_or_assign(key, std::move(again)));
  CATCH_REQUIRE(again.empty());
  CATCH_REQUIRE(names[key] == "bb"s);
}

CATCH_TEST_CASE("map_colliding_keys", "[map_colliding_keys]") {
  // TracedItem hashes only the low 32 bits, so these keys share a full hash
  using map_type = persistent_map<TracedItem, int, TracedItem::Hasher>;
  constexpr auto step = static_cast<std::size_t>(std::numeric_limits<uint32_t>::max()) + 1;
  uint32_t counter = 0;
  {
    auto key = [&counter](std::size_t n) { return TracedItem{counter, 10 + n * step}; };
    CATCH_REQUIRE(map_type::hash_function()(key(0)) == map_type::hash_function()(key(2)));

    map_type map;
    for (std::size_t n = 0; n < 3; ++n)
      CATCH_REQUIRE(map.insert_or_assign(key(n), static_cast<int>(n)));
    CATCH_REQUIRE(!map.insert_or_assign(key(1), 100));
    CATCH_REQUIRE(map.size() == 3);
    CATCH_REQUIRE(map[key(0)] == 0);
    CATCH_REQUIRE(map[key(1)] == 100);
    CATCH_REQUIRE(map[key(2)] == 2);

    CATCH_REQUIRE(map.erase(key(1)) == 1);
    CATCH_REQUIRE(!map.contains(key(1)));
    CATCH_REQUIRE(map[key(0)] == 0);
    CATCH_REQUIRE(map[key(2)] == 2);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("map_update", "[map_update]") {
  using map_type = persistent_map<std::string, int>;
  map_type map;
  auto increment = [](const int* current) { return current ? *current + 1 : 1; };
  map.update("x"s, increment);
  map.update("x"s, increment);
  map.update("y"s, increment);
  const auto snapshot = map;
  map.update("x"s, increment);
  CATCH_REQUIRE(map["x"s] == 3);
  CATCH_REQUIRE(map["y"s] == 1);
  CATCH_REQUIRE(snapshot["x"s] == 2);
  CATCH_REQUIRE(map.size() == 2);
}

CATCH_TEST_CASE("map_hash_code", "[map_hash_code]") {
  using map_type = persistent_map<int, std::string>;
  const map_type a{{{0, "a"s}, {1, "b"s}}};
  const map_type b{{{1, "b"s}, {0, "a"s}}};
  const map_type c{{{0, "a"s}, {1, "c"s}}};
  CATCH_REQUIRE(a.hash_code() == b.hash_code());
  CATCH_REQUIRE(std::hash<map_type>{}(a) == a.hash_code());
  CATCH_REQUIRE(a.hash_code() != c.hash_code()); // values are hashed too
  CATCH_REQUIRE(map_type::key_eq()(1, 1));
  CATCH_REQUIRE(map_type::hash_function()(1) == std::hash<int>{}(1));
}

CATCH_TEST_CASE("map_iteration", "[map_iteration]") {
  using map_type = persistent_map<int, std::string>;
  map_type map;
  for (int i = 0; i < 40; ++i)
    map.insert_or_assign(i, std::string(static_cast<std::size_t>(i % 5), 'x'));

  std::vector<int> seen;
  for (auto ii = map.cbegin(); ii != map.cend(); ++ii) {
    CATCH_REQUIRE(ii->second.size() == static_cast<std::size_t>(ii->first % 5));
    seen.push_back(ii->first);
  }
  std::sort(std::begin(seen), std::end(seen));
  CATCH_REQUIRE(seen.size() == 40);
  CATCH_REQUIRE(std::adjacent_find(std::begin(seen), std::end(seen)) == std::end(seen));

  std::size_t total = 0;
  for (const auto& [key, value] : map)
    total += value.size();
  CATCH_REQUIRE(total == 80);
}

CATCH_TEST_CASE("map_transient", "[map_transient]") {
  using map_type = persistent_map<std::string, int>;
  const map_type base{{{"a"s, 1}, {"b"s, 2}}};

  auto session = base.transient();
  CATCH_REQUIRE(session.set("c"s, 3));
  CATCH_REQUIRE(!session.set("a"s, 10));
  CATCH_REQUIRE(!session.insert({"b"s, 20}));
  CATCH_REQUIRE(session.insert_or_assign("d"s, 4));
  session.update("b"s, [](const int* v) { return *v * 100; });
  CATCH_REQUIRE(session.erase("d"s) == 1);
  CATCH_REQUIRE(session["a"s] == 10);
  CATCH_REQUIRE(session.at("zz"s) == nullptr);
  CATCH_REQUIRE_THROWS_AS(session["zz"s], std::out_of_range);
  CATCH_REQUIRE_THROWS_WITH(session["zz"s], "transient_map::operator[]: key not found");

  const auto result = session.persistent();
  CATCH_REQUIRE(result == (map_type{{{"a"s, 10}, {"b"s, 200}, {"c"s, 3}}}));
  CATCH_REQUIRE(base == (map_type{{{"a"s, 1}, {"b"s, 2}}}));
  CATCH_REQUIRE_THROWS_AS(session.set("e"s, 5), frozen_transient_error);
}

// -------------------------------------------------------------------------------- insertion order

template <typename Collection> std::vector<int> keys_in_order(const Collection& collection) {
  std::vector<int> keys;
  for (const auto& item : collection) {
    if constexpr (std::is_same<std::decay_t<decltype(item)>, int>::value) {
      keys.push_back(item);
    } else {
      keys.push_back(item.first);
    }
  }
  return keys;
}

CATCH_TEST_CASE("set_insertion_order", "[set_insertion_order]") {
  using set_type = persistent_set<int>;
  const std::vector<int> values{40, 3, 17, 1000, 0, 64, 5};
  const set_type set{std::begin(values), std::end(values)};
  CATCH_REQUIRE(keys_in_order(set) == values);

  auto edited = set;
  CATCH_REQUIRE(edited.erase(17) == 1);
  CATCH_REQUIRE(!edited.insert(40)); // already present, keeps its place
  CATCH_REQUIRE(edited.insert(17));  // back at the end
  CATCH_REQUIRE(keys_in_order(edited) == (std::vector<int>{40, 3, 1000, 0, 64, 5, 17}));
  CATCH_REQUIRE(keys_in_order(set) == values);

  // Order does not take part in equality or hashing
  CATCH_REQUIRE(edited == set);
  CATCH_REQUIRE(edited.hash_code() == set.hash_code());

  // Walking backwards from the end
  std::vector<int> reversed;
  for (auto ii = set.end(); ii != set.begin();)
    reversed.push_back(*--ii);
  CATCH_REQUIRE(reversed == (std::vector<int>{5, 64, 0, 1000, 17, 3, 40}));
}

CATCH_TEST_CASE("map_insertion_order", "[map_insertion_order]") {
  using map_type = persistent_map<int, std::string>;
  map_type map;
  for (int key : {9, 2, 33, 4})
    map.insert_or_assign(key, std::to_string(key));
  CATCH_REQUIRE(keys_in_order(map) == (std::vector<int>{9, 2, 33, 4}));

  CATCH_REQUIRE(!map.insert_or_assign(2, "two"s)); // keeps its place
  map.update(7, [](const std::string*) { return "seven"s; });
  map.update(9, [](const std::string* current) { return *current + "!"; });
  CATCH_REQUIRE(keys_in_order(map) == (std::vector<int>{9, 2, 33, 4, 7}));
  CATCH_REQUIRE(map[2] == "two"s);
  CATCH_REQUIRE(map[9] == "9!"s);

  CATCH_REQUIRE(map.erase(33) == 1);
  CATCH_REQUIRE(map.erase(33) == 0);
  CATCH_REQUIRE(keys_in_order(map) == (std::vector<int>{9, 2, 4, 7}));

  const auto copy = map_type{map.begin(), map.end()};
  CATCH_REQUIRE(keys_in_order(copy) == keys_in_order(map));

  const auto odd = map.erase_if([](int key) { return key % 2 == 0; });
  CATCH_REQUIRE(keys_in_order(odd) == (std::vector<int>{9, 7}));

  map.clear();
  CATCH_REQUIRE(map.begin() == map.end());
  map.insert_or_assign(1, "one"s);
  CATCH_REQUIRE(keys_in_order(map) == (std::vector<int>{1}));
}

CATCH_TEST_CASE("insertion_order_survives_many_erases",
                "[insertion_order_survives_many_erases]") {
  using map_type = persistent_map<int, int>;
  map_type map;
  std::vector<int> expected;
  for (int i = 0; i < 500; ++i) {
    map.insert_or_assign(i, i);
    expected.push_back(i);
  }

  // Erasing most keys renumbers the rest; the order must not change
  for (int i = 0; i < 500; ++i) {
    if (i % 7 != 0)
      map.erase(i);
  }
  expected.erase(std::remove_if(std::begin(expected), std::end(expected),
                                [](int i) { return i % 7 != 0; }),
                 std::end(expected));
  CATCH_REQUIRE(map.size() == expected.size());
  CATCH_REQUIRE(keys_in_order(map) == expected);

  map.insert_or_assign(1, 1);
  expected.push_back(1);
  CATCH_REQUIRE(keys_in_order(map) == expected);

  // The same through a session
  auto session = map.transient();
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (i % 3 != 0)
      session.erase(expected[i]);
  }
  session.set(-1, -1);
  std::vector<int> kept;
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (i % 3 == 0)
      kept.push_back(expected[i]);
  }
  kept.push_back(-1);
  CATCH_REQUIRE(keys_in_order(session) == kept);
  const auto result = session.persistent();
  CATCH_REQUIRE(keys_in_order(result) == kept);
  CATCH_REQUIRE(keys_in_order(map) == expected);
}

CATCH_TEST_CASE("transient_insertion_order", "[transient_insertion_order]") {
  const persistent_set<int> base{{5, 1, 3}};
  auto set_session = base.transient();
  set_session.insert(2);
  set_session.erase(1);
  set_session.insert(1);
  CATCH_REQUIRE(keys_in_order(set_session) == (std::vector<int>{5, 3, 2, 1}));
  CATCH_REQUIRE(keys_in_order(set_session.persistent()) == (std::vector<int>{5, 3, 2, 1}));
  CATCH_REQUIRE(keys_in_order(base) == (std::vector<int>{5, 1, 3}));

  persistent_map<int, int> map;
  auto map_session = map.transient();
  map_session.set(8, 0);
  map_session.insert({6, 0});
  map_session.update(7, [](const int*) { return 1; });
  map_session.set(8, 2);
  CATCH_REQUIRE(keys_in_order(map_session) == (std::vector<int>{8, 6, 7}));
  CATCH_REQUIRE(map_session[8] == 2);
  CATCH_REQUIRE(keys_in_order(map_session.persistent()) == (std::vector<int>{8, 6, 7}));
}

// ------------------------------------------------------------------------------------ set algebra

CATCH_TEST_CASE("set_algebra", "[set_algebra]") {
  using set_type = persistent_set<int>;
  const set_type a{{1, 2, 3, 4}};
  const set_type b{{6, 4, 3, 5}};

  const auto both = a | b;
  CATCH_REQUIRE(keys_in_order(both) == (std::vector<int>{1, 2, 3, 4, 6, 5}));
  CATCH_REQUIRE(keys_in_order(a & b) == (std::vector<int>{3, 4}));
  CATCH_REQUIRE(keys_in_order(b & a) == (std::vector<int>{4, 3}));
  CATCH_REQUIRE(keys_in_order(a - b) == (std::vector<int>{1, 2}));
  CATCH_REQUIRE(keys_in_order(b - a) == (std::vector<int>{6, 5}));
  CATCH_REQUIRE(keys_in_order(a ^ b) == (std::vector<int>{1, 2, 6, 5}));
  CATCH_REQUIRE((a ^ b) == ((a | b) - (a & b)));

  // Operands are untouched, and an empty operand changes nothing
  CATCH_REQUIRE(a == (set_type{{1, 2, 3, 4}}));
  CATCH_REQUIRE((a | set_type{}) == a);
  CATCH_REQUIRE((a & set_type{}).empty());
  CATCH_REQUIRE((a - set_type{}) == a);
  CATCH_REQUIRE(collection_root(a - set_type{}) == collection_root(a));

  // A large right-hand side of a difference
  set_type large;
  for (int i = 2; i < 200; ++i)
    large.insert(i);
  CATCH_REQUIRE(keys_in_order(a - large) == (std::vector<int>{1}));

  auto c = a;
  c |= b;
  CATCH_REQUIRE(c == both);
  c &= set_type{{2, 6, 7}};
  CATCH_REQUIRE(c == (set_type{{2, 6}}));
  c -= set_type{{2}};
  CATCH_REQUIRE(c == (set_type{{6}}));
  c ^= set_type{{6, 9}};
  CATCH_REQUIRE(c == (set_type{{9}}));
}

CATCH_TEST_CASE("set_relations", "[set_relations]") {
  using set_type = persistent_set<int>;
  const set_type small{{1, 2}};
  const set_type large{{3, 2, 1}};
  const set_type other{{7, 8}};

  CATCH_REQUIRE(small.is_subset_of(large));
  CATCH_REQUIRE(small <= large);
  CATCH_REQUIRE(small < large);
  CATCH_REQUIRE(large >= small);
  CATCH_REQUIRE(large > small);
  CATCH_REQUIRE(large.is_superset_of(small));
  CATCH_REQUIRE(!large.is_subset_of(small));

  CATCH_REQUIRE(large <= large);
  CATCH_REQUIRE(!(large < large));
  CATCH_REQUIRE(large >= set_type{{1, 2, 3}});

  // Subset order is partial
  CATCH_REQUIRE(!(small <= other));
  CATCH_REQUIRE(!(other <= small));
  CATCH_REQUIRE(small.is_disjoint(other));
  CATCH_REQUIRE(other.is_disjoint(large));
  CATCH_REQUIRE(!small.is_disjoint(large));
  CATCH_REQUIRE(set_type{}.is_disjoint(set_type{}));
  CATCH_REQUIRE(set_type{} <= small);
}

CATCH_TEST_CASE("set_bulk_edits", "[set_bulk_edits]") {
  using set_type = persistent_set<std::string>;
  set_type set{{"a"s, "b"s, "c"s}};
  const std::vector<std::string> more{"c"s, "d"s, "e"s};
  set.insert(std::begin(more), std::end(more));
  CATCH_REQUIRE(set.size() == 5);

  const std::vector<std::string> some{"a"s, "e"s, "zz"s};
  CATCH_REQUIRE(set.erase(std::begin(some), std::end(some)) == 2);
  CATCH_REQUIRE(set == (set_type{{"b"s, "c"s, "d"s}}));

  const auto before = set;
  CATCH_REQUIRE_THROWS_AS(set.remove(std::begin(some), std::end(some)), std::out_of_range);
  CATCH_REQUIRE(collection_root(set) == collection_root(before));

  const std::vector<std::string> present{"b"s, "d"s};
  set.remove(std::begin(present), std::end(present));
  CATCH_REQUIRE(set == (set_type{{"c"s}}));

  set.remove("c"s);
  CATCH_REQUIRE(set.empty());
  CATCH_REQUIRE_THROWS_WITH(set.remove("c"s), "persistent_set::remove: item not found");

  auto session = before.transient();
  session |= set_type{{"x"s}};
  session -= set_type{{"b"s}};
  session ^= set_type{{"c"s, "y"s}};
  CATCH_REQUIRE_THROWS_WITH(session.remove("q"s), "transient_set::remove: item not found");
  CATCH_REQUIRE(session.persistent() == (set_type{{"d"s, "x"s, "y"s}}));
}

} // namespace pcollections::test
