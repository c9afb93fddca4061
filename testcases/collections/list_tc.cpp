#include <catch2/catch.hpp>

#include "pcollections/persistent-list.hpp"

#include <deque>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace pcollections::test {

using namespace std::string_literals;

template <typename List> static std::vector<typename List::value_type> to_vector(const List& list) {
  return {list.begin(), list.end()};
}

CATCH_TEST_CASE("list_construct", "[list_construct]") {
  persistent_list<int> empty;
  CATCH_REQUIRE(empty.size() == 0);
  CATCH_REQUIRE(empty.empty());
  CATCH_REQUIRE(empty.begin() == empty.end());

  persistent_list<int> list{1, 2, 3};
  CATCH_REQUIRE(list.size() == 3);
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{1, 2, 3});

  std::vector<std::string> words{"a"s, "b"s};
  persistent_list<std::string> from_range{std::begin(words), std::end(words)};
  CATCH_REQUIRE(from_range.size() == 2);
  CATCH_REQUIRE(words[0] == "a"s); // not moved from
  CATCH_REQUIRE(from_range[1] == "b"s);
}

CATCH_TEST_CASE("list_element_access", "[list_element_access]") {
  const persistent_list<std::string> list{"x"s, "y"s, "z"s};
  CATCH_REQUIRE(list[0] == "x"s);
  CATCH_REQUIRE(list.at(2) == "z"s);
  CATCH_REQUIRE(list[-1] == "z"s);
  CATCH_REQUIRE(list.at(-3) == "x"s);
  CATCH_REQUIRE(list.front() == "x"s);
  CATCH_REQUIRE(list.back() == "z"s);

  CATCH_REQUIRE_THROWS_AS(list.at(3), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(list[-4], std::out_of_range);
  CATCH_REQUIRE_THROWS_WITH(list.at(7), "persistent_list::at: index 7 out of range for size 3");

  const persistent_list<std::string> empty;
  CATCH_REQUIRE_THROWS_AS(empty.front(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(empty.back(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(empty[0], std::out_of_range);
}

CATCH_TEST_CASE("list_push_pop", "[list_push_pop]") {
  persistent_list<int> list;
  list.push_back(2);
  list.push_back(3);
  list.push_front(1);
  list.push_front(0);
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{0, 1, 2, 3});

  const auto snapshot = list;
  list.pop_front();
  list.pop_back();
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{1, 2});
  CATCH_REQUIRE(to_vector(snapshot) == std::vector<int>{0, 1, 2, 3});

  list.pop_back();
  list.pop_back();
  CATCH_REQUIRE(list.empty());
  CATCH_REQUIRE_THROWS_AS(list.pop_back(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(list.pop_front(), std::out_of_range);

  list.push_front(9);
  CATCH_REQUIRE(list.front() == 9);
  CATCH_REQUIRE(list.back() == 9);
}

CATCH_TEST_CASE("list_set", "[list_set]") {
  persistent_list<int> list{1, 2, 3};
  const auto snapshot = list;
  list.set(1, 20);
  list.set(-1, 30);
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{1, 20, 30});
  CATCH_REQUIRE(to_vector(snapshot) == std::vector<int>{1, 2, 3});
  CATCH_REQUIRE_THROWS_AS(list.set(3, 0), std::out_of_range);
}

CATCH_TEST_CASE("list_insert_erase", "[list_insert_erase]") {
  persistent_list<int> list{0, 1, 2, 3, 4, 5};
  list.insert(1, 10);  // shifts the front
  list.insert(-1, 50); // shifts the back
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{0, 10, 1, 2, 3, 4, 50, 5});

  list.insert(0, -1);
  list.insert(100, 99); // clamped to the back
  list.insert(-100, -2); // clamped to the front
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{-2, -1, 0, 10, 1, 2, 3, 4, 50, 5, 99});

  list.erase(0);
  list.erase(-1);
  list.erase(2); // 10
  list.erase(-3); // 4
  CATCH_REQUIRE(to_vector(list) == std::vector<int>{-1, 0, 1, 2, 3, 50, 5});
  CATCH_REQUIRE_THROWS_AS(list.erase(7), std::out_of_range);
}

CATCH_TEST_CASE("list_matches_deque", "[list_matches_deque]") {
  std::mt19937 generator{7};
  std::uniform_int_distribution<int> op_dist{0, 6};

  persistent_list<int> list;
  std::deque<int> expected;
  for (int step = 0; step < 4000; ++step) {
    const auto n = static_cast<int64_t>(expected.size());
    switch (op_dist(generator)) {
    case 0:
      list.push_back(step);
      expected.push_back(step);
      break;
    case 1:
      list.push_front(step);
      expected.push_front(step);
      break;
    case 2: {
      const auto index = std::uniform_int_distribution<int64_t>{0, n}(generator);
      list.insert(index, step);
      expected.insert(expected.begin() + index, step);
    } break;
    case 3:
      if (n > 0) {
        const auto index = std::uniform_int_distribution<int64_t>{0, n - 1}(generator);
        list.erase(index);
        expected.erase(expected.begin() + index);
      }
      break;
    case 4:
      if (n > 0) {
        const auto index = std::uniform_int_distribution<int64_t>{0, n - 1}(generator);
        list.set(index, -step);
        expected[static_cast<std::size_t>(index)] = -step;
      }
      break;
    case 5:
      if (n > 0) {
        list.pop_back();
        expected.pop_back();
      }
      break;
    default:
      if (n > 0) {
        list.pop_front();
        expected.pop_front();
      }
      break;
    }
    CATCH_REQUIRE(list.size() == expected.size());
  }
  CATCH_REQUIRE(to_vector(list) == std::vector<int>(expected.begin(), expected.end()));
}

CATCH_TEST_CASE("list_transient", "[list_transient]") {
  const persistent_list<int> base{1, 2, 3, 4};
  auto session = base.transient();
  session.push_back(5);
  session.push_front(0);
  session.insert(3, 25);
  session.erase(1);
  session.set(-1, 50);
  CATCH_REQUIRE(session.size() == 6);
  CATCH_REQUIRE(session[0] == 0);
  CATCH_REQUIRE(session.at(-1) == 50);
  session.pop_front();
  session.pop_back();

  const auto result = session.persistent();
  CATCH_REQUIRE(to_vector(result) == std::vector<int>{2, 25, 3, 4});
  CATCH_REQUIRE(to_vector(base) == std::vector<int>{1, 2, 3, 4});
  CATCH_REQUIRE(session.is_frozen());
  CATCH_REQUIRE_THROWS_AS(session.push_back(1), frozen_transient_error);

  transient_list<std::string> fresh;
  fresh.push_back("a"s);
  CATCH_REQUIRE(fresh.persistent().back() == "a"s);
}

CATCH_TEST_CASE("list_equality_order_and_hash", "[list_equality_order_and_hash]") {
  using list_type = persistent_list<int>;
  list_type a{1, 2, 3};
  list_type b;
  b.push_front(3);
  b.push_front(2);
  b.push_front(1);
  const list_type c{3, 2, 1};

  CATCH_REQUIRE(a == b); // different starting positions, same items
  CATCH_REQUIRE(a != c);
  CATCH_REQUIRE(a < c);
  CATCH_REQUIRE(!(c < a));
  CATCH_REQUIRE(list_type{1, 2} < a);
  CATCH_REQUIRE(a.hash_code() == b.hash_code());
  CATCH_REQUIRE(a.hash_code() != c.hash_code()); // order matters
  CATCH_REQUIRE(std::hash<list_type>{}(a) == a.hash_code());

  std::unordered_set<list_type> lists{a, b, c};
  CATCH_REQUIRE(lists.size() == 2);

  using std::swap;
  swap(a, b);
  CATCH_REQUIRE(a == b);
  a.clear();
  CATCH_REQUIRE(a.empty());
  CATCH_REQUIRE(b.size() == 3);
}

CATCH_TEST_CASE("list_iterators", "[list_iterators]") {
  const persistent_list<std::string> list{"a"s, "bb"s, "ccc"s};
  std::size_t total = 0;
  for (auto ii = list.cbegin(); ii != list.cend(); ++ii)
    total += ii->size();
  CATCH_REQUIRE(total == 6);

  auto ii = list.end();
  CATCH_REQUIRE(*--ii == "ccc"s);
  CATCH_REQUIRE(*ii-- == "ccc"s);
  CATCH_REQUIRE(*ii == "bb"s);
  CATCH_REQUIRE(*ii++ == "bb"s);
  CATCH_REQUIRE(std::distance(list.begin(), list.end()) == 3);
}

} // namespace pcollections::test
