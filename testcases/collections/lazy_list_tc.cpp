#include <catch2/catch.hpp>

#include "pcollections/lazy-list.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace pcollections::test {

using list_type = lazy_list<int>;
using lazy_int = list_type::lazy_type;

static std::vector<int> forced_values(const list_type& list) {
  return {list.begin(), list.end()};
}

CATCH_TEST_CASE("lazy_list_mixed_items", "[lazy_list_mixed_items]") {
  int calls = 0;
  list_type list;
  list.push_back(1);
  list.push_back(lazy_int{[&calls]() { return ++calls * 10; }});
  list.push_front(lazy_int{[&calls]() { return ++calls * 100; }});
  CATCH_REQUIRE(list.size() == 3);

  CATCH_REQUIRE(list.is_lazy(0));
  CATCH_REQUIRE(!list.is_lazy(1));
  CATCH_REQUIRE(list.is_ready(1));
  CATCH_REQUIRE(!list.is_ready(-1));
  CATCH_REQUIRE(std::holds_alternative<lazy_int>(list.get_lazy(-1)));
  CATCH_REQUIRE(calls == 0);

  CATCH_REQUIRE(list[-1] == 10); // evaluated first
  CATCH_REQUIRE(list.front() == 200);
  CATCH_REQUIRE(list.back() == 10);
  CATCH_REQUIRE(list.at(1) == 1);
  CATCH_REQUIRE(calls == 2);
  CATCH_REQUIRE(list.is_ready(0));
  CATCH_REQUIRE(list.is_lazy(0)); // still stored as a lazy

  CATCH_REQUIRE(forced_values(list) == (std::vector<int>{200, 1, 10}));
  CATCH_REQUIRE(calls == 2);
}

CATCH_TEST_CASE("lazy_list_errors", "[lazy_list_errors]") {
  const list_type list{1, 2};
  CATCH_REQUIRE_THROWS_AS(list[2], std::out_of_range);
  CATCH_REQUIRE_THROWS_WITH(list.at(-3), "lazy_list::at: index -3 out of range for size 2");
  CATCH_REQUIRE_THROWS_WITH(list.is_lazy(5),
                            "lazy_list::is_lazy: index 5 out of range for size 2");
  CATCH_REQUIRE_THROWS_AS(list_type{}.front(), std::out_of_range);

  // A failing item throws on every read, and is retried
  int attempts = 0;
  list_type failing;
  failing.push_back(lazy_int{[&attempts]() -> int {
    if (++attempts < 3)
      throw std::runtime_error{"not yet"};
    return 7;
  }});
  CATCH_REQUIRE_THROWS_AS(failing[0], std::runtime_error);
  CATCH_REQUIRE_THROWS_AS(failing.ready_all(), std::runtime_error);
  CATCH_REQUIRE(failing[0] == 7);
  CATCH_REQUIRE(attempts == 3);
}

CATCH_TEST_CASE("lazy_list_edits_share_cells", "[lazy_list_edits_share_cells]") {
  int calls = 0;
  list_type list{1, lazy_int{[&calls]() { return ++calls; }}, 3};
  const auto snapshot = list;

  list.insert(1, 50);
  list.set(0, lazy_int{[]() { return -1; }});
  list.erase(-1);
  CATCH_REQUIRE(list.size() == 3);
  CATCH_REQUIRE(snapshot.size() == 3);
  CATCH_REQUIRE(!snapshot.is_ready(1));

  // Forcing through the edited list is seen by the snapshot
  CATCH_REQUIRE(forced_values(list) == (std::vector<int>{-1, 50, 1}));
  CATCH_REQUIRE(snapshot.is_ready(1));
  CATCH_REQUIRE(forced_values(snapshot) == (std::vector<int>{1, 1, 3}));
  CATCH_REQUIRE(calls == 1);

  list.pop_front();
  list.pop_back();
  CATCH_REQUIRE(forced_values(list) == (std::vector<int>{50}));
  list.clear();
  CATCH_REQUIRE(list.empty());
}

CATCH_TEST_CASE("lazy_list_equality_and_hash", "[lazy_list_equality_and_hash]") {
  const list_type eager{1, 2, 3};
  const list_type deferred{1, lazy_int{[]() { return 2; }}, lazy_int::ready(3)};
  const list_type shorter{1, 2};
  CATCH_REQUIRE(eager == deferred);
  CATCH_REQUIRE(eager.hash_code() == deferred.hash_code());
  CATCH_REQUIRE(std::hash<list_type>{}(eager) == eager.hash_code());
  CATCH_REQUIRE(eager != shorter);
  CATCH_REQUIRE(shorter < eager);
  CATCH_REQUIRE(!(eager < deferred));

  // The underlying list keeps the lazies
  CATCH_REQUIRE(deferred.to_list().size() == 3);
  CATCH_REQUIRE(std::holds_alternative<lazy_int>(deferred.to_list()[1]));

  CATCH_REQUIRE(&deferred.ready_all() == &deferred);
}

CATCH_TEST_CASE("lazy_list_transient", "[lazy_list_transient]") {
  int calls = 0;
  const list_type base{1, 2};
  auto session = base.transient();
  static_assert(std::is_same<decltype(session), transient_lazy_list<int>>::value);

  session.push_back(lazy_int{[&calls]() { return ++calls * 3; }});
  session.push_front(0);
  session.insert(2, lazy_int{[&calls]() { return ++calls * 1000; }});
  session.set(1, 11);
  session.pop_front();
  CATCH_REQUIRE(session.size() == 4);
  CATCH_REQUIRE(std::holds_alternative<lazy_int>(session.get_lazy(-1)));
  CATCH_REQUIRE(calls == 0);

  // Reads force
  CATCH_REQUIRE(session[-1] == 3);
  CATCH_REQUIRE(session.at(1) == 1000 * 2);
  CATCH_REQUIRE(calls == 2);
  CATCH_REQUIRE_THROWS_WITH(session[4],
                            "transient_lazy_list::operator[]: index 4 out of range for size 4");

  session.erase(2);
  const lazy_list<int> result = session.persistent();
  CATCH_REQUIRE(session.is_frozen());
  CATCH_REQUIRE(forced_values(result) == (std::vector<int>{11, 2000, 3}));
  CATCH_REQUIRE(result.is_lazy(1));
  CATCH_REQUIRE(result.is_ready(1));
  CATCH_REQUIRE(forced_values(base) == (std::vector<int>{1, 2}));
  CATCH_REQUIRE(calls == 2);

  auto untouched = base.transient();
  CATCH_REQUIRE(untouched.persistent() == base);
}

} // namespace pcollections::test
