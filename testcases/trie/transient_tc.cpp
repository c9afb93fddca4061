#include "trie-test-utils.hpp"

#include <random>
#include <stdexcept>
#include <string>

namespace pcollections::trie::test {

using IntTrie = basic_trie<int, int, std::hash<int>, std::equal_to<int>, true>;
using IntSetTrie = basic_trie<int, int, std::hash<int>, std::equal_to<int>, false>;

// A value whose copies and moves draw on a shared budget, and throw once it is spent.
// A negative budget is unlimited.
class BudgetedValue {
private:
  uint32_t& counter_;
  int& budget_;
  std::string text_;

  static int& spend(int& budget) {
    if (budget == 0)
      throw std::runtime_error{"budget spent"};
    if (budget > 0)
      --budget;
    return budget;
  }

public:
  BudgetedValue(uint32_t& counter, int& budget, std::string text)
      : counter_{counter}, budget_{budget}, text_{std::move(text)} {
    counter_++;
  }
  BudgetedValue(const BudgetedValue& o)
      : counter_{o.counter_}, budget_{spend(o.budget_)}, text_{o.text_} {
    counter_++;
  }
  BudgetedValue(BudgetedValue&& o) // not noexcept
      : counter_{o.counter_}, budget_{spend(o.budget_)}, text_{std::move(o.text_)} {
    counter_++;
  }
  ~BudgetedValue() { counter_--; }
  BudgetedValue& operator=(const BudgetedValue&) = delete;
  const std::string& text() const { return text_; }
  bool operator==(const BudgetedValue& o) const { return text_ == o.text_; }
};

CATCH_TEST_CASE("transient_matches_persistent_edits", "[transient_matches_persistent_edits]") {
  using Ops = NodeOpsOf<IntTrie>;
  std::mt19937 generator{99};
  std::uniform_int_distribution<int> key_dist{0, 999};
  std::uniform_int_distribution<int> op_dist{0, 2};

  IntTrie base;
  for (int i = 0; i < 300; ++i)
    base = base.insert(key_dist(generator), i);
  const auto snapshot = base;

  IntTrie expected = base;
  auto session = base.transient();
  for (int step = 0; step < 3000; ++step) {
    const auto key = key_dist(generator);
    switch (op_dist(generator)) {
    case 0:
      expected = expected.insert(key, step);
      session.set(key, step);
      break;
    case 1:
      expected = expected.remove(key);
      session.erase(key);
      break;
    default:
      expected = expected.update(key, [](const int* v) { return v ? *v * 2 : 7; });
      session.update(key, [](const int* v) { return v ? *v * 2 : 7; });
      break;
    }
    CATCH_REQUIRE(session.size() == expected.size());
    if (step % 500 == 0)
      check_trie_invariants<Ops>(root_of(session), session.size());
  }

  const auto result = session.persistent();
  CATCH_REQUIRE(result == expected);
  CATCH_REQUIRE(shape_of<Ops>(root_of(result)) == shape_of<Ops>(root_of(expected)));
  check_trie_invariants<Ops>(root_of(result), result.size());

  // The session never touched the trie it was opened on
  CATCH_REQUIRE(base == snapshot);
  CATCH_REQUIRE(root_of(base) == root_of(snapshot));
  check_trie_invariants<Ops>(root_of(base), base.size());
}

CATCH_TEST_CASE("transient_reads", "[transient_reads]") {
  IntTrie base{{1, 10}, {2, 20}};
  auto session = base.transient();
  CATCH_REQUIRE(session.size() == 2);
  CATCH_REQUIRE(!session.empty());
  CATCH_REQUIRE(session.contains(1));
  CATCH_REQUIRE(session.count(3) == 0);
  CATCH_REQUIRE(*session.get(2) == 20);
  CATCH_REQUIRE(session.find(3) == nullptr);

  CATCH_REQUIRE(session.insert(IntTrie::item_type{1, 99}) == false); // key present
  CATCH_REQUIRE(*session.get(1) == 10);
  CATCH_REQUIRE(session.insert_or_assign(IntTrie::item_type{1, 99}) == false);
  CATCH_REQUIRE(*session.get(1) == 99);
  CATCH_REQUIRE(session.set(3, 30) == true);
  CATCH_REQUIRE(session.erase(4) == 0);
  CATCH_REQUIRE(session.erase(2) == 1);
  CATCH_REQUIRE(session.size() == 2);

  const auto result = session.freeze();
  CATCH_REQUIRE(result.size() == 2);
  CATCH_REQUIRE(*result.get(1) == 99);
  CATCH_REQUIRE(*result.get(3) == 30);
  CATCH_REQUIRE(!result.contains(2));
  CATCH_REQUIRE(*base.get(1) == 10);
  CATCH_REQUIRE(base.size() == 2);
}

CATCH_TEST_CASE("transient_frozen_throws", "[transient_frozen_throws]") {
  IntTrie base{{1, 10}};
  auto session = base.transient();
  session.set(2, 20);
  const auto result = session.persistent();
  CATCH_REQUIRE(session.is_frozen());
  CATCH_REQUIRE(result.size() == 2);

  CATCH_REQUIRE_THROWS_AS(session.set(3, 30), frozen_transient_error);
  CATCH_REQUIRE_THROWS_AS(session.erase(1), frozen_transient_error);
  CATCH_REQUIRE_THROWS_AS(session.get(1), frozen_transient_error);
  CATCH_REQUIRE_THROWS_AS(session.size(), frozen_transient_error);
  CATCH_REQUIRE_THROWS_AS(session.persistent(), frozen_transient_error);
  CATCH_REQUIRE_THROWS_AS(session.freeze(), frozen_transient_error);
  CATCH_REQUIRE_THROWS_AS(session.update(1, [](const int*) { return 0; }),
                          frozen_transient_error);

  // A logic error, with a message naming the operation
  try {
    session.erase(1);
    CATCH_FAIL("expected frozen_transient_error");
  } catch (const std::logic_error& e) {
    CATCH_REQUIRE(std::string{e.what()}.find("erase") != std::string::npos);
  }

  // The published trie is unaffected by the failed calls
  CATCH_REQUIRE(result.size() == 2);
  CATCH_REQUIRE(*result.get(2) == 20);
}

CATCH_TEST_CASE("transient_moved_from_is_frozen", "[transient_moved_from_is_frozen]") {
  IntTrie base{{1, 10}};
  auto session = base.transient();
  auto other = std::move(session);
  CATCH_REQUIRE(session.is_frozen());
  CATCH_REQUIRE(!other.is_frozen());
  CATCH_REQUIRE_THROWS_AS(session.set(1, 1), frozen_transient_error);
  other.set(1, 11);
  CATCH_REQUIRE(*other.persistent().get(1) == 11);
}

CATCH_TEST_CASE("transient_copies_each_path_once", "[transient_copies_each_path_once]") {
  using Ops = NodeOpsOf<IntTrie>;

  IntTrie base;
  for (int i = 0; i < 2000; ++i)
    base = base.insert(i, i);

  auto session = base.transient();
  CATCH_REQUIRE(root_of(session) == root_of(base)); // opening copies nothing

  session.set(17, -1);
  const auto first_root = root_of(session);
  CATCH_REQUIRE(first_root != root_of(base));
  CATCH_REQUIRE(Ops::ref_count(first_root) == 1);

  // The path to 17 is now owned by the session: a second edit on it copies nothing
  const auto owned_nodes = all_nodes<Ops>(first_root);
  session.set(17, -2);
  CATCH_REQUIRE(root_of(session) == first_root);
  CATCH_REQUIRE(count_new_nodes<Ops>(first_root, root_of(session)) == 0);
  CATCH_REQUIRE(all_nodes<Ops>(root_of(session)) == owned_nodes);

  // Each distinct path is copied at most once over many edits
  for (int i = 0; i < 2000; i += 3)
    session.set(i, 0);
  const auto after_first_round = all_nodes<Ops>(root_of(session));
  const auto first_round_root = root_of(session);
  for (int round = 1; round < 5; ++round)
    for (int i = 0; i < 2000; i += 3)
      session.set(i, round);
  CATCH_REQUIRE(root_of(session) == first_round_root);
  CATCH_REQUIRE(all_nodes<Ops>(root_of(session)) == after_first_round);

  auto result = session.persistent();
  CATCH_REQUIRE(result.size() == 2000);
  for (int i = 0; i < 2000; ++i)
    CATCH_REQUIRE(*result.get(i) == (i % 3 == 0 ? 4 : (i == 17 ? -2 : i)));
  for (int i = 0; i < 2000; ++i)
    CATCH_REQUIRE(*base.get(i) == i);
  check_trie_invariants<Ops>(root_of(result), result.size());
}

CATCH_TEST_CASE("transient_no_edits_shares_root", "[transient_no_edits_shares_root]") {
  IntTrie base{{1, 10}, {2, 20}};
  auto session = base.transient();
  CATCH_REQUIRE(session.erase(3) == 0);
  CATCH_REQUIRE(session.insert(IntTrie::item_type{1, 0}) == false);
  const auto result = session.persistent();
  CATCH_REQUIRE(root_of(result) == root_of(base));
}

CATCH_TEST_CASE("transient_does_not_disturb_other_snapshots",
                "[transient_does_not_disturb_other_snapshots]") {
  using Ops = NodeOpsOf<IntTrie>;
  IntTrie base;
  for (int i = 0; i < 500; ++i)
    base = base.insert(i, i);

  auto session = base.transient();
  for (int i = 0; i < 500; i += 2)
    session.erase(i);
  const auto middle = session.persistent();

  // A second session over the result of the first
  auto session2 = middle.transient();
  for (int i = 1; i < 500; i += 4)
    session2.erase(i);
  for (int i = 1000; i < 1100; ++i)
    session2.set(i, i);
  const auto last = session2.persistent();

  CATCH_REQUIRE(base.size() == 500);
  CATCH_REQUIRE(middle.size() == 250);
  CATCH_REQUIRE(last.size() == 125 + 100);
  for (int i = 0; i < 500; ++i) {
    CATCH_REQUIRE(base.contains(i));
    CATCH_REQUIRE(middle.contains(i) == (i % 2 == 1));
    CATCH_REQUIRE(last.contains(i) == (i % 4 == 3));
  }
  check_trie_invariants<Ops>(root_of(base), base.size());
  check_trie_invariants<Ops>(root_of(middle), middle.size());
  check_trie_invariants<Ops>(root_of(last), last.size());
}

CATCH_TEST_CASE("transient_collapse_is_canonical", "[transient_collapse_is_canonical]") {
  using Ops = NodeOpsOf<IntSetTrie>;
  IntSetTrie full;
  {
    auto session = full.transient();
    for (int i = 0; i < 3000; ++i)
      session.insert(i);
    full = session.persistent();
  }

  auto session = full.transient();
  for (int i = 0; i < 3000; ++i)
    if (i % 7 != 0)
      session.erase(i);
  const auto trimmed = session.persistent();

  IntSetTrie fresh;
  for (int i = 0; i < 3000; i += 7)
    fresh = fresh.insert(i);

  CATCH_REQUIRE(trimmed == fresh);
  CATCH_REQUIRE(shape_of<Ops>(root_of(trimmed)) == shape_of<Ops>(root_of(fresh)));
  check_trie_invariants<Ops>(root_of(trimmed), trimmed.size());
  CATCH_REQUIRE(full.size() == 3000);
}

CATCH_TEST_CASE("transient_traced_items_do_not_leak", "[transient_traced_items_do_not_leak]") {
  using Set = basic_trie<MoveTracedItem, MoveTracedItem, MoveTracedItem::Hasher,
                         std::equal_to<MoveTracedItem>, false>;
  uint32_t counter = 0;
  {
    Set base;
    for (std::size_t i = 0; i < 100; ++i)
      base = base.insert(MoveTracedItem{counter, i});

    auto session = base.transient();
    for (std::size_t i = 0; i < 100; i += 2)
      session.erase(MoveTracedItem{counter, i});
    for (std::size_t i = 0; i < 50; ++i) // collides with i, in the low 32 bits
      session.insert(MoveTracedItem{counter, i + (std::size_t{1} << 32)});
    const auto result = session.persistent();
    CATCH_REQUIRE(result.size() == 100);
    CATCH_REQUIRE(base.size() == 100);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("transient_throwing_values_leave_the_session_intact",
                "[transient_throwing_values_leave_the_session_intact]") {
  // Every key lands in one bucket, so edits rebuild a leaf of several items
  using Map = persistent_map<int, BudgetedValue, CollidingHasher<1>>;
  static_assert(!std::is_nothrow_move_constructible<Map::item_type>::value);

  const auto xs = std::string(100, 'x');
  const auto ys = std::string(100, 'y');
  const auto zs = std::string(100, 'z');
  uint32_t counter = 0;
  int budget = -1;
  {
    Map base;
    auto session = base.transient();
    session.set(1, BudgetedValue{counter, budget, xs});
    session.set(2, BudgetedValue{counter, budget, zs});

    // Overwrite: the pair takes the one move left, then rebuilding the leaf throws
    budget = 1;
    CATCH_REQUIRE_THROWS_AS(session.set(1, BudgetedValue{counter, budget, ys}), std::runtime_error);
    budget = -1;
    CATCH_REQUIRE(session.size() == 2);
    CATCH_REQUIRE(session[1].text() == xs);
    CATCH_REQUIRE(session[2].text() == zs);

    // Append to the bucket
    budget = 1;
    CATCH_REQUIRE_THROWS_AS(session.set(3, BudgetedValue{counter, budget, ys}), std::runtime_error);
    budget = -1;
    CATCH_REQUIRE(session.size() == 2);
    CATCH_REQUIRE(!session.contains(3));

    // Erase
    budget = 0;
    CATCH_REQUIRE_THROWS_AS(session.erase(1), std::runtime_error);
    budget = -1;
    CATCH_REQUIRE(session.contains(1));

    CATCH_REQUIRE(session.set(3, BudgetedValue{counter, budget, ys}));
    CATCH_REQUIRE(!session.set(1, BudgetedValue{counter, budget, zs}));
    auto result = session.persistent();
    CATCH_REQUIRE(result.size() == 3);
    CATCH_REQUIRE(result[1].text() == zs);
    CATCH_REQUIRE(result[3].text() == ys);

    // Persistent edits fail without touching the map
    budget = 0;
    CATCH_REQUIRE_THROWS_AS(result.insert_or_assign(2, BudgetedValue{counter, budget, xs}),
                            std::runtime_error);
    budget = -1;
    CATCH_REQUIRE(result[2].text() == zs);
    CATCH_REQUIRE(result.size() == 3);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("transient_assign_from_own_item", "[transient_assign_from_own_item]") {
  const auto xs = std::string(100, 'x');
  {
    using Trie = basic_trie<int, std::string, std::hash<int>, std::equal_to<int>, true>;
    Trie base;
    auto session = base.transient();
    session.set(1, xs);
    CATCH_REQUIRE(!session.insert_or_assign(*session.find(1))); // the leaf is owned
    CATCH_REQUIRE(*session.get(1) == xs);
    const auto result = session.persistent();
    CATCH_REQUIRE(*result.get(1) == xs);
    CATCH_REQUIRE(*result.insert(*result.find(1)).get(1) == xs);
  }
  {
    using Trie = basic_trie<int, std::string, CollidingHasher<1>, std::equal_to<int>, true>;
    Trie base;
    auto session = base.transient();
    for (int i = 0; i < 4; ++i)
      session.set(i, std::string(static_cast<std::size_t>(50 + i), 'a' + static_cast<char>(i)));
    for (int i = 0; i < 4; ++i)
      CATCH_REQUIRE(!session.insert_or_assign(*session.find(i)));
    for (int i = 0; i < 4; ++i)
      CATCH_REQUIRE(*session.get(i) ==
                    std::string(static_cast<std::size_t>(50 + i), 'a' + static_cast<char>(i)));
    CATCH_REQUIRE(session.size() == 4);
  }
}

} // namespace pcollections::trie::test
