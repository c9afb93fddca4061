#include "trie-test-utils.hpp"

#include <random>
#include <thread>
#include <unordered_map>

namespace pcollections::trie::test {

using namespace std::string_literals;

using TracedItemSetType = persistent_set<TracedItem, TracedItem::Hasher>;
using MoveTracedItemSetType = persistent_set<MoveTracedItem, MoveTracedItem::Hasher>;
using TrivialTracedItemSetType = persistent_set<TrivialTracedItem, TrivialTracedItem::Hasher>;

struct IdentityHash {
  std::size_t operator()(std::size_t key) const { return key; }
};

using IntStringTrie = basic_trie<int, std::string, std::hash<int>, std::equal_to<int>, true>;
using IdentityTrie =
    basic_trie<std::size_t, std::size_t, IdentityHash, std::equal_to<std::size_t>, true>;

template <typename SetType> void trie_ops_test() {
  constexpr bool skip_counter_test{std::is_same<SetType, TrivialTracedItemSetType>::value};
  constexpr uint32_t copies_per_item = 3; // the item, plus two in the insertion order
  uint32_t counter = 0;

  {
    SetType set;
    using ItemType = typename SetType::item_type;
    using Ops = CollectionOps<SetType>;

    // Inserting the following sequence, to test code paths, hash is 32 bits
    // value =   1,         hash = 00|00-000|0 0000-|0000 0|000-00|00 000|0-0001
    // value =  55,         hash = 00|00-000|0 0000-|0000 0|000-00|00 001|1-0111
    // value = 119,         hash = 00|00-000|0 0000-|0000 0|000-00|00 011|1-0111
    // value =   3,         hash = 00|00-000|0 0000-|0000 0|000-00|00 000|0-0011
    // value =   0,         hash = 00|00-000|0 0000-|0000 0|000-00|00 000|0-0000
    // value =  31,         hash = 00|00-000|0 0000-|0000 0|000-00|00 000|1-1111
    // value = 0x100000000, hash = 00|00-000|0 0000-|0000 0|000-00|00 000|0-0000
    // value = 0x4000001F,  hash = 01|00-000|0 0000-|0000 0|000-00|00 000|1-1111
    // value = 0xC000001F,  hash = 11|00-000|0 0000-|0000 0|000-00|00 000|1-1111
    // value = 0x100001F,   hash = 00|00-000|1 0000-|0000 0|000-00|00 000|1-1111

    std::vector<std::size_t> values{
        {1, 55, 119, 3, 0, 31, 0x100000000, 0x4000001F, 0xC000001F, 0x100001F}};
    auto pos = 0u;

    uint32_t test_number = 0;
    auto run_standard_tests = [&set, &counter, &values, &test_number](uint32_t pos) {
      const auto value = values[pos];
      const auto new_size = pos + 1;
      bool was_inserted = set.insert(ItemType{counter, value});
      CATCH_REQUIRE(was_inserted == true);
      CATCH_REQUIRE(!set.empty());
      CATCH_REQUIRE(set.size() == new_size);
      CATCH_REQUIRE(set.size() < set.max_size());
      CATCH_REQUIRE((skip_counter_test || counter == copies_per_item * new_size));
      auto root = collection_root(set);
      dot_graph<Ops>(fmt::format("/tmp/pcollections-{}.dot", test_number++).c_str(), root);
      check_trie_invariants<Ops>(root, set.size());
      check_trie_iterators(set, std::begin(values), std::begin(values) + new_size);
    };

    // root -> L(1)
    CATCH_REQUIRE(set.empty());
    run_standard_tests(pos++);

    // root -> B ( 1)-> L(1)
    //           (23)-> L(55)
    run_standard_tests(pos++);

    // root -> B ( 1)-> L(1)
    //           (23)-> B ( 1) -> L(55)
    //                    ( 3) -> L(119)
    run_standard_tests(pos++);

    // root -> B ( 1)-> L(1)
    //           ( 3)-> L(3)
    //           (23)-> B ( 1) -> L(55)
    //                    ( 3) -> L(119)
    run_standard_tests(pos++);

    // ... ( 0)-> L(0)
    run_standard_tests(pos++);

    // ... (31)-> L(31)
    run_standard_tests(pos++);

    // root -> B ( 0)-> L(0, 0x100000000), a full hash collision
    run_standard_tests(pos++);

    // (31)-> B ( 0) -> B ( 0) -> B ( 0) -> B ( 0) -> B ( 0) -> B ( 0)-> L(31)
    //                                                            ( 1)-> L(0x4000001F)
    run_standard_tests(pos++);

    //                                                            ( 3)-> L(0xC000001F)
    run_standard_tests(pos++);

    //                                   -> B (16) -> L(0x100001F)
    run_standard_tests(pos++);

    { // duplicate: graph unchanged
      for (auto value : values) {
        const auto root_before = collection_root(set);
        bool was_inserted = set.insert(ItemType{counter, value});
        CATCH_REQUIRE(was_inserted == false);
        CATCH_REQUIRE(collection_root(set) == root_before);
        CATCH_REQUIRE(set.size() == pos);
        CATCH_REQUIRE((skip_counter_test || counter == copies_per_item * pos));
        check_trie_invariants<Ops>(collection_root(set), set.size());
      }
    }

    { // Attempt to remove 'non-element'; graph unchanged
      const auto root_before = collection_root(set);
      bool was_erased = set.erase(ItemType{counter, 0xff112233u});
      CATCH_REQUIRE(was_erased == false);
      CATCH_REQUIRE(set.size() == pos);
      CATCH_REQUIRE(collection_root(set) == root_before);
    }

    while (set.size() > 0) {
      { // Test removing any element
        for (const auto& item : set) {
          auto temp_set = set;
          bool was_erased = temp_set.erase(item);
          CATCH_REQUIRE(was_erased == true);
          CATCH_REQUIRE(temp_set.size() + 1 == set.size());
          check_trie_invariants<Ops>(collection_root(temp_set), temp_set.size());
          check_trie_invariants<Ops>(collection_root(set), set.size()); // untouched
        }
      }
      { // Erase if
        auto predicate = [](const ItemType& item) { return item.value() % 2 == 0; };
        auto temp_set = set;
        const auto delete_count = erase_if(temp_set, predicate);
        std::size_t matches = 0;
        for (const auto& item : set) {
          if (predicate(item)) {
            CATCH_REQUIRE(!temp_set.contains(item));
            matches++;
          } else {
            CATCH_REQUIRE(temp_set.contains(item));
          }
        }
        CATCH_REQUIRE(matches == delete_count);
        check_trie_invariants<Ops>(collection_root(temp_set), temp_set.size());
      }
      const auto value = values[--pos];
      auto item = ItemType{counter, value};
      CATCH_REQUIRE(set.contains(item));
      bool was_erased = set.erase(item);
      CATCH_REQUIRE(was_erased == true);
      CATCH_REQUIRE(!set.contains(item));
      check_trie_invariants<Ops>(collection_root(set), set.size());
      check_trie_iterators(set, std::begin(values), std::begin(values) + set.size());
    }
  }

  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("trie_set_ops", "[trie_set_ops]") {
  trie_ops_test<TracedItemSetType>();
  trie_ops_test<MoveTracedItemSetType>();
  trie_ops_test<TrivialTracedItemSetType>();
}

CATCH_TEST_CASE("trie_scenario", "[trie_scenario]") {
  const auto& t0 = IntStringTrie::empty_trie();
  const auto t1 = t0.insert(1, "a"s);
  const auto t2 = t1.insert(2, "b"s);
  const auto t3 = t2.remove(1);

  CATCH_REQUIRE(t0.size() == 0);
  CATCH_REQUIRE(t1.size() == 1);
  CATCH_REQUIRE(t2.size() == 2);
  CATCH_REQUIRE(t3.size() == 1);

  CATCH_REQUIRE(t2.get(1) != nullptr);
  CATCH_REQUIRE(*t2.get(1) == "a"s);
  CATCH_REQUIRE(t3.get(1) == nullptr);
  CATCH_REQUIRE(*t3.get(2) == "b"s);
  CATCH_REQUIRE(t0.get(1) == nullptr);
  CATCH_REQUIRE(t0.empty());
}

CATCH_TEST_CASE("trie_persistence", "[trie_persistence]") {
  IntStringTrie base;
  for (int i = 0; i < 1000; ++i)
    base = base.insert(i, std::to_string(i));
  const auto snapshot = base;

  const auto inserted = base.insert(1000, "new"s);
  const auto replaced = base.insert(500, "replaced"s);
  const auto removed = base.remove(250);
  const auto updated =
      base.update(7, [](const std::string* current) { return *current + "+"; });
  const auto kept = base.try_insert(IntStringTrie::item_type{3, "ignored"s});

  CATCH_REQUIRE(base.size() == 1000);
  CATCH_REQUIRE(base == snapshot);
  CATCH_REQUIRE(root_of(base) == root_of(snapshot));
  for (int i = 0; i < 1000; ++i)
    CATCH_REQUIRE(*base.get(i) == std::to_string(i));
  CATCH_REQUIRE(!base.contains(1000));

  CATCH_REQUIRE(inserted.size() == 1001);
  CATCH_REQUIRE(*inserted.get(1000) == "new"s);
  CATCH_REQUIRE(replaced.size() == 1000);
  CATCH_REQUIRE(*replaced.get(500) == "replaced"s);
  CATCH_REQUIRE(removed.size() == 999);
  CATCH_REQUIRE(!removed.contains(250));
  CATCH_REQUIRE(*updated.get(7) == "7+"s);
  CATCH_REQUIRE(root_of(kept) == root_of(base));
  CATCH_REQUIRE(*kept.get(3) == "3"s);
}

CATCH_TEST_CASE("trie_no_op_edits_share_root", "[trie_no_op_edits_share_root]") {
  IntStringTrie base{{1, "a"s}, {2, "b"s}};
  CATCH_REQUIRE(root_of(base.remove(3)) == root_of(base));
  CATCH_REQUIRE(root_of(base.try_insert(IntStringTrie::item_type{1, "z"s})) == root_of(base));
  CATCH_REQUIRE(base.remove(3) == base);

  persistent_set<int> set{{1, 2, 3}};
  auto other = set;
  CATCH_REQUIRE(!other.insert(2));
  CATCH_REQUIRE(collection_root(other) == collection_root(set));
}

CATCH_TEST_CASE("trie_structural_sharing", "[trie_structural_sharing]") {
  using Ops = NodeOpsOf<IdentityTrie>;
  std::mt19937_64 generator{42};

  IdentityTrie base;
  for (int i = 0; i < 2000; ++i) {
    const auto key = static_cast<std::size_t>(generator());
    base = base.insert(key, key);
  }

  // Edit the path to a new key: at most one new node per level, plus the leaf
  for (int i = 0; i < 100; ++i) {
    const auto key = static_cast<std::size_t>(generator());
    const auto edited = base.insert(key, key);
    const auto path = Ops::make_path(root_of(edited), key);
    CATCH_REQUIRE(count_new_nodes<Ops>(root_of(base), root_of(edited)) <= path.size + 1);
    check_trie_invariants<Ops>(root_of(edited), edited.size());
  }

  // Overwrite and remove existing keys
  std::vector<std::size_t> keys;
  for (const auto& item : base)
    keys.push_back(item.first);
  for (std::size_t i = 0; i < keys.size(); i += 97) {
    const auto key = keys[i];
    const auto depth = Ops::make_path(root_of(base), key).size;

    const auto replaced = base.insert(key, std::size_t{0});
    CATCH_REQUIRE(count_new_nodes<Ops>(root_of(base), root_of(replaced)) <= depth + 1);

    const auto removed = base.remove(key);
    CATCH_REQUIRE(count_new_nodes<Ops>(root_of(base), root_of(removed)) <= depth + 1);
    check_trie_invariants<Ops>(root_of(removed), removed.size());
  }
}

CATCH_TEST_CASE("trie_round_trip", "[trie_round_trip]") {
  using Trie = basic_trie<int, int, std::hash<int>, std::equal_to<int>, true>;
  using Ops = NodeOpsOf<Trie>;
  std::mt19937 generator{1234};
  std::uniform_int_distribution<int> key_dist{0, 499};
  std::uniform_int_distribution<int> op_dist{0, 9};

  Trie trie;
  std::unordered_map<int, int> reference;

  for (int step = 0; step < 5000; ++step) {
    const auto key = key_dist(generator);
    const auto op = op_dist(generator);
    if (op < 5) {
      trie = trie.insert(key, step);
      reference[key] = step;
    } else if (op < 8) {
      trie = trie.remove(key);
      reference.erase(key);
    } else {
      trie = trie.update(key, [](const int* current) { return current ? *current + 1 : -1; });
      auto ii = reference.find(key);
      if (ii == reference.end())
        reference[key] = -1;
      else
        ii->second += 1;
    }

    CATCH_REQUIRE(trie.size() == reference.size());
    if (step % 250 == 0)
      check_trie_invariants<Ops>(root_of(trie), trie.size());
  }

  for (const auto& [key, value] : reference) {
    CATCH_REQUIRE(trie.get(key) != nullptr);
    CATCH_REQUIRE(*trie.get(key) == value);
  }
  std::size_t visited = 0;
  for (const auto& [key, value] : trie) {
    CATCH_REQUIRE(reference.at(key) == value);
    ++visited;
  }
  CATCH_REQUIRE(visited == reference.size());
}

CATCH_TEST_CASE("trie_collisions", "[trie_collisions]") {
  using Trie = basic_trie<int, int, CollidingHasher<3>, std::equal_to<int>, true>;
  using Ops = NodeOpsOf<Trie>;

  Trie trie;
  for (int i = 0; i < 60; ++i)
    trie = trie.insert(i, i * 10);
  CATCH_REQUIRE(trie.size() == 60);
  check_trie_invariants<Ops>(root_of(trie), trie.size());

  // Three buckets of twenty
  std::size_t leaves = 0;
  for_each_node<Ops>(root_of(trie), [&](auto* node) {
    if (Ops::type(node) == detail::NodeType::Leaf) {
      CATCH_REQUIRE(Ops::size(node) == 20);
      ++leaves;
    }
  });
  CATCH_REQUIRE(leaves == 3);

  for (int i = 0; i < 60; ++i)
    CATCH_REQUIRE(*trie.get(i) == i * 10);
  CATCH_REQUIRE(trie.get(60) == nullptr);

  trie = trie.insert(4, 0); // overwrite inside a bucket
  CATCH_REQUIRE(trie.size() == 60);
  CATCH_REQUIRE(*trie.get(4) == 0);

  for (int i = 0; i < 60; i += 2) {
    trie = trie.remove(i);
    check_trie_invariants<Ops>(root_of(trie), trie.size());
  }
  CATCH_REQUIRE(trie.size() == 30);
  for (int i = 0; i < 60; ++i)
    CATCH_REQUIRE(trie.contains(i) == (i % 2 == 1));
}

CATCH_TEST_CASE("trie_collapse_is_canonical", "[trie_collapse_is_canonical]") {
  using Ops = NodeOpsOf<IdentityTrie>;

  // Pairs of keys that agree on many low chunks, to build deep branch chains
  std::vector<std::size_t> kept_keys;
  std::vector<std::size_t> removed_keys;
  for (std::size_t i = 0; i < 40; ++i) {
    kept_keys.push_back(i);
    removed_keys.push_back(i + (std::size_t{1} << (5 * (i % 11 + 2)))); // 2^10 .. 2^60
  }

  IdentityTrie full;
  for (auto key : kept_keys)
    full = full.insert(key, key);
  for (auto key : removed_keys)
    full = full.insert(key, key);

  IdentityTrie trimmed = full;
  for (auto key : removed_keys)
    trimmed = trimmed.remove(key);

  IdentityTrie fresh;
  for (auto ii = kept_keys.rbegin(); ii != kept_keys.rend(); ++ii)
    fresh = fresh.insert(*ii, *ii);

  CATCH_REQUIRE(trimmed == fresh);
  CATCH_REQUIRE(shape_of<Ops>(root_of(trimmed)) == shape_of<Ops>(root_of(fresh)));
  check_trie_invariants<Ops>(root_of(trimmed), trimmed.size());

  // Removing everything leaves the empty root
  for (auto key : kept_keys)
    trimmed = trimmed.remove(key);
  CATCH_REQUIRE(trimmed.empty());
  CATCH_REQUIRE(root_of(trimmed) == nullptr);
}

CATCH_TEST_CASE("trie_equality_and_hash", "[trie_equality_and_hash]") {
  IntStringTrie forward;
  IntStringTrie backward;
  for (int i = 0; i < 300; ++i) {
    forward = forward.insert(i, std::to_string(i));
    backward = backward.insert(299 - i, std::to_string(299 - i));
  }
  CATCH_REQUIRE(forward == backward);
  CATCH_REQUIRE(forward.hash_code() == backward.hash_code());

  const auto different_value = forward.insert(10, "ten"s);
  CATCH_REQUIRE(different_value != forward);
  CATCH_REQUIRE(different_value.size() == forward.size());
  CATCH_REQUIRE(different_value.hash_code() != forward.hash_code());

  CATCH_REQUIRE(forward.remove(3) != forward);
  CATCH_REQUIRE(IntStringTrie::empty_trie() == IntStringTrie{});
  CATCH_REQUIRE(IntStringTrie::empty_trie().hash_code() == IntStringTrie{}.hash_code());
}

CATCH_TEST_CASE("trie_update", "[trie_update]") {
  IntStringTrie trie{{1, "a"s}};
  const auto absent = trie.update(2, [](const std::string* current) {
    CATCH_REQUIRE(current == nullptr);
    return "new"s;
  });
  CATCH_REQUIRE(absent.size() == 2);
  CATCH_REQUIRE(*absent.get(2) == "new"s);

  const auto present = absent.update(1, [](const std::string* current) {
    CATCH_REQUIRE(current != nullptr);
    return *current + *current;
  });
  CATCH_REQUIRE(present.size() == 2);
  CATCH_REQUIRE(*present.get(1) == "aa"s);
  CATCH_REQUIRE(*absent.get(1) == "a"s);
}

CATCH_TEST_CASE("trie_erase_if", "[trie_erase_if]") {
  IdentityTrie trie;
  for (std::size_t i = 0; i < 100; ++i)
    trie = trie.insert(i, i);
  const auto odd = trie.erase_if([](std::size_t key) { return key % 2 == 0; });
  CATCH_REQUIRE(odd.size() == 50);
  CATCH_REQUIRE(trie.size() == 100);
  for (std::size_t i = 0; i < 100; ++i)
    CATCH_REQUIRE(odd.contains(i) == (i % 2 == 1));
  check_trie_invariants<NodeOpsOf<IdentityTrie>>(root_of(odd), odd.size());
}

CATCH_TEST_CASE("trie_iteration_is_stable", "[trie_iteration_is_stable]") {
  IntStringTrie trie;
  for (int i = 0; i < 200; ++i)
    trie = trie.insert(i, std::to_string(i));
  const auto copy = trie;

  std::vector<int> first;
  std::vector<int> second;
  for (const auto& item : trie)
    first.push_back(item.first);
  for (const auto& item : copy)
    second.push_back(item.first);
  CATCH_REQUIRE(first == second);
  CATCH_REQUIRE(first.size() == 200);
}

CATCH_TEST_CASE("trie_concurrent_derivation", "[trie_concurrent_derivation]") {
  IntStringTrie base;
  for (int i = 0; i < 500; ++i)
    base = base.insert(i, std::to_string(i));

  std::vector<IntStringTrie> results(8);
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&base, &results, t]() {
      auto trie = base;
      for (int i = 0; i < 500; i += 8)
        trie = trie.remove(i + t);
      for (int i = 0; i < 100; ++i)
        trie = trie.insert(1000 * (t + 1) + i, "x"s);
      results[t] = trie;
    });
  }
  for (auto& thread : threads)
    thread.join();

  CATCH_REQUIRE(base.size() == 500);
  for (int i = 0; i < 500; ++i)
    CATCH_REQUIRE(*base.get(i) == std::to_string(i));
  for (int t = 0; t < 8; ++t) {
    const auto removed = static_cast<std::size_t>((500 - t + 7) / 8);
    CATCH_REQUIRE(results[t].size() == 500 - removed + 100);
    CATCH_REQUIRE(!results[t].contains(t));
    CATCH_REQUIRE(results[t].contains(1000 * (t + 1)));
  }
}

} // namespace pcollections::trie::test
