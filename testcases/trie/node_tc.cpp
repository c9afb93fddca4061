#include "trie-test-utils.hpp"

#include <array>
#include <bit>

namespace pcollections::trie::test {

CATCH_TEST_CASE("max_trie_depth", "[max_trie_depth]") {
  const auto hash_bits = sizeof(std::size_t) * 8;                      // 64 bits
  const auto chunk_bits = std::size_t{detail::BitsPerLevel};           // 32 fits in 5 bits
  CATCH_REQUIRE(chunk_bits * (detail::MaxTrieDepth - 0) >= hash_bits); // 5 * 13 = 65
  CATCH_REQUIRE(chunk_bits * (detail::MaxTrieDepth - 1) < hash_bits);  // 5 * 12 = 60
}

CATCH_TEST_CASE("popcount", "[popcount]") {
  auto slow_popcount = [](uint32_t x) {
    uint32_t count = 0;
    for (; x != 0; x >>= 1)
      count += (x & 1u);
    return count;
  };
  for (uint32_t x : {0x00000000u, 0x01010101u, 0x11010101u, 0xf1010101u, 0xffffffffu})
    CATCH_REQUIRE(detail::popcount(x) == slow_popcount(x));
  CATCH_REQUIRE(detail::popcount(0xffffffffu) == 32);
  CATCH_REQUIRE(detail::popcount(0x11010101u) == 5);
}

CATCH_TEST_CASE("hash_chunk", "[hash_chunk]") {
  const std::size_t hash = 0b10101'00011'11111'00000'00001;
  CATCH_REQUIRE(detail::hash_chunk(hash, 0) == 0b00001u);
  CATCH_REQUIRE(detail::hash_chunk(hash, 1) == 0b00000u);
  CATCH_REQUIRE(detail::hash_chunk(hash, 2) == 0b11111u);
  CATCH_REQUIRE(detail::hash_chunk(hash, 3) == 0b00011u);
  CATCH_REQUIRE(detail::hash_chunk(hash, 4) == 0b10101u);

  // The last level only has the top 4 bits
  const std::size_t top = std::size_t{0xf} << 60;
  CATCH_REQUIRE(detail::hash_chunk(top, detail::MaxTrieDepth - 1) == 0xfu);
}

CATCH_TEST_CASE("sparse_index", "[sparse_index]") {
  const uint32_t bitmap = (1u << 0) | (1u << 7) | (1u << 16) | (1u << 22) | (1u << 31);
  CATCH_REQUIRE(detail::popcount(bitmap) == 5);
  CATCH_REQUIRE(detail::to_dense_index(0u, bitmap) == 0);
  CATCH_REQUIRE(detail::to_dense_index(7u, bitmap) == 1);
  CATCH_REQUIRE(detail::to_dense_index(16u, bitmap) == 2);
  CATCH_REQUIRE(detail::to_dense_index(22u, bitmap) == 3);
  CATCH_REQUIRE(detail::to_dense_index(31u, bitmap) == 4);

  for (auto i = 0u; i < detail::BranchingFactor; ++i) {
    const bool is_valid = (i == 0) || (i == 7) || (i == 16) || (i == 22) || (i == 31);
    CATCH_REQUIRE(detail::is_valid_index(i, bitmap) == is_valid);
  }
  CATCH_REQUIRE(!detail::is_valid_index(detail::NotAnIndex, bitmap));
}

CATCH_TEST_CASE("mix_hash", "[mix_hash]") {
  // Nearby inputs should not give nearby outputs
  CATCH_REQUIRE(detail::mix_hash(0) != detail::mix_hash(1));
  CATCH_REQUIRE((detail::mix_hash(1) ^ detail::mix_hash(2)) > 0xffffu);
  CATCH_REQUIRE(detail::combine_hash(1, 2) != detail::combine_hash(2, 1));
}

CATCH_TEST_CASE("node_data_size_alignment", "[node_data_size_alignment]") {
  using NodeDataTheadSafe = detail::NodeData<true>;
  using NodeDataVanilla = detail::NodeData<false>;
  CATCH_REQUIRE(alignof(NodeDataTheadSafe) == alignof(NodeDataVanilla));
  CATCH_REQUIRE(sizeof(NodeDataTheadSafe) == sizeof(NodeDataVanilla));
  CATCH_REQUIRE(sizeof(NodeDataTheadSafe) == 8);
  CATCH_REQUIRE(alignof(NodeDataTheadSafe) == 4);
}

CATCH_TEST_CASE("node_data_add_dec_ref", "[node_data_add_dec_ref]") {
  auto test_node = [](auto& node) {
    CATCH_REQUIRE(node.ref_count() == 1);
    CATCH_REQUIRE(node.is_unique());
    CATCH_REQUIRE(node.add_ref() == 2);
    CATCH_REQUIRE(!node.is_unique());
    CATCH_REQUIRE(node.type() == detail::NodeType::Leaf); // counting leaves the type alone
    CATCH_REQUIRE(node.dec_ref() == 1);
    CATCH_REQUIRE(node.dec_ref() == 0);
  };
  auto n1 = detail::NodeData<true>{detail::NodeType::Leaf, 0};
  auto n2 = detail::NodeData<false>{detail::NodeType::Leaf, 0};

  test_node(n1);
  test_node(n2);
}

CATCH_TEST_CASE("node_type", "[node_type]") {
  {
    detail::NodeData<true> node{detail::NodeType::Branch, 0};
    CATCH_REQUIRE(node.type() == detail::NodeType::Branch);
    node.add_ref();
    CATCH_REQUIRE(node.type() == detail::NodeType::Branch);
  }
  {
    detail::NodeData<false> node{detail::NodeType::Leaf, 0};
    CATCH_REQUIRE(node.type() == detail::NodeType::Leaf);
  }
}

template <typename T> void test_node_size() {
  using NodeType = detail::NodeType;
  {
    auto node = T::Branch::make_uninitialized(0, 0);
    CATCH_REQUIRE(T::size(node) == 0);
    CATCH_REQUIRE(T::type(node) == NodeType::Branch);
    CATCH_REQUIRE(T::Branch::offset() >= sizeof(typename T::node_type));
    auto address_0 = std::bit_cast<uintptr_t>(T::Branch::dense_ptr_at(node, 0));
    CATCH_REQUIRE(address_0 >= std::bit_cast<uintptr_t>(node) + sizeof(typename T::node_type));
    CATCH_REQUIRE(address_0 % T::Branch::AlignOf == 0);
    CATCH_REQUIRE(T::Branch::AlignOf == alignof(void*));
    CATCH_REQUIRE(T::ref_count(node) == 1);
    T::Branch::free_shell(node);
  }

  {
    auto node = T::Leaf::make_uninitialized(0, 0);
    CATCH_REQUIRE(T::size(node) == 0);
    CATCH_REQUIRE(T::type(node) == NodeType::Leaf);
    CATCH_REQUIRE(T::Leaf::offset() >= sizeof(typename T::node_type));
    auto address_0 = std::bit_cast<uintptr_t>(T::Leaf::ptr_at(node, 0));
    CATCH_REQUIRE(address_0 >= std::bit_cast<uintptr_t>(node) + sizeof(typename T::node_type));
    CATCH_REQUIRE(address_0 % alignof(typename T::Leaf::item_type) == 0);
    CATCH_REQUIRE(T::ref_count(node) == 1);
    T::Leaf::free_shell(node);
  }
}

template <typename T> void test_node_configuration() {
  test_node_size<detail::NodeOps<T, T, std::hash<T>, std::equal_to<T>, false, true>>();
  test_node_size<detail::NodeOps<T, T, std::hash<T>, std::equal_to<T>, false, false>>();
}

struct alignas(1) Weird0 {
  char value[5];
};

struct alignas(2) Weird1 {
  char value[17];
};

struct alignas(16) Weird2 {
  int64_t a;
  char b;
};

CATCH_TEST_CASE("node_configuration", "[node_configuration]") {
  test_node_configuration<char>();
  test_node_configuration<int16_t>();
  test_node_configuration<int32_t>();
  test_node_configuration<int64_t>();
  test_node_configuration<void*>();
  test_node_configuration<std::array<char, 22>>();
  test_node_configuration<Weird0>();
  test_node_configuration<Weird1>();
  test_node_configuration<Weird2>();

  CATCH_REQUIRE(detail::calculate_logical_size<Weird0>() == 5);
  CATCH_REQUIRE(detail::calculate_logical_size<Weird1>() == 18);
  CATCH_REQUIRE(detail::calculate_logical_size<Weird2>() == 16);
}

CATCH_TEST_CASE("trie_construct_destruct", "[trie_construct_destruct]") {
  uint32_t counter{0}; // Tracks how many times the constructor/destructor is called
  using Ops = detail::NodeOps<TracedItem, TracedItem>;

  { // Constructor should be called 4 times, and same with destructor
    auto* node_ptr = Ops::Leaf::make_uninitialized(4, 4);
    CATCH_REQUIRE(Ops::size(node_ptr) == 4);
    for (auto i = 0u; i < Ops::size(node_ptr); ++i)
      new (Ops::Leaf::ptr_at(node_ptr, i)) TracedItem{counter};
    CATCH_REQUIRE(counter == Ops::size(node_ptr));
    Ops::dec_ref(node_ptr); // Calls destructor
    CATCH_REQUIRE(counter == 0);
  }
}

CATCH_TEST_CASE("trie_ops_safe_destroy", "[trie_ops_safe_destroy]") {
  using Ops = detail::NodeOps<TracedItem, TracedItem, TracedItem::Hasher>;
  Ops::destroy(nullptr); // should not crash
  Ops::dec_ref(nullptr);
  CATCH_REQUIRE(Ops::ref_count(nullptr) == 0);
}

CATCH_TEST_CASE("duplicate_leaf", "[duplicate_leaf]") {
  uint32_t counter = 0;

  using Ops = detail::NodeOps<TracedItem, TracedItem>;
  using Leaf = Ops::Leaf;

  auto* leaf_0 = Leaf::make(TracedItem{counter, 0});
  auto* leaf_1 = Leaf::copy_append(leaf_0, TracedItem{counter, 1});
  auto* leaf_2 = Leaf::duplicate_leaf(leaf_1, detail::NotAnIndex);
  auto* leaf_3 = Leaf::duplicate_leaf(leaf_1, 0); // skips the first item

  CATCH_REQUIRE(Leaf::size(leaf_0) == 1);
  CATCH_REQUIRE(Leaf::size(leaf_1) == 2);
  CATCH_REQUIRE(Leaf::size(leaf_2) == 2);
  CATCH_REQUIRE(Leaf::size(leaf_3) == 1);

  for (auto index = 0u; index < 2; ++index) {
    CATCH_REQUIRE(Leaf::ptr_at(leaf_1, index)->value() == index);
    CATCH_REQUIRE(Leaf::ptr_at(leaf_2, index)->value() == index);
  }
  CATCH_REQUIRE(Leaf::ptr_at(leaf_3, 0)->value() == 1);

  Ops::dec_ref(leaf_0);
  Ops::dec_ref(leaf_1);
  Ops::dec_ref(leaf_2);
  Ops::dec_ref(leaf_3);

  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("leaf_edit_in_place", "[leaf_edit_in_place]") {
  uint32_t counter = 0;

  using Ops = detail::NodeOps<MoveTracedItem, MoveTracedItem, MoveTracedItem::Hasher>;
  using Leaf = Ops::Leaf;

  auto* leaf = Leaf::make(MoveTracedItem{counter, 7});
  leaf = Leaf::append_in_place(leaf, MoveTracedItem{counter, 8});
  leaf = Leaf::append_in_place(leaf, MoveTracedItem{counter, 9});
  CATCH_REQUIRE(Leaf::size(leaf) == 3);
  CATCH_REQUIRE(counter == 3);
  CATCH_REQUIRE(Ops::ref_count(leaf) == 1);

  Leaf::erase_in_place(leaf, 1);
  CATCH_REQUIRE(Leaf::size(leaf) == 2);
  CATCH_REQUIRE(counter == 2);
  CATCH_REQUIRE(Leaf::ptr_at(leaf, 0)->value() == 7);
  CATCH_REQUIRE(Leaf::ptr_at(leaf, 1)->value() == 9);

  Ops::dec_ref(leaf);
  CATCH_REQUIRE(counter == 0);
}

} // namespace pcollections::trie::test
