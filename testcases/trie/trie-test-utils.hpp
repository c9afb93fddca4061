#pragma once

#include <catch2/catch.hpp>

#include "pcollections/persistent-map.hpp"
#include "pcollections/persistent-set.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

namespace pcollections::trie::test {

// -------------------------------------------------------------------------------------- TracedItem
// Items that count their live instances, so that tests can check for leaks

class TracedItem {
private:
  uint32_t& counter_;
  std::size_t value_{0};

public:
  explicit TracedItem(uint32_t& counter) : TracedItem(counter, 0) {}
  TracedItem(uint32_t& counter, std::size_t value) : counter_{counter}, value_{value} {
    counter_++;
  }
  TracedItem(const TracedItem& o) : counter_{o.counter_}, value_{o.value_} { counter_++; }
  TracedItem(TracedItem&&) = delete;
  ~TracedItem() { counter_--; }
  TracedItem& operator=(const TracedItem&) = delete;
  TracedItem& operator=(TracedItem&&) = delete;
  std::size_t value() const { return value_; }
  bool operator==(const TracedItem& o) const { return o.value() == value(); }

  // Only the low 32 bits, so that values 2^32 apart collide
  struct Hasher {
    std::size_t operator()(const TracedItem& item) const {
      return static_cast<std::size_t>(item.value() & static_cast<std::size_t>(0xffffffffu));
    }
  };
};

class MoveTracedItem {
private:
  uint32_t& counter_;
  std::size_t value_{0};

public:
  explicit MoveTracedItem(uint32_t& counter) : MoveTracedItem(counter, 0) {}
  MoveTracedItem(uint32_t& counter, std::size_t value) : counter_{counter}, value_{value} {
    counter_++;
  }
  MoveTracedItem(const MoveTracedItem& o) : counter_{o.counter_}, value_{o.value_} { counter_++; }
  MoveTracedItem(MoveTracedItem&& o) noexcept : counter_{o.counter_}, value_{o.value_} {
    counter_++;
  }
  ~MoveTracedItem() { counter_--; }
  MoveTracedItem& operator=(const MoveTracedItem&) = delete;
  MoveTracedItem& operator=(MoveTracedItem&&) = delete;
  std::size_t value() const { return value_; }
  bool operator==(const MoveTracedItem& o) const { return o.value() == value(); }

  struct Hasher {
    std::size_t operator()(const MoveTracedItem& item) const {
      return static_cast<std::size_t>(item.value() & static_cast<std::size_t>(0xffffffffu));
    }
  };
};

class TrivialTracedItem {
private:
  std::size_t value_{0};

public:
  TrivialTracedItem() = default;
  explicit TrivialTracedItem(uint32_t&) {}
  TrivialTracedItem(uint32_t&, std::size_t value) : value_{value} {}
  std::size_t value() const { return value_; }
  bool operator==(const TrivialTracedItem& o) const { return o.value() == value(); }

  struct Hasher {
    std::size_t operator()(const TrivialTracedItem& item) const {
      return static_cast<std::size_t>(item.value() & static_cast<std::size_t>(0xffffffffu));
    }
  };
};

/**
 * A deliberately poor hash: every key lands in one of `Buckets` full-hash buckets
 */
template <std::size_t Buckets> struct CollidingHasher {
  std::size_t operator()(int key) const { return static_cast<std::size_t>(key) % Buckets; }
};

// ------------------------------------------------------------------------------------- Inspection

/**
 * NodeOps matching a set/map/trie type
 */
template <typename Trie>
using NodeOpsOf = detail::NodeOps<typename Trie::key_type, typename Trie::value_type,
                                  typename Trie::hasher, typename Trie::key_equal, Trie::is_map,
                                  Trie::is_thread_safe>;

template <typename Trie> auto root_of(const Trie& trie) { return detail::trie_access::root(trie); }

template <typename Collection> auto collection_root(const Collection& collection) {
  return detail::trie_access::root(detail::trie_access::trie(collection));
}

template <typename Collection>
using CollectionOps = NodeOpsOf<std::decay_t<decltype(detail::trie_access::trie(
    std::declval<const Collection&>()))>>;

template <typename NodeOps, typename Function>
void for_each_node(typename NodeOps::node_type* node, Function f) {
  if (node == nullptr)
    return; // empty
  f(node);
  if (NodeOps::type(node) == detail::NodeType::Branch) {
    auto* start = NodeOps::Branch::dense_ptr_at(node, 0);
    for (auto* iterator = start; iterator != start + NodeOps::Branch::size(node); ++iterator)
      for_each_node<NodeOps>(*iterator, f);
  }
}

/**
 * Every node reachable from `root`, for identity comparisons between versions
 */
template <typename NodeOps> std::vector<const void*> all_nodes(typename NodeOps::node_type* root) {
  std::vector<const void*> nodes;
  for_each_node<NodeOps>(root, [&nodes](auto* node) { nodes.push_back(node); });
  std::sort(begin(nodes), end(nodes));
  return nodes;
}

/**
 * @return The number of nodes under `after` that do not appear under `before`
 */
template <typename NodeOps>
std::size_t count_new_nodes(typename NodeOps::node_type* before,
                            typename NodeOps::node_type* after) {
  const auto old_nodes = all_nodes<NodeOps>(before);
  std::size_t counter = 0;
  for_each_node<NodeOps>(after, [&](auto* node) {
    if (!std::binary_search(begin(old_nodes), end(old_nodes), static_cast<const void*>(node)))
      ++counter;
  });
  return counter;
}

/**
 * A printable description of the shape of a tree. Trees over the same entries
 * built in any order must print the same.
 */
template <typename NodeOps> std::string shape_of(typename NodeOps::node_type* node) {
  if (node == nullptr)
    return "E";
  if (NodeOps::type(node) == detail::NodeType::Leaf)
    return fmt::format("L{}", NodeOps::size(node));
  std::string result = fmt::format("B{:08x}(", node->payload_);
  auto* start = NodeOps::Branch::dense_ptr_at(node, 0);
  for (auto* iterator = start; iterator != start + NodeOps::Branch::size(node); ++iterator)
    result += shape_of<NodeOps>(*iterator);
  return result + ")";
}

template <typename NodeOps>
void dot_graph(const char* filename, typename NodeOps::node_type* root) {
  if (root == nullptr)
    return;

  using NodeType = detail::NodeType;
  auto node_name = [](typename NodeOps::node_type* node) -> std::string {
    return fmt::format("{:c}0x{:08x}{}", (NodeOps::type(node) == NodeType::Branch ? 'B' : 'L'),
                       reinterpret_cast<uintptr_t>(node),
                       (NodeOps::type(node) == NodeType::Branch
                            ? std::string{""}
                            : fmt::format("sz_{}", NodeOps::size(node))));
  };

  std::ofstream out;
  out.open(filename);
  out << "digraph {\n";
  for_each_node<NodeOps>(root, [&](typename NodeOps::node_type* node) {
    if (NodeOps::type(node) == NodeType::Branch) {
      for (auto i = 0u; i < detail::BranchingFactor; ++i) {
        if (NodeOps::Branch::is_valid_index(node, i)) {
          auto* other = *NodeOps::Branch::ptr_at(node, i);
          out << fmt::format("   {} -> {}[label=\"{}\"]\n", node_name(node), node_name(other), i);
        }
      }
    }
  });
  if (NodeOps::type(root) == NodeType::Leaf)
    out << fmt::format("   {}\n", node_name(root));
  out << "}\n";
}

// ------------------------------------------------------------------------------------- Invariants

template <typename NodeOps> void check_leaf_invariants(const typename NodeOps::node_type* leaf) {
  const auto size = NodeOps::size(leaf);
  CATCH_REQUIRE(NodeOps::type(leaf) == detail::NodeType::Leaf);
  CATCH_REQUIRE(size > 0); // No empty leaves

  // All items have the same hash
  const auto hash0 = NodeOps::leaf_hash(leaf);
  for (auto i = 0u; i < size; ++i)
    CATCH_REQUIRE(NodeOps::hash_item(*NodeOps::Leaf::ptr_at(leaf, i)) == hash0);

  // No two keys are equal
  for (auto i = 0u; i < size; ++i)
    for (auto j = i + 1; j < size; ++j)
      CATCH_REQUIRE(!NodeOps::keys_equal(NodeOps::key_of(*NodeOps::Leaf::ptr_at(leaf, i)),
                                         NodeOps::key_of(*NodeOps::Leaf::ptr_at(leaf, j))));
}

/**
 * Checks that the tree under `root` holds `tree_size` items, and is canonical:
 * every leaf sits on the path of its hash, no node is empty, and no branch has
 * a lone leaf child.
 */
template <typename NodeOps>
void check_trie_invariants(typename NodeOps::node_type* root, std::size_t tree_size) {
  using node_ptr_type = typename NodeOps::node_type*;
  std::size_t leaf_count = 0;

  auto check_leaf = [root, &leaf_count](node_ptr_type leaf) {
    check_leaf_invariants<NodeOps>(leaf);
    leaf_count += NodeOps::Leaf::size(leaf);

    const auto hash = NodeOps::leaf_hash(leaf);
    const auto path = NodeOps::make_path(root, hash);
    CATCH_REQUIRE(path.leaf_end == leaf);
    for (auto i = 0u; i < path.size; ++i) {
      const auto node = path.nodes[i];
      const void* next_node = (i + 1 == path.size) ? path.leaf_end : path.nodes[i + 1];
      const auto sparse_index = detail::hash_chunk(hash, i);
      CATCH_REQUIRE(NodeOps::type(node) == detail::NodeType::Branch);
      CATCH_REQUIRE(NodeOps::Branch::is_valid_index(node, sparse_index));
      CATCH_REQUIRE(*NodeOps::Branch::ptr_at(node, sparse_index) == next_node);
    }
  };

  auto check_node = [&check_leaf](node_ptr_type node) {
    if (NodeOps::type(node) == detail::NodeType::Leaf) {
      check_leaf(node);
    } else {
      CATCH_REQUIRE(NodeOps::size(node) > 0);
      if (NodeOps::size(node) == 1) { // a lone child must be another branch
        node_ptr_type child = *NodeOps::Branch::dense_ptr_at(node, 0);
        CATCH_REQUIRE(NodeOps::type(child) == detail::NodeType::Branch);
      }
    }
  };
  for_each_node<NodeOps>(root, check_node);

  CATCH_REQUIRE(leaf_count == tree_size);
}

template <typename Set, typename ForwardItr>
void check_trie_iterators(const Set& set, ForwardItr start, ForwardItr finish) {
  std::vector<std::size_t> values{start, finish};
  auto is_value = [&values](std::size_t value) {
    return std::find(std::begin(values), std::end(values), value) != std::end(values);
  };

  { // forward
    std::size_t counter = 0;
    for (auto ii = set.begin(); ii != set.end(); ++ii) {
      CATCH_REQUIRE(is_value((*ii).value()));
      ++counter;
    }
    CATCH_REQUIRE(counter == values.size());
  }

  { // backward
    std::size_t counter = 0;
    for (auto ii = set.end(); ii != set.begin();) {
      --ii;
      CATCH_REQUIRE(is_value((*ii).value()));
      ++counter;
    }
    CATCH_REQUIRE(counter == values.size());
  }

  for (auto ii = set.cbegin(); ii != set.cend(); ++ii) {
    CATCH_REQUIRE(set.count(*ii) == 1);
    CATCH_REQUIRE(*set.find(*ii) == *ii);
    CATCH_REQUIRE(set.contains(*ii));
  }

  { // Moving beyond the end has no effect
    std::size_t counter = 0;
    auto end = set.cend();
    ++end;
    for (auto ii = end; ii != set.cbegin();) {
      CATCH_REQUIRE(is_value((*--ii).value()));
      ++counter;
    }
    CATCH_REQUIRE(counter == values.size());
  }

  { // Moving before the start lands on the end
    auto start = set.cbegin();
    --start;
    CATCH_REQUIRE(start == set.cend());
  }

  { // postincrement
    std::size_t counter = 0;
    for (auto ii = set.cbegin(); ii != set.cend();) {
      CATCH_REQUIRE(is_value((*ii++).value()));
      ++counter;
    }
    CATCH_REQUIRE(counter == values.size());
  }

  { // postdecrement
    std::size_t counter = 0;
    for (auto ii = set.end(); ii != set.begin();) {
      ii--;
      CATCH_REQUIRE(is_value((*ii).value()));
      ++counter;
    }
    CATCH_REQUIRE(counter == values.size());
  }
}

} // namespace pcollections::trie::test
