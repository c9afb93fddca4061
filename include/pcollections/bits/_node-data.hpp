#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <functional>
#include <iterator>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <type_traits>

#include <cstdint>
#include <cstring>
#include <cassert>
#include <cstdlib>

namespace pcollections::trie::detail {

// ------------------------------------------------------------------------------------ Hash chunks

constexpr uint32_t BitsPerLevel{5};
constexpr uint32_t BranchingFactor{1u << BitsPerLevel}; // 32 children per branch
constexpr uint32_t ChunkMask{BranchingFactor - 1};

// Enough levels to consume every bit of a 64 bit hash: ceil(64 / 5)
constexpr std::size_t MaxTrieDepth{(64 + BitsPerLevel - 1) / BitsPerLevel};

constexpr uint32_t NotAnIndex{std::numeric_limits<uint32_t>::max()};

/**
 * The 5 bits of `hash` that select a child at depth `level`
 */
constexpr uint32_t hash_chunk(std::size_t hash, uint32_t level) {
  assert(level < MaxTrieDepth);
  return static_cast<uint32_t>(static_cast<uint64_t>(hash) >> (level * BitsPerLevel)) & ChunkMask;
}

// ---------------------------------------------------------------------------------------- Bitmaps

constexpr uint32_t popcount(uint32_t bitmap) { return static_cast<uint32_t>(std::popcount(bitmap)); }

/**
 * A branch stores only its present children, in slot order. The child in slot
 * `index` lives at the number of present slots below it.
 */
constexpr uint32_t to_dense_index(uint32_t index, uint32_t bitmap) {
  assert(index < BranchingFactor);
  return popcount(bitmap & ((1u << index) - 1u));
}

constexpr bool is_valid_index(uint32_t index, uint32_t bitmap) {
  return index < BranchingFactor && ((bitmap >> index) & 1u) != 0;
}

// ---------------------------------------------------------------------------------- Hash mixing

/**
 * Finalizer from splitmix64. Spreads the bits of an entry hash before the
 * (commutative) combination used by `hash_code()`.
 */
constexpr std::size_t mix_hash(std::size_t hash) {
  uint64_t z = static_cast<uint64_t>(hash) + 0x9e3779b97f4a7c15ull;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return static_cast<std::size_t>(z ^ (z >> 31));
}

constexpr std::size_t combine_hash(std::size_t seed, std::size_t hash) {
  return seed ^ (hash + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

// ----------------------------------------------------------------------------------- Array layout

/**
 * The stride of T in an array: sizeof(T) rounded up to a multiple of alignof(T)
 */
template <typename T> constexpr std::size_t calculate_logical_size() {
  constexpr std::size_t align = alignof(T);
  return ((sizeof(T) + align - 1) / align) * align;
}

// ---------------------------------------------------------------------------------------- NodeType

enum class NodeType : int { Branch = 0, Leaf = 1 };

// ---------------------------------------------------------------------------------------- NodeData

/**
 * Header of every node: an intrusive reference count and a 32 bit payload.
 *
 * The lowest bit of the count word holds the node type, and the count proper
 * lives in the remaining bits, so one reference is worth `RefUnit`.
 */
template <bool IsThreadSafe = true> struct NodeData {
  using ref_count_type = uint32_t;
  using node_size_type = uint32_t;
  using word_type = std::conditional_t<IsThreadSafe, std::atomic<ref_count_type>, ref_count_type>;

  static constexpr ref_count_type TypeMask{1u};
  static constexpr ref_count_type RefUnit{2u};
  static constexpr ref_count_type MaxRef{std::numeric_limits<ref_count_type>::max() / RefUnit};

  mutable word_type word_;  // (count * RefUnit) | type
  node_size_type payload_;  // bitmap for branches, item count for leaves

  constexpr NodeData(NodeType type, node_size_type payload)
      : word_{RefUnit | static_cast<ref_count_type>(type)}, payload_{payload} {}

  /**
   * @return The count after the increment
   */
  constexpr ref_count_type add_ref() const {
    ref_count_type before;
    if constexpr (IsThreadSafe) {
      before = word_.fetch_add(RefUnit, std::memory_order_relaxed);
    } else {
      before = word_;
      word_ += RefUnit;
    }
    assert(before / RefUnit < MaxRef);
    return before / RefUnit + 1;
  }

  /**
   * @return The count after the decrement; the caller destroys the node at zero
   */
  constexpr ref_count_type dec_ref() const {
    ref_count_type before;
    if constexpr (IsThreadSafe) {
      before = word_.fetch_sub(RefUnit, std::memory_order_acq_rel);
    } else {
      before = word_;
      word_ -= RefUnit;
    }
    assert(before / RefUnit > 0);
    return before / RefUnit - 1;
  }

  constexpr ref_count_type ref_count() const { return load_() / RefUnit; }

  /**
   * True if exactly one pointer (a parent slot, a trie root, or a session root)
   * refers to this node. Such a node, reached through a chain of such nodes,
   * may be edited in place.
   */
  constexpr bool is_unique() const { return ref_count() == 1; }

  constexpr NodeType type() const { return static_cast<NodeType>(load_() & TypeMask); }

private:
  constexpr ref_count_type load_() const {
    if constexpr (IsThreadSafe) {
      return word_.load(std::memory_order_acquire);
    } else {
      return word_;
    }
  }
};

} // namespace pcollections::trie::detail
