
#pragma once

#include "_base-node-ops.hpp"

#include <array>
#include <utility>

namespace pcollections::trie::detail {

// ----------------------------------------------------------------------------------------- NodeOps

template <typename KeyType,                           //
          typename ValueType,                         // Value Type for maps
          typename Hash = std::hash<KeyType>,         //
          typename KeyEqual = std::equal_to<KeyType>, //
          bool IsMap = false,                         // True if map
          bool IsThreadSafe = true>
struct NodeOps {
  using key_type = KeyType;
  using value_type = ValueType;
  using item_type = typename std::conditional_t<IsMap, std::pair<KeyType, ValueType>, KeyType>;
  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using size_type = std::size_t;
  using hash_type = std::size_t;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;
  using hasher = Hash;
  using key_equal = KeyEqual;

  using Branch = BranchNodeOps<IsThreadSafe>;
  using Leaf = LeafNodeOps<item_type, IsThreadSafe>;

  static constexpr bool is_map = IsMap;
  static constexpr bool is_thread_safe = IsThreadSafe;

  /**
   * Result of a pure edit: `root` carries one reference owned by the caller, even
   * when the edit changed nothing (and `root` is the input root).
   */
  struct EditResult {
    node_ptr_type root = nullptr;
    int size_delta = 0;
  };

  //@{ Destruction
  static constexpr void destroy(node_ptr_type node_ptr) {
    if (node_ptr == nullptr) {
      return;
    }

    if (node_ptr->type() == NodeType::Branch) {
      node_ptr_type* iterator = Branch::dense_ptr_at(node_ptr, 0); // i.e., node_type**
      node_ptr_type* end = iterator + Branch::size(node_ptr);
      while (iterator != end)
        dec_ref(*iterator++);
    } else {
      // Destroy payload only if its of "class" type
      if constexpr (std::is_class<item_type>::value) {
        auto* iterator = Leaf::ptr_at(node_ptr, 0);
        auto* end = iterator + Leaf::size(node_ptr);
        while (iterator != end)
          std::destroy_at(iterator++);
      }
    }

    node_ptr->~node_type();
    std::free(node_ptr);
  }
  //@}

  //@{ Getters
  static constexpr NodeType type(node_const_ptr_type node) { return node->type(); }

  static constexpr size_type size(node_const_ptr_type node) {
    return (node->type() == NodeType::Branch) ? Branch::size(node) : Leaf::size(node);
  }

  static constexpr const key_type& key_of(const item_type& item) {
    if constexpr (IsMap) {
      return item.first;
    } else {
      return item;
    }
  }

  static constexpr hash_type hash_key(const key_type& key) { return hasher{}(key); }

  static constexpr hash_type hash_item(const item_type& item) { return hash_key(key_of(item)); }

  static constexpr bool keys_equal(const key_type& lhs, const key_type& rhs) {
    return key_equal{}(lhs, rhs);
  }

  /**
   * Every item in a leaf shares the same (full) hash
   */
  static constexpr hash_type leaf_hash(node_const_ptr_type leaf) {
    assert(leaf != nullptr);
    assert(leaf->type() == NodeType::Leaf);
    assert(Leaf::size(leaf) > 0);
    return hash_item(*Leaf::ptr_at(leaf, 0));
  }
  //@}

  //@{ Reference counting
  static constexpr void add_ref(node_const_ptr_type node) {
    if (node != nullptr)
      node->add_ref();
  }
  static constexpr void dec_ref(node_const_ptr_type node) {
    if (node != nullptr && node->dec_ref() == 0)
      destroy(const_cast<node_ptr_type>(node));
  }
  static constexpr ref_count_type ref_count(node_const_ptr_type node) {
    return (node == nullptr) ? 0 : node->ref_count();
  }
  //@}

  //@{ Lookup
  static constexpr uint32_t get_index_in_leaf(node_const_ptr_type leaf, const key_type& key) {
    if (leaf != nullptr) {
      assert(type(leaf) == NodeType::Leaf);
      auto* start = Leaf::ptr_at(leaf, 0);
      for (auto* iterator = start; iterator != start + Leaf::size(leaf); ++iterator) {
        if (keys_equal(key, key_of(*iterator)))
          return static_cast<uint32_t>(iterator - start);
      }
    }
    return NotAnIndex;
  }

  static constexpr const item_type* find(node_const_ptr_type root, const key_type& key) {
    if (root == nullptr)
      return nullptr;

    const auto hash = hash_key(key);
    auto node = root;
    auto level = 0u;
    while (type(node) == NodeType::Branch) {
      const auto sparse_index = hash_chunk(hash, level++);
      if (!Branch::is_valid_index(node, sparse_index))
        return nullptr;
      node = *Branch::ptr_at(node, sparse_index);
    }

    auto* start = Leaf::ptr_at(node, 0);
    auto* finish = start + Leaf::size(node);
    for (auto iterator = start; iterator != finish; ++iterator) {
      if (keys_equal(key, key_of(*iterator)))
        return iterator;
    }
    return nullptr;
  }
  //@}

  //@{ Path
  struct TreePath {
    std::array<node_ptr_type, MaxTrieDepth> nodes; //!< the path is {Branch, Branch, Branch}
    node_ptr_type leaf_end = nullptr;              //!< set if the path ends in a leaf
    uint32_t size = 0;                             //!< number of branch elements in path
    void push(node_ptr_type node) {
      assert(size < nodes.size());
      nodes[size++] = node;
    }
  };

  static constexpr TreePath make_path(node_ptr_type root, hash_type hash) {
    TreePath path;
    auto node = root;
    while (node != nullptr && type(node) == NodeType::Branch) {
      auto sparse_index = hash_chunk(hash, path.size);
      path.push(node);
      node = Branch::is_valid_index(node, sparse_index) ? *Branch::ptr_at(node, sparse_index)
                                                        : nullptr;
    }
    path.leaf_end = node;
    assert(path.leaf_end == nullptr || type(path.leaf_end) == NodeType::Leaf);
    return path;
  }

  /**
   * A copy of `branch` with `child` at `sparse_index`, either overwriting the
   * existing child, or expanding the branch. The reference to `child` moves into
   * the copy.
   */
  static constexpr node_ptr_type with_child(node_const_ptr_type branch, uint32_t sparse_index,
                                            node_ptr_type child) {
    if (Branch::is_valid_index(branch, sparse_index)) {
      const auto dense_index = to_dense_index(sparse_index, branch->payload_);
      auto* new_branch = Branch::duplicate(branch, dense_index); // Private copy
      *Branch::dense_ptr_at(new_branch, dense_index) = child;    // Do the overwrite
      return new_branch;
    }
    return Branch::insert_into_branch_node(branch, child, sparse_index);
  }

  /**
   * Copies the branch nodes `path.nodes[0..level)`, splicing `splice_node` in below
   * `path.nodes[level - 1]`. Siblings off the path are shared.
   * @return The new root of the tree
   */
  static constexpr node_ptr_type rewrite_branch_path(const TreePath& path, hash_type hash,
                                                     uint32_t level, node_ptr_type splice_node) {
    auto iterator = splice_node;
    for (auto i = level; i > 0; --i)
      iterator = with_child(path.nodes[i - 1], hash_chunk(hash, i - 1), iterator);
    return iterator;
  }

  /**
   * It may be necessary to create a sequence of "common" branch nodes when
   * inserting a new leaf. This method handles creating the new leaf, and
   * creating however many common branch nodes required to insert leaf from the
   * existing position (level).
   *
   *    [...] -> old-leaf
   *
   *        goes to
   *
   *    [...] -> branch-head -> branch -> branch -> old-leaf
   *                                             -> new-leaf
   *
   * The caller hands over one reference to `existing_leaf`, whose hash must differ
   * from `item_hash`.
   *
   * Returns branch-head
   */
  template <typename ItemType>
  static constexpr node_ptr_type branch_to_leaves(const hash_type item_hash, uint32_t level,
                                                  node_ptr_type existing_leaf, ItemType&& item) {
    assert(type(existing_leaf) == NodeType::Leaf);
    assert(Leaf::size(existing_leaf) > 0);

    const auto existing_hash = leaf_hash(existing_leaf);
    assert(existing_hash != item_hash);

    // Make {branch, branch, branch, ...} until the indices diverge
    node_ptr_type branch = nullptr;
    node_ptr_type tail = nullptr;
    uint32_t last_index = 0u;

    auto append_to_tail = [&](node_ptr_type new_branch, uint32_t index) {
      if (branch == nullptr) {
        branch = new_branch;                            // nothing to connect
      } else {                                          //
        *Branch::ptr_at(tail, last_index) = new_branch; // connect [tail => new_branch]
      }                                                 //
      tail = new_branch;                                // update the tail
      last_index = index;                               // store the index for next insert into tail
    };

    // Built first, so that a throwing item constructor leaves nothing behind
    node_ptr_type new_leaf = Leaf::make(std::forward<ItemType>(item));
    for (auto i = level;; ++i) {
      assert(i < MaxTrieDepth); // otherwise the hashes would be equal
      const auto index_lhs = hash_chunk(existing_hash, i);
      const auto index_rhs = hash_chunk(item_hash, i);
      if (index_lhs == index_rhs) {
        append_to_tail(Branch::make_uninitialized(1, 1u << index_lhs), index_lhs);
      } else { // divergence
        const auto pattern = (1u << index_lhs) | (1u << index_rhs);
        append_to_tail(Branch::make_uninitialized(2, pattern), 0 /* irrelevant */);
        *Branch::ptr_at(tail, index_lhs) = existing_leaf;
        *Branch::ptr_at(tail, index_rhs) = new_leaf;
        return branch;
      }
    }
  }
  //@}

  //@{ Persistent edits: inputs are never modified
  template <typename ItemType>
  static constexpr node_ptr_type finish_insert(hash_type hash, const TreePath& path,
                                               ItemType&& item) {
    if (path.leaf_end == nullptr) {
      auto new_leaf = Leaf::make(std::forward<ItemType>(item));
      return rewrite_branch_path(path, hash, path.size, new_leaf);
    }

    if (leaf_hash(path.leaf_end) == hash) { // Full hash collision: extend the bucket
      auto new_leaf = Leaf::copy_append(path.leaf_end, std::forward<ItemType>(item));
      return rewrite_branch_path(path, hash, path.size, new_leaf);
    }

    add_ref(path.leaf_end); // now shared by the old and the new tree
    auto new_branch = branch_to_leaves(hash, path.size, path.leaf_end, std::forward<ItemType>(item));
    return rewrite_branch_path(path, hash, path.size, new_branch);
  }

  /**
   * Inserts `item`. If the key is already present, then the item is replaced when
   * `overwrite` is set, and otherwise the root is returned unchanged.
   */
  template <typename ItemType>
  static constexpr EditResult do_insert(node_ptr_type root, ItemType&& item, bool overwrite) {
    const auto hash = hash_item(item);
    const auto path = make_path(root, hash);
    const auto leaf_index = get_index_in_leaf(path.leaf_end, key_of(item));

    if (leaf_index != NotAnIndex) {
      if (!overwrite) {
        add_ref(root);
        return {root, 0};
      }
      auto new_leaf = Leaf::duplicate_leaf_with_overwrite(path.leaf_end, leaf_index,
                                                          std::forward<ItemType>(item));
      return {rewrite_branch_path(path, hash, path.size, new_leaf), 0};
    }
    return {finish_insert(hash, path, std::forward<ItemType>(item)), 1};
  }

  /**
   * Sets the value at `key` to `fn(current)`, where `current` is null when the key
   * is absent.
   */
  template <typename Function>
  static constexpr EditResult update(node_ptr_type root, const key_type& key, Function&& fn) {
    static_assert(IsMap);
    const auto hash = hash_key(key);
    const auto path = make_path(root, hash);
    const auto leaf_index = get_index_in_leaf(path.leaf_end, key);

    if (leaf_index != NotAnIndex) {
      const auto& current = *Leaf::ptr_at(path.leaf_end, leaf_index);
      item_type item(current.first, fn(static_cast<const value_type*>(&current.second)));
      auto new_leaf = Leaf::duplicate_leaf_with_overwrite(path.leaf_end, leaf_index, std::move(item));
      return {rewrite_branch_path(path, hash, path.size, new_leaf), 0};
    }
    item_type item(key, fn(static_cast<const value_type*>(nullptr)));
    return {finish_insert(hash, path, std::move(item)), 1};
  }

  /**
   * If a Branch node has two children, then this method will return the child
   * that is *not* at `sparse_index`
   */
  static constexpr node_ptr_type other_sibling(node_const_ptr_type node, uint32_t sparse_index) {
    assert(type(node) == NodeType::Branch);
    assert(Branch::size(node) == 2);
    assert(Branch::is_valid_index(node, sparse_index));
    const auto dense_index = to_dense_index(sparse_index, node->payload_);
    return *Branch::dense_ptr_at(node, 1 - dense_index);
  }

  static constexpr EditResult erase(node_ptr_type root, const key_type& key) {
    // 1. Find the node (if it's not found, the tree is unchanged)
    // 2. Delete the leaf, and "roll up"
    const hash_type hash = hash_key(key);
    const auto path = make_path(root, hash);
    const auto leaf_index = get_index_in_leaf(path.leaf_end, key);

    if (leaf_index == NotAnIndex) { // value not in tree
      add_ref(root);
      return {root, 0};
    }

    if (Leaf::size(path.leaf_end) > 1) { // Special case: deleting from "many value" leaf
      auto new_leaf = Leaf::duplicate_leaf(path.leaf_end, leaf_index);
      return {rewrite_branch_path(path, hash, path.size, new_leaf), -1};
    }

    // While rolling up the tree, we may find a single leaf node
    // that we can attach higher up. This is called the `leaf_in_hand`
    // and is held and attached if appropriate
    node_ptr_type leaf_in_hand = nullptr;
    auto level = path.size;

    while (level > 0) {
      --level;
      node_ptr_type branch = path.nodes[level];
      const auto branch_size = Branch::size(branch);
      const auto sparse_index = hash_chunk(hash, level);

      if (branch_size == 1)
        continue; // Only child is gone (or in hand): this branch disappears

      if (leaf_in_hand == nullptr && branch_size == 2) {
        node_ptr_type sibling = other_sibling(branch, sparse_index);
        if (type(sibling) == NodeType::Leaf) {
          leaf_in_hand = sibling;
          add_ref(leaf_in_hand); // this will be attached elsewhere
          continue;
        }
      }

      node_ptr_type new_branch = (leaf_in_hand != nullptr)
                                     ? with_child(branch, sparse_index, leaf_in_hand)
                                     : Branch::remove_from_branch_node(branch, sparse_index);
      return {rewrite_branch_path(path, hash, level, new_branch), -1};
    }

    // The tree collapsed to the leaf in hand. (If null, the last item was deleted.)
    return {leaf_in_hand, -1};
  }
  //@}

  //@{ Transient edits: nodes referenced once (through a chain of nodes referenced
  //   once) belong to the caller, and are edited in place.

  /**
   * Replaces `*slot` with a private copy, unless it is already uniquely owned
   */
  static constexpr void make_unique(node_ptr_type& slot) {
    assert(slot != nullptr);
    if (slot->is_unique())
      return;
    auto* copy = (type(slot) == NodeType::Branch) ? Branch::duplicate(slot, NotAnIndex)
                                                  : Leaf::duplicate_leaf(slot, NotAnIndex);
    dec_ref(slot);
    slot = copy;
  }

  template <typename ItemType>
  static constexpr int transient_insert(node_ptr_type& root, ItemType&& item, bool overwrite) {
    if (!overwrite && find(root, key_of(item)) != nullptr)
      return 0; // Nothing to do, so nothing is copied

    const auto hash = hash_item(item);
    node_ptr_type* slot = &root;
    uint32_t level = 0;

    while (*slot != nullptr && type(*slot) == NodeType::Branch) {
      make_unique(*slot);
      const auto sparse_index = hash_chunk(hash, level);
      if (!Branch::is_valid_index(*slot, sparse_index)) {
        auto* new_leaf = Leaf::make(std::forward<ItemType>(item));
        *slot = Branch::insert_in_place(*slot, new_leaf, sparse_index);
        return 1;
      }
      slot = Branch::ptr_at(*slot, sparse_index);
      ++level;
    }

    if (*slot == nullptr) { // Only the root can be empty
      *slot = Leaf::make(std::forward<ItemType>(item));
      return 1;
    }

    auto* leaf = *slot;
    const auto leaf_index = get_index_in_leaf(leaf, key_of(item));
    if (leaf_index != NotAnIndex) {
      if constexpr (Leaf::edits_in_place) {
        if (leaf->is_unique()) {
          Leaf::assign_in_place(leaf, leaf_index, std::forward<ItemType>(item));
          return 0;
        }
      }
      // `item` may live in `leaf`, which is released only after the copy is built
      *slot = Leaf::duplicate_leaf_with_overwrite(leaf, leaf_index, std::forward<ItemType>(item));
      dec_ref(leaf);
      return 0;
    }

    if (leaf_hash(leaf) == hash) { // Full hash collision: extend the bucket
      if constexpr (Leaf::edits_in_place) {
        if (leaf->is_unique()) {
          *slot = Leaf::append_in_place(leaf, std::forward<ItemType>(item));
          return 1;
        }
      }
      *slot = Leaf::copy_append(leaf, std::forward<ItemType>(item));
      dec_ref(leaf);
      return 1;
    }

    // The reference held by `*slot` moves into the new branch
    *slot = branch_to_leaves(hash, level, leaf, std::forward<ItemType>(item));
    return 1;
  }

  template <typename Function>
  static constexpr int transient_update(node_ptr_type& root, const key_type& key, Function&& fn) {
    static_assert(IsMap);
    if (const auto* current = find(root, key); current != nullptr) {
      item_type item(current->first, fn(static_cast<const value_type*>(&current->second)));
      return transient_insert(root, std::move(item), true);
    }
    item_type item(key, fn(static_cast<const value_type*>(nullptr)));
    return transient_insert(root, std::move(item), true);
  }

  static constexpr int transient_erase(node_ptr_type& root, const key_type& key) {
    if (find(root, key) == nullptr)
      return 0; // Nothing to do, so nothing is copied

    const auto hash = hash_key(key);
    std::array<node_ptr_type*, MaxTrieDepth> slots; // slots holding the branches on the path
    uint32_t depth = 0;
    node_ptr_type* slot = &root;

    while (type(*slot) == NodeType::Branch) {
      make_unique(*slot);
      slots[depth] = slot;
      slot = Branch::ptr_at(*slot, hash_chunk(hash, depth));
      ++depth;
    }

    auto* leaf = *slot;
    const auto leaf_index = get_index_in_leaf(leaf, key);
    assert(leaf_index != NotAnIndex);

    if (Leaf::size(leaf) > 1) {
      if constexpr (Leaf::edits_in_place) {
        if (leaf->is_unique()) {
          Leaf::erase_in_place(leaf, leaf_index);
          return -1;
        }
      }
      *slot = Leaf::duplicate_leaf(leaf, leaf_index);
      dec_ref(leaf);
      return -1;
    }

    dec_ref(leaf);

    // Roll up, as with `erase`. Collapsed branches are uniquely owned, and their
    // remaining child (if any) is moved, so only the shell is released.
    node_ptr_type leaf_in_hand = nullptr;
    while (depth > 0) {
      --depth;
      auto* branch = *slots[depth];
      const auto branch_size = Branch::size(branch);
      const auto sparse_index = hash_chunk(hash, depth);

      if (branch_size == 1) {
        Branch::free_shell(branch);
        continue;
      }

      if (leaf_in_hand == nullptr && branch_size == 2) {
        node_ptr_type sibling = other_sibling(branch, sparse_index);
        if (type(sibling) == NodeType::Leaf) {
          leaf_in_hand = sibling;
          Branch::free_shell(branch);
          continue;
        }
      }

      if (leaf_in_hand != nullptr)
        *Branch::ptr_at(branch, sparse_index) = leaf_in_hand;
      else
        Branch::remove_in_place(branch, sparse_index);
      return -1;
    }

    root = leaf_in_hand;
    return -1;
  }
  //@}
};

} // namespace pcollections::trie::detail
