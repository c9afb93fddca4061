
#pragma once

#include "_node-data.hpp"

namespace pcollections::trie::detail {

// ------------------------------------------------------------------------------------- BaseNodeOps

template <typename T, bool IsThreadSafe = true, bool IsBranchNode = false> struct BaseNodeOps {

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using hash_type = std::size_t;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  static constexpr bool is_thread_safe = IsThreadSafe;

  static constexpr NodeType DefaultType{IsBranchNode ? NodeType::Branch : NodeType::Leaf};
  static constexpr std::size_t LogicalSize{calculate_logical_size<item_type>()};
  static constexpr std::size_t AlignOf{std::max(alignof(item_type), alignof(node_type))};
  static constexpr std::size_t MinStorageSize{std::max(sizeof(node_type), AlignOf)};
  static constexpr node_size_type MaxSize{(1u << (8 * sizeof(node_size_type) - 1)) - 1};

  // The start of a compact array (BranchNode), or array of values (LeafNode)
  static constexpr std::size_t offset() {
    if (alignof(item_type) <= sizeof(node_type)) {
      return sizeof(node_type); // align=[1, 2, 4, 8] => data starts at node_type edge
    }
    return LogicalSize;
  }

  static constexpr std::size_t offset_at(node_size_type index) {
    return offset() + LogicalSize * index;
  }

  // std::aligned_alloc wants a multiple of the alignment
  static constexpr std::size_t storage_size(node_size_type size) {
    const auto bytes = (size == 0) ? MinStorageSize : offset() + LogicalSize * size;
    return ((bytes + AlignOf - 1) / AlignOf) * AlignOf;
  }

  static constexpr std::size_t size(node_const_ptr_type node) {
    if constexpr (IsBranchNode) {
      return popcount(node->payload_);
    } else {
      return node->payload_;
    }
  }

  //@{ Member access
  static constexpr bool is_valid_index(node_const_ptr_type node, node_size_type index) {
    if constexpr (IsBranchNode) {
      return ::pcollections::trie::detail::is_valid_index(index, node->payload_);
    } else {
      return index < node->payload_;
    }
  }

  static constexpr item_type* ptr_at(node_const_ptr_type node, node_size_type index) {
    if constexpr (IsBranchNode) {
      assert(index < BranchingFactor);
      return dense_ptr_at(node, to_dense_index(index, node->payload_));
    } else {
      return dense_ptr_at(node, index);
    }
  }

  static constexpr item_type* dense_ptr_at(node_const_ptr_type node, node_size_type index) {
    auto ptr_idx = reinterpret_cast<uintptr_t>(node) + offset_at(index);
    assert(ptr_idx % alignof(item_type) == 0); // never unaligned access
    return reinterpret_cast<item_type*>(ptr_idx);
  }

  static constexpr item_type* begin(node_const_ptr_type node) { return dense_ptr_at(node, 0); }

  static constexpr item_type* end(node_const_ptr_type node) {
    return dense_ptr_at(node, 0) + size(node);
  }
  //@}

  //@{ Utility
  static constexpr node_ptr_type make_uninitialized(node_size_type size, node_size_type payload) {
    auto ptr = static_cast<node_ptr_type>(std::aligned_alloc(AlignOf, storage_size(size)));
    if (ptr == nullptr)
      throw std::bad_alloc{};
    new (ptr) node_type{DefaultType, payload};
    return ptr;
  }

  /**
   * Releases the storage of a node without touching its payload. The caller has already
   * destroyed, moved or re-homed whatever the payload referenced.
   */
  static constexpr void free_shell(node_ptr_type node) {
    node->~node_type();
    std::free(node);
  }
  //@}
};

// ------------------------------------------------------------------------------------- LeafNodeOps

template <typename T, bool IsThreadSafe = true>
struct LeafNodeOps : public BaseNodeOps<T, IsThreadSafe, false> {

  using Base = BaseNodeOps<T, IsThreadSafe, false>;

  using node_type = typename Base::node_type;
  using node_ptr_type = typename Base::node_ptr_type;
  using node_const_ptr_type = typename Base::node_const_ptr_type;
  using item_type = typename Base::item_type;
  using hash_type = typename Base::hash_type;
  using node_size_type = typename Base::node_size_type;
  using ref_count_type = typename Base::ref_count_type;

  /**
   * In-place edits relocate items inside owned storage, so they need a move that
   * cannot throw. Other item types are edited by copying the leaf.
   */
  static constexpr bool edits_in_place = std::is_nothrow_move_constructible<item_type>::value;

  template <typename P> static constexpr void copy_one(P&& src, item_type* dst) {
    if constexpr (std::is_trivial<item_type>::value &&
                  std::is_same<std::decay_t<P>, item_type>::value) {
      std::memcpy(dst, &src, sizeof(item_type));
    } else {
      new (dst) item_type(std::forward<P>(src));
    }
  }

  static constexpr void initialize_one(const item_type& src, item_type* dst) { copy_one(src, dst); }

  static constexpr void initialize_one(item_type& src, item_type* dst) { copy_one(src, dst); }

  static constexpr void initialize_one(item_type&& src, item_type* dst) {
    if constexpr (std::is_move_constructible<item_type>::value) {
      new (dst) item_type(std::move(src));
    } else {
      copy_one(src, dst);
    }
  }

  /**
   * Moves `*src` to `dst`, and destroys `*src`
   */
  static constexpr void relocate_one(item_type* src, item_type* dst) noexcept {
    static_assert(edits_in_place);
    if constexpr (std::is_trivially_copyable<item_type>::value) {
      std::memcpy(static_cast<void*>(dst), static_cast<const void*>(src), sizeof(item_type));
    } else {
      new (dst) item_type(std::move(*src));
      std::destroy_at(src);
    }
  }

  /**
   * A leaf being filled in index order. If an item constructor throws, the items
   * built so far are destroyed and the storage released.
   */
  class LeafBuilder {
  private:
    node_ptr_type node_ = nullptr;
    uint32_t built_ = 0;

  public:
    constexpr explicit LeafBuilder(node_size_type size)
        : node_{Base::make_uninitialized(size, size)} {}
    LeafBuilder(const LeafBuilder&) = delete;
    LeafBuilder& operator=(const LeafBuilder&) = delete;
    constexpr ~LeafBuilder() {
      if (node_ == nullptr)
        return;
      for (auto i = 0u; i < built_; ++i)
        std::destroy_at(Base::ptr_at(node_, i));
      Base::free_shell(node_);
    }

    template <typename P> constexpr void push(P&& value) {
      initialize_one(std::forward<P>(value), Base::ptr_at(node_, built_));
      ++built_;
    }

    constexpr void copy_from(node_const_ptr_type src, uint32_t index) {
      copy_one(*Base::ptr_at(src, index), Base::ptr_at(node_, built_));
      ++built_;
    }

    constexpr node_ptr_type release() {
      assert(built_ == Base::size(node_));
      auto* node = node_;
      node_ = nullptr;
      return node;
    }
  };

  template <typename P> static constexpr node_ptr_type make(P&& value) {
    LeafBuilder builder{1};
    builder.push(std::forward<P>(value));
    return builder.release();
  }

  /**
   * Duplicates a leaf node, optionally omitting the value at `index_to_skip`
   */
  static constexpr node_ptr_type duplicate_leaf(node_const_ptr_type node, uint32_t index_to_skip) {
    const auto sz = static_cast<node_size_type>(Base::size(node));
    if (index_to_skip >= sz && std::is_trivially_copyable<item_type>::value) {
      auto* new_node = Base::make_uninitialized(sz, sz);
      std::memcpy(static_cast<void*>(Base::ptr_at(new_node, 0)),
                  static_cast<const void*>(Base::ptr_at(node, 0)), sz * Base::LogicalSize);
      return new_node;
    }
    static_assert(std::is_copy_constructible<item_type>::value);
    LeafBuilder builder{static_cast<node_size_type>(index_to_skip < sz ? sz - 1 : sz)};
    for (auto index = 0u; index != sz; ++index) {
      if (index != index_to_skip)
        builder.copy_from(node, index);
    }
    return builder.release();
  }

  /**
   * Duplicates a leaf node, overwriting one value. `item` may refer into `node`.
   */
  template <typename Item>
  static constexpr node_ptr_type duplicate_leaf_with_overwrite(node_const_ptr_type node,
                                                               uint32_t index_to_overwrite,
                                                               Item&& item) {
    const auto sz = static_cast<node_size_type>(Base::size(node));
    assert(index_to_overwrite < sz);
    LeafBuilder builder{sz};
    for (auto index = 0u; index != sz; ++index) {
      if (index == index_to_overwrite)
        builder.push(std::forward<Item>(item));
      else
        builder.copy_from(node, index);
    }
    return builder.release();
  }

  /**
   * Creates a new leaf node, with values copied, and `value` at the end
   */
  template <typename Item>
  static constexpr node_ptr_type copy_append(node_const_ptr_type src, Item&& item) {
    const auto sz = static_cast<node_size_type>(Base::size(src));
    LeafBuilder builder{static_cast<node_size_type>(sz + 1)};
    for (auto index = 0u; index != sz; ++index)
      builder.copy_from(src, index);
    builder.push(std::forward<Item>(item));
    return builder.release();
  }

  //@{ In-place edits: only for uniquely owned leaves, and items with a nothrow move
  /**
   * The replacement is built before the old item is destroyed, so `item` may refer
   * into the leaf, and a throwing constructor leaves the leaf untouched.
   */
  template <typename Item>
  static constexpr void assign_in_place(node_ptr_type node, uint32_t index, Item&& item) {
    static_assert(edits_in_place);
    assert(node->is_unique());
    assert(index < Base::size(node));
    item_type replacement(std::forward<Item>(item));
    auto* dst = Base::ptr_at(node, index);
    std::destroy_at(dst);
    new (dst) item_type(std::move(replacement));
  }

  /**
   * The leaf is full, so the items are relocated into a larger node, and the old
   * storage released.
   * @return The replacement node
   */
  template <typename Item>
  static constexpr node_ptr_type append_in_place(node_ptr_type node, Item&& item) {
    static_assert(edits_in_place);
    assert(node->is_unique());
    const auto sz = static_cast<node_size_type>(Base::size(node));
    auto* new_node = Base::make_uninitialized(sz + 1, sz + 1);
    try {
      initialize_one(std::forward<Item>(item), Base::ptr_at(new_node, sz));
    } catch (...) {
      Base::free_shell(new_node);
      throw;
    }
    for (auto index = 0u; index != sz; ++index)
      relocate_one(Base::ptr_at(node, index), Base::ptr_at(new_node, index));
    Base::free_shell(node);
    return new_node;
  }

  static constexpr void erase_in_place(node_ptr_type node, uint32_t index) {
    static_assert(edits_in_place);
    assert(node->is_unique());
    const auto sz = static_cast<node_size_type>(Base::size(node));
    assert(sz > 1);
    assert(index < sz);
    std::destroy_at(Base::ptr_at(node, index));
    for (auto i = index + 1; i < sz; ++i)
      relocate_one(Base::ptr_at(node, i), Base::ptr_at(node, i - 1));
    node->payload_ = sz - 1;
  }
  //@}
};

// ----------------------------------------------------------------------------------- BranchNodeOps

template <bool IsThreadSafe = true>
struct BranchNodeOps : public BaseNodeOps<NodeData<IsThreadSafe>*, IsThreadSafe, true> {

  using Base = BaseNodeOps<NodeData<IsThreadSafe>*, IsThreadSafe, true>;

  using node_type = typename Base::node_type;
  using node_ptr_type = typename Base::node_ptr_type;
  using node_const_ptr_type = typename Base::node_const_ptr_type;
  using item_type = typename Base::item_type;
  using hash_type = typename Base::hash_type;
  using node_size_type = typename Base::node_size_type;
  using ref_count_type = typename Base::ref_count_type;

  /**
   * Duplicate a Branch node, copying the values, perhaps skipping an index that is being
   * overwritten
   */
  static constexpr node_ptr_type duplicate(node_const_ptr_type node,
                                           uint32_t dense_index_to_skip) {
    assert(node->type() == NodeType::Branch);
    const auto sz = Base::size(node);
    node_ptr_type ptr = Base::make_uninitialized(static_cast<node_size_type>(sz), node->payload_);

    // Copy the pointers
    item_type* dst = Base::dense_ptr_at(ptr, 0);
    const item_type* src = Base::dense_ptr_at(node, 0);
    std::memcpy(static_cast<void*>(dst), static_cast<const void*>(src), sz * sizeof(item_type));

    // Must bump up all references
    for (auto i = 0u; i < sz; ++i) {
      if (i == dense_index_to_skip)
        continue;
      dst[i]->add_ref();
    }
    return ptr;
  }

  /**
   * Creates a new branch node without the child at `sparse_index_to_remove`
   */
  static constexpr node_ptr_type remove_from_branch_node(node_const_ptr_type node,
                                                         uint32_t sparse_index_to_remove) {
    assert(node->type() == NodeType::Branch);
    assert(Base::size(node) > 1);             // otherwise the branch node would become empty
    assert(Base::is_valid_index(node, sparse_index_to_remove)); // must remove something!

    const auto sz = Base::size(node);
    const auto dense_index = to_dense_index(sparse_index_to_remove, node->payload_);

    node_ptr_type ptr = Base::make_uninitialized(static_cast<node_size_type>(sz - 1),
                                                 node->payload_ & ~(1u << sparse_index_to_remove));

    item_type* dst = Base::dense_ptr_at(ptr, 0);
    const item_type* src = Base::dense_ptr_at(node, 0);

    auto write_pos = 0u;
    for (auto i = 0u; i < sz; ++i) {
      if (i == dense_index)
        continue;
      src[i]->add_ref();
      dst[write_pos++] = src[i];
    }
    return ptr;
  }

  /**
   * Creates a new branch node, with `value` inserted at `index`
   */
  static constexpr node_ptr_type insert_into_branch_node(node_const_ptr_type src, item_type value,
                                                         uint32_t index) {
    assert(src->type() == NodeType::Branch);
    assert(index < BranchingFactor);
    assert(!Base::is_valid_index(src, index)); // Cannot overwrite existing value

    const auto src_bitmap = src->payload_;
    const auto src_size = static_cast<node_size_type>(Base::size(src));
    const auto dst_bitmap = (1u << index) | src_bitmap;
    const auto dst_size = src_size + 1;

    auto dst = Base::make_uninitialized(dst_size, dst_bitmap);
    assert(Base::size(dst) == dst_size);
    assert(dst->type() == NodeType::Branch);

    // Copy across the (densely stored) pointers
    auto* dst_array = Base::dense_ptr_at(dst, 0);
    const auto* src_array = Base::dense_ptr_at(src, 0);
    const auto insert_pos = to_dense_index(index, dst_bitmap);

    for (auto i = 0u; i < insert_pos; ++i) {
      dst_array[i] = src_array[i];
      dst_array[i]->add_ref();
    }
    dst_array[insert_pos] = value; // insert the value
    for (auto i = insert_pos + 1; i < dst_size; ++i) {
      dst_array[i] = src_array[i - 1];
      dst_array[i]->add_ref();
    }

    return dst;
  }

  //@{ In-place edits: only for uniquely owned branches
  /**
   * Like `insert_into_branch_node`, but the children of `src` are re-homed (not shared)
   * and `src` is released.
   */
  static constexpr node_ptr_type insert_in_place(node_ptr_type src, item_type value,
                                                 uint32_t index) {
    assert(src->is_unique());
    assert(!Base::is_valid_index(src, index));

    const auto dst_bitmap = (1u << index) | src->payload_;
    const auto src_size = static_cast<node_size_type>(Base::size(src));
    auto dst = Base::make_uninitialized(src_size + 1, dst_bitmap);

    auto* dst_array = Base::dense_ptr_at(dst, 0);
    const auto* src_array = Base::dense_ptr_at(src, 0);
    const auto insert_pos = to_dense_index(index, dst_bitmap);

    std::memcpy(static_cast<void*>(dst_array), static_cast<const void*>(src_array),
                insert_pos * sizeof(item_type));
    dst_array[insert_pos] = value;
    std::memcpy(static_cast<void*>(dst_array + insert_pos + 1),
                static_cast<const void*>(src_array + insert_pos),
                (src_size - insert_pos) * sizeof(item_type));

    Base::free_shell(src);
    return dst;
  }

  /**
   * Drops the slot at `sparse_index`. The caller is responsible for the child that
   * was stored there.
   */
  static constexpr void remove_in_place(node_ptr_type node, uint32_t sparse_index) {
    assert(node->is_unique());
    assert(Base::size(node) > 1);
    assert(Base::is_valid_index(node, sparse_index));

    const auto sz = Base::size(node);
    const auto dense_index = to_dense_index(sparse_index, node->payload_);
    auto* array = Base::dense_ptr_at(node, 0);
    for (auto i = dense_index + 1; i < sz; ++i)
      array[i - 1] = array[i];
    node->payload_ &= ~(1u << sparse_index);
  }
  //@}
};

} // namespace pcollections::trie::detail
