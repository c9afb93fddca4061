#pragma once

#include "_node-ops.hpp"

namespace pcollections::trie::detail {

/**
 * Bidirectional, read-only iteration over the items of a trie, depth first, in
 * ascending slot order. The order is stable for a given root.
 *
 * The iterator keeps the stack of (node, cursor) frames from the root down to
 * the current leaf. An empty stack is `end()`. Stepping past either end lands
 * on `end()`, and stepping back from `end()` lands on the last item.
 */
template <typename NodeOps> class Iterator {
public:
  using iterator_category = std::bidirectional_iterator_tag;
  using item_type = typename NodeOps::item_type;
  using value_type = item_type;
  using difference_type = std::ptrdiff_t;
  using reference = const item_type&;
  using pointer = const item_type*;
  using node_type = typename NodeOps::node_type;
  using node_const_ptr_type = const node_type*;

private:
  struct Frame {
    node_const_ptr_type node = nullptr;
    uint32_t cursor = 0; // dense index of a child (branch), or of an item (leaf)
  };

  node_const_ptr_type root_{nullptr};
  std::array<Frame, MaxTrieDepth + 1> stack_{}; // +1 for the leaf
  uint32_t height_{0};                          // number of frames in use

public:
  struct MakeBeginTag {};
  struct MakeEndTag {};

  constexpr Iterator() = default;

  constexpr Iterator(node_const_ptr_type root, MakeBeginTag) : root_{root} {
    if (root_ != nullptr) {
      push_(root_, 0);
      settle_(true);
    }
  }

  constexpr Iterator(node_const_ptr_type root, MakeEndTag) : root_{root} {}

  constexpr bool operator==(const Iterator& other) const {
    if (at_end_() || other.at_end_())
      return at_end_() && other.at_end_();
    return top_().node == other.top_().node && top_().cursor == other.top_().cursor;
  }

  constexpr bool operator!=(const Iterator& other) const { return !(*this == other); }

  constexpr Iterator& operator++() {
    step_forward_();
    return *this;
  }

  constexpr Iterator& operator--() {
    step_backward_();
    return *this;
  }

  constexpr Iterator operator++(int) {
    auto tmp = *this;
    step_forward_();
    return tmp;
  }

  constexpr Iterator operator--(int) {
    auto tmp = *this;
    step_backward_();
    return tmp;
  }

  constexpr reference operator*() const { return *operator->(); }

  constexpr pointer operator->() const {
    assert(!at_end_());
    assert(NodeOps::type(top_().node) == NodeType::Leaf);
    return NodeOps::Leaf::ptr_at(top_().node, top_().cursor);
  }

private:
  constexpr bool at_end_() const { return height_ == 0; }
  constexpr Frame& top_() { return stack_[height_ - 1]; }
  constexpr const Frame& top_() const { return stack_[height_ - 1]; }

  constexpr void push_(node_const_ptr_type node, uint32_t cursor) {
    assert(height_ < stack_.size());
    stack_[height_++] = Frame{node, cursor};
  }

  /**
   * Descends from the top frame to a leaf, taking the first (or last) child at
   * each branch below it
   */
  constexpr void settle_(bool leftmost) {
    while (NodeOps::type(top_().node) == NodeType::Branch) {
      auto* child = *NodeOps::Branch::dense_ptr_at(top_().node, top_().cursor);
      const auto size = static_cast<uint32_t>(NodeOps::size(child));
      push_(child, leftmost ? 0u : size - 1u);
    }
  }

  constexpr void step_forward_() {
    while (!at_end_()) {
      auto& frame = top_();
      if (++frame.cursor < NodeOps::size(frame.node)) {
        settle_(true);
        return;
      }
      --height_; // this node is exhausted
    }
  }

  constexpr void step_backward_() {
    if (at_end_()) { // wrap around to the last item
      if (root_ != nullptr) {
        push_(root_, static_cast<uint32_t>(NodeOps::size(root_)) - 1u);
        settle_(false);
      }
      return;
    }

    while (!at_end_()) {
      auto& frame = top_();
      if (frame.cursor > 0) {
        --frame.cursor;
        settle_(false);
        return;
      }
      --height_;
    }
  }
};

} // namespace pcollections::trie::detail
