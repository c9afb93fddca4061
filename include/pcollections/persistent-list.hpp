
#pragma once

#include "bits/trie-base.hpp"
#include "bits/_insertion-order.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace pcollections {

template <typename ValueType, bool IsThreadSafe> class transient_list;

namespace detail {

template <typename ValueType, bool IsThreadSafe>
using list_trie_type = trie::basic_trie<int64_t, ValueType, index_hasher, std::equal_to<int64_t>,
                                        true, IsThreadSafe>;

/**
 * Resolves a (possibly negative) position against `size`, throwing if it is out of range
 */
inline int64_t resolve_list_index(const char* what, int64_t index, std::size_t size) {
  const auto n = static_cast<int64_t>(size);
  if (index >= n || index < -n)
    throw std::out_of_range{fmt::format("{}: index {} out of range for size {}", what, index, n)};
  return (index < 0) ? index + n : index;
}

/**
 * Clamps an insert position to [0, size], counting negative positions from the end
 */
inline int64_t clamp_list_insert_index(int64_t index, std::size_t size) {
  const auto n = static_cast<int64_t>(size);
  index = std::clamp(index, -n, n);
  return (index < 0) ? index + n : index;
}

} // namespace detail

// --------------------------------------------------------------------------------- persistent_list

/**
 * An immutable sequence, stored in a trie keyed by position.
 *
 * Item `i` lives at key `start + i`, so that pushing or popping at either end
 * touches a single path. Inserting or erasing in the middle shifts the shorter
 * side of the list, in a single transient session.
 */
template <typename ValueType, bool IsThreadSafe = true> class persistent_list {
private:
  using trie_type = detail::list_trie_type<ValueType, IsThreadSafe>;
  trie_type trie_;
  int64_t start_{0};

  friend class transient_list<ValueType, IsThreadSafe>;
  friend struct trie::detail::trie_access;

  persistent_list(trie_type trie, int64_t start) : trie_{std::move(trie)}, start_{start} {}

  const ValueType& item_at_(int64_t position) const { return *trie_.get(start_ + position); }

public:
  using value_type = ValueType;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using reference = const value_type&;
  using const_reference = const value_type&;
  using transient_type = transient_list<ValueType, IsThreadSafe>;
  static constexpr bool is_thread_safe = IsThreadSafe;

  class const_iterator {
  private:
    const persistent_list* list_{nullptr};
    int64_t position_{0};

  public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = ValueType;
    using difference_type = std::ptrdiff_t;
    using reference = const ValueType&;
    using pointer = const ValueType*;

    const_iterator() = default;
    const_iterator(const persistent_list* list, int64_t position)
        : list_{list}, position_{position} {}

    reference operator*() const { return list_->item_at_(position_); }
    pointer operator->() const { return &list_->item_at_(position_); }

    const_iterator& operator++() {
      ++position_;
      return *this;
    }
    const_iterator& operator--() {
      --position_;
      return *this;
    }
    const_iterator operator++(int) {
      auto tmp = *this;
      ++position_;
      return tmp;
    }
    const_iterator operator--(int) {
      auto tmp = *this;
      --position_;
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return list_ == other.list_ && position_ == other.position_;
    }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }
  };
  using iterator = const_iterator;

  //@{ Construction/Destruction
  persistent_list() = default;

  template <typename InputIt> persistent_list(InputIt first, InputIt last) {
    auto session = transient();
    for (; first != last; ++first)
      session.push_back(*first);
    *this = session.persistent();
  }
  persistent_list(std::initializer_list<value_type> ilist)
      : persistent_list(std::begin(ilist), std::end(ilist)) {}
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{this, 0}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{this, static_cast<int64_t>(size())}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return trie_.empty(); }
  std::size_t size() const { return trie_.size(); }
  static constexpr std::size_t max_size() { return std::numeric_limits<int64_t>::max(); }
  //@}

  //@{ Element access: negative indices count from the back
  const value_type& at(int64_t index) const {
    return item_at_(detail::resolve_list_index("persistent_list::at", index, size()));
  }
  const value_type& operator[](int64_t index) const {
    return item_at_(detail::resolve_list_index("persistent_list::operator[]", index, size()));
  }
  const value_type& front() const {
    return item_at_(detail::resolve_list_index("persistent_list::front", 0, size()));
  }
  const value_type& back() const {
    return item_at_(detail::resolve_list_index("persistent_list::back", -1, size()));
  }
  //@}

  //@{ Modifiers
  void clear() {
    trie_ = trie_type::empty_trie();
    start_ = 0;
  }

  template <typename V> void set(int64_t index, V&& value) {
    const auto position = detail::resolve_list_index("persistent_list::set", index, size());
    trie_ = trie_.insert(start_ + position, std::forward<V>(value));
  }

  template <typename V> void push_back(V&& value) {
    trie_ = trie_.insert(start_ + static_cast<int64_t>(size()), std::forward<V>(value));
  }

  template <typename V> void push_front(V&& value) {
    trie_ = trie_.insert(start_ - 1, std::forward<V>(value));
    --start_;
  }

  void pop_back() {
    const auto position = detail::resolve_list_index("persistent_list::pop_back", -1, size());
    trie_ = trie_.remove(start_ + position);
  }

  void pop_front() {
    detail::resolve_list_index("persistent_list::pop_front", 0, size());
    trie_ = trie_.remove(start_);
    ++start_;
  }

  /**
   * Inserts `value` before `index`. The index is clamped to the list, as with
   * `std::vector::insert` given an iterator in range.
   */
  template <typename V> void insert(int64_t index, V&& value) {
    const auto position = detail::clamp_list_insert_index(index, size());
    if (position == 0) {
      push_front(std::forward<V>(value));
    } else if (position == static_cast<int64_t>(size())) {
      push_back(std::forward<V>(value));
    } else {
      auto session = transient();
      session.insert(position, std::forward<V>(value));
      *this = session.persistent();
    }
  }

  void erase(int64_t index) {
    const auto position = detail::resolve_list_index("persistent_list::erase", index, size());
    if (position == 0) {
      pop_front();
    } else if (position + 1 == static_cast<int64_t>(size())) {
      pop_back();
    } else {
      auto session = transient();
      session.erase(position);
      *this = session.persistent();
    }
  }

  void swap(persistent_list& other) noexcept {
    trie_.swap(other.trie_);
    std::swap(start_, other.start_);
  }
  //@}

  //@{ Observers
  /**
   * Depends on the order of items, unlike the set and map hash codes
   */
  template <typename ValueHash = std::hash<value_type>> std::size_t hash_code() const {
    std::size_t result = trie::detail::mix_hash(size());
    for (const auto& value : *this)
      result = trie::detail::combine_hash(result, ValueHash{}(value));
    return result;
  }
  //@}

  transient_type transient() const { return transient_type{*this}; }

  //@{ Friends
  friend bool operator==(const persistent_list& lhs, const persistent_list& rhs) {
    if (lhs.size() != rhs.size())
      return false;
    return std::equal(lhs.begin(), lhs.end(), rhs.begin());
  }

  friend bool operator!=(const persistent_list& lhs, const persistent_list& rhs) {
    return !(lhs == rhs);
  }

  friend bool operator<(const persistent_list& lhs, const persistent_list& rhs) {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
  }

  friend void swap(persistent_list& lhs, persistent_list& rhs) noexcept { lhs.swap(rhs); }
  //@}
};

// ---------------------------------------------------------------------------------- transient_list

/**
 * Batch edits of a `persistent_list`. Call `persistent()` to get the result; the
 * transient cannot be used afterwards.
 */
template <typename ValueType, bool IsThreadSafe = true> class transient_list {
private:
  using persistent_type = persistent_list<ValueType, IsThreadSafe>;
  using session_type = typename persistent_type::trie_type::transient_type;
  session_type session_;
  int64_t start_{0};

  const ValueType& item_at_(int64_t position) const { return *session_.get(start_ + position); }

  // Copies the item at `from` to `to`
  void shift_(int64_t from, int64_t to) {
    session_.set(start_ + to, ValueType(item_at_(from)));
  }

public:
  using value_type = ValueType;
  using size_type = std::size_t;

  transient_list() : transient_list(persistent_type{}) {}
  explicit transient_list(const persistent_type& origin)
      : session_{origin.trie_.transient()}, start_{origin.start_} {}

  //@{ Reads
  bool empty() const { return session_.empty(); }
  std::size_t size() const { return session_.size(); }
  const value_type& at(int64_t index) const {
    return item_at_(detail::resolve_list_index("transient_list::at", index, size()));
  }
  const value_type& operator[](int64_t index) const {
    return item_at_(detail::resolve_list_index("transient_list::operator[]", index, size()));
  }
  bool is_frozen() const noexcept { return session_.is_frozen(); }
  //@}

  //@{ Edits
  template <typename V> void set(int64_t index, V&& value) {
    const auto position = detail::resolve_list_index("transient_list::set", index, size());
    session_.set(start_ + position, std::forward<V>(value));
  }

  template <typename V> void push_back(V&& value) {
    session_.set(start_ + static_cast<int64_t>(size()), std::forward<V>(value));
  }

  template <typename V> void push_front(V&& value) {
    session_.set(start_ - 1, std::forward<V>(value));
    --start_;
  }

  void pop_back() {
    const auto position = detail::resolve_list_index("transient_list::pop_back", -1, size());
    session_.erase(start_ + position);
  }

  void pop_front() {
    detail::resolve_list_index("transient_list::pop_front", 0, size());
    session_.erase(start_);
    ++start_;
  }

  /**
   * Inserts `value` before `index` (clamped to the list), shifting the shorter side
   */
  template <typename V> void insert(int64_t index, V&& value) {
    const auto n = static_cast<int64_t>(size());
    const auto position = detail::clamp_list_insert_index(index, size());
    if (n - position <= position) {
      for (auto i = n; i > position; --i)
        shift_(i - 1, i);
      session_.set(start_ + position, std::forward<V>(value));
    } else {
      for (auto i = int64_t{0}; i < position; ++i)
        shift_(i, i - 1);
      --start_;
      session_.set(start_ + position, std::forward<V>(value));
    }
  }

  void erase(int64_t index) {
    const auto n = static_cast<int64_t>(size());
    const auto position = detail::resolve_list_index("transient_list::erase", index, size());
    if (n - position <= position) {
      for (auto i = position; i + 1 < n; ++i)
        shift_(i + 1, i);
      session_.erase(start_ + n - 1);
    } else {
      for (auto i = position; i > 0; --i)
        shift_(i - 1, i);
      session_.erase(start_);
      ++start_;
    }
  }
  //@}

  /**
   * If nothing was edited, then the result shares the original list's root.
   */
  persistent_type persistent() {
    auto trie = session_.persistent();
    return persistent_type(std::move(trie), start_);
  }
};

} // namespace pcollections

namespace std {
template <typename ValueType, bool IsThreadSafe>
struct hash<pcollections::persistent_list<ValueType, IsThreadSafe>> {
  std::size_t operator()(const pcollections::persistent_list<ValueType, IsThreadSafe>& list) const {
    return list.hash_code();
  }
};
} // namespace std
