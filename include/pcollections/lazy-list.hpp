#pragma once

#include "lazy.hpp"
#include "persistent-list.hpp"

#include <algorithm>
#include <variant>

namespace pcollections {

template <typename ValueType, bool IsThreadSafe> class transient_lazy_list;

// --------------------------------------------------------------------------------------- lazy_list

/**
 * A persistent list whose items may be given lazily.
 *
 * Each item is either a plain `ValueType` or a `lazy<ValueType>`. Indexing and
 * iteration return forced values, so a lazy list behaves like a list whose
 * values were computed up front. `get_lazy` returns what is actually stored.
 * Equality, ordering and hashing force every item.
 */
template <typename ValueType, bool IsThreadSafe = true> class lazy_list {
public:
  using lazy_type = lazy<ValueType, IsThreadSafe>;
  using stored_type = std::variant<ValueType, lazy_type>;
  using list_type = persistent_list<stored_type, IsThreadSafe>;
  using transient_type = transient_lazy_list<ValueType, IsThreadSafe>;
  using value_type = ValueType;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using reference = const value_type&;
  using const_reference = const value_type&;
  static constexpr bool is_thread_safe = IsThreadSafe;

  class const_iterator {
  private:
    typename list_type::const_iterator position_;

  public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = ValueType;
    using difference_type = std::ptrdiff_t;
    using reference = const ValueType&;
    using pointer = const ValueType*;

    const_iterator() = default;
    explicit const_iterator(typename list_type::const_iterator position) : position_{position} {}

    reference operator*() const { return unlazy(*position_); }
    pointer operator->() const { return &unlazy(*position_); }

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

    bool operator==(const const_iterator& other) const { return position_ == other.position_; }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }
  };
  using iterator = const_iterator;

private:
  list_type list_;

  const stored_type& stored_at_(const char* what, int64_t index) const {
    return list_[detail::resolve_list_index(what, index, size())];
  }

public:
  //@{ Construction/Destruction
  lazy_list() = default;

  /**
   * Adopts a list of stored items, lazy or not
   */
  explicit lazy_list(list_type list) : list_{std::move(list)} {}

  lazy_list(std::initializer_list<stored_type> ilist) : list_(ilist) {}
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{list_.begin()}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{list_.end()}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return list_.empty(); }
  std::size_t size() const { return list_.size(); }
  //@}

  //@{ Element access: these force lazy items
  const value_type& at(int64_t index) const { return unlazy(stored_at_("lazy_list::at", index)); }
  const value_type& operator[](int64_t index) const {
    return unlazy(stored_at_("lazy_list::operator[]", index));
  }
  const value_type& front() const { return unlazy(stored_at_("lazy_list::front", 0)); }
  const value_type& back() const { return unlazy(stored_at_("lazy_list::back", -1)); }
  //@}

  //@{ Element access: these do not force
  const stored_type& get_lazy(int64_t index) const {
    return stored_at_("lazy_list::get_lazy", index);
  }

  /**
   * True if the item at `index` is a lazy, whether or not it has been evaluated
   */
  bool is_lazy(int64_t index) const {
    return std::holds_alternative<lazy_type>(stored_at_("lazy_list::is_lazy", index));
  }

  /**
   * True if the item at `index` can be returned without evaluating anything
   */
  bool is_ready(int64_t index) const {
    const auto* cell = std::get_if<lazy_type>(&stored_at_("lazy_list::is_ready", index));
    return cell == nullptr || cell->is_ready();
  }
  //@}

  /**
   * Evaluates every lazy item
   */
  const lazy_list& ready_all() const {
    for (const auto& stored : list_)
      unlazy(stored);
    return *this;
  }

  /**
   * The underlying list, with lazy items left as they are
   */
  const list_type& to_list() const { return list_; }

  //@{ Modifiers: `value` may be a `value_type` or a `lazy_type`
  void clear() { list_.clear(); }

  template <typename V> void set(int64_t index, V&& value) {
    list_.set(index, stored_type{std::forward<V>(value)});
  }
  template <typename V> void push_back(V&& value) {
    list_.push_back(stored_type{std::forward<V>(value)});
  }
  template <typename V> void push_front(V&& value) {
    list_.push_front(stored_type{std::forward<V>(value)});
  }
  template <typename V> void insert(int64_t index, V&& value) {
    list_.insert(index, stored_type{std::forward<V>(value)});
  }

  void pop_back() { list_.pop_back(); }
  void pop_front() { list_.pop_front(); }
  void erase(int64_t index) { list_.erase(index); }

  void swap(lazy_list& other) noexcept { list_.swap(other.list_); }
  //@}

  /**
   * Batch edits that keep items lazy until they are read
   */
  transient_type transient() const { return transient_type{*this}; }

  //@{ Observers
  template <typename ValueHash = detail::unlazy_hash<value_type>> std::size_t hash_code() const {
    return list_.template hash_code<ValueHash>();
  }
  //@}

  //@{ Friends
  friend bool operator==(const lazy_list& lhs, const lazy_list& rhs) {
    if (lhs.size() != rhs.size())
      return false;
    return std::equal(lhs.begin(), lhs.end(), rhs.begin());
  }

  friend bool operator!=(const lazy_list& lhs, const lazy_list& rhs) { return !(lhs == rhs); }

  friend bool operator<(const lazy_list& lhs, const lazy_list& rhs) {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
  }

  friend void swap(lazy_list& lhs, lazy_list& rhs) noexcept { lhs.swap(rhs); }
  //@}
};

// ----------------------------------------------------------------------------- transient_lazy_list

/**
 * Batch edits of a `lazy_list`. Reads force lazy items, as they do on the list;
 * edits store items as given. `persistent()` publishes a `lazy_list` and closes
 * the session.
 */
template <typename ValueType, bool IsThreadSafe = true> class transient_lazy_list {
private:
  using persistent_type = lazy_list<ValueType, IsThreadSafe>;
  using session_type = typename persistent_type::list_type::transient_type;
  session_type session_;

public:
  using value_type = ValueType;
  using lazy_type = typename persistent_type::lazy_type;
  using stored_type = typename persistent_type::stored_type;
  using size_type = std::size_t;

private:
  const stored_type& stored_at_(const char* what, int64_t index) const {
    return session_[detail::resolve_list_index(what, index, size())];
  }

public:
  transient_lazy_list() : transient_lazy_list(persistent_type{}) {}
  explicit transient_lazy_list(const persistent_type& origin)
      : session_{origin.to_list().transient()} {}

  //@{ Reads
  bool empty() const { return session_.empty(); }
  std::size_t size() const { return session_.size(); }
  bool is_frozen() const noexcept { return session_.is_frozen(); }

  const value_type& at(int64_t index) const {
    return unlazy(stored_at_("transient_lazy_list::at", index));
  }
  const value_type& operator[](int64_t index) const {
    return unlazy(stored_at_("transient_lazy_list::operator[]", index));
  }
  const stored_type& get_lazy(int64_t index) const {
    return stored_at_("transient_lazy_list::get_lazy", index);
  }
  //@}

  //@{ Edits
  template <typename V> void set(int64_t index, V&& value) {
    session_.set(index, stored_type{std::forward<V>(value)});
  }
  template <typename V> void push_back(V&& value) {
    session_.push_back(stored_type{std::forward<V>(value)});
  }
  template <typename V> void push_front(V&& value) {
    session_.push_front(stored_type{std::forward<V>(value)});
  }
  template <typename V> void insert(int64_t index, V&& value) {
    session_.insert(index, stored_type{std::forward<V>(value)});
  }

  void pop_back() { session_.pop_back(); }
  void pop_front() { session_.pop_front(); }
  void erase(int64_t index) { session_.erase(index); }
  //@}

  /**
   * If nothing was edited, then the result shares the original list's root.
   */
  persistent_type persistent() { return persistent_type{session_.persistent()}; }
};

} // namespace pcollections

namespace std {
template <typename ValueType, bool IsThreadSafe>
struct hash<pcollections::lazy_list<ValueType, IsThreadSafe>> {
  std::size_t operator()(const pcollections::lazy_list<ValueType, IsThreadSafe>& list) const {
    return list.hash_code();
  }
};
} // namespace std
