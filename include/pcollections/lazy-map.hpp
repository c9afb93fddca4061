#pragma once

#include "lazy.hpp"
#include "persistent-map.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <variant>

namespace pcollections {

template <typename KeyType, typename ValueType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class transient_lazy_map;

namespace detail {

/**
 * Iterates (key, forced value) pairs over an iterator of (key, stored value) items
 */
template <typename BaseIterator, typename KeyType, typename ValueType> class forcing_map_iterator {
private:
  BaseIterator position_;

public:
  using iterator_category = std::bidirectional_iterator_tag;
  using value_type = std::pair<const KeyType&, const ValueType&>;
  using difference_type = std::ptrdiff_t;
  using reference = value_type;
  using pointer = void;

  forcing_map_iterator() = default;
  explicit forcing_map_iterator(BaseIterator position) : position_{position} {}

  reference operator*() const {
    const auto& item = *position_;
    return reference{item.first, unlazy(item.second)};
  }

  forcing_map_iterator& operator++() {
    ++position_;
    return *this;
  }
  forcing_map_iterator& operator--() {
    --position_;
    return *this;
  }
  forcing_map_iterator operator++(int) {
    auto tmp = *this;
    ++position_;
    return tmp;
  }
  forcing_map_iterator operator--(int) {
    auto tmp = *this;
    --position_;
    return tmp;
  }

  bool operator==(const forcing_map_iterator& other) const { return position_ == other.position_; }
  bool operator!=(const forcing_map_iterator& other) const { return !(*this == other); }
};

} // namespace detail

// ---------------------------------------------------------------------------------------- lazy_map

/**
 * A persistent map whose values may be given lazily.
 *
 * Each key maps to either a plain `ValueType`, or a `lazy<ValueType>` that is
 * evaluated the first time the value is read. Lookups and iteration return the
 * forced value; `get_lazy` returns what is actually stored.
 *
 * The lazy cells are shared between copies of the map, so a value forced through
 * one copy is ready in all of them.
 */
template <typename KeyType,                           //
          typename ValueType,                         //
          typename Hash = std::hash<KeyType>,         //
          typename KeyEqual = std::equal_to<KeyType>, //
          bool IsThreadSafe = true>
class lazy_map {
public:
  using lazy_type = lazy<ValueType, IsThreadSafe>;
  using stored_type = std::variant<ValueType, lazy_type>;
  using map_type = persistent_map<KeyType, stored_type, Hash, KeyEqual, IsThreadSafe>;
  using transient_type = transient_lazy_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>;
  using key_type = KeyType;
  using value_type = ValueType;
  using mapped_type = ValueType;
  using size_type = std::size_t;
  using hasher = Hash;
  using key_equal = KeyEqual;
  using const_iterator =
      detail::forcing_map_iterator<typename map_type::const_iterator, KeyType, ValueType>;
  using iterator = const_iterator;
  static constexpr bool is_thread_safe = IsThreadSafe;

  /**
   * @return The value held by `stored`, evaluating it if it is lazy
   */
  static const value_type& force(const stored_type& stored) { return unlazy(stored); }

private:
  map_type map_;

  const stored_type& stored_at_(const key_type& key, const char* what) const {
    const auto* stored = map_.at(key);
    if (stored == nullptr)
      throw std::out_of_range{fmt::format("{}: key not found", what)};
    return *stored;
  }

public:
  //@{ Construction/Destruction
  lazy_map() = default;

  /**
   * Adopts a map of stored values, lazy or not
   */
  explicit lazy_map(map_type map) : map_{std::move(map)} {}

  lazy_map(std::initializer_list<typename map_type::item_type> ilist) : map_(ilist) {}
  //@}

  //@{ Iterators: in insertion order
  const_iterator begin() const { return const_iterator{map_.begin()}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{map_.end()}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return map_.empty(); }
  std::size_t size() const { return map_.size(); }
  //@}

  //@{ Lookup: these force lazy values
  const value_type& operator[](const key_type& key) const {
    return force(stored_at_(key, "lazy_map::operator[]"));
  }

  const value_type* at(const key_type& key) const {
    const auto* stored = map_.at(key);
    return (stored == nullptr) ? nullptr : &force(*stored);
  }

  value_type get(const key_type& key, value_type default_value) const {
    const auto* stored = map_.at(key);
    return (stored == nullptr) ? std::move(default_value) : force(*stored);
  }

  bool contains(const key_type& key) const { return map_.contains(key); }
  std::size_t count(const key_type& key) const { return map_.count(key); }
  //@}

  //@{ Lookup: these do not force
  /**
   * @return The stored value (possibly an unevaluated lazy), or nullptr
   */
  const stored_type* get_lazy(const key_type& key) const { return map_.at(key); }

  /**
   * True if `key` maps to a lazy, whether or not it has been evaluated
   */
  bool is_lazy(const key_type& key) const {
    return std::holds_alternative<lazy_type>(stored_at_(key, "lazy_map::is_lazy"));
  }

  /**
   * True if the value at `key` can be returned without evaluating anything
   */
  bool is_ready(const key_type& key) const {
    const auto& stored = stored_at_(key, "lazy_map::is_ready");
    const auto* cell = std::get_if<lazy_type>(&stored);
    return cell == nullptr || cell->is_ready();
  }
  //@}

  /**
   * Evaluates every lazy value
   */
  const lazy_map& ready_all() const {
    for (const auto& item : map_)
      force(item.second);
    return *this;
  }

  //@{ Modifiers
  void clear() { map_.clear(); }

  /**
   * Inserts if `key` is absent. `value` may be a `value_type` or a `lazy_type`.
   * @return true if inserted
   */
  template <typename K, typename V> bool insert(K&& key, V&& value) {
    return map_.emplace(std::forward<K>(key), stored_type{std::forward<V>(value)});
  }

  /**
   * @return true if `key` was absent
   */
  template <typename K, typename V> bool insert_or_assign(K&& key, V&& value) {
    return map_.insert_or_assign(std::forward<K>(key), stored_type{std::forward<V>(value)});
  }

  size_type erase(const key_type& key) { return map_.erase(key); }

  void swap(lazy_map& other) noexcept { map_.swap(other.map_); }
  //@}

  /**
   * The underlying map, with lazy values left as they are
   */
  const map_type& to_map() const { return map_; }

  /**
   * Batch edits that keep values lazy until they are read
   */
  transient_type transient() const { return transient_type{*this}; }

  //@{ Observers
  template <typename ValueHash = detail::unlazy_hash<value_type>> std::size_t hash_code() const {
    return map_.template hash_code<ValueHash>();
  }
  //@}

  //@{ Friends
  friend bool operator==(const lazy_map& lhs, const lazy_map& rhs) {
    if (lhs.size() != rhs.size())
      return false;
    for (const auto& item : lhs.map_) {
      const auto* other = rhs.map_.at(item.first);
      if (other == nullptr || !(force(*other) == force(item.second)))
        return false;
    }
    return true;
  }

  friend bool operator!=(const lazy_map& lhs, const lazy_map& rhs) { return !(lhs == rhs); }

  friend void swap(lazy_map& lhs, lazy_map& rhs) noexcept { lhs.swap(rhs); }
  //@}
};

// ------------------------------------------------------------------------------ transient_lazy_map

/**
 * Batch edits of a `lazy_map`. Reads force lazy values, as they do on the map;
 * edits store values as given. `persistent()` publishes a `lazy_map` and closes
 * the session.
 */
template <typename KeyType,                           //
          typename ValueType,                         //
          typename Hash = std::hash<KeyType>,         //
          typename KeyEqual = std::equal_to<KeyType>, //
          bool IsThreadSafe = true>
class transient_lazy_map {
private:
  using persistent_type = lazy_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>;
  using session_type = typename persistent_type::map_type::transient_type;
  session_type session_;

public:
  using key_type = KeyType;
  using value_type = ValueType;
  using lazy_type = typename persistent_type::lazy_type;
  using stored_type = typename persistent_type::stored_type;
  using size_type = std::size_t;
  using const_iterator =
      detail::forcing_map_iterator<typename session_type::const_iterator, KeyType, ValueType>;
  using iterator = const_iterator;

private:
  const stored_type& stored_at_(const key_type& key, const char* what) const {
    const auto* stored = session_.at(key);
    if (stored == nullptr)
      throw std::out_of_range{fmt::format("{}: key not found", what)};
    return *stored;
  }

public:
  transient_lazy_map() : transient_lazy_map(persistent_type{}) {}
  explicit transient_lazy_map(const persistent_type& origin)
      : session_{origin.to_map().transient()} {}

  //@{ Iterators: invalidated by edits
  const_iterator begin() const { return const_iterator{session_.begin()}; }
  const_iterator end() const { return const_iterator{session_.end()}; }
  //@}

  //@{ Reads: these force lazy values
  bool empty() const { return session_.empty(); }
  std::size_t size() const { return session_.size(); }
  bool contains(const key_type& key) const { return session_.contains(key); }
  std::size_t count(const key_type& key) const { return session_.count(key); }
  bool is_frozen() const noexcept { return session_.is_frozen(); }

  const value_type& operator[](const key_type& key) const {
    return unlazy(stored_at_(key, "transient_lazy_map::operator[]"));
  }

  const value_type* at(const key_type& key) const {
    const auto* stored = session_.at(key);
    return (stored == nullptr) ? nullptr : &unlazy(*stored);
  }

  value_type get(const key_type& key, value_type default_value) const {
    const auto* stored = session_.at(key);
    return (stored == nullptr) ? std::move(default_value) : unlazy(*stored);
  }
  //@}

  //@{ Reads: these do not force
  const stored_type* get_lazy(const key_type& key) const { return session_.at(key); }

  bool is_lazy(const key_type& key) const {
    return std::holds_alternative<lazy_type>(stored_at_(key, "transient_lazy_map::is_lazy"));
  }

  bool is_ready(const key_type& key) const {
    const auto& stored = stored_at_(key, "transient_lazy_map::is_ready");
    const auto* cell = std::get_if<lazy_type>(&stored);
    return cell == nullptr || cell->is_ready();
  }
  //@}

  //@{ Edits: `value` may be a `value_type`, a `lazy_type`, or a `stored_type`
  template <typename K, typename V> bool insert(K&& key, V&& value) {
    return session_.emplace(std::forward<K>(key), stored_type{std::forward<V>(value)});
  }

  /**
   * @return true if `key` was absent
   */
  template <typename K, typename V> bool insert_or_assign(K&& key, V&& value) {
    return session_.insert_or_assign(std::forward<K>(key), stored_type{std::forward<V>(value)});
  }

  template <typename K, typename V> bool set(K&& key, V&& value) {
    return insert_or_assign(std::forward<K>(key), std::forward<V>(value));
  }

  size_type erase(const key_type& key) { return session_.erase(key); }
  //@}

  /**
   * If nothing was edited, then the result shares the original map's root.
   */
  persistent_type persistent() { return persistent_type{session_.persistent()}; }
};

} // namespace pcollections

namespace std {
template <typename KeyType, typename ValueType, typename Hash, typename KeyEqual, bool IsThreadSafe>
struct hash<pcollections::lazy_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>> {
  std::size_t operator()(
      const pcollections::lazy_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>& map) const {
    return map.hash_code();
  }
};
} // namespace std
