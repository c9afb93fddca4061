
#pragma once

#include "bits/trie-base.hpp"
#include "bits/_insertion-order.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace pcollections {

template <typename KeyType, typename ValueType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class transient_map;

// ---------------------------------------------------------------------------------- persistent_map

/**
 * An immutable map. Copies are cheap, and modifying a copy never affects the original.
 *
 * Iteration visits keys in the order they were first inserted; assigning to an
 * existing key keeps its place. Equality and hashing ignore that order.
 */
template <typename KeyType,                           //
          typename ValueType,                         //
          typename Hash = std::hash<KeyType>,         // Hash function for item
          typename KeyEqual = std::equal_to<KeyType>, // Equality comparision for Item
          bool IsThreadSafe = true                    // True if Set is threadsafe
          >
class persistent_map {
private:
  using trie_type = trie::basic_trie<KeyType, ValueType, Hash, KeyEqual, true, IsThreadSafe>;
  using order_type = detail::insertion_order<KeyType, Hash, KeyEqual, IsThreadSafe>;
  trie_type trie_;
  order_type order_;

  friend class transient_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>;
  friend struct trie::detail::trie_access;
  template <typename, typename> friend class detail::insertion_order_iterator;

  persistent_map(trie::detail::adopt_trie_tag, trie_type trie, order_type order)
      : trie_{std::move(trie)}, order_{std::move(order)} {}

  int64_t order_end_() const { return order_.end(); }
  const typename trie_type::item_type* item_at_(int64_t sequence) const {
    const auto* key = order_.key_at(sequence);
    return (key == nullptr) ? nullptr : trie_.find(*key);
  }

  // Applies `edit` to the trie, numbering `key` first if it is new
  template <typename Edit> bool edit_(const KeyType& key, Edit&& edit) {
    if (contains(key)) {
      trie_ = edit();
      return false;
    }
    auto order = order_.append(key);
    trie_ = edit();
    order_ = std::move(order);
    return true;
  }

public:
  using key_type = typename trie_type::key_type;
  using value_type = typename trie_type::value_type;
  using mapped_type = value_type;
  using item_type = typename trie_type::item_type;
  using size_type = typename trie_type::size_type;
  using hash_type = typename trie_type::hash_type;
  using hasher = typename trie_type::hasher;
  using key_equal = typename trie_type::key_equal;
  using reference = typename trie_type::reference;
  using const_reference = typename trie_type::const_reference;
  using const_iterator = detail::insertion_order_iterator<persistent_map, item_type>;
  using iterator = const_iterator;
  using transient_type = transient_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>;
  static constexpr bool is_thread_safe = IsThreadSafe;

  //@{ Construction/Destruction
  persistent_map() = default;
  persistent_map(const persistent_map& other) = default;
  persistent_map(persistent_map&& other) noexcept = default;
  ~persistent_map() = default;

  template <typename InputIt> persistent_map(InputIt first, InputIt last) { insert(first, last); }
  persistent_map(std::initializer_list<item_type> ilist)
      : persistent_map(std::begin(ilist), std::end(ilist)) {}

  /**
   * @return A copy without the items whose key satisfies `predicate`
   */
  template <typename Predicate> persistent_map erase_if(Predicate&& predicate) const {
    auto session = transient();
    for (const auto& item : trie_) {
      if (predicate(item.first))
        session.erase(item.first);
    }
    return session.persistent();
  }
  //@}

  //@{ Assignment
  persistent_map& operator=(const persistent_map& other) = default;
  persistent_map& operator=(persistent_map&& other) noexcept = default;
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{this, 0}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{this, order_end_()}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return trie_.empty(); }
  std::size_t size() const { return trie_.size(); }
  static constexpr std::size_t max_size() { return trie_type::max_size(); }
  //@}

  //@{ Modifiers
  void clear() {
    trie_ = trie_type::empty_trie();
    order_ = order_type{};
  }

  /**
   * Inserts `value` if its key is absent.
   * @return true if inserted
   */
  bool insert(const item_type& value) {
    if (contains(value.first))
      return false;
    return edit_(value.first, [&] { return trie_.insert(value); });
  }
  bool insert(item_type&& value) {
    if (contains(value.first))
      return false;
    return edit_(value.first, [&] { return trie_.insert(std::move(value)); });
  }
  template <class InputIt> void insert(InputIt first, InputIt last) {
    auto session = transient();
    for (; first != last; ++first)
      session.insert(*first);
    *this = session.persistent();
  }
  void insert(std::initializer_list<item_type> ilist) {
    insert(std::begin(ilist), std::end(ilist));
  }

  /**
   * Sets the value at `key`, replacing any existing value.
   * @return true if `key` was absent
   */
  template <typename K, typename V> bool insert_or_assign(K&& key, V&& value) {
    item_type item(std::forward<K>(key), std::forward<V>(value));
    return edit_(item.first, [&] { return trie_.insert(std::move(item)); });
  }

  /**
   * Sets the value at `key` to `fn(current)`, where `current` is a
   * `const value_type*`, null if `key` is absent.
   */
  template <typename Function> void update(const key_type& key, Function&& fn) {
    edit_(key, [&] { return trie_.update(key, std::forward<Function>(fn)); });
  }

  template <class... Args> bool emplace(Args&&... args) {
    return insert(item_type(std::forward<Args>(args)...));
  }

  size_type erase(const key_type& key) {
    if (!contains(key))
      return 0;
    auto order = order_.remove(key);
    trie_ = trie_.remove(key);
    order_ = std::move(order);
    return 1;
  }

  void swap(persistent_map& other) noexcept {
    trie_.swap(other.trie_);
    order_.swap(other.order_);
  }

  std::optional<item_type> extract(const key_type& key) {
    auto* item = trie_.find(key);
    if (item == nullptr)
      return {};
    auto result = std::optional<item_type>{*item}; // nodes are shared, so copy
    erase(key);
    return result;
  }
  //@}

  //@{ Lookup
  const value_type* at(const key_type& key) const { return find(key); }
  const value_type& operator[](const key_type& key) const {
    auto* value = at(key);
    if (value == nullptr)
      throw std::out_of_range{fmt::format("{}: key not found", "persistent_map::operator[]")};
    return *value;
  }

  /**
   * @return A copy of the value at `key`, or `default_value` if absent
   */
  value_type get(const key_type& key, value_type default_value) const {
    auto* value = at(key);
    return (value == nullptr) ? std::move(default_value) : *value;
  }

  std::size_t count(const key_type& key) const { return trie_.count(key); }
  const value_type* find(const key_type& key) const { return trie_.get(key); }
  bool contains(const key_type& key) const { return trie_.contains(key); }
  //@}

  //@{ Observers
  static constexpr hasher hash_function() { return trie_type::hash_function(); }
  static constexpr key_equal key_eq() { return trie_type::key_eq(); }

  template <typename ValueHash = std::hash<value_type>> std::size_t hash_code() const {
    return trie_.template hash_code<ValueHash>();
  }
  //@}

  transient_type transient() const { return transient_type{*this}; }

  //@{ Friends
  friend bool operator==(const persistent_map& lhs, const persistent_map& rhs) {
    return lhs.trie_ == rhs.trie_;
  }

  friend bool operator!=(const persistent_map& lhs, const persistent_map& rhs) {
    return lhs.trie_ != rhs.trie_;
  }

  friend void swap(persistent_map& lhs, persistent_map& rhs) noexcept { lhs.swap(rhs); }

  template <typename Predicate>
  friend size_type erase_if(persistent_map& map, Predicate&& predicate) {
    const auto size_0 = map.size();
    map = map.erase_if(std::forward<Predicate>(predicate));
    return size_0 - map.size();
  }
  //@}
};

// ----------------------------------------------------------------------------------- transient_map

/**
 * Batch edits of a `persistent_map`. Call `persistent()` to get the result; the
 * transient cannot be used afterwards.
 */
template <typename KeyType,                           //
          typename ValueType,                         //
          typename Hash = std::hash<KeyType>,         //
          typename KeyEqual = std::equal_to<KeyType>, //
          bool IsThreadSafe = true>
class transient_map {
private:
  using persistent_type = persistent_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>;
  using session_type = typename persistent_type::trie_type::transient_type;
  using order_session_type = typename persistent_type::order_type::transient_type;
  session_type session_;
  order_session_type order_;

  template <typename, typename> friend class detail::insertion_order_iterator;

  int64_t order_end_() const { return order_.end(); }
  const typename persistent_type::item_type* item_at_(int64_t sequence) const {
    const auto* key = order_.key_at(sequence);
    return (key == nullptr) ? nullptr : session_.find(*key);
  }

  template <typename Item> bool insert_(Item&& item, bool overwrite) {
    if (session_.contains(item.first)) {
      if (overwrite)
        session_.insert_or_assign(std::forward<Item>(item));
      return false;
    }
    order_.append(item.first);
    try {
      session_.insert(std::forward<Item>(item));
    } catch (...) {
      order_.drop_last(); // `item` may have been moved from
      throw;
    }
    return true;
  }

public:
  using key_type = typename persistent_type::key_type;
  using value_type = typename persistent_type::value_type;
  using item_type = typename persistent_type::item_type;
  using size_type = typename persistent_type::size_type;
  using const_iterator = detail::insertion_order_iterator<transient_map, item_type>;
  using iterator = const_iterator;

  transient_map() : transient_map(persistent_type{}) {}
  explicit transient_map(const persistent_type& origin)
      : session_{origin.trie_.transient()}, order_{origin.order_.transient()} {}

  //@{ Iterators: invalidated by edits
  const_iterator begin() const { return const_iterator{this, 0}; }
  const_iterator end() const { return const_iterator{this, order_end_()}; }
  //@}

  //@{ Reads
  bool empty() const { return session_.empty(); }
  std::size_t size() const { return session_.size(); }
  bool contains(const key_type& key) const { return session_.contains(key); }
  std::size_t count(const key_type& key) const { return session_.count(key); }
  const value_type* find(const key_type& key) const { return session_.get(key); }
  const value_type* at(const key_type& key) const { return session_.get(key); }
  const value_type& operator[](const key_type& key) const {
    auto* value = at(key);
    if (value == nullptr)
      throw std::out_of_range{fmt::format("{}: key not found", "transient_map::operator[]")};
    return *value;
  }
  bool is_frozen() const noexcept { return session_.is_frozen(); }
  //@}

  //@{ Edits
  bool insert(const item_type& value) { return insert_(value, false); }
  bool insert(item_type&& value) { return insert_(std::move(value), false); }

  /**
   * Inserts `value`, replacing the value of an item with the same key.
   * @return true if the key was absent
   */
  bool insert_or_assign(const item_type& value) { return insert_(value, true); }
  bool insert_or_assign(item_type&& value) { return insert_(std::move(value), true); }

  /**
   * @return true if `key` was absent
   */
  template <typename K, typename V> bool insert_or_assign(K&& key, V&& value) {
    return insert_(item_type(std::forward<K>(key), std::forward<V>(value)), true);
  }

  template <typename K, typename V> bool set(K&& key, V&& value) {
    return insert_or_assign(std::forward<K>(key), std::forward<V>(value));
  }

  template <typename Function> void update(const key_type& key, Function&& fn) {
    if (session_.contains(key)) {
      session_.update(key, std::forward<Function>(fn));
      return;
    }
    order_.append(key);
    try {
      session_.update(key, std::forward<Function>(fn));
    } catch (...) {
      order_.drop_last();
      throw;
    }
  }

  template <class... Args> bool emplace(Args&&... args) {
    return insert(item_type(std::forward<Args>(args)...));
  }

  size_type erase(const key_type& key) {
    const auto erased = session_.erase(key);
    if (erased > 0)
      order_.remove(key);
    return erased;
  }
  //@}

  /**
   * If nothing was edited, then the result shares the original map's root.
   */
  persistent_type persistent() {
    auto trie = session_.persistent();
    return persistent_type(trie::detail::adopt_trie_tag{}, std::move(trie), order_.persistent());
  }
};

} // namespace pcollections

namespace std {
template <typename KeyType, typename ValueType, typename Hash, typename KeyEqual, bool IsThreadSafe>
struct hash<pcollections::persistent_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>> {
  std::size_t operator()(
      const pcollections::persistent_map<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>& map)
      const {
    return map.hash_code();
  }
};
} // namespace std
