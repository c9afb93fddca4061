
#pragma once

#include "bits/trie-base.hpp"
#include "bits/_insertion-order.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <vector>

namespace pcollections {

template <typename ItemType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class transient_set;

// ---------------------------------------------------------------------------------- persistent_set

/**
 * An immutable set. Copies are cheap, and modifying a copy never affects the original.
 *
 * Iteration visits items in the order they were first inserted. Equality and
 * hashing ignore that order.
 */
template <typename ItemType,                           // Type of item to store
          typename Hash = std::hash<ItemType>,         // Hash function for item
          typename KeyEqual = std::equal_to<ItemType>, // Equality comparision for Item
          bool IsThreadSafe = true                     // True if Set is threadsafe
          >
class persistent_set {
private:
  using trie_type = trie::basic_trie<ItemType, ItemType, Hash, KeyEqual, false, IsThreadSafe>;
  using order_type = detail::insertion_order<ItemType, Hash, KeyEqual, IsThreadSafe>;
  trie_type trie_;
  order_type order_;

  friend class transient_set<ItemType, Hash, KeyEqual, IsThreadSafe>;
  friend struct trie::detail::trie_access;
  template <typename, typename> friend class detail::insertion_order_iterator;

  persistent_set(trie::detail::adopt_trie_tag, trie_type trie, order_type order)
      : trie_{std::move(trie)}, order_{std::move(order)} {}

  int64_t order_end_() const { return order_.end(); }
  const ItemType* item_at_(int64_t sequence) const {
    const auto* key = order_.key_at(sequence);
    return (key == nullptr) ? nullptr : trie_.find(*key);
  }

  template <typename Item> bool insert_(Item&& value) {
    if (contains(value))
      return false;
    auto order = order_.append(value);
    trie_ = trie_.insert(std::forward<Item>(value));
    order_ = std::move(order);
    return true;
  }

public:
  using key_type = typename trie_type::key_type;
  using item_type = typename trie_type::item_type;
  using value_type = item_type;
  using size_type = typename trie_type::size_type;
  using hash_type = typename trie_type::hash_type;
  using hasher = typename trie_type::hasher;
  using key_equal = typename trie_type::key_equal;
  using reference = typename trie_type::reference;
  using const_reference = typename trie_type::const_reference;
  using const_iterator = detail::insertion_order_iterator<persistent_set, item_type>;
  using iterator = const_iterator;
  using transient_type = transient_set<ItemType, Hash, KeyEqual, IsThreadSafe>;
  static constexpr bool is_thread_safe = IsThreadSafe;

  //@{ Construction/Destruction
  persistent_set() = default;
  persistent_set(const persistent_set& other) = default;
  persistent_set(persistent_set&& other) noexcept = default;
  ~persistent_set() = default;

  template <typename InputIt> persistent_set(InputIt first, InputIt last) { insert(first, last); }
  persistent_set(std::initializer_list<item_type> ilist)
      : persistent_set(std::begin(ilist), std::end(ilist)) {}

  template <typename Predicate> persistent_set erase_if(Predicate&& predicate) const {
    auto session = transient();
    for (const auto& item : trie_) {
      if (predicate(item))
        session.erase(item);
    }
    return session.persistent();
  }
  //@}

  //@{ Assignment
  persistent_set& operator=(const persistent_set& other) = default;
  persistent_set& operator=(persistent_set&& other) noexcept = default;
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

  bool insert(const item_type& value) { return insert_(value); }
  bool insert(item_type&& value) { return insert_(std::move(value)); }
  template <class InputIt> void insert(InputIt first, InputIt last) {
    auto session = transient();
    session.insert(first, last);
    *this = session.persistent();
  }
  void insert(std::initializer_list<item_type> ilist) {
    insert(std::begin(ilist), std::end(ilist));
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

  /**
   * Erases `key`, which must be present.
   * @throw std::out_of_range if `key` is absent
   */
  void remove(const key_type& key) {
    if (erase(key) == 0)
      throw std::out_of_range{fmt::format("{}: item not found", "persistent_set::remove")};
  }

  /**
   * Erases every item in [first, last) that is present.
   * @return The number of items erased
   */
  template <class InputIt> size_type erase(InputIt first, InputIt last) {
    auto session = transient();
    const auto count = session.erase(first, last);
    *this = session.persistent();
    return count;
  }

  /**
   * Erases every item in [first, last). Leaves the set unchanged if any is absent.
   * @throw std::out_of_range if an item is absent
   */
  template <class ForwardIt> void remove(ForwardIt first, ForwardIt last) {
    auto session = transient();
    session.remove(first, last);
    *this = session.persistent();
  }

  void swap(persistent_set& other) noexcept {
    trie_.swap(other.trie_);
    order_.swap(other.order_);
  }

  std::optional<item_type> extract(const key_type& key) {
    auto* item = find(key);
    if (item == nullptr)
      return {};
    auto result = std::optional<item_type>{*item}; // nodes are shared, so copy
    erase(key);
    return result;
  }

  persistent_set& operator|=(const persistent_set& other) { return *this = *this | other; }
  persistent_set& operator&=(const persistent_set& other) { return *this = *this & other; }
  persistent_set& operator-=(const persistent_set& other) { return *this = *this - other; }
  persistent_set& operator^=(const persistent_set& other) { return *this = *this ^ other; }
  //@}

  //@{ Lookup
  std::size_t count(const key_type& key) const { return trie_.count(key); }
  const item_type* find(const key_type& key) const { return trie_.find(key); }
  bool contains(const key_type& key) const { return trie_.contains(key); }
  //@}

  //@{ Set relations
  bool is_subset_of(const persistent_set& other) const {
    if (size() > other.size())
      return false;
    for (const auto& item : trie_) {
      if (!other.contains(item))
        return false;
    }
    return true;
  }

  bool is_superset_of(const persistent_set& other) const { return other.is_subset_of(*this); }

  bool is_disjoint(const persistent_set& other) const {
    const auto& smaller = (size() <= other.size()) ? *this : other;
    const auto& larger = (size() <= other.size()) ? other : *this;
    for (const auto& item : smaller.trie_) {
      if (larger.contains(item))
        return false;
    }
    return true;
  }
  //@}

  //@{ Observers
  static constexpr hasher hash_function() { return trie_type::hash_function(); }
  static constexpr key_equal key_eq() { return trie_type::key_eq(); }
  std::size_t hash_code() const { return trie_.hash_code(); }
  //@}

  transient_type transient() const { return transient_type{*this}; }

  //@{ Friends
  friend bool operator==(const persistent_set& lhs, const persistent_set& rhs) {
    return lhs.trie_ == rhs.trie_;
  }

  friend bool operator!=(const persistent_set& lhs, const persistent_set& rhs) {
    return lhs.trie_ != rhs.trie_;
  }

  /**
   * Subset ordering: a partial order, so `!(a < b)` does not imply `b <= a`
   */
  friend bool operator<=(const persistent_set& lhs, const persistent_set& rhs) {
    return lhs.is_subset_of(rhs);
  }
  friend bool operator<(const persistent_set& lhs, const persistent_set& rhs) {
    return lhs.size() < rhs.size() && lhs.is_subset_of(rhs);
  }
  friend bool operator>=(const persistent_set& lhs, const persistent_set& rhs) {
    return rhs <= lhs;
  }
  friend bool operator>(const persistent_set& lhs, const persistent_set& rhs) { return rhs < lhs; }

  /**
   * Items of `lhs`, then the items of `rhs` that `lhs` lacks
   */
  friend persistent_set operator|(const persistent_set& lhs, const persistent_set& rhs) {
    auto session = lhs.transient();
    session |= rhs;
    return session.persistent();
  }

  friend persistent_set operator&(const persistent_set& lhs, const persistent_set& rhs) {
    auto session = lhs.transient();
    session &= rhs;
    return session.persistent();
  }

  friend persistent_set operator-(const persistent_set& lhs, const persistent_set& rhs) {
    auto session = lhs.transient();
    session -= rhs;
    return session.persistent();
  }

  friend persistent_set operator^(const persistent_set& lhs, const persistent_set& rhs) {
    auto session = lhs.transient();
    session ^= rhs;
    return session.persistent();
  }

  friend void swap(persistent_set& lhs, persistent_set& rhs) noexcept { lhs.swap(rhs); }

  template <typename Predicate>
  friend size_type erase_if(persistent_set& set, Predicate&& predicate) {
    const auto size_0 = set.size();
    set = set.erase_if(std::forward<Predicate>(predicate));
    return size_0 - set.size();
  }
  //@}
};

// ----------------------------------------------------------------------------------- transient_set

/**
 * Batch edits of a `persistent_set`. Call `persistent()` to get the result; the
 * transient cannot be used afterwards.
 */
template <typename ItemType,                           //
          typename Hash = std::hash<ItemType>,         //
          typename KeyEqual = std::equal_to<ItemType>, //
          bool IsThreadSafe = true>
class transient_set {
private:
  using persistent_type = persistent_set<ItemType, Hash, KeyEqual, IsThreadSafe>;
  using session_type = typename persistent_type::trie_type::transient_type;
  using order_session_type = typename persistent_type::order_type::transient_type;
  session_type session_;
  order_session_type order_;

  template <typename, typename> friend class detail::insertion_order_iterator;

  int64_t order_end_() const { return order_.end(); }
  const ItemType* item_at_(int64_t sequence) const {
    const auto* key = order_.key_at(sequence);
    return (key == nullptr) ? nullptr : session_.find(*key);
  }

  template <typename Item> bool insert_(Item&& value) {
    if (contains(value))
      return false;
    order_.append(value);
    try {
      session_.insert(std::forward<Item>(value));
    } catch (...) {
      order_.drop_last(); // `value` may have been moved from
      throw;
    }
    return true;
  }

public:
  using key_type = typename persistent_type::key_type;
  using item_type = typename persistent_type::item_type;
  using size_type = typename persistent_type::size_type;
  using const_iterator = detail::insertion_order_iterator<transient_set, item_type>;
  using iterator = const_iterator;

  transient_set() : transient_set(persistent_type{}) {}
  explicit transient_set(const persistent_type& origin)
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
  const item_type* find(const key_type& key) const { return session_.find(key); }
  bool is_frozen() const noexcept { return session_.is_frozen(); }
  //@}

  //@{ Edits
  bool insert(const item_type& value) { return insert_(value); }
  bool insert(item_type&& value) { return insert_(std::move(value)); }
  template <class InputIt> void insert(InputIt first, InputIt last) {
    for (; first != last; ++first)
      insert(*first);
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

  template <class InputIt> size_type erase(InputIt first, InputIt last) {
    size_type count = 0;
    for (; first != last; ++first)
      count += erase(*first);
    return count;
  }

  /**
   * @throw std::out_of_range if `key` is absent
   */
  void remove(const key_type& key) {
    if (erase(key) == 0)
      throw std::out_of_range{fmt::format("{}: item not found", "transient_set::remove")};
  }

  /**
   * Erases every item in [first, last). Nothing is erased if any is absent.
   * @throw std::out_of_range if an item is absent
   */
  template <class ForwardIt> void remove(ForwardIt first, ForwardIt last) {
    for (auto ii = first; ii != last; ++ii) {
      if (!contains(*ii))
        throw std::out_of_range{fmt::format("{}: item not found", "transient_set::remove")};
    }
    erase(first, last);
  }

  transient_set& operator|=(const persistent_type& other) {
    insert(other.begin(), other.end());
    return *this;
  }

  transient_set& operator&=(const persistent_type& other) {
    std::vector<item_type> missing;
    for (const auto& item : *this) {
      if (!other.contains(item))
        missing.push_back(item);
    }
    erase(missing.begin(), missing.end());
    return *this;
  }

  transient_set& operator-=(const persistent_type& other) {
    if (other.size() <= size()) {
      erase(other.begin(), other.end());
    } else {
      std::vector<item_type> shared;
      for (const auto& item : *this) {
        if (other.contains(item))
          shared.push_back(item);
      }
      erase(shared.begin(), shared.end());
    }
    return *this;
  }

  transient_set& operator^=(const persistent_type& other) {
    for (const auto& item : other) {
      if (erase(item) == 0)
        insert(item);
    }
    return *this;
  }
  //@}

  /**
   * If nothing was edited, then the result shares the original set's root.
   */
  persistent_type persistent() {
    auto trie = session_.persistent();
    return persistent_type(trie::detail::adopt_trie_tag{}, std::move(trie), order_.persistent());
  }
};

} // namespace pcollections

namespace std {
template <typename ItemType, typename Hash, typename KeyEqual, bool IsThreadSafe>
struct hash<pcollections::persistent_set<ItemType, Hash, KeyEqual, IsThreadSafe>> {
  std::size_t operator()(
      const pcollections::persistent_set<ItemType, Hash, KeyEqual, IsThreadSafe>& set) const {
    return set.hash_code();
  }
};
} // namespace std
