
#pragma once

#include "_node-data.hpp"
#include "_base-node-ops.hpp"
#include "_node-ops.hpp"
#include "_iterator.hpp"

namespace pcollections::trie {

template <typename KeyType, typename ValueType, typename Hash, typename KeyEqual, bool IsMap,
          bool IsThreadSafe>
class basic_transient;

namespace detail {
struct trie_access;

/**
 * Selects the constructor of a collection that adopts an existing trie
 */
struct adopt_trie_tag {};
} // namespace detail

// -------------------------------------------------------------------------------------- basic_trie

/**
 * An immutable hash array mapped trie: a root node plus an item count.
 *
 * Copies share the root (one reference increment). Every edit is `const`, and
 * returns a new trie that shares all the subtrees the edit did not touch.
 */
template <typename KeyType,                           // The type used for Hash/KeyEqual
          typename ValueType,                         // Value Type for maps
          typename Hash = std::hash<KeyType>,         // Hash function for item
          typename KeyEqual = std::equal_to<KeyType>, // Equality comparision for Item
          bool IsMap = false,                         // True if map
          bool IsThreadSafe = true                    // True if reference counts are atomic
          >
class basic_trie {
private:
  using Ops = detail::NodeOps<KeyType, ValueType, Hash, KeyEqual, IsMap, IsThreadSafe>;
  using node_type = typename Ops::node_type;
  using node_ptr_type = typename Ops::node_ptr_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;
  using edit_result_type = typename Ops::EditResult;

public:
  //@{
  using key_type = KeyType;
  using value_type = ValueType;
  using item_type = typename Ops::item_type;
  using size_type = typename Ops::size_type;
  using hash_type = typename Ops::hash_type;
  using hasher = Hash;
  using key_equal = KeyEqual;
  using reference = const item_type&;
  using const_reference = const item_type&;
  using iterator = detail::Iterator<Ops>;
  using const_iterator = detail::Iterator<Ops>;
  using transient_type = basic_transient<KeyType, ValueType, Hash, KeyEqual, IsMap, IsThreadSafe>;
  static constexpr bool is_map = IsMap;
  static constexpr bool is_thread_safe = IsThreadSafe;
  //@}

  static_assert(IsMap || std::is_same<KeyType, ValueType>::value);

private:
  node_ptr_type root_{nullptr}; //!< Root of the tree could be branch of leaf
  std::size_t size_{0};         //!< Number of items reachable from root_

  friend transient_type;
  friend struct detail::trie_access;

  // Adopts the reference carried by `root`
  constexpr basic_trie(node_ptr_type root, std::size_t size) noexcept : root_{root}, size_{size} {}

  constexpr basic_trie(edit_result_type result, std::size_t size)
      : root_{result.root}, size_{size + result.size_delta} {}

  template <typename Item> basic_trie insert_(Item&& item, bool overwrite) const {
    if constexpr (std::is_same<std::decay_t<Item>, item_type>::value) {
      return basic_trie(Ops::do_insert(root_, std::forward<Item>(item), overwrite), size_);
    } else {
      return insert_(item_type(std::forward<Item>(item)), overwrite);
    }
  }

public:
  //@{ Construction/Destruction
  constexpr basic_trie() = default;
  constexpr basic_trie(const basic_trie& other) : root_{other.root_}, size_{other.size_} {
    Ops::add_ref(root_);
  }
  constexpr basic_trie(basic_trie&& other) noexcept { swap(other); }
  constexpr ~basic_trie() { Ops::dec_ref(root_); }

  template <typename InputIt> basic_trie(InputIt first, InputIt last) {
    auto session = transient();
    for (; first != last; ++first)
      session.insert(*first);
    *this = session.persistent();
  }
  basic_trie(std::initializer_list<item_type> ilist)
      : basic_trie(std::begin(ilist), std::end(ilist)) {}

  /**
   * The empty trie. It has no nodes, so sharing it costs nothing.
   */
  static const basic_trie& empty_trie() {
    static const basic_trie instance;
    return instance;
  }
  //@}

  //@{ Assignment
  constexpr basic_trie& operator=(const basic_trie& other) {
    basic_trie tmp(other);
    swap(tmp);
    return *this;
  }

  constexpr basic_trie& operator=(basic_trie&& other) noexcept {
    swap(other);
    return *this;
  }
  //@}

  //@{ Iterators
  constexpr const_iterator begin() const { return cbegin(); }
  constexpr const_iterator cbegin() const {
    return const_iterator{root_, typename const_iterator::MakeBeginTag{}};
  }

  constexpr const_iterator end() const { return cend(); }
  constexpr const_iterator cend() const {
    return const_iterator{root_, typename const_iterator::MakeEndTag{}};
  }
  //@}

  //@{ Capacity
  constexpr bool empty() const { return size() == 0; }
  constexpr std::size_t size() const { return size_; }
  static constexpr std::size_t max_size() { return std::numeric_limits<std::size_t>::max(); }
  //@}

  //@{ Lookup
  constexpr const item_type* find(const key_type& key) const { return Ops::find(root_, key); }

  /**
   * @return The value stored at `key` (the key itself for sets), or nullptr
   */
  constexpr const value_type* get(const key_type& key) const {
    auto* item = find(key);
    if constexpr (IsMap) {
      return item != nullptr ? &item->second : nullptr;
    } else {
      return item;
    }
  }

  constexpr bool contains(const key_type& key) const { return find(key) != nullptr; }
  constexpr std::size_t count(const key_type& key) const { return contains(key); }
  //@}

  //@{ Edits
  /**
   * Inserts `item`, replacing the value of a map item with the same key
   */
  template <typename Item> basic_trie insert(Item&& item) const {
    return insert_(std::forward<Item>(item), true);
  }

  template <typename K, typename V> basic_trie insert(K&& key, V&& value) const {
    static_assert(IsMap);
    return insert(item_type(std::forward<K>(key), std::forward<V>(value)));
  }

  /**
   * Inserts `item` only if its key is absent; otherwise returns a trie with this root
   */
  template <typename Item> basic_trie try_insert(Item&& item) const {
    return insert_(std::forward<Item>(item), false);
  }

  basic_trie remove(const key_type& key) const {
    return basic_trie(Ops::erase(root_, key), size_);
  }

  /**
   * Sets the value at `key` to `fn(current)`, where `current` is a
   * `const value_type*` that is null when `key` is absent.
   */
  template <typename Function> basic_trie update(const key_type& key, Function&& fn) const {
    static_assert(IsMap);
    return basic_trie(Ops::update(root_, key, std::forward<Function>(fn)), size_);
  }

  /**
   * @return A trie without the items whose key satisfies `predicate`
   */
  template <typename Predicate> basic_trie erase_if(Predicate predicate) const {
    auto session = transient();
    for (const auto& item : *this) {
      if (predicate(Ops::key_of(item)))
        session.erase(Ops::key_of(item));
    }
    return session.persistent();
  }

  transient_type transient() const { return transient_type{*this}; }

  constexpr void swap(basic_trie& other) noexcept { // Should be able to swap onto itself
    std::swap(root_, other.root_);
    std::swap(size_, other.size_);
  }
  //@}

  //@{ Observers
  static constexpr hasher hash_function() { return hasher{}; }
  static constexpr key_equal key_eq() { return key_equal{}; }

  /**
   * Independent of iteration order, so equal tries have equal hash codes.
   * Map values are hashed with `ValueHash`.
   */
  template <typename ValueHash = std::hash<value_type>> std::size_t hash_code() const {
    std::size_t result = detail::mix_hash(size_);
    for (const auto& item : *this) {
      auto entry_hash = Ops::hash_item(item);
      if constexpr (IsMap)
        entry_hash = detail::combine_hash(entry_hash, ValueHash{}(item.second));
      result += detail::mix_hash(entry_hash);
    }
    return result;
  }
  //@}

  //@{ Friends
  friend bool operator==(const basic_trie& lhs, const basic_trie& rhs) {
    if (lhs.size() != rhs.size())
      return false;

    if (lhs.root_ == rhs.root_)
      return true;

    for (const auto& item : lhs) {
      const auto* other = rhs.find(Ops::key_of(item));
      if (other == nullptr)
        return false;
      if constexpr (IsMap) {
        if (!(other->second == item.second))
          return false;
      }
    }

    return true;
  }

  friend bool operator!=(const basic_trie& lhs, const basic_trie& rhs) { return !(lhs == rhs); }

  friend constexpr void swap(basic_trie& lhs, basic_trie& rhs) noexcept { lhs.swap(rhs); }
  //@}
};

namespace detail {
/**
 * Exposes the nodes under a trie, transient, or collection to instrumentation
 * (tests, benchmarks)
 */
struct trie_access {
  template <typename T> static auto root(const T& trie_or_transient) {
    return trie_or_transient.root_;
  }

  template <typename Collection> static const auto& trie(const Collection& collection) {
    return collection.trie_;
  }
};
} // namespace detail

} // namespace pcollections::trie
