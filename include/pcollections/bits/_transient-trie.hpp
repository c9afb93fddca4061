
#pragma once

#include "_base-trie.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>

namespace pcollections {

/**
 * Thrown on any use of a transient session after it has been frozen (or moved from)
 */
class frozen_transient_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace pcollections

namespace pcollections::trie {

// --------------------------------------------------------------------------------- basic_transient

/**
 * A batch-editing session over a snapshot of a `basic_trie`.
 *
 * Nodes the session owns outright are edited in place. Shared nodes are copied
 * the first time an edit passes through them, so a run of edits copies each
 * path at most once, and the snapshot (and every other trie) is never changed.
 * `persistent()` hands the tree over to a new trie and closes the session.
 *
 * Sessions are move-only, and must not be used from more than one thread at a time.
 */
template <typename KeyType, typename ValueType, typename Hash, typename KeyEqual, bool IsMap,
          bool IsThreadSafe>
class basic_transient {
private:
  using Ops = detail::NodeOps<KeyType, ValueType, Hash, KeyEqual, IsMap, IsThreadSafe>;
  using node_ptr_type = typename Ops::node_ptr_type;

public:
  using trie_type = basic_trie<KeyType, ValueType, Hash, KeyEqual, IsMap, IsThreadSafe>;
  using key_type = typename trie_type::key_type;
  using value_type = typename trie_type::value_type;
  using item_type = typename trie_type::item_type;
  using size_type = typename trie_type::size_type;

private:
  node_ptr_type root_{nullptr}; //!< One reference, owned by the session
  std::size_t size_{0};
  bool frozen_{false};

  friend struct detail::trie_access;

  void check_open_(std::string_view operation) const {
    if (frozen_)
      throw frozen_transient_error{
          fmt::format("transient session is closed: cannot call '{}' after freeze", operation)};
  }

  template <typename Item> bool insert_(Item&& item, bool overwrite) {
    if constexpr (std::is_same<std::decay_t<Item>, item_type>::value) {
      const auto delta = Ops::transient_insert(root_, std::forward<Item>(item), overwrite);
      size_ += delta;
      return delta > 0;
    } else {
      return insert_(item_type(std::forward<Item>(item)), overwrite);
    }
  }

public:
  //@{ Construction/Destruction
  explicit basic_transient(const trie_type& base) : root_{base.root_}, size_{base.size_} {
    Ops::add_ref(root_);
  }
  basic_transient(const basic_transient&) = delete;
  basic_transient(basic_transient&& other) noexcept
      : root_{other.root_}, size_{other.size_}, frozen_{other.frozen_} {
    other.root_ = nullptr;
    other.size_ = 0;
    other.frozen_ = true;
  }
  ~basic_transient() { Ops::dec_ref(root_); }

  basic_transient& operator=(const basic_transient&) = delete;
  basic_transient& operator=(basic_transient&& other) noexcept {
    if (this != &other) {
      Ops::dec_ref(root_);
      root_ = std::exchange(other.root_, nullptr);
      size_ = std::exchange(other.size_, 0);
      frozen_ = std::exchange(other.frozen_, true);
    }
    return *this;
  }
  //@}

  //@{ Reads
  const item_type* find(const key_type& key) const {
    check_open_("find");
    return Ops::find(root_, key);
  }

  const value_type* get(const key_type& key) const {
    auto* item = find(key);
    if constexpr (IsMap) {
      return item != nullptr ? &item->second : nullptr;
    } else {
      return item;
    }
  }

  bool contains(const key_type& key) const { return find(key) != nullptr; }
  std::size_t count(const key_type& key) const { return contains(key); }

  std::size_t size() const {
    check_open_("size");
    return size_;
  }
  bool empty() const { return size() == 0; }
  bool is_frozen() const noexcept { return frozen_; }
  //@}

  //@{ Edits
  /**
   * Inserts `item` if its key is absent.
   * @return true if inserted
   */
  template <typename Item> bool insert(Item&& item) {
    check_open_("insert");
    return insert_(std::forward<Item>(item), false);
  }

  /**
   * Inserts `item`, replacing any item with the same key.
   * @return true if the key was absent
   */
  template <typename Item> bool insert_or_assign(Item&& item) {
    check_open_("insert_or_assign");
    return insert_(std::forward<Item>(item), true);
  }

  template <typename K, typename V> bool set(K&& key, V&& value) {
    static_assert(IsMap);
    return insert_or_assign(item_type(std::forward<K>(key), std::forward<V>(value)));
  }

  /**
   * @return The number of items removed (0 or 1)
   */
  size_type erase(const key_type& key) {
    check_open_("erase");
    const auto delta = Ops::transient_erase(root_, key);
    size_ += delta;
    return static_cast<size_type>(-delta);
  }

  template <typename Function> void update(const key_type& key, Function&& fn) {
    static_assert(IsMap);
    check_open_("update");
    size_ += Ops::transient_update(root_, key, std::forward<Function>(fn));
  }
  //@}

  //@{ Publishing
  /**
   * Closes the session, and returns the edited trie
   */
  trie_type persistent() {
    check_open_("persistent");
    frozen_ = true;
    trie_type result(root_, size_); // adopts the session's reference
    root_ = nullptr;
    size_ = 0;
    return result;
  }

  trie_type freeze() { return persistent(); }
  //@}
};

} // namespace pcollections::trie
