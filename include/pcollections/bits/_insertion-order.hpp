#pragma once

#include "_base-trie.hpp"
#include "_transient-trie.hpp"

#include <cstdint>
#include <iterator>

namespace pcollections::detail {

/**
 * List positions and sequence numbers are their own hash, so neighbours share branches
 */
struct index_hasher {
  std::size_t operator()(int64_t index) const noexcept { return static_cast<std::size_t>(index); }
};

template <typename KeyType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class transient_insertion_order;

// --------------------------------------------------------------------------------- insertion_order

/**
 * The order in which the keys of a set or map were first inserted.
 *
 * Each new key takes the next sequence number, and `keys_` maps the numbers back
 * to keys, so walking the numbers upwards visits the keys in insertion order.
 * Assigning to an existing key keeps its number. Erasing leaves a gap; once the
 * gaps outnumber the keys, the numbers are reassigned densely from 0.
 */
template <typename KeyType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class insertion_order {
public:
  using sequence_trie_type = trie::basic_trie<KeyType, int64_t, Hash, KeyEqual, true, IsThreadSafe>;
  using key_trie_type =
      trie::basic_trie<int64_t, KeyType, index_hasher, std::equal_to<int64_t>, true, IsThreadSafe>;
  using transient_type = transient_insertion_order<KeyType, Hash, KeyEqual, IsThreadSafe>;

  static constexpr int64_t min_gaps_to_compact = 32;

private:
  sequence_trie_type sequences_;
  key_trie_type keys_;
  int64_t end_{0};

  friend transient_type;

  insertion_order(sequence_trie_type sequences, key_trie_type keys, int64_t end)
      : sequences_{std::move(sequences)}, keys_{std::move(keys)}, end_{end} {}

  bool is_sparse_() const {
    const auto gaps = end_ - static_cast<int64_t>(sequences_.size());
    return gaps >= min_gaps_to_compact && gaps > static_cast<int64_t>(sequences_.size());
  }

  insertion_order compacted_() const {
    auto sequences = sequence_trie_type::empty_trie().transient();
    auto keys = key_trie_type::empty_trie().transient();
    int64_t next = 0;
    for (int64_t i = 0; i < end_; ++i) {
      if (const auto* key = keys_.get(i)) {
        sequences.set(*key, next);
        keys.set(next, *key);
        ++next;
      }
    }
    return insertion_order{sequences.persistent(), keys.persistent(), next};
  }

public:
  insertion_order() = default;

  std::size_t size() const { return sequences_.size(); }

  /**
   * One past the highest sequence number in use
   */
  int64_t end() const { return end_; }

  /**
   * @return The key numbered `sequence`, or nullptr for a gap
   */
  const KeyType* key_at(int64_t sequence) const { return keys_.get(sequence); }
  const int64_t* sequence_of(const KeyType& key) const { return sequences_.get(key); }

  /**
   * @return A copy with `key` after every other key. `key` must be absent.
   */
  insertion_order append(const KeyType& key) const {
    return insertion_order{sequences_.insert(key, end_), keys_.insert(end_, key), end_ + 1};
  }

  /**
   * @return A copy without `key`, or this order if `key` is absent
   */
  insertion_order remove(const KeyType& key) const {
    const auto* sequence = sequences_.get(key);
    if (sequence == nullptr)
      return *this;
    insertion_order result{sequences_.remove(key), keys_.remove(*sequence), end_};
    return result.is_sparse_() ? result.compacted_() : result;
  }

  transient_type transient() const { return transient_type{*this}; }

  void swap(insertion_order& other) noexcept {
    sequences_.swap(other.sequences_);
    keys_.swap(other.keys_);
    std::swap(end_, other.end_);
  }
};

// ----------------------------------------------------------------------- transient_insertion_order

template <typename KeyType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class transient_insertion_order {
private:
  using persistent_type = insertion_order<KeyType, Hash, KeyEqual, IsThreadSafe>;
  using sequence_session_type = typename persistent_type::sequence_trie_type::transient_type;
  using key_session_type = typename persistent_type::key_trie_type::transient_type;

  sequence_session_type sequences_;
  key_session_type keys_;
  int64_t end_{0};

  bool is_sparse_() const {
    const auto gaps = end_ - static_cast<int64_t>(sequences_.size());
    return gaps >= persistent_type::min_gaps_to_compact &&
           gaps > static_cast<int64_t>(sequences_.size());
  }

  void compact_() {
    auto sequences = persistent_type::sequence_trie_type::empty_trie().transient();
    auto keys = persistent_type::key_trie_type::empty_trie().transient();
    int64_t next = 0;
    for (int64_t i = 0; i < end_; ++i) {
      if (const auto* key = keys_.get(i)) {
        sequences.set(*key, next);
        keys.set(next, *key);
        ++next;
      }
    }
    sequences_ = std::move(sequences);
    keys_ = std::move(keys);
    end_ = next;
  }

public:
  explicit transient_insertion_order(const persistent_type& origin)
      : sequences_{origin.sequences_.transient()}, keys_{origin.keys_.transient()},
        end_{origin.end_} {}

  std::size_t size() const { return sequences_.size(); }
  int64_t end() const { return end_; }
  const KeyType* key_at(int64_t sequence) const { return keys_.get(sequence); }
  const int64_t* sequence_of(const KeyType& key) const { return sequences_.get(key); }

  /**
   * Numbers `key` after every other key. `key` must be absent.
   */
  void append(const KeyType& key) {
    keys_.set(end_, key);
    try {
      sequences_.set(key, end_);
    } catch (...) {
      keys_.erase(end_);
      throw;
    }
    ++end_;
  }

  /**
   * Undoes the last `append`
   */
  void drop_last() {
    const auto sequence = end_ - 1;
    sequences_.erase(*keys_.get(sequence));
    keys_.erase(sequence);
    --end_;
  }

  void remove(const KeyType& key) {
    const auto* found = sequences_.get(key);
    if (found == nullptr)
      return;
    const auto sequence = *found;
    keys_.erase(sequence);
    sequences_.erase(key);
    if (is_sparse_())
      compact_();
  }

  persistent_type persistent() {
    auto sequences = sequences_.persistent();
    return persistent_type{std::move(sequences), keys_.persistent(), end_};
  }
};

// ------------------------------------------------------------------------ insertion_order_iterator

/**
 * Visits the items of a set or map in insertion order.
 *
 * `Collection` provides `order_end_()`, and `item_at_(sequence)`, which returns
 * nullptr for a gap. Editing the collection invalidates its iterators.
 */
template <typename Collection, typename Item> class insertion_order_iterator {
private:
  const Collection* collection_{nullptr};
  int64_t sequence_{0};
  const Item* item_{nullptr};

  void seek_forward_() {
    const auto end = collection_->order_end_();
    for (item_ = nullptr; sequence_ < end; ++sequence_) {
      item_ = collection_->item_at_(sequence_);
      if (item_ != nullptr)
        return;
    }
  }

public:
  using iterator_category = std::bidirectional_iterator_tag;
  using value_type = Item;
  using difference_type = std::ptrdiff_t;
  using reference = const Item&;
  using pointer = const Item*;

  insertion_order_iterator() = default;
  insertion_order_iterator(const Collection* collection, int64_t sequence)
      : collection_{collection}, sequence_{sequence} {
    seek_forward_();
  }

  reference operator*() const { return *item_; }
  pointer operator->() const { return item_; }

  insertion_order_iterator& operator++() {
    if (sequence_ < collection_->order_end_()) { // Moving beyond the end has no effect
      ++sequence_;
      seek_forward_();
    }
    return *this;
  }

  insertion_order_iterator& operator--() {
    while (sequence_ > 0) {
      --sequence_;
      item_ = collection_->item_at_(sequence_);
      if (item_ != nullptr)
        break;
    }
    return *this;
  }

  insertion_order_iterator operator++(int) {
    auto tmp = *this;
    ++*this;
    return tmp;
  }

  insertion_order_iterator operator--(int) {
    auto tmp = *this;
    --*this;
    return tmp;
  }

  bool operator==(const insertion_order_iterator& other) const {
    return collection_ == other.collection_ && sequence_ == other.sequence_;
  }
  bool operator!=(const insertion_order_iterator& other) const { return !(*this == other); }
};

} // namespace pcollections::detail
