
#pragma once

#include <atomic>
#include <cassert>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace pcollections {

// -------------------------------------------------------------------------------------------- lazy

/**
 * A value that is computed on first use, and then cached.
 *
 * `lazy<T>(fn, args...)` captures a callable and its arguments (by value). The
 * first `get()` calls `fn(args...)`, caches the result, and drops the callable
 * (along with the captured arguments). Later calls return the cached value.
 *
 * If the callable throws, then the exception propagates to the caller of
 * `get()`, nothing is cached, and the next `get()` calls it again.
 *
 * Copies of a lazy share one cell, so a value computed through one copy is seen
 * by all of them. A persistent collection holding a lazy never changes; only the
 * cell does.
 *
 * With `IsThreadSafe` (the default) evaluation happens at most once, even when
 * many threads call `get()` at the same time: one thread evaluates while the
 * others wait on a per-cell mutex. Otherwise there is no locking at all, and
 * concurrent first calls are undefined.
 *
 * The callable and its arguments need only be movable. A moved-from lazy has no
 * cell, and may only be assigned to or destroyed.
 *
 * Equality and hashing force evaluation. Lazies should be used as values, and
 * never as keys.
 */
template <typename T, bool IsThreadSafe = true> class lazy {
public:
  using value_type = T;
  static constexpr bool is_thread_safe = IsThreadSafe;

private:
  struct no_gate {};
  struct ready_tag {};

  struct thunk_base {
    virtual ~thunk_base() = default;
    virtual value_type operator()() = 0;
  };

  template <typename Function> struct thunk_of final : thunk_base {
    Function fn;
    explicit thunk_of(Function&& f) : fn{std::move(f)} {}
    value_type operator()() override { return fn(); }
  };

  struct cell {
    std::conditional_t<IsThreadSafe, std::atomic<bool>, bool> evaluated{false};
    std::conditional_t<IsThreadSafe, std::mutex, no_gate> gate;
    std::optional<value_type> value;
    std::unique_ptr<thunk_base> thunk; // move-only, unlike std::function
  };

  std::shared_ptr<cell> cell_;

  static void evaluate_(cell& c) {
    c.value.emplace((*c.thunk)()); // if this throws, the cell is unchanged
    c.thunk.reset();
    if constexpr (IsThreadSafe) {
      c.evaluated.store(true, std::memory_order_release);
    } else {
      c.evaluated = true;
    }
  }

  lazy(ready_tag, value_type value) : cell_{std::make_shared<cell>()} {
    cell_->value.emplace(std::move(value));
    cell_->evaluated = true;
  }

public:
  template <typename Function, typename... Args,
            typename = std::enable_if_t<!std::is_same<std::decay_t<Function>, lazy>::value &&
                                        std::is_invocable_r<value_type, std::decay_t<Function>&,
                                                            std::decay_t<Args>&...>::value>>
  explicit lazy(Function&& fn, Args&&... args) : cell_{std::make_shared<cell>()} {
    auto thunk = [fn = std::forward<Function>(fn),
                  ... args = std::forward<Args>(args)]() mutable -> value_type {
      return std::invoke(fn, args...);
    };
    cell_->thunk = std::make_unique<thunk_of<decltype(thunk)>>(std::move(thunk));
  }

  /**
   * A lazy that is already evaluated
   */
  static lazy ready(value_type value) { return lazy{ready_tag{}, std::move(value)}; }

  bool is_evaluated() const {
    assert(cell_ != nullptr);
    if constexpr (IsThreadSafe) {
      return cell_->evaluated.load(std::memory_order_acquire);
    } else {
      return cell_->evaluated;
    }
  }

  bool is_ready() const { return is_evaluated(); }

  const value_type& get() const {
    assert(cell_ != nullptr);
    auto& c = *cell_;
    if (is_evaluated())
      return *c.value;

    if constexpr (IsThreadSafe) {
      std::lock_guard<std::mutex> lock{c.gate};
      if (!c.evaluated.load(std::memory_order_relaxed)) // lost the race?
        evaluate_(c);
    } else {
      evaluate_(c);
    }
    return *c.value;
  }

  const value_type& operator()() const { return get(); }

  friend bool operator==(const lazy& lhs, const lazy& rhs) {
    return lhs.cell_ == rhs.cell_ || lhs.get() == rhs.get();
  }
  friend bool operator!=(const lazy& lhs, const lazy& rhs) { return !(lhs == rhs); }
};

/**
 * @return The (forced) value of a lazy, or the argument itself
 */
template <typename T, bool IsThreadSafe> const T& unlazy(const lazy<T, IsThreadSafe>& value) {
  return value.get();
}

template <typename T> const T& unlazy(const T& value) { return value; }

/**
 * @return The value held by `stored`, evaluating it if it is lazy
 */
template <typename T, bool IsThreadSafe>
const T& unlazy(const std::variant<T, lazy<T, IsThreadSafe>>& stored) {
  if (const auto* cell = std::get_if<lazy<T, IsThreadSafe>>(&stored))
    return cell->get();
  return std::get<T>(stored);
}

namespace detail {
/**
 * Hashes the value held by a stored variant, forcing it if it is lazy
 */
template <typename T> struct unlazy_hash {
  template <typename Stored> std::size_t operator()(const Stored& stored) const {
    return std::hash<T>{}(unlazy(stored));
  }
};
} // namespace detail

} // namespace pcollections

namespace std {
template <typename T, bool IsThreadSafe> struct hash<pcollections::lazy<T, IsThreadSafe>> {
  std::size_t operator()(const pcollections::lazy<T, IsThreadSafe>& value) const {
    return std::hash<T>{}(value.get());
  }
};
} // namespace std
