#pragma once
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cadence/core/error.hpp>

namespace cadence {

enum class promise_state { pending, fulfilled, rejected };

// What a promise needs from the loop that owns it.
class promise_context {
public:
  virtual ~promise_context() = default;

  virtual void enqueue_microtask(std::function<void()> job) = 0;
  virtual std::uint64_t next_promise_id() noexcept = 0;

  // Rejected while no reaction is attached.
  virtual void track_rejection(std::uint64_t promise_id, std::exception_ptr e) = 0;
  // A reaction got attached to a tracked rejection.
  virtual void untrack_rejection(std::uint64_t promise_id) noexcept = 0;
};

template <class T> class promise;

namespace detail {

template <class T> struct stored { using type = T; };
template <> struct stored<void> { using type = std::monostate; };
template <class T> using stored_t = typename stored<T>::type;

template <class T> struct is_promise : std::false_type {};
template <class T> struct is_promise<promise<T>> : std::true_type {};
template <class T>
inline constexpr bool is_promise_v = is_promise<std::remove_cvref_t<T>>::value;

// promise<U> -> U, anything else unchanged: returned promises are chained, not nested.
template <class R> struct unwrap_promise { using type = R; };
template <class U> struct unwrap_promise<promise<U>> { using type = U; };
template <class R>
using unwrap_promise_t = typename unwrap_promise<std::remove_cvref_t<R>>::type;

template <class F, class T> struct fulfil_result { using type = std::invoke_result_t<F&, const T&>; };
template <class F> struct fulfil_result<F, void> { using type = std::invoke_result_t<F&>; };
template <class F, class T> using fulfil_result_t = typename fulfil_result<F, T>::type;

// Markers for the handler a then() call leaves out.
struct pass_value {};
struct pass_error {};

template <class F, class T> struct then_result {
  using type = unwrap_promise_t<fulfil_result_t<F, T>>;
};
template <class T> struct then_result<pass_value, T> { using type = T; };

template <class T> struct shared_state;
template <class T> using state_ptr = std::shared_ptr<shared_state<T>>;

// A reaction is handed the settled state instead of capturing it, so a
// promise that never settles owns no reference to itself and is freed once
// its last handle goes.
template <class T> using reaction = std::function<void(const state_ptr<T>&)>;

template <class T>
struct shared_state {
  promise_context* ctx{nullptr};
  std::uint64_t id{0};
  promise_state state{promise_state::pending};
  bool locked{false};  // resolved with another promise, waiting for it
  bool handled{false}; // at least one reaction was attached
  std::optional<stored_t<T>> value;
  std::exception_ptr error;
  std::vector<reaction<T>> reactions;
};

template <class T>
void enqueue_reaction(const state_ptr<T>& s, reaction<T> r) {
  s->ctx->enqueue_microtask([s, r = std::move(r)] { r(s); });
}

template <class T>
void flush_reactions(const state_ptr<T>& s) {
  auto pending = std::move(s->reactions);
  s->reactions.clear();
  for (auto& r : pending) enqueue_reaction(s, std::move(r));
}

template <class T>
void fulfil(const state_ptr<T>& s, stored_t<T> v) {
  if (s->state != promise_state::pending) return;
  s->value.emplace(std::move(v));
  s->state = promise_state::fulfilled;
  flush_reactions(s);
}

template <class T>
void reject(const state_ptr<T>& s, std::exception_ptr e) {
  if (s->state != promise_state::pending) return;
  s->error = std::move(e);
  s->state = promise_state::rejected;
  if (!s->handled) s->ctx->track_rejection(s->id, s->error);
  flush_reactions(s);
}

template <class T>
void copy_outcome(const state_ptr<T>& dst, const shared_state<T>& src) {
  if (src.state == promise_state::fulfilled)
    fulfil(dst, *src.value);
  else if (src.state == promise_state::rejected)
    reject(dst, src.error);
}

// Runs as a microtask right away if already settled, otherwise on settlement.
template <class T>
void add_reaction(const state_ptr<T>& s, std::type_identity_t<reaction<T>> r) {
  if (!s->handled) {
    s->handled = true;
    if (s->state == promise_state::rejected) s->ctx->untrack_rejection(s->id);
  }
  if (s->state == promise_state::pending)
    s->reactions.push_back(std::move(r));
  else
    enqueue_reaction(s, std::move(r));
}

} // namespace detail

// Single-assignment result of a unit of work.
// Pending -> fulfilled | rejected, once; later settle attempts are no-ops.
// Copies share the same state.
template <class T>
class promise {
public:
  using value_type = T;
  using stored_type = detail::stored_t<T>;

  // resolve(...) capability handed to a resolver function.
  class resolver {
  public:
    explicit resolver(promise p) : p_(std::move(p)) {}
    void operator()() const requires std::is_void_v<T> { p_.resolve(); }
    void operator()(stored_type v) const requires(!std::is_void_v<T>) { p_.resolve(std::move(v)); }
    void operator()(const promise& other) const { p_.resolve(other); }
  private:
    promise p_;
  };

  class rejecter {
  public:
    explicit rejecter(promise p) : p_(std::move(p)) {}
    void operator()(std::exception_ptr e) const { p_.reject(std::move(e)); }
  private:
    promise p_;
  };

  // Empty handle; only valid() and assignment may be used.
  promise() = default;

  explicit promise(promise_context& ctx)
    : s_(std::make_shared<detail::shared_state<T>>()) {
    s_->ctx = &ctx;
    s_->id = ctx.next_promise_id();
  }

  // Calls fn(resolve, reject) synchronously. If fn throws, the promise is
  // rejected with that exception.
  template <class Fn>
  static promise create(promise_context& ctx, Fn&& fn) {
    promise p(ctx);
    try {
      std::forward<Fn>(fn)(resolver{p}, rejecter{p});
    } catch (const fatal_error&) {
      throw;
    } catch (...) {
      p.reject(std::current_exception());
    }
    return p;
  }

  static promise resolved(promise_context& ctx, stored_type v) requires(!std::is_void_v<T>) {
    promise p(ctx);
    p.resolve(std::move(v));
    return p;
  }

  static promise resolved(promise_context& ctx) requires std::is_void_v<T> {
    promise p(ctx);
    p.resolve();
    return p;
  }

  static promise rejected(promise_context& ctx, std::exception_ptr e) {
    promise p(ctx);
    p.reject(std::move(e));
    return p;
  }

  void resolve(stored_type v) const requires(!std::is_void_v<T>) {
    if (!s_->locked) detail::fulfil(s_, std::move(v));
  }

  void resolve() const requires std::is_void_v<T> {
    if (!s_->locked) detail::fulfil(s_, std::monostate{});
  }

  // Adopts the eventual state of other. Resolving a promise with itself
  // rejects it with std::logic_error.
  void resolve(const promise& other) const {
    if (s_->locked || s_->state != promise_state::pending) return;
    if (other.s_ == s_) {
      detail::reject(s_, std::make_exception_ptr(
          std::logic_error("chaining cycle: promise resolved with itself")));
      return;
    }
    s_->locked = true;
    detail::add_reaction(other.s_, [self = s_](const detail::state_ptr<T>& src) {
      detail::copy_outcome(self, *src);
    });
  }

  void reject(std::exception_ptr e) const {
    if (!s_->locked) detail::reject(s_, std::move(e));
  }

  // Settles this promise like src, which must already be settled.
  void settle_from(const promise& src) const {
    if (!s_->locked) detail::copy_outcome(s_, *src.s_);
  }

  // Raw reaction: fn(settled) runs as a microtask once this promise settles,
  // settled being a handle to this promise. Counts as handling a rejection.
  // fn should not capture this promise: use the argument instead.
  template <class F>
  void on_settled(F fn) const {
    detail::add_reaction(s_, [fn = std::move(fn)](const detail::state_ptr<T>& s) mutable {
      fn(promise(s));
    });
  }

  // then(on_fulfilled): rejections pass through to the returned promise.
  template <class F>
  auto then(F on_fulfilled) const {
    return then_impl(std::move(on_fulfilled), detail::pass_error{});
  }

  // Both handlers must produce the same type (or a promise of it).
  template <class F, class R>
  auto then(F on_fulfilled, R on_rejected) const {
    return then_impl(std::move(on_fulfilled), std::move(on_rejected));
  }

  // on_rejected(std::exception_ptr) must return T (or promise<T>).
  template <class R>
  promise<T> catch_(R on_rejected) const {
    return then_impl(detail::pass_value{}, std::move(on_rejected));
  }

  // f() runs on either outcome; the outcome passes through unless f throws.
  template <class F>
  promise<T> finally(F f) const {
    promise<T> next(*s_->ctx);
    detail::add_reaction(s_, [next, f = std::move(f)](const detail::state_ptr<T>& src) mutable {
      try {
        f();
      } catch (const fatal_error&) {
        throw;
      } catch (...) {
        next.reject(std::current_exception());
        return;
      }
      next.settle_from_state(*src);
    });
    return next;
  }

  promise_state state() const noexcept { return s_->state; }
  bool is_pending() const noexcept { return s_->state == promise_state::pending; }
  bool valid() const noexcept { return static_cast<bool>(s_); }
  std::uint64_t id() const noexcept { return s_->id; }
  promise_context& context() const noexcept { return *s_->ctx; }

  // Throws std::logic_error unless fulfilled.
  const stored_type& value() const {
    if (s_->state != promise_state::fulfilled)
      throw std::logic_error("promise value read before fulfilment");
    return *s_->value;
  }

  std::exception_ptr error() const noexcept { return s_->error; }

  friend bool operator==(const promise& a, const promise& b) noexcept { return a.s_ == b.s_; }

private:
  template <class> friend class promise;

  explicit promise(detail::state_ptr<T> s) noexcept : s_(std::move(s)) {}

  void settle_from_state(const detail::shared_state<T>& src) const {
    if (!s_->locked) detail::copy_outcome(s_, src);
  }

  template <class F>
  static decltype(auto) invoke_fulfilled(F& f, detail::stored_t<T>& v) {
    if constexpr (std::is_void_v<T>)
      return f();
    else
      return f(static_cast<const T&>(v));
  }

  // Settles next with what thunk produces: a value, a promise to adopt, or
  // nothing for void. A throw rejects next.
  template <class U, class Thunk>
  static void settle_with(const promise<U>& next, Thunk&& thunk) {
    using R = decltype(thunk());
    try {
      if constexpr (std::is_void_v<R>) {
        thunk();
        next.resolve();
      } else {
        next.resolve(thunk());
      }
    } catch (const fatal_error&) {
      throw;
    } catch (...) {
      next.reject(std::current_exception());
    }
  }

  template <class F, class R>
  auto then_impl(F on_fulfilled, R on_rejected) const {
    constexpr bool keeps_value = std::is_same_v<F, detail::pass_value>;
    constexpr bool keeps_error = std::is_same_v<R, detail::pass_error>;

    using U = typename detail::then_result<F, T>::type;

    if constexpr (!keeps_error) {
      using RU = detail::unwrap_promise_t<std::invoke_result_t<R&, std::exception_ptr>>;
      static_assert(std::is_same_v<RU, U>,
                    "rejection handler must produce the same type as the fulfilment path");
    }

    promise<U> next(*s_->ctx);
    detail::add_reaction(s_, [next, f = std::move(on_fulfilled),
                              r = std::move(on_rejected)](const detail::state_ptr<T>& src) mutable {
      if (src->state == promise_state::fulfilled) {
        if constexpr (keeps_value)
          next.settle_from_state(*src);
        else
          settle_with(next, [&]() -> decltype(auto) { return invoke_fulfilled(f, *src->value); });
      } else {
        if constexpr (keeps_error)
          next.reject(src->error);
        else
          settle_with(next, [&]() -> decltype(auto) { return r(src->error); });
      }
    });
    return next;
  }

  detail::state_ptr<T> s_;
};

} // namespace cadence
