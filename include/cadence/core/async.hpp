#pragma once
#include <coroutine>
#include <exception>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <cadence/core/error.hpp>
#include <cadence/core/promise.hpp>

// Coroutines returning promise<T> behave like async functions:
//
//   promise<int> load(event_loop& loop) {
//     co_await delay(loop, 10ms);
//     co_return 42;
//   }
//
// The body runs synchronously up to the first co_await. co_await always
// suspends, and the rest of the body runs later as a microtask. One parameter
// must be a promise_context (usually the event_loop) so the returned promise
// knows where to queue its reactions. A coroutine waiting on a promise that
// nobody else holds is destroyed along with that promise.

namespace cadence {
namespace detail {

// Only a mutable context can take reactions; const ones are skipped.
template <class A>
promise_context* context_of(A& a) noexcept {
  if constexpr (std::is_base_of_v<promise_context, std::remove_cvref_t<A>> && !std::is_const_v<A>)
    return &a;
  else
    return nullptr;
}

template <class T>
class coroutine_promise_base {
public:
  template <class... Args>
  explicit coroutine_promise_base(Args&... args) {
    promise_context* ctx = nullptr;
    ((ctx = ctx ? ctx : context_of(args)), ...);
    if (!ctx) throw std::logic_error("async function needs a non-const promise_context& parameter");
    result_ = promise<T>(*ctx);
  }

  promise<T> get_return_object() const { return result_; }
  std::suspend_never initial_suspend() const noexcept { return {}; }
  std::suspend_never final_suspend() const noexcept { return {}; }

  void unhandled_exception() {
    try {
      throw;
    } catch (const fatal_error&) {
      throw;
    } catch (...) {
      result_.reject(std::current_exception());
    }
  }

protected:
  promise<T> result_;
};

template <class T>
class coroutine_promise : public coroutine_promise_base<T> {
public:
  using coroutine_promise_base<T>::coroutine_promise_base;
  void return_value(T v) { this->result_.resolve(std::move(v)); }
  void return_value(const promise<T>& p) { this->result_.resolve(p); }
};

template <>
class coroutine_promise<void> : public coroutine_promise_base<void> {
public:
  using coroutine_promise_base<void>::coroutine_promise_base;
  void return_void() { result_.resolve(); }
};

// Owns a suspended coroutine until it is resumed; destroys it otherwise.
class suspended_frame {
public:
  explicit suspended_frame(std::coroutine_handle<> h) noexcept : h_(h) {}

  suspended_frame(const suspended_frame&) = delete;
  suspended_frame& operator=(const suspended_frame&) = delete;

  ~suspended_frame() {
    if (h_) h_.destroy();
  }

  void resume() {
    auto h = h_;
    h_ = nullptr;
    h.resume();
  }

private:
  std::coroutine_handle<> h_;
};

template <class T>
struct promise_awaiter {
  promise<T> p;

  bool await_ready() const noexcept { return false; }

  // The frame lets go of the awaited promise while suspended. If nothing else
  // holds it, it can never settle, and dropping it destroys the frame.
  void await_suspend(std::coroutine_handle<> h) {
    auto frame = std::make_shared<suspended_frame>(h);
    const promise<T> src = std::move(p);
    src.on_settled([this, frame](const promise<T>& settled) {
      p = settled;
      frame->resume();
    });
  }

  T await_resume() const {
    if (p.state() == promise_state::rejected) std::rethrow_exception(p.error());
    if constexpr (std::is_void_v<T>)
      return;
    else
      return p.value();
  }
};

} // namespace detail

template <class T>
detail::promise_awaiter<T> operator co_await(promise<T> p) {
  return detail::promise_awaiter<T>{std::move(p)};
}

} // namespace cadence

namespace std {
template <class T, class... Args>
struct coroutine_traits<cadence::promise<T>, Args...> {
  using promise_type = cadence::detail::coroutine_promise<T>;
};
} // namespace std
