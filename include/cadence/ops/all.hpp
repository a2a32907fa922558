#pragma once
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <cadence/core/promise.hpp>

namespace cadence {

namespace detail {
template <class T> struct all_result { using type = std::vector<T>; };
template <> struct all_result<void> { using type = void; };
} // namespace detail

// all(ctx, {p1, p2, ...}): fulfils with the values in input order once every
// input is fulfilled (promise<void> for void inputs). Rejects with the first
// rejection to happen; the other inputs keep running and are ignored.
template <class T>
auto all(promise_context& ctx, std::vector<promise<T>> inputs) {
  using R = typename detail::all_result<T>::type;
  promise<R> out(ctx);

  if (inputs.empty()) {
    if constexpr (std::is_void_v<T>) out.resolve();
    else out.resolve(R{});
    return out;
  }

  struct state_t {
    std::vector<std::optional<detail::stored_t<T>>> values;
    std::size_t remaining{0};
  };
  auto st = std::make_shared<state_t>();
  st->values.resize(inputs.size());
  st->remaining = inputs.size();

  for (std::size_t i = 0; i < inputs.size(); ++i) {
    inputs[i].on_settled([st, out, i](const promise<T>& p) {
      if (p.state() == promise_state::rejected) {
        out.reject(p.error());
        return;
      }
      st->values[i].emplace(p.value());
      if (--st->remaining != 0) return;
      if constexpr (std::is_void_v<T>) {
        out.resolve();
      } else {
        R values;
        values.reserve(st->values.size());
        for (auto& v : st->values) values.push_back(std::move(*v));
        out.resolve(std::move(values));
      }
    });
  }
  return out;
}

template <class T>
auto all(promise_context& ctx, std::initializer_list<promise<T>> inputs) {
  return all(ctx, std::vector<promise<T>>(inputs));
}

} // namespace cadence
