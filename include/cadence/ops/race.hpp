#pragma once
#include <initializer_list>
#include <vector>

#include <cadence/core/promise.hpp>

namespace cadence {

// race(ctx, {p1, p2, ...}): settles like whichever input settles first in
// time, regardless of its position. An empty input stays pending forever.
template <class T>
promise<T> race(promise_context& ctx, std::vector<promise<T>> inputs) {
  promise<T> out(ctx);
  for (const auto& p : inputs) {
    p.on_settled([out](const promise<T>& settled) { out.settle_from(settled); });
  }
  return out;
}

template <class T>
promise<T> race(promise_context& ctx, std::initializer_list<promise<T>> inputs) {
  return race(ctx, std::vector<promise<T>>(inputs));
}

} // namespace cadence
