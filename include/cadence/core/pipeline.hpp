#pragma once
#include <type_traits>
#include <utility>

#include <cadence/core/promise.hpp>

namespace cadence {

// p | op  ==  op(p), for promise operators such as timeout().
template <class T, class Op>
  requires std::is_invocable_v<Op&&, const promise<T>&>
auto operator|(const promise<T>& p, Op&& op) {
  return std::forward<Op>(op)(p);
}

} // namespace cadence
