#pragma once
#include <cadence/core/event_loop.hpp>
#include <cadence/core/promise.hpp>

namespace cadence {

// delay(loop, d): fulfils once d of logical time has passed.
inline promise<void> delay(event_loop& loop, duration d) {
  promise<void> p(loop);
  loop.set_timeout(d, [p] { p.resolve(); });
  return p;
}

// delay(loop, d, v): same, fulfilling with v.
template <class T>
promise<T> delay(event_loop& loop, duration d, T value) {
  promise<T> p(loop);
  loop.set_timeout(d, [p, value] { p.resolve(value); });
  return p;
}

} // namespace cadence
