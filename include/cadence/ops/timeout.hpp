#pragma once
#include <exception>
#include <string>

#include <cadence/core/error.hpp>
#include <cadence/core/event_loop.hpp>
#include <cadence/core/promise.hpp>

namespace cadence {

// p | timeout(loop, d): settles like p, unless d elapses first; then it
// rejects with timeout_error. The watchdog timer is cleared once p settles.
struct op_timeout {
  event_loop* loop;
  duration d;

  template <class T>
  promise<T> operator()(const promise<T>& src) const {
    promise<T> out(*loop);
    const auto ms = d.count();
    auto watchdog = loop->set_timeout(d, [out, ms] {
      out.reject(std::make_exception_ptr(
          timeout_error("timed out after " + std::to_string(ms) + "ms")));
    });
    src.on_settled([out, l = loop, watchdog](const promise<T>& settled) {
      l->clear_timeout(watchdog);
      out.settle_from(settled);
    });
    return out;
  }
};

inline op_timeout timeout(event_loop& loop, duration d) { return op_timeout{&loop, d}; }

} // namespace cadence
