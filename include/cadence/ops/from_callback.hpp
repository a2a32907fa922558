#pragma once
#include <exception>
#include <type_traits>
#include <utility>

#include <cadence/core/event_loop.hpp>
#include <cadence/core/promise.hpp>

namespace cadence {

// Wraps a Node-style callback API into a promise.
// fn receives a callback: callback(err, value) for T, callback(err) for void.
// A non-null err rejects, otherwise the value fulfils.
template <class T, class Fn>
promise<T> from_callback(event_loop& loop, Fn&& fn) {
  return loop.make_promise<T>([&fn](auto resolve, auto reject) {
    if constexpr (std::is_void_v<T>) {
      fn([resolve, reject](std::exception_ptr err) {
        if (err) reject(std::move(err));
        else resolve();
      });
    } else {
      fn([resolve, reject](std::exception_ptr err, T value) {
        if (err) reject(std::move(err));
        else resolve(std::move(value));
      });
    }
  });
}

} // namespace cadence
