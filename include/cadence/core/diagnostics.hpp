#pragma once
#include <functional>
#include <iostream>
#include <string>

#include <cadence/core/error.hpp>

namespace cadence {

// Where the loop reports execution errors and unhandled rejections.
using error_sink = std::function<void(const loop_error&)>;

inline std::string format(const loop_error& e) {
  return std::string("[cadence] ") + to_string(e.kind) + " in " + to_string(e.from.kind) +
         " #" + std::to_string(e.from.id) + ": " + describe(e.exception);
}

inline error_sink stderr_sink() {
  return [](const loop_error& e) { std::cerr << format(e) << "\n"; };
}

inline error_sink null_sink() {
  return [](const loop_error&) {};
}

} // namespace cadence
