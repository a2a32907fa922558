#pragma once
#include <chrono>
#include <string>

#include <cadence/core/error.hpp>

namespace cadence {

using duration   = std::chrono::milliseconds;
using time_point = std::chrono::milliseconds; // logical time since loop start

// t + d, pinned to time_point::max() instead of wrapping. d must not be negative.
constexpr time_point later_by(time_point t, duration d) noexcept {
  return d > time_point::max() - t ? time_point::max() : t + d;
}

// Monotonic logical clock. Never moves on its own: only the event loop (or a
// host adapter through run_until) pushes it forward.
class logical_clock {
public:
  explicit logical_clock(time_point start = time_point{0}) noexcept : now_(start) {}

  logical_clock(const logical_clock&) = delete;
  logical_clock& operator=(const logical_clock&) = delete;

  time_point now() const noexcept { return now_; }

  // Throws time_regression_error if t is earlier than now().
  void advance_to(time_point t) {
    if (t < now_) {
      throw time_regression_error("clock cannot move from " + std::to_string(now_.count()) +
                                  "ms back to " + std::to_string(t.count()) + "ms");
    }
    now_ = t;
  }

private:
  time_point now_;
};

} // namespace cadence
