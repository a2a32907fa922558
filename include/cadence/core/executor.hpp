#pragma once
#include <cstdint>
#include <functional>

#include <cadence/core/error.hpp>

namespace cadence {

// Basic executor interface: runs one unit of work synchronously.
// Whatever the unit throws reaches the caller of run().
struct executor {
  virtual ~executor() = default;
  virtual void run(const std::function<void()>& unit) = 0;
};

// The call stack of the loop: one unit at a time, always to completion.
class call_stack final : public executor {
public:
  call_stack() = default;
  call_stack(const call_stack&) = delete;
  call_stack& operator=(const call_stack&) = delete;

  void run(const std::function<void()>& unit) override {
    if (busy_) throw reentrant_run_error("unit of work started while another is running");
    busy_ = true;
    struct reset_on_exit {
      bool& flag;
      ~reset_on_exit() { flag = false; }
    } reset{busy_};
    ++started_;
    if (unit) unit();
  }

  bool busy() const noexcept { return busy_; }
  std::uint64_t units_started() const noexcept { return started_; }

private:
  bool busy_{false};
  std::uint64_t started_{0};
};

} // namespace cadence
