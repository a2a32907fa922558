#pragma once
#include <utility>

#include <cadence/core/event_loop.hpp>
#include <cadence/core/task_queue.hpp>

namespace cadence {

// RAII owner of a timer or interval: clears it on destruction.
// Move-only, one owner per timer.
class scoped_timer {
public:
  scoped_timer() noexcept = default;

  scoped_timer(event_loop& loop, timer_handle h) noexcept : loop_(&loop), h_(h) {}

  scoped_timer(const scoped_timer&) = delete;
  scoped_timer& operator=(const scoped_timer&) = delete;

  scoped_timer(scoped_timer&& other) noexcept
    : loop_(std::exchange(other.loop_, nullptr)), h_(std::exchange(other.h_, timer_handle{})) {}

  scoped_timer& operator=(scoped_timer&& other) noexcept {
    if (this != &other) {
      reset();
      loop_ = std::exchange(other.loop_, nullptr);
      h_ = std::exchange(other.h_, timer_handle{});
    }
    return *this;
  }

  ~scoped_timer() { reset(); }

  // Clears the timer once. Clearing one that already fired is a no-op.
  void reset() noexcept {
    if (loop_ && h_) loop_->clear_timeout(h_);
    loop_ = nullptr;
    h_ = timer_handle{};
  }

  // Gives up ownership; the timer keeps running.
  timer_handle release() noexcept {
    loop_ = nullptr;
    return std::exchange(h_, timer_handle{});
  }

  timer_handle handle() const noexcept { return h_; }
  explicit operator bool() const noexcept { return static_cast<bool>(h_); }

private:
  event_loop* loop_{nullptr};
  timer_handle h_{};
};

} // namespace cadence
