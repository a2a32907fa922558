#pragma once
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <utility>

#include <cadence/core/error.hpp>
#include <cadence/core/executor.hpp>

namespace cadence {

struct microtask {
  std::uint64_t id{0};
  std::function<void()> action;
};

// FIFO of promise continuations. Drained exhaustively between macrotasks.
// There is no cycle breaker: a microtask that keeps re-queueing itself keeps
// the drain going forever, starving timers, exactly like the real thing.
class microtask_queue {
public:
  using failure_fn = std::function<void(const microtask&, std::exception_ptr)>;

  microtask_queue() = default;
  microtask_queue(const microtask_queue&) = delete;
  microtask_queue& operator=(const microtask_queue&) = delete;

  std::uint64_t enqueue(std::function<void()> action) {
    const std::uint64_t id = next_id_++;
    q_.push_back(microtask{id, std::move(action)});
    return id;
  }

  // Pops and runs from the front until empty, including microtasks queued
  // while draining. A throwing microtask is handed to on_failure and the
  // drain continues; without on_failure the exception propagates and the
  // rest stays queued. fatal_error always propagates.
  std::size_t drain_all(executor& ex, const failure_fn& on_failure = {}) {
    std::size_t ran = 0;
    while (!q_.empty()) {
      microtask m = std::move(q_.front());
      q_.pop_front();
      ++ran;
      try {
        ex.run(m.action);
      } catch (const fatal_error&) {
        throw;
      } catch (...) {
        if (!on_failure) throw;
        on_failure(m, std::current_exception());
      }
    }
    return ran;
  }

  std::size_t size() const noexcept { return q_.size(); }
  bool empty() const noexcept { return q_.empty(); }

private:
  std::deque<microtask> q_;
  std::uint64_t next_id_{1};
};

} // namespace cadence
