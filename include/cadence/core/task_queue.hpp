#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include <cadence/core/clock.hpp>

namespace cadence {

enum class timer_kind { once, repeating };

struct timer_handle {
  std::uint64_t id{0};
  timer_kind kind{timer_kind::once};

  explicit operator bool() const noexcept { return id != 0; }
  friend bool operator==(const timer_handle&, const timer_handle&) = default;
};

struct macrotask {
  std::uint64_t id{0}; // doubles as the insertion sequence
  time_point due{0};
  std::function<void()> action;
};

// Timers ordered by (due time, insertion sequence): equal due times fire FIFO.
// A delay is a lower bound, never an exact firing time.
class task_queue {
public:
  explicit task_queue(const logical_clock& clock) noexcept : clock_(clock) {}

  task_queue(const task_queue&) = delete;
  task_queue& operator=(const task_queue&) = delete;

  // Negative delays count as zero; huge ones saturate at time_point::max().
  timer_handle schedule(duration delay, std::function<void()> action) {
    return schedule_at(later_by(clock_.now(), std::max(delay, duration{0})), std::move(action));
  }

  // Due times in the past are clamped to now().
  timer_handle schedule_at(time_point due, std::function<void()> action) {
    const std::uint64_t id = next_id_++;
    const key k{std::max(due, clock_.now()), id};
    tasks_.emplace(k, macrotask{id, k.first, std::move(action)});
    index_.emplace(id, k);
    return timer_handle{id, timer_kind::once};
  }

  // Returns false (and does nothing) if the task already ran or was cancelled.
  bool cancel(timer_handle h) noexcept {
    auto it = index_.find(h.id);
    if (it == index_.end()) return false;
    tasks_.erase(it->second);
    index_.erase(it);
    return true;
  }

  // Earliest-due task with due <= at_or_before, removed from the queue.
  std::optional<macrotask> pop_next_due(time_point at_or_before) {
    if (tasks_.empty()) return std::nullopt;
    auto it = tasks_.begin();
    if (it->first.first > at_or_before) return std::nullopt;
    macrotask t = std::move(it->second);
    index_.erase(t.id);
    tasks_.erase(it);
    return t;
  }

  std::optional<time_point> peek_next_due_time() const {
    if (tasks_.empty()) return std::nullopt;
    return tasks_.begin()->first.first;
  }

  bool contains(timer_handle h) const { return index_.count(h.id) != 0; }
  std::size_t size() const noexcept { return tasks_.size(); }
  bool empty() const noexcept { return tasks_.empty(); }
  const logical_clock& clock() const noexcept { return clock_; }

private:
  using key = std::pair<time_point, std::uint64_t>;

  const logical_clock& clock_;
  std::map<key, macrotask> tasks_;
  std::unordered_map<std::uint64_t, key> index_;
  std::uint64_t next_id_{1};
};

} // namespace cadence
