#pragma once
#include <algorithm>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cadence/core/clock.hpp>
#include <cadence/core/diagnostics.hpp>
#include <cadence/core/error.hpp>
#include <cadence/core/executor.hpp>
#include <cadence/core/microtask_queue.hpp>
#include <cadence/core/promise.hpp>
#include <cadence/core/task_queue.hpp>

namespace cadence {

enum class loop_state { idle, draining };

struct loop_options {
  time_point start_time{0};
  error_sink sink = stderr_sink();
};

// What one run of the loop observed. Errors come in the order they were recorded.
struct run_report {
  std::vector<loop_error> errors;
  std::size_t units_run{0};
  time_point finished_at{0};

  bool ok() const noexcept { return errors.empty(); }

  std::size_t count(error_kind k) const noexcept {
    return static_cast<std::size_t>(std::count_if(
        errors.begin(), errors.end(), [k](const loop_error& e) { return e.kind == k; }));
  }
};

// Single-threaded cooperative scheduler.
//
// One iteration: run a pending synchronous unit (or, if none, exactly one due
// macrotask), then drain the microtask queue to empty. When nothing is due,
// the clock jumps to the next timer. Stops once both queues are empty and no
// synchronous unit is pending.
//
// A unit of work that throws is recorded as an execution_error and the loop
// moves on. fatal_error (clock misuse, re-entrant run) escapes to the caller.
class event_loop final : public promise_context {
public:
  explicit event_loop(loop_options opts = {})
    : owned_clock_(std::make_unique<logical_clock>(opts.start_time))
    , owned_tasks_(std::make_unique<task_queue>(*owned_clock_))
    , owned_micro_(std::make_unique<microtask_queue>())
    , owned_exec_(std::make_unique<call_stack>())
    , clock_(owned_clock_.get())
    , tasks_(owned_tasks_.get())
    , micro_(owned_micro_.get())
    , exec_(owned_exec_.get())
    , sink_(std::move(opts.sink)) {}

  // Injected collaborators; tasks must be built on clock. start_time is ignored.
  event_loop(logical_clock& clock, task_queue& tasks, microtask_queue& micro, executor& exec,
             loop_options opts = {})
    : clock_(&clock), tasks_(&tasks), micro_(&micro), exec_(&exec), sink_(std::move(opts.sink)) {}

  event_loop(const event_loop&) = delete;
  event_loop& operator=(const event_loop&) = delete;

  // ---- submission -------------------------------------------------------

  // Queues a synchronous unit of work. Pending units run before any macrotask.
  void submit(std::function<void()> unit) { units_.push_back(std::move(unit)); }

  // Fires f(args...) no earlier than delay from now.
  template <class F, class... Args>
  timer_handle set_timeout(duration delay, F&& f, Args&&... args) {
    return tasks_->schedule(delay, [fn = std::forward<F>(f),
                                    bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
      std::apply(fn, bound);
    });
  }

  bool clear_timeout(timer_handle h) noexcept { return cancel_timer(h); }

  // Fixed cadence: the next firing is armed at (this due + interval) before
  // the callback runs, however long the callback takes. Intervals below 1ms
  // are raised to 1ms.
  template <class F>
  timer_handle set_interval(duration interval, F&& f) {
    const std::uint64_t id = next_interval_id_++;
    const duration period = std::max(interval, duration{1});
    auto cb = std::make_shared<std::function<void()>>(std::forward<F>(f));
    arm_interval(id, later_by(clock_->now(), period), period, std::move(cb));
    return timer_handle{id, timer_kind::repeating};
  }

  bool clear_interval(timer_handle h) noexcept { return cancel_timer(h); }

  void queue_microtask(std::function<void()> job) { micro_->enqueue(std::move(job)); }

  // ---- promises ---------------------------------------------------------

  template <class T = void, class Fn>
  promise<T> make_promise(Fn&& resolver) {
    return promise<T>::create(*this, std::forward<Fn>(resolver));
  }

  template <class T>
    requires(!detail::is_promise_v<T>)
  promise<std::decay_t<T>> resolved(T&& v) {
    return promise<std::decay_t<T>>::resolved(*this, std::forward<T>(v));
  }

  template <class T>
  promise<T> resolved(promise<T> p) { return p; }

  promise<void> resolved() { return promise<void>::resolved(*this); }

  template <class T = void>
  promise<T> rejected(std::exception_ptr e) {
    return promise<T>::rejected(*this, std::move(e));
  }

  // ---- driving ----------------------------------------------------------

  // Runs until quiescent. Errors are collected, not thrown.
  // Calling any run function from inside a unit throws reentrant_run_error.
  run_report run_to_completion() { return run(std::nullopt); }

  // Same, but never moves the clock past limit; the clock ends at limit.
  run_report run_until(time_point limit) {
    run_report r = run(limit);
    if (clock_->now() < limit) clock_->advance_to(limit);
    r.finished_at = clock_->now();
    return r;
  }

  // One iteration. Returns false when there was nothing left to do.
  // Errors recorded here show up in the next run_to_completion()/run_until() report.
  bool run_once() {
    enter();
    bool more = false;
    try {
      more = step(std::nullopt);
    } catch (...) {
      state_ = loop_state::idle;
      throw;
    }
    state_ = loop_state::idle;
    return more;
  }

  time_point now() const noexcept { return clock_->now(); }
  loop_state state() const noexcept { return state_; }
  std::size_t pending_timers() const noexcept { return tasks_->size(); }
  std::size_t pending_microtasks() const noexcept { return micro_->size(); }
  std::size_t pending_units() const noexcept { return units_.size(); }
  std::optional<time_point> next_due_time() const { return tasks_->peek_next_due_time(); }

  bool idle() const noexcept { return units_.empty() && micro_->empty() && tasks_->empty(); }

  // ---- promise_context --------------------------------------------------

  void enqueue_microtask(std::function<void()> job) override { micro_->enqueue(std::move(job)); }

  std::uint64_t next_promise_id() noexcept override { return next_promise_id_++; }

  void track_rejection(std::uint64_t promise_id, std::exception_ptr e) override {
    rejections_.emplace_back(promise_id, std::move(e));
  }

  void untrack_rejection(std::uint64_t promise_id) noexcept override {
    std::erase_if(rejections_, [promise_id](const auto& r) { return r.first == promise_id; });
  }

private:
  // Throws reentrant_run_error when called from inside one of the loop's own units.
  void enter() {
    if (state_ == loop_state::draining)
      throw reentrant_run_error("event loop run from inside one of its own units");
    state_ = loop_state::draining;
  }

  run_report run(std::optional<time_point> limit) {
    enter();
    try {
      while (step(limit)) {
      }
    } catch (...) {
      state_ = loop_state::idle;
      throw;
    }
    // a slice that stops with timers pending has not quiesced: a later timer may still attach a handler
    if (idle()) report_unhandled_rejections();
    state_ = loop_state::idle;
    report_.finished_at = clock_->now();
    return std::exchange(report_, run_report{});
  }

  bool step(std::optional<time_point> limit) {
    drain();

    if (!units_.empty()) {
      auto unit = std::move(units_.front());
      units_.pop_front();
      execute(origin{origin_kind::sync_unit, next_unit_id_++}, unit);
      drain();
      return true;
    }

    const time_point horizon = limit ? std::min(*limit, max_time()) : max_time();
    auto task = tasks_->pop_next_due(clock_->now());
    if (!task) {
      auto due = tasks_->peek_next_due_time();
      if (!due || *due > horizon) return false;
      clock_->advance_to(*due);
      task = tasks_->pop_next_due(clock_->now());
      if (!task) return true;
    }
    execute(origin{origin_kind::macrotask, task->id}, task->action);
    drain();
    return true;
  }

  void drain() {
    report_.units_run += micro_->drain_all(*exec_, [this](const microtask& m, std::exception_ptr e) {
      record(loop_error{error_kind::execution_error, origin{origin_kind::microtask, m.id}, std::move(e)});
    });
  }

  void execute(origin from, const std::function<void()>& unit) {
    ++report_.units_run;
    try {
      exec_->run(unit);
    } catch (const fatal_error&) {
      throw;
    } catch (...) {
      record(loop_error{error_kind::execution_error, from, std::current_exception()});
    }
  }

  void report_unhandled_rejections() {
    auto pending = std::move(rejections_);
    rejections_.clear();
    for (auto& [id, e] : pending)
      record(loop_error{error_kind::unhandled_rejection, origin{origin_kind::promise, id}, std::move(e)});
  }

  void record(loop_error e) {
    if (sink_) sink_(e);
    report_.errors.push_back(std::move(e));
  }

  void arm_interval(std::uint64_t id, time_point due, duration period,
                    std::shared_ptr<std::function<void()>> cb) {
    auto h = tasks_->schedule_at(due, [this, id, due, period, cb] {
      if (intervals_.find(id) == intervals_.end()) return;
      // at the end of time there is no next firing
      if (const time_point next = later_by(due, period); next > due)
        arm_interval(id, next, period, cb);
      else
        intervals_.erase(id);
      (*cb)();
    });
    intervals_[id] = h;
  }

  bool cancel_timer(timer_handle h) noexcept {
    if (h.kind == timer_kind::once) return tasks_->cancel(h);
    auto it = intervals_.find(h.id);
    if (it == intervals_.end()) return false;
    tasks_->cancel(it->second);
    intervals_.erase(it);
    return true;
  }

  static constexpr time_point max_time() noexcept { return time_point::max(); }

  std::unique_ptr<logical_clock> owned_clock_;
  std::unique_ptr<task_queue> owned_tasks_;
  std::unique_ptr<microtask_queue> owned_micro_;
  std::unique_ptr<call_stack> owned_exec_;

  logical_clock* clock_;
  task_queue* tasks_;
  microtask_queue* micro_;
  executor* exec_;

  error_sink sink_;
  loop_state state_{loop_state::idle};
  run_report report_{};

  std::deque<std::function<void()>> units_;
  std::unordered_map<std::uint64_t, timer_handle> intervals_;
  std::vector<std::pair<std::uint64_t, std::exception_ptr>> rejections_;

  std::uint64_t next_unit_id_{1};
  std::uint64_t next_interval_id_{1};
  std::uint64_t next_promise_id_{1};
};

} // namespace cadence
