#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <cadence/core/event_loop.hpp>

namespace cadence {
namespace qt {

// ====================================================================================
// qt_driver - runs an event_loop from inside a Qt event loop.
// Logical time follows wall time since start(): every pump runs whatever is
// due up to "now" and re-arms a single-shot QTimer for the next due timer.
// ====================================================================================
class qt_driver {
public:
  using quiescent_fn = std::function<void(const run_report&)>;

  explicit qt_driver(event_loop& loop)
  : loop_(loop), timer_(std::make_unique<QTimer>()) {
    timer_->setSingleShot(true);
    QObject::connect(timer_.get(), &QTimer::timeout, timer_.get(), [this]{ pump(); });
  }

  qt_driver(const qt_driver&) = delete;
  qt_driver& operator=(const qt_driver&) = delete;

  ~qt_driver() { if (timer_) timer_->stop(); }

  // Called with the accumulated report each time the loop goes quiescent.
  void on_quiescent(quiescent_fn fn) { on_quiescent_ = std::move(fn); }

  void start() {
    origin_ = loop_.now();
    elapsed_.start();
    schedule_pump(std::chrono::milliseconds{0});
  }

  // Runs everything due by the current wall time, then re-arms.
  void pump() {
    const time_point target = std::max(loop_.now(), origin_ + std::chrono::milliseconds(elapsed_.elapsed()));
    run_report r = loop_.run_until(target);
    report_.units_run += r.units_run;
    report_.finished_at = r.finished_at;
    for (auto& e : r.errors) report_.errors.push_back(std::move(e));

    if (auto next = loop_.next_due_time()) {
      schedule_pump(*next - loop_.now());
    } else if (loop_.idle() && on_quiescent_) {
      on_quiescent_(report_);
    }
  }

  // Work submitted from Qt code is picked up on the next turn of the Qt loop.
  void wake() { schedule_pump(std::chrono::milliseconds{0}); }

  const run_report& report() const noexcept { return report_; }

private:
  void schedule_pump(std::chrono::milliseconds in) {
    timer_->start(static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, in.count())));
  }

  event_loop& loop_;
  std::unique_ptr<QTimer> timer_;
  QElapsedTimer elapsed_;
  time_point origin_{0};
  run_report report_{};
  quiescent_fn on_quiescent_{};
};

} // namespace qt
} // namespace cadence
