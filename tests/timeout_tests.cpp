#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <cadence/cadence.hpp>

using namespace cadence;
using namespace std::chrono_literals;

int main() {
  // slower than the deadline: timeout_error
  {
    event_loop loop{{.sink = null_sink()}};
    bool timed_out = false;
    (delay(loop, 50ms, 1) | timeout(loop, 20ms))
      .catch_([&](std::exception_ptr e) {
        try {
          std::rethrow_exception(e);
        } catch (const timeout_error&) {
          timed_out = true;
        }
        return 0;
      });
    auto report = loop.run_to_completion();
    assert(report.ok());
    assert(timed_out);
    assert(loop.now() == 50ms && "the source itself keeps running");
  }

  // faster than the deadline: value passes, watchdog is cleared
  {
    event_loop loop{{.sink = null_sink()}};
    int v = 0;
    (delay(loop, 5ms, 2) | timeout(loop, 20ms)).then([&](int r) { v = r; });
    loop.run_to_completion();
    assert(v == 2);
    assert(loop.now() == 5ms && "no watchdog left behind");
  }

  // rejections pass through untouched
  {
    event_loop loop{{.sink = null_sink()}};
    std::string reason;
    (loop.rejected<void>(std::make_exception_ptr(std::runtime_error("source failed"))) | timeout(loop, 20ms))
      .catch_([&](std::exception_ptr e) { reason = describe(e); });
    loop.run_to_completion();
    assert(reason == "source failed");
    assert(loop.now() == 0ms);
  }

  // a source that never settles is released once nothing holds it
  {
    event_loop loop{{.sink = null_sink()}};
    std::weak_ptr<int> watch;
    bool timed_out = false;
    {
      auto token = std::make_shared<int>(0);
      watch = token;
      promise<int> stuck(loop);
      stuck.then([token](int v) { return v; });
      (stuck | timeout(loop, 20ms)).catch_([&](std::exception_ptr) { timed_out = true; return 0; });
    }
    assert(loop.run_to_completion().ok());
    assert(timed_out);
    assert(watch.expired());
  }

  std::cout << "[timeout_tests] OK\n";
  return 0;
}
