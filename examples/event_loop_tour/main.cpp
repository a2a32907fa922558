#include <cadence/cadence.hpp>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>

using namespace cadence;
using namespace std::chrono_literals;

namespace {

void say(const event_loop& loop, const std::string& what) {
  std::cout << "  [" << loop.now().count() << "ms] " << what << "\n";
}

void section(const char* title) { std::cout << "\n" << title << "\n"; }

promise<void> async_example(event_loop& loop) {
  say(loop, "async function started");
  co_await loop.resolved();
  say(loop, "after await");
  co_await loop.resolved();
  say(loop, "after second await");
}

} // namespace

int main() {
  event_loop loop;

  section("1) sync first, then microtasks, then timers");
  loop.submit([&] {
    say(loop, "step 1: synchronous");
    loop.set_timeout(0ms, [&] { say(loop, "step 2: setTimeout callback"); });
    loop.resolved().then([&] { say(loop, "step 3: promise callback"); });
    say(loop, "step 4: more synchronous");
    loop.resolved().then([&] { say(loop, "step 5: another promise callback"); });
    loop.set_timeout(0ms, [&] { say(loop, "step 6: another setTimeout callback"); });
    say(loop, "step 7: final synchronous");
  });
  loop.run_to_completion();

  section("2) nested microtasks drain before the timer");
  loop.submit([&] {
    loop.resolved().then([&] {
      say(loop, "first promise callback");
      loop.resolved().then([&] { say(loop, "nested promise callback"); });
      say(loop, "code inside first promise callback");
    });
    loop.set_timeout(0ms, [&] { say(loop, "setTimeout callback"); });
    say(loop, "synchronous code");
  });
  loop.run_to_completion();

  section("3) async/await and the loop");
  loop.submit([&] {
    async_example(loop);
    loop.set_timeout(0ms, [&] { say(loop, "setTimeout in async example"); });
    say(loop, "synchronous code after async call");
  });
  loop.run_to_completion();

  section("4) interval with fixed cadence vs recursive timeout");
  int ticks = 0;
  timer_handle interval;
  int recursions = 0;
  std::function<void()> recursive = [&] {
    say(loop, "recursive timeout " + std::to_string(++recursions));
    if (recursions < 3) loop.set_timeout(1000ms, recursive);
  };
  loop.submit([&] {
    interval = loop.set_interval(1000ms, [&] {
      say(loop, "interval tick " + std::to_string(++ticks));
      if (ticks >= 3) loop.clear_interval(interval);
    });
    loop.set_timeout(1500ms, recursive);
  });
  loop.run_to_completion();

  section("5) cancelling a timeout");
  loop.submit([&] {
    auto doomed = loop.set_timeout(5000ms, [&] { say(loop, "this never runs"); });
    loop.set_timeout(1000ms, [&loop, doomed] {
      loop.clear_timeout(doomed);
      say(loop, "timeout cancelled");
    });
  });
  auto report = loop.run_to_completion();

  std::cout << "\nfinished at " << report.finished_at.count() << "ms, "
            << report.units_run << " units run, " << report.errors.size() << " errors\n";
  return 0;
}
