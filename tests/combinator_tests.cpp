#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cadence/cadence.hpp>

using namespace cadence;
using namespace std::chrono_literals;

static std::exception_ptr error(const char* what) {
  return std::make_exception_ptr(std::runtime_error(what));
}

int main() {
  // all: input order, not completion order
  {
    event_loop loop{{.sink = null_sink()}};
    promise<int> p1(loop), p2(loop), p3(loop);
    std::vector<int> got;
    all(loop, {p1, p2, p3}).then([&](const std::vector<int>& v) { got = v; });
    loop.set_timeout(30ms, [p1] { p1.resolve(1); });
    loop.set_timeout(10ms, [p2] { p2.resolve(2); });
    loop.set_timeout(20ms, [p3] { p3.resolve(3); });
    auto report = loop.run_to_completion();
    assert(report.ok());
    assert((got == std::vector<int>{1, 2, 3}));
  }

  // all: first rejection in time wins, the other inputs still settle
  {
    event_loop loop{{.sink = null_sink()}};
    promise<int> a(loop), b(loop), c(loop);
    bool fulfilled = false;
    std::string reason;
    bool c_settled = false;
    all(loop, {a, b, c})
      .then([&](const std::vector<int>&) { fulfilled = true; })
      .catch_([&](std::exception_ptr e) { reason = describe(e); });
    c.then([&](int) { c_settled = true; });
    loop.set_timeout(20ms, [a] { a.reject(error("a failed")); });
    loop.set_timeout(10ms, [b] { b.reject(error("b failed")); });
    loop.set_timeout(30ms, [c] { c.resolve(3); });
    auto report = loop.run_to_completion();
    assert(report.ok() && "inputs of all() count as handled");
    assert(!fulfilled);
    assert(reason == "b failed");
    assert(c_settled);
    assert(loop.now() == 30ms);
  }

  // all over void inputs and over nothing
  {
    event_loop loop{{.sink = null_sink()}};
    bool voids = false;
    bool empty = false;
    all(loop, std::vector<promise<void>>{loop.resolved(), delay(loop, 5ms)}).then([&] { voids = true; });
    all(loop, std::vector<promise<int>>{}).then([&](const std::vector<int>& v) { empty = v.empty(); });
    loop.run_to_completion();
    assert(voids);
    assert(empty);
  }

  // race: first to settle in time, whatever its position
  {
    event_loop loop{{.sink = null_sink()}};
    promise<std::string> slow(loop), fast(loop);
    std::string winner;
    race(loop, {slow, fast}).then([&](const std::string& s) { winner = s; });
    loop.set_timeout(50ms, [slow] { slow.resolve("slow"); });
    loop.set_timeout(10ms, [fast] { fast.resolve("fast"); });
    loop.run_to_completion();
    assert(winner == "fast");

    std::string lost_to;
    race(loop, {delay(loop, 20ms, 1), loop.rejected<int>(error("early"))})
      .catch_([&](std::exception_ptr e) { lost_to = describe(e); return 0; });
    auto report = loop.run_to_completion();
    assert(report.ok());
    assert(lost_to == "early");
  }

  // all_settled: one record per input, in order, never rejects
  {
    event_loop loop{{.sink = null_sink()}};
    std::vector<settled<std::string>> outcomes;
    all_settled(loop, std::vector<promise<std::string>>{
                          loop.resolved(std::string("ok1")),
                          loop.rejected<std::string>(error("e1")),
                          delay(loop, 5ms, std::string("ok2")),
                          loop.rejected<std::string>(error("e2")),
                      })
      .then([&](const std::vector<settled<std::string>>& v) { outcomes = v; });
    auto report = loop.run_to_completion();
    assert(report.ok());
    assert(outcomes.size() == 4);
    assert(outcomes[0].ok() && *outcomes[0].value == "ok1");
    assert(outcomes[1].status == settle_status::rejected && describe(outcomes[1].reason) == "e1");
    assert(outcomes[2].ok() && *outcomes[2].value == "ok2");
    assert(!outcomes[3].ok() && describe(outcomes[3].reason) == "e2");
  }

  std::cout << "[combinator_tests] OK\n";
  return 0;
}
