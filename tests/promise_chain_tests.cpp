#include <algorithm>
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

static bool has(const std::vector<std::string>& log, const std::string& s) {
  return std::find(log.begin(), log.end(), s) != log.end();
}

int main() {
  event_loop loop{{.sink = null_sink()}};
  std::vector<std::string> log;

  // values flow through the chain, changing type on the way
  loop.resolved(2)
    .then([](int v) { return v * 10; })
    .then([](int v) { return std::to_string(v); })
    .then([&](const std::string& s) { log.push_back("chain:" + s); });

  // a handler returning a promise is chained, not nested
  int adopted = 0;
  promise<int> later(loop);
  loop.resolved(1)
    .then([later](int) { return later; })
    .then([&](int v) { adopted = v; });
  loop.set_timeout(5ms, [later] { later.resolve(99); });

  // a throw skips fulfilment handlers down to the next catch_
  loop.resolved(1)
    .then([](int) -> int { throw std::runtime_error("bad step"); })
    .then([&](int v) { log.push_back("skipped"); return v; })
    .catch_([&](std::exception_ptr e) { log.push_back("caught:" + describe(e)); return -1; })
    .then([&](int v) { log.push_back("recovered:" + std::to_string(v)); });

  // two-handler then
  loop.rejected<int>(std::make_exception_ptr(std::runtime_error("x")))
    .then([](int v) { return v; }, [](std::exception_ptr) { return 7; })
    .then([&](int v) { log.push_back("two-arg:" + std::to_string(v)); });

  // finally passes the outcome through
  std::string fin;
  loop.resolved(std::string("v"))
    .finally([&] { fin += "f"; })
    .then([&](const std::string& s) { fin += s; });
  bool still_rejected = false;
  loop.rejected<int>(std::make_exception_ptr(std::runtime_error("r")))
    .finally([&] { fin += "g"; })
    .catch_([&](std::exception_ptr) { still_rejected = true; return 0; });

  // ... unless it throws itself
  std::string finally_error;
  loop.resolved(1)
    .finally([] { throw std::runtime_error("finally failed"); })
    .catch_([&](std::exception_ptr e) { finally_error = describe(e); return 0; });

  auto report = loop.run_to_completion();
  assert(report.ok());
  assert(has(log, "chain:20"));
  assert(adopted == 99);
  assert(loop.now() == 5ms);
  assert(!has(log, "skipped"));
  assert(has(log, "caught:bad step"));
  assert(has(log, "recovered:-1"));
  assert(has(log, "two-arg:7"));
  assert(fin == "fgv");
  assert(still_rejected);
  assert(finally_error == "finally failed");

  // two chains interleave one step per microtask turn
  log.clear();
  loop.resolved().then([&] { log.push_back("a1"); }).then([&] { log.push_back("a2"); });
  loop.resolved().then([&] { log.push_back("b1"); }).then([&] { log.push_back("b2"); });
  loop.run_to_completion();
  assert((log == std::vector<std::string>{"a1", "b1", "a2", "b2"}));

  // void chains returning promise<void>
  bool waited = false;
  loop.resolved()
    .then([&] { return delay(loop, 10ms); })
    .then([&] { waited = true; });
  loop.run_to_completion();
  assert(waited);
  assert(loop.now() == 15ms);

  std::cout << "[promise_chain_tests] OK\n";
  return 0;
}
