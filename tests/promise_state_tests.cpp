#include <cassert>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <cadence/cadence.hpp>

using namespace cadence;

int main() {
  event_loop loop{{.sink = null_sink()}};
  std::vector<std::string> log;

  // settlement happens once
  promise<int> p(loop);
  assert(p.is_pending());
  p.resolve(1);
  assert(p.state() == promise_state::fulfilled && p.value() == 1);
  p.resolve(2);
  p.reject(std::make_exception_ptr(std::runtime_error("late")));
  assert(p.state() == promise_state::fulfilled && p.value() == 1);

  promise<int> r(loop);
  r.reject(std::make_exception_ptr(std::runtime_error("no")));
  r.resolve(3);
  assert(r.state() == promise_state::rejected);
  assert(describe(r.error()) == "no");
  r.catch_([](std::exception_ptr) { return 0; });

  bool read_early = false;
  try {
    promise<int> pending(loop);
    (void)pending.value();
  } catch (const std::logic_error&) {
    read_early = true;
  }
  assert(read_early && "value() of a pending promise throws");

  // a throwing resolver rejects the promise
  auto thrown = loop.make_promise<int>([](auto, auto) { throw std::runtime_error("in resolver"); });
  assert(thrown.state() == promise_state::rejected);
  assert(describe(thrown.error()) == "in resolver");
  thrown.catch_([](std::exception_ptr) { return 0; });

  // ... unless it already resolved
  auto early = loop.make_promise<int>([](auto resolve, auto) {
    resolve(7);
    throw std::runtime_error("ignored");
  });
  assert(early.state() == promise_state::fulfilled && early.value() == 7);

  // flush the catch_ reactions queued above
  loop.run_to_completion();
  assert(loop.pending_microtasks() == 0);

  // handlers on a settled promise: nothing runs synchronously, one microtask each, in order
  auto settled = loop.resolved(5);
  settled.then([&](int v) { log.push_back("first:" + std::to_string(v)); });
  settled.then([&](int v) { log.push_back("second:" + std::to_string(v)); });
  assert(log.empty());
  assert(loop.pending_microtasks() == 2);
  auto report = loop.run_to_completion();
  assert(report.ok());
  assert((log == std::vector<std::string>{"first:5", "second:5"}));

  // waiters registered while pending are queued at settlement, in registration order
  log.clear();
  promise<void> gate(loop);
  gate.then([&] { log.push_back("w1"); });
  gate.then([&] { log.push_back("w2"); });
  assert(loop.pending_microtasks() == 0);
  gate.resolve();
  assert(loop.pending_microtasks() == 2);
  loop.run_to_completion();
  assert((log == std::vector<std::string>{"w1", "w2"}));

  // resolving with itself is a chaining cycle
  promise<int> self(loop);
  self.resolve(self);
  assert(self.state() == promise_state::rejected);
  bool cycle = false;
  try {
    std::rethrow_exception(self.error());
  } catch (const std::logic_error&) {
    cycle = true;
  }
  assert(cycle);
  self.catch_([](std::exception_ptr) { return 0; });

  // adoption locks the outer promise onto the inner one
  promise<int> outer(loop), inner(loop);
  outer.resolve(inner);
  outer.resolve(9);
  outer.reject(std::make_exception_ptr(std::runtime_error("ignored")));
  assert(outer.is_pending());
  inner.resolve(4);
  loop.run_to_completion();
  assert(outer.state() == promise_state::fulfilled && outer.value() == 4);

  // adopting a rejection
  promise<int> follower(loop), leader(loop);
  follower.resolve(leader);
  leader.reject(std::make_exception_ptr(std::runtime_error("leader failed")));
  std::string seen;
  follower.catch_([&](std::exception_ptr e) { seen = describe(e); return 0; });
  loop.run_to_completion();
  assert(seen == "leader failed");

  // copies share state
  promise<std::string> original(loop);
  auto copy = original;
  copy.resolve("shared");
  assert(original.value() == "shared");
  assert(copy == original);

  // a promise that never settles is freed with its last handle, reactions included
  std::weak_ptr<int> watch;
  {
    auto token = std::make_shared<int>(1);
    watch = token;
    promise<int> never(loop);
    never.then([token](int v) { return v + *token; });
    never.finally([token] {});
    never.on_settled([token](const promise<int>&) {});
    promise<int> follower(loop);
    follower.resolve(never);
  }
  loop.run_to_completion();
  assert(watch.expired());

  std::cout << "[promise_state_tests] OK\n";
  return 0;
}
