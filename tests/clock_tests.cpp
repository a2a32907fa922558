#include <cassert>
#include <chrono>
#include <iostream>
#include <cadence/cadence.hpp>

using namespace cadence;
using namespace std::chrono_literals;

int main() {
  logical_clock clock;
  assert(clock.now() == 0ms);

  clock.advance_to(5ms);
  assert(clock.now() == 5ms);

  // standing still is allowed
  clock.advance_to(5ms);
  assert(clock.now() == 5ms);

  bool regressed = false;
  try {
    clock.advance_to(3ms);
  } catch (const time_regression_error&) {
    regressed = true;
  }
  assert(regressed && "moving backwards must throw");
  assert(clock.now() == 5ms && "a failed advance leaves the clock alone");

  // time_regression_error is one of the fatal errors the loop never swallows
  bool fatal = false;
  try {
    clock.advance_to(0ms);
  } catch (const fatal_error&) {
    fatal = true;
  }
  assert(fatal);

  logical_clock late{100ms};
  assert(late.now() == 100ms);

  std::cout << "[clock_tests] OK\n";
  return 0;
}
