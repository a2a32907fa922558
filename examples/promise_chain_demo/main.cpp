#include <cadence/cadence.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cadence;
using namespace std::chrono_literals;

struct user { int id; std::string name; };
struct post { int id; std::string title; };

// Simulated API calls answering after a fixed latency.
static promise<user> fetch_user(event_loop& loop, int id) {
  std::cout << "[" << loop.now().count() << "ms] fetching user " << id << "\n";
  return delay(loop, 100ms, user{id, "Alice"});
}

static promise<std::vector<post>> fetch_posts(event_loop& loop, int user_id) {
  std::cout << "[" << loop.now().count() << "ms] fetching posts of user " << user_id << "\n";
  return delay(loop, 150ms, std::vector<post>{{1, "First Post"}, {2, "Second Post"}});
}

static promise<std::string> flaky(event_loop& loop, std::string endpoint, duration latency, bool succeed) {
  return loop.make_promise<std::string>([&loop, endpoint, latency, succeed](auto resolve, auto reject) {
    loop.set_timeout(latency, [endpoint, succeed, resolve, reject] {
      if (succeed)
        resolve("data from " + endpoint);
      else
        reject(std::make_exception_ptr(std::runtime_error("failed to fetch " + endpoint)));
    });
  });
}

static promise<std::string> sequential(event_loop& loop) {
  const user u = co_await fetch_user(loop, 123);
  const auto posts = co_await fetch_posts(loop, u.id);
  co_return u.name + " wrote " + std::to_string(posts.size()) + " posts";
}

int main() {
  event_loop loop;

  fetch_user(loop, 123)
    .then([&](const user& u) { return fetch_posts(loop, u.id); })
    .then([&](const std::vector<post>& posts) {
      std::cout << "[" << loop.now().count() << "ms] first post: " << posts.front().title << "\n";
    })
    .catch_([](std::exception_ptr e) { std::cout << "chain failed: " << describe(e) << "\n"; });

  all(loop, {flaky(loop, "/api/user", 100ms, true), flaky(loop, "/api/posts", 150ms, true)})
    .then([&](const std::vector<std::string>& v) {
      std::cout << "[" << loop.now().count() << "ms] all: " << v[0] << ", " << v[1] << "\n";
    });

  race(loop, {flaky(loop, "fast", 50ms, true), flaky(loop, "slow", 300ms, true)})
    .then([&](const std::string& s) { std::cout << "[" << loop.now().count() << "ms] race winner: " << s << "\n"; });

  all_settled(loop, {flaky(loop, "/a", 10ms, true), flaky(loop, "/b", 20ms, false)})
    .then([](const std::vector<settled<std::string>>& results) {
      for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].ok())
          std::cout << "  settled " << i << " ok: " << *results[i].value << "\n";
        else
          std::cout << "  settled " << i << " failed: " << describe(results[i].reason) << "\n";
      }
    });

  (flaky(loop, "/slow", 500ms, true) | timeout(loop, 200ms))
    .catch_([](std::exception_ptr e) { return "gave up: " + describe(e); })
    .then([](const std::string& s) { std::cout << s << "\n"; });

  sequential(loop).then([&](const std::string& s) {
    std::cout << "[" << loop.now().count() << "ms] " << s << "\n";
  });

  auto report = loop.run_to_completion();
  std::cout << "done at " << report.finished_at.count() << "ms\n";
  return report.ok() ? 0 : 1;
}
