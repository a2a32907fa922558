#pragma once
#include <cstddef>
#include <initializer_list>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <cadence/core/promise.hpp>

namespace cadence {

enum class settle_status { fulfilled, rejected };

template <class T>
struct settled {
  settle_status status{settle_status::fulfilled};
  std::optional<detail::stored_t<T>> value; // set when fulfilled
  std::exception_ptr reason;                // set when rejected

  bool ok() const noexcept { return status == settle_status::fulfilled; }
};

// all_settled(ctx, {p1, p2, ...}): one outcome record per input, in input
// order, once every input has settled. Never rejects.
template <class T>
promise<std::vector<settled<T>>> all_settled(promise_context& ctx, std::vector<promise<T>> inputs) {
  using R = std::vector<settled<T>>;
  promise<R> out(ctx);

  if (inputs.empty()) {
    out.resolve(R{});
    return out;
  }

  struct state_t {
    R outcomes;
    std::size_t remaining{0};
  };
  auto st = std::make_shared<state_t>();
  st->outcomes.resize(inputs.size());
  st->remaining = inputs.size();

  for (std::size_t i = 0; i < inputs.size(); ++i) {
    inputs[i].on_settled([st, out, i](const promise<T>& p) {
      auto& slot = st->outcomes[i];
      if (p.state() == promise_state::fulfilled) {
        slot.status = settle_status::fulfilled;
        slot.value.emplace(p.value());
      } else {
        slot.status = settle_status::rejected;
        slot.reason = p.error();
      }
      if (--st->remaining == 0) out.resolve(std::move(st->outcomes));
    });
  }
  return out;
}

template <class T>
promise<std::vector<settled<T>>> all_settled(promise_context& ctx,
                                             std::initializer_list<promise<T>> inputs) {
  return all_settled(ctx, std::vector<promise<T>>(inputs));
}

} // namespace cadence
