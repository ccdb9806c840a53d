#pragma once

#include <concepts>
#include <cstdint>
#include <utility>
#include "eff-scope/compound.hpp"
#include "eff-scope/io.hpp"
#include "eff-scope/state.hpp"
#include "fmt/core.h"

namespace effscope {

// Any handle that can be bumped and read back is a counter, whatever it is
// made of.
template <typename C>
concept counter = is_handle<C> && requires(const C& c) {
  increment(c);
  { count(c) } -> std::convertible_to<int64_t>;
};

struct state_counter {
  compound<state<int64_t>> handles;

  scope_set scopes() const { return handles.scopes(); }
};

inline void increment(const state_counter& c) {
  modify(get<0>(c.handles), [](int64_t n) { return n + 1; });
}

inline int64_t count(const state_counter& c) {
  return get(get<0>(c.handles));
}

// Reports every increment on the io handle it was built with.
struct logging_counter {
  compound<state<int64_t>, io> handles;

  scope_set scopes() const { return handles.scopes(); }
};

inline void increment(const logging_counter& c) {
  const auto& [cell, console] = c.handles;
  modify(cell, [](int64_t n) { return n + 1; });
  put_line(console, fmt::format("counter = {}", get(cell)));
}

inline int64_t count(const logging_counter& c) {
  return get(get<0>(c.handles));
}

// Both handlers return (body result, final count).
template <typename Body>
auto run_counter(int64_t initial, Body&& body) {
  return run_state(initial, [&](const state<int64_t>& cell) {
    return invoke_unit(
        std::forward<Body>(body), state_counter{bundle(cell)});
  });
}

template <typename Body>
auto run_logging_counter(const io& console, int64_t initial, Body&& body) {
  return run_state(initial, [&](const state<int64_t>& cell) {
    return invoke_unit(
        std::forward<Body>(body), logging_counter{bundle(cell, console)});
  });
}

}  // namespace effscope
