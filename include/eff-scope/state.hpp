#pragma once

#include <functional>
#include <utility>
#include "eff-scope/handle.hpp"

namespace effscope {

// A mutable cell owned by the `run_state`/`eval_state` frame that created it.
template <typename T>
class state : public handle_base {
  T* cell;

 public:
  typedef T value_type;

  state(scope_tag scope, T& cell) : handle_base(scope), cell(&cell) {}

  T& access(const char* operation) const {
    check(operation);
    return *cell;
  }
};

template <typename T>
T get(const state<T>& s) {
  return s.access("state::get");
}

template <typename T, typename V>
void put(const state<T>& s, V&& value) {
  s.access("state::put") = std::forward<V>(value);
}

// Not atomic: `f` may itself operate on `s`, and its result overwrites the
// cell afterwards.
template <typename T, typename F>
void modify(const state<T>& s, F&& f) {
  T next = std::invoke(std::forward<F>(f), get(s));
  put(s, std::move(next));
}

// Runs `body` with a fresh cell holding `initial`. Returns the body's result
// and the final cell value.
template <typename T, typename Body>
auto run_state(T initial, Body&& body) {
  T cell = std::move(initial);
  auto [final_value, result] = run_handler<state<T>>(
      [&](scope_tag tag) { return state<T>(tag, cell); },
      std::forward<Body>(body), [&] { return cell; });
  return std::make_pair(std::move(result), std::move(final_value));
}

template <typename T, typename Body>
auto eval_state(T initial, Body&& body) {
  return run_state(std::move(initial), std::forward<Body>(body)).first;
}

}  // namespace effscope
