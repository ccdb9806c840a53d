#pragma once

#include <concepts>
#include <functional>
#include <scope_guard.hpp>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include "eff-scope/scope.hpp"
#include "eff-scope/trace.hpp"

namespace effscope {

// Result of a computation that returns nothing.
class unit_t {
 public:
  friend bool operator==(unit_t, unit_t) { return true; }
};

template <typename T>
using lift_void_t = std::conditional_t<std::is_void_v<T>, unit_t, T>;

template <typename F, typename... Args>
lift_void_t<std::remove_cvref_t<std::invoke_result_t<F, Args...>>> invoke_unit(
    F&& f,
    Args&&... args) {
  if constexpr (std::is_void_v<std::invoke_result_t<F, Args...>>) {
    std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
    return unit_t{};
  } else {
    return std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
  }
}

// Anything bound to one or more scopes. Compound handles qualify as well as
// the primitive ones, so operations are written against this concept.
template <typename H>
concept is_handle = requires(const H& h) {
  { h.scopes() } -> std::convertible_to<scope_set>;
};

class handle_base {
 protected:
  scope_tag scope;

  explicit handle_base(scope_tag scope) : scope(scope) {}

  void check(const char* operation) const { check_scope(scope, operation); }

 public:
  scope_tag tag() const { return scope; }
  scope_set scopes() const { return {scope}; }
  bool valid() const { return is_visible(scope); }
};

// Runs `body` inside a fresh scope of capability `Kind`. The scope is closed
// on every exit path, so unwinding through here tears it down too.
template <typename Kind, typename F>
auto with_scope(F&& body) -> decltype(std::forward<F>(body)(scope_tag{})) {
  auto tag = mint_scope(typeid(Kind));
  auto guard = sg::make_scope_guard([tag]() noexcept { close_scope(tag); });
  return std::forward<F>(body)(tag);
}

// The generic handler: mint a scope, build its handle, run the body with it,
// finalize while the scope is still open, close the scope. Returns
// (finalization result, body result).
template <typename Handle, typename MakeHandle, typename Body, typename Finalize>
  requires std::invocable<MakeHandle, scope_tag>
auto run_handler(MakeHandle&& make_handle, Body&& body, Finalize&& finalize) {
  return with_scope<Handle>([&](scope_tag tag) {
    Handle handle = make_handle(tag);
    auto result = invoke_unit(std::forward<Body>(body), handle);
    auto final_value = invoke_unit(std::forward<Finalize>(finalize));
    return std::pair<decltype(final_value), decltype(result)>(
        std::move(final_value), std::move(result));
  });
}

}  // namespace effscope
