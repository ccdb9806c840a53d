#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include "eff-scope/handle.hpp"

namespace effscope {

struct pure_region {};

template <typename R>
class eff;

template <typename T>
struct is_eff : std::false_type {};

template <typename R>
struct is_eff<eff<R>> : std::true_type {};

// An inert computation: the scopes it needs plus the steps that produce an
// `R`. Nothing happens until `run` or `run_pure` executes it.
template <typename R>
class eff {
  template <typename>
  friend class eff;

  struct composed {};

  scope_set scopes_required;
  // Opens its own regions.
  std::function<R()> thunk;

  eff(composed, scope_set required, std::function<R()> thunk)
      : scopes_required(std::move(required)), thunk(std::move(thunk)) {}

  // Runs `fn` in a region that only lets this computation's scopes through.
  template <typename F>
  static auto in_region(const scope_set& allowed, F&& fn) {
    auto region = open_region(typeid(eff), allowed);
    auto guard = sg::make_scope_guard([region]() noexcept { close_scope(region); });
    return std::forward<F>(fn)();
  }

  template <typename K>
  decltype(auto) execute_into(K&& k) const {
    if constexpr (std::is_void_v<R>) {
      execute();
      return std::forward<K>(k)();
    } else {
      return std::forward<K>(k)(execute());
    }
  }

 public:
  typedef R result_type;

  eff(scope_set required, std::function<R()> fn)
      : scopes_required(std::move(required)),
        thunk([allowed = scopes_required, fn = std::move(fn)]() -> R {
          return in_region(allowed, fn);
        }) {}

  // The scopes checked before this computation starts. A step chained with
  // `then` that returns an `eff` has its own scopes checked when it is
  // reached.
  const scope_set& required() const { return scopes_required; }

  // Sequences `next` after this computation. `next` receives the result
  // (nothing, for `eff<void>`) and runs with this computation's scope set.
  // If it returns an `eff`, that computation is run in turn, under its own
  // scope set, and its result is the result of the chain.
  template <typename F>
  auto then(F next) const {
    using next_t = std::conditional_t<std::is_void_v<R>,
        std::invoke_result<F>, std::invoke_result<F, R>>;
    using S = std::remove_cvref_t<typename next_t::type>;
    auto step = [allowed = scopes_required, next](auto&&... value) -> S {
      return in_region(allowed, [&]() -> S {
        return next(std::forward<decltype(value)>(value)...);
      });
    };
    auto first = *this;
    if constexpr (is_eff<S>::value) {
      using T = typename S::result_type;
      return eff<T>(typename eff<T>::composed{}, scopes_required,
          [first, step]() -> T {
            S inner = first.execute_into(step);
            for (auto tag : inner.required()) {
              check_scope(tag, "eff::then");
            }
            return inner.execute();
          });
    } else {
      return eff<S>(typename eff<S>::composed{}, scopes_required,
          [first, step]() -> S { return first.execute_into(step); });
    }
  }

  R execute() const { return thunk(); }
};

// Builds a computation that may use exactly `handles`.
template <typename F, typename... Hs>
  requires(std::invocable<F> && (is_handle<Hs> && ...))
auto delay(F fn, const Hs&... handles) {
  scope_set required;
  (required.merge(handles.scopes()), ...);
  return eff<std::invoke_result_t<F>>(std::move(required), std::move(fn));
}

template <typename F>
  requires std::invocable<F>
auto pure(F fn) {
  return eff<std::invoke_result_t<F>>({}, std::move(fn));
}

// Executes `computation` in the current context. Every scope it requires
// must be usable here; while it runs, handles outside its scope set are
// rejected.
template <typename R>
R run(const eff<R>& computation) {
  for (auto tag : computation.required()) {
    check_scope(tag, "eff::run");
  }
  return computation.execute();
}

// The escape hatch: only a computation with no unhandled scopes can be turned
// into a plain value. A non-empty scope set is rejected before anything runs.
template <typename R>
R run_pure(const eff<R>& computation) {
  if (!computation.required().empty()) {
    fatal_scope_violation(*computation.required().begin(), "run_pure",
        "computation still requires open scopes");
  }
  auto region = open_region(typeid(pure_region), {});
  auto guard = sg::make_scope_guard([region]() noexcept { close_scope(region); });
  return computation.execute();
}

template <typename F>
  requires std::invocable<F>
auto run_pure(F&& fn) {
  return run_pure(pure(std::forward<F>(fn)));
}

}  // namespace effscope
