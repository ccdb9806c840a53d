#pragma once

#include <cstdint>
#include <utility>
#include "eff-scope/either.hpp"
#include "eff-scope/handle.hpp"

namespace effscope {

namespace detail {
// Thrown to unwind to the handler that minted `scope_id`. Deliberately not
// derived from std::exception so that ordinary catch handlers pass it on.
struct effect_signal {
  uint64_t scope_id;
};

template <typename E>
struct exception_signal : effect_signal {
  E value;
};
}  // namespace detail

// One typed failure channel.
template <typename E>
class exception : public handle_base {
 public:
  typedef E value_type;

  explicit exception(scope_tag scope) : handle_base(scope) {}

  template <typename V>
  [[noreturn]] void raise(const char* operation, V&& value) const {
    check(operation);
#ifdef EFF_SCOPE_TRACE
    fmt::print(stderr, "[eff-scope] {} to scope #{}\n", operation, scope.id);
#endif
    throw detail::exception_signal<E>{{scope.id}, E(std::forward<V>(value))};
  }
};

template <typename E, typename V>
[[noreturn]] void throw_(const exception<E>& ex, V&& value) {
  ex.raise("exception::throw", std::forward<V>(value));
}

namespace detail {
// `Kind` names the scope in diagnostics, so the restricted forms built on
// exceptions (early return, jump) show up as themselves.
template <typename Kind, typename E, typename Body>
auto try_scope(Body&& body) {
  using R = lift_void_t<
      std::remove_cvref_t<std::invoke_result_t<Body, const exception<E>&>>>;
  return with_scope<Kind>([&](scope_tag tag) -> either<E, R> {
    try {
      return either<E, R>::right(
          invoke_unit(std::forward<Body>(body), exception<E>(tag)));
    } catch (exception_signal<E>& signal) {
      if (signal.scope_id != tag.id) {
        throw;
      }
#ifdef EFF_SCOPE_TRACE
      fmt::print(stderr, "[eff-scope] caught at scope #{}\n", tag.id);
#endif
      return either<E, R>::left(std::move(signal.value));
    }
  });
}
}  // namespace detail

// `Left(e)` if `body` threw `e` on the handle it was given, `Right(r)` if it
// returned `r`. Throws on other exception handles pass through.
template <typename E, typename Body>
auto try_(Body&& body) {
  return detail::try_scope<exception<E>, E>(std::forward<Body>(body));
}

template <typename E, typename OnError, typename Body>
auto handle_(OnError&& on_error, Body&& body) {
  auto outcome = try_<E>(std::forward<Body>(body));
  using R = typename decltype(outcome)::right_type;
  if (outcome.is_left()) {
    return R(invoke_unit(
        std::forward<OnError>(on_error), std::move(outcome).left_value()));
  }
  return std::move(outcome).right_value();
}

template <typename E, typename Body, typename OnError>
auto catch_(Body&& body, OnError&& on_error) {
  return handle_<E>(std::forward<OnError>(on_error), std::forward<Body>(body));
}

// `release` runs after `body` however it exits, including when an exception,
// early return or jump unwinds through it. `release` may raise effects of its
// own; one raised while unwinding replaces the effect that was unwinding.
template <typename Acquire, typename Release, typename Body>
auto bracket(Acquire&& acquire, Release&& release, Body&& body) {
  auto resource = acquire();
  auto result = [&] {
    try {
      return invoke_unit(std::forward<Body>(body), resource);
    } catch (...) {
      release(resource);
      throw;
    }
  }();
  release(resource);
  return result;
}

}  // namespace effscope
