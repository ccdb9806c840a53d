#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include "eff-scope/handle.hpp"

namespace effscope {

// A coroutine seen from the inside: yielding an `Out` is a request that the
// handler answers with an `In`.
template <typename Out, typename In>
class coroutine : public handle_base {
  const std::function<In(Out)>* respond;

 public:
  typedef Out output_type;
  typedef In input_type;

  coroutine(scope_tag scope, const std::function<In(Out)>& respond)
      : handle_base(scope), respond(&respond) {}

  In request(const char* operation, Out value) const {
    check(operation);
    return (*respond)(std::move(value));
  }
};

template <typename Out, typename In, typename V>
In yield_coroutine(const coroutine<Out, In>& co, V&& value) {
  return co.request("coroutine::yield", Out(std::forward<V>(value)));
}

// Runs `body` with a coroutine handle; every yield calls `on_yield`. When
// `In` is unit_t, `on_yield` may return nothing. `on_yield` sees the handles
// visible where `for_each` was called, whatever regions the body has opened.
template <typename Out, typename In = unit_t, typename Body, typename OnYield>
auto for_each(Body&& body, OnYield&& on_yield) {
  return with_scope<coroutine<Out, In>>([&](scope_tag tag) {
    std::function<In(Out)> respond = [&](Out value) -> In {
      region_view view(tag.depth);
      if constexpr (std::is_same_v<In, unit_t>) {
        invoke_unit(on_yield, std::move(value));
        return unit_t{};
      } else {
        return on_yield(std::move(value));
      }
    };
    return invoke_unit(
        std::forward<Body>(body), coroutine<Out, In>(tag, respond));
  });
}

}  // namespace effscope
