#pragma once

#include <cstddef>
#include <tuple>
#include <utility>
#include "eff-scope/handle.hpp"

namespace effscope {

// A bundle of handles passed around as one. Holds nothing but its members;
// each member keeps its own scope check.
template <typename... Hs>
  requires(is_handle<Hs> && ...)
class compound {
  std::tuple<Hs...> members;

 public:
  explicit compound(Hs... hs) : members(std::move(hs)...) {}

  scope_set scopes() const {
    scope_set result;
    std::apply(
        [&](const Hs&... hs) { (result.merge(hs.scopes()), ...); }, members);
    return result;
  }

  template <std::size_t I>
  const std::tuple_element_t<I, std::tuple<Hs...>>& get() const {
    return std::get<I>(members);
  }
};

template <typename... Hs>
  requires(is_handle<Hs> && ...)
compound<Hs...> bundle(Hs... hs) {
  return compound<Hs...>(std::move(hs)...);
}

template <std::size_t I, typename... Hs>
const auto& get(const compound<Hs...>& c) {
  return c.template get<I>();
}

}  // namespace effscope

template <typename... Hs>
struct std::tuple_size<effscope::compound<Hs...>>
    : std::integral_constant<std::size_t, sizeof...(Hs)> {};

template <std::size_t I, typename... Hs>
struct std::tuple_element<I, effscope::compound<Hs...>> {
  using type = std::tuple_element_t<I, std::tuple<Hs...>>;
};
