#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "eff-scope/coroutine.hpp"

namespace effscope {

// A coroutine that only produces values.
template <typename T>
using stream = coroutine<T, unit_t>;

template <typename T, typename V>
void yield_(const stream<T>& s, V&& value) {
  s.request("stream::yield", T(std::forward<V>(value)));
}

// Collects everything `body` yields, in order, next to its result.
template <typename T, typename Body>
auto yield_to_list(Body&& body) {
  std::vector<T> items;
  auto result = for_each<T>(std::forward<Body>(body),
      [&](T value) { items.push_back(std::move(value)); });
  return std::make_pair(std::move(items), std::move(result));
}

template <typename Range, typename T>
void in_foldable(const Range& range, const stream<T>& s) {
  for (const auto& item : range) {
    yield_(s, item);
  }
}

// Re-yields every value of `body` on `s`, numbered from 0.
template <typename T, typename Body>
auto enumerate(Body&& body, const stream<std::pair<std::size_t, T>>& s) {
  std::size_t index = 0;
  return for_each<T>(std::forward<Body>(body),
      [&](T value) { yield_(s, std::make_pair(index++, std::move(value))); });
}

}  // namespace effscope
