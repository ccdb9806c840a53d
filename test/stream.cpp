#include <cassert>
#include <string>
#include <utility>
#include <vector>
#include "eff-scope.hpp"
#include "fmt/core.h"

using namespace effscope;

void collects_in_order() {
  auto [items, result] = yield_to_list<int>([](const stream<int>& s) {
    in_foldable(std::vector<int>{3, 1, 2}, s);
    yield_(s, 9);
    return 7;
  });
  assert((items == std::vector<int>{3, 1, 2, 9}));
  assert(result == 7);
}

void enumerates() {
  typedef std::pair<std::size_t, std::string> numbered;
  auto [items, result] = yield_to_list<numbered>([](const stream<numbered>& out) {
    enumerate<std::string>(
        [](const stream<std::string>& s) {
          yield_(s, "a");
          yield_(s, "b");
        },
        out);
  });
  assert(items.size() == 2);
  assert(items[0] == numbered(0, "a"));
  assert(items[1] == numbered(1, "b"));
  assert(result == unit_t{});
}

void nested_streams_stay_apart() {
  std::vector<int> evens, odds;
  for_each<int>(
      [&](const stream<int>& even) {
        for_each<int>(
            [&](const stream<int>& odd) {
              for (int i = 0; i < 6; i++) {
                yield_(i % 2 == 0 ? even : odd, i);
              }
            },
            [&](int v) { odds.push_back(v); });
      },
      [&](int v) { evens.push_back(v); });
  assert((evens == std::vector<int>{0, 2, 4}));
  assert((odds == std::vector<int>{1, 3, 5}));
}

void callbacks_see_handles_outside_body_regions() {
  auto total = eval_state(0, [](const state<int>& sum) {
    for_each<int>(
        [](const stream<int>& s) {
          run(delay(
              [s] {
                yield_(s, 1);
                yield_(s, 2);
              },
              s));
        },
        [&](int v) { modify(sum, [v](int n) { return n + v; }); });
    return get(sum);
  });
  assert(total == 3);
}

int main() {
  collects_in_order();
  enumerates();
  nested_streams_stay_apart();
  callbacks_see_handles_outside_body_regions();
  fmt::print("stream: ok\n");
  return 0;
}
