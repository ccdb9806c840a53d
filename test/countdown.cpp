/**
 * Test case "countdown"
 * https://github.com/effect-handlers/effect-handlers-bench/blob/main/benchmarks/koka/countdown/main.kk
 * Counts a state cell down from "n" to "0" through get/put on its handle.
 */
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include "eff-scope.hpp"

using namespace effscope;

uint64_t countdown(const state<uint64_t>& s) {
  auto i = get(s);
  while (true) {
    i = get(s);
    if (i == 0) {
      return i;
    } else {
      put(s, i - 1);
    }
  }
}

uint64_t run(uint64_t n) {
  return run_pure([n] {
    return eval_state(n, [](const state<uint64_t>& s) { return countdown(s); });
  });
}

int main(int argc, char** argv) {
  auto size = argc > 1 ? std::stoi(argv[1]) : 1000;
  auto value = run(size);
  std::cout << value << std::endl;
  assert(value == 0);
  return 0;
}
