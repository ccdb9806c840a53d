// Test case "iterator"
// https://github.com/effect-handlers/effect-handlers-bench/blob/main/benchmarks/koka/iterator/main.kk

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include "eff-scope.hpp"

using namespace effscope;

void range(const stream<int>& emit, int l, int u) {
  for (; l <= u; l++) {
    yield_(emit, l);
  }
}

uint64_t run(int n) {
  uint64_t s = 0;
  for_each<int>([&](const stream<int>& emit) { range(emit, 0, n); },
      [&s](int e) { s += e; });
  return s;
}

int main(int argc, char** argv) {
  auto size = argc > 1 ? std::stoi(argv[1]) : 40000;
  auto value = run(size);
  std::cout << value << std::endl;
  assert(value == static_cast<uint64_t>(size) * (size + 1) / 2);
  return 0;
}
