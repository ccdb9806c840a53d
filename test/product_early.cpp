// product_early
// https://github.com/effect-handlers/effect-handlers-bench/blob/main/benchmarks/koka/product_early/main.kk

#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "eff-scope.hpp"

using namespace effscope;

int destroyed = 0;
struct RAII {
  ~RAII() { destroyed++; }
};

int product(const early_return<int>& abort,
    std::vector<int>::const_iterator xs_begin,
    std::vector<int>::const_iterator xs_end) {
  RAII raii;
  int product = 1;
  for (auto it = xs_begin; it != xs_end; it++) {
    if (*it == 0) {
      return_early(abort, 0);
    } else {
      product *= *it;
    }
  }
  return product;
}

int run_product(const std::vector<int>& xs) {
  return with_early_return<int>([&](const early_return<int>& abort) {
    return product(abort, xs.begin(), xs.end());
  });
}

int run(int n) {
  std::vector<int> xs(1001);
  for (int i = 0; i <= 1000; i++) {
    xs[i] = 1000 - i;
  }

  int sum = 0;
  for (int i = 0; i < n; i++) {
    sum += run_product(xs);
  }
  return sum;
}

int main(int argc, char** argv) {
  auto size = argc > 1 ? std::stoi(argv[1]) : 1000;
  auto value = run(size);
  std::cout << value << std::endl;
  assert(value == 0);
  assert(destroyed == size);
  assert(run_product({1, 2, 3, 4}) == 24);
  return 0;
}
