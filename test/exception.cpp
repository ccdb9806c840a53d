#include <cassert>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "eff-scope.hpp"
#include "fmt/core.h"

using namespace effscope;

void catch_law() {
  for (int x : {-3, 0, 7}) {
    auto r = run_pure([x] {
      return try_<int>(
          [&](const exception<int>& ex) -> std::string { throw_(ex, x); });
    });
    assert(r.is_left());
    assert(r.left_value() == x);
  }
  for (auto y : {"", "y"}) {
    auto r = try_<int>([&](const exception<int>&) { return std::string(y); });
    assert(r.is_right());
    assert(r.right_value() == y);
  }
}

void throw_reaches_its_own_handler() {
  auto outer = try_<std::string>([](const exception<std::string>& a) {
    auto inner =
        try_<std::string>([&](const exception<std::string>&) -> int {
          throw_(a, "outer");
        });
    assert(false);
    return inner.is_left();
  });
  assert(outer.is_left());
  assert(outer.left_value() == "outer");

  auto nested = try_<std::string>([](const exception<std::string>&) {
    return try_<std::string>([&](const exception<std::string>& b) -> int {
      throw_(b, "inner");
    });
  });
  assert(nested.is_right());
  assert(nested.right_value().left_value() == "inner");
}

void unwinding_tears_down_nested_handlers() {
  std::optional<state<int>> leaked;
  auto depth = open_scopes.size();
  auto r = try_<int>([&](const exception<int>& ex) {
    return eval_state(1, [&](const state<int>& s) -> int {
      leaked = s;
      return eval_state(2, [&](const state<int>& t) -> int {
        throw_(ex, get(s) + get(t));
      });
    });
  });
  assert(r.is_left());
  assert(r.left_value() == 3);
  assert(open_scopes.size() == depth);
  assert(!leaked->valid());
}

void ordinary_catch_does_not_intercept() {
  auto r = try_<int>([](const exception<int>& ex) {
    try {
      throw_(ex, 5);
    } catch (const std::exception&) {
      assert(false);
    }
    return 0;
  });
  assert(r.is_left());
  assert(r.left_value() == 5);
}

void handle_and_catch() {
  auto handled = handle_<std::string>(
      [](std::string e) { return static_cast<int>(e.size()); },
      [](const exception<std::string>& ex) -> int { throw_(ex, "four"); });
  assert(handled == 4);

  auto caught = catch_<std::string>(
      [](const exception<std::string>&) { return 1; },
      [](std::string) { return 2; });
  assert(caught == 1);
}

void bracket_releases_on_throw() {
  std::vector<std::string> log;
  auto r = try_<int>([&](const exception<int>& ex) {
    return bracket(
        [&] {
          log.push_back("acquire");
          return 7;
        },
        [&](int) { log.push_back("release"); },
        [&](int resource) -> int {
          log.push_back("use");
          throw_(ex, resource);
        });
  });
  assert(r.is_left());
  assert(r.left_value() == 7);
  assert((log == std::vector<std::string>{"acquire", "use", "release"}));

  log.clear();
  auto ok = bracket([] { return 1; }, [&](int) { log.push_back("release"); },
      [](int resource) { return resource + 1; });
  assert(ok == 2);
  assert(log.size() == 1);
}

void bracket_release_raises() {
  auto r = try_<std::string>([](const exception<std::string>& ex) {
    return bracket([] { return 5; },
        [&](int) { throw_(ex, "release failed"); },
        [](int resource) { return resource; });
  });
  assert(r.is_left());
  assert(r.left_value() == "release failed");

  std::vector<std::string> log;
  auto both = try_<std::string>([&](const exception<std::string>& outer) {
    return try_<int>([&](const exception<int>& inner) {
      return bracket([] { return 1; },
          [&](int) {
            log.push_back("release");
            throw_(outer, "from release");
          },
          [&](int resource) -> int { throw_(inner, resource); });
    });
  });
  assert(both.is_left());
  assert(both.left_value() == "from release");
  assert((log == std::vector<std::string>{"release"}));
}

int main() {
  catch_law();
  throw_reaches_its_own_handler();
  unwinding_tears_down_nested_handlers();
  ordinary_catch_does_not_intercept();
  handle_and_catch();
  bracket_releases_on_throw();
  bracket_release_raises();
  fmt::print("exception: ok\n");
  return 0;
}
