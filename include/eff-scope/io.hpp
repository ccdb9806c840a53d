#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "eff-scope/eff.hpp"
#include "eff-scope/handle.hpp"

namespace effscope {

// Permission to perform host effects. Exactly one exists per `run_eff`.
class io : public handle_base {
  std::istream* in;
  std::ostream* out;

 public:
  io(scope_tag scope, std::istream& in, std::ostream& out)
      : handle_base(scope), in(&in), out(&out) {}

  std::istream& input(const char* operation) const {
    check(operation);
    return *in;
  }

  std::ostream& output(const char* operation) const {
    check(operation);
    return *out;
  }

  void require(const char* operation) const { check(operation); }
};

template <typename F>
auto eff_io(const io& h, F&& action) {
  h.require("io::eff_io");
  return std::forward<F>(action)();
}

void put_line(const io& h, std::string_view text);

// std::nullopt at end of input.
std::optional<std::string> read_line(const io& h);

// Runs a top-level computation with host effects, reading from `in` and
// writing to `out`.
template <typename Body>
auto run_eff(std::istream& in, std::ostream& out, Body&& body) {
  if (count_open_scopes(typeid(io)) > 0) {
    fatal_protocol_violation(
        "run_eff", "an io handle is already open on this thread");
  }
  if (count_open_scopes(typeid(pure_region)) > 0) {
    fatal_protocol_violation("run_eff", "host effects inside run_pure");
  }
  return with_scope<io>([&](scope_tag tag) {
    return std::forward<Body>(body)(io(tag, in, out));
  });
}

template <typename Body>
auto run_eff(Body&& body) {
  return run_eff(std::cin, std::cout, std::forward<Body>(body));
}

}  // namespace effscope
