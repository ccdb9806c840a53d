#pragma once

#include <utility>
#include "eff-scope/exception.hpp"

namespace effscope {

// Leaves the enclosing `with_early_return` with a value. An exception
// channel whose payload is the block's own result.
template <typename R>
class early_return {
  exception<R> channel;

 public:
  explicit early_return(exception<R> channel) : channel(channel) {}

  scope_set scopes() const { return channel.scopes(); }

  template <typename V>
  [[noreturn]] void leave(V&& value) const {
    channel.raise("early_return::return", std::forward<V>(value));
  }
};

template <typename R, typename V>
[[noreturn]] void return_early(const early_return<R>& ret, V&& value) {
  ret.leave(std::forward<V>(value));
}

template <typename R, typename Body>
R with_early_return(Body&& body) {
  auto outcome = detail::try_scope<early_return<R>, R>(
      [&](const exception<R>& channel) -> R {
        return std::forward<Body>(body)(early_return<R>(channel));
      });
  if (outcome.is_left()) {
    return std::move(outcome).left_value();
  }
  return std::move(outcome).right_value();
}

// Payload-less early exit: control resumes right after `with_jump`.
class jump {
  exception<unit_t> channel;

 public:
  explicit jump(exception<unit_t> channel) : channel(channel) {}

  scope_set scopes() const { return channel.scopes(); }

  [[noreturn]] void to() const { channel.raise("jump::jump_to", unit_t{}); }
};

[[noreturn]] inline void jump_to(const jump& j) {
  j.to();
}

// Returns true if the body left through its jump handle.
template <typename Body>
bool with_jump(Body&& body) {
  auto outcome = detail::try_scope<jump, unit_t>(
      [&](const exception<unit_t>& channel) {
        std::forward<Body>(body)(jump(channel));
      });
  return outcome.is_left();
}

}  // namespace effscope
