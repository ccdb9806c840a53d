#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include "eff-scope/either.hpp"
#include "eff-scope/handle.hpp"

namespace effscope {

enum class coroutine_state { idle, running, suspended, completed };

const char* to_string(coroutine_state status);

// Either the next yielded output (left) or the final result (right).
template <typename Out, typename R>
using step = either<Out, R>;

template <typename Out, typename In>
class yielder;

template <typename Out, typename In, typename R>
class suspendable;

namespace detail {
// Shared by the driver's handle and the body's yielder: the slots a value
// passes through in each direction, and the frame they belong to.
template <typename Out, typename In>
struct coroutine_control {
  std::optional<Out> pending_output;
  std::optional<In> input;
  std::coroutine_handle<> self;
  coroutine_state status = coroutine_state::idle;
};

template <typename R>
class promise_result {
  std::optional<R> result;

 public:
  template <typename V>
  void return_value(V&& value) {
    result.emplace(std::forward<V>(value));
  }

  R take_result() { return std::move(*result); }
};

template <>
class promise_result<void> {
 public:
  void return_void() noexcept {}
  unit_t take_result() { return {}; }
};
}  // namespace detail

template <typename Out, typename In>
class yield_awaiter {
  detail::coroutine_control<Out, In>* control;
  Out value;

 public:
  yield_awaiter(detail::coroutine_control<Out, In>& control, Out value)
      : control(&control), value(std::move(value)) {}

  bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> awaiting) {
    if (awaiting.address() != control->self.address()) {
      fatal_protocol_violation("coroutine::yield",
          "yielder used from a coroutine it does not belong to");
    }
    control->pending_output.emplace(std::move(value));
  }

  In await_resume() { return *control->input; }
};

// The body's side of a resumable coroutine.
template <typename Out, typename In>
class yielder : public handle_base {
  detail::coroutine_control<Out, In>* control;

 public:
  yielder(scope_tag scope, detail::coroutine_control<Out, In>& control)
      : handle_base(scope), control(&control) {}

  detail::coroutine_control<Out, In>& running(const char* operation) const {
    check(operation);
    if (control->status != coroutine_state::running) {
      fatal_protocol_violation(operation, "coroutine is not running");
    }
    return *control;
  }
};

// Suspends the body, handing `value` to the pending `resume`; evaluates to the
// input of the next `resume`.
template <typename Out, typename In, typename V>
yield_awaiter<Out, In> yield(const yielder<Out, In>& y, V&& value) {
  return yield_awaiter<Out, In>(
      y.running("coroutine::yield"), Out(std::forward<V>(value)));
}

// The input passed to the `resume` that last woke the body.
template <typename Out, typename In>
const In& input(const yielder<Out, In>& y) {
  return *y.running("coroutine::input").input;
}

// Return type of a resumable coroutine body. Starts suspended (idle) and
// only reacts to `yield` on its own yielder.
template <typename Out, typename In, typename R>
class suspendable {
 public:
  class promise_type : public detail::promise_result<R> {
    std::exception_ptr exception;

   public:
    suspendable get_return_object() noexcept {
      return suspendable(
          std::coroutine_handle<promise_type>::from_promise(*this));
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    void unhandled_exception() { exception = std::current_exception(); }

    void rethrow_if_exception() {
      if (exception) {
        std::rethrow_exception(std::exchange(exception, nullptr));
      }
    }

    yield_awaiter<Out, In> await_transform(yield_awaiter<Out, In> awaiter) {
      return awaiter;
    }

    template <typename U>
    std::suspend_never await_transform(U&&) = delete;
  };

  typedef std::coroutine_handle<promise_type> handle_type;
  typedef lift_void_t<R> result_type;

  explicit suspendable(handle_type handle) : handle(handle) {}

  suspendable(suspendable&& other) noexcept
      : handle(std::exchange(other.handle, nullptr)) {}

  suspendable& operator=(suspendable&& other) noexcept {
    if (this != &other) {
      if (handle) {
        handle.destroy();
      }
      handle = std::exchange(other.handle, nullptr);
    }
    return *this;
  }

  suspendable(const suspendable&) = delete;
  suspendable& operator=(const suspendable&) = delete;

  ~suspendable() {
    if (handle) {
      handle.destroy();
    }
  }

  handle_type get() const { return handle; }

 private:
  handle_type handle;
};

template <typename T>
struct suspendable_traits;

template <typename Out, typename In, typename R>
struct suspendable_traits<suspendable<Out, In, R>> {
  typedef R result_type;
};

namespace detail {
template <typename Out, typename In, typename R>
struct coroutine_frame {
  coroutine_control<Out, In> control;
  std::optional<suspendable<Out, In, R>> body;
};
}  // namespace detail

// The driver's side of a resumable coroutine.
template <typename Out, typename In, typename R>
class resumable : public handle_base {
  detail::coroutine_frame<Out, In, R>* frame;

 public:
  resumable(scope_tag scope, detail::coroutine_frame<Out, In, R>& frame)
      : handle_base(scope), frame(&frame) {}

  detail::coroutine_frame<Out, In, R>& access(const char* operation) const {
    check(operation);
    return *frame;
  }

  coroutine_state status() const {
    return access("coroutine::status").control.status;
  }
};

// Runs the body until its next yield (left) or its end (right). Resuming a
// completed or currently running coroutine is a protocol violation. An
// exception escaping the body completes the coroutine and propagates out of
// this call.
template <typename Out, typename In, typename R, typename V>
step<Out, lift_void_t<R>> resume(const resumable<Out, In, R>& co, V&& value) {
  auto& frame = co.access("coroutine::resume");
  auto& control = frame.control;
  if (control.status == coroutine_state::completed ||
      control.status == coroutine_state::running) {
    fatal_protocol_violation("coroutine::resume",
        fmt::format("cannot resume a {} coroutine", to_string(control.status)));
  }
  control.input.emplace(std::forward<V>(value));
  control.status = coroutine_state::running;
  auto handle = frame.body->get();
#ifdef EFF_SCOPE_TRACE
  fmt::print(stderr, "[eff-scope] resume coroutine #{}\n", co.tag().id);
#endif
  {
    // The body sees what was visible where it was created, not the driver's
    // regions.
    region_view view(co.tag().depth);
    handle.resume();
  }
  if (handle.done()) {
    control.status = coroutine_state::completed;
#ifdef EFF_SCOPE_TRACE
    fmt::print(stderr, "[eff-scope] coroutine #{} completed\n", co.tag().id);
#endif
    handle.promise().rethrow_if_exception();
    return step<Out, lift_void_t<R>>::right(handle.promise().take_result());
  }
  control.status = coroutine_state::suspended;
#ifdef EFF_SCOPE_TRACE
  fmt::print(stderr, "[eff-scope] coroutine #{} yielded\n", co.tag().id);
#endif
  auto output = std::move(*control.pending_output);
  control.pending_output.reset();
  return step<Out, lift_void_t<R>>::left(std::move(output));
}

// Creates the coroutine `body(yielder)` in the idle state and hands its
// driver handle to `driver`. The coroutine frame, suspended or not, is
// destroyed when this returns or unwinds.
template <typename Out, typename In, typename Body, typename Driver>
auto with_coroutine(Body&& body, Driver&& driver) {
  using body_t = std::invoke_result_t<Body, const yielder<Out, In>&>;
  using R = typename suspendable_traits<body_t>::result_type;
  return with_scope<resumable<Out, In, R>>([&](scope_tag tag) {
    detail::coroutine_frame<Out, In, R> frame;
    yielder<Out, In> y(tag, frame.control);
    frame.body.emplace(std::forward<Body>(body)(y));
    frame.control.self = frame.body->get();
    return invoke_unit(
        std::forward<Driver>(driver), resumable<Out, In, R>(tag, frame));
  });
}

}  // namespace effscope
