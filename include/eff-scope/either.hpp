#pragma once

#include <utility>
#include <variant>

namespace effscope {

// A value that is either a `Left` (failure, yielded output) or a `Right`
// (success, final result). `L` and `R` may be the same type.
template <typename L, typename R>
class either {
  std::variant<L, R> value;

  template <std::size_t I, typename T>
  either(std::in_place_index_t<I> index, T&& v)
      : value(index, std::forward<T>(v)) {}

 public:
  typedef L left_type;
  typedef R right_type;

  template <typename T>
  static either left(T&& v) {
    return either(std::in_place_index<0>, std::forward<T>(v));
  }

  template <typename T>
  static either right(T&& v) {
    return either(std::in_place_index<1>, std::forward<T>(v));
  }

  bool is_left() const { return value.index() == 0; }
  bool is_right() const { return value.index() == 1; }

  const L& left_value() const& { return std::get<0>(value); }
  L&& left_value() && { return std::get<0>(std::move(value)); }
  const R& right_value() const& { return std::get<1>(value); }
  R&& right_value() && { return std::get<1>(std::move(value)); }

  friend bool operator==(const either&, const either&) = default;
};

}  // namespace effscope
