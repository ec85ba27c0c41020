#pragma once

#include <initializer_list>
#include <ranges>
#include <utility>
#include <vector>

#include "branch.hpp"
#include "dispatch.hpp"

namespace weave::execution {

// [exec.each] Lifts a finite sequence into a branch with one alternative per
// element: alt(singleton(x0), alt(singleton(x1), ... empty)).
struct each_t {
  template <std::ranges::input_range R>
  auto operator()(R&& values) const -> branch<std::ranges::range_value_t<R>> {
    using T = std::ranges::range_value_t<R>;

    std::vector<T> elements;
    for (auto&& value : values) {
      elements.emplace_back(std::forward<decltype(value)>(value));
    }

    branch<T> result = empty<T>();
    for (auto it = elements.rbegin(); it != elements.rend(); ++it) {
      result = alt(singleton(std::move(*it)), std::move(result));
    }
    return result;
  }

  template <class T>
  auto operator()(std::initializer_list<T> values) const -> branch<T> {
    return (*this)(std::vector<T>(values));
  }
};

inline constexpr each_t each{};

}  // namespace weave::execution
