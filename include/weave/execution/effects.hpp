#pragma once

#include <concepts>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "branch.hpp"
#include "context.hpp"
#include "journal.hpp"
#include "sender.hpp"
#include "sync_wait.hpp"

namespace weave::execution {

template <class TypeList>
struct _lifted_value;

template <>
struct _lifted_value<type_list<>> {
  using type = std::monostate;
};

template <class T>
struct _lifted_value<type_list<T>> {
  using type = T;
};

template <class S>
using _lifted_value_t = typename _lifted_value<typename __remove_cvref_t<S>::value_types>::type;

// Runs a sender to completion on the worker that advances it
template <class T, class S>
class _lift_sender_node final : public node<T> {
 public:
  explicit _lift_sender_node(S sndr) : sndr_(std::move(sndr)) {}

  auto advance(cursor& /*unused*/) const -> step<T> override {
    S    sndr   = sndr_;
    auto result = this_thread::sync_wait(std::move(sndr));
    if (!result) {
      return exhausted_t{};
    }
    if constexpr (std::tuple_size_v<std::remove_cvref_t<decltype(*result)>> == 0) {
      return final_value<T>{std::monostate{}};
    } else {
      return final_value<T>{std::get<0>(std::move(*result))};
    }
  }

 private:
  S sndr_;
};

template <class T, class Fn>
class _lift_fn_node final : public node<T> {
 public:
  explicit _lift_fn_node(Fn fn) : fn_(std::move(fn)) {}

  auto advance(cursor& /*unused*/) const -> step<T> override {
    return final_value<T>{std::invoke(fn_)};
  }

 private:
  Fn fn_;
};

// [effect.lift] lift(sndr): the single value of a sender, or nothing if it
// stops. Errors are rethrown. lift(fn): the result of fn().
struct lift_t {
  template <typed_sender S>
  auto operator()(S&& sndr) const -> branch<_lifted_value_t<S>> {
    using T = _lifted_value_t<S>;
    return make_branch<T, _lift_sender_node<T, __decay_t<S>>>(std::forward<S>(sndr));
  }

  template <class Fn>
    requires(!sender<Fn>) && std::invocable<const __decay_t<Fn>&>
  auto operator()(Fn&& fn) const -> branch<__decay_t<std::invoke_result_t<const __decay_t<Fn>&>>> {
    using T = __decay_t<std::invoke_result_t<const __decay_t<Fn>&>>;
    return make_branch<T, _lift_fn_node<T, __decay_t<Fn>>>(std::forward<Fn>(fn));
  }
};

inline constexpr lift_t lift{};

template <class T, class Fn>
class _record_node final : public node<T> {
 public:
  explicit _record_node(Fn fn) : fn_(std::move(fn)) {}

  auto advance(cursor& cur) const -> step<T> override {
    return final_value<T>{record_effect<T>(cur.trail(), fn_)};
  }

 private:
  Fn fn_;
};

// [effect.record] record(fn): runs fn once per branch and journals its
// result; a replayed branch gets the journaled result back instead.
struct record_t {
  template <class Fn>
    requires std::invocable<const __decay_t<Fn>&>
  auto operator()(Fn&& fn) const -> branch<__decay_t<std::invoke_result_t<const __decay_t<Fn>&>>> {
    using T = __decay_t<std::invoke_result_t<const __decay_t<Fn>&>>;
    return make_branch<T, _record_node<T, __decay_t<Fn>>>(std::forward<Fn>(fn));
  }
};

inline constexpr record_t record{};

class _pause_node final : public node<std::monostate> {
 public:
  auto advance(cursor& cur) const -> step<std::monostate> override {
    pause_point(cur.trail());
    return final_value<std::monostate>{};
  }
};

// [effect.pause] Checkpoints the branch in a recorded run. The journal of the
// paused branch joins the recording set and the branch ends there; replaying
// that journal continues right after the pause.
inline auto pause_branch() -> branch<std::monostate> {
  return make_branch<std::monostate, _pause_node>();
}

}  // namespace weave::execution
