#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "context.hpp"
#include "debug_log.hpp"
#include "journal.hpp"
#include "sender.hpp"

namespace weave::execution {

template <class T>
class branch;

// [branch.step] Outcome of advancing a branch by one unit
struct exhausted_t {};

template <class T>
struct final_value {
  T value;
};

template <class T>
struct more_values {
  T         value;
  branch<T> rest;
};

template <class T>
using step = std::variant<exhausted_t, final_value<T>, more_values<T>>;

// [branch.node] One piece of a branching computation. Nodes are immutable
// and shared between the branches that were composed from them.
template <class T>
class node {
 public:
  virtual ~node() = default;

  virtual auto advance(cursor& cur) const -> step<T> = 0;

  // Reports the branches still pending in a continuation to the recording
  // set. Only called on continuations returned by advance().
  virtual void checkpoint(cursor& cur) const {
    checkpoint_from(cur, cur.trail());
  }

  // Same for a node that has not been advanced yet, reached with `trail`
  virtual void checkpoint_from(cursor& cur, const recorder& trail) const {
    cur.context().save(trail.snapshot());
  }
};

// [branch.branch] A lazy producer of zero or more values of type T
template <class T>
class branch {
 public:
  using value_type = T;

  explicit branch(std::shared_ptr<const node<T>> n) noexcept : node_(std::move(n)) {}

  auto advance(cursor& cur) const -> step<T> {
    return node_->advance(cur);
  }

  // Two-continuation form of advance(): calls exactly one of
  // stop() or yield(value, rest) and returns its result
  template <class Stop, class Yield>
  auto run(cursor& cur, Stop&& stop, Yield&& yield) const -> decltype(auto) {
    step<T> s = advance(cur);
    if (auto* f = std::get_if<final_value<T>>(&s)) {
      return std::invoke(std::forward<Yield>(yield), std::move(f->value),
                         std::optional<branch<T>>{});
    }
    if (auto* m = std::get_if<more_values<T>>(&s)) {
      return std::invoke(std::forward<Yield>(yield), std::move(m->value),
                         std::optional<branch<T>>{std::move(m->rest)});
    }
    return std::invoke(std::forward<Stop>(stop));
  }

  void checkpoint(cursor& cur) const {
    node_->checkpoint(cur);
  }

  void checkpoint_from(cursor& cur, const recorder& trail) const {
    node_->checkpoint_from(cur, trail);
  }

 private:
  std::shared_ptr<const node<T>> node_;
};

template <class T, class Node, class... Args>
auto make_branch(Args&&... args) -> branch<T> {
  auto n = std::make_shared<Node>(std::forward<Args>(args)...);
  return branch<T>{std::shared_ptr<const node<T>>(std::move(n))};
}

template <class B>
struct _is_branch : std::false_type {};

template <class T>
struct _is_branch<branch<T>> : std::true_type {};

template <class B>
concept branch_type = _is_branch<__remove_cvref_t<B>>::value;

template <class T>
class _empty_node final : public node<T> {
 public:
  auto advance(cursor& /*unused*/) const -> step<T> override {
    return exhausted_t{};
  }

  void checkpoint(cursor& /*unused*/) const override {}

  void checkpoint_from(cursor& /*unused*/, const recorder& /*unused*/) const override {}
};

// empty<T>(): no values
template <class T>
auto empty() -> branch<T> {
  return make_branch<T, _empty_node<T>>();
}

template <class T>
class _singleton_node final : public node<T> {
 public:
  explicit _singleton_node(T value) : value_(std::move(value)) {}

  auto advance(cursor& /*unused*/) const -> step<T> override {
    return final_value<T>{value_};
  }

 private:
  T value_;
};

// singleton(v): exactly one value
template <class V>
auto singleton(V&& value) -> branch<__decay_t<V>> {
  using T = __decay_t<V>;
  return make_branch<T, _singleton_node<T>>(std::forward<V>(value));
}

// Restores the journal a branch had when it was set aside, then advances it
template <class T>
class _resume_node final : public node<T> {
 public:
  _resume_node(branch<T> inner, recorder trail)
      : inner_(std::move(inner)), trail_(std::move(trail)) {}

  auto advance(cursor& cur) const -> step<T> override {
    cur.trail() = trail_;
    return inner_.advance(cur);
  }

  void checkpoint(cursor& cur) const override {
    inner_.checkpoint_from(cur, trail_);
  }

 private:
  branch<T> inner_;
  recorder  trail_;
};

template <class T>
auto resume(branch<T> inner, recorder trail) -> branch<T> {
  return make_branch<T, _resume_node<T>>(std::move(inner), std::move(trail));
}

// Advances `first` and continues with `second` once it is exhausted or
// paused. A pause in `first` files its journal and does not end `second`.
template <class T>
auto sequence_step(cursor& cur, const branch<T>& first, const branch<T>& second) -> step<T>;

template <class T>
class _append_node final : public node<T> {
 public:
  _append_node(branch<T> first, branch<T> second)
      : first_(std::move(first)), second_(std::move(second)) {}

  auto advance(cursor& cur) const -> step<T> override {
    return sequence_step(cur, first_, second_);
  }

  void checkpoint(cursor& cur) const override {
    first_.checkpoint(cur);
    second_.checkpoint(cur);
  }

 private:
  branch<T> first_;
  branch<T> second_;
};

template <class T>
auto sequence_step(cursor& cur, const branch<T>& first, const branch<T>& second) -> step<T> {
  step<T> s;
  try {
    s = first.advance(cur);
  } catch (branch_paused& paused) {
    WEAVE_DEBUG_LOG("branch paused, continuing with its successor");
    cur.context().save(std::move(paused.recording));
  }

  if (auto* f = std::get_if<final_value<T>>(&s)) {
    return more_values<T>{std::move(f->value), second};
  }
  if (auto* m = std::get_if<more_values<T>>(&s)) {
    return more_values<T>{std::move(m->value),
                          make_branch<T, _append_node<T>>(std::move(m->rest), second)};
  }
  return second.advance(cur);
}

// [branch.bind] Runs fn on every value of the inner branch and concatenates
// the resulting branches
template <class T, class U, class Fn>
class _bind_node final : public node<U> {
 public:
  _bind_node(branch<T> inner, Fn fn) : inner_(std::move(inner)), fn_(std::move(fn)) {}

  auto advance(cursor& cur) const -> step<U> override {
    step<T> s = inner_.advance(cur);

    if (auto* f = std::get_if<final_value<T>>(&s)) {
      return std::invoke(fn_, std::move(f->value)).advance(cur);
    }
    if (auto* m = std::get_if<more_values<T>>(&s)) {
      branch<U> head = std::invoke(fn_, std::move(m->value));
      branch<U> tail = make_branch<U, _bind_node>(std::move(m->rest), fn_);
      return sequence_step(cur, head, tail);
    }
    return exhausted_t{};
  }

  void checkpoint(cursor& cur) const override {
    inner_.checkpoint(cur);
  }

 private:
  branch<T> inner_;
  Fn        fn_;
};

template <class Fn, class T>
using _bind_result_t = typename __remove_cvref_t<std::invoke_result_t<const Fn&, T>>::value_type;

template <class Fn>
struct _pipeable_bind;

struct bind_t {
  template <class T, class Fn>
  auto operator()(branch<T> inner, Fn&& fn) const -> branch<_bind_result_t<__decay_t<Fn>, T>> {
    using U = _bind_result_t<__decay_t<Fn>, T>;
    return make_branch<U, _bind_node<T, U, __decay_t<Fn>>>(std::move(inner), std::forward<Fn>(fn));
  }

  template <class Fn>
  constexpr auto operator()(Fn&& fn) const {
    return _pipeable_bind<__decay_t<Fn>>{std::forward<Fn>(fn)};
  }
};

inline constexpr bind_t bind{};

template <class Fn>
struct _pipeable_bind {
  Fn fn_;

  template <class T>
  friend auto operator|(branch<T> b, const _pipeable_bind& p) {
    return bind_t{}(std::move(b), p.fn_);
  }
};

template <class Fn>
struct _pipeable_then;

// [branch.then] Maps every value through fn
struct then_t {
  template <class T, class Fn>
  auto operator()(branch<T> inner, Fn&& fn) const {
    using U = __decay_t<std::invoke_result_t<const __decay_t<Fn>&, T>>;
    return bind_t{}(std::move(inner), [fn = __decay_t<Fn>(std::forward<Fn>(fn))](T value) {
      return singleton(U(std::invoke(fn, std::move(value))));
    });
  }

  template <class Fn>
  constexpr auto operator()(Fn&& fn) const {
    return _pipeable_then<__decay_t<Fn>>{std::forward<Fn>(fn)};
  }
};

inline constexpr then_t then{};

template <class Fn>
struct _pipeable_then {
  Fn fn_;

  template <class T>
  friend auto operator|(branch<T> b, const _pipeable_then& p) {
    return then_t{}(std::move(b), p.fn_);
  }
};

}  // namespace weave::execution
