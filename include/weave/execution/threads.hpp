#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>

#include "branch.hpp"
#include "context.hpp"
#include "credit.hpp"

namespace weave::execution {

// Puts a dedicated credit pool in scope while the inner branch advances.
// The pool is created on first advance so every run gets its own.
template <class T>
class _threads_node final : public node<T> {
 public:
  _threads_node(std::size_t limit, branch<T> inner, std::shared_ptr<credit_pool> pool)
      : limit_(limit), inner_(std::move(inner)), pool_(std::move(pool)) {}

  auto advance(cursor& cur) const -> step<T> override {
    auto pool = pool_ ? pool_ : std::make_shared<credit_pool>(limit_);

    // Values leave this scope under the caller's pool
    struct scope_guard {
      cursor&                      cur_;
      std::shared_ptr<credit_pool> saved_;
      ~scope_guard() {
        cur_.set_credit(std::move(saved_));
      }
    } guard{cur, cur.credit()};

    cur.set_credit(pool);
    step<T> s = inner_.advance(cur);

    if (auto* m = std::get_if<more_values<T>>(&s)) {
      return more_values<T>{std::move(m->value),
                            make_branch<T, _threads_node>(limit_, std::move(m->rest), pool)};
    }
    return s;
  }

  void checkpoint(cursor& cur) const override {
    inner_.checkpoint(cur);
  }

  void checkpoint_from(cursor& cur, const recorder& trail) const override {
    inner_.checkpoint_from(cur, trail);
  }

 private:
  std::size_t                  limit_;
  branch<T>                    inner_;
  std::shared_ptr<credit_pool> pool_;
};

struct _pipeable_threads {
  std::size_t limit_;

  template <class T>
  friend auto operator|(branch<T> b, const _pipeable_threads& p) -> branch<T> {
    return make_branch<T, _threads_node<T>>(p.limit_, std::move(b), nullptr);
  }
};

// [exec.threads] threads(n, c): at most n workers dispatched at a time from
// the alternations inside c. threads(0, c) runs c fully inline.
struct threads_t {
  template <class T>
  auto operator()(std::size_t limit, branch<T> inner) const -> branch<T> {
    return make_branch<T, _threads_node<T>>(limit, std::move(inner), nullptr);
  }

  constexpr auto operator()(std::size_t limit) const -> _pipeable_threads {
    return _pipeable_threads{limit};
  }
};

inline constexpr threads_t threads{};

}  // namespace weave::execution
