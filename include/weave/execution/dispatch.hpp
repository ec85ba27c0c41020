#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "branch.hpp"
#include "channel.hpp"
#include "context.hpp"
#include "credit.hpp"
#include "debug_log.hpp"
#include "journal.hpp"
#include "run_loop.hpp"

namespace weave::execution {

namespace _dispatch_detail {

// Events a dispatched worker sends back to the branch that consumes it
template <class T>
struct yielded {
  T        value;
  recorder trail;  // journal of the branch that produced the value
};

struct finished {};

struct failed {
  std::exception_ptr error;
};

template <class T>
using worker_event = std::variant<yielded<T>, finished, failed>;

// Channel and bookkeeping of one dispatched worker. Shared by the worker and
// the continuations that drain it; those continuations are single-shot.
template <class T>
class fork_state {
 public:
  explicit fork_state(std::shared_ptr<credit_pool> credit) : credit_(std::move(credit)) {}

  ~fork_state() {
    if (!retired_) {
      credit_->release();
    }
  }

  fork_state(const fork_state&)                    = delete;
  auto operator=(const fork_state&) -> fork_state& = delete;

  auto events() noexcept -> channel<worker_event<T>>& {
    return events_;
  }

  void set_worker(std::uint64_t id) noexcept {
    worker_ = id;
  }

  // Next value from the worker, blocking until one arrives. nullopt once
  // the worker has finished; a worker failure is rethrown here.
  auto receive(cursor& cur) -> std::optional<T> {
    while (!retired_) {
      worker_event<T> event = events_.pop();

      if (auto* y = std::get_if<yielded<T>>(&event)) {
        cur.trail() = std::move(y->trail);
        return std::move(y->value);
      }
      retire(cur.context());
      if (auto* f = std::get_if<failed>(&event)) {
        std::rethrow_exception(f->error);
      }
    }
    return std::nullopt;
  }

  // Waits for the stopping worker and files every value it produced that
  // nobody consumed as a pending branch
  void checkpoint(cursor& cur) {
    while (!retired_) {
      worker_event<T> event = events_.pop();

      if (auto* y = std::get_if<yielded<T>>(&event)) {
        cur.context().save(y->trail.snapshot());
        continue;
      }
      retire(cur.context());
      if (auto* f = std::get_if<failed>(&event)) {
        std::rethrow_exception(f->error);
      }
    }
  }

 private:
  void retire(execution_context& ctx) {
    retired_ = true;
    ctx.retire(worker_);
    credit_->release();
  }

  std::shared_ptr<credit_pool> credit_;
  channel<worker_event<T>>     events_;
  std::uint64_t                worker_  = 0;
  bool                         retired_ = false;
};

// Body of a dispatched worker: drives `work` to completion on its own
// cursor and forwards everything it produces
template <class T>
void run_worker(execution_context&               ctx,
                std::shared_ptr<credit_pool>     credit,
                recorder                         trail,
                const branch<T>&                 work,
                const std::shared_ptr<fork_state<T>>& fork) {
  cursor cur{ctx, std::move(credit), std::move(trail)};
  try {
    drive(cur, work, [&](T value) -> void {
      fork->events().push(yielded<T>{std::move(value), cur.trail()});
    });
  } catch (...) {
    fork->events().push(failed{std::current_exception()});
    return;
  }
  fork->events().push(finished{});
}

// The local side of a dispatched alternation followed by whatever the
// worker sends back
template <class T>
class merge_node final : public node<T> {
 public:
  merge_node(std::optional<branch<T>> local, std::shared_ptr<fork_state<T>> fork)
      : local_(std::move(local)), fork_(std::move(fork)) {}

  auto advance(cursor& cur) const -> step<T> override {
    if (local_) {
      step<T> s;
      try {
        s = local_->advance(cur);
      } catch (branch_paused& paused) {
        cur.context().save(std::move(paused.recording));
      }

      if (auto* f = std::get_if<final_value<T>>(&s)) {
        return more_values<T>{std::move(f->value), make_branch<T, merge_node>(std::nullopt, fork_)};
      }
      if (auto* m = std::get_if<more_values<T>>(&s)) {
        return more_values<T>{std::move(m->value),
                              make_branch<T, merge_node>(std::move(m->rest), fork_)};
      }
    }

    if (std::optional<T> value = fork_->receive(cur)) {
      return more_values<T>{std::move(*value), make_branch<T, merge_node>(std::nullopt, fork_)};
    }
    return exhausted_t{};
  }

  void checkpoint(cursor& cur) const override {
    if (local_) {
      local_->checkpoint(cur);
    }
    fork_->checkpoint(cur);
  }

 private:
  std::optional<branch<T>>       local_;
  std::shared_ptr<fork_state<T>> fork_;
};

}  // namespace _dispatch_detail

// [exec.alt] Alternation point. Takes one unit of the credit in scope to
// hand the right side to a new worker; without credit both sides run inline,
// left first. While replaying, only the journaled side runs.
template <class T>
class _alt_node final : public node<T> {
 public:
  _alt_node(branch<T> left, branch<T> right) : left_(std::move(left)), right_(std::move(right)) {}

  auto advance(cursor& cur) const -> step<T> override {
    recorder& rec = cur.trail();

    if (auto choice = rec.take(entry_kind::choice)) {
      if (choice->payload == left_choice) {
        return left_.advance(cur);
      }
      if (choice->payload == right_choice) {
        return right_.advance(cur);
      }
      throw journal_error("unknown choice '" + choice->payload + "' in journal");
    }

    recorder right_trail = rec;
    rec.note(journal_entry{entry_kind::choice, std::string(left_choice)});
    right_trail.note(journal_entry{entry_kind::choice, std::string(right_choice)});

    if (!cur.context().stop_requested() && cur.credit()->try_acquire()) {
      return dispatch_right(cur, std::move(right_trail));
    }
    WEAVE_DEBUG_LOG("alternation runs inline (credit available: %zu)", cur.credit()->available());
    return sequence_step(cur, left_, resume(right_, std::move(right_trail)));
  }

  void checkpoint_from(cursor& cur, const recorder& trail) const override {
    if (trail.replaying()) {
      node<T>::checkpoint_from(cur, trail);
      return;
    }
    recorder left_trail  = trail;
    recorder right_trail = trail;
    left_trail.note(journal_entry{entry_kind::choice, std::string(left_choice)});
    right_trail.note(journal_entry{entry_kind::choice, std::string(right_choice)});
    left_.checkpoint_from(cur, left_trail);
    right_.checkpoint_from(cur, right_trail);
  }

 private:
  auto dispatch_right(cursor& cur, recorder right_trail) const -> step<T> {
    using namespace _dispatch_detail;

    execution_context& ctx  = cur.context();
    auto               fork = std::make_shared<fork_state<T>>(cur.credit());

    std::uint64_t id = ctx.dispatch(
        [&ctx, fork, credit = cur.credit(), trail = std::move(right_trail), work = right_] {
          run_worker(ctx, credit, trail, work, fork);
        });
    fork->set_worker(id);

    return make_branch<T, merge_node<T>>(std::optional<branch<T>>{left_}, std::move(fork))
        .advance(cur);
  }

  branch<T> left_;
  branch<T> right_;
};

struct alt_t {
  template <class T>
  auto operator()(branch<T> left, branch<T> right) const -> branch<T> {
    return make_branch<T, _alt_node<T>>(std::move(left), std::move(right));
  }
};

// alt(l, r): every value of l and every value of r, possibly in parallel
inline constexpr alt_t alt{};

}  // namespace weave::execution
