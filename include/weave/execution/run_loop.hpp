#pragma once

#include <optional>
#include <utility>

#include "branch.hpp"
#include "context.hpp"
#include "debug_log.hpp"
#include "journal.hpp"

namespace weave::execution {

// [exec.drive] Advances `root` until it is exhausted, handing every value to
// on_value in the order this worker observes them.
//
// Stops early, without error, when the context is asked to stop; in a
// recorded run the branches still pending at that point are checkpointed.
// A pause escaping `root` means nothing is left to advance.
template <class T, class OnValue>
void drive(cursor& cur, const branch<T>& root, OnValue&& on_value) {
  execution_context&       ctx = cur.context();
  std::optional<branch<T>> next{root};
  bool                     started = false;

  while (next) {
    if (ctx.stop_requested()) {
      if (ctx.recording()) {
        WEAVE_DEBUG_LOG("stop requested, checkpointing pending branches");
        if (started) {
          next->checkpoint(cur);
        } else {
          next->checkpoint_from(cur, cur.trail());
        }
      }
      return;
    }

    branch<T> current = *next;
    try {
      current.run(
          cur, [&] -> void { next.reset(); },
          [&](T value, std::optional<branch<T>> rest) -> void {
            on_value(std::move(value));
            next = std::move(rest);
          });
    } catch (branch_paused& paused) {
      ctx.save(std::move(paused.recording));
      return;
    }
    started = true;
  }
}

}  // namespace weave::execution
