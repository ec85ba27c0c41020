#pragma once

#include <concepts>
#include <ranges>
#include <utility>
#include <vector>

#include "branch.hpp"
#include "context.hpp"
#include "debug_log.hpp"
#include "dispatch.hpp"
#include "journal.hpp"

namespace weave::execution {

// Seeds the branch's journal with a recording, then advances the computation
// it was recorded from
template <class T>
class _play_node final : public node<T> {
 public:
  _play_node(journal recording, branch<T> inner)
      : recording_(std::move(recording)), inner_(std::move(inner)) {}

  auto advance(cursor& cur) const -> step<T> override {
    WEAVE_DEBUG_LOG("replaying journal with %zu entries", recording_.size());
    cur.play(recording_);
    return inner_.advance(cur);
  }

  // Not started yet: the recording itself is still the way back here
  void checkpoint_from(cursor& cur, const recorder& /*unused*/) const override {
    cur.context().save(recording_);
  }

 private:
  journal   recording_;
  branch<T> inner_;
};

// [replay.one] play_recording(m, j): resumes m at the point j was taken
struct play_recording_t {
  template <class T>
  auto operator()(branch<T> m, journal recording) const -> branch<T> {
    return make_branch<T, _play_node<T>>(std::move(recording), std::move(m));
  }
};

inline constexpr play_recording_t play_recording{};

template <class T>
auto _play_all(const branch<T>& m, std::vector<journal> journals) -> branch<T> {
  branch<T> result = empty<T>();
  for (auto it = journals.rbegin(); it != journals.rend(); ++it) {
    result = alt(play_recording(m, std::move(*it)), std::move(result));
  }
  return result;
}

struct _pipeable_play_recordings {
  std::vector<journal> recordings_;

  template <class T>
  friend auto operator|(branch<T> m, const _pipeable_play_recordings& p) -> branch<T> {
    return _play_all(m, p.recordings_);
  }
};

// [replay.all] play_recordings(m, js): one alternative per journal, each
// resuming m where its journal left off
struct play_recordings_t {
  template <class T, std::ranges::input_range R>
    requires std::same_as<std::ranges::range_value_t<R>, journal>
  auto operator()(branch<T> m, R&& recordings) const -> branch<T> {
    std::vector<journal> journals;
    for (const journal& j : recordings) {
      journals.push_back(j);
    }
    return _play_all(m, std::move(journals));
  }

  auto operator()(std::vector<journal> recordings) const -> _pipeable_play_recordings {
    return _pipeable_play_recordings{std::move(recordings)};
  }
};

inline constexpr play_recordings_t play_recordings{};

}  // namespace weave::execution
