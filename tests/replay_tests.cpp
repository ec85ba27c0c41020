// replay_tests.cpp
// Checkpoint and replay: pauses, external termination of recorded runs and
// resuming from the returned journals

#include <algorithm>
#include <atomic>
#include <boost/ut.hpp>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>
#include <weave/execution.hpp>

namespace {

using namespace weave::execution;

template <class Sender>
auto values_of(Sender&& sndr) {
  auto result = weave::this_thread::sync_wait(std::forward<Sender>(sndr));
  return std::get<0>(std::move(*result));
}

template <class Sender>
auto recorded(Sender&& sndr) {
  auto result = weave::this_thread::sync_wait(std::forward<Sender>(sndr));
  return std::move(*result);
}

auto sorted(std::vector<int> v) -> std::vector<int> {
  std::ranges::sort(v);
  return v;
}

auto iota(int n) -> std::vector<int> {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) {
    v.push_back(i);
  }
  return v;
}

auto entry(entry_kind kind, std::string payload) -> journal_entry {
  return journal_entry{kind, std::move(payload)};
}

auto journal_of(std::vector<journal_entry> entries) -> journal {
  return journal{std::move(entries)};
}

// Multiplies by ten; the branch of `paused_at` pauses before doing so
auto pausing_computation(int paused_at) -> branch<int> {
  return threads(0, each({1, 2, 3}) | bind([paused_at](int x) {
                      if (x != paused_at) {
                        return singleton(x * 10);
                      }
                      return pause_branch() | then([x](std::monostate) { return x * 10; });
                    }));
}

// Tags the branch's journal with its value through the cursor and keeps the
// journal it found there
class tagging_node final : public node<int> {
 public:
  tagging_node(int value, std::vector<journal>* seen) : value_(value), seen_(seen) {}

  auto advance(cursor& cur) const -> step<int> override {
    journal j = cur.get_journal();
    seen_->push_back(j);
    j.append(journal_entry{entry_kind::effect, std::to_string(value_)});
    cur.put_journal(std::move(j));
    return final_value<int>{value_};
  }

 private:
  int                   value_;
  std::vector<journal>* seen_;
};

}  // namespace

int main() {
  using namespace boost::ut;
  using namespace weave::execution;

  "paused_branch_returns_its_journal"_test = [] {
    auto [values, journals] = recorded(to_list_recorded(pausing_computation(2)));

    expect(values == std::vector<int>{10, 30});
    expect(journals.size() == 1_ul);

    journal expected;
    expected.append(entry(entry_kind::choice, "R"));
    expected.append(entry(entry_kind::choice, "L"));
    expected.append(entry(entry_kind::pause, ""));
    expect(journals.front() == expected);
  };

  "replaying_a_pause_completes_the_result_set"_test = [] {
    auto m = pausing_computation(2);

    auto [values, journals] = recorded(to_list_recorded(m));
    auto resumed            = values_of(to_list(play_recordings(m, journals)));

    values.insert(values.end(), resumed.begin(), resumed.end());
    expect(resumed == std::vector<int>{20});
    expect(sorted(values) == values_of(to_list(pausing_computation(0))));
  };

  "replay_can_be_recorded_again"_test = [] {
    auto m = pausing_computation(2);

    auto journals = std::get<0>(recorded(run_asyncly_recorded(m)));
    auto again    = std::get<0>(recorded(run_asyncly_recorded(m | play_recordings(journals))));

    // the replayed pause is consumed, so the resumed branch runs to completion
    expect(journals.size() == 1_ul);
    expect(again.empty());
  };

  "external_stop_checkpoints_the_pending_branch"_test = [] {
    std::stop_source source;

    auto m = threads(0, each({1, 2, 3}) | bind([&source](int x) {
                          if (x == 2) {
                            source.request_stop();
                          }
                          return singleton(x);
                        }));

    auto [values, journals] = recorded(to_list_recorded(m, source.get_token()));

    expect(values == std::vector<int>{1, 2});
    expect(journals.size() == 1_ul);

    auto resumed = values_of(to_list(play_recordings(m, journals)));
    expect(resumed == std::vector<int>{3});
  };

  "stop_before_start_checkpoints_every_alternative"_test = [] {
    std::stop_source source;
    source.request_stop();

    auto m = each({1, 2});

    auto journals = std::get<0>(recorded(run_asyncly_recorded(m, source.get_token())));
    expect(journals.size() == 2_ul);

    expect(sorted(values_of(to_list(play_recordings(m, journals)))) == std::vector<int>{1, 2});
  };

  "external_stop_with_workers_loses_nothing"_test = [] {
    constexpr int n = 24;

    std::stop_source source;
    auto             m = each(iota(n)) | bind([&source](int x) {
               if (x == 7) {
                 source.request_stop();
               }
               return singleton(x);
             });

    auto [values, journals] = recorded(to_list_recorded(m, source.get_token()));
    auto resumed            = values_of(to_list(play_recordings(m, journals)));

    values.insert(values.end(), resumed.begin(), resumed.end());
    expect(sorted(values) == iota(n));
  };

  "recorded_effects_are_not_repeated"_test = [] {
    std::atomic<int> calls{0};

    auto m = record([&calls] { return 41 + calls.fetch_add(1) + 1; }) | bind([](int x) {
               return pause_branch() | then([x](std::monostate) { return x; });
             });

    auto [values, journals] = recorded(to_list_recorded(m));
    expect(values.empty());
    expect(journals.size() == 1_ul);
    expect(journals.front().entries().front() == entry(entry_kind::effect, "42"));

    auto resumed = values_of(to_list(play_recordings(m, journals)));
    expect(resumed == std::vector<int>{42});
    expect(calls.load() == 1_i);
  };

  "play_recording_resumes_one_journal"_test = [] {
    journal right;
    right.append(entry(entry_kind::choice, "R"));
    right.append(entry(entry_kind::choice, "L"));

    auto out = values_of(to_list(play_recording(each({"a", "b", "c"}), right)));
    expect(out.size() == 1_ul);
    expect(std::string(out.front()) == std::string("b"));
  };

  "replaying_a_blank_journal_reruns_everything"_test = [] {
    auto m   = threads(0, each({1, 2, 3}));
    auto out = values_of(to_list(play_recordings(m, std::vector<journal>{blank()})));
    expect(out == std::vector<int>{1, 2, 3});
  };

  "mismatched_journal_is_rejected"_test = [] {
    journal wrong_kind;
    wrong_kind.append(entry(entry_kind::effect, "1"));

    journal unknown_choice;
    unknown_choice.append(entry(entry_kind::choice, "X"));

    auto m = each({1, 2});
    expect(throws<journal_error>([&] { values_of(to_list(play_recording(m, wrong_kind))); }));
    expect(throws<journal_error>([&] { values_of(to_list(play_recording(m, unknown_choice))); }));
  };

  "undecodable_effect_is_rejected"_test = [] {
    journal j;
    j.append(entry(entry_kind::effect, "not a number"));

    auto m = record([] { return 1; });
    expect(throws<journal_error>([&] { values_of(to_list(play_recording(m, j))); }));
  };

  "replaced_journal_is_what_a_pause_reports"_test = [] {
    std::vector<journal> seen;

    auto m = threads(0, each({1, 2}) | bind([&seen](int x) {
                          return make_branch<int, tagging_node>(x, &seen) | bind([](int y) {
                                   return pause_branch() | then([y](std::monostate) { return y; });
                                 });
                        }));

    auto [values, journals] = recorded(to_list_recorded(m));
    expect(values.empty());

    expect(seen == std::vector<journal>{
                       journal_of({entry(entry_kind::choice, "L")}),
                       journal_of({entry(entry_kind::choice, "R"), entry(entry_kind::choice, "L")}),
                   });

    expect(journals == std::vector<journal>{
                           journal_of({entry(entry_kind::choice, "L"), entry(entry_kind::effect, "1"),
                                       entry(entry_kind::pause, "")}),
                           journal_of({entry(entry_kind::choice, "R"), entry(entry_kind::choice, "L"),
                                       entry(entry_kind::effect, "2"), entry(entry_kind::pause, "")}),
                       });
  };
}
