// driver_tests.cpp
// Run-loop drivers as senders: completion channels, explicit contexts and
// custom receivers

#include <algorithm>
#include <atomic>
#include <boost/ut.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <weave/execution.hpp>

namespace {

using namespace weave::execution;

// Stores whatever to_list completes with
struct list_receiver {
  using receiver_concept = receiver_t;

  std::optional<std::vector<int>>* values_;
  std::exception_ptr*              error_;
  bool*                            stopped_;

  void set_value(std::vector<int> values) && noexcept {
    *values_ = std::move(values);
  }

  void set_error(std::exception_ptr ep) && noexcept {
    *error_ = std::move(ep);
  }

  void set_stopped() && noexcept {
    *stopped_ = true;
  }
};

}  // namespace

int main() {
  using namespace boost::ut;
  using namespace weave::execution;

  "drivers_are_senders"_test = [] {
    static_assert(sender<decltype(run_asyncly(singleton(1)))>);
    static_assert(typed_sender<decltype(to_list(singleton(1)))>);
    static_assert(
        std::same_as<decltype(to_list(singleton(1)))::value_types, type_list<std::vector<int>>>);
    static_assert(std::same_as<decltype(run_asyncly_recorded(singleton(1)))::value_types,
                               type_list<std::vector<journal>>>);
    static_assert(std::same_as<decltype(to_list_recorded(singleton(1)))::value_types,
                               type_list<std::vector<int>, std::vector<journal>>>);
  };

  "run_asyncly_runs_every_branch"_test = [] {
    std::atomic<int> visited{0};

    auto b = each({1, 2, 3, 4}) | bind([&](int x) {
               return lift([&visited, x] {
                 visited.fetch_add(x);
                 return x;
               });
             });

    auto result = weave::this_thread::sync_wait(run_asyncly(b));
    expect(result.has_value());
    expect(visited.load() == 10_i);
  };

  "to_list_with_explicit_context"_test = [] {
    execution_context ctx{1};

    auto result = weave::this_thread::sync_wait(to_list(ctx, each({"x", "y"}) | then([](const char* s) {
                                                             return std::string(s);
                                                           })));
    expect(result.has_value());

    auto values = std::get<0>(*result);
    std::ranges::sort(values);
    expect(values == std::vector<std::string>{"x", "y"});
    expect(ctx.pending() == 0_ul);
  };

  "custom_receiver_gets_values"_test = [] {
    std::optional<std::vector<int>> values;
    std::exception_ptr              error;
    bool                            stopped = false;

    auto op = connect(to_list(threads(0, each({5, 6}))), list_receiver{&values, &error, &stopped});
    start(op);

    expect(values.has_value());
    expect(*values == std::vector<int>{5, 6});
    expect(!error);
    expect(!stopped);
  };

  "custom_receiver_gets_errors"_test = [] {
    std::optional<std::vector<int>> values;
    std::exception_ptr              error;
    bool                            stopped = false;

    auto failing = singleton(1) | then([](int) -> int { throw std::invalid_argument("nope"); });

    auto op = connect(to_list(failing), list_receiver{&values, &error, &stopped});
    start(op);

    expect(!values.has_value());
    expect(static_cast<bool>(error));
    expect(throws<std::invalid_argument>([&] { std::rethrow_exception(error); }));
  };

  "driver_sender_can_be_started_twice"_test = [] {
    auto sndr = to_list(threads(0, each({1, 2})));

    auto first  = weave::this_thread::sync_wait(sndr);
    auto second = weave::this_thread::sync_wait(sndr);
    expect(std::get<0>(*first) == std::get<0>(*second));
  };

  "recorded_run_without_pauses_returns_no_journals"_test = [] {
    auto result = weave::this_thread::sync_wait(run_asyncly_recorded(each({1, 2, 3})));
    expect(result.has_value());
    expect(std::get<0>(*result).empty());
  };

  "context_is_reusable_after_a_failed_run"_test = [] {
    execution_context ctx;

    auto failing = each({1, 2, 3}) | then([](int x) -> int {
                     if (x == 2) {
                       throw std::runtime_error("failed run");
                     }
                     return x;
                   });
    expect(throws<std::runtime_error>([&] { static_cast<void>(weave::this_thread::sync_wait(to_list(ctx, failing))); }));

    auto result = weave::this_thread::sync_wait(to_list(ctx, each({1, 2, 3})));
    auto values = std::get<0>(*result);
    std::ranges::sort(values);
    expect(values == std::vector<int>{1, 2, 3});
    expect(!ctx.stop_requested());
  };

  "plain_run_after_recorded_run_does_not_pause"_test = [] {
    execution_context ctx;

    auto m = threads(0, each({1, 2}) | bind([](int x) {
                          return pause_branch() | then([x](std::monostate) { return x; });
                        }));

    auto journals = std::get<0>(*weave::this_thread::sync_wait(run_asyncly_recorded(ctx, m)));
    expect(journals.size() == 2_ul);

    auto values = std::get<0>(*weave::this_thread::sync_wait(to_list(ctx, m)));
    expect(values == std::vector<int>{1, 2});
  };

  "recording_set_starts_empty_on_every_run"_test = [] {
    execution_context ctx;

    auto m = threads(0, singleton(1) | bind([](int x) {
                          return pause_branch() | then([x](std::monostate) { return x; });
                        }));

    auto first  = std::get<0>(*weave::this_thread::sync_wait(run_asyncly_recorded(ctx, m)));
    auto second = std::get<0>(*weave::this_thread::sync_wait(run_asyncly_recorded(ctx, m)));
    expect(first.size() == 1_ul);
    expect(second.size() == 1_ul);
  };
}
