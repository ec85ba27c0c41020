// module_tests.cpp
// The library works the same through `import weave;` and through its
// headers

#include <boost/ut.hpp>

#if defined(WEAVE_USE_MODULES)
import weave;
#else
#include <weave/execution.hpp>
#endif

#include <algorithm>
#include <vector>

int main() {
  using namespace boost::ut;
  using namespace weave::execution;

  "core_types_are_visible"_test = [] {
    static_assert(sender<decltype(just(42))>);
    static_assert(requires { typename branch<int>; });
    static_assert(requires { typename execution_context; });
    static_assert(requires { typename journal; });
  };

  "computation_round_trip"_test = [] {
    auto b = each({3, 1, 2}) | then([](int x) { return x * 2; });

    auto result = weave::this_thread::sync_wait(to_list(b));
    expect(result.has_value());

    auto values = std::get<0>(*result);
    std::ranges::sort(values);
    expect(values == std::vector<int>{2, 4, 6});
  };

  "recording_round_trip"_test = [] {
    auto m = threads(0, each({1, 2}) | bind([](int x) {
                          return pause_branch() | then([x](std::monostate) { return x; });
                        }));

    auto journals = std::get<0>(*weave::this_thread::sync_wait(run_asyncly_recorded(m)));
    expect(journals.size() == 2_ul);

    auto values = std::get<0>(*weave::this_thread::sync_wait(to_list(play_recordings(m, journals))));
    std::ranges::sort(values);
    expect(values == std::vector<int>{1, 2});
  };
}
