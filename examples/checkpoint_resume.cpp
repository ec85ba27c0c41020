#include <iostream>
#include <variant>
#include <weave/execution.hpp>

using namespace weave::execution;

namespace {

// Squares every number; odd numbers stop at a checkpoint first
auto squares() -> branch<int> {
  return each({1, 2, 3, 4, 5}) | bind([](int x) -> branch<int> {
           auto square = [x](std::monostate) -> int { return x * x; };
           if (x % 2 == 0) {
             return singleton(std::monostate{}) | then(square);
           }
           return pause_branch() | then(square);
         });
}

}  // namespace

auto main() -> int {
  auto [done, journals] = *weave::this_thread::sync_wait(to_list_recorded(squares()));

  std::cout << "completed:";
  for (int v : done) {
    std::cout << ' ' << v;
  }
  std::cout << "\npaused branches: " << journals.size() << '\n';

  for (const journal& j : journals) {
    std::cout << "  journal:";
    for (const journal_entry& e : j) {
      std::cout << ' ' << to_string(e.kind) << (e.payload.empty() ? "" : "=") << e.payload;
    }
    std::cout << '\n';
  }

  // Resume every paused branch where it stopped
  auto resumed = weave::this_thread::sync_wait(to_list(squares() | play_recordings(journals)));

  std::cout << "resumed:";
  for (int v : std::get<0>(*resumed)) {
    std::cout << ' ' << v;
  }
  std::cout << '\n';

  return 0;
}
