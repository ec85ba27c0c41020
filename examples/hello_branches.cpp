#include <iostream>
#include <string>
#include <weave/execution.hpp>

using namespace weave::execution;

auto main() -> int {
  // Every pair (x, y) with x from one sequence and y from another
  auto pairs = each({1, 2, 3}) | bind([](int x) -> branch<std::string> {
                 return each({'a', 'b'}) | then([x](char y) -> std::string {
                          return std::to_string(x) + y;
                        });
               });

  // Inline: deterministic, in declaration order
  auto ordered = weave::this_thread::sync_wait(to_list(threads(0, pairs)));
  std::cout << "inline:";
  for (const auto& p : std::get<0>(*ordered)) {
    std::cout << ' ' << p;
  }
  std::cout << '\n';

  // Up to four workers: same values, arrival order
  auto parallel = weave::this_thread::sync_wait(to_list(threads(4, pairs)));
  std::cout << "parallel:";
  for (const auto& p : std::get<0>(*parallel)) {
    std::cout << ' ' << p;
  }
  std::cout << '\n';

  return 0;
}
