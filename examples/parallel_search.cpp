#include <chrono>
#include <cstdlib>
#include <iostream>
#include <vector>
#include <weave/execution.hpp>

using namespace weave::execution;

namespace {

using board = std::vector<int>;  // column of the queen in each row

auto safe(const board& b, int col) -> bool {
  const int row = static_cast<int>(b.size());
  for (int r = 0; r < row; ++r) {
    if (b[r] == col || std::abs(b[r] - col) == row - r) {
      return false;
    }
  }
  return true;
}

// All placements of n queens, one alternative per candidate column
auto place(int n, board b) -> branch<board> {
  if (static_cast<int>(b.size()) == n) {
    return singleton(std::move(b));
  }

  std::vector<int> columns;
  for (int col = 0; col < n; ++col) {
    if (safe(b, col)) {
      columns.push_back(col);
    }
  }

  return each(columns) | bind([n, b](int col) -> branch<board> {
           board next = b;
           next.push_back(col);
           return place(n, std::move(next));
         });
}

}  // namespace

auto main(int argc, char** argv) -> int {
  const int n       = argc > 1 ? std::atoi(argv[1]) : 8;
  const int workers = argc > 2 ? std::atoi(argv[2]) : 4;

  auto start     = std::chrono::steady_clock::now();
  auto solutions = weave::this_thread::sync_wait(
      to_list(threads(static_cast<std::size_t>(workers), place(n, {}))));
  auto elapsed   = std::chrono::steady_clock::now() - start;

  std::cout << n << "-queens: " << std::get<0>(*solutions).size() << " solutions with up to "
            << workers << " workers in "
            << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms\n";

  return 0;
}
