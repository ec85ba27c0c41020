// credit_tests.cpp
// Credit pool accounting: bounded and unlimited pools, concurrent acquire

#include <atomic>
#include <boost/ut.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <thread>
#include <vector>
#include <weave/execution/credit.hpp>

int main() {
  using namespace boost::ut;
  using namespace weave::execution;

  "bounded_pool_never_goes_below_zero"_test = [] {
    credit_pool pool{2};

    expect(pool.try_acquire());
    expect(pool.try_acquire());
    expect(!pool.try_acquire());
    expect(pool.available() == 0_ul);
    expect(pool.outstanding() == 2_ul);

    pool.release();
    expect(pool.available() == 1_ul);
    expect(pool.try_acquire());
  };

  "zero_credit_refuses_everything"_test = [] {
    credit_pool pool{0};
    expect(!pool.try_acquire());
    expect(pool.outstanding() == 0_ul);
    expect(pool.limit() == 0_ul);
  };

  "unlimited_pool_always_grants"_test = [] {
    credit_pool pool{unlimited};
    for (int i = 0; i < 1000; ++i) {
      expect(pool.try_acquire());
    }
    expect(pool.is_unlimited());
    expect(pool.outstanding() == 1000_ul);
    expect(pool.available() == std::numeric_limits<std::size_t>::max());

    for (int i = 0; i < 1000; ++i) {
      pool.release();
    }
    expect(pool.outstanding() == 0_ul);
  };

  "concurrent_acquire_respects_limit"_test = [] {
    credit_pool      pool{3};
    std::atomic<int> granted{0};

    std::vector<std::thread> workers;
    workers.reserve(8);
    for (int t = 0; t < 8; ++t) {
      workers.emplace_back([&] {
        for (int i = 0; i < 100; ++i) {
          if (pool.try_acquire()) {
            granted.fetch_add(1);
          }
        }
      });
    }
    for (auto& w : workers) {
      w.join();
    }

    expect(granted.load() == 3_i);
    expect(pool.available() == 0_ul);
  };

  "huge_limit_does_not_wrap_negative"_test = [] {
    credit_pool pool{std::numeric_limits<std::size_t>::max()};

    expect(!pool.is_unlimited());
    expect(pool.try_acquire());
    expect(pool.outstanding() == 1_ul);
    expect(pool.available() == static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max() - 1));
  };
}
