#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace weave::execution {

struct unlimited_t {
  explicit unlimited_t() = default;
};

inline constexpr unlimited_t unlimited{};

// Credit counter bounding the number of concurrently dispatched workers.
// One unit is taken when a worker is dispatched and given back when the
// worker is retired. A bounded pool never goes below zero.
class credit_pool {
 public:
  explicit credit_pool(unlimited_t /*unused*/) noexcept : limit_(0), available_(0), unlimited_(true) {}

  explicit credit_pool(std::size_t limit) noexcept
      : limit_(limit),
        available_(limit > static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max())
                       ? std::numeric_limits<std::int64_t>::max()
                       : static_cast<std::int64_t>(limit)),
        unlimited_(false) {}

  credit_pool(const credit_pool&)                    = delete;
  auto operator=(const credit_pool&) -> credit_pool& = delete;

  [[nodiscard]] auto try_acquire() noexcept -> bool {
    if (unlimited_) {
      outstanding_.fetch_add(1, std::memory_order_acq_rel);
      return true;
    }

    std::int64_t current = available_.load(std::memory_order_acquire);
    while (current > 0) {
      if (available_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel)) {
        outstanding_.fetch_add(1, std::memory_order_acq_rel);
        return true;
      }
    }
    return false;
  }

  void release() noexcept {
    outstanding_.fetch_sub(1, std::memory_order_acq_rel);
    if (!unlimited_) {
      available_.fetch_add(1, std::memory_order_acq_rel);
    }
  }

  [[nodiscard]] auto is_unlimited() const noexcept -> bool {
    return unlimited_;
  }

  [[nodiscard]] auto limit() const noexcept -> std::size_t {
    return unlimited_ ? std::numeric_limits<std::size_t>::max() : limit_;
  }

  [[nodiscard]] auto available() const noexcept -> std::size_t {
    if (unlimited_) {
      return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(available_.load(std::memory_order_acquire));
  }

  // Dispatched workers not yet retired
  [[nodiscard]] auto outstanding() const noexcept -> std::size_t {
    return outstanding_.load(std::memory_order_acquire);
  }

 private:
  std::size_t               limit_;
  std::atomic<std::int64_t> available_;
  std::atomic<std::size_t>  outstanding_{0};
  bool                      unlimited_;
};

}  // namespace weave::execution
