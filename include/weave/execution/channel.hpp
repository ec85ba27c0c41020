#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace weave::execution {

// Unbounded FIFO, many producers and one consumer. Items from one producer
// are popped in the order that producer pushed them.
template <class T>
class channel {
 public:
  channel() = default;

  channel(const channel&)                    = delete;
  auto operator=(const channel&) -> channel& = delete;

  void push(T item) {
    {
      std::scoped_lock lock(mutex_);
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
  }

  // Blocks until an item is available
  auto pop() -> T {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] -> bool { return !queue_.empty(); });
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

 private:
  std::deque<T>           queue_;
  std::mutex              mutex_;
  std::condition_variable cv_;
};

}  // namespace weave::execution
