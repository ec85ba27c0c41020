#pragma once

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <tuple>
#include <variant>

#include "sender.hpp"

namespace weave::this_thread {

namespace _sync_wait_detail {

template <class... Ts>
struct _sync_wait_state {
  std::mutex                                                          mutex;
  std::condition_variable                                             cv;
  bool                                                                completed = false;
  std::variant<std::monostate, std::tuple<Ts...>, std::exception_ptr> result;

  template <std::size_t I, class... Args>
  void complete(Args&&... args) noexcept {
    {
      std::scoped_lock lock(mutex);
      try {
        result.template emplace<I>(std::forward<Args>(args)...);
      } catch (...) {
        result.template emplace<2>(std::current_exception());
      }
      completed = true;
    }
    cv.notify_one();
  }
};

template <class... Ts>
struct _sync_wait_receiver {
  using receiver_concept = execution::receiver_t;

  _sync_wait_state<Ts...>* state_;

  template <class... Args>
    requires std::constructible_from<std::tuple<Ts...>, Args...>
  void set_value(Args&&... args) && noexcept {
    state_->template complete<1>(std::forward<Args>(args)...);
  }

  void set_error(std::exception_ptr ep) && noexcept {
    state_->template complete<2>(std::move(ep));
  }

  template <class E>
  void set_error(E&& e) && noexcept {
    state_->template complete<2>(std::make_exception_ptr(std::forward<E>(e)));
  }

  void set_stopped() && noexcept {
    state_->template complete<0>();
  }
};

template <class TypeList>
struct _sync_wait_impl;

template <class... Ts>
struct _sync_wait_impl<execution::type_list<Ts...>> {
  template <execution::sender S>
  static auto run(S&& sndr) -> std::optional<std::tuple<Ts...>> {
    _sync_wait_state<Ts...> state;

    auto op = execution::connect(std::forward<S>(sndr), _sync_wait_receiver<Ts...>{&state});
    execution::start(op);

    {
      std::unique_lock lock(state.mutex);
      state.cv.wait(lock, [&] -> auto { return state.completed; });
    }

    if (auto* ep = std::get_if<2>(&state.result)) {
      std::rethrow_exception(*ep);
    }
    if (auto* values = std::get_if<1>(&state.result)) {
      return std::move(*values);
    }
    return std::nullopt;  // stopped
  }
};

}  // namespace _sync_wait_detail

// Blocks the calling thread until the sender completes. Errors are rethrown,
// a stopped sender yields nullopt.
struct sync_wait_t {
  template <execution::typed_sender S>
  auto operator()(S&& sndr) const {
    using values = typename execution::__remove_cvref_t<S>::value_types;
    return _sync_wait_detail::_sync_wait_impl<values>::run(std::forward<S>(sndr));
  }
};

inline constexpr sync_wait_t sync_wait{};

}  // namespace weave::this_thread
