#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>
#include <vector>

#include "branch.hpp"
#include "context.hpp"
#include "debug_log.hpp"
#include "journal.hpp"
#include "run_loop.hpp"
#include "sender.hpp"

namespace weave::execution {

namespace _drivers_detail {

enum class output : std::uint8_t {
  none,      // values are discarded
  values,    // values are collected
  journals,  // values are discarded, recordings are returned
  both,      // values and recordings are returned
};

template <class T, output Out>
struct _driver_values;

template <class T>
struct _driver_values<T, output::none> {
  using type = type_list<>;
};

template <class T>
struct _driver_values<T, output::values> {
  using type = type_list<std::vector<T>>;
};

template <class T>
struct _driver_values<T, output::journals> {
  using type = type_list<std::vector<journal>>;
};

template <class T>
struct _driver_values<T, output::both> {
  using type = type_list<std::vector<T>, std::vector<journal>>;
};

constexpr auto collects_values(output out) noexcept -> bool {
  return out == output::values || out == output::both;
}

constexpr auto records(output out) noexcept -> bool {
  return out == output::journals || out == output::both;
}

struct _request_stop {
  execution_context* ctx_;

  void operator()() const noexcept {
    ctx_->request_stop();
  }
};

// Drives `root` on the calling thread under `ctx`. On failure the run is
// stopped and its workers joined before the error leaves.
template <output Out, class T>
auto run_under(execution_context& ctx, const branch<T>& root, const std::stop_token& token)
    -> std::pair<std::vector<T>, std::vector<journal>> {
  ctx.begin_run(records(Out));

  std::optional<std::stop_callback<_request_stop>> link;
  if (token.stop_possible()) {
    link.emplace(token, _request_stop{&ctx});
  }

  std::vector<T> values;
  cursor         cur{ctx};
  try {
    drive(cur, root, [&](T value) -> void {
      if constexpr (collects_values(Out)) {
        values.push_back(std::move(value));
      }
    });
  } catch (...) {
    WEAVE_DEBUG_LOG("run failed, stopping %zu pending workers", ctx.pending());
    ctx.shutdown();
    throw;
  }

  if (ctx.stop_requested()) {
    ctx.shutdown();
  }
  return {std::move(values), ctx.take_recordings()};
}

template <class T, output Out>
struct _driver_sender {
  using sender_concept = sender_t;
  using value_types    = typename _driver_values<T, Out>::type;

  branch<T>          root_;
  execution_context* ctx_ = nullptr;  // a fresh context per run when null
  std::stop_token    token_;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const noexcept {
    if constexpr (Out == output::none) {
      return completion_signatures<set_value_t(), set_error_t(std::exception_ptr)>{};
    } else if constexpr (Out == output::values) {
      return completion_signatures<set_value_t(std::vector<T>),
                                   set_error_t(std::exception_ptr)>{};
    } else if constexpr (Out == output::journals) {
      return completion_signatures<set_value_t(std::vector<journal>),
                                   set_error_t(std::exception_ptr)>{};
    } else {
      return completion_signatures<set_value_t(std::vector<T>, std::vector<journal>),
                                   set_error_t(std::exception_ptr)>{};
    }
  }

  template <receiver R>
  auto connect(R&& r) const {
    return _operation<__decay_t<R>>{root_, ctx_, token_, std::forward<R>(r)};
  }

 private:
  template <class Rcvr>
  struct _operation {
    using operation_state_concept = operation_state_t;

    branch<T>          root_;
    execution_context* ctx_;
    std::stop_token    token_;
    Rcvr               receiver_;

    void start() & noexcept {
      std::pair<std::vector<T>, std::vector<journal>> result;
      try {
        if (ctx_ != nullptr) {
          result = run_under<Out>(*ctx_, root_, token_);
        } else {
          execution_context ctx;
          result = run_under<Out>(ctx, root_, token_);
        }
      } catch (...) {
        std::move(receiver_).set_error(std::current_exception());
        return;
      }

      if constexpr (Out == output::none) {
        std::move(receiver_).set_value();
      } else if constexpr (Out == output::values) {
        std::move(receiver_).set_value(std::move(result.first));
      } else if constexpr (Out == output::journals) {
        std::move(receiver_).set_value(std::move(result.second));
      } else {
        std::move(receiver_).set_value(std::move(result.first), std::move(result.second));
      }
    }
  };
};

template <output Out>
struct driver_t {
  template <class T>
  auto operator()(branch<T> root) const -> _driver_sender<T, Out> {
    return {std::move(root), nullptr, {}};
  }

  template <class T>
  auto operator()(execution_context& ctx, branch<T> root) const -> _driver_sender<T, Out> {
    return {std::move(root), &ctx, {}};
  }
};

template <output Out>
struct recorded_driver_t : driver_t<Out> {
  using driver_t<Out>::operator();

  template <class T>
  auto operator()(branch<T> root, std::stop_token token) const -> _driver_sender<T, Out> {
    return {std::move(root), nullptr, std::move(token)};
  }
};

}  // namespace _drivers_detail

// [drive.run_asyncly] Runs a computation to exhaustion and discards its values
inline constexpr _drivers_detail::driver_t<_drivers_detail::output::none> run_asyncly{};

// [drive.to_list] Runs a computation to exhaustion and collects its values in
// the order the driving worker observes them
inline constexpr _drivers_detail::driver_t<_drivers_detail::output::values> to_list{};

// [drive.recorded] Runs a computation with journaling enabled under a blank
// journal and completes with the journals of the branches that paused or
// were still pending when the run ended. A stop request on `token` ends the
// run early and checkpoints every pending branch.
inline constexpr _drivers_detail::recorded_driver_t<_drivers_detail::output::journals>
    run_asyncly_recorded{};

// Same as run_asyncly_recorded, also completing with the collected values
inline constexpr _drivers_detail::recorded_driver_t<_drivers_detail::output::both>
    to_list_recorded{};

}  // namespace weave::execution
