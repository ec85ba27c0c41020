#pragma once

#include <exception>
#include <tuple>
#include <utility>

#include "sender.hpp"

namespace weave::execution {

// just(vs...): completes inline with the given values
template <class... Vs>
struct _just_sender {
  using sender_concept = sender_t;
  using value_types    = type_list<Vs...>;

  std::tuple<Vs...> values_;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const noexcept {
    return completion_signatures<set_value_t(Vs...)>{};
  }

  template <receiver R>
  auto connect(R&& r) && {
    return _operation<__decay_t<R>>{std::move(values_), std::forward<R>(r)};
  }

  template <receiver R>
  auto connect(R&& r) const& {
    return _operation<__decay_t<R>>{values_, std::forward<R>(r)};
  }

 private:
  template <class Rcvr>
  struct _operation {
    using operation_state_concept = operation_state_t;

    std::tuple<Vs...> values_;
    Rcvr              receiver_;

    void start() & noexcept {
      std::apply(
          [this](auto&&... args) -> auto {
            std::move(receiver_).set_value(std::forward<decltype(args)>(args)...);
          },
          std::move(values_));
    }
  };
};

struct just_t {
  template <class... Vs>
  constexpr auto operator()(Vs&&... vs) const {
    return _just_sender<__decay_t<Vs>...>{std::tuple<__decay_t<Vs>...>{std::forward<Vs>(vs)...}};
  }
};

inline constexpr just_t just{};

// just_error<Ts...>(e): fails inline; Ts names the values it would have sent
template <class E, class... Ts>
struct _just_error_sender {
  using sender_concept = sender_t;
  using value_types    = type_list<Ts...>;

  E error_;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const noexcept {
    return completion_signatures<set_error_t(E)>{};
  }

  template <receiver R>
  auto connect(R&& r) const {
    return _operation<__decay_t<R>>{error_, std::forward<R>(r)};
  }

 private:
  template <class Rcvr>
  struct _operation {
    using operation_state_concept = operation_state_t;

    E    error_;
    Rcvr receiver_;

    void start() & noexcept {
      std::move(receiver_).set_error(std::move(error_));
    }
  };
};

template <class... Ts>
struct just_error_t {
  template <class E>
  constexpr auto operator()(E&& e) const {
    return _just_error_sender<__decay_t<E>, Ts...>{std::forward<E>(e)};
  }
};

template <class... Ts>
inline constexpr just_error_t<Ts...> just_error{};

// just_stopped<Ts...>(): completes inline with set_stopped
template <class... Ts>
struct _just_stopped_sender {
  using sender_concept = sender_t;
  using value_types    = type_list<Ts...>;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const noexcept {
    return completion_signatures<set_stopped_t()>{};
  }

  template <receiver R>
  auto connect(R&& r) const {
    return _operation<__decay_t<R>>{std::forward<R>(r)};
  }

 private:
  template <class Rcvr>
  struct _operation {
    using operation_state_concept = operation_state_t;

    Rcvr receiver_;

    void start() & noexcept {
      std::move(receiver_).set_stopped();
    }
  };
};

template <class... Ts>
struct just_stopped_t {
  constexpr auto operator()() const noexcept {
    return _just_stopped_sender<Ts...>{};
  }
};

template <class... Ts>
inline constexpr just_stopped_t<Ts...> just_stopped{};

}  // namespace weave::execution
