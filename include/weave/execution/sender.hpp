#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

namespace weave::execution {

template <class T>
using __decay_t = std::decay_t<T>;

template <class T>
using __remove_cvref_t = std::remove_cvref_t<T>;

// Compile-time list of the values a sender completes with
template <class... Ts>
struct type_list {};

template <class... Sigs>
struct completion_signatures {};

// Receivers
struct receiver_t {};
struct set_value_t {};
struct set_error_t {};
struct set_stopped_t {};

template <class Rcvr>
concept receiver =
    std::move_constructible<__remove_cvref_t<Rcvr>> && requires {
      typename __remove_cvref_t<Rcvr>::receiver_concept;
      requires std::same_as<typename __remove_cvref_t<Rcvr>::receiver_concept, receiver_t>;
    } && requires(__remove_cvref_t<Rcvr>&& r) {
      { std::move(r).set_stopped() } noexcept;
    };

// Operation states
struct operation_state_t {};

template <class O>
concept operation_state = std::destructible<O> && std::is_object_v<O> && requires {
  typename O::operation_state_concept;
  requires std::same_as<typename O::operation_state_concept, operation_state_t>;
} && requires(O& o) {
  { o.start() } noexcept;
};

struct start_t {
  template <class O>
    requires operation_state<O>
  constexpr void operator()(O& o) const noexcept {
    o.start();
  }
};

inline constexpr start_t start{};

// Senders
struct sender_t {};

template <class Sndr>
concept sender = std::move_constructible<__remove_cvref_t<Sndr>> && requires {
  typename __remove_cvref_t<Sndr>::sender_concept;
  requires std::same_as<typename __remove_cvref_t<Sndr>::sender_concept, sender_t>;
};

// A sender that names the values it completes with
template <class Sndr>
concept typed_sender = sender<Sndr> && requires {
  typename __remove_cvref_t<Sndr>::value_types;
};

template <class Sndr, class Rcvr>
concept sender_to = sender<Sndr> && receiver<Rcvr> && requires(Sndr&& sndr, Rcvr&& rcvr) {
  { std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr)) } -> operation_state;
};

struct connect_t {
  template <class Sndr, class Rcvr>
    requires sender_to<Sndr, Rcvr>
  constexpr auto operator()(Sndr&& sndr, Rcvr&& rcvr) const
      noexcept(noexcept(std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr))))
          -> decltype(std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr))) {
    return std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr));
  }
};

inline constexpr connect_t connect{};

}  // namespace weave::execution
