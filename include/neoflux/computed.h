#pragma once

#include <neoflux/batch.h>
#include <neoflux/computation.h>
#include <neoflux/errors.h>
#include <neoflux/log.h>
#include <neoflux/owner.h>
#include <neoflux/signal.h>
#include <neoflux/subscribers.h>

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace neoflux {

template <typename T> struct computed_options {
  equals_t<T> equals = {};
  std::string name = {};
};

template <typename T> struct computed_state {
  std::shared_ptr<computation_t> node = nullptr;
  std::optional<T> cache = std::nullopt;
  equals_t<T> equals;
  subscriber_list<T> subscribers = {};

  explicit computed_state(equals_t<T> equals)
      : equals{equals ? std::move(equals) : default_equals<T>()} {}

  computed_state(const computed_state &) = delete;
  computed_state &operator=(const computed_state &) = delete;

  ~computed_state() {
    if (node)
      node->dispose();
  }

  // The value handed out when no up-to-date value can be produced: the last
  // cached one, or a value-initialized `T` if there never was one.
  template <typename Error> auto &fallback(Error failure) const {
    if (cache)
      return std::as_const(*cache);

    if constexpr (std::default_initializable<T>) {
      static const auto sentinel = T{};
      return sentinel;
    } else {
      throw failure;
    }
  }
};

template <typename T>
auto make_computed_state(std::function<T()> f, computed_options<T> options) {
  auto state = std::make_shared<computed_state<T>>(std::move(options.equals));

  auto evaluate = [weak = std::weak_ptr{state}, f = std::move(f)]() -> bool {
    auto state = weak.lock();
    if (not state)
      return false;

    auto value = f();
    if (state->cache and state->equals(*state->cache, value))
      return false;

    state->cache.emplace(std::move(value));
    state->subscribers.notify(
        state, [raw = state.get()]() -> const T & { return *raw->cache; });
    return true;
  };

  state->node = std::make_shared<computation_t>(
      derived_t{.evaluate = std::move(evaluate)}, std::move(options.name));
  if (auto owner = get_owner()) {
    state->node->owner = owner;
    owner->adopt(state->node);
  }
  return state;
}

template <typename T> class computed {
  std::shared_ptr<computed_state<T>> state;

public:
  template <std::invocable F>
    requires(not std::same_as<std::remove_cvref_t<F>, computed>)
  explicit(false) computed(F f, computed_options<T> options = {})
      : state{make_computed_state<T>(std::function<T()>{std::move(f)},
                                     std::move(options))} {}

  computed(const computed &) = default;
  computed &operator=(const computed &) = default;
  computed(computed &&) = default;
  computed &operator=(computed &&) = default;

  /// Brings the value up to date and registers a dependency on the running
  /// computation. Re-throws whatever the last evaluation threw.
  auto &read() const {
    auto &node = *state->node;

    if (node.disposed())
      return state->fallback(
          error{"read of disposed derived value " + node.name});

    if (node.state == state_t::computing) {
      log(log_level_t::warn, "circular dependency detected while computing {}",
          node.name);
      return state->fallback(circular_dependency_error{node.name});
    }

    node.ensure_up_to_date();
    node.track();

    if (auto failure = node.as_derived().error)
      std::rethrow_exception(failure);

    return std::as_const(*state->cache);
  }

  auto &operator()() const { return read(); }
  operator const T &() const { return read(); }

  auto &peek() const {
    return untrack([&]() -> const T & { return read(); });
  }

  /// `f(value)` runs after every flush in which the value changed. While it
  /// has subscribers, the value is recomputed eagerly during flushes.
  [[nodiscard]] auto subscribe(std::function<void(const T &)> f)
      -> unsubscribe_t {
    auto &node = *state->node;
    untrack([&] { node.ensure_up_to_date(); });

    const auto key = state->subscribers.add(std::move(f));
    ++node.as_derived().subscribers;

    return [weak = std::weak_ptr{state}, key] {
      auto p = weak.lock();
      if (not p or not p->subscribers.remove(key))
        return;

      --p->node->as_derived().subscribers;
    };
  }

  void dispose() {
    state->node->dispose();
    state->subscribers.clear();
  }

  auto disposed() const { return state->node->disposed(); }
  auto id() const { return state->node->id; }
  auto &name() const { return state->node->name; }
  auto &observers() const { return state->node->observers; }
  auto run_count() const { return state->node->run_counter; }
  auto resolve_count() const { return state->node->resolve_counter; }
};

template <std::invocable F>
computed(F) -> computed<std::remove_cvref_t<std::invoke_result_t<F &>>>;

template <std::invocable F>
computed(F, computed_options<std::remove_cvref_t<std::invoke_result_t<F &>>>)
    -> computed<std::remove_cvref_t<std::invoke_result_t<F &>>>;

} // namespace neoflux
