#pragma once

#include <neoflux/batch.h>
#include <neoflux/computation.h>
#include <neoflux/log.h>
#include <neoflux/subscribers.h>
#include <neoflux/utility.h>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace neoflux {

template <typename T>
using equals_t = std::function<bool(const T &, const T &)>;

// `operator==` where available. Values that cannot be compared are never
// considered equal, so every write to them propagates.
template <typename T> auto default_equals() -> equals_t<T> {
  if constexpr (std::equality_comparable<T>)
    return std::equal_to<T>{};
  else
    return [](const T &, const T &) { return false; };
}

template <typename T> struct signal_options {
  equals_t<T> equals = {};
  std::string name = {};
};

template <typename T> struct signal_state : source_t {
  T value;
  equals_t<T> equals;
  subscriber_list<T> subscribers = {};
  bool disposed = false;

  signal_state(T value, signal_options<T> options)
      : source_t{node_kind_t::signal, std::move(options.name)},
        value{std::move(value)},
        equals{options.equals ? std::move(options.equals)
                              : default_equals<T>()} {}

  void changed() {
    log(log_level_t::trace, "write {}", name);
    if (disposed)
      return;

    batch([&] {
      mark_observers(state_t::stale);
      subscribers.notify(weak_from_this(),
                         [this]() -> const T & { return value; });
    });
  }

  void dispose() {
    if (std::exchange(disposed, true))
      return;

    log(log_level_t::trace, "dispose {}", name);
    detach_observers();
    subscribers.clear();
  }
};

template <typename T> class signal {
  std::shared_ptr<signal_state<T>> state;

public:
  explicit(false) signal(T value, signal_options<T> options = {})
      : state{std::make_shared<signal_state<T>>(std::move(value),
                                                std::move(options))} {}

  signal(const signal &) = default;
  signal(signal &&) = default;

  // Disallow assignment from signals: it would silently rewire the handle
  // while dependents keep observing the old cell.
  signal &operator=(const signal &) = delete;
  signal &operator=(signal &&) = delete;

  // Returns the current value and registers a dependency on the running
  // computation. A disposed signal stays readable but is never linked again.
  auto &read() const {
    if (not state->disposed)
      state->track();
    return std::as_const(state->value);
  }

  auto &operator()() const { return read(); }
  operator const T &() const { return read(); }

  auto &peek() const { return std::as_const(state->value); }

  void write(T value) {
    if (state->equals(state->value, value))
      return;

    state->value = std::move(value);
    state->changed();
  }

  auto &operator=(T value) {
    write(std::move(value));
    return *this;
  }

  void update(std::invocable<const T &> auto &&f) {
    write(std::invoke(NEOFLUX_FWD(f), peek()));
  }

  // Modifies the value in place. Always notifies, since there is no previous
  // value left to compare against.
  void mutate(std::invocable<T &> auto &&f) {
    std::invoke(NEOFLUX_FWD(f), state->value);
    state->changed();
  }

  [[nodiscard]] auto subscribe(std::function<void(const T &)> f)
      -> unsubscribe_t {
    const auto key = state->subscribers.add(std::move(f));
    return [weak = std::weak_ptr{state}, key] {
      if (auto p = weak.lock())
        p->subscribers.remove(key);
    };
  }

  void dispose() { state->dispose(); }
  auto disposed() const { return state->disposed; }

  auto id() const { return state->id; }
  auto &name() const { return state->name; }
  auto &observers() const { return state->observers; }
};

template <typename T> signal(T) -> signal<T>;
template <typename T> signal(T, signal_options<T>) -> signal<T>;

} // namespace neoflux
