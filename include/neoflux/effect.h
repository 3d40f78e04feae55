#pragma once

#include <neoflux/computation.h>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace neoflux {

struct effect_options {
  // Postpone the first run to the microtask queue. Ignored when a scheduler is
  // given, since the scheduler then decides when the first run happens.
  bool defer = false;

  // Receives a runner for every (re)run instead of running synchronously.
  scheduler_t scheduler = {};

  priority_t priority = priority_t::normal;
  std::string name = {};
};

/// Adapts an effect body to the uniform "returns a cleanup" shape. Bodies may
/// return nothing or anything a `cleanup_t` can be built from.
template <typename F> auto with_cleanup(F f) -> std::function<cleanup_t()> {
  return [f = std::move(f)]() mutable -> cleanup_t {
    if constexpr (std::is_void_v<std::invoke_result_t<F &>>) {
      std::invoke(f);
      return {};
    } else {
      return cleanup_t{std::invoke(f)};
    }
  };
}

// Creates an effect owned by the active owner (or the global owner) and
// starts it according to `options`.
auto make_effect(std::function<cleanup_t()> body, effect_options options)
    -> std::shared_ptr<computation_t>;

// A handle to an effect. The effect keeps running after the handle is gone;
// it stops when disposed, either directly or through its owner.
class effect {
  std::shared_ptr<computation_t> node;

public:
  template <std::invocable F>
    requires(not std::same_as<std::remove_cvref_t<F>, effect>)
  explicit(false) effect(F body, effect_options options = {})
      : node{make_effect(with_cleanup(std::move(body)), std::move(options))} {}

  void dispose() { node->dispose(); }

  auto disposed() const { return node->disposed(); }
  auto id() const { return node->id; }
  auto &name() const { return node->name; }
  auto run_count() const { return node->run_counter; }
};

} // namespace neoflux
