#pragma once

#include <neoflux/dependency_graph.h>
#include <neoflux/insertion_order.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace neoflux {

struct computation_t;
struct owner_t;

using cleanup_t = std::function<void()>;
using scheduler_t = std::function<void(std::function<void()>)>;

enum class priority_t {
  sync,
  high,
  normal,
  low,
  idle,
};

enum class state_t {
  clean,
  // An upstream derived value was invalidated; it may or may not change.
  check,
  stale,
  computing,
  errored,
  disposed,
};

auto to_string(state_t state) -> std::string_view;
auto to_string(priority_t priority) -> std::string_view;

// Counters that tests use to assert how much work propagation did.
struct hooks_mixin {
  mutable int run_counter = 0;
  mutable int resolve_counter = 0;
};

using observers_t =
    insertion_order_set<std::weak_ptr<computation_t>, std::owner_less<>>;

// Anything a computation can read: signals and derived values.
struct source_t : hooks_mixin, std::enable_shared_from_this<source_t> {
  node_id_t id;
  std::string name;
  observers_t observers = {};

  source_t(node_kind_t kind, std::string name);
  virtual ~source_t();

  source_t(const source_t &) = delete;
  source_t &operator=(const source_t &) = delete;

  // We will end up here only if an observer marked `check` could not decide
  // by itself whether it has to rerun. A signal has no pending work: if it
  // had changed, it would have marked the observer stale directly.
  virtual void ensure_up_to_date() {}

  void track();

  void mark_observers(state_t level);

  void detach_observers();
};

using sources_t =
    insertion_order_set<std::weak_ptr<source_t>, std::owner_less<>>;

struct derived_t {
  // Evaluates and stores the new value; returns whether it changed.
  std::function<bool()> evaluate;
  std::exception_ptr error = nullptr;
  std::size_t subscribers = 0;
};

struct effect_t {
  std::function<cleanup_t()> body;
  scheduler_t scheduler = {};
  priority_t priority = priority_t::normal;

  // Owner of everything created by the last run, and the cleanup the last
  // run returned.
  std::shared_ptr<owner_t> run_owner = nullptr;
  cleanup_t cleanup = {};
};

// The record shared by derived values and effects. What differs between
// the two lives in `detail`.
struct computation_t : source_t {
  state_t state = state_t::stale;

  // Strongest mark received while computing; applied once the run ends.
  state_t marked_while_running = state_t::clean;

  sources_t sources = {};
  std::weak_ptr<owner_t> owner = {};
  std::variant<derived_t, effect_t> detail;

  computation_t(derived_t derived, std::string name);
  computation_t(effect_t effect, std::string name);
  ~computation_t() override;

  auto is_derived() const { return std::holds_alternative<derived_t>(detail); }
  auto is_effect() const { return std::holds_alternative<effect_t>(detail); }
  auto &as_derived() { return std::get<derived_t>(detail); }
  auto &as_effect() { return std::get<effect_t>(detail); }
  auto &as_derived() const { return std::get<derived_t>(detail); }
  auto &as_effect() const { return std::get<effect_t>(detail); }

  auto disposed() const { return state == state_t::disposed; }
  auto self() -> std::shared_ptr<computation_t>;

  /// Raises the state to `level` (check or stale). The first mark of a
  /// propagation enqueues effects and watched derived values, and passes a
  /// check mark on to derived values' own observers.
  void mark(state_t level);

  // Settles a check mark and reruns if the result is stale.
  void ensure_up_to_date() override;

  void run();

  // Flush entry point for effects: run now, or hand the run to the
  // effect's scheduler.
  void schedule();

  // A callable that brings this computation up to date later, if it is
  // still alive by then.
  auto runner() -> std::function<void()>;

  void dispose();

  void handle_error(std::exception_ptr error, std::string_view where);

private:
  void resolve_sources();
  void unlink_sources(const sources_t &previous);
  void run_effect(effect_t &effect);
  void dispose_run(effect_t &effect);
};

auto current_observer() -> computation_t *;

} // namespace neoflux
