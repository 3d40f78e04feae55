#include <neoflux/batch.h>
#include <neoflux/computation.h>
#include <neoflux/context.h>
#include <neoflux/log.h>
#include <neoflux/owner.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace neoflux {

auto to_string(state_t state) -> std::string_view {
  switch (state) {
  case state_t::clean:
    return "clean";
  case state_t::check:
    return "check";
  case state_t::stale:
    return "stale";
  case state_t::computing:
    return "computing";
  case state_t::errored:
    return "errored";
  case state_t::disposed:
    return "disposed";
  }
  return "unknown";
}

auto to_string(priority_t priority) -> std::string_view {
  switch (priority) {
  case priority_t::sync:
    return "sync";
  case priority_t::high:
    return "high";
  case priority_t::normal:
    return "normal";
  case priority_t::low:
    return "low";
  case priority_t::idle:
    return "idle";
  }
  return "unknown";
}

source_t::source_t(node_kind_t kind, std::string name)
    : id{context().graph.add_node(kind, std::move(name))},
      name{context().graph.node(id)->name} {}

source_t::~source_t() { context().graph.remove_node(id); }

void source_t::track() {
  auto observer = current_observer();
  if (not observer or observer->disposed())
    return;

  // Reading the same source twice in one run links it only once.
  if (not observer->sources.insert(weak_from_this()))
    return;

  observers.insert(observer->self());
  context().graph.add_dependency(observer->id, id);
}

void source_t::mark_observers(state_t level) {
  const auto source = weak_from_this();
  auto current = observers; // copy, because it might be modified
  for (auto &observer : current) {
    if (not observers.contains(observer))
      continue;

    auto p = observer.lock();
    if (not p)
      continue;

    // A running computation that has not read this source yet will see the
    // new value when it does.
    if (p->state == state_t::computing and not p->sources.contains(source))
      continue;

    p->mark(level);
  }
}

void source_t::detach_observers() {
  const auto source = weak_from_this();
  for (auto &observer : std::exchange(observers, {})) {
    if (auto p = observer.lock()) {
      p->sources.erase(source);
      context().graph.remove_dependency(p->id, id);
    }
  }
}

computation_t::computation_t(derived_t derived, std::string name)
    : source_t{node_kind_t::computed, std::move(name)},
      detail{std::move(derived)} {}

computation_t::computation_t(effect_t effect, std::string name)
    : source_t{node_kind_t::effect, std::move(name)},
      detail{std::move(effect)} {}

// Only unlinks. Cleanups belong to disposal, which owners and handles trigger
// explicitly while the computation is still alive.
computation_t::~computation_t() {
  auto previous = std::exchange(sources, {});
  unlink_sources(previous);
}

auto computation_t::self() -> std::shared_ptr<computation_t> {
  return std::static_pointer_cast<computation_t>(shared_from_this());
}

void computation_t::mark(state_t level) {
  if (state == state_t::disposed)
    return;

  auto watched = is_effect() or as_derived().subscribers != 0;

  if (state == state_t::computing) {
    marked_while_running = std::max(marked_while_running, level);
    if (watched)
      context().pending.insert(self());
    return;
  }

  const auto settled = state == state_t::clean or state == state_t::errored;
  if (settled or (state == state_t::check and level == state_t::stale))
    state = level;

  // Only the first visit of a propagation travels further.
  if (not settled)
    return;

  log(log_level_t::trace, "mark {} {}", name, to_string(level));

  if (watched)
    context().pending.insert(self());

  if (is_derived())
    mark_observers(state_t::check);
}

void computation_t::ensure_up_to_date() {
  if (state == state_t::check)
    resolve_sources();

  if (state == state_t::stale)
    run();
}

void computation_t::resolve_sources() {
  ++resolve_counter;

  auto current = sources; // copy, because it might be modified
  for (auto &source : current) {
    if (auto p = source.lock())
      p->ensure_up_to_date();

    // A source that recomputed to a different value marked us stale.
    if (state != state_t::check)
      return;
  }

  state = is_derived() and as_derived().error ? state_t::errored
                                              : state_t::clean;
}

void computation_t::run() {
  if (state == state_t::disposed or state == state_t::computing)
    return;

  // The body may drop the last handle to this computation.
  const auto keep = self();

  ++run_counter;
  log(log_level_t::trace, "run {}", name);

  state = state_t::computing;
  marked_while_running = state_t::clean;
  auto previous = std::exchange(sources, {});
  auto changed = false;

  {
    auto &observers = context().observers;
    observers.push_back(this);
    auto _ = scope_guard{[&] { observers.pop_back(); }};

    if (is_derived()) {
      auto &derived = as_derived();
      const auto had_error = derived.error != nullptr;
      try {
        changed = derived.evaluate() or had_error;
        derived.error = nullptr;
      } catch (...) {
        derived.error = std::current_exception();
        changed = true;
        log(log_level_t::debug, "{} threw: {}", name,
            describe(derived.error));
      }
    } else {
      run_effect(as_effect());
    }
  }

  unlink_sources(previous);

  // Disposed by its own body: finish the disposal that was postponed.
  if (state == state_t::disposed) {
    auto current = std::exchange(sources, {});
    unlink_sources(current);
    if (is_effect())
      untrack([&] { dispose_run(as_effect()); });
    return;
  }

  if (marked_while_running != state_t::clean)
    state = marked_while_running;
  else if (is_derived() and as_derived().error)
    state = state_t::errored;
  else
    state = state_t::clean;

  if (is_derived() and changed)
    mark_observers(state_t::stale);
}

void computation_t::schedule() {
  if (disposed())
    return;

  auto &effect = as_effect();
  if (not effect.scheduler) {
    ensure_up_to_date();
    return;
  }

  // Settle check marks first so that unchanged inputs do not schedule.
  if (state == state_t::check)
    resolve_sources();

  if (state != state_t::stale)
    return;

  try {
    effect.scheduler(runner());
  } catch (...) {
    handle_error(std::current_exception(), "scheduler");
  }
}

auto computation_t::runner() -> std::function<void()> {
  return [weak = weak_from_this()] {
    auto p = std::static_pointer_cast<computation_t>(weak.lock());
    if (not p)
      return;

    batch([&] { p->ensure_up_to_date(); });
  };
}

void computation_t::dispose() {
  if (disposed())
    return;

  const auto keep = weak_from_this().lock();
  const auto was_computing = state == state_t::computing;
  state = state_t::disposed;

  log(log_level_t::trace, "dispose {}", name);

  auto &ctx = context();
  if (keep)
    ctx.pending.erase(keep);

  detach_observers();

  // A computation disposed from inside its own run is unlinked once the run
  // is over.
  if (not was_computing) {
    auto current = std::exchange(sources, {});
    unlink_sources(current);
  }

  if (is_derived())
    as_derived().subscribers = 0;
  else if (not was_computing)
    untrack([&] { dispose_run(as_effect()); });

  if (auto p = owner.lock())
    p->release(*this);

  ctx.graph.remove_node(id);
}

void computation_t::handle_error(std::exception_ptr error,
                                 std::string_view where) {
  log(log_level_t::debug, "{} error in {}: {}", where, name, describe(error));

  if (auto p = owner.lock())
    p->handle_error(error, where);
  else
    report_error(error, where);
}

void computation_t::unlink_sources(const sources_t &previous) {
  const auto observer = weak_from_this();
  auto &graph = context().graph;

  for (auto &source : previous) {
    if (sources.contains(source))
      continue;

    if (auto p = source.lock()) {
      p->observers.erase(observer);
      graph.remove_dependency(id, p->id);
    }
  }
}

void computation_t::run_effect(effect_t &effect) {
  untrack([&] { dispose_run(effect); });

  effect.run_owner = owner_t::make(owner.lock());
  try {
    effect.cleanup = run_with_owner(effect.run_owner, effect.body);
  } catch (...) {
    handle_error(std::current_exception(), "effect");
  }
}

void computation_t::dispose_run(effect_t &effect) {
  if (auto run_owner = std::exchange(effect.run_owner, nullptr))
    run_owner->dispose();

  if (auto cleanup = std::exchange(effect.cleanup, {})) {
    try {
      cleanup();
    } catch (...) {
      handle_error(std::current_exception(), "cleanup");
    }
  }
}

} // namespace neoflux
