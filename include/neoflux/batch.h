#pragma once

#include <neoflux/context.h>
#include <neoflux/utility.h>

#include <cstddef>
#include <functional>

namespace neoflux {

void begin_batch();

// Closes one batch level. Closing the outermost level flushes: watched
// derived values are pulled, pending effects run (by priority), then the
// deferred subscriber notifications are delivered.
void end_batch();

auto is_batching() -> bool;

/// Runs `f` with writes coalesced into a single flush at the end of the
/// outermost batch. Writes made before an exception stay committed and are
/// still flushed.
template <typename F> decltype(auto) batch(F &&f) {
  begin_batch();
  auto _ = scope_guard{[] { end_batch(); }};
  return std::invoke(NEOFLUX_FWD(f));
}

template <typename F> decltype(auto) untrack(F &&f) {
  auto &observers = context().observers;
  observers.push_back(nullptr);
  auto _ = scope_guard{[&] { observers.pop_back(); }};
  return std::invoke(NEOFLUX_FWD(f));
}

// Defers a subscriber callback until the current flush is done. Outside of
// a batch it runs immediately.
void queue_notification(std::function<void()> notification);

void queue_microtask(std::function<void()> task);

// Drains the microtask queue, including tasks queued while draining.
// Returns how many tasks ran.
auto run_microtasks() -> std::size_t;

} // namespace neoflux
