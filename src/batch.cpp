#include <neoflux/batch.h>
#include <neoflux/log.h>
#include <neoflux/owner.h>

#include <algorithm>
#include <cassert>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace neoflux {

namespace {

// Runs until nothing is pending anymore. Effects may write signals; those
// writes land in the same loop instead of starting a nested flush.
void flush(context_t &ctx) {
  ++ctx.batch_depth;
  auto _ = scope_guard{[&] { --ctx.batch_depth; }};

  while (not ctx.pending.empty() or not ctx.notifications.empty()) {
    auto pending = std::exchange(ctx.pending, {});
    log(log_level_t::trace, "flush {} computations", pending.size());

    auto effects = std::vector<std::shared_ptr<computation_t>>{};
    for (auto &computation : pending) {
      if (computation->is_effect())
        effects.push_back(computation);
      else
        computation->ensure_up_to_date();
    }

    std::ranges::stable_sort(effects, {}, [](auto &effect) {
      return effect->as_effect().priority;
    });

    for (auto &effect : effects)
      effect->schedule();

    for (auto &notification : std::exchange(ctx.notifications, {})) {
      try {
        notification();
      } catch (...) {
        report_error(std::current_exception(), "subscriber");
      }
    }
  }
}

} // namespace

void begin_batch() { ++context().batch_depth; }

void end_batch() {
  auto &ctx = context();
  assert(ctx.batch_depth > 0);
  if (--ctx.batch_depth == 0)
    flush(ctx);
}

auto is_batching() -> bool { return context().batch_depth != 0; }

void queue_notification(std::function<void()> notification) {
  auto &ctx = context();
  if (ctx.batch_depth == 0) {
    notification();
    return;
  }

  ctx.notifications.push_back(std::move(notification));
}

void queue_microtask(std::function<void()> task) {
  context().microtasks.push_back(std::move(task));
}

auto run_microtasks() -> std::size_t {
  auto &microtasks = context().microtasks;
  auto count = std::size_t{0};

  while (not microtasks.empty()) {
    auto task = std::move(microtasks.front());
    microtasks.pop_front();
    ++count;

    try {
      task();
    } catch (...) {
      report_error(std::current_exception(), "microtask");
    }
  }

  return count;
}

} // namespace neoflux
