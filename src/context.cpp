#include <neoflux/context.h>
#include <neoflux/owner.h>

#include <utility>

namespace neoflux {

context_t::context_t() = default;

// Stops whatever is still running when the thread exits, while the graph and
// the configuration are still around for the cleanups to use.
context_t::~context_t() {
  for (auto &root : std::exchange(roots, {}))
    root->dispose();

  if (auto owner = std::exchange(global_owner, nullptr))
    owner->dispose();

  pending.clear();
  notifications.clear();
  microtasks.clear();
}

auto context() -> context_t & {
  thread_local context_t instance;
  return instance;
}

auto config() -> config_t & { return context().config; }

auto configure(config_t config) -> config_t {
  return std::exchange(context().config, std::move(config));
}

auto current_observer() -> computation_t * {
  auto &observers = context().observers;
  return observers.empty() ? nullptr : observers.back();
}

} // namespace neoflux
