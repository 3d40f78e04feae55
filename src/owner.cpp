#include <neoflux/batch.h>
#include <neoflux/context.h>
#include <neoflux/log.h>
#include <neoflux/owner.h>

#include <algorithm>
#include <utility>

namespace neoflux {

auto owner_t::make(const std::shared_ptr<owner_t> &parent)
    -> std::shared_ptr<owner_t> {
  auto owner = std::make_shared<owner_t>();
  if (parent and not parent->disposed) {
    owner->parent = parent;
    parent->children.push_back(owner);
  }
  return owner;
}

void owner_t::on_cleanup(cleanup_t cleanup) {
  if (disposed) {
    log(log_level_t::trace, "cleanup registered on a disposed owner, dropped");
    return;
  }

  cleanups.push_back(std::move(cleanup));
}

void owner_t::adopt(std::shared_ptr<computation_t> computation) {
  if (disposed)
    return;

  if (computation->is_effect())
    effects.insert(computation);
  else
    derived.insert(computation);
}

void owner_t::release(const computation_t &computation) {
  if (computation.is_effect())
    effects.erase(computation.weak_from_this());
  else
    derived.erase(computation.weak_from_this());
}

void owner_t::dispose() {
  if (std::exchange(disposed, true))
    return;

  const auto keep = shared_from_this();

  // Cleanups read signals without subscribing whoever triggered the disposal.
  untrack([&] {
    for (auto &child : std::exchange(children, {}))
      child->dispose();

    for (auto &effect : std::exchange(effects, {}))
      effect->dispose();

    for (auto &computation : std::exchange(derived, {}))
      if (auto p = computation.lock())
        p->dispose();

    for (auto &cleanup : std::exchange(cleanups, {})) {
      try {
        cleanup();
      } catch (...) {
        handle_error(std::current_exception(), "cleanup");
      }
    }
  });

  if (auto p = parent.lock()) {
    p->remove_child(*this);
  } else {
    std::erase(context().roots, keep);
  }
}

void owner_t::handle_error(std::exception_ptr error, std::string_view where) {
  for (auto owner = shared_from_this(); owner; owner = owner->parent.lock()) {
    if (not owner->error_handler)
      continue;

    try {
      owner->error_handler(error, where);
    } catch (...) {
      log(log_level_t::error, "error handler threw: {}",
          describe(std::current_exception()));
    }
    return;
  }

  report_error(error, where);
}

void owner_t::remove_child(const owner_t &child) {
  std::erase_if(children, [&](auto &p) { return p.get() == &child; });
}

void report_error(std::exception_ptr error, std::string_view where) {
  if (auto &handler = config().on_error) {
    try {
      handler(error, where);
    } catch (...) {
      log(log_level_t::error, "error handler threw: {}",
          describe(std::current_exception()));
    }
    return;
  }

  log(log_level_t::error, "unhandled error in {}: {}", where, describe(error));
}

auto get_owner() -> std::shared_ptr<owner_t> {
  auto &owners = context().owners;
  return owners.empty() ? nullptr : owners.back();
}

auto global_owner() -> std::shared_ptr<owner_t> {
  auto &owner = context().global_owner;
  if (not owner or owner->disposed)
    owner = std::make_shared<owner_t>();
  return owner;
}

void on_cleanup(cleanup_t cleanup) {
  if (auto owner = get_owner()) {
    owner->on_cleanup(std::move(cleanup));
    return;
  }

  log(log_level_t::trace, "on_cleanup called without an owner, dropped");
}

void on_error(error_handler_t handler) {
  auto owner = get_owner();
  if (not owner or owner->disposed) {
    log(log_level_t::trace, "on_error called without an owner, dropped");
    return;
  }

  owner->error_handler = std::move(handler);
}

auto make_root() -> std::shared_ptr<owner_t> {
  auto parent = get_owner();
  auto owner = owner_t::make(parent);

  // Nothing would ever dispose a root created under a disposed owner.
  if (parent and parent->disposed) {
    owner->disposed = true;
    return owner;
  }

  if (not parent)
    context().roots.push_back(owner);
  return owner;
}

} // namespace neoflux
