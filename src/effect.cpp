#include <neoflux/batch.h>
#include <neoflux/effect.h>
#include <neoflux/log.h>
#include <neoflux/owner.h>

#include <utility>

namespace neoflux {

auto make_effect(std::function<cleanup_t()> body, effect_options options)
    -> std::shared_ptr<computation_t> {
  auto owner = get_owner();
  if (not owner)
    owner = global_owner();

  const auto deferred = options.defer and not options.scheduler;
  auto effect = std::make_shared<computation_t>(
      effect_t{
          .body = std::move(body),
          .scheduler = std::move(options.scheduler),
          .priority = options.priority,
      },
      std::move(options.name));
  effect->owner = owner;

  // Created under a disposed owner: it would never be stopped, so it never
  // starts.
  if (owner->disposed) {
    log(log_level_t::trace, "effect {} created under a disposed owner",
        effect->name);
    effect->dispose();
    return effect;
  }

  owner->adopt(effect);

  if (effect->as_effect().scheduler)
    effect->schedule();
  else if (deferred)
    queue_microtask(effect->runner());
  else
    effect->runner()();

  return effect;
}

} // namespace neoflux
