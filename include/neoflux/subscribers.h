#pragma once

#include <neoflux/batch.h>
#include <neoflux/insertion_order.h>
#include <neoflux/owner.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>

namespace neoflux {

using unsubscribe_t = std::function<void()>;

// Plain callbacks attached to a signal or a derived value. They are not
// computations: they neither track nor own anything, and they are called with
// the final value once per flush in which the value changed.
template <typename T> class subscriber_list {
  using callback_t = std::function<void(const T &)>;

  insertion_order_map<std::size_t, callback_t> callbacks;
  std::size_t next_key = 0;
  bool queued = false;

public:
  auto size() const { return callbacks.size(); }
  auto empty() const { return callbacks.empty(); }

  auto add(callback_t callback) {
    const auto key = next_key++;
    callbacks[key] = std::move(callback);
    return key;
  }

  auto remove(std::size_t key) { return not callbacks.extract(key).empty(); }

  void clear() { callbacks.clear(); }

  // Queues one delivery for the current flush. `read` is invoked at delivery
  // time so that every callback sees the final value of the batch.
  template <typename Read>
  void notify(std::weak_ptr<void> owner, Read read) {
    if (callbacks.empty() or queued)
      return;

    queued = true;
    queue_notification([this, owner = std::move(owner), read = std::move(read)] {
      auto alive = owner.lock();
      if (not alive)
        return;

      queued = false;
      deliver(read());
    });
  }

private:
  void deliver(const T &value) {
    // Copy: a callback may unsubscribe itself or others.
    auto current = callbacks;
    for (auto &[key, callback] : current) {
      if (not callbacks.contains(key))
        continue;

      try {
        callback(value);
      } catch (...) {
        report_error(std::current_exception(), "subscriber");
      }
    }
  }
};

} // namespace neoflux
