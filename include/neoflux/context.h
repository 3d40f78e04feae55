#pragma once

#include <neoflux/computation.h>
#include <neoflux/config.h>
#include <neoflux/dependency_graph.h>
#include <neoflux/insertion_order.h>

#include <deque>
#include <functional>
#include <memory>
#include <vector>

namespace neoflux {

struct owner_t;

using pending_t =
    insertion_order_set<std::shared_ptr<computation_t>, std::owner_less<>>;

// All mutable state of the reactive runtime. There is one per thread; the
// runtime is single-threaded and handles must stay on the thread that created
// them.
struct context_t {
  // Declared first so it outlives every node released by the members below.
  dependency_graph_t graph;

  config_t config;

  // Tracking stack. A nullptr frame means "untracked".
  std::vector<computation_t *> observers;

  // Owner stack. A nullptr frame means "no owner".
  std::vector<std::shared_ptr<owner_t>> owners;

  // Keeps effects created outside any owner alive.
  std::shared_ptr<owner_t> global_owner;

  // Top-level roots stay alive until disposed.
  std::vector<std::shared_ptr<owner_t>> roots;

  int batch_depth = 0;
  pending_t pending;
  std::vector<std::function<void()>> notifications;
  std::deque<std::function<void()>> microtasks;

  context_t();
  ~context_t();

  context_t(const context_t &) = delete;
  context_t &operator=(const context_t &) = delete;
};

auto context() -> context_t &;

} // namespace neoflux
