#pragma once

#include <neoflux/computation.h>
#include <neoflux/config.h>
#include <neoflux/context.h>
#include <neoflux/insertion_order.h>
#include <neoflux/utility.h>

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace neoflux {

/// A disposal scope. Owners form a tree: disposing one disposes its
/// children depth-first, then the effects and derived values created under
/// it, then runs its own cleanups in registration order.
struct owner_t : std::enable_shared_from_this<owner_t> {
  std::weak_ptr<owner_t> parent = {};
  std::vector<std::shared_ptr<owner_t>> children = {};
  pending_t effects = {};
  // Derived values stay alive through their handles only.
  observers_t derived = {};
  std::vector<cleanup_t> cleanups = {};
  error_handler_t error_handler = {};
  bool disposed = false;

    static auto make(const std::shared_ptr<owner_t> &parent)
      -> std::shared_ptr<owner_t>;

  void on_cleanup(cleanup_t cleanup);

  // Effects are kept alive by their owner until disposed.
  void adopt(std::shared_ptr<computation_t> computation);
  void release(const computation_t &computation);

  void dispose();

  // Nearest handler up the parent chain, else `report_error`.
  void handle_error(std::exception_ptr error, std::string_view where);

private:
  void remove_child(const owner_t &child);
};

// Last resort for errors nobody claimed: the configured handler, else the
// log.
void report_error(std::exception_ptr error, std::string_view where);

auto get_owner() -> std::shared_ptr<owner_t>;

// Keeps effects created outside of any owner alive. Disposing it stops all of
// them; a fresh one takes its place.
auto global_owner() -> std::shared_ptr<owner_t>;

// Registers a cleanup on the active owner. Without an active owner the
// callback is dropped.
void on_cleanup(cleanup_t cleanup);

void on_error(error_handler_t handler);

template <typename F>
decltype(auto) run_with_owner(std::shared_ptr<owner_t> owner, F &&f) {
  auto &owners = context().owners;
  owners.push_back(std::move(owner));
  auto _ = scope_guard{[&] { owners.pop_back(); }};
  return std::invoke(NEOFLUX_FWD(f));
}

auto make_root() -> std::shared_ptr<owner_t>;

/// Runs `f` untracked inside a new root owner. `f` may accept a callback
/// that disposes the root. Roots created inside another owner are disposed
/// with it; top-level roots live until disposed.
template <typename F> decltype(auto) create_root(F &&f) {
  auto owner = make_root();
  auto dispose = std::function<void()>{[weak = std::weak_ptr{owner}] {
    if (auto p = weak.lock())
      p->dispose();
  }};

  auto &observers = context().observers;
  observers.push_back(nullptr);
  auto _ = scope_guard{[&] { observers.pop_back(); }};

  return run_with_owner(std::move(owner), [&]() -> decltype(auto) {
    if constexpr (std::invocable<F, std::function<void()>>)
      return std::invoke(NEOFLUX_FWD(f), std::move(dispose));
    else
      return std::invoke(NEOFLUX_FWD(f));
  });
}

} // namespace neoflux
