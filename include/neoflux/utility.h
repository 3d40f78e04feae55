#pragma once

#include <utility>

#define NEOFLUX_FWD(x) std::forward<decltype(x)>(x)

namespace neoflux {

template <typename F> struct scope_guard {
  F f;
  ~scope_guard() { f(); };
};

template <typename F> scope_guard(F) -> scope_guard<F>;

} // namespace neoflux
