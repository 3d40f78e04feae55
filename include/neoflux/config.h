#pragma once

#include <exception>
#include <functional>
#include <string_view>

namespace neoflux {

enum class log_level_t {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

using log_sink_t = std::function<void(log_level_t, std::string_view)>;

// Receives errors that no owner error handler claimed. The second argument
// names where the error surfaced ("effect", "cleanup", ...).
using error_handler_t = std::function<void(std::exception_ptr, std::string_view)>;

struct config_t {
  log_level_t log_level = log_level_t::warn;

  // Empty means: write to stderr.
  log_sink_t log_sink = {};

  error_handler_t on_error = {};
};

auto config() -> config_t &;

// Replaces the configuration and returns the previous one, so that callers
// (tests mostly) can restore it afterwards.
auto configure(config_t config) -> config_t;

} // namespace neoflux
