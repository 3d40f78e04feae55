#pragma once

#include <neoflux/config.h>

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace neoflux {

auto to_string(log_level_t level) -> std::string_view;

auto describe(std::exception_ptr error) -> std::string;

auto log_enabled(log_level_t level) -> bool;
void write_log(log_level_t level, std::string_view message);

template <typename... Args>
void log(log_level_t level, fmt::format_string<Args...> format,
         Args &&...args) {
  if (not log_enabled(level))
    return;

  write_log(level, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace neoflux
