#include <neoflux/log.h>

#include <fmt/core.h>

#include <cstdio>
#include <exception>

namespace neoflux {

auto to_string(log_level_t level) -> std::string_view {
  switch (level) {
  case log_level_t::trace:
    return "trace";
  case log_level_t::debug:
    return "debug";
  case log_level_t::info:
    return "info";
  case log_level_t::warn:
    return "warn";
  case log_level_t::error:
    return "error";
  case log_level_t::off:
    return "off";
  }
  return "unknown";
}

auto describe(std::exception_ptr error) -> std::string {
  if (not error)
    return "no error";

  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

auto log_enabled(log_level_t level) -> bool {
  return level != log_level_t::off and level >= config().log_level;
}

void write_log(log_level_t level, std::string_view message) {
  if (auto &sink = config().log_sink) {
    sink(level, message);
    return;
  }

  fmt::print(stderr, "[neoflux] {}: {}\n", to_string(level), message);
}

} // namespace neoflux
