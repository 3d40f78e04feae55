#pragma once

#include <neoflux/neoflux.h>

#include <boost/ut.hpp>

#include <algorithm>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace boost::ut;

// Suites live in neoflux::tests so that `signal` names the reactive cell
// rather than the C library function.
namespace neoflux::tests {

auto to_vector(auto &&rng) {
  using T = std::ranges::range_value_t<decltype(rng)>;

  auto r = std::vector<T>{};
  for (auto &&x : rng)
    r.push_back(x);

  return r;
}

// Collects log lines for as long as it lives, then restores the previous
// configuration.
class log_capture {
  config_t previous;

public:
  std::vector<std::pair<log_level_t, std::string>> lines;

  explicit log_capture(log_level_t level = log_level_t::warn)
      : previous{configure({
            .log_level = level,
            .log_sink =
                [this](log_level_t severity, std::string_view message) {
                  lines.emplace_back(severity, std::string{message});
                },
        })} {}

  log_capture(const log_capture &) = delete;
  log_capture &operator=(const log_capture &) = delete;

  ~log_capture() { configure(std::move(previous)); }

  auto contains(std::string_view text) const {
    return std::ranges::any_of(lines, [&](auto &line) {
      return line.second.find(text) != std::string::npos;
    });
  }

  auto count(log_level_t level) const {
    return std::ranges::count(lines, level, &decltype(lines)::value_type::first);
  }
};

} // namespace neoflux::tests

#define CONCAT2(a, b) a##b
#define CONCAT(a, b) CONCAT2(a, b)
#define _ CONCAT(placeholder_, __LINE__)
