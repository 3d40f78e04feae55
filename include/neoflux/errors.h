#pragma once

#include <stdexcept>
#include <string>

namespace neoflux {

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Thrown only when a derived value is read while it is being computed and no
// sentinel value can be produced for its type. Otherwise circular reads are
// logged and answered with the last cached value.
struct circular_dependency_error : error {
  explicit circular_dependency_error(const std::string &name)
      : error{"circular dependency while computing " + name} {}
};

} // namespace neoflux
