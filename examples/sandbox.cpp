#include <neoflux/neoflux.h>

#include <fmt/core.h>

#include <functional>
#include <string>

using namespace neoflux;
using namespace std::string_literals;

int main() {
  auto first_name = neoflux::signal{"Anita"s, {.name = "first_name"}};
  auto last_name = neoflux::signal{"Laera"s, {.name = "last_name"}};
  auto nick_name = neoflux::signal{""s, {.name = "nick_name"}};

  auto full_name = computed{[=] {
                              fmt::print("calc full_name\n");
                              if (nick_name() != "")
                                return nick_name();
                              else
                                return first_name() + " " + last_name();
                            },
                            {.name = "full_name"}};

  auto display_full = neoflux::signal{true, {.name = "display_full"}};
  effect([=] {
    fmt::print("calc effect\n");
    if (display_full()) {
      const auto n = full_name();
      fmt::print(">> {}\n", n);
    } else
      fmt::print("disable effect\n");
  });

  // Anita Laera
  first_name = "Missi";
  // full_name >> effect >> Missi Laera
  last_name = "Valkering";
  // full_name >> effect >> Missi Valkering
  first_name = "Erik";
  // full_name >> effect >> Erik Valkering
  nick_name = "Erik Valkering";
  // full_name
  nick_name = "Erik Engelbertus Johannes Valkering";
  // full_name >> effect >> Erik Engelbertus Johannes Valkering
  display_full = false;
  // effect >> disable
  nick_name = "Ciri";

  auto a = neoflux::signal{1, {.name = "a"}};
  auto b = neoflux::signal{2, {.name = "b"}};
  auto sum = computed{[=] { return a() + b(); }, {.name = "sum"}};

  create_root([&](std::function<void()> dispose) {
    effect([=] { fmt::print("sum = {}\n", sum()); });

    // sum = 3
    batch([&] {
      a = 10;
      b = 20;
    });
    // sum = 30

    fmt::print("{}", dependency_graph().to_dot());
    dispose();
  });

  a = 100;
  // nothing, the effect was disposed with its root
}
