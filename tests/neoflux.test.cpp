#include <fmt/core.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common.h"

using namespace std::string_literals;

namespace neoflux::tests {

static suite<"scenarios"> _ = [] {
  "full_name"_test = [] {
    auto first_name = signal{"Anita"s};
    auto last_name = signal{"Laera"s};
    auto nick_name = signal{""s};

    auto full_name = computed{[=] {
      if (nick_name() != "")
        return nick_name();
      else
        return first_name() + " " + last_name();
    }};

    auto display_full = signal{true};
    auto printed = std::vector<std::string>{};
    auto e = effect{[&] {
      if (display_full())
        printed.push_back(full_name());
      else
        printed.push_back("disabled");
    }};

    first_name = "Missi";
    last_name = "Valkering";
    first_name = "Erik";
    nick_name = "Erik Valkering";
    expect(full_name.run_count() == 5_i);

    nick_name = "Erik Engelbertus Johannes Valkering";
    display_full = false;
    nick_name = "Ciri";

    expect(printed == std::vector{
                          "Anita Laera"s,
                          "Missi Laera"s,
                          "Missi Valkering"s,
                          "Erik Valkering"s,
                          "Erik Engelbertus Johannes Valkering"s,
                          "disabled"s,
                      });
    expect(full_name.run_count() == 6_i)
        << "an unobserved derived value is not recomputed";

    first_name = "Anita";
    expect(e.run_count() == 6_i)
        << "dependencies of untaken branches are dropped";

    e.dispose();
  };

  "todo_list"_test = [] {
    auto todos = signal{std::vector<std::string>{}};
    auto done = signal{0};
    auto remaining =
        computed{[=] { return static_cast<int>(todos().size()) - done(); }};

    auto status = std::vector<std::string>{};
    auto e = effect{[&] {
      status.push_back(
          fmt::format("{} of {} left", remaining(), todos().size()));
    }};

    todos.mutate([](auto &list) { list.push_back("write tests"); });
    todos.mutate([](auto &list) { list.push_back("fix bugs"); });
    batch([&] {
      done = 1;
      todos.update([](auto &list) {
        auto copy = list;
        copy.push_back("ship");
        return copy;
      });
    });

    expect(status == std::vector{
                         "0 of 0 left"s,
                         "1 of 1 left"s,
                         "2 of 2 left"s,
                         "2 of 3 left"s,
                     });

    e.dispose();
  };
};

static suite<"configuration"> _ = [] {
  "configure"_test = [] {
    auto previous = configure({.log_level = log_level_t::debug});
    expect(previous.log_level == log_level_t::warn);
    expect(config().log_level == log_level_t::debug);

    auto replaced = configure(std::move(previous));
    expect(replaced.log_level == log_level_t::debug);
    expect(config().log_level == log_level_t::warn);
  };

  "log_levels"_test = [] {
    auto logs = log_capture{log_level_t::info};

    log(log_level_t::debug, "hidden {}", 1);
    log(log_level_t::info, "shown {}", 2);
    log(log_level_t::error, "shown {}", 3);
    log(log_level_t::off, "never");

    expect(logs.lines.size() == 2_i);
    expect(logs.contains("shown 2"));
    expect(logs.count(log_level_t::error) == 1);
    expect(not logs.contains("hidden"));
    expect(not log_enabled(log_level_t::debug));
    expect(not log_enabled(log_level_t::off));
  };

  "trace_logging"_test = [] {
    auto logs = log_capture{log_level_t::trace};

    auto a = signal{1, {.name = "counter"}};
    auto e = effect{[=] { a(); }, {.name = "watcher"}};
    a = 2;

    expect(logs.contains("run watcher"));
    expect(logs.contains("counter"));

    e.dispose();
    expect(logs.contains("dispose watcher"));
  };

  "describe"_test = [] {
    expect(describe(nullptr) == "no error"s);
    expect(describe(std::make_exception_ptr(std::runtime_error{"boom"})) ==
           "boom"s);
    expect(describe(std::make_exception_ptr(42)) == "unknown exception"s);
  };

  "to_string"_test = [] {
    expect(to_string(log_level_t::warn) == "warn");
    expect(to_string(state_t::check) == "check");
    expect(to_string(priority_t::idle) == "idle");
    expect(to_string(node_kind_t::effect) == "effect");
  };

  "per_thread_context"_test = [] {
    auto inner_batching = true;
    auto inner_nodes = std::size_t{1};

    batch([&] {
      auto a = signal{0};
      expect(dependency_graph().contains(a.id()));

      std::thread{[&] {
        inner_batching = is_batching();
        inner_nodes = dependency_graph().size();
      }}.join();
    });

    expect(not inner_batching) << "every thread runs its own context";
    expect(inner_nodes == 0_u);
  };
};

} // namespace neoflux::tests

// Run the suites from main rather than at static destruction, while the
// main thread's reactive context is still alive.
int main() { return cfg<override>.run({.report_errors = true}); }
