#include "common.h"

#include <fmt/core.h>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_literals;

namespace neoflux::tests {

static suite<"owner"> _ = [] {
  "create_root"_test = [] {
    auto order = std::vector<int>{};

    auto dispose = create_root([&](std::function<void()> dispose) {
      on_cleanup([&] { order.push_back(1); });
      on_cleanup([&] { order.push_back(2); });
      return dispose;
    });

    expect(order.empty()) << "cleanups wait for disposal";

    dispose();
    dispose();
    expect(order == std::vector{1, 2})
        << "cleanups run once, in registration order";
  };

  "result"_test = [] {
    auto value = create_root([] { return 42; });
    expect(value == 42_i);
  };

  "untracked"_test = [] {
    auto a = signal{1};
    auto runs = 0;
    auto e = effect{[&] {
      ++runs;
      create_root([&] { a(); });
    }};

    a = 2;
    expect(runs == 1_i) << "reads inside a root do not subscribe the caller";

    e.dispose();
  };

  "depth_first"_test = [] {
    auto order = std::vector<std::string>{};

    auto dispose = create_root([&](std::function<void()> dispose) {
      on_cleanup([&] { order.push_back("parent"); });
      create_root([&] {
        on_cleanup([&] { order.push_back("child"); });
        create_root([&] { on_cleanup([&] { order.push_back("grandchild"); }); });
      });
      create_root([&] { on_cleanup([&] { order.push_back("sibling"); }); });
      return dispose;
    });

    dispose();
    expect(order ==
           std::vector{"grandchild"s, "child"s, "sibling"s, "parent"s});
  };

  "independent_roots"_test = [] {
    auto first = false;
    auto second = false;

    auto dispose_first = create_root([&](std::function<void()> dispose) {
      on_cleanup([&] { first = true; });
      return dispose;
    });
    auto dispose_second = create_root([&](std::function<void()> dispose) {
      on_cleanup([&] { second = true; });
      return dispose;
    });

    dispose_first();
    expect(first);
    expect(not second) << "sibling roots are disposed independently";

    dispose_second();
    expect(second);
  };

  "no_owner"_test = [] {
    auto logs = log_capture{log_level_t::trace};
    auto called = false;

    expect(get_owner() == nullptr);
    on_cleanup([&] { called = true; });

    expect(not called) << "a cleanup without an owner is dropped";
    expect(logs.contains("without an owner"));
  };

  "disposed_owner"_test = [] {
    auto owner = create_root([] { return get_owner(); });
    owner->dispose();

    auto called = false;
    run_with_owner(owner, [&] { on_cleanup([&] { called = true; }); });
    owner->dispose();
    expect(not called) << "registrations on a disposed owner are no-ops";

    auto runs = 0;
    run_with_owner(owner, [&] { effect{[&] { ++runs; }}; });
    expect(runs == 0_i) << "effects created under a disposed owner never run";
  };

  "derived_values"_test = [] {
    auto a = signal{1};
    auto runs = 0;
    auto escaped = std::optional<computed<int>>{};

    create_root([&](std::function<void()> dispose) {
      escaped.emplace([&, a] {
        ++runs;
        return a() * 2;
      });
      expect(escaped->read() == 2_i);
      expect(a.observers().size() == 1_i);
      dispose();
    });

    expect(escaped->disposed())
        << "derived values are disposed with the root they were created in";
    expect(a.observers().empty());
    expect(dependency_graph().dependencies(escaped->id()).empty());

    a = 5;
    expect(escaped->read() == 2_i) << "the last value stays readable";
    expect(runs == 1_i) << "a disposed derived value never recomputes";
  };

  "effect_derived_values"_test = [] {
    auto a = signal{0};
    auto created = std::vector<computed<int>>{};

    auto dispose = create_root([&](std::function<void()> dispose) {
      effect{[&] {
        auto value = a();
        created.push_back(computed{[value] { return value; }});
      }};
      return dispose;
    });

    a = 1;
    expect(created.size() == 2_u);
    expect(created[0].disposed())
        << "derived values created by a run are disposed before the next run";
    expect(not created[1].disposed());

    dispose();
    expect(created[1].disposed());
  };

  "run_with_owner"_test = [] {
    auto owner = create_root([] { return get_owner(); });
    expect(owner != nullptr);
    expect(get_owner() == nullptr) << "the owner stack is restored";

    auto cleaned = false;
    run_with_owner(owner, [&] {
      expect(get_owner() == owner);
      on_cleanup([&] { cleaned = true; });
    });

    owner->dispose();
    expect(cleaned);
  };

  "cleanup_errors"_test = [] {
    auto errors = std::vector<std::string>{};
    auto ran = false;

    create_root([&](std::function<void()> dispose) {
      on_error([&](std::exception_ptr error, std::string_view where) {
        errors.push_back(fmt::format("{}: {}", where, describe(error)));
      });
      on_cleanup([] { throw std::runtime_error{"first"}; });
      on_cleanup([&] { ran = true; });
      dispose();
    });

    expect(errors == std::vector{"cleanup: first"s});
    expect(ran) << "a failing cleanup does not stop its siblings";
  };

  "error_boundary"_test = [] {
    auto a = signal{0};
    auto errors = 0;

    auto dispose = create_root([&](std::function<void()> dispose) {
      on_error([&](std::exception_ptr, std::string_view) { ++errors; });
      create_root([&] {
        effect{[&] {
          if (a() > 0)
            throw std::runtime_error{"descendant failed"};
        }};
      });
      return dispose;
    });

    a = 1;
    expect(errors == 1_i) << "handlers receive errors of descendants";

    dispose();
    a = 2;
    expect(errors == 1_i);
  };

  "failing_handler"_test = [] {
    auto logs = log_capture{};

    create_root([&](std::function<void()> dispose) {
      on_error([](std::exception_ptr, std::string_view) {
        throw std::runtime_error{"handler failed"};
      });
      on_cleanup([] { throw std::runtime_error{"cleanup failed"}; });
      dispose();
    });

    expect(logs.contains("handler failed"));
  };

  "global_owner"_test = [] {
    auto a = signal{0};
    auto runs = 0;
    effect{[&] {
      a();
      ++runs;
    }};

    auto first = global_owner();
    first->dispose();

    a = 1;
    expect(runs == 1_i) << "disposing the global owner stops its effects";
    expect(global_owner() != first) << "a fresh global owner takes its place";
    expect(not global_owner()->disposed);
  };

  "effect_run_owner"_test = [] {
    auto a = signal{0};
    auto cleanups = std::vector<int>{};

    auto dispose = create_root([&](std::function<void()> dispose) {
      effect{[&] {
        auto value = a();
        create_root([&, value] {
          on_cleanup([&, value] { cleanups.push_back(value); });
        });
      }};
      return dispose;
    });

    a = 1;
    expect(cleanups == std::vector{0})
        << "roots created by a run are disposed before the next run";

    dispose();
    expect(cleanups == std::vector{0, 1});
  };
};

} // namespace neoflux::tests
