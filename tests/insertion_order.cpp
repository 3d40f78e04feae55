#include "common.h"

#include <memory>
#include <tuple>

namespace neoflux::tests {

static suite<"insertion_order"> _ = [] {
  auto x = std::make_shared<int>(42);
  auto y = std::make_shared<int>(1729);

  "insertion_order_map"_test =
      [](auto data) {
        auto [key0, key1, cmp] = data;
        using key_t = decltype(key0);
        using cmp_t = decltype(cmp);

        auto eq = [=](auto lhs, auto rhs) {
          return not cmp(lhs, rhs) and not cmp(rhs, lhs);
        };

        auto m = insertion_order_map<key_t, int, cmp_t>{};

        expect(m.size() == 0_i);
        expect(m.begin() == m.end());
        expect(not m.contains(key0));
        expect(that % m[key0] == 0);
        expect(m.size() == 1_i);
        expect(m.contains(key0));
        expect(that % (m[key0] = 42) == 42);

        auto n = m.extract(key0);
        expect(not n.empty());
        expect(that % eq(n.key(), key0));
        expect(that % n.mapped() == 42);
        expect(m.size() == 0_i);

        n = m.extract(key0);
        expect(n.empty());

        expect(that % (m[key1] = 1729) == 1729);
        expect(that % (m[key0] = 42) == 42);
        expect(m.size() == 2_i);

        auto keys = to_vector(m | std::views::keys);
        expect(that % eq(keys[0], key1)) << "keys iterate in insertion order";
        expect(that % eq(keys[1], key0));
      } |
      std::tuple{
          std::tuple{42, 1729, std::less{}},
          std::tuple{std::weak_ptr{x}, std::weak_ptr{y}, std::owner_less{}},
      };

  "insertion_order_set"_test = [=] {
    auto s = insertion_order_set<std::weak_ptr<int>, std::owner_less<>>{};

    expect(s.empty());
    expect(s.insert(std::weak_ptr{y}));
    expect(s.insert(std::weak_ptr{x}));
    expect(not s.insert(std::weak_ptr{y})) << "values are inserted only once";
    expect(s.size() == 2_i);

    auto values = to_vector(s);
    expect(values[0].lock() == y) << "values iterate in insertion order";
    expect(values[1].lock() == x);

    expect(s.erase(y));
    expect(not s.erase(y));
    expect(not s.contains(y));
    expect(s.contains(x));

    s.clear();
    expect(s.empty());
  };
};

} // namespace neoflux::tests
