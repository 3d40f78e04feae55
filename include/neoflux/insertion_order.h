#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace neoflux {

// Small associative containers that iterate in insertion order.
// Dependency and subscriber sets are tiny in practice, and deterministic
// iteration order keeps propagation (and its logs) reproducible.
template <typename Key, typename Value, typename Comparator = std::less<Key>>
class insertion_order_map {
  std::vector<std::pair<Key, Value>> nodes;

  static auto equivalent(const Key &lhs, const auto &rhs) {
    auto cmp = Comparator{};
    return not cmp(lhs, rhs) and not cmp(rhs, lhs);
  }

  auto find_node(const auto &key) {
    return std::ranges::find_if(
        nodes, [&](auto &k) { return equivalent(k, key); },
        &std::pair<Key, Value>::first);
  }

  auto find_node(const auto &key) const {
    return std::ranges::find_if(
        nodes, [&](auto &k) { return equivalent(k, key); },
        &std::pair<Key, Value>::first);
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() { return nodes.begin(); }
  auto end() { return nodes.end(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }

  auto &operator[](const auto &key) {
    auto it = find_node(key);
    if (it != nodes.end())
      return it->second;

    return nodes.emplace_back(key, Value{}).second;
  }

  auto contains(const auto &key) const { return find_node(key) != nodes.end(); }

  auto extract(const auto &key) {
    struct node_handle {
      bool _empty;
      Key _key;
      Value _mapped;

      auto empty() const { return _empty; }
      auto &key() const { return _key; }
      auto &mapped() const { return _mapped; }
    };

    auto it = find_node(key);
    if (it == nodes.end())
      return node_handle{true, Key{}, Value{}};

    auto result = std::move(*it);
    nodes.erase(it);

    return node_handle{
        false,
        std::move(result.first),
        std::move(result.second),
    };
  }

  void clear() { nodes.clear(); }
};

template <typename T, typename Comparator = std::less<T>>
class insertion_order_set {
  std::vector<T> nodes;

  auto find_node(const auto &value) const {
    return std::ranges::find_if(nodes, [&](auto &k) {
      auto cmp = Comparator{};
      return not cmp(k, value) and not cmp(value, k);
    });
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }

  auto contains(const auto &value) const {
    return find_node(value) != nodes.end();
  }

  // Returns whether the value was newly inserted.
  auto insert(const T &value) {
    if (contains(value))
      return false;

    nodes.push_back(value);
    return true;
  }

  auto erase(const auto &value) {
    auto it = find_node(value);
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }

  void clear() { nodes.clear(); }
};

} // namespace neoflux
