#pragma once

#include <neoflux/insertion_order.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace neoflux {

using node_id_t = std::uint64_t;

enum class node_kind_t {
  signal,
  computed,
  effect,
};

auto to_string(node_kind_t kind) -> std::string_view;

struct graph_node_t {
  node_kind_t kind;
  std::string name;
  insertion_order_set<node_id_t> dependencies;
  insertion_order_set<node_id_t> dependents;
};

struct graph_stats_t {
  std::size_t nodes = 0;
  std::size_t edges = 0;
  std::size_t depth = 0;
  std::size_t signals = 0;
  std::size_t computeds = 0;
  std::size_t effects = 0;
};

// Aggregate view of every dependency edge in the runtime.
//
// Propagation never consults this graph: it walks the per-source observer
// sets and the per-computation source sets. The graph mirrors those edges so
// that tests and tooling can inspect the whole picture (leaks, orphaned
// computations, evaluation order, accidental cycles).
class dependency_graph_t {
  std::map<node_id_t, graph_node_t> nodes;
  node_id_t next_id = 1;

public:
  // An empty name is replaced by "<kind>#<id>".
  auto add_node(node_kind_t kind, std::string name = {}) -> node_id_t;
  void remove_node(node_id_t id);

  // Records that `dependent` reads `dependency`. Returns false when either
  // node is unknown or the edge already exists.
  auto add_dependency(node_id_t dependent, node_id_t dependency) -> bool;
  auto remove_dependency(node_id_t dependent, node_id_t dependency) -> bool;

  auto contains(node_id_t id) const -> bool;
  auto node(node_id_t id) const -> const graph_node_t *;
  auto dependencies(node_id_t id) const -> std::vector<node_id_t>;
  auto dependents(node_id_t id) const -> std::vector<node_id_t>;

  auto size() const { return nodes.size(); }
  auto edge_count() const -> std::size_t;

  /// Every elementary cycle found by a depth-first walk, each listed in
  /// dependency order starting at the node where the walk entered it.
  auto detect_cycles() const -> std::vector<std::vector<node_id_t>>;

  /// Dependencies before dependents. Nodes on a cycle cannot be ordered;
  /// they are appended at the end (by id) and a warning is logged.
  auto topological_sort() const -> std::vector<node_id_t>;

  auto depth() const -> std::size_t;

  // Computations that neither read anything nor are read by anything.
  auto orphans() const -> std::vector<node_id_t>;

  auto stats() const -> graph_stats_t;

  // Graphviz rendering, edges pointing in the direction data flows.
  auto to_dot() const -> std::string;

  void clear();
};

auto dependency_graph() -> dependency_graph_t &;

} // namespace neoflux
