#include <neoflux/context.h>
#include <neoflux/dependency_graph.h>
#include <neoflux/log.h>

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <deque>
#include <iterator>
#include <map>

namespace neoflux {

auto to_string(node_kind_t kind) -> std::string_view {
  switch (kind) {
  case node_kind_t::signal:
    return "signal";
  case node_kind_t::computed:
    return "computed";
  case node_kind_t::effect:
    return "effect";
  }
  return "unknown";
}

auto dependency_graph_t::add_node(node_kind_t kind, std::string name)
    -> node_id_t {
  const auto id = next_id++;
  if (name.empty())
    name = fmt::format("{}#{}", to_string(kind), id);

  nodes.emplace(id, graph_node_t{.kind = kind, .name = std::move(name)});
  return id;
}

void dependency_graph_t::remove_node(node_id_t id) {
  auto it = nodes.find(id);
  if (it == nodes.end())
    return;

  for (auto dependency : it->second.dependencies)
    if (auto p = nodes.find(dependency); p != nodes.end())
      p->second.dependents.erase(id);

  for (auto dependent : it->second.dependents)
    if (auto p = nodes.find(dependent); p != nodes.end())
      p->second.dependencies.erase(id);

  nodes.erase(it);
}

auto dependency_graph_t::add_dependency(node_id_t dependent,
                                        node_id_t dependency) -> bool {
  auto from = nodes.find(dependent);
  auto to = nodes.find(dependency);
  if (from == nodes.end() or to == nodes.end())
    return false;

  if (not from->second.dependencies.insert(dependency))
    return false;

  to->second.dependents.insert(dependent);
  return true;
}

auto dependency_graph_t::remove_dependency(node_id_t dependent,
                                           node_id_t dependency) -> bool {
  auto from = nodes.find(dependent);
  auto to = nodes.find(dependency);
  if (from == nodes.end() or to == nodes.end())
    return false;

  to->second.dependents.erase(dependent);
  return from->second.dependencies.erase(dependency);
}

auto dependency_graph_t::contains(node_id_t id) const -> bool {
  return nodes.contains(id);
}

auto dependency_graph_t::node(node_id_t id) const -> const graph_node_t * {
  auto it = nodes.find(id);
  return it == nodes.end() ? nullptr : &it->second;
}

auto dependency_graph_t::dependencies(node_id_t id) const
    -> std::vector<node_id_t> {
  auto p = node(id);
  if (not p)
    return {};

  return {p->dependencies.begin(), p->dependencies.end()};
}

auto dependency_graph_t::dependents(node_id_t id) const
    -> std::vector<node_id_t> {
  auto p = node(id);
  if (not p)
    return {};

  return {p->dependents.begin(), p->dependents.end()};
}

auto dependency_graph_t::edge_count() const -> std::size_t {
  auto count = std::size_t{0};
  for (auto &[id, node] : nodes)
    count += node.dependencies.size();
  return count;
}

auto dependency_graph_t::detect_cycles() const
    -> std::vector<std::vector<node_id_t>> {
  enum class color_t { white, grey, black };

  auto colors = std::map<node_id_t, color_t>{};
  auto path = std::vector<node_id_t>{};
  auto cycles = std::vector<std::vector<node_id_t>>{};

  auto visit = [&](auto &self, node_id_t id) -> void {
    colors[id] = color_t::grey;
    path.push_back(id);

    for (auto dependency : nodes.at(id).dependencies) {
      switch (colors[dependency]) {
      case color_t::white:
        self(self, dependency);
        break;
      case color_t::grey: {
        // Back edge: the cycle is the tail of the path starting at it.
        auto start = std::ranges::find(path, dependency);
        cycles.emplace_back(start, path.end());
        break;
      }
      case color_t::black:
        break;
      }
    }

    path.pop_back();
    colors[id] = color_t::black;
  };

  for (auto &[id, node] : nodes)
    if (colors[id] == color_t::white)
      visit(visit, id);

  return cycles;
}

auto dependency_graph_t::topological_sort() const -> std::vector<node_id_t> {
  auto remaining = std::map<node_id_t, std::size_t>{};
  auto ready = std::deque<node_id_t>{};

  for (auto &[id, node] : nodes) {
    remaining[id] = node.dependencies.size();
    if (node.dependencies.empty())
      ready.push_back(id);
  }

  auto order = std::vector<node_id_t>{};
  order.reserve(nodes.size());

  while (not ready.empty()) {
    const auto id = ready.front();
    ready.pop_front();
    order.push_back(id);

    for (auto dependent : nodes.at(id).dependents)
      if (--remaining[dependent] == 0)
        ready.push_back(dependent);
  }

  if (order.size() != nodes.size()) {
    log(log_level_t::warn,
        "dependency graph has cycles; {} nodes could not be ordered",
        nodes.size() - order.size());

    for (auto &[id, count] : remaining)
      if (count != 0)
        order.push_back(id);
  }

  return order;
}

auto dependency_graph_t::depth() const -> std::size_t {
  // Longest chain ending at each node, in topological order. Nodes on a
  // cycle only count the acyclic part leading to them.
  auto longest = std::map<node_id_t, std::size_t>{};
  auto result = std::size_t{0};

  for (auto id : topological_sort()) {
    auto &own = longest[id];
    for (auto dependency : nodes.at(id).dependencies)
      if (auto it = longest.find(dependency); it != longest.end())
        own = std::max(own, it->second + 1);

    result = std::max(result, own);
  }

  return result;
}

auto dependency_graph_t::orphans() const -> std::vector<node_id_t> {
  auto result = std::vector<node_id_t>{};
  for (auto &[id, node] : nodes) {
    if (node.kind == node_kind_t::signal)
      continue;

    if (node.dependencies.empty() and node.dependents.empty())
      result.push_back(id);
  }
  return result;
}

auto dependency_graph_t::stats() const -> graph_stats_t {
  auto stats = graph_stats_t{
      .nodes = nodes.size(),
      .edges = edge_count(),
      .depth = depth(),
  };

  for (auto &[id, node] : nodes) {
    switch (node.kind) {
    case node_kind_t::signal:
      ++stats.signals;
      break;
    case node_kind_t::computed:
      ++stats.computeds;
      break;
    case node_kind_t::effect:
      ++stats.effects;
      break;
    }
  }

  return stats;
}

auto dependency_graph_t::to_dot() const -> std::string {
  auto shape = [](node_kind_t kind) {
    switch (kind) {
    case node_kind_t::signal:
      return "ellipse";
    case node_kind_t::computed:
      return "box";
    case node_kind_t::effect:
      return "diamond";
    }
    return "ellipse";
  };

  auto out = fmt::memory_buffer{};
  fmt::format_to(std::back_inserter(out), "digraph neoflux {{\n");

  for (auto &[id, node] : nodes)
    fmt::format_to(std::back_inserter(out), "  n{} [label=\"{}\" shape={}];\n",
                   id, node.name, shape(node.kind));

  for (auto &[id, node] : nodes)
    for (auto dependency : node.dependencies)
      fmt::format_to(std::back_inserter(out), "  n{} -> n{};\n", dependency,
                     id);

  fmt::format_to(std::back_inserter(out), "}}\n");
  return fmt::to_string(out);
}

void dependency_graph_t::clear() { nodes.clear(); }

auto dependency_graph() -> dependency_graph_t & { return context().graph; }

} // namespace neoflux
