#include "mycelium/core/metrics.hpp"

#include <vector>

#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/components.hpp"
#include "mycelium/core/shortest_paths.hpp"

namespace mycelium::core {

MetricsSnapshot metrics_snapshot(const Graph& g, std::optional<double> last_repair_seconds) {
  MetricsSnapshot m;
  m.last_repair_seconds = last_repair_seconds;
  m.node_count = static_cast<std::int64_t>(g.num_nodes());
  m.edge_count = static_cast<std::int64_t>(g.num_edges());
  for (NodeId id : g.node_ids()) {
    const Node& n = g.node(id);
    if (n.healthy()) ++m.healthy_node_count; else ++m.damaged_node_count;
    m.total_resources += n.resource_level;
  }
  for (EdgeId id : g.edge_ids()) {
    if (g.edge(id).healthy()) ++m.healthy_edge_count;
  }

  const auto cg = CompactGraph::from_graph(g, /*add_reverse=*/true);
  const auto cc = connected_components(cg);
  m.component_count = cc.count();
  m.largest_component_size = cc.largest_size();
  if (m.node_count > 0) {
    m.largest_component_ratio = static_cast<double>(m.largest_component_size) /
                                static_cast<double>(m.node_count);
  }
  if (m.largest_component_size < 2) return m;

  // Hop counts: every usable edge costs 1.
  const std::vector<Cost> unit(static_cast<std::size_t>(cg.num_edges()), 1.0);
  SpfOptions opts;
  opts.cost_override = unit;
  opts.node_mask = cg.node_mask();
  opts.edge_mask = cg.edge_mask();

  const auto largest = cc.largest();
  double total = 0.0;
  std::int64_t pairs = 0;
  for (Index u = 0; u < cg.num_nodes(); ++u) {
    if (cc.label[static_cast<std::size_t>(u)] != largest) continue;
    const auto tree = shortest_path_tree(cg, u, std::nullopt, opts);
    for (Index v = 0; v < cg.num_nodes(); ++v) {
      if (v == u || cc.label[static_cast<std::size_t>(v)] != largest) continue;
      total += tree.dist[static_cast<std::size_t>(v)];
      ++pairs;
    }
  }
  m.average_path_length = pairs > 0 ? total / static_cast<double>(pairs) : 0.0;
  return m;
}

} // namespace mycelium::core
