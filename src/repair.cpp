/*
  apply_damage: damage marking, fragmentation analysis and edge growth.

  Connectivity is judged on a symmetric snapshot (add_reverse) so that a
  directed graph is treated by weak connectivity. Pre-damage distances come
  from the same snapshot taken before any node is marked.
*/
#include "mycelium/core/repair.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <tuple>

#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/components.hpp"
#include "mycelium/core/error.hpp"
#include "mycelium/core/log.hpp"
#include "mycelium/core/shortest_paths.hpp"

namespace mycelium::core {

namespace {

struct LostPair {
  Cost prior_distance;
  Index u;
  Index v;
};

double largest_ratio(const Components& cc, std::size_t total_nodes) {
  if (total_nodes == 0) return 0.0;
  return static_cast<double>(cc.largest_size()) / static_cast<double>(total_nodes);
}

// Split a node's stock equally among its healthy neighbours that are not being
// damaged in the same call, then empty it. Whatever a full neighbour refuses is
// lost with the node. Returns the amount the neighbours accepted.
Resource redistribute(Graph& g, NodeId id, const std::vector<NodeId>& damage_set) {
  const Node& n = g.node(id);
  if (n.resource_level <= 0.0) return 0.0;
  std::vector<NodeId> receivers;
  for (EdgeId eid : g.incident_edges(id)) {
    const Edge& e = g.edge(eid);
    if (!e.healthy()) continue;
    const NodeId other = e.other(id);
    if (!g.node(other).healthy()) continue;
    if (std::binary_search(damage_set.begin(), damage_set.end(), other)) continue;
    receivers.push_back(other);
  }
  std::sort(receivers.begin(), receivers.end());
  receivers.erase(std::unique(receivers.begin(), receivers.end()), receivers.end());
  if (receivers.empty()) return 0.0;

  const Resource share = n.resource_level / static_cast<double>(receivers.size());
  Resource accepted = 0.0;
  for (NodeId r : receivers) {
    accepted += g.adjust_node_resource(r, share);
    g.sync_node(r);
  }
  g.set_node_resource(id, 0.0);
  g.sync_node(id);
  return accepted;
}

} // namespace

RepairReport apply_damage(Graph& g, std::span<const NodeId> node_ids, const RepairOptions& opts) {
  opts.validate();
  const auto started = std::chrono::steady_clock::now();

  std::vector<NodeId> ids(node_ids.begin(), node_ids.end());
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  for (NodeId id : ids) {
    if (!g.has_node(id)) throw UnknownNode("cannot damage unknown node " + std::to_string(id));
  }

  RepairReport report;
  report.damaged_nodes = ids;
  const std::size_t total_nodes = g.num_nodes();

  const auto before = CompactGraph::from_graph(g, /*add_reverse=*/true);
  const auto before_cc = connected_components(before);
  report.components_before = before_cc.count();

  // 1. Damage
  for (NodeId id : ids) {
    if (!g.node(id).healthy()) continue;
    if (opts.redistribute_resources) {
      report.resources_redistributed += redistribute(g, id, ids);
    }
    g.set_node_health(id, Health::Damaged);
  }

  // 2. Fragmentation. Node set is unchanged, so dense indices match `before`.
  const auto after = CompactGraph::from_graph(g, /*add_reverse=*/true);
  const auto after_cc = connected_components(after);
  report.components_after_damage = after_cc.count();
  report.largest_ratio_after_damage = largest_ratio(after_cc, total_nodes);

  // 3. Pairs that shared a component before damage but not after.
  const auto N = static_cast<std::size_t>(after.num_nodes());
  std::vector<std::vector<Index>> groups(static_cast<std::size_t>(before_cc.count()));
  for (std::size_t v = 0; v < N; ++v) {
    if (after_cc.label[v] < 0) continue;
    groups[static_cast<std::size_t>(before_cc.label[v])].push_back(static_cast<Index>(v));
  }
  SpfOptions prior;
  prior.node_mask = before.node_mask();
  prior.edge_mask = before.edge_mask();
  std::vector<LostPair> lost;
  for (auto const& members : groups) {
    const bool split = std::any_of(members.begin(), members.end(), [&](Index v) {
      return after_cc.label[static_cast<std::size_t>(v)] != after_cc.label[static_cast<std::size_t>(members.front())];
    });
    if (!split) continue;
    for (std::size_t i = 0; i < members.size(); ++i) {
      const Index u = members[i];
      auto tree = shortest_path_tree(before, u, std::nullopt, prior);
      for (std::size_t j = i + 1; j < members.size(); ++j) {
        const Index v = members[j];
        if (after_cc.label[static_cast<std::size_t>(u)] == after_cc.label[static_cast<std::size_t>(v)]) continue;
        lost.push_back(LostPair{tree.dist[static_cast<std::size_t>(v)], u, v});
      }
    }
  }
  std::sort(lost.begin(), lost.end(), [](const LostPair& x, const LostPair& y) {
    return std::tie(x.prior_distance, x.u, x.v) < std::tie(y.prior_distance, y.u, y.v);
  });
  report.pairs_lost = static_cast<std::int64_t>(lost.size());

  // 4-5. Reconnect closest-first; components merge as edges grow.
  DisjointSet joined(static_cast<std::size_t>(after_cc.count()));
  int budget = opts.growth_budget;
  for (auto const& pair : lost) {
    const auto cu = after_cc.label[static_cast<std::size_t>(pair.u)];
    const auto cv = after_cc.label[static_cast<std::size_t>(pair.v)];
    const NodeId a = after.node_id(pair.u);
    const NodeId b = after.node_id(pair.v);
    if (joined.find(cu) == joined.find(cv)) {
      ++report.pairs_reconnected;
      continue;
    }
    if (budget <= 0) {
      report.budget_exhausted = true;
      report.unreconnected_pairs.emplace_back(a, b);
      continue;
    }
    const Cost grown_cost = pair.prior_distance + opts.growth_cost_penalty;
    auto existing = g.find_edge(a, b);
    if (!existing && g.directed()) existing = g.find_edge(b, a);
    EdgeId eid;
    if (existing) {
      // Only a damaged edge can join two separated healthy nodes.
      eid = *existing;
      g.set_base_cost(eid, grown_cost);
      g.set_edge_health(eid, Health::Healthy);
    } else {
      EdgeSpec spec;
      spec.base_cost = grown_cost;
      spec.capacity = opts.growth_capacity;
      spec.grown = true;
      eid = g.add_edge(a, b, spec);
    }
    --budget;
    report.edges_added.push_back(eid);
    joined.unite(cu, cv);
    ++report.pairs_reconnected;
    log(LogLevel::Debug, "repair", "grew edge ", eid, " between ", a, " and ", b,
        " cost=", grown_cost);
  }

  // 6. Final assessment
  const auto repaired = CompactGraph::from_graph(g, /*add_reverse=*/true);
  const auto repaired_cc = connected_components(repaired);
  report.components_after_repair = repaired_cc.count();
  report.largest_ratio_after_repair = largest_ratio(repaired_cc, total_nodes);
  report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

  log(LogLevel::Info, "repair", "damaged=", ids.size(), " lost_pairs=", report.pairs_lost,
      " edges_added=", report.edges_added.size(), " unreconnected=", report.unreconnected_pairs.size(),
      " components ", report.components_after_damage, "->", report.components_after_repair);
  return report;
}

} // namespace mycelium::core
