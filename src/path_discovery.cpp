/*
  discover_paths: repeated penalised SPF producing diverse-enough routes.

  Unlike Yen-style enumeration this does not force deviations: each accepted
  path makes its own edges more expensive for the next search, so later
  searches drift onto alternative corridors when they exist and fall back to
  shared edges when they do not.
*/
#include "mycelium/core/path_discovery.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/constants.hpp"
#include "mycelium/core/error.hpp"
#include "mycelium/core/log.hpp"
#include "mycelium/core/shortest_paths.hpp"

namespace mycelium::core {

namespace {

struct Accepted {
  IndexPath path;
  Cost true_cost { 0.0 };
};

bool ranks_before(const Accepted& x, const Accepted& y) {
  if (x.true_cost < y.true_cost - kCostEpsilon) return true;
  if (y.true_cost < x.true_cost - kCostEpsilon) return false;
  if (x.path.arcs.size() != y.path.arcs.size()) return x.path.arcs.size() < y.path.arcs.size();
  return x.path.nodes < y.path.nodes;
}

Path to_path(const CompactGraph& cg, const Accepted& a) {
  const auto arc_edge = cg.arc_edge_view();
  Path p;
  p.nodes.reserve(a.path.nodes.size());
  for (Index v : a.path.nodes) p.nodes.push_back(cg.node_id(v));
  p.edges.reserve(a.path.arcs.size());
  for (Index arc : a.path.arcs) p.edges.push_back(cg.edge_id(arc_edge[static_cast<std::size_t>(arc)]));
  p.cost = a.true_cost;
  return p;
}

} // namespace

std::vector<Path> discover_paths(const Graph& g, NodeId src, NodeId dst,
                                 int k, const DiscoveryOptions& opts) {
  if (k <= 0) throw InvalidArgument("k must be >= 1");
  opts.validate();
  if (!g.has_node(src)) throw UnknownNode("unknown source node " + std::to_string(src));
  if (!g.has_node(dst)) throw UnknownNode("unknown target node " + std::to_string(dst));

  if (src == dst) {
    if (!g.node(src).healthy()) return {};
    return {Path{{src}, {}, 0.0}};
  }

  const auto cg = CompactGraph::from_graph(g);
  const Index s = *cg.index_of(src);
  const Index t = *cg.index_of(dst);
  const auto true_cost = cg.cost_view();
  const auto arc_edge = cg.arc_edge_view();

  // Transient, invocation-scoped costs.
  std::vector<Cost> penalised(true_cost.begin(), true_cost.end());

  SpfOptions spf;
  spf.cost_override = penalised;
  spf.node_mask = cg.node_mask();
  spf.edge_mask = cg.edge_mask();

  std::vector<Accepted> accepted;
  // k * attempts, bounded by the edge count so large k cannot overflow.
  const std::int64_t per_path = opts.max_attempts_per_path;
  const std::int64_t max_attempts = std::min<std::int64_t>(
      std::int64_t{k} * per_path, (std::int64_t{cg.num_edges()} + 1) * per_path);
  std::int64_t attempts = 0;
  while (static_cast<std::int64_t>(accepted.size()) < k && attempts < max_attempts) {
    ++attempts;
    auto tree = shortest_path_tree(cg, s, t, spf);
    auto found = extract_path(cg, tree, t);
    if (!found) break;  // no finite-cost path remains

    Cost cost = 0.0;
    for (Index arc : found->arcs) cost += true_cost[static_cast<std::size_t>(arc_edge[static_cast<std::size_t>(arc)])];
    for (Index arc : found->arcs) {
      penalised[static_cast<std::size_t>(arc_edge[static_cast<std::size_t>(arc)])] *= opts.penalty_multiplier;
    }
    const bool duplicate = std::any_of(accepted.begin(), accepted.end(), [&](const Accepted& a) {
      return a.path.arcs == found->arcs;
    });
    if (duplicate) continue;
    accepted.push_back(Accepted{std::move(*found), cost});
  }

  std::stable_sort(accepted.begin(), accepted.end(), ranks_before);
  std::vector<Path> out;
  out.reserve(accepted.size());
  for (auto const& a : accepted) out.push_back(to_path(cg, a));
  log(LogLevel::Debug, "discovery", "src=", src, " dst=", dst, " k=", k,
      " found=", out.size(), " attempts=", attempts);
  return out;
}

} // namespace mycelium::core
