/*
  distribute_flow: round-based source-to-sink placement over residuals.

  Works on a CompactGraph snapshot with local residual, cost and
  reinforcement buffers; results are written back to the Graph once the
  rounds finish. Per-edge residual is shared by both directions of an
  undirected edge, so no edge ever carries more than its capacity in total.
*/
#include "mycelium/core/flow_distribution.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/constants.hpp"
#include "mycelium/core/error.hpp"
#include "mycelium/core/log.hpp"
#include "mycelium/core/shortest_paths.hpp"

namespace mycelium::core {

namespace {

std::map<NodeId, Flow> aggregate(const Graph& g, const FlowAmounts& amounts, const char* role) {
  std::map<NodeId, Flow> out;
  for (auto const& [node, amount] : amounts) {
    if (!g.has_node(node)) {
      throw UnknownNode(std::string("unknown ") + role + " node " + std::to_string(node));
    }
    if (!std::isfinite(amount) || amount < 0.0) {
      throw InvalidArgument(std::string(role) + " amount for node " + std::to_string(node) +
                            " must be finite and >= 0");
    }
    out[node] += amount;
  }
  return out;
}

// Remaining amounts keyed by dense index, in ascending NodeId order.
struct Terminal {
  NodeId id;
  Index index;
  Flow remaining;
};

// Nearest sink with unmet demand reachable in tree; lower id wins ties.
std::optional<std::size_t> nearest_sink(const ShortestPathTree& tree, Index src,
                                        const std::vector<Terminal>& sinks) {
  std::optional<std::size_t> best;
  Cost best_dist = std::numeric_limits<Cost>::infinity();
  for (std::size_t i = 0; i < sinks.size(); ++i) {
    const auto& sk = sinks[i];
    if (sk.index == src || sk.remaining < kMinFlow) continue;
    const Cost d = tree.dist[static_cast<std::size_t>(sk.index)];
    if (!std::isfinite(d)) continue;
    if (!best || d < best_dist - kCostEpsilon) { best = i; best_dist = d; }
  }
  return best;
}

} // namespace

FlowReport distribute_flow(Graph& g, const FlowAmounts& sources,
                           const FlowAmounts& sinks, const FlowOptions& opts) {
  opts.validate();
  const auto supply = aggregate(g, sources, "source");
  const auto demand = aggregate(g, sinks, "sink");

  FlowReport report;
  const auto cg = CompactGraph::from_graph(g);
  const auto M = static_cast<std::size_t>(cg.num_edges());
  const auto capacity = cg.capacity_view();
  const auto base_cost = cg.base_cost_view();
  const auto arc_edge = cg.arc_edge_view();

  std::vector<Terminal> src_terms, sink_terms;
  for (auto const& [id, amount] : supply) {
    // A source ships at most what it holds.
    const Flow stock = g.node(id).resource_level;
    src_terms.push_back(Terminal{id, *cg.index_of(id), std::min(amount, stock)});
    report.total_supply += amount;
  }
  for (auto const& [id, amount] : demand) {
    const Node& n = g.node(id);
    const Flow headroom = n.capacity - n.resource_level;
    sink_terms.push_back(Terminal{id, *cg.index_of(id), std::min(amount, headroom)});
    report.total_demand += amount;
  }

  std::vector<Cap> residual(capacity.begin(), capacity.end());
  std::vector<Flow> edge_flow(M, 0.0);
  std::vector<Flow> carried(M, 0.0);
  std::vector<std::uint64_t> usage(M, 0);
  std::vector<double> factor(M, 1.0);
  std::vector<Cost> cost(cg.cost_view().begin(), cg.cost_view().end());
  for (std::size_t e = 0; e < M; ++e) factor[e] = g.edge(cg.edge_id(static_cast<Index>(e))).reinforcement;

  SpfOptions spf;
  spf.cost_override = cost;
  spf.residual = residual;
  spf.min_residual = kMinCap;
  spf.node_mask = cg.node_mask();
  spf.edge_mask = cg.edge_mask();

  // One pass over the sources. Returns true if any flow moved.
  auto run_pass = [&](bool place) {
    bool moved = false;
    for (auto& st : src_terms) {
      if (st.remaining < kMinFlow) continue;
      auto tree = shortest_path_tree(cg, st.index, std::nullopt, spf);
      auto pick = nearest_sink(tree, st.index, sink_terms);
      if (!pick) continue;
      if (!place) return true;
      auto& sk = sink_terms[*pick];
      auto path = extract_path(cg, tree, sk.index);
      if (!path) continue;
      Flow bottleneck = std::numeric_limits<Flow>::infinity();
      for (Index arc : path->arcs) {
        bottleneck = std::min(bottleneck, residual[static_cast<std::size_t>(arc_edge[static_cast<std::size_t>(arc)])]);
      }
      const Flow amount = std::min({st.remaining, sk.remaining, bottleneck});
      if (amount < kMinFlow) continue;
      for (Index arc : path->arcs) {
        auto e = static_cast<std::size_t>(arc_edge[static_cast<std::size_t>(arc)]);
        residual[e] = std::max(0.0, residual[e] - amount);
        edge_flow[e] += amount;
        carried[e] += amount;
        usage[e] += 1;
      }
      st.remaining -= amount;
      sk.remaining -= amount;
      report.shipped[st.id] += amount;
      report.received[sk.id] += amount;
      report.delivered += amount;
      report.placements += 1;
      moved = true;
    }
    return moved;
  };

  for (std::int32_t round = 0; round < opts.round_limit; ++round) {
    std::fill(carried.begin(), carried.end(), 0.0);
    if (!run_pass(true)) {
      report.converged = true;
      break;
    }
    report.rounds += 1;
    for (std::size_t e = 0; e < M; ++e) {
      if (carried[e] > 0.0) {
        const double load = capacity[e] > kMinCap ? carried[e] / capacity[e] : 1.0;
        factor[e] = std::max(opts.min_reinforcement, factor[e] - opts.reinforcement_rate * load);
      } else {
        factor[e] += opts.decay_rate * (1.0 - factor[e]);
      }
      cost[e] = base_cost[e] * factor[e];
    }
  }
  if (!report.converged) {
    // Round limit reached: converged only if nothing could still move.
    report.converged = !run_pass(false);
  }

  for (auto const& [id, amount] : supply) {
    auto it = report.shipped.find(id);
    report.remaining_supply += amount - (it == report.shipped.end() ? 0.0 : it->second);
  }
  for (auto const& [id, amount] : demand) {
    auto it = report.received.find(id);
    report.unmet_demand += amount - (it == report.received.end() ? 0.0 : it->second);
  }

  // Write back.
  for (std::size_t e = 0; e < M; ++e) {
    const EdgeId id = cg.edge_id(static_cast<Index>(e));
    const bool changed = usage[e] > 0 || factor[e] != g.edge(id).reinforcement;
    if (!changed) continue;
    if (usage[e] > 0) g.record_usage(id, usage[e]);
    g.set_reinforcement(id, factor[e]);
    if (edge_flow[e] > 0.0) report.edge_flows.emplace_back(id, edge_flow[e]);
    g.sync_edge(id);
  }
  for (auto const& [id, amount] : report.shipped) {
    g.adjust_node_resource(id, -amount);
    g.sync_node(id);
  }
  for (auto const& [id, amount] : report.received) {
    g.adjust_node_resource(id, amount);
    g.sync_node(id);
  }

  log(LogLevel::Info, "flow", "delivered=", report.delivered, " of supply=", report.total_supply,
      " demand=", report.total_demand, " rounds=", report.rounds,
      report.converged ? " (converged)" : " (round limit)");
  return report;
}

} // namespace mycelium::core
