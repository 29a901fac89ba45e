/*
  Flow distribution ("nutrient flow"): capacity-respecting transfer of
  resource from sources to sinks with usage-driven edge reinforcement.
*/
#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "mycelium/core/graph.hpp"
#include "mycelium/core/options.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

// (node, amount) pairs. Repeated nodes are summed.
using FlowAmounts = std::vector<std::pair<NodeId, Flow>>;

struct FlowReport {
  Flow total_supply { 0.0 };
  Flow total_demand { 0.0 };
  Flow delivered { 0.0 };
  Flow remaining_supply { 0.0 };
  Flow unmet_demand { 0.0 };
  // Only edges that carried flow, ascending EdgeId.
  std::vector<std::pair<EdgeId, Flow>> edge_flows;
  std::map<NodeId, Flow> shipped;   // per source
  std::map<NodeId, Flow> received;  // per sink
  std::int32_t rounds { 0 };
  std::int64_t placements { 0 };
  // false when the round limit stopped the loop with movable flow left.
  bool converged { false };
};

// Each round visits sources in ascending id order. A source with remaining
// supply pushes along its cheapest residual path (true effective costs) to the
// nearest reachable sink with unmet demand; the pushed amount is the minimum
// of remaining supply, remaining demand and the path's residual capacity.
// A sink's demand is also capped by its storage headroom, and a source's
// supply by the resource it holds. After every round that moved flow, edges
// that carried flow are reinforced (effective cost shrinks towards
// base_cost * min_reinforcement) and idle edges decay back towards base_cost.
//
// Mutates resource levels, usage counters and reinforcement factors of g.
// Throws UnknownNode / InvalidArgument before touching the graph.
[[nodiscard]] FlowReport distribute_flow(Graph& g, const FlowAmounts& sources,
                                         const FlowAmounts& sinks,
                                         const FlowOptions& opts = {});

} // namespace mycelium::core
