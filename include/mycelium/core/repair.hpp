/*
  Damage & repair controller ("self-healing response").
*/
#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "mycelium/core/graph.hpp"
#include "mycelium/core/options.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

struct RepairReport {
  std::vector<NodeId> damaged_nodes;       // ascending, deduplicated
  std::vector<EdgeId> edges_added;         // grown or restored by this call
  std::int64_t pairs_lost { 0 };           // reachable before damage, not after
  std::int64_t pairs_reconnected { 0 };
  std::vector<std::pair<NodeId, NodeId>> unreconnected_pairs;
  std::int32_t components_before { 0 };
  std::int32_t components_after_damage { 0 };
  std::int32_t components_after_repair { 0 };
  double largest_ratio_after_damage { 0.0 };
  double largest_ratio_after_repair { 0.0 };
  Resource resources_redistributed { 0.0 };
  bool budget_exhausted { false };
  double elapsed_seconds { 0.0 };
};

// Mark node_ids damaged (with all incident edges), then restore connectivity
// between surviving nodes that lost it.
//
// Lost pairs are handled closest-first by their pre-damage distance. A pair
// still joined by some healthy path (possibly through an edge grown earlier in
// this call) needs no change. Otherwise a direct edge is grown with
// base_cost = prior distance + opts.growth_cost_penalty, or an existing
// damaged edge between the two is restored, while opts.growth_budget lasts.
// Pairs left over are reported, not treated as errors.
//
// Components are weak for directed graphs. A grown edge runs one way only,
// from the lower to the higher node id, so the pair it joins may still be
// unreachable in the other direction. Calling again with the same ids and no
// topology change adds no edges.
//
// Cost: every lost pair is materialised and one Dijkstra runs per member of
// each split component, i.e. O(s^2) memory and O(s * (V + E) log V) time for a
// split component of s nodes.
//
// Throws UnknownNode (before any mutation) for unknown ids.
[[nodiscard]] RepairReport apply_damage(Graph& g, std::span<const NodeId> node_ids,
                                        const RepairOptions& opts = {});

} // namespace mycelium::core
