/* Shortest paths (Dijkstra) over a CompactGraph with deterministic ties. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/constants.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

// Search parameters. Spans are indexed by dense edge index and ignored when
// empty.
// - cost_override replaces the snapshot's effective costs (used for transient
//   penalties and unit-cost hop counting). Non-finite entries block the edge.
// - residual gates traversal: an edge is usable only if residual >= min_residual.
// - node_mask/edge_mask: true means allowed. nullptr disables the mask.
struct SpfOptions {
  std::span<const Cost> cost_override {};
  std::span<const Cap> residual {};
  Cap min_residual { kMinCap };
  const bool* node_mask { nullptr };
  const bool* edge_mask { nullptr };
};

// Single-parent shortest path tree. Unreached nodes have dist = +inf and
// parent = -1. Among equal-cost routes the tree keeps the one with fewer
// edges, then the lexicographically smallest node sequence from the source.
struct ShortestPathTree {
  Index source { -1 };
  std::vector<Cost> dist;
  std::vector<std::int32_t> hops;
  std::vector<Index> parent;
  std::vector<Index> via_arc;
};

// A path in snapshot indices.
struct IndexPath {
  std::vector<Index> nodes;
  std::vector<Index> arcs;
  Cost cost { 0.0 };
};

// When dst is given the search stops as soon as dst is settled; other labels
// may then be incomplete.
[[nodiscard]] ShortestPathTree
shortest_path_tree(const CompactGraph& g, Index src, std::optional<Index> dst,
                   const SpfOptions& opts = {});

// Reconstruct src -> dst from a tree. Returns nullopt if dst was not reached.
[[nodiscard]] std::optional<IndexPath>
extract_path(const CompactGraph& g, const ShortestPathTree& tree, Index dst);

} // namespace mycelium::core
