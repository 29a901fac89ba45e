/* Diversity-seeking K-path discovery ("hyphal growth"). */
#pragma once

#include <cstdint>
#include <vector>

#include "mycelium/core/graph.hpp"
#include "mycelium/core/options.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

struct Path {
  std::vector<NodeId> nodes;  // source first, target last
  std::vector<EdgeId> edges;  // edges[i] joins nodes[i] and nodes[i+1]
  Cost cost { 0.0 };          // sum of effective costs (no penalties)

  [[nodiscard]] std::size_t hops() const noexcept { return edges.size(); }
};

// Compute up to k paths from src to dst over healthy nodes and edges.
//
// The cheapest path is found first; every edge on an accepted path then has its
// cost multiplied by opts.penalty_multiplier for the remainder of this call
// and the search repeats. Penalties live in a per-call cost vector; the graph
// is never modified. A search returning an already accepted path is not
// accepted twice. Stops at k paths, when no path remains, or after
// k * opts.max_attempts_per_path searches.
//
// Results are sorted by ascending cost, then hop count, then node sequence.
// Paths may share edges. Disconnected endpoints yield an empty result.
//
// Throws UnknownNode for unknown endpoints and InvalidArgument for k <= 0 or
// invalid options. src == dst yields one zero-length path (none if damaged).
[[nodiscard]] std::vector<Path> discover_paths(const Graph& g, NodeId src, NodeId dst,
                                               int k, const DiscoveryOptions& opts = {});

} // namespace mycelium::core
