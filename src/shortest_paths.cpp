/*
  shortest_paths: Dijkstra over a CompactGraph with flexible edge gating.

  Features:
    - Optional per-edge cost override (transient penalties, unit costs).
    - Optional residual-aware traversal (treat residual as capacity gate).
    - Node/edge masks to exclude damaged elements.
    - Deterministic single-parent tree: ties in cost prefer fewer edges, then
      the lexicographically smallest node sequence.
    - Optional early exit when a specific destination is provided.
*/
#include "mycelium/core/shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <tuple>
#include <utility>

namespace mycelium::core {

namespace {

// Compare the tree paths source->x and source->y (same hop count) in
// lexicographic order of their dense node indices.
bool sequence_less(const std::vector<Index>& parent, Index x, Index y) {
  std::vector<Index> px, py;
  for (Index v = x; v >= 0; v = parent[static_cast<std::size_t>(v)]) px.push_back(v);
  for (Index v = y; v >= 0; v = parent[static_cast<std::size_t>(v)]) py.push_back(v);
  return std::lexicographical_compare(px.rbegin(), px.rend(), py.rbegin(), py.rend());
}

} // namespace

ShortestPathTree shortest_path_tree(const CompactGraph& g, Index src,
                                    std::optional<Index> dst,
                                    const SpfOptions& opts) {
  const auto N = static_cast<std::size_t>(g.num_nodes());
  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto aai = g.adj_arc_index_view();
  const auto arc_edge = g.arc_edge_view();
  const auto base = g.cost_view();
  const bool has_override = opts.cost_override.size() == static_cast<std::size_t>(g.num_edges());
  const bool has_residual = opts.residual.size() == static_cast<std::size_t>(g.num_edges());
  const auto cost = has_override ? opts.cost_override : base;

  ShortestPathTree tree;
  tree.source = src;
  tree.dist.assign(N, std::numeric_limits<Cost>::infinity());
  tree.hops.assign(N, std::numeric_limits<std::int32_t>::max());
  tree.parent.assign(N, -1);
  tree.via_arc.assign(N, -1);
  if (src < 0 || static_cast<std::size_t>(src) >= N) return tree;
  if (opts.node_mask && !opts.node_mask[static_cast<std::size_t>(src)]) return tree;

  std::vector<char> settled(N, 0);
  tree.dist[static_cast<std::size_t>(src)] = 0.0;
  tree.hops[static_cast<std::size_t>(src)] = 0;

  using QItem = std::tuple<Cost, std::int32_t, Index>;
  std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>> pq;
  pq.emplace(0.0, 0, src);
  const bool early_exit = dst.has_value();
  const Index dst_node = dst.value_or(-1);

  while (!pq.empty()) {
    auto [d_u_key, h_u_key, u] = pq.top(); pq.pop();
    (void)d_u_key; (void)h_u_key;
    auto ui = static_cast<std::size_t>(u);
    if (settled[ui]) continue;
    settled[ui] = 1;
    if (early_exit && u == dst_node) break;
    const Cost d_u = tree.dist[ui];
    const std::int32_t h_u = tree.hops[ui];

    auto start = static_cast<std::size_t>(row[ui]);
    auto end   = static_cast<std::size_t>(row[ui + 1]);
    for (std::size_t j = start; j < end; ++j) {
      const Index v = col[j];
      const auto vi = static_cast<std::size_t>(v);
      if (settled[vi]) continue;
      if (opts.node_mask && !opts.node_mask[vi]) continue;
      const auto e = static_cast<std::size_t>(arc_edge[static_cast<std::size_t>(aai[j])]);
      if (opts.edge_mask && !opts.edge_mask[e]) continue;
      if (has_residual && opts.residual[e] < opts.min_residual) continue;
      const Cost c = cost[e];
      if (!std::isfinite(c)) continue;

      const Cost nd = d_u + c;
      const std::int32_t nh = h_u + 1;
      const Cost dv = tree.dist[vi];
      bool better = false;
      if (nd < dv - kCostEpsilon) {
        better = true;
      } else if (nd <= dv + kCostEpsilon) {
        if (nh < tree.hops[vi]) {
          better = true;
        } else if (nh == tree.hops[vi] && tree.parent[vi] != u &&
                   sequence_less(tree.parent, u, tree.parent[vi])) {
          better = true;
        }
      }
      if (better) {
        tree.dist[vi] = nd;
        tree.hops[vi] = nh;
        tree.parent[vi] = u;
        tree.via_arc[vi] = aai[j];
        pq.emplace(nd, nh, v);
      }
    }
  }
  return tree;
}

std::optional<IndexPath> extract_path(const CompactGraph& g, const ShortestPathTree& tree, Index dst) {
  if (dst < 0 || dst >= g.num_nodes()) return std::nullopt;
  if (!std::isfinite(tree.dist[static_cast<std::size_t>(dst)])) return std::nullopt;
  IndexPath p;
  for (Index v = dst; v != tree.source; v = tree.parent[static_cast<std::size_t>(v)]) {
    if (v < 0) return std::nullopt;
    p.nodes.push_back(v);
    p.arcs.push_back(tree.via_arc[static_cast<std::size_t>(v)]);
  }
  p.nodes.push_back(tree.source);
  std::reverse(p.nodes.begin(), p.nodes.end());
  std::reverse(p.arcs.begin(), p.arcs.end());
  p.cost = tree.dist[static_cast<std::size_t>(dst)];
  return p;
}

} // namespace mycelium::core
