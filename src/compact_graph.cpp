/*
  CompactGraph: immutable snapshot of a Graph with deterministic layout.

  Construction renumbers nodes and edges densely in identifier order, expands
  edges into traversable arcs (both directions for undirected graphs, or when
  add_reverse is requested), and compacts arcs into CSR adjacency using a
  stable (src, dst) ordering. Health is captured in node/edge masks rather
  than by dropping elements, so indices stay valid for the whole snapshot.
*/
#include "mycelium/core/compact_graph.hpp"

#include <algorithm>
#include <numeric>

namespace mycelium::core {

std::optional<Index> CompactGraph::index_of(NodeId id) const noexcept {
  auto it = std::lower_bound(node_ids_.begin(), node_ids_.end(), id);
  if (it == node_ids_.end() || *it != id) return std::nullopt;
  return static_cast<Index>(it - node_ids_.begin());
}

std::optional<Index> CompactGraph::edge_index_of(EdgeId id) const noexcept {
  auto it = std::lower_bound(edge_ids_.begin(), edge_ids_.end(), id);
  if (it == edge_ids_.end() || *it != id) return std::nullopt;
  return static_cast<Index>(it - edge_ids_.begin());
}

CompactGraph CompactGraph::from_graph(const Graph& g, bool add_reverse) {
  CompactGraph cg;
  cg.node_ids_ = g.node_ids();
  cg.edge_ids_ = g.edge_ids();
  const std::size_t n = cg.node_ids_.size();
  const std::size_t m = cg.edge_ids_.size();

  cg.node_mask_ = std::make_unique<bool[]>(n);
  for (std::size_t v = 0; v < n; ++v) {
    cg.node_mask_[v] = g.node(cg.node_ids_[v]).healthy();
  }

  cg.cost_.resize(m);
  cg.base_cost_.resize(m);
  cg.capacity_.resize(m);
  cg.edge_mask_ = std::make_unique<bool[]>(m);
  const bool both_ways = !g.directed() || add_reverse;
  std::vector<Index> src_v, dst_v, edge_v;
  src_v.reserve(both_ways ? 2 * m : m);
  dst_v.reserve(both_ways ? 2 * m : m);
  edge_v.reserve(both_ways ? 2 * m : m);
  for (std::size_t e = 0; e < m; ++e) {
    const Edge& edge = g.edge(cg.edge_ids_[e]);
    cg.cost_[e] = edge.effective_cost();
    cg.base_cost_[e] = edge.base_cost;
    cg.capacity_[e] = edge.capacity;
    cg.edge_mask_[e] = edge.healthy();
    // Endpoints exist by Graph invariant.
    const Index a = *cg.index_of(edge.endpoints.a);
    const Index b = *cg.index_of(edge.endpoints.b);
    src_v.push_back(a); dst_v.push_back(b); edge_v.push_back(static_cast<Index>(e));
    if (both_ways) {
      src_v.push_back(b); dst_v.push_back(a); edge_v.push_back(static_cast<Index>(e));
    }
  }
  const std::size_t arcs = src_v.size();

  // Sort arcs by (src, dst, edge) so CSR rows are neighbour-ordered.
  std::vector<std::size_t> idx(arcs);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t x, std::size_t y) {
    if (src_v[x] != src_v[y]) return src_v[x] < src_v[y];
    if (dst_v[x] != dst_v[y]) return dst_v[x] < dst_v[y];
    return edge_v[x] < edge_v[y];
  });
  auto apply_perm = [&](auto& out_vec, const auto& in_vec) {
    out_vec.resize(arcs);
    for (std::size_t i = 0; i < arcs; ++i) out_vec[i] = in_vec[idx[i]];
  };
  apply_perm(cg.arc_src_, src_v);
  apply_perm(cg.arc_dst_, dst_v);
  apply_perm(cg.arc_edge_, edge_v);

  // Build CSR adjacency. Arcs are already grouped by source.
  cg.row_offsets_.assign(n + 1, 0);
  for (std::size_t i = 0; i < arcs; ++i) {
    cg.row_offsets_[static_cast<std::size_t>(cg.arc_src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < cg.row_offsets_.size(); ++i) {
    cg.row_offsets_[i] += cg.row_offsets_[i - 1];
  }
  cg.col_indices_.resize(arcs);
  cg.adj_arc_index_.resize(arcs);
  std::vector<std::int32_t> cursor = cg.row_offsets_;
  for (std::size_t a = 0; a < arcs; ++a) {
    auto u = cg.arc_src_[a];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    cg.col_indices_[pos] = cg.arc_dst_[a];
    cg.adj_arc_index_[pos] = static_cast<Index>(a);
  }
  return cg;
}

} // namespace mycelium::core
