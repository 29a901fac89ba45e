/*
  connected_components: union-find over healthy arcs.
*/
#include "mycelium/core/components.hpp"

#include <numeric>
#include <utility>

namespace mycelium::core {

DisjointSet::DisjointSet(std::size_t n) : parent(n) {
  std::iota(parent.begin(), parent.end(), 0);
}

std::int32_t DisjointSet::find(std::int32_t x) noexcept {
  while (parent[static_cast<std::size_t>(x)] != x) {
    auto& p = parent[static_cast<std::size_t>(x)];
    p = parent[static_cast<std::size_t>(p)];
    x = p;
  }
  return x;
}

void DisjointSet::unite(std::int32_t a, std::int32_t b) noexcept {
  a = find(a); b = find(b);
  if (a == b) return;
  if (b < a) std::swap(a, b);
  parent[static_cast<std::size_t>(b)] = a;
}

std::int32_t Components::largest() const noexcept {
  std::int32_t best = -1;
  for (std::size_t c = 0; c < sizes.size(); ++c) {
    if (best < 0 || sizes[c] > sizes[static_cast<std::size_t>(best)]) best = static_cast<std::int32_t>(c);
  }
  return best;
}

std::int32_t Components::largest_size() const noexcept {
  auto c = largest();
  return c < 0 ? 0 : sizes[static_cast<std::size_t>(c)];
}

Components connected_components(const CompactGraph& g) {
  const auto N = static_cast<std::size_t>(g.num_nodes());
  const auto src = g.arc_src_view();
  const auto dst = g.arc_dst_view();
  const auto arc_edge = g.arc_edge_view();
  DisjointSet ds(N);
  for (std::size_t a = 0; a < src.size(); ++a) {
    if (!g.edge_healthy(arc_edge[a])) continue;
    if (!g.node_healthy(src[a]) || !g.node_healthy(dst[a])) continue;
    ds.unite(src[a], dst[a]);
  }
  Components out;
  out.label.assign(N, -1);
  std::vector<std::int32_t> root_label(N, -1);
  for (std::size_t v = 0; v < N; ++v) {
    if (!g.node_healthy(static_cast<Index>(v))) continue;
    auto r = static_cast<std::size_t>(ds.find(static_cast<std::int32_t>(v)));
    if (root_label[r] < 0) {
      root_label[r] = out.count();
      out.sizes.push_back(0);
    }
    out.label[v] = root_label[r];
    out.sizes[static_cast<std::size_t>(root_label[r])]++;
  }
  return out;
}

} // namespace mycelium::core
