/* Immutable CSR snapshot of a Graph with healthy-element masks. */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "mycelium/core/graph.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

// Notes on indices:
// - Nodes are renumbered densely in ascending NodeId order, so comparing dense
//   indices is the same as comparing NodeIds.
// - Edges are renumbered densely in ascending EdgeId order. Per-edge arrays
//   (cost, capacity, residuals, cost overrides) are indexed by this dense edge
//   index.
// - Arcs are the traversable directions. An undirected edge produces two arcs
//   sharing one edge index (and therefore one capacity); a directed edge
//   produces one, unless the snapshot is built with add_reverse.
// - Arcs are sorted by (src, dst) so CSR rows list neighbours in ascending
//   order.

class CompactGraph {
public:
  [[nodiscard]] static CompactGraph from_graph(const Graph& g, bool add_reverse = false);
  CompactGraph(CompactGraph&&) noexcept = default;
  CompactGraph& operator=(CompactGraph&&) noexcept = default;
  ~CompactGraph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(node_ids_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edge_ids_.size()); }
  [[nodiscard]] std::int32_t num_arcs() const noexcept { return static_cast<std::int32_t>(arc_src_.size()); }

  [[nodiscard]] NodeId node_id(Index v) const noexcept { return node_ids_[static_cast<std::size_t>(v)]; }
  [[nodiscard]] EdgeId edge_id(Index e) const noexcept { return edge_ids_[static_cast<std::size_t>(e)]; }
  [[nodiscard]] std::optional<Index> index_of(NodeId id) const noexcept;
  [[nodiscard]] std::optional<Index> edge_index_of(EdgeId id) const noexcept;

  [[nodiscard]] std::span<const NodeId> node_id_view() const noexcept { return node_ids_; }
  [[nodiscard]] std::span<const EdgeId> edge_id_view() const noexcept { return edge_ids_; }
  [[nodiscard]] std::span<const Cost> cost_view() const noexcept { return cost_; }
  [[nodiscard]] std::span<const Cost> base_cost_view() const noexcept { return base_cost_; }
  [[nodiscard]] std::span<const Cap> capacity_view() const noexcept { return capacity_; }
  [[nodiscard]] std::span<const Index> arc_src_view() const noexcept { return arc_src_; }
  [[nodiscard]] std::span<const Index> arc_dst_view() const noexcept { return arc_dst_; }
  [[nodiscard]] std::span<const Index> arc_edge_view() const noexcept { return arc_edge_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const Index> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const Index> adj_arc_index_view() const noexcept { return adj_arc_index_; }

  // Health masks: true means the element may be traversed.
  [[nodiscard]] const bool* node_mask() const noexcept { return node_mask_.get(); }
  [[nodiscard]] const bool* edge_mask() const noexcept { return edge_mask_.get(); }
  [[nodiscard]] bool node_healthy(Index v) const noexcept { return node_mask_[static_cast<std::size_t>(v)]; }
  [[nodiscard]] bool edge_healthy(Index e) const noexcept { return edge_mask_[static_cast<std::size_t>(e)]; }

private:
  CompactGraph() = default;

  std::vector<NodeId> node_ids_ {};
  std::vector<EdgeId> edge_ids_ {};
  // Per dense edge
  std::vector<Cost> cost_ {};       // effective cost
  std::vector<Cost> base_cost_ {};
  std::vector<Cap> capacity_ {};
  // Per arc
  std::vector<Index> arc_src_ {};
  std::vector<Index> arc_dst_ {};
  std::vector<Index> arc_edge_ {};

  // CSR adjacency for deterministic traversal
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<Index> col_indices_ {};
  std::vector<Index> adj_arc_index_ {}; // map CSR entry -> arc

  std::unique_ptr<bool[]> node_mask_ {};
  std::unique_ptr<bool[]> edge_mask_ {};
};

} // namespace mycelium::core
