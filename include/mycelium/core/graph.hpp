/* Mutable attributed graph: the single owned state every algorithm reads. */
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <span>
#include <unordered_map>
#include <vector>

#include "mycelium/core/storage.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

struct Node {
  NodeId id { -1 };
  Resource resource_level { 0.0 };
  Resource capacity { 0.0 };
  Health health { Health::Healthy };
  NodeKind kind { NodeKind::Intermediate };
  std::vector<EdgeId> incident {};  // unordered; includes damaged edges

  [[nodiscard]] std::int32_t degree() const noexcept { return static_cast<std::int32_t>(incident.size()); }
  [[nodiscard]] bool healthy() const noexcept { return health == Health::Healthy; }
};

struct Edge {
  EdgeId id { -1 };
  EdgeEndpoints endpoints {};
  Cost base_cost { 1.0 };
  // Multiplier in (0, 1]; lowered by flow (reinforcement) and drifting back
  // to 1 when idle (decay).
  double reinforcement { 1.0 };
  Cap capacity { 0.0 };
  std::uint64_t usage_count { 0 };
  Health health { Health::Healthy };
  bool grown { false };

  [[nodiscard]] Cost effective_cost() const noexcept { return base_cost * reinforcement; }
  [[nodiscard]] bool healthy() const noexcept { return health == Health::Healthy; }
  [[nodiscard]] NodeId other(NodeId v) const noexcept { return v == endpoints.a ? endpoints.b : endpoints.a; }
};

// Insertion parameters. Capacity may be +inf.
struct NodeSpec {
  Resource resource_level { 0.0 };
  Resource capacity { std::numeric_limits<Resource>::infinity() };
  NodeKind kind { NodeKind::Intermediate };
};

struct EdgeSpec {
  Cost base_cost { 1.0 };
  Cap capacity { 10.0 };
  bool grown { false };
};

// Graph owns nodes and edges keyed by stable identifiers. Adjacency is an
// incident-edge list per node so neighbour lookup, edge insertion and edge
// removal are O(degree). Undirected by default; a directed graph keeps
// (tail, head) order in EdgeEndpoints and allows both (u,v) and (v,u).
//
// When a storage backend is attached, every structural mutation (node/edge
// add, delete, health change) is mirrored to it; backend failures are logged
// and swallowed.
class Graph {
public:
  explicit Graph(bool directed = false) : directed_(directed) {}

  [[nodiscard]] bool directed() const noexcept { return directed_; }

  void attach_storage(StoragePtr storage) noexcept { storage_ = std::move(storage); }
  [[nodiscard]] const StoragePtr& storage() const noexcept { return storage_; }

  // Nodes
  void add_node(NodeId id, const NodeSpec& spec = {});
  void remove_node(NodeId id);
  [[nodiscard]] bool has_node(NodeId id) const noexcept { return nodes_.find(id) != nodes_.end(); }
  [[nodiscard]] const Node& node(NodeId id) const;
  [[nodiscard]] std::size_t num_nodes() const noexcept { return nodes_.size(); }
  // Ascending identifiers.
  [[nodiscard]] std::vector<NodeId> node_ids() const;

  // Edges
  EdgeId add_edge(NodeId a, NodeId b, const EdgeSpec& spec = {});
  void remove_edge(EdgeId id);
  void remove_edge(NodeId a, NodeId b);
  [[nodiscard]] bool has_edge(NodeId a, NodeId b) const noexcept { return find_edge(a, b).has_value(); }
  [[nodiscard]] std::optional<EdgeId> find_edge(NodeId a, NodeId b) const noexcept;
  [[nodiscard]] const Edge& edge(EdgeId id) const;
  [[nodiscard]] std::size_t num_edges() const noexcept { return edges_.size(); }
  // Ascending identifiers.
  [[nodiscard]] std::vector<EdgeId> edge_ids() const;

  // Adjacent nodes regardless of direction or health, ascending.
  [[nodiscard]] std::vector<NodeId> neighbors(NodeId id) const;
  [[nodiscard]] std::span<const EdgeId> incident_edges(NodeId id) const;

  // Resource mutation clamps to [0, capacity]. Returns the level (set) or the
  // delta actually applied (adjust).
  Resource set_node_resource(NodeId id, Resource level);
  Resource adjust_node_resource(NodeId id, Resource delta);

  // Damaging a node damages all incident edges. Restoring a node leaves its
  // edges as they are; use set_edge_health to bring them back.
  void set_node_health(NodeId id, Health health);
  // An edge with a damaged endpoint cannot be marked healthy.
  void set_edge_health(EdgeId id, Health health);

  void record_usage(EdgeId id, std::uint64_t count = 1);
  void set_reinforcement(EdgeId id, double factor);
  void set_base_cost(EdgeId id, Cost base_cost);

  // Push current attributes of one element to the storage backend.
  void sync_node(NodeId id) const;
  void sync_edge(EdgeId id) const;

private:
  [[nodiscard]] EdgeEndpoints normalize(NodeId a, NodeId b) const noexcept;
  Node& node_mut(NodeId id);
  Edge& edge_mut(EdgeId id);
  void detach_edge(const Edge& e);

  bool directed_ { false };
  std::unordered_map<NodeId, Node> nodes_;
  std::unordered_map<EdgeId, Edge> edges_;
  std::unordered_map<EdgeEndpoints, EdgeId, EdgeEndpointsHash> by_endpoints_;
  EdgeId next_edge_id_ { 0 };
  StoragePtr storage_ {};
};

} // namespace mycelium::core
