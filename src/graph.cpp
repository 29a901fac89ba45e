/*
  Graph: mutable node/edge store with health, usage and capacity state.

  Validation always happens before mutation so a rejected call leaves the
  graph untouched. Structural mutations are mirrored to the optional storage
  backend after they have been applied in memory.
*/
#include "mycelium/core/graph.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "mycelium/core/error.hpp"
#include "mycelium/core/log.hpp"

namespace mycelium::core {

namespace {

NodeAttributes to_attributes(const Node& n) {
  return NodeAttributes{n.resource_level, n.capacity, n.health, n.kind, n.degree()};
}

EdgeAttributes to_attributes(const Edge& e) {
  return EdgeAttributes{e.id, e.base_cost, e.effective_cost(), e.capacity,
                        e.usage_count, e.health, e.grown};
}

// Fire-and-forget: the outcome is only visible in the log.
template <typename Fn>
void mirror(const StoragePtr& storage, const char* what, Fn&& fn) {
  if (!storage) return;
  try {
    fn(*storage);
  } catch (const std::exception& ex) {
    log(LogLevel::Warning, "storage", what, " failed: ", ex.what());
  }
}

} // namespace

EdgeEndpoints Graph::normalize(NodeId a, NodeId b) const noexcept {
  if (directed_ || a <= b) return EdgeEndpoints{a, b};
  return EdgeEndpoints{b, a};
}

Node& Graph::node_mut(NodeId id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw UnknownNode("unknown node " + std::to_string(id));
  }
  return it->second;
}

Edge& Graph::edge_mut(EdgeId id) {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    throw NotFound("edge " + std::to_string(id) + " not found");
  }
  return it->second;
}

const Node& Graph::node(NodeId id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw UnknownNode("unknown node " + std::to_string(id));
  }
  return it->second;
}

const Edge& Graph::edge(EdgeId id) const {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    throw NotFound("edge " + std::to_string(id) + " not found");
  }
  return it->second;
}

void Graph::add_node(NodeId id, const NodeSpec& spec) {
  if (nodes_.find(id) != nodes_.end()) {
    throw DuplicateIdentifier("node " + std::to_string(id) + " already exists");
  }
  if (std::isnan(spec.capacity) || spec.capacity < 0.0) {
    throw InvalidArgument("node capacity must be >= 0");
  }
  if (!std::isfinite(spec.resource_level) || spec.resource_level < 0.0 ||
      spec.resource_level > spec.capacity) {
    throw InvalidArgument("node resource_level must be within [0, capacity]");
  }
  Node n;
  n.id = id;
  n.resource_level = spec.resource_level;
  n.capacity = spec.capacity;
  n.kind = spec.kind;
  auto it = nodes_.emplace(id, std::move(n)).first;
  mirror(storage_, "upsert_node", [&](StorageBackend& s) { s.upsert_node(id, to_attributes(it->second)); });
}

void Graph::remove_node(NodeId id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw NotFound("node " + std::to_string(id) + " not found");
  }
  // Copy: detach_edge edits the incident list we are iterating.
  std::vector<EdgeId> incident = it->second.incident;
  for (EdgeId eid : incident) remove_edge(eid);
  nodes_.erase(it);
  mirror(storage_, "delete_node", [&](StorageBackend& s) { s.delete_node(id); });
}

std::vector<NodeId> Graph::node_ids() const {
  std::vector<NodeId> out;
  out.reserve(nodes_.size());
  for (auto const& kv : nodes_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

EdgeId Graph::add_edge(NodeId a, NodeId b, const EdgeSpec& spec) {
  if (!has_node(a)) throw UnknownEndpoint("edge endpoint " + std::to_string(a) + " does not exist");
  if (!has_node(b)) throw UnknownEndpoint("edge endpoint " + std::to_string(b) + " does not exist");
  if (a == b) throw InvalidArgument("self-loops are not allowed (node " + std::to_string(a) + ")");
  if (!std::isfinite(spec.base_cost) || spec.base_cost <= 0.0) {
    throw InvalidArgument("edge base_cost must be finite and > 0");
  }
  if (std::isnan(spec.capacity) || spec.capacity < 0.0) {
    throw InvalidArgument("edge capacity must be >= 0");
  }
  const EdgeEndpoints ep = normalize(a, b);
  if (by_endpoints_.find(ep) != by_endpoints_.end()) {
    throw DuplicateIdentifier("edge " + std::to_string(ep.a) + "-" + std::to_string(ep.b) + " already exists");
  }
  Edge e;
  e.id = next_edge_id_++;
  e.endpoints = ep;
  e.base_cost = spec.base_cost;
  e.capacity = spec.capacity;
  e.grown = spec.grown;
  // Edges touching a damaged node are born damaged.
  if (!node(a).healthy() || !node(b).healthy()) e.health = Health::Damaged;
  const EdgeId id = e.id;
  edges_.emplace(id, e);
  by_endpoints_.emplace(ep, id);
  nodes_[ep.a].incident.push_back(id);
  nodes_[ep.b].incident.push_back(id);
  mirror(storage_, "upsert_edge", [&](StorageBackend& s) { s.upsert_edge(ep, to_attributes(e)); });
  // Endpoint degrees changed.
  sync_node(ep.a);
  sync_node(ep.b);
  return id;
}

void Graph::detach_edge(const Edge& e) {
  for (NodeId v : {e.endpoints.a, e.endpoints.b}) {
    auto& inc = nodes_[v].incident;
    inc.erase(std::remove(inc.begin(), inc.end(), e.id), inc.end());
  }
  by_endpoints_.erase(e.endpoints);
}

void Graph::remove_edge(EdgeId id) {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    throw NotFound("edge " + std::to_string(id) + " not found");
  }
  const EdgeEndpoints ep = it->second.endpoints;
  detach_edge(it->second);
  edges_.erase(it);
  mirror(storage_, "delete_edge", [&](StorageBackend& s) { s.delete_edge(ep); });
  sync_node(ep.a);
  sync_node(ep.b);
}

void Graph::remove_edge(NodeId a, NodeId b) {
  auto eid = find_edge(a, b);
  if (!eid) {
    throw NotFound("edge " + std::to_string(a) + "-" + std::to_string(b) + " not found");
  }
  remove_edge(*eid);
}

std::optional<EdgeId> Graph::find_edge(NodeId a, NodeId b) const noexcept {
  auto it = by_endpoints_.find(normalize(a, b));
  if (it == by_endpoints_.end()) return std::nullopt;
  return it->second;
}

std::vector<EdgeId> Graph::edge_ids() const {
  std::vector<EdgeId> out;
  out.reserve(edges_.size());
  for (auto const& kv : edges_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<NodeId> Graph::neighbors(NodeId id) const {
  const Node& n = node(id);
  std::vector<NodeId> out;
  out.reserve(n.incident.size());
  for (EdgeId eid : n.incident) out.push_back(edges_.at(eid).other(id));
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::span<const EdgeId> Graph::incident_edges(NodeId id) const {
  return node(id).incident;
}

Resource Graph::set_node_resource(NodeId id, Resource level) {
  if (std::isnan(level)) throw InvalidArgument("resource level must not be NaN");
  Node& n = node_mut(id);
  n.resource_level = std::clamp(level, 0.0, n.capacity);
  return n.resource_level;
}

Resource Graph::adjust_node_resource(NodeId id, Resource delta) {
  if (std::isnan(delta)) throw InvalidArgument("resource delta must not be NaN");
  Node& n = node_mut(id);
  const Resource before = n.resource_level;
  n.resource_level = std::clamp(before + delta, 0.0, n.capacity);
  return n.resource_level - before;
}

void Graph::set_node_health(NodeId id, Health health) {
  Node& n = node_mut(id);
  if (n.health == health) return;
  n.health = health;
  mirror(storage_, "upsert_node", [&](StorageBackend& s) { s.upsert_node(id, to_attributes(n)); });
  if (health != Health::Damaged) return;
  for (EdgeId eid : n.incident) {
    Edge& e = edges_.at(eid);
    if (e.health == Health::Damaged) continue;
    e.health = Health::Damaged;
    mirror(storage_, "upsert_edge", [&](StorageBackend& s) { s.upsert_edge(e.endpoints, to_attributes(e)); });
  }
}

void Graph::set_edge_health(EdgeId id, Health health) {
  Edge& e = edge_mut(id);
  if (health == Health::Healthy &&
      (!node(e.endpoints.a).healthy() || !node(e.endpoints.b).healthy())) {
    throw InvalidArgument("edge " + std::to_string(id) + " has a damaged endpoint");
  }
  if (e.health == health) return;
  e.health = health;
  mirror(storage_, "upsert_edge", [&](StorageBackend& s) { s.upsert_edge(e.endpoints, to_attributes(e)); });
}

void Graph::record_usage(EdgeId id, std::uint64_t count) {
  edge_mut(id).usage_count += count;
}

void Graph::set_reinforcement(EdgeId id, double factor) {
  if (!std::isfinite(factor) || factor <= 0.0) {
    throw InvalidArgument("reinforcement factor must be finite and > 0");
  }
  edge_mut(id).reinforcement = factor;
}

void Graph::set_base_cost(EdgeId id, Cost base_cost) {
  if (!std::isfinite(base_cost) || base_cost <= 0.0) {
    throw InvalidArgument("edge base_cost must be finite and > 0");
  }
  edge_mut(id).base_cost = base_cost;
}

void Graph::sync_node(NodeId id) const {
  const Node& n = node(id);
  mirror(storage_, "upsert_node", [&](StorageBackend& s) { s.upsert_node(id, to_attributes(n)); });
}

void Graph::sync_edge(EdgeId id) const {
  const Edge& e = edge(id);
  mirror(storage_, "upsert_edge", [&](StorageBackend& s) { s.upsert_edge(e.endpoints, to_attributes(e)); });
}

} // namespace mycelium::core
