/*
  MemoryStorage: in-process mirror of the graph for inspection and tests.
*/
#include "mycelium/core/storage.hpp"

namespace mycelium::core {

void MemoryStorage::upsert_node(NodeId id, const NodeAttributes& attributes) {
  ++calls_;
  nodes_[id] = attributes;
}

void MemoryStorage::upsert_edge(EdgeEndpoints endpoints, const EdgeAttributes& attributes) {
  ++calls_;
  edges_[key(endpoints)] = attributes;
}

void MemoryStorage::delete_node(NodeId id) {
  ++calls_;
  nodes_.erase(id);
}

void MemoryStorage::delete_edge(EdgeEndpoints endpoints) {
  ++calls_;
  edges_.erase(key(endpoints));
}

std::optional<NodeAttributes> MemoryStorage::node(NodeId id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeAttributes> MemoryStorage::edge(EdgeEndpoints endpoints) const {
  auto it = edges_.find(key(endpoints));
  if (it == edges_.end()) return std::nullopt;
  return it->second;
}

std::shared_ptr<MemoryStorage> make_memory_storage() {
  return std::make_shared<MemoryStorage>();
}

} // namespace mycelium::core
