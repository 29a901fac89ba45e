/*
  Storage collaborator: mirror of graph state in an external store.

  The engine calls the backend after every structural mutation. Calls are
  fire-and-forget: a backend that throws is logged and ignored, and the
  engine never waits on or consults the store to make a decision.

  For Python developers:
  - virtual ... = 0: pure virtual (like @abstractmethod)
  - std::shared_ptr<T>: reference-counted pointer
*/
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "mycelium/core/types.hpp"

namespace mycelium::core {

struct NodeAttributes {
  Resource resource_level {0.0};
  Resource capacity {0.0};
  Health health {Health::Healthy};
  NodeKind kind {NodeKind::Intermediate};
  std::int32_t degree {0};
};

struct EdgeAttributes {
  EdgeId id {-1};
  Cost base_cost {1.0};
  Cost effective_cost {1.0};
  Cap capacity {0.0};
  std::uint64_t usage_count {0};
  Health health {Health::Healthy};
  bool grown {false};
};

class StorageBackend {
public:
  virtual ~StorageBackend() noexcept = default;

  virtual void upsert_node(NodeId id, const NodeAttributes& attributes) = 0;
  virtual void upsert_edge(EdgeEndpoints endpoints, const EdgeAttributes& attributes) = 0;
  virtual void delete_node(NodeId id) = 0;
  virtual void delete_edge(EdgeEndpoints endpoints) = 0;
};

using StoragePtr = std::shared_ptr<StorageBackend>;

// In-memory mirror. Keeps the last upserted attributes per element and a
// count of calls received; useful for inspection and tests.
class MemoryStorage final : public StorageBackend {
public:
  void upsert_node(NodeId id, const NodeAttributes& attributes) override;
  void upsert_edge(EdgeEndpoints endpoints, const EdgeAttributes& attributes) override;
  void delete_node(NodeId id) override;
  void delete_edge(EdgeEndpoints endpoints) override;

  [[nodiscard]] std::optional<NodeAttributes> node(NodeId id) const;
  [[nodiscard]] std::optional<EdgeAttributes> edge(EdgeEndpoints endpoints) const;
  [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }
  [[nodiscard]] std::size_t call_count() const noexcept { return calls_; }

private:
  static std::pair<NodeId, NodeId> key(EdgeEndpoints e) noexcept { return {e.a, e.b}; }

  std::map<NodeId, NodeAttributes> nodes_;
  std::map<std::pair<NodeId, NodeId>, EdgeAttributes> edges_;
  std::size_t calls_ {0};
};

[[nodiscard]] std::shared_ptr<MemoryStorage> make_memory_storage();

} // namespace mycelium::core
