/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId/EdgeId: int32 (stable external identifiers, not dense indices)
 * - Cost/Cap/Flow/Resource: double (matches np.float64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>
#include <utility>

namespace mycelium::core {

// Node and edge identifiers are signed 32-bit integers chosen by the caller
// (nodes) or assigned by the graph (edges). They stay stable across mutations.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Cost     = double;  // Path cost (effective cost is base cost scaled by reinforcement)
using Cap      = double;  // Edge capacity
using Flow     = double;  // Flow amount (same unit as capacity)
using Resource = double;  // Node resource stock

// Dense index into a CompactGraph snapshot. Only meaningful for the snapshot
// that produced it.
using Index = std::int32_t;

enum class Health : std::uint8_t {
  Healthy = 0,
  Damaged = 1
};

// Informational role of a node, as labelled by the network builder.
enum class NodeKind : std::uint8_t {
  Source = 1,
  Intermediate = 2,
  Sink = 3
};

// Endpoint pair of an edge. For undirected graphs the pair is stored with
// a <= b; for directed graphs a is the tail and b the head.
struct EdgeEndpoints {
  NodeId a { -1 };
  NodeId b { -1 };
  friend bool operator==(const EdgeEndpoints& x, const EdgeEndpoints& y) noexcept {
    return x.a == y.a && x.b == y.b;
  }
};

// Hash function for EdgeEndpoints (enables use in std::unordered_map).
struct EdgeEndpointsHash {
  std::size_t operator()(const EdgeEndpoints& k) const noexcept {
    std::size_t h = 0;
    auto combine = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    combine(std::hash<NodeId>{}(k.a));
    combine(std::hash<NodeId>{}(k.b));
    return h;
  }
};

[[nodiscard]] inline const char* to_string(Health h) noexcept {
  return h == Health::Healthy ? "healthy" : "damaged";
}

[[nodiscard]] inline const char* to_string(NodeKind k) noexcept {
  switch (k) {
    case NodeKind::Source: return "source";
    case NodeKind::Sink: return "sink";
    case NodeKind::Intermediate: break;
  }
  return "intermediate";
}

} // namespace mycelium::core
