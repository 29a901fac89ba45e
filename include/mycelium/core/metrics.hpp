/* Point-in-time measurements of network health. */
#pragma once

#include <cstdint>
#include <optional>

#include "mycelium/core/graph.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

struct MetricsSnapshot {
  std::int32_t component_count { 0 };       // healthy components only
  std::int32_t largest_component_size { 0 };
  // Largest component size over all nodes, damaged ones included.
  double largest_component_ratio { 0.0 };
  // Mean hop count over ordered pairs inside the largest component; 0 when it
  // has fewer than two nodes.
  double average_path_length { 0.0 };
  std::int64_t node_count { 0 };
  std::int64_t healthy_node_count { 0 };
  std::int64_t damaged_node_count { 0 };
  std::int64_t edge_count { 0 };
  std::int64_t healthy_edge_count { 0 };
  Resource total_resources { 0.0 };
  std::optional<double> last_repair_seconds;
};

// Read-only. Directed graphs are measured by weak connectivity.
[[nodiscard]] MetricsSnapshot metrics_snapshot(const Graph& g,
                                               std::optional<double> last_repair_seconds = std::nullopt);

} // namespace mycelium::core
