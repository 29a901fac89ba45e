/*
  ResilienceEngine: façade owning one Graph and its options.

  All four entry points run synchronously on the caller's thread against the
  owned graph. The engine adds no state of its own beyond the options and the
  last repair report.
*/
#pragma once

#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "mycelium/core/flow_distribution.hpp"
#include "mycelium/core/graph.hpp"
#include "mycelium/core/metrics.hpp"
#include "mycelium/core/options.hpp"
#include "mycelium/core/path_discovery.hpp"
#include "mycelium/core/repair.hpp"
#include "mycelium/core/storage.hpp"

namespace mycelium::core {

class ResilienceEngine {
public:
  // Throws InvalidArgument if opts does not validate.
  explicit ResilienceEngine(EngineOptions opts = {}, bool directed = false);

  [[nodiscard]] Graph& graph() noexcept { return graph_; }
  [[nodiscard]] const Graph& graph() const noexcept { return graph_; }

  [[nodiscard]] const EngineOptions& options() const noexcept { return opts_; }
  void set_options(const EngineOptions& opts);

  void attach_storage(StoragePtr storage) noexcept { graph_.attach_storage(std::move(storage)); }

  // Like core::discover_paths, and additionally counts one use on every edge
  // of every returned path.
  [[nodiscard]] std::vector<Path> discover_paths(NodeId src, NodeId dst, int k);
  FlowReport distribute_flow(const FlowAmounts& sources, const FlowAmounts& sinks);
  RepairReport apply_damage(std::span<const NodeId> node_ids);
  RepairReport apply_damage(const std::vector<NodeId>& node_ids) {
    return apply_damage(std::span<const NodeId>(node_ids));
  }
  // Carries the elapsed time of the last apply_damage(), if any.
  [[nodiscard]] MetricsSnapshot metrics_snapshot() const;

  [[nodiscard]] const std::optional<RepairReport>& last_repair() const noexcept { return last_repair_; }

private:
  Graph graph_;
  EngineOptions opts_;
  std::optional<RepairReport> last_repair_;
};

} // namespace mycelium::core
