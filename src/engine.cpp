#include "mycelium/core/engine.hpp"

#include <utility>

#include "mycelium/core/log.hpp"

namespace mycelium::core {

ResilienceEngine::ResilienceEngine(EngineOptions opts, bool directed)
    : graph_(directed), opts_(std::move(opts)) {
  opts_.validate();
}

void ResilienceEngine::set_options(const EngineOptions& opts) {
  opts.validate();
  opts_ = opts;
}

std::vector<Path> ResilienceEngine::discover_paths(NodeId src, NodeId dst, int k) {
  auto paths = core::discover_paths(graph_, src, dst, k, opts_.discovery);
  for (auto const& p : paths) {
    for (EdgeId e : p.edges) {
      graph_.record_usage(e);
      graph_.sync_edge(e);
    }
  }
  log(LogLevel::Debug, "engine", "discover_paths ", src, "->", dst, " k=", k,
      " returned ", paths.size());
  return paths;
}

FlowReport ResilienceEngine::distribute_flow(const FlowAmounts& sources, const FlowAmounts& sinks) {
  return core::distribute_flow(graph_, sources, sinks, opts_.flow);
}

RepairReport ResilienceEngine::apply_damage(std::span<const NodeId> node_ids) {
  auto report = core::apply_damage(graph_, node_ids, opts_.repair);
  last_repair_ = report;
  return report;
}

MetricsSnapshot ResilienceEngine::metrics_snapshot() const {
  std::optional<double> seconds;
  if (last_repair_) seconds = last_repair_->elapsed_seconds;
  return core::metrics_snapshot(graph_, seconds);
}

} // namespace mycelium::core
