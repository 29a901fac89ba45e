#include "mycelium/core/network_builder.hpp"

#include <cmath>
#include <random>
#include <string>

#include "mycelium/core/error.hpp"
#include "mycelium/core/log.hpp"

namespace mycelium::core {

namespace {

void validate(const NetworkSpec& s) {
  if (s.num_nodes < 0) throw InvalidArgument("num_nodes must be >= 0");
  if (!(s.connection_prob >= 0.0 && s.connection_prob <= 1.0)) {
    throw InvalidArgument("connection_prob must be in [0, 1]");
  }
  if (!(s.min_resource >= 0.0 && s.min_resource <= s.max_resource)) {
    throw InvalidArgument("resource range must satisfy 0 <= min <= max");
  }
  if (!(s.min_cost > 0.0 && s.min_cost <= s.max_cost && std::isfinite(s.max_cost))) {
    throw InvalidArgument("cost range must satisfy 0 < min <= max < inf");
  }
  if (!(s.min_capacity >= 0.0 && s.min_capacity <= s.max_capacity)) {
    throw InvalidArgument("capacity range must satisfy 0 <= min <= max");
  }
  if (s.num_sources < 0 || s.num_sinks < 0) {
    throw InvalidArgument("num_sources and num_sinks must be >= 0");
  }
}

NodeKind kind_of(std::int32_t i, const NetworkSpec& s) {
  if (i < s.num_sources) return NodeKind::Source;
  if (i >= s.num_nodes - s.num_sinks) return NodeKind::Sink;
  return NodeKind::Intermediate;
}

} // namespace

void build_mycelium_network(Graph& g, const NetworkSpec& spec) {
  validate(spec);
  for (std::int32_t i = 0; i < spec.num_nodes; ++i) {
    const NodeId id = spec.first_id + i;
    if (g.has_node(id)) throw DuplicateIdentifier("node " + std::to_string(id) + " already exists");
  }

  std::mt19937 rng(spec.seed);
  std::uniform_int_distribution<long long> resource(std::llround(spec.min_resource),
                                                    std::llround(spec.max_resource));
  std::uniform_int_distribution<long long> capacity(std::llround(spec.min_capacity),
                                                    std::llround(spec.max_capacity));
  std::uniform_real_distribution<double> cost(spec.min_cost, spec.max_cost);
  std::uniform_real_distribution<double> coin(0.0, 1.0);

  for (std::int32_t i = 0; i < spec.num_nodes; ++i) {
    NodeSpec ns;
    ns.resource_level = static_cast<Resource>(resource(rng));
    ns.kind = kind_of(i, spec);
    g.add_node(spec.first_id + i, ns);
  }

  // Nearby ids connect more often (simulated spatial clustering).
  std::int32_t edges = 0;
  const auto n = static_cast<double>(spec.num_nodes);
  for (std::int32_t i = 0; i < spec.num_nodes; ++i) {
    for (std::int32_t j = i + 1; j < spec.num_nodes; ++j) {
      const double prob = spec.connection_prob * (1.0 - static_cast<double>(j - i) / n);
      if (coin(rng) >= prob) continue;
      EdgeSpec es;
      es.base_cost = cost(rng);
      es.capacity = static_cast<Cap>(capacity(rng));
      g.add_edge(spec.first_id + i, spec.first_id + j, es);
      ++edges;
    }
  }
  log(LogLevel::Info, "builder", "built network: nodes=", spec.num_nodes, " edges=", edges,
      " seed=", spec.seed);
}

} // namespace mycelium::core
