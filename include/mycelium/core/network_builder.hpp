/* Seeded generator of "mycelium-like" test topologies. */
#pragma once

#include <cstdint>

#include "mycelium/core/graph.hpp"
#include "mycelium/core/types.hpp"

namespace mycelium::core {

struct NetworkSpec {
  std::int32_t num_nodes { 20 };
  // Base connection probability; pairs i < j connect with
  // connection_prob * (1 - (j - i) / num_nodes).
  double connection_prob { 0.15 };
  std::uint32_t seed { 42 };
  Resource min_resource { 50.0 };
  Resource max_resource { 150.0 };
  Cost min_cost { 0.5 };
  Cost max_cost { 1.5 };
  Cap min_capacity { 5.0 };
  Cap max_capacity { 15.0 };
  // The first num_sources nodes are Sources, the last num_sinks are Sinks.
  std::int32_t num_sources { 3 };
  std::int32_t num_sinks { 3 };
  NodeId first_id { 0 };
};

// Adds spec.num_nodes nodes with ids first_id.. and random edges to g.
// Resources and capacities are whole numbers drawn uniformly from their
// ranges; costs are uniform reals. The same spec always yields the same
// topology.
//
// Throws InvalidArgument for inconsistent ranges and DuplicateIdentifier if
// any id in the range already exists; g is unchanged in both cases.
void build_mycelium_network(Graph& g, const NetworkSpec& spec = {});

} // namespace mycelium::core
