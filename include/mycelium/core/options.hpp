/* Tunable parameters for discovery, flow and repair.
 *
 * The defaults are empirical; none of the algorithms depends on a specific
 * value beyond the documented ranges checked by validate().
 */
#pragma once

#include <cstdint>

namespace mycelium::core {

struct DiscoveryOptions {
  // Cost multiplier applied to every edge of an accepted path for the rest of
  // one discover_paths() call. Must be > 1.
  double penalty_multiplier { 2.0 };
  // Each requested path may take this many searches before giving up; bounds
  // the loop when penalties keep returning an already accepted path.
  int max_attempts_per_path { 3 };

  void validate() const;
};

struct FlowOptions {
  // Maximum number of passes over the sources.
  int round_limit { 64 };
  // Reinforcement factor drop per unit of capacity-normalised flow carried.
  double reinforcement_rate { 0.1 };
  // Floor of the reinforcement factor; keeps effective_cost > 0.
  double min_reinforcement { 0.5 };
  // Fraction of the gap to base cost recovered per idle pass.
  double decay_rate { 0.05 };

  void validate() const;
};

struct RepairOptions {
  // Maximum number of edges a single apply_damage() call may create.
  int growth_budget { 8 };
  // Added to the prior shortest distance to price a grown edge.
  double growth_cost_penalty { 1.0 };
  double growth_capacity { 5.0 };
  // Share a damaged node's resources among its healthy neighbours.
  bool redistribute_resources { true };

  void validate() const;
};

struct EngineOptions {
  DiscoveryOptions discovery {};
  FlowOptions flow {};
  RepairOptions repair {};

  void validate() const {
    discovery.validate();
    flow.validate();
    repair.validate();
  }
};

} // namespace mycelium::core
