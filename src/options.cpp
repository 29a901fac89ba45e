#include "mycelium/core/options.hpp"

#include <cmath>

#include "mycelium/core/error.hpp"

namespace mycelium::core {

void DiscoveryOptions::validate() const {
  if (!std::isfinite(penalty_multiplier) || penalty_multiplier <= 1.0) {
    throw InvalidArgument("penalty_multiplier must be finite and > 1");
  }
  if (max_attempts_per_path < 1) {
    throw InvalidArgument("max_attempts_per_path must be >= 1");
  }
}

void FlowOptions::validate() const {
  if (round_limit < 1) throw InvalidArgument("round_limit must be >= 1");
  if (!std::isfinite(reinforcement_rate) || reinforcement_rate < 0.0) {
    throw InvalidArgument("reinforcement_rate must be finite and >= 0");
  }
  if (!std::isfinite(min_reinforcement) || min_reinforcement <= 0.0 || min_reinforcement > 1.0) {
    throw InvalidArgument("min_reinforcement must be within (0, 1]");
  }
  if (!std::isfinite(decay_rate) || decay_rate < 0.0 || decay_rate > 1.0) {
    throw InvalidArgument("decay_rate must be within [0, 1]");
  }
}

void RepairOptions::validate() const {
  if (growth_budget < 0) throw InvalidArgument("growth_budget must be >= 0");
  if (!std::isfinite(growth_cost_penalty) || growth_cost_penalty < 0.0) {
    throw InvalidArgument("growth_cost_penalty must be finite and >= 0");
  }
  if (std::isnan(growth_capacity) || growth_capacity < 0.0) {
    throw InvalidArgument("growth_capacity must be >= 0");
  }
}

} // namespace mycelium::core
