/* Numeric thresholds shared by the algorithms. */
#pragma once

namespace mycelium::core {

// Residual capacity below this value is treated as saturated.
inline constexpr double kMinCap = 1e-12;
// Placements smaller than this are treated as no progress.
inline constexpr double kMinFlow = 1e-12;
// Path costs within this distance compare equal (tie-breaking applies).
inline constexpr double kCostEpsilon = 1e-9;

} // namespace mycelium::core
