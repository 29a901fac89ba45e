/* Connected components of the healthy part of a snapshot. */
#pragma once

#include <cstdint>
#include <vector>

#include "mycelium/core/compact_graph.hpp"

namespace mycelium::core {

// Union-find with path halving. The smaller root wins a union so roots are
// stable and equal the smallest member.
struct DisjointSet {
  std::vector<std::int32_t> parent;

  explicit DisjointSet(std::size_t n);
  std::int32_t find(std::int32_t x) noexcept;
  void unite(std::int32_t a, std::int32_t b) noexcept;
};

// Components are weak (arc direction is ignored). label[v] is -1 for damaged
// nodes; otherwise labels are numbered 0.. in order of each component's
// smallest node index.
struct Components {
  std::vector<std::int32_t> label;
  std::vector<std::int32_t> sizes;

  [[nodiscard]] std::int32_t count() const noexcept { return static_cast<std::int32_t>(sizes.size()); }
  // Label of the largest component (smallest label on ties), -1 if none.
  [[nodiscard]] std::int32_t largest() const noexcept;
  [[nodiscard]] std::int32_t largest_size() const noexcept;
};

[[nodiscard]] Components connected_components(const CompactGraph& g);

} // namespace mycelium::core
