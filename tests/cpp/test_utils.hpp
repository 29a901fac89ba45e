#pragma once

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/graph.hpp"
#include "mycelium/core/log.hpp"
#include "mycelium/core/path_discovery.hpp"

namespace mycelium::core::test {

// Graph builders

inline Graph make_chain_graph(const std::vector<NodeId>& ids, Cost cost = 1.0, Cap cap = 10.0) {
  // Undirected chain ids[0] - ids[1] - ... with uniform cost and capacity
  Graph g;
  for (NodeId id : ids) g.add_node(id);
  for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
    g.add_edge(ids[i], ids[i + 1], EdgeSpec{cost, cap, false});
  }
  return g;
}

inline Graph make_abcd_chain() {
  // A(1) - B(2) - C(3) - D(4), unit costs
  return make_chain_graph({1, 2, 3, 4});
}

inline Graph make_diamond_graph(Cost upper = 1.0, Cost lower = 1.5) {
  // 1 -> {2, 3} -> 4; upper route via 2, lower route via 3
  Graph g;
  for (NodeId id : {1, 2, 3, 4}) g.add_node(id);
  g.add_edge(1, 2, EdgeSpec{upper, 10.0, false});
  g.add_edge(2, 4, EdgeSpec{upper, 10.0, false});
  g.add_edge(1, 3, EdgeSpec{lower, 10.0, false});
  g.add_edge(3, 4, EdgeSpec{lower, 10.0, false});
  return g;
}

struct SplitIds {
  NodeId s { 10 };
  NodeId t { 20 };
  NodeId u { 30 };
  EdgeId st { -1 };
  EdgeId su { -1 };
  EdgeId ut { -1 };
};

inline Graph make_split_flow_graph(SplitIds& ids, Resource source_stock = 10.0,
                                   Resource sink_capacity = std::numeric_limits<Resource>::infinity()) {
  // S - T (cap 5, cost 1) and S - U - T (cap 10, cost 1 each)
  Graph g;
  g.add_node(ids.s, NodeSpec{source_stock, std::numeric_limits<Resource>::infinity(), NodeKind::Source});
  g.add_node(ids.t, NodeSpec{0.0, sink_capacity, NodeKind::Sink});
  g.add_node(ids.u);
  ids.st = g.add_edge(ids.s, ids.t, EdgeSpec{1.0, 5.0, false});
  ids.su = g.add_edge(ids.s, ids.u, EdgeSpec{1.0, 10.0, false});
  ids.ut = g.add_edge(ids.u, ids.t, EdgeSpec{1.0, 10.0, false});
  return g;
}

inline Graph make_grid_graph(int rows, int cols, Cost cost = 1.0) {
  // Undirected grid; node id = r * cols + c
  Graph g;
  for (int r = 0; r < rows; ++r)
    for (int c = 0; c < cols; ++c) g.add_node(r * cols + c);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const int node = r * cols + c;
      if (c < cols - 1) g.add_edge(node, node + 1, EdgeSpec{cost, 10.0, false});
      if (r < rows - 1) g.add_edge(node, node + cols, EdgeSpec{cost, 10.0, false});
    }
  }
  return g;
}

// Assertion helpers

inline void expect_path_healthy(const Graph& g, const Path& p) {
  for (NodeId v : p.nodes) EXPECT_TRUE(g.node(v).healthy()) << "damaged node " << v << " on path";
  for (EdgeId e : p.edges) EXPECT_TRUE(g.edge(e).healthy()) << "damaged edge " << e << " on path";
}

inline void expect_path_consistent(const Graph& g, const Path& p) {
  ASSERT_FALSE(p.nodes.empty());
  ASSERT_EQ(p.edges.size() + 1, p.nodes.size());
  Cost total = 0.0;
  for (std::size_t i = 0; i < p.edges.size(); ++i) {
    const Edge& e = g.edge(p.edges[i]);
    const bool forward = e.endpoints.a == p.nodes[i] && e.endpoints.b == p.nodes[i + 1];
    const bool backward = e.endpoints.b == p.nodes[i] && e.endpoints.a == p.nodes[i + 1];
    EXPECT_TRUE(forward || (!g.directed() && backward)) << "edge " << e.id << " does not join hop " << i;
    total += e.effective_cost();
  }
  EXPECT_NEAR(p.cost, total, 1e-9);
}

inline void expect_csr_valid(const CompactGraph& g) {
  auto row = g.row_offsets_view();
  auto col = g.col_indices_view();
  auto aai = g.adj_arc_index_view();

  EXPECT_EQ(row.size(), static_cast<std::size_t>(g.num_nodes() + 1));
  for (std::size_t i = 0; i + 1 < row.size(); ++i) {
    EXPECT_LE(row[i], row[i + 1]) << "Row offsets not monotonic at " << i;
  }
  EXPECT_EQ(row[row.size() - 1], g.num_arcs());
  EXPECT_EQ(col.size(), static_cast<std::size_t>(g.num_arcs()));
  EXPECT_EQ(aai.size(), static_cast<std::size_t>(g.num_arcs()));
  for (std::size_t i = 0; i < col.size(); ++i) {
    EXPECT_GE(col[i], 0);
    EXPECT_LT(col[i], g.num_nodes());
    EXPECT_GE(aai[i], 0);
    EXPECT_LT(aai[i], g.num_arcs());
  }
}

// Installs a capturing log sink for the lifetime of the object and restores
// the stderr sink and previous level afterwards.
class LogCapture {
public:
  struct Record {
    LogLevel level;
    std::string component;
    std::string message;
  };

  explicit LogCapture(LogLevel level = LogLevel::Debug) : saved_level_(log_level()) {
    set_log_level(level);
    set_log_sink([this](LogLevel lvl, std::string_view component, std::string_view message) {
      records_.push_back(Record{lvl, std::string(component), std::string(message)});
    });
  }
  ~LogCapture() {
    set_log_sink({});
    set_log_level(saved_level_);
  }
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  [[nodiscard]] const std::vector<Record>& records() const noexcept { return records_; }

  [[nodiscard]] std::size_t count(LogLevel level, const std::string& component) const {
    std::size_t n = 0;
    for (auto const& r : records_) n += (r.level == level && r.component == component) ? 1 : 0;
    return n;
  }

private:
  LogLevel saved_level_;
  std::vector<Record> records_;
};

} // namespace mycelium::core::test
