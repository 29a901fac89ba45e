#include <gtest/gtest.h>
#include "mycelium/core/metrics.hpp"
#include "test_utils.hpp"

using namespace mycelium::core;
using namespace mycelium::core::test;

TEST(Metrics, HealthyChain) {
  Graph g = make_abcd_chain();
  g.set_node_resource(1, 2.5);
  g.set_node_resource(4, 1.5);
  auto m = metrics_snapshot(g);
  EXPECT_EQ(m.component_count, 1);
  EXPECT_EQ(m.largest_component_size, 4);
  EXPECT_DOUBLE_EQ(m.largest_component_ratio, 1.0);
  // Hop distances 1,2,3,1,2,1 in both directions over 12 ordered pairs.
  EXPECT_NEAR(m.average_path_length, 20.0 / 12.0, 1e-12);
  EXPECT_EQ(m.node_count, 4);
  EXPECT_EQ(m.healthy_node_count, 4);
  EXPECT_EQ(m.damaged_node_count, 0);
  EXPECT_EQ(m.edge_count, 3);
  EXPECT_EQ(m.healthy_edge_count, 3);
  EXPECT_DOUBLE_EQ(m.total_resources, 4.0);
  EXPECT_FALSE(m.last_repair_seconds.has_value());
}

TEST(Metrics, PathLengthCountsHopsNotCost) {
  Graph g = make_chain_graph({1, 2, 3}, /*cost=*/7.5);
  auto m = metrics_snapshot(g);
  // (1,2)=1, (1,3)=2, (2,3)=1, doubled over 6 ordered pairs
  EXPECT_NEAR(m.average_path_length, 8.0 / 6.0, 1e-12);
}

TEST(Metrics, DamageShrinksLargestComponent) {
  Graph g = make_abcd_chain();
  g.set_node_health(2, Health::Damaged);
  auto m = metrics_snapshot(g, 0.25);
  EXPECT_EQ(m.component_count, 2);
  EXPECT_EQ(m.largest_component_size, 2);
  EXPECT_DOUBLE_EQ(m.largest_component_ratio, 0.5);
  EXPECT_DOUBLE_EQ(m.average_path_length, 1.0);
  EXPECT_EQ(m.healthy_node_count, 3);
  EXPECT_EQ(m.damaged_node_count, 1);
  EXPECT_EQ(m.edge_count, 3);
  EXPECT_EQ(m.healthy_edge_count, 1);
  ASSERT_TRUE(m.last_repair_seconds.has_value());
  EXPECT_DOUBLE_EQ(*m.last_repair_seconds, 0.25);
}

TEST(Metrics, EmptyAndSingletonGraphs) {
  Graph empty;
  auto m = metrics_snapshot(empty);
  EXPECT_EQ(m.component_count, 0);
  EXPECT_DOUBLE_EQ(m.largest_component_ratio, 0.0);
  EXPECT_DOUBLE_EQ(m.average_path_length, 0.0);

  Graph one;
  one.add_node(1);
  m = metrics_snapshot(one);
  EXPECT_EQ(m.component_count, 1);
  EXPECT_DOUBLE_EQ(m.largest_component_ratio, 1.0);
  EXPECT_DOUBLE_EQ(m.average_path_length, 0.0);
}

TEST(Metrics, DirectedGraphMeasuredWeakly) {
  Graph g(/*directed=*/true);
  for (NodeId id : {1, 2, 3}) g.add_node(id);
  g.add_edge(1, 2);
  g.add_edge(3, 2);
  auto m = metrics_snapshot(g);
  EXPECT_EQ(m.component_count, 1);
  EXPECT_EQ(m.largest_component_size, 3);
  EXPECT_NEAR(m.average_path_length, 8.0 / 6.0, 1e-12);
}
