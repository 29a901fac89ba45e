#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include "mycelium/core/error.hpp"
#include "mycelium/core/graph.hpp"
#include "test_utils.hpp"

using namespace mycelium::core;
using namespace mycelium::core::test;

TEST(GraphModel, AddNodeDefaultsAndLookup) {
  Graph g;
  g.add_node(7);
  ASSERT_TRUE(g.has_node(7));
  const Node& n = g.node(7);
  EXPECT_EQ(n.id, 7);
  EXPECT_DOUBLE_EQ(n.resource_level, 0.0);
  EXPECT_TRUE(std::isinf(n.capacity));
  EXPECT_EQ(n.health, Health::Healthy);
  EXPECT_EQ(n.kind, NodeKind::Intermediate);
  EXPECT_EQ(n.degree(), 0);
  EXPECT_FALSE(g.has_node(8));
  EXPECT_THROW((void)g.node(8), UnknownNode);
}

TEST(GraphModel, DuplicateNodeRejected) {
  Graph g;
  g.add_node(1, NodeSpec{5.0, 10.0, NodeKind::Source});
  EXPECT_THROW(g.add_node(1), DuplicateIdentifier);
  EXPECT_DOUBLE_EQ(g.node(1).resource_level, 5.0);
  EXPECT_EQ(g.num_nodes(), 1u);
}

TEST(GraphModel, InvalidNodeSpecRejected) {
  Graph g;
  EXPECT_THROW(g.add_node(1, NodeSpec{-1.0, 10.0, NodeKind::Intermediate}), InvalidArgument);
  EXPECT_THROW(g.add_node(1, NodeSpec{20.0, 10.0, NodeKind::Intermediate}), InvalidArgument);
  EXPECT_THROW(g.add_node(1, NodeSpec{0.0, -1.0, NodeKind::Intermediate}), InvalidArgument);
  EXPECT_EQ(g.num_nodes(), 0u);
}

TEST(GraphModel, AddEdgeValidation) {
  Graph g;
  g.add_node(1);
  g.add_node(2);
  EXPECT_THROW(g.add_edge(1, 3), UnknownEndpoint);
  EXPECT_THROW(g.add_edge(3, 1), UnknownEndpoint);
  EXPECT_THROW(g.add_edge(1, 1), InvalidArgument);
  EXPECT_THROW(g.add_edge(1, 2, EdgeSpec{0.0, 1.0, false}), InvalidArgument);
  EXPECT_THROW(g.add_edge(1, 2, EdgeSpec{-2.0, 1.0, false}), InvalidArgument);
  EXPECT_THROW(g.add_edge(1, 2, EdgeSpec{std::numeric_limits<double>::infinity(), 1.0, false}), InvalidArgument);
  EXPECT_THROW(g.add_edge(1, 2, EdgeSpec{1.0, -1.0, false}), InvalidArgument);
  EXPECT_EQ(g.num_edges(), 0u);
  EXPECT_EQ(g.node(1).degree(), 0);

  auto e = g.add_edge(1, 2);
  EXPECT_EQ(g.num_edges(), 1u);
  EXPECT_DOUBLE_EQ(g.edge(e).base_cost, 1.0);
  EXPECT_DOUBLE_EQ(g.edge(e).capacity, 10.0);
  EXPECT_DOUBLE_EQ(g.edge(e).reinforcement, 1.0);
  EXPECT_EQ(g.edge(e).usage_count, 0u);
  EXPECT_FALSE(g.edge(e).grown);
}

TEST(GraphModel, UndirectedEdgeIsUniquePerPair) {
  Graph g;
  g.add_node(1);
  g.add_node(2);
  auto e = g.add_edge(2, 1);
  EXPECT_THROW(g.add_edge(1, 2), DuplicateIdentifier);
  EXPECT_THROW(g.add_edge(2, 1), DuplicateIdentifier);
  ASSERT_TRUE(g.find_edge(1, 2).has_value());
  EXPECT_EQ(*g.find_edge(1, 2), e);
  EXPECT_EQ(*g.find_edge(2, 1), e);
  // Stored normalised
  EXPECT_EQ(g.edge(e).endpoints.a, 1);
  EXPECT_EQ(g.edge(e).endpoints.b, 2);
}

TEST(GraphModel, DirectedEdgesAllowBothOrientations) {
  Graph g(/*directed=*/true);
  g.add_node(1);
  g.add_node(2);
  auto fwd = g.add_edge(1, 2);
  auto rev = g.add_edge(2, 1);
  EXPECT_NE(fwd, rev);
  EXPECT_EQ(*g.find_edge(1, 2), fwd);
  EXPECT_EQ(*g.find_edge(2, 1), rev);
  EXPECT_THROW(g.add_edge(1, 2), DuplicateIdentifier);
  EXPECT_EQ(g.edge(rev).endpoints.a, 2);
}

TEST(GraphModel, EdgeIdsAreStableAndNotReused) {
  Graph g = make_abcd_chain();
  auto ids = g.edge_ids();
  ASSERT_EQ(ids.size(), 3u);
  g.remove_edge(ids[1]);
  auto fresh = g.add_edge(2, 3);
  EXPECT_GT(fresh, ids[2]);
  EXPECT_EQ(g.edge(ids[0]).endpoints.a, 1);
  EXPECT_EQ(g.edge(ids[2]).endpoints.b, 4);
}

TEST(GraphModel, RemoveNodeRemovesIncidentEdges) {
  Graph g = make_abcd_chain();
  g.remove_node(2);
  EXPECT_FALSE(g.has_node(2));
  EXPECT_EQ(g.num_edges(), 1u);
  EXPECT_FALSE(g.has_edge(1, 2));
  EXPECT_TRUE(g.has_edge(3, 4));
  EXPECT_EQ(g.node(1).degree(), 0);
  EXPECT_EQ(g.node(3).degree(), 1);
}

TEST(GraphModel, RemoveMissingElementsThrowNotFound) {
  Graph g = make_abcd_chain();
  EXPECT_THROW(g.remove_node(99), NotFound);
  EXPECT_THROW(g.remove_edge(99), NotFound);
  EXPECT_THROW(g.remove_edge(1, 3), NotFound);
  EXPECT_THROW((void)g.edge(99), NotFound);
  EXPECT_EQ(g.num_nodes(), 4u);
  EXPECT_EQ(g.num_edges(), 3u);
}

TEST(GraphModel, NeighborsAndIterationAreOrdered) {
  Graph g;
  for (NodeId id : {5, 3, 9, 1}) g.add_node(id);
  g.add_edge(5, 9);
  g.add_edge(5, 1);
  g.add_edge(3, 5);
  EXPECT_EQ(g.node_ids(), (std::vector<NodeId>{1, 3, 5, 9}));
  EXPECT_EQ(g.neighbors(5), (std::vector<NodeId>{1, 3, 9}));
  EXPECT_EQ(g.incident_edges(5).size(), 3u);
  auto eids = g.edge_ids();
  EXPECT_TRUE(std::is_sorted(eids.begin(), eids.end()));
  EXPECT_THROW((void)g.neighbors(42), UnknownNode);
}

TEST(GraphModel, ResourceSettersClamp) {
  Graph g;
  g.add_node(1, NodeSpec{5.0, 10.0, NodeKind::Intermediate});
  EXPECT_DOUBLE_EQ(g.set_node_resource(1, 25.0), 10.0);
  EXPECT_DOUBLE_EQ(g.set_node_resource(1, -3.0), 0.0);
  g.set_node_resource(1, 4.0);
  EXPECT_DOUBLE_EQ(g.adjust_node_resource(1, 3.0), 3.0);
  EXPECT_DOUBLE_EQ(g.adjust_node_resource(1, 100.0), 3.0);
  EXPECT_DOUBLE_EQ(g.node(1).resource_level, 10.0);
  EXPECT_DOUBLE_EQ(g.adjust_node_resource(1, -15.0), -10.0);
  EXPECT_DOUBLE_EQ(g.node(1).resource_level, 0.0);
  EXPECT_THROW(g.set_node_resource(1, std::nan("")), InvalidArgument);
  EXPECT_THROW(g.adjust_node_resource(2, 1.0), UnknownNode);
}

TEST(GraphModel, DamagingNodeDamagesIncidentEdges) {
  Graph g = make_abcd_chain();
  g.set_node_health(2, Health::Damaged);
  EXPECT_FALSE(g.node(2).healthy());
  EXPECT_FALSE(g.edge(*g.find_edge(1, 2)).healthy());
  EXPECT_FALSE(g.edge(*g.find_edge(2, 3)).healthy());
  EXPECT_TRUE(g.edge(*g.find_edge(3, 4)).healthy());

  // Healing the node leaves its edges damaged until restored explicitly.
  g.set_node_health(2, Health::Healthy);
  EXPECT_TRUE(g.node(2).healthy());
  EXPECT_FALSE(g.edge(*g.find_edge(1, 2)).healthy());
  g.set_edge_health(*g.find_edge(1, 2), Health::Healthy);
  EXPECT_TRUE(g.edge(*g.find_edge(1, 2)).healthy());
}

TEST(GraphModel, EdgeHealthRespectsEndpoints) {
  Graph g = make_abcd_chain();
  g.set_node_health(2, Health::Damaged);
  const auto e12 = *g.find_edge(1, 2);
  EXPECT_THROW(g.set_edge_health(e12, Health::Healthy), InvalidArgument);
  EXPECT_FALSE(g.edge(e12).healthy());

  // New edges touching a damaged node are born damaged.
  auto e24 = g.add_edge(2, 4);
  EXPECT_FALSE(g.edge(e24).healthy());
}

TEST(GraphModel, UsageAndReinforcement) {
  Graph g = make_abcd_chain();
  const auto e = *g.find_edge(1, 2);
  g.record_usage(e);
  g.record_usage(e, 4);
  EXPECT_EQ(g.edge(e).usage_count, 5u);

  g.set_reinforcement(e, 0.5);
  EXPECT_DOUBLE_EQ(g.edge(e).effective_cost(), 0.5);
  EXPECT_THROW(g.set_reinforcement(e, 0.0), InvalidArgument);
  EXPECT_THROW(g.set_reinforcement(e, -1.0), InvalidArgument);
  EXPECT_DOUBLE_EQ(g.edge(e).reinforcement, 0.5);

  g.set_base_cost(e, 4.0);
  EXPECT_DOUBLE_EQ(g.edge(e).effective_cost(), 2.0);
  EXPECT_THROW(g.set_base_cost(e, 0.0), InvalidArgument);
  EXPECT_THROW(g.record_usage(99), NotFound);
}
