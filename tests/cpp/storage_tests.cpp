#include <gtest/gtest.h>
#include <stdexcept>
#include "mycelium/core/graph.hpp"
#include "mycelium/core/repair.hpp"
#include "mycelium/core/storage.hpp"
#include "test_utils.hpp"

using namespace mycelium::core;
using namespace mycelium::core::test;

namespace {

class ThrowingStorage final : public StorageBackend {
public:
  void upsert_node(NodeId, const NodeAttributes&) override { ++calls; throw std::runtime_error("store offline"); }
  void upsert_edge(EdgeEndpoints, const EdgeAttributes&) override { ++calls; throw std::runtime_error("store offline"); }
  void delete_node(NodeId) override { ++calls; throw std::runtime_error("store offline"); }
  void delete_edge(EdgeEndpoints) override { ++calls; throw std::runtime_error("store offline"); }
  int calls { 0 };
};

} // namespace

TEST(Storage, MirrorsStructuralMutations) {
  auto store = make_memory_storage();
  Graph g;
  g.attach_storage(store);
  g.add_node(1, NodeSpec{3.0, 10.0, NodeKind::Source});
  g.add_node(2);
  g.add_node(3);
  auto e = g.add_edge(2, 1, EdgeSpec{2.0, 4.0, false});
  g.add_edge(2, 3);
  EXPECT_EQ(store->node_count(), 3u);
  EXPECT_EQ(store->edge_count(), 2u);

  auto n1 = store->node(1);
  ASSERT_TRUE(n1.has_value());
  EXPECT_DOUBLE_EQ(n1->resource_level, 3.0);
  EXPECT_EQ(n1->kind, NodeKind::Source);

  auto e12 = store->edge(EdgeEndpoints{1, 2});
  ASSERT_TRUE(e12.has_value());
  EXPECT_EQ(e12->id, e);
  EXPECT_DOUBLE_EQ(e12->base_cost, 2.0);
  EXPECT_DOUBLE_EQ(e12->capacity, 4.0);

  g.remove_edge(e);
  EXPECT_FALSE(store->edge(EdgeEndpoints{1, 2}).has_value());
  g.remove_node(3);
  EXPECT_FALSE(store->node(3).has_value());
  EXPECT_EQ(store->edge_count(), 0u);
}

TEST(Storage, MirroredDegreeTracksEdgeChanges) {
  auto store = make_memory_storage();
  Graph g;
  g.attach_storage(store);
  g.add_node(1);
  g.add_node(2);
  g.add_node(3);
  ASSERT_TRUE(store->node(1).has_value());
  EXPECT_EQ(store->node(1)->degree, 0);

  auto e12 = g.add_edge(1, 2);
  g.add_edge(1, 3);
  EXPECT_EQ(store->node(1)->degree, g.node(1).degree());
  EXPECT_EQ(store->node(1)->degree, 2);
  EXPECT_EQ(store->node(2)->degree, 1);
  EXPECT_EQ(store->node(3)->degree, 1);

  g.remove_edge(e12);
  EXPECT_EQ(store->node(1)->degree, 1);
  EXPECT_EQ(store->node(2)->degree, 0);
}

TEST(Storage, MirrorsHealthChanges) {
  auto store = make_memory_storage();
  Graph g = make_abcd_chain();
  g.attach_storage(store);
  g.set_node_health(2, Health::Damaged);
  ASSERT_TRUE(store->node(2).has_value());
  EXPECT_EQ(store->node(2)->health, Health::Damaged);
  ASSERT_TRUE(store->edge(EdgeEndpoints{1, 2}).has_value());
  EXPECT_EQ(store->edge(EdgeEndpoints{1, 2})->health, Health::Damaged);
  EXPECT_EQ(store->edge(EdgeEndpoints{2, 3})->health, Health::Damaged);
  EXPECT_FALSE(store->edge(EdgeEndpoints{3, 4}).has_value());
}

TEST(Storage, RepairMirrorsGrownEdges) {
  auto store = make_memory_storage();
  Graph g = make_abcd_chain();
  g.attach_storage(store);
  auto ids = std::vector<NodeId>{2};
  auto r = apply_damage(g, ids);
  ASSERT_FALSE(r.edges_added.empty());
  auto grown = store->edge(EdgeEndpoints{1, 3});
  ASSERT_TRUE(grown.has_value());
  EXPECT_TRUE(grown->grown);
  EXPECT_EQ(grown->health, Health::Healthy);
}

TEST(Storage, BackendFailuresAreLoggedNotPropagated) {
  LogCapture logs(LogLevel::Warning);
  auto store = std::make_shared<ThrowingStorage>();
  Graph g;
  g.attach_storage(store);
  EXPECT_NO_THROW(g.add_node(1));
  EXPECT_NO_THROW(g.add_node(2));
  EdgeId e = -1;
  EXPECT_NO_THROW(e = g.add_edge(1, 2));
  EXPECT_NO_THROW(g.remove_edge(e));
  // Edge add/remove each re-upsert both endpoints.
  EXPECT_EQ(store->calls, 8);
  EXPECT_EQ(logs.count(LogLevel::Warning, "storage"), 8u);
  // In-memory state is authoritative regardless of the store.
  EXPECT_EQ(g.num_nodes(), 2u);
  EXPECT_EQ(g.num_edges(), 0u);
}

TEST(Storage, DetachedGraphDoesNotMirror) {
  auto store = make_memory_storage();
  Graph g;
  g.attach_storage(store);
  g.add_node(1);
  g.attach_storage(nullptr);
  g.add_node(2);
  EXPECT_EQ(store->node_count(), 1u);
  EXPECT_EQ(store->call_count(), 1u);
}
