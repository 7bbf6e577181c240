#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <vector>

#include "graph_model.hpp"
#include "kernel/services/graph_event_service.hpp"

using graphos::EdgeId;
using graphos::GraphErrc;
using graphos::GraphError;
using graphos::GraphEventService;
using graphos::GraphMode;
using graphos::GraphModel;
using graphos::NodeId;
using Kind = GraphEventService::TopologyEvent::Kind;

namespace {

// Every edge is listed under both endpoints and nowhere else.
void expect_adjacency_consistent(const GraphModel& g) {
  std::size_t listed = 0;
  for (NodeId n : g.node_ids()) {
    for (EdgeId e : g.incident_edges(n)) {
      ASSERT_TRUE(g.has_edge(e)) << "dangling edge " << e << " at node " << n;
      EXPECT_TRUE(g.edge(e).touches(n));
      ++listed;
    }
  }
  for (EdgeId e : g.edge_ids()) {
    const auto& edge = g.edge(e);
    ASSERT_TRUE(g.has_node(edge.from));
    ASSERT_TRUE(g.has_node(edge.to));
    EXPECT_EQ(g.incident_edges(edge.from).count(e), 1u);
    EXPECT_EQ(g.incident_edges(edge.to).count(e), 1u);
  }
  EXPECT_EQ(listed, 2 * g.edge_count());
}

}  // namespace

TEST(GraphModelTest, AddEdgeRequiresLiveEndpoints) {
  GraphModel g;
  NodeId a = g.add_node("a");
  try {
    g.add_edge(a, 42);
    FAIL() << "expected GraphError";
  } catch (const GraphError& e) {
    EXPECT_EQ(e.code(), GraphErrc::UnknownNode);
  }
  EXPECT_EQ(g.edge_count(), 0u);
  EXPECT_TRUE(g.incident_edges(a).empty());
}

TEST(GraphModelTest, SelfLoopIsRejected) {
  GraphModel g;
  NodeId a = g.add_node("a");
  try {
    g.add_edge(a, a);
    FAIL() << "expected GraphError";
  } catch (const GraphError& e) {
    EXPECT_EQ(e.code(), GraphErrc::InvalidParameter);
  }
  EXPECT_EQ(g.edge_count(), 0u);
}

TEST(GraphModelTest, RemoveUnknownThrows) {
  GraphModel g;
  EXPECT_THROW(g.remove_node(7), GraphError);
  EXPECT_THROW(g.remove_edge(7), GraphError);
  try {
    g.remove_edge(7);
  } catch (const GraphError& e) {
    EXPECT_EQ(e.code(), GraphErrc::UnknownEdge);
  }
  EXPECT_THROW(g.neighbors(3), GraphError);
}

TEST(GraphModelTest, RemoveNodeRemovesExactlyIncidentEdges) {
  GraphModel g;
  NodeId a = g.add_node("a");
  NodeId b = g.add_node("b");
  NodeId c = g.add_node("c");
  NodeId d = g.add_node("d");
  EdgeId ab = g.add_edge(a, b);
  EdgeId bc = g.add_edge(b, c);
  EdgeId cd = g.add_edge(c, d);
  EdgeId bd = g.add_edge(b, d);

  g.remove_node(b);

  EXPECT_FALSE(g.has_node(b));
  EXPECT_FALSE(g.has_edge(ab));
  EXPECT_FALSE(g.has_edge(bc));
  EXPECT_FALSE(g.has_edge(bd));
  EXPECT_TRUE(g.has_edge(cd));
  EXPECT_EQ(g.edge_count(), 1u);
  EXPECT_EQ(g.neighbors(c), std::vector<NodeId>{d});
  EXPECT_TRUE(g.neighbors(a).empty());
  expect_adjacency_consistent(g);
}

TEST(GraphModelTest, NeighborsAreSortedAndUnique) {
  GraphModel g;
  NodeId a = g.add_node("a");
  NodeId b = g.add_node("b");
  NodeId c = g.add_node("c");
  g.add_edge(a, c);
  g.add_edge(a, b);
  g.add_edge(b, a);  // parallel
  EXPECT_EQ(g.neighbors(a), (std::vector<NodeId>{b, c}));
}

TEST(GraphModelTest, IdsAreNeverReused) {
  GraphModel g;
  NodeId a = g.add_node("a");
  g.remove_node(a);
  NodeId b = g.add_node("b");
  EXPECT_NE(a, b);
  g.clear();
  NodeId c = g.add_node("c");
  EXPECT_NE(c, a);
  EXPECT_NE(c, b);
}

TEST(GraphModelTest, FindEdgeRespectsMode) {
  GraphModel undirected(GraphMode::Undirected);
  NodeId a = undirected.add_node("a");
  NodeId b = undirected.add_node("b");
  EdgeId e = undirected.add_edge(a, b);
  EXPECT_EQ(undirected.find_edge(b, a), e);

  GraphModel directed(GraphMode::Directed);
  NodeId x = directed.add_node("x");
  NodeId y = directed.add_node("y");
  EdgeId xy = directed.add_edge(x, y);
  EXPECT_EQ(directed.find_edge(x, y), xy);
  EXPECT_FALSE(directed.find_edge(y, x).has_value());
}

TEST(GraphModelTest, FindNodeByLabelReturnsLowestId) {
  GraphModel g;
  NodeId first = g.add_node("dup");
  g.add_node("dup");
  EXPECT_EQ(g.find_node_by_label("dup"), first);
  EXPECT_FALSE(g.find_node_by_label("missing").has_value());
}

TEST(GraphModelTest, MutationsEmitTopologyEvents) {
  GraphEventService events;
  GraphModel g(GraphMode::Undirected, &events);
  NodeId a = g.add_node("a");
  NodeId b = g.add_node("b", {3.0, 4.0});
  EdgeId e = g.add_edge(a, b);
  g.set_pinned(a, true);
  g.set_pinned(a, true);  // no change, no event
  g.remove_node(a);

  auto batch = events.drain();
  ASSERT_EQ(batch.size(), 6u);
  EXPECT_EQ(batch[0].kind, Kind::NodeAdded);
  EXPECT_FALSE(batch[0].placed);
  EXPECT_EQ(batch[1].kind, Kind::NodeAdded);
  EXPECT_TRUE(batch[1].placed);
  EXPECT_EQ(batch[2].kind, Kind::EdgeAdded);
  EXPECT_EQ(batch[2].edge, e);
  EXPECT_EQ(batch[3].kind, Kind::PinChanged);
  EXPECT_EQ(batch[4].kind, Kind::EdgeRemoved);
  EXPECT_EQ(batch[5].kind, Kind::NodeRemoved);
  EXPECT_EQ(batch[5].node, a);
  EXPECT_TRUE(events.empty());
}

TEST(GraphModelTest, FailedMutationEmitsNothing) {
  GraphEventService events;
  GraphModel g(GraphMode::Undirected, &events);
  NodeId a = g.add_node("a");
  events.drain();
  EXPECT_THROW(g.add_edge(a, 99), GraphError);
  EXPECT_THROW(g.remove_node(99), GraphError);
  EXPECT_TRUE(events.empty());
}

TEST(GraphModelTest, ClearSelectionReportsWhetherAnythingWasSelected) {
  GraphModel g;
  NodeId a = g.add_node("a");
  EXPECT_FALSE(g.clear_selection());
  g.set_selected(a, true);
  EXPECT_TRUE(g.clear_selection());
  EXPECT_FALSE(g.node(a).state.selected);
}

TEST(GraphModelTest, AdjacencyStaysConsistentUnderRandomMutations) {
  GraphModel g;
  std::mt19937 rng(7);
  auto pick = [&](const std::vector<int>& ids) {
    std::uniform_int_distribution<std::size_t> d(0, ids.size() - 1);
    return ids[d(rng)];
  };

  for (int step = 0; step < 2000; ++step) {
    int op = std::uniform_int_distribution<int>(0, 9)(rng);
    auto nodes = g.node_ids();
    auto edges = g.edge_ids();
    if (op <= 2 || nodes.size() < 2) {
      g.add_node("n" + std::to_string(step));
    } else if (op <= 6) {
      NodeId a = pick(nodes);
      NodeId b = pick(nodes);
      if (a == b) {
        EXPECT_THROW(g.add_edge(a, b), GraphError);
      } else {
        g.add_edge(a, b);
      }
    } else if (op == 7) {
      std::size_t before_nodes = g.node_count();
      NodeId victim = pick(nodes);
      std::size_t incident = g.incident_edges(victim).size();
      std::size_t before_edges = g.edge_count();
      g.remove_node(victim);
      EXPECT_EQ(g.node_count(), before_nodes - 1);
      EXPECT_EQ(g.edge_count(), before_edges - incident);
    } else if (op == 8 && !edges.empty()) {
      g.remove_edge(pick(edges));
    } else {
      // Unknown ids must leave the store untouched.
      std::size_t n = g.node_count();
      std::size_t m = g.edge_count();
      EXPECT_THROW(g.add_edge(pick(nodes), -5), GraphError);
      EXPECT_THROW(g.remove_edge(1000000), GraphError);
      EXPECT_EQ(g.node_count(), n);
      EXPECT_EQ(g.edge_count(), m);
    }
    if (step % 50 == 0) {
      expect_adjacency_consistent(g);
    }
  }
  expect_adjacency_consistent(g);
}
