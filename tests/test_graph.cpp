#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "graph.h"

using route::Graph;
using route::node_t;

// Helper function to add a batch of nodes that all must succeed.
static void addNodes(Graph &graph, const std::vector<node_t> &nodes) {
    for (const auto &node: nodes) {
        ASSERT_EQ(graph.add_node(node), ROUTE_STATUS_SUCCESS) << "Could not add node " << node.id;
    }
}

TEST(GraphTest, DuplicateNode) {
    Graph graph{};
    EXPECT_EQ(graph.add_node({.id = 1}), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(graph.add_node({.id = 1, .x = 5.0}), ROUTE_STATUS_ERROR_DUPLICATE_NODE);
    EXPECT_EQ(graph.num_nodes(), static_cast<size_t>(1));
    // the first declaration is kept
    EXPECT_DOUBLE_EQ(graph.find_node(1)->x, 0.0);
}

TEST(GraphTest, EdgeToUnknownNode) {
    Graph graph{};
    addNodes(graph, {{.id = 1}});
    EXPECT_EQ(graph.add_edge(1, 2, 1.0), ROUTE_STATUS_ERROR_UNKNOWN_NODE);
    EXPECT_EQ(graph.add_edge(2, 1, 1.0), ROUTE_STATUS_ERROR_UNKNOWN_NODE);
    EXPECT_EQ(graph.add_euclidean_edge(1, 3), ROUTE_STATUS_ERROR_UNKNOWN_NODE);
    EXPECT_EQ(graph.num_edges(), static_cast<size_t>(0));
}

TEST(GraphTest, InvalidWeights) {
    Graph graph{};
    addNodes(graph, {{.id = 1}, {.id = 2}});
    EXPECT_EQ(graph.add_edge(1, 2, -1.0), ROUTE_STATUS_ERROR_INVALID_WEIGHT);
    EXPECT_EQ(graph.add_edge(1, 2, std::nan("")), ROUTE_STATUS_ERROR_INVALID_WEIGHT);
    EXPECT_EQ(graph.add_edge(1, 2, INFINITY), ROUTE_STATUS_ERROR_INVALID_WEIGHT);
    // zero is a valid weight, e.g. two doors of the same room
    EXPECT_EQ(graph.add_edge(1, 2, 0.0), ROUTE_STATUS_SUCCESS);
}

TEST(GraphTest, SelfLoopAndParallelEdges) {
    Graph graph{};
    addNodes(graph, {{.id = 1}, {.id = 2}});
    EXPECT_EQ(graph.add_edge(1, 1, 1.0), ROUTE_STATUS_ERROR_INVALID_EDGE);
    EXPECT_EQ(graph.add_edge(1, 2, 3.0), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(graph.add_edge(1, 2, 1.0), ROUTE_STATUS_ERROR_DUPLICATE_EDGE);
    EXPECT_EQ(graph.add_edge(2, 1, 1.0), ROUTE_STATUS_ERROR_DUPLICATE_EDGE);
    EXPECT_EQ(graph.num_edges(), static_cast<size_t>(1));
    EXPECT_DOUBLE_EQ(*graph.edge_weight(2, 1), 3.0);
}

TEST(GraphTest, NeighborsAreUndirectedAndRestartable) {
    Graph graph{};
    addNodes(graph, {{.id = 1}, {.id = 2}, {.id = 3}, {.id = 4}});
    ASSERT_EQ(graph.add_edge(1, 2, 2.0), ROUTE_STATUS_SUCCESS);
    ASSERT_EQ(graph.add_edge(3, 1, 5.0), ROUTE_STATUS_SUCCESS);

    const auto neighbors = graph.neighbors(1);
    ASSERT_EQ(neighbors.size(), static_cast<size_t>(2));
    EXPECT_EQ(neighbors[0].id, static_cast<nodeid_t>(2));
    EXPECT_DOUBLE_EQ(neighbors[0].weight, 2.0);
    EXPECT_EQ(neighbors[1].id, static_cast<nodeid_t>(3));
    EXPECT_DOUBLE_EQ(neighbors[1].weight, 5.0);

    // iterating twice yields the same sequence
    cost_t first_pass = 0;
    cost_t second_pass = 0;
    for (const auto &[id, weight]: graph.neighbors(1)) {
        first_pass += weight;
    }
    for (const auto &[id, weight]: graph.neighbors(1)) {
        second_pass += weight;
    }
    EXPECT_DOUBLE_EQ(first_pass, second_pass);

    ASSERT_EQ(graph.neighbors(3).size(), static_cast<size_t>(1));
    EXPECT_EQ(graph.neighbors(3)[0].id, static_cast<nodeid_t>(1));
    EXPECT_TRUE(graph.neighbors(4).empty());
    EXPECT_TRUE(graph.neighbors(42).empty());
}

TEST(GraphTest, EuclideanEdgeWeight) {
    Graph graph{};
    addNodes(graph, {{.id = 1, .x = 0, .y = 0, .z = 0}, {.id = 2, .x = 3, .y = 4, .z = 12}});
    ASSERT_EQ(graph.add_euclidean_edge(1, 2), ROUTE_STATUS_SUCCESS);
    EXPECT_DOUBLE_EQ(*graph.edge_weight(1, 2), 13.0);
    EXPECT_DOUBLE_EQ(route::EuclideanDistance(*graph.find_node(2), *graph.find_node(1)), 13.0);
}

TEST(GraphTest, CriticalNodesAscending) {
    Graph graph{};
    addNodes(graph, {
                 {.id = 9, .is_critical = true},
                 {.id = 4},
                 {.id = 7, .is_critical = true},
                 {.id = 1, .is_critical = true},
             });
    EXPECT_EQ(graph.critical_nodes(), (std::vector<nodeid_t>{1, 7, 9}));
    EXPECT_EQ(graph.max_node_id(), static_cast<nodeid_t>(9));
    EXPECT_TRUE(graph.contains(4));
    EXPECT_FALSE(graph.contains(5));
    EXPECT_EQ(graph.find_node(5), nullptr);
}
