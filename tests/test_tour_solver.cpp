#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "graph_reducer.h"
#include "tour_solver.h"

using route::node_cost_idx;
using route::ReducedGraph;
using route::tour_t;

// Helper function to build a reduced graph from a vector of triples (a, b, cost).
static ReducedGraph createReducedGraph(const std::vector<nodeid_t> &nodes,
                                       const std::vector<std::tuple<nodeid_t, nodeid_t, cost_t>> &edges) {
    ReducedGraph reduced{};
    EXPECT_EQ(ReducedGraph::Create(nodes, reduced), ROUTE_STATUS_SUCCESS);
    for (const auto &[a, b, cost]: edges) {
        reduced.set_cost(*reduced.index_of(a), *reduced.index_of(b), cost);
    }
    return reduced;
}

// A complete graph over ids 1..n with random symmetric costs.
static ReducedGraph createRandomReducedGraph(const size_t n, const uint64_t seed) {
    std::mt19937_64 rng{seed};
    std::uniform_real_distribution dist(1.0, 100.0);
    std::vector<nodeid_t> nodes{};
    for (nodeid_t id = 1; id <= n; ++id) {
        nodes.push_back(id);
    }
    ReducedGraph reduced{};
    EXPECT_EQ(ReducedGraph::Create(nodes, reduced), ROUTE_STATUS_SUCCESS);
    for (node_cost_idx i = 0; i < static_cast<node_cost_idx>(n); ++i) {
        for (node_cost_idx j = i + 1; j < static_cast<node_cost_idx>(n); ++j) {
            reduced.set_cost(i, j, dist(rng));
        }
    }
    return reduced;
}

static RouteSolverOptionsDescriptor options(const RouteStrategy strategy, const bool closed = true) {
    RouteSolverOptionsDescriptor solver_options{};
    solver_options.strategy = strategy;
    solver_options.closed_tour = closed;
    return solver_options;
}

// The 4-cycle with diagonals: A-B=1, B-C=1, C-D=1, A-D=1, A-C=2, B-D=2.
static ReducedGraph createSquare() {
    return createReducedGraph({1, 2, 3, 4}, {
                                  {1, 2, 1.0}, {2, 3, 1.0}, {3, 4, 1.0}, {1, 4, 1.0},
                                  {1, 3, 2.0}, {2, 4, 2.0}
                              });
}

// Checks that the tour starts at start, visits every node exactly once and closes when asked to.
static void expectFeasibleTour(const ReducedGraph &reduced, const tour_t &tour, const nodeid_t start) {
    ASSERT_FALSE(tour.nodes.empty());
    EXPECT_EQ(tour.nodes.front(), start);
    std::vector visits = tour.nodes;
    if (tour.closed && reduced.num_nodes() > 1) {
        ASSERT_EQ(tour.nodes.size(), reduced.num_nodes() + 1);
        EXPECT_EQ(tour.nodes.back(), start);
        visits.pop_back();
    } else {
        ASSERT_EQ(tour.nodes.size(), reduced.num_nodes());
    }
    const std::unordered_set<nodeid_t> distinct(visits.begin(), visits.end());
    EXPECT_EQ(distinct.size(), reduced.num_nodes()) << "Tour revisits a node";
    for (const auto id: reduced.nodes()) {
        EXPECT_TRUE(distinct.contains(id)) << "Tour misses node " << id;
    }
}

TEST(TourSolverTest, SquareWithDiagonals) {
    const ReducedGraph reduced = createSquare();
    for (const auto strategy: {ROUTE_STRATEGY_EXACT, ROUTE_STRATEGY_GREEDY}) {
        tour_t tour{};
        ASSERT_EQ(route::SolveTour(reduced, 1, options(strategy), tour), ROUTE_STATUS_SUCCESS);
        EXPECT_EQ(tour.nodes, (std::vector<nodeid_t>{1, 2, 3, 4, 1}));
        EXPECT_DOUBLE_EQ(tour.cost, 4.0);
    }
}

TEST(TourSolverTest, SolutionTypeFollowsStrategy) {
    const ReducedGraph reduced = createSquare();
    tour_t exact{};
    ASSERT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_EXACT), exact), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(exact.solution_type, ROUTE_SOLUTION_TYPE_OPTIMAL);

    tour_t greedy{};
    ASSERT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_GREEDY), greedy), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(greedy.solution_type, ROUTE_SOLUTION_TYPE_APPROXIMATE);

    tour_t automatic{};
    ASSERT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_AUTO), automatic), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(automatic.solution_type, ROUTE_SOLUTION_TYPE_OPTIMAL);
}

TEST(TourSolverTest, EmptyGraph) {
    const ReducedGraph reduced = createReducedGraph({}, {});
    tour_t tour{};
    EXPECT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_EXACT), tour),
              ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET);
    EXPECT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_GREEDY), tour),
              ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET);
}

TEST(TourSolverTest, StartNotInGraph) {
    const ReducedGraph reduced = createSquare();
    tour_t tour{};
    EXPECT_EQ(route::SolveTour(reduced, 7, options(ROUTE_STRATEGY_GREEDY), tour), ROUTE_STATUS_ERROR_UNKNOWN_NODE);
}

TEST(TourSolverTest, SingleNode) {
    const ReducedGraph reduced = createReducedGraph({5}, {});
    for (const bool closed: {true, false}) {
        tour_t tour{};
        ASSERT_EQ(route::SolveTour(reduced, 5, options(ROUTE_STRATEGY_EXACT, closed), tour), ROUTE_STATUS_SUCCESS);
        EXPECT_EQ(tour.nodes, (std::vector<nodeid_t>{5}));
        EXPECT_DOUBLE_EQ(tour.cost, 0.0);
    }
}

TEST(TourSolverTest, TwoNodesRoundTrip) {
    const ReducedGraph reduced = createReducedGraph({1, 2}, {{1, 2, 10.0}});
    tour_t closed{};
    ASSERT_EQ(route::SolveTour(reduced, 2, options(ROUTE_STRATEGY_EXACT), closed), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(closed.nodes, (std::vector<nodeid_t>{2, 1, 2}));
    EXPECT_DOUBLE_EQ(closed.cost, 20.0);

    tour_t open{};
    ASSERT_EQ(route::SolveTour(reduced, 2, options(ROUTE_STRATEGY_EXACT, false), open), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(open.nodes, (std::vector<nodeid_t>{2, 1}));
    EXPECT_DOUBLE_EQ(open.cost, 10.0);
}

TEST(TourSolverTest, OpenTourEndsAnywhere) {
    // A corridor 1 - 2 - 3 - 4 where walking back is expensive. The open tour from 1 ends at 4,
    // the closed tour has to pay for the return.
    const ReducedGraph reduced = createReducedGraph({1, 2, 3, 4}, {
                                                        {1, 2, 1.0}, {2, 3, 1.0}, {3, 4, 1.0},
                                                        {1, 3, 2.0}, {2, 4, 2.0}, {1, 4, 3.0}
                                                    });
    tour_t open{};
    ASSERT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_EXACT, false), open), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(open.nodes, (std::vector<nodeid_t>{1, 2, 3, 4}));
    EXPECT_DOUBLE_EQ(open.cost, 3.0);

    tour_t closed{};
    ASSERT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_EXACT), closed), ROUTE_STATUS_SUCCESS);
    EXPECT_DOUBLE_EQ(closed.cost, 6.0);
}

TEST(TourSolverTest, ExactTiesKeepFirstPermutation) {
    // Every tour costs the same, so the first permutation in lexicographic order wins.
    std::vector<std::tuple<nodeid_t, nodeid_t, cost_t>> edges{};
    for (nodeid_t a = 1; a <= 5; ++a) {
        for (nodeid_t b = a + 1; b <= 5; ++b) {
            edges.emplace_back(a, b, 2.5);
        }
    }
    const ReducedGraph reduced = createReducedGraph({1, 2, 3, 4, 5}, edges);
    tour_t tour{};
    ASSERT_EQ(route::SolveTour(reduced, 3, options(ROUTE_STRATEGY_EXACT), tour), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(tour.nodes, (std::vector<nodeid_t>{3, 1, 2, 4, 5, 3}));

    // greedy prefers the smaller id on ties as well
    tour_t greedy{};
    ASSERT_EQ(route::SolveTour(reduced, 3, options(ROUTE_STRATEGY_GREEDY), greedy), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(greedy.nodes, (std::vector<nodeid_t>{3, 1, 2, 4, 5, 3}));
}

TEST(TourSolverTest, ExactBeatsEveryPermutation) {
    for (size_t n = 2; n <= 8; ++n) {
        for (const bool closed: {true, false}) {
            SCOPED_TRACE("n = " + std::to_string(n) + (closed ? " closed" : " open"));
            const ReducedGraph reduced = createRandomReducedGraph(n, 1000 + n);

            std::vector<node_cost_idx> order{};
            ASSERT_EQ(route::SolveTourExact(reduced, 0, closed, 1, order), ROUTE_STATUS_SUCCESS);
            const cost_t exact_cost = route::ComputeTourCost(order, reduced, closed);

            std::vector<node_cost_idx> permutation(n);
            for (size_t i = 0; i < n; ++i) {
                permutation[i] = static_cast<node_cost_idx>(i);
            }
            do {
                EXPECT_LE(exact_cost, route::ComputeTourCost(permutation, reduced, closed));
            } while (std::next_permutation(permutation.begin() + 1, permutation.end()));
        }
    }
}

TEST(TourSolverTest, GreedyIsFeasibleAndNeverBeatsExact) {
    for (uint64_t seed = 1; seed <= 10; ++seed) {
        SCOPED_TRACE("seed " + std::to_string(seed));
        const ReducedGraph reduced = createRandomReducedGraph(7, seed);
        for (const bool closed: {true, false}) {
            tour_t exact{};
            ASSERT_EQ(route::SolveTour(reduced, 4, options(ROUTE_STRATEGY_EXACT, closed), exact),
                      ROUTE_STATUS_SUCCESS);
            tour_t greedy{};
            ASSERT_EQ(route::SolveTour(reduced, 4, options(ROUTE_STRATEGY_GREEDY, closed), greedy),
                      ROUTE_STATUS_SUCCESS);

            expectFeasibleTour(reduced, exact, 4);
            expectFeasibleTour(reduced, greedy, 4);
            EXPECT_GE(greedy.cost, exact.cost);
        }
    }
}

TEST(TourSolverTest, ShardedExactMatchesSequential) {
    for (uint64_t seed = 1; seed <= 4; ++seed) {
        SCOPED_TRACE("seed " + std::to_string(seed));
        const ReducedGraph reduced = createRandomReducedGraph(8, seed);
        std::vector<node_cost_idx> sequential{};
        ASSERT_EQ(route::SolveTourExact(reduced, 2, true, 1, sequential), ROUTE_STATUS_SUCCESS);
        std::vector<node_cost_idx> sharded{};
        ASSERT_EQ(route::SolveTourExact(reduced, 2, true, 4, sharded), ROUTE_STATUS_SUCCESS);
        EXPECT_EQ(sharded, sequential);
    }

    // ties must resolve the same way as well
    std::vector<std::tuple<nodeid_t, nodeid_t, cost_t>> edges{};
    for (nodeid_t a = 1; a <= 6; ++a) {
        for (nodeid_t b = a + 1; b <= 6; ++b) {
            edges.emplace_back(a, b, 1.0);
        }
    }
    const ReducedGraph uniform = createReducedGraph({1, 2, 3, 4, 5, 6}, edges);
    std::vector<node_cost_idx> sharded{};
    ASSERT_EQ(route::SolveTourExact(uniform, 0, true, 3, sharded), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(sharded, (std::vector<node_cost_idx>{0, 1, 2, 3, 4, 5}));
}

TEST(TourSolverTest, ExactUpperBound) {
    const ReducedGraph reduced = createRandomReducedGraph(6, 7);
    RouteSolverOptionsDescriptor solver_options = options(ROUTE_STRATEGY_EXACT);
    solver_options.exact_upper_bound = 5;

    tour_t tour{};
    EXPECT_EQ(route::SolveTour(reduced, 1, solver_options, tour), ROUTE_STATUS_ERROR_INVALID_ARG);

    // auto falls back to the greedy strategy above the bound
    solver_options.strategy = ROUTE_STRATEGY_AUTO;
    ASSERT_EQ(route::SolveTour(reduced, 1, solver_options, tour), ROUTE_STATUS_SUCCESS);
    EXPECT_EQ(tour.solution_type, ROUTE_SOLUTION_TYPE_APPROXIMATE);
    expectFeasibleTour(reduced, tour, 1);
}

TEST(TourSolverTest, MissingEdgeIsUnreachable) {
    // 1 - 3 was never set, so no tour exists.
    const ReducedGraph reduced = createReducedGraph({1, 2, 3}, {{1, 2, 1.0}, {2, 3, 1.0}});
    tour_t tour{};
    EXPECT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_EXACT), tour), ROUTE_STATUS_ERROR_UNREACHABLE);
    EXPECT_EQ(route::SolveTour(reduced, 1, options(ROUTE_STRATEGY_GREEDY), tour), ROUTE_STATUS_ERROR_UNREACHABLE);
}
