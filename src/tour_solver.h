#pragma once

#include "graph_reducer.h"

#include <vector>

namespace route {
    /**
     * An order in which to visit the nodes of a reduced graph. The first node is the start node; a closed tour
     * repeats it as the last node.
     */
    struct tour_t {
        std::vector<nodeid_t> nodes{};
        cost_t cost = 0;
        bool closed = true;
        RouteSolutionType solution_type = ROUTE_SOLUTION_TYPE_OPTIMAL;
    };

    /**
     * Returns the sum of the reduced edge weights along the order, including the edge back to order[0] when
     * closed is set.
     */
    [[nodiscard]] cost_t ComputeTourCost(const std::vector<node_cost_idx> &order,
                                         const ReducedGraph &reduced,
                                         bool closed);

    /**
     * Finds the cheapest order by enumerating every permutation of the non-start nodes. Among equal costs the
     * first permutation in lexicographic order wins. With num_threads > 1 the permutations are split by their
     * first node across threads, which yields the same order as the sequential enumeration.
     */
    RouteStatus SolveTourExact(const ReducedGraph &reduced,
                               node_cost_idx start,
                               bool closed,
                               uint32_t num_threads,
                               std::vector<node_cost_idx> &order);

    /**
     * Builds an order by repeatedly moving to the nearest unvisited node, preferring the smaller id on ties.
     */
    RouteStatus SolveTourGreedy(const ReducedGraph &reduced,
                                node_cost_idx start,
                                std::vector<node_cost_idx> &order);

    /**
     * Solves the tour over every node of the reduced graph with the configured strategy.
     * @param reduced the complete graph over the nodes to visit
     * @param start the node the tour starts from
     * @param solver_options strategy, tour shape, exact size limit and thread count
     * @param tour receives the tour on success
     * @return ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET for an empty graph, ROUTE_STATUS_ERROR_UNKNOWN_NODE if start is
     * not part of the graph, ROUTE_STATUS_ERROR_INVALID_ARG if the exact strategy is requested above the limit
     */
    RouteStatus SolveTour(const ReducedGraph &reduced,
                          nodeid_t start,
                          const RouteSolverOptionsDescriptor &solver_options,
                          tour_t &tour);
}
