#pragma once

#include "graph.h"

#include <cstdint>
#include <vector>

namespace route {
    /**
     * A walk through the original graph. Consecutive nodes are joined by an edge and cost is the sum of the
     * traversed edge weights.
     */
    struct path_t {
        std::vector<nodeid_t> nodes{};
        cost_t cost = 0;

        [[nodiscard]] nodeid_t source() const {
            return nodes.front();
        }

        [[nodiscard]] nodeid_t destination() const {
            return nodes.back();
        }

        /// The same walk in the opposite direction. The cost is carried over unchanged.
        [[nodiscard]] path_t reversed() const {
            return path_t{std::vector(nodes.rbegin(), nodes.rend()), cost};
        }
    };

    /// Counters of the last search, for diagnostics and benchmarks.
    struct search_stats_t {
        uint64_t num_pushed = 0;
        uint64_t num_expanded = 0;
    };

    /**
     * A* search from source to destination using the straight-line distance to the destination as heuristic.
     *
     * The heuristic is admissible as long as no edge is cheaper than the straight-line distance between its
     * endpoints, which holds for physical distances. Frontier ties are broken by insertion order.
     *
     * @param graph the graph to search
     * @param source the node to start from
     * @param destination the node to reach
     * @param path receives the shortest path on success
     * @param stats optional search counters
     * @return ROUTE_STATUS_ERROR_UNKNOWN_NODE if an endpoint is missing, ROUTE_STATUS_ERROR_UNREACHABLE if no path
     * exists
     */
    RouteStatus ShortestPath(const Graph &graph,
                             nodeid_t source,
                             nodeid_t destination,
                             path_t &path,
                             search_stats_t *stats = nullptr);
}
