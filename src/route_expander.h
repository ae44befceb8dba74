#pragma once

#include "path_cache.h"
#include "tour_solver.h"

#include <vector>

namespace route {
    /// A gapless walk through the building graph.
    struct route_t {
        std::vector<nodeid_t> nodes{};
        cost_t cost = 0;
    };

    /**
     * Replaces every hop of the tour by the cached shortest path between its endpoints.
     * The route cost is the sum of the spliced path costs in tour order, which equals the tour cost.
     * @return ROUTE_STATUS_ERROR_INCONSISTENT_CACHE if a hop has no cached path
     */
    RouteStatus ExpandTour(const tour_t &tour, const PathCache &cache, route_t &result);
}
