#include "route_expander.h"

#include <utility>

namespace route {
    RouteStatus ExpandTour(const tour_t &tour, const PathCache &cache, route_t &result) {
        if (tour.nodes.empty()) {
            return ROUTE_STATUS_ERROR_INVALID_ARG;
        }

        route_t expanded{};
        expanded.nodes.push_back(tour.nodes.front());

        for (size_t i = 1; i < tour.nodes.size(); ++i) {
            const auto path = cache.get(tour.nodes[i - 1], tour.nodes[i]);
            if (!path || path->nodes.empty()) {
                return ROUTE_STATUS_ERROR_INCONSISTENT_CACHE;
            }
            // the first node of the path is the last node already emitted
            expanded.nodes.insert(expanded.nodes.end(), path->nodes.begin() + 1, path->nodes.end());
            expanded.cost += path->cost;
        }

        result = std::move(expanded);
        return ROUTE_STATUS_SUCCESS;
    }
}
