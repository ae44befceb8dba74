#include <libroute.h>

#include "graph.h"
#include "graph_reducer.h"
#include "path_cache.h"
#include "route_expander.h"
#include "tour_solver.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <new>

struct RouteGraph {
    route::Graph graph;
};

namespace {
    /// Runs fn, reporting allocation failure as a status since exceptions must not cross the C API.
    template<typename Fn>
    RouteStatus CatchOutOfMemory(Fn &&fn) {
        try {
            return fn();
        } catch (const std::bad_alloc &) {
            return ROUTE_STATUS_OUT_OF_MEMORY;
        }
    }

    [[nodiscard]] const char *StrategyName(const RouteSolutionType solution_type) {
        return solution_type == ROUTE_SOLUTION_TYPE_OPTIMAL ? "exact" : "greedy";
    }

    RouteStatus ComputeRoute(const route::Graph &graph,
                             const nodeid_t start,
                             const RouteSolverOptionsDescriptor &solver_options,
                             RouteSolutionDescriptor &output_descriptor) {
        if (!graph.contains(start)) {
            return ROUTE_STATUS_ERROR_UNKNOWN_NODE;
        }
        const std::vector<nodeid_t> critical = graph.critical_nodes();
        if (critical.empty()) {
            return ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET;
        }

        // the start node anchors the tour even when it is not critical itself
        std::vector<nodeid_t> tour_nodes = critical;
        if (!std::ranges::binary_search(critical, start)) {
            tour_nodes.push_back(start);
        }

        // the cache lives exactly as long as this request
        route::PathCache cache{};

        route::ReducedGraph reduced{};
        if (const auto status = route::Reduce(graph, tour_nodes, cache, solver_options.num_threads, reduced);
            status != ROUTE_STATUS_SUCCESS) {
            return status;
        }
        if (solver_options.verbose) {
            std::cout << "[route] reduced graph: " << reduced.num_nodes() << " nodes, "
                    << reduced.num_edges() << " edges, " << cache.size() << " cached paths" << std::endl;
        }
#ifdef ROUTE_IS_DEBUG
        route::PrintReducedGraph(reduced);
#endif

        route::tour_t tour{};
        if (const auto status = route::SolveTour(reduced, start, solver_options, tour);
            status != ROUTE_STATUS_SUCCESS) {
            return status;
        }
        if (solver_options.verbose) {
            std::cout << "[route] " << ::StrategyName(tour.solution_type) << " tour over "
                    << reduced.num_nodes() << " nodes, cost " << tour.cost << std::endl;
        }

        route::route_t expanded{};
        if (const auto status = route::ExpandTour(tour, cache, expanded); status != ROUTE_STATUS_SUCCESS) {
            return status;
        }
#ifdef ROUTE_IS_DEBUG
        assert(expanded.cost == tour.cost);
#endif
        if (solver_options.verbose) {
            std::cout << "[route] expanded route: " << expanded.nodes.size() << " nodes, cost "
                    << expanded.cost << std::endl;
        }

        auto *route_ids = new(std::nothrow) nodeid_t[expanded.nodes.size()];
        if (!route_ids) {
            return ROUTE_STATUS_OUT_OF_MEMORY;
        }
        std::ranges::copy(expanded.nodes, route_ids);

        output_descriptor.route = route_ids;
        output_descriptor.num_nodes = expanded.nodes.size();
        output_descriptor.route_cost = expanded.cost;
        output_descriptor.num_stops = critical.size();
        output_descriptor.solution_type = tour.solution_type;
        return ROUTE_STATUS_SUCCESS;
    }
}

RouteStatus routeGraphCreate(RouteGraphHandle *graph) {
    if (graph == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    *graph = new(std::nothrow) RouteGraph{};
    if (*graph == nullptr) {
        return ROUTE_STATUS_OUT_OF_MEMORY;
    }
    return ROUTE_STATUS_SUCCESS;
}

void routeGraphDestroy(RouteGraphHandle graph) {
    delete graph;
}

RouteStatus routeGraphAddNode(RouteGraphHandle graph, const RouteNodeDescriptor *node) {
    if (graph == nullptr || node == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    if (!std::isfinite(node->x) || !std::isfinite(node->y) || !std::isfinite(node->z)) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    return ::CatchOutOfMemory([&] {
        return graph->graph.add_node(route::node_t{
            .id = node->id,
            .x = node->x,
            .y = node->y,
            .z = node->z,
            .is_critical = node->is_critical
        });
    });
}

RouteStatus routeGraphAddEdge(RouteGraphHandle graph, const nodeid_t a, const nodeid_t b, const cost_t weight) {
    if (graph == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    return ::CatchOutOfMemory([&] {
        return graph->graph.add_edge(a, b, weight);
    });
}

RouteStatus routeGraphAddEuclideanEdge(RouteGraphHandle graph, const nodeid_t a, const nodeid_t b) {
    if (graph == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    return ::CatchOutOfMemory([&] {
        return graph->graph.add_euclidean_edge(a, b);
    });
}

RouteStatus routeGraphConnectIsolated(RouteGraphHandle graph, size_t *num_added_nodes) {
    if (graph == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    return ::CatchOutOfMemory([&] {
        size_t added = 0;
        const RouteStatus status = route::ConnectIsolatedNodes(graph->graph, added);
        if (num_added_nodes != nullptr) {
            *num_added_nodes = added;
        }
        return status;
    });
}

RouteStatus routeComputeRoute(RouteGraphHandle graph,
                              const nodeid_t start,
                              const RouteSolverOptionsDescriptor *solver_options,
                              RouteSolutionDescriptor *output_descriptor) {
    if (graph == nullptr || output_descriptor == nullptr || solver_options == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    return ::CatchOutOfMemory([&] {
        return ::ComputeRoute(graph->graph, start, *solver_options, *output_descriptor);
    });
}

void routeDisposeRoute(RouteSolutionDescriptor *solution) {
    if (solution == nullptr) {
        return;
    }
    delete[] solution->route;
    solution->route = nullptr;
    solution->num_nodes = 0;
}

RouteStatus routeEstimateTravelTime(const RouteSolutionDescriptor *solution,
                                    const RouteTimingDescriptor *timing,
                                    double *seconds) {
    if (solution == nullptr || timing == nullptr || seconds == nullptr) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    if (!std::isfinite(timing->units_per_second) || timing->units_per_second <= 0) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    if (!std::isfinite(timing->dwell_seconds) || timing->dwell_seconds < 0) {
        return ROUTE_STATUS_ERROR_INVALID_ARG;
    }
    *seconds = static_cast<double>(solution->num_stops) * timing->dwell_seconds
               + solution->route_cost / timing->units_per_second;
    return ROUTE_STATUS_SUCCESS;
}

const char *routeStatusString(const RouteStatus status) {
    switch (status) {
        case ROUTE_STATUS_SUCCESS:
            return "success";
        case ROUTE_STATUS_ERROR_INVALID_ARG:
            return "invalid argument";
        case ROUTE_STATUS_ERROR_DUPLICATE_NODE:
            return "duplicate node";
        case ROUTE_STATUS_ERROR_UNKNOWN_NODE:
            return "unknown node";
        case ROUTE_STATUS_ERROR_INVALID_WEIGHT:
            return "invalid edge weight";
        case ROUTE_STATUS_ERROR_INVALID_EDGE:
            return "self-loop edge";
        case ROUTE_STATUS_ERROR_DUPLICATE_EDGE:
            return "duplicate edge";
        case ROUTE_STATUS_ERROR_UNREACHABLE:
            return "critical node unreachable";
        case ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET:
            return "no critical nodes";
        case ROUTE_STATUS_ERROR_INCONSISTENT_CACHE:
            return "path cache inconsistent with tour";
        case ROUTE_STATUS_ERROR_NO_CANDIDATES:
            return "not enough hallway nodes to connect an isolated node";
        case ROUTE_STATUS_OUT_OF_MEMORY:
            return "out of memory";
        case ROUTE_STATUS_ERROR_INTERNAL:
            return "internal error";
    }
    return "unknown status";
}
