#pragma once

#ifndef __cplusplus
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>
#else
#include <cstdint>
#include <cstddef>
#endif


#define ROUTE_EXPORT extern "C"

typedef enum RouteResult {
    ROUTE_STATUS_SUCCESS = 0, /**< Operation completed successfully. */
    ROUTE_STATUS_ERROR_INVALID_ARG = 1, /**< Invalid argument provided. */
    ROUTE_STATUS_ERROR_DUPLICATE_NODE = 2, /**< A node with the same id already exists. */
    ROUTE_STATUS_ERROR_UNKNOWN_NODE = 3, /**< A referenced node does not exist in the graph. */
    ROUTE_STATUS_ERROR_INVALID_WEIGHT = 4, /**< An edge weight is negative or not finite. */
    ROUTE_STATUS_ERROR_INVALID_EDGE = 5, /**< An edge connects a node to itself. */
    ROUTE_STATUS_ERROR_DUPLICATE_EDGE = 6, /**< The unordered node pair is already connected. */
    ROUTE_STATUS_ERROR_UNREACHABLE = 7, /**< Two nodes that must be connected are not. */
    ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET = 8, /**< The graph has no critical nodes. */
    ROUTE_STATUS_ERROR_INCONSISTENT_CACHE = 9, /**< A path needed for expansion is missing. Indicates a bug. */
    ROUTE_STATUS_ERROR_NO_CANDIDATES = 10, /**< Too few hallway nodes to connect an isolated node. */
    ROUTE_STATUS_OUT_OF_MEMORY = 11, /**< Out of memory. */
    ROUTE_STATUS_ERROR_INTERNAL = 12 /**< An internal error occurred. */
} RouteStatus;

typedef double cost_t;
typedef uint64_t nodeid_t;

/**
 * Opaque handle to a building graph owned by the library.
 */
typedef struct RouteGraph *RouteGraphHandle;

/**
 * Describes a single location in the building.
 */
typedef struct RouteNodeDescriptor {
    /**
     * A unique 64-bit unsigned integer representing the identity of the node.
     */
    nodeid_t id = 0;

    /**
     * Euclidean coordinates of the node. z is the elevation of the node's floor.
     */
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    /**
     * Whether the route must visit this node.
     */
    bool is_critical = false;
} RouteNodeDescriptor;

/**
 * The tour strategy used on the reduced graph.
 */
typedef enum RouteStrategy {
    /**
     * Enumerates every ordering of the critical nodes. Optimal, factorial time.
     */
    ROUTE_STRATEGY_EXACT = 0,

    /**
     * Repeatedly travels to the nearest unvisited critical node.
     */
    ROUTE_STRATEGY_GREEDY = 1,

    /**
     * Uses the exact strategy up to exact_upper_bound tour nodes and the greedy strategy above it.
     */
    ROUTE_STRATEGY_AUTO = 2
} RouteStrategy;

/**
 * The type of solution returned by the solver
 */
typedef enum RouteSolutionType {
    /**
     * The visiting order is optimal.
     */
    ROUTE_SOLUTION_TYPE_OPTIMAL = 0,

    /**
     * The visiting order is approximate.
     */
    ROUTE_SOLUTION_TYPE_APPROXIMATE = 1
} RouteSolutionType;

/**
 * Solver configuration descriptor.
 */
typedef struct RouteSolverOptionsDescriptor {
    /**
     * Which tour strategy to use.
     */
    RouteStrategy strategy = ROUTE_STRATEGY_AUTO;

    /**
     * Whether the route returns to the start node after the last critical node.
     */
    bool closed_tour = true;

    /**
     * Upper bound for the number of tour nodes (critical nodes plus the start node) for which
     * the exact strategy is attempted. Requesting ROUTE_STRATEGY_EXACT above it is an error.
     */
    size_t exact_upper_bound = 10;

    /**
     * Number of worker threads used for the pairwise path searches and the exact strategy.
     */
    uint32_t num_threads = 1;

    /**
     * Print a summary line per pipeline stage to stdout.
     */
    bool verbose = false;
} RouteSolverOptionsDescriptor;

typedef struct RouteSolutionDescriptor {
    /**
     * The walk through the building as an array of node IDs. Every consecutive pair is an edge of the graph.
     * For a closed tour the last element equals the first.
     */
    nodeid_t *route{};

    /**
     * The number of elements in the route array.
     */
    size_t num_nodes{};

    /**
     * The sum of the weights of the traversed edges.
     */
    cost_t route_cost{};

    /**
     * The number of critical nodes visited by the route.
     */
    size_t num_stops{};

    /**
     * The type of the solution.
     */
    RouteSolutionType solution_type{};
} RouteSolutionDescriptor;

/**
 * Converts a route into walking time.
 */
typedef struct RouteTimingDescriptor {
    /**
     * Euclidean distance units walked per second.
     */
    double units_per_second = 360.55 / 120.0;

    /**
     * Seconds spent at each critical stop.
     */
    double dwell_seconds = 90.0;
} RouteTimingDescriptor;

/**
 * Creates an empty building graph.
 * @param graph receives the new graph handle
 * @return the result status of the operation
 */
ROUTE_EXPORT RouteStatus routeGraphCreate(RouteGraphHandle *graph);

/**
 * Releases a graph created by routeGraphCreate. Passing nullptr is a no-op.
 */
ROUTE_EXPORT void routeGraphDestroy(RouteGraphHandle graph);

/**
 * Adds a node to the graph.
 * @return ROUTE_STATUS_ERROR_DUPLICATE_NODE if the id is already present
 */
ROUTE_EXPORT RouteStatus routeGraphAddNode(RouteGraphHandle graph, const RouteNodeDescriptor *node);

/**
 * Adds an undirected edge between two existing nodes.
 * @return ROUTE_STATUS_ERROR_UNKNOWN_NODE, ROUTE_STATUS_ERROR_INVALID_WEIGHT, ROUTE_STATUS_ERROR_INVALID_EDGE or
 * ROUTE_STATUS_ERROR_DUPLICATE_EDGE on invalid input
 */
ROUTE_EXPORT RouteStatus routeGraphAddEdge(RouteGraphHandle graph, nodeid_t a, nodeid_t b, cost_t weight);

/**
 * Adds an undirected edge weighted by the straight-line distance between its endpoints.
 */
ROUTE_EXPORT RouteStatus routeGraphAddEuclideanEdge(RouteGraphHandle graph, nodeid_t a, nodeid_t b);

/**
 * Connects every critical node without edges to the hallway network by projecting it onto the segment between
 * its two nearest connected non-critical nodes on the same floor.
 * @param graph the graph to modify
 * @param num_added_nodes optional, receives the number of projection nodes added
 * @return the result status of the operation
 */
ROUTE_EXPORT RouteStatus routeGraphConnectIsolated(RouteGraphHandle graph, size_t *num_added_nodes);

/**
 * Computes a route from start that visits every critical node of the graph.
 * @param graph the input graph
 * @param start the node the route starts at. It does not need to be critical.
 * @param solver_options options to configure the solver
 * @param output_descriptor the output descriptor to write the route to
 * @return the result status of the operation
 */
ROUTE_EXPORT RouteStatus routeComputeRoute(RouteGraphHandle graph,
                                           nodeid_t start,
                                           const RouteSolverOptionsDescriptor *solver_options,
                                           RouteSolutionDescriptor *output_descriptor);

/**
 * Releases the route array of a solution written by routeComputeRoute.
 */
ROUTE_EXPORT void routeDisposeRoute(RouteSolutionDescriptor *solution);

/**
 * Estimates the time needed to walk a route and serve each of its stops.
 * @param solution a solution written by routeComputeRoute
 * @param timing walking speed and dwell time
 * @param seconds receives the estimate
 * @return the result status of the operation
 */
ROUTE_EXPORT RouteStatus routeEstimateTravelTime(const RouteSolutionDescriptor *solution,
                                                 const RouteTimingDescriptor *timing,
                                                 double *seconds);

/**
 * Returns a static, human-readable description of a status code.
 */
ROUTE_EXPORT const char *routeStatusString(RouteStatus status);
