#include "graph.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
    using route::Graph;
    using route::node_t;

    constexpr double FLOOR_EPSILON = 1e-9;

    [[nodiscard]] bool OnSameFloor(const node_t &a, const node_t &b) {
        return std::abs(a.z - b.z) < FLOOR_EPSILON;
    }

    /**
     * Finds the k hallway nodes nearest to the given node, sorted by distance and then by id.
     * Only connected, non-critical nodes on the same floor at a non-zero distance qualify.
     */
    [[nodiscard]] std::vector<node_t> NearestHallwayNodes(const Graph &graph, const node_t &node, const size_t k) {
        std::vector<node_t> candidates{};
        for (const auto &other: graph.nodes()) {
            if (other.is_critical || graph.degree(other.id) == 0 || !OnSameFloor(node, other)) {
                continue;
            }
            if (route::EuclideanDistance(node, other) == 0) {
                continue;
            }
            candidates.push_back(other);
        }
        std::ranges::sort(candidates, [&node](const node_t &lhs, const node_t &rhs) {
            const cost_t lhs_dist = route::EuclideanDistance(node, lhs);
            const cost_t rhs_dist = route::EuclideanDistance(node, rhs);
            if (lhs_dist != rhs_dist) {
                return lhs_dist < rhs_dist;
            }
            return lhs.id < rhs.id;
        });
        if (candidates.size() > k) {
            candidates.resize(k);
        }
        return candidates;
    }

    /// Orthogonal projection of p onto segment ab, clamped to the segment.
    [[nodiscard]] node_t ProjectOntoSegment(const node_t &a, const node_t &b, const node_t &p) {
        const double abx = b.x - a.x;
        const double aby = b.y - a.y;
        const double abz = b.z - a.z;
        const double length_sq = abx * abx + aby * aby + abz * abz;

        double t = 0.0;
        if (length_sq > 0) {
            t = ((p.x - a.x) * abx + (p.y - a.y) * aby + (p.z - a.z) * abz) / length_sq;
            t = std::clamp(t, 0.0, 1.0);
        }
        return node_t{
            .id = 0,
            .x = a.x + t * abx,
            .y = a.y + t * aby,
            .z = a.z + t * abz,
            .is_critical = false
        };
    }
}

namespace route {
    RouteStatus ConnectIsolatedNodes(Graph &graph, size_t &num_added_nodes) {
        num_added_nodes = 0;

        std::vector<node_t> isolated{};
        for (const auto &node: graph.nodes()) {
            if (node.is_critical && graph.degree(node.id) == 0) {
                isolated.push_back(node);
            }
        }
        std::ranges::sort(isolated, {}, &node_t::id);

        for (const auto &classroom: isolated) {
            const std::vector<node_t> nearest = ::NearestHallwayNodes(graph, classroom, 2);
            if (nearest.size() < 2) {
                return ROUTE_STATUS_ERROR_NO_CANDIDATES;
            }
            const node_t &a = nearest[0];
            const node_t &b = nearest[1];
            node_t projected = ::ProjectOntoSegment(a, b, classroom);

            // the projection landed on an endpoint, connect to it directly
            if (EuclideanDistance(projected, a) == 0) {
                if (const auto status = graph.add_euclidean_edge(classroom.id, a.id); status != ROUTE_STATUS_SUCCESS) {
                    return status;
                }
                continue;
            }
            if (EuclideanDistance(projected, b) == 0) {
                if (const auto status = graph.add_euclidean_edge(classroom.id, b.id); status != ROUTE_STATUS_SUCCESS) {
                    return status;
                }
                continue;
            }

            if (graph.max_node_id() == std::numeric_limits<nodeid_t>::max()) {
                return ROUTE_STATUS_ERROR_INVALID_ARG;
            }
            projected.id = graph.max_node_id() + 1;
            if (const auto status = graph.add_node(projected); status != ROUTE_STATUS_SUCCESS) {
                return status;
            }
            ++num_added_nodes;

            for (const nodeid_t endpoint: {a.id, b.id, classroom.id}) {
                if (const auto status = graph.add_euclidean_edge(endpoint, projected.id);
                    status != ROUTE_STATUS_SUCCESS) {
                    return status;
                }
            }
        }
        return ROUTE_STATUS_SUCCESS;
    }
}
