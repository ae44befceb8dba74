#pragma once

#include "libroute.h"

#include <functional>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace route {
    /// A location in the building. Immutable once added to a Graph.
    struct node_t {
        nodeid_t id = 0;
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
        bool is_critical = false;
    };

    struct neighbor_t {
        nodeid_t id;
        cost_t weight;
    };

    /// An unordered node pair. Always stored with a <= b.
    struct node_pair_t {
        nodeid_t a;
        nodeid_t b;

        [[nodiscard]] static node_pair_t Of(const nodeid_t u, const nodeid_t v) {
            return u < v ? node_pair_t{u, v} : node_pair_t{v, u};
        }

        bool operator==(const node_pair_t &other) const {
            return a == other.a && b == other.b;
        }

        bool operator!=(const node_pair_t &other) const {
            return !(*this == other);
        }
    };

    /// Straight-line 3D distance between two nodes.
    [[nodiscard]] cost_t EuclideanDistance(const node_t &a, const node_t &b);
}

// hash specialization for node_pair_t
template<>
struct [[maybe_unused]] std::hash<route::node_pair_t> {
    std::size_t operator()(const route::node_pair_t &pair) const noexcept {
        const std::size_t h = std::hash<nodeid_t>{}(pair.a);
        return h ^ (std::hash<nodeid_t>{}(pair.b) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

namespace route {
    /**
     * An undirected, Euclidean-weighted building graph.
     *
     * Construction is the only mutation phase: once a route computation starts the graph is only read,
     * which makes it safe to share between worker threads.
     */
    class Graph {
        std::unordered_map<nodeid_t, size_t> id_to_idx;
        std::vector<node_t> node_list;
        std::vector<std::vector<neighbor_t>> adjacency;
        std::unordered_map<node_pair_t, cost_t> edges;
        nodeid_t max_id = 0;

    public:
        Graph() = default;

        Graph(const Graph &) = delete;

        Graph &operator=(const Graph &) = delete;

        Graph(Graph &&) = default;

        Graph &operator=(Graph &&) = default;

        /// Fails with ROUTE_STATUS_ERROR_DUPLICATE_NODE if the id exists.
        RouteStatus add_node(const node_t &node);

        /// Fails with ROUTE_STATUS_ERROR_UNKNOWN_NODE, ROUTE_STATUS_ERROR_INVALID_WEIGHT,
        /// ROUTE_STATUS_ERROR_INVALID_EDGE (self-loop) or ROUTE_STATUS_ERROR_DUPLICATE_EDGE.
        RouteStatus add_edge(nodeid_t a, nodeid_t b, cost_t weight);

        /// Adds an edge weighted by the Euclidean distance between a and b.
        RouteStatus add_euclidean_edge(nodeid_t a, nodeid_t b);

        [[nodiscard]] bool contains(const nodeid_t id) const {
            return id_to_idx.contains(id);
        }

        /// Returns nullptr if the node does not exist.
        [[nodiscard]] const node_t *find_node(nodeid_t id) const;

        /// Adjacent nodes with the connecting edge weight, in insertion order. Empty for unknown ids.
        [[nodiscard]] std::span<const neighbor_t> neighbors(nodeid_t id) const;

        [[nodiscard]] std::optional<cost_t> edge_weight(nodeid_t a, nodeid_t b) const;

        /// Critical node ids in ascending order.
        [[nodiscard]] std::vector<nodeid_t> critical_nodes() const;

        [[nodiscard]] const std::vector<node_t> &nodes() const {
            return node_list;
        }

        [[nodiscard]] size_t num_nodes() const {
            return node_list.size();
        }

        [[nodiscard]] size_t num_edges() const {
            return edges.size();
        }

        [[nodiscard]] size_t degree(const nodeid_t id) const {
            return neighbors(id).size();
        }

        /// The largest id added so far, 0 for an empty graph.
        [[nodiscard]] nodeid_t max_node_id() const {
            return max_id;
        }
    };

    /**
     * Connects every critical node without edges to its two nearest connected non-critical nodes on the same
     * floor through a new node projected onto the segment between them.
     * @param graph the graph to modify
     * @param num_added_nodes receives the number of projection nodes added
     */
    RouteStatus ConnectIsolatedNodes(Graph &graph, size_t &num_added_nodes);
}
