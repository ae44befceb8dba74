#pragma once

#include "graph.h"
#include "path_cache.h"

#include <limits>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#ifndef WIN32
#define ROUTE_FORCE_INLINE __attribute__((always_inline)) inline
#else
#define ROUTE_FORCE_INLINE inline __forceinline
#endif

namespace route {
    constexpr cost_t COST_POSITIVE_INFINITY = std::numeric_limits<cost_t>::infinity();

    /// Represents an index into the reduced graph's cost matrix where a particular node is located
    typedef std::ptrdiff_t node_cost_idx;

    /**
     * A complete graph over a subset of the building's nodes. The weight of the edge {a, b} is the cost of the
     * shortest path between a and b in the building graph. Nodes are indexed in ascending id order.
     */
    class ReducedGraph {
        std::vector<nodeid_t> node_ids;
        std::unordered_map<nodeid_t, node_cost_idx> id_to_idx;
        std::unique_ptr<cost_t[]> distances;
        size_t edge_count = 0;

    public:
        ReducedGraph() = default;

        ReducedGraph(const ReducedGraph &) = delete;

        ReducedGraph &operator=(const ReducedGraph &) = delete;

        ReducedGraph(ReducedGraph &&other) = default;

        ReducedGraph &operator=(ReducedGraph &&other) = default;

        /**
         * Creates a graph over the given node ids without any edges.
         * @param nodes distinct node ids in ascending order
         * @param out receives the graph
         * @return ROUTE_STATUS_OUT_OF_MEMORY if the cost matrix cannot be allocated
         */
        static RouteStatus Create(std::vector<nodeid_t> nodes, ReducedGraph &out);

        /// Sets the weight of the undirected edge between two node indices.
        void set_cost(node_cost_idx a, node_cost_idx b, cost_t cost);

        [[nodiscard]] ROUTE_FORCE_INLINE cost_t get_cost(const node_cost_idx from, const node_cost_idx to) const {
            return distances[from * static_cast<node_cost_idx>(node_ids.size()) + to];
        }

        /// Edge weight by node id, nullopt if either node is missing or the edge was never set.
        [[nodiscard]] std::optional<cost_t> cost(nodeid_t a, nodeid_t b) const;

        [[nodiscard]] std::optional<node_cost_idx> index_of(nodeid_t id) const;

        [[nodiscard]] nodeid_t node_id(const node_cost_idx idx) const {
            return node_ids[idx];
        }

        [[nodiscard]] const std::vector<nodeid_t> &nodes() const {
            return node_ids;
        }

        [[nodiscard]] size_t num_nodes() const {
            return node_ids.size();
        }

        [[nodiscard]] size_t num_edges() const {
            return edge_count;
        }
    };

    /// Prints the cost matrix to the console. Useful for debugging.
    void PrintReducedGraph(const ReducedGraph &reduced);

    /**
     * Builds the complete graph over the given nodes, taking every edge weight from the path cache and searching
     * for the paths that are not cached yet.
     * @param graph the building graph
     * @param nodes the nodes of the reduced graph, in any order. Duplicates are ignored.
     * @param cache the request's path cache, receives every searched path
     * @param num_threads number of threads searching missing paths in parallel
     * @param reduced receives the reduced graph
     * @return ROUTE_STATUS_ERROR_UNREACHABLE if any pair of nodes is disconnected
     */
    RouteStatus Reduce(const Graph &graph,
                       const std::vector<nodeid_t> &nodes,
                       PathCache &cache,
                       uint32_t num_threads,
                       ReducedGraph &reduced);
}
