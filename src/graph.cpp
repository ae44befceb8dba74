#include "graph.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace {
    /// Grows the capacity so that the next push_back cannot throw.
    template<typename T>
    void ReserveOneMore(std::vector<T> &values) {
        if (values.size() == values.capacity()) {
            values.reserve(std::max<size_t>(4, 2 * values.capacity()));
        }
    }
}

namespace route {
    cost_t EuclideanDistance(const node_t &a, const node_t &b) {
        const double dx = a.x - b.x;
        const double dy = a.y - b.y;
        const double dz = a.z - b.z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    RouteStatus Graph::add_node(const node_t &node) {
        if (id_to_idx.contains(node.id)) {
            return ROUTE_STATUS_ERROR_DUPLICATE_NODE;
        }
        // every allocation happens before the graph changes, a throw leaves it untouched
        ::ReserveOneMore(node_list);
        ::ReserveOneMore(adjacency);
        id_to_idx.emplace(node.id, node_list.size());
        node_list.push_back(node);
        adjacency.emplace_back();
        max_id = std::max(max_id, node.id);
        return ROUTE_STATUS_SUCCESS;
    }

    RouteStatus Graph::add_edge(const nodeid_t a, const nodeid_t b, const cost_t weight) {
        const auto a_it = id_to_idx.find(a);
        const auto b_it = id_to_idx.find(b);
        if (a_it == id_to_idx.end() || b_it == id_to_idx.end()) {
            return ROUTE_STATUS_ERROR_UNKNOWN_NODE;
        }
        if (!std::isfinite(weight) || weight < 0) {
            return ROUTE_STATUS_ERROR_INVALID_WEIGHT;
        }
        if (a == b) {
            return ROUTE_STATUS_ERROR_INVALID_EDGE;
        }
        const node_pair_t key = node_pair_t::Of(a, b);
        if (edges.contains(key)) {
            return ROUTE_STATUS_ERROR_DUPLICATE_EDGE;
        }
        auto &a_neighbors = adjacency[a_it->second];
        auto &b_neighbors = adjacency[b_it->second];
        ::ReserveOneMore(a_neighbors);
        ::ReserveOneMore(b_neighbors);
        edges.emplace(key, weight);
        a_neighbors.push_back(neighbor_t{b, weight});
        b_neighbors.push_back(neighbor_t{a, weight});
        return ROUTE_STATUS_SUCCESS;
    }

    RouteStatus Graph::add_euclidean_edge(const nodeid_t a, const nodeid_t b) {
        const node_t *node_a = find_node(a);
        const node_t *node_b = find_node(b);
        if (node_a == nullptr || node_b == nullptr) {
            return ROUTE_STATUS_ERROR_UNKNOWN_NODE;
        }
        return add_edge(a, b, EuclideanDistance(*node_a, *node_b));
    }

    const node_t *Graph::find_node(const nodeid_t id) const {
        const auto it = id_to_idx.find(id);
        if (it == id_to_idx.end()) {
            return nullptr;
        }
        return &node_list[it->second];
    }

    std::span<const neighbor_t> Graph::neighbors(const nodeid_t id) const {
        const auto it = id_to_idx.find(id);
        if (it == id_to_idx.end()) {
            return {};
        }
        return adjacency[it->second];
    }

    std::optional<cost_t> Graph::edge_weight(const nodeid_t a, const nodeid_t b) const {
        const auto it = edges.find(node_pair_t::Of(a, b));
        if (it == edges.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<nodeid_t> Graph::critical_nodes() const {
        std::vector<nodeid_t> critical{};
        for (const auto &node: node_list) {
            if (node.is_critical) {
                critical.push_back(node.id);
            }
        }
        std::ranges::sort(critical);
        return critical;
    }
}
