#include "path_search.h"

#include <algorithm>
#include <queue>
#include <unordered_map>

namespace {
    struct frontier_entry_t {
        cost_t priority;
        uint64_t sequence;
        nodeid_t id;
        cost_t cost_so_far;
    };

    /// Orders the priority queue so the lowest priority comes first, and the earliest pushed among equals.
    struct frontier_order_t {
        bool operator()(const frontier_entry_t &lhs, const frontier_entry_t &rhs) const {
            if (lhs.priority != rhs.priority) {
                return lhs.priority > rhs.priority;
            }
            return lhs.sequence > rhs.sequence;
        }
    };

    [[nodiscard]] route::path_t ReconstructPath(const route::Graph &graph,
                                                const std::unordered_map<nodeid_t, nodeid_t> &came_from,
                                                const nodeid_t source,
                                                const nodeid_t destination) {
        route::path_t path{};
        for (nodeid_t current = destination; current != source; current = came_from.at(current)) {
            path.nodes.push_back(current);
        }
        path.nodes.push_back(source);
        std::ranges::reverse(path.nodes);

        // re-sum the edge weights in walking order so the cost is exactly the sum of its edges
        for (size_t i = 1; i < path.nodes.size(); ++i) {
            path.cost += *graph.edge_weight(path.nodes[i - 1], path.nodes[i]);
        }
        return path;
    }
}

namespace route {
    RouteStatus ShortestPath(const Graph &graph,
                             const nodeid_t source,
                             const nodeid_t destination,
                             path_t &path,
                             search_stats_t *stats) {
        const node_t *source_node = graph.find_node(source);
        const node_t *destination_node = graph.find_node(destination);
        if (source_node == nullptr || destination_node == nullptr) {
            return ROUTE_STATUS_ERROR_UNKNOWN_NODE;
        }

        search_stats_t local_stats{};
        search_stats_t &counters = stats != nullptr ? *stats : local_stats;
        counters = {};

        if (source == destination) {
            path = path_t{{source}, 0};
            return ROUTE_STATUS_SUCCESS;
        }

        const auto heuristic = [&graph, destination_node](const nodeid_t id) {
            return EuclideanDistance(*graph.find_node(id), *destination_node);
        };

        std::priority_queue<frontier_entry_t, std::vector<frontier_entry_t>, frontier_order_t> frontier{};
        std::unordered_map<nodeid_t, cost_t> best_cost{};
        std::unordered_map<nodeid_t, cost_t> expanded_cost{};
        std::unordered_map<nodeid_t, nodeid_t> came_from{};
        uint64_t sequence = 0;

        best_cost[source] = 0;
        frontier.push(frontier_entry_t{heuristic(source), sequence++, source, 0});
        ++counters.num_pushed;

        while (!frontier.empty()) {
            const frontier_entry_t current = frontier.top();
            frontier.pop();

            if (current.id == destination) {
                path = ::ReconstructPath(graph, came_from, source, destination);
                return ROUTE_STATUS_SUCCESS;
            }

            // skip stale entries, a node is only expanded again for a strictly better cost
            if (current.cost_so_far > best_cost.at(current.id)) {
                continue;
            }
            if (const auto it = expanded_cost.find(current.id);
                it != expanded_cost.end() && current.cost_so_far >= it->second) {
                continue;
            }
            expanded_cost[current.id] = current.cost_so_far;
            ++counters.num_expanded;

            for (const auto &[neighbor, weight]: graph.neighbors(current.id)) {
                const cost_t tentative = current.cost_so_far + weight;
                if (const auto it = best_cost.find(neighbor); it != best_cost.end() && tentative >= it->second) {
                    continue;
                }
                best_cost[neighbor] = tentative;
                came_from[neighbor] = current.id;
                frontier.push(frontier_entry_t{tentative + heuristic(neighbor), sequence++, neighbor, tentative});
                ++counters.num_pushed;
            }
        }
        return ROUTE_STATUS_ERROR_UNREACHABLE;
    }
}
