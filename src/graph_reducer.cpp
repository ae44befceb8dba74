#include "graph_reducer.h"

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <new>
#include <system_error>
#include <thread>
#include <utility>

namespace route {
    RouteStatus ReducedGraph::Create(std::vector<nodeid_t> nodes, ReducedGraph &out) {
        const size_t n = nodes.size();

        ReducedGraph reduced{};
        reduced.distances.reset(new(std::nothrow) cost_t[n * n]);
        if (n > 0 && !reduced.distances) {
            return ROUTE_STATUS_OUT_OF_MEMORY;
        }
        std::fill_n(reduced.distances.get(), n * n, COST_POSITIVE_INFINITY);

        // Fill in the diagonal with zeros
        for (size_t i = 0; i < n; ++i) {
            reduced.distances[i * n + i] = 0;
        }
        for (const auto &id: nodes) {
            reduced.id_to_idx[id] = static_cast<node_cost_idx>(reduced.id_to_idx.size());
        }
        reduced.node_ids = std::move(nodes);
        out = std::move(reduced);
        return ROUTE_STATUS_SUCCESS;
    }

    void ReducedGraph::set_cost(const node_cost_idx a, const node_cost_idx b, const cost_t cost) {
        const auto n = static_cast<node_cost_idx>(node_ids.size());
        if (distances[a * n + b] == COST_POSITIVE_INFINITY) {
            ++edge_count;
        }
        distances[a * n + b] = cost;
        distances[b * n + a] = cost;
    }

    std::optional<cost_t> ReducedGraph::cost(const nodeid_t a, const nodeid_t b) const {
        const auto a_idx = index_of(a);
        const auto b_idx = index_of(b);
        if (!a_idx || !b_idx) {
            return std::nullopt;
        }
        const cost_t cost = get_cost(*a_idx, *b_idx);
        if (cost == COST_POSITIVE_INFINITY) {
            return std::nullopt;
        }
        return cost;
    }

    std::optional<node_cost_idx> ReducedGraph::index_of(const nodeid_t id) const {
        const auto it = id_to_idx.find(id);
        if (it == id_to_idx.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void PrintReducedGraph(const ReducedGraph &reduced) {
        const auto n = static_cast<node_cost_idx>(reduced.num_nodes());
        // print header
        const auto printHeader = [n] {
            std::cout << "+";
            for (node_cost_idx i = 0; i < n; ++i) {
                std::cout << "---------"; // allow 8 chars per number
            }
            std::cout << "+" << std::endl;
        };
        printHeader();
        for (node_cost_idx i = 0; i < n; ++i) {
            std::cout << "|";
            for (node_cost_idx j = 0; j < n; ++j) {
                std::cout << std::fixed << std::setprecision(2) << std::setw(8)
                        << reduced.get_cost(i, j) << " ";
            }
            std::cout << "| " << reduced.node_id(i) << std::endl;
        }
        printHeader();
    }
}

namespace {
    using route::node_pair_t;

    /// Searches the given pairs on num_threads threads. statuses[i] receives the result of pairs[i].
    RouteStatus SearchPairsInParallel(const route::Graph &graph,
                                      const std::vector<node_pair_t> &pairs,
                                      route::PathCache &cache,
                                      const uint32_t num_threads,
                                      std::vector<RouteStatus> &statuses) {
        statuses.assign(pairs.size(), ROUTE_STATUS_SUCCESS);
        std::atomic<size_t> next_pair{0};

        const auto worker = [&] {
            for (size_t i = next_pair++; i < pairs.size(); i = next_pair++) {
                const auto &[a, b] = pairs[i];
                if (cache.contains(a, b)) {
                    continue;
                }
                // each pair is handed to exactly one worker, so the search runs once per pair
                try {
                    route::path_t path{};
                    statuses[i] = route::ShortestPath(graph, a, b, path);
                    if (statuses[i] == ROUTE_STATUS_SUCCESS) {
                        cache.put(a, b, path);
                    }
                } catch (const std::bad_alloc &) {
                    // exceptions must not leave a worker thread
                    statuses[i] = ROUTE_STATUS_OUT_OF_MEMORY;
                }
            }
        };

        try {
            std::vector<std::jthread> workers{};
            workers.reserve(num_threads);
            for (uint32_t t = 0; t < num_threads; ++t) {
                workers.emplace_back(worker);
            }
        } catch (const std::system_error &) {
            // started workers are joined by their destructors
            return ROUTE_STATUS_ERROR_INTERNAL;
        }
        return ROUTE_STATUS_SUCCESS;
    }
}

namespace route {
    RouteStatus Reduce(const Graph &graph,
                       const std::vector<nodeid_t> &nodes,
                       PathCache &cache,
                       const uint32_t num_threads,
                       ReducedGraph &reduced) {
        std::vector<nodeid_t> sorted_nodes(nodes);
        std::ranges::sort(sorted_nodes);
        const auto [first, last] = std::ranges::unique(sorted_nodes);
        sorted_nodes.erase(first, last);

        for (const auto &id: sorted_nodes) {
            if (!graph.contains(id)) {
                return ROUTE_STATUS_ERROR_UNKNOWN_NODE;
            }
        }

        ReducedGraph result{};
        if (const auto status = ReducedGraph::Create(sorted_nodes, result); status != ROUTE_STATUS_SUCCESS) {
            return status;
        }

        std::vector<node_pair_t> pairs{};
        for (size_t i = 0; i < sorted_nodes.size(); ++i) {
            for (size_t j = i + 1; j < sorted_nodes.size(); ++j) {
                pairs.push_back(node_pair_t{sorted_nodes[i], sorted_nodes[j]});
            }
        }

        if (num_threads > 1 && pairs.size() > 1) {
            std::vector<RouteStatus> statuses{};
            const uint32_t workers = static_cast<uint32_t>(std::min<size_t>(num_threads, pairs.size()));
            if (const auto status = ::SearchPairsInParallel(graph, pairs, cache, workers, statuses);
                status != ROUTE_STATUS_SUCCESS) {
                return status;
            }
            // report the first failure in pair order, as the sequential search would
            for (const auto &status: statuses) {
                if (status != ROUTE_STATUS_SUCCESS) {
                    return status;
                }
            }
        }

        const search_fn_t search = [&graph](const nodeid_t a, const nodeid_t b, path_t &path) {
            return ShortestPath(graph, a, b, path);
        };

        for (const auto &[a, b]: pairs) {
            path_t path{};
            if (const auto status = cache.get_or_compute(a, b, search, path); status != ROUTE_STATUS_SUCCESS) {
                return status;
            }
            result.set_cost(*result.index_of(a), *result.index_of(b), path.cost);
        }

        reduced = std::move(result);
        return ROUTE_STATUS_SUCCESS;
    }
}
