#include "tour_solver.h"

#include <algorithm>
#include <atomic>
#include <new>
#include <system_error>
#include <thread>
#include <utility>

namespace {
    using route::node_cost_idx;
    using route::ReducedGraph;

    struct branch_result_t {
        std::vector<node_cost_idx> order{};
        cost_t cost = route::COST_POSITIVE_INFINITY;
        RouteStatus status = ROUTE_STATUS_SUCCESS;
    };

    /**
     * Enumerates every permutation of order[first..] in lexicographic order, keeping the positions before first
     * fixed. order[first..] must be sorted ascending.
     */
    [[nodiscard]] branch_result_t EnumeratePermutations(std::vector<node_cost_idx> order,
                                                        const size_t first,
                                                        const ReducedGraph &reduced,
                                                        const bool closed) {
        branch_result_t best{};
        do {
            if (const cost_t cost = route::ComputeTourCost(order, reduced, closed); cost < best.cost) {
                best.cost = cost;
                best.order = order;
            }
        } while (std::next_permutation(order.begin() + static_cast<std::ptrdiff_t>(first), order.end()));
        return best;
    }

    /// Runs one branch per choice of the second tour node and merges the branch minima in branch order.
    RouteStatus EnumerateBranchesInParallel(const std::vector<node_cost_idx> &base_order,
                                            const ReducedGraph &reduced,
                                            const bool closed,
                                            const uint32_t num_threads,
                                            branch_result_t &best) {
        const size_t num_branches = base_order.size() - 1;
        std::vector<branch_result_t> results(num_branches);
        std::atomic<size_t> next_branch{0};

        const auto worker = [&] {
            for (size_t b = next_branch++; b < num_branches; b = next_branch++) {
                try {
                    // move the branch's node to position 1, the remaining suffix stays sorted
                    std::vector<node_cost_idx> order = base_order;
                    std::rotate(order.begin() + 1,
                                order.begin() + 1 + static_cast<std::ptrdiff_t>(b),
                                order.begin() + 2 + static_cast<std::ptrdiff_t>(b));
                    results[b] = ::EnumeratePermutations(std::move(order), 2, reduced, closed);
                } catch (const std::bad_alloc &) {
                    results[b].status = ROUTE_STATUS_OUT_OF_MEMORY;
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
            return ROUTE_STATUS_ERROR_INTERNAL;
        }

        for (const auto &result: results) {
            if (result.status != ROUTE_STATUS_SUCCESS) {
                return result.status;
            }
        }

        best = branch_result_t{};
        for (auto &result: results) {
            if (result.cost < best.cost) {
                best = std::move(result);
            }
        }
        return ROUTE_STATUS_SUCCESS;
    }
}

namespace route {
    cost_t ComputeTourCost(const std::vector<node_cost_idx> &order, const ReducedGraph &reduced, const bool closed) {
        cost_t cost = 0;
        for (size_t i = 1; i < order.size(); ++i) {
            cost += reduced.get_cost(order[i - 1], order[i]);
        }
        if (closed && order.size() > 1) {
            cost += reduced.get_cost(order.back(), order.front());
        }
        return cost;
    }

    RouteStatus SolveTourExact(const ReducedGraph &reduced,
                               const node_cost_idx start,
                               const bool closed,
                               const uint32_t num_threads,
                               std::vector<node_cost_idx> &order) {
        const auto n = static_cast<node_cost_idx>(reduced.num_nodes());
        if (start < 0 || start >= n) {
            return ROUTE_STATUS_ERROR_INVALID_ARG;
        }

        // start is the anchor, the other nodes follow in ascending order
        std::vector<node_cost_idx> base_order{start};
        for (node_cost_idx i = 0; i < n; ++i) {
            if (i != start) {
                base_order.push_back(i);
            }
        }

        branch_result_t best{};
        if (num_threads > 1 && base_order.size() > 3) {
            const auto workers = static_cast<uint32_t>(std::min<size_t>(num_threads, base_order.size() - 1));
            if (const auto status = ::EnumerateBranchesInParallel(base_order, reduced, closed, workers, best);
                status != ROUTE_STATUS_SUCCESS) {
                return status;
            }
        } else {
            best = ::EnumeratePermutations(std::move(base_order), 1, reduced, closed);
        }

        if (best.cost == COST_POSITIVE_INFINITY) {
            return ROUTE_STATUS_ERROR_UNREACHABLE;
        }
        order = std::move(best.order);
        return ROUTE_STATUS_SUCCESS;
    }

    RouteStatus SolveTourGreedy(const ReducedGraph &reduced,
                                const node_cost_idx start,
                                std::vector<node_cost_idx> &order) {
        const auto n = static_cast<node_cost_idx>(reduced.num_nodes());
        if (start < 0 || start >= n) {
            return ROUTE_STATUS_ERROR_INVALID_ARG;
        }

        std::vector<bool> visited(n, false);
        std::vector<node_cost_idx> tour{start};
        tour.reserve(n);
        visited[start] = true;

        while (static_cast<node_cost_idx>(tour.size()) < n) {
            const node_cost_idx last_node = tour.back();
            cost_t min_cost = COST_POSITIVE_INFINITY;
            node_cost_idx nearest_node = -1;
            // indices ascend with node ids, so the strict comparison keeps the smallest id on ties
            for (node_cost_idx node = 0; node < n; ++node) {
                if (visited[node]) {
                    continue;
                }
                const cost_t cost = reduced.get_cost(last_node, node);
                if (cost < min_cost) {
                    min_cost = cost;
                    nearest_node = node;
                }
            }
            if (nearest_node == -1) {
                return ROUTE_STATUS_ERROR_UNREACHABLE;
            }
            visited[nearest_node] = true;
            tour.push_back(nearest_node);
        }
        order = std::move(tour);
        return ROUTE_STATUS_SUCCESS;
    }

    RouteStatus SolveTour(const ReducedGraph &reduced,
                          const nodeid_t start,
                          const RouteSolverOptionsDescriptor &solver_options,
                          tour_t &tour) {
        if (reduced.num_nodes() == 0) {
            return ROUTE_STATUS_ERROR_EMPTY_CRITICAL_SET;
        }
        const auto start_idx = reduced.index_of(start);
        if (!start_idx) {
            return ROUTE_STATUS_ERROR_UNKNOWN_NODE;
        }

        const bool fits_exact = reduced.num_nodes() <= solver_options.exact_upper_bound;
        bool use_exact;
        switch (solver_options.strategy) {
            case ROUTE_STRATEGY_EXACT:
                if (!fits_exact) {
                    return ROUTE_STATUS_ERROR_INVALID_ARG;
                }
                use_exact = true;
                break;
            case ROUTE_STRATEGY_GREEDY:
                use_exact = false;
                break;
            case ROUTE_STRATEGY_AUTO:
                use_exact = fits_exact;
                break;
            default:
                return ROUTE_STATUS_ERROR_INVALID_ARG;
        }

        std::vector<node_cost_idx> order{};
        const RouteStatus status = use_exact
                                       ? SolveTourExact(reduced, *start_idx, solver_options.closed_tour,
                                                        solver_options.num_threads, order)
                                       : SolveTourGreedy(reduced, *start_idx, order);
        if (status != ROUTE_STATUS_SUCCESS) {
            return status;
        }

        tour_t result{};
        result.closed = solver_options.closed_tour;
        result.cost = ComputeTourCost(order, reduced, result.closed);
        if (result.cost == COST_POSITIVE_INFINITY) {
            return ROUTE_STATUS_ERROR_UNREACHABLE;
        }
        result.solution_type = use_exact ? ROUTE_SOLUTION_TYPE_OPTIMAL : ROUTE_SOLUTION_TYPE_APPROXIMATE;
        result.nodes.reserve(order.size() + 1);
        for (const auto idx: order) {
            result.nodes.push_back(reduced.node_id(idx));
        }
        if (result.closed && order.size() > 1) {
            result.nodes.push_back(reduced.node_id(order.front()));
        }
        tour = std::move(result);
        return ROUTE_STATUS_SUCCESS;
    }
}
