#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>
#include <libroute.h>

// A side x side grid of hallway nodes with unit spacing and num_critical randomly chosen rooms.
static RouteGraphHandle createRandomGridBuilding(const nodeid_t side, const size_t num_critical) {
    RouteGraphHandle graph{};
    if (routeGraphCreate(&graph) != ROUTE_STATUS_SUCCESS) {
        return nullptr;
    }

    std::mt19937_64 rng{std::random_device{}()};
    std::vector<nodeid_t> ids(side * side);
    for (nodeid_t id = 0; id < side * side; id++) {
        ids[id] = id;
    }
    std::shuffle(ids.begin(), ids.end(), rng);
    std::vector<bool> is_critical(side * side, false);
    for (size_t i = 0; i < num_critical && i < ids.size(); i++) {
        is_critical[ids[i]] = true;
    }

    for (nodeid_t row = 0; row < side; row++) {
        for (nodeid_t col = 0; col < side; col++) {
            const RouteNodeDescriptor node{
                .id = row * side + col,
                .x = static_cast<double>(col),
                .y = static_cast<double>(row),
                .is_critical = is_critical[row * side + col]
            };
            if (routeGraphAddNode(graph, &node) != ROUTE_STATUS_SUCCESS) {
                routeGraphDestroy(graph);
                return nullptr;
            }
        }
    }
    for (nodeid_t row = 0; row < side; row++) {
        for (nodeid_t col = 0; col < side; col++) {
            const nodeid_t id = row * side + col;
            if ((col + 1 < side && routeGraphAddEuclideanEdge(graph, id, id + 1) != ROUTE_STATUS_SUCCESS) ||
                (row + 1 < side && routeGraphAddEuclideanEdge(graph, id, id + side) != ROUTE_STATUS_SUCCESS)) {
                routeGraphDestroy(graph);
                return nullptr;
            }
        }
    }
    return graph;
}

int main() {
    constexpr nodeid_t side = 40;
    for (const std::vector<size_t> test_sizes{3, 5, 7, 9, 10, 20, 50, 100}; const auto n : test_sizes) {
        RouteGraphHandle graph = createRandomGridBuilding(side, n);
        if (graph == nullptr) {
            std::cerr << "Error: could not build a " << side << " x " << side << " building" << std::endl;
            return 1;
        }

        for (const uint32_t num_threads : {1u, 4u}) {
            constexpr size_t iterations = 3;
            long long total_ns = 0;
            double cost = 0;

            for (size_t i = 0; i < iterations; i++) {
                RouteSolverOptionsDescriptor options{};
                options.num_threads = num_threads;
                RouteSolutionDescriptor outputDesc{};

                auto start = std::chrono::steady_clock::now();
                if (const RouteStatus status = routeComputeRoute(graph, 0, &options, &outputDesc);
                    status != ROUTE_STATUS_SUCCESS) {
                    std::cerr << "Error: routeComputeRoute returned " << routeStatusString(status) << std::endl;
                    routeDisposeRoute(&outputDesc);
                    routeGraphDestroy(graph);
                    return 1;
                }
                auto end = std::chrono::steady_clock::now();

                total_ns += std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
                cost = outputDesc.route_cost;
                routeDisposeRoute(&outputDesc);
            }

            const double avg_ms = (static_cast<double>(total_ns) / iterations) / 1e6;

            // Print a summary for this n
            std::cout << "Critical = " << n << ", Threads = " << num_threads
                      << ", Average Solve Time = " << std::fixed << std::setprecision(3) << avg_ms
                      << " ms (over " << iterations << " runs), Route Cost = " << cost << std::endl;
        }

        routeGraphDestroy(graph);
    }

    return 0;
}
