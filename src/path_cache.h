#pragma once

#include "graph.h"
#include "path_search.h"

#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace route {
    /// Computes the path from a to b. Same contract as ShortestPath.
    using search_fn_t = std::function<RouteStatus(nodeid_t a, nodeid_t b, path_t &path)>;

    /**
     * Shortest paths keyed by unordered node pair.
     *
     * A cache belongs to a single route computation: the graph it was filled from must not change while it is
     * alive, so entries are never updated once inserted. All operations are serialized on one mutex.
     */
    class PathCache {
        mutable std::mutex mutex;
        std::unordered_map<node_pair_t, path_t> paths;

        [[nodiscard]] std::optional<path_t> get_locked(nodeid_t a, nodeid_t b) const;

    public:
        PathCache() = default;

        PathCache(const PathCache &) = delete;

        PathCache &operator=(const PathCache &) = delete;

        /// Returns the cached path oriented from a to b, or nullopt.
        [[nodiscard]] std::optional<path_t> get(nodeid_t a, nodeid_t b) const;

        /// Inserts the path for {a, b} unless the pair is already cached. The path must run between a and b
        /// in either direction.
        /// @return true if the path was inserted
        bool put(nodeid_t a, nodeid_t b, const path_t &path);

        /**
         * Returns the cached path for {a, b}, computing and caching it with search_fn first if needed.
         * The search runs at most once per unordered pair; failures are returned and not cached.
         */
        RouteStatus get_or_compute(nodeid_t a, nodeid_t b, const search_fn_t &search_fn, path_t &path);

        [[nodiscard]] bool contains(nodeid_t a, nodeid_t b) const;

        [[nodiscard]] size_t size() const;
    };
}
