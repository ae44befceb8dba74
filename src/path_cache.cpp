#include "path_cache.h"

#include <utility>

namespace route {
    std::optional<path_t> PathCache::get_locked(const nodeid_t a, const nodeid_t b) const {
        const auto it = paths.find(node_pair_t::Of(a, b));
        if (it == paths.end()) {
            return std::nullopt;
        }
        // paths are stored oriented from their first requested source
        if (it->second.source() == a) {
            return it->second;
        }
        return it->second.reversed();
    }

    std::optional<path_t> PathCache::get(const nodeid_t a, const nodeid_t b) const {
        std::lock_guard lock(mutex);
        return get_locked(a, b);
    }

    bool PathCache::put(const nodeid_t a, const nodeid_t b, const path_t &path) {
        if (path.nodes.empty() || node_pair_t::Of(path.source(), path.destination()) != node_pair_t::Of(a, b)) {
            return false;
        }
        std::lock_guard lock(mutex);
        const auto &[_, inserted] = paths.try_emplace(node_pair_t::Of(a, b), path);
        return inserted;
    }

    RouteStatus PathCache::get_or_compute(const nodeid_t a,
                                          const nodeid_t b,
                                          const search_fn_t &search_fn,
                                          path_t &path) {
        std::lock_guard lock(mutex);
        if (auto cached = get_locked(a, b)) {
            path = std::move(*cached);
            return ROUTE_STATUS_SUCCESS;
        }

        path_t computed{};
        if (const auto status = search_fn(a, b, computed); status != ROUTE_STATUS_SUCCESS) {
            return status;
        }
        paths.emplace(node_pair_t::Of(a, b), computed);
        path = std::move(computed);
        return ROUTE_STATUS_SUCCESS;
    }

    bool PathCache::contains(const nodeid_t a, const nodeid_t b) const {
        std::lock_guard lock(mutex);
        return paths.contains(node_pair_t::Of(a, b));
    }

    size_t PathCache::size() const {
        std::lock_guard lock(mutex);
        return paths.size();
    }
}
