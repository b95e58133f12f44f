#include <gd/algorithm/force/Preprocessing.hpp>

#include <deque>
#include <unordered_map>

namespace gd::force {

namespace {

/// hop distance from `source` to every vertex within `limit` hops
std::unordered_map<VertexId, std::size_t> boundedDistances(const Digraph& graph, VertexId source, std::size_t limit) {
    std::unordered_map<VertexId, std::size_t> distance{{source, 0UZ}};
    std::deque<VertexId>                      queue{source};
    while (!queue.empty()) {
        const VertexId    u    = queue.front();
        const std::size_t next = distance[u] + 1UZ;
        queue.pop_front();
        if (next > limit) {
            continue;
        }
        auto visit = [&](VertexId w) {
            if (distance.try_emplace(w, next).second) {
                queue.push_back(w);
            }
        };
        for (ArcId a : graph.outgoing(u)) {
            visit(graph[a].head);
        }
        for (ArcId a : graph.incoming(u)) {
            visit(graph[a].tail);
        }
    }
    return distance;
}

template<typename TAccept>
std::vector<VertexPair> pairsWithin(const Digraph& graph, std::size_t n, TAccept accept) {
    std::vector<VertexPair> pairs;
    if (n == 0UZ) {
        return pairs;
    }
    const auto& vertices = graph.vertices();
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        const auto distance = boundedDistances(graph, vertices[i], n);
        for (std::size_t j = i + 1UZ; j < vertices.size(); ++j) {
            if (auto it = distance.find(vertices[j]); it != distance.end() && accept(it->second)) {
                pairs.emplace_back(vertices[i], vertices[j]);
            }
        }
    }
    return pairs;
}

} // namespace

std::vector<VertexPair> allPairs(std::span<const VertexId> vertices) {
    std::vector<VertexPair> pairs;
    pairs.reserve(vertices.size() * (vertices.size() - (vertices.empty() ? 0UZ : 1UZ)) / 2UZ);
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        for (std::size_t j = i + 1UZ; j < vertices.size(); ++j) {
            pairs.emplace_back(vertices[i], vertices[j]);
        }
    }
    return pairs;
}

std::vector<VertexPair> overMaxNPairs(const Digraph& graph, std::size_t n) {
    return pairsWithin(graph, n, [](std::size_t d) { return d >= 1UZ; });
}

std::vector<VertexPair> overExactlyNPairs(const Digraph& graph, std::size_t n) {
    return pairsWithin(graph, n, [n](std::size_t d) { return d == n; });
}

} // namespace gd::force
