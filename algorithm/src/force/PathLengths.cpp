#include <gd/algorithm/force/PathLengths.hpp>

#include <deque>
#include <limits>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd::force {

namespace {
std::size_t degree(const Digraph& graph, VertexId v) { return graph.incoming(v).size() + graph.outgoing(v).size(); }
} // namespace

DistanceTable::DistanceTable(std::span<const VertexId> vertices, double initial) : _n(vertices.size()), _values(vertices.size() * vertices.size(), initial) {
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        _index.emplace(vertices[i], i);
    }
}

std::size_t DistanceTable::slot(VertexId u, VertexId v) const {
    auto iu = _index.find(u);
    auto iv = _index.find(v);
    if (iu == _index.end() || iv == _index.end()) {
        throw gd::exception(fmt::format("distance table has no entry for the pair ({}, {})", u, v));
    }
    return iu->second * _n + iv->second;
}

DistanceTable breadthFirstSearch(const Digraph& ugraph) {
    const auto&   vertices = ugraph.vertices();
    DistanceTable table(vertices, static_cast<double>(vertices.size() + 1UZ));
    for (VertexId source : vertices) {
        table(source, source) = 0.0;
        std::deque<VertexId>                      queue{source};
        std::unordered_map<VertexId, std::size_t> seen{{source, 0UZ}};
        while (!queue.empty()) {
            const VertexId u = queue.front();
            queue.pop_front();
            const std::size_t next = seen[u] + 1UZ;
            for (ArcId a : ugraph.outgoing(u)) {
                const VertexId w = ugraph[a].head;
                if (seen.contains(w)) {
                    continue;
                }
                seen.emplace(w, next);
                table(source, w) = static_cast<double>(next);
                queue.push_back(w);
            }
        }
    }
    return table;
}

DistanceTable floydWarshall(const Digraph& graph) {
    const auto&   vertices = graph.vertices();
    DistanceTable table(vertices, std::numeric_limits<double>::infinity());
    for (VertexId v : vertices) {
        table(v, v) = 0.0;
    }
    for (ArcId a : graph.arcs()) {
        table(graph[a].tail, graph[a].head) = 1.0;
    }
    for (VertexId k : vertices) {
        for (VertexId i : vertices) {
            for (VertexId j : vertices) {
                if (const double via = table(i, k) + table(k, j); via < table(i, j)) {
                    table(i, j) = via;
                }
            }
        }
    }
    return table;
}

ShortestPaths dijkstra(const Digraph& ugraph, VertexId source) {
    ShortestPaths result;
    result.distance.emplace(source, 0UZ);
    std::deque<VertexId> queue{source};
    while (!queue.empty()) {
        const VertexId    u = queue.front();
        const std::size_t d = result.distance[u];
        queue.pop_front();
        if (d > 0UZ) {
            if (result.levels.size() < d) {
                result.levels.resize(d);
            }
            result.levels[d - 1UZ].push_back(u);
        }
        for (ArcId a : ugraph.outgoing(u)) {
            const VertexId w = ugraph[a].head;
            if (!result.distance.contains(w)) {
                result.distance.emplace(w, d + 1UZ);
                result.parent.emplace(w, u);
                queue.push_back(w);
            }
        }
    }
    if (result.distance.size() != ugraph.size()) {
        throw gd::exception("the graph is not connected, Dijkstra will not work");
    }
    return result;
}

PseudoDiameter pseudoDiameter(const Digraph& ugraph) {
    if (ugraph.empty()) {
        throw gd::exception("the pseudo diameter of an empty graph is undefined");
    }
    VertexId start = ugraph.vertices().front();
    for (VertexId v : ugraph.vertices()) {
        if (degree(ugraph, v) < degree(ugraph, start)) {
            start = v;
        }
    }

    std::size_t diameter = 0UZ;
    while (true) {
        const ShortestPaths paths       = dijkstra(ugraph, start);
        const std::size_t   oldDiameter = diameter;
        diameter                        = paths.levels.size();
        if (diameter == 0UZ) {
            return {0UZ, start, start};
        }
        const std::vector<VertexId>& last = paths.levels.back();
        if (diameter == oldDiameter) {
            return {diameter, start, last.front()};
        }
        start = last.front();
        for (VertexId v : last) {
            if (degree(ugraph, v) < degree(ugraph, start)) {
                start = v;
            }
        }
    }
}

} // namespace gd::force
