#ifndef GD_ALGORITHM_FORCE_PATHLENGTHS_HPP
#define GD_ALGORITHM_FORCE_PATHLENGTHS_HPP

#include <cstddef>
#include <span>
#include <unordered_map>
#include <vector>

#include <gd/Digraph.hpp>
#include <gd/Identifiers.hpp>

namespace gd::force {

/// dense table of a value per ordered pair of vertices
class DistanceTable {
    std::unordered_map<VertexId, std::size_t> _index;
    std::size_t                               _n = 0UZ;
    std::vector<double>                       _values;

public:
    DistanceTable(std::span<const VertexId> vertices, double initial);

    [[nodiscard]] double& operator()(VertexId u, VertexId v) { return _values[slot(u, v)]; }
    [[nodiscard]] double  operator()(VertexId u, VertexId v) const { return _values[slot(u, v)]; }
    [[nodiscard]] bool    contains(VertexId v) const { return _index.contains(v); }
    [[nodiscard]] std::size_t size() const noexcept { return _n; }

private:
    [[nodiscard]] std::size_t slot(VertexId u, VertexId v) const;
};

struct ShortestPaths {
    std::unordered_map<VertexId, std::size_t> distance;
    std::vector<std::vector<VertexId>>        levels; ///< `levels[d - 1]`: the vertices at distance `d`, in discovery order
    std::unordered_map<VertexId, VertexId>    parent;
};

struct PseudoDiameter {
    std::size_t diameter = 0UZ;
    VertexId    start{};
    VertexId    end{};
};

/// hop distances between all vertices of an undirected graph; unreachable pairs get `size() + 1`
[[nodiscard]] DistanceTable breadthFirstSearch(const Digraph& ugraph);

/// all-pairs shortest paths with unit arc lengths; unreachable pairs stay at infinity
[[nodiscard]] DistanceTable floydWarshall(const Digraph& graph);

/// single-source hop distances; throws if a vertex cannot be reached from `source`
[[nodiscard]] ShortestPaths dijkstra(const Digraph& ugraph, VertexId source);

/**
 * approximates the diameter by repeated searches, starting from a vertex of minimum degree and continuing from the
 * minimum-degree vertex of the last level until the eccentricity no longer grows.
 */
[[nodiscard]] PseudoDiameter pseudoDiameter(const Digraph& ugraph);

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_PATHLENGTHS_HPP
