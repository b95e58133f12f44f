#ifndef GD_ALGORITHM_FORCE_COARSEGRAPH_HPP
#define GD_ALGORITHM_FORCE_COARSEGRAPH_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <gd/Digraph.hpp>
#include <gd/Identifiers.hpp>
#include <gd/Options.hpp>
#include <gd/Storage.hpp>
#include <gd/rng/RandomSource.hpp>

namespace gd::force {

/// combines the values of a framework attribute when two vertices are collapsed into one
using AttributeCombine = std::function<pmtv::pmt(const pmtv::pmt& replacement, const pmtv::pmt& collapsed)>;

/**
 * @brief the per-invocation attributes a coarse graph reads and accumulates.
 *
 * `weight` and `mass` of a collapsed vertex are the sums of the collapsed ones, `arcWeight` of an arc that several
 * arcs merged into is the sum of their weights. `framework` holds further numeric or opaque per-vertex values; numbers
 * add up, other values use the function registered in `combine` under their key.
 */
struct CoarseningAttributes {
    Storage<VertexId, double>       weight{1.0};
    Storage<VertexId, double>       mass{1.0};
    Storage<ArcId, double>          arcWeight{1.0};
    Storage<VertexId, property_map> framework;
    std::map<std::string, AttributeCombine, std::less<>> combine;
};

/**
 * @brief multilevel contraction of a digraph by repeated maximal matchings.
 *
 * `coarsen()` visits the vertices in random order and matches every unmatched vertex with its unmatched neighbour of
 * minimum weight (ties: the first one found). Every matched pair is collapsed into a new dummy vertex placed at the
 * midpoint. The vertices left unmatched are listed in a second random order. `uncoarsen()` expands the vertices
 * created by the last `coarsen()` in reverse order of creation.
 *
 * The wrapped digraph is modified in place; it is expected to carry every arc in both directions.
 */
class CoarseGraph {
public:
    enum class Expansion {
        jitter,      ///< restored vertex at placeholder + 10 * (random(), random()), reseeded with 42 before each expansion
        interpolate, ///< restored vertex at the placeholder position
    };

private:
    Digraph&                           _graph;
    rng::RandomSource&                 _random;
    CoarseningAttributes&              _attributes;
    Expansion                          _expansion;
    std::size_t                        _level = 0UZ;
    double                             _ratio = 0.0;
    std::vector<std::vector<VertexId>> _collapsedVertices{{}}; // [level] -> vertices created at that level
    std::vector<std::vector<VertexId>> _unmatchedVertices{{}}; // [level] -> vertices that level did not match

public:
    CoarseGraph(Digraph& graph, rng::RandomSource& random, CoarseningAttributes& attributes, Expansion expansion = Expansion::jitter);

    void coarsen();
    void uncoarsen();

    [[nodiscard]] std::size_t getSize() const noexcept { return _graph.size(); }
    [[nodiscard]] double      getRatio() const noexcept { return _ratio; }
    [[nodiscard]] std::size_t getLevel() const noexcept { return _level; }
    [[nodiscard]] Digraph&    graph() noexcept { return _graph; }

    [[nodiscard]] const std::vector<VertexId>& collapsedVertices(std::size_t level) const { return _collapsedVertices.at(level); }
    [[nodiscard]] const std::vector<VertexId>& unmatchedVertices(std::size_t level) const { return _unmatchedVertices.at(level); }

private:
    [[nodiscard]] std::vector<std::pair<VertexId, VertexId>> findMatching(std::vector<VertexId>& unmatched);
    void                                                     mergeVertex(VertexId replacement, VertexId collapsed);
    void                                                     mergeArc(ArcId surviving, ArcId removed);
};

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_COARSEGRAPH_HPP
