#ifndef GD_ALGORITHM_LAYERED_CROSSINGMINIMIZATIONGANSNERKNV1993_HPP
#define GD_ALGORITHM_LAYERED_CROSSINGMINIMIZATIONGANSNERKNV1993_HPP

#include <cstddef>

#include <gd/Digraph.hpp>
#include <gd/algorithm/layered/Ranking.hpp>

namespace gd::layered {

enum class SweepDirection { down, up };

/**
 * @brief orders the vertices inside the ranks of a layered digraph so that few arcs cross.
 *
 * Every arc of the digraph is expected to connect two adjacent ranks (long arcs split by dummy vertices). The
 * initial order comes from two depth-first searches, one from the sources and one from the sinks; afterwards
 * 24 sweeps alternate between the two directions, each reordering the ranks by the weighted median of the
 * neighbour positions followed by a transposition of adjacent vertices. The best ordering seen is returned.
 * @see E. Gansner, E. Koutsofios, S. North, K. Vo, "A technique for drawing directed graphs", IEEE TSE 19(3), 1993
 */
class CrossingMinimizationGansnerKNV1993 {
    const Digraph& _graph;
    Ranking        _ranking;

public:
    static constexpr std::size_t kIterations = 24UZ;

    CrossingMinimizationGansnerKNV1993(const Digraph& graph, Ranking ranking) : _graph(graph), _ranking(std::move(ranking)) {}

    Ranking run();

    [[nodiscard]] const Ranking& ranking() const noexcept { return _ranking; }

    /// number of arc crossings between every rank and the rank above it
    [[nodiscard]] std::size_t countRankCrossings(const Ranking& ranking) const;
    /// crossings between the arcs of `left` and `right` towards the neighbouring rank, assuming `left` is left of `right`
    [[nodiscard]] std::size_t countNodeCrossings(const Ranking& ranking, VertexId left, VertexId right, SweepDirection direction) const;
    /// weighted median of the positions of the neighbours of `v` on `rank`, -1 if there are none
    [[nodiscard]] double computeMedianPosition(VertexId v, int rank) const;

    void computeInitialRankOrdering();
    void orderByWeightedMedian(SweepDirection direction);
    void transpose(SweepDirection direction);
};

} // namespace gd::layered

#endif // GD_ALGORITHM_LAYERED_CROSSINGMINIMIZATIONGANSNERKNV1993_HPP
