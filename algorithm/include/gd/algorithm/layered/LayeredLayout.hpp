#ifndef GD_ALGORITHM_LAYERED_LAYEREDLAYOUT_HPP
#define GD_ALGORITHM_LAYERED_LAYEREDLAYOUT_HPP

#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <gd/LayoutAlgorithm.hpp>
#include <gd/algorithm/layered/Ranking.hpp>

namespace gd::layered {

/// arcs reversed by the cycle removal, as (tail, head) of the original arc
using ReversedArcs = std::unordered_set<std::pair<VertexId, VertexId>, meta::PairHash<VertexId, VertexId>>;

/// the vertices of `digraph` and its arcs, where the back arcs of a depth-first search are turned around
[[nodiscard]] Digraph removeCycles(const Digraph& digraph, ReversedArcs& reversed);

/// longest-path ranking of an acyclic digraph: sources get rank 1, every other vertex one more than its highest predecessor
[[nodiscard]] Ranking rankLongestPath(const Digraph& dag);

/**
 * @brief Sugiyama-style layered drawing: cycle removal, longest-path ranking, dummy vertices on arcs spanning
 * several ranks, crossing minimization and a simple coordinate assignment where rank `r` lies `level distance`
 * below rank `r - 1` and the vertices of a rank are centred `sibling distance` apart. Arcs through dummies are
 * routed as polylines.
 */
class LayeredLayout : public LayoutAlgorithm {
    using Chains = std::unordered_map<std::pair<VertexId, VertexId>, std::vector<VertexId>, meta::PairHash<VertexId, VertexId>>;

public:
    using LayoutAlgorithm::LayoutAlgorithm;
    void run(Digraph& digraph, const property_map& options) override;

private:
    /// replaces every arc spanning more than one rank by a chain of dummy vertices, returned per (tail, head)
    [[nodiscard]] static Chains insertDummies(Digraph& dag, Ranking& ranking);
};

} // namespace gd::layered

#endif // GD_ALGORITHM_LAYERED_LAYEREDLAYOUT_HPP
