#ifndef GD_SUBLAYOUTS_HPP
#define GD_SUBLAYOUTS_HPP

#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <gd/AlgorithmRegistry.hpp>
#include <gd/Coordinate.hpp>
#include <gd/Digraph.hpp>
#include <gd/Identifiers.hpp>
#include <gd/Scope.hpp>
#include <gd/meta/utils.hpp>

namespace gd {

/**
 * @brief bottom-up layout of a collection tree.
 *
 * Every `kSublayoutKind` child is laid out first; the resulting graphs that share vertices are merged (the
 * coordinate frame of each added graph is shifted so that the shared vertex coincides), and each merged graph that
 * intersects the current layout is collapsed into a rectangular placeholder before the algorithm of the current
 * layout runs. Afterwards the placeholders are expanded again, subgraph nodes are created around their members and
 * `nudge` is applied.
 *
 * One instance holds the bookkeeping (positions per vertex and graph, subgraph node members, nudged vertices) of one
 * pipeline run.
 */
class Sublayouts {
public:
    using LayoutFunction = std::function<void(Digraph& layoutGraph, CollectionId layout, std::string_view algorithm, const AlgorithmTraits& traits)>;

private:
    Scope&                                                                                                       _scope;
    const AlgorithmRegistry&                                                                                     _registry;
    std::unordered_map<VertexId, std::vector<VertexId>>                                                          _subs;
    std::unordered_set<VertexId>                                                                                 _alreadyNudged;
    std::unordered_map<std::pair<VertexId, const Digraph*>, Coordinate, meta::PairHash<VertexId, const Digraph*>> _positions;

public:
    Sublayouts(Scope& scope, const AlgorithmRegistry& registry) : _scope(scope), _registry(registry) {}

    /// lays out `layout` and its sub-layouts; returns the syntactic digraph of `layout` with final positions
    [[nodiscard]] std::unique_ptr<Digraph> layoutRecursively(CollectionId layout, const LayoutFunction& fun);

    /// moves every vertex that has a `regardless at` option to that position
    void regardless(Digraph& graph);

    /// moves `v` and, recursively, the members of the subgraph node `v`
    void offsetVertex(VertexId v, const Coordinate& delta);

    /// options of `layout`: the defaults overlaid with the options of all enclosing collections
    [[nodiscard]] property_map layoutOptions(CollectionId layout) const;

private:
    void nudge(const Digraph& graph);
    void createSubgraphNode(const Digraph& syntactic, VertexId vertex);
    void recordPositions(const Digraph& graph);
    void mergeResults(std::vector<std::unique_ptr<Digraph>>& results, std::unordered_map<const Digraph*, CollectionId>& location, std::vector<std::unique_ptr<Digraph>>& merged);
    [[nodiscard]] bool specialVertexSubset(std::span<const VertexId> vertices, const Digraph& graph) const;
};

} // namespace gd

#endif // GD_SUBLAYOUTS_HPP
