#ifndef GD_LAYOUT_PIPELINE_HPP
#define GD_LAYOUT_PIPELINE_HPP

#include <string_view>
#include <vector>

#include <gd/AlgorithmRegistry.hpp>
#include <gd/Digraph.hpp>
#include <gd/Export.hpp>
#include <gd/Scope.hpp>
#include <gd/Sublayouts.hpp>
#include <gd/rng/RandomSource.hpp>

namespace gd {

/**
 * @brief drives the layout of a `gd::Scope`: lays out the collection tree bottom-up, runs the selected
 * algorithm per connected component, packs the components, anchors the drawing and cuts the edges at the
 * vertex outlines.
 */
class LayoutPipeline {
    Scope&                   _scope;
    const AlgorithmRegistry& _registry;
    rng::RandomSource        _random;
    Sublayouts               _sublayouts;

public:
    GD_EXPORT explicit LayoutPipeline(Scope& scope, const AlgorithmRegistry& registry = globalAlgorithmRegistry());

    /// lays out the first layout collection of the scope; the result replaces the scope's syntactic digraph
    GD_EXPORT void run();

    void runOnLayout(Digraph& layoutGraph, CollectionId layout, std::string_view algorithm, const AlgorithmTraits& traits);

    /// shifts the graph so that the anchor vertex sits at its desired position
    void anchor(Digraph& graph) const;

    [[nodiscard]] rng::RandomSource& random() noexcept { return _random; }

    /// connected components (ignoring arc direction), vertices in event order; `{digraph}` if connected
    [[nodiscard]] static std::vector<Digraph> decompose(const Digraph& digraph);
    static void                               sortComponents(std::string_view order, std::vector<Digraph>& components);
    /// places the components side by side along `component direction`
    static void packComponents(const Digraph& syntactic, std::vector<Digraph>& components);
    /// rigidifies every edge path and cuts it at the outlines of its end vertices
    static void cutEdges(Digraph& graph);
};

} // namespace gd

#endif // GD_LAYOUT_PIPELINE_HPP
