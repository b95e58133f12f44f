#ifndef GD_LAYOUT_ALGORITHM_HPP
#define GD_LAYOUT_ALGORITHM_HPP

#include <memory>
#include <optional>

#include <gd/Digraph.hpp>
#include <gd/Identifiers.hpp>
#include <gd/Options.hpp>
#include <gd/rng/RandomSource.hpp>

namespace gd {

class Scope;

/// preconditions and capabilities of a registered layout algorithm
struct AlgorithmTraits {
    bool connected            = false; ///< run once per connected component
    bool loopFree             = false; ///< self-loops are removed before the run
    bool tree                 = false; ///< implies `connected`
    bool includeSubgraphNodes = false; ///< subgraph nodes stay visible to the algorithm
    bool runAlsoForSingleNode = false;
};

/// what a layout algorithm gets to see besides the digraph it works on
struct AlgorithmContext {
    Scope&                      scope;
    rng::RandomSource&          random;
    Digraph&                    ugraph;              ///< undirected view (every arc in both directions)
    const Digraph&              syntacticComponent;  ///< the component of the layout's syntactic digraph
    std::optional<CollectionId> layout;
};

/**
 * @brief interface of all layout algorithms: an instance is created per component and `run` places the vertices
 * of `digraph` (setting `Vertex::pos`) and optionally routes its arcs (setting `Arc::path`).
 */
class LayoutAlgorithm {
protected:
    AlgorithmContext _context;

public:
    explicit LayoutAlgorithm(AlgorithmContext context) : _context(context) {}
    virtual ~LayoutAlgorithm() = default;

    LayoutAlgorithm(const LayoutAlgorithm&)            = delete;
    LayoutAlgorithm& operator=(const LayoutAlgorithm&) = delete;

    virtual void run(Digraph& digraph, const property_map& options) = 0;

    [[nodiscard]] const AlgorithmContext& context() const noexcept { return _context; }
};

} // namespace gd

#endif // GD_LAYOUT_ALGORITHM_HPP
