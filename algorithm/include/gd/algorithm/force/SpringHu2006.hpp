#ifndef GD_ALGORITHM_FORCE_SPRINGHU2006_HPP
#define GD_ALGORITHM_FORCE_SPRINGHU2006_HPP

#include <cstddef>
#include <optional>
#include <unordered_set>

#include <gd/LayoutAlgorithm.hpp>
#include <gd/algorithm/force/CoarseGraph.hpp>
#include <gd/algorithm/force/QuadTree.hpp>

namespace gd::force {

/**
 * @brief common driver of Hu's multilevel layouts.
 *
 * The graph is coarsened while it shrinks by at least `downsize ratio`, the coarsest graph gets an initial layout
 * and a force layout with adaptive step length; every interpolation step back to a finer level is followed by a
 * rescaling with the ratio of the pseudo diameters and a force layout with conservative step length. Vertices with a
 * `desired at` option are fixed at that position.
 * @see Y. Hu, "Efficient, high quality force-directed graph drawing", The Mathematica Journal 10(1), 2006
 */
class Hu2006Layout : public LayoutAlgorithm {
protected:
    enum class StepUpdate { adaptive, conservative };

    struct Parameters {
        std::size_t iterations           = 500UZ;
        double      coolingFactor        = 0.95;
        double      initialStepLength    = 0.0;
        double      convergenceTolerance = 0.01;
        double      naturalSpringLength  = 0.0;
        bool        coarsen              = true;
        double      downsizeRatio        = 0.25;
        double      minimumGraphSize     = 2.0;
        double      graphSize            = 0.0;
        double      graphDensity         = 0.0;
    };

    Parameters                   _parameters;
    CoarseningAttributes         _attributes;
    std::unordered_set<VertexId> _fixed;

public:
    explicit Hu2006Layout(AlgorithmContext context) : LayoutAlgorithm(context) {}

    void run(Digraph& digraph, const property_map& options) override;

protected:
    /// reads and validates the options the derived layout needs besides the common ones
    virtual void readOptions(const property_map& options) = 0;
    /// factor of `spring length · density · √size / 2` that bounds the random initial positions
    [[nodiscard]] virtual double initialSpread() const noexcept = 0;
    /// the same factor for the distance of the two vertices of a coarsest graph of size 2
    [[nodiscard]] virtual double pairSpread() const noexcept = 0;
    virtual void                 computeForceLayout(Digraph& graph, double springLength, StepUpdate update) = 0;

    void fixateNodes(Digraph& graph);
    void computeInitialLayout(Digraph& graph, double springLength);

    [[nodiscard]] Coordinate    jitter();
    [[nodiscard]] static double meanEdgeLength(const Digraph& graph, double fallback);
    [[nodiscard]] double        updateStep(StepUpdate update, double step, double energy, double oldEnergy, std::size_t& progress) const noexcept;
};

/// Hu's spring-electrical model: repulsion `-w·C·K^(p+1)/d^p` between all pairs, attraction `d²/K` along the arcs
class SpringElectricalHu2006 : public Hu2006Layout {
    std::optional<double> _presetSpringConstant;
    double                _springConstant = 0.01;
    double                _forceOrder     = 1.0;
    bool                  _approximate    = false;

public:
    explicit SpringElectricalHu2006(AlgorithmContext context, std::optional<double> springConstant = std::nullopt) : Hu2006Layout(context), _presetSpringConstant(springConstant) {}

protected:
    void                 readOptions(const property_map& options) override;
    [[nodiscard]] double initialSpread() const noexcept override { return 3.0; }
    [[nodiscard]] double pairSpread() const noexcept override { return 3.0; }
    void                 computeForceLayout(Digraph& graph, double springLength, StepUpdate update) override;

private:
    [[nodiscard]] Coordinate repulsion(const Digraph& graph, VertexId v, double springLength);
    [[nodiscard]] Coordinate approximatedRepulsion(const Digraph& graph, VertexId v, double springLength, const QuadTree& tree);
    [[nodiscard]] QuadTree   buildQuadTree(const Digraph& graph);
};

/// Hu's spring model: every pair is a spring whose rest length is `K` times the graph distance
class SpringHu2006 : public Hu2006Layout {
public:
    using Hu2006Layout::Hu2006Layout;

protected:
    void                 readOptions(const property_map& options) override;
    [[nodiscard]] double initialSpread() const noexcept override { return 2.0; }
    [[nodiscard]] double pairSpread() const noexcept override { return 1.8; }
    void                 computeForceLayout(Digraph& graph, double springLength, StepUpdate update) override;
};

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_SPRINGHU2006_HPP
