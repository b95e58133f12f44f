#ifndef GD_ALGORITHM_FORCE_FORCELAYOUTS_HPP
#define GD_ALGORITHM_FORCE_FORCELAYOUTS_HPP

#include <gd/LayoutAlgorithm.hpp>

namespace gd::force {

/**
 * @brief Hu's spring-electrical model on the force framework: electric repulsion `k²/d` between all pairs and spring
 * attraction `d²/k` along the arcs, both active while expanding and afterwards.
 * @see Y. Hu, "Efficient, high quality force-directed graph drawing", The Mathematica Journal 10(1), 2006
 */
class HuSpringElectricalFW : public LayoutAlgorithm {
public:
    using LayoutAlgorithm::LayoutAlgorithm;
    void run(Digraph& digraph, const property_map& options) override;
};

/**
 * @brief Fruchterman–Reingold without coarsening; the repulsion is halved during the first half of the virtual time
 * and doubled afterwards.
 * @see T. Fruchterman, E. Reingold, "Graph Drawing by Force-directed Placement", Software: Practice and Experience 21(11), 1991
 */
class FruchtermanReingold : public LayoutAlgorithm {
public:
    using LayoutAlgorithm::LayoutAlgorithm;
    void run(Digraph& digraph, const property_map& options) override;
};

/// springs along the arcs only, with rest length `node distance`
class SimpleSpring : public LayoutAlgorithm {
public:
    using LayoutAlgorithm::LayoutAlgorithm;
    void run(Digraph& digraph, const property_map& options) override;
};

/**
 * @brief social gravity: vertices are pulled to the centroid with a strength proportional to their degree times
 * `gravity`.
 * @see M. Bannister et al., "Force-Directed Graph Drawing Using Social Gravity and Scaling", CoRR abs/1209.0748, 2012
 */
class SocialGravityDegree : public LayoutAlgorithm {
public:
    using LayoutAlgorithm::LayoutAlgorithm;
    void run(Digraph& digraph, const property_map& options) override;
};

/// social gravity with the closeness (inverse mean hop distance) as social mass
class SocialGravityCloseness : public LayoutAlgorithm {
public:
    using LayoutAlgorithm::LayoutAlgorithm;
    void run(Digraph& digraph, const property_map& options) override;
};

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_FORCELAYOUTS_HPP
