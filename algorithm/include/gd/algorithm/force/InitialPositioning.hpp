#ifndef GD_ALGORITHM_FORCE_INITIALPOSITIONING_HPP
#define GD_ALGORITHM_FORCE_INITIALPOSITIONING_HPP

#include <memory>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <gd/AlgorithmRegistry.hpp>
#include <gd/Coordinate.hpp>
#include <gd/Digraph.hpp>
#include <gd/Options.hpp>
#include <gd/rng/RandomSource.hpp>

namespace gd::force {

struct InitialPositioningContext {
    Digraph&                                            graph;
    const property_map&                                 options;
    rng::RandomSource&                                  random;
    const std::vector<std::pair<VertexId, Coordinate>>& desired; ///< vertices with a `desired at` option
};

/**
 * @brief places the vertices before the first simulation step. Vertices with a desired position are put there;
 * the others are arranged around the centroid of the desired positions.
 */
class InitialPositioning {
protected:
    InitialPositioningContext _context;

public:
    explicit InitialPositioning(InitialPositioningContext context) : _context(context) {}
    virtual ~InitialPositioning() = default;

    virtual void run() = 0;

protected:
    struct Placement {
        std::unordered_set<VertexId> placed;
        Coordinate                   centroid;
    };

    /// puts the desired vertices at their positions
    Placement placeDesired();
};

class RandomInitialPositioning : public InitialPositioning {
public:
    using InitialPositioning::InitialPositioning;
    void run() override;
};

class CircularInitialPositioning : public InitialPositioning {
public:
    using InitialPositioning::InitialPositioning;
    void run() override;
};

class GridInitialPositioning : public InitialPositioning {
public:
    using InitialPositioning::InitialPositioning;
    void run() override;
};

using InitialPositioningRegistry = Registry<InitialPositioning, InitialPositioningContext>;

/// `random initial position`, `circular initial position` and `grid initial position`
[[nodiscard]] const InitialPositioningRegistry& initialPositioningRegistry();

/// runs the positioning named by the `initial positioning` option
void positionInitially(InitialPositioningContext context);

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_INITIALPOSITIONING_HPP
