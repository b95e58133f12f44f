#ifndef GD_ALGORITHM_FORCE_FORCE_HPP
#define GD_ALGORITHM_FORCE_FORCE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gd/Coordinate.hpp>
#include <gd/Digraph.hpp>
#include <gd/Options.hpp>
#include <gd/Storage.hpp>
#include <gd/algorithm/force/CoarseGraph.hpp>
#include <gd/algorithm/force/Preprocessing.hpp>

namespace gd::force {

/// what a force law gets to see for one vertex pair (`u` is the head, `v` the tail) or one vertex (`u == v`)
struct ForceArguments {
    double                      k = 0.0; ///< natural spring length (`node distance`)
    double                      d = 0.0; ///< distance of the pair, at least 0.1
    VertexId                    u{};
    VertexId                    v{};
    const CoarseningAttributes& attributes;
    const property_map&         options;
};

using ForceFunction = std::function<double(const ForceArguments&)>;
/// modulates a force over the virtual time of an epoch: `f(maximum time, current time)`
using TimeFunction = std::function<double(double tMax, double tNow)>;

/// parameters a force is registered with
struct ForceConfig {
    std::vector<std::string> epochs;
    TimeFunction             timeFunction;
    std::optional<double>    cap;          ///< clamps every component of a contribution to [-cap, cap]
    ForceFunction            funU;         ///< force law (acting on the head when `funV` is set)
    ForceFunction            funV;         ///< separate law for the tail
    std::size_t              n = 1UZ;      ///< graph distance of the pairs (`ForceGraphDistance`)
    double                   value = 0.0;  ///< `ForceAbsoluteValue`
    std::vector<std::string> vertexNames;  ///< `ForceAbsoluteValue`
};

/// one iteration of the simulation as seen by the forces
struct ForceStep {
    Digraph&                        graph;
    Storage<VertexId, Coordinate>&  netForces;
    double                          tNow = 0.0;
    double                          k    = 0.0;
    std::size_t                     iteration = 0UZ;
};

/**
 * @brief interface of the forces of the force framework: `preprocess` selects what the force acts on once per epoch,
 * `applyTo` adds its contribution to the net force of every affected vertex once per iteration.
 */
class Force {
protected:
    ForceConfig                 _config;
    const property_map&         _options;
    const CoarseningAttributes& _attributes;

public:
    Force(ForceConfig config, const property_map& options, const CoarseningAttributes& attributes) : _config(std::move(config)), _options(options), _attributes(attributes) {
        if (!_config.timeFunction) {
            _config.timeFunction = [](double, double) { return 1.0; };
        }
    }
    virtual ~Force() = default;

    Force(const Force&)            = delete;
    Force& operator=(const Force&) = delete;

    virtual void preprocess(const Digraph& graph) = 0;
    virtual void applyTo(ForceStep& step)          = 0;

    [[nodiscard]] const ForceConfig& config() const noexcept { return _config; }

protected:
    [[nodiscard]] double     timeFactor(double tNow) const;
    [[nodiscard]] Coordinate capped(Coordinate c) const noexcept;
    /// pairwise law shared by the canvas and graph distance forces
    void applyToPairs(ForceStep& step, const std::vector<VertexPair>& pairs, double tf) const;
};

/// acts between all vertex pairs; with `approximate remote forces` far-away groups are combined via a Barnes–Hut quadtree
class ForceCanvasDistance : public Force {
    std::vector<VertexPair> _pairs;
    std::vector<VertexId>   _vertices;
    bool                    _approximate = false;

public:
    using Force::Force;
    void preprocess(const Digraph& graph) override;
    void applyTo(ForceStep& step) override;

private:
    void applyApproximated(ForceStep& step, double tf) const;
};

/// acts between the vertex pairs whose graph distance is exactly `n`
class ForceGraphDistance : public Force {
    std::vector<VertexPair> _pairs;

public:
    using Force::Force;
    void preprocess(const Digraph& graph) override;
    void applyTo(ForceStep& step) override;
};

/// pulls every vertex with a `desired at` option towards that point
class ForcePullToPoint : public Force {
    std::vector<std::pair<VertexId, Coordinate>> _points;

public:
    using Force::Force;
    void preprocess(const Digraph& graph) override;
    void applyTo(ForceStep& step) override;
};

/// pulls every vertex towards the nearest point of the `grid x length` × `grid y length` grid
class ForcePullToGrid : public Force {
    std::vector<VertexId> _vertices;

public:
    using Force::Force;
    void preprocess(const Digraph& graph) override;
    void applyTo(ForceStep& step) override;
};

/// pulls every vertex towards the centroid of all vertices, weighted by `funU`
class ForceCanvasPosition : public Force {
    std::vector<VertexId> _vertices;

public:
    using Force::Force;
    void preprocess(const Digraph& graph) override;
    void applyTo(ForceStep& step) override;
};

/// adds a constant `value` to both components of the net force of the named vertices
class ForceAbsoluteValue : public Force {
    std::vector<VertexId> _vertices;

public:
    using Force::Force;
    void preprocess(const Digraph& graph) override;
    void applyTo(ForceStep& step) override;
};

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_FORCE_HPP
