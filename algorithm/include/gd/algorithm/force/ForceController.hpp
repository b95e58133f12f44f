#ifndef GD_ALGORITHM_FORCE_FORCECONTROLLER_HPP
#define GD_ALGORITHM_FORCE_FORCECONTROLLER_HPP

#include <concepts>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gd/Digraph.hpp>
#include <gd/Options.hpp>
#include <gd/algorithm/force/CoarseGraph.hpp>
#include <gd/algorithm/force/Force.hpp>
#include <gd/rng/RandomSource.hpp>

namespace gd::force {

/**
 * @brief drives a force-directed simulation through a sequence of named epochs.
 *
 * Every force is registered for a set of epochs. Epochs between `start coarsening process` and `end coarsening
 * process` take part in the multilevel scheme: the graph is coarsened while it shrinks fast enough, the coarsest graph
 * is positioned initially, and then every `uncoarsen` step is followed by the `during expand` and `end expand` epochs.
 * All other epochs run once. Options can be overridden per epoch by appending the epoch name, e.g.
 * `iterations after expand`.
 */
class ForceController {
public:
    [[nodiscard]] static const std::vector<std::string>& defaultEpochs();

private:
    Digraph&                                              _ugraph;
    rng::RandomSource&                                    _random;
    property_map                                          _options;
    CoarseningAttributes&                                 _attributes;
    std::vector<std::string>                              _epochs = defaultEpochs();
    std::vector<std::unique_ptr<Force>>                   _forces;
    std::map<std::string, std::vector<Force*>, std::less<>> _epochForces;
    bool                                                  _pullToPoint = false;

public:
    ForceController(Digraph& ugraph, rng::RandomSource& random, property_map options, CoarseningAttributes& attributes);

    template<std::derived_from<Force> TForce>
    TForce& addForce(ForceConfig config) {
        if constexpr (std::same_as<TForce, ForcePullToPoint>) {
            _pullToPoint = true;
        }
        auto   force = std::make_unique<TForce>(std::move(config), _options, _attributes);
        TForce& ref  = *force;
        for (const std::string& epoch : ref.config().epochs) {
            _epochForces[epoch].push_back(&ref);
        }
        _forces.push_back(std::move(force));
        return ref;
    }

    /// inserts a new epoch before `before` (or at the end)
    void addEpoch(std::string name, std::optional<std::string_view> before = std::nullopt);

    [[nodiscard]] std::optional<std::size_t>      findEpoch(std::string_view name) const;
    [[nodiscard]] const std::vector<std::string>& epochs() const noexcept { return _epochs; }
    [[nodiscard]] const property_map&             options() const noexcept { return _options; }

    void run();

private:
    template<typename T>
    [[nodiscard]] T epochOption(std::string_view key, std::string_view epoch) const {
        if (auto specific = options::get<T>(_options, fmt::format("{} {}", key, epoch))) {
            return *specific;
        }
        return options::required<T>(_options, key);
    }

    [[nodiscard]] std::size_t requireEpoch(std::string_view name) const;
    [[nodiscard]] std::vector<std::pair<VertexId, Coordinate>> desiredVertices() const;
    void                                                       preprocess(std::string_view epoch);
    void                                                       moveVertices(std::string_view epoch);
};

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_FORCECONTROLLER_HPP
