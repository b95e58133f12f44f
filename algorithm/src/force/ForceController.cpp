#include <gd/algorithm/force/ForceController.hpp>

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include <gd/Error.hpp>
#include <gd/algorithm/force/InitialPositioning.hpp>

namespace gd::force {

const std::vector<std::string>& ForceController::defaultEpochs() {
    static const std::vector<std::string> kEpochs{"preprocessing", "initial layout", "start coarsening process", "before coarsen", "start coarsen", "during coarsen", "end coarsen", //
        "before expand", "start expand", "during expand", "end expand", "end coarsening process", "after expand", "postprocessing"};
    return kEpochs;
}

ForceController::ForceController(Digraph& ugraph, rng::RandomSource& random, property_map options, CoarseningAttributes& attributes) : _ugraph(ugraph), _random(random), _options(std::move(options)), _attributes(attributes) {}

void ForceController::addEpoch(std::string name, std::optional<std::string_view> before) {
    if (findEpoch(name)) {
        throw gd::exception(fmt::format("epoch '{}' already exists", name));
    }
    if (!before) {
        _epochs.push_back(std::move(name));
        return;
    }
    _epochs.insert(_epochs.begin() + static_cast<std::ptrdiff_t>(requireEpoch(*before)), std::move(name));
}

std::optional<std::size_t> ForceController::findEpoch(std::string_view name) const {
    if (auto it = std::ranges::find(_epochs, name); it != _epochs.end()) {
        return static_cast<std::size_t>(std::distance(_epochs.begin(), it));
    }
    return std::nullopt;
}

std::size_t ForceController::requireEpoch(std::string_view name) const {
    if (auto index = findEpoch(name)) {
        return *index;
    }
    throw gd::exception(fmt::format("unknown epoch '{}'", name));
}

std::vector<std::pair<VertexId, Coordinate>> ForceController::desiredVertices() const {
    std::vector<std::pair<VertexId, Coordinate>> desired;
    for (VertexId v : _ugraph.vertices()) {
        if (auto point = options::coordinate(_ugraph[v].options, "desired at")) {
            desired.emplace_back(v, *point);
        }
    }
    return desired;
}

void ForceController::preprocess(std::string_view epoch) {
    if (auto it = _epochForces.find(epoch); it != _epochForces.end()) {
        for (Force* force : it->second) {
            force->preprocess(_ugraph);
        }
    }
}

void ForceController::moveVertices(std::string_view epoch) {
    auto it = _epochForces.find(epoch);
    if (it == _epochForces.end() || it->second.empty()) {
        return;
    }
    const auto   iterations      = static_cast<std::size_t>(epochOption<double>("iterations", epoch));
    const bool   findEquilibrium = epochOption<bool>("find equilibrium", epoch);
    const double epsilon         = epochOption<double>("equilibrium threshold", epoch);
    const double speed           = epochOption<double>("global speed factor", epoch);
    const double maxStep         = epochOption<double>("maximum displacement per step", epoch);
    if (epsilon < 0.0) {
        throw gd::exception(fmt::format("the threshold for finding an equilibirum (equilibrium threshold) (value: {}) needs to be greater than or equal to 0", epsilon));
    }
    if (speed <= 0.0) {
        throw gd::exception(fmt::format("the speed at which the vertices move (value: {}) needs to be greater than 0", speed));
    }
    if (maxStep <= 0.0) {
        throw gd::exception(fmt::format("the maximum displacement per step each vertex can move per iteration (value: {}) needs to be greater than 0", maxStep));
    }
    const double maxTime = epochOption<double>("maximum time", epoch);
    const double dt      = maxTime / static_cast<double>(iterations);
    const double k       = options::required<double>(_options, "node distance");
    const auto&  forces  = it->second;

    double tNow = 0.0;
    for (std::size_t j = 1UZ; j <= iterations; ++j) {
        tNow += dt;
        Storage<VertexId, Coordinate> net;
        for (VertexId v : _ugraph.vertices()) {
            net[v] = Coordinate{};
        }
        ForceStep step{.graph = _ugraph, .netForces = net, .tNow = tNow, .k = k, .iteration = j};
        for (Force* force : forces) {
            force->applyTo(step);
        }

        double sum = 0.0;
        for (auto& [v, c] : net) {
            if (const double n = c.norm(); n > maxStep) {
                c *= maxStep / n;
            }
            sum += std::abs(c.x) + std::abs(c.y);
        }

        if (findEquilibrium && sum * dt <= epsilon) {
            break;
        }
        const double coolDown = dt > 1.0 ? 1.0 + 1.0 / dt : dt;
        for (VertexId v : _ugraph.vertices()) {
            _ugraph[v].pos += net.at(v) * (speed * coolDown / _attributes.mass.at(v));
        }
    }
}

void ForceController::run() {
    const double minimumGraphSize = options::required<double>(_options, "minimum coarsening size");
    const double downsizeRatio    = options::required<double>(_options, "downsize ratio");
    const double nodeDistance     = options::required<double>(_options, "node distance");
    const bool   snapToGrid       = options::required<bool>(_options, "snap to grid");
    const bool   coarsen          = options::required<bool>(_options, "coarsen");
    if (minimumGraphSize < 2.0) {
        throw gd::exception(fmt::format("the minimum coarsening size of coarse graphs (value: {}) needs to be greater than or equal to 2", minimumGraphSize));
    }
    if (downsizeRatio < 0.0 || downsizeRatio > 1.0) {
        throw gd::exception(fmt::format("the downsize ratio of the coarse graphs (value: {}) needs to be greater than or equal to 0 and smaller than or equal to 1", downsizeRatio));
    }
    if (nodeDistance < 0.0) {
        throw gd::exception(fmt::format("the node distance (value: {}) needs to be greater than or equal to 0", nodeDistance));
    }

    for (VertexId v : _ugraph.vertices()) {
        const property_map& vertexOptions = _ugraph[v].options;
        _attributes.weight[v]             = options::value<double>(vertexOptions, "coarsening weight", options::required<double>(_options, "coarsening weight"));
        _attributes.mass[v]               = options::value<double>(vertexOptions, "mass", options::required<double>(_options, "mass"));
    }

    if (snapToGrid) {
        addForce<ForcePullToGrid>(ForceConfig{.epochs = {"postprocessing"}, .timeFunction = [](double, double) { return 40.0; }, .cap = 1.0, .funU = {}, .funV = {}, .n = 1UZ, .value = 0.0, .vertexNames = {}});
        _options.try_emplace("iterations postprocessing", 200.0);
        _options.try_emplace("maximum time postprocessing", 200.0);
        _options.try_emplace("find equilibrium postprocessing", true);
        _options.try_emplace("equilibrium threshold postprocessing", 1.0);
        _options.try_emplace("maximum displacement per step postprocessing", 1.0);
        _options.try_emplace("global speed factor postprocessing", 1.0);
    }

    const auto desired = desiredVertices();
    if (!desired.empty() && !_pullToPoint) {
        addForce<ForcePullToPoint>(ForceConfig{.epochs = _epochs, .timeFunction = [](double, double) { return 5.0; }, .cap = std::nullopt, .funU = {}, .funV = {}, .n = 1UZ, .value = 0.0, .vertexNames = {}});
    }

    const std::size_t startCoarsening = requireEpoch("start coarsening process");
    const std::size_t endCoarsening   = requireEpoch("end coarsening process");
    const std::size_t startCoarsen    = requireEpoch("start coarsen");
    const std::size_t endCoarsen      = requireEpoch("end coarsen");
    const std::size_t startExpand     = requireEpoch("start expand");
    const std::size_t endExpand       = requireEpoch("end expand");

    CoarseGraph coarseGraph(_ugraph, _random, _attributes, CoarseGraph::Expansion::jitter);
    bool        initialised = false;
    auto        initialise  = [&] {
        if (!initialised) {
            positionInitially(InitialPositioningContext{.graph = _ugraph, .options = _options, .random = _random, .desired = desired});
            initialised = true;
        }
    };
    auto simulate = [this](std::string_view epoch) {
        preprocess(epoch);
        moveVertices(epoch);
    };
    // a coarsening round that removes no vertex ends the coarsening
    auto keepCoarsening = [&] { return static_cast<double>(coarseGraph.getSize()) > minimumGraphSize && coarseGraph.getRatio() <= 1.0 - downsizeRatio && coarseGraph.getRatio() < 1.0; };

    for (std::size_t i = 0UZ; i < _epochs.size(); ++i) {
        const std::string epoch = _epochs[i];
        if (const double iterations = epochOption<double>("iterations", epoch); iterations < 0.0) {
            throw gd::exception(fmt::format("iterations (value: {}) needs to be greater than 0", iterations));
        }
        const bool outsideCoarsening = i < startCoarsening || i > endCoarsening;
        if (!coarsen || outsideCoarsening) {
            if (outsideCoarsening) {
                initialise();
                simulate(epoch);
            }
            continue;
        }
        if (i == endCoarsening) {
            continue;
        }

        if (i >= startCoarsen && i < startExpand && keepCoarsening()) {
            if (i == startCoarsen) {
                coarseGraph.coarsen();
            } else if (i < endCoarsen) {
                simulate(epoch);
            } else {
                i = startCoarsen - 1UZ; // next round
                continue;
            }
        }
        if (i > endCoarsen && i < startExpand) {
            initialise();
            preprocess(epoch);
        }
        if (i >= startExpand) {
            if (coarseGraph.getLevel() > 0UZ) {
                if (i == startExpand) {
                    coarseGraph.uncoarsen();
                } else if (i < endExpand) {
                    simulate(epoch);
                } else {
                    i = startExpand - 1UZ; // next level
                }
            } else {
                simulate(epoch);
            }
        }
    }
}

} // namespace gd::force
