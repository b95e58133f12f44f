#include <gd/algorithm/force/SpringHu2006.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

#include <fmt/format.h>

#include <gd/Error.hpp>
#include <gd/algorithm/force/PathLengths.hpp>

namespace gd::force {

namespace {
constexpr double kVirtuallyZero = 0.1;
} // namespace

void Hu2006Layout::run(Digraph& /*digraph*/, const property_map& options) {
    Digraph&    graph = _context.ugraph;
    Parameters& p     = _parameters;

    const double iterations = options::required<double>(options, "iterations");
    p.coolingFactor         = options::required<double>(options, "cooling factor");
    p.initialStepLength     = options::required<double>(options, "initial step length");
    p.convergenceTolerance  = options::required<double>(options, "convergence tolerance");
    p.naturalSpringLength   = options::required<double>(options, "node distance");
    p.coarsen               = options::required<bool>(options, "coarsen");
    p.downsizeRatio         = std::clamp(options::required<double>(options, "downsize ratio"), 0.0, 1.0);
    p.minimumGraphSize      = options::required<double>(options, "minimum coarsening size");

    if (iterations < 0.0) {
        throw gd::exception(fmt::format("iterations (value: {}) need to be greater than 0", iterations));
    }
    if (p.coolingFactor < 0.0 || p.coolingFactor > 1.0) {
        throw gd::exception(fmt::format("the cooling factor (value: {}) needs to be between 0 and 1", p.coolingFactor));
    }
    if (p.initialStepLength < 0.0) {
        throw gd::exception(fmt::format("the initial step length (value: {}) needs to be greater than or equal to 0", p.initialStepLength));
    }
    if (p.convergenceTolerance < 0.0) {
        throw gd::exception(fmt::format("the convergence tolerance (value: {}) needs to be greater than or equal to 0", p.convergenceTolerance));
    }
    if (p.naturalSpringLength < 0.0) {
        throw gd::exception(fmt::format("the natural spring dimension (value: {}) needs to be greater than or equal to 0", p.naturalSpringLength));
    }
    if (p.minimumGraphSize < 2.0) {
        throw gd::exception(fmt::format("the minimum coarsening size of coarse graphs (value: {}) needs to be greater than or equal to 2", p.minimumGraphSize));
    }
    p.iterations = static_cast<std::size_t>(iterations);

    const auto n   = static_cast<double>(graph.size());
    const auto e   = static_cast<double>(graph.arcs().size()) / 2.0; // every edge is present in both directions
    p.graphSize    = n;
    p.graphDensity = n > 1.0 ? 2.0 * e / (n * (n - 1.0)) : 0.0;

    readOptions(options);

    CoarseGraph coarseGraph(graph, _context.random, _attributes, CoarseGraph::Expansion::interpolate);
    if (!p.coarsen) {
        computeInitialLayout(graph, p.naturalSpringLength);
        computeForceLayout(graph, meanEdgeLength(graph, p.naturalSpringLength), StepUpdate::adaptive);
        return;
    }

    while (static_cast<double>(coarseGraph.getSize()) > p.minimumGraphSize && coarseGraph.getRatio() <= 1.0 - p.downsizeRatio && coarseGraph.getRatio() < 1.0) {
        coarseGraph.coarsen();
    }

    computeInitialLayout(graph, p.naturalSpringLength);
    const double springLength = meanEdgeLength(graph, p.naturalSpringLength);
    if (coarseGraph.getSize() > 2UZ) {
        computeForceLayout(graph, springLength, StepUpdate::adaptive);
    }

    while (coarseGraph.getLevel() > 0UZ) {
        const auto parentDiameter = static_cast<double>(pseudoDiameter(graph).diameter);
        coarseGraph.uncoarsen();
        const auto currentDiameter = static_cast<double>(pseudoDiameter(graph).diameter);
        if (parentDiameter > 0.0) {
            for (VertexId v : graph.vertices()) {
                if (!_fixed.contains(v)) {
                    graph[v].pos *= currentDiameter / parentDiameter;
                }
            }
        }
        computeForceLayout(graph, springLength, StepUpdate::conservative);
    }
}

void Hu2006Layout::fixateNodes(Digraph& graph) {
    for (VertexId v : graph.vertices()) {
        if (auto desired = options::coordinate(graph[v].options, "desired at")) {
            graph[v].pos = *desired;
            _fixed.insert(v);
        }
    }
}

void Hu2006Layout::computeInitialLayout(Digraph& graph, double springLength) {
    fixateNodes(graph);
    const Parameters& p      = _parameters;
    const double      spread = springLength * p.graphDensity * std::sqrt(p.graphSize) / 2.0;

    if (graph.size() == 2UZ) {
        const VertexId first  = graph.vertices()[0];
        const VertexId second = graph.vertices()[1];
        if (_fixed.contains(first) && _fixed.contains(second)) {
            return;
        }
        const VertexId anchor = _fixed.contains(second) ? second : first;
        const VertexId loose  = _fixed.contains(second) ? first : second;
        if (!_fixed.contains(first) && !_fixed.contains(second)) {
            graph[first].pos = Coordinate{0.0, 0.0};
        }
        const double dx       = _context.random.random(1.0, springLength);
        const double dy       = _context.random.random(1.0, springLength);
        // a graph of two vertices is placed at its natural spring length
        const double distance = p.graphSize == 2.0 ? springLength : pairSpread() * spread;
        graph[loose].pos      = graph[anchor].pos + Coordinate{dx, dy}.normalized() * distance;
        return;
    }

    const double radius = initialSpread() * spread;
    for (VertexId v : graph.vertices()) {
        if (_fixed.contains(v)) {
            continue;
        }
        const double x = _context.random.random(-radius, radius);
        const double y = _context.random.random(-radius, radius);
        graph[v].pos   = Coordinate{x, y};
    }
}

Coordinate Hu2006Layout::jitter() {
    const double x = kVirtuallyZero + _context.random.random() * kVirtuallyZero;
    const double y = kVirtuallyZero + _context.random.random() * kVirtuallyZero;
    return {x, y};
}

double Hu2006Layout::meanEdgeLength(const Digraph& graph, double fallback) {
    const std::vector<ArcId> arcs = graph.arcs();
    if (arcs.empty()) {
        return fallback;
    }
    double sum = 0.0;
    for (ArcId a : arcs) {
        sum += distance(graph[graph[a].head].pos, graph[graph[a].tail].pos);
    }
    return sum / static_cast<double>(arcs.size());
}

double Hu2006Layout::updateStep(StepUpdate update, double step, double energy, double oldEnergy, std::size_t& progress) const noexcept {
    const double cooling = _parameters.coolingFactor;
    if (update == StepUpdate::conservative) {
        return cooling * step;
    }
    if (energy < oldEnergy) {
        if (++progress >= 5UZ) {
            progress = 0UZ;
            return step / cooling;
        }
        return step;
    }
    progress = 0UZ;
    return cooling * step;
}

void SpringElectricalHu2006::readOptions(const property_map& options) {
    _springConstant = _presetSpringConstant.value_or(options::required<double>(options, "spring constant"));
    _forceOrder     = options::required<double>(options, "electric force order");
    _approximate    = options::required<bool>(options, "approximate remote forces");
    if (_springConstant < 0.0) {
        throw gd::exception(fmt::format("the spring constant (value: {}) needs to be greater or equal to 0", _springConstant));
    }
    if (_parameters.downsizeRatio < 0.0 || _parameters.downsizeRatio > 1.0) {
        throw gd::exception(fmt::format("the downsize ratio (value: {}) needs to be between 0 and 1", _parameters.downsizeRatio));
    }

    Digraph& graph = _context.ugraph;
    for (VertexId v : graph.vertices()) {
        _attributes.weight[v] = options::value<double>(graph[v].options, "electric charge", 1.0);
    }
}

QuadTree SpringElectricalHu2006::buildQuadTree(const Digraph& graph) {
    Coordinate minPos = graph[graph.vertices().front()].pos;
    Coordinate maxPos = minPos;
    for (VertexId v : graph.vertices()) {
        const Coordinate& pos = graph[v].pos;
        minPos                = {std::min(minPos.x, pos.x), std::min(minPos.y, pos.y)};
        maxPos                = {std::max(maxPos.x, pos.x), std::max(maxPos.y, pos.y)};
    }
    if (minPos == maxPos) {
        maxPos += jitter();
    }
    minPos -= Coordinate{1.0, 1.0};
    maxPos += Coordinate{1.0, 1.0};

    QuadTree tree(minPos.x, minPos.y, maxPos.x - minPos.x, maxPos.y - minPos.y);
    for (VertexId v : graph.vertices()) {
        tree.insert(QuadTree::Particle{.pos = graph[v].pos, .mass = _attributes.weight.at(v), .vertex = v, .subparticles = {}});
    }
    return tree;
}

Coordinate SpringElectricalHu2006::repulsion(const Digraph& graph, VertexId v, double springLength) {
    Coordinate force;
    for (VertexId u : graph.vertices()) {
        if (u == v) {
            continue;
        }
        Coordinate delta = graph[u].pos - graph[v].pos;
        if (delta.norm() < kVirtuallyZero) {
            delta = jitter();
        }
        const double magnitude = -_attributes.weight.at(u) * _springConstant * std::pow(springLength, _forceOrder + 1.0) / std::pow(delta.norm(), _forceOrder);
        force += delta.normalized() * magnitude;
    }
    return force;
}

Coordinate SpringElectricalHu2006::approximatedRepulsion(const Digraph& graph, VertexId v, double springLength, const QuadTree& tree) {
    Coordinate force;
    auto       push = [&](const Coordinate& pos, double mass) {
        Coordinate delta = pos - graph[v].pos;
        if (delta.norm() < kVirtuallyZero) {
            delta = jitter();
        }
        const double magnitude = -mass * _springConstant * std::pow(springLength, _forceOrder + 1.0) / std::pow(delta.norm(), _forceOrder);
        force += delta.normalized() * magnitude;
    };

    const QuadTree::Particle self{.pos = graph[v].pos, .mass = _attributes.weight.at(v), .vertex = v, .subparticles = {}};
    for (const QuadTree::Cell* cell : tree.findInteractionCells(self, QuadTree::barnesHutCriterion)) {
        if (!cell->subcells.empty()) {
            if (cell->centerOfMass) {
                push(*cell->centerOfMass, cell->mass);
            }
            continue;
        }
        for (const QuadTree::Particle& particle : cell->particles) {
            for (const QuadTree::Particle& sub : particle.subparticles) {
                if (sub.vertex != v) {
                    push(sub.pos, sub.mass);
                }
            }
            if (particle.vertex != v) {
                push(particle.pos, particle.mass);
            }
        }
    }
    return force;
}

void SpringElectricalHu2006::computeForceLayout(Digraph& graph, double springLength, StepUpdate update) {
    fixateNodes(graph);
    const Parameters& p = _parameters;

    double      step      = p.initialStepLength == 0.0 ? springLength : p.initialStepLength;
    bool        converged = false;
    double      energy    = std::numeric_limits<double>::infinity();
    std::size_t progress  = 0UZ;

    for (std::size_t iteration = 0UZ; !converged && iteration < p.iterations; ++iteration) {
        std::unordered_map<VertexId, Coordinate> oldPositions;
        for (VertexId v : graph.vertices()) {
            oldPositions.emplace(v, graph[v].pos);
        }
        const double oldEnergy = energy;
        energy                 = 0.0;

        std::optional<QuadTree> tree;
        if (_approximate) {
            tree.emplace(buildQuadTree(graph));
        }

        for (VertexId v : graph.vertices()) {
            if (_fixed.contains(v)) {
                continue;
            }
            Coordinate d = tree ? approximatedRepulsion(graph, v, springLength, *tree) : repulsion(graph, v, springLength);
            for (ArcId a : graph.outgoing(v)) {
                Coordinate delta = graph[graph[a].head].pos - graph[v].pos;
                if (delta.norm() < kVirtuallyZero) {
                    delta = jitter();
                }
                const double norm = delta.norm();
                d += delta.normalized() * (norm * norm / springLength);
            }
            if (d.norm() > 0.0) {
                graph[v].pos += d.normalized() * step;
            }
            energy += d * d;
        }

        step = updateStep(update, step, energy, oldEnergy, progress);

        double maxMovement = 0.0;
        for (VertexId v : graph.vertices()) {
            maxMovement = std::max(maxMovement, distance(graph[v].pos, oldPositions[v]));
        }
        converged = maxMovement < springLength * p.convergenceTolerance;
    }
}

void SpringHu2006::readOptions(const property_map& /*options*/) {
    for (VertexId v : _context.ugraph.vertices()) {
        _attributes.weight[v] = 1.0;
    }
}

void SpringHu2006::computeForceLayout(Digraph& graph, double springLength, StepUpdate update) {
    fixateNodes(graph);
    const Parameters&   p         = _parameters;
    const DistanceTable distances = floydWarshall(graph);
    const double        far       = static_cast<double>(graph.size() + 1UZ);

    double      step      = p.initialStepLength == 0.0 ? springLength : p.initialStepLength;
    bool        converged = false;
    double      energy    = std::numeric_limits<double>::infinity();
    std::size_t progress  = 0UZ;

    for (std::size_t iteration = 0UZ; !converged && iteration < p.iterations; ++iteration) {
        std::unordered_map<VertexId, Coordinate> oldPositions;
        for (VertexId v : graph.vertices()) {
            oldPositions.emplace(v, graph[v].pos);
        }
        const double oldEnergy = energy;
        energy                 = 0.0;

        for (VertexId v : graph.vertices()) {
            if (_fixed.contains(v)) {
                continue;
            }
            Coordinate d;
            for (VertexId u : graph.vertices()) {
                if (u == v) {
                    continue;
                }
                Coordinate delta = graph[u].pos - graph[v].pos;
                if (delta.norm() < kVirtuallyZero) {
                    delta = jitter();
                }
                const double graphDistance = std::isfinite(distances(u, v)) ? distances(u, v) : far;
                d += delta.normalized() * (delta.norm() - springLength * graphDistance);
            }
            if (d.norm() > 0.0) {
                graph[v].pos += d.normalized() * step;
            }
            energy += d * d;
        }

        step = updateStep(update, step, energy, oldEnergy, progress);

        double maxMovement = 0.0;
        for (VertexId v : graph.vertices()) {
            maxMovement = std::max(maxMovement, distance(graph[v].pos, oldPositions[v]));
        }
        converged = maxMovement < springLength * p.convergenceTolerance;
    }
}

} // namespace gd::force
