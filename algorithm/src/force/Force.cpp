#include <gd/algorithm/force/Force.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

#include <gd/algorithm/force/QuadTree.hpp>

namespace gd::force {

namespace {

constexpr double kMinimumDistance = 0.1;

double gridRound(double n) { return std::floor((n * 10.0 + 0.5) / 10.0); }

} // namespace

double Force::timeFactor(double tNow) const { return _config.timeFunction(options::required<double>(_options, "maximum time"), tNow); }

Coordinate Force::capped(Coordinate c) const noexcept {
    if (_config.cap) {
        const double cap = *_config.cap;
        c.x              = std::clamp(c.x, -cap, cap);
        c.y              = std::clamp(c.y, -cap, cap);
    }
    return c;
}

void Force::applyToPairs(ForceStep& step, const std::vector<VertexPair>& pairs, double tf) const {
    for (const auto& [tail, head] : pairs) {
        const Coordinate delta = step.graph[head].pos - step.graph[tail].pos;
        const double     d     = std::max(delta.norm(), kMinimumDistance);
        ForceArguments   args{.k = step.k, .d = d, .u = head, .v = tail, .attributes = _attributes, .options = _options};
        if (!_config.funV) {
            const Coordinate f = capped(delta * (_config.funU(args) * tf / d));
            step.netForces[tail] -= f;
            step.netForces[head] += f;
        } else {
            step.netForces[tail] -= capped(delta * (_config.funV(args) * tf / d));
            step.netForces[head] += capped(delta * (_config.funU(args) * tf / d));
        }
    }
}

void ForceCanvasDistance::preprocess(const Digraph& graph) {
    _vertices    = graph.vertices();
    _approximate = options::value<bool>(_options, "approximate remote forces", false);
    _pairs       = _approximate ? std::vector<VertexPair>{} : allPairs(_vertices);
}

void ForceCanvasDistance::applyTo(ForceStep& step) {
    const double tf = timeFactor(step.tNow);
    if (tf == 0.0) {
        return;
    }
    if (_approximate) {
        applyApproximated(step, tf);
    } else {
        applyToPairs(step, _pairs, tf);
    }
}

void ForceCanvasDistance::applyApproximated(ForceStep& step, double tf) const {
    if (_vertices.empty()) {
        return;
    }
    Coordinate minPos{std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    Coordinate maxPos{std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    for (VertexId v : _vertices) {
        const Coordinate& p = step.graph[v].pos;
        minPos              = {std::min(minPos.x, p.x), std::min(minPos.y, p.y)};
        maxPos              = {std::max(maxPos.x, p.x), std::max(maxPos.y, p.y)};
    }
    minPos -= Coordinate{1.0, 1.0};
    maxPos += Coordinate{1.0, 1.0};

    QuadTree tree(minPos.x, minPos.y, maxPos.x - minPos.x, maxPos.y - minPos.y);
    for (VertexId v : _vertices) {
        tree.insert(QuadTree::Particle{.pos = step.graph[v].pos, .mass = 1.0, .vertex = v, .subparticles = {}});
    }

    auto push = [&](VertexId v, const Coordinate& other, VertexId otherVertex, double mass) {
        const Coordinate delta = other - step.graph[v].pos;
        const double     d     = std::max(delta.norm(), kMinimumDistance);
        ForceArguments   args{.k = step.k, .d = d, .u = otherVertex, .v = v, .attributes = _attributes, .options = _options};
        step.netForces[v] -= capped(delta * (_config.funU(args) * tf * mass / d));
    };

    for (VertexId v : _vertices) {
        const QuadTree::Particle self{.pos = step.graph[v].pos, .mass = 1.0, .vertex = v, .subparticles = {}};
        for (const QuadTree::Cell* cell : tree.findInteractionCells(self, QuadTree::barnesHutCriterion)) {
            if (cell->subcells.empty()) {
                for (const QuadTree::Particle& particle : cell->particles) {
                    if (particle.vertex != v) {
                        push(v, particle.pos, particle.vertex.value_or(v), particle.mass);
                    }
                    for (const QuadTree::Particle& sub : particle.subparticles) {
                        if (sub.vertex != v) {
                            push(v, sub.pos, sub.vertex.value_or(v), sub.mass);
                        }
                    }
                }
            } else if (cell->centerOfMass) {
                push(v, *cell->centerOfMass, v, cell->mass);
            }
        }
    }
}

void ForceGraphDistance::preprocess(const Digraph& graph) { _pairs = overExactlyNPairs(graph, _config.n); }

void ForceGraphDistance::applyTo(ForceStep& step) {
    const double tf = timeFactor(step.tNow);
    if (tf == 0.0) {
        return;
    }
    applyToPairs(step, _pairs, tf);
}

void ForcePullToPoint::preprocess(const Digraph& graph) {
    _points.clear();
    for (VertexId v : graph.vertices()) {
        if (auto desired = options::coordinate(graph[v].options, "desired at")) {
            _points.emplace_back(v, *desired);
        }
    }
}

void ForcePullToPoint::applyTo(ForceStep& step) {
    const double tf = timeFactor(step.tNow);
    if (tf == 0.0) {
        return;
    }
    for (const auto& [v, point] : _points) {
        const Coordinate delta = step.graph[v].pos - point;
        const double     d     = std::max(delta.norm(), kMinimumDistance);
        step.netForces[v] -= capped(delta * (d * tf));
    }
}

void ForcePullToGrid::preprocess(const Digraph& graph) { _vertices = graph.vertices(); }

void ForcePullToGrid::applyTo(ForceStep& step) {
    const double tf = timeFactor(step.tNow);
    if (tf == 0.0) {
        return;
    }
    const double     gridX  = options::required<double>(_options, "grid x length");
    const double     gridY  = options::required<double>(_options, "grid y length");
    constexpr double length = 5.0;
    for (VertexId v : _vertices) {
        const Coordinate& p     = step.graph[v].pos;
        const Coordinate  delta = p - Coordinate{gridRound(p.x / gridX) * gridX, gridRound(p.y / gridY) * gridY};
        const double      d     = std::max(delta.norm(), kMinimumDistance);
        step.netForces[v] -= capped(delta * (-d / (length * length) * tf));
    }
}

void ForceCanvasPosition::preprocess(const Digraph& graph) { _vertices = graph.vertices(); }

void ForceCanvasPosition::applyTo(ForceStep& step) {
    const double tf = timeFactor(step.tNow);
    if (tf == 0.0 || _vertices.empty()) {
        return;
    }
    Coordinate centroid;
    for (VertexId v : _vertices) {
        centroid += step.graph[v].pos;
    }
    centroid /= static_cast<double>(_vertices.size());
    for (VertexId v : _vertices) {
        ForceArguments args{.k = step.k, .d = 0.0, .u = v, .v = v, .attributes = _attributes, .options = _options};
        step.netForces[v] += capped((centroid - step.graph[v].pos) * (_config.funU(args) * tf));
    }
}

void ForceAbsoluteValue::preprocess(const Digraph& graph) {
    _vertices.clear();
    for (VertexId v : graph.vertices()) {
        if (std::ranges::find(_config.vertexNames, graph[v].name) != _config.vertexNames.end()) {
            _vertices.push_back(v);
        }
    }
}

void ForceAbsoluteValue::applyTo(ForceStep& step) {
    const double tf = timeFactor(step.tNow);
    if (tf == 0.0) {
        return;
    }
    const double f = _config.value * tf;
    for (VertexId v : _vertices) {
        step.netForces[v] += capped(Coordinate{f, f});
    }
}

} // namespace gd::force
