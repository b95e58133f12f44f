#include <gd/algorithm/force/InitialPositioning.hpp>

#include <cmath>
#include <numbers>
#include <string>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd::force {

InitialPositioning::Placement InitialPositioning::placeDesired() {
    Placement result;
    for (const auto& [v, point] : _context.desired) {
        _context.graph[v].pos = point;
        result.centroid += point;
        result.placed.insert(v);
    }
    if (!_context.desired.empty()) {
        result.centroid /= static_cast<double>(_context.desired.size());
    }
    return result;
}

void RandomInitialPositioning::run() {
    const auto [placed, centroid] = placeDesired();
    for (VertexId v : _context.graph.vertices()) {
        if (placed.contains(v)) {
            continue;
        }
        const double x        = 100.0 * _context.random.random();
        const double y        = 100.0 * _context.random.random();
        _context.graph[v].pos = Coordinate{x, y} + centroid;
    }
}

void CircularInitialPositioning::run() {
    const auto&       opts     = _context.options;
    const std::size_t n        = _context.graph.size();
    const double      sep      = options::required<double>(opts, "node pre sep") + options::required<double>(opts, "node post sep") + options::required<double>(opts, "sibling pre sep") + options::required<double>(opts, "sibling post sep");
    const double      minRadius = sep * static_cast<double>(n) / 2.0 / std::numbers::pi;
    const double      radius   = std::max(options::required<double>(opts, "radius"), minRadius);

    const auto [placed, centroid] = placeDesired();
    const double step             = 2.0 * std::numbers::pi / static_cast<double>(n);
    double       angle            = step;
    for (VertexId v : _context.graph.vertices()) {
        if (placed.contains(v)) {
            continue;
        }
        _context.graph[v].pos = Coordinate{std::sin(angle) * radius, std::cos(angle) * radius} + centroid;
        angle += step;
    }
}

void GridInitialPositioning::run() {
    const double dist             = options::required<double>(_context.options, "node distance");
    const auto [placed, centroid] = placeDesired();
    const auto&  vertices         = _context.graph.vertices();
    const double n                = std::ceil(std::sqrt(static_cast<double>(vertices.size())));
    double       x                = -dist;
    double       y                = 0.0;
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        if (placed.contains(vertices[i])) {
            continue;
        }
        if (static_cast<double>(i + 1UZ) <= (y / dist + 1.0) * n) {
            x += dist;
        } else {
            x = 0.0;
            y += dist;
        }
        _context.graph[vertices[i]].pos = Coordinate{x, y} + centroid;
    }
}

const InitialPositioningRegistry& initialPositioningRegistry() {
    static const InitialPositioningRegistry registry = [] {
        InitialPositioningRegistry r;
        r.insert<RandomInitialPositioning>("random initial position");
        r.insert<CircularInitialPositioning>("circular initial position");
        r.insert<GridInitialPositioning>("grid initial position");
        return r;
    }();
    return registry;
}

void positionInitially(InitialPositioningContext context) {
    const auto name        = options::required<std::string>(context.options, "initial positioning");
    auto       positioning = initialPositioningRegistry().create(name, context);
    if (!positioning) {
        throw gd::exception(fmt::format("initial positioning selection failed: '{}' is not a known initial positioning", name));
    }
    positioning->run();
}

} // namespace gd::force
