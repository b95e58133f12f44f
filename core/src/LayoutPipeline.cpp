#include <gd/LayoutPipeline.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <numbers>
#include <span>
#include <unordered_set>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

struct RotatedBox {
    double minX = kInf;
    double maxX = -kInf;
    double minY = kInf;
    double maxY = -kInf;
    double cY   = 0.0;
};

RotatedBox rotatedBox(std::span<const Coordinate> outline, const Coordinate& pos, const Transform& rotation, double sep) {
    const auto toFrame = [&](Coordinate c) { return c.shiftByCoordinate(pos).apply(rotation); };
    RotatedBox box;
    for (const Coordinate& p : outline) {
        const Coordinate c = toFrame(p);
        box.minX           = std::min(box.minX, c.x);
        box.maxX           = std::max(box.maxX, c.x);
        box.minY           = std::min(box.minY, c.y);
        box.maxY           = std::max(box.maxY, c.y);
    }
    box.minX -= sep;
    box.maxX += sep;
    box.minY -= sep;
    box.maxY += sep;
    const BoundingBox local = boundingBox(outline);
    box.cY                  = toFrame(Coordinate{local.centerX, local.centerY}).y;
    return box;
}

struct PackedComponent {
    std::vector<RotatedBox> boxes; // vertices first, then the point cloud of the arcs
    std::size_t             vertexCount = 0UZ;
    std::vector<EdgeId>     cloudEdges;
};

std::vector<EdgeId> cloudEdgesOf(const Digraph& component) {
    const Digraph&             syntactic = component.syntacticDigraph();
    std::vector<EdgeId>        edges;
    std::unordered_set<EdgeId> seen;
    for (ArcId a : component.arcs()) {
        if (auto sa = syntactic.arc(component[a].tail, component[a].head)) {
            for (EdgeId e : syntactic[*sa].syntacticEdges) {
                if (seen.insert(e).second) {
                    edges.push_back(e);
                }
            }
        }
    }
    return edges;
}

double alignmentLine(std::string_view align, const Digraph& component, std::span<const RotatedBox> boxes) {
    double maxMaxY = -kInf;
    double maxCY   = -kInf;
    double minMinY = kInf;
    double minCY   = kInf;
    for (const RotatedBox& box : boxes) {
        maxMaxY = std::max(maxMaxY, box.maxY);
        maxCY   = std::max(maxCY, box.cY);
        minMinY = std::min(minMinY, box.minY);
        minCY   = std::min(minCY, box.cY);
    }

    double line = minMinY;
    if (align == "counterclockwise bounding box") {
        line = maxMaxY;
    } else if (align == "counterclockwise") {
        line = maxCY;
    } else if (align == "center") {
        line = (maxMaxY + minMinY) / 2.0;
    } else if (align == "clockwise") {
        line = minCY;
    } else if (align == "first node") {
        line = boxes.front().cY;
    }

    const auto& vertices = component.vertices();
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        if (component[vertices[i]].hasOption("align here")) {
            return boxes[i].cY;
        }
    }
    return line;
}

} // namespace

LayoutPipeline::LayoutPipeline(Scope& scope, const AlgorithmRegistry& registry) : _scope(scope), _registry(registry), _sublayouts(scope, registry) {}

void LayoutPipeline::run() {
    const auto root = _scope.rootLayout();
    if (!root) {
        throw gd::exception("no layout in scope");
    }
    const bool debug = options::value<bool>(_sublayouts.layoutOptions(*root), "debug layout", false);
    const auto start = std::chrono::steady_clock::now();

    std::unique_ptr<Digraph> result = _sublayouts.layoutRecursively(*root, [this](Digraph& layoutGraph, CollectionId layout, std::string_view algorithm, const AlgorithmTraits& traits) { runOnLayout(layoutGraph, layout, algorithm, traits); });
    _scope.setSyntacticDigraph(std::move(result));

    Digraph& graph = _scope.syntacticDigraph();
    anchor(graph);
    _sublayouts.regardless(graph);
    cutEdges(graph);

    if (debug) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        fmt::println(stderr, "layout of {} vertices took {} us\n{}", graph.size(), elapsed.count(), graph);
    }
}

void LayoutPipeline::runOnLayout(Digraph& layoutGraph, CollectionId layout, std::string_view algorithm, const AlgorithmTraits& traits) {
    if (layoutGraph.empty()) {
        return;
    }
    const property_map& layoutOptions = layoutGraph.options();
    const bool          debug         = options::value<bool>(layoutOptions, "debug layout", false);

    Digraph layoutCopy(layoutGraph.sharedArena(), &layoutGraph, layoutOptions);
    layoutCopy.add(layoutGraph.vertices());
    for (ArcId a : layoutGraph.arcs()) {
        const ArcId copy                = layoutCopy.connect(layoutGraph[a].tail, layoutGraph[a].head);
        layoutCopy[copy].syntacticEdges = layoutGraph[a].syntacticEdges;
    }

    std::vector<Digraph> components;
    if (traits.tree || traits.connected || options::value<bool>(layoutOptions, "componentwise", false)) {
        components = decompose(layoutCopy);
        sortComponents(options::value<std::string>(layoutOptions, "component order", ""), components);
    } else {
        components.push_back(std::move(layoutCopy));
    }

    const auto seed = static_cast<std::uint64_t>(options::value<double>(layoutOptions, "random seed", 42.0));
    for (Digraph& component : components) {
        _random.reseed(seed);

        Digraph digraph = digraphFromSyntacticDigraph(component);
        if (traits.loopFree) {
            for (VertexId v : digraph.vertices()) {
                digraph.disconnect(v, v);
            }
        }
        Digraph ugraph = ugraphFromDigraph(digraph);

        auto instance = _registry.create(algorithm, AlgorithmContext{.scope = _scope, .random = _random, .ugraph = ugraph, .syntacticComponent = component, .layout = layout});
        if (!instance) {
            throw gd::exception(fmt::format("algorithm selection failed: cannot create '{}'", algorithm));
        }
        if (digraph.size() > 1UZ || traits.runAlsoForSingleNode) {
            const auto start = std::chrono::steady_clock::now();
            instance->run(digraph, layoutOptions);
            if (debug) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
                fmt::println(stderr, "{} on {} vertices: {} us", algorithm, digraph.size(), elapsed.count());
            }
        }
        digraph.sync();
        ugraph.sync();
    }

    packComponents(layoutGraph, components);
}

void LayoutPipeline::anchor(Digraph& graph) const {
    if (graph.empty()) {
        return;
    }
    std::optional<VertexId> anchorVertex;
    if (auto name = options::get<std::string>(graph.options(), "anchor node")) {
        anchorVertex = _scope.vertexByName(*name);
    }
    if (!anchorVertex || !graph.contains(*anchorVertex)) {
        const auto& vertices = graph.vertices();
        auto        it       = std::ranges::find_if(vertices, [&](VertexId v) { return graph[v].hasOption("anchor here"); });
        if (it == vertices.end()) {
            it = std::ranges::find_if(vertices, [&](VertexId v) { return graph[v].hasOption("desired at"); });
        }
        anchorVertex = it != vertices.end() ? *it : vertices.front();
    }

    const Vertex& v       = graph[*anchorVertex];
    auto          desired = options::coordinate(v.options, "desired at");
    if (!desired) {
        desired = options::coordinate(graph.options(), "anchor at");
    }
    const Coordinate delta = desired.value_or(Coordinate{}) - v.pos;

    for (VertexId u : graph.vertices()) {
        graph[u].pos += delta;
    }
    for (ArcId a : graph.arcs()) {
        if (graph[a].path) {
            graph[a].path->shiftByCoordinate(delta);
        }
        for (EdgeId e : graph[a].syntacticEdges) {
            graph.arena()[e].path.shiftByCoordinate(delta);
        }
    }
}

std::vector<Digraph> LayoutPipeline::decompose(const Digraph& digraph) {
    std::vector<Digraph>         components;
    std::unordered_set<VertexId> visited;
    for (VertexId v : digraph.vertices()) {
        if (visited.contains(v)) {
            continue;
        }
        Digraph&              component = components.emplace_back(digraph.sharedArena(), &digraph.syntacticDigraph(), digraph.options());
        std::vector<VertexId> stack{v};
        while (!stack.empty()) {
            const VertexId top = stack.back();
            stack.pop_back();
            if (!visited.insert(top).second) {
                continue;
            }
            component.add(top);
            for (ArcId a : digraph.incoming(top)) {
                if (!visited.contains(digraph[a].tail)) {
                    stack.push_back(digraph[a].tail);
                }
            }
            for (ArcId a : digraph.outgoing(top)) {
                if (!visited.contains(digraph[a].head)) {
                    stack.push_back(digraph[a].head);
                }
            }
        }
    }

    if (components.size() < 2UZ) {
        components.clear();
        Digraph& whole = components.emplace_back(digraph.sharedArena(), &digraph.syntacticDigraph(), digraph.options());
        whole.add(digraph.vertices());
        for (ArcId a : digraph.arcs()) {
            whole[whole.connect(digraph[a].tail, digraph[a].head)].syntacticEdges = digraph[a].syntacticEdges;
        }
        return components;
    }

    for (Digraph& component : components) {
        component.sortVertices([&digraph](VertexId u, VertexId w) { return digraph[u].eventIndex < digraph[w].eventIndex; });
        const std::vector<VertexId> vertices = component.vertices();
        for (VertexId v : vertices) {
            for (ArcId a : digraph.outgoing(v)) {
                component[component.connect(digraph[a].tail, digraph[a].head)].syntacticEdges = digraph[a].syntacticEdges;
            }
            for (ArcId a : digraph.incoming(v)) {
                component[component.connect(digraph[a].tail, digraph[a].head)].syntacticEdges = digraph[a].syntacticEdges;
            }
        }
    }
    return components;
}

void LayoutPipeline::sortComponents(std::string_view order, std::vector<Digraph>& components) {
    const auto firstEvent = [](const Digraph& g) { return g[g.vertices().front()].eventIndex; };
    if (order == "increasing node number") {
        std::ranges::stable_sort(components, [&](const Digraph& g, const Digraph& h) { return g.size() == h.size() ? firstEvent(g) < firstEvent(h) : g.size() < h.size(); });
    } else if (order == "decreasing node number") {
        std::ranges::stable_sort(components, [&](const Digraph& g, const Digraph& h) { return g.size() == h.size() ? firstEvent(g) < firstEvent(h) : g.size() > h.size(); });
    }
}

void LayoutPipeline::packComponents(const Digraph& syntactic, std::vector<Digraph>& components) {
    if (components.empty()) {
        return;
    }
    const property_map& opts     = syntactic.options();
    const double        sep      = options::value<double>(opts, "component sep", 8.0);
    const double        angle    = options::value<double>(opts, "component direction", 0.0) / 180.0 * std::numbers::pi;
    const Transform     rotation = rotationTransform(-angle);
    const std::string   align    = options::value<std::string>(opts, "component align", "first node");
    const bool          rectangular = options::value<std::string>(opts, "component packing", "skyline") == "rectangular";

    const std::array<Coordinate, 1> cloudOutline{Coordinate{0.0, 0.0}};
    std::vector<PackedComponent>    packed(components.size());
    for (std::size_t c = 0UZ; c < components.size(); ++c) {
        const Digraph&   component = components[c];
        PackedComponent& pc        = packed[c];
        for (VertexId v : component.vertices()) {
            pc.boxes.push_back(rotatedBox(component[v].path.coordinates(), component[v].pos, rotation, sep / 2.0));
        }
        pc.vertexCount = pc.boxes.size();
        for (ArcId a : component.arcs()) {
            for (const Coordinate& p : component.pointCloud(a)) {
                pc.boxes.push_back(rotatedBox(cloudOutline, p, rotation, sep / 2.0));
            }
        }
        pc.cloudEdges = cloudEdgesOf(component);
    }

    std::vector<double> xShifts(components.size(), 0.0);
    std::vector<double> yShifts(components.size(), 0.0);
    for (std::size_t c = 0UZ; c < components.size(); ++c) {
        const double line = alignmentLine(align, components[c], std::span(packed[c].boxes).first(packed[c].vertexCount));
        yShifts[c]        = -line;
        for (RotatedBox& box : packed[c].boxes) {
            box.minY -= line;
            box.maxY -= line;
            box.cY -= line;
        }
    }

    std::vector<double> yValues;
    for (const PackedComponent& pc : packed) {
        for (const RotatedBox& box : pc.boxes) {
            yValues.insert(yValues.end(), {box.minY, box.maxY, box.cY});
        }
    }
    std::ranges::sort(yValues);
    std::map<double, std::size_t> yRanks; // equal values map to their last index
    for (std::size_t i = 0UZ; i < yValues.size(); ++i) {
        yRanks[yValues[i]] = i;
    }

    const std::size_t   n = yValues.size();
    std::vector<double> rightFace(n, -kInf);
    for (std::size_t c = 0UZ; c + 1UZ < components.size(); ++c) {
        std::vector<bool> touched(n, false);
        for (const RotatedBox& box : packed[c].boxes) {
            for (std::size_t i = yRanks.at(box.minY); i <= yRanks.at(box.maxY); ++i) {
                touched[i]   = true;
                rightFace[i] = std::max(rightFace[i], box.maxX);
            }
        }
        double rightMax = -kInf;
        for (std::size_t i = 0UZ; i < n; ++i) {
            if (!touched[i]) {
                double interpolate = -kInf;
                for (std::size_t j = i + 1UZ; j < n; ++j) {
                    if (touched[j]) {
                        interpolate = std::max(interpolate, rightFace[j] - (yValues[j] - yValues[i]));
                        break;
                    }
                }
                for (std::size_t j = i; j-- > 0UZ;) {
                    if (touched[j]) {
                        interpolate = std::max(interpolate, rightFace[j] - (yValues[i] - yValues[j]));
                        break;
                    }
                }
                rightFace[i] = std::max(interpolate, rightFace[i]);
            }
            rightMax = std::max(rightMax, rightFace[i]);
        }

        std::vector<double> leftFace(n, kInf);
        std::ranges::fill(touched, false);
        for (const RotatedBox& box : packed[c + 1UZ].boxes) {
            for (std::size_t i = yRanks.at(box.minY); i <= yRanks.at(box.maxY); ++i) {
                touched[i]  = true;
                leftFace[i] = std::min(leftFace[i], box.minX);
            }
        }
        double leftMin = kInf;
        for (std::size_t i = 0UZ; i < n; ++i) {
            if (!touched[i]) {
                double interpolate = kInf;
                for (std::size_t j = i + 1UZ; j < n; ++j) {
                    if (touched[j]) {
                        interpolate = std::min(interpolate, leftFace[j] + (yValues[j] - yValues[i]));
                        break;
                    }
                }
                for (std::size_t j = i; j-- > 0UZ;) {
                    if (touched[j]) {
                        interpolate = std::min(interpolate, leftFace[j] + (yValues[i] - yValues[j]));
                        break;
                    }
                }
                leftFace[i] = interpolate;
            }
            leftMin = std::min(leftMin, leftFace[i]);
        }

        double shift = -kInf;
        if (rectangular) {
            shift = rightMax - leftMin;
        } else {
            for (std::size_t i = 0UZ; i < n; ++i) {
                shift = std::max(shift, rightFace[i] - leftFace[i]);
            }
        }

        xShifts[c + 1UZ] = shift;
        for (RotatedBox& box : packed[c + 1UZ].boxes) {
            box.minX += shift;
            box.maxX += shift;
        }
    }

    for (std::size_t c = 0UZ; c < components.size(); ++c) {
        const Coordinate delta{xShifts[c] * std::cos(angle) - yShifts[c] * std::sin(angle), xShifts[c] * std::sin(angle) + yShifts[c] * std::cos(angle)};
        for (VertexId v : components[c].vertices()) {
            components[c][v].pos += delta;
        }
        for (EdgeId e : packed[c].cloudEdges) {
            components[c].arena()[e].path.shiftByCoordinate(delta);
        }
    }
}

void LayoutPipeline::cutEdges(Digraph& graph) {
    Arena& arena = graph.arena();
    for (ArcId a : graph.arcs()) {
        for (EdgeId e : graph[a].syntacticEdges) {
            Edge&         edge = arena[e];
            const Vertex& tail = arena[edge.tail];
            const Vertex& head = arena[edge.head];
            Path&         p    = edge.path;
            p.makeRigid();
            const Path orig = p.clone();

            const auto cuts = [&edge](std::string_view key, const Vertex& v) {
                const std::string policy = options::value<std::string>(v.options, "cut policy", "as edge requests");
                return (options::value<bool>(edge.options, key, true) && policy == "as edge requests") || policy == "all";
            };

            if (cuts("tail cut", tail)) {
                Path outline = tail.path.clone();
                outline.shiftByCoordinate(tail.pos);
                const auto x = p.intersectionsWith(outline);
                if (!x.empty()) {
                    p.cutAtBeginning(x.front().index, x.front().time);
                }
            }

            if (cuts("head cut", head)) {
                Path outline = head.path.clone();
                outline.shiftByCoordinate(head.pos);
                const auto x = p.intersectionsWith(outline);
                if (!x.empty()) {
                    p.cutAtEnd(x.back().index, x.back().time);
                } else if (const auto x2 = orig.intersectionsWith(outline); !x2.empty()) {
                    const Coordinate* from = p.size() > 1UZ ? std::get_if<Coordinate>(&p[1UZ]) : nullptr;
                    if (options::value<bool>(edge.options, "allow inside edges", true) && from != nullptr) {
                        const Coordinate start = *from;
                        p.clear();
                        p.appendMoveto(start);
                        p.appendLineto(x2.front().point);
                    } else {
                        p.clear();
                    }
                }
            }
        }
    }
}

} // namespace gd
