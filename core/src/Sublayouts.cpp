#include <gd/Sublayouts.hpp>

#include <algorithm>
#include <ranges>
#include <string>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd {

namespace {

void shiftConcretePoints(Arena& arena, std::span<const EdgeId> edges, const Coordinate& delta) {
    for (EdgeId e : edges) {
        arena[e].path.shiftByCoordinate(delta);
    }
}

std::optional<VertexId> firstCommonVertex(const Digraph& g1, const Digraph& g2) {
    for (VertexId v : g1.vertices()) {
        if (g2.contains(v)) {
            return v;
        }
    }
    return std::nullopt;
}

} // namespace

property_map Sublayouts::layoutOptions(CollectionId layout) const {
    std::vector<const property_map*> chain;
    for (std::optional<CollectionId> c = layout; c; c = _scope[*c].parent) {
        chain.push_back(&_scope[*c].options);
    }
    property_map result = options::defaults();
    for (const property_map* layer : chain | std::views::reverse) {
        updateMaps(*layer, result);
    }
    return result;
}

void Sublayouts::offsetVertex(VertexId v, const Coordinate& delta) {
    _scope[v].pos += delta;
    if (auto it = _subs.find(v); it != _subs.end()) {
        for (VertexId sub : it->second) {
            offsetVertex(sub, delta);
        }
    }
}

void Sublayouts::nudge(const Digraph& graph) {
    for (VertexId v : graph.vertices()) {
        auto delta = options::coordinate(_scope[v].options, "nudge");
        if (delta && _alreadyNudged.insert(v).second) {
            offsetVertex(v, *delta);
        }
    }
}

void Sublayouts::regardless(Digraph& graph) {
    for (VertexId v : graph.vertices()) {
        if (auto target = options::coordinate(_scope[v].options, "regardless at")) {
            offsetVertex(v, *target - _scope[v].pos);
        }
    }
}

void Sublayouts::recordPositions(const Digraph& graph) {
    for (VertexId v : graph.vertices()) {
        _positions[{v, &graph}] = _scope[v].pos;
    }
}

bool Sublayouts::specialVertexSubset(std::span<const VertexId> vertices, const Digraph& graph) const {
    return std::ranges::all_of(vertices, [&](VertexId v) { return graph.contains(v) || _scope[v].kind == VertexKind::subgraphNode; });
}

void Sublayouts::createSubgraphNode(const Digraph& syntactic, VertexId vertex) {
    if (!_scope[vertex].subgraphCollection) {
        throw gd::exception(fmt::format("vertex {} is not a subgraph node", _scope[vertex]));
    }
    const Collection& collection = _scope[*_scope[vertex].subgraphCollection];

    std::vector<Coordinate> cloud;
    std::vector<VertexId>   members;
    for (VertexId v : collection.vertices) {
        if (v == vertex) {
            continue;
        }
        if (!syntactic.contains(v)) {
            throw gd::exception(fmt::format("the layout must contain all nodes of the subgraph, {} is missing", _scope[v]));
        }
        members.push_back(v);
        for (const Coordinate& p : _scope[v].path.coordinates()) {
            cloud.push_back(p + _scope[v].pos);
        }
    }
    for (EdgeId e : collection.edges) {
        const std::vector<Coordinate> points = _scope[e].path.coordinates();
        cloud.insert(cloud.end(), points.begin(), points.end());
    }

    const BoundingBox box = boundingBox(cloud);
    const Coordinate  center{box.centerX, box.centerY};
    std::string       pointCloud;
    for (Coordinate& p : cloud) {
        p -= center;
        pointCloud += fmt::format("{}", p);
    }

    property_map& generated                  = _scope[vertex].generatedOptions;
    generated["subgraph point cloud"]         = pointCloud;
    generated["subgraph bounding box height"] = fmt::format("{}pt", box.height());
    generated["subgraph bounding box width"]  = fmt::format("{}pt", box.width());

    _scope.notifyVertexCreated(vertex);
    _scope[vertex].pos += center;
    _subs[vertex] = std::move(members);
}

void Sublayouts::mergeResults(std::vector<std::unique_ptr<Digraph>>& results, std::unordered_map<const Digraph*, CollectionId>& location, std::vector<std::unique_ptr<Digraph>>& merged) {
    const auto position = [this](VertexId v, const Digraph* g) {
        auto it = _positions.find({v, g});
        if (it == _positions.end()) {
            throw gd::exception(fmt::format("no position recorded for {} in sub-layout", _scope[v]));
        }
        return it->second;
    };

    while (!results.empty()) {
        const std::size_t            n = results.size();
        std::vector<bool>            marked(n, false);
        std::unordered_set<VertexId> touched;

        marked[0] = true;
        for (VertexId v : results[0]->vertices()) {
            _scope[v].pos = position(v, results[0].get());
            touched.insert(v);
        }

        // attach every graph sharing a vertex with an already attached one; restart after each attachment
        for (std::size_t i = 0UZ; i < n;) {
            bool attached = false;
            if (!marked[i]) {
                for (std::size_t j = 0UZ; j < n && !attached; ++j) {
                    if (!marked[j]) {
                        continue;
                    }
                    auto common = firstCommonVertex(*results[i], *results[j]);
                    if (!common) {
                        continue;
                    }
                    marked[i]               = true;
                    attached                = true;
                    const Coordinate offset = _scope[*common].pos - position(*common, results[i].get());
                    for (VertexId u : results[i]->vertices()) {
                        if (!touched.insert(u).second) {
                            continue;
                        }
                        _scope[u].pos = position(u, results[i].get()) + offset;
                        for (ArcId a : results[i]->outgoing(u)) {
                            shiftConcretePoints(_scope.arena(), (*results[i])[a].syntacticEdges, offset);
                        }
                    }
                }
            }
            i = attached ? 0UZ : i + 1UZ;
        }

        auto merge = std::make_unique<Digraph>(_scope.sharedArena());
        std::vector<std::unique_ptr<Digraph>> remaining;
        for (std::size_t i = 0UZ; i < n; ++i) {
            if (!marked[i]) {
                remaining.push_back(std::move(results[i]));
                continue;
            }
            merge->add(results[i]->vertices());
            for (ArcId a : results[i]->arcs()) {
                const Arc&  arc = (*results[i])[a];
                const ArcId ma  = merge->connect(arc.tail, arc.head);
                auto&       dst = (*merge)[ma].syntacticEdges;
                dst.insert(dst.end(), arc.syntacticEdges.begin(), arc.syntacticEdges.end());
            }
        }
        location[merge.get()] = location.at(results[0].get());
        merged.push_back(std::move(merge));
        results = std::move(remaining);
    }
}

std::unique_ptr<Digraph> Sublayouts::layoutRecursively(CollectionId layout, const LayoutFunction& fun) {
    std::vector<std::unique_ptr<Digraph>>             results;
    std::unordered_map<const Digraph*, CollectionId> location;
    for (CollectionId child : _scope.childrenOfKind(layout, kSublayoutKind)) {
        results.push_back(layoutRecursively(child, fun));
        location[results.back().get()] = child;
    }

    std::vector<std::unique_ptr<Digraph>> mergedGraphs;
    mergeResults(results, location, mergedGraphs);

    const property_map options   = layoutOptions(layout);
    const std::string  algorithm = options::value<std::string>(options, "algorithm", "");
    const auto         traits    = _registry.traits(algorithm);
    if (algorithm.empty() || !traits) {
        throw gd::exception(fmt::format("algorithm selection failed: '{}' is not a registered layout algorithm", algorithm));
    }

    std::vector<std::optional<VertexId>> uncollapsedSubgraphNodes;
    for (CollectionId c : _scope.collectionsOfKind(kSubgraphNodeKind)) {
        if (_scope[c].parentLayout == layout && _scope[c].subgraphNode) {
            uncollapsedSubgraphNodes.emplace_back(_scope[c].subgraphNode);
        }
    }

    const Collection& layoutCollection = _scope[layout];
    auto              syntactic        = std::make_unique<Digraph>(_scope.sharedArena(), nullptr, options);
    syntactic->add(layoutCollection.vertices);
    for (EdgeId e : layoutCollection.edges) {
        const Edge& edge = _scope[e];
        syntactic->add(edge.head);
        syntactic->add(edge.tail);
        const ArcId a = syntactic->connect(edge.tail, edge.head);
        (*syntactic)[a].syntacticEdges.push_back(e);
    }

    for (auto& entry : uncollapsedSubgraphNodes | std::views::reverse) {
        const VertexId    v       = *entry;
        const Collection& members = _scope[*_scope[v].subgraphCollection];
        for (auto& g : mergedGraphs) {
            if (specialVertexSubset(members.vertices, *g)) {
                createSubgraphNode(*syntactic, v);
                g->add(v);
                entry.reset();
                break;
            }
        }
    }

    // every merged sub-layout that shares vertices with this layout becomes one rectangular placeholder
    std::vector<VertexId> placeholders;
    for (const auto& g : mergedGraphs) {
        std::vector<VertexId> intersection;
        std::ranges::copy_if(g->vertices(), std::back_inserter(intersection), [&](VertexId v) { return syntactic->contains(v); });
        if (intersection.empty()) {
            continue;
        }

        std::vector<Coordinate> extent;
        for (VertexId v : g->vertices()) {
            const BoundingBox box = _scope[v].boundingBox();
            extent.emplace_back(box.minX + _scope[v].pos.x, box.minY + _scope[v].pos.y);
            extent.emplace_back(box.maxX + _scope[v].pos.x, box.maxY + _scope[v].pos.y);
        }
        const std::vector<ArcId> arcs = g->arcs();
        for (ArcId a : arcs) {
            for (EdgeId e : (*g)[a].syntacticEdges) {
                const std::vector<Coordinate> points = _scope[e].path.coordinates();
                extent.insert(extent.end(), points.begin(), points.end());
            }
        }
        const BoundingBox box = boundingBox(extent);
        const Coordinate  center{box.centerX, box.centerY};
        for (VertexId v : g->vertices()) {
            _scope[v].pos -= center;
        }
        for (ArcId a : arcs) {
            shiftConcretePoints(_scope.arena(), (*g)[a].syntacticEdges, -center);
        }

        const double minX = box.minX - center.x;
        const double maxX = box.maxX - center.x;
        const double minY = box.minY - center.y;
        const double maxY = box.maxY - center.y;
        Vertex       placeholder{
                  .path       = Path{PathOp::moveto, Coordinate{minX, minY}, Coordinate{minX, maxY}, Coordinate{maxX, maxY}, Coordinate{maxX, minY}, PathOp::closepath},
                  .shape      = "none",
                  .kind       = VertexKind::node,
                  .eventIndex = _scope[location.at(g.get())].eventIndex,
        };
        const VertexId p = _scope.arena().addVertex(std::move(placeholder));

        Digraph& s = *syntactic;
        s.collapse(intersection, p, {}, [&s](ArcId surviving, ArcId removed) {
            const std::vector<EdgeId> edges = s[removed].syntacticEdges;
            auto&                     dst   = s[surviving].syntacticEdges;
            dst.insert(dst.end(), edges.begin(), edges.end());
        });
        placeholders.push_back(p);
    }

    syntactic->sortVertices([this](VertexId u, VertexId v) { return _scope[u].eventIndex < _scope[v].eventIndex; });

    std::optional<VertexId> hiddenNode;
    if (!traits->includeSubgraphNodes) {
        std::vector<VertexId> subgraphNodes;
        std::ranges::copy_if(syntactic->vertices(), std::back_inserter(subgraphNodes), [this](VertexId v) { return _scope[v].kind == VertexKind::subgraphNode; });
        if (!subgraphNodes.empty()) {
            hiddenNode = _scope.arena().addVertex(Vertex{});
            syntactic->collapse(subgraphNodes, *hiddenNode);
            syntactic->remove(*hiddenNode);
        }
    }

    fun(*syntactic, layout, algorithm, *traits);

    if (hiddenNode) {
        syntactic->expand(*hiddenNode);
    }

    for (VertexId p : placeholders | std::views::reverse) {
        const Coordinate    placeholderPos = _scope[p].pos;
        std::vector<EdgeId> leaving;
        for (ArcId a : syntactic->outgoing(p)) {
            const auto& edges = (*syntactic)[a].syntacticEdges;
            leaving.insert(leaving.end(), edges.begin(), edges.end());
        }

        Digraph& s = *syntactic;
        s.expand(
            p, [this](VertexId replacement, VertexId restored) { _scope[restored].pos += _scope[replacement].pos; },
            [this, &s](ArcId restored, VertexId replacement) { shiftConcretePoints(_scope.arena(), s[restored].syntacticEdges, _scope[replacement].pos); });

        for (EdgeId e : leaving) {
            shiftConcretePoints(_scope.arena(), std::span<const EdgeId>(&e, 1UZ), placeholderPos - _scope[_scope[e].tail].pos);
        }
    }

    for (const auto& entry : uncollapsedSubgraphNodes | std::views::reverse) {
        if (entry) {
            createSubgraphNode(*syntactic, *entry);
        }
    }

    nudge(*syntactic);
    recordPositions(*syntactic);
    return syntactic;
}

} // namespace gd
