#include <gd/Digraph.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <tuple>
#include <unordered_set>

#include <gd/Error.hpp>

namespace gd {

Digraph::Digraph(std::shared_ptr<Arena> arena, const Digraph* syntactic, property_map options) : _arena(std::move(arena)), _syntactic(syntactic), _options(std::move(options)) {
    if (!_arena) {
        throw gd::exception("digraph without arena");
    }
}

Digraph Digraph::withVerticesOf(const Digraph& other) {
    Digraph copy(other._arena, &other.syntacticDigraph(), other._options);
    copy.add(other._vertices);
    return copy;
}

Digraph::Adjacency& Digraph::adjacency(VertexId v, std::string_view what) {
    auto it = _adjacency.find(v);
    if (it == _adjacency.end()) {
        throw gd::exception(fmt::format("{} {} not in graph", what, (*_arena)[v]));
    }
    return it->second;
}

const Digraph::Adjacency& Digraph::adjacency(VertexId v, std::string_view what) const {
    auto it = _adjacency.find(v);
    if (it == _adjacency.end()) {
        throw gd::exception(fmt::format("{} {} not in graph", what, (*_arena)[v]));
    }
    return it->second;
}

void Digraph::add(VertexId v) {
    if (_adjacency.try_emplace(v).second) {
        _vertices.push_back(v);
    }
}

void Digraph::add(std::span<const VertexId> vertices) {
    for (VertexId v : vertices) {
        add(v);
    }
}

void Digraph::remove(std::span<const VertexId> vertices) {
    for (VertexId v : vertices) {
        if (!contains(v)) {
            throw gd::exception(fmt::format("to-be-deleted node {} is not in graph", (*_arena)[v]));
        }
    }
    const std::unordered_set<VertexId> removed(vertices.begin(), vertices.end());
    for (VertexId v : removed) {
        disconnect(v);
        _adjacency.erase(v);
    }
    std::erase_if(_vertices, [&removed](VertexId v) { return removed.contains(v); });
}

void Digraph::sortVertices(const std::function<bool(VertexId, VertexId)>& less) { std::ranges::stable_sort(_vertices, less); }

std::optional<ArcId> Digraph::arc(VertexId tail, VertexId head) const {
    if (auto it = _arcLookup.find({tail, head}); it != _arcLookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<ArcId> Digraph::arcs() const {
    std::vector<ArcId> result;
    for (VertexId v : _vertices) {
        const Adjacency& adj = _adjacency.at(v);
        result.insert(result.end(), adj.outgoing.begin(), adj.outgoing.end());
    }
    return result;
}

void Digraph::link(ArcId a) {
    Arc& arc = _arcs[meta::index(a)];
    arc.alive = true;
    adjacency(arc.tail, "tail node").outgoing.push_back(a);
    adjacency(arc.head, "head node").incoming.push_back(a);
    _arcLookup[{arc.tail, arc.head}] = a;
}

void Digraph::unlink(ArcId a) {
    Arc& arc = _arcs[meta::index(a)];
    if (!arc.alive) {
        return;
    }
    arc.alive = false;
    _arcLookup.erase({arc.tail, arc.head});
    if (auto it = _adjacency.find(arc.tail); it != _adjacency.end()) {
        std::erase(it->second.outgoing, a);
    }
    if (auto it = _adjacency.find(arc.head); it != _adjacency.end()) {
        std::erase(it->second.incoming, a);
    }
}

ArcId Digraph::connect(VertexId tail, VertexId head) {
    if (!contains(tail) || !contains(head)) {
        throw gd::exception(fmt::format("trying to connect nodes not in graph: {} -> {}", (*_arena)[tail], (*_arena)[head]));
    }
    if (auto existing = arc(tail, head)) {
        return *existing;
    }
    _arcs.push_back(Arc{.tail = tail, .head = head});
    const ArcId id = meta::makeId<ArcId>(_arcs.size() - 1UZ);
    link(id);
    return id;
}

void Digraph::disconnect(VertexId tail, VertexId head) {
    std::ignore = adjacency(tail, "tail node");
    std::ignore = adjacency(head, "head node");
    if (auto existing = arc(tail, head)) {
        unlink(*existing);
    }
}

void Digraph::disconnect(VertexId v) {
    Adjacency&               adj = adjacency(v, "node");
    const std::vector<ArcId> incident = [&adj] {
        std::vector<ArcId> all(adj.outgoing);
        all.insert(all.end(), adj.incoming.begin(), adj.incoming.end());
        return all;
    }();
    for (ArcId a : incident) {
        unlink(a);
    }
}

ArcId Digraph::reconnect(ArcId a, VertexId tail, VertexId head) {
    const Arc& old = (*this)[a];
    if (old.tail == tail && old.head == head) {
        return a;
    }
    const Arc   fields = old;
    const ArcId target = connect(tail, head);
    Arc&        arc    = (*this)[target];
    arc.syntacticEdges   = fields.syntacticEdges;
    arc.path             = fields.path;
    arc.generatedOptions = fields.generatedOptions;
    disconnect(fields.tail, fields.head);
    return target;
}

const std::vector<ArcId>& Digraph::outgoing(VertexId v) const { return adjacency(v, "vertex").outgoing; }

const std::vector<ArcId>& Digraph::incoming(VertexId v) const { return adjacency(v, "vertex").incoming; }

void Digraph::sortOutgoing(VertexId v, const std::function<bool(ArcId, ArcId)>& less) { std::ranges::stable_sort(adjacency(v, "vertex").outgoing, less); }

void Digraph::sortIncoming(VertexId v, const std::function<bool(ArcId, ArcId)>& less) { std::ranges::stable_sort(adjacency(v, "vertex").incoming, less); }

namespace {
void orderArcs(std::vector<ArcId>& arcs, std::span<const VertexId> order, const std::function<VertexId(ArcId)>& endpoint) {
    if (arcs.size() != order.size()) {
        throw gd::exception(fmt::format("illegal vertex order: {} arcs but {} vertices", arcs.size(), order.size()));
    }
    std::unordered_map<VertexId, std::size_t> lookup;
    for (std::size_t i = 0UZ; i < order.size(); ++i) {
        lookup[order[i]] = i;
    }
    std::vector<std::optional<ArcId>> reordered(arcs.size());
    for (ArcId a : arcs) {
        auto it = lookup.find(endpoint(a));
        if (it == lookup.end()) {
            throw gd::exception("illegal vertex order");
        }
        reordered[it->second] = a;
    }
    for (std::size_t i = 0UZ; i < arcs.size(); ++i) {
        if (!reordered[i]) {
            throw gd::exception("illegal vertex order");
        }
        arcs[i] = *reordered[i];
    }
}
} // namespace

void Digraph::orderOutgoing(VertexId v, std::span<const VertexId> heads) {
    orderArcs(adjacency(v, "vertex").outgoing, heads, [this](ArcId a) { return (*this)[a].head; });
}

void Digraph::orderIncoming(VertexId v, std::span<const VertexId> tails) {
    orderArcs(adjacency(v, "vertex").incoming, tails, [this](ArcId a) { return (*this)[a].tail; });
}

void Digraph::collapse(std::span<const VertexId> vertices, VertexId replacement, const VertexMerge& vertexMerge, const ArcMerge& arcMerge) {
    if (hasHistory(replacement)) {
        throw gd::exception(fmt::format("vertex {} already carries a collapse history", (*_arena)[replacement]));
    }
    const std::unordered_set<VertexId> collapsed(vertices.begin(), vertices.end());
    if (collapsed.contains(replacement)) {
        throw gd::exception("collapse vertex is in the collapsed vertex set");
    }
    for (VertexId v : vertices) {
        if (!contains(v)) {
            throw gd::exception(fmt::format("cannot collapse vertex {}: not in graph", (*_arena)[v]));
        }
    }

    add(replacement);
    History history{.vertices = {vertices.begin(), vertices.end()}, .arcs = {}};
    for (VertexId v : vertices) {
        if (vertexMerge) {
            vertexMerge(replacement, v);
        }
        const std::vector<ArcId> out = outgoing(v);
        for (ArcId a : out) {
            const VertexId head = (*this)[a].head;
            if (!collapsed.contains(head)) {
                const ArcId surviving = connect(replacement, head);
                if (arcMerge) {
                    arcMerge(surviving, a);
                }
                history.arcs.push_back(a);
            }
        }
        const std::vector<ArcId> in = incoming(v);
        for (ArcId a : in) {
            const VertexId tail = (*this)[a].tail;
            if (!collapsed.contains(tail)) {
                const ArcId surviving = connect(tail, replacement);
                if (arcMerge) {
                    arcMerge(surviving, a);
                }
            }
            history.arcs.push_back(a); // arcs inside the set are restored by expand as well
        }
    }
    remove(vertices);
    _history.emplace(replacement, std::move(history));
}

void Digraph::expand(VertexId replacement, const VertexHook& vertexHook, const ArcHook& arcHook) {
    auto it = _history.find(replacement);
    if (it == _history.end()) {
        throw gd::exception(fmt::format("no expand information stored for vertex {}", (*_arena)[replacement]));
    }
    History history = std::move(it->second);
    _history.erase(it);

    add(history.vertices);
    if (vertexHook) {
        for (VertexId v : history.vertices) {
            vertexHook(replacement, v);
        }
    }
    for (ArcId a : history.arcs) {
        const Arc& old = (*this)[a];
        if (!contains(old.tail) || !contains(old.head)) {
            continue;
        }
        ArcId restored = a;
        if (auto existing = arc(old.tail, old.head)) {
            restored = *existing;
            if (restored != a) {
                Arc& target            = (*this)[restored];
                target.syntacticEdges   = old.syntacticEdges;
                target.path             = old.path;
                target.generatedOptions = old.generatedOptions;
            }
        } else {
            link(a);
        }
        if (arcHook) {
            arcHook(restored, replacement);
        }
    }
    if (contains(replacement)) {
        remove(replacement);
    }
}

std::span<const VertexId> Digraph::collapsedVertices(VertexId replacement) const {
    auto it = _history.find(replacement);
    if (it == _history.end()) {
        return {};
    }
    return it->second.vertices;
}

std::vector<EdgeId> Digraph::syntacticEdgesBetween(VertexId tail, VertexId head) const {
    const Digraph& s = syntacticDigraph();
    if (auto a = s.arc(tail, head)) {
        return s[*a].syntacticEdges;
    }
    return {};
}

std::optional<std::pair<VertexId, VertexId>> Digraph::syntacticTailAndHead(ArcId a) const {
    const Arc&     arc = (*this)[a];
    const Digraph& s   = syntacticDigraph();
    if (s.arc(arc.tail, arc.head)) {
        return std::pair{arc.tail, arc.head};
    }
    if (s.arc(arc.head, arc.tail)) {
        return std::pair{arc.head, arc.tail};
    }
    return std::nullopt;
}

OptionsArray Digraph::optionsArray(ArcId a, std::string_view key) const {
    const Arc&   arc = (*this)[a];
    OptionsArray result;
    auto         byEventIndex = [this](EdgeId x, EdgeId y) { return (*_arena)[x].eventIndex < (*_arena)[y].eventIndex; };
    for (EdgeId e : syntacticEdgesBetween(arc.tail, arc.head)) {
        if (options::contains((*_arena)[e].options, key)) {
            result.aligned.push_back(e);
        }
    }
    if (arc.head != arc.tail) {
        for (EdgeId e : syntacticEdgesBetween(arc.head, arc.tail)) {
            if (options::contains((*_arena)[e].options, key)) {
                result.antiAligned.push_back(e);
            }
        }
    }
    std::ranges::stable_sort(result.aligned, byEventIndex);
    std::ranges::stable_sort(result.antiAligned, byEventIndex);
    for (EdgeId e : result.aligned) {
        result.values.push_back((*_arena)[e].options.find(key)->second);
    }
    for (EdgeId e : result.antiAligned) {
        result.values.push_back((*_arena)[e].options.find(key)->second);
    }
    return result;
}

std::optional<pmtv::pmt> Digraph::arcOption(ArcId a, std::string_view key, bool onlyAligned) const {
    const OptionsArray opts = optionsArray(a, key);
    if (opts.values.empty() || (onlyAligned && opts.aligned.empty())) {
        return std::nullopt;
    }
    return opts.values.front();
}

std::size_t Digraph::eventIndex(ArcId a) const {
    const Arc&  arc    = (*this)[a];
    std::size_t result = kNoEventIndex;
    for (EdgeId e : syntacticEdgesBetween(arc.tail, arc.head)) {
        result = std::min(result, (*_arena)[e].eventIndex);
    }
    if (arc.head != arc.tail) {
        for (EdgeId e : syntacticEdgesBetween(arc.head, arc.tail)) {
            result = std::min(result, (*_arena)[e].eventIndex);
        }
    }
    return result;
}

double Digraph::spanPriority(ArcId a) const {
    const Arc& arc    = (*this)[a];
    double     result = std::numeric_limits<double>::infinity();
    auto       lookup = [&](EdgeId e, std::string_view prefix) {
        const Edge& edge = (*_arena)[e];
        if (auto p = options::get<double>(edge.options, "span priority")) {
            return *p;
        }
        const std::string key = fmt::format("{}{}", prefix, symbol(edge.direction));
        if (auto p = options::get<double>(edge.options, key)) {
            return *p;
        }
        return options::value<double>(syntacticDigraph().options(), key, 5.0);
    };
    for (EdgeId e : syntacticEdgesBetween(arc.tail, arc.head)) {
        result = std::min(result, lookup(e, "span priority "));
    }
    if (arc.head != arc.tail) {
        for (EdgeId e : syntacticEdgesBetween(arc.head, arc.tail)) {
            result = std::min(result, lookup(e, "span priority reversed "));
        }
    }
    return std::isinf(result) ? 5.0 : result;
}

std::vector<Coordinate> Digraph::pointCloud(ArcId a) const {
    const Arc&              arc = (*this)[a];
    std::vector<Coordinate> cloud;
    for (EdgeId e : syntacticEdgesBetween(arc.tail, arc.head)) {
        const std::vector<Coordinate> points = (*_arena)[e].path.coordinates();
        cloud.insert(cloud.end(), points.begin(), points.end());
    }
    return cloud;
}

DeferredCoordinate Digraph::tailAnchor(ArcId a) {
    const Arc& arc = (*this)[a];
    return _arena->anchorOf(arc.tail, arcOptionValue<std::string>(a, "tail anchor", "center"));
}

DeferredCoordinate Digraph::headAnchor(ArcId a) {
    const Arc& arc = (*this)[a];
    return _arena->anchorOf(arc.head, arcOptionValue<std::string>(a, "head anchor", "center"));
}

void Digraph::setPolylinePath(ArcId a, std::span<const Coordinate> bends) {
    Path path;
    path.appendMoveto(tailAnchor(a));
    for (const Coordinate& c : bends) {
        path.appendLineto(c);
    }
    path.appendLineto(headAnchor(a));
    (*this)[a].path = std::move(path);
}

void Digraph::syncArc(ArcId a) {
    const Arc& arc = (*this)[a];
    if (arc.path) {
        for (EdgeId e : syntacticEdgesBetween(arc.tail, arc.head)) {
            (*_arena)[e].path = arc.path->clone();
        }
        if (arc.head != arc.tail) {
            for (EdgeId e : syntacticEdgesBetween(arc.head, arc.tail)) {
                (*_arena)[e].path = arc.path->reversed();
            }
        }
    }
    if (!arc.generatedOptions.empty()) {
        for (EdgeId e : syntacticEdgesBetween(arc.tail, arc.head)) {
            updateMaps(arc.generatedOptions, (*_arena)[e].generatedOptions);
        }
        if (arc.head != arc.tail) {
            for (EdgeId e : syntacticEdgesBetween(arc.head, arc.tail)) {
                updateMaps(arc.generatedOptions, (*_arena)[e].generatedOptions);
            }
        }
    }
}

void Digraph::sync() {
    for (ArcId a : arcs()) {
        syncArc(a);
    }
}

Digraph digraphFromSyntacticDigraph(const Digraph& syntactic) {
    Digraph digraph(syntactic.sharedArena(), &syntactic, syntactic.options());
    digraph.add(syntactic.vertices());
    for (ArcId a : syntactic.arcs()) {
        const Arc& arc = syntactic[a];
        for (EdgeId e : arc.syntacticEdges) {
            switch (syntactic.arena()[e].direction) {
            case Direction::forward: std::ignore = digraph.connect(arc.tail, arc.head); break;
            case Direction::backward: std::ignore = digraph.connect(arc.head, arc.tail); break;
            case Direction::undirected:
            case Direction::both:
                std::ignore = digraph.connect(arc.tail, arc.head);
                std::ignore = digraph.connect(arc.head, arc.tail);
                break;
            case Direction::none: break;
            }
        }
    }
    return digraph;
}

Digraph ugraphFromDigraph(const Digraph& digraph) {
    Digraph ugraph(digraph.sharedArena(), &digraph.syntacticDigraph(), digraph.options());
    ugraph.add(digraph.vertices());
    for (ArcId a : digraph.arcs()) {
        std::ignore = ugraph.connect(digraph[a].tail, digraph[a].head);
        std::ignore = ugraph.connect(digraph[a].head, digraph[a].tail);
    }
    return ugraph;
}

} // namespace gd
