#include <gd/algorithm/force/CoarseGraph.hpp>

#include <algorithm>
#include <array>
#include <unordered_set>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd::force {

CoarseGraph::CoarseGraph(Digraph& graph, rng::RandomSource& random, CoarseningAttributes& attributes, Expansion expansion) : _graph(graph), _random(random), _attributes(attributes), _expansion(expansion) {}

std::vector<std::pair<VertexId, VertexId>> CoarseGraph::findMatching(std::vector<VertexId>& unmatched) {
    const std::vector<VertexId>                vertices = _graph.vertices();
    std::unordered_set<VertexId>               matched;
    std::vector<std::pair<VertexId, VertexId>> matching;

    for (std::size_t j : _random.randomPermutation(vertices.size())) {
        const VertexId v = vertices[j];
        if (matched.contains(v)) {
            continue;
        }
        matched.insert(v);

        std::vector<VertexId> candidates;
        for (ArcId a : _graph.incoming(v)) {
            if (const VertexId other = _graph[a].tail; !matched.contains(other)) {
                candidates.push_back(other);
            }
        }
        for (ArcId a : _graph.outgoing(v)) {
            if (const VertexId other = _graph[a].head; !matched.contains(other)) {
                candidates.push_back(other);
            }
        }
        if (candidates.empty()) {
            continue;
        }
        std::ranges::stable_sort(candidates, [this](VertexId x, VertexId y) { return _attributes.weight.at(x) < _attributes.weight.at(y); });
        matched.insert(candidates.front());
        matching.emplace_back(v, candidates.front());
    }

    unmatched.clear();
    for (std::size_t j : _random.randomPermutation(vertices.size())) {
        if (!matched.contains(vertices[j])) {
            unmatched.push_back(vertices[j]);
        }
    }
    return matching;
}

void CoarseGraph::mergeVertex(VertexId replacement, VertexId collapsed) {
    _attributes.weight[replacement] += _attributes.weight.at(collapsed);
    _attributes.mass[replacement] += _attributes.mass.at(collapsed);

    const property_map* values = _attributes.framework.find(collapsed);
    if (values == nullptr) {
        return;
    }
    property_map& target = _attributes.framework[replacement];
    for (const auto& [key, value] : *values) {
        auto it = target.find(key);
        if (it == target.end()) {
            target.emplace(key, value);
            continue;
        }
        if (auto combine = _attributes.combine.find(key); combine != _attributes.combine.end()) {
            it->second = combine->second(it->second, value);
            continue;
        }
        auto sum = options::get<double>(target, key);
        auto add = options::get<double>(*values, key);
        if (!sum || !add) {
            throw gd::exception(fmt::format("cannot combine framework attribute '{}': no combine function registered for non-numeric values", key));
        }
        it->second = *sum + *add;
    }
}

void CoarseGraph::mergeArc(ArcId surviving, ArcId removed) {
    if (!_attributes.arcWeight.contains(surviving)) {
        _attributes.arcWeight[surviving] = _attributes.arcWeight.at(removed);
    } else {
        _attributes.arcWeight[surviving] += _attributes.arcWeight.at(removed);
    }
}

void CoarseGraph::coarsen() {
    ++_level;
    _collapsedVertices.resize(_level + 1UZ);
    _collapsedVertices[_level].clear();
    _unmatchedVertices.resize(_level + 1UZ);
    const std::size_t oldSize = _graph.size();

    for (const auto& [u, v] : findMatching(_unmatchedVertices[_level])) {
        Vertex vertex;
        vertex.name = fmt::format("({}:{})", _graph[u], _graph[v]);
        vertex.kind = VertexKind::dummy;
        vertex.pos  = (_graph[u].pos + _graph[v].pos) / 2.0;

        const VertexId replacement       = _graph.arena().addVertex(std::move(vertex));
        _attributes.weight[replacement]  = 0.0;
        _attributes.mass[replacement]    = 0.0;
        const std::array<VertexId, 2UZ> pair{u, v};
        _graph.collapse(pair, replacement, [this](VertexId r, VertexId c) { mergeVertex(r, c); }, [this](ArcId s, ArcId r) { mergeArc(s, r); });
        _collapsedVertices[_level].push_back(replacement);
    }

    _ratio = oldSize == 0UZ ? 1.0 : static_cast<double>(_graph.size()) / static_cast<double>(oldSize);
}

void CoarseGraph::uncoarsen() {
    if (_level == 0UZ) {
        throw gd::exception("cannot uncoarsen a graph that has not been coarsened");
    }
    const std::vector<VertexId>& created = _collapsedVertices[_level];
    for (auto it = created.rbegin(); it != created.rend(); ++it) {
        _random.reseed(rng::RandomSource::kExpandSeed);
        _graph.expand(*it, [this](VertexId replacement, VertexId restored) {
            Coordinate pos = _graph[replacement].pos;
            if (_expansion == Expansion::jitter) {
                const double dx = _random.random() * 10.0;
                const double dy = _random.random() * 10.0;
                pos += Coordinate{dx, dy};
            }
            _graph[restored].pos = pos;
        });
    }
    _collapsedVertices[_level].clear();
    _unmatchedVertices[_level].clear();
    --_level;
}

} // namespace gd::force
