#include <gd/Scope.hpp>

#include <algorithm>
#include <unordered_set>

#include <gd/Error.hpp>

namespace gd {

Scope::Scope() : _syntacticDigraph(std::make_unique<Digraph>(_arena)) {}

void Scope::setSyntacticDigraph(std::unique_ptr<Digraph> digraph) {
    if (!digraph) {
        throw gd::exception("syntactic digraph must not be null");
    }
    _syntacticDigraph = std::move(digraph);
}

CollectionId Scope::addCollection(std::string kind, property_map options, std::optional<CollectionId> parent) {
    if (kind.empty()) {
        throw gd::exception("collection kind not set");
    }
    _collections.push_back(Collection{.kind = std::move(kind), .options = std::move(options), .eventIndex = nextEventIndex()});
    const CollectionId id = meta::makeId<CollectionId>(_collections.size() - 1UZ);
    registerAsChildOf(id, parent);
    return id;
}

void Scope::registerAsChildOf(CollectionId child, std::optional<CollectionId> parent) {
    (*this)[child].parent = parent;
    if (parent) {
        (*this)[*parent].children.push_back(child);
    }
}

void Scope::registerName(VertexId v) {
    const Vertex& vertex = (*_arena)[v];
    if (vertex.name.empty()) {
        return;
    }
    if (!_nodeNames.emplace(vertex.name, v).second) {
        throw gd::exception(fmt::format("node name '{}' is used twice", vertex.name));
    }
}

void Scope::addToCollections(VertexId v, std::span<const CollectionId> collections) {
    std::unordered_set<CollectionId> visited;
    for (CollectionId c : collections) {
        for (std::optional<CollectionId> current = c; current && visited.insert(*current).second; current = (*this)[*current].parent) {
            (*this)[*current].vertices.push_back(v);
        }
    }
}

VertexId Scope::addVertex(Vertex vertex, std::span<const CollectionId> collections) {
    if (vertex.eventIndex == kNoEventIndex) {
        vertex.eventIndex = nextEventIndex();
    }
    const VertexId v = _arena->addVertex(std::move(vertex));
    registerName(v);
    _syntacticDigraph->add(v);
    addToCollections(v, collections);
    return v;
}

CollectionId Scope::addSubgraphNode(Vertex vertex, CollectionId parentLayout, std::span<const CollectionId> collections) {
    vertex.kind = VertexKind::subgraphNode;
    const VertexId     v = addVertex(std::move(vertex), collections);
    const CollectionId c = addCollection(std::string(kSubgraphNodeKind), {}, collections.empty() ? std::optional<CollectionId>(parentLayout) : std::optional<CollectionId>(collections.back()));
    (*this)[c].subgraphNode   = v;
    (*this)[c].parentLayout   = parentLayout;
    (*_arena)[v].subgraphCollection = c;
    return c;
}

EdgeId Scope::addEdge(VertexId tail, VertexId head, Direction direction, property_map options, std::span<const CollectionId> collections) {
    Edge edge{.tail = tail, .head = head, .direction = direction, .options = std::move(options), .eventIndex = nextEventIndex()};
    edge.path         = _arena->defaultEdgePath(edge);
    const EdgeId e    = _arena->addEdge(std::move(edge));
    const ArcId  arc  = _syntacticDigraph->connect(tail, head);
    (*_syntacticDigraph)[arc].syntacticEdges.push_back(e);

    std::unordered_set<CollectionId> visited;
    for (CollectionId c : collections) {
        for (std::optional<CollectionId> current = c; current && visited.insert(*current).second; current = (*this)[*current].parent) {
            (*this)[*current].edges.push_back(e);
        }
    }
    return e;
}

VertexId Scope::createVertex(Vertex vertex) {
    if (vertex.eventIndex == kNoEventIndex) {
        vertex.eventIndex = nextEventIndex();
    }
    const VertexId v = _arena->addVertex(std::move(vertex));
    registerName(v);
    notifyVertexCreated(v);
    return v;
}

EdgeId Scope::createEdge(VertexId tail, VertexId head, property_map options) {
    Edge edge{.tail = tail, .head = head, .direction = Direction::forward, .options = std::move(options), .eventIndex = nextEventIndex()};
    edge.path      = _arena->defaultEdgePath(edge);
    const EdgeId e = _arena->addEdge(std::move(edge));
    if (_onCreateEdge) {
        _onCreateEdge(e);
    }
    return e;
}

void Scope::notifyVertexCreated(VertexId v) const {
    if (_onCreateVertex) {
        _onCreateVertex(v);
    }
}

std::optional<VertexId> Scope::vertexByName(std::string_view name) const {
    if (auto it = _nodeNames.find(name); it != _nodeNames.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<CollectionId> Scope::rootLayout() const {
    const std::vector<CollectionId> layouts = collectionsOfKind(kSublayoutKind);
    if (layouts.empty()) {
        return std::nullopt;
    }
    return layouts.front();
}

std::vector<CollectionId> Scope::childrenOfKind(CollectionId id, std::string_view kind) const {
    std::vector<CollectionId> result;
    auto                      recurse = [&](auto& self, CollectionId c) -> void {
        for (CollectionId child : (*this)[c].children) {
            if ((*this)[child].kind == kind) {
                result.push_back(child);
            } else {
                self(self, child);
            }
        }
    };
    recurse(recurse, id);
    return result;
}

std::vector<CollectionId> Scope::descendants(CollectionId id) const {
    std::vector<CollectionId> result;
    auto                      recurse = [&](auto& self, CollectionId c) -> void {
        for (CollectionId child : (*this)[c].children) {
            result.push_back(child);
            self(self, child);
        }
    };
    recurse(recurse, id);
    return result;
}

std::vector<CollectionId> Scope::descendantsOfKind(CollectionId id, std::string_view kind) const {
    std::vector<CollectionId> result = descendants(id);
    std::erase_if(result, [&](CollectionId c) { return (*this)[c].kind != kind; });
    return result;
}

std::vector<CollectionId> Scope::collectionsOfKind(std::string_view kind) const {
    std::vector<CollectionId> result;
    for (std::size_t i = 0UZ; i < _collections.size(); ++i) {
        if (_collections[i].kind == kind) {
            result.push_back(meta::makeId<CollectionId>(i));
        }
    }
    return result;
}

} // namespace gd
