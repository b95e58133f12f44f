#ifndef GD_SCOPE_HPP
#define GD_SCOPE_HPP

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gd/Arena.hpp>
#include <gd/Collection.hpp>
#include <gd/Digraph.hpp>
#include <gd/Export.hpp>
#include <gd/Identifiers.hpp>

namespace gd {

/**
 * @brief everything one graph drawing consists of: the arena with all vertices and edges, the syntactic
 * digraph, the collection tree and the node names.
 *
 * The host adds vertices, edges and collections in input order (each one gets the next event index); the layout
 * pipeline then works on the collection tree. Algorithms that need new vertices or edges use `createVertex` and
 * `createEdge`; the host can observe those through `onCreateVertex`/`onCreateEdge`.
 */
class Scope {
    std::shared_ptr<Arena>           _arena = std::make_shared<Arena>();
    std::unique_ptr<Digraph>         _syntacticDigraph;
    std::deque<Collection>           _collections;
    std::map<std::string, VertexId, std::less<>> _nodeNames;
    std::size_t                      _nextEventIndex = 0UZ;
    std::function<void(VertexId)>    _onCreateVertex;
    std::function<void(EdgeId)>      _onCreateEdge;

public:
    GD_EXPORT Scope();

    [[nodiscard]] Arena&                 arena() noexcept { return *_arena; }
    [[nodiscard]] const Arena&           arena() const noexcept { return *_arena; }
    [[nodiscard]] std::shared_ptr<Arena> sharedArena() const noexcept { return _arena; }
    [[nodiscard]] Digraph&               syntacticDigraph() noexcept { return *_syntacticDigraph; }
    [[nodiscard]] const Digraph&         syntacticDigraph() const noexcept { return *_syntacticDigraph; }
    void                                 setSyntacticDigraph(std::unique_ptr<Digraph> digraph);

    [[nodiscard]] Collection&       operator[](CollectionId id) { return _collections.at(meta::index(id)); }
    [[nodiscard]] const Collection& operator[](CollectionId id) const { return _collections.at(meta::index(id)); }
    [[nodiscard]] Vertex&           operator[](VertexId id) { return (*_arena)[id]; }
    [[nodiscard]] const Vertex&     operator[](VertexId id) const { return (*_arena)[id]; }
    [[nodiscard]] Edge&             operator[](EdgeId id) { return (*_arena)[id]; }
    [[nodiscard]] const Edge&       operator[](EdgeId id) const { return (*_arena)[id]; }

    /// new collection of the given (non-empty) kind, registered as child of `parent`
    GD_EXPORT CollectionId addCollection(std::string kind, property_map options = {}, std::optional<CollectionId> parent = std::nullopt);
    void                   registerAsChildOf(CollectionId child, std::optional<CollectionId> parent);

    /// user vertex: named, added to the syntactic digraph and to `collections` and all their ancestors
    GD_EXPORT VertexId addVertex(Vertex vertex, std::span<const CollectionId> collections = {});
    /// a vertex of kind `subgraphNode` together with the collection its members are added to
    GD_EXPORT CollectionId addSubgraphNode(Vertex vertex, CollectionId parentLayout, std::span<const CollectionId> collections = {});
    /// user edge: creates (or reuses) the syntactic arc and appends the edge to it
    GD_EXPORT EdgeId addEdge(VertexId tail, VertexId head, Direction direction = Direction::forward, property_map options = {}, std::span<const CollectionId> collections = {});

    /// vertices created by algorithms; they are not added to any digraph or collection
    VertexId createVertex(Vertex vertex);
    EdgeId   createEdge(VertexId tail, VertexId head, property_map options = {});
    void     onCreateVertex(std::function<void(VertexId)> callback) { _onCreateVertex = std::move(callback); }
    void     onCreateEdge(std::function<void(EdgeId)> callback) { _onCreateEdge = std::move(callback); }
    void     notifyVertexCreated(VertexId v) const;

    [[nodiscard]] std::optional<VertexId>      vertexByName(std::string_view name) const;
    [[nodiscard]] std::optional<CollectionId> rootLayout() const;
    [[nodiscard]] std::size_t                  nextEventIndex() noexcept { return _nextEventIndex++; }
    [[nodiscard]] std::size_t                  collectionCount() const noexcept { return _collections.size(); }

    [[nodiscard]] const std::vector<CollectionId>& children(CollectionId id) const { return (*this)[id].children; }
    /// children of the given kind; does not descend into matching children
    [[nodiscard]] std::vector<CollectionId> childrenOfKind(CollectionId id, std::string_view kind) const;
    [[nodiscard]] std::vector<CollectionId> descendants(CollectionId id) const;
    [[nodiscard]] std::vector<CollectionId> descendantsOfKind(CollectionId id, std::string_view kind) const;
    /// every collection of the given kind in creation order
    [[nodiscard]] std::vector<CollectionId> collectionsOfKind(std::string_view kind) const;

private:
    void addToCollections(VertexId v, std::span<const CollectionId> collections);
    void registerName(VertexId v);
};

} // namespace gd

#endif // GD_SCOPE_HPP
