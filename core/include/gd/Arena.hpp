#ifndef GD_ARENA_HPP
#define GD_ARENA_HPP

#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <gd/Edge.hpp>
#include <gd/Error.hpp>
#include <gd/Identifiers.hpp>
#include <gd/Vertex.hpp>

namespace gd {

/**
 * @brief owner of every vertex and syntactic edge record of a drawing.
 *
 * Records are never erased, so a `VertexId`/`EdgeId` stays valid (and references to the records stay stable)
 * for the lifetime of the arena. Digraphs only hold ids and share the arena via `std::shared_ptr`.
 *
 * The dummy vertices of the algorithms (coarse vertices, layered dummies, placeholders of sub-layouts) are appended
 * as well: every layout run on the same scope grows the arena by the vertices it creates. Hosts that lay out a
 * drawing repeatedly should use a fresh `Scope` per run.
 *
 * Arenas are always owned by a `std::shared_ptr`; anchors handed out by `anchorOf` only keep a weak reference and
 * throw when they are resolved after the arena is gone.
 */
class Arena : public std::enable_shared_from_this<Arena> {
    std::deque<Vertex> _vertices;
    std::deque<Edge>   _edges;

public:
    VertexId addVertex(Vertex vertex) {
        _vertices.push_back(std::move(vertex));
        return meta::makeId<VertexId>(_vertices.size() - 1UZ);
    }

    EdgeId addEdge(Edge edge) {
        _edges.push_back(std::move(edge));
        return meta::makeId<EdgeId>(_edges.size() - 1UZ);
    }

    [[nodiscard]] Vertex&       operator[](VertexId id) { return _vertices.at(meta::index(id)); }
    [[nodiscard]] const Vertex& operator[](VertexId id) const { return _vertices.at(meta::index(id)); }
    [[nodiscard]] Edge&         operator[](EdgeId id) { return _edges.at(meta::index(id)); }
    [[nodiscard]] const Edge&   operator[](EdgeId id) const { return _edges.at(meta::index(id)); }

    [[nodiscard]] std::size_t vertexCount() const noexcept { return _vertices.size(); }
    [[nodiscard]] std::size_t edgeCount() const noexcept { return _edges.size(); }

    /// absolute position of the named anchor of `v`, evaluated when the coordinate is resolved
    [[nodiscard]] DeferredCoordinate anchorOf(VertexId v, std::string anchorName) {
        if (anchorName.empty()) {
            anchorName = "center";
        }
        return DeferredCoordinate{[arena = weak_from_this(), v, name = std::move(anchorName)] {
            const std::shared_ptr<Arena> self = arena.lock();
            if (!self) {
                throw gd::exception(fmt::format("anchor '{}' of vertex {} resolved without a live arena", name, v));
            }
            Vertex& vertex = (*self)[v];
            return vertex.anchor(name).value_or(Coordinate{}) + vertex.pos;
        }};
    }

    /// the default path of a syntactic edge: a straight line between the `tail anchor` and `head anchor`
    [[nodiscard]] Path defaultEdgePath(const Edge& edge) {
        Path path;
        path.appendMoveto(anchorOf(edge.tail, options::value<std::string>(edge.options, "tail anchor", "center")));
        path.appendLineto(anchorOf(edge.head, options::value<std::string>(edge.options, "head anchor", "center")));
        return path;
    }
};

} // namespace gd

#endif // GD_ARENA_HPP
