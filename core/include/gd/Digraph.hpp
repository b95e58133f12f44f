#ifndef GD_DIGRAPH_HPP
#define GD_DIGRAPH_HPP

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <gd/Arena.hpp>
#include <gd/Export.hpp>
#include <gd/Identifiers.hpp>
#include <gd/Options.hpp>
#include <gd/Path.hpp>
#include <gd/meta/utils.hpp>

namespace gd {

/**
 * @brief directed arc of one particular digraph. There is at most one (live) arc per ordered pair of vertices;
 * the user edges it stands for are listed in `syntacticEdges`.
 */
struct Arc {
    VertexId            tail{};
    VertexId            head{};
    std::vector<EdgeId> syntacticEdges;
    std::optional<Path> path;
    property_map        generatedOptions;
    bool                alive = true;
};

/// option values of the syntactic edges behind an arc: first the aligned ones, then the anti-aligned ones
struct OptionsArray {
    std::vector<EdgeId>    aligned;
    std::vector<EdgeId>    antiAligned;
    std::vector<pmtv::pmt> values;
};

class Digraph {
public:
    using VertexMerge = std::function<void(VertexId replacement, VertexId collapsed)>;
    using ArcMerge    = std::function<void(ArcId surviving, ArcId removed)>;
    using VertexHook  = std::function<void(VertexId replacement, VertexId restored)>;
    using ArcHook     = std::function<void(ArcId restored, VertexId replacement)>;

private:
    struct Adjacency {
        std::vector<ArcId> outgoing;
        std::vector<ArcId> incoming;
    };

    struct History {
        std::vector<VertexId> vertices;
        std::vector<ArcId>    arcs;
    };

    std::shared_ptr<Arena>                                                                     _arena;
    const Digraph*                                                                             _syntactic = nullptr; // nullptr: this digraph is its own syntactic digraph
    property_map                                                                               _options;
    std::vector<VertexId>                                                                      _vertices;
    std::unordered_map<VertexId, Adjacency>                                                    _adjacency;
    std::deque<Arc>                                                                            _arcs;
    std::unordered_map<std::pair<VertexId, VertexId>, ArcId, meta::PairHash<VertexId, VertexId>> _arcLookup;
    std::unordered_map<VertexId, History>                                                      _history;

public:
    explicit Digraph(std::shared_ptr<Arena> arena, const Digraph* syntactic = nullptr, property_map options = {});

    /// a digraph with the vertices, options and syntactic digraph of `other` but without its arcs
    [[nodiscard]] static Digraph withVerticesOf(const Digraph& other);

    [[nodiscard]] Arena&                 arena() noexcept { return *_arena; }
    [[nodiscard]] const Arena&           arena() const noexcept { return *_arena; }
    [[nodiscard]] std::shared_ptr<Arena> sharedArena() const noexcept { return _arena; }
    [[nodiscard]] const Digraph&         syntacticDigraph() const noexcept { return _syntactic != nullptr ? *_syntactic : *this; }
    void                                 setSyntacticDigraph(const Digraph* syntactic) noexcept { _syntactic = syntactic == this ? nullptr : syntactic; }
    [[nodiscard]] property_map&          options() noexcept { return _options; }
    [[nodiscard]] const property_map&    options() const noexcept { return _options; }

    [[nodiscard]] Vertex&       operator[](VertexId v) { return (*_arena)[v]; }
    [[nodiscard]] const Vertex& operator[](VertexId v) const { return (*_arena)[v]; }
    [[nodiscard]] Arc&          operator[](ArcId a) { return _arcs.at(meta::index(a)); }
    [[nodiscard]] const Arc&    operator[](ArcId a) const { return _arcs.at(meta::index(a)); }

    // vertices
    void add(VertexId v);
    void add(std::span<const VertexId> vertices);
    /// removes the vertices and all their arcs; throws if one of them is not a member
    void                                       remove(std::span<const VertexId> vertices);
    void                                       remove(VertexId v) { remove(std::span<const VertexId>(&v, 1UZ)); }
    [[nodiscard]] bool                         contains(VertexId v) const { return _adjacency.contains(v); }
    [[nodiscard]] const std::vector<VertexId>& vertices() const noexcept { return _vertices; }
    [[nodiscard]] std::size_t                  size() const noexcept { return _vertices.size(); }
    [[nodiscard]] bool                         empty() const noexcept { return _vertices.empty(); }
    void                                       sortVertices(const std::function<bool(VertexId, VertexId)>& less);

    // arcs
    [[nodiscard]] std::optional<ArcId> arc(VertexId tail, VertexId head) const;
    /// live arcs in vertex order, each vertex contributing its outgoing arcs in order
    [[nodiscard]] std::vector<ArcId> arcs() const;
    /// the unique arc from `tail` to `head`, created if absent
    GD_EXPORT ArcId connect(VertexId tail, VertexId head);
    void            disconnect(VertexId tail, VertexId head);
    /// removes every arc incident to `v`
    void disconnect(VertexId v);
    /// moves the fields of `arc` onto the arc from `tail` to `head` and disconnects `arc`
    ArcId reconnect(ArcId arc, VertexId tail, VertexId head);

    [[nodiscard]] const std::vector<ArcId>& outgoing(VertexId v) const;
    [[nodiscard]] const std::vector<ArcId>& incoming(VertexId v) const;
    void                                    sortOutgoing(VertexId v, const std::function<bool(ArcId, ArcId)>& less);
    void                                    sortIncoming(VertexId v, const std::function<bool(ArcId, ArcId)>& less);
    /// reorders the outgoing arcs of `v` so that their heads appear in the order of `heads`
    void orderOutgoing(VertexId v, std::span<const VertexId> heads);
    /// reorders the incoming arcs of `v` so that their tails appear in the order of `tails`
    void orderIncoming(VertexId v, std::span<const VertexId> tails);

    // contraction
    /**
     * replaces `vertices` by `replacement`: every arc between a collapsed vertex and an outside vertex is
     * redirected to `replacement` (`arcMerge(surviving, removed)` is called for each of them, so several arcs
     * merging into one can be accumulated), arcs inside the set are dropped and the collapsed vertices are
     * removed. The history needed by `expand` is recorded under `replacement`.
     */
    GD_EXPORT void collapse(std::span<const VertexId> vertices, VertexId replacement, const VertexMerge& vertexMerge = {}, const ArcMerge& arcMerge = {});
    /// restores the vertices and arcs collapsed into `replacement` and removes `replacement`
    GD_EXPORT void     expand(VertexId replacement, const VertexHook& vertexHook = {}, const ArcHook& arcHook = {});
    [[nodiscard]] bool hasHistory(VertexId replacement) const { return _history.contains(replacement); }
    [[nodiscard]] std::span<const VertexId> collapsedVertices(VertexId replacement) const;

    // arc views onto the syntactic digraph
    [[nodiscard]] std::optional<std::pair<VertexId, VertexId>> syntacticTailAndHead(ArcId a) const;
    [[nodiscard]] OptionsArray                                 optionsArray(ArcId a, std::string_view key) const;
    /// value of the first syntactic edge (aligned before anti-aligned, by event index) that sets `key`
    [[nodiscard]] std::optional<pmtv::pmt> arcOption(ArcId a, std::string_view key, bool onlyAligned = false) const;
    template<typename T>
    [[nodiscard]] T arcOptionValue(ArcId a, std::string_view key, T fallback) const {
        auto value = arcOption(a, key);
        if (!value) {
            return fallback;
        }
        property_map single{{std::string(key), *value}};
        return options::value<T>(single, key, fallback);
    }
    [[nodiscard]] std::size_t             eventIndex(ArcId a) const;
    [[nodiscard]] double                  spanPriority(ArcId a) const;
    [[nodiscard]] std::vector<Coordinate> pointCloud(ArcId a) const;
    [[nodiscard]] DeferredCoordinate      tailAnchor(ArcId a);
    [[nodiscard]] DeferredCoordinate      headAnchor(ArcId a);
    void                                  setPolylinePath(ArcId a, std::span<const Coordinate> bends);

    /// copies the path and generated options of the arc into its syntactic edges (reversed for anti-aligned ones)
    void syncArc(ArcId a);
    void sync();

private:
    [[nodiscard]] Adjacency&       adjacency(VertexId v, std::string_view what);
    [[nodiscard]] const Adjacency& adjacency(VertexId v, std::string_view what) const;
    void                           unlink(ArcId a);
    void                           link(ArcId a);
    [[nodiscard]] std::vector<EdgeId> syntacticEdgesBetween(VertexId tail, VertexId head) const;
};

/// the digraph the algorithms see: `->` arcs as given, `<-` reversed, `--` and `<->` in both directions, `-!-` none
[[nodiscard]] Digraph digraphFromSyntacticDigraph(const Digraph& syntactic);
/// every arc of `digraph` in both directions
[[nodiscard]] Digraph ugraphFromDigraph(const Digraph& digraph);

} // namespace gd

template<>
struct fmt::formatter<gd::Digraph> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gd::Digraph& g, FormatContext& ctx) const -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "graph {{\n");
        for (gd::VertexId v : g.vertices()) {
            out = fmt::format_to(out, "  {}[x={}pt,y={}pt]\n", g[v], static_cast<long>(std::floor(g[v].pos.x)), static_cast<long>(std::floor(g[v].pos.y)));
        }
        for (gd::VertexId v : g.vertices()) {
            if (g.outgoing(v).empty()) {
                continue;
            }
            out = fmt::format_to(out, "  {} -> {{", g[v]);
            for (gd::ArcId a : g.outgoing(v)) {
                out = fmt::format_to(out, " {}", g[g[a].head]);
            }
            out = fmt::format_to(out, " }}\n");
        }
        return fmt::format_to(out, "}}");
    }
};

#endif // GD_DIGRAPH_HPP
