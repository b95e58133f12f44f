#ifndef GD_VERTEX_HPP
#define GD_VERTEX_HPP

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <gd/Coordinate.hpp>
#include <gd/Export.hpp>
#include <gd/Identifiers.hpp>
#include <gd/Options.hpp>
#include <gd/Path.hpp>

namespace gd {

enum class VertexKind : std::uint8_t {
    node,         ///< a vertex the user specified
    dummy,        ///< created by an algorithm (coarsening placeholder, layer dummy, ...)
    subgraphNode, ///< a node drawn around the vertices of a subgraph collection
};

inline constexpr std::size_t kNoEventIndex = std::numeric_limits<std::size_t>::max();

/**
 * @brief a vertex of the drawing: its position (the result of the layout), its outline `path` in a local frame
 * centred near the origin and the options the user attached to it.
 *
 * Vertices live in a `gd::Arena` and are referred to by `VertexId`; membership in digraphs and adjacency are
 * kept by the digraphs themselves.
 */
struct Vertex {
    std::string                                     name;
    Coordinate                                      pos;
    Path                                            path{PathOp::moveto, Coordinate{0.0, 0.0}};
    std::string                                     shape = "none";
    VertexKind                                      kind  = VertexKind::dummy;
    property_map                                    options;
    property_map                                    generatedOptions;
    std::map<std::string, std::optional<Coordinate>, std::less<>> anchors{{"center", Coordinate{0.0, 0.0}}};
    std::size_t                                     eventIndex = kNoEventIndex;
    std::optional<CollectionId>                     subgraphCollection;

    /**
     * named anchor (`center`, `north`, `south east`, ...) or numeric angle in degrees, relative to `pos`.
     * Computed by intersecting the ray from the center with the outline (first hit) and cached; `std::nullopt`
     * when the ray misses the outline or the name is unknown.
     */
    GD_EXPORT std::optional<Coordinate> anchor(std::string_view anchorName);

    [[nodiscard]] BoundingBox boundingBox() const { return path.boundingBox(); }

    [[nodiscard]] bool hasOption(std::string_view key) const { return options::contains(options, key); }
};

} // namespace gd

template<>
struct fmt::formatter<gd::Vertex> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gd::Vertex& v, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", v.name.empty() ? std::string_view("<unnamed>") : std::string_view(v.name));
    }
};

#endif // GD_VERTEX_HPP
