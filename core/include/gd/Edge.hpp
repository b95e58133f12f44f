#ifndef GD_EDGE_HPP
#define GD_EDGE_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <gd/Identifiers.hpp>
#include <gd/Options.hpp>
#include <gd/Path.hpp>
#include <gd/Vertex.hpp>

namespace gd {

enum class Direction : std::uint8_t {
    forward,    // ->
    backward,   // <-
    undirected, // --
    both,       // <->
    none,       // -!-
};

[[nodiscard]] constexpr std::string_view symbol(Direction d) noexcept {
    switch (d) {
    case Direction::forward: return "->";
    case Direction::backward: return "<-";
    case Direction::undirected: return "--";
    case Direction::both: return "<->";
    case Direction::none: return "-!-";
    }
    return "?";
}

[[nodiscard]] constexpr std::optional<Direction> directionFromSymbol(std::string_view s) noexcept {
    for (Direction d : magic_enum::enum_values<Direction>()) {
        if (symbol(d) == s) {
            return d;
        }
    }
    return std::nullopt;
}

/**
 * @brief an edge as the user specified it. Several syntactic edges between the same pair of vertices are
 * represented by a single arc of a digraph that lists them in its `syntacticEdges`.
 */
struct Edge {
    VertexId     tail{};
    VertexId     head{};
    Direction    direction = Direction::forward;
    property_map options;
    property_map generatedOptions;
    Path         path;
    std::size_t  eventIndex = kNoEventIndex;
};

} // namespace gd

template<>
struct fmt::formatter<gd::Direction> : fmt::formatter<std::string_view> {
    auto format(gd::Direction d, fmt::format_context& ctx) const { return fmt::formatter<std::string_view>::format(magic_enum::enum_name(d), ctx); }
};

#endif // GD_EDGE_HPP
