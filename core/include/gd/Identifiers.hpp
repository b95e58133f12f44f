#ifndef GD_IDENTIFIERS_HPP
#define GD_IDENTIFIERS_HPP

#include <cstdint>

#include <fmt/format.h>

#include <gd/meta/utils.hpp>

namespace gd {

/// index of a vertex record in its `gd::Arena`
enum class VertexId : std::uint32_t {};
/// index of a syntactic edge record in its `gd::Arena`
enum class EdgeId : std::uint32_t {};
/// index of an arc record in the arc arena of one `gd::Digraph`
enum class ArcId : std::uint32_t {};
/// index of a collection owned by a `gd::Scope`
enum class CollectionId : std::uint32_t {};

} // namespace gd

template<typename TId>
requires std::same_as<TId, gd::VertexId> || std::same_as<TId, gd::EdgeId> || std::same_as<TId, gd::ArcId> || std::same_as<TId, gd::CollectionId>
struct fmt::formatter<TId> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(TId id, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "#{}", gd::meta::index(id));
    }
};

#endif // GD_IDENTIFIERS_HPP
