#ifndef GD_COLLECTION_HPP
#define GD_COLLECTION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gd/Identifiers.hpp>
#include <gd/Options.hpp>
#include <gd/Vertex.hpp>

namespace gd {

/// kind of the collections that request a (sub)layout
inline constexpr std::string_view kSublayoutKind = "INTERNAL_sublayout_kind";
/// kind of the collections whose vertices are drawn inside a subgraph node
inline constexpr std::string_view kSubgraphNodeKind = "INTERNAL_subgraph_node_kind";

/**
 * @brief a named (`kind`) group of vertices and edges. Collections form a tree (owned by the `gd::Scope`)
 * that scopes nested layout requests and subgraph nodes.
 */
struct Collection {
    std::string                 kind;
    std::vector<VertexId>       vertices;
    std::vector<EdgeId>         edges;
    property_map                options;
    property_map                generatedOptions;
    std::optional<CollectionId> parent;
    std::vector<CollectionId>   children;
    std::size_t                 eventIndex = kNoEventIndex;
    std::optional<VertexId>     subgraphNode; // kSubgraphNodeKind only
    std::optional<CollectionId> parentLayout; // kSubgraphNodeKind only
};

} // namespace gd

#endif // GD_COLLECTION_HPP
