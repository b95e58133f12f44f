#ifndef GD_ALGORITHM_FORCE_PREPROCESSING_HPP
#define GD_ALGORITHM_FORCE_PREPROCESSING_HPP

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include <gd/Digraph.hpp>
#include <gd/Identifiers.hpp>

namespace gd::force {

/// unordered vertex pair a force acts on; every pair is listed once, `first` precedes `second` in vertex order
using VertexPair = std::pair<VertexId, VertexId>;

[[nodiscard]] std::vector<VertexPair> allPairs(std::span<const VertexId> vertices);

/// pairs whose graph distance (ignoring arc direction) is at least 1 and at most `n`
[[nodiscard]] std::vector<VertexPair> overMaxNPairs(const Digraph& graph, std::size_t n);

/// pairs whose graph distance is exactly `n`
[[nodiscard]] std::vector<VertexPair> overExactlyNPairs(const Digraph& graph, std::size_t n);

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_PREPROCESSING_HPP
