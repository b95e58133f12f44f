#ifndef GD_ALGORITHM_LAYERED_RANKING_HPP
#define GD_ALGORITHM_LAYERED_RANKING_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <gd/Identifiers.hpp>

namespace gd::layered {

/**
 * @brief assignment of vertices to ranks (layers) together with their left-to-right order inside each rank.
 *
 * Positions are 0-based and always dense: the vertices of a rank occupy the positions `0 .. rankSize(rank) - 1`.
 * A `Ranking` is a plain value; `copy()` gives an independent snapshot.
 */
class Ranking {
public:
    using IndexFunction  = std::function<double(std::size_t position, VertexId v)>;
    using FixedPredicate  = std::function<bool(std::size_t position, VertexId v)>;

private:
    std::unordered_map<VertexId, int>         _rank;
    std::unordered_map<VertexId, std::size_t> _position;
    std::map<int, std::vector<VertexId>>      _ranks;

public:
    [[nodiscard]] Ranking copy() const { return *this; }

    /// moves `v` to the end of `rank`
    void                              setRank(VertexId v, int rank);
    [[nodiscard]] std::optional<int>  rank(VertexId v) const;
    [[nodiscard]] int                 requireRank(VertexId v) const;
    [[nodiscard]] bool                contains(VertexId v) const { return _rank.contains(v); }
    [[nodiscard]] std::vector<int>    ranks() const;
    [[nodiscard]] std::size_t         rankSize(int rank) const;
    [[nodiscard]] std::span<const VertexId> vertices(int rank) const;

    [[nodiscard]] std::size_t position(VertexId v) const;
    /// moves `v` to `position` inside its rank, clamped to the last position
    void setPosition(VertexId v, std::size_t position);
    void switchPositions(VertexId left, VertexId right);

    /**
     * stable sort of the non-fixed vertices of `rank` by `index`; fixed vertices keep their positions and the
     * sorted ones fill the remaining slots from left to right.
     */
    void reorderRank(int rank, const IndexFunction& index, const FixedPredicate& isFixed);

    /// renumbers the ranks to `1 .. ranks().size()` keeping their order
    void normalize();

private:
    [[nodiscard]] std::vector<VertexId>& rankVertices(int rank);
    void                                 updatePositions(int rank);
};

} // namespace gd::layered

#endif // GD_ALGORITHM_LAYERED_RANKING_HPP
