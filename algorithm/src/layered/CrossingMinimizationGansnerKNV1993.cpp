#include <gd/algorithm/layered/CrossingMinimizationGansnerKNV1993.hpp>

#include <algorithm>
#include <optional>
#include <ranges>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gd::layered {

namespace {

std::optional<int> neighbourRank(const std::vector<int>& ranks, int rank, SweepDirection direction) {
    auto it = std::ranges::find(ranks, rank);
    if (it == ranks.end()) {
        return std::nullopt;
    }
    if (direction == SweepDirection::down) {
        return it == ranks.begin() ? std::nullopt : std::optional<int>(*std::prev(it));
    }
    auto next = std::next(it);
    return next == ranks.end() ? std::nullopt : std::optional<int>(*next);
}

} // namespace

Ranking CrossingMinimizationGansnerKNV1993::run() {
    computeInitialRankOrdering();

    Ranking     best          = _ranking.copy();
    std::size_t bestCrossings = countRankCrossings(best);

    for (std::size_t iteration = 1UZ; iteration <= kIterations; ++iteration) {
        const SweepDirection direction = iteration % 2UZ == 0UZ ? SweepDirection::down : SweepDirection::up;
        orderByWeightedMedian(direction);
        transpose(direction);

        if (const std::size_t crossings = countRankCrossings(_ranking); crossings < bestCrossings) {
            best          = _ranking.copy();
            bestCrossings = crossings;
        }
    }

    _ranking = std::move(best);
    return _ranking;
}

void CrossingMinimizationGansnerKNV1993::computeInitialRankOrdering() {
    Ranking     best          = _ranking.copy();
    std::size_t bestCrossings = countRankCrossings(best);

    for (SweepDirection direction : {SweepDirection::down, SweepDirection::up}) {
        const bool                   down = direction == SweepDirection::down;
        std::vector<VertexId>        stack;
        std::unordered_set<VertexId> discovered;

        const auto& vertices = _graph.vertices();
        for (VertexId v : vertices | std::views::reverse) {
            if ((down ? _graph.incoming(v) : _graph.outgoing(v)).empty()) {
                stack.push_back(v);
                discovered.insert(v);
            }
        }

        while (!stack.empty()) {
            const VertexId v = stack.back();
            stack.pop_back();
            _ranking.setPosition(v, _ranking.rankSize(_ranking.requireRank(v)));

            for (ArcId a : (down ? _graph.outgoing(v) : _graph.incoming(v)) | std::views::reverse) {
                const VertexId neighbour = down ? _graph[a].head : _graph[a].tail;
                if (discovered.insert(neighbour).second) {
                    stack.push_back(neighbour);
                }
            }
        }

        if (const std::size_t crossings = countRankCrossings(_ranking); crossings < bestCrossings) {
            best          = _ranking.copy();
            bestCrossings = crossings;
        }
    }

    _ranking = std::move(best);
}

std::size_t CrossingMinimizationGansnerKNV1993::countRankCrossings(const Ranking& ranking) const {
    std::size_t crossings = 0UZ;
    const auto  ranks     = ranking.ranks();
    for (std::size_t r = 1UZ; r < ranks.size(); ++r) {
        const auto vertices = ranking.vertices(ranks[r]);
        for (std::size_t i = 0UZ; i + 1UZ < vertices.size(); ++i) {
            for (std::size_t j = i + 1UZ; j < vertices.size(); ++j) {
                crossings += countNodeCrossings(ranking, vertices[i], vertices[j], SweepDirection::down);
            }
        }
    }
    return crossings;
}

std::size_t CrossingMinimizationGansnerKNV1993::countNodeCrossings(const Ranking& ranking, VertexId left, VertexId right, SweepDirection direction) const {
    const auto otherRank = neighbourRank(ranking.ranks(), ranking.requireRank(left), direction);
    if (!otherRank) {
        return 0UZ;
    }

    const bool down       = direction == SweepDirection::down;
    auto       neighbours = [&](VertexId v) {
        std::vector<std::size_t> positions;
        for (ArcId a : down ? _graph.incoming(v) : _graph.outgoing(v)) {
            const VertexId n = down ? _graph[a].tail : _graph[a].head;
            if (ranking.rank(n) == otherRank) {
                positions.push_back(ranking.position(n));
            }
        }
        return positions;
    };

    std::size_t crossings      = 0UZ;
    const auto  rightPositions = neighbours(right);
    for (std::size_t l : neighbours(left)) {
        crossings += static_cast<std::size_t>(std::ranges::count_if(rightPositions, [l](std::size_t r) { return r < l; }));
    }
    return crossings;
}

double CrossingMinimizationGansnerKNV1993::computeMedianPosition(VertexId v, int rank) const {
    std::vector<double> positions;
    for (ArcId a : _graph.incoming(v)) {
        if (_ranking.rank(_graph[a].tail) == rank) {
            positions.push_back(static_cast<double>(_ranking.position(_graph[a].tail)));
        }
    }
    for (ArcId a : _graph.outgoing(v)) {
        if (_ranking.rank(_graph[a].head) == rank) {
            positions.push_back(static_cast<double>(_ranking.position(_graph[a].head)));
        }
    }
    std::ranges::sort(positions);

    const std::size_t n = positions.size();
    if (n == 0UZ) {
        return -1.0;
    }
    const std::size_t median = n / 2UZ; // upper median for even counts
    if (n % 2UZ == 1UZ) {
        return positions[median];
    }
    if (n == 2UZ) {
        return (positions[0] + positions[1]) / 2.0;
    }
    const double left  = positions[median - 1UZ] - positions.front();
    const double right = positions.back() - positions[median];
    if (left + right == 0.0) {
        return (positions[median - 1UZ] + positions[median]) / 2.0;
    }
    return (positions[median - 1UZ] * right + positions[median] * left) / (left + right);
}

void CrossingMinimizationGansnerKNV1993::orderByWeightedMedian(SweepDirection direction) {
    const auto ranks = _ranking.ranks();
    if (ranks.size() < 2UZ) {
        return;
    }
    auto reorder = [this](int rank, int reference) {
        std::unordered_map<VertexId, double> median;
        for (VertexId v : _ranking.vertices(rank)) {
            median[v] = computeMedianPosition(v, reference);
        }
        _ranking.reorderRank(rank, [&](std::size_t, VertexId v) { return median.at(v); }, [&](std::size_t, VertexId v) { return median.at(v) < 0.0; });
    };

    if (direction == SweepDirection::down) {
        for (std::size_t r = 1UZ; r < ranks.size(); ++r) {
            reorder(ranks[r], ranks[r - 1UZ]);
        }
    } else {
        for (std::size_t r = 0UZ; r + 1UZ < ranks.size(); ++r) {
            reorder(ranks[r], ranks[r + 1UZ]);
        }
    }
}

void CrossingMinimizationGansnerKNV1993::transpose(SweepDirection direction) {
    const auto ranks = _ranking.ranks();
    if (ranks.size() < 2UZ) {
        return;
    }
    auto transposeRank = [&](int rank) {
        bool improved = false;
        for (std::size_t i = 0UZ; i + 1UZ < _ranking.rankSize(rank); ++i) {
            const VertexId v = _ranking.vertices(rank)[i];
            const VertexId w = _ranking.vertices(rank)[i + 1UZ];
            if (countNodeCrossings(_ranking, v, w, direction) > countNodeCrossings(_ranking, w, v, direction)) {
                improved = true;
                _ranking.switchPositions(v, w);
            }
        }
        return improved;
    };

    // every swap lowers the crossings towards the reference rank, so sweeping until nothing moves terminates
    bool improved = true;
    while (improved) {
        improved = false;
        if (direction == SweepDirection::down) {
            for (std::size_t r = 1UZ; r < ranks.size(); ++r) {
                improved = transposeRank(ranks[r]) || improved;
            }
        } else {
            for (std::size_t r = ranks.size() - 1UZ; r-- > 0UZ;) {
                improved = transposeRank(ranks[r]) || improved;
            }
        }
    }
}

} // namespace gd::layered
