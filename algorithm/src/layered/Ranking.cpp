#include <gd/algorithm/layered/Ranking.hpp>

#include <algorithm>
#include <ranges>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd::layered {

void Ranking::setRank(VertexId v, int rank) {
    if (auto it = _rank.find(v); it != _rank.end()) {
        if (it->second == rank) {
            return;
        }
        const int old = it->second;
        std::erase(rankVertices(old), v);
        if (_ranks[old].empty()) {
            _ranks.erase(old);
        } else {
            updatePositions(old);
        }
    }
    _rank[v] = rank;
    auto& vertices = _ranks[rank];
    vertices.push_back(v);
    _position[v] = vertices.size() - 1UZ;
}

std::optional<int> Ranking::rank(VertexId v) const {
    if (auto it = _rank.find(v); it != _rank.end()) {
        return it->second;
    }
    return std::nullopt;
}

int Ranking::requireRank(VertexId v) const {
    if (auto r = rank(v)) {
        return *r;
    }
    throw gd::exception(fmt::format("vertex {} has no rank", v));
}

std::vector<int> Ranking::ranks() const {
    auto view = _ranks | std::views::keys;
    return {view.begin(), view.end()};
}

std::size_t Ranking::rankSize(int rank) const {
    auto it = _ranks.find(rank);
    return it == _ranks.end() ? 0UZ : it->second.size();
}

std::span<const VertexId> Ranking::vertices(int rank) const {
    auto it = _ranks.find(rank);
    if (it == _ranks.end()) {
        return {};
    }
    return it->second;
}

std::size_t Ranking::position(VertexId v) const {
    if (auto it = _position.find(v); it != _position.end()) {
        return it->second;
    }
    throw gd::exception(fmt::format("vertex {} has no rank position", v));
}

void Ranking::setPosition(VertexId v, std::size_t position) {
    const int rank     = requireRank(v);
    auto&     vertices = rankVertices(rank);
    std::erase(vertices, v);
    const std::size_t target = std::min(position, vertices.size());
    vertices.insert(vertices.begin() + static_cast<std::ptrdiff_t>(target), v);
    updatePositions(rank);
}

void Ranking::switchPositions(VertexId left, VertexId right) {
    const int rank = requireRank(left);
    if (rank != requireRank(right)) {
        throw gd::exception(fmt::format("cannot switch {} and {}: they are on different ranks", left, right));
    }
    auto&             vertices = rankVertices(rank);
    const std::size_t l        = _position.at(left);
    const std::size_t r        = _position.at(right);
    std::swap(vertices[l], vertices[r]);
    _position[left]  = r;
    _position[right] = l;
}

void Ranking::reorderRank(int rank, const IndexFunction& index, const FixedPredicate& isFixed) {
    auto& vertices = rankVertices(rank);

    std::vector<std::size_t>                 freeSlots;
    std::vector<std::pair<double, VertexId>>  movable;
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        if (!isFixed(i, vertices[i])) {
            freeSlots.push_back(i);
            movable.emplace_back(index(i, vertices[i]), vertices[i]);
        }
    }
    std::ranges::stable_sort(movable, {}, &std::pair<double, VertexId>::first);
    for (std::size_t i = 0UZ; i < freeSlots.size(); ++i) {
        vertices[freeSlots[i]] = movable[i].second;
    }
    updatePositions(rank);
}

void Ranking::normalize() {
    std::map<int, std::vector<VertexId>> renumbered;
    int                                  next = 1;
    for (auto& [rank, vertices] : _ranks) {
        for (VertexId v : vertices) {
            _rank[v] = next;
        }
        renumbered.emplace(next++, std::move(vertices));
    }
    _ranks = std::move(renumbered);
}

std::vector<VertexId>& Ranking::rankVertices(int rank) {
    auto it = _ranks.find(rank);
    if (it == _ranks.end()) {
        throw gd::exception(fmt::format("unknown rank {}", rank));
    }
    return it->second;
}

void Ranking::updatePositions(int rank) {
    const auto& vertices = rankVertices(rank);
    for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
        _position[vertices[i]] = i;
    }
}

} // namespace gd::layered
