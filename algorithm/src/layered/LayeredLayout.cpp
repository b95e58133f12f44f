#include <gd/algorithm/layered/LayeredLayout.hpp>

#include <algorithm>
#include <deque>
#include <ranges>

#include <fmt/format.h>

#include <gd/Error.hpp>
#include <gd/algorithm/layered/CrossingMinimizationGansnerKNV1993.hpp>

namespace gd::layered {

Digraph removeCycles(const Digraph& digraph, ReversedArcs& reversed) {
    enum class Colour { white, grey, black };
    std::unordered_map<VertexId, Colour> colour;
    for (VertexId v : digraph.vertices()) {
        colour[v] = Colour::white;
    }

    for (VertexId root : digraph.vertices()) {
        if (colour[root] != Colour::white) {
            continue;
        }
        std::vector<std::pair<VertexId, std::size_t>> stack{{root, 0UZ}};
        colour[root] = Colour::grey;
        while (!stack.empty()) {
            const auto [v, next] = stack.back();
            const auto& outgoing = digraph.outgoing(v);
            if (next == outgoing.size()) {
                colour[v] = Colour::black;
                stack.pop_back();
                continue;
            }
            stack.back().second = next + 1UZ;
            const VertexId w    = digraph[outgoing[next]].head;
            if (w == v) {
                continue;
            }
            if (colour[w] == Colour::grey) {
                reversed.emplace(v, w);
            } else if (colour[w] == Colour::white) {
                colour[w] = Colour::grey;
                stack.emplace_back(w, 0UZ);
            }
        }
    }

    Digraph dag(digraph.sharedArena(), &digraph.syntacticDigraph(), digraph.options());
    dag.add(digraph.vertices());
    for (ArcId a : digraph.arcs()) {
        const VertexId tail = digraph[a].tail;
        const VertexId head = digraph[a].head;
        if (tail == head) {
            continue;
        }
        if (reversed.contains({tail, head})) {
            dag.connect(head, tail);
        } else {
            dag.connect(tail, head);
        }
    }
    return dag;
}

Ranking rankLongestPath(const Digraph& dag) {
    std::unordered_map<VertexId, std::size_t> inDegree;
    std::deque<VertexId>                      queue;
    for (VertexId v : dag.vertices()) {
        inDegree[v] = dag.incoming(v).size();
        if (inDegree[v] == 0UZ) {
            queue.push_back(v);
        }
    }

    Ranking     ranking;
    std::size_t ranked = 0UZ;
    while (!queue.empty()) {
        const VertexId v = queue.front();
        queue.pop_front();
        int rank = 1;
        for (ArcId a : dag.incoming(v)) {
            rank = std::max(rank, ranking.requireRank(dag[a].tail) + 1);
        }
        ranking.setRank(v, rank);
        ++ranked;
        for (ArcId a : dag.outgoing(v)) {
            if (--inDegree[dag[a].head] == 0UZ) {
                queue.push_back(dag[a].head);
            }
        }
    }
    if (ranked != dag.size()) {
        throw gd::exception(fmt::format("cannot rank a digraph with cycles ({} of {} vertices ranked)", ranked, dag.size()));
    }
    return ranking;
}

LayeredLayout::Chains LayeredLayout::insertDummies(Digraph& dag, Ranking& ranking) {
    Chains chains;
    for (ArcId a : dag.arcs()) {
        const VertexId tail     = dag[a].tail;
        const VertexId head     = dag[a].head;
        const int      tailRank = ranking.requireRank(tail);
        const int      headRank = ranking.requireRank(head);
        if (headRank - tailRank <= 1) {
            continue;
        }

        dag.disconnect(tail, head);
        auto&    chain    = chains[{tail, head}];
        VertexId previous = tail;
        for (int r = tailRank + 1; r < headRank; ++r) {
            Vertex dummy;
            dummy.kind        = VertexKind::dummy;
            const VertexId id = dag.arena().addVertex(std::move(dummy));
            dag.add(id);
            ranking.setRank(id, r);
            dag.connect(previous, id);
            chain.push_back(id);
            previous = id;
        }
        dag.connect(previous, head);
    }
    return chains;
}

void LayeredLayout::run(Digraph& digraph, const property_map& options) {
    const double levelDistance   = options::required<double>(options, "level distance");
    const double siblingDistance = options::required<double>(options, "sibling distance");

    ReversedArcs reversed;
    Digraph      dag     = removeCycles(digraph, reversed);
    Ranking      ranking = rankLongestPath(dag);
    const Chains chains  = insertDummies(dag, ranking);
    ranking.normalize();

    ranking = CrossingMinimizationGansnerKNV1993(dag, std::move(ranking)).run();

    for (int rank : ranking.ranks()) {
        const auto   vertices = ranking.vertices(rank);
        const double centre   = static_cast<double>(vertices.size() - 1UZ) / 2.0;
        for (std::size_t i = 0UZ; i < vertices.size(); ++i) {
            dag[vertices[i]].pos = Coordinate{(static_cast<double>(i) - centre) * siblingDistance, -static_cast<double>(rank - 1) * levelDistance};
        }
    }

    for (ArcId a : digraph.arcs()) {
        const VertexId tail = digraph[a].tail;
        const VertexId head = digraph[a].head;
        if (tail == head) {
            continue;
        }
        const bool isReversed = reversed.contains({tail, head});
        auto       it         = chains.find(isReversed ? std::pair{head, tail} : std::pair{tail, head});
        if (it == chains.end()) {
            continue;
        }
        std::vector<Coordinate> bends;
        for (VertexId dummy : it->second) {
            bends.push_back(dag[dummy].pos);
        }
        if (isReversed) {
            std::ranges::reverse(bends);
        }
        digraph.setPolylinePath(a, bends);
    }
}

} // namespace gd::layered
