#include <boost/ut.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include <gd/algorithm/force/CoarseGraph.hpp>

#include "GraphTestUtils.hpp"

const boost::ut::suite<"CoarseGraph"> coarseGraphTests = [] {
    using namespace boost::ut;
    using namespace gd;
    using namespace gd::force;

    "directed triangle coarsens to two vertices"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a", {0.0, 0.0});
        const VertexId  b = g.add("b", {10.0, 0.0});
        const VertexId  c = g.add("c", {0.0, 10.0});
        g.connect(a, b);
        g.connect(b, c);
        g.connect(c, a);

        rng::RandomSource    random{42U};
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes);
        coarse.coarsen();

        expect(eq(coarse.getSize(), 2UZ));
        expect(eq(coarse.getLevel(), 1UZ));
        expect(approx(coarse.getRatio(), 2.0 / 3.0, 1e-12));

        std::vector<double> weights;
        for (VertexId v : g.graph.vertices()) {
            weights.push_back(attributes.weight.at(v));
        }
        std::ranges::sort(weights);
        expect(weights == std::vector<double>{1.0, 2.0});

        expect(eq(coarse.collapsedVertices(1UZ).size(), 1UZ));
        const VertexId merged = coarse.collapsedVertices(1UZ).front();
        expect(g[merged].name.starts_with("(")) << g[merged].name;
        expect(g[merged].kind == VertexKind::dummy);
        expect(approx(attributes.mass.at(merged), 2.0, 1e-12));
    };

    "uncoarsen restores vertices and arcs"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a");
        const VertexId  b = g.add("b");
        const VertexId  c = g.add("c");
        g.connect(a, b);
        g.connect(b, c);
        g.connect(c, a);

        rng::RandomSource    random{7U};
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes);
        coarse.coarsen();
        coarse.uncoarsen();

        expect(eq(coarse.getLevel(), 0UZ));
        expect(eq(g.graph.size(), 3UZ));
        expect(eq(g.graph.arcs().size(), 3UZ));
        expect(g.graph.arc(a, b).has_value());
        expect(g.graph.arc(b, c).has_value());
        expect(g.graph.arc(c, a).has_value());
    };

    "jitter expansion places restored vertices near the placeholder"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a", {0.0, 0.0});
        const VertexId  b = g.add("b", {20.0, 0.0});
        g.connect(a, b);

        rng::RandomSource    random{1U};
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes, CoarseGraph::Expansion::jitter);
        coarse.coarsen();
        expect(eq(coarse.getSize(), 1UZ));
        const Coordinate centre = g[g.graph.vertices().front()].pos;
        expect(approx(centre.x, 10.0, 1e-12));

        coarse.uncoarsen();
        for (VertexId v : {a, b}) {
            const Coordinate delta = g[v].pos - centre;
            expect(delta.x >= 0.0 && delta.x < 10.0) << fmt::format("{}", g[v].pos);
            expect(delta.y >= 0.0 && delta.y < 10.0) << fmt::format("{}", g[v].pos);
        }
    };

    "interpolation places restored vertices on the placeholder"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a", {0.0, 0.0});
        const VertexId  b = g.add("b", {0.0, 8.0});
        g.connect(a, b);

        rng::RandomSource    random{1U};
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes, CoarseGraph::Expansion::interpolate);
        coarse.coarsen();
        g[g.graph.vertices().front()].pos = Coordinate{5.0, 5.0};
        coarse.uncoarsen();
        expect(g[a].pos == Coordinate{5.0, 5.0});
        expect(g[b].pos == Coordinate{5.0, 5.0});
    };

    "framework attributes are summed"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a");
        const VertexId  b = g.add("b");
        g.connect(a, b);

        rng::RandomSource    random{3U};
        CoarseningAttributes attributes;
        attributes.framework[a]["social mass"] = 2.0;
        attributes.framework[b]["social mass"] = 3.0;
        CoarseGraph coarse(g.graph, random, attributes);
        coarse.coarsen();

        const VertexId merged = g.graph.vertices().front();
        expect(approx(options::required<double>(attributes.framework[merged], "social mass"), 5.0, 1e-12));
    };

    "framework attributes use the registered combine function"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a");
        const VertexId  b = g.add("b");
        g.connect(a, b);

        rng::RandomSource    random{3U};
        CoarseningAttributes attributes;
        attributes.framework[a]["label"] = std::string("a");
        attributes.framework[b]["label"] = std::string("b");
        attributes.combine["label"]      = [](const pmtv::pmt& x, const pmtv::pmt& y) -> pmtv::pmt { return std::get<std::string>(x) + std::get<std::string>(y); };
        CoarseGraph coarse(g.graph, random, attributes);
        coarse.coarsen();

        const VertexId    merged = g.graph.vertices().front();
        const std::string label  = options::required<std::string>(attributes.framework[merged], "label");
        expect(label == "ab" || label == "ba") << label;
    };

    "non-numeric framework attributes need a combine function"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a");
        const VertexId  b = g.add("b");
        g.connect(a, b);

        rng::RandomSource    random{3U};
        CoarseningAttributes attributes;
        attributes.framework[a]["label"] = std::string("a");
        attributes.framework[b]["label"] = std::string("b");
        CoarseGraph coarse(g.graph, random, attributes);
        expect(throws<gd::exception>([&] { coarse.coarsen(); }));
    };

    "uncoarsen without coarsening throws"_test = [] {
        test::TestGraph g;
        g.add("a");
        rng::RandomSource    random;
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes);
        expect(throws<gd::exception>([&] { coarse.uncoarsen(); }));
    };

    "isolated vertices are not matched"_test = [] {
        test::TestGraph g;
        g.add("a");
        g.add("b");
        g.add("c");

        rng::RandomSource    random{5U};
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes);
        coarse.coarsen();
        expect(eq(coarse.getSize(), 3UZ));
        expect(approx(coarse.getRatio(), 1.0, 1e-12));
        expect(eq(coarse.unmatchedVertices(1UZ).size(), 3UZ));
    };

    "every round leaves a maximal matching and never grows the graph"_test = [] {
        test::TestGraph       g;
        std::vector<VertexId> path;
        for (std::size_t i = 0UZ; i < 7UZ; ++i) {
            path.push_back(g.add(fmt::format("p{}", i)));
            if (i > 0UZ) {
                g.connectBoth(path[i - 1UZ], path[i]);
            }
        }
        const VertexId centre = g.add("centre");
        for (std::size_t i = 0UZ; i < 5UZ; ++i) {
            g.connectBoth(centre, g.add(fmt::format("s{}", i)));
        }
        g.connectBoth(path.back(), centre);

        rng::RandomSource    random{11U};
        CoarseningAttributes attributes;
        CoarseGraph          coarse(g.graph, random, attributes);
        std::size_t          previous = coarse.getSize();
        for (std::size_t round = 1UZ; round <= 6UZ; ++round) {
            coarse.coarsen();
            expect(le(coarse.getSize(), previous)) << fmt::format("round {}", round);
            previous = coarse.getSize();

            const std::vector<VertexId>& unmatched = coarse.unmatchedVertices(round);
            expect(eq(coarse.collapsedVertices(round).size() + unmatched.size(), coarse.getSize()));
            for (VertexId u : unmatched) {
                expect(g.graph.contains(u));
                for (VertexId w : unmatched) {
                    expect(!g.graph.arc(u, w).has_value()) << fmt::format("round {} left {} and {} unmatched", round, g[u].name, g[w].name);
                }
            }
        }
        expect(lt(coarse.getSize(), 13UZ));
    };

    "coarse vertices are appended to the arena and never reclaimed"_test = [] {
        test::TestGraph g;
        const VertexId  a = g.add("a", {0.0, 0.0});
        const VertexId  b = g.add("b", {4.0, 0.0});
        g.connect(a, b);

        rng::RandomSource    random{2U};
        CoarseningAttributes attributes;
        for (std::size_t run = 1UZ; run <= 2UZ; ++run) {
            CoarseGraph coarse(g.graph, random, attributes);
            coarse.coarsen();
            coarse.uncoarsen();
            expect(eq(g.arena->vertexCount(), 2UZ + run));
            expect(eq(g.graph.size(), 2UZ));
        }
        expect(g[a].name == "a" && g[b].name == "b") << "original ids keep their records";
    };
};

int main() { /* not needed for UT */ }
