#include <boost/ut.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "GraphTestUtils.hpp"

namespace {

double edgeLengthSpread(const gd::test::LayoutFixture& f, const std::vector<std::pair<gd::VertexId, gd::VertexId>>& edges) {
    double shortest = std::numeric_limits<double>::max();
    double longest  = 0.0;
    for (const auto& [u, v] : edges) {
        shortest = std::min(shortest, f.distance(u, v));
        longest  = std::max(longest, f.distance(u, v));
    }
    return longest / shortest;
}

} // namespace

const boost::ut::suite<"SpringLayouts"> springLayoutTests = [] {
    using namespace boost::ut;
    using namespace gd;

    "two vertices are placed at node distance"_test = [](const std::string& algorithm) {
        test::LayoutFixture f;
        const VertexId      a = f.node("a");
        const VertexId      b = f.node("b");
        f.edge(a, b);
        f.run(algorithm);
        expect(approx(f.distance(a, b), test::kOneCentimetre, 0.1 * test::kOneCentimetre)) << algorithm;
    } | std::vector<std::string>{"spring electrical layout", "spring electrical Hu 2006 layout", "spring layout", "spring Hu 2006 layout"};

    "node distance scales the drawing"_test = [] {
        test::LayoutFixture f;
        const VertexId      a = f.node("a");
        const VertexId      b = f.node("b");
        f.edge(a, b);
        f.run("spring electrical layout", {{"node distance", 50.0}});
        expect(approx(f.distance(a, b), 50.0, 1e-6));
    };

    "triangle edges get similar lengths"_test = [](const std::string& algorithm) {
        test::LayoutFixture f;
        const VertexId      a = f.node("a");
        const VertexId      b = f.node("b");
        const VertexId      c = f.node("c");
        f.edge(a, b);
        f.edge(b, c);
        f.edge(c, a);
        f.run(algorithm);
        expect(f.allFinite());
        expect(gt(f.distance(a, b), 1.0));
        expect(lt(edgeLengthSpread(f, {{a, b}, {b, c}, {c, a}}), 2.0)) << algorithm;
    } | std::vector<std::string>{"spring electrical layout", "spring layout"};

    "approximated repulsion gives a proper drawing"_test = [] {
        test::LayoutFixture   f;
        std::vector<VertexId> ring;
        for (int i = 0; i < 8; ++i) {
            ring.push_back(f.node(fmt::format("v{}", i)));
        }
        for (std::size_t i = 0UZ; i < ring.size(); ++i) {
            f.edge(ring[i], ring[(i + 1UZ) % ring.size()]);
        }
        f.run("spring electrical layout", {{"approximate remote forces", true}});
        expect(f.allFinite());
        for (std::size_t i = 0UZ; i < ring.size(); ++i) {
            for (std::size_t j = i + 1UZ; j < ring.size(); ++j) {
                expect(gt(f.distance(ring[i], ring[j]), 0.1)) << fmt::format("v{} and v{} coincide", i, j);
            }
        }
    };

    "desired positions are kept"_test = [] {
        test::LayoutFixture f;
        const VertexId      a = f.node("a", {{"desired at", std::vector<double>{10.0, 20.0}}});
        const VertexId      b = f.node("b");
        const VertexId      c = f.node("c");
        f.edge(a, b);
        f.edge(b, c);
        f.run("spring electrical layout");
        expect(f.pos(a) == Coordinate{10.0, 20.0});
        expect(f.allFinite());
    };

    "the same seed gives the same drawing"_test = [] {
        auto draw = [] {
            test::LayoutFixture f;
            const VertexId      a = f.node("a");
            const VertexId      b = f.node("b");
            const VertexId      c = f.node("c");
            const VertexId      d = f.node("d");
            f.edge(a, b);
            f.edge(b, c);
            f.edge(c, d);
            f.edge(d, b);
            f.run("spring electrical layout");
            return std::vector<Coordinate>{f.pos(a), f.pos(b), f.pos(c), f.pos(d)};
        };
        expect(draw() == draw());
    };

    "invalid parameters are rejected"_test = [] {
        for (const property_map& overrides : std::vector<property_map>{{{"cooling factor", 1.5}}, {{"iterations", -1.0}}, {{"minimum coarsening size", 1.0}}, {{"spring constant", -0.5}}, {{"initial step length", -1.0}}}) {
            test::LayoutFixture f;
            const VertexId      a = f.node("a");
            const VertexId      b = f.node("b");
            const VertexId      c = f.node("c");
            f.edge(a, b);
            f.edge(b, c);
            expect(throws<gd::exception>([&] { f.run("spring electrical Hu 2006 layout", overrides); }));
        }
    };

    "force framework layouts settle two vertices at the rest length of their force laws"_test = [] {
        constexpr double k = test::kOneCentimetre;
        struct Case {
            std::string  algorithm;
            double       expected;
            property_map overrides;
        };
        // social layouts: gravity towards the centroid acts with weight 0.2 times the social mass (degree 1, closeness 2)
        const std::vector<Case> cases{
            {"jedi spring electric layout", k, {}},
            {"spring electric no coarsen layout", std::cbrt(2.0) * k, {}},
            {"trivial spring layout", k, {{"global speed factor", 0.1}}}, // the pure spring law only settles for 0.2 * k * speed < 2
            {"social degree layout", std::cbrt(4.0 * k / (2.0 / (k * k) + 0.1)), {}},
            {"social closeness layout", std::cbrt(k / (1.0 / (k * k) + 0.2)), {}},
        };
        for (const Case& c : cases) {
            test::LayoutFixture f;
            const VertexId      a = f.node("a");
            const VertexId      b = f.node("b");
            f.edge(a, b);
            property_map overrides        = c.overrides;
            overrides["find equilibrium"] = false;
            f.run(c.algorithm, overrides);
            expect(approx(f.distance(a, b), c.expected, 0.1 * c.expected)) << fmt::format("{} ended at {}", c.algorithm, f.distance(a, b));
        }
    };

    "force framework layouts produce a drawing"_test = [](const std::string& algorithm) {
        test::LayoutFixture f;
        const VertexId      a = f.node("a");
        const VertexId      b = f.node("b");
        const VertexId      c = f.node("c");
        const VertexId      d = f.node("d");
        f.edge(a, b);
        f.edge(b, c);
        f.edge(c, d);
        f.edge(d, a);
        f.run(algorithm);
        expect(f.allFinite()) << algorithm;

        std::vector<Coordinate> points{f.pos(a), f.pos(b), f.pos(c), f.pos(d)};
        const BoundingBox       box = boundingBox(points);
        expect(gt(box.width() + box.height(), 1.0)) << algorithm << "collapsed to a point";
    } | std::vector<std::string>{"jedi spring electric layout", "spring electric no coarsen layout", "trivial spring layout", "social degree layout", "social closeness layout"};

    "every algorithm is registered"_test = [] {
        AlgorithmRegistry registry;
        expect(eq(registerBuiltinAlgorithms(registry), 10UZ));
        expect(eq(registerBuiltinAlgorithms(registry), 0UZ)) << "registering twice adds nothing";
        for (std::string_view key : {"spring electrical layout", "spring electrical Hu 2006 layout", "spring layout", "spring Hu 2006 layout", "layered layout"}) {
            expect(registry.contains(key)) << key;
            expect(registry.traits(key)->connected && registry.traits(key)->loopFree) << key;
        }
        for (std::string_view key : {"jedi spring electric layout", "spring electric no coarsen layout", "trivial spring layout", "social degree layout", "social closeness layout"}) {
            expect(registry.contains(key)) << key;
            expect(registry.traits(key)->connected) << key;
        }
        expect(globalAlgorithmRegistry().contains("spring electrical layout"));
    };
};

int main() { /* not needed for UT */ }
