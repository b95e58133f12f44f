#include <boost/ut.hpp>

#include <cmath>
#include <string>
#include <vector>

#include <gd/AlgorithmRegistry.hpp>
#include <gd/Collection.hpp>
#include <gd/Error.hpp>
#include <gd/LayoutPipeline.hpp>
#include <gd/Scope.hpp>

namespace {

/// places the vertices of the digraph on the x axis, `grid step` apart, in digraph order
struct GridLayout : gd::LayoutAlgorithm {
    using gd::LayoutAlgorithm::LayoutAlgorithm;

    void run(gd::Digraph& digraph, const gd::property_map& options) override {
        const double step = gd::options::value<double>(options, "grid step", 10.0);
        double       x    = 0.0;
        for (gd::VertexId v : digraph.vertices()) {
            digraph[v].pos = gd::Coordinate{x, 0.0};
            x += step;
        }
    }
};

gd::Path square(double halfSize) {
    using gd::Coordinate;
    using gd::PathOp;
    return gd::Path{PathOp::moveto, Coordinate{-halfSize, -halfSize}, Coordinate{halfSize, -halfSize}, Coordinate{halfSize, halfSize}, Coordinate{-halfSize, halfSize}, PathOp::closepath};
}

struct PipelineFixture {
    gd::AlgorithmRegistry registry;
    gd::Scope             scope;
    gd::CollectionId      root;

    explicit PipelineFixture(gd::property_map rootOptions = {{"algorithm", std::string("grid")}}) : root(scope.addCollection(std::string(gd::kSublayoutKind), std::move(rootOptions))) {
        registry.insert<GridLayout>("grid");
        registry.insert<GridLayout>("grid per component", gd::AlgorithmTraits{.connected = true});
    }

    gd::VertexId node(std::string name, gd::property_map options = {}, std::vector<gd::CollectionId> collections = {}) {
        gd::Vertex v;
        v.name    = std::move(name);
        v.kind    = gd::VertexKind::node;
        v.options = std::move(options);
        collections.push_back(root);
        return scope.addVertex(std::move(v), collections);
    }

    gd::EdgeId edge(gd::VertexId tail, gd::VertexId head, gd::property_map options = {}) {
        const std::vector<gd::CollectionId> collections{root};
        return scope.addEdge(tail, head, gd::Direction::forward, std::move(options), collections);
    }

    void run() { gd::LayoutPipeline(scope, registry).run(); }

    [[nodiscard]] gd::Coordinate pos(gd::VertexId v) const { return scope[v].pos; }
};

bool near(const gd::Coordinate& a, const gd::Coordinate& b, double tolerance = 1e-9) { return std::abs(a.x - b.x) < tolerance && std::abs(a.y - b.y) < tolerance; }

} // namespace

const boost::ut::suite<"LayoutPipeline"> layoutPipelineTests = [] {
    using namespace boost::ut;
    using namespace gd;

    "a scope without layout cannot be drawn"_test = [] {
        Scope             scope;
        AlgorithmRegistry registry;
        expect(throws<gd::exception>([&] { LayoutPipeline(scope, registry).run(); }));
    };

    "unknown algorithms are reported"_test = [] {
        PipelineFixture f({{"algorithm", std::string("no such layout")}});
        std::ignore = f.node("a");
        expect(throws<gd::exception>([&] { f.run(); }));

        PipelineFixture unset{property_map{}};
        std::ignore = unset.node("a");
        expect(throws<gd::exception>([&] { unset.run(); }));
    };

    "the first vertex is anchored at the origin"_test = [] {
        PipelineFixture f;
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        const VertexId  c = f.node("c");
        f.edge(a, b);
        f.edge(b, c);
        f.run();

        expect(near(f.pos(a), {0.0, 0.0}));
        expect(near(f.pos(b), {10.0, 0.0}));
        expect(near(f.pos(c), {20.0, 0.0}));
        expect(f.scope.syntacticDigraph().contains(a)) << "the result replaces the syntactic digraph";
    };

    "desired positions anchor the drawing"_test = [] {
        PipelineFixture f;
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b", {{"desired at", std::vector<double>{100.0, 50.0}}});
        f.edge(a, b);
        f.run();
        expect(near(f.pos(b), {100.0, 50.0}));
        expect(near(f.pos(a), {90.0, 50.0}));
    };

    "anchor node and anchor at"_test = [] {
        PipelineFixture f({{"algorithm", std::string("grid")}, {"anchor node", std::string("b")}, {"anchor at", std::vector<double>{-5.0, 5.0}}});
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        f.edge(a, b);
        f.run();
        expect(near(f.pos(b), {-5.0, 5.0}));
        expect(near(f.pos(a), {-15.0, 5.0}));
    };

    "layout options reach the algorithm"_test = [] {
        PipelineFixture f({{"algorithm", std::string("grid")}, {"grid step", 25.0}});
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        f.edge(a, b);
        f.run();
        expect(approx(f.pos(b).x - f.pos(a).x, 25.0, 1e-9));
    };

    "regardless at and nudge"_test = [] {
        PipelineFixture f;
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b", {{"nudge", std::vector<double>{3.0, 4.0}}});
        const VertexId  c = f.node("c", {{"regardless at", std::vector<double>{7.0, 7.0}}});
        f.edge(a, b);
        f.edge(b, c);
        f.run();
        expect(near(f.pos(a), {0.0, 0.0}));
        expect(near(f.pos(b), {13.0, 4.0}));
        expect(near(f.pos(c), {7.0, 7.0}));
    };

    "components are packed side by side"_test = [] {
        PipelineFixture f({{"algorithm", std::string("grid per component")}});
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        const VertexId  c = f.node("c");
        const VertexId  d = f.node("d");
        f.edge(a, b);
        f.edge(c, d);
        f.run();

        expect(near(f.pos(a), {0.0, 0.0}));
        expect(near(f.pos(b), {10.0, 0.0}));
        expect(approx(f.pos(c).x - f.pos(b).x, 8.0, 1e-9)) << "separated by the component sep";
        expect(approx(f.pos(d).x - f.pos(c).x, 10.0, 1e-9));
        expect(approx(f.pos(c).y, 0.0, 1e-9)) << "aligned at their first nodes";
    };

    "component order and direction"_test = [] {
        PipelineFixture f({{"algorithm", std::string("grid per component")}, {"component order", std::string("decreasing node number")}, {"component direction", 90.0}});
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        const VertexId  c = f.node("c");
        const VertexId  d = f.node("d");
        f.edge(a, b);
        f.edge(b, c);
        std::ignore = d;
        f.run();

        expect(near(f.pos(a), {0.0, 0.0}));
        expect(approx(f.pos(d).x, 0.0, 1e-9)) << "the smaller component follows upwards";
        expect(f.pos(d).y > 0.0);
    };

    "edges are cut at the vertex outlines"_test = [] {
        PipelineFixture f({{"algorithm", std::string("grid")}, {"grid step", 30.0}});
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        f.scope[a].path   = square(5.0);
        f.scope[b].path   = square(5.0);
        const EdgeId cut  = f.edge(a, b);
        const EdgeId kept = f.edge(b, a, {{"tail cut", false}, {"head cut", false}});
        f.run();

        const auto points = f.scope[cut].path.coordinates();
        expect(eq(points.size(), 2UZ));
        if (points.size() == 2UZ) {
            expect(near(points.front(), {5.0, 0.0}));
            expect(near(points.back(), {25.0, 0.0}));
        }
        const auto uncut = f.scope[kept].path.coordinates();
        expect(eq(uncut.size(), 2UZ));
        if (uncut.size() == 2UZ) {
            expect(near(uncut.front(), {30.0, 0.0}));
            expect(near(uncut.back(), {0.0, 0.0}));
        }
    };

    "decompose keeps the event order"_test = [] {
        PipelineFixture f;
        const VertexId  a = f.node("a");
        const VertexId  b = f.node("b");
        const VertexId  c = f.node("c");
        f.edge(c, a);
        const auto components = LayoutPipeline::decompose(f.scope.syntacticDigraph());
        expect(eq(components.size(), 2UZ));
        expect(components[0].vertices() == std::vector<VertexId>{a, c});
        expect(components[1].vertices() == std::vector<VertexId>{b});
        expect(components[0].arc(c, a).has_value());

        const auto whole = LayoutPipeline::decompose(components[0]);
        expect(eq(whole.size(), 1UZ));
        expect(eq(whole.front().arcs().size(), 1UZ));
    };
};

const boost::ut::suite<"Sublayouts"> sublayoutTests = [] {
    using namespace boost::ut;
    using namespace gd;

    "sub-layouts keep their shape"_test = [] {
        PipelineFixture    f({{"algorithm", std::string("grid")}, {"grid step", 50.0}});
        const CollectionId inner = f.scope.addCollection(std::string(kSublayoutKind), {{"grid step", 3.0}}, f.root);
        const VertexId     a     = f.node("a");
        const VertexId     c     = f.node("c", {}, {inner});
        const VertexId     d     = f.node("d", {}, {inner});
        f.run();

        expect(approx(f.pos(d).x - f.pos(c).x, 3.0, 1e-9));
        expect(approx(f.pos(c).y, f.pos(d).y, 1e-9));
        const double middle = (f.pos(c).x + f.pos(d).x) / 2.0;
        expect(approx(std::abs(f.pos(a).x - middle), 50.0, 1e-9)) << "the sub-layout is placed as one block";
    };

    "layout options inherit from the enclosing collections"_test = [] {
        PipelineFixture    f({{"algorithm", std::string("grid")}, {"grid step", 50.0}, {"node distance", 1.0}});
        const CollectionId inner = f.scope.addCollection(std::string(kSublayoutKind), {{"grid step", 3.0}}, f.root);
        AlgorithmRegistry  registry;
        const Sublayouts   sublayouts(f.scope, registry);
        const property_map options = sublayouts.layoutOptions(inner);
        expect(eq(options::required<double>(options, "grid step"), 3.0));
        expect(eq(options::required<double>(options, "node distance"), 1.0));
        expect(eq(options::required<std::string>(options, "algorithm"), std::string("grid")));
        expect(eq(options::required<double>(options, "iterations"), 500.0));
    };

    "subgraph nodes surround their members"_test = [] {
        PipelineFixture    f;
        Vertex             node;
        node.name                   = "s";
        const CollectionId subgraph = f.scope.addSubgraphNode(std::move(node), f.root, std::vector<CollectionId>{f.root});
        const VertexId     s        = *f.scope.vertexByName("s");
        const VertexId     a        = f.node("a", {}, {subgraph});
        const VertexId     b        = f.node("b", {}, {subgraph});
        f.edge(a, b);

        std::vector<VertexId> created;
        f.scope.onCreateVertex([&](VertexId v) { created.push_back(v); });
        f.run();

        expect(near(f.pos(a), {0.0, 0.0}));
        expect(near(f.pos(b), {10.0, 0.0})) << "the subgraph node is hidden from the algorithm";
        expect(near(f.pos(s), {5.0, 0.0}));
        expect(eq(options::value<std::string>(f.scope[s].generatedOptions, "subgraph bounding box width", ""), std::string("10pt")));
        expect(created == std::vector<VertexId>{s});
    };
};

int main() { /* not needed for UT */ }
