#include <boost/ut.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <gd/Arena.hpp>
#include <gd/Digraph.hpp>
#include <gd/Edge.hpp>
#include <gd/Error.hpp>
#include <gd/Scope.hpp>

namespace {
struct Fixture {
    std::shared_ptr<gd::Arena> arena = std::make_shared<gd::Arena>();
    gd::Digraph                graph{arena};

    gd::VertexId vertex(std::string name) {
        gd::Vertex v;
        v.name                = std::move(name);
        v.kind                = gd::VertexKind::node;
        v.eventIndex          = arena->vertexCount();
        const gd::VertexId id = arena->addVertex(std::move(v));
        graph.add(id);
        return id;
    }

    [[nodiscard]] std::vector<gd::VertexId> heads(gd::VertexId v) const {
        std::vector<gd::VertexId> result;
        for (gd::ArcId a : graph.outgoing(v)) {
            result.push_back(graph[a].head);
        }
        return result;
    }

    /// every ordered vertex pair carries at most one arc, and the lookup agrees with the adjacency lists
    [[nodiscard]] bool arcsAreUnique() const {
        std::set<std::pair<gd::VertexId, gd::VertexId>> pairs;
        for (gd::ArcId a : graph.arcs()) {
            const gd::Arc& arc = graph[a];
            if (!pairs.emplace(arc.tail, arc.head).second || graph.arc(arc.tail, arc.head) != std::optional<gd::ArcId>(a)) {
                return false;
            }
        }
        for (gd::VertexId v : graph.vertices()) {
            std::size_t incoming = 0UZ;
            for (const auto& [tail, head] : pairs) {
                incoming += head == v ? 1UZ : 0UZ;
            }
            if (incoming != graph.incoming(v).size()) {
                return false;
            }
        }
        return true;
    }
};
} // namespace

const boost::ut::suite<"Digraph"> digraphTests = [] {
    using namespace boost::ut;
    using namespace gd;

    "vertices are added once"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        f.graph.add(a);
        expect(eq(f.graph.size(), 2UZ));
        expect(f.graph.contains(b));
        expect(f.graph.vertices() == std::vector<VertexId>{a, b});
    };

    "a digraph needs an arena"_test = [] { expect(throws<gd::exception>([] { std::ignore = Digraph(nullptr); })); };

    "connect reuses existing arcs"_test = [] {
        Fixture        f;
        const VertexId a  = f.vertex("a");
        const VertexId b  = f.vertex("b");
        const ArcId    ab = f.graph.connect(a, b);
        expect(f.graph.connect(a, b) == ab);
        expect(f.graph.arc(a, b) == std::optional<ArcId>(ab));
        expect(!f.graph.arc(b, a).has_value());
        expect(eq(f.graph.outgoing(a).size(), 1UZ));
        expect(eq(f.graph.incoming(b).size(), 1UZ));
        expect(f.graph.incoming(a).empty());

        const VertexId stranger = f.arena->addVertex(Vertex{.name = "stranger"});
        expect(throws<gd::exception>([&] { std::ignore = f.graph.connect(a, stranger); }));
        expect(throws<gd::exception>([&] { std::ignore = f.graph.outgoing(stranger); }));
    };

    "arcs are listed in vertex order"_test = [] {
        Fixture        f;
        const VertexId a  = f.vertex("a");
        const VertexId b  = f.vertex("b");
        const VertexId c  = f.vertex("c");
        const ArcId    bc = f.graph.connect(b, c);
        const ArcId    ab = f.graph.connect(a, b);
        const ArcId    ac = f.graph.connect(a, c);
        expect(f.graph.arcs() == std::vector<ArcId>{ab, ac, bc});
    };

    "disconnect and remove"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        const VertexId c = f.vertex("c");
        f.graph.connect(a, b);
        f.graph.connect(b, c);
        f.graph.connect(c, a);

        f.graph.disconnect(a, b);
        expect(!f.graph.arc(a, b).has_value());
        f.graph.disconnect(a, b); // absent arcs are ignored
        expect(eq(f.graph.arcs().size(), 2UZ));

        f.graph.remove(c);
        expect(!f.graph.contains(c));
        expect(f.graph.arcs().empty());
        expect(f.graph.vertices() == std::vector<VertexId>{a, b});
        expect(throws<gd::exception>([&] { f.graph.remove(c); }));

        const ArcId again = f.graph.connect(a, b);
        expect(f.graph.arcs() == std::vector<ArcId>{again});
    };

    "reconnect moves the arc fields"_test = [] {
        Fixture        f;
        const VertexId a  = f.vertex("a");
        const VertexId b  = f.vertex("b");
        const VertexId c  = f.vertex("c");
        const ArcId    ab = f.graph.connect(a, b);
        f.graph[ab].generatedOptions["label"] = std::string("x");

        const ArcId ac = f.graph.reconnect(ab, a, c);
        expect(!f.graph.arc(a, b).has_value());
        expect(eq(options::value<std::string>(f.graph[ac].generatedOptions, "label", ""), std::string("x")));
        expect(f.graph.reconnect(ac, a, c) == ac);
    };

    "ordering of adjacency lists"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        const VertexId c = f.vertex("c");
        const VertexId d = f.vertex("d");
        f.graph.connect(a, b);
        f.graph.connect(a, c);
        f.graph.connect(a, d);

        const std::vector<VertexId> order{d, b, c};
        f.graph.orderOutgoing(a, order);
        expect(f.heads(a) == order);

        const std::vector<VertexId> incomplete{d, b};
        expect(throws<gd::exception>([&] { f.graph.orderOutgoing(a, incomplete); }));

        f.graph.sortOutgoing(a, [&](ArcId x, ArcId y) { return f.graph[f.graph[x].head].name < f.graph[f.graph[y].head].name; });
        expect(f.heads(a) == std::vector<VertexId>{b, c, d});

        f.graph.sortVertices([&](VertexId x, VertexId y) { return f.graph[x].name > f.graph[y].name; });
        expect(f.graph.vertices() == std::vector<VertexId>{d, c, b, a});
    };

    "withVerticesOf drops the arcs"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        f.graph.connect(a, b);
        f.graph.options()["marker"] = 1.0;

        const Digraph copy = Digraph::withVerticesOf(f.graph);
        expect(copy.vertices() == f.graph.vertices());
        expect(copy.arcs().empty());
        expect(options::contains(copy.options(), "marker"));
        expect(&copy.syntacticDigraph() == &f.graph);
    };

    "collapse and expand"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        const VertexId c = f.vertex("c");
        const VertexId d = f.vertex("d");
        const ArcId    ab = f.graph.connect(a, b);
        f.graph.connect(b, c);
        f.graph.connect(d, a);
        f.graph.connect(c, d);
        f.graph[ab].generatedOptions["kept"] = true;

        const VertexId replacement = f.arena->addVertex(Vertex{.name = "ab"});
        std::vector<VertexId> merged;
        std::size_t           mergedArcs = 0UZ;
        const std::vector<VertexId> collapsed{a, b};
        f.graph.collapse(collapsed, replacement, [&](VertexId r, VertexId v) {
            expect(r == replacement);
            merged.push_back(v);
        }, [&](ArcId, ArcId) { ++mergedArcs; });

        expect(merged == collapsed);
        expect(eq(mergedArcs, 2UZ));
        expect(!f.graph.contains(a) and !f.graph.contains(b));
        expect(f.graph.arc(replacement, c).has_value());
        expect(f.graph.arc(d, replacement).has_value());
        expect(f.graph.arc(c, d).has_value());
        expect(f.graph.hasHistory(replacement));
        expect(f.graph.collapsedVertices(replacement).size() == 2UZ);
        expect(throws<gd::exception>([&] { f.graph.collapse(std::vector<VertexId>{c}, replacement); }));

        std::vector<VertexId> restored;
        f.graph.expand(replacement, [&](VertexId, VertexId v) { restored.push_back(v); });
        expect(restored == collapsed);
        expect(!f.graph.contains(replacement));
        expect(!f.graph.hasHistory(replacement));
        expect(f.graph.arc(a, b).has_value()) << "arcs inside the set come back";
        expect(f.graph.arc(b, c).has_value());
        expect(f.graph.arc(d, a).has_value());
        expect(eq(f.graph.arcs().size(), 4UZ));
        expect(options::value<bool>(f.graph[*f.graph.arc(a, b)].generatedOptions, "kept", false));
        expect(throws<gd::exception>([&] { f.graph.expand(replacement); }));
    };

    "arcs stay unique across collapse, reconnect and expand"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        const VertexId c = f.vertex("c");
        const VertexId d = f.vertex("d");
        const VertexId e = f.vertex("e");
        for (const auto& [tail, head] : std::vector<std::pair<VertexId, VertexId>>{{a, c}, {b, c}, {c, a}, {c, b}, {a, d}, {d, b}, {a, b}, {b, a}, {e, c}}) {
            f.graph.connect(tail, head);
        }
        expect(f.arcsAreUnique());

        const VertexId              ab = f.arena->addVertex(Vertex{.name = "ab"});
        const std::vector<VertexId> pair{a, b};
        f.graph.collapse(pair, ab);
        expect(f.arcsAreUnique()) << "shared neighbours c and d are connected once";
        expect(eq(f.graph.outgoing(ab).size(), 2UZ));
        expect(eq(f.graph.incoming(ab).size(), 2UZ));

        expect(f.graph.connect(ab, c) == *f.graph.arc(ab, c));
        const ArcId moved = f.graph.reconnect(*f.graph.arc(d, ab), ab, d);
        expect(moved == *f.graph.arc(ab, d)) << "reconnecting onto an existing arc reuses it";
        f.graph.reconnect(*f.graph.arc(e, c), e, ab);
        f.graph.connect(c, ab);
        expect(f.arcsAreUnique());

        f.graph.expand(ab);
        expect(f.arcsAreUnique());
        expect(f.graph.arc(a, b).has_value() and f.graph.arc(b, a).has_value());

        const VertexId              cd = f.arena->addVertex(Vertex{.name = "cd"});
        const std::vector<VertexId> other{c, d};
        f.graph.collapse(other, cd);
        f.graph.connect(a, cd);
        f.graph.connect(cd, a);
        expect(f.arcsAreUnique());
        f.graph.expand(cd);
        expect(f.arcsAreUnique());
        expect(!f.graph.contains(cd));
    };

    "collapse rejects the replacement itself"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        expect(throws<gd::exception>([&] { f.graph.collapse(std::vector<VertexId>{a}, a); }));
    };

    "formatting"_test = [] {
        Fixture        f;
        const VertexId a = f.vertex("a");
        const VertexId b = f.vertex("b");
        f.graph[b].pos   = Coordinate{10.7, -2.5};
        f.graph.connect(a, b);
        expect(eq(fmt::format("{}", f.graph), std::string("graph {\n  a[x=0pt,y=0pt]\n  b[x=10pt,y=-3pt]\n  a -> { b }\n}")));
        expect(eq(fmt::format("{}", a), std::string("#0")));
    };
};

const boost::ut::suite<"SyntacticDigraph"> syntacticDigraphTests = [] {
    using namespace boost::ut;
    using namespace gd;

    auto node = [](Scope& scope, std::string name) {
        Vertex v;
        v.name = std::move(name);
        v.kind = VertexKind::node;
        return scope.addVertex(std::move(v));
    };

    "edge directions become arcs"_test = [&] {
        Scope          scope;
        const VertexId a = node(scope, "a");
        const VertexId b = node(scope, "b");
        const VertexId c = node(scope, "c");
        const VertexId d = node(scope, "d");
        scope.addEdge(a, b, Direction::forward);
        scope.addEdge(b, c, Direction::backward);
        scope.addEdge(c, d, Direction::undirected);
        scope.addEdge(a, d, Direction::none);

        const Digraph digraph = digraphFromSyntacticDigraph(scope.syntacticDigraph());
        expect(digraph.arc(a, b).has_value());
        expect(digraph.arc(c, b).has_value() and !digraph.arc(b, c).has_value());
        expect(digraph.arc(c, d).has_value() and digraph.arc(d, c).has_value());
        expect(!digraph.arc(a, d).has_value() and !digraph.arc(d, a).has_value());

        const Digraph ugraph = ugraphFromDigraph(digraph);
        expect(ugraph.arc(b, a).has_value() and ugraph.arc(b, c).has_value());
        expect(eq(ugraph.arcs().size(), 6UZ));
    };

    "direction symbols"_test = [] {
        expect(directionFromSymbol("<->") == Direction::both);
        expect(directionFromSymbol("-!-") == Direction::none);
        expect(!directionFromSymbol("=>").has_value());
        expect(eq(symbol(Direction::backward), std::string_view("<-")));
        expect(eq(fmt::format("{}", Direction::undirected), std::string("undirected")));
    };

    "options of the syntactic edges"_test = [&] {
        Scope          scope;
        const VertexId a = node(scope, "a");
        const VertexId b = node(scope, "b");
        scope.addEdge(a, b, Direction::forward, {{"weight", 1.0}});
        scope.addEdge(b, a, Direction::forward, {{"weight", 2.0}});
        scope.addEdge(a, b, Direction::forward, {{"weight", 3.0}, {"span priority", 2.0}});

        Digraph     digraph = digraphFromSyntacticDigraph(scope.syntacticDigraph());
        const ArcId ab      = *digraph.arc(a, b);
        const ArcId ba      = *digraph.arc(b, a);

        const OptionsArray array = digraph.optionsArray(ab, "weight");
        expect(eq(array.aligned.size(), 2UZ) and eq(array.antiAligned.size(), 1UZ));
        expect(eq(array.values.size(), 3UZ));
        expect(eq(std::get<double>(array.values[0]), 1.0));
        expect(eq(std::get<double>(array.values[2]), 2.0));

        expect(eq(digraph.arcOptionValue<double>(ba, "weight", 0.0), 2.0));
        expect(!digraph.arcOption(ab, "colour").has_value());
        expect(eq(digraph.eventIndex(ab), scope[scope.syntacticDigraph()[*scope.syntacticDigraph().arc(a, b)].syntacticEdges.front()].eventIndex));
        expect(eq(digraph.spanPriority(ab), 2.0));
        expect(eq(digraph.spanPriority(ba), 2.0)) << "anti-aligned edges count as well";
        expect(digraph.syntacticTailAndHead(ab) == std::optional(std::pair{a, b}));
    };

    "span priorities by direction"_test = [&] {
        Scope          scope;
        const VertexId a = node(scope, "a");
        const VertexId b = node(scope, "b");
        scope.addEdge(a, b, Direction::forward, {{"span priority ->", 3.0}});
        const Digraph digraph = digraphFromSyntacticDigraph(scope.syntacticDigraph());
        expect(eq(digraph.spanPriority(*digraph.arc(a, b)), 3.0));

        Scope          plain;
        const VertexId u = node(plain, "u");
        const VertexId v = node(plain, "v");
        plain.addEdge(u, v);
        const Digraph other = digraphFromSyntacticDigraph(plain.syntacticDigraph());
        expect(eq(other.spanPriority(*other.arc(u, v)), 5.0));
    };

    "sync writes paths back to the edges"_test = [&] {
        Scope          scope;
        const VertexId a       = node(scope, "a");
        const VertexId b       = node(scope, "b");
        const EdgeId   forward = scope.addEdge(a, b, Direction::forward);
        const EdgeId   back    = scope.addEdge(b, a, Direction::backward);
        scope[b].pos           = Coordinate{10.0, 0.0};

        Digraph     digraph = digraphFromSyntacticDigraph(scope.syntacticDigraph());
        const ArcId ab      = *digraph.arc(a, b);
        const std::vector<Coordinate> bends{{5.0, 5.0}};
        digraph.setPolylinePath(ab, bends);
        digraph[ab].generatedOptions["routed"] = true;
        digraph.sync();

        Path forwardPath = scope[forward].path.clone();
        forwardPath.makeRigid();
        expect(forwardPath == Path{PathOp::moveto, Coordinate{0.0, 0.0}, Coordinate{5.0, 5.0}, Coordinate{10.0, 0.0}});
        Path backPath = scope[back].path.clone();
        backPath.makeRigid();
        expect(backPath == Path{PathOp::moveto, Coordinate{10.0, 0.0}, Coordinate{5.0, 5.0}, Coordinate{0.0, 0.0}});
        expect(options::value<bool>(scope[forward].generatedOptions, "routed", false));
        expect(digraph.pointCloud(ab).size() == 1UZ) << "anchors stay deferred";
    };
};

int main() { /* not needed for UT */ }
