#include <boost/ut.hpp>

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#include <gd/AlgorithmRegistry.hpp>
#include <gd/Error.hpp>
#include <gd/Options.hpp>
#include <gd/Scope.hpp>

namespace {
struct Noop : gd::LayoutAlgorithm {
    using gd::LayoutAlgorithm::LayoutAlgorithm;
    void run(gd::Digraph&, const gd::property_map&) override {}
};

struct Other : Noop {
    using Noop::Noop;
};
} // namespace

const boost::ut::suite<"Options"> optionTests = [] {
    using namespace boost::ut;
    using namespace gd;

    "typed access"_test = [] {
        const property_map map{{"distance", 2.5}, {"count", 3}, {"name", std::string("spring")}, {"flag", true}};
        expect(eq(options::get<double>(map, "distance").value(), 2.5));
        expect(eq(options::get<double>(map, "count").value(), 3.0)) << "numbers convert into each other";
        expect(eq(options::get<int>(map, "distance").value(), 2));
        expect(eq(options::get<std::string>(map, "name").value(), std::string("spring")));
        expect(options::get<bool>(map, "flag").value());

        expect(!options::get<double>(map, "name").has_value());
        expect(!options::get<bool>(map, "count").has_value()) << "booleans are not numbers";
        const auto missing = options::get<double>(map, "absent");
        expect(!missing.has_value());
        expect(missing.error().message.find("absent") != std::string::npos);
    };

    "fallbacks and required values"_test = [] {
        const property_map map{{"distance", 2.5}};
        expect(eq(options::value<double>(map, "distance", 1.0), 2.5));
        expect(eq(options::value<double>(map, "absent", 1.0), 1.0));
        expect(eq(options::value<std::string>(map, "distance", "x"), std::string("x")));
        expect(eq(options::required<double>(map, "distance"), 2.5));
        expect(throws<gd::exception>([&] { std::ignore = options::required<double>(map, "absent"); }));
    };

    "coordinates"_test = [] {
        const property_map map{{"at", std::vector<double>{1.0, 2.0}}, {"float", std::vector<float>{3.0F, 4.0F}}, {"bad", std::vector<double>{1.0}}};
        expect(options::coordinate(map, "at").value() == Coordinate{1.0, 2.0});
        expect(options::coordinate(map, "float").value() == Coordinate{3.0, 4.0});
        expect(!options::coordinate(map, "bad").has_value());
        expect(!options::coordinate(map, "absent").has_value());
        expect(std::get<std::vector<double>>(options::toValue(Coordinate{5.0, 6.0})) == std::vector<double>{5.0, 6.0});
    };

    "layers override the defaults"_test = [] {
        const property_map outer{{"node distance", 10.0}, {"algorithm", std::string("outer")}};
        const property_map inner{{"algorithm", std::string("inner")}};
        const property_map resolved = options::resolve({&outer, nullptr, &inner});
        expect(eq(options::required<double>(resolved, "node distance"), 10.0));
        expect(eq(options::required<std::string>(resolved, "algorithm"), std::string("inner")));
        expect(eq(options::required<double>(resolved, "iterations"), 500.0));
        expect(eq(options::required<double>(options::defaults(), "node distance"), 28.452755));
    };

    "nested maps are merged"_test = [] {
        property_map       dest{{"nested", property_map{{"a", 1.0}, {"b", 2.0}}}, {"plain", 1.0}};
        const property_map src{{"nested", property_map{{"b", 3.0}}}, {"plain", property_map{{"c", 4.0}}}};
        updateMaps(src, dest);
        const auto& nested = std::get<property_map>(dest.at("nested"));
        expect(eq(std::get<double>(nested.at("a")), 1.0));
        expect(eq(std::get<double>(nested.at("b")), 3.0));
        expect(std::holds_alternative<property_map>(dest.at("plain")));
    };

    "errors carry their origin"_test = [] {
        const gd::Error error("broken");
        expect(eq(error.message, std::string("broken")));
        expect(fmt::format("{}", error).ends_with(": broken"));
        expect(fmt::format("{}", error).find("qa_Options.cpp") != std::string::npos);

        const gd::exception ex("failed");
        expect(std::string_view(ex.what()).starts_with("failed at "));
    };

    "a failed lookup is raised at the caller"_test = [] {
        const property_map map{{"size", 2.0}};
        try {
            std::ignore = options::required<std::string>(map, "size");
            expect(false) << "an incompatible type is rejected";
        } catch (const gd::exception& ex) {
            expect(eq(ex.message, std::string("option 'size' has an incompatible type")));
            expect(std::string_view(ex.sourceLocation.file_name()).ends_with("qa_Options.cpp"));
        }
    };
};

const boost::ut::suite<"AlgorithmRegistry"> registryTests = [] {
    using namespace boost::ut;
    using namespace gd;

    "insert and create"_test = [] {
        AlgorithmRegistry registry;
        expect(registry.insert<Noop>("noop", AlgorithmTraits{.connected = true}));
        expect(!registry.insert<Other>("noop")) << "the key is already taken";
        expect(registry.insert<Other>("other", AlgorithmTraits{.tree = true}));

        expect(registry.contains("noop"));
        expect(registry.keys() == std::vector<std::string>{"noop", "other"});
        expect(!registry.traits("noop")->connected) << "the latest registration wins";
        expect(registry.traits("other")->tree);
        expect(!registry.traits("missing").has_value());

        Scope             scope;
        rng::RandomSource random;
        Digraph           ugraph(scope.sharedArena());
        const AlgorithmContext context{.scope = scope, .random = random, .ugraph = ugraph, .syntacticComponent = scope.syntacticDigraph(), .layout = std::nullopt};
        auto              created = registry.create("other", context);
        expect(created != nullptr);
        expect(dynamic_cast<Other*>(created.get()) != nullptr);
        expect(&created->context().scope == &scope);
        expect(registry.create("missing", context) == nullptr);
    };

    "registries move"_test = [] {
        AlgorithmRegistry registry;
        registry.insert<Noop>("noop");
        AlgorithmRegistry moved = std::move(registry);
        expect(moved.contains("noop"));
    };

    "the global registry is shared"_test = [] { expect(&globalAlgorithmRegistry() == gdGlobalAlgorithmRegistry()); };
};

int main() { /* not needed for UT */ }
