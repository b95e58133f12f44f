#include <boost/ut.hpp>

#include <array>
#include <numbers>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <gd/Bezier.hpp>
#include <gd/Coordinate.hpp>
#include <gd/Storage.hpp>

const boost::ut::suite<"Coordinate"> coordinateTests = [] {
    using namespace boost::ut;
    using gd::Coordinate;

    "arithmetic"_test = [] {
        constexpr Coordinate a{1.0, 2.0};
        constexpr Coordinate b{3.0, -1.0};
        static_assert(a + b == Coordinate{4.0, 1.0});
        static_assert(a - b == Coordinate{-2.0, 3.0});
        static_assert(2.0 * a == Coordinate{2.0, 4.0});
        static_assert(a * b == 1.0);
        static_assert(-a == Coordinate{-1.0, -2.0});
        expect(eq(Coordinate(3.0, 4.0).norm(), 5.0));
        expect(eq(gd::distance(a, b), std::sqrt(13.0)));
    };

    "normalize"_test = [] {
        const Coordinate n = Coordinate{0.0, -2.0}.normalized();
        expect(approx(n.x, 0.0, 1e-12) and approx(n.y, -1.0, 1e-12));
        expect(Coordinate{}.normalized() == Coordinate{1.0, 0.0}) << "zero vectors normalise to the x axis";
    };

    "moveTowards"_test = [] {
        Coordinate c{0.0, 0.0};
        c.moveTowards({10.0, -4.0}, 0.25);
        expect(c == Coordinate{2.5, -1.0});
    };

    "transform"_test = [] {
        Coordinate c{1.0, 0.0};
        c.apply(gd::rotationTransform(std::numbers::pi / 2.0));
        expect(approx(c.x, 0.0, 1e-12) and approx(c.y, 1.0, 1e-12));
        c.apply({2.0, 0.0, 0.0, 2.0, 1.0, -1.0});
        expect(approx(c.x, 1.0, 1e-12) and approx(c.y, 1.0, 1e-12));
    };

    "bounding box"_test = [] {
        const std::vector<Coordinate> points{{1.0, 5.0}, {-3.0, 2.0}, {4.0, -1.0}};
        const gd::BoundingBox         box = gd::boundingBox(points);
        expect(eq(box.minX, -3.0) and eq(box.maxX, 4.0));
        expect(eq(box.minY, -1.0) and eq(box.maxY, 5.0));
        expect(eq(box.width(), 7.0) and eq(box.height(), 6.0));
        expect(eq(box.centerX, 0.5) and eq(box.centerY, 2.0));

        const gd::BoundingBox empty = gd::boundingBox(std::vector<Coordinate>{});
        expect(eq(empty.width(), 0.0) and eq(empty.centerX, 0.0));
    };

    "formatting"_test = [] { expect(eq(fmt::format("{}", Coordinate{1.5, -2.0}), std::string("(1.5pt,-2pt)"))); };
};

const boost::ut::suite<"Bezier"> bezierTests = [] {
    using namespace boost::ut;
    using gd::Coordinate;

    "de Casteljau split"_test = [] {
        constexpr Coordinate from{0.0, 0.0};
        constexpr Coordinate s1{0.0, 1.0};
        constexpr Coordinate s2{2.0, 1.0};
        constexpr Coordinate to{2.0, 0.0};

        const auto start = gd::bezier::atTime(from, s1, s2, to, 0.0);
        expect(start.point == from);
        const auto end = gd::bezier::atTime(from, s1, s2, to, 1.0);
        expect(end.point == to);

        const auto mid = gd::bezier::atTime(from, s1, s2, to, 0.5);
        expect(approx(mid.point.x, 1.0, 1e-12) and approx(mid.point.y, 0.75, 1e-12));
        expect(approx(mid.left.y, mid.right.y, 1e-12)) << "tangent at the apex is horizontal";
        expect(mid.left.x < mid.point.x and mid.point.x < mid.right.x);
    };

    "supports through two points"_test = [] {
        constexpr Coordinate from{0.0, 0.0};
        constexpr Coordinate s1{1.0, 3.0};
        constexpr Coordinate s2{4.0, -2.0};
        constexpr Coordinate to{5.0, 1.0};
        const Coordinate     p1 = gd::bezier::atTime(from, s1, s2, to, 1.0 / 3.0).point;
        const Coordinate     p2 = gd::bezier::atTime(from, s1, s2, to, 2.0 / 3.0).point;

        const auto [r1, r2] = gd::bezier::supportsForPointsAtTime(from, p1, 1.0 / 3.0, p2, 2.0 / 3.0, to);
        expect(approx(r1.x, s1.x, 1e-9) and approx(r1.y, s1.y, 1e-9));
        expect(approx(r2.x, s2.x, 1e-9) and approx(r2.y, s2.y, 1e-9));
    };
};

const boost::ut::suite<"Storage"> storageTests = [] {
    using namespace boost::ut;

    "entries are created on write access"_test = [] {
        gd::Storage<int, double> storage(1.5);
        expect(eq(storage.at(3), 1.5)) << "reads fall back to the default";
        expect(!storage.contains(3));
        expect(storage.find(3) == nullptr);

        storage[3] += 1.0;
        expect(eq(storage.at(3), 2.5));
        expect(eq(storage.size(), 1UZ));
        expect(storage.find(3) != nullptr);

        storage.erase(3);
        expect(eq(storage.size(), 0UZ));
    };

    "default constructed values"_test = [] {
        gd::Storage<std::string, std::vector<int>> storage;
        storage["a"].push_back(1);
        storage["a"].push_back(2);
        expect(eq(storage.at("a").size(), 2UZ));
        expect(storage.at("b").empty());
        storage.clear();
        expect(eq(storage.size(), 0UZ));
    };
};

int main() { /* not needed for UT */ }
