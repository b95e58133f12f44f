#include <boost/ut.hpp>

#include <vector>

#include <gd/Error.hpp>
#include <gd/algorithm/layered/Ranking.hpp>

namespace {
std::vector<gd::VertexId> members(const gd::layered::Ranking& ranking, int rank) {
    const auto vertices = ranking.vertices(rank);
    return {vertices.begin(), vertices.end()};
}
} // namespace

const boost::ut::suite<"Ranking"> rankingTests = [] {
    using namespace boost::ut;
    using namespace gd;
    using namespace gd::layered;

    const VertexId a{0};
    const VertexId b{1};
    const VertexId c{2};
    const VertexId d{3};

    "vertices are appended to their rank"_test = [&] {
        Ranking ranking;
        ranking.setRank(a, 1);
        ranking.setRank(b, 1);
        ranking.setRank(c, 3);
        expect(ranking.ranks() == std::vector<int>{1, 3});
        expect(members(ranking, 1) == std::vector<VertexId>{a, b});
        expect(eq(ranking.position(b), 1UZ));
        expect(eq(ranking.rankSize(2), 0UZ));
        expect(!ranking.rank(d).has_value());
        expect(throws<gd::exception>([&] { std::ignore = ranking.requireRank(d); }));
        expect(throws<gd::exception>([&] { std::ignore = ranking.position(d); }));
    };

    "changing the rank closes the gap"_test = [&] {
        Ranking ranking;
        ranking.setRank(a, 1);
        ranking.setRank(b, 1);
        ranking.setRank(c, 1);
        ranking.setRank(a, 2);
        expect(members(ranking, 1) == std::vector<VertexId>{b, c});
        expect(eq(ranking.position(b), 0UZ));
        expect(eq(ranking.position(c), 1UZ));
        expect(eq(ranking.position(a), 0UZ));

        ranking.setRank(a, 3);
        expect(ranking.ranks() == std::vector<int>{1, 3}) << "empty ranks disappear";
    };

    "positions can be set and switched"_test = [&] {
        Ranking ranking;
        for (VertexId v : {a, b, c}) {
            ranking.setRank(v, 1);
        }
        ranking.setPosition(c, 0UZ);
        expect(members(ranking, 1) == std::vector<VertexId>{c, a, b});
        ranking.setPosition(c, 99UZ);
        expect(members(ranking, 1) == std::vector<VertexId>{a, b, c});
        ranking.switchPositions(a, c);
        expect(members(ranking, 1) == std::vector<VertexId>{c, b, a});
        expect(eq(ranking.position(a), 2UZ));

        ranking.setRank(d, 2);
        expect(throws<gd::exception>([&] { ranking.switchPositions(a, d); }));
    };

    "reordering keeps fixed vertices in place"_test = [&] {
        Ranking ranking;
        for (VertexId v : {a, b, c, d}) {
            ranking.setRank(v, 1);
        }
        // b is fixed, the others are sorted by descending id
        ranking.reorderRank(1, [](std::size_t, VertexId v) { return -static_cast<double>(meta::index(v)); }, [&](std::size_t, VertexId v) { return v == b; });
        expect(members(ranking, 1) == std::vector<VertexId>{d, b, c, a});
        expect(eq(ranking.position(a), 3UZ));
    };

    "reordering is stable"_test = [&] {
        Ranking ranking;
        for (VertexId v : {a, b, c}) {
            ranking.setRank(v, 1);
        }
        ranking.reorderRank(1, [](std::size_t, VertexId) { return 0.0; }, [](std::size_t, VertexId) { return false; });
        expect(members(ranking, 1) == std::vector<VertexId>{a, b, c});
    };

    "normalize renumbers the ranks"_test = [&] {
        Ranking ranking;
        ranking.setRank(a, -4);
        ranking.setRank(b, 7);
        ranking.setRank(c, 7);
        ranking.normalize();
        expect(ranking.ranks() == std::vector<int>{1, 2});
        expect(eq(ranking.requireRank(a), 1));
        expect(eq(ranking.requireRank(c), 2));
        expect(eq(ranking.position(c), 1UZ));
    };

    "copies are independent"_test = [&] {
        Ranking ranking;
        ranking.setRank(a, 1);
        ranking.setRank(b, 1);
        Ranking snapshot = ranking.copy();
        ranking.switchPositions(a, b);
        expect(members(snapshot, 1) == std::vector<VertexId>{a, b});
        expect(members(ranking, 1) == std::vector<VertexId>{b, a});
    };
};

int main() { /* not needed for UT */ }
