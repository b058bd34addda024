#include "swisspair/core/matching/MatchingComputer.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <tuple>
#include <vector>

using swisspair::core::matching::MatchingComputer;

namespace {

using WeightedEdge = std::tuple<int, int, MatchingComputer::Weight>;

MatchingComputer Solve(int vertices,
                       MatchingComputer::Weight max_weight,
                       const std::vector<WeightedEdge>& edges) {
    MatchingComputer computer(vertices, max_weight);
    for (const auto& edge : edges) {
        computer.SetEdgeWeight(std::get<0>(edge), std::get<1>(edge), std::get<2>(edge));
    }
    computer.ComputeMatching();
    return computer;
}

}  // namespace

TEST_CASE("Perfect matching is found on a small graph", "[matching]") {
    const auto computer = Solve(4, 1, {{0, 1, 1}, {2, 3, 1}, {0, 2, 1}});

    REQUIRE(computer.IsComplete());
    REQUIRE(computer.MatchingSize() == 2);
    const auto& mates = computer.GetMatching();
    REQUIRE(mates == std::vector<int>{1, 0, 3, 2});
}

TEST_CASE("Heavier perfect matching wins", "[matching]") {
    const auto computer = Solve(4, 10, {{0, 1, 5}, {2, 3, 5}, {0, 2, 8}, {1, 3, 4}});

    REQUIRE(computer.IsComplete());
    REQUIRE(computer.GetMatching() == std::vector<int>{2, 3, 0, 1});
    REQUIRE(computer.MatchingWeight() == 12);
}

TEST_CASE("Cardinality takes precedence over weight", "[matching]") {
    const auto computer = Solve(4, 10, {{0, 1, 1}, {1, 2, 10}, {2, 3, 1}});

    REQUIRE(computer.IsComplete());
    REQUIRE(computer.GetMatching() == std::vector<int>{1, 0, 3, 2});
    REQUIRE(computer.MatchingWeight() == 2);
}

TEST_CASE("Odd cycles are contracted into blossoms", "[matching]") {
    SECTION("triangle with pendant vertices") {
        const auto computer = Solve(6, 1, {{0, 1, 1}, {1, 2, 1}, {2, 0, 1}, {0, 3, 1}, {1, 4, 1}, {2, 5, 1}});
        REQUIRE(computer.IsComplete());
        REQUIRE(computer.GetMatching() == std::vector<int>{3, 4, 5, 0, 1, 2});
    }

    SECTION("weighted blossom") {
        const auto computer =
            Solve(6, 10, {{0, 1, 8}, {0, 2, 9}, {1, 2, 10}, {2, 3, 7}, {0, 5, 5}, {3, 4, 6}});
        REQUIRE(computer.IsComplete());
        REQUIRE(computer.GetMatching() == std::vector<int>{5, 2, 1, 4, 3, 0});
        REQUIRE(computer.MatchingWeight() == 21);
    }

    SECTION("nested blossoms") {
        const auto computer = Solve(
            6, 10, {{0, 1, 9}, {0, 2, 9}, {1, 2, 10}, {1, 3, 8}, {2, 4, 8}, {3, 4, 10}, {4, 5, 6}});
        REQUIRE(computer.IsComplete());
        REQUIRE(computer.GetMatching() == std::vector<int>{2, 3, 0, 1, 5, 4});
    }

    SECTION("relabelled nested blossoms") {
        const auto computer = Solve(8,
                                    25,
                                    {{0, 1, 10},
                                     {0, 6, 10},
                                     {1, 2, 12},
                                     {2, 3, 20},
                                     {2, 4, 20},
                                     {3, 4, 25},
                                     {4, 5, 10},
                                     {5, 6, 10},
                                     {6, 7, 8}});
        REQUIRE(computer.IsComplete());
        REQUIRE(computer.GetMatching() == std::vector<int>{1, 0, 3, 2, 5, 4, 7, 6});
    }
}

TEST_CASE("Graphs without a perfect matching are reported incomplete", "[matching]") {
    SECTION("odd vertex count") {
        const auto computer = Solve(3, 1, {{0, 1, 1}, {1, 2, 1}});
        REQUIRE_FALSE(computer.IsComplete());
        REQUIRE(computer.MatchingSize() == 1);
    }

    SECTION("star") {
        const auto computer = Solve(4, 1, {{0, 1, 1}, {0, 2, 1}, {0, 3, 1}});
        REQUIRE_FALSE(computer.IsComplete());
        REQUIRE(computer.MatchingSize() == 1);
    }

    SECTION("no edges") {
        const auto computer = Solve(2, 1, {});
        REQUIRE_FALSE(computer.IsComplete());
        REQUIRE(computer.GetMatching() == std::vector<int>{-1, -1});
    }
}

TEST_CASE("Zero weight removes an edge", "[matching]") {
    MatchingComputer computer(2, 5);
    computer.SetEdgeWeight(0, 1, 3);
    computer.SetEdgeWeight(1, 0, 0);
    computer.ComputeMatching();

    REQUIRE(computer.EdgeWeight(0, 1) == 0);
    REQUIRE_FALSE(computer.IsComplete());
}

TEST_CASE("Misuse of the solver is rejected", "[matching]") {
    MatchingComputer computer(4, 5);

    REQUIRE_THROWS_AS(computer.SetEdgeWeight(0, 4, 1), std::out_of_range);
    REQUIRE_THROWS_AS(computer.SetEdgeWeight(-1, 2, 1), std::out_of_range);
    REQUIRE_THROWS_AS(computer.SetEdgeWeight(2, 2, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(computer.SetEdgeWeight(0, 1, 6), std::invalid_argument);
    REQUIRE_THROWS_AS(computer.SetEdgeWeight(0, 1, -1), std::invalid_argument);
    REQUIRE_THROWS_AS(MatchingComputer(-1, 1), std::invalid_argument);
}
