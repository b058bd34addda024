#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/pairing/DutchSystem.h"
#include "swisspair/core/pairing/PairingRules.h"
#include "swisspair/core/pairing/PairingSystem.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <utility>

using namespace swisspair::core;
using model::Color;
using model::Match;
using model::MatchScore;

namespace {

model::Tournament MakeField(const std::vector<int>& ratings) {
    model::Tournament tournament;
    for (size_t i = 0; i < ratings.size(); ++i) {
        tournament.AddPlayer("P" + std::to_string(i + 1), ratings[i]);
    }
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return tournament;
}

void AddGame(model::Tournament& tournament, int white, int black, MatchScore white_score) {
    tournament.players[static_cast<size_t>(white)].matches.push_back(
        Match::Played(black, Color::White, white_score));
    tournament.players[static_cast<size_t>(black)].matches.push_back(
        Match::Played(white, Color::Black, model::InvertMatchScore(white_score)));
}

void FinishRound(model::Tournament& tournament) {
    ++tournament.played_rounds;
    tournament.Validate();
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
}

// Records the pairings as the next round, every game drawn.
void ApplyDraws(model::Tournament& tournament, const std::vector<model::Pairing>& pairings) {
    for (const auto& pairing : pairings) {
        if (pairing.is_bye) {
            auto& player = tournament.players[static_cast<size_t>(pairing.white_id)];
            player.matches.push_back(pairing.bye_type == model::ByeType::HalfPointBye
                                         ? Match::Unpaired(player.id, MatchScore::Draw)
                                         : Match::PairingAllocatedBye(player.id));
            continue;
        }
        AddGame(tournament, pairing.white_id, *pairing.black_id, MatchScore::Draw);
    }
    FinishRound(tournament);
}

std::pair<int, int> Key(const model::Pairing& pairing) {
    return std::minmax(pairing.white_id, *pairing.black_id);
}

}  // namespace

TEST_CASE("Round one with five players gives the lowest rated the bye", "[dutch]") {
    auto tournament = MakeField({2400, 2300, 2200, 2100, 2000});
    pairing::DutchSystem system;

    const auto pairings = system.ComputeMatching(tournament);

    REQUIRE(pairings.size() == 3);
    REQUIRE(std::count_if(pairings.begin(), pairings.end(),
                          [](const model::Pairing& p) { return p.is_bye; }) == 1);
    REQUIRE(pairings[0].white_id == 0);
    REQUIRE(*pairings[0].black_id == 2);
    REQUIRE(pairings[1].white_id == 1);
    REQUIRE(*pairings[1].black_id == 3);
    REQUIRE(pairings[2].is_bye);
    REQUIRE(pairings[2].white_id == 4);
    REQUIRE_FALSE(pairings[2].black_id.has_value());
    REQUIRE(pairings[2].bye_type == model::ByeType::Bye);
}

TEST_CASE("Even field pairs top half against bottom half", "[dutch]") {
    auto tournament = MakeField({2500, 2400, 2300, 2200, 2100, 2000});
    pairing::DutchSystem system;

    const auto pairings = system.ComputeMatching(tournament);

    REQUIRE(pairings.size() == 3);
    std::set<std::pair<int, int>> pairs;
    for (const auto& pairing : pairings) {
        REQUIRE_FALSE(pairing.is_bye);
        pairs.insert(Key(pairing));
    }
    REQUIRE(pairs == std::set<std::pair<int, int>>{{0, 3}, {1, 4}, {2, 5}});
}

TEST_CASE("A player with two whites in a row is due black", "[dutch]") {
    auto tournament = MakeField({2700, 2600, 2500, 2400, 2300, 2200, 2100, 2000});
    tournament.expected_rounds = 7;
    AddGame(tournament, 0, 4, MatchScore::Draw);
    AddGame(tournament, 5, 1, MatchScore::Draw);
    AddGame(tournament, 2, 6, MatchScore::Draw);
    AddGame(tournament, 7, 3, MatchScore::Draw);
    FinishRound(tournament);
    AddGame(tournament, 0, 5, MatchScore::Draw);
    AddGame(tournament, 1, 4, MatchScore::Draw);
    AddGame(tournament, 3, 6, MatchScore::Draw);
    AddGame(tournament, 2, 7, MatchScore::Draw);
    FinishRound(tournament);

    const auto& player = tournament.players[0];
    REQUIRE(player.color_preference == Color::Black);
    REQUIRE(player.AbsoluteColorPreference());

    pairing::DutchSystem system;
    const auto pairings = system.ComputeMatching(tournament);

    REQUIRE(pairings.size() == 4);
    const auto game = std::find_if(pairings.begin(), pairings.end(), [](const model::Pairing& p) {
        return p.white_id == 0 || (p.black_id && *p.black_id == 0);
    });
    REQUIRE(game != pairings.end());
    REQUIRE(*game->black_id == 0);
    REQUIRE(game->white_id == 6);
}

TEST_CASE("Players who already met cannot be paired again", "[dutch]") {
    auto tournament = MakeField({2000, 1900});
    tournament.expected_rounds = 5;
    AddGame(tournament, 0, 1, MatchScore::Win);
    FinishRound(tournament);

    pairing::DutchSystem system;
    try {
        system.ComputeMatching(tournament);
        FAIL("expected an unsatisfiable pairing");
    } catch (const model::PairingError& error) {
        REQUIRE(error.kind() == model::PairingErrorKind::Unsatisfiable);
    }
}

TEST_CASE("Byes are not repeated while others are eligible", "[dutch]") {
    auto tournament = MakeField({2400, 2300, 2200, 2100, 2000});
    tournament.expected_rounds = 5;
    pairing::DutchSystem system;

    std::set<std::pair<int, int>> played;
    std::map<int, int> full_byes;
    for (int round = 1; round <= 3; ++round) {
        const auto pairings = system.ComputeMatching(tournament);
        int byes = 0;
        for (const auto& pairing : pairings) {
            if (pairing.is_bye) {
                ++byes;
                if (pairing.bye_type == model::ByeType::Bye) {
                    ++full_byes[pairing.white_id];
                }
                continue;
            }
            const auto& white = tournament.players[static_cast<size_t>(pairing.white_id)];
            const auto& black = tournament.players[static_cast<size_t>(*pairing.black_id)];
            REQUIRE(played.insert(Key(pairing)).second);
            const bool clash = white.AbsoluteColorPreference() && black.AbsoluteColorPreference() &&
                               white.color_preference == black.color_preference;
            REQUIRE_FALSE(clash);
        }
        REQUIRE(byes == 1);
        ApplyDraws(tournament, pairings);
    }
    for (const auto& entry : full_byes) {
        REQUIRE(entry.second == 1);
    }
    REQUIRE(full_byes.size() == 2);
}

TEST_CASE("The previous full bye recipient is first in line for a half-point bye", "[dutch]") {
    auto tournament = MakeField({2400, 2300, 2200, 2100, 2000});
    AddGame(tournament, 0, 2, MatchScore::Draw);
    AddGame(tournament, 1, 3, MatchScore::Draw);
    tournament.players[4].matches.push_back(Match::PairingAllocatedBye(4));
    FinishRound(tournament);

    REQUIRE(pairing::DutchSystem::SelectByePlayer(tournament, {0, 1, 2, 3, 4}) == 4);
    REQUIRE(pairing::DutchSystem::SelectByePlayer(tournament, {0, 1, 2, 3}) == 3);

    pairing::DutchSystem system;
    const auto pairings = system.ComputeMatching(tournament);
    REQUIRE(pairings.back().is_bye);
    REQUIRE(pairings.back().white_id == 4);
    REQUIRE(pairings.back().bye_type == model::ByeType::HalfPointBye);
}

TEST_CASE("Absent players and forbidden pairs are respected", "[dutch]") {
    auto tournament = MakeField({2500, 2400, 2300, 2200, 2100});
    tournament.absent_players.insert(4);
    tournament.forbidden_pairs.emplace_back(0, 2);
    tournament.UpdatePlayerData();

    REQUIRE(pairing::ActivePlayerIds(tournament) == std::vector<int>{0, 1, 2, 3});

    pairing::DutchSystem system;
    const auto pairings = system.ComputeMatching(tournament);
    REQUIRE(pairings.size() == 2);
    for (const auto& pairing : pairings) {
        REQUIRE_FALSE(pairing.is_bye);
        REQUIRE(Key(pairing) != std::make_pair(0, 2));
        REQUIRE(pairing.white_id != 4);
        REQUIRE(*pairing.black_id != 4);
    }
}

TEST_CASE("Color assignment rules", "[dutch]") {
    auto tournament = MakeField({2400, 2300, 2200, 2100});

    SECTION("initial color decides the first round") {
        auto colors = pairing::AssignColors(tournament, tournament.players[2], tournament.players[0]);
        REQUIRE(colors == std::make_pair(0, 2));
        tournament.initial_color = Color::Black;
        colors = pairing::AssignColors(tournament, tournament.players[2], tournament.players[0]);
        REQUIRE(colors == std::make_pair(2, 0));
    }

    SECTION("lower id gets white when nothing else decides") {
        tournament.initial_color = Color::Black;
        tournament.players[3].rank_index = tournament.players[1].rank_index;
        const auto colors =
            pairing::AssignColors(tournament, tournament.players[3], tournament.players[1]);
        REQUIRE(colors == std::make_pair(1, 3));
    }

    SECTION("fewer whites gets white") {
        AddGame(tournament, 0, 1, MatchScore::Draw);
        AddGame(tournament, 2, 3, MatchScore::Draw);
        FinishRound(tournament);
        const auto colors =
            pairing::AssignColors(tournament, tournament.players[0], tournament.players[3]);
        REQUIRE(colors == std::make_pair(3, 0));
    }
}

TEST_CASE("Pairing systems are created by name", "[dutch]") {
    REQUIRE(pairing::CreatePairingSystem("dutch")->Name() == "dutch");
    REQUIRE(pairing::CreatePairingSystem("Burstein")->Name() == "burstein");
    REQUIRE_THROWS_AS(pairing::CreatePairingSystem("monrad"), model::PairingError);
    REQUIRE(pairing::AvailablePairingSystems() == std::vector<std::string>{"dutch", "burstein"});
}
