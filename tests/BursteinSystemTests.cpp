#include "swisspair/core/pairing/BursteinSystem.h"
#include "swisspair/core/pairing/Tiebreaks.h"

#include <catch2/catch.hpp>

using namespace swisspair::core;
using model::Color;
using model::Match;
using model::MatchScore;

namespace {

// Round 1: 1-0 for player 0 against 2, 1-0 for player 1 against 3, bye for 4.
model::Tournament AfterFirstRound() {
    model::Tournament tournament;
    const int ratings[] = {2400, 2300, 2200, 2100, 2000};
    for (int rating : ratings) {
        tournament.AddPlayer("P" + std::to_string(tournament.players.size() + 1), rating);
    }
    tournament.played_rounds = 1;
    tournament.players[0].matches = {Match::Played(2, Color::White, MatchScore::Win)};
    tournament.players[2].matches = {Match::Played(0, Color::Black, MatchScore::Loss)};
    tournament.players[1].matches = {Match::Played(3, Color::White, MatchScore::Win)};
    tournament.players[3].matches = {Match::Played(1, Color::Black, MatchScore::Loss)};
    tournament.players[4].matches = {Match::PairingAllocatedBye(4)};
    tournament.Validate();
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return tournament;
}

}  // namespace

TEST_CASE("Tiebreaks count unplayed games as draws", "[burstein]") {
    const auto tournament = AfterFirstRound();
    const auto all = pairing::ComputeAllTiebreaks(tournament);

    REQUIRE(all.size() == 5);
    REQUIRE(all[0].adjusted_score == Approx(10.0));
    REQUIRE(all[0].sonneborn_berger == Approx(0.0));
    REQUIRE(all[0].buchholz == Approx(0.0));

    REQUIRE(all[2].sonneborn_berger == Approx(0.0));
    REQUIRE(all[2].buchholz == Approx(10.0));

    // The bye counts as a draw for the adjusted score and meets a virtual
    // opponent worth a win.
    REQUIRE(all[4].adjusted_score == Approx(5.0));
    REQUIRE(all[4].sonneborn_berger == Approx(10.0));
    REQUIRE(all[4].buchholz == Approx(10.0));
    REQUIRE(all[4].median == Approx(0.0));
}

TEST_CASE("Virtual opponents", "[burstein]") {
    const auto tournament = AfterFirstRound();
    const auto& player = tournament.players[4];

    REQUIRE(pairing::VirtualOpponentScore(tournament, player, Match::Unpaired(4)) == Approx(10.0));
    REQUIRE(pairing::VirtualOpponentScore(tournament, player,
                                          Match::Unpaired(4, MatchScore::Draw)) == Approx(5.0));
    REQUIRE(pairing::VirtualOpponentScore(tournament, player, Match::PairingAllocatedBye(4)) ==
            Approx(10.0));
    REQUIRE(pairing::VirtualOpponentScore(tournament, player,
                                          Match::Forfeit(0, Color::White, MatchScore::Win)) ==
            Approx(0.0));
}

TEST_CASE("Median trims the best and worst opponent after two rounds", "[burstein]") {
    model::Tournament tournament;
    for (int i = 0; i < 4; ++i) {
        tournament.AddPlayer("P" + std::to_string(i + 1), 2000 - i * 100);
    }
    tournament.played_rounds = 3;
    auto play = [&tournament](int white, int black, MatchScore score) {
        tournament.players[static_cast<size_t>(white)].matches.push_back(
            Match::Played(black, Color::White, score));
        tournament.players[static_cast<size_t>(black)].matches.push_back(
            Match::Played(white, Color::Black, model::InvertMatchScore(score)));
    };
    play(0, 1, MatchScore::Win);
    play(2, 3, MatchScore::Draw);
    play(2, 0, MatchScore::Loss);
    play(3, 1, MatchScore::Win);
    play(0, 3, MatchScore::Win);
    play(1, 2, MatchScore::Loss);
    tournament.Validate();
    tournament.UpdatePlayerData();

    // Player 0 met 1 (0 points), 2 (15) and 3 (15).
    const auto scores = pairing::ComputeTiebreaks(tournament, tournament.players[0]);
    REQUIRE(scores.adjusted_score == Approx(30.0));
    REQUIRE(scores.buchholz == Approx(30.0));
    REQUIRE(scores.sonneborn_berger == Approx(30.0));
    REQUIRE(scores.median == Approx(15.0));
}

TEST_CASE("Round one follows the ranking", "[burstein]") {
    model::Tournament tournament;
    const int ratings[] = {2400, 2300, 2200, 2100, 2000};
    for (int rating : ratings) {
        tournament.AddPlayer("P" + std::to_string(tournament.players.size() + 1), rating);
    }
    tournament.UpdatePlayerData();
    tournament.AssignRanks();

    pairing::BursteinSystem system;
    const auto pairings = system.ComputeMatching(tournament);

    REQUIRE(pairings.size() == 3);
    REQUIRE(pairings[0].white_id == 0);
    REQUIRE(*pairings[0].black_id == 2);
    REQUIRE(pairings[1].white_id == 1);
    REQUIRE(*pairings[1].black_id == 3);
    REQUIRE(pairings[2].is_bye);
    REQUIRE(pairings[2].white_id == 4);
}

TEST_CASE("Tiebreak order decides groups and the bye", "[burstein]") {
    auto tournament = AfterFirstRound();
    pairing::BursteinSystem system;

    const auto pairings = system.ComputeMatching(tournament);

    REQUIRE(system.tiebreaks().size() == 5);
    REQUIRE(pairings.size() == 3);
    REQUIRE(pairings[0].white_id == 4);
    REQUIRE(*pairings[0].black_id == 0);
    REQUIRE(pairings[1].white_id == 2);
    REQUIRE(*pairings[1].black_id == 1);
    REQUIRE(pairings[2].is_bye);
    REQUIRE(pairings[2].white_id == 3);
    REQUIRE(pairings[2].bye_type == model::ByeType::Bye);
}
