#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/model/Tournament.h"

#include <catch2/catch.hpp>

using namespace swisspair::core::model;

namespace {

// Player 0 has White against players 1 and 2 in rounds 1 and 2.
Tournament TwoWhitesInARow() {
    Tournament tournament;
    tournament.played_rounds = 2;
    tournament.AddPlayer("Alpha", 2200);
    tournament.AddPlayer("Bravo", 2100);
    tournament.AddPlayer("Charlie", 2000);
    tournament.players[0].matches = {Match::Played(1, Color::White, MatchScore::Win),
                                     Match::Played(2, Color::White, MatchScore::Draw)};
    tournament.players[1].matches = {Match::Played(0, Color::Black, MatchScore::Loss),
                                     Match::Unpaired(1)};
    tournament.players[2].matches = {Match::Unpaired(2),
                                     Match::Played(0, Color::Black, MatchScore::Draw)};
    tournament.Validate();
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return tournament;
}

}  // namespace

TEST_CASE("Players are indexed by id", "[model]") {
    Tournament tournament;
    tournament.AddPlayer("Alpha", 2000);
    tournament.AddPlayer("Bravo", 1900);

    REQUIRE(tournament.players.size() == 2);
    REQUIRE(tournament.FindPlayer(1)->name == "Bravo");
    REQUIRE(tournament.FindPlayer(1)->id == 1);
    REQUIRE(tournament.FindPlayer(2) == nullptr);
    REQUIRE(tournament.FindPlayer(-1) == nullptr);
}

TEST_CASE("Color history drives the color preference", "[model]") {
    const auto tournament = TwoWhitesInARow();
    const auto& player = tournament.players[0];

    REQUIRE(player.color_imbalance == 2);
    REQUIRE(player.color_preference == Color::Black);
    REQUIRE(player.repeated_color == Color::White);
    REQUIRE(player.color_streak == 2);
    REQUIRE(player.AbsoluteColorPreference());
    REQUIRE_FALSE(player.strong_color_preference);
    REQUIRE(player.ColorBalance() == 2);
    REQUIRE(player.LastTwoColors() == Color::White);

    const auto& bravo = tournament.players[1];
    REQUIRE(bravo.color_preference == Color::White);
    REQUIRE(bravo.color_imbalance == 1);
    REQUIRE_FALSE(bravo.AbsoluteColorPreference());
    REQUIRE(bravo.strong_color_preference);
    REQUIRE(bravo.LastTwoColors() == Color::None);
}

TEST_CASE("Scores and forbidden opponents come from the history", "[model]") {
    const auto tournament = TwoWhitesInARow();

    REQUIRE(tournament.players[0].score_without_acceleration == 15);
    REQUIRE(tournament.players[1].score_without_acceleration == 0);
    REQUIRE(tournament.players[2].score_without_acceleration == 5);
    REQUIRE(tournament.players[0].forbidden_opponents == std::set<int>{1, 2});
    REQUIRE(tournament.players[1].forbidden_opponents == std::set<int>{0});
    REQUIRE(tournament.players[0].HasPlayed(2));
    REQUIRE_FALSE(tournament.players[1].HasPlayed(2));
}

TEST_CASE("Ranks order by score then rating", "[model]") {
    Tournament tournament;
    tournament.AddPlayer("Low", 1500).score_without_acceleration = 10;
    tournament.AddPlayer("High", 2500).score_without_acceleration = 5;
    tournament.AddPlayer("Mid", 2000).score_without_acceleration = 10;

    REQUIRE(tournament.ComputeRanks() == std::vector<int>{1, 2, 0});
    tournament.AssignRanks();
    REQUIRE(tournament.players[2].rank_index == 0);
}

TEST_CASE("Points follow the scoring table", "[model]") {
    Tournament tournament;
    tournament.scoring.win = 30;
    tournament.scoring.draw = 10;
    tournament.scoring.loss = 1;
    tournament.scoring.zero_point_bye = 2;
    tournament.scoring.forfeit_loss = 3;
    tournament.scoring.pairing_allocated_bye = 25;
    const auto& player = tournament.AddPlayer("Alpha", 2000);

    REQUIRE(tournament.GetPoints(player, Match::Played(1, Color::White, MatchScore::Win)) == 30);
    REQUIRE(tournament.GetPoints(player, Match::Played(1, Color::White, MatchScore::Draw)) == 10);
    REQUIRE(tournament.GetPoints(player, Match::Played(1, Color::White, MatchScore::Loss)) == 1);
    REQUIRE(tournament.GetPoints(player, Match::Forfeit(1, Color::White, MatchScore::Loss)) == 3);
    REQUIRE(tournament.GetPoints(player, Match::Forfeit(1, Color::White, MatchScore::Win)) == 30);
    REQUIRE(tournament.GetPoints(player, Match::PairingAllocatedBye(0)) == 25);
    REQUIRE(tournament.GetPoints(player, Match::Unpaired(0)) == 2);
    REQUIRE(tournament.GetPoints(player, Match::Unpaired(0, MatchScore::Draw)) == 10);
    REQUIRE(tournament.GetPoints(player, Match::Unpaired(0, MatchScore::Win)) == 30);
    REQUIRE_FALSE(tournament.scoring.IsDefault());
    REQUIRE(ScoringTable{}.IsDefault());
}

TEST_CASE("Changing the win value shifts scores by the expected delta", "[model]") {
    auto tournament = TwoWhitesInARow();
    const int before = tournament.players[0].score_without_acceleration;

    tournament.scoring.win = 12;
    tournament.UpdatePlayerData();

    REQUIRE(tournament.players[0].score_without_acceleration == before + 2);
    REQUIRE(tournament.players[2].score_without_acceleration == 5);
    REQUIRE(tournament.players[0].forbidden_opponents == std::set<int>{1, 2});
}

TEST_CASE("Accelerated scores", "[model]") {
    Tournament tournament;
    tournament.played_rounds = 1;
    auto& player = tournament.AddPlayer("Alpha", 2000);
    player.matches = {Match::PairingAllocatedBye(0)};
    player.accelerations = {10, 5};
    tournament.UpdatePlayerData();

    SECTION("current round") {
        REQUIRE(player.Acceleration(tournament) == 5);
        REQUIRE(player.ScoreWithAcceleration(tournament) == 15);
    }

    SECTION("rounds back") {
        REQUIRE(player.ScoreWithAcceleration(tournament, 1) == 10);
        REQUIRE(player.Acceleration(tournament, 5) == 0);
    }

    SECTION("corrupt score is rejected") {
        player.score_without_acceleration = 0;
        REQUIRE_THROWS_AS(player.ScoreWithAcceleration(tournament, 1), PairingError);
    }

    SECTION("negative acceleration is rejected") {
        player.accelerations = {0, -5};
        try {
            player.ScoreWithAcceleration(tournament);
            FAIL("expected a PairingError");
        } catch (const PairingError& error) {
            REQUIRE(error.kind() == PairingErrorKind::MalformedHistory);
        }
    }
}

TEST_CASE("Bye tracking and eligibility", "[model]") {
    Tournament tournament;
    tournament.played_rounds = 2;
    auto& player = tournament.AddPlayer("Alpha", 1800);
    player.matches = {Match::PairingAllocatedBye(0), Match::Unpaired(0)};

    tournament.UpdatePlayerData();
    REQUIRE(player.bye_count == 1);
    REQUIRE(player.full_bye_count == 1);
    REQUIRE(player.half_point_bye_count == 0);
    REQUIRE(player.bye_rounds == std::vector<int>{1});
    REQUIRE_FALSE(player.IsEligibleForBye(3));
    REQUIRE(player.IsEligibleForHalfPointBye());
    REQUIRE(player.ByePriority() == 1000 + 1800);

    player.matches[1] = Match::Unpaired(0, MatchScore::Draw);
    tournament.UpdatePlayerData();
    REQUIRE(player.bye_count == 2);
    REQUIRE(player.half_point_bye_count == 1);
    REQUIRE_FALSE(player.IsEligibleForHalfPointBye());

    auto& fresh = tournament.AddPlayer("Bravo", 1700);
    fresh.matches = {Match::Unpaired(1), Match::Unpaired(1)};
    fresh.intentional_bye_rounds = {3};
    tournament.UpdatePlayerData();
    REQUIRE(fresh.bye_count == 0);
    REQUIRE(fresh.IsEligibleForBye(4));
    REQUIRE_FALSE(fresh.IsEligibleForBye(3));
}

TEST_CASE("Inconsistent histories are malformed", "[model]") {
    auto tournament = TwoWhitesInARow();

    SECTION("one-sided result") {
        tournament.players[1].matches[0] = Match::Played(0, Color::Black, MatchScore::Draw);
        REQUIRE_THROWS_AS(tournament.Validate(), PairingError);
    }

    SECTION("unknown opponent") {
        tournament.players[1].matches[1] = Match::Played(7, Color::White, MatchScore::Win);
        try {
            tournament.Validate();
            FAIL("expected a PairingError");
        } catch (const PairingError& error) {
            REQUIRE(error.kind() == PairingErrorKind::MalformedHistory);
        }
    }

    SECTION("history longer than the played rounds") {
        tournament.players[1].matches.push_back(Match::Unpaired(1));
        REQUIRE_THROWS_AS(tournament.Validate(), PairingError);
    }

    SECTION("double forfeit is accepted") {
        tournament.players[0].matches[0] = Match::Forfeit(1, Color::White, MatchScore::Loss);
        tournament.players[1].matches[0] = Match::Forfeit(0, Color::Black, MatchScore::Loss);
        REQUIRE_NOTHROW(tournament.Validate());
    }
}

TEST_CASE("Last round and activity", "[model]") {
    Tournament tournament;
    tournament.expected_rounds = 5;
    tournament.played_rounds = 4;
    REQUIRE(tournament.IsLastRound());
    tournament.played_rounds = 3;
    REQUIRE_FALSE(tournament.IsLastRound());
    tournament.expected_rounds = 0;
    REQUIRE_FALSE(tournament.IsLastRound());
    REQUIRE(tournament.TopScoreThreshold() == 15);

    auto& player = tournament.AddPlayer("Alpha", 2000);
    REQUIRE(tournament.IsActive(player));
    tournament.absent_players.insert(player.id);
    REQUIRE_FALSE(tournament.IsActive(player));
}

TEST_CASE("Enumerations convert to and from text", "[model]") {
    Color color = Color::None;
    REQUIRE(ParseColor("White", color));
    REQUIRE(color == Color::White);
    REQUIRE(ParseColor("b", color));
    REQUIRE(color == Color::Black);
    REQUIRE_FALSE(ParseColor("green", color));
    REQUIRE(ColorToString(Color::Black) == "black");

    ByeType type = ByeType::Bye;
    REQUIRE(ParseByeType("half_point_bye", type));
    REQUIRE(type == ByeType::HalfPointBye);
    REQUIRE_FALSE(ParseByeType("inactive", type));
    REQUIRE(ByeTypeToString(ByeType::Unpaired) == "unpaired");

    REQUIRE(InvertColor(Color::White) == Color::Black);
    REQUIRE(InvertMatchScore(MatchScore::Draw) == MatchScore::Draw);
    REQUIRE(PairingErrorKindToString(PairingErrorKind::FormatLimit) == "format_limit");
}
