#include "swisspair/core/pairing/Tiebreaks.h"

#include <algorithm>
#include <numeric>

namespace swisspair::core::pairing {

namespace {

double ResultFactor(model::MatchScore score) {
    switch (score) {
        case model::MatchScore::Win:
            return 1.0;
        case model::MatchScore::Draw:
            return 0.5;
        case model::MatchScore::Loss:
            break;
    }
    return 0.0;
}

// Opponent scores per round: the real opponent's adjusted score for played
// games, the virtual opponent otherwise.
std::vector<double> OpponentScores(const model::Tournament& tournament,
                                   const model::Player& player) {
    std::vector<double> scores;
    scores.reserve(player.matches.size());
    for (const auto& match : player.matches) {
        if (!match.game_was_played) {
            scores.push_back(VirtualOpponentScore(tournament, player, match));
            continue;
        }
        if (const model::Player* opponent = tournament.FindPlayer(match.opponent)) {
            scores.push_back(AdjustedScore(tournament, *opponent));
        }
    }
    return scores;
}

}  // namespace

double AdjustedScore(const model::Tournament& tournament, const model::Player& player) {
    double score = player.Acceleration(tournament);
    for (const auto& match : player.matches) {
        score += match.game_was_played ? tournament.GetPoints(player, match)
                                       : tournament.scoring.draw;
    }
    return score;
}

double VirtualOpponentScore(const model::Tournament& tournament,
                            const model::Player& player,
                            const model::Match& match) {
    const auto& scoring = tournament.scoring;
    if (match.score == model::MatchScore::Loss) {
        return scoring.win;
    }
    if (match.score == model::MatchScore::Draw) {
        return scoring.draw;
    }
    if (match.IsBye(player.id) && match.participated_in_pairing) {
        if (scoring.pairing_allocated_bye < scoring.win) {
            return scoring.pairing_allocated_bye < scoring.draw ? scoring.win : scoring.draw;
        }
        return scoring.win;
    }
    return scoring.forfeit_loss;
}

TiebreakScores ComputeTiebreaks(const model::Tournament& tournament, const model::Player& player) {
    TiebreakScores scores;
    scores.adjusted_score = AdjustedScore(tournament, player);

    size_t index = 0;
    const auto opponent_scores = OpponentScores(tournament, player);
    for (const auto& match : player.matches) {
        if (match.game_was_played && !tournament.FindPlayer(match.opponent)) {
            continue;
        }
        scores.sonneborn_berger += opponent_scores[index] * ResultFactor(match.score);
        ++index;
    }
    scores.buchholz = std::accumulate(opponent_scores.begin(), opponent_scores.end(), 0.0);

    if (tournament.played_rounds > 2 && opponent_scores.size() > 2) {
        auto sorted = opponent_scores;
        std::sort(sorted.begin(), sorted.end());
        scores.median = std::accumulate(sorted.begin() + 1, sorted.end() - 1, 0.0);
    }
    return scores;
}

std::vector<TiebreakScores> ComputeAllTiebreaks(const model::Tournament& tournament) {
    std::vector<TiebreakScores> all(tournament.players.size());
    for (const auto& player : tournament.players) {
        if (player.is_valid) {
            all[static_cast<size_t>(player.id)] = ComputeTiebreaks(tournament, player);
        }
    }
    return all;
}

}  // namespace swisspair::core::pairing
