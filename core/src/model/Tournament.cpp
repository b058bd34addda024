#include "swisspair/core/model/Tournament.h"

#include "swisspair/core/model/PairingError.h"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace swisspair::core::model {

namespace {

[[noreturn]] void ThrowMalformed(const std::string& text) {
    throw PairingError(PairingErrorKind::MalformedHistory, text);
}

}  // namespace

bool ScoringTable::IsDefault() const {
    return *this == ScoringTable{};
}

bool ScoringTable::operator==(const ScoringTable& other) const {
    return win == other.win && draw == other.draw && loss == other.loss &&
           zero_point_bye == other.zero_point_bye && forfeit_loss == other.forfeit_loss &&
           pairing_allocated_bye == other.pairing_allocated_bye;
}

Player& Tournament::AddPlayer(const std::string& name, int rating) {
    Player player;
    player.id = static_cast<int>(players.size());
    player.name = name;
    player.rating = rating;
    players.push_back(std::move(player));
    return players.back();
}

const Player* Tournament::FindPlayer(int id) const {
    if (id < 0 || id >= static_cast<int>(players.size())) {
        return nullptr;
    }
    return &players[static_cast<size_t>(id)];
}

Player* Tournament::FindPlayer(int id) {
    if (id < 0 || id >= static_cast<int>(players.size())) {
        return nullptr;
    }
    return &players[static_cast<size_t>(id)];
}

int Tournament::GetPoints(const Player& player, const Match& match) const {
    switch (match.score) {
        case MatchScore::Loss:
            if (!match.participated_in_pairing) {
                return scoring.zero_point_bye;
            }
            return match.game_was_played ? scoring.loss : scoring.forfeit_loss;
        case MatchScore::Win:
            if (match.IsBye(player.id) && match.participated_in_pairing) {
                return scoring.pairing_allocated_bye;
            }
            return scoring.win;
        case MatchScore::Draw:
            break;
    }
    return scoring.draw;
}

void Tournament::UpdatePlayerData() {
    for (auto& player : players) {
        player.forbidden_opponents.clear();
        if (!player.is_valid) {
            continue;
        }
        int score = 0;
        for (const auto& match : player.matches) {
            score += GetPoints(player, match);
            if (!match.IsBye(player.id)) {
                player.forbidden_opponents.insert(match.opponent);
            }
        }
        player.score_without_acceleration = score;
        player.UpdateColorPreferences();
        player.UpdateByeTracking();
    }

    for (const auto& pair : forbidden_pairs) {
        Player* first = FindPlayer(pair.first);
        Player* second = FindPlayer(pair.second);
        if (first && second && first != second) {
            first->forbidden_opponents.insert(second->id);
            second->forbidden_opponents.insert(first->id);
        }
    }
}

std::vector<int> Tournament::ComputeRanks() const {
    std::vector<int> order(players.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](int a, int b) {
        const auto& left = players[static_cast<size_t>(a)];
        const auto& right = players[static_cast<size_t>(b)];
        if (left.score_without_acceleration != right.score_without_acceleration) {
            return left.score_without_acceleration > right.score_without_acceleration;
        }
        return left.rating > right.rating;
    });

    std::vector<int> ranks(players.size(), 0);
    for (size_t position = 0; position < order.size(); ++position) {
        ranks[static_cast<size_t>(order[position])] = static_cast<int>(position);
    }
    return ranks;
}

void Tournament::AssignRanks() {
    const auto ranks = ComputeRanks();
    for (size_t i = 0; i < players.size(); ++i) {
        players[i].rank_index = ranks[i];
    }
}

void Tournament::Validate() const {
    for (size_t index = 0; index < players.size(); ++index) {
        const auto& player = players[index];
        if (player.id != static_cast<int>(index)) {
            std::ostringstream message;
            message << "Player at position " << index << " carries id " << player.id;
            ThrowMalformed(message.str());
        }
        if (!player.is_valid) {
            continue;
        }
        if (static_cast<int>(player.matches.size()) > played_rounds) {
            std::ostringstream message;
            message << "Player " << player.id + 1 << " has " << player.matches.size()
                    << " rounds of history but only " << played_rounds << " were played";
            ThrowMalformed(message.str());
        }
        for (size_t round = 0; round < player.matches.size(); ++round) {
            const auto& match = player.matches[round];
            if (match.IsBye(player.id)) {
                continue;
            }
            const Player* opponent = FindPlayer(match.opponent);
            if (!opponent || !opponent->is_valid) {
                std::ostringstream message;
                message << "Player " << player.id + 1 << " meets unknown opponent "
                        << match.opponent + 1 << " in round " << round + 1;
                ThrowMalformed(message.str());
            }
            const Match* other =
                round < opponent->matches.size() ? &opponent->matches[round] : nullptr;
            // An unplayed game may be lost by both sides.
            const bool double_forfeit = other && !match.game_was_played &&
                                        match.score == MatchScore::Loss &&
                                        other->score == MatchScore::Loss;
            const bool mirrored =
                other && other->opponent == player.id &&
                (other->score == InvertMatchScore(match.score) || double_forfeit) &&
                other->color == InvertColor(match.color) &&
                other->game_was_played == match.game_was_played;
            if (!mirrored) {
                std::ostringstream message;
                message << "Round " << round + 1 << " history of players " << player.id + 1
                        << " and " << opponent->id + 1 << " does not agree";
                ThrowMalformed(message.str());
            }
        }
    }
}

bool Tournament::IsLastRound() const {
    return expected_rounds > 0 && played_rounds >= expected_rounds - 1;
}

int Tournament::TopScoreThreshold() const {
    return played_rounds * std::max(scoring.win, scoring.draw) / 2;
}

bool Tournament::IsActive(const Player& player) const {
    return player.is_valid && static_cast<int>(player.matches.size()) <= played_rounds &&
           absent_players.count(player.id) == 0;
}

}  // namespace swisspair::core::model
