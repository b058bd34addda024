#pragma once

#include "swisspair/core/model/Player.h"

#include <set>
#include <utility>
#include <vector>

namespace swisspair::core::model {

// Points are stored in tenths: a win worth 1.0 is 10.
struct ScoringTable {
    int win = 10;
    int draw = 5;
    int loss = 0;
    int zero_point_bye = 0;
    int forfeit_loss = 0;
    int pairing_allocated_bye = 10;

    bool IsDefault() const;
    bool operator==(const ScoringTable& other) const;
};

struct Tournament {
    int played_rounds = 0;
    int expected_rounds = 0;
    ScoringTable scoring;
    Color initial_color = Color::White;
    // Players are indexed by id: players[i].id == i.
    std::vector<Player> players;
    std::set<int> absent_players;
    std::vector<std::pair<int, int>> forbidden_pairs;

    Player& AddPlayer(const std::string& name, int rating);
    const Player* FindPlayer(int id) const;
    Player* FindPlayer(int id);

    int GetPoints(const Player& player, const Match& match) const;

    // Recomputes scores, color preferences, bye counters and forbidden
    // opponents from the match histories.
    void UpdatePlayerData();

    // Ranks by unaccelerated score then rating, both descending.
    std::vector<int> ComputeRanks() const;
    void AssignRanks();

    // Throws PairingError(MalformedHistory) on histories that do not agree.
    void Validate() const;

    bool IsLastRound() const;
    int TopScoreThreshold() const;
    bool IsActive(const Player& player) const;
};

}  // namespace swisspair::core::model
