#pragma once

#include "swisspair/core/model/Match.h"
#include "swisspair/core/model/Types.h"

#include <set>
#include <string>
#include <vector>

namespace swisspair::core::model {

struct Tournament;

struct Player {
    int id = -1;
    std::string name;
    int rating = 0;
    bool is_valid = true;

    // Index-aligned to round number: matches[0] is round 1.
    std::vector<Match> matches;
    // Acceleration bonus per round index, in tenths of a point.
    std::vector<int> accelerations;
    std::set<int> intentional_bye_rounds;

    // Derived by Tournament::UpdatePlayerData().
    int score_without_acceleration = 0;
    int rank_index = 0;
    std::set<int> forbidden_opponents;
    int color_imbalance = 0;
    Color color_preference = Color::None;
    Color repeated_color = Color::None;
    int color_streak = 0;
    bool strong_color_preference = false;
    int bye_count = 0;
    int half_point_bye_count = 0;
    int full_bye_count = 0;
    std::vector<int> bye_rounds;

    int Acceleration(const Tournament& tournament, int rounds_back = 0) const;

    // Throws PairingError(MalformedHistory) when the history or the
    // acceleration table cannot produce a consistent score.
    int ScoreWithAcceleration(const Tournament& tournament, int rounds_back = 0) const;

    bool AbsoluteColorImbalance() const { return color_imbalance > 1; }
    bool AbsoluteColorPreference() const {
        return AbsoluteColorImbalance() || repeated_color != Color::None;
    }

    void UpdateColorPreferences();
    void UpdateByeTracking();

    bool IsEligibleForBye(int round) const;
    bool IsEligibleForHalfPointBye() const;
    int ByePriority() const { return bye_count * 1000 + rating; }

    // White games minus black games over played games.
    int ColorBalance() const;
    // White or Black when the last two played games share that color.
    Color LastTwoColors() const;
    bool HasPlayed(int opponent) const;
};

}  // namespace swisspair::core::model
