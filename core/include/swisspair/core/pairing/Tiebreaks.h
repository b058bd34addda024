#pragma once

#include "swisspair/core/model/Tournament.h"

#include <vector>

namespace swisspair::core::pairing {

// All values are in tenths of a point.
struct TiebreakScores {
    double adjusted_score = 0.0;
    double sonneborn_berger = 0.0;
    double buchholz = 0.0;
    double median = 0.0;
};

// Acceleration plus points, every unplayed game counted as a draw.
double AdjustedScore(const model::Tournament& tournament, const model::Player& player);

// Stand-in opponent score for a round without a played game.
double VirtualOpponentScore(const model::Tournament& tournament,
                            const model::Player& player,
                            const model::Match& match);

TiebreakScores ComputeTiebreaks(const model::Tournament& tournament, const model::Player& player);

// Indexed by player id; invalid players get zeros.
std::vector<TiebreakScores> ComputeAllTiebreaks(const model::Tournament& tournament);

}  // namespace swisspair::core::pairing
