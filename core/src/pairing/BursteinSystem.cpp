#include "swisspair/core/pairing/BursteinSystem.h"

#include <algorithm>
#include <unordered_map>

namespace swisspair::core::pairing {

namespace {

const model::Player& PlayerAt(const model::Tournament& tournament, int id) {
    return tournament.players[static_cast<size_t>(id)];
}

// A player who already scored a win without playing has had the bye.
bool HasUnplayedWin(const model::Player& player) {
    return std::any_of(player.matches.begin(), player.matches.end(), [](const model::Match& match) {
        return !match.game_was_played && match.participated_in_pairing &&
               match.score == model::MatchScore::Win;
    });
}

}  // namespace

bool BursteinSystem::TiebreakBefore(const model::Tournament& tournament,
                                    int first,
                                    int second) const {
    const auto& left = tiebreaks_[static_cast<size_t>(first)];
    const auto& right = tiebreaks_[static_cast<size_t>(second)];
    if (left.sonneborn_berger != right.sonneborn_berger) {
        return left.sonneborn_berger > right.sonneborn_berger;
    }
    if (left.buchholz != right.buchholz) {
        return left.buchholz > right.buchholz;
    }
    if (left.median != right.median) {
        return left.median > right.median;
    }
    return PlayerAt(tournament, first).rank_index < PlayerAt(tournament, second).rank_index;
}

std::vector<int> BursteinSystem::SortPlayers(const model::Tournament& tournament,
                                             std::vector<int> player_ids) {
    tiebreaks_ = ComputeAllTiebreaks(tournament);

    std::unordered_map<int, int> scores;
    for (int id : player_ids) {
        scores[id] = PlayerAt(tournament, id).ScoreWithAcceleration(tournament);
    }
    std::stable_sort(player_ids.begin(), player_ids.end(), [&](int a, int b) {
        if (scores[a] != scores[b]) {
            return scores[a] > scores[b];
        }
        return TiebreakBefore(tournament, a, b);
    });
    return player_ids;
}

int BursteinSystem::PreselectBye(const model::Tournament& tournament,
                                 const std::vector<int>& sorted_ids) {
    for (auto it = sorted_ids.rbegin(); it != sorted_ids.rend(); ++it) {
        if (!HasUnplayedWin(PlayerAt(tournament, *it))) {
            return *it;
        }
    }
    return sorted_ids.empty() ? -1 : sorted_ids.back();
}

int BursteinSystem::SelectFloater(const model::Tournament&, const std::vector<int>& group) {
    return group.back();
}

void BursteinSystem::OrderGroup(const model::Tournament& tournament, std::vector<int>& group) {
    std::stable_sort(group.begin(), group.end(),
                     [&](int a, int b) { return TiebreakBefore(tournament, a, b); });
}

}  // namespace swisspair::core::pairing
