#include "swisspair/core/pairing/DutchSystem.h"

#include "swisspair/core/pairing/PairingRules.h"

#include <algorithm>
#include <unordered_map>

namespace swisspair::core::pairing {

namespace {

const model::Player& PlayerAt(const model::Tournament& tournament, int id) {
    return tournament.players[static_cast<size_t>(id)];
}

// Lowest bye priority among the players accepted by the filter, or -1.
template <typename Filter>
int LowestByePriority(const model::Tournament& tournament,
                      const std::vector<int>& group,
                      Filter filter) {
    int best = -1;
    for (int id : group) {
        const auto& player = PlayerAt(tournament, id);
        if (!filter(player)) {
            continue;
        }
        if (best < 0 || player.ByePriority() < PlayerAt(tournament, best).ByePriority()) {
            best = id;
        }
    }
    return best;
}

}  // namespace

int DutchSystem::SelectByePlayer(const model::Tournament& tournament,
                                 const std::vector<int>& group) {
    int chosen = LowestByePriority(tournament, group, [](const model::Player& player) {
        return player.IsEligibleForHalfPointBye();
    });
    if (chosen >= 0) {
        return chosen;
    }

    const int round = tournament.played_rounds + 1;
    chosen = LowestByePriority(tournament, group, [round](const model::Player& player) {
        return player.IsEligibleForBye(round);
    });
    if (chosen >= 0) {
        return chosen;
    }

    for (int id : group) {
        if (chosen < 0 || PlayerAt(tournament, id).rating < PlayerAt(tournament, chosen).rating) {
            chosen = id;
        }
    }
    return chosen;
}

std::vector<int> DutchSystem::SortPlayers(const model::Tournament& tournament,
                                          std::vector<int> player_ids) {
    std::unordered_map<int, int> scores;
    for (int id : player_ids) {
        scores[id] = PlayerAt(tournament, id).ScoreWithAcceleration(tournament);
    }
    std::stable_sort(player_ids.begin(), player_ids.end(), [&](int a, int b) {
        if (scores[a] != scores[b]) {
            return scores[a] > scores[b];
        }
        return PlayerAt(tournament, a).rank_index < PlayerAt(tournament, b).rank_index;
    });
    return player_ids;
}

int DutchSystem::SelectFloater(const model::Tournament& tournament,
                               const std::vector<int>& group) {
    return SelectByePlayer(tournament, group);
}

void DutchSystem::OrderGroup(const model::Tournament& tournament, std::vector<int>& group) {
    std::stable_sort(group.begin(), group.end(), [&](int a, int b) {
        const auto& left = PlayerAt(tournament, a);
        const auto& right = PlayerAt(tournament, b);
        if (left.rating != right.rating) {
            return left.rating > right.rating;
        }
        return left.rank_index < right.rank_index;
    });
}

}  // namespace swisspair::core::pairing
