#include "swisspair/core/pairing/ScoreGroupPairingSystem.h"

#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/pairing/PairingRules.h"

#include <algorithm>
#include <string>

namespace swisspair::core::pairing {

namespace {

const model::Player& PlayerAt(const model::Tournament& tournament, int id) {
    return tournament.players[static_cast<size_t>(id)];
}

void EraseId(std::vector<int>& ids, int id) {
    const auto it = std::find(ids.begin(), ids.end(), id);
    if (it != ids.end()) {
        ids.erase(it);
    }
}

}  // namespace

int ScoreGroupPairingSystem::PreselectBye(const model::Tournament&, const std::vector<int>&) {
    return -1;
}

void ScoreGroupPairingSystem::PairHalves(const model::Tournament& tournament,
                                         const std::vector<int>& group,
                                         std::vector<bool>& used,
                                         std::vector<std::pair<int, int>>& pairs) {
    const auto try_pair = [&](int first, int second) {
        if (used[static_cast<size_t>(first)] || used[static_cast<size_t>(second)]) {
            return false;
        }
        if (!AreCompatible(tournament, PlayerAt(tournament, first), PlayerAt(tournament, second))) {
            return false;
        }
        used[static_cast<size_t>(first)] = true;
        used[static_cast<size_t>(second)] = true;
        pairs.emplace_back(first, second);
        return true;
    };

    const size_t half = group.size() / 2;
    for (size_t i = 0; i < half; ++i) {
        const int top = group[i];
        const int bottom = group[half + i];
        if (used[static_cast<size_t>(top)]) {
            continue;
        }
        if (try_pair(top, bottom)) {
            continue;
        }
        // Another top player takes this bottom player...
        for (size_t j = 0; j < half && !used[static_cast<size_t>(bottom)]; ++j) {
            if (j != i) {
                try_pair(group[j], bottom);
            }
        }
        // ...and the top player looks for another bottom partner.
        for (size_t j = half; j < group.size() && !used[static_cast<size_t>(top)]; ++j) {
            if (group[j] != bottom) {
                try_pair(top, group[j]);
            }
        }
    }
}

std::vector<model::Pairing> ScoreGroupPairingSystem::ComputeMatching(
    const model::Tournament& tournament) {
    std::vector<model::Pairing> pairings;
    const std::vector<int> active = ActivePlayerIds(tournament);
    if (active.empty()) {
        return pairings;
    }
    CertifyRound(tournament, active);

    std::vector<int> order = SortPlayers(tournament, active);
    int bye_candidate = order.size() % 2 == 1 ? PreselectBye(tournament, order) : -1;
    if (bye_candidate >= 0) {
        EraseId(order, bye_candidate);
    }

    std::vector<std::vector<int>> groups;
    int group_score = 0;
    for (int id : order) {
        const int score = PlayerAt(tournament, id).ScoreWithAcceleration(tournament);
        if (groups.empty() || score != group_score) {
            groups.emplace_back();
            group_score = score;
        }
        groups.back().push_back(id);
    }

    std::vector<bool> used(tournament.players.size(), false);
    std::vector<std::pair<int, int>> pairs;
    std::vector<int> carry;
    std::vector<int> residual;
    for (size_t index = 0; index < groups.size(); ++index) {
        const bool last_group = index + 1 == groups.size();
        std::vector<int> group = carry;
        group.insert(group.end(), groups[index].begin(), groups[index].end());
        carry.clear();
        OrderGroup(tournament, group);

        if (group.size() % 2 == 1) {
            const int floater = SelectFloater(tournament, group);
            EraseId(group, floater);
            if (!last_group) {
                carry.push_back(floater);
            } else if (bye_candidate < 0) {
                bye_candidate = floater;
            } else {
                residual.push_back(floater);
            }
        }

        PairHalves(tournament, group, used, pairs);
        for (int id : group) {
            if (!used[static_cast<size_t>(id)]) {
                (last_group ? residual : carry).push_back(id);
            }
        }
    }

    int bye_player = -1;
    std::vector<int> rest = residual;
    if (bye_candidate >= 0) {
        rest.push_back(bye_candidate);
    }
    if (!rest.empty()) {
        SolvedRound solved = SolveRound(tournament, rest, bye_candidate);
        if (!solved.ok) {
            // The greedy pass painted itself into a corner: settle the whole
            // round with the solver instead.
            pairs.clear();
            solved = SolveRound(tournament, active, bye_candidate);
            if (!solved.ok) {
                throw model::PairingError(model::PairingErrorKind::Unsatisfiable,
                                          "No complete pairing found for round " +
                                              std::to_string(tournament.played_rounds + 1));
            }
        }
        pairs.insert(pairs.end(), solved.pairs.begin(), solved.pairs.end());
        bye_player = solved.bye_player;
    }

    for (const auto& pair : pairs) {
        const auto colors = AssignColors(tournament, PlayerAt(tournament, pair.first),
                                         PlayerAt(tournament, pair.second));
        pairings.push_back(model::Pairing::Game(colors.first, colors.second));
    }
    if (bye_player >= 0) {
        pairings.push_back(
            model::Pairing::ByeFor(bye_player, ByeTypeFor(PlayerAt(tournament, bye_player))));
    }
    return pairings;
}

}  // namespace swisspair::core::pairing
