#include "swisspair/core/pairing/PairingRules.h"

#include "swisspair/core/matching/MatchingComputer.h"
#include "swisspair/core/model/PairingError.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace swisspair::core::pairing {

namespace {

using model::Color;
using model::Player;
using model::Tournament;
using Weight = matching::MatchingComputer::Weight;

const Player& PlayerAt(const Tournament& tournament, int id) {
    return tournament.players[static_cast<size_t>(id)];
}

// Vertex i is player_ids[i]; the bye vertex, when present, is the last one.
matching::MatchingComputer BuildComputer(const Tournament& tournament,
                                         const std::vector<int>& player_ids,
                                         bool weighted,
                                         int preferred_bye) {
    const int count = static_cast<int>(player_ids.size());
    const bool needs_bye = count % 2 == 1;

    std::vector<int> scores;
    scores.reserve(player_ids.size());
    for (int id : player_ids) {
        scores.push_back(PlayerAt(tournament, id).ScoreWithAcceleration(tournament));
    }
    Weight spread = 0;
    if (!scores.empty()) {
        const auto bounds = std::minmax_element(scores.begin(), scores.end());
        spread = *bounds.second - *bounds.first;
    }
    const Weight max_score = scores.empty() ? 0 : *std::max_element(scores.begin(), scores.end());

    matching::MatchingComputer computer(count + (needs_bye ? 1 : 0),
                                        weighted ? 3 * spread + 8 : 1);
    for (int i = 0; i < count; ++i) {
        const Player& first = PlayerAt(tournament, player_ids[static_cast<size_t>(i)]);
        for (int j = i + 1; j < count; ++j) {
            const Player& second = PlayerAt(tournament, player_ids[static_cast<size_t>(j)]);
            if (!AreCompatible(tournament, first, second)) {
                continue;
            }
            Weight weight = 1;
            if (weighted) {
                const Weight diff = std::abs(scores[static_cast<size_t>(i)] -
                                             scores[static_cast<size_t>(j)]);
                weight = 4 + spread - diff;
            }
            computer.SetEdgeWeight(i, j, weight);
        }
    }

    if (needs_bye) {
        const auto candidates = ByeVertexCandidates(tournament, player_ids);
        for (int i = 0; i < count; ++i) {
            const int id = player_ids[static_cast<size_t>(i)];
            if (std::find(candidates.begin(), candidates.end(), id) == candidates.end()) {
                continue;
            }
            Weight weight = 1;
            if (weighted) {
                weight += max_score - scores[static_cast<size_t>(i)];
                if (id == preferred_bye) {
                    weight += spread + 2;
                }
            }
            computer.SetEdgeWeight(i, count, weight);
        }
    }
    return computer;
}

}  // namespace

std::vector<int> ActivePlayerIds(const Tournament& tournament) {
    std::vector<int> ids;
    for (const auto& player : tournament.players) {
        if (tournament.IsActive(player)) {
            ids.push_back(player.id);
        }
    }
    return ids;
}

bool AreCompatible(const Tournament& tournament, const Player& first, const Player& second) {
    if (first.id == second.id) {
        return false;
    }
    if (first.forbidden_opponents.count(second.id) > 0 ||
        second.forbidden_opponents.count(first.id) > 0) {
        return false;
    }
    if (first.AbsoluteColorPreference() && second.AbsoluteColorPreference() &&
        first.color_preference == second.color_preference && !tournament.IsLastRound()) {
        const int threshold = tournament.TopScoreThreshold();
        if (first.score_without_acceleration <= threshold &&
            second.score_without_acceleration <= threshold) {
            return false;
        }
    }
    return true;
}

std::pair<int, int> AssignColors(const Tournament& tournament,
                                 const Player& first,
                                 const Player& second) {
    const int balance_first = first.ColorBalance();
    const int balance_second = second.ColorBalance();
    if (balance_first < balance_second) {
        return {first.id, second.id};
    }
    if (balance_first > balance_second) {
        return {second.id, first.id};
    }

    // Nobody gets the same color three times in a row.
    const Color last_first = first.LastTwoColors();
    const Color last_second = second.LastTwoColors();
    if (last_first == Color::White) {
        return {second.id, first.id};
    }
    if (last_second == Color::White) {
        return {first.id, second.id};
    }
    if (last_first == Color::Black) {
        return {first.id, second.id};
    }
    if (last_second == Color::Black) {
        return {second.id, first.id};
    }

    if (first.rank_index != second.rank_index) {
        const Player& higher = first.rank_index < second.rank_index ? first : second;
        const Player& lower = first.rank_index < second.rank_index ? second : first;
        Color due = higher.color_preference;
        if (due == Color::None) {
            due = model::InvertColor(lower.color_preference);
        }
        if (due == Color::None) {
            due = tournament.initial_color;
        }
        if (due == Color::White) {
            return {higher.id, lower.id};
        }
        return {lower.id, higher.id};
    }

    if (first.id < second.id) {
        return {first.id, second.id};
    }
    return {second.id, first.id};
}

bool CanReceiveBye(const Tournament& tournament, const Player& player) {
    return player.IsEligibleForBye(tournament.played_rounds + 1) ||
           player.IsEligibleForHalfPointBye();
}

std::vector<int> ByeVertexCandidates(const Tournament& tournament,
                                     const std::vector<int>& player_ids) {
    std::vector<int> candidates;
    for (int id : player_ids) {
        if (CanReceiveBye(tournament, PlayerAt(tournament, id))) {
            candidates.push_back(id);
        }
    }
    if (candidates.empty()) {
        return player_ids;
    }
    return candidates;
}

model::ByeType ByeTypeFor(const Player& player) {
    return player.IsEligibleForHalfPointBye() ? model::ByeType::HalfPointBye
                                              : model::ByeType::Bye;
}

void CertifyRound(const Tournament& tournament, const std::vector<int>& player_ids) {
    auto computer = BuildComputer(tournament, player_ids, false, -1);
    computer.ComputeMatching();
    if (computer.IsComplete()) {
        return;
    }

    std::ostringstream message;
    message << "No valid pairing exists for round " << tournament.played_rounds + 1 << ": ";
    const auto& mates = computer.GetMatching();
    bool first = true;
    for (size_t i = 0; i < player_ids.size(); ++i) {
        if (mates[i] < 0) {
            message << (first ? "" : ", ") << "player " << player_ids[i] + 1;
            first = false;
        }
    }
    if (first) {
        message << "the bye cannot be allocated";
    } else {
        message << " left without a compatible opponent";
    }
    throw model::PairingError(model::PairingErrorKind::Unsatisfiable, message.str());
}

SolvedRound SolveRound(const Tournament& tournament,
                       const std::vector<int>& player_ids,
                       int preferred_bye) {
    SolvedRound result;
    auto computer = BuildComputer(tournament, player_ids, true, preferred_bye);
    computer.ComputeMatching();
    if (!computer.IsComplete()) {
        return result;
    }

    const int count = static_cast<int>(player_ids.size());
    const auto& mates = computer.GetMatching();
    for (int i = 0; i < count; ++i) {
        const int mate = mates[static_cast<size_t>(i)];
        if (mate == count) {
            result.bye_player = player_ids[static_cast<size_t>(i)];
        } else if (mate > i) {
            result.pairs.emplace_back(player_ids[static_cast<size_t>(i)],
                                      player_ids[static_cast<size_t>(mate)]);
        }
    }
    result.ok = true;
    return result;
}

}  // namespace swisspair::core::pairing
