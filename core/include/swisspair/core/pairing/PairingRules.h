#pragma once

#include "swisspair/core/model/Pairing.h"
#include "swisspair/core/model/Tournament.h"

#include <utility>
#include <vector>

namespace swisspair::core::pairing {

// Ids of the players taking part in the next round, in id order.
std::vector<int> ActivePlayerIds(const model::Tournament& tournament);

// Not yet met (or forbidden), and not both absolutely due the same color
// unless the round is the last one or either player is in the top scores.
bool AreCompatible(const model::Tournament& tournament,
                   const model::Player& first,
                   const model::Player& second);

// Returns {white, black}.
std::pair<int, int> AssignColors(const model::Tournament& tournament,
                                 const model::Player& first,
                                 const model::Player& second);

// A pairing-allocated bye may go to this player in the next round.
bool CanReceiveBye(const model::Tournament& tournament, const model::Player& player);
// Players allowed on the bye vertex: the bye candidates, or everybody when
// nobody qualifies.
std::vector<int> ByeVertexCandidates(const model::Tournament& tournament,
                                     const std::vector<int>& player_ids);
model::ByeType ByeTypeFor(const model::Player& player);

// Throws PairingError(Unsatisfiable) unless every listed player can be
// paired (one of them receiving the bye when the count is odd).
void CertifyRound(const model::Tournament& tournament, const std::vector<int>& player_ids);

// Maximum-cardinality matching preferring pairs of close scores. An odd
// player count adds a bye vertex; preferred_bye (or -1) is favored for it.
// ok is false when no complete matching exists.
struct SolvedRound {
    bool ok = false;
    std::vector<std::pair<int, int>> pairs;
    int bye_player = -1;
};
SolvedRound SolveRound(const model::Tournament& tournament,
                       const std::vector<int>& player_ids,
                       int preferred_bye);

}  // namespace swisspair::core::pairing
