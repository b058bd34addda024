#pragma once

#include "swisspair/core/pairing/PairingSystem.h"

#include <utility>
#include <vector>

namespace swisspair::core::pairing {

// Shared score-group pairing: the round is certified with the matching
// solver, players are ordered and split into score groups, each group is
// paired top half against bottom half with a swap search, and whatever the
// greedy pass leaves over is settled by the weighted matching solver.
class ScoreGroupPairingSystem : public IPairingSystem {
public:
    std::vector<model::Pairing> ComputeMatching(const model::Tournament& tournament) override;

protected:
    // Active players in pairing order, highest score first.
    virtual std::vector<int> SortPlayers(const model::Tournament& tournament,
                                         std::vector<int> player_ids) = 0;
    // A bye recipient taken out before the groups are formed, or -1.
    virtual int PreselectBye(const model::Tournament& tournament,
                             const std::vector<int>& sorted_ids);
    // The player leaving an odd group: it floats down, or becomes the bye
    // candidate when the group is the last one.
    virtual int SelectFloater(const model::Tournament& tournament,
                              const std::vector<int>& group) = 0;
    // Order used to split a group into halves.
    virtual void OrderGroup(const model::Tournament& tournament, std::vector<int>& group) = 0;

private:
    static void PairHalves(const model::Tournament& tournament,
                           const std::vector<int>& group,
                           std::vector<bool>& used,
                           std::vector<std::pair<int, int>>& pairs);
};

}  // namespace swisspair::core::pairing
