#pragma once

#include "swisspair/core/pairing/ScoreGroupPairingSystem.h"
#include "swisspair/core/pairing/Tiebreaks.h"

namespace swisspair::core::pairing {

// Score groups ordered by Sonneborn-Berger, Buchholz and median instead of
// rating. The bye is chosen before pairing starts.
class BursteinSystem final : public ScoreGroupPairingSystem {
public:
    std::string Name() const override { return "burstein"; }

    const std::vector<TiebreakScores>& tiebreaks() const { return tiebreaks_; }

protected:
    std::vector<int> SortPlayers(const model::Tournament& tournament,
                                 std::vector<int> player_ids) override;
    int PreselectBye(const model::Tournament& tournament,
                     const std::vector<int>& sorted_ids) override;
    int SelectFloater(const model::Tournament& tournament, const std::vector<int>& group) override;
    void OrderGroup(const model::Tournament& tournament, std::vector<int>& group) override;

private:
    bool TiebreakBefore(const model::Tournament& tournament, int first, int second) const;

    std::vector<TiebreakScores> tiebreaks_;
};

}  // namespace swisspair::core::pairing
