#pragma once

#include "swisspair/core/pairing/ScoreGroupPairingSystem.h"

namespace swisspair::core::pairing {

// FIDE Dutch style: accelerated score groups split by rating.
class DutchSystem final : public ScoreGroupPairingSystem {
public:
    std::string Name() const override { return "dutch"; }

    // Half-point bye eligible players first, then full bye eligible ones;
    // lowest bye priority within a tier. Falls back to the lowest rating.
    static int SelectByePlayer(const model::Tournament& tournament, const std::vector<int>& group);

protected:
    std::vector<int> SortPlayers(const model::Tournament& tournament,
                                 std::vector<int> player_ids) override;
    int SelectFloater(const model::Tournament& tournament, const std::vector<int>& group) override;
    void OrderGroup(const model::Tournament& tournament, std::vector<int>& group) override;
};

}  // namespace swisspair::core::pairing
