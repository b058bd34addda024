#pragma once

#include "swisspair/core/model/Pairing.h"
#include "swisspair/core/model/Tournament.h"

#include <memory>
#include <string>
#include <vector>

namespace swisspair::core::pairing {

// Produces the pairings of the next round (played_rounds + 1). The tournament
// must have had UpdatePlayerData() and AssignRanks() applied.
class IPairingSystem {
public:
    virtual ~IPairingSystem() = default;
    virtual std::string Name() const = 0;
    virtual std::vector<model::Pairing> ComputeMatching(const model::Tournament& tournament) = 0;
};

// Throws PairingError(Configuration) for an unknown name.
std::unique_ptr<IPairingSystem> CreatePairingSystem(const std::string& name);
std::vector<std::string> AvailablePairingSystems();

}  // namespace swisspair::core::pairing
