#include "swisspair/core/pairing/PairingSystem.h"

#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/pairing/BursteinSystem.h"
#include "swisspair/core/pairing/DutchSystem.h"

#include <algorithm>
#include <cctype>

namespace swisspair::core::pairing {

std::unique_ptr<IPairingSystem> CreatePairingSystem(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "dutch") {
        return std::make_unique<DutchSystem>();
    }
    if (key == "burstein") {
        return std::make_unique<BursteinSystem>();
    }
    throw model::PairingError(model::PairingErrorKind::Configuration,
                              "Unknown pairing system: " + name);
}

std::vector<std::string> AvailablePairingSystems() {
    return {"dutch", "burstein"};
}

}  // namespace swisspair::core::pairing
