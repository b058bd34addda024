#pragma once

#include "swisspair/core/model/Tournament.h"
#include "swisspair/core/trf/Extensions.h"
#include "swisspair/core/trf/ScoringSystem.h"

#include <string>
#include <vector>

namespace swisspair::core::trf {

struct TrfDocument {
    std::string tournament_name;
    Extensions extensions;
    ScoringSystem scoring_system;
    // Ids are 0-based; ids missing from the file are invalid placeholders.
    // Player data is updated and ranks are assigned.
    model::Tournament tournament;
    // Rank column as written in the file (0-based), indexed by player id.
    std::vector<int> file_ranks;
};

class TrfReader {
public:
    // Throws PairingError(Parse) for malformed lines and
    // PairingError(MalformedHistory) for histories that do not agree.
    static TrfDocument Parse(const std::string& text);

    static model::Match ParseGame(const std::string& block, int self, size_t line_number);
};

}  // namespace swisspair::core::trf
