#pragma once

#include "swisspair/core/model/Pairing.h"
#include "swisspair/core/model/Tournament.h"

#include <string>
#include <vector>

namespace swisspair::core::trf {

// Emits TRF16 text with CRLF line endings. Ids, ratings and points beyond
// the fixed columns throw PairingError(FormatLimit).
class TrfWriter {
public:
    static std::string WriteTournament(const model::Tournament& tournament,
                                       const std::string& tournament_name = {});

    static std::string FormatPlayerLine(const model::Player& player, int rank);
    static std::string FormatGame(const model::Player& player, const model::Match& match);
    static std::vector<std::string> FormatScoringLines(const model::ScoringTable& scoring);

    // Pair count, then "white black" per line with 1-based ids; a bye is
    // written as "id 0".
    static std::string WritePairingListing(const std::vector<model::Pairing>& pairings);
};

// Reads a pairing listing back to 0-based pairings; throws PairingError(Parse).
std::vector<model::Pairing> ParsePairingListing(const std::string& text);

}  // namespace swisspair::core::trf
