#pragma once

#include "swisspair/core/model/Pairing.h"
#include "swisspair/core/model/Tournament.h"

#include <string>
#include <utility>
#include <vector>

namespace swisspair::core::trf {

enum class Violation {
    RepeatPairing,
    ColorViolation
};

std::string ViolationToString(Violation violation);

struct ComplianceReport {
    bool valid = true;
    std::vector<Violation> violations;
};

// A pairing checked against the state before its round.
struct PairingAudit {
    int round = 0;
    int white_id = -1;
    int black_id = -1;
    ComplianceReport report;
};

class FideCompliance {
public:
    static bool HasPlayedBefore(int first, int second, const std::vector<model::Pairing>& previous);
    static bool ViolatesColorRules(const model::Player& first, const model::Player& second);

    static ComplianceReport CheckPairingValidity(const model::Player& first,
                                                 const model::Player& second,
                                                 const std::vector<model::Pairing>& previous);

    // {white, black}, by the same rule the pairing systems use.
    static std::pair<int, int> AssignColors(const model::Tournament& tournament,
                                            const model::Player& first,
                                            const model::Player& second);

    // Replays the history round by round and checks every played game.
    static std::vector<PairingAudit> AuditTournament(const model::Tournament& tournament);
};

}  // namespace swisspair::core::trf
