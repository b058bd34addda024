#include "swisspair/core/trf/FideCompliance.h"

#include "swisspair/core/pairing/PairingRules.h"

#include <algorithm>

namespace swisspair::core::trf {

std::string ViolationToString(Violation violation) {
    switch (violation) {
        case Violation::RepeatPairing:
            return "REPEAT_PAIRING";
        case Violation::ColorViolation:
            return "COLOR_VIOLATION";
    }
    return "UNKNOWN";
}

bool FideCompliance::HasPlayedBefore(int first,
                                     int second,
                                     const std::vector<model::Pairing>& previous) {
    return std::any_of(previous.begin(), previous.end(), [&](const model::Pairing& pairing) {
        if (pairing.is_bye || !pairing.black_id) {
            return false;
        }
        const int black = *pairing.black_id;
        return (pairing.white_id == first && black == second) ||
               (pairing.white_id == second && black == first);
    });
}

bool FideCompliance::ViolatesColorRules(const model::Player& first, const model::Player& second) {
    return first.AbsoluteColorPreference() && second.AbsoluteColorPreference() &&
           first.color_preference == second.color_preference;
}

ComplianceReport FideCompliance::CheckPairingValidity(const model::Player& first,
                                                      const model::Player& second,
                                                      const std::vector<model::Pairing>& previous) {
    ComplianceReport report;
    if (HasPlayedBefore(first.id, second.id, previous)) {
        report.violations.push_back(Violation::RepeatPairing);
    }
    if (ViolatesColorRules(first, second)) {
        report.violations.push_back(Violation::ColorViolation);
    }
    report.valid = report.violations.empty();
    return report;
}

std::pair<int, int> FideCompliance::AssignColors(const model::Tournament& tournament,
                                                 const model::Player& first,
                                                 const model::Player& second) {
    return pairing::AssignColors(tournament, first, second);
}

std::vector<PairingAudit> FideCompliance::AuditTournament(const model::Tournament& tournament) {
    std::vector<PairingAudit> audits;
    std::vector<model::Pairing> previous;

    for (int round = 1; round <= tournament.played_rounds; ++round) {
        // State as it stood before this round was paired.
        model::Tournament before = tournament;
        before.played_rounds = round - 1;
        for (auto& player : before.players) {
            if (static_cast<int>(player.matches.size()) > round - 1) {
                player.matches.resize(static_cast<size_t>(round - 1));
            }
        }
        before.UpdatePlayerData();

        std::vector<model::Pairing> this_round;
        for (const auto& player : tournament.players) {
            if (!player.is_valid || static_cast<int>(player.matches.size()) < round) {
                continue;
            }
            const auto& match = player.matches[static_cast<size_t>(round - 1)];
            if (!match.game_was_played || match.color != model::Color::White) {
                continue;
            }
            const auto& white = before.players[static_cast<size_t>(player.id)];
            const auto& black = before.players[static_cast<size_t>(match.opponent)];

            PairingAudit audit;
            audit.round = round;
            audit.white_id = player.id;
            audit.black_id = match.opponent;
            audit.report = CheckPairingValidity(white, black, previous);
            audits.push_back(std::move(audit));
            this_round.push_back(model::Pairing::Game(player.id, match.opponent));
        }
        previous.insert(previous.end(), this_round.begin(), this_round.end());
    }
    return audits;
}

}  // namespace swisspair::core::trf
