#pragma once

#include "swisspair/core/api/PairingConfig.h"
#include "swisspair/core/api/PairingStore.h"
#include "swisspair/core/model/Pairing.h"
#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/model/Tournament.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace swisspair::core::api {

struct PairingRequest {
    std::string tournament_id;
    std::string section = "Open";
    // 0 pairs the round after the last stored one.
    int round = 0;
    int expected_rounds = 0;
    std::string system = "dutch";
    model::ScoringTable scoring;
    model::Color initial_color = model::Color::White;
    bool include_trf = false;

    static PairingRequest FromConfig(const PairingConfig& config);
};

struct PairingRecord {
    std::string white_player_id;
    std::optional<std::string> black_player_id;
    bool is_bye = false;
    std::optional<model::ByeType> bye_type;
    int board = 0;
    std::string section;
    int round = 0;
};

struct PairingOutcome {
    bool success = false;
    // Empty for store failures.
    std::optional<model::PairingErrorKind> error_kind;
    std::string error;
    int round = 0;
    std::vector<PairingRecord> records;
    // Engine ids, boards assigned; intentional byes included.
    std::vector<model::Pairing> pairings;
    std::string pairing_listing;
    std::string trf;
};

struct ReconstructedTournament {
    model::Tournament tournament;
    // External id per engine id.
    std::vector<std::string> external_ids;
    // Engine ids taking a requested half-point bye this round.
    std::vector<int> intentional_byes;
};

class PairingService {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit PairingService(IPairingStore& store, LogFn log = {});

    // Never throws for domain failures; see PairingOutcome::error_kind.
    PairingOutcome GeneratePairings(const PairingRequest& request);

    bool PersistOutcome(const PairingRequest& request,
                        const PairingOutcome& outcome,
                        std::string* error);

    // One past the highest stored round, or 1 for a new tournament.
    bool NextRound(const std::string& tournament_id,
                   const std::string& section,
                   int& round,
                   std::string* error);

    // Rebuilds the state before `round` from store rows. Throws
    // PairingError(MalformedHistory) for rows that do not fit the roster and
    // PairingError(FormatLimit) for ids or ratings beyond 9999.
    static ReconstructedTournament BuildTournament(const std::vector<PlayerRow>& players,
                                                   const std::vector<PairingRow>& pairings,
                                                   int round,
                                                   const model::ScoringTable& scoring,
                                                   int expected_rounds = 0,
                                                   model::Color initial_color = model::Color::White);

    static nlohmann::json OutcomeToJson(const PairingOutcome& outcome);

private:
    void Log(const std::string& line) const;

    IPairingStore& store_;
    LogFn log_;
};

}  // namespace swisspair::core::api
