#include "swisspair/core/api/PairingService.h"

#include "swisspair/core/pairing/PairingSystem.h"
#include "swisspair/core/trf/TrfFields.h"
#include "swisspair/core/trf/TrfWriter.h"
#include "swisspair/core/util/ByeRounds.h"

#include <algorithm>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace swisspair::core::api {

namespace {

using model::Color;
using model::Match;
using model::MatchScore;
using model::PairingError;
using model::PairingErrorKind;

[[noreturn]] void ThrowMalformed(const std::string& text) {
    throw PairingError(PairingErrorKind::MalformedHistory, text);
}

struct GameResult {
    MatchScore white = MatchScore::Loss;
    MatchScore black = MatchScore::Loss;
    bool played = false;
};

// A missing result is an unreported game: not played, lost by both.
GameResult ParseGameResult(const std::optional<std::string>& code, const PairingRow& row) {
    GameResult result;
    if (!code || code->empty()) {
        return result;
    }
    std::string text = *code;
    result.played = true;
    if (text.back() == 'F' || text.back() == 'f') {
        result.played = false;
        text.pop_back();
    }
    if (text == "1-0") {
        result.white = MatchScore::Win;
        result.black = MatchScore::Loss;
    } else if (text == "0-1") {
        result.white = MatchScore::Loss;
        result.black = MatchScore::Win;
    } else if (text == "1/2-1/2") {
        result.white = MatchScore::Draw;
        result.black = MatchScore::Draw;
    } else {
        ThrowMalformed("Unknown result '" + *code + "' in round " + std::to_string(row.round) +
                       " for player " + row.white_player_id);
    }
    return result;
}

Match ByeMatch(int self, const PairingRow& row) {
    if (row.bye_type) {
        model::ByeType type = model::ByeType::Bye;
        if (!model::ParseByeType(*row.bye_type, type)) {
            ThrowMalformed("Unknown bye type '" + *row.bye_type + "' in round " +
                           std::to_string(row.round) + " for player " + row.white_player_id);
        }
        switch (type) {
            case model::ByeType::HalfPointBye:
                return Match::Unpaired(self, MatchScore::Draw);
            case model::ByeType::Unpaired:
                return Match::Unpaired(self, MatchScore::Loss);
            case model::ByeType::Bye:
                return Match::PairingAllocatedBye(self);
        }
    }
    const std::string result = row.result.value_or(std::string{});
    if (result == "1/2-1/2") {
        return Match::Unpaired(self, MatchScore::Draw);
    }
    if (result == "0-1") {
        return Match::Unpaired(self, MatchScore::Loss);
    }
    if (result.empty() || result == "1-0") {
        return Match::PairingAllocatedBye(self);
    }
    ThrowMalformed("Unknown bye result '" + result + "' in round " + std::to_string(row.round) +
                   " for player " + row.white_player_id);
}

std::string ByeResultCode(model::ByeType type) {
    switch (type) {
        case model::ByeType::HalfPointBye:
            return "1/2-1/2";
        case model::ByeType::Unpaired:
            return "0-1";
        case model::ByeType::Bye:
            break;
    }
    return "1-0";
}

}  // namespace

PairingRequest PairingRequest::FromConfig(const PairingConfig& config) {
    PairingRequest request;
    request.tournament_id = config.tournament.id;
    request.section = config.tournament.section;
    request.round = config.tournament.round;
    request.expected_rounds = config.tournament.rounds;
    request.system = config.tournament.system;
    request.scoring = config.scoring.ToScoringTable();
    if (!model::ParseColor(config.tournament.initial_color, request.initial_color) ||
        request.initial_color == Color::None) {
        request.initial_color = Color::White;
    }
    request.include_trf = !config.output.trf.empty();
    return request;
}

PairingService::PairingService(IPairingStore& store, LogFn log)
    : store_(store), log_(std::move(log)) {}

void PairingService::Log(const std::string& line) const {
    if (log_) {
        log_(line);
    }
}

bool PairingService::NextRound(const std::string& tournament_id,
                               const std::string& section,
                               int& round,
                               std::string* error) {
    std::vector<PairingRow> rows;
    if (!store_.LoadPairings(tournament_id, section, std::numeric_limits<int>::max(), rows, error)) {
        return false;
    }
    int last = 0;
    for (const auto& row : rows) {
        last = std::max(last, row.round);
    }
    round = last + 1;
    return true;
}

ReconstructedTournament PairingService::BuildTournament(const std::vector<PlayerRow>& players,
                                                        const std::vector<PairingRow>& pairings,
                                                        int round,
                                                        const model::ScoringTable& scoring,
                                                        int expected_rounds,
                                                        Color initial_color) {
    if (round < 1) {
        throw PairingError(PairingErrorKind::Configuration,
                           "Round must be at least 1, got " + std::to_string(round));
    }
    if (static_cast<int>(players.size()) > trf::kMaxId) {
        throw PairingError(PairingErrorKind::FormatLimit,
                           "At most 9999 players are supported, got " +
                               std::to_string(players.size()));
    }

    ReconstructedTournament result;
    auto& tournament = result.tournament;
    tournament.played_rounds = round - 1;
    tournament.expected_rounds = expected_rounds;
    tournament.scoring = scoring;
    tournament.initial_color = initial_color;

    std::map<std::string, int> index_of;
    for (const auto& row : players) {
        if (row.id.empty()) {
            ThrowMalformed("Player row without an id: " + row.name);
        }
        if (index_of.count(row.id) != 0) {
            ThrowMalformed("Duplicate player id " + row.id);
        }
        if (row.rating < 0 || row.rating > trf::kMaxRating) {
            throw PairingError(PairingErrorKind::FormatLimit,
                               "Player " + row.id + " has rating " + std::to_string(row.rating) +
                                   ", ratings are limited to 0..9999");
        }
        auto& player = tournament.AddPlayer(row.name, row.rating);
        index_of[row.id] = player.id;
        result.external_ids.push_back(row.id);

        const auto bye_rounds = util::NormalizeByeRounds(row.intentional_bye_rounds);
        player.intentional_bye_rounds.insert(bye_rounds.begin(), bye_rounds.end());

        if (row.status != "active") {
            tournament.absent_players.insert(player.id);
        } else if (player.intentional_bye_rounds.count(round) != 0) {
            tournament.absent_players.insert(player.id);
            result.intentional_byes.push_back(player.id);
        }
    }

    auto resolve = [&index_of](const std::string& id, const PairingRow& row) {
        const auto found = index_of.find(id);
        if (found == index_of.end()) {
            ThrowMalformed("Round " + std::to_string(row.round) + " pairing references unknown player " +
                           id);
        }
        return found->second;
    };

    const size_t history = static_cast<size_t>(round - 1);
    std::vector<std::vector<std::optional<Match>>> slots(
        tournament.players.size(), std::vector<std::optional<Match>>(history));
    auto place = [&slots](int player, const PairingRow& row, const Match& match) {
        auto& slot = slots[static_cast<size_t>(player)][static_cast<size_t>(row.round - 1)];
        if (slot) {
            ThrowMalformed("Player appears twice in round " + std::to_string(row.round));
        }
        slot = match;
    };

    for (const auto& row : pairings) {
        if (row.round < 1 || row.round >= round) {
            ThrowMalformed("Pairing row for round " + std::to_string(row.round) +
                           " does not precede round " + std::to_string(round));
        }
        const int white = resolve(row.white_player_id, row);
        if (!row.black_player_id) {
            place(white, row, ByeMatch(white, row));
            continue;
        }
        const int black = resolve(*row.black_player_id, row);
        if (black == white) {
            ThrowMalformed("Player " + row.white_player_id + " is paired with itself in round " +
                           std::to_string(row.round));
        }
        const GameResult game = ParseGameResult(row.result, row);
        if (game.played) {
            place(white, row, Match::Played(black, Color::White, game.white));
            place(black, row, Match::Played(white, Color::Black, game.black));
        } else {
            place(white, row, Match::Forfeit(black, Color::White, game.white));
            place(black, row, Match::Forfeit(white, Color::Black, game.black));
        }
    }

    for (auto& player : tournament.players) {
        const auto& player_slots = slots[static_cast<size_t>(player.id)];
        player.matches.reserve(player_slots.size());
        for (const auto& slot : player_slots) {
            player.matches.push_back(slot ? *slot : Match::Unpaired(player.id));
        }
    }

    tournament.Validate();
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return result;
}

PairingOutcome PairingService::GeneratePairings(const PairingRequest& request) {
    PairingOutcome outcome;
    auto fail = [this, &outcome](std::optional<PairingErrorKind> kind, const std::string& text) {
        outcome.success = false;
        outcome.error_kind = kind;
        outcome.error = text;
        outcome.records.clear();
        outcome.pairings.clear();
        outcome.pairing_listing.clear();
        outcome.trf.clear();
        Log("[pairing] Failed: " + text);
        return outcome;
    };

    Log("[pairing] Request tournament=" + request.tournament_id + " section=" + request.section +
        " system=" + request.system);

    std::string error;
    int round = request.round;
    if (round <= 0 && !NextRound(request.tournament_id, request.section, round, &error)) {
        return fail(std::nullopt, error);
    }
    outcome.round = round;

    std::vector<PlayerRow> player_rows;
    if (!store_.LoadPlayers(request.tournament_id, request.section, player_rows, &error)) {
        return fail(std::nullopt, error);
    }
    std::vector<PairingRow> pairing_rows;
    if (!store_.LoadPairings(request.tournament_id, request.section, round, pairing_rows, &error)) {
        return fail(std::nullopt, error);
    }
    {
        std::ostringstream line;
        line << "[pairing] Round " << round << ": " << player_rows.size() << " players, "
             << pairing_rows.size() << " stored pairings";
        Log(line.str());
    }

    try {
        auto system = pairing::CreatePairingSystem(request.system);
        auto built = BuildTournament(player_rows,
                                     pairing_rows,
                                     round,
                                     request.scoring,
                                     request.expected_rounds,
                                     request.initial_color);

        auto pairings = system->ComputeMatching(built.tournament);
        outcome.pairing_listing = trf::TrfWriter::WritePairingListing(pairings);
        for (int id : built.intentional_byes) {
            pairings.push_back(model::Pairing::ByeFor(id, model::ByeType::HalfPointBye));
        }

        int board = 0;
        int byes = 0;
        for (auto& pairing : pairings) {
            pairing.board = ++board;
            pairing.section = request.section;

            PairingRecord record;
            record.white_player_id = built.external_ids[static_cast<size_t>(pairing.white_id)];
            if (pairing.black_id) {
                record.black_player_id = built.external_ids[static_cast<size_t>(*pairing.black_id)];
            }
            record.is_bye = pairing.is_bye;
            if (pairing.is_bye) {
                record.bye_type = pairing.bye_type;
                ++byes;
            }
            record.board = pairing.board;
            record.section = request.section;
            record.round = round;
            outcome.records.push_back(std::move(record));
        }
        outcome.pairings = std::move(pairings);

        if (request.include_trf) {
            outcome.trf = trf::TrfWriter::WriteTournament(built.tournament, request.tournament_id);
        }

        std::ostringstream line;
        line << "[pairing] " << system->Name() << " produced " << outcome.records.size() - byes
             << " boards and " << byes << " byes";
        Log(line.str());
    } catch (const PairingError& ex) {
        return fail(ex.kind(), ex.what());
    } catch (const std::exception& ex) {
        return fail(std::nullopt, ex.what());
    }

    outcome.success = true;
    return outcome;
}

bool PairingService::PersistOutcome(const PairingRequest& request,
                                    const PairingOutcome& outcome,
                                    std::string* error) {
    if (!outcome.success) {
        if (error) {
            *error = "Refusing to persist a failed pairing: " + outcome.error;
        }
        return false;
    }
    std::vector<PairingRow> rows;
    rows.reserve(outcome.records.size());
    for (const auto& record : outcome.records) {
        PairingRow row;
        row.white_player_id = record.white_player_id;
        row.black_player_id = record.black_player_id;
        row.round = record.round;
        row.section = record.section;
        row.board = record.board;
        if (record.is_bye) {
            const auto type = record.bye_type.value_or(model::ByeType::Bye);
            row.result = ByeResultCode(type);
            row.bye_type = model::ByeTypeToString(type);
        }
        rows.push_back(std::move(row));
    }
    if (!store_.SavePairings(request.tournament_id, outcome.round, rows, error)) {
        return false;
    }
    Log("[pairing] Stored round " + std::to_string(outcome.round) + " (" +
        std::to_string(rows.size()) + " rows)");
    return true;
}

nlohmann::json PairingService::OutcomeToJson(const PairingOutcome& outcome) {
    nlohmann::json root;
    root["success"] = outcome.success;
    root["round"] = outcome.round;
    if (outcome.error_kind) {
        root["error_kind"] = model::PairingErrorKindToString(*outcome.error_kind);
    }
    if (!outcome.success) {
        root["error"] = outcome.error;
    }
    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : outcome.records) {
        nlohmann::json node = {
            {"white_player_id", record.white_player_id},
            {"black_player_id", nullptr},
            {"is_bye", record.is_bye},
            {"board", record.board},
            {"section", record.section},
        };
        if (record.black_player_id) {
            node["black_player_id"] = *record.black_player_id;
        }
        if (record.bye_type) {
            node["bye_type"] = model::ByeTypeToString(*record.bye_type);
        }
        records.push_back(std::move(node));
    }
    root["pairings"] = std::move(records);
    root["pairing_listing"] = outcome.pairing_listing;
    if (!outcome.trf.empty()) {
        root["trf"] = outcome.trf;
    }
    return root;
}

}  // namespace swisspair::core::api
