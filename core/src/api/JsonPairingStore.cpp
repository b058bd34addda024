#include "swisspair/core/api/JsonPairingStore.h"

#include "swisspair/core/util/AtomicFileWriter.h"

#include <algorithm>
#include <fstream>
#include <utility>

namespace swisspair::core::api {

namespace {

std::string IdToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number()) {
        return std::to_string(static_cast<long long>(value.get<double>()));
    }
    return {};
}

std::optional<std::string> OptionalString(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    const auto& value = node.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return IdToString(value);
}

std::string SectionOf(const nlohmann::json& node) {
    return node.value("section", std::string{});
}

bool SectionMatches(const nlohmann::json& node, const std::string& section) {
    const std::string row_section = SectionOf(node);
    return section.empty() || row_section.empty() || row_section == section;
}

}  // namespace

JsonPairingStore::JsonPairingStore(nlohmann::json document) : document_(std::move(document)) {}

bool JsonPairingStore::Open(const std::string& path, std::string* error) {
    path_ = path;
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open store: " + path;
        }
        return false;
    }
    try {
        input >> document_;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse store ") + path + ": " + ex.what();
        }
        return false;
    }
    if (!document_.is_object()) {
        if (error) {
            *error = "Store root must be an object: " + path;
        }
        return false;
    }
    return true;
}

const nlohmann::json* JsonPairingStore::FindTournament(const std::string& tournament_id,
                                                       std::string* error) const {
    const auto tournaments = document_.find("tournaments");
    if (tournaments == document_.end() || !tournaments->is_object()) {
        if (error) {
            *error = "Store has no tournaments";
        }
        return nullptr;
    }
    const auto tournament = tournaments->find(tournament_id);
    if (tournament == tournaments->end()) {
        if (error) {
            *error = "Unknown tournament: " + tournament_id;
        }
        return nullptr;
    }
    return &*tournament;
}

bool JsonPairingStore::LoadPlayers(const std::string& tournament_id,
                                   const std::string& section,
                                   std::vector<PlayerRow>& rows,
                                   std::string* error) {
    rows.clear();
    const nlohmann::json* tournament = FindTournament(tournament_id, error);
    if (!tournament) {
        return false;
    }
    try {
        for (const auto& node : tournament->value("players", nlohmann::json::array())) {
            if (!SectionMatches(node, section)) {
                continue;
            }
            PlayerRow row;
            row.id = IdToString(node.at("id"));
            row.name = node.value("name", row.name);
            row.rating = node.value("rating", row.rating);
            row.status = node.value("status", row.status);
            row.section = SectionOf(node);
            if (node.contains("intentional_bye_rounds")) {
                row.intentional_bye_rounds = node.at("intentional_bye_rounds");
            }
            rows.push_back(std::move(row));
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = "Invalid player row in tournament " + tournament_id + ": " + ex.what();
        }
        rows.clear();
        return false;
    }
    return true;
}

bool JsonPairingStore::LoadPairings(const std::string& tournament_id,
                                    const std::string& section,
                                    int before_round,
                                    std::vector<PairingRow>& rows,
                                    std::string* error) {
    rows.clear();
    const nlohmann::json* tournament = FindTournament(tournament_id, error);
    if (!tournament) {
        return false;
    }
    try {
        for (const auto& node : tournament->value("pairings", nlohmann::json::array())) {
            if (!SectionMatches(node, section)) {
                continue;
            }
            PairingRow row;
            row.round = node.at("round").get<int>();
            if (row.round >= before_round) {
                continue;
            }
            row.white_player_id = IdToString(node.at("white_player_id"));
            row.black_player_id = OptionalString(node, "black_player_id");
            row.result = OptionalString(node, "result");
            row.section = SectionOf(node);
            row.board = node.value("board", row.board);
            row.bye_type = OptionalString(node, "bye_type");
            rows.push_back(std::move(row));
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = "Invalid pairing row in tournament " + tournament_id + ": " + ex.what();
        }
        rows.clear();
        return false;
    }
    std::stable_sort(rows.begin(), rows.end(), [](const PairingRow& a, const PairingRow& b) {
        if (a.round != b.round) {
            return a.round < b.round;
        }
        return a.board < b.board;
    });
    return true;
}

bool JsonPairingStore::SavePairings(const std::string& tournament_id,
                                    int round,
                                    const std::vector<PairingRow>& rows,
                                    std::string* error) {
    auto& tournament = document_["tournaments"][tournament_id];
    if (!tournament.is_object()) {
        tournament = nlohmann::json::object();
    }
    auto& pairings = tournament["pairings"];
    if (!pairings.is_array()) {
        pairings = nlohmann::json::array();
    }

    std::vector<std::string> sections;
    for (const auto& row : rows) {
        sections.push_back(row.section);
    }
    nlohmann::json kept = nlohmann::json::array();
    for (const auto& node : pairings) {
        const bool same_round = node.value("round", 0) == round;
        const bool same_section =
            std::find(sections.begin(), sections.end(), SectionOf(node)) != sections.end();
        if (!(same_round && same_section)) {
            kept.push_back(node);
        }
    }

    for (const auto& row : rows) {
        nlohmann::json node = {
            {"white_player_id", row.white_player_id},
            {"black_player_id", nullptr},
            {"result", nullptr},
            {"round", row.round},
            {"section", row.section},
            {"board", row.board},
        };
        if (row.black_player_id) {
            node["black_player_id"] = *row.black_player_id;
        }
        if (row.result) {
            node["result"] = *row.result;
        }
        if (row.bye_type) {
            node["bye_type"] = *row.bye_type;
        }
        kept.push_back(std::move(node));
    }
    pairings = std::move(kept);

    if (path_.empty()) {
        return true;
    }
    return util::AtomicFileWriter::Write(path_, document_.dump(2), error);
}

}  // namespace swisspair::core::api
