#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace swisspair::core::api {

struct PlayerRow {
    std::string id;
    std::string name;
    int rating = 0;
    std::string status = "active";
    std::string section;
    // Raw value as stored: array, number, JSON string or free text.
    nlohmann::json intentional_bye_rounds;
};

struct PairingRow {
    std::string white_player_id;
    std::optional<std::string> black_player_id;
    // "1-0", "0-1", "1/2-1/2", with an optional "F" suffix for forfeits.
    std::optional<std::string> result;
    int round = 0;
    std::string section;
    int board = 0;
    std::optional<std::string> bye_type;
};

class IPairingStore {
public:
    virtual ~IPairingStore() = default;

    virtual bool LoadPlayers(const std::string& tournament_id,
                             const std::string& section,
                             std::vector<PlayerRow>& rows,
                             std::string* error) = 0;

    // Every stored pairing of the section with round < before_round.
    virtual bool LoadPairings(const std::string& tournament_id,
                              const std::string& section,
                              int before_round,
                              std::vector<PairingRow>& rows,
                              std::string* error) = 0;

    // Replaces any rows already stored for the round and section.
    virtual bool SavePairings(const std::string& tournament_id,
                              int round,
                              const std::vector<PairingRow>& rows,
                              std::string* error) = 0;
};

}  // namespace swisspair::core::api
