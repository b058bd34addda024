#pragma once

#include "swisspair/core/model/Tournament.h"

#include <string>

namespace swisspair::core::api {

struct StoreConfig {
    std::string path = "swisspair_store.json";
};

struct TournamentConfig {
    std::string id;
    std::string section = "Open";
    // Expected total rounds; 0 when unknown.
    int rounds = 0;
    // Round to pair; 0 pairs the round after the last stored one.
    int round = 0;
    std::string system = "dutch";
    std::string initial_color = "white";
};

// Points, not tenths.
struct ScoringConfig {
    double win = 1.0;
    double draw = 0.5;
    double loss = 0.0;
    double zero_point_bye = 0.0;
    double forfeit_loss = 0.0;
    double pairing_allocated_bye = 1.0;

    model::ScoringTable ToScoringTable() const;
};

struct OutputConfig {
    std::string pairings_json;
    std::string trf;
    std::string trf_pairings;
    bool persist = false;
};

struct PairingConfig {
    StoreConfig store;
    TournamentConfig tournament;
    ScoringConfig scoring;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, PairingConfig& config, std::string* error);
    static bool LoadFromString(const std::string& text, PairingConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const PairingConfig& config, std::string* error);
    static std::string ToJsonString(const PairingConfig& config);

    // Empty when valid, otherwise the first problem found.
    std::string Validate() const;
};

}  // namespace swisspair::core::api
