#pragma once

#include "swisspair/core/api/PairingStore.h"

#include <nlohmann/json.hpp>

#include <string>

namespace swisspair::core::api {

// Store document: {"tournaments": {"<id>": {"players": [...], "pairings": [...]}}}.
// Player and opponent ids may be written as numbers or strings.
class JsonPairingStore : public IPairingStore {
public:
    JsonPairingStore() = default;
    explicit JsonPairingStore(nlohmann::json document);

    bool Open(const std::string& path, std::string* error);

    bool LoadPlayers(const std::string& tournament_id,
                     const std::string& section,
                     std::vector<PlayerRow>& rows,
                     std::string* error) override;
    bool LoadPairings(const std::string& tournament_id,
                      const std::string& section,
                      int before_round,
                      std::vector<PairingRow>& rows,
                      std::string* error) override;
    bool SavePairings(const std::string& tournament_id,
                      int round,
                      const std::vector<PairingRow>& rows,
                      std::string* error) override;

    const nlohmann::json& document() const { return document_; }

private:
    const nlohmann::json* FindTournament(const std::string& tournament_id, std::string* error) const;

    std::string path_;
    nlohmann::json document_ = nlohmann::json::object();
};

}  // namespace swisspair::core::api
