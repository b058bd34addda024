#include "swisspair/core/api/PairingConfig.h"

#include "swisspair/core/pairing/PairingSystem.h"
#include "swisspair/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

namespace swisspair::core::api {

namespace {

bool LoadJson(const std::string& path, nlohmann::json& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    try {
        input >> config;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

int ToTenths(double points) {
    return static_cast<int>(std::lround(points * 10.0));
}

bool FromJson(const nlohmann::json& root, PairingConfig& config, std::string* error) {
    config = PairingConfig{};
    try {
        if (root.contains("store")) {
            const auto& node = root.at("store");
            config.store.path = node.value("path", config.store.path);
        }

        if (root.contains("tournament")) {
            const auto& node = root.at("tournament");
            config.tournament.id = node.value("id", config.tournament.id);
            config.tournament.section = node.value("section", config.tournament.section);
            config.tournament.rounds = node.value("rounds", config.tournament.rounds);
            config.tournament.round = node.value("round", config.tournament.round);
            config.tournament.system = node.value("system", config.tournament.system);
            config.tournament.initial_color =
                node.value("initial_color", config.tournament.initial_color);
        }

        if (root.contains("scoring")) {
            const auto& node = root.at("scoring");
            config.scoring.win = node.value("win", config.scoring.win);
            config.scoring.draw = node.value("draw", config.scoring.draw);
            config.scoring.loss = node.value("loss", config.scoring.loss);
            config.scoring.zero_point_bye = node.value("zero_point_bye", config.scoring.zero_point_bye);
            config.scoring.forfeit_loss = node.value("forfeit_loss", config.scoring.forfeit_loss);
            config.scoring.pairing_allocated_bye =
                node.value("pairing_allocated_bye", config.scoring.pairing_allocated_bye);
        }

        if (root.contains("output")) {
            const auto& node = root.at("output");
            config.output.pairings_json = node.value("pairings_json", config.output.pairings_json);
            config.output.trf = node.value("trf", config.output.trf);
            config.output.trf_pairings = node.value("trf_pairings", config.output.trf_pairings);
            config.output.persist = node.value("persist", config.output.persist);
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }

    const std::string problem = config.Validate();
    if (!problem.empty()) {
        if (error) {
            *error = problem;
        }
        return false;
    }
    return true;
}

}  // namespace

model::ScoringTable ScoringConfig::ToScoringTable() const {
    model::ScoringTable table;
    table.win = ToTenths(win);
    table.draw = ToTenths(draw);
    table.loss = ToTenths(loss);
    table.zero_point_bye = ToTenths(zero_point_bye);
    table.forfeit_loss = ToTenths(forfeit_loss);
    table.pairing_allocated_bye = ToTenths(pairing_allocated_bye);
    return table;
}

std::string PairingConfig::Validate() const {
    if (tournament.id.empty()) {
        return "tournament.id is required";
    }
    if (tournament.rounds < 0) {
        return "tournament.rounds must not be negative";
    }
    if (tournament.round < 0) {
        return "tournament.round must not be negative";
    }
    std::string system = tournament.system;
    std::transform(system.begin(), system.end(), system.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto systems = pairing::AvailablePairingSystems();
    if (std::find(systems.begin(), systems.end(), system) == systems.end()) {
        return "Unknown pairing system: " + tournament.system;
    }
    model::Color color = model::Color::None;
    if (!model::ParseColor(tournament.initial_color, color) || color == model::Color::None) {
        return "tournament.initial_color must be white or black";
    }
    return {};
}

bool PairingConfig::LoadFromFile(const std::string& path, PairingConfig& config, std::string* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }
    return FromJson(root, config, error);
}

bool PairingConfig::LoadFromString(const std::string& text, PairingConfig& config, std::string* error) {
    const auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        if (error) {
            *error = "Failed to parse JSON config";
        }
        return false;
    }
    return FromJson(root, config, error);
}

std::string PairingConfig::ToJsonString(const PairingConfig& config) {
    nlohmann::json root;
    root["store"] = {
        {"path", config.store.path},
    };
    root["tournament"] = {
        {"id", config.tournament.id},
        {"section", config.tournament.section},
        {"rounds", config.tournament.rounds},
        {"round", config.tournament.round},
        {"system", config.tournament.system},
        {"initial_color", config.tournament.initial_color},
    };
    root["scoring"] = {
        {"win", config.scoring.win},
        {"draw", config.scoring.draw},
        {"loss", config.scoring.loss},
        {"zero_point_bye", config.scoring.zero_point_bye},
        {"forfeit_loss", config.scoring.forfeit_loss},
        {"pairing_allocated_bye", config.scoring.pairing_allocated_bye},
    };
    root["output"] = {
        {"pairings_json", config.output.pairings_json},
        {"trf", config.output.trf},
        {"trf_pairings", config.output.trf_pairings},
        {"persist", config.output.persist},
    };
    return root.dump(2);
}

bool PairingConfig::SaveToFile(const std::string& path, const PairingConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, ToJsonString(config), error);
}

}  // namespace swisspair::core::api
