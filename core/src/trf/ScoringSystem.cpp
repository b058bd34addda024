#include "swisspair/core/trf/ScoringSystem.h"

#include "swisspair/core/model/PairingError.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace swisspair::core::trf {

namespace {

const std::map<std::string, std::vector<std::string>>& Shortcuts() {
    static const std::map<std::string, std::vector<std::string>> shortcuts = {
        {"W", {"WW", "BW", "FW", "FPB"}},
        {"D", {"WD", "BD", "HPB"}},
    };
    return shortcuts;
}

int ToTenths(double points) {
    return static_cast<int>(std::lround(points * 10.0));
}

[[noreturn]] void ThrowParse(const std::string& message) {
    throw model::PairingError(model::PairingErrorKind::Parse, message);
}

}  // namespace

ScoringSystem::ScoringSystem()
    : points_{{"WW", 1.0},  {"BW", 1.0},  {"WD", 0.5},  {"BD", 0.5},  {"WL", 0.0},
              {"BL", 0.0},  {"ZPB", 0.0}, {"HPB", 0.5}, {"FPB", 1.0}, {"PAB", 1.0},
              {"FW", 1.0},  {"FL", 0.0},  {"W", 1.0},   {"D", 0.5}} {}

const std::vector<std::string>& ScoringSystem::Codes() {
    static const std::vector<std::string> codes = {"WW",  "BW",  "WD",  "BD",  "WL", "BL", "ZPB",
                                                   "HPB", "FPB", "PAB", "FW",  "FL", "W",  "D"};
    return codes;
}

bool ScoringSystem::IsKnownCode(const std::string& code) {
    const auto& codes = Codes();
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

double ScoringSystem::Points(const std::string& code) const {
    const auto it = points_.find(code);
    return it == points_.end() ? 0.0 : it->second;
}

void ScoringSystem::Set(const std::string& code, double points) {
    if (!IsKnownCode(code)) {
        ThrowParse("Unknown scoring code: " + code);
    }
    points_[code] = points;
    explicit_codes_.insert(code);

    const auto shortcut = Shortcuts().find(code);
    if (shortcut == Shortcuts().end()) {
        return;
    }
    for (const auto& covered : shortcut->second) {
        if (explicit_codes_.count(covered) == 0) {
            points_[covered] = points;
        }
    }
}

void ScoringSystem::ApplyXxsLine(const std::string& line) {
    std::istringstream input(line.size() > 3 ? line.substr(3) : std::string());
    std::vector<std::string> tokens;
    std::string token;
    while (input >> token) {
        const auto equals = token.find('=');
        if (equals == std::string::npos) {
            tokens.push_back(token);
        } else {
            tokens.push_back(token.substr(0, equals));
            tokens.push_back(token.substr(equals + 1));
        }
    }
    if (tokens.size() % 2 != 0) {
        ThrowParse("Unbalanced XXS line: " + line);
    }
    for (size_t i = 0; i < tokens.size(); i += 2) {
        char* end = nullptr;
        const double value = std::strtod(tokens[i + 1].c_str(), &end);
        if (tokens[i + 1].empty() || *end != '\0') {
            ThrowParse("Invalid XXS value '" + tokens[i + 1] + "' for " + tokens[i]);
        }
        Set(tokens[i], value);
    }
}

bool ScoringSystem::IsDefault() const {
    return ToScoringTable().IsDefault() && points_ == ScoringSystem{}.points_;
}

model::ScoringTable ScoringSystem::ToScoringTable() const {
    model::ScoringTable table;
    table.win = ToTenths(Points("WW"));
    table.draw = ToTenths(Points("WD"));
    table.loss = ToTenths(Points("WL"));
    table.zero_point_bye = ToTenths(Points("ZPB"));
    table.forfeit_loss = ToTenths(Points("FL"));
    table.pairing_allocated_bye = ToTenths(Points("PAB"));
    return table;
}

ScoringSystem ScoringSystem::FromScoringTable(const model::ScoringTable& table) {
    ScoringSystem system;
    system.Set("W", table.win / 10.0);
    system.Set("D", table.draw / 10.0);
    system.Set("WL", table.loss / 10.0);
    system.Set("BL", table.loss / 10.0);
    system.Set("ZPB", table.zero_point_bye / 10.0);
    system.Set("FL", table.forfeit_loss / 10.0);
    system.Set("PAB", table.pairing_allocated_bye / 10.0);
    return system;
}

}  // namespace swisspair::core::trf
