#include "swisspair/core/util/ByeRounds.h"

#include <cctype>
#include <cmath>
#include <set>

namespace swisspair::core::util {

namespace {

void AddRound(double value, std::set<int>& rounds) {
    if (!std::isfinite(value)) {
        return;
    }
    const double round = std::trunc(value);
    if (round > 0 && round < 1e9) {
        rounds.insert(static_cast<int>(round));
    }
}

void AddDigitRuns(const std::string& text, std::set<int>& rounds) {
    size_t pos = 0;
    while (pos < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
            continue;
        }
        const size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const std::string digits = text.substr(start, pos - start);
        const bool negative = start > 0 && text[start - 1] == '-';
        if (!negative && digits.size() <= 9) {
            AddRound(std::stod(digits), rounds);
        }
    }
}

void Collect(const nlohmann::json& value, std::set<int>& rounds) {
    if (value.is_array()) {
        for (const auto& item : value) {
            Collect(item, rounds);
        }
        return;
    }
    if (value.is_number()) {
        AddRound(value.get<double>(), rounds);
        return;
    }
    if (!value.is_string()) {
        return;
    }

    const std::string text = value.get<std::string>();
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return;
    }
    const auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_discarded()) {
        Collect(parsed, rounds);
        return;
    }
    AddDigitRuns(text, rounds);
}

}  // namespace

std::vector<int> NormalizeByeRounds(const nlohmann::json& value) {
    std::set<int> rounds;
    Collect(value, rounds);
    return {rounds.begin(), rounds.end()};
}

}  // namespace swisspair::core::util
