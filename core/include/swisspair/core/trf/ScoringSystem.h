#pragma once

#include "swisspair/core/model/Tournament.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace swisspair::core::trf {

// The XXS point codes: WW BW WD BD WL BL ZPB HPB FPB PAB FW FL and the
// shortcuts W (WW BW FW FPB) and D (WD BD HPB). Values are in points.
class ScoringSystem {
public:
    ScoringSystem();

    static const std::vector<std::string>& Codes();
    static bool IsKnownCode(const std::string& code);

    double Points(const std::string& code) const;
    // Throws PairingError(Parse) for an unknown code.
    void Set(const std::string& code, double points);

    // "XXS WW=1 BW=1 D=0.5" or "XXS WW 1 BW 1"; throws PairingError(Parse).
    void ApplyXxsLine(const std::string& line);

    bool IsDefault() const;
    model::ScoringTable ToScoringTable() const;
    static ScoringSystem FromScoringTable(const model::ScoringTable& table);

private:
    std::map<std::string, double> points_;
    std::set<std::string> explicit_codes_;
};

}  // namespace swisspair::core::trf
