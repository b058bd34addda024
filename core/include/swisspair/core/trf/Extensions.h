#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace swisspair::core::trf {

// The XX* extension lines of a TRF16 file, read once. Player ids are the
// 1-based ids of the file.
class Extensions {
public:
    // Throws PairingError(Parse) naming the offending line.
    static Extensions Parse(const std::vector<std::string>& lines);

    const std::optional<int>& total_rounds() const { return total_rounds_; }
    const std::vector<int>& absent_players() const { return absent_players_; }
    const std::vector<std::pair<int, int>>& forbidden_pairs() const { return forbidden_pairs_; }
    // Acceleration per round in tenths of a point.
    const std::map<int, std::vector<int>>& accelerations() const { return accelerations_; }
    const std::string& checklist() const { return checklist_; }
    const std::string& build() const { return build_; }
    const std::string& release() const { return release_; }

private:
    std::optional<int> total_rounds_;
    std::vector<int> absent_players_;
    std::vector<std::pair<int, int>> forbidden_pairs_;
    std::map<int, std::vector<int>> accelerations_;
    std::string checklist_;
    std::string build_;
    std::string release_;
};

}  // namespace swisspair::core::trf
