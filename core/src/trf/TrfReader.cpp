#include "swisspair/core/trf/TrfReader.h"

#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/trf/TrfFields.h"

#include <algorithm>
#include <map>
#include <sstream>

namespace swisspair::core::trf {

namespace {

struct ParsedPlayer {
    std::string name;
    int rating = 0;
    int file_rank = -1;
    std::vector<model::Match> matches;
};

[[noreturn]] void ThrowParse(size_t line_number, const std::string& line, const std::string& what) {
    std::ostringstream message;
    message << "Line " << line_number << ": " << what << ": '" << line << "'";
    throw model::PairingError(model::PairingErrorKind::Parse, message.str());
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(' ') == std::string::npos;
}

ParsedPlayer ParsePlayerLine(const std::string& line, size_t line_number, int& id) {
    if (line.size() < fields::kGamesOffset) {
        ThrowParse(line_number, line,
                   "player line shorter than " + std::to_string(fields::kGamesOffset) + " columns");
    }

    ParsedPlayer player;
    try {
        id = ParseIntField(line, fields::kPlayerId);
        player.rating = ParseIntField(line, fields::kRating);
        player.file_rank = ParseIntField(line, fields::kRank) - 1;
    } catch (const model::PairingError& ex) {
        ThrowParse(line_number, line, ex.what());
    }
    if (id <= 0) {
        ThrowParse(line_number, line, "missing player id");
    }
    player.name = ExtractField(line, fields::kName);

    const std::string points = ExtractField(line, fields::kPoints);
    int tenths = 0;
    if (!points.empty() && !ParseTenths(points, false, tenths)) {
        ThrowParse(line_number, line, "invalid points '" + points + "'");
    }

    std::vector<std::string> blocks;
    for (size_t offset = fields::kGamesOffset; offset < line.size(); offset += fields::kGameWidth) {
        blocks.push_back(line.substr(offset, fields::kGameWidth));
    }
    while (!blocks.empty() && IsBlank(blocks.back())) {
        blocks.pop_back();
    }
    for (const auto& block : blocks) {
        if (IsBlank(block)) {
            player.matches.push_back(model::Match::Unpaired(id - 1));
            continue;
        }
        if (block.size() < fields::kGameWidth) {
            ThrowParse(line_number, line, "truncated game block '" + block + "'");
        }
        player.matches.push_back(TrfReader::ParseGame(block, id - 1, line_number));
    }
    return player;
}

void ApplyScoringLine(const std::string& line, size_t line_number, model::ScoringTable& scoring) {
    const std::string tag = line.substr(0, 3);
    int tenths = 0;
    const std::string value = line.size() > 3 ? line.substr(3) : std::string();
    if (!ParseTenths(value, true, tenths)) {
        ThrowParse(line_number, line, "invalid scoring value");
    }
    if (tag == "BBW") {
        scoring.win = tenths;
    } else if (tag == "BBD") {
        scoring.draw = tenths;
    } else if (tag == "BBL") {
        scoring.loss = tenths;
    } else if (tag == "BBZ") {
        scoring.zero_point_bye = tenths;
    } else if (tag == "BBF") {
        scoring.forfeit_loss = tenths;
    } else if (tag == "BBU") {
        scoring.pairing_allocated_bye = tenths;
    }
}

bool IsScoringTag(const std::string& line) {
    static const char* const kTags[] = {"BBW", "BBD", "BBL", "BBZ", "BBF", "BBU"};
    return std::any_of(std::begin(kTags), std::end(kTags),
                       [&](const char* tag) { return line.compare(0, 3, tag) == 0; });
}

}  // namespace

model::Match TrfReader::ParseGame(const std::string& block, int self, size_t line_number) {
    int opponent = 0;
    try {
        opponent = ParseIntField(block, fields::kGameOpponent);
    } catch (const model::PairingError& ex) {
        ThrowParse(line_number, block, ex.what());
    }
    const char color_code = block[fields::kGameColor.offset];
    const char result_code = block[fields::kGameResult.offset];

    if (opponent == 0) {
        switch (result_code) {
            case 'U':
                return model::Match::PairingAllocatedBye(self);
            case 'F':
                return model::Match::Unpaired(self, model::MatchScore::Win);
            case 'H':
                return model::Match::Unpaired(self, model::MatchScore::Draw);
            case 'Z':
                return model::Match::Unpaired(self, model::MatchScore::Loss);
            default:
                ThrowParse(line_number, block, "unrecognized bye code");
        }
    }

    model::Color color = model::Color::None;
    if (color_code == 'w') {
        color = model::Color::White;
    } else if (color_code == 'b') {
        color = model::Color::Black;
    } else if (color_code != '-' && color_code != ' ') {
        ThrowParse(line_number, block, "unrecognized color code");
    }

    const int opponent_id = opponent - 1;
    if (opponent_id == self) {
        ThrowParse(line_number, block, "player paired against itself");
    }
    switch (result_code) {
        case '1':
        case '=':
        case '0': {
            if (color == model::Color::None) {
                ThrowParse(line_number, block, "played game without a color");
            }
            const model::MatchScore score = result_code == '1'   ? model::MatchScore::Win
                                            : result_code == '=' ? model::MatchScore::Draw
                                                                 : model::MatchScore::Loss;
            return model::Match::Played(opponent_id, color, score);
        }
        case '+':
        case 'W':
            return model::Match::Forfeit(opponent_id, color, model::MatchScore::Win);
        case 'D':
            return model::Match::Forfeit(opponent_id, color, model::MatchScore::Draw);
        case '-':
        case 'L':
            return model::Match::Forfeit(opponent_id, color, model::MatchScore::Loss);
        default:
            break;
    }
    ThrowParse(line_number, block, "unrecognized result code");
}

TrfDocument TrfReader::Parse(const std::string& text) {
    const std::vector<std::string> lines = SplitLines(text);

    TrfDocument document;
    document.extensions = Extensions::Parse(lines);

    std::map<int, ParsedPlayer> parsed;
    for (size_t index = 0; index < lines.size(); ++index) {
        const std::string& line = lines[index];
        const size_t line_number = index + 1;
        if (line.compare(0, 3, "012") == 0) {
            const auto start = line.find_first_not_of(' ', 3);
            document.tournament_name = start == std::string::npos ? std::string() : line.substr(start);
            while (!document.tournament_name.empty() && document.tournament_name.back() == ' ') {
                document.tournament_name.pop_back();
            }
        } else if (line.compare(0, 3, "XXS") == 0) {
            document.scoring_system.ApplyXxsLine(line);
        } else if (line.compare(0, 3, "001") == 0) {
            int id = 0;
            ParsedPlayer player = ParsePlayerLine(line, line_number, id);
            if (parsed.count(id) > 0) {
                ThrowParse(line_number, line, "duplicate player id " + std::to_string(id));
            }
            parsed.emplace(id, std::move(player));
        }
    }

    model::Tournament& tournament = document.tournament;
    tournament.scoring = document.scoring_system.ToScoringTable();
    for (size_t index = 0; index < lines.size(); ++index) {
        if (IsScoringTag(lines[index])) {
            ApplyScoringLine(lines[index], index + 1, tournament.scoring);
        }
    }

    const int max_id = parsed.empty() ? 0 : parsed.rbegin()->first;
    document.file_ranks.assign(static_cast<size_t>(max_id), -1);
    for (int id = 1; id <= max_id; ++id) {
        const auto it = parsed.find(id);
        if (it == parsed.end()) {
            tournament.AddPlayer("", 0).is_valid = false;
            continue;
        }
        model::Player& player = tournament.AddPlayer(it->second.name, it->second.rating);
        player.matches = std::move(it->second.matches);
        document.file_ranks[static_cast<size_t>(id - 1)] = it->second.file_rank;
        tournament.played_rounds =
            std::max(tournament.played_rounds, static_cast<int>(player.matches.size()));
    }
    for (auto& player : tournament.players) {
        if (!player.is_valid) {
            continue;
        }
        while (static_cast<int>(player.matches.size()) < tournament.played_rounds) {
            player.matches.push_back(model::Match::Unpaired(player.id));
        }
    }
    tournament.expected_rounds = document.extensions.total_rounds().value_or(0);

    const auto known = [&](int file_id) {
        const model::Player* player = tournament.FindPlayer(file_id - 1);
        return player != nullptr && player->is_valid;
    };
    for (const auto& entry : document.extensions.accelerations()) {
        if (!known(entry.first)) {
            throw model::PairingError(model::PairingErrorKind::Parse,
                                      "XXA line for unknown player " + std::to_string(entry.first));
        }
        tournament.players[static_cast<size_t>(entry.first - 1)].accelerations = entry.second;
    }
    for (int id : document.extensions.absent_players()) {
        if (!known(id)) {
            throw model::PairingError(model::PairingErrorKind::Parse,
                                      "XXZ names unknown player " + std::to_string(id));
        }
        tournament.absent_players.insert(id - 1);
    }
    for (const auto& pair : document.extensions.forbidden_pairs()) {
        if (!known(pair.first) || !known(pair.second)) {
            throw model::PairingError(model::PairingErrorKind::Parse,
                                      "XXF names unknown player " + std::to_string(pair.first) +
                                          " or " + std::to_string(pair.second));
        }
        tournament.forbidden_pairs.emplace_back(pair.first - 1, pair.second - 1);
    }

    tournament.Validate();
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return document;
}

}  // namespace swisspair::core::trf
