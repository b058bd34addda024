#include "swisspair/core/trf/TrfWriter.h"

#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/trf/TrfFields.h"

#include <sstream>

namespace swisspair::core::trf {

namespace {

[[noreturn]] void ThrowFormatLimit(const std::string& message) {
    throw model::PairingError(model::PairingErrorKind::FormatLimit, message);
}

void CheckPoints(int tenths, const std::string& what) {
    if (tenths > kMaxPoints) {
        ThrowFormatLimit("The output file format does not support scores above 99.9 (" + what +
                         " is " + FormatTenths(tenths) + ")");
    }
}

std::string ScoringLine(const char* tag, int value) {
    std::string line = std::string(tag) + " ";
    PlaceField(line, fields::kScoringValue, std::to_string(value));
    return line;
}

char ColorCode(model::Color color) {
    switch (color) {
        case model::Color::White:
            return 'w';
        case model::Color::Black:
            return 'b';
        case model::Color::None:
            break;
    }
    return '-';
}

char ResultCode(const model::Match& match) {
    if (match.game_was_played) {
        switch (match.score) {
            case model::MatchScore::Win:
                return '1';
            case model::MatchScore::Draw:
                return '=';
            case model::MatchScore::Loss:
                break;
        }
        return '0';
    }
    switch (match.score) {
        case model::MatchScore::Win:
            return '+';
        case model::MatchScore::Draw:
            return 'D';
        case model::MatchScore::Loss:
            break;
    }
    return '-';
}

char ByeCode(const model::Match& match) {
    if (match.score == model::MatchScore::Win) {
        return match.participated_in_pairing ? 'U' : 'F';
    }
    if (match.score == model::MatchScore::Draw) {
        return 'H';
    }
    return 'Z';
}

}  // namespace

std::string TrfWriter::FormatGame(const model::Player& player, const model::Match& match) {
    std::string block(fields::kGameWidth, ' ');
    if (match.IsBye(player.id)) {
        PlaceField(block, fields::kGameOpponent, "0000");
        PlaceField(block, fields::kGameColor, "-");
        PlaceField(block, fields::kGameResult, std::string(1, ByeCode(match)));
        return block;
    }
    if (match.opponent + 1 > kMaxId) {
        ThrowFormatLimit("The output file format only supports player IDs up to 9999 (opponent " +
                         std::to_string(match.opponent + 1) + ")");
    }
    PlaceField(block, fields::kGameOpponent, std::to_string(match.opponent + 1));
    PlaceField(block, fields::kGameColor, std::string(1, ColorCode(match.color)));
    PlaceField(block, fields::kGameResult, std::string(1, ResultCode(match)));
    return block;
}

std::string TrfWriter::FormatPlayerLine(const model::Player& player, int rank) {
    const int id = player.id + 1;
    if (id > kMaxId) {
        ThrowFormatLimit("The output file format only supports player IDs up to 9999 (player " +
                         std::to_string(id) + ")");
    }
    if (player.rating > kMaxRating || player.rating < 0) {
        ThrowFormatLimit("The output file format only supports ratings up to 9999 (player " +
                         std::to_string(id) + " has " + std::to_string(player.rating) + ")");
    }
    CheckPoints(player.score_without_acceleration, "player " + std::to_string(id));

    std::string line;
    PlaceField(line, fields::kRecordType, "001");
    PlaceField(line, fields::kPlayerId, std::to_string(id));
    PlaceField(line, fields::kName, player.name.substr(0, fields::kName.width));
    PlaceField(line, fields::kFideId, std::to_string(id));
    PlaceField(line, fields::kTitle, "");
    PlaceField(line, fields::kPlayerIdRepeat, std::to_string(id));
    PlaceField(line, fields::kRating, std::to_string(player.rating));
    PlaceField(line, fields::kGutter, "");
    PlaceField(line, fields::kPoints, FormatTenths(player.score_without_acceleration));
    PlaceField(line, fields::kRank, std::to_string(rank + 1));
    for (const auto& match : player.matches) {
        line += FormatGame(player, match);
    }
    return line;
}

std::vector<std::string> TrfWriter::FormatScoringLines(const model::ScoringTable& scoring) {
    std::vector<std::string> lines;
    if (scoring.IsDefault()) {
        return lines;
    }
    CheckPoints(scoring.win, "the win score");
    CheckPoints(scoring.draw, "the draw score");
    CheckPoints(scoring.loss, "the loss score");
    CheckPoints(scoring.zero_point_bye, "the zero-point bye score");
    CheckPoints(scoring.forfeit_loss, "the forfeit loss score");
    CheckPoints(scoring.pairing_allocated_bye, "the pairing-allocated bye score");

    const bool losses_changed =
        scoring.loss != 0 || scoring.zero_point_bye != 0 || scoring.forfeit_loss != 0;
    if (scoring.win != 10 || scoring.draw != 5 || losses_changed) {
        lines.push_back(ScoringLine("BBW", scoring.win));
        lines.push_back(ScoringLine("BBD", scoring.draw));
    }
    if (losses_changed) {
        lines.push_back(ScoringLine("BBL", scoring.loss));
        lines.push_back(ScoringLine("BBZ", scoring.zero_point_bye));
        lines.push_back(ScoringLine("BBF", scoring.forfeit_loss));
    }
    if (scoring.win != scoring.pairing_allocated_bye) {
        lines.push_back(ScoringLine("BBU", scoring.pairing_allocated_bye));
    }
    return lines;
}

std::string TrfWriter::WriteTournament(const model::Tournament& tournament,
                                       const std::string& tournament_name) {
    std::vector<std::string> lines;
    if (!tournament_name.empty()) {
        lines.push_back("012 " + tournament_name);
    }
    if (tournament.played_rounds < tournament.expected_rounds) {
        lines.push_back("XXR " + std::to_string(tournament.expected_rounds));
    }

    const auto ranks = tournament.ComputeRanks();
    for (const auto& player : tournament.players) {
        if (player.is_valid) {
            lines.push_back(FormatPlayerLine(player, ranks[static_cast<size_t>(player.id)]));
        }
    }
    lines.push_back("");

    const auto scoring_lines = FormatScoringLines(tournament.scoring);
    if (!scoring_lines.empty()) {
        lines.insert(lines.end(), scoring_lines.begin(), scoring_lines.end());
        lines.push_back("");
    }

    for (const auto& player : tournament.players) {
        if (!player.is_valid || player.accelerations.empty()) {
            continue;
        }
        std::string line = "XXA ";
        PlaceField(line, fields::kAccelerationId, std::to_string(player.id + 1));
        for (int acceleration : player.accelerations) {
            CheckPoints(acceleration, "acceleration of player " + std::to_string(player.id + 1));
            const std::string value = FormatTenths(acceleration);
            line += std::string(fields::kAccelerationWidth - value.size(), ' ') + value;
        }
        lines.push_back(line);
    }

    if (!tournament.absent_players.empty()) {
        std::string line = "XXZ";
        for (int id : tournament.absent_players) {
            line += " " + std::to_string(id + 1);
        }
        lines.push_back(line);
    }
    for (const auto& pair : tournament.forbidden_pairs) {
        lines.push_back("XXF " + std::to_string(pair.first + 1) + " " +
                        std::to_string(pair.second + 1));
    }

    std::string text;
    for (const auto& line : lines) {
        text += line;
        text += "\r\n";
    }
    return text;
}

std::string TrfWriter::WritePairingListing(const std::vector<model::Pairing>& pairings) {
    std::ostringstream out;
    out << pairings.size() << '\n';
    for (const auto& pairing : pairings) {
        out << pairing.white_id + 1 << ' '
            << (pairing.is_bye || !pairing.black_id ? 0 : *pairing.black_id + 1) << '\n';
    }
    return out.str();
}

std::vector<model::Pairing> ParsePairingListing(const std::string& text) {
    std::istringstream input(text);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            lines.push_back(line);
        }
    }
    if (lines.empty()) {
        throw model::PairingError(model::PairingErrorKind::Parse, "Empty pairing listing");
    }

    const auto read_ints = [](const std::string& source, std::vector<long long>& values) {
        std::istringstream stream(source);
        long long value = 0;
        while (stream >> value) {
            values.push_back(value);
        }
        return stream.eof();
    };

    std::vector<long long> header;
    if (!read_ints(lines.front(), header) || header.size() != 1 || header.front() < 0) {
        throw model::PairingError(model::PairingErrorKind::Parse,
                                  "Invalid pair count line: '" + lines.front() + "'");
    }
    if (static_cast<size_t>(header.front()) != lines.size() - 1) {
        throw model::PairingError(model::PairingErrorKind::Parse,
                                  "Pair count " + std::to_string(header.front()) + " does not match " +
                                      std::to_string(lines.size() - 1) + " listed pairs");
    }

    std::vector<model::Pairing> pairings;
    for (size_t index = 1; index < lines.size(); ++index) {
        std::vector<long long> ids;
        if (!read_ints(lines[index], ids) || ids.size() != 2 || ids[0] <= 0 || ids[1] < 0 ||
            ids[0] > kMaxId || ids[1] > kMaxId || ids[0] == ids[1]) {
            throw model::PairingError(model::PairingErrorKind::Parse,
                                      "Invalid pairing line " + std::to_string(index + 1) + ": '" +
                                          lines[index] + "'");
        }
        const int white = static_cast<int>(ids[0]) - 1;
        if (ids[1] == 0) {
            pairings.push_back(model::Pairing::ByeFor(white, model::ByeType::Bye));
        } else {
            pairings.push_back(model::Pairing::Game(white, static_cast<int>(ids[1]) - 1));
        }
    }
    return pairings;
}

}  // namespace swisspair::core::trf
