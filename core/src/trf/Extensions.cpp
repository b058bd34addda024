#include "swisspair/core/trf/Extensions.h"

#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/trf/TrfFields.h"

#include <cctype>
#include <sstream>

namespace swisspair::core::trf {

namespace {

[[noreturn]] void ThrowParse(size_t line_number, const std::string& line, const std::string& what) {
    std::ostringstream message;
    message << "Line " << line_number << ": " << what << ": '" << line << "'";
    throw model::PairingError(model::PairingErrorKind::Parse, message.str());
}

std::vector<std::string> Tokens(const std::string& line) {
    std::istringstream input(line.size() > 3 ? line.substr(3) : std::string());
    std::vector<std::string> tokens;
    std::string token;
    while (input >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool ParsePositive(const std::string& text, int& value) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    value = std::stoi(text);
    return value > 0;
}

std::string Rest(const std::string& line) {
    const auto start = line.find_first_not_of(' ', 3);
    return start == std::string::npos ? std::string() : line.substr(start);
}

}  // namespace

Extensions Extensions::Parse(const std::vector<std::string>& lines) {
    Extensions extensions;
    for (size_t index = 0; index < lines.size(); ++index) {
        const std::string& line = lines[index];
        const size_t line_number = index + 1;
        if (line.compare(0, 2, "XX") != 0 || line.size() < 3) {
            continue;
        }
        const std::string tag = line.substr(0, 3);
        if (tag == "XXR") {
            const auto tokens = Tokens(line);
            int rounds = 0;
            if (tokens.empty() || !ParsePositive(tokens.front(), rounds)) {
                ThrowParse(line_number, line, "invalid round count");
            }
            extensions.total_rounds_ = rounds;
        } else if (tag == "XXZ") {
            for (const auto& token : Tokens(line)) {
                int id = 0;
                if (!ParsePositive(token, id)) {
                    ThrowParse(line_number, line, "invalid absent player id");
                }
                extensions.absent_players_.push_back(id);
            }
        } else if (tag == "XXF") {
            const auto tokens = Tokens(line);
            std::vector<int> ids;
            for (const auto& token : tokens) {
                int id = 0;
                if (!ParsePositive(token, id)) {
                    ThrowParse(line_number, line, "invalid forbidden pair id");
                }
                ids.push_back(id);
            }
            if (ids.size() < 2) {
                ThrowParse(line_number, line, "forbidden pair needs two ids");
            }
            for (size_t i = 1; i < ids.size(); ++i) {
                extensions.forbidden_pairs_.emplace_back(ids.front(), ids[i]);
            }
        } else if (tag == "XXA") {
            int id = 0;
            if (!ParsePositive(ExtractField(line, fields::kAccelerationId), id)) {
                ThrowParse(line_number, line, "invalid acceleration player id");
            }
            std::vector<int> values;
            for (size_t offset = fields::kAccelerationOffset; offset < line.size();
                 offset += fields::kAccelerationWidth) {
                const std::string chunk = line.substr(offset, fields::kAccelerationWidth);
                int tenths = 0;
                if (chunk.find_first_not_of(' ') != std::string::npos &&
                    !ParseTenths(chunk, false, tenths)) {
                    ThrowParse(line_number, line, "invalid acceleration value");
                }
                values.push_back(tenths);
            }
            extensions.accelerations_[id] = std::move(values);
        } else if (tag == "XXC") {
            extensions.checklist_ = Rest(line);
        } else if (tag == "XXB") {
            extensions.build_ = Rest(line);
        } else if (tag == "XXV") {
            extensions.release_ = Rest(line);
        }
    }
    return extensions;
}

}  // namespace swisspair::core::trf
