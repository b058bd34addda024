#include "swisspair/core/model/Types.h"
#include "swisspair/core/model/PairingError.h"

#include <algorithm>
#include <cctype>

namespace swisspair::core::model {

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

}  // namespace

std::string ColorToString(Color color) {
    switch (color) {
        case Color::White:
            return "white";
        case Color::Black:
            return "black";
        case Color::None:
            break;
    }
    return "none";
}

bool ParseColor(const std::string& value, Color& out) {
    const std::string lower = Lower(value);
    if (lower == "white" || lower == "w") {
        out = Color::White;
        return true;
    }
    if (lower == "black" || lower == "b") {
        out = Color::Black;
        return true;
    }
    if (lower == "none" || lower.empty()) {
        out = Color::None;
        return true;
    }
    return false;
}

std::string ByeTypeToString(ByeType type) {
    switch (type) {
        case ByeType::Bye:
            return "bye";
        case ByeType::HalfPointBye:
            return "half_point_bye";
        case ByeType::Unpaired:
            return "unpaired";
    }
    return "bye";
}

bool ParseByeType(const std::string& value, ByeType& out) {
    const std::string lower = Lower(value);
    if (lower == "bye") {
        out = ByeType::Bye;
    } else if (lower == "half_point_bye") {
        out = ByeType::HalfPointBye;
    } else if (lower == "unpaired") {
        out = ByeType::Unpaired;
    } else {
        return false;
    }
    return true;
}

std::string PairingErrorKindToString(PairingErrorKind kind) {
    switch (kind) {
        case PairingErrorKind::Unsatisfiable:
            return "unsatisfiable";
        case PairingErrorKind::FormatLimit:
            return "format_limit";
        case PairingErrorKind::MalformedHistory:
            return "malformed_history";
        case PairingErrorKind::Parse:
            return "parse";
        case PairingErrorKind::Configuration:
            return "configuration";
    }
    return "unknown";
}

}  // namespace swisspair::core::model
