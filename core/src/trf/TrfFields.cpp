#include "swisspair/core/trf/TrfFields.h"

#include "swisspair/core/model/PairingError.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace swisspair::core::trf {

namespace {

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(' ');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(' ');
    return text.substr(first, last - first + 1);
}

}  // namespace

std::string ExtractField(const std::string& line, const TrfField& field, size_t base) {
    const size_t start = base + field.offset;
    if (line.size() <= start) {
        return {};
    }
    return Trim(line.substr(start, field.width));
}

void PlaceField(std::string& line, const TrfField& field, const std::string& value, size_t base) {
    if (value.size() > field.width) {
        throw model::PairingError(model::PairingErrorKind::FormatLimit,
                                  std::string("Value '") + value + "' does not fit the " +
                                      field.name + " field (" + std::to_string(field.width) +
                                      " columns)");
    }
    const size_t start = base + field.offset;
    if (line.size() < start + field.width) {
        line.resize(start + field.width, ' ');
    }
    const std::string padding(field.width - value.size(), field.fill);
    const std::string text = field.align == Align::Right ? padding + value : value + padding;
    line.replace(start, field.width, text);
}

int ParseIntField(const std::string& line, const TrfField& field, size_t base) {
    const std::string text = ExtractField(line, field, base);
    if (text.empty()) {
        return 0;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw model::PairingError(model::PairingErrorKind::Parse,
                                      std::string("Invalid ") + field.name + " '" + text + "'");
        }
    }
    if (text.size() > 9) {
        throw model::PairingError(model::PairingErrorKind::Parse,
                                  std::string("Out of range ") + field.name + " '" + text + "'");
    }
    return std::atoi(text.c_str());
}

std::string FormatTenths(int tenths) {
    const int magnitude = std::abs(tenths);
    std::string text = std::to_string(magnitude / 10) + "." + std::to_string(magnitude % 10);
    return tenths < 0 ? "-" + text : text;
}

bool ParseTenths(const std::string& text, bool integer_is_tenths, int& tenths) {
    const std::string value = Trim(text);
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    const bool has_point = value.find('.') != std::string::npos;
    const double scaled = has_point || !integer_is_tenths ? parsed * 10.0 : parsed;
    tenths = static_cast<int>(std::lround(scaled));
    return true;
}

}  // namespace swisspair::core::trf
