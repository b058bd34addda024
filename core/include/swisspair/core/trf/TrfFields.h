#pragma once

#include <cstddef>
#include <string>

namespace swisspair::core::trf {

enum class Align {
    Left,
    Right
};

// One fixed-width column of a TRF16 line.
struct TrfField {
    const char* name;
    size_t offset;
    size_t width;
    Align align;
    char fill;
};

namespace fields {

// Player line ("001").
constexpr TrfField kRecordType{"record type", 0, 4, Align::Left, ' '};
constexpr TrfField kPlayerId{"player id", 4, 4, Align::Right, ' '};
constexpr TrfField kName{"name", 8, 10, Align::Left, ' '};
constexpr TrfField kFideId{"fide id", 18, 4, Align::Right, '0'};
constexpr TrfField kTitle{"title", 22, 4, Align::Left, ' '};
constexpr TrfField kPlayerIdRepeat{"player id (repeated)", 26, 4, Align::Right, ' '};
constexpr TrfField kRating{"rating", 30, 19, Align::Right, ' '};
constexpr TrfField kGutter{"gutter", 49, 28, Align::Left, ' '};
constexpr TrfField kPoints{"points", 77, 4, Align::Right, ' '};
constexpr TrfField kRank{"rank", 81, 5, Align::Right, ' '};

constexpr size_t kGamesOffset = 86;
constexpr size_t kGameWidth = 10;

// Inside one game block, relative to the block start.
constexpr TrfField kGameOpponent{"opponent", 2, 4, Align::Right, ' '};
constexpr TrfField kGameColor{"color", 7, 1, Align::Left, ' '};
constexpr TrfField kGameResult{"result", 9, 1, Align::Left, ' '};

// XXA acceleration line.
constexpr TrfField kAccelerationId{"acceleration player id", 4, 4, Align::Right, ' '};
constexpr size_t kAccelerationOffset = 8;
constexpr size_t kAccelerationWidth = 5;

// BBW / BBD / BBL / BBZ / BBF / BBU scoring lines.
constexpr TrfField kScoringValue{"scoring value", 4, 4, Align::Right, ' '};

}  // namespace fields

constexpr int kMaxId = 9999;
constexpr int kMaxRating = 9999;
// Tenths of a point.
constexpr int kMaxPoints = 999;

// Trimmed text of the field; empty when the line is too short.
std::string ExtractField(const std::string& line, const TrfField& field, size_t base = 0);

// Writes the value padded to the field width; a value wider than the field
// throws PairingError(FormatLimit).
void PlaceField(std::string& line, const TrfField& field, const std::string& value, size_t base = 0);

// Parses an integer field; throws PairingError(Parse) naming the field.
int ParseIntField(const std::string& line, const TrfField& field, size_t base = 0);

// "1.5" style text for a value in tenths.
std::string FormatTenths(int tenths);
// Accepts "1.5", "15" (tenths when integer_is_tenths) or "1".
bool ParseTenths(const std::string& text, bool integer_is_tenths, int& tenths);

}  // namespace swisspair::core::trf
