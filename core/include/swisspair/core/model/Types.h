#pragma once

#include <string>

namespace swisspair::core::model {

enum class Color {
    White,
    Black,
    None
};

enum class MatchScore {
    Loss,
    Draw,
    Win
};

enum class ByeType {
    Bye,
    HalfPointBye,
    Unpaired
};

inline Color InvertColor(Color color) {
    if (color == Color::White) {
        return Color::Black;
    }
    if (color == Color::Black) {
        return Color::White;
    }
    return Color::None;
}

inline MatchScore InvertMatchScore(MatchScore score) {
    if (score == MatchScore::Loss) {
        return MatchScore::Win;
    }
    if (score == MatchScore::Win) {
        return MatchScore::Loss;
    }
    return MatchScore::Draw;
}

std::string ColorToString(Color color);
bool ParseColor(const std::string& value, Color& out);
std::string ByeTypeToString(ByeType type);
bool ParseByeType(const std::string& value, ByeType& out);

}  // namespace swisspair::core::model
