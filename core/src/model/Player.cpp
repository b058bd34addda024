#include "swisspair/core/model/Player.h"

#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/model/Tournament.h"

#include <sstream>

namespace swisspair::core::model {

int Player::Acceleration(const Tournament& tournament, int rounds_back) const {
    const int round_index = tournament.played_rounds - rounds_back;
    if (round_index < 0 || round_index >= static_cast<int>(accelerations.size())) {
        return 0;
    }
    return accelerations[static_cast<size_t>(round_index)];
}

int Player::ScoreWithAcceleration(const Tournament& tournament, int rounds_back) const {
    int score = score_without_acceleration;
    int round_index = tournament.played_rounds;
    for (int back = rounds_back; back > 0; --back) {
        --round_index;
        if (round_index >= 0 && round_index < static_cast<int>(matches.size())) {
            score -= tournament.GetPoints(*this, matches[static_cast<size_t>(round_index)]);
        }
    }
    if (score < 0) {
        std::ostringstream message;
        message << "Player " << id + 1 << " has a negative score " << rounds_back
                << " round(s) back";
        throw PairingError(PairingErrorKind::MalformedHistory, message.str());
    }

    const int accelerated = score + Acceleration(tournament, rounds_back);
    if (accelerated < score) {
        std::ostringstream message;
        message << "Player " << id + 1 << " has an acceleration below zero for round "
                << tournament.played_rounds - rounds_back + 1;
        throw PairingError(PairingErrorKind::MalformedHistory, message.str());
    }
    return accelerated;
}

void Player::UpdateColorPreferences() {
    if (!is_valid) {
        return;
    }

    int games_as_white = 0;
    int games_as_black = 0;
    int consecutive = 0;
    Color last = Color::None;
    for (const auto& match : matches) {
        if (!match.game_was_played) {
            continue;
        }
        if (match.color == Color::White) {
            ++games_as_white;
        } else if (match.color == Color::Black) {
            ++games_as_black;
        }
        if (consecutive == 0 || match.color != last) {
            consecutive = 1;
        } else {
            ++consecutive;
        }
        last = match.color;
    }

    const Color lower_color = games_as_white > games_as_black ? Color::Black : Color::White;
    color_imbalance = lower_color == Color::Black ? games_as_white - games_as_black
                                                  : games_as_black - games_as_white;
    color_streak = consecutive;

    if (color_imbalance > 1) {
        color_preference = lower_color;
    } else if (consecutive > 1) {
        color_preference = InvertColor(last);
    } else if (color_imbalance > 0) {
        color_preference = lower_color;
    } else if (consecutive > 0) {
        color_preference = InvertColor(last);
    } else {
        color_preference = Color::None;
    }

    repeated_color = consecutive > 1 ? last : Color::None;
    strong_color_preference = !AbsoluteColorPreference() && color_imbalance != 0;
}

void Player::UpdateByeTracking() {
    if (!is_valid) {
        return;
    }

    bye_count = 0;
    half_point_bye_count = 0;
    full_bye_count = 0;
    bye_rounds.clear();

    for (size_t index = 0; index < matches.size(); ++index) {
        const auto& match = matches[index];
        if (match.game_was_played || !match.IsBye(id)) {
            continue;
        }
        if (!match.participated_in_pairing && match.score == MatchScore::Loss) {
            continue;
        }
        ++bye_count;
        bye_rounds.push_back(static_cast<int>(index) + 1);
        if (match.score == MatchScore::Win) {
            ++full_bye_count;
        } else if (match.score == MatchScore::Draw) {
            ++half_point_bye_count;
        }
    }
}

bool Player::IsEligibleForBye(int round) const {
    if (bye_count > 0) {
        return false;
    }
    return intentional_bye_rounds.count(round) == 0;
}

bool Player::IsEligibleForHalfPointBye() const {
    return full_bye_count == 1 && half_point_bye_count == 0;
}

int Player::ColorBalance() const {
    int balance = 0;
    for (const auto& match : matches) {
        if (!match.game_was_played) {
            continue;
        }
        if (match.color == Color::White) {
            ++balance;
        } else if (match.color == Color::Black) {
            --balance;
        }
    }
    return balance;
}

Color Player::LastTwoColors() const {
    Color last = Color::None;
    Color before_last = Color::None;
    for (const auto& match : matches) {
        if (!match.game_was_played) {
            continue;
        }
        before_last = last;
        last = match.color;
    }
    return last == before_last ? last : Color::None;
}

bool Player::HasPlayed(int opponent) const {
    for (const auto& match : matches) {
        if (match.opponent == opponent && !match.IsBye(id)) {
            return true;
        }
    }
    return false;
}

}  // namespace swisspair::core::model
