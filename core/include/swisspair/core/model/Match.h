#pragma once

#include "swisspair/core/model/Types.h"

namespace swisspair::core::model {

// One round of a player's history. A bye or an unpaired round points the
// opponent back at the player itself.
struct Match {
    int opponent = -1;
    Color color = Color::None;
    MatchScore score = MatchScore::Loss;
    bool game_was_played = false;
    bool participated_in_pairing = false;

    static Match Played(int opponent, Color color, MatchScore score) {
        return Match{opponent, color, score, true, true};
    }

    static Match Forfeit(int opponent, Color color, MatchScore score) {
        return Match{opponent, color, score, false, true};
    }

    static Match PairingAllocatedBye(int self) {
        return Match{self, Color::None, MatchScore::Win, false, true};
    }

    static Match Unpaired(int self, MatchScore score = MatchScore::Loss) {
        return Match{self, Color::None, score, false, false};
    }

    bool IsBye(int self) const { return opponent == self; }

    bool operator==(const Match& other) const {
        return opponent == other.opponent && color == other.color && score == other.score &&
               game_was_played == other.game_was_played &&
               participated_in_pairing == other.participated_in_pairing;
    }
    bool operator!=(const Match& other) const { return !(*this == other); }
};

}  // namespace swisspair::core::model
