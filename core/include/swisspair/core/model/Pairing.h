#pragma once

#include "swisspair/core/model/Types.h"

#include <optional>
#include <string>

namespace swisspair::core::model {

struct Pairing {
    int white_id = -1;
    std::optional<int> black_id;
    bool is_bye = false;
    ByeType bye_type = ByeType::Bye;
    int board = 0;
    std::string section;

    static Pairing Game(int white, int black) {
        Pairing pairing;
        pairing.white_id = white;
        pairing.black_id = black;
        return pairing;
    }

    static Pairing ByeFor(int player, ByeType type) {
        Pairing pairing;
        pairing.white_id = player;
        pairing.is_bye = true;
        pairing.bye_type = type;
        return pairing;
    }
};

}  // namespace swisspair::core::model
