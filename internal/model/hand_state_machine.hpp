#pragma once

#include <variant>

#include "internal/model/status.hpp"

namespace pokertable::model {

/*
  Hand lifecycle as an explicit transition function.

    PREFLOP -> FLOP -> TURN -> RIVER       (StreetDealt)
    any betting street -> INTER_HAND_WAIT  (HandCompleted: fold-out or showdown)
    INTER_HAND_WAIT -> ENDED               (InterHandResolved)

  ENDED is terminal. Any other pair is rejected with util::InvalidState.
*/

// Engine advanced to street_index (1 = flop, 2 = turn, 3 = river).
struct StreetDealt {
  int street_index = 0;
};

struct HandCompleted {};

struct InterHandResolved {};

using HandEvent = std::variant<StreetDealt, HandCompleted, InterHandResolved>;

HandStatus StatusForStreet(int street_index);

// Returns the status after `event`, throws util::InvalidState if illegal from `from`.
HandStatus Transition(HandStatus from, const HandEvent& event);

} // namespace pokertable::model
