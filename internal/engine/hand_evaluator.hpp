#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "internal/engine/cards.hpp"

namespace pokertable::engine {

enum class HandCategory : int {
  kHighCard = 0,
  kPair,
  kTwoPair,
  kThreeOfAKind,
  kStraight,
  kFlush,
  kFullHouse,
  kFourOfAKind,
  kStraightFlush,
};

std::string_view CategoryName(HandCategory category);

/*
  A ranked five-card hand.

  `ranks` holds the tiebreak order (grouped cards first, then kickers, wheel
  straights rank the ace as 1). `cards` follows the same order.
*/
struct HandValue {
  HandCategory         category = HandCategory::kHighCard;
  std::array<int, 5>   ranks{};
  std::array<Card, 5>  cards{};

  // Totally ordered: a higher score is a stronger hand, equal scores split.
  int64_t Score() const;
};

HandValue EvaluateFive(const std::array<Card, 5>& cards);

// Best five of 5..7 cards. Throws std::invalid_argument outside that range.
HandValue EvaluateBest(const std::vector<Card>& cards);

} // namespace pokertable::engine
