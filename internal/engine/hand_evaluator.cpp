#include "internal/engine/hand_evaluator.hpp"

#include <algorithm>
#include <stdexcept>

namespace pokertable::engine {

std::string_view CategoryName(HandCategory category) {
  switch (category) {
    case HandCategory::kHighCard:
      return "high_card";
    case HandCategory::kPair:
      return "pair";
    case HandCategory::kTwoPair:
      return "two_pair";
    case HandCategory::kThreeOfAKind:
      return "three_of_a_kind";
    case HandCategory::kStraight:
      return "straight";
    case HandCategory::kFlush:
      return "flush";
    case HandCategory::kFullHouse:
      return "full_house";
    case HandCategory::kFourOfAKind:
      return "four_of_a_kind";
    case HandCategory::kStraightFlush:
      return "straight_flush";
  }
  return "unknown";
}

int64_t HandValue::Score() const {
  int64_t score = static_cast<int64_t>(category);
  for (int rank : ranks) {
    score = (score << 4) | rank;
  }
  return score;
}

HandValue EvaluateFive(const std::array<Card, 5>& input) {
  std::array<Card, 5> cards = input;

  std::array<int, 15> counts{};
  for (const auto& card : cards) {
    counts[static_cast<size_t>(card.rank)]++;
  }

  // Group order: larger groups first, then higher rank.
  std::sort(cards.begin(), cards.end(), [&](const Card& a, const Card& b) {
    const int ca = counts[static_cast<size_t>(a.rank)];
    const int cb = counts[static_cast<size_t>(b.rank)];
    if (ca != cb) return ca > cb;
    if (a.rank != b.rank) return a.rank > b.rank;
    return a.suit > b.suit;
  });

  const bool flush = std::all_of(cards.begin(), cards.end(), [&](const Card& c) { return c.suit == cards[0].suit; });

  bool distinct = true;
  for (int count : counts) {
    if (count > 1) distinct = false;
  }

  bool straight = false;
  bool wheel    = false;
  if (distinct) {
    if (cards[0].rank - cards[4].rank == 4) {
      straight = true;
    } else if (cards[0].rank == 14 && cards[1].rank == 5) {
      straight = true;
      wheel    = true;
    }
  }

  HandValue value;
  value.cards = cards;
  for (size_t i = 0; i < cards.size(); ++i) {
    value.ranks[i] = cards[i].rank;
  }
  if (wheel) {
    std::rotate(value.cards.begin(), value.cards.begin() + 1, value.cards.end());
    value.ranks = {5, 4, 3, 2, 1};
  }

  const int top    = counts[static_cast<size_t>(cards[0].rank)];
  const int second = counts[static_cast<size_t>(cards[top].rank)];

  if (straight && flush) {
    value.category = HandCategory::kStraightFlush;
  } else if (top == 4) {
    value.category = HandCategory::kFourOfAKind;
  } else if (top == 3 && second == 2) {
    value.category = HandCategory::kFullHouse;
  } else if (flush) {
    value.category = HandCategory::kFlush;
  } else if (straight) {
    value.category = HandCategory::kStraight;
  } else if (top == 3) {
    value.category = HandCategory::kThreeOfAKind;
  } else if (top == 2 && second == 2) {
    value.category = HandCategory::kTwoPair;
  } else if (top == 2) {
    value.category = HandCategory::kPair;
  } else {
    value.category = HandCategory::kHighCard;
  }
  return value;
}

HandValue EvaluateBest(const std::vector<Card>& cards) {
  const size_t n = cards.size();
  if (n < 5 || n > 7) {
    throw std::invalid_argument("hand evaluation needs 5 to 7 cards");
  }

  HandValue best;
  bool      have_best = false;
  for (size_t a = 0; a < n; ++a)
    for (size_t b = a + 1; b < n; ++b)
      for (size_t c = b + 1; c < n; ++c)
        for (size_t d = c + 1; d < n; ++d)
          for (size_t e = d + 1; e < n; ++e) {
            const auto candidate = EvaluateFive({cards[a], cards[b], cards[c], cards[d], cards[e]});
            if (!have_best || candidate.Score() > best.Score()) {
              best      = candidate;
              have_best = true;
            }
          }
  return best;
}

} // namespace pokertable::engine
