#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pokertable::engine {

// rank 2..14 (14 = ace), suit 0..3 (c, d, h, s)
struct Card {
  int rank = 0;
  int suit = 0;

  bool operator==(const Card& other) const = default;
};

constexpr int kDeckSize = 52;

// Dense index 0..51, used for duplicate detection.
constexpr int CardIndex(Card card) {
  return (card.rank - 2) * 4 + card.suit;
}

// Two-character notation, e.g. "Ah", "Tc".
std::string ToString(Card card);
std::vector<std::string> ToStrings(const std::vector<Card>& cards);

std::optional<Card> ParseCard(std::string_view text);

// Ordered 2c, 2d, 2h, 2s, 3c ... As.
std::vector<Card> FullDeck();

} // namespace pokertable::engine
