#include "internal/engine/cards.hpp"

namespace pokertable::engine {

namespace {

constexpr std::string_view kRanks = "23456789TJQKA";
constexpr std::string_view kSuits = "cdhs";

} // namespace

std::string ToString(Card card) {
  std::string out;
  out.push_back(kRanks[static_cast<size_t>(card.rank - 2)]);
  out.push_back(kSuits[static_cast<size_t>(card.suit)]);
  return out;
}

std::vector<std::string> ToStrings(const std::vector<Card>& cards) {
  std::vector<std::string> out;
  out.reserve(cards.size());
  for (const auto& card : cards) {
    out.push_back(ToString(card));
  }
  return out;
}

std::optional<Card> ParseCard(std::string_view text) {
  if (text.size() != 2) {
    return std::nullopt;
  }
  const auto rank = kRanks.find(text[0]);
  const auto suit = kSuits.find(text[1]);
  if (rank == std::string_view::npos || suit == std::string_view::npos) {
    return std::nullopt;
  }
  return Card{static_cast<int>(rank) + 2, static_cast<int>(suit)};
}

std::vector<Card> FullDeck() {
  std::vector<Card> deck;
  deck.reserve(kDeckSize);
  for (int rank = 2; rank <= 14; ++rank) {
    for (int suit = 0; suit < 4; ++suit) {
      deck.push_back(Card{rank, suit});
    }
  }
  return deck;
}

} // namespace pokertable::engine
