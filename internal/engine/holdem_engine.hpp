#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "internal/engine/rules_engine.hpp"

namespace pokertable::engine {

/*
  No-Limit Texas Hold'em, tournament mode.

  - 2..8 players, antes are dead money, blinds are live.
  - Heads-up the button posts the small blind and acts first preflop.
  - A raise must be at least the previous raise size; an all-in short of
    that does not reopen betting for players who already acted.
  - Folding is rejected when checking is free.
  - Side pots by contribution level; odd chips go to the first winner left
    of the button.
  - No burn cards: the deck is dealt in order.
*/
class HoldemEngine final : public RulesEngine {
 public:
  explicit HoldemEngine(const EngineConfig& config);

  static std::unique_ptr<HoldemEngine> FromSnapshot(const pokertable::v1::EngineSnapshot& snapshot);

  void DealHoleCards() override;
  void DealBoard(int count) override;

  void Fold() override;
  void CheckOrCall() override;
  void BetOrRaiseTo(int64_t to) override;

  std::optional<int> ActorIndex() const override {
    return actor_;
  }
  bool IsHandComplete() const override {
    return completed_;
  }
  bool WentToShowdown() const override;

  int StreetIndex() const override {
    return street_;
  }
  int BoardCardsNeeded() const override;

  std::vector<Winner> Winners() const override {
    return winners_;
  }
  LegalActions LegalActionsFor(int player) const override;

  int PlayerCount() const override {
    return static_cast<int>(stacks_.size());
  }
  int ButtonIndex() const override {
    return button_;
  }
  const std::vector<int64_t>& Stacks() const override {
    return stacks_;
  }
  const std::vector<int64_t>& Bets() const override {
    return bets_;
  }
  std::vector<bool>        FoldedPlayers() const override;
  bool                     IsAllIn(int player) const override;
  int64_t                  CurrentBet() const override;
  int64_t                  TotalPot() const override;
  std::vector<std::string> HoleCards(int player) const override;
  std::vector<std::string> BoardCards() const override;

  pokertable::v1::EngineSnapshot Serialize() const override;

 private:
  struct Pot {
    int64_t          amount = 0;
    std::vector<int> eligible;
  };

  HoldemEngine() = default;

  int  Next(int index) const;
  int  SmallBlindIndex() const;
  int  BigBlindIndex() const;
  int  RequireActor() const;
  int  CountCanAct() const;
  int  CountLive() const;
  bool NeedsAction(int player) const;

  std::optional<int> FindActor(int start) const;

  void Commit(int player, int64_t amount);
  void ReturnUncalled();
  void AfterAction(int player);
  void OpenStreet();
  void AwardFoldOut();
  void Showdown();

  std::vector<Pot> BuildPots() const;
  std::vector<Card> CardsFor(int player) const;

  int64_t small_blind_ = 0;
  int64_t big_blind_   = 0;
  int64_t ante_        = 0;
  int     button_      = 0;

  std::vector<int64_t> starting_stacks_;
  std::vector<int64_t> stacks_;
  std::vector<int64_t> bets_;
  std::vector<int64_t> contributions_;
  std::vector<bool>    folded_;
  std::vector<bool>    acted_;

  std::vector<std::vector<Card>> hole_;
  std::vector<Card>              board_;
  std::vector<Card>              deck_;

  int                 street_          = 0;
  std::optional<int>  actor_;
  int64_t             last_raise_size_ = 0;
  bool                hole_dealt_      = false;
  bool                completed_       = false;
  std::vector<Winner> winners_;
};

/*
  Builds HoldemEngine instances. The deck source is called once per new
  hand; the default shuffles a full deck.
*/
class HoldemEngineFactory final : public EngineFactory {
 public:
  using DeckSource = std::function<std::vector<Card>()>;

  HoldemEngineFactory();
  explicit HoldemEngineFactory(DeckSource deck_source);

  std::unique_ptr<RulesEngine> Create(const EngineConfig& config) override;
  std::unique_ptr<RulesEngine> Restore(const pokertable::v1::EngineSnapshot& snapshot) override;

 private:
  DeckSource deck_source_;
};

std::vector<Card> ShuffledDeck();

} // namespace pokertable::engine
