#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/engine/cards.hpp"
#include "pokertable/v1.hpp"

namespace pokertable::engine {

struct EngineConfig {
  std::vector<int64_t> starting_stacks;
  int64_t              small_blind = 0;
  int64_t              big_blind   = 0;
  int64_t              ante        = 0;
  int                  button_index = 0;

  // Deal order, first card dealt first. Empty means a freshly shuffled deck.
  std::vector<Card> deck;
};

struct Winner {
  int                      player_index = 0;
  int64_t                  amount       = 0;
  std::string              hand_rank;
  std::vector<std::string> best_hand_cards;
  int                      pot_index = 0;
};

// Everything a client needs to render action buttons for one player.
struct LegalActions {
  bool    can_fold     = false;
  bool    can_check    = false;
  bool    can_call     = false;
  int64_t call_amount  = 0;
  bool    can_bet      = false;
  bool    can_raise    = false;
  int64_t min_raise_to = 0;
  int64_t max_raise_to = 0;
  int64_t current_pot  = 0;
  int64_t player_stack = 0;
};

/*
  RulesEngine

  Stateful poker engine for a single hand. Player indices are fixed at
  creation; index order is the order of EngineConfig::starting_stacks.

  Street advancement is driven by the caller: when no actor is pending and
  the hand is not complete, the caller deals BoardCardsNeeded() cards.

  Illegal actions throw util::IllegalActionError and leave state unchanged.
*/
class RulesEngine {
 public:
  virtual ~RulesEngine() = default;

  virtual void DealHoleCards()       = 0;
  virtual void DealBoard(int count)  = 0;

  virtual void Fold()                    = 0;
  virtual void CheckOrCall()             = 0;
  virtual void BetOrRaiseTo(int64_t to)  = 0;

  virtual std::optional<int> ActorIndex() const = 0;
  bool HasPendingActor() const {
    return ActorIndex().has_value();
  }
  virtual bool IsHandComplete() const = 0;
  virtual bool WentToShowdown() const = 0;

  // 0 = preflop, 1 = flop, 2 = turn, 3 = river
  virtual int StreetIndex() const      = 0;
  virtual int BoardCardsNeeded() const = 0;

  // Empty until the hand is complete. Sorted by amount, largest first.
  virtual std::vector<Winner> Winners() const             = 0;
  virtual LegalActions        LegalActionsFor(int player) const = 0;

  virtual int                         PlayerCount() const          = 0;
  virtual int                         ButtonIndex() const          = 0;
  virtual const std::vector<int64_t>& Stacks() const               = 0;
  virtual const std::vector<int64_t>& Bets() const                 = 0;
  virtual std::vector<bool>           FoldedPlayers() const        = 0;
  virtual bool                        IsAllIn(int player) const    = 0;
  virtual int64_t                     CurrentBet() const           = 0;
  virtual int64_t                     TotalPot() const             = 0;
  virtual std::vector<std::string>    HoleCards(int player) const  = 0;
  virtual std::vector<std::string>    BoardCards() const           = 0;

  virtual pokertable::v1::EngineSnapshot Serialize() const = 0;
};

class EngineFactory {
 public:
  virtual ~EngineFactory() = default;

  // Posts antes and blinds. Hole cards are dealt by DealHoleCards().
  virtual std::unique_ptr<RulesEngine> Create(const EngineConfig& config) = 0;

  // Never reshuffles. Throws util::RestorationError on an inconsistent snapshot.
  virtual std::unique_ptr<RulesEngine> Restore(const pokertable::v1::EngineSnapshot& snapshot) = 0;
};

} // namespace pokertable::engine
