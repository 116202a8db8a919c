#include "internal/engine/holdem_engine.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using pokertable::engine::EngineConfig;
using pokertable::engine::HoldemEngine;
using pokertable::testing::DeckStartingWith;
using pokertable::testing::ThrowsAs;
using pokertable::util::IllegalActionError;

EngineConfig Config(std::vector<int64_t> stacks, std::vector<pokertable::engine::Card> deck = pokertable::engine::FullDeck()) {
  EngineConfig config;
  config.starting_stacks = std::move(stacks);
  config.small_blind     = 5;
  config.big_blind       = 10;
  config.button_index    = 0;
  config.deck            = std::move(deck);
  return config;
}

void TestFoldIsRejectedWhenCheckIsFree() {
  for (int n = 2; n <= 8; ++n) {
    HoldemEngine engine(Config(std::vector<int64_t>(static_cast<size_t>(n), 1000)));
    engine.DealHoleCards();

    const int big_blind = n == 2 ? 1 : 2 % n;
    while (engine.ActorIndex() && *engine.ActorIndex() != big_blind) {
      engine.CheckOrCall();
    }
    assert(engine.ActorIndex().has_value());

    const auto legal = engine.LegalActionsFor(big_blind);
    assert(legal.can_check);
    assert(!legal.can_fold);
    assert(ThrowsAs<IllegalActionError>([&] { engine.Fold(); }));

    engine.CheckOrCall();
    assert(!engine.ActorIndex().has_value());
    assert(engine.BoardCardsNeeded() == 3);
    assert(engine.TotalPot() == 10 * n);
  }
}

void TestHeadsUpButtonPostsSmallBlindAndActsFirst() {
  HoldemEngine engine(Config({1000, 1000}));
  engine.DealHoleCards();
  assert(engine.Bets()[0] == 5);
  assert(engine.Bets()[1] == 10);
  assert(*engine.ActorIndex() == 0);

  engine.CheckOrCall();
  engine.CheckOrCall();
  engine.DealBoard(3);
  assert(engine.StreetIndex() == 1);
  assert(*engine.ActorIndex() == 1);
}

void TestFoldOutAwardsPot() {
  HoldemEngine engine(Config({1000, 1000}));
  engine.DealHoleCards();
  engine.Fold();

  assert(engine.IsHandComplete());
  assert(!engine.WentToShowdown());
  assert(engine.Stacks()[0] == 995);
  assert(engine.Stacks()[1] == 1005);
  const auto winners = engine.Winners();
  assert(winners.size() == 1);
  assert(winners[0].player_index == 1);
  assert(winners[0].amount == 10);
}

void TestAllInRunsOutTheBoard() {
  HoldemEngine engine(Config({100, 100}, DeckStartingWith({"As", "2c", "Ad", "7d", "Kh", "Qh", "3s", "8c", "9d"})));
  engine.DealHoleCards();

  const auto legal = engine.LegalActionsFor(0);
  assert(legal.max_raise_to == 100);
  engine.BetOrRaiseTo(100);
  engine.CheckOrCall();
  assert(engine.IsAllIn(0));
  assert(engine.IsAllIn(1));
  assert(!engine.ActorIndex().has_value());

  while (!engine.IsHandComplete()) {
    engine.DealBoard(engine.BoardCardsNeeded());
  }

  assert(engine.BoardCards().size() == 5);
  assert(engine.WentToShowdown());
  assert(engine.Stacks()[0] == 200);
  assert(engine.Stacks()[1] == 0);
  const auto winners = engine.Winners();
  assert(winners.size() == 1);
  assert(winners[0].amount == 200);
  assert(winners[0].hand_rank == "pair");
}

void TestUncalledBetIsReturned() {
  HoldemEngine engine(Config({1000, 500}, DeckStartingWith({"7c", "As", "2d", "Ad", "Kh", "Qs", "9d", "5h", "3c"})));
  engine.DealHoleCards();
  engine.BetOrRaiseTo(1000);
  engine.CheckOrCall();

  // the 500 nobody could call is back before the board is dealt
  assert(engine.Stacks()[0] == 500);
  assert(engine.TotalPot() == 1000);
  const auto snapshot = engine.Serialize();
  assert(snapshot.pots_size() == 1);
  assert(snapshot.pots(0).amount() == 1000);

  while (!engine.IsHandComplete()) {
    engine.DealBoard(engine.BoardCardsNeeded());
  }
  assert(engine.Stacks()[0] == 500);
  assert(engine.Stacks()[1] == 1000);
  const auto winners = engine.Winners();
  assert(winners.size() == 1);
  assert(winners[0].player_index == 1);
  assert(winners[0].amount == 1000);
}

void TestUncalledRaiseReturnedOnFoldOut() {
  HoldemEngine engine(Config({1000, 1000, 1000}));
  engine.DealHoleCards();
  engine.BetOrRaiseTo(100);
  engine.Fold();
  engine.Fold();

  assert(engine.IsHandComplete());
  assert(engine.Stacks()[0] == 1015);
  assert(engine.Winners()[0].amount == 25);
}

void TestSidePots() {
  // button 0, small blind 1, big blind 2; cards go to 1, 2, 0, 1, 2, 0
  HoldemEngine engine(Config({50, 100, 200}, DeckStartingWith({"Ks", "2c", "As", "Kd", "7d", "Ad", "3h", "8s", "9c", "Jd", "4h"})));
  engine.DealHoleCards();
  assert(*engine.ActorIndex() == 0);

  engine.BetOrRaiseTo(50);
  engine.BetOrRaiseTo(100);
  engine.CheckOrCall();
  assert(!engine.ActorIndex().has_value());

  const auto snapshot = engine.Serialize();
  assert(snapshot.pots_size() == 2);
  assert(snapshot.pots(0).amount() == 150);
  assert(snapshot.pots(0).eligible_players_size() == 3);
  assert(snapshot.pots(1).amount() == 100);
  assert(snapshot.pots(1).eligible_players_size() == 2);

  while (!engine.IsHandComplete()) {
    engine.DealBoard(engine.BoardCardsNeeded());
  }

  assert(engine.Stacks()[0] == 150);
  assert(engine.Stacks()[1] == 100);
  assert(engine.Stacks()[2] == 100);

  const auto winners = engine.Winners();
  assert(winners.size() == 2);
  assert(winners[0].player_index == 0);
  assert(winners[0].amount == 150);
  assert(winners[0].pot_index == 0);
  assert(winners[1].player_index == 1);
  assert(winners[1].amount == 100);
  assert(winners[1].pot_index == 1);
}

void TestMinimumRaiseTracksLastRaiseSize() {
  HoldemEngine engine(Config({1000, 1000}));
  engine.DealHoleCards();

  assert(engine.LegalActionsFor(0).min_raise_to == 20);
  assert(ThrowsAs<IllegalActionError>([&] { engine.BetOrRaiseTo(15); }));
  engine.BetOrRaiseTo(30);

  assert(engine.LegalActionsFor(1).min_raise_to == 50);
  assert(ThrowsAs<IllegalActionError>([&] { engine.BetOrRaiseTo(40); }));
  engine.BetOrRaiseTo(50);
  assert(*engine.ActorIndex() == 0);
}

void TestShortAllInDoesNotReopenBetting() {
  HoldemEngine engine(Config({1000, 35}));
  engine.DealHoleCards();

  engine.BetOrRaiseTo(30);
  engine.BetOrRaiseTo(35);
  assert(engine.IsAllIn(1));

  const auto legal = engine.LegalActionsFor(0);
  assert(legal.can_call);
  assert(legal.call_amount == 5);
  assert(!legal.can_raise);
  assert(ThrowsAs<IllegalActionError>([&] { engine.BetOrRaiseTo(100); }));
}

void TestIllegalActionsLeaveStateUnchanged() {
  HoldemEngine engine(Config({1000, 1000}));
  engine.DealHoleCards();
  const auto before = engine.Serialize().SerializeAsString();

  assert(ThrowsAs<IllegalActionError>([&] { engine.BetOrRaiseTo(5000); }));
  assert(ThrowsAs<IllegalActionError>([&] { engine.DealBoard(3); }));
  assert(engine.Serialize().SerializeAsString() == before);
}

void TestConfigurationIsValidated() {
  using pokertable::util::ValidationError;
  assert(ThrowsAs<ValidationError>([] { HoldemEngine engine(Config({1000})); }));
  assert(ThrowsAs<ValidationError>([] { HoldemEngine engine(Config(std::vector<int64_t>(9, 1000))); }));
  assert(ThrowsAs<ValidationError>([] { HoldemEngine engine(Config({1000, 0})); }));

  auto deck = pokertable::engine::FullDeck();
  deck[1]   = deck[0];
  assert(ThrowsAs<ValidationError>([&] { HoldemEngine engine(Config({1000, 1000}, deck)); }));
}

} // namespace

int main() {
  TestFoldIsRejectedWhenCheckIsFree();
  TestHeadsUpButtonPostsSmallBlindAndActsFirst();
  TestFoldOutAwardsPot();
  TestAllInRunsOutTheBoard();
  TestUncalledBetIsReturned();
  TestUncalledRaiseReturnedOnFoldOut();
  TestSidePots();
  TestMinimumRaiseTracksLastRaiseSize();
  TestShortAllInDoesNotReopenBetting();
  TestIllegalActionsLeaveStateUnchanged();
  TestConfigurationIsValidated();

  std::cout << "holdem_engine_test: pass\n";
  return 0;
}
