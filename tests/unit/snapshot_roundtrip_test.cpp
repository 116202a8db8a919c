#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/snapshot_codec.hpp"
#include "internal/engine/holdem_engine.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using pokertable::engine::EngineConfig;
using pokertable::engine::HoldemEngineFactory;
using pokertable::engine::RulesEngine;
using pokertable::testing::DeckStartingWith;
using pokertable::testing::ThrowsAs;

std::unique_ptr<RulesEngine> NewHand(HoldemEngineFactory& factory, std::vector<int64_t> stacks) {
  EngineConfig config;
  config.starting_stacks = std::move(stacks);
  config.small_blind     = 5;
  config.big_blind       = 10;
  config.button_index    = 0;
  auto engine            = factory.Create(config);
  engine->DealHoleCards();
  return engine;
}

std::unique_ptr<RulesEngine> ThroughJson(HoldemEngineFactory& factory, const RulesEngine& engine) {
  const auto json = pokertable::core::EncodeSnapshot(engine.Serialize());
  return factory.Restore(pokertable::core::DecodeSnapshot(json));
}

bool SameState(const RulesEngine& a, const RulesEngine& b) {
  return a.Serialize().SerializeAsString() == b.Serialize().SerializeAsString();
}

void TestPreflopRoundTrip() {
  HoldemEngineFactory factory([] { return DeckStartingWith({"As", "Kd", "Ah", "Kc"}); });
  auto                original = NewHand(factory, {1000, 1000});
  auto                restored = ThroughJson(factory, *original);

  assert(SameState(*original, *restored));
  assert(restored->HoleCards(0) == original->HoleCards(0));
  assert(*restored->ActorIndex() == 0);

  original->BetOrRaiseTo(40);
  restored->BetOrRaiseTo(40);
  original->CheckOrCall();
  restored->CheckOrCall();
  assert(SameState(*original, *restored));
}

void TestPostFlopRoundTripKeepsDeckOrder() {
  HoldemEngineFactory factory([] { return DeckStartingWith({"As", "Kd", "Ah", "Kc", "2h", "7s", "9d", "Jc", "3s", "Qd"}); });
  auto                original = NewHand(factory, {1000, 1000, 1000});

  original->CheckOrCall();
  original->CheckOrCall();
  original->CheckOrCall();
  original->DealBoard(3);

  auto restored = ThroughJson(factory, *original);
  assert(restored->StreetIndex() == 1);
  assert(restored->BoardCards() == original->BoardCards());

  original->CheckOrCall();
  restored->CheckOrCall();
  original->CheckOrCall();
  restored->CheckOrCall();
  original->CheckOrCall();
  restored->CheckOrCall();
  original->DealBoard(1);
  restored->DealBoard(1);

  assert(restored->BoardCards().size() == 4);
  assert(restored->BoardCards()[3] == "Qd");
  assert(SameState(*original, *restored));
}

void TestAllInRunOutRoundTrip() {
  HoldemEngineFactory factory([] { return DeckStartingWith({"As", "2c", "Ad", "7d", "Kh", "Qh", "3s", "8c", "9d"}); });
  auto                original = NewHand(factory, {100, 100});
  original->BetOrRaiseTo(100);
  original->CheckOrCall();

  auto restored = ThroughJson(factory, *original);
  assert(restored->IsAllIn(0));
  assert(restored->IsAllIn(1));
  assert(!restored->HasPendingActor());

  while (!restored->IsHandComplete()) {
    restored->DealBoard(restored->BoardCardsNeeded());
  }
  assert(restored->Stacks()[0] == 200);

  auto finished = ThroughJson(factory, *restored);
  assert(finished->IsHandComplete());
  assert(finished->Winners().size() == 1);
  assert(finished->Winners()[0].amount == 200);
}

void TestPlayerOrderSurvivesJson() {
  HoldemEngineFactory factory;
  auto                engine   = NewHand(factory, {500, 500});
  auto                snapshot = engine->Serialize();
  snapshot.add_hand_player_order(42);
  snapshot.add_hand_player_order(7);

  const auto decoded = pokertable::core::DecodeSnapshot(pokertable::core::EncodeSnapshot(snapshot));
  assert(decoded.hand_player_order_size() == 2);
  assert(decoded.hand_player_order(0) == 42);
  assert(decoded.hand_player_order(1) == 7);
}

void TestCorruptSnapshotsAreRejected() {
  using pokertable::util::RestorationError;
  HoldemEngineFactory factory;

  assert(ThrowsAs<RestorationError>([] { pokertable::core::DecodeSnapshot("{not json"); }));
  assert(ThrowsAs<RestorationError>([] { pokertable::core::DecodeSnapshot(R"({"no_such_field": 1})"); }));
  assert(ThrowsAs<RestorationError>([&] { factory.Restore(pokertable::core::DecodeSnapshot("{}")); }));

  auto engine   = NewHand(factory, {500, 500});
  auto snapshot = engine->Serialize();
  snapshot.set_player_count(3);
  assert(ThrowsAs<RestorationError>([&] { factory.Restore(snapshot); }));

  snapshot = engine->Serialize();
  snapshot.set_deck(0, snapshot.hole_cards(0).cards(0));
  assert(ThrowsAs<RestorationError>([&] { factory.Restore(snapshot); }));
}

void TestInterHandStateRoundTrip() {
  pokertable::v1::InterHandState state;
  state.add_ready_user_ids(3);
  state.add_ready_user_ids(9);
  state.set_wait_started_at_ms(1700000000000);
  state.set_event_seq(12);
  state.mutable_hand_ended()->set_hand_no(4);

  const auto decoded = pokertable::core::DecodeInterHand(pokertable::core::EncodeInterHand(state));
  assert(decoded.ready_user_ids_size() == 2);
  assert(decoded.wait_started_at_ms() == 1700000000000ULL);
  assert(decoded.event_seq() == 12);
  assert(decoded.hand_ended().hand_no() == 4);

  assert(pokertable::core::DecodeInterHand("").ready_user_ids_size() == 0);
}

void TestTurnTimerDecoding() {
  pokertable::v1::TurnTimer timer;
  timer.set_actor_user_id(7);
  timer.set_turn_started_at_ms(1700000000000);

  const auto decoded = pokertable::core::DecodeTurnTimer(pokertable::core::EncodeTurnTimer(timer));
  assert(decoded.actor_user_id() == 7);
  assert(decoded.turn_started_at_ms() == 1700000000000ULL);

  // hand rows written before the timer existed hold "{}"
  assert(pokertable::core::DecodeTurnTimer("{}").turn_started_at_ms() == 0);
  assert(ThrowsAs<pokertable::util::RestorationError>([] { pokertable::core::DecodeTurnTimer("{not json"); }));
}

void TestTableConfigDecoding() {
  const auto config = pokertable::core::DecodeTableConfig(R"({"small_blind": "25", "big_blind": "50", "legacy_field": true})");
  assert(config.has_small_blind());
  assert(config.small_blind() == 25);
  assert(!config.has_ante());

  assert(ThrowsAs<pokertable::util::ValidationError>([] { pokertable::core::DecodeTableConfig("[1,2]"); }));
}

} // namespace

int main() {
  TestPreflopRoundTrip();
  TestPostFlopRoundTripKeepsDeckOrder();
  TestAllInRunOutRoundTrip();
  TestPlayerOrderSurvivesJson();
  TestCorruptSnapshotsAreRejected();
  TestInterHandStateRoundTrip();
  TestTurnTimerDecoding();
  TestTableConfigDecoding();

  std::cout << "snapshot_roundtrip_test: pass\n";
  return 0;
}
