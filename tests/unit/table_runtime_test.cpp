#include "internal/core/table_runtime.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using pokertable::core::GameSettings;
using pokertable::core::HandContext;
using pokertable::core::TableRuntime;
using pokertable::db::memory::MemoryRepository;
using pokertable::db::model::LedgerEntryType;
using pokertable::engine::HoldemEngineFactory;
using pokertable::testing::ActiveSeats;
using pokertable::testing::ChipsOf;
using pokertable::testing::DeckStartingWith;
using pokertable::testing::LoadTable;
using pokertable::testing::SeatSpec;
using pokertable::testing::SeedTable;
using pokertable::testing::ThrowsAs;

// User 1 holds aces against user 2 on a dry board.
std::vector<pokertable::engine::Card> AcesDeck() {
  return DeckStartingWith({"As", "2c", "Ad", "7d", "Kh", "Qh", "3s", "8c", "9d"});
}

struct Harness {
  explicit Harness(std::vector<SeatSpec> seats, GameSettings game = pokertable::testing::TestSettings(),
                   std::vector<pokertable::engine::Card> deck = AcesDeck(), int64_t small_blind = 5, int64_t big_blind = 10)
      : factory([deck] { return deck; }), settings(std::move(game)) {
    table_id = SeedTable(*repo, seats, small_blind, big_blind);
    runtime  = std::make_unique<TableRuntime>(table_id, factory);
    runtime->Refresh(LoadTable(*repo, table_id), ActiveSeats(*repo, table_id));
  }

  void Run(const std::function<void(HandContext&)>& op) {
    auto        tx = repo->Begin();
    HandContext ctx{*repo, *tx, wallet, lifecycle, settings, now};
    op(ctx);
    tx->Commit();
  }

  void Act(int64_t user_id, pokertable::v1::ActionType action, std::optional<int64_t> amount = std::nullopt) {
    Run([&](HandContext& ctx) { last_ended = runtime->HandleAction(ctx, user_id, action, amount); });
  }

  std::shared_ptr<MemoryRepository>             repo = std::make_shared<MemoryRepository>();
  HoldemEngineFactory                           factory;
  pokertable::collab::LedgerWalletService       wallet;
  pokertable::collab::DefaultTableLifecycle     lifecycle;
  GameSettings                                  settings;
  pokertable::util::TimePoint                   now      = pokertable::util::Now();
  int64_t                                       table_id = 0;
  std::unique_ptr<TableRuntime>                 runtime;
  std::optional<pokertable::v1::HandEndedEvent> last_ended;
};

// Raise to 100, call, then check down to showdown.
void PlayShowdownHand(Harness& h) {
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });
  h.Act(1, pokertable::v1::ACTION_TYPE_RAISE, 100);
  h.Act(2, pokertable::v1::ACTION_TYPE_CALL);
  for (int street = 0; street < 3; ++street) {
    h.Act(2, pokertable::v1::ACTION_TYPE_CHECK);
    h.Act(1, pokertable::v1::ACTION_TYPE_CHECK);
  }
}

void TestStartHandPersistsRow() {
  Harness h({{1, 1000}, {2, 1000}});
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });

  const auto hand = pokertable::testing::ActiveHand(*h.repo, h.table_id);
  assert(hand.has_value());
  assert(hand->hand_no == 1);
  assert(hand->status == pokertable::v1::HAND_STATUS_PREFLOP);
  assert(hand->version == 2);

  const auto snapshot = pokertable::core::DecodeSnapshot(hand->engine_state_json);
  assert(snapshot.hand_player_order_size() == 2);
  assert(snapshot.hand_player_order(0) == 1);
  assert(snapshot.hand_player_order(1) == 2);

  assert(LoadTable(*h.repo, h.table_id).status == pokertable::v1::TABLE_STATUS_ACTIVE);
  assert(h.runtime->PlayerOrder().size() == 2);
  assert(h.runtime->EventSeq() == 1);

  // button seat posts the small blind and acts first heads-up
  const auto state = h.runtime->BuildState(1, h.settings, h.now);
  assert(state.button_position() == 0);
  assert(state.current_actor() == 1);
  assert(state.hero_cards_size() == 2);
  assert(state.players(1).hole_cards_size() == 0);
  assert(state.allowed_actions().can_raise());
}

void TestCompletionWritesResults() {
  GameSettings settings           = pokertable::testing::TestSettings();
  settings.rake.rate_basis_points = 500;
  settings.rake.cap               = 10;
  Harness h({{1, 1000}, {2, 1000}}, settings);
  PlayShowdownHand(h);

  assert(h.last_ended.has_value());
  const auto& ended = *h.last_ended;
  assert(ended.hand_no() == 1);
  assert(ended.pot() == 200);
  assert(ended.rake() == 10);
  assert(ended.winners_size() == 1);
  assert(ended.winners(0).user_id() == 1);
  assert(ended.winners(0).amount() == 190);
  assert(ended.board_size() == 5);
  assert(ended.showdown_cards().size() == 2);
  assert(ended.status() == pokertable::v1::HAND_STATUS_INTER_HAND_WAIT);
  assert(ended.next_hand_in() == 20);
  assert(!ended.table_will_end());

  const auto seats = ActiveSeats(*h.repo, h.table_id);
  assert(ChipsOf(seats, 1) == 1090);
  assert(ChipsOf(seats, 2) == 900);
  for (const auto& seat : seats) assert(seat.is_sitting_out_next_hand);

  auto tx   = h.repo->Begin();
  auto hand = h.repo->GetActiveHand(*tx, h.table_id);
  assert(hand->status == pokertable::v1::HAND_STATUS_INTER_HAND_WAIT);
  assert(hand->pot_size == 200);
  assert(h.repo->ListPots(*tx, hand->id).size() == 1);
  assert(h.repo->GetHandHistory(*tx, h.table_id, 1).has_value());
  assert(h.repo->ListActions(*tx, hand->id).size() == 8);

  const auto ledger = h.repo->ListLedgerEntries(*tx, h.table_id);
  assert(ledger.size() == 3);
  int64_t net = 0;
  for (const auto& entry : ledger) {
    net += entry.amount;
    if (entry.type == LedgerEntryType::kRake) assert(entry.user_id == 0 && entry.amount == 10);
  }
  assert(net == 0);
  tx->Commit();

  // the persisted result survives a restore
  TableRuntime restored(h.table_id, h.factory);
  restored.Refresh(LoadTable(*h.repo, h.table_id), seats);
  restored.Restore(*pokertable::testing::ActiveHand(*h.repo, h.table_id));
  const auto state = restored.BuildState(std::nullopt, h.settings, h.now);
  assert(state.inter_hand_wait());
  assert(state.hand_result().hand_no() == 1);
  assert(state.players(0).hole_cards_size() == 2);
}

void TestReadyPlayersStartNextHand() {
  Harness h({{1, 1000}, {2, 1000}});
  PlayShowdownHand(h);

  h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 2); });
  assert(h.runtime->ReadyPlayers().size() == 1);
  // repeated ready is a no-op
  h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 2); });
  assert(h.runtime->ReadyPlayers().size() == 1);
  h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 1); });

  pokertable::core::InterHandOutcome outcome;
  h.Run([&](HandContext& ctx) { outcome = h.runtime->CompleteInterHandPhase(ctx, false); });
  assert(!outcome.table_ended);

  const auto hand = pokertable::testing::ActiveHand(*h.repo, h.table_id);
  assert(hand->hand_no == 2);
  assert(hand->status == pokertable::v1::HAND_STATUS_PREFLOP);
  assert(h.runtime->ReadyPlayers().empty());

  // button moved to position 1, so user 2 posts the small blind and acts first
  const auto state = h.runtime->BuildState(std::nullopt, h.settings, h.now);
  assert(state.button_position() == 1);
  assert(state.current_actor() == 2);

  auto tx    = h.repo->Begin();
  auto hands = h.repo->ListHands(*tx, h.table_id);
  assert(hands.size() == 2);
  assert(hands[0].status == pokertable::v1::HAND_STATUS_ENDED);
  assert(hands[0].ended_at_ms != 0);
  tx->Commit();

  for (const auto& seat : ActiveSeats(*h.repo, h.table_id)) assert(!seat.is_sitting_out_next_hand);
}

void TestOutOfPhaseRequestsAreRejected() {
  using pokertable::util::InvalidState;
  using pokertable::util::ValidationError;

  Harness h({{1, 1000}, {2, 1000}});
  assert(ThrowsAs<pokertable::util::NoActiveHand>([&] { h.Act(1, pokertable::v1::ACTION_TYPE_CHECK); }));

  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });
  assert(ThrowsAs<InvalidState>([&] { h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); }); }));
  assert(ThrowsAs<ValidationError>([&] { h.Act(2, pokertable::v1::ACTION_TYPE_CALL); }));
  assert(ThrowsAs<ValidationError>([&] { h.Act(99, pokertable::v1::ACTION_TYPE_CALL); }));
  assert(ThrowsAs<ValidationError>([&] { h.Act(1, pokertable::v1::ACTION_TYPE_RAISE); }));
  assert(ThrowsAs<ValidationError>([&] { h.Act(1, pokertable::v1::ACTION_TYPE_READY); }));
  assert(ThrowsAs<InvalidState>([&] { h.Run([&](HandContext& ctx) { h.runtime->CompleteInterHandPhase(ctx, true); }); }));

  h.Act(1, pokertable::v1::ACTION_TYPE_FOLD);
  assert(h.last_ended.has_value());
  assert(h.last_ended->winners(0).user_id() == 2);
  assert(ThrowsAs<ValidationError>([&] { h.Act(2, pokertable::v1::ACTION_TYPE_CHECK); }));
  assert(ThrowsAs<ValidationError>([&] { h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 42); }); }));
}

void TestWaitMustElapseBeforeTableEnds() {
  Harness h({{1, 1000}, {2, 1000}});
  PlayShowdownHand(h);
  h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 1); });

  assert(ThrowsAs<pokertable::util::InvalidState>([&] { h.Run([&](HandContext& ctx) { h.runtime->CompleteInterHandPhase(ctx, false); }); }));

  h.now += std::chrono::seconds(21);
  pokertable::core::InterHandOutcome outcome;
  h.Run([&](HandContext& ctx) { outcome = h.runtime->CompleteInterHandPhase(ctx, false); });
  assert(outcome.table_ended);
  assert(outcome.end_reason == "not_enough_players_ready");

  assert(LoadTable(*h.repo, h.table_id).status == pokertable::v1::TABLE_STATUS_ENDED);
  assert(ActiveSeats(*h.repo, h.table_id).empty());
  assert(!pokertable::testing::ActiveHand(*h.repo, h.table_id).has_value());
  assert(!h.runtime->HasEngine());
}

void TestForcedCompletionWithNobodyReady() {
  Harness h({{1, 1000}, {2, 1000}});
  PlayShowdownHand(h);

  pokertable::core::InterHandOutcome outcome;
  h.Run([&](HandContext& ctx) { outcome = h.runtime->CompleteInterHandPhase(ctx, true); });
  assert(outcome.table_ended);
  assert(outcome.end_reason == "no_players_ready");
}

void TestBustedPlayerCannotReady() {
  Harness h({{1, 1000}, {2, 100}});
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });
  h.Act(1, pokertable::v1::ACTION_TYPE_RAISE, 100);
  h.Act(2, pokertable::v1::ACTION_TYPE_CALL);

  // user 2 is all in, the board runs out without further action
  assert(h.last_ended.has_value());
  assert(h.last_ended->table_will_end());
  assert(h.last_ended->end_reason() == "insufficient_players");
  assert(ChipsOf(ActiveSeats(*h.repo, h.table_id), 2) == 0);

  assert(ThrowsAs<pokertable::util::ValidationError>([&] { h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 2); }); }));
  h.Run([&](HandContext& ctx) { h.runtime->MarkPlayerReady(ctx, 1); });
}

void TestUncalledChipsGoBackBeforeRake() {
  GameSettings settings           = pokertable::testing::TestSettings();
  settings.rake.rate_basis_points = 500;
  settings.rake.cap               = 50;
  // user 1 (button) holds 7c2d, user 2 holds AsAd
  Harness h({{1, 1000}, {2, 500}}, settings, DeckStartingWith({"7c", "As", "2d", "Ad", "Kh", "Qs", "9d", "5h", "3c"}));
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });
  h.Act(1, pokertable::v1::ACTION_TYPE_ALL_IN);
  h.Act(2, pokertable::v1::ACTION_TYPE_CALL);

  assert(h.last_ended.has_value());
  const auto& ended = *h.last_ended;
  assert(ended.pot() == 1000);
  assert(ended.rake() == 50);
  assert(ended.winners_size() == 1);
  assert(ended.winners(0).user_id() == 2);
  assert(ended.winners(0).amount() == 950);

  const auto seats = ActiveSeats(*h.repo, h.table_id);
  assert(ChipsOf(seats, 1) == 500);
  assert(ChipsOf(seats, 2) == 950);

  auto tx = h.repo->Begin();
  for (const auto& entry : h.repo->ListLedgerEntries(*tx, h.table_id)) {
    if (entry.type == LedgerEntryType::kRake) assert(entry.amount == 50);
    if (entry.user_id == 1) assert(entry.amount == -500);
  }
  tx->Commit();
}

void TestHeadsUpAllInRunsOutBoard() {
  Harness h({{1, 1000}, {2, 1000}}, pokertable::testing::TestSettings(), AcesDeck(), 10, 20);
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });
  assert(h.runtime->BuildState(std::nullopt, h.settings, h.now).pot() == 30);

  h.Act(1, pokertable::v1::ACTION_TYPE_ALL_IN);
  assert(!h.last_ended.has_value());
  h.Act(2, pokertable::v1::ACTION_TYPE_CALL);

  assert(h.last_ended.has_value());
  assert(h.last_ended->pot() == 2000);
  assert(h.last_ended->board_size() == 5);
  assert(h.last_ended->winners(0).user_id() == 1);
  assert(h.last_ended->winners(0).amount() == 2000);
  assert(h.last_ended->table_will_end());

  const auto hand = pokertable::testing::ActiveHand(*h.repo, h.table_id);
  assert(hand->status == pokertable::v1::HAND_STATUS_INTER_HAND_WAIT);
  assert(hand->pot_size == 2000);

  const auto seats = ActiveSeats(*h.repo, h.table_id);
  assert(ChipsOf(seats, 1) + ChipsOf(seats, 2) == 2000);
  assert(ChipsOf(seats, 1) == 2000);

  const auto state = h.runtime->BuildState(2, h.settings, h.now);
  assert(state.inter_hand_wait());
  assert(state.current_actor() == 0);
  assert(state.players(0).hole_cards_size() == 2);
}

void TestPreflopFoldKeepsSeat() {
  Harness h({{1, 1000}, {2, 1000}, {3, 1000}});
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });

  // button is under the gun three-handed
  assert(h.runtime->BuildState(std::nullopt, h.settings, h.now).current_actor() == 1);
  h.Act(1, pokertable::v1::ACTION_TYPE_FOLD);
  assert(!h.last_ended.has_value());

  const auto state   = h.runtime->BuildState(std::nullopt, h.settings, h.now);
  int        in_hand = 0;
  for (const auto& player : state.players()) {
    if (player.in_hand()) ++in_hand;
    if (player.user_id() == 1) assert(!player.in_hand());
  }
  assert(in_hand == 2);
  assert(state.players_size() == 3);
  assert(state.current_actor() == 2);

  const auto seats = ActiveSeats(*h.repo, h.table_id);
  assert(seats.size() == 3);
  for (const auto& seat : seats) assert(seat.left_at_ms == 0);

  h.Act(2, pokertable::v1::ACTION_TYPE_CALL);
  h.Act(3, pokertable::v1::ACTION_TYPE_CHECK);
  assert(h.runtime->BuildState(std::nullopt, h.settings, h.now).status() == pokertable::v1::HAND_STATUS_FLOP);
  assert(h.runtime->PlayerOrder().size() == 3);
}

void TestActionDeadlineCountsFromTurnStart() {
  using pokertable::util::ToIso8601;
  using pokertable::util::ToUnixMillis;

  GameSettings settings         = pokertable::testing::TestSettings();
  settings.turn_timeout_seconds = 30;
  Harness    h({{1, 1000}, {2, 1000}}, settings);
  const auto dealt_at = h.now;
  h.Run([&](HandContext& ctx) { h.runtime->StartHand(ctx); });

  const auto first = h.runtime->BuildState(std::nullopt, h.settings, dealt_at + std::chrono::seconds(7));
  const auto again = h.runtime->BuildState(std::nullopt, h.settings, dealt_at + std::chrono::seconds(12));
  assert(first.action_deadline() == ToIso8601(dealt_at + std::chrono::seconds(30)));
  assert(again.action_deadline() == first.action_deadline());

  auto timer = pokertable::core::DecodeTurnTimer(pokertable::testing::ActiveHand(*h.repo, h.table_id)->timeout_tracking_json);
  assert(timer.actor_user_id() == 1);
  assert(timer.turn_started_at_ms() == ToUnixMillis(dealt_at));

  h.now += std::chrono::seconds(10);
  h.Act(1, pokertable::v1::ACTION_TYPE_CALL);
  const auto option_deadline = ToIso8601(h.now + std::chrono::seconds(30));
  assert(h.runtime->BuildState(std::nullopt, h.settings, h.now).action_deadline() == option_deadline);

  // a restored runtime keeps the same clock
  TableRuntime restored(h.table_id, h.factory);
  restored.Refresh(LoadTable(*h.repo, h.table_id), ActiveSeats(*h.repo, h.table_id));
  restored.Restore(*pokertable::testing::ActiveHand(*h.repo, h.table_id));
  const auto later = restored.BuildState(std::nullopt, h.settings, h.now + std::chrono::seconds(25));
  assert(later.current_actor() == 2);
  assert(later.action_deadline() == option_deadline);

  // nobody is on the clock between hands
  h.Act(2, pokertable::v1::ACTION_TYPE_RAISE, 40);
  h.Act(1, pokertable::v1::ACTION_TYPE_FOLD);
  assert(h.last_ended.has_value());
  assert(h.runtime->BuildState(std::nullopt, h.settings, h.now).action_deadline().empty());
  timer = pokertable::core::DecodeTurnTimer(pokertable::testing::ActiveHand(*h.repo, h.table_id)->timeout_tracking_json);
  assert(timer.actor_user_id() == 0);
  assert(timer.turn_started_at_ms() == 0);
}

void TestCompletionUsesOperationClock() {
  Harness h({{1, 1000}, {2, 1000}});
  h.now = pokertable::util::FromUnixMillis(1700000000000);
  PlayShowdownHand(h);
  assert(h.last_ended.has_value());

  auto       tx     = h.repo->Begin();
  const auto ledger = h.repo->ListLedgerEntries(*tx, h.table_id);
  assert(!ledger.empty());
  for (const auto& entry : ledger) assert(entry.created_at_ms == 1700000000000);
  tx->Commit();
}

void TestExpiryIsJudgedAtGivenTime() {
  Harness h({{1, 1000}, {2, 1000}});
  auto    table       = LoadTable(*h.repo, h.table_id);
  table.expires_at_ms = 1700000060000;

  const auto before = pokertable::util::FromUnixMillis(1700000000000);
  const auto after  = pokertable::util::FromUnixMillis(1700000060000);

  auto tx = h.repo->Begin();
  assert(!h.lifecycle.ComputeInactivity(*h.repo, *tx, table, before).should_end);
  const auto verdict = h.lifecycle.ComputeInactivity(*h.repo, *tx, table, after);
  assert(verdict.should_end);
  assert(verdict.reason == "table_expired");
  tx->Commit();
}

void TestTableBlindsOverrideDefaults() {
  Harness h({{1, 1000}, {2, 1000}});
  const auto blinds = h.runtime->ResolveBlinds(h.settings);
  assert(blinds.small_blind == 5);
  assert(blinds.big_blind == 10);
  assert(blinds.ante == 0);

  auto table        = LoadTable(*h.repo, h.table_id);
  table.config_json = "{}";
  h.runtime->Refresh(table, ActiveSeats(*h.repo, h.table_id));
  GameSettings defaults;
  assert(h.runtime->ResolveBlinds(defaults).big_blind == 50);
}

} // namespace

int main() {
  TestStartHandPersistsRow();
  TestCompletionWritesResults();
  TestReadyPlayersStartNextHand();
  TestOutOfPhaseRequestsAreRejected();
  TestWaitMustElapseBeforeTableEnds();
  TestForcedCompletionWithNobodyReady();
  TestBustedPlayerCannotReady();
  TestUncalledChipsGoBackBeforeRake();
  TestHeadsUpAllInRunsOutBoard();
  TestPreflopFoldKeepsSeat();
  TestActionDeadlineCountsFromTurnStart();
  TestCompletionUsesOperationClock();
  TestExpiryIsJudgedAtGivenTime();
  TestTableBlindsOverrideDefaults();

  std::cout << "table_runtime_test: pass\n";
  return 0;
}
