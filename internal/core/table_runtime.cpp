#include "table_runtime.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

#include "internal/core/persistence.hpp"
#include "internal/core/snapshot_codec.hpp"
#include "internal/model/hand_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pokertable::core {

using pokertable::observability::BoolField;
using pokertable::observability::IntField;
using pokertable::observability::StringField;

namespace {

constexpr const char* kHandEndedType  = "hand_ended";
constexpr const char* kTableStateType = "table_state";

void FillAllowed(const engine::LegalActions& legal, pokertable::v1::AllowedActions* out) {
  out->set_can_fold(legal.can_fold);
  out->set_can_check(legal.can_check);
  out->set_can_call(legal.can_call);
  out->set_call_amount(legal.call_amount);
  out->set_can_bet(legal.can_bet);
  out->set_can_raise(legal.can_raise);
  out->set_min_raise_to(legal.min_raise_to);
  out->set_max_raise_to(legal.max_raise_to);
  out->set_current_pot(legal.current_pot);
  out->set_player_stack(legal.player_stack);
}

} // namespace

TableRuntime::TableRuntime(int64_t table_id, engine::EngineFactory& factory) : table_id_(table_id), factory_(factory) {
  table_.id = table_id;
}

void TableRuntime::Refresh(db::model::TableRecord table, std::vector<db::model::SeatRecord> seats) {
  table_ = std::move(table);
  seats_ = std::move(seats);
}

// ------------------------------------------------------------------
// Lookup helpers
// ------------------------------------------------------------------

db::model::SeatRecord* TableRuntime::FindSeat(int64_t user_id) {
  for (auto& seat : seats_) {
    if (seat.user_id == user_id && seat.IsActive()) return &seat;
  }
  return nullptr;
}

const db::model::SeatRecord* TableRuntime::FindSeat(int64_t user_id) const {
  for (const auto& seat : seats_) {
    if (seat.user_id == user_id && seat.IsActive()) return &seat;
  }
  return nullptr;
}

int TableRuntime::PositionOf(int64_t user_id) const {
  const auto* seat = FindSeat(user_id);
  return seat ? seat->position : -1;
}

model::HandStatus TableRuntime::Status() const {
  return current_hand_ ? current_hand_->status : pokertable::v1::HAND_STATUS_UNSPECIFIED;
}

void TableRuntime::AssignOrder(std::vector<int64_t> order) {
  player_order_ = std::move(order);
  user_to_index_.clear();
  for (size_t i = 0; i < player_order_.size(); ++i) {
    user_to_index_[player_order_[i]] = static_cast<int>(i);
  }
}

Blinds TableRuntime::ResolveBlinds(const GameSettings& settings) const {
  const auto config = DecodeTableConfig(table_.config_json);
  Blinds     blinds;
  blinds.small_blind = config.has_small_blind() ? config.small_blind() : settings.default_small_blind;
  blinds.big_blind   = config.has_big_blind() ? config.big_blind() : settings.default_big_blind;
  blinds.ante        = config.has_ante() ? config.ante() : 0;
  return blinds;
}

rake::RakeConfig TableRuntime::ResolveRake(const GameSettings& settings) const {
  const auto       config = DecodeTableConfig(table_.config_json);
  rake::RakeConfig rake   = settings.rake;
  if (config.has_rake_basis_points()) rake.rate_basis_points = config.rake_basis_points();
  if (config.has_rake_cap()) rake.cap = config.rake_cap();
  return rake;
}

// ------------------------------------------------------------------
// Restore / checkpoint
// ------------------------------------------------------------------

void TableRuntime::Restore(const db::model::HandRecord& hand) {
  const auto snapshot = DecodeSnapshot(hand.engine_state_json);
  auto       engine   = factory_.Restore(snapshot);

  std::vector<int64_t> order(snapshot.hand_player_order().begin(), snapshot.hand_player_order().end());
  if (order.empty()) {
    // Snapshots written before hand_player_order existed. Wrong if seating changed mid-hand.
    for (const auto& seat : seats_) {
      if (seat.IsActive() && static_cast<int>(order.size()) < engine->PlayerCount()) order.push_back(seat.user_id);
    }
    POKERTABLE_LOG_WARN("engine restored with legacy seat-order fallback",
                        {IntField("table_id", table_id_), IntField("hand_no", hand.hand_no), IntField("players", engine->PlayerCount())});
  }
  if (static_cast<int>(order.size()) != engine->PlayerCount()) {
    throw util::RestorationError(fmt::format("hand {}: player order has {} entries, engine has {} players", hand.hand_no, order.size(),
                                             engine->PlayerCount()));
  }

  const auto inter = DecodeInterHand(hand.inter_hand_json);
  const auto timer = DecodeTurnTimer(hand.timeout_tracking_json);

  engine_ = std::move(engine);
  AssignOrder(std::move(order));
  current_hand_ = hand;
  ready_players_.clear();
  ready_players_.insert(inter.ready_user_ids().begin(), inter.ready_user_ids().end());
  inter_hand_wait_start_.reset();
  if (inter.wait_started_at_ms() != 0) inter_hand_wait_start_ = util::FromUnixMillis(inter.wait_started_at_ms());
  last_hand_ended_.reset();
  if (inter.has_hand_ended()) last_hand_ended_ = inter.hand_ended();
  event_seq_            = inter.event_seq();
  last_button_position_ = PositionOf(player_order_[engine_->ButtonIndex()]);
  turn_started_at_.reset();
  if (timer.turn_started_at_ms() != 0) turn_started_at_ = util::FromUnixMillis(timer.turn_started_at_ms());

  POKERTABLE_LOG_INFO("engine restored", {IntField("table_id", table_id_), IntField("hand_no", hand.hand_no),
                                          StringField("status", model::ToString(hand.status)), IntField("version", static_cast<int64_t>(hand.version))});
}

void TableRuntime::Unload() {
  engine_.reset();
  current_hand_.reset();
  AssignOrder({});
  ready_players_.clear();
  inter_hand_wait_start_.reset();
  turn_started_at_.reset();
}

TableRuntime::Checkpoint TableRuntime::Capture() const {
  Checkpoint checkpoint;
  checkpoint.table = table_;
  checkpoint.seats = seats_;
  if (engine_) checkpoint.engine = engine_->Serialize();
  checkpoint.player_order          = player_order_;
  checkpoint.current_hand          = current_hand_;
  checkpoint.ready_players         = ready_players_;
  checkpoint.inter_hand_wait_start = inter_hand_wait_start_;
  checkpoint.event_seq             = event_seq_;
  checkpoint.last_hand_ended       = last_hand_ended_;
  checkpoint.last_button_position  = last_button_position_;
  checkpoint.turn_started_at       = turn_started_at_;
  return checkpoint;
}

void TableRuntime::RollbackTo(const Checkpoint& checkpoint) {
  table_ = checkpoint.table;
  seats_ = checkpoint.seats;
  engine_.reset();
  if (checkpoint.engine) engine_ = factory_.Restore(*checkpoint.engine);
  AssignOrder(checkpoint.player_order);
  current_hand_          = checkpoint.current_hand;
  ready_players_         = checkpoint.ready_players;
  inter_hand_wait_start_ = checkpoint.inter_hand_wait_start;
  event_seq_             = checkpoint.event_seq;
  last_hand_ended_       = checkpoint.last_hand_ended;
  last_button_position_  = checkpoint.last_button_position;
  turn_started_at_       = checkpoint.turn_started_at;
}

// ------------------------------------------------------------------
// Hand start
// ------------------------------------------------------------------

void TableRuntime::SeatEveryone(HandContext& ctx) {
  for (auto& seat : seats_) {
    if (!seat.IsActive() || !seat.is_sitting_out_next_hand) continue;
    seat.is_sitting_out_next_hand = false;
    ThrowIfDbError(ctx.repo.UpdateSeat(ctx.tx, seat), "seat player");
  }
}

std::optional<pokertable::v1::HandEndedEvent> TableRuntime::StartHand(HandContext& ctx) {
  if (model::IsTerminal(table_.status)) {
    throw util::InvalidState(fmt::format("table {} is {}", table_id_, model::ToString(table_.status)));
  }
  if (current_hand_ && current_hand_->status != pokertable::v1::HAND_STATUS_ENDED) {
    throw util::InvalidState(fmt::format("table {} already has hand {} in progress", table_id_, current_hand_->hand_no));
  }

  const auto blinds = ResolveBlinds(ctx.settings);

  std::vector<const db::model::SeatRecord*> eligible;
  for (const auto& seat : seats_) {
    if (seat.IsActive() && !seat.is_sitting_out_next_hand && seat.chips > 0) eligible.push_back(&seat);
  }
  if (eligible.size() < 2) {
    throw util::ValidationError(fmt::format("table {} needs at least two funded players to start a hand", table_id_));
  }

  // Button moves to the next eligible seat after the previous button.
  int button = 0;
  for (size_t i = 0; i < eligible.size(); ++i) {
    if (eligible[i]->position > last_button_position_) {
      button = static_cast<int>(i);
      break;
    }
  }

  engine::EngineConfig config;
  config.small_blind  = blinds.small_blind;
  config.big_blind    = blinds.big_blind;
  config.ante         = blinds.ante;
  config.button_index = button;
  std::vector<int64_t> order;
  for (const auto* seat : eligible) {
    config.starting_stacks.push_back(seat->chips);
    order.push_back(seat->user_id);
  }

  auto engine = factory_.Create(config);
  engine->DealHoleCards();

  db::model::HandRecord hand;
  hand.table_id      = table_id_;
  hand.hand_no       = ctx.repo.MaxHandNo(ctx.tx, table_id_).value_or(0) + 1;
  hand.status        = pokertable::v1::HAND_STATUS_PREFLOP;
  hand.version       = 1;
  hand.started_at_ms = util::ToUnixMillis(ctx.now);

  engine_ = std::move(engine);
  AssignOrder(std::move(order));
  current_hand_ = hand;
  ready_players_.clear();
  inter_hand_wait_start_.reset();
  last_hand_ended_.reset();
  event_seq_            = 1;
  last_button_position_ = eligible[button]->position;
  turn_started_at_.reset();

  current_hand_->engine_state_json = EncodeSnapshot(SnapshotWithOrder());
  current_hand_->inter_hand_json   = EncodeInterHand(BuildInterHandState());
  ThrowIfDbError(ctx.repo.InsertHand(ctx.tx, *current_hand_), fmt::format("start hand {}", current_hand_->hand_no));

  table_.status            = pokertable::v1::TABLE_STATUS_ACTIVE;
  table_.expires_at_ms     = 0;
  table_.last_action_at_ms = util::ToUnixMillis(ctx.now);
  ThrowIfDbError(ctx.repo.UpdateTable(ctx.tx, table_), "activate table");

  POKERTABLE_LOG_INFO("hand started", {IntField("table_id", table_id_), IntField("hand_no", current_hand_->hand_no),
                                       IntField("players", static_cast<int64_t>(player_order_.size())),
                                       IntField("button_position", last_button_position_), IntField("small_blind", blinds.small_blind),
                                       IntField("big_blind", blinds.big_blind)});

  return AdvanceAndPersist(ctx);
}

// ------------------------------------------------------------------
// Actions
// ------------------------------------------------------------------

std::optional<pokertable::v1::HandEndedEvent> TableRuntime::HandleAction(HandContext& ctx, int64_t user_id, model::ActionType action,
                                                                         std::optional<int64_t> amount) {
  if (action == pokertable::v1::ACTION_TYPE_READY) {
    MarkPlayerReady(ctx, user_id);
    return std::nullopt;
  }
  if (!engine_ || !current_hand_ || current_hand_->status == pokertable::v1::HAND_STATUS_ENDED) {
    throw util::NoActiveHand();
  }
  if (current_hand_->status == pokertable::v1::HAND_STATUS_INTER_HAND_WAIT) {
    throw util::ValidationError("hand is over; waiting for players to signal ready");
  }

  const auto it = user_to_index_.find(user_id);
  if (it == user_to_index_.end()) {
    throw util::ValidationError(fmt::format("user {} is not playing this hand", user_id));
  }
  const int  player = it->second;
  const auto actor  = engine_->ActorIndex();
  if (!actor) {
    throw util::ValidationError("no player is due to act");
  }
  if (*actor != player) {
    throw util::ValidationError(fmt::format("not your turn: waiting for user {}", player_order_[*actor]));
  }

  const auto legal     = engine_->LegalActionsFor(player);
  int64_t    committed = 0;
  switch (action) {
    case pokertable::v1::ACTION_TYPE_FOLD:
      engine_->Fold();
      break;
    case pokertable::v1::ACTION_TYPE_CHECK:
    case pokertable::v1::ACTION_TYPE_CALL:
      committed = legal.call_amount;
      engine_->CheckOrCall();
      break;
    case pokertable::v1::ACTION_TYPE_BET:
    case pokertable::v1::ACTION_TYPE_RAISE:
      if (!amount) {
        throw util::ValidationError(fmt::format("{} requires an amount", model::ToString(action)));
      }
      committed = *amount;
      engine_->BetOrRaiseTo(*amount);
      break;
    case pokertable::v1::ACTION_TYPE_ALL_IN:
      if (legal.can_bet || legal.can_raise) {
        committed = legal.max_raise_to;
        engine_->BetOrRaiseTo(legal.max_raise_to);
      } else if (legal.call_amount >= legal.player_stack) {
        committed = legal.call_amount;
        engine_->CheckOrCall();
      } else {
        throw util::IllegalActionError("all-in raise is not allowed in this position");
      }
      break;
    default:
      throw util::ValidationError(fmt::format("unsupported action {}", static_cast<int>(action)));
  }
  ++event_seq_;

  db::model::ActionRecord record;
  record.hand_id       = current_hand_->id;
  record.user_id       = user_id;
  record.type          = action;
  record.amount        = committed;
  record.created_at_ms = util::ToUnixMillis(ctx.now);
  ThrowIfDbError(ctx.repo.InsertAction(ctx.tx, record), "record action");

  table_.last_action_at_ms = util::ToUnixMillis(ctx.now);
  ThrowIfDbError(ctx.repo.UpdateTable(ctx.tx, table_), "touch table");

  POKERTABLE_LOG_INFO("action processed", {IntField("table_id", table_id_), IntField("hand_no", current_hand_->hand_no),
                                           IntField("user_id", user_id), StringField("action", model::ToString(action)),
                                           IntField("amount", committed), IntField("event_seq", static_cast<int64_t>(event_seq_))});

  return AdvanceAndPersist(ctx);
}

std::optional<pokertable::v1::HandEndedEvent> TableRuntime::AdvanceAndPersist(HandContext& ctx) {
  while (!engine_->IsHandComplete() && !engine_->HasPendingActor()) {
    const int needed = engine_->BoardCardsNeeded();
    if (needed == 0) {
      throw util::InvalidState(fmt::format("hand {}: no actor pending but no street left to deal", current_hand_->hand_no));
    }
    engine_->DealBoard(needed);
    ++event_seq_;
    current_hand_->status = model::Transition(current_hand_->status, model::StreetDealt{engine_->StreetIndex()});

    POKERTABLE_LOG_DEBUG("street dealt", {IntField("table_id", table_id_), IntField("hand_no", current_hand_->hand_no),
                                          StringField("street", model::ToString(current_hand_->status)), IntField("cards", needed)});
  }

  std::optional<pokertable::v1::HandEndedEvent> ended;
  if (engine_->IsHandComplete()) {
    ended = CompleteHand(ctx);
  }
  // Every call here hands the turn to a new actor, or to nobody.
  turn_started_at_.reset();
  if (engine_->HasPendingActor()) turn_started_at_ = ctx.now;
  PersistHand(ctx);
  return ended;
}

// ------------------------------------------------------------------
// Completion
// ------------------------------------------------------------------

pokertable::v1::HandEndedEvent TableRuntime::CompleteHand(HandContext& ctx) {
  auto&      hand     = *current_hand_;
  const auto snapshot = engine_->Serialize();
  const auto winners  = engine_->Winners();
  const auto pot      = engine_->TotalPot();

  // (a) rake, deducted from winners in proportion to their winnings
  const int64_t        rake = rake::ComputeRake(pot, ResolveRake(ctx.settings));
  std::vector<int64_t> amounts;
  for (const auto& winner : winners) amounts.push_back(winner.amount);
  const auto deductions = rake::DistributeRake(amounts, rake);

  pokertable::v1::HandEndedEvent event;
  event.set_type(kHandEndedType);
  event.set_table_id(table_id_);
  event.set_hand_no(hand.hand_no);
  event.set_rake(rake);
  event.set_pot(pot);
  for (size_t i = 0; i < winners.size(); ++i) {
    auto* out = event.add_winners();
    out->set_user_id(player_order_[winners[i].player_index]);
    out->set_amount(amounts[i]);
    out->set_hand_rank(winners[i].hand_rank);
    for (const auto& card : winners[i].best_hand_cards) out->add_best_hand_cards(card);
    out->set_pot_index(winners[i].pot_index);
  }
  for (const auto& card : engine_->BoardCards()) event.add_board(card);
  if (engine_->WentToShowdown()) {
    const auto folded = engine_->FoldedPlayers();
    for (int i = 0; i < engine_->PlayerCount(); ++i) {
      if (folded[i]) continue;
      auto& view = (*event.mutable_showdown_cards())[player_order_[i]];
      for (const auto& card : engine_->HoleCards(i)) view.add_cards(card);
    }
  }

  // (b) pots and history
  for (int i = 0; i < snapshot.pots_size(); ++i) {
    ThrowIfDbError(ctx.repo.InsertPot(ctx.tx, {hand.id, i, snapshot.pots(i).amount()}), "record pot");
  }
  hand.pot_size = pot;

  db::model::HandHistoryRecord history;
  history.table_id      = table_id_;
  history.hand_no       = hand.hand_no;
  history.payload_json  = ToJson(event);
  history.created_at_ms = util::ToUnixMillis(ctx.now);
  ThrowIfDbError(ctx.repo.InsertHandHistory(ctx.tx, history), "record hand history");

  // (c) chip movement through the wallet
  collab::HandResult result;
  result.pot  = pot;
  result.rake = rake;
  for (int i = 0; i < engine_->PlayerCount(); ++i) {
    result.deltas[player_order_[i]] = engine_->Stacks()[i] - snapshot.pre_hand_stacks(i);
  }
  for (size_t i = 0; i < winners.size(); ++i) {
    result.deltas[player_order_[winners[i].player_index]] -= deductions[i];
  }
  ctx.wallet.ApplyHandResult(ctx.repo, ctx.tx, hand, table_, seats_, result, ctx.now);
  ctx.wallet.RecordRake(ctx.repo, ctx.tx, rake, hand.id, table_id_, ctx.now);

  // (d) everyone must opt in to the next hand
  for (auto& seat : seats_) {
    if (!seat.IsActive()) continue;
    seat.is_sitting_out_next_hand = true;
    ThrowIfDbError(ctx.repo.UpdateSeat(ctx.tx, seat), "sit out after hand");
  }

  // (e)
  ready_players_.clear();

  // (f) evaluated only, acted on when the inter-hand phase resolves
  const auto verdict = ctx.lifecycle.ComputeInactivity(ctx.repo, ctx.tx, table_, ctx.now);

  // (g)
  hand.status            = model::Transition(hand.status, model::HandCompleted{});
  inter_hand_wait_start_ = ctx.now;
  const auto deadline    = ctx.now + std::chrono::seconds(ctx.settings.post_hand_delay_seconds);

  event.set_status(hand.status);
  event.set_next_hand_in(static_cast<int32_t>(ctx.settings.post_hand_delay_seconds));
  event.set_inter_hand_wait_deadline(util::ToIso8601(deadline));
  event.add_allowed_actions(pokertable::v1::ACTION_TYPE_READY);
  event.set_table_will_end(verdict.should_end);
  event.set_end_reason(verdict.reason);
  last_hand_ended_ = event;

  POKERTABLE_LOG_INFO("hand completed", {IntField("table_id", table_id_), IntField("hand_no", hand.hand_no), IntField("pot", pot),
                                         IntField("rake", rake), IntField("winners", static_cast<int64_t>(winners.size())),
                                         BoolField("showdown", engine_->WentToShowdown()), BoolField("table_will_end", verdict.should_end)});
  return event;
}

pokertable::v1::EngineSnapshot TableRuntime::SnapshotWithOrder() const {
  auto snapshot = engine_->Serialize();
  for (auto user_id : player_order_) snapshot.add_hand_player_order(user_id);
  return snapshot;
}

pokertable::v1::InterHandState TableRuntime::BuildInterHandState() const {
  pokertable::v1::InterHandState state;
  for (auto user_id : ready_players_) state.add_ready_user_ids(user_id);
  if (inter_hand_wait_start_) state.set_wait_started_at_ms(util::ToUnixMillis(*inter_hand_wait_start_));
  if (last_hand_ended_) *state.mutable_hand_ended() = *last_hand_ended_;
  state.set_event_seq(event_seq_);
  return state;
}

pokertable::v1::TurnTimer TableRuntime::BuildTurnTimer() const {
  pokertable::v1::TurnTimer timer;
  const auto                actor = engine_ ? engine_->ActorIndex() : std::optional<int>{};
  if (actor && turn_started_at_) {
    timer.set_actor_user_id(player_order_[*actor]);
    timer.set_turn_started_at_ms(util::ToUnixMillis(*turn_started_at_));
  }
  return timer;
}

void TableRuntime::PersistHand(HandContext& ctx) {
  current_hand_->engine_state_json     = EncodeSnapshot(SnapshotWithOrder());
  current_hand_->inter_hand_json       = EncodeInterHand(BuildInterHandState());
  current_hand_->timeout_tracking_json = EncodeTurnTimer(BuildTurnTimer());
  current_hand_->version += 1;
  ThrowIfDbError(ctx.repo.UpdateHand(ctx.tx, *current_hand_), fmt::format("persist hand {}", current_hand_->hand_no));
}

// ------------------------------------------------------------------
// Inter-hand phase
// ------------------------------------------------------------------

void TableRuntime::MarkPlayerReady(HandContext& ctx, int64_t user_id) {
  if (!engine_ || Status() != pokertable::v1::HAND_STATUS_INTER_HAND_WAIT) {
    throw util::ValidationError("ready is only accepted between hands");
  }
  const auto* seat = FindSeat(user_id);
  if (!seat) {
    throw util::ValidationError(fmt::format("user {} is not seated at table {}", user_id, table_id_));
  }

  const auto blinds = ResolveBlinds(ctx.settings);
  const auto check  = ctx.lifecycle.CheckBalanceRequirement(*seat, blinds.small_blind, blinds.big_blind, blinds.ante);
  if (!check.ok) {
    throw util::ValidationError(fmt::format("insufficient balance: {} chips required, {} available", check.required, seat->chips));
  }

  if (ready_players_.insert(user_id).second) {
    ++event_seq_;
  }
  PersistHand(ctx);

  POKERTABLE_LOG_INFO("player ready", {IntField("table_id", table_id_), IntField("hand_no", current_hand_->hand_no), IntField("user_id", user_id),
                                       IntField("ready", static_cast<int64_t>(ready_players_.size()))});
}

InterHandOutcome TableRuntime::CompleteInterHandPhase(HandContext& ctx, bool force) {
  if (!engine_ || Status() != pokertable::v1::HAND_STATUS_INTER_HAND_WAIT) {
    throw util::InvalidState(fmt::format("table {} is not waiting between hands", table_id_));
  }

  bool all_ready = true;
  for (const auto& seat : seats_) {
    if (seat.IsActive() && !ready_players_.contains(seat.user_id)) all_ready = false;
  }
  const auto wait_start = inter_hand_wait_start_.value_or(ctx.now);
  const bool elapsed    = ctx.now >= wait_start + std::chrono::seconds(ctx.settings.post_hand_delay_seconds);
  if (!all_ready && !force && !elapsed) {
    throw util::InvalidState("inter-hand wait is still running and not every player is ready");
  }

  // Close the old hand.
  current_hand_->status      = model::Transition(current_hand_->status, model::InterHandResolved{});
  current_hand_->ended_at_ms = util::ToUnixMillis(ctx.now);
  PersistHand(ctx);
  const int32_t finished_hand_no = current_hand_->hand_no;

  // Ready players that can still cover the blinds play the next hand.
  const auto        blinds = ResolveBlinds(ctx.settings);
  std::set<int64_t> willing;
  for (auto& seat : seats_) {
    if (!seat.IsActive()) continue;
    const bool ready = ready_players_.contains(seat.user_id) &&
                       ctx.lifecycle.CheckBalanceRequirement(seat, blinds.small_blind, blinds.big_blind, blinds.ante).ok;
    if (ready) willing.insert(seat.user_id);
    seat.is_sitting_out_next_hand = !ready;
    ThrowIfDbError(ctx.repo.UpdateSeat(ctx.tx, seat), "apply ready votes");
  }

  engine_.reset();
  AssignOrder({});
  ready_players_.clear();
  inter_hand_wait_start_.reset();
  turn_started_at_.reset();

  POKERTABLE_LOG_INFO("inter-hand phase resolved", {IntField("table_id", table_id_), IntField("hand_no", finished_hand_no),
                                                    IntField("ready", static_cast<int64_t>(willing.size())), BoolField("forced", force)});

  if (willing.size() < 2) {
    const std::string reason = willing.empty() ? "no_players_ready" : "not_enough_players_ready";
    const auto        now_ms = util::ToUnixMillis(ctx.now);
    for (auto& seat : seats_) {
      if (!seat.IsActive()) continue;
      seat.left_at_ms = now_ms;
      ThrowIfDbError(ctx.repo.UpdateSeat(ctx.tx, seat), "release seat");
    }
    table_.status            = pokertable::v1::TABLE_STATUS_ENDED;
    table_.last_action_at_ms = now_ms;
    ThrowIfDbError(ctx.repo.UpdateTable(ctx.tx, table_), "end table");

    current_hand_.reset();
    last_hand_ended_.reset();
    seats_.clear();

    POKERTABLE_LOG_INFO("table ended", {IntField("table_id", table_id_), StringField("reason", reason)});
    return {true, reason};
  }

  StartHand(ctx);
  return {};
}

// ------------------------------------------------------------------
// Viewer state
// ------------------------------------------------------------------

pokertable::v1::TableState TableRuntime::BuildState(std::optional<int64_t> viewer_user_id, const GameSettings& settings,
                                                    util::TimePoint now) const {
  pokertable::v1::TableState state;
  state.set_type(kTableStateType);
  state.set_table_id(table_id_);
  state.set_table_status(table_.status);
  state.set_event_seq(event_seq_);
  if (last_hand_ended_) *state.mutable_hand_result() = *last_hand_ended_;

  if (!engine_ || !current_hand_) {
    for (const auto& seat : seats_) {
      if (!seat.IsActive()) continue;
      auto* player = state.add_players();
      player->set_user_id(seat.user_id);
      player->set_position(seat.position);
      player->set_stack(seat.chips);
      player->set_is_sitting_out_next_hand(seat.is_sitting_out_next_hand);
    }
    return state;
  }

  const auto status = current_hand_->status;
  state.set_hand_no(current_hand_->hand_no);
  state.set_status(status);
  state.set_street(std::string(model::ToString(model::StatusForStreet(engine_->StreetIndex()))));
  for (const auto& card : engine_->BoardCards()) state.add_board(card);
  state.set_pot(engine_->TotalPot());
  state.set_current_bet(engine_->CurrentBet());
  state.set_button_position(PositionOf(player_order_[engine_->ButtonIndex()]));

  const auto actor = engine_->ActorIndex();
  if (actor) {
    state.set_current_actor(player_order_[*actor]);
    const auto turn_start = turn_started_at_.value_or(now);
    state.set_action_deadline(util::ToIso8601(turn_start + std::chrono::seconds(settings.turn_timeout_seconds)));
  }

  const bool showdown = engine_->IsHandComplete() && engine_->WentToShowdown();
  const auto folded   = engine_->FoldedPlayers();
  for (int i = 0; i < engine_->PlayerCount(); ++i) {
    const auto user_id = player_order_[i];
    auto*      player  = state.add_players();
    player->set_user_id(user_id);
    player->set_position(PositionOf(user_id));
    player->set_stack(engine_->Stacks()[i]);
    player->set_bet(engine_->Bets()[i]);
    player->set_in_hand(!folded[i]);
    player->set_is_all_in(engine_->IsAllIn(i));
    player->set_is_button(i == engine_->ButtonIndex());
    player->set_is_actor(actor && *actor == i);
    if (const auto* seat = FindSeat(user_id)) player->set_is_sitting_out_next_hand(seat->is_sitting_out_next_hand);

    const bool own = viewer_user_id && *viewer_user_id == user_id;
    if (own || (showdown && !folded[i])) {
      for (const auto& card : engine_->HoleCards(i)) player->add_hole_cards(card);
    }
    if (own) {
      for (const auto& card : engine_->HoleCards(i)) state.add_hero_cards(card);
      if (actor && *actor == i) FillAllowed(engine_->LegalActionsFor(i), state.mutable_allowed_actions());
    }
  }

  if (status == pokertable::v1::HAND_STATUS_INTER_HAND_WAIT) {
    const auto wait_start = inter_hand_wait_start_.value_or(now);
    state.set_inter_hand_wait(true);
    state.set_inter_hand_wait_seconds(static_cast<int32_t>(settings.post_hand_delay_seconds));
    state.set_inter_hand_wait_deadline(util::ToIso8601(wait_start + std::chrono::seconds(settings.post_hand_delay_seconds)));
    for (auto user_id : ready_players_) state.add_ready_players(user_id);
    if (viewer_user_id && FindSeat(*viewer_user_id)) {
      state.mutable_allowed_actions()->set_can_ready(!ready_players_.contains(*viewer_user_id));
    }
  }
  return state;
}

} // namespace pokertable::core
