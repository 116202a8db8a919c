#include "internal/engine/holdem_engine.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <set>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "internal/engine/hand_evaluator.hpp"
#include "internal/util/errors.hpp"

namespace pokertable::engine {

namespace {

constexpr int      kMinPlayers      = 2;
constexpr int      kMaxPlayers      = 8;
constexpr int      kRiver           = 3;
constexpr uint32_t kSnapshotVersion = 1;

using pokertable::util::IllegalActionError;
using pokertable::util::RestorationError;
using pokertable::util::ValidationError;

Card ParseOrThrow(const std::string& text) {
  auto card = ParseCard(text);
  if (!card) {
    throw RestorationError("engine snapshot: unknown card '" + text + "'");
  }
  return *card;
}

template <typename Container>
void RequireSize(const Container& values, int expected, const char* field) {
  if (static_cast<int>(values.size()) != expected) {
    throw RestorationError(fmt::format("engine snapshot: {} has {} entries, expected {}", field, values.size(), expected));
  }
}

} // namespace

std::vector<Card> ShuffledDeck() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto                                deck = FullDeck();
  std::shuffle(deck.begin(), deck.end(), rng);
  return deck;
}

HoldemEngine::HoldemEngine(const EngineConfig& config)
    : small_blind_(config.small_blind),
      big_blind_(config.big_blind),
      ante_(config.ante),
      button_(config.button_index),
      starting_stacks_(config.starting_stacks),
      stacks_(config.starting_stacks) {
  const int n = static_cast<int>(stacks_.size());
  if (n < kMinPlayers || n > kMaxPlayers) {
    throw ValidationError(fmt::format("holdem: player count {} outside {}..{}", n, kMinPlayers, kMaxPlayers));
  }
  if (small_blind_ <= 0 || big_blind_ < small_blind_ || ante_ < 0) {
    throw ValidationError("holdem: blinds must satisfy 0 < small_blind <= big_blind and ante >= 0");
  }
  if (button_ < 0 || button_ >= n) {
    throw ValidationError("holdem: button index out of range");
  }
  for (auto stack : stacks_) {
    if (stack <= 0) throw ValidationError("holdem: every player needs a positive stack");
  }

  deck_ = config.deck.empty() ? ShuffledDeck() : config.deck;
  std::set<int> seen;
  for (const auto& card : deck_) {
    if (!seen.insert(CardIndex(card)).second) {
      throw ValidationError("holdem: duplicate card " + ToString(card) + " in deck");
    }
  }
  if (static_cast<int>(deck_.size()) < 2 * n + 5) {
    throw ValidationError("holdem: deck too small for this many players");
  }

  bets_.assign(n, 0);
  contributions_.assign(n, 0);
  folded_.assign(n, false);
  acted_.assign(n, false);
  hole_.assign(n, {});
  last_raise_size_ = big_blind_;

  if (ante_ > 0) {
    for (int i = 0; i < n; ++i) {
      const auto paid = std::min(ante_, stacks_[i]);
      stacks_[i] -= paid;
      contributions_[i] += paid;
    }
  }
  Commit(SmallBlindIndex(), std::min(small_blind_, stacks_[SmallBlindIndex()]));
  Commit(BigBlindIndex(), std::min(big_blind_, stacks_[BigBlindIndex()]));
}

// ------------------------------------------------------------------
// Positions
// ------------------------------------------------------------------

int HoldemEngine::Next(int index) const {
  return (index + 1) % PlayerCount();
}

int HoldemEngine::SmallBlindIndex() const {
  return PlayerCount() == 2 ? button_ : Next(button_);
}

int HoldemEngine::BigBlindIndex() const {
  return Next(SmallBlindIndex());
}

int HoldemEngine::CountCanAct() const {
  int count = 0;
  for (int i = 0; i < PlayerCount(); ++i) {
    if (!folded_[i] && stacks_[i] > 0) ++count;
  }
  return count;
}

int HoldemEngine::CountLive() const {
  return static_cast<int>(std::count(folded_.begin(), folded_.end(), false));
}

bool HoldemEngine::NeedsAction(int player) const {
  if (folded_[player] || stacks_[player] == 0) {
    return false;
  }
  if (bets_[player] < CurrentBet()) {
    return true;
  }
  return !acted_[player] && CountCanAct() >= 2;
}

std::optional<int> HoldemEngine::FindActor(int start) const {
  for (int step = 0; step < PlayerCount(); ++step) {
    const int candidate = (start + step) % PlayerCount();
    if (NeedsAction(candidate)) return candidate;
  }
  return std::nullopt;
}

int HoldemEngine::RequireActor() const {
  if (completed_) throw IllegalActionError("hand is already complete");
  if (!actor_) throw IllegalActionError("no player to act");
  return *actor_;
}

// ------------------------------------------------------------------
// Dealing
// ------------------------------------------------------------------

void HoldemEngine::DealHoleCards() {
  if (hole_dealt_) throw IllegalActionError("hole cards already dealt");

  const int n     = PlayerCount();
  const int first = SmallBlindIndex();
  size_t    next  = 0;
  for (int round = 0; round < 2; ++round) {
    for (int step = 0; step < n; ++step) {
      hole_[(first + step) % n].push_back(deck_[next++]);
    }
  }
  deck_.erase(deck_.begin(), deck_.begin() + static_cast<std::ptrdiff_t>(next));
  hole_dealt_ = true;

  const int start = n == 2 ? button_ : Next(BigBlindIndex());
  actor_          = FindActor(start);
  if (!actor_) ReturnUncalled();
}

int HoldemEngine::BoardCardsNeeded() const {
  if (!hole_dealt_ || completed_ || actor_ || street_ >= kRiver) {
    return 0;
  }
  return street_ == 0 ? 3 : 1;
}

void HoldemEngine::DealBoard(int count) {
  const int needed = BoardCardsNeeded();
  if (needed == 0 || count != needed) {
    throw IllegalActionError(fmt::format("cannot deal {} board cards now", count));
  }

  std::fill(bets_.begin(), bets_.end(), 0);
  board_.insert(board_.end(), deck_.begin(), deck_.begin() + count);
  deck_.erase(deck_.begin(), deck_.begin() + count);
  ++street_;
  OpenStreet();
}

void HoldemEngine::OpenStreet() {
  std::fill(acted_.begin(), acted_.end(), false);
  last_raise_size_ = big_blind_;
  actor_           = FindActor(Next(button_));
  if (!actor_ && street_ == kRiver) {
    Showdown();
  }
}

// ------------------------------------------------------------------
// Betting
// ------------------------------------------------------------------

void HoldemEngine::Commit(int player, int64_t amount) {
  stacks_[player] -= amount;
  bets_[player] += amount;
  contributions_[player] += amount;
}

// The part of the largest bet nobody else matched goes back to its owner
// once the betting round closes. It never enters a pot.
void HoldemEngine::ReturnUncalled() {
  const int n   = PlayerCount();
  int       top = 0;
  for (int i = 1; i < n; ++i) {
    if (bets_[i] > bets_[top]) top = i;
  }
  int64_t matched = 0;
  for (int i = 0; i < n; ++i) {
    if (i != top) matched = std::max(matched, bets_[i]);
  }
  const int64_t excess = bets_[top] - matched;
  if (excess <= 0) return;
  bets_[top] -= excess;
  contributions_[top] -= excess;
  stacks_[top] += excess;
}

int64_t HoldemEngine::CurrentBet() const {
  return bets_.empty() ? 0 : *std::max_element(bets_.begin(), bets_.end());
}

void HoldemEngine::Fold() {
  const int player = RequireActor();
  if (CurrentBet() - bets_[player] <= 0) {
    throw IllegalActionError("no reason to fold: checking is available");
  }
  folded_[player] = true;
  AfterAction(player);
}

void HoldemEngine::CheckOrCall() {
  const int player = RequireActor();
  Commit(player, std::min(CurrentBet() - bets_[player], stacks_[player]));
  acted_[player] = true;
  AfterAction(player);
}

void HoldemEngine::BetOrRaiseTo(int64_t to) {
  const int  player = RequireActor();
  const auto legal  = LegalActionsFor(player);
  if (!legal.can_bet && !legal.can_raise) {
    throw IllegalActionError("raising is not allowed in this position");
  }
  if (to > legal.max_raise_to || (to < legal.min_raise_to && to != legal.max_raise_to)) {
    throw IllegalActionError(fmt::format("cannot bet/raise to {}: allowed range {}..{}", to, legal.min_raise_to, legal.max_raise_to));
  }

  const int64_t raise_size = to - CurrentBet();
  Commit(player, to - bets_[player]);
  if (raise_size >= last_raise_size_) {
    last_raise_size_ = raise_size;
    std::fill(acted_.begin(), acted_.end(), false);
  }
  acted_[player] = true;
  AfterAction(player);
}

void HoldemEngine::AfterAction(int player) {
  if (CountLive() == 1) {
    AwardFoldOut();
    return;
  }
  actor_ = FindActor(Next(player));
  if (actor_) return;
  ReturnUncalled();
  if (street_ == kRiver) {
    Showdown();
  }
}

LegalActions HoldemEngine::LegalActionsFor(int player) const {
  LegalActions legal;
  legal.current_pot = TotalPot();
  if (player < 0 || player >= PlayerCount()) {
    return legal;
  }
  legal.player_stack = stacks_[player];
  if (completed_ || !actor_ || *actor_ != player) {
    return legal;
  }

  const int64_t current = CurrentBet();
  const int64_t to_call = current - bets_[player];
  legal.can_fold        = to_call > 0;
  legal.can_check       = to_call == 0;
  legal.can_call        = to_call > 0;
  legal.call_amount     = std::min(to_call, stacks_[player]);

  bool opponent_has_chips = false;
  for (int i = 0; i < PlayerCount(); ++i) {
    if (i != player && !folded_[i] && stacks_[i] > 0) opponent_has_chips = true;
  }

  const int64_t max_to = bets_[player] + stacks_[player];
  const bool    may_raise = max_to > current && !acted_[player] && opponent_has_chips;
  if (may_raise) {
    const int64_t min_to = current == 0 ? big_blind_ : current + last_raise_size_;
    legal.min_raise_to   = std::min(min_to, max_to);
    legal.max_raise_to   = max_to;
    legal.can_bet        = current == 0;
    legal.can_raise      = current > 0;
  }
  return legal;
}

// ------------------------------------------------------------------
// Resolution
// ------------------------------------------------------------------

std::vector<HoldemEngine::Pot> HoldemEngine::BuildPots() const {
  std::set<int64_t> levels;
  for (int i = 0; i < PlayerCount(); ++i) {
    if (!folded_[i] && contributions_[i] > 0) levels.insert(contributions_[i]);
  }

  std::vector<Pot> pots;
  int64_t          previous = 0;
  for (int64_t level : levels) {
    Pot pot;
    for (int i = 0; i < PlayerCount(); ++i) {
      pot.amount += std::min(contributions_[i], level) - std::min(contributions_[i], previous);
      if (!folded_[i] && contributions_[i] >= level) pot.eligible.push_back(i);
    }
    pots.push_back(std::move(pot));
    previous = level;
  }

  // Folded money above the highest live contribution stays with the last pot.
  int64_t overflow = 0;
  for (int i = 0; i < PlayerCount(); ++i) {
    if (folded_[i] && contributions_[i] > previous) overflow += contributions_[i] - previous;
  }
  if (overflow > 0 && !pots.empty()) {
    pots.back().amount += overflow;
  }
  return pots;
}

std::vector<Card> HoldemEngine::CardsFor(int player) const {
  std::vector<Card> cards = hole_[player];
  cards.insert(cards.end(), board_.begin(), board_.end());
  return cards;
}

void HoldemEngine::AwardFoldOut() {
  const int winner = static_cast<int>(std::find(folded_.begin(), folded_.end(), false) - folded_.begin());
  ReturnUncalled();
  const auto pot = TotalPot();
  stacks_[winner] += pot;
  std::fill(bets_.begin(), bets_.end(), 0);

  Winner result;
  result.player_index = winner;
  result.amount       = pot;
  const auto cards    = CardsFor(winner);
  if (cards.size() >= 5) {
    const auto best = EvaluateBest(cards);
    result.hand_rank = std::string(CategoryName(best.category));
    result.best_hand_cards = ToStrings({best.cards.begin(), best.cards.end()});
  }
  winners_   = {std::move(result)};
  actor_     = std::nullopt;
  completed_ = true;
}

void HoldemEngine::Showdown() {
  const auto pots = BuildPots();
  const int  n    = PlayerCount();

  std::vector<std::optional<HandValue>> values(n);
  for (int i = 0; i < n; ++i) {
    if (!folded_[i]) values[i] = EvaluateBest(CardsFor(i));
  }

  std::vector<int64_t> awarded(n, 0);
  std::vector<int>     first_pot(n, -1);
  for (size_t p = 0; p < pots.size(); ++p) {
    const auto& pot  = pots[p];
    int64_t     best = -1;
    for (int i : pot.eligible) best = std::max(best, values[i]->Score());

    // Seat order starting left of the button decides who gets odd chips.
    std::vector<int> winners;
    for (int step = 1; step <= n; ++step) {
      const int i = (button_ + step) % n;
      if (std::find(pot.eligible.begin(), pot.eligible.end(), i) != pot.eligible.end() && values[i]->Score() == best) {
        winners.push_back(i);
      }
    }

    const int64_t share     = pot.amount / static_cast<int64_t>(winners.size());
    int64_t       remainder = pot.amount % static_cast<int64_t>(winners.size());
    for (int i : winners) {
      int64_t amount = share;
      if (remainder > 0) {
        ++amount;
        --remainder;
      }
      awarded[i] += amount;
      if (first_pot[i] < 0) first_pot[i] = static_cast<int>(p);
    }
  }

  winners_.clear();
  for (int i = 0; i < n; ++i) {
    stacks_[i] += awarded[i];
    if (awarded[i] <= 0) continue;
    Winner winner;
    winner.player_index    = i;
    winner.amount          = awarded[i];
    winner.hand_rank       = std::string(CategoryName(values[i]->category));
    winner.best_hand_cards = ToStrings({values[i]->cards.begin(), values[i]->cards.end()});
    winner.pot_index       = first_pot[i];
    winners_.push_back(std::move(winner));
  }
  std::stable_sort(winners_.begin(), winners_.end(), [](const Winner& a, const Winner& b) { return a.amount > b.amount; });

  std::fill(bets_.begin(), bets_.end(), 0);
  actor_     = std::nullopt;
  completed_ = true;
}

// ------------------------------------------------------------------
// Introspection
// ------------------------------------------------------------------

bool HoldemEngine::WentToShowdown() const {
  return completed_ && CountLive() > 1;
}

std::vector<bool> HoldemEngine::FoldedPlayers() const {
  return folded_;
}

bool HoldemEngine::IsAllIn(int player) const {
  return !folded_[player] && stacks_[player] == 0;
}

int64_t HoldemEngine::TotalPot() const {
  return std::accumulate(contributions_.begin(), contributions_.end(), int64_t{0});
}

std::vector<std::string> HoldemEngine::HoleCards(int player) const {
  return ToStrings(hole_[player]);
}

std::vector<std::string> HoldemEngine::BoardCards() const {
  return ToStrings(board_);
}

// ------------------------------------------------------------------
// Snapshot
// ------------------------------------------------------------------

pokertable::v1::EngineSnapshot HoldemEngine::Serialize() const {
  pokertable::v1::EngineSnapshot snapshot;
  snapshot.set_version(kSnapshotVersion);
  snapshot.set_player_count(PlayerCount());
  snapshot.set_small_blind(small_blind_);
  snapshot.set_big_blind(big_blind_);
  snapshot.set_ante(ante_);
  snapshot.set_min_bet(big_blind_);
  snapshot.set_button_index(button_);

  for (int i = 0; i < PlayerCount(); ++i) {
    snapshot.add_starting_stacks(starting_stacks_[i]);
    snapshot.add_pre_hand_stacks(starting_stacks_[i]);
    snapshot.add_stacks(stacks_[i]);
    snapshot.add_bets(bets_[i]);
    snapshot.add_contributions(contributions_[i]);
    snapshot.add_folded(folded_[i]);
    snapshot.add_acted(acted_[i]);
    auto* hole = snapshot.add_hole_cards();
    for (const auto& card : hole_[i]) hole->add_cards(ToString(card));
  }
  for (const auto& card : board_) snapshot.add_board_cards(ToString(card));
  for (const auto& card : deck_) snapshot.add_deck(ToString(card));

  for (const auto& pot : BuildPots()) {
    auto* out = snapshot.add_pots();
    out->set_amount(pot.amount);
    for (int i : pot.eligible) out->add_eligible_players(i);
  }

  snapshot.set_street_index(street_);
  snapshot.set_actor_index(actor_ ? *actor_ : -1);
  snapshot.set_last_raise_size(last_raise_size_);
  snapshot.set_hole_cards_dealt(hole_dealt_);
  snapshot.set_completed(completed_);
  for (const auto& winner : winners_) {
    auto* out = snapshot.add_winners();
    out->set_player_index(winner.player_index);
    out->set_amount(winner.amount);
    out->set_hand_rank(winner.hand_rank);
    for (const auto& card : winner.best_hand_cards) out->add_best_hand_cards(card);
    out->set_pot_index(winner.pot_index);
  }
  return snapshot;
}

std::unique_ptr<HoldemEngine> HoldemEngine::FromSnapshot(const pokertable::v1::EngineSnapshot& s) {
  if (s.version() != kSnapshotVersion) {
    throw RestorationError(fmt::format("engine snapshot: unsupported version {}", s.version()));
  }
  const int n = s.player_count();
  if (n < kMinPlayers || n > kMaxPlayers) {
    throw RestorationError(fmt::format("engine snapshot: player count {} outside {}..{}", n, kMinPlayers, kMaxPlayers));
  }
  RequireSize(s.starting_stacks(), n, "starting_stacks");
  RequireSize(s.stacks(), n, "stacks");
  RequireSize(s.bets(), n, "bets");
  RequireSize(s.contributions(), n, "contributions");
  RequireSize(s.folded(), n, "folded");
  RequireSize(s.acted(), n, "acted");
  RequireSize(s.hole_cards(), n, "hole_cards");
  if (s.button_index() < 0 || s.button_index() >= n) {
    throw RestorationError("engine snapshot: button index out of range");
  }
  if (s.street_index() < 0 || s.street_index() > kRiver) {
    throw RestorationError("engine snapshot: street index out of range");
  }
  if (s.actor_index() < -1 || s.actor_index() >= n) {
    throw RestorationError("engine snapshot: actor index out of range");
  }

  std::unique_ptr<HoldemEngine> engine(new HoldemEngine());
  engine->small_blind_     = s.small_blind();
  engine->big_blind_       = s.big_blind();
  engine->ante_            = s.ante();
  engine->button_          = s.button_index();
  engine->starting_stacks_.assign(s.starting_stacks().begin(), s.starting_stacks().end());
  engine->stacks_.assign(s.stacks().begin(), s.stacks().end());
  engine->bets_.assign(s.bets().begin(), s.bets().end());
  engine->contributions_.assign(s.contributions().begin(), s.contributions().end());
  engine->folded_.assign(s.folded().begin(), s.folded().end());
  engine->acted_.assign(s.acted().begin(), s.acted().end());

  std::set<int> seen;
  auto          take = [&seen](const std::string& text) {
    const auto card = ParseOrThrow(text);
    if (!seen.insert(CardIndex(card)).second) {
      throw RestorationError("engine snapshot: duplicate card " + text);
    }
    return card;
  };

  engine->hole_.resize(n);
  for (int i = 0; i < n; ++i) {
    for (const auto& text : s.hole_cards(i).cards()) engine->hole_[i].push_back(take(text));
  }
  for (const auto& text : s.board_cards()) engine->board_.push_back(take(text));
  for (const auto& text : s.deck()) engine->deck_.push_back(take(text));

  engine->street_          = s.street_index();
  engine->actor_           = s.actor_index() >= 0 ? std::optional<int>(s.actor_index()) : std::nullopt;
  engine->last_raise_size_ = s.last_raise_size();
  engine->hole_dealt_      = s.hole_cards_dealt();
  engine->completed_       = s.completed();
  for (const auto& w : s.winners()) {
    Winner winner;
    winner.player_index    = w.player_index();
    winner.amount          = w.amount();
    winner.hand_rank       = w.hand_rank();
    winner.best_hand_cards.assign(w.best_hand_cards().begin(), w.best_hand_cards().end());
    winner.pot_index       = w.pot_index();
    engine->winners_.push_back(std::move(winner));
  }
  return engine;
}

// ------------------------------------------------------------------
// Factory
// ------------------------------------------------------------------

HoldemEngineFactory::HoldemEngineFactory() : deck_source_(&ShuffledDeck) {
}

HoldemEngineFactory::HoldemEngineFactory(DeckSource deck_source) : deck_source_(std::move(deck_source)) {
}

std::unique_ptr<RulesEngine> HoldemEngineFactory::Create(const EngineConfig& config) {
  if (!config.deck.empty()) {
    return std::make_unique<HoldemEngine>(config);
  }
  EngineConfig with_deck = config;
  with_deck.deck         = deck_source_();
  return std::make_unique<HoldemEngine>(with_deck);
}

std::unique_ptr<RulesEngine> HoldemEngineFactory::Restore(const pokertable::v1::EngineSnapshot& snapshot) {
  return HoldemEngine::FromSnapshot(snapshot);
}

} // namespace pokertable::engine
