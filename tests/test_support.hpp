#pragma once

#include <cassert>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/collab/table_lifecycle.hpp"
#include "internal/collab/wallet_service.hpp"
#include "internal/core/runtime_manager.hpp"
#include "internal/core/snapshot_codec.hpp"
#include "internal/core/table_runtime.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/cards.hpp"
#include "internal/engine/holdem_engine.hpp"
#include "internal/util/time.hpp"

namespace pokertable::testing {

// `first` in deal order, followed by every other card in FullDeck() order.
inline std::vector<engine::Card> DeckStartingWith(std::initializer_list<const char*> first) {
  std::vector<engine::Card> deck;
  std::set<int>             used;
  for (const char* text : first) {
    const auto card = engine::ParseCard(text);
    assert(card.has_value());
    deck.push_back(*card);
    used.insert(engine::CardIndex(*card));
  }
  for (const auto& card : engine::FullDeck()) {
    if (!used.contains(engine::CardIndex(card))) deck.push_back(card);
  }
  return deck;
}

inline std::shared_ptr<engine::HoldemEngineFactory> FixedDeckFactory(std::vector<engine::Card> deck) {
  return std::make_shared<engine::HoldemEngineFactory>([deck]() { return deck; });
}

struct SeatSpec {
  int64_t user_id = 0;
  int64_t chips   = 0;
};

// Creates a WAITING table with blinds 5/10 and seats at positions 0..n-1.
inline int64_t SeedTable(db::Repository& repo, const std::vector<SeatSpec>& seats, int64_t small_blind = 5, int64_t big_blind = 10) {
  auto tx = repo.Begin();

  pokertable::v1::TableConfig config;
  config.set_small_blind(small_blind);
  config.set_big_blind(big_blind);

  db::model::TableRecord table;
  table.status      = pokertable::v1::TABLE_STATUS_WAITING;
  table.config_json = core::EncodeTableConfig(config);
  const auto inserted = repo.InsertTable(*tx, table);
  assert(inserted);

  int32_t position = 0;
  for (const auto& spec : seats) {
    db::model::SeatRecord seat;
    seat.table_id     = table.id;
    seat.user_id      = spec.user_id;
    seat.position     = position++;
    seat.chips        = spec.chips;
    seat.joined_at_ms = util::ToUnixMillis(util::Now());
    const auto seated = repo.InsertSeat(*tx, seat);
    assert(seated);
  }
  tx->Commit();
  return table.id;
}

inline core::GameSettings TestSettings() {
  core::GameSettings settings;
  settings.post_hand_delay_seconds = 20;
  settings.default_small_blind     = 5;
  settings.default_big_blind       = 10;
  return settings;
}

inline std::shared_ptr<core::RuntimeManager> MakeManager(std::shared_ptr<db::Repository> repo, std::shared_ptr<engine::EngineFactory> factory,
                                                         core::GameSettings settings = TestSettings()) {
  return std::make_shared<core::RuntimeManager>(std::move(repo), std::move(factory), std::make_shared<collab::LedgerWalletService>(),
                                                std::make_shared<collab::DefaultTableLifecycle>(), settings);
}

inline std::optional<db::model::HandRecord> ActiveHand(db::Repository& repo, int64_t table_id) {
  auto tx   = repo.Begin();
  auto hand = repo.GetActiveHand(*tx, table_id);
  tx->Commit();
  return hand;
}

inline std::vector<db::model::SeatRecord> ActiveSeats(db::Repository& repo, int64_t table_id) {
  auto tx    = repo.Begin();
  auto seats = repo.ListActiveSeats(*tx, table_id);
  tx->Commit();
  return seats;
}

inline db::model::TableRecord LoadTable(db::Repository& repo, int64_t table_id) {
  auto tx    = repo.Begin();
  auto table = repo.GetTable(*tx, table_id);
  tx->Commit();
  assert(table.has_value());
  return *table;
}

inline int64_t ChipsOf(const std::vector<db::model::SeatRecord>& seats, int64_t user_id) {
  for (const auto& seat : seats) {
    if (seat.user_id == user_id) return seat.chips;
  }
  return -1;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

template <typename Error, typename Fn>
bool ThrowsAs(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

} // namespace pokertable::testing
