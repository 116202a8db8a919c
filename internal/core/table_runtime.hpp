#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/collab/table_lifecycle.hpp"
#include "internal/collab/wallet_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/rules_engine.hpp"
#include "internal/model/status.hpp"
#include "internal/rake/rake_calculator.hpp"
#include "internal/util/time.hpp"
#include "pokertable/v1.hpp"

namespace pokertable::core {

struct GameSettings {
  uint32_t         post_hand_delay_seconds = 20;
  int64_t          default_small_blind     = 25;
  int64_t          default_big_blind       = 50;
  rake::RakeConfig rake;
  uint32_t         turn_timeout_seconds = 25;
};

struct Blinds {
  int64_t small_blind = 0;
  int64_t big_blind   = 0;
  int64_t ante        = 0;
};

// Dependencies of one operation. Valid only for the duration of that operation.
struct HandContext {
  db::Repository&         repo;
  db::Transaction&        tx;
  collab::WalletService&  wallet;
  collab::TableLifecycle& lifecycle;
  const GameSettings&     settings;
  util::TimePoint         now;
};

struct InterHandOutcome {
  bool        table_ended = false;
  std::string end_reason;
};

/*
  TableRuntime

  In-process state of one table: the rules engine for the live hand, the
  canonical player order, the durable hand row and the inter-hand ready set.

  Invariants:
  - engine and current hand are either both set or both unset
  - the player order is fixed from hand start until the hand is dropped
  - every mutating operation writes the hand row (version bumped) before returning

  Not thread-safe. The owning RuntimeManager serializes access per table.
*/
class TableRuntime {
 public:
  TableRuntime(int64_t table_id, engine::EngineFactory& factory);

  int64_t TableId() const {
    return table_id_;
  }

  void Refresh(db::model::TableRecord table, std::vector<db::model::SeatRecord> seats);

  const db::model::TableRecord& Table() const {
    return table_;
  }
  const std::vector<db::model::SeatRecord>& Seats() const {
    return seats_;
  }

  bool HasEngine() const {
    return engine_ != nullptr;
  }
  const std::optional<db::model::HandRecord>& CurrentHand() const {
    return current_hand_;
  }
  const std::vector<int64_t>& PlayerOrder() const {
    return player_order_;
  }
  const std::set<int64_t>& ReadyPlayers() const {
    return ready_players_;
  }
  uint64_t EventSeq() const {
    return event_seq_;
  }

  // Rebuilds engine and bookkeeping from a durable hand row. Throws
  // util::RestorationError and leaves the runtime unchanged on failure.
  void Restore(const db::model::HandRecord& hand);

  // Drops the engine and the cached hand.
  void Unload();

  Blinds           ResolveBlinds(const GameSettings& settings) const;
  rake::RakeConfig ResolveRake(const GameSettings& settings) const;

  // Clears is_sitting_out_next_hand on every active seat.
  void SeatEveryone(HandContext& ctx);

  // Deals hand_no + 1 to every funded seat that is not sitting out.
  std::optional<pokertable::v1::HandEndedEvent> StartHand(HandContext& ctx);

  // Returns the hand-ended payload when this action completed the hand.
  std::optional<pokertable::v1::HandEndedEvent> HandleAction(HandContext& ctx, int64_t user_id, model::ActionType action,
                                                             std::optional<int64_t> amount);

  void MarkPlayerReady(HandContext& ctx, int64_t user_id);

  // Ends the waiting hand, then starts the next one or ends the table.
  InterHandOutcome CompleteInterHandPhase(HandContext& ctx, bool force);

  // Viewer-scoped state. Opponent hole cards stay hidden until showdown.
  pokertable::v1::TableState BuildState(std::optional<int64_t> viewer_user_id, const GameSettings& settings, util::TimePoint now) const;

  struct Checkpoint {
    db::model::TableRecord                        table;
    std::vector<db::model::SeatRecord>            seats;
    std::optional<pokertable::v1::EngineSnapshot> engine;
    std::vector<int64_t>                          player_order;
    std::optional<db::model::HandRecord>          current_hand;
    std::set<int64_t>                             ready_players;
    std::optional<util::TimePoint>                inter_hand_wait_start;
    uint64_t                                      event_seq = 0;
    std::optional<pokertable::v1::HandEndedEvent> last_hand_ended;
    int                                           last_button_position = -1;
    std::optional<util::TimePoint>                turn_started_at;
  };

  Checkpoint Capture() const;
  void       RollbackTo(const Checkpoint& checkpoint);

 private:
  std::optional<pokertable::v1::HandEndedEvent> AdvanceAndPersist(HandContext& ctx);
  pokertable::v1::HandEndedEvent                CompleteHand(HandContext& ctx);
  void                                          PersistHand(HandContext& ctx);

  pokertable::v1::EngineSnapshot SnapshotWithOrder() const;
  pokertable::v1::InterHandState BuildInterHandState() const;
  pokertable::v1::TurnTimer      BuildTurnTimer() const;

  void                         AssignOrder(std::vector<int64_t> order);
  db::model::SeatRecord*       FindSeat(int64_t user_id);
  const db::model::SeatRecord* FindSeat(int64_t user_id) const;
  int                          PositionOf(int64_t user_id) const;
  model::HandStatus            Status() const;

  int64_t                table_id_;
  engine::EngineFactory& factory_;

  db::model::TableRecord             table_;
  std::vector<db::model::SeatRecord> seats_;

  std::unique_ptr<engine::RulesEngine> engine_;
  std::vector<int64_t>                 player_order_;
  std::map<int64_t, int>               user_to_index_;
  std::optional<db::model::HandRecord> current_hand_;

  std::set<int64_t>                             ready_players_;
  std::optional<util::TimePoint>                inter_hand_wait_start_;
  uint64_t                                      event_seq_ = 0;
  std::optional<pokertable::v1::HandEndedEvent> last_hand_ended_;
  int                                           last_button_position_ = -1;

  // Set while an actor is pending; the action deadline counts from here.
  std::optional<util::TimePoint> turn_started_at_;
};

} // namespace pokertable::core
