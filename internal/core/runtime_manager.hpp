#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/collab/table_lifecycle.hpp"
#include "internal/collab/wallet_service.hpp"
#include "internal/core/table_runtime.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/rules_engine.hpp"
#include "pokertable/v1.hpp"

namespace pokertable::core {

struct ActionResult {
  pokertable::v1::TableState                    state;
  std::optional<pokertable::v1::HandEndedEvent> hand_ended;
};

struct InterHandResult {
  bool                       table_ended = false;
  std::string                end_reason;
  pokertable::v1::TableState state;
};

/*
  RuntimeManager

  Per-process registry of TableRuntimes keyed by table id.

  Concurrency model:
  - one mutex per table id serializes every operation on that table
  - runtimes of different tables never block each other
  - across processes the table row lock (LockTableForUpdate, taken before the
    seats are read) and the versioned hand row are the arbiters; a cached
    runtime whose hand version lags the database is reloaded from the stored
    snapshot

  Every mutating operation runs load -> checkpoint -> mutate -> commit. When
  a write or the commit fails the runtime is rolled back to the checkpoint,
  so success is reported only for committed state.
*/
class RuntimeManager {
 public:
  RuntimeManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<engine::EngineFactory> engine_factory,
                 std::shared_ptr<collab::WalletService> wallet, std::shared_ptr<collab::TableLifecycle> lifecycle, GameSettings settings);

  // Refreshes table and seats, restores the engine when missing or stale.
  // Returns the viewer-less state. Restoration errors are logged, never thrown.
  pokertable::v1::TableState EnsureTable(int64_t table_id);

  pokertable::v1::TableState StartGame(int64_t table_id);

  ActionResult HandleAction(int64_t table_id, int64_t user_id, pokertable::v1::ActionType action, std::optional<int64_t> amount);

  pokertable::v1::TableState MarkPlayerReady(int64_t table_id, int64_t user_id);

  InterHandResult CompleteInterHandPhase(int64_t table_id, bool force);

  pokertable::v1::TableState GetState(int64_t table_id, std::optional<int64_t> viewer_user_id);

  const GameSettings& Settings() const {
    return settings_;
  }

 private:
  using Operation = std::function<void(TableRuntime&, HandContext&)>;

  std::shared_ptr<std::mutex> TableMutex(int64_t table_id);

  // Caller holds the table mutex.
  TableRuntime& LoadLocked(int64_t table_id, db::Transaction& tx, bool lock_hand);
  void          SyncHandLocked(TableRuntime& runtime, const std::optional<db::model::HandRecord>& durable);

  // Load, checkpoint, run `op`, commit, then render the state for `viewer`.
  // Rolls the runtime back on any failure.
  pokertable::v1::TableState Mutate(int64_t table_id, const char* name, std::optional<int64_t> viewer, const Operation& op);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<engine::EngineFactory>  engine_factory_;
  std::shared_ptr<collab::WalletService>  wallet_;
  std::shared_ptr<collab::TableLifecycle> lifecycle_;
  GameSettings                            settings_;

  mutable std::mutex                                         table_mutexes_guard_;
  std::unordered_map<int64_t, std::shared_ptr<std::mutex>>   table_mutexes_;
  mutable std::mutex                                         runtimes_guard_;
  std::unordered_map<int64_t, std::unique_ptr<TableRuntime>> runtimes_;
};

} // namespace pokertable::core
