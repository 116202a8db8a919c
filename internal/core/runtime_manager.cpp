#include "runtime_manager.hpp"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "internal/core/persistence.hpp"
#include "internal/model/status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pokertable::core {

using pokertable::observability::BoolField;
using pokertable::observability::IntField;
using pokertable::observability::StringField;

namespace {

bool IsRejection(const std::exception& e) {
  return dynamic_cast<const util::ValidationError*>(&e) != nullptr || dynamic_cast<const util::InvalidState*>(&e) != nullptr ||
         dynamic_cast<const util::NotFound*>(&e) != nullptr;
}

void RollbackQuietly(db::Transaction& tx, int64_t table_id, const char* name) {
  try {
    tx.Rollback();
  } catch (const db::CommitError& e) {
    POKERTABLE_LOG_WARN("rollback failed", {IntField("table_id", table_id), StringField("operation", name), StringField("error", e.what())});
  }
}

} // namespace

RuntimeManager::RuntimeManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<engine::EngineFactory> engine_factory,
                               std::shared_ptr<collab::WalletService> wallet, std::shared_ptr<collab::TableLifecycle> lifecycle,
                               GameSettings settings)
    : repository_(std::move(repository)),
      engine_factory_(std::move(engine_factory)),
      wallet_(std::move(wallet)),
      lifecycle_(std::move(lifecycle)),
      settings_(std::move(settings)) {
  if (!repository_ || !engine_factory_ || !wallet_ || !lifecycle_) {
    throw std::invalid_argument("RuntimeManager: all collaborators are required");
  }
}

std::shared_ptr<std::mutex> RuntimeManager::TableMutex(int64_t table_id) {
  std::lock_guard<std::mutex> lock(table_mutexes_guard_);
  auto&                       mutex = table_mutexes_[table_id];
  if (!mutex) mutex = std::make_shared<std::mutex>();
  return mutex;
}

// ------------------------------------------------------------------
// Loading
// ------------------------------------------------------------------

TableRuntime& RuntimeManager::LoadLocked(int64_t table_id, db::Transaction& tx, bool lock_hand) {
  // Seats are read under the table lock so a waiting writer sees the chips
  // committed by the one it waited for.
  auto table = lock_hand ? repository_->LockTableForUpdate(tx, table_id) : repository_->GetTable(tx, table_id);
  if (!table) throw util::NotFound(fmt::format("table {} not found", table_id));
  auto seats = repository_->ListActiveSeats(tx, table_id);

  TableRuntime* runtime = nullptr;
  {
    std::lock_guard<std::mutex> lock(runtimes_guard_);
    auto&                       slot = runtimes_[table_id];
    if (!slot) slot = std::make_unique<TableRuntime>(table_id, *engine_factory_);
    runtime = slot.get();
  }
  runtime->Refresh(std::move(*table), std::move(seats));

  auto durable = repository_->GetActiveHand(tx, table_id);
  if (durable && lock_hand) durable = repository_->LockHandForUpdate(tx, durable->id);
  SyncHandLocked(*runtime, durable);
  return *runtime;
}

void RuntimeManager::SyncHandLocked(TableRuntime& runtime, const std::optional<db::model::HandRecord>& durable) {
  if (!durable) {
    if (runtime.HasEngine()) runtime.Unload();
    return;
  }

  const auto& cached = runtime.CurrentHand();
  if (runtime.HasEngine() && cached && cached->id == durable->id && cached->version == durable->version) return;

  try {
    runtime.Restore(*durable);
  } catch (const util::RestorationError& e) {
    POKERTABLE_LOG_ERROR("hand restoration failed", {IntField("table_id", runtime.TableId()), IntField("hand_id", durable->id),
                                                      IntField("hand_no", durable->hand_no), StringField("error", e.what())});
    runtime.Unload();
  }
}

// ------------------------------------------------------------------
// Mutation pipeline
// ------------------------------------------------------------------

pokertable::v1::TableState RuntimeManager::Mutate(int64_t table_id, const char* name, std::optional<int64_t> viewer, const Operation& op) {
  auto                        mutex = TableMutex(table_id);
  std::lock_guard<std::mutex> lock(*mutex);

  auto tx = repository_->Begin();

  TableRuntime* runtime = nullptr;
  try {
    runtime = &LoadLocked(table_id, *tx, /*lock_hand=*/true);
  } catch (const std::exception&) {
    RollbackQuietly(*tx, table_id, name);
    throw;
  }

  const auto checkpoint = runtime->Capture();
  HandContext ctx{*repository_, *tx, *wallet_, *lifecycle_, settings_, util::Now()};

  try {
    op(*runtime, ctx);
    CommitOrThrow(*tx, name);
  } catch (const std::exception& e) {
    if (!tx->IsCommitted()) RollbackQuietly(*tx, table_id, name);
    runtime->RollbackTo(checkpoint);
    if (IsRejection(e)) {
      POKERTABLE_LOG_DEBUG("operation rejected", {IntField("table_id", table_id), StringField("operation", name), StringField("reason", e.what())});
    } else {
      POKERTABLE_LOG_ERROR("operation rolled back", {IntField("table_id", table_id), StringField("operation", name), StringField("error", e.what())});
    }
    throw;
  }

  return runtime->BuildState(viewer, settings_, ctx.now);
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

pokertable::v1::TableState RuntimeManager::EnsureTable(int64_t table_id) {
  return GetState(table_id, std::nullopt);
}

pokertable::v1::TableState RuntimeManager::GetState(int64_t table_id, std::optional<int64_t> viewer_user_id) {
  auto                        mutex = TableMutex(table_id);
  std::lock_guard<std::mutex> lock(*mutex);

  auto  tx      = repository_->Begin();
  auto& runtime = LoadLocked(table_id, *tx, /*lock_hand=*/false);
  CommitOrThrow(*tx, "get_state");
  return runtime.BuildState(viewer_user_id, settings_, util::Now());
}

pokertable::v1::TableState RuntimeManager::StartGame(int64_t table_id) {
  return Mutate(table_id, "start_game", std::nullopt, [](TableRuntime& runtime, HandContext& ctx) {
    if (model::IsTerminal(runtime.Table().status)) {
      throw util::InvalidState(fmt::format("table {} is {}", runtime.TableId(), model::ToString(runtime.Table().status)));
    }
    if (runtime.HasEngine()) {
      throw util::InvalidState(fmt::format("table {} already has hand {} in progress", runtime.TableId(), runtime.CurrentHand()->hand_no));
    }

    // A live hand row the engine could not be rebuilt from blocks every new hand.
    if (auto stuck = ctx.repo.GetActiveHand(ctx.tx, runtime.TableId())) {
      POKERTABLE_LOG_WARN("abandoning unrestorable hand", {IntField("table_id", runtime.TableId()), IntField("hand_no", stuck->hand_no)});
      stuck->status      = pokertable::v1::HAND_STATUS_ENDED;
      stuck->ended_at_ms = util::ToUnixMillis(ctx.now);
      stuck->version += 1;
      ThrowIfDbError(ctx.repo.UpdateHand(ctx.tx, *stuck), "abandon hand");
    }

    runtime.SeatEveryone(ctx);
    runtime.StartHand(ctx);
    POKERTABLE_LOG_INFO("game started", {IntField("table_id", runtime.TableId()), IntField("hand_no", runtime.CurrentHand()->hand_no)});
  });
}

ActionResult RuntimeManager::HandleAction(int64_t table_id, int64_t user_id, pokertable::v1::ActionType action,
                                          std::optional<int64_t> amount) {
  ActionResult result;
  result.state = Mutate(table_id, "handle_action", user_id, [&](TableRuntime& runtime, HandContext& ctx) {
    result.hand_ended = runtime.HandleAction(ctx, user_id, action, amount);
  });
  if (result.hand_ended) {
    POKERTABLE_LOG_INFO("hand ended", {IntField("table_id", table_id), IntField("hand_no", result.hand_ended->hand_no()),
                                       BoolField("table_will_end", result.hand_ended->table_will_end())});
  }
  return result;
}

pokertable::v1::TableState RuntimeManager::MarkPlayerReady(int64_t table_id, int64_t user_id) {
  return Mutate(table_id, "mark_player_ready", user_id,
                [user_id](TableRuntime& runtime, HandContext& ctx) { runtime.MarkPlayerReady(ctx, user_id); });
}

InterHandResult RuntimeManager::CompleteInterHandPhase(int64_t table_id, bool force) {
  InterHandResult result;
  result.state = Mutate(table_id, "complete_inter_hand_phase", std::nullopt, [&](TableRuntime& runtime, HandContext& ctx) {
    const auto outcome = runtime.CompleteInterHandPhase(ctx, force);
    result.table_ended = outcome.table_ended;
    result.end_reason  = outcome.end_reason;
  });
  if (result.table_ended) {
    POKERTABLE_LOG_INFO("table ended", {IntField("table_id", table_id), StringField("reason", result.end_reason)});
  }
  return result;
}

} // namespace pokertable::core
