#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

#if POKERTABLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using pokertable::core::RuntimeManager;
using pokertable::db::Repository;
using pokertable::testing::DeckStartingWith;
using pokertable::testing::FixedDeckFactory;
using pokertable::testing::MakeManager;
using pokertable::testing::SeedTable;

std::shared_ptr<RuntimeManager> NewProcess(std::shared_ptr<Repository> repo) {
  return MakeManager(std::move(repo), FixedDeckFactory(DeckStartingWith({"As", "2c", "Ad", "7d", "Kh", "Qh", "3s", "8c", "9d"})));
}

// Two managers stand in for two server processes behind one database.
void VerifyAlternatingManagers(const std::shared_ptr<Repository>& repo) {
  const auto table_id = SeedTable(*repo, {{1, 1000}, {2, 1000}});
  auto       a        = NewProcess(repo);
  auto       b        = NewProcess(repo);

  a->StartGame(table_id);
  assert(b->GetState(table_id, 1).current_actor() == 1);

  b->HandleAction(table_id, 1, pokertable::v1::ACTION_TYPE_RAISE, 100);
  a->HandleAction(table_id, 2, pokertable::v1::ACTION_TYPE_CALL, std::nullopt);

  pokertable::core::ActionResult last;
  for (int street = 0; street < 3; ++street) {
    b->HandleAction(table_id, 2, pokertable::v1::ACTION_TYPE_CHECK, std::nullopt);
    last = a->HandleAction(table_id, 1, pokertable::v1::ACTION_TYPE_CHECK, std::nullopt);
  }
  assert(last.hand_ended.has_value());
  assert(last.hand_ended->winners(0).user_id() == 1);

  // b never saw the river; its view comes from the stored hand
  const auto waiting = b->GetState(table_id, 2);
  assert(waiting.inter_hand_wait());
  assert(waiting.board_size() == 5);

  b->MarkPlayerReady(table_id, 1);
  a->MarkPlayerReady(table_id, 2);
  assert(a->GetState(table_id, std::nullopt).ready_players_size() == 2);

  const auto next = b->CompleteInterHandPhase(table_id, false);
  assert(!next.table_ended);
  assert(next.state.hand_no() == 2);
  assert(a->GetState(table_id, std::nullopt).hand_no() == 2);
  assert(a->GetState(table_id, std::nullopt).current_actor() == 2);
}

void VerifyRacingManagers(const std::shared_ptr<Repository>& repo) {
  const auto table_id = SeedTable(*repo, {{1, 1000}, {2, 1000}});
  auto       a        = NewProcess(repo);
  auto       b        = NewProcess(repo);

  a->StartGame(table_id);
  b->GetState(table_id, std::nullopt);

  std::atomic<int> accepted{0};
  std::atomic<int> rejected{0};

  auto call_as_small_blind = [&](RuntimeManager& manager) {
    for (;;) {
      try {
        manager.HandleAction(table_id, 1, pokertable::v1::ACTION_TYPE_CALL, std::nullopt);
        accepted.fetch_add(1);
        return;
      } catch (const pokertable::util::ConcurrencyError&) {
        continue;
      } catch (const pokertable::util::ValidationError&) {
        rejected.fetch_add(1);
        return;
      }
    }
  };

  std::thread ta([&] { call_as_small_blind(*a); });
  std::thread tb([&] { call_as_small_blind(*b); });
  ta.join();
  tb.join();

  assert(accepted.load() == 1);
  assert(rejected.load() == 1);

  const auto seen_a = a->GetState(table_id, std::nullopt);
  const auto seen_b = b->GetState(table_id, std::nullopt);
  assert(seen_a.current_actor() == 2);
  assert(seen_b.current_actor() == 2);
  assert(seen_a.pot() == 20);
  assert(seen_b.pot() == 20);
  assert(pokertable::testing::ActiveHand(*repo, table_id)->version == 3);
}

void RunSuite(const std::string& name, const std::function<std::shared_ptr<Repository>()>& make_repository) {
  std::cout << "running shared repository suite: " << name << "\n";
  auto repo = make_repository();
  VerifyAlternatingManagers(repo);
  VerifyRacingManagers(repo);
}

} // namespace

int main() {
  RunSuite("memory", [] { return std::make_shared<pokertable::db::memory::MemoryRepository>(); });

#if POKERTABLE_DB_SQLITE
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("pokertable_shared_" + std::to_string(stamp) + ".db")).string();
  RunSuite("sqlite", [&] {
    auto db = std::make_shared<pokertable::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<pokertable::db::sqlite::SqliteRepository>(std::move(db));
  });
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
#endif

  std::cout << "shared_repository_test: pass\n";
  return 0;
}
