#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace pokertable::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS poker_tables (id INTEGER PRIMARY KEY AUTOINCREMENT, status INTEGER NOT NULL, config_json TEXT NOT NULL, "
      "last_action_at_ms INTEGER NOT NULL DEFAULT 0, expires_at_ms INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS seats (id INTEGER PRIMARY KEY AUTOINCREMENT, table_id INTEGER NOT NULL REFERENCES poker_tables(id), "
      "user_id INTEGER NOT NULL, position INTEGER NOT NULL, chips INTEGER NOT NULL, joined_at_ms INTEGER NOT NULL, "
      "left_at_ms INTEGER NOT NULL DEFAULT 0, is_sitting_out_next_hand INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS seats_active_position ON seats(table_id, position) WHERE left_at_ms = 0;",
      "CREATE UNIQUE INDEX IF NOT EXISTS seats_active_user ON seats(table_id, user_id) WHERE left_at_ms = 0;",
      "CREATE TABLE IF NOT EXISTS hands (id INTEGER PRIMARY KEY AUTOINCREMENT, table_id INTEGER NOT NULL REFERENCES poker_tables(id), "
      "hand_no INTEGER NOT NULL, status INTEGER NOT NULL, engine_state_json TEXT NOT NULL, inter_hand_json TEXT NOT NULL, "
      "pot_size INTEGER NOT NULL DEFAULT 0, timeout_tracking_json TEXT NOT NULL, version INTEGER NOT NULL DEFAULT 0, "
      "started_at_ms INTEGER NOT NULL, ended_at_ms INTEGER NOT NULL DEFAULT 0, UNIQUE(table_id, hand_no));",
      "CREATE UNIQUE INDEX IF NOT EXISTS hands_one_live ON hands(table_id) WHERE status <> 6;",
      "CREATE TABLE IF NOT EXISTS pots (hand_id INTEGER NOT NULL REFERENCES hands(id), pot_index INTEGER NOT NULL, size INTEGER NOT NULL, "
      "PRIMARY KEY (hand_id, pot_index));",
      "CREATE TABLE IF NOT EXISTS hand_history (table_id INTEGER NOT NULL REFERENCES poker_tables(id), hand_no INTEGER NOT NULL, "
      "payload_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (table_id, hand_no));",
      "CREATE TABLE IF NOT EXISTS hand_actions (id INTEGER PRIMARY KEY AUTOINCREMENT, hand_id INTEGER NOT NULL REFERENCES hands(id), "
      "user_id INTEGER NOT NULL, type INTEGER NOT NULL, amount INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id INTEGER NOT NULL, amount INTEGER NOT NULL, "
      "type INTEGER NOT NULL, hand_id INTEGER NOT NULL, table_id INTEGER NOT NULL, reference TEXT NOT NULL, created_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace pokertable::db::sqlite
