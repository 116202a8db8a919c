#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace pokertable::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all transactions; TxMutex() serializes them.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

  // Idempotent CREATE TABLE IF NOT EXISTS for every table the repository uses.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace pokertable::db::sqlite
