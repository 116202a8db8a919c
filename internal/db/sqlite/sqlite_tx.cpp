#include "sqlite_tx.hpp"

#include "internal/db/api/result.hpp"

namespace pokertable::db::sqlite {

namespace {

ErrorCode CodeFor(sqlite3* db) {
  switch (sqlite3_errcode(db)) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_IOERR:
      return ErrorCode::IOError;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    default:
      return ErrorCode::InternalError;
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  if (sqlite3_exec(db_->Handle(), "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    throw CommitError(CodeFor(db_->Handle()), std::string("sqlite begin: ") + sqlite3_errmsg(db_->Handle()));
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // best effort; the connection discards the transaction on close anyway
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  if (sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    throw CommitError(CodeFor(db_->Handle()), std::string("sqlite commit: ") + sqlite3_errmsg(db_->Handle()));
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    throw CommitError(CodeFor(db_->Handle()), std::string("sqlite rollback: ") + sqlite3_errmsg(db_->Handle()));
  }
}

} // namespace pokertable::db::sqlite
