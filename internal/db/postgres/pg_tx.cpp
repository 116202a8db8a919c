#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"

namespace pokertable::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  // pqxx::work aborts on destruction when still open
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw CommitError(ErrorCode::InternalError, "transaction already finished");
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw CommitError(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw CommitError(ErrorCode::Conflict, e.what());
  } catch (const pqxx::broken_connection& e) {
    throw CommitError(ErrorCode::IOError, e.what());
  } catch (const std::exception& e) {
    throw CommitError(ErrorCode::InternalError, e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace pokertable::db::postgres
