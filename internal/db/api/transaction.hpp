#pragma once

namespace pokertable::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws CommitError when the backend refuses the commit

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work (+ SELECT ... FOR UPDATE on the hand row)
  Memory: snapshot copy-on-write, version checked at commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace pokertable::db
