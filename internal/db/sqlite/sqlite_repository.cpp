#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/time.hpp"
#include "pokertable/v1.hpp"

namespace pokertable::db::sqlite {

using pokertable::db::ErrorCode;
using pokertable::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kTableColumns = "id,status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms";
constexpr const char* kSeatColumns  = "id,table_id,user_id,position,chips,joined_at_ms,left_at_ms,is_sitting_out_next_hand";
constexpr const char* kHandColumns =
    "id,table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,started_at_ms,ended_at_ms";

model::TableRecord ReadTable(sqlite3_stmt* st) {
  model::TableRecord r;
  r.id                = ColI64(st, 0);
  r.status            = static_cast<pokertable::v1::TableStatus>(ColI32(st, 1));
  r.config_json       = ColText(st, 2);
  r.last_action_at_ms = ColU64(st, 3);
  r.expires_at_ms     = ColU64(st, 4);
  r.updated_at_ms     = ColU64(st, 5);
  return r;
}

model::SeatRecord ReadSeat(sqlite3_stmt* st) {
  model::SeatRecord r;
  r.id                       = ColI64(st, 0);
  r.table_id                 = ColI64(st, 1);
  r.user_id                  = ColI64(st, 2);
  r.position                 = ColI32(st, 3);
  r.chips                    = ColI64(st, 4);
  r.joined_at_ms             = ColU64(st, 5);
  r.left_at_ms               = ColU64(st, 6);
  r.is_sitting_out_next_hand = ColI32(st, 7) != 0;
  return r;
}

model::HandRecord ReadHand(sqlite3_stmt* st) {
  model::HandRecord r;
  r.id                    = ColI64(st, 0);
  r.table_id              = ColI64(st, 1);
  r.hand_no               = ColI32(st, 2);
  r.status                = static_cast<pokertable::v1::HandStatus>(ColI32(st, 3));
  r.engine_state_json     = ColText(st, 4);
  r.inter_hand_json       = ColText(st, 5);
  r.pot_size              = ColI64(st, 6);
  r.timeout_tracking_json = ColText(st, 7);
  r.version               = ColU64(st, 8);
  r.started_at_ms         = ColU64(st, 9);
  r.ended_at_ms           = ColU64(st, 10);
  return r;
}

std::optional<model::HandRecord> SingleHand(sqlite3* db, const std::string& sql, int64_t key) {
  Statement st(db, sql.c_str());
  if (!st.ok()) return std::nullopt;
  BindI64(st.get(), 1, key);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadHand(st.get());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result SqliteRepository::InsertTable(Transaction& t, model::TableRecord& r) {
  auto* db        = TX(t).Handle();
  r.updated_at_ms = util::ToUnixMillis(util::Now());

  Statement st(db, r.id == 0 ? "INSERT INTO poker_tables(status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms) VALUES(?,?,?,?,?);"
                             : "INSERT INTO poker_tables(status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms,id) VALUES(?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindText(st.get(), 2, r.config_json);
  BindU64(st.get(), 3, r.last_action_at_ms);
  BindU64(st.get(), 4, r.expires_at_ms);
  BindU64(st.get(), 5, r.updated_at_ms);
  if (r.id != 0) BindI64(st.get(), 6, r.id);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (r.id == 0) r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::TableRecord> SqliteRepository::GetTable(Transaction& t, int64_t table_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kTableColumns + " FROM poker_tables WHERE id=?;";
  Statement         st(db, sql.c_str());
  if (!st.ok()) return std::nullopt;
  BindI64(st.get(), 1, table_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadTable(st.get());
}

std::optional<model::TableRecord> SqliteRepository::LockTableForUpdate(Transaction& t, int64_t table_id) {
  // BEGIN IMMEDIATE already holds the database write lock.
  return GetTable(t, table_id);
}

Result SqliteRepository::UpdateTable(Transaction& t, const model::TableRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE poker_tables SET status=?,config_json=?,last_action_at_ms=?,expires_at_ms=?,updated_at_ms=? WHERE id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindText(st.get(), 2, r.config_json);
  BindU64(st.get(), 3, r.last_action_at_ms);
  BindU64(st.get(), 4, r.expires_at_ms);
  BindU64(st.get(), 5, util::ToUnixMillis(util::Now()));
  BindI64(st.get(), 6, r.id);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "table not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Seats
// ------------------------------------------------------------------

Result SqliteRepository::InsertSeat(Transaction& t, model::SeatRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO seats(table_id,user_id,position,chips,joined_at_ms,left_at_ms,is_sitting_out_next_hand) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.table_id);
  BindI64(st.get(), 2, r.user_id);
  BindI32(st.get(), 3, r.position);
  BindI64(st.get(), 4, r.chips);
  BindU64(st.get(), 5, r.joined_at_ms);
  BindU64(st.get(), 6, r.left_at_ms);
  BindI32(st.get(), 7, r.is_sitting_out_next_hand ? 1 : 0);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::vector<model::SeatRecord> SqliteRepository::ListActiveSeats(Transaction& t, int64_t table_id) {
  std::vector<model::SeatRecord> out;
  auto*                          db  = TX(t).Handle();
  const std::string              sql = std::string("SELECT ") + kSeatColumns + " FROM seats WHERE table_id=? AND left_at_ms=0 ORDER BY position ASC;";
  Statement                      st(db, sql.c_str());
  if (!st.ok()) return out;
  BindI64(st.get(), 1, table_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadSeat(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateSeat(Transaction& t, const model::SeatRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE seats SET chips=?,left_at_ms=?,is_sitting_out_next_hand=?,position=? WHERE id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.chips);
  BindU64(st.get(), 2, r.left_at_ms);
  BindI32(st.get(), 3, r.is_sitting_out_next_hand ? 1 : 0);
  BindI32(st.get(), 4, r.position);
  BindI64(st.get(), 5, r.id);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "seat not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Hands
// ------------------------------------------------------------------

Result SqliteRepository::InsertHand(Transaction& t, model::HandRecord& r) {
  auto* db = TX(t).Handle();
  if (GetActiveHand(t, r.table_id)) return Result::Err(ErrorCode::Conflict, "table already has a live hand");
  if (r.started_at_ms == 0) r.started_at_ms = util::ToUnixMillis(util::Now());

  Statement st(db,
               "INSERT INTO hands(table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,"
               "started_at_ms,ended_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.table_id);
  BindI32(st.get(), 2, r.hand_no);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindText(st.get(), 4, r.engine_state_json);
  BindText(st.get(), 5, r.inter_hand_json);
  BindI64(st.get(), 6, r.pot_size);
  BindText(st.get(), 7, r.timeout_tracking_json);
  BindU64(st.get(), 8, r.version);
  BindU64(st.get(), 9, r.started_at_ms);
  BindU64(st.get(), 10, r.ended_at_ms);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) {
    auto result = Translate(db, rc);
    // unique (table_id, hand_no)
    if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
    return result;
  }
  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::HandRecord> SqliteRepository::GetHand(Transaction& t, int64_t hand_id) {
  return SingleHand(TX(t).Handle(), std::string("SELECT ") + kHandColumns + " FROM hands WHERE id=?;", hand_id);
}

std::optional<model::HandRecord> SqliteRepository::GetActiveHand(Transaction& t, int64_t table_id) {
  return SingleHand(TX(t).Handle(),
                    std::string("SELECT ") + kHandColumns + " FROM hands WHERE table_id=? AND status<>" +
                        std::to_string(static_cast<int>(pokertable::v1::HAND_STATUS_ENDED)) + " ORDER BY hand_no DESC LIMIT 1;",
                    table_id);
}

std::optional<model::HandRecord> SqliteRepository::LockHandForUpdate(Transaction& t, int64_t hand_id) {
  // BEGIN IMMEDIATE already holds the database write lock.
  return GetHand(t, hand_id);
}

Result SqliteRepository::UpdateHand(Transaction& t, const model::HandRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE hands SET status=?,engine_state_json=?,inter_hand_json=?,pot_size=?,timeout_tracking_json=?,version=?,"
               "ended_at_ms=? WHERE id=? AND version=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindText(st.get(), 2, r.engine_state_json);
  BindText(st.get(), 3, r.inter_hand_json);
  BindI64(st.get(), 4, r.pot_size);
  BindText(st.get(), 5, r.timeout_tracking_json);
  BindU64(st.get(), 6, r.version);
  BindU64(st.get(), 7, r.ended_at_ms);
  BindI64(st.get(), 8, r.id);
  BindU64(st.get(), 9, r.version - 1);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) {
    return GetHand(t, r.id) ? Result::Err(ErrorCode::Conflict, "hand version changed") : Result::Err(ErrorCode::NotFound, "hand not found");
  }
  return Result::Ok();
}

std::optional<int32_t> SqliteRepository::MaxHandNo(Transaction& t, int64_t table_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT MAX(hand_no) FROM hands WHERE table_id=?;");
  if (!st.ok()) return std::nullopt;
  BindI64(st.get(), 1, table_id);
  if (st.Step() != SQLITE_ROW || sqlite3_column_type(st.get(), 0) == SQLITE_NULL) return std::nullopt;
  return ColI32(st.get(), 0);
}

std::vector<model::HandRecord> SqliteRepository::ListHands(Transaction& t, int64_t table_id) {
  std::vector<model::HandRecord> out;
  auto*                          db  = TX(t).Handle();
  const std::string              sql = std::string("SELECT ") + kHandColumns + " FROM hands WHERE table_id=? ORDER BY hand_no ASC;";
  Statement                      st(db, sql.c_str());
  if (!st.ok()) return out;
  BindI64(st.get(), 1, table_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadHand(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Hand results
// ------------------------------------------------------------------

Result SqliteRepository::InsertPot(Transaction& t, const model::PotRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO pots(hand_id,pot_index,size) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, r.hand_id);
  BindI32(st.get(), 2, r.pot_index);
  BindI64(st.get(), 3, r.size);
  return Translate(db, st.Step());
}

std::vector<model::PotRecord> SqliteRepository::ListPots(Transaction& t, int64_t hand_id) {
  std::vector<model::PotRecord> out;
  auto*                         db = TX(t).Handle();
  Statement                     st(db, "SELECT hand_id,pot_index,size FROM pots WHERE hand_id=? ORDER BY pot_index ASC;");
  if (!st.ok()) return out;
  BindI64(st.get(), 1, hand_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back({ColI64(st.get(), 0), ColI32(st.get(), 1), ColI64(st.get(), 2)});
  }
  return out;
}

Result SqliteRepository::InsertHandHistory(Transaction& t, const model::HandHistoryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO hand_history(table_id,hand_no,payload_json,created_at_ms) VALUES(?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, r.table_id);
  BindI32(st.get(), 2, r.hand_no);
  BindText(st.get(), 3, r.payload_json);
  BindU64(st.get(), 4, r.created_at_ms);
  auto result = Translate(db, st.Step());
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
  return result;
}

std::optional<model::HandHistoryRecord> SqliteRepository::GetHandHistory(Transaction& t, int64_t table_id, int32_t hand_no) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT table_id,hand_no,payload_json,created_at_ms FROM hand_history WHERE table_id=? AND hand_no=?;");
  if (!st.ok()) return std::nullopt;
  BindI64(st.get(), 1, table_id);
  BindI32(st.get(), 2, hand_no);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::HandHistoryRecord r;
  r.table_id      = ColI64(st.get(), 0);
  r.hand_no       = ColI32(st.get(), 1);
  r.payload_json  = ColText(st.get(), 2);
  r.created_at_ms = ColU64(st.get(), 3);
  return r;
}

Result SqliteRepository::InsertAction(Transaction& t, const model::ActionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO hand_actions(hand_id,user_id,type,amount,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, r.hand_id);
  BindI64(st.get(), 2, r.user_id);
  BindI32(st.get(), 3, static_cast<int>(r.type));
  BindI64(st.get(), 4, r.amount);
  BindU64(st.get(), 5, r.created_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::ActionRecord> SqliteRepository::ListActions(Transaction& t, int64_t hand_id) {
  std::vector<model::ActionRecord> out;
  auto*                            db = TX(t).Handle();
  Statement                        st(db, "SELECT hand_id,user_id,type,amount,created_at_ms FROM hand_actions WHERE hand_id=? ORDER BY id ASC;");
  if (!st.ok()) return out;
  BindI64(st.get(), 1, hand_id);
  while (st.Step() == SQLITE_ROW) {
    model::ActionRecord r;
    r.hand_id       = ColI64(st.get(), 0);
    r.user_id       = ColI64(st.get(), 1);
    r.type          = static_cast<pokertable::v1::ActionType>(ColI32(st.get(), 2));
    r.amount        = ColI64(st.get(), 3);
    r.created_at_ms = ColU64(st.get(), 4);
    out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO ledger(user_id,amount,type,hand_id,table_id,reference,created_at_ms) VALUES(?,?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, r.user_id);
  BindI64(st.get(), 2, r.amount);
  BindI32(st.get(), 3, static_cast<int>(r.type));
  BindI64(st.get(), 4, r.hand_id);
  BindI64(st.get(), 5, r.table_id);
  BindText(st.get(), 6, r.reference);
  BindU64(st.get(), 7, r.created_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::LedgerRecord> SqliteRepository::ListLedgerEntries(Transaction& t, int64_t table_id) {
  std::vector<model::LedgerRecord> out;
  auto*                            db = TX(t).Handle();
  Statement st(db, "SELECT user_id,amount,type,hand_id,table_id,reference,created_at_ms FROM ledger WHERE table_id=? ORDER BY id ASC;");
  if (!st.ok()) return out;
  BindI64(st.get(), 1, table_id);
  while (st.Step() == SQLITE_ROW) {
    model::LedgerRecord r;
    r.user_id       = ColI64(st.get(), 0);
    r.amount        = ColI64(st.get(), 1);
    r.type          = static_cast<model::LedgerEntryType>(ColI32(st.get(), 2));
    r.hand_id       = ColI64(st.get(), 3);
    r.table_id      = ColI64(st.get(), 4);
    r.reference     = ColText(st.get(), 5);
    r.created_at_ms = ColU64(st.get(), 6);
    out.push_back(r);
  }
  return out;
}

} // namespace pokertable::db::sqlite
