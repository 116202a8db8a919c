#include "pg_repository.hpp"

#include "internal/util/time.hpp"
#include "pokertable/v1.hpp"

namespace pokertable::db::postgres {

namespace {

model::TableRecord ReadTable(const pqxx::row& row) {
  model::TableRecord r;
  r.id                = row[0].as<int64_t>();
  r.status            = static_cast<pokertable::v1::TableStatus>(row[1].as<int>());
  r.config_json       = row[2].c_str();
  r.last_action_at_ms = row[3].as<uint64_t>();
  r.expires_at_ms     = row[4].as<uint64_t>();
  r.updated_at_ms     = row[5].as<uint64_t>();
  return r;
}

model::SeatRecord ReadSeat(const pqxx::row& row) {
  model::SeatRecord r;
  r.id                       = row[0].as<int64_t>();
  r.table_id                 = row[1].as<int64_t>();
  r.user_id                  = row[2].as<int64_t>();
  r.position                 = row[3].as<int>();
  r.chips                    = row[4].as<int64_t>();
  r.joined_at_ms             = row[5].as<uint64_t>();
  r.left_at_ms               = row[6].as<uint64_t>();
  r.is_sitting_out_next_hand = row[7].as<bool>();
  return r;
}

model::HandRecord ReadHand(const pqxx::row& row) {
  model::HandRecord r;
  r.id                    = row[0].as<int64_t>();
  r.table_id              = row[1].as<int64_t>();
  r.hand_no               = row[2].as<int32_t>();
  r.status                = static_cast<pokertable::v1::HandStatus>(row[3].as<int>());
  r.engine_state_json     = row[4].c_str();
  r.inter_hand_json       = row[5].c_str();
  r.pot_size              = row[6].as<int64_t>();
  r.timeout_tracking_json = row[7].c_str();
  r.version               = row[8].as<uint64_t>();
  r.started_at_ms         = row[9].as<uint64_t>();
  r.ended_at_ms           = row[10].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result PgRepository::InsertTable(Transaction& t, model::TableRecord& r) {
  try {
    r.updated_at_ms = util::ToUnixMillis(util::Now());
    if (r.id == 0) {
      auto res = TX(t).Work().exec_params(
          "INSERT INTO poker_tables(status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5) RETURNING id;",
          static_cast<int>(r.status), r.config_json, r.last_action_at_ms, r.expires_at_ms, r.updated_at_ms);
      r.id = res[0][0].as<int64_t>();
    } else {
      TX(t).Work().exec_params(
          "INSERT INTO poker_tables(id,status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6);", r.id,
          static_cast<int>(r.status), r.config_json, r.last_action_at_ms, r.expires_at_ms, r.updated_at_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TableRecord> PgRepository::GetTable(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_prepared("get_table", table_id);
  if (res.empty()) return std::nullopt;
  return ReadTable(res[0]);
}

std::optional<model::TableRecord> PgRepository::LockTableForUpdate(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_prepared("lock_table", table_id);
  if (res.empty()) return std::nullopt;
  return ReadTable(res[0]);
}

Result PgRepository::UpdateTable(Transaction& t, const model::TableRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_table", r.id, static_cast<int>(r.status), r.config_json, r.last_action_at_ms, r.expires_at_ms,
                                          util::ToUnixMillis(util::Now()));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "table not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Seats
// ------------------------------------------------------------------

Result PgRepository::InsertSeat(Transaction& t, model::SeatRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO seats(table_id,user_id,position,chips,joined_at_ms,left_at_ms,is_sitting_out_next_hand) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id;",
        r.table_id, r.user_id, r.position, r.chips, r.joined_at_ms, r.left_at_ms, r.is_sitting_out_next_hand);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SeatRecord> PgRepository::ListActiveSeats(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_prepared("list_active_seats", table_id);

  std::vector<model::SeatRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSeat(row));
  }
  return out;
}

Result PgRepository::UpdateSeat(Transaction& t, const model::SeatRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_seat", r.id, r.chips, r.left_at_ms, r.is_sitting_out_next_hand, r.position);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "seat not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Hands
// ------------------------------------------------------------------

Result PgRepository::InsertHand(Transaction& t, model::HandRecord& r) {
  try {
    if (GetActiveHand(t, r.table_id)) return Result::Err(ErrorCode::Conflict, "table already has a live hand");
    if (r.started_at_ms == 0) r.started_at_ms = util::ToUnixMillis(util::Now());
    auto res = TX(t).Work().exec_prepared("insert_hand", r.table_id, r.hand_no, static_cast<int>(r.status), r.engine_state_json,
                                          r.inter_hand_json, r.pot_size, r.timeout_tracking_json, r.version, r.started_at_ms, r.ended_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HandRecord> PgRepository::GetHand(Transaction& t, int64_t hand_id) {
  auto res = TX(t).Work().exec_prepared("get_hand", hand_id);
  if (res.empty()) return std::nullopt;
  return ReadHand(res[0]);
}

std::optional<model::HandRecord> PgRepository::GetActiveHand(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_prepared("get_active_hand", table_id);
  if (res.empty()) return std::nullopt;
  return ReadHand(res[0]);
}

std::optional<model::HandRecord> PgRepository::LockHandForUpdate(Transaction& t, int64_t hand_id) {
  auto res = TX(t).Work().exec_prepared("lock_hand", hand_id);
  if (res.empty()) return std::nullopt;
  return ReadHand(res[0]);
}

Result PgRepository::UpdateHand(Transaction& t, const model::HandRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_hand", r.id, static_cast<int>(r.status), r.engine_state_json, r.inter_hand_json, r.pot_size,
                                          r.timeout_tracking_json, r.version, r.ended_at_ms, r.version - 1);
    if (res.affected_rows() == 0) {
      return GetHand(t, r.id) ? Result::Err(ErrorCode::Conflict, "hand version changed") : Result::Err(ErrorCode::NotFound, "hand not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<int32_t> PgRepository::MaxHandNo(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_params("SELECT MAX(hand_no) FROM hands WHERE table_id=$1;", table_id);
  if (res.empty() || res[0][0].is_null()) return std::nullopt;
  return res[0][0].as<int32_t>();
}

std::vector<model::HandRecord> PgRepository::ListHands(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,started_at_ms,ended_at_ms "
      "FROM hands WHERE table_id=$1 ORDER BY hand_no ASC;",
      table_id);

  std::vector<model::HandRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadHand(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Hand results
// ------------------------------------------------------------------

Result PgRepository::InsertPot(Transaction& t, const model::PotRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO pots(hand_id,pot_index,size) VALUES($1,$2,$3);", r.hand_id, r.pot_index, r.size);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PotRecord> PgRepository::ListPots(Transaction& t, int64_t hand_id) {
  auto res = TX(t).Work().exec_params("SELECT hand_id,pot_index,size FROM pots WHERE hand_id=$1 ORDER BY pot_index ASC;", hand_id);

  std::vector<model::PotRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].as<int64_t>(), row[1].as<int32_t>(), row[2].as<int64_t>()});
  }
  return out;
}

Result PgRepository::InsertHandHistory(Transaction& t, const model::HandHistoryRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO hand_history(table_id,hand_no,payload_json,created_at_ms) VALUES($1,$2,$3,$4);", r.table_id, r.hand_no,
                             r.payload_json, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HandHistoryRecord> PgRepository::GetHandHistory(Transaction& t, int64_t table_id, int32_t hand_no) {
  auto res = TX(t).Work().exec_params("SELECT table_id,hand_no,payload_json,created_at_ms FROM hand_history WHERE table_id=$1 AND hand_no=$2;",
                                      table_id, hand_no);
  if (res.empty()) return std::nullopt;

  model::HandHistoryRecord r;
  r.table_id      = res[0][0].as<int64_t>();
  r.hand_no       = res[0][1].as<int32_t>();
  r.payload_json  = res[0][2].c_str();
  r.created_at_ms = res[0][3].as<uint64_t>();
  return r;
}

Result PgRepository::InsertAction(Transaction& t, const model::ActionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_action", r.hand_id, r.user_id, static_cast<int>(r.type), r.amount, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ActionRecord> PgRepository::ListActions(Transaction& t, int64_t hand_id) {
  auto res =
      TX(t).Work().exec_params("SELECT hand_id,user_id,type,amount,created_at_ms FROM hand_actions WHERE hand_id=$1 ORDER BY id ASC;", hand_id);

  std::vector<model::ActionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ActionRecord r;
    r.hand_id       = row[0].as<int64_t>();
    r.user_id       = row[1].as<int64_t>();
    r.type          = static_cast<pokertable::v1::ActionType>(row[2].as<int>());
    r.amount        = row[3].as<int64_t>();
    r.created_at_ms = row[4].as<uint64_t>();
    out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_ledger", r.user_id, r.amount, static_cast<int>(r.type), r.hand_id, r.table_id, r.reference,
                               r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LedgerRecord> PgRepository::ListLedgerEntries(Transaction& t, int64_t table_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT user_id,amount,type,hand_id,table_id,reference,created_at_ms FROM ledger WHERE table_id=$1 ORDER BY id ASC;", table_id);

  std::vector<model::LedgerRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::LedgerRecord r;
    r.user_id       = row[0].as<int64_t>();
    r.amount        = row[1].as<int64_t>();
    r.type          = static_cast<model::LedgerEntryType>(row[2].as<int>());
    r.hand_id       = row[3].as<int64_t>();
    r.table_id      = row[4].as<int64_t>();
    r.reference     = row[5].c_str();
    r.created_at_ms = row[6].as<uint64_t>();
    out.push_back(r);
  }
  return out;
}

} // namespace pokertable::db::postgres
