#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/hand_record.hpp"
#include "internal/db/model/result_records.hpp"
#include "internal/db/model/seat_record.hpp"
#include "internal/db/model/table_record.hpp"

namespace pokertable::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Hand numbers are never reused for a table
  - UpdateHand is a compare-and-set on HandRecord::version

  The DB is the source of truth for:
    tables and seats
    hand snapshots
    hand results and the chip ledger
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tables
  // ---------------------------------------------------------------------

  // Assigns record.id when it is 0.
  virtual Result InsertTable(Transaction&, model::TableRecord&) = 0;

  virtual std::optional<model::TableRecord> GetTable(Transaction&, int64_t table_id) = 0;

  // Row lock held until the transaction ends. Taken before any seat or hand
  // read of a mutating operation.
  virtual std::optional<model::TableRecord> LockTableForUpdate(Transaction&, int64_t table_id) = 0;

  virtual Result UpdateTable(Transaction&, const model::TableRecord&) = 0;

  // ---------------------------------------------------------------------
  // Seats
  // ---------------------------------------------------------------------

  virtual Result InsertSeat(Transaction&, model::SeatRecord&) = 0;

  // Seats with left_at_ms == 0, ordered by position.
  virtual std::vector<model::SeatRecord> ListActiveSeats(Transaction&, int64_t table_id) = 0;

  virtual Result UpdateSeat(Transaction&, const model::SeatRecord&) = 0;

  // ---------------------------------------------------------------------
  // Hands
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists on a duplicate (table_id, hand_no),
  // Conflict while another hand of the table is not ENDED.
  virtual Result InsertHand(Transaction&, model::HandRecord&) = 0;

  virtual std::optional<model::HandRecord> GetHand(Transaction&, int64_t hand_id) = 0;

  // Latest hand of the table whose status is not ENDED.
  virtual std::optional<model::HandRecord> GetActiveHand(Transaction&, int64_t table_id) = 0;

  // Row lock held until the transaction ends.
  virtual std::optional<model::HandRecord> LockHandForUpdate(Transaction&, int64_t hand_id) = 0;

  // record.version must be exactly one above the stored version.
  virtual Result UpdateHand(Transaction&, const model::HandRecord&) = 0;

  virtual std::optional<int32_t> MaxHandNo(Transaction&, int64_t table_id) = 0;

  virtual std::vector<model::HandRecord> ListHands(Transaction&, int64_t table_id) = 0;

  // ---------------------------------------------------------------------
  // Hand results
  // ---------------------------------------------------------------------

  virtual Result InsertPot(Transaction&, const model::PotRecord&) = 0;

  virtual std::vector<model::PotRecord> ListPots(Transaction&, int64_t hand_id) = 0;

  virtual Result InsertHandHistory(Transaction&, const model::HandHistoryRecord&) = 0;

  virtual std::optional<model::HandHistoryRecord> GetHandHistory(Transaction&, int64_t table_id, int32_t hand_no) = 0;

  virtual Result InsertAction(Transaction&, const model::ActionRecord&) = 0;

  virtual std::vector<model::ActionRecord> ListActions(Transaction&, int64_t hand_id) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerRecord&) = 0;

  virtual std::vector<model::LedgerRecord> ListLedgerEntries(Transaction&, int64_t table_id) = 0;
};

} // namespace pokertable::db
