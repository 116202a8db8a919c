#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace pokertable::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertTable(Transaction&, model::TableRecord&) override;
  std::optional<model::TableRecord> GetTable(Transaction&, int64_t table_id) override;
  std::optional<model::TableRecord> LockTableForUpdate(Transaction&, int64_t table_id) override;
  Result                            UpdateTable(Transaction&, const model::TableRecord&) override;

  Result                         InsertSeat(Transaction&, model::SeatRecord&) override;
  std::vector<model::SeatRecord> ListActiveSeats(Transaction&, int64_t table_id) override;
  Result                         UpdateSeat(Transaction&, const model::SeatRecord&) override;

  Result                           InsertHand(Transaction&, model::HandRecord&) override;
  std::optional<model::HandRecord> GetHand(Transaction&, int64_t hand_id) override;
  std::optional<model::HandRecord> GetActiveHand(Transaction&, int64_t table_id) override;
  std::optional<model::HandRecord> LockHandForUpdate(Transaction&, int64_t hand_id) override;
  Result                           UpdateHand(Transaction&, const model::HandRecord&) override;
  std::optional<int32_t>           MaxHandNo(Transaction&, int64_t table_id) override;
  std::vector<model::HandRecord>   ListHands(Transaction&, int64_t table_id) override;

  Result                                  InsertPot(Transaction&, const model::PotRecord&) override;
  std::vector<model::PotRecord>           ListPots(Transaction&, int64_t hand_id) override;
  Result                                  InsertHandHistory(Transaction&, const model::HandHistoryRecord&) override;
  std::optional<model::HandHistoryRecord> GetHandHistory(Transaction&, int64_t table_id, int32_t hand_no) override;
  Result                                  InsertAction(Transaction&, const model::ActionRecord&) override;
  std::vector<model::ActionRecord>        ListActions(Transaction&, int64_t hand_id) override;

  Result                           InsertLedgerEntry(Transaction&, const model::LedgerRecord&) override;
  std::vector<model::LedgerRecord> ListLedgerEntries(Transaction&, int64_t table_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::TableRecord> tables;
    std::map<int64_t, model::SeatRecord>  seats;
    std::map<int64_t, model::HandRecord>  hands;

    std::vector<model::PotRecord>         pots;
    std::vector<model::HandHistoryRecord> history;
    std::vector<model::ActionRecord>      actions;
    std::vector<model::LedgerRecord>      ledger;

    int64_t next_table_id = 1;
    int64_t next_seat_id  = 1;
    int64_t next_hand_id  = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace pokertable::db::memory
