#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace pokertable::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace pokertable::db::postgres
