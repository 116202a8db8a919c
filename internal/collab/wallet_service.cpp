#include "wallet_service.hpp"

#include "internal/core/persistence.hpp"
#include "internal/util/time.hpp"

namespace pokertable::collab {

void LedgerWalletService::ApplyHandResult(db::Repository& repo, db::Transaction& tx, const db::model::HandRecord& hand,
                                          const db::model::TableRecord& table, std::vector<db::model::SeatRecord>& seats,
                                          const HandResult& result, util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);

  for (auto& seat : seats) {
    const auto it = result.deltas.find(seat.user_id);
    if (it == result.deltas.end() || it->second == 0) continue;

    seat.chips += it->second;
    core::ThrowIfDbError(repo.UpdateSeat(tx, seat), "apply hand result");

    db::model::LedgerRecord entry;
    entry.user_id       = seat.user_id;
    entry.amount        = it->second;
    entry.type          = db::model::LedgerEntryType::kHandResult;
    entry.hand_id       = hand.id;
    entry.table_id      = table.id;
    entry.reference     = "hand:" + std::to_string(hand.hand_no);
    entry.created_at_ms = now_ms;
    core::ThrowIfDbError(repo.InsertLedgerEntry(tx, entry), "ledger hand result");
  }
}

void LedgerWalletService::RecordRake(db::Repository& repo, db::Transaction& tx, int64_t amount, int64_t hand_id, int64_t table_id,
                                     util::TimePoint now) {
  if (amount <= 0) return;

  db::model::LedgerRecord entry;
  entry.user_id       = 0;
  entry.amount        = amount;
  entry.type          = db::model::LedgerEntryType::kRake;
  entry.hand_id       = hand_id;
  entry.table_id      = table_id;
  entry.reference     = "rake";
  entry.created_at_ms = util::ToUnixMillis(now);
  core::ThrowIfDbError(repo.InsertLedgerEntry(tx, entry), "ledger rake");
}

} // namespace pokertable::collab
