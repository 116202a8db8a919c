#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace pokertable::collab {

struct HandResult {
  // user id -> net chip change for the hand, after rake
  std::map<int64_t, int64_t> deltas;
  int64_t                    pot  = 0;
  int64_t                    rake = 0;
};

/*
  Wallet / stats collaborator.

  Called inside the completion transaction. Seat chips are authoritative at
  hand start only; post-hand chip movement goes through here.
*/
class WalletService {
 public:
  virtual ~WalletService() = default;

  // Updates `seats` in place and persists them. `now` stamps the ledger rows.
  virtual void ApplyHandResult(db::Repository& repo, db::Transaction& tx, const db::model::HandRecord& hand, const db::model::TableRecord& table,
                               std::vector<db::model::SeatRecord>& seats, const HandResult& result, util::TimePoint now) = 0;

  virtual void RecordRake(db::Repository& repo, db::Transaction& tx, int64_t amount, int64_t hand_id, int64_t table_id, util::TimePoint now) = 0;
};

// Applies deltas to seat chips and writes one ledger row per movement.
class LedgerWalletService final : public WalletService {
 public:
  void ApplyHandResult(db::Repository& repo, db::Transaction& tx, const db::model::HandRecord& hand, const db::model::TableRecord& table,
                       std::vector<db::model::SeatRecord>& seats, const HandResult& result, util::TimePoint now) override;

  void RecordRake(db::Repository& repo, db::Transaction& tx, int64_t amount, int64_t hand_id, int64_t table_id, util::TimePoint now) override;
};

} // namespace pokertable::collab
