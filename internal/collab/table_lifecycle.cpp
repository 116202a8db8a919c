#include "table_lifecycle.hpp"

#include "internal/model/status.hpp"
#include "internal/util/time.hpp"

namespace pokertable::collab {

InactivityVerdict DefaultTableLifecycle::ComputeInactivity(db::Repository& repo, db::Transaction& tx, const db::model::TableRecord& table,
                                                           util::TimePoint now) {
  if (model::IsTerminal(table.status)) return {true, "table_closed"};

  if (table.expires_at_ms != 0 && util::ToUnixMillis(now) >= table.expires_at_ms) return {true, "table_expired"};

  int funded = 0;
  for (const auto& seat : repo.ListActiveSeats(tx, table.id)) {
    if (seat.chips > 0) ++funded;
  }
  if (funded < 2) return {true, "insufficient_players"};

  return {};
}

BalanceCheck DefaultTableLifecycle::CheckBalanceRequirement(const db::model::SeatRecord& seat, int64_t small_blind, int64_t big_blind,
                                                            int64_t ante) const {
  const int64_t required = small_blind + big_blind + ante;
  return {seat.chips >= required, required};
}

} // namespace pokertable::collab
