#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace pokertable::collab {

struct InactivityVerdict {
  bool        should_end = false;
  std::string reason;
};

struct BalanceCheck {
  bool    ok       = false;
  int64_t required = 0;
};

class TableLifecycle {
 public:
  virtual ~TableLifecycle() = default;

  // Evaluates only. The caller decides whether to act on the verdict.
  virtual InactivityVerdict ComputeInactivity(db::Repository& repo, db::Transaction& tx, const db::model::TableRecord& table,
                                              util::TimePoint now) = 0;

  virtual BalanceCheck CheckBalanceRequirement(const db::model::SeatRecord& seat, int64_t small_blind, int64_t big_blind, int64_t ante) const = 0;
};

/*
  Ends a table once fewer than two seated players hold chips, or once its
  expiry has passed. A player must cover small blind + big blind + ante.
*/
class DefaultTableLifecycle final : public TableLifecycle {
 public:
  InactivityVerdict ComputeInactivity(db::Repository& repo, db::Transaction& tx, const db::model::TableRecord& table, util::TimePoint now) override;

  BalanceCheck CheckBalanceRequirement(const db::model::SeatRecord& seat, int64_t small_blind, int64_t big_blind, int64_t ante) const override;
};

} // namespace pokertable::collab
