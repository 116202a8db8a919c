#pragma once

#include <cstdint>

namespace pokertable::db::model {

struct SeatRecord {
  int64_t id       = 0;
  int64_t table_id = 0;
  int64_t user_id  = 0;
  int32_t position = 0;
  int64_t chips    = 0;

  uint64_t joined_at_ms = 0;

  // 0 while seated
  uint64_t left_at_ms = 0;

  bool is_sitting_out_next_hand = false;

  bool IsActive() const {
    return left_at_ms == 0;
  }
};

} // namespace pokertable::db::model
