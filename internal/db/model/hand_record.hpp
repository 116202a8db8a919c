#pragma once

#include <cstdint>
#include <string>

#include "pokertable/v1.hpp"

namespace pokertable::db::model {

/*
  Persistent hand row.

  IMPORTANT:
  - engine_state_json is the authoritative engine snapshot
    (pokertable.engine.v1.EngineSnapshot as JSON, including hand_player_order).
  - inter_hand_json carries the ready set and hand result while the hand
    waits in INTER_HAND_WAIT (pokertable.runtime.v1.InterHandState as JSON).
  - version is bumped on every update and checked by UpdateHand, so a
    writer holding a stale copy gets ErrorCode::Conflict.
  - (table_id, hand_no) is unique; at most one hand per table is not ENDED.
*/
struct HandRecord {
  int64_t id       = 0;
  int64_t table_id = 0;
  int32_t hand_no  = 0;

  pokertable::v1::HandStatus status = pokertable::v1::HAND_STATUS_PREFLOP;

  std::string engine_state_json = "{}";
  std::string inter_hand_json   = "{}";

  int64_t pot_size = 0;

  std::string timeout_tracking_json = "{}";

  uint64_t version = 0;

  uint64_t started_at_ms = 0;
  uint64_t ended_at_ms   = 0;
};

} // namespace pokertable::db::model
