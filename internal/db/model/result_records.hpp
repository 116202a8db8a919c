#pragma once

#include <cstdint>
#include <string>

#include "pokertable/v1.hpp"

namespace pokertable::db::model {

struct PotRecord {
  int64_t hand_id   = 0;
  int32_t pot_index = 0;
  int64_t size      = 0;
};

// Completed-hand summary, unique per (table_id, hand_no).
struct HandHistoryRecord {
  int64_t     table_id = 0;
  int32_t     hand_no  = 0;
  std::string payload_json;

  uint64_t created_at_ms = 0;
};

// One accepted player action.
struct ActionRecord {
  int64_t hand_id = 0;
  int64_t user_id = 0;

  pokertable::v1::ActionType type = pokertable::v1::ACTION_TYPE_UNSPECIFIED;

  int64_t amount = 0;

  uint64_t created_at_ms = 0;
};

enum class LedgerEntryType : int {
  kHandResult = 1,
  kRake       = 2,
};

// Chip movement written by the wallet collaborator. user_id 0 is the house.
struct LedgerRecord {
  int64_t         user_id  = 0;
  int64_t         amount   = 0;
  LedgerEntryType type     = LedgerEntryType::kHandResult;
  int64_t         hand_id  = 0;
  int64_t         table_id = 0;
  std::string     reference;

  uint64_t created_at_ms = 0;
};

} // namespace pokertable::db::model
