#pragma once

#include <cstdint>
#include <string>

#include "pokertable/v1.hpp"

namespace pokertable::db::model {

/*
  Persistent table row.

  config_json holds a pokertable.core.v1.TableConfig rendered as JSON.
*/
struct TableRecord {
  int64_t id = 0;

  pokertable::v1::TableStatus status = pokertable::v1::TABLE_STATUS_WAITING;

  std::string config_json = "{}";

  uint64_t last_action_at_ms = 0;

  // Optional expiration (0 = none)
  uint64_t expires_at_ms = 0;

  uint64_t updated_at_ms = 0;
};

} // namespace pokertable::db::model
