#pragma once

#include <string_view>

#include "pokertable/v1.hpp"

namespace pokertable::model {

using HandStatus  = pokertable::v1::HandStatus;
using TableStatus = pokertable::v1::TableStatus;
using ActionType  = pokertable::v1::ActionType;

constexpr std::string_view ToString(HandStatus status) {
  switch (status) {
    case pokertable::v1::HAND_STATUS_PREFLOP:
      return "preflop";
    case pokertable::v1::HAND_STATUS_FLOP:
      return "flop";
    case pokertable::v1::HAND_STATUS_TURN:
      return "turn";
    case pokertable::v1::HAND_STATUS_RIVER:
      return "river";
    case pokertable::v1::HAND_STATUS_INTER_HAND_WAIT:
      return "inter_hand_wait";
    case pokertable::v1::HAND_STATUS_ENDED:
      return "ended";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(TableStatus status) {
  switch (status) {
    case pokertable::v1::TABLE_STATUS_WAITING:
      return "waiting";
    case pokertable::v1::TABLE_STATUS_ACTIVE:
      return "active";
    case pokertable::v1::TABLE_STATUS_PAUSED:
      return "paused";
    case pokertable::v1::TABLE_STATUS_ENDED:
      return "ended";
    case pokertable::v1::TABLE_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(ActionType action) {
  switch (action) {
    case pokertable::v1::ACTION_TYPE_FOLD:
      return "fold";
    case pokertable::v1::ACTION_TYPE_CHECK:
      return "check";
    case pokertable::v1::ACTION_TYPE_CALL:
      return "call";
    case pokertable::v1::ACTION_TYPE_BET:
      return "bet";
    case pokertable::v1::ACTION_TYPE_RAISE:
      return "raise";
    case pokertable::v1::ACTION_TYPE_ALL_IN:
      return "all_in";
    case pokertable::v1::ACTION_TYPE_READY:
      return "ready";
    default:
      return "unspecified";
  }
}

constexpr bool IsBettingStatus(HandStatus status) {
  return status == pokertable::v1::HAND_STATUS_PREFLOP || status == pokertable::v1::HAND_STATUS_FLOP ||
         status == pokertable::v1::HAND_STATUS_TURN || status == pokertable::v1::HAND_STATUS_RIVER;
}

constexpr bool IsTerminal(TableStatus status) {
  return status == pokertable::v1::TABLE_STATUS_ENDED || status == pokertable::v1::TABLE_STATUS_EXPIRED;
}

} // namespace pokertable::model
