#pragma once

#include <string>

#include "pokertable/v1.hpp"

namespace pokertable::core {

/*
  JSON text codecs for the opaque columns of the hand and table rows.

  Snapshot, inter-hand and turn timer decoding throw util::RestorationError; table
  config decoding throws util::ValidationError.
*/

std::string                    EncodeSnapshot(const pokertable::v1::EngineSnapshot& snapshot);
pokertable::v1::EngineSnapshot DecodeSnapshot(const std::string& json);

std::string                    EncodeInterHand(const pokertable::v1::InterHandState& state);
pokertable::v1::InterHandState DecodeInterHand(const std::string& json);

std::string               EncodeTurnTimer(const pokertable::v1::TurnTimer& timer);
pokertable::v1::TurnTimer DecodeTurnTimer(const std::string& json);

std::string                 EncodeTableConfig(const pokertable::v1::TableConfig& config);
pokertable::v1::TableConfig DecodeTableConfig(const std::string& json);

// Compact JSON of any message, used for hand history payloads.
std::string ToJson(const google::protobuf::Message& message);

} // namespace pokertable::core
