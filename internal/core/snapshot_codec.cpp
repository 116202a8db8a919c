#include "snapshot_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace pokertable::core {

namespace {

template <typename Error>
void Parse(const std::string& json, google::protobuf::Message* message, bool ignore_unknown, const char* what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = ignore_unknown;

  auto status = google::protobuf::util::JsonStringToMessage(json.empty() ? "{}" : json, message, options);
  if (!status.ok()) {
    throw Error(std::string(what) + ": " + std::string(status.message()));
  }
}

} // namespace

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw pokertable::util::PersistenceError("encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

std::string EncodeSnapshot(const pokertable::v1::EngineSnapshot& snapshot) {
  return ToJson(snapshot);
}

pokertable::v1::EngineSnapshot DecodeSnapshot(const std::string& json) {
  pokertable::v1::EngineSnapshot snapshot;
  Parse<pokertable::util::RestorationError>(json, &snapshot, false, "invalid engine snapshot");
  return snapshot;
}

std::string EncodeInterHand(const pokertable::v1::InterHandState& state) {
  return ToJson(state);
}

pokertable::v1::InterHandState DecodeInterHand(const std::string& json) {
  pokertable::v1::InterHandState state;
  Parse<pokertable::util::RestorationError>(json, &state, false, "invalid inter-hand state");
  return state;
}

std::string EncodeTurnTimer(const pokertable::v1::TurnTimer& timer) {
  return ToJson(timer);
}

pokertable::v1::TurnTimer DecodeTurnTimer(const std::string& json) {
  pokertable::v1::TurnTimer timer;
  Parse<pokertable::util::RestorationError>(json, &timer, false, "invalid turn timer");
  return timer;
}

std::string EncodeTableConfig(const pokertable::v1::TableConfig& config) {
  return ToJson(config);
}

pokertable::v1::TableConfig DecodeTableConfig(const std::string& json) {
  pokertable::v1::TableConfig config;
  Parse<pokertable::util::ValidationError>(json, &config, true, "invalid table config");
  return config;
}

} // namespace pokertable::core
