#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace jobmeter::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json.empty() ? "{}" : json, message, options);
  if (!status.ok()) {
    throw std::invalid_argument("decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

} // namespace jobmeter::util
