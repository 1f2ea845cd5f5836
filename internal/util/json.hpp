#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace jobmeter::util {

/*
  Protobuf JSON helpers for payloads stored in TEXT/JSONB columns.
*/

// Compact JSON, field names as declared in the .proto.
std::string ToJson(const google::protobuf::Message& message);

// Throws std::invalid_argument on malformed JSON or unknown fields.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace jobmeter::util
