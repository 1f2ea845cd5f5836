#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace jobmeter::util {

/*
  Time utilities. Every component takes `now` from the caller so tests can
  move the clock; production callers pass Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::milliseconds;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// "500ms", "30s", "15m", "24h", "7d". Throws std::invalid_argument.
Duration ParseDuration(const std::string& text);

// Returns fallback when text is empty.
Duration ParseDurationOr(const std::string& text, Duration fallback);

} // namespace jobmeter::util
