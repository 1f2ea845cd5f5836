#include "time.hpp"

#include <cctype>
#include <stdexcept>

namespace jobmeter::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

Duration ParseDuration(const std::string& text) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  if (pos == 0) {
    throw std::invalid_argument("invalid duration: '" + text + "'");
  }

  const auto value  = std::stoll(text.substr(0, pos));
  const auto suffix = text.substr(pos);

  if (suffix == "ms") return Duration(value);
  if (suffix == "s") return std::chrono::seconds(value);
  if (suffix == "m") return std::chrono::minutes(value);
  if (suffix == "h") return std::chrono::hours(value);
  if (suffix == "d") return std::chrono::hours(24 * value);

  throw std::invalid_argument("invalid duration suffix: '" + text + "'");
}

Duration ParseDurationOr(const std::string& text, Duration fallback) {
  return text.empty() ? fallback : ParseDuration(text);
}

} // namespace jobmeter::util
