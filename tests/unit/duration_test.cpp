#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using jobmeter::util::Duration;
using jobmeter::util::ParseDuration;
using jobmeter::util::ParseDurationOr;

bool Throws(const std::string& text) {
  try {
    (void)ParseDuration(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestSuffixes() {
  assert(ParseDuration("500ms") == Duration(500));
  assert(ParseDuration("30s") == std::chrono::seconds(30));
  assert(ParseDuration("15m") == std::chrono::minutes(15));
  assert(ParseDuration("24h") == std::chrono::hours(24));
  assert(ParseDuration("7d") == std::chrono::hours(24 * 7));
  assert(ParseDuration("0s") == Duration::zero());
}

void TestMalformed() {
  assert(Throws(""));
  assert(Throws("h"));
  assert(Throws("10"));
  assert(Throws("10w"));
  assert(Throws("-5s"));
  assert(Throws("1.5s"));
  assert(Throws("5 s"));
}

void TestFallbackOnlyForEmpty() {
  assert(ParseDurationOr("", std::chrono::minutes(15)) == std::chrono::minutes(15));
  assert(ParseDurationOr("1h", std::chrono::minutes(15)) == std::chrono::hours(1));

  bool threw = false;
  try {
    (void)ParseDurationOr("later", std::chrono::minutes(15));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestUnixMillisRoundTripKeepsMilliseconds() {
  const auto tp = jobmeter::util::FromUnixMillis(1700000000123);
  assert(jobmeter::util::ToUnixMillis(tp) == 1700000000123);

  const auto ts = jobmeter::util::ToProto(tp);
  assert(ts.seconds() == 1700000000);
  assert(ts.nanos() == 123000000);
}

} // namespace

int main() {
  TestSuffixes();
  TestMalformed();
  TestFallbackOnlyForEmpty();
  TestUnixMillisRoundTripKeepsMilliseconds();

  std::cout << "jobmeter_unit_duration: pass\n";
  return 0;
}
