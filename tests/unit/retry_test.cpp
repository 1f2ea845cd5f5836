#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/worker/retry.hpp"

namespace {

using jobmeter::util::Duration;
using jobmeter::worker::AttemptResult;
using jobmeter::worker::RetryPolicy;
using jobmeter::worker::RunBounded;

struct RecordingSleeper {
  std::vector<Duration>* slept;

  void operator()(Duration d) const {
    slept->push_back(d);
  }
};

RetryPolicy Policy(uint32_t max_attempts) {
  RetryPolicy policy;
  policy.max_attempts = max_attempts;
  policy.delay        = [](uint32_t failed) { return Duration(100 * failed); };
  policy.is_retryable = jobmeter::worker::IsProviderFailure;
  return policy;
}

void TestFirstSuccessStops() {
  std::vector<Duration> slept;
  uint32_t              calls   = 0;
  const auto            outcome = RunBounded(Policy(3), RecordingSleeper{&slept}, [&](uint32_t) {
    ++calls;
    return AttemptResult::kDone;
  });
  assert(outcome.done && !outcome.exhausted);
  assert(outcome.attempts == 1 && calls == 1);
  assert(slept.empty());
}

void TestRetriesUntilSuccessWithDelays() {
  std::vector<Duration> slept;
  const auto            outcome = RunBounded(Policy(3), RecordingSleeper{&slept}, [&](uint32_t attempt) {
    if (attempt < 3) throw jobmeter::util::ProviderError("HTTP 503");
    return AttemptResult::kDone;
  });
  assert(outcome.done);
  assert(outcome.attempts == 3);
  assert(outcome.last_error == "HTTP 503");
  assert(slept.size() == 2);
  assert(slept[0] == Duration(100) && slept[1] == Duration(200));
}

void TestExhaustionKeepsLastError() {
  std::vector<Duration> slept;
  const auto            outcome = RunBounded(Policy(3), RecordingSleeper{&slept}, [&](uint32_t attempt) -> AttemptResult {
    throw jobmeter::util::ParseError("bad reply " + std::to_string(attempt));
  });
  assert(!outcome.done && outcome.exhausted);
  assert(outcome.attempts == 3);
  assert(outcome.last_error == "bad reply 3");
}

void TestNonRetryablePropagates() {
  std::vector<Duration> slept;
  uint32_t              calls = 0;
  bool                  threw = false;
  try {
    RunBounded(Policy(5), RecordingSleeper{&slept}, [&](uint32_t) -> AttemptResult {
      ++calls;
      throw jobmeter::util::StorageError("disk full");
    });
  } catch (const jobmeter::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 1);
}

void TestContinueCollectsSamples() {
  std::vector<Duration> slept;
  uint32_t              samples = 0;
  const auto            outcome = RunBounded(Policy(30), RecordingSleeper{&slept}, [&](uint32_t attempt) {
    if (attempt % 3 == 0) throw jobmeter::util::ParseError("levels decrease");
    ++samples;
    return samples >= 4 ? AttemptResult::kDone : AttemptResult::kContinue;
  });
  assert(outcome.done);
  assert(samples == 4);
  assert(outcome.attempts == 5);
}

void TestContinueWithoutDoneExhausts() {
  std::vector<Duration> slept;
  const auto outcome = RunBounded(Policy(2), RecordingSleeper{&slept}, [](uint32_t) { return AttemptResult::kContinue; });
  assert(outcome.exhausted && !outcome.done);
  assert(outcome.last_error.empty());
}

} // namespace

int main() {
  TestFirstSuccessStops();
  TestRetriesUntilSuccessWithDelays();
  TestExhaustionKeepsLastError();
  TestNonRetryablePropagates();
  TestContinueCollectsSamples();
  TestContinueWithoutDoneExhausts();

  std::cout << "jobmeter_unit_retry: pass\n";
  return 0;
}
