#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>

#include "internal/util/time.hpp"

namespace jobmeter::worker {

/*
  The one bounded-retry loop.

  fn(attempt) is called with attempt = 1..max_attempts. It returns kDone
  when no further attempt is wanted, or kContinue to ask for another
  (sampling modules collect several valid replies). A thrown exception
  accepted by is_retryable is kept as last_error and the loop goes on;
  anything else propagates. The sleeper runs between attempts, never
  before the first.
*/

enum class AttemptResult { kDone, kContinue };

using DelayFn     = std::function<util::Duration(uint32_t attempt)>;
using RetryableFn = std::function<bool(const std::exception&)>;
using Sleeper     = std::function<void(util::Duration)>;

struct RetryPolicy {
  uint32_t    max_attempts = 3;
  DelayFn     delay;
  RetryableFn is_retryable;
};

struct RetryOutcome {
  uint32_t    attempts = 0;
  bool        done     = false; // fn returned kDone
  bool        exhausted = false;
  std::string last_error;
};

RetryOutcome RunBounded(const RetryPolicy& policy, const Sleeper& sleeper, const std::function<AttemptResult(uint32_t)>& fn);

// Sleeps on the calling thread.
Sleeper ThreadSleeper();

// Treats util::ProviderError and util::ParseError as retryable.
bool IsProviderFailure(const std::exception& e);

} // namespace jobmeter::worker
