#include "retry.hpp"

#include <thread>

#include "internal/util/errors.hpp"

namespace jobmeter::worker {

RetryOutcome RunBounded(const RetryPolicy& policy, const Sleeper& sleeper, const std::function<AttemptResult(uint32_t)>& fn) {
  RetryOutcome outcome;

  for (uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if (attempt > 1 && sleeper && policy.delay) {
      sleeper(policy.delay(attempt - 1));
    }

    outcome.attempts = attempt;
    try {
      if (fn(attempt) == AttemptResult::kDone) {
        outcome.done = true;
        return outcome;
      }
    } catch (const std::exception& e) {
      if (!policy.is_retryable || !policy.is_retryable(e)) throw;
      outcome.last_error = e.what();
    }
  }

  outcome.exhausted = true;
  return outcome;
}

Sleeper ThreadSleeper() {
  return [](util::Duration d) { std::this_thread::sleep_for(d); };
}

bool IsProviderFailure(const std::exception& e) {
  return dynamic_cast<const util::ProviderError*>(&e) != nullptr || dynamic_cast<const util::ParseError*>(&e) != nullptr;
}

} // namespace jobmeter::worker
