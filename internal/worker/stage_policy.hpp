#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/job_item_record.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "retry.hpp"

namespace jobmeter::runtime::config {
class ModuleConfig;
}

namespace jobmeter::worker {

// Minimum number of completed items a stage needs.
struct SuccessThreshold {
  enum class Kind { kAll, kAny, kAtLeast, kFraction, kNone };

  Kind     kind     = Kind::kAll;
  uint32_t count    = 0;   // kAtLeast
  double   fraction = 1.0; // kFraction, (0, 1]

  static SuccessThreshold RequireAll() {
    return {Kind::kAll, 0, 1.0};
  }
  static SuccessThreshold RequireAny() {
    return {Kind::kAny, 0, 1.0};
  }
  static SuccessThreshold RequireAtLeast(uint32_t n) {
    return {Kind::kAtLeast, n, 1.0};
  }
  static SuccessThreshold RequireFraction(double f) {
    return {Kind::kFraction, 0, f};
  }
  // best effort: the stage never fails the job
  static SuccessThreshold RequireNone() {
    return {Kind::kNone, 0, 1.0};
  }

  // items needed out of `total`; at_least is capped at total
  uint32_t Required(uint32_t total) const;

  bool IsMet(uint32_t succeeded, uint32_t total) const {
    return succeeded >= Required(total);
  }

  std::string Describe() const;
};

// "all", "any", "none", "at_least:N", "fraction:F". Throws std::invalid_argument.
SuccessThreshold ParseThreshold(const std::string& text);

enum class DelayMode { kFixed, kLinear };

/*
  One row of a module's policy table. A stage owns the items of one round.
*/
struct StagePolicy {
  std::string name;
  uint32_t    round = 1;

  uint32_t attempt_cap     = 3;
  uint32_t concurrency_cap = 1;

  DelayMode      delay_mode = DelayMode::kFixed;
  util::Duration retry_delay{1000};

  SuccessThreshold threshold = SuccessThreshold::RequireAll();

  // valid replies wanted per item, and the fewest that still count
  uint32_t target_samples = 1;
  uint32_t min_samples    = 1;

  // units charged per completed item
  int64_t units_per_item = 0;

  util::Duration DelayFor(uint32_t failed_attempts) const;

  RetryPolicy ToRetryPolicy() const;
};

struct ModulePolicy {
  std::vector<StagePolicy> stages;

  // units charged once when the job completes
  int64_t units_on_completion = 0;

  const StagePolicy* StageForRound(uint32_t round) const;
};

// Applies `stages[]` overrides from config, matched by stage name.
// Throws std::invalid_argument for unknown stages or bad values.
void ApplyOverrides(ModulePolicy& policy, const jobmeter::runtime::config::ModuleConfig& config);

struct StageTally {
  const StagePolicy* stage     = nullptr;
  uint32_t           total     = 0;
  uint32_t           completed = 0;
  uint32_t           failed    = 0;
  bool               met       = false;
};

StageTally TallyStage(const StagePolicy& stage, const std::vector<db::model::JobItemRecord>& items);

struct JobVerdict {
  model::JobStatus status = model::JobStatus::kFailed;
  std::string      detail;
  std::string      error_message; // Failed only
};

/*
  Derives the job's terminal status from its items' terminal statuses.
  Pure: the same items and policy always give the same verdict. Items in
  a non-terminal state count as failed.
*/
JobVerdict EvaluateJob(const ModulePolicy& policy, const std::vector<db::model::JobItemRecord>& items);

} // namespace jobmeter::worker
