#include "stage_policy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "config/config.pb.h"

namespace jobmeter::worker {

using jobmeter::model::JobStatus;

uint32_t SuccessThreshold::Required(uint32_t total) const {
  switch (kind) {
    case Kind::kAll:
      return total;
    case Kind::kAny:
      return 1;
    case Kind::kAtLeast:
      // a stage with fewer items than asked for needs all of them
      return std::min(count, total);
    case Kind::kFraction:
      return static_cast<uint32_t>(std::ceil(fraction * static_cast<double>(total)));
    case Kind::kNone:
      return 0;
  }
  return total;
}

std::string SuccessThreshold::Describe() const {
  switch (kind) {
    case Kind::kAll:
      return "all";
    case Kind::kAny:
      return "any";
    case Kind::kAtLeast:
      return "at_least:" + std::to_string(count);
    case Kind::kFraction:
      return "fraction:" + std::to_string(fraction);
    case Kind::kNone:
      return "none";
  }
  return "all";
}

SuccessThreshold ParseThreshold(const std::string& text) {
  if (text == "all") return SuccessThreshold::RequireAll();
  if (text == "any") return SuccessThreshold::RequireAny();
  if (text == "none") return SuccessThreshold::RequireNone();

  const auto colon = text.find(':');
  if (colon == std::string::npos) {
    throw std::invalid_argument("unknown success threshold '" + text + "'");
  }

  const auto kind  = text.substr(0, colon);
  const auto value = text.substr(colon + 1);
  try {
    std::size_t consumed = 0;
    if (kind == "at_least") {
      const auto n = std::stoul(value, &consumed);
      if (consumed == value.size() && n > 0) return SuccessThreshold::RequireAtLeast(static_cast<uint32_t>(n));
    } else if (kind == "fraction") {
      const auto f = std::stod(value, &consumed);
      if (consumed == value.size() && f > 0.0 && f <= 1.0) return SuccessThreshold::RequireFraction(f);
    }
  } catch (const std::logic_error&) {
    // fall through
  }
  throw std::invalid_argument("invalid success threshold '" + text + "'");
}

util::Duration StagePolicy::DelayFor(uint32_t failed_attempts) const {
  if (delay_mode == DelayMode::kLinear) {
    return retry_delay * static_cast<int64_t>(failed_attempts);
  }
  return retry_delay;
}

RetryPolicy StagePolicy::ToRetryPolicy() const {
  RetryPolicy policy;
  policy.max_attempts = attempt_cap;
  policy.delay        = [stage = *this](uint32_t failed_attempts) { return stage.DelayFor(failed_attempts); };
  policy.is_retryable = IsProviderFailure;
  return policy;
}

const StagePolicy* ModulePolicy::StageForRound(uint32_t round) const {
  for (const auto& stage : stages) {
    if (stage.round == round) return &stage;
  }
  return nullptr;
}

void ApplyOverrides(ModulePolicy& policy, const jobmeter::runtime::config::ModuleConfig& config) {
  for (const auto& override_cfg : config.stages()) {
    StagePolicy* stage = nullptr;
    for (auto& candidate : policy.stages) {
      if (candidate.name == override_cfg.name()) stage = &candidate;
    }
    if (!stage) {
      throw std::invalid_argument("module " + config.key() + " has no stage '" + override_cfg.name() + "'");
    }

    if (override_cfg.attempt_cap() > 0) stage->attempt_cap = override_cfg.attempt_cap();
    if (override_cfg.concurrency_cap() > 0) stage->concurrency_cap = override_cfg.concurrency_cap();
    if (!override_cfg.retry_delay().empty()) stage->retry_delay = util::ParseDuration(override_cfg.retry_delay());
    if (!override_cfg.delay_mode().empty()) {
      if (override_cfg.delay_mode() == "fixed") {
        stage->delay_mode = DelayMode::kFixed;
      } else if (override_cfg.delay_mode() == "linear") {
        stage->delay_mode = DelayMode::kLinear;
      } else {
        throw std::invalid_argument("unknown delay_mode '" + override_cfg.delay_mode() + "'");
      }
    }
    if (!override_cfg.success_threshold().empty()) stage->threshold = ParseThreshold(override_cfg.success_threshold());
  }
}

StageTally TallyStage(const StagePolicy& stage, const std::vector<db::model::JobItemRecord>& items) {
  StageTally tally;
  tally.stage = &stage;
  for (const auto& item : items) {
    if (item.round != stage.round) continue;
    ++tally.total;
    if (item.status == JobStatus::kCompleted) {
      ++tally.completed;
    } else {
      ++tally.failed;
    }
  }
  tally.met = stage.threshold.IsMet(tally.completed, tally.total);
  return tally;
}

JobVerdict EvaluateJob(const ModulePolicy& policy, const std::vector<db::model::JobItemRecord>& items) {
  JobVerdict verdict;

  uint32_t completed = 0;
  uint32_t total     = 0;
  for (const auto& stage : policy.stages) {
    const auto tally = TallyStage(stage, items);
    completed += tally.completed;
    total += tally.total;

    if (!tally.met) {
      verdict.status        = JobStatus::kFailed;
      verdict.error_message = stage.name + ": " + std::to_string(tally.completed) + "/" + std::to_string(tally.total) +
                              " items succeeded, need " + stage.threshold.Describe();
      verdict.detail        = "failed at " + stage.name;
      return verdict;
    }
  }

  verdict.status = JobStatus::kCompleted;
  verdict.detail = std::to_string(completed) + "/" + std::to_string(total) + " items completed";
  if (completed < total) {
    verdict.detail += ", " + std::to_string(total - completed) + " failed";
  }
  return verdict;
}

} // namespace jobmeter::worker
