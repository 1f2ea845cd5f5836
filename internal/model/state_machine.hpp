#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace jobmeter::model {

/*
  Job and JobItem share one lifecycle:

    Pending -> Processing -> { Completed, Failed }

  Terminal states are absorbing. The purge flag on a job is orthogonal and
  never changes status.
*/
enum class JobStatus : std::uint8_t {
  kPending    = 1,
  kProcessing = 2,
  kCompleted  = 3,
  kFailed     = 4,
};

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed;
}

constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case JobStatus::kPending:
      // Pending -> Failed covers post-hoc validation failures.
      return to == JobStatus::kProcessing || to == JobStatus::kFailed;
    case JobStatus::kProcessing:
      return IsTerminal(to);
    default:
      return false;
  }
}

constexpr std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:
      return "pending";
    case JobStatus::kProcessing:
      return "processing";
    case JobStatus::kCompleted:
      return "completed";
    case JobStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr std::optional<JobStatus> FromInt(int value) {
  if (value < static_cast<int>(JobStatus::kPending) || value > static_cast<int>(JobStatus::kFailed)) {
    return std::nullopt;
  }
  return static_cast<JobStatus>(value);
}

static_assert(!CanTransition(JobStatus::kCompleted, JobStatus::kFailed));
static_assert(!CanTransition(JobStatus::kFailed, JobStatus::kProcessing));
static_assert(CanTransition(JobStatus::kPending, JobStatus::kProcessing));

} // namespace jobmeter::model
