#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace jobmeter::db::model {

/*
  Sub-unit of a job (<module>_job_items), addressed by (job_id, round, index).
*/
struct JobItemRecord {
  std::string job_id;
  uint32_t    round = 0;
  uint32_t    index = 0;

  jobmeter::model::JobStatus status = jobmeter::model::JobStatus::kPending;

  std::string status_detail;
  uint32_t    attempt_count = 0;
  std::string error_message;

  // valid only while the parent job is not purged
  std::string output_path;

  int64_t tokens_used = 0;

  std::string payload_json; // module ItemPayload as protobuf JSON
  std::string result_text;  // interpreted provider output

  int64_t updated_at_ms = 0;
};

} // namespace jobmeter::db::model
