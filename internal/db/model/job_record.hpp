#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace jobmeter::db::model {

/*
  Persistent job row, one table per module (<module>_jobs).

  - files_purged_at_ms != 0 implies a terminal status.
  - usage_delta only grows.
  - Rows are never deleted; purge clears paths only.
*/
struct JobRecord {
  std::string id; // UUID string
  std::string module;
  std::string user_id;

  jobmeter::model::JobStatus status = jobmeter::model::JobStatus::kPending;

  std::string status_detail;
  std::string error_message;

  int64_t usage_delta = 0;

  // module JobPayload as protobuf JSON
  std::string payload_json;

  // aggregate artifact, empty until assembled or after purge
  std::string output_path;

  int64_t created_at_ms      = 0;
  int64_t updated_at_ms      = 0;
  int64_t files_purged_at_ms = 0; // 0 = not purged
};

} // namespace jobmeter::db::model
