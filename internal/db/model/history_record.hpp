#pragma once

#include <cstdint>
#include <string>

namespace jobmeter::db::model {

// Pointer into a module job table; status is never cached here.
struct HistoryRecord {
  std::string user_id;
  std::string module;
  std::string job_key;
  int64_t     created_at_ms = 0;
};

} // namespace jobmeter::db::model
