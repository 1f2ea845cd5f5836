#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace jobmeter::db::model {

// Append-only; never updated or deleted.
struct UsageEventRecord {
  std::string id;
  std::string user_id;
  std::string module;
  int64_t     tokens         = 0;
  int64_t     units          = 0;
  int64_t     occurred_at_ms = 0;
};

struct UsageGroupRecord {
  std::string            id;
  std::string            name;
  std::optional<int64_t> token_budget; // nullopt = unlimited
  int64_t                token_window_sec = 7 * 24 * 3600;
};

struct GroupLimitRecord {
  std::string            group_id;
  std::string            module;
  std::optional<int64_t> unit_limit; // nullopt = unlimited
};

} // namespace jobmeter::db::model
