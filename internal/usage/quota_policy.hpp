#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "usage_ledger.hpp"

namespace jobmeter::usage {

struct QuotaSettings {
  // window applied to groups created without one
  util::Duration token_window = std::chrono::hours(24 * 7);
  // group for users without an assignment; empty = reject them
  std::string default_group;
};

struct QuotaDecision {
  bool        admitted = true;
  std::string reason; // "tokens", "units", "no_group"
  std::string message;

  static QuotaDecision Admit() {
    return {};
  }

  static QuotaDecision Reject(std::string reason, std::string message) {
    return {false, std::move(reason), std::move(message)};
  }
};

/*
  Point-in-time admission check over the usage ledger.

  1. tokens, all modules, trailing group window: reject when the window is
     already at or over budget, or the projection would take it over
  2. units, this module only, lifetime: reject when used + projected
     exceeds the group's module cap

  Null budgets and caps are unlimited. Nothing is reserved: two concurrent
  submissions may both pass.
*/
class QuotaPolicy {
 public:
  QuotaPolicy(std::shared_ptr<db::Repository> repository, std::shared_ptr<UsageLedger> ledger, QuotaSettings settings);

  QuotaDecision Check(db::Transaction& tx, const std::string& user_id, const std::string& module, int64_t projected_units,
                      int64_t projected_tokens, util::TimePoint now);

  // assigned group, else the default group, else nullopt
  std::optional<db::model::UsageGroupRecord> ResolveGroup(db::Transaction& tx, const std::string& user_id);

  const QuotaSettings& Settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<UsageLedger>    ledger_;
  QuotaSettings                   settings_;
};

} // namespace jobmeter::usage
