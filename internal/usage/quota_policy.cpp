#include "quota_policy.hpp"

#include <algorithm>

namespace jobmeter::usage {

QuotaPolicy::QuotaPolicy(std::shared_ptr<db::Repository> repository, std::shared_ptr<UsageLedger> ledger, QuotaSettings settings)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), settings_(std::move(settings)) {
}

std::optional<db::model::UsageGroupRecord> QuotaPolicy::ResolveGroup(db::Transaction& tx, const std::string& user_id) {
  auto group_id = repository_->GetUserGroup(tx, user_id);
  if (!group_id) {
    if (settings_.default_group.empty()) return std::nullopt;
    group_id = settings_.default_group;
  }
  return repository_->GetUsageGroup(tx, *group_id);
}

QuotaDecision QuotaPolicy::Check(db::Transaction& tx, const std::string& user_id, const std::string& module, int64_t projected_units,
                                 int64_t projected_tokens, util::TimePoint now) {
  projected_units  = std::max<int64_t>(projected_units, 0);
  projected_tokens = std::max<int64_t>(projected_tokens, 0);

  auto group = ResolveGroup(tx, user_id);
  if (!group) {
    return QuotaDecision::Reject("no_group", "user " + user_id + " has no usage group");
  }

  if (group->token_budget) {
    const auto window = group->token_window_sec > 0 ? util::Duration(std::chrono::seconds(group->token_window_sec)) : settings_.token_window;
    const auto used   = ledger_->TokensSince(tx, user_id, now - window);
    const auto budget = *group->token_budget;
    if (used >= budget || used + projected_tokens > budget) {
      return QuotaDecision::Reject("tokens", "token budget exhausted: used " + std::to_string(used) + " + projected " + std::to_string(projected_tokens) + " > " +
                                                    std::to_string(budget));
    }
  }

  auto limit = repository_->GetGroupLimit(tx, group->id, module);
  if (limit && limit->unit_limit) {
    const auto used = ledger_->Units(tx, user_id, module);
    const auto cap  = *limit->unit_limit;
    if (used + projected_units > cap) {
      return QuotaDecision::Reject("units", module + " unit cap reached: used " + std::to_string(used) + " + requested " + std::to_string(projected_units) +
                                                   " > " + std::to_string(cap));
    }
  }

  return QuotaDecision::Admit();
}

} // namespace jobmeter::usage
