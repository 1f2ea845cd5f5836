#include "usage_ledger.hpp"

#include <algorithm>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/util/uuid.hpp"

namespace jobmeter::usage {

UsageLedger::UsageLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void UsageLedger::Record(db::Transaction& tx, const std::string& user_id, const std::string& module, int64_t tokens, int64_t units,
                         util::TimePoint now) {
  db::model::UsageEventRecord event;
  event.id             = util::NewJobId();
  event.user_id        = user_id;
  event.module         = module;
  event.tokens         = std::max<int64_t>(tokens, 0);
  event.units          = std::max<int64_t>(units, 0);
  event.occurred_at_ms = util::ToUnixMillis(now);

  db::ThrowIfDbError(repository_->AppendUsageEvent(tx, event), "append usage event");
}

void UsageLedger::Record(const std::string& user_id, const std::string& module, int64_t tokens, int64_t units, util::TimePoint now) {
  auto tx = repository_->Begin();
  Record(*tx, user_id, module, tokens, units, now);
  tx->Commit();
}

int64_t UsageLedger::TokensSince(db::Transaction& tx, const std::string& user_id, util::TimePoint since) {
  return repository_->SumTokensSince(tx, user_id, util::ToUnixMillis(since));
}

int64_t UsageLedger::Units(db::Transaction& tx, const std::string& user_id, const std::string& module) {
  return repository_->SumUnits(tx, user_id, module);
}

} // namespace jobmeter::usage
