#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "api/jobmeter/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobmeter::modules {
class ModuleRegistry;
}
namespace jobmeter::store {
class JobStore;
}
namespace jobmeter::usage {
class QuotaPolicy;
class UsageLedger;
} // namespace jobmeter::usage
namespace jobmeter::history {
class HistoryIndex;
}
namespace jobmeter::worker {
class JobScheduler;
}

namespace jobmeter::core {

// Resolved from the session by the caller; the engine trusts it.
struct Requester {
  std::string user_id;
  bool        is_admin = false;
};

// Edit of a nullable limit. nullopt keeps the stored value; an engaged
// empty inner value clears it to unlimited.
using LimitEdit = std::optional<std::optional<int64_t>>;

inline const LimitEdit kClearLimit{std::in_place, std::nullopt};

/*
  In-process boundary of the engine.

  Inbound:  SubmitJob
  Outbound: GetStatus, ResolveDownload, ListHistory, UsageSnapshot
  Admin:    UpsertGroup, SetModuleLimit, AssignUser

  Errors are util exceptions; core::ToErrorCode maps them for callers.
*/
class JobEngine {
 public:
  JobEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
            std::shared_ptr<store::JobStore> store, std::shared_ptr<usage::UsageLedger> ledger, std::shared_ptr<usage::QuotaPolicy> quota,
            std::shared_ptr<history::HistoryIndex> history, std::shared_ptr<worker::JobScheduler> scheduler,
            std::function<util::TimePoint()> clock = util::Now);

  /*
    Validate -> quota check -> Pending job + items + history entry in one
    transaction -> enqueue.

    Throws util::NotFound (module), util::ValidationFailed,
    util::QuotaExceeded. A rejected submission leaves no rows.
  */
  v1::SubmitJobResponse SubmitJob(const std::string& user_id, const std::string& module, const std::string& payload_json);

  // Throws util::NotFound, util::Forbidden.
  v1::JobStatusView GetStatus(const std::string& module, const std::string& job_id, const Requester& requester);

  /*
    Path of a downloadable artifact: "result" or "item/<round>/<index>".
    Checks run in order: NotFound (job), Forbidden, Gone (purged),
    NotFound (artifact).
  */
  std::string ResolveDownload(const std::string& module, const std::string& job_id, const Requester& requester, const std::string& artifact);

  std::vector<v1::HistoryEntry> ListHistory(const std::string& user_id, const std::string& module, uint32_t limit);

  v1::UsageSnapshot UsageSnapshot(const std::string& user_id);

  // Token budget and window are left unchanged when not given for an
  // existing group. kClearLimit makes the budget unlimited.
  v1::UsageGroup UpsertGroup(const std::string& group_id, const std::string& name, LimitEdit token_budget,
                             std::optional<int64_t> token_window_sec);

  // nullopt unit_limit = unlimited. Throws util::NotFound for an unknown
  // group or module.
  void SetModuleLimit(const std::string& group_id, const std::string& module, std::optional<int64_t> unit_limit);

  // Throws util::NotFound for an unknown group.
  void AssignUser(const std::string& user_id, const std::string& group_id);

 private:
  db::model::JobRecord RequireVisible(db::Transaction& tx, const std::string& module, const std::string& job_id, const Requester& requester);

  // Fails a committed job that could not be queued.
  void AbandonQueued(const std::string& module, const std::string& job_id, const std::string& error);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const modules::ModuleRegistry> registry_;
  std::shared_ptr<store::JobStore>              store_;
  std::shared_ptr<usage::UsageLedger>           ledger_;
  std::shared_ptr<usage::QuotaPolicy>           quota_;
  std::shared_ptr<history::HistoryIndex>        history_;
  std::shared_ptr<worker::JobScheduler>         scheduler_;
  std::function<util::TimePoint()>              clock_;
};

} // namespace jobmeter::core
