#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/glossary_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/job_item_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/module_settings_record.hpp"
#include "internal/db/model/usage_records.hpp"

namespace jobmeter::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All calls require a Transaction
  - Reads inside a transaction see its writes
  - Job and item rows live in per-module tables; `module` selects the table
    and must be a registered module key
  - usage_events is append-only

  The DB is the source of truth for:
    job and item state
    usage ledger and quota policy
    history index
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& module, const std::string& id) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  // terminal, not purged, created before cutoff; oldest first
  virtual std::vector<model::JobRecord> ListPurgeCandidates(Transaction&, const std::string& module, int64_t created_before_ms) = 0;

  // Clears every output path of the job and its items and stamps
  // files_purged_at. No-op (NotFound) when already purged.
  virtual Result MarkJobPurged(Transaction&, const std::string& module, const std::string& id, int64_t purged_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Job items
  // ---------------------------------------------------------------------

  virtual Result InsertJobItem(Transaction&, const std::string& module, const model::JobItemRecord&) = 0;

  virtual Result UpdateJobItem(Transaction&, const std::string& module, const model::JobItemRecord&) = 0;

  // ordered by (round, index)
  virtual std::vector<model::JobItemRecord> ListJobItems(Transaction&, const std::string& module, const std::string& job_id) = 0;

  // ---------------------------------------------------------------------
  // Usage ledger
  // ---------------------------------------------------------------------

  virtual Result AppendUsageEvent(Transaction&, const model::UsageEventRecord&) = 0;

  // all modules, occurred_at >= since
  virtual int64_t SumTokensSince(Transaction&, const std::string& user_id, int64_t since_ms) = 0;

  // one module, lifetime
  virtual int64_t SumUnits(Transaction&, const std::string& user_id, const std::string& module) = 0;

  // ---------------------------------------------------------------------
  // Quota policy
  // ---------------------------------------------------------------------

  virtual Result UpsertUsageGroup(Transaction&, const model::UsageGroupRecord&) = 0;

  virtual std::optional<model::UsageGroupRecord> GetUsageGroup(Transaction&, const std::string& group_id) = 0;

  virtual std::vector<model::UsageGroupRecord> ListUsageGroups(Transaction&) = 0;

  virtual Result UpsertGroupLimit(Transaction&, const model::GroupLimitRecord&) = 0;

  virtual std::optional<model::GroupLimitRecord> GetGroupLimit(Transaction&, const std::string& group_id, const std::string& module) = 0;

  virtual std::vector<model::GroupLimitRecord> ListGroupLimits(Transaction&, const std::string& group_id) = 0;

  virtual Result AssignUserGroup(Transaction&, const std::string& user_id, const std::string& group_id) = 0;

  virtual std::optional<std::string> GetUserGroup(Transaction&, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // History index
  // ---------------------------------------------------------------------

  // Upsert-ignore on (module, job_key).
  virtual Result InsertHistory(Transaction&, const model::HistoryRecord&) = 0;

  // newest first; module empty = all modules
  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::string& user_id, const std::string& module, int64_t since_ms,
                                                        uint32_t limit) = 0;

  virtual Result DeleteHistoryBefore(Transaction&, int64_t cutoff_ms) = 0;

  // keep the newest `keep` rows of every (user, module)
  virtual Result TrimHistory(Transaction&, uint32_t keep) = 0;

  // ---------------------------------------------------------------------
  // Module settings
  // ---------------------------------------------------------------------

  virtual Result UpsertModuleSettings(Transaction&, const model::ModuleSettingsRecord&) = 0;

  virtual std::optional<model::ModuleSettingsRecord> GetModuleSettings(Transaction&, const std::string& module) = 0;

  // ---------------------------------------------------------------------
  // Glossary
  // ---------------------------------------------------------------------

  // Insert, or replace the term whose source matches ignoring case.
  // created_at of an existing term is kept.
  virtual Result UpsertGlossaryTerm(Transaction&, const model::GlossaryTermRecord&) = 0;

  // ordered by source_term
  virtual std::vector<model::GlossaryTermRecord> ListGlossaryTerms(Transaction&) = 0;

  // NotFound when no term matches ignoring case.
  virtual Result DeleteGlossaryTerm(Transaction&, const std::string& source_term) = 0;
};

} // namespace jobmeter::db
