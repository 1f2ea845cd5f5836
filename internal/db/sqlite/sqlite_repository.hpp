#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace jobmeter::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string& module, const std::string& id) override;
  Result                          UpdateJob(Transaction&, const model::JobRecord&) override;
  std::vector<model::JobRecord>   ListPurgeCandidates(Transaction&, const std::string& module, int64_t created_before_ms) override;
  Result                          MarkJobPurged(Transaction&, const std::string& module, const std::string& id, int64_t purged_at_ms) override;

  Result                            InsertJobItem(Transaction&, const std::string& module, const model::JobItemRecord&) override;
  Result                            UpdateJobItem(Transaction&, const std::string& module, const model::JobItemRecord&) override;
  std::vector<model::JobItemRecord> ListJobItems(Transaction&, const std::string& module, const std::string& job_id) override;

  Result  AppendUsageEvent(Transaction&, const model::UsageEventRecord&) override;
  int64_t SumTokensSince(Transaction&, const std::string& user_id, int64_t since_ms) override;
  int64_t SumUnits(Transaction&, const std::string& user_id, const std::string& module) override;

  Result                                 UpsertUsageGroup(Transaction&, const model::UsageGroupRecord&) override;
  std::optional<model::UsageGroupRecord> GetUsageGroup(Transaction&, const std::string& group_id) override;
  std::vector<model::UsageGroupRecord>   ListUsageGroups(Transaction&) override;
  Result                                 UpsertGroupLimit(Transaction&, const model::GroupLimitRecord&) override;
  std::optional<model::GroupLimitRecord> GetGroupLimit(Transaction&, const std::string& group_id, const std::string& module) override;
  std::vector<model::GroupLimitRecord>   ListGroupLimits(Transaction&, const std::string& group_id) override;
  Result                                 AssignUserGroup(Transaction&, const std::string& user_id, const std::string& group_id) override;
  std::optional<std::string>             GetUserGroup(Transaction&, const std::string& user_id) override;

  Result                            InsertHistory(Transaction&, const model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::string& user_id, const std::string& module, int64_t since_ms,
                                                uint32_t limit) override;
  Result                            DeleteHistoryBefore(Transaction&, int64_t cutoff_ms) override;
  Result                            TrimHistory(Transaction&, uint32_t keep) override;

  Result                                     UpsertModuleSettings(Transaction&, const model::ModuleSettingsRecord&) override;
  std::optional<model::ModuleSettingsRecord> GetModuleSettings(Transaction&, const std::string& module) override;

  Result                                 UpsertGlossaryTerm(Transaction&, const model::GlossaryTermRecord&) override;
  std::vector<model::GlossaryTermRecord> ListGlossaryTerms(Transaction&) override;
  Result                                 DeleteGlossaryTerm(Transaction&, const std::string& source_term) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace jobmeter::db::sqlite
