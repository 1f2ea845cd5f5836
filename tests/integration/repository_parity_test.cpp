#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"

#if JOBMETER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if JOBMETER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using jobmeter::db::ErrorCode;
using jobmeter::db::Repository;
using jobmeter::db::memory::MemoryRepository;
using jobmeter::db::model::GlossaryTermRecord;
using jobmeter::db::model::GroupLimitRecord;
using jobmeter::db::model::HistoryRecord;
using jobmeter::db::model::JobItemRecord;
using jobmeter::db::model::JobRecord;
using jobmeter::db::model::ModuleSettingsRecord;
using jobmeter::db::model::UsageEventRecord;
using jobmeter::db::model::UsageGroupRecord;
using jobmeter::model::JobStatus;

const std::vector<std::string> kModules = {"summarizer", "grader"};

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

JobRecord MakeJob(const std::string& id, const std::string& user, int64_t created_at_ms) {
  JobRecord job;
  job.id            = id;
  job.module        = "summarizer";
  job.user_id       = user;
  job.status_detail = "queued";
  job.payload_json  = R"({"documents":[{"filename":"a.txt","text":"alpha"}]})";
  job.created_at_ms = created_at_ms;
  job.updated_at_ms = created_at_ms;
  return job;
}

JobItemRecord MakeItem(const std::string& job_id, uint32_t round, uint32_t index) {
  JobItemRecord item;
  item.job_id        = job_id;
  item.round         = round;
  item.index         = index;
  item.payload_json  = "{}";
  item.updated_at_ms = 1;
  return item;
}

void VerifyJobLifecycle(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(id, "alice", 1000)));
    // inserted out of order on purpose
    assert(repo.InsertJobItem(*tx, "summarizer", MakeItem(id, 2, 0)));
    assert(repo.InsertJobItem(*tx, "summarizer", MakeItem(id, 1, 1)));
    assert(repo.InsertJobItem(*tx, "summarizer", MakeItem(id, 1, 0)));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertJob(*tx, MakeJob(id, "alice", 1000));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx  = repo.Begin();
    auto job = repo.GetJob(*tx, "summarizer", id);
    assert(job.has_value());
    assert(job->status == JobStatus::kPending);
    assert(job->payload_json.find("alpha") != std::string::npos);
    assert(!repo.GetJob(*tx, "grader", id).has_value());

    job->status        = JobStatus::kCompleted;
    job->status_detail = "3/3 items completed, 0 failed";
    job->usage_delta   = 3;
    job->output_path   = "/tmp/" + id + "/combined.md";
    job->updated_at_ms = 2000;
    assert(repo.UpdateJob(*tx, *job));

    auto items = repo.ListJobItems(*tx, "summarizer", id);
    assert(items.size() == 3);
    assert(items[0].round == 1 && items[0].index == 0);
    assert(items[1].round == 1 && items[1].index == 1);
    assert(items[2].round == 2 && items[2].index == 0);

    items[1].status        = JobStatus::kFailed;
    items[1].attempt_count = 3;
    items[1].error_message = "HTTP 502";
    items[1].tokens_used   = 42;
    assert(repo.UpdateJobItem(*tx, "summarizer", items[1]));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto job   = repo.GetJob(*tx, "summarizer", id);
  auto items = repo.ListJobItems(*tx, "summarizer", id);
  tx->Commit();
  assert(job->status == JobStatus::kCompleted);
  assert(job->usage_delta == 3);
  assert(job->files_purged_at_ms == 0);
  assert(items[1].status == JobStatus::kFailed);
  assert(items[1].attempt_count == 3);
  assert(items[1].error_message == "HTTP 502");
  assert(items[1].tokens_used == 42);
}

void VerifyPurge(Repository& repo, const std::string& prefix) {
  const auto old_done    = prefix + "-old-done";
  const auto old_running = prefix + "-old-running";
  const auto young_done  = prefix + "-young-done";

  {
    auto tx = repo.Begin();
    for (const auto& [id, created] : {std::pair{old_done, int64_t{100}}, {old_running, 200}, {young_done, 90000}}) {
      auto job = MakeJob(id, "alice", created);
      if (id != old_running) {
        job.status      = JobStatus::kCompleted;
        job.output_path = "/tmp/" + id + "/out.md";
      } else {
        job.status = JobStatus::kProcessing;
      }
      assert(repo.InsertJob(*tx, job));

      auto item        = MakeItem(id, 1, 0);
      item.status      = JobStatus::kCompleted;
      item.output_path = "/tmp/" + id + "/item.md";
      assert(repo.InsertJobItem(*tx, "summarizer", item));
    }
    tx->Commit();
  }

  auto tx         = repo.Begin();
  auto candidates = repo.ListPurgeCandidates(*tx, "summarizer", 50000);
  bool saw_done   = false;
  for (const auto& job : candidates) {
    assert(job.id != old_running && job.id != young_done);
    saw_done = saw_done || job.id == old_done;
  }
  assert(saw_done);

  assert(repo.MarkJobPurged(*tx, "summarizer", old_done, 60000));
  auto second = repo.MarkJobPurged(*tx, "summarizer", old_done, 61000);
  assert(!second);
  assert(!repo.MarkJobPurged(*tx, "summarizer", old_running, 60000));
  tx->Commit();

  auto verify = repo.Begin();
  auto purged = repo.GetJob(*verify, "summarizer", old_done);
  assert(purged->files_purged_at_ms == 60000);
  assert(purged->output_path.empty());
  assert(purged->status == JobStatus::kCompleted);
  assert(repo.ListJobItems(*verify, "summarizer", old_done)[0].output_path.empty());
  assert(!repo.ListJobItems(*verify, "summarizer", young_done)[0].output_path.empty());

  for (const auto& job : repo.ListPurgeCandidates(*verify, "summarizer", 50000)) {
    assert(job.id != old_done);
  }
  verify->Commit();
}

void VerifyUsageLedger(Repository& repo, const std::string& user) {
  {
    auto tx = repo.Begin();
    assert(repo.AppendUsageEvent(*tx, UsageEventRecord{user + "-e1", user, "summarizer", 300, 1, 1000}));
    assert(repo.AppendUsageEvent(*tx, UsageEventRecord{user + "-e2", user, "grader", 200, 0, 2000}));
    assert(repo.AppendUsageEvent(*tx, UsageEventRecord{user + "-e3", user, "summarizer", 0, 2, 3000}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.SumTokensSince(*tx, user, 0) == 500);
  assert(repo.SumTokensSince(*tx, user, 1500) == 200);
  assert(repo.SumTokensSince(*tx, user, 5000) == 0);
  assert(repo.SumUnits(*tx, user, "summarizer") == 3);
  assert(repo.SumUnits(*tx, user, "grader") == 0);
  assert(repo.SumTokensSince(*tx, user + "-nobody", 0) == 0);
  tx->Commit();
}

void VerifyQuotaTables(Repository& repo, const std::string& prefix) {
  const auto group = prefix + "-group";
  {
    auto tx = repo.Begin();
    assert(repo.UpsertUsageGroup(*tx, UsageGroupRecord{group, "Starter", std::nullopt, 3600}));
    assert(repo.UpsertGroupLimit(*tx, GroupLimitRecord{group, "summarizer", 5}));
    assert(repo.UpsertGroupLimit(*tx, GroupLimitRecord{group, "grader", std::nullopt}));
    assert(repo.AssignUserGroup(*tx, prefix + "-user", group));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetUsageGroup(*tx, group);
    assert(stored.has_value());
    assert(stored->name == "Starter");
    assert(!stored->token_budget.has_value());
    assert(stored->token_window_sec == 3600);

    auto limit = repo.GetGroupLimit(*tx, group, "summarizer");
    assert(limit.has_value() && limit->unit_limit == 5);
    auto unlimited = repo.GetGroupLimit(*tx, group, "grader");
    assert(unlimited.has_value() && !unlimited->unit_limit.has_value());
    assert(repo.ListGroupLimits(*tx, group).size() == 2);

    assert(repo.GetUserGroup(*tx, prefix + "-user") == group);
    assert(!repo.GetUserGroup(*tx, prefix + "-stranger").has_value());

    stored->token_budget = 25000;
    assert(repo.UpsertUsageGroup(*tx, *stored));
    assert(repo.UpsertGroupLimit(*tx, GroupLimitRecord{group, "summarizer", 7}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.GetUsageGroup(*tx, group)->token_budget == 25000);
  assert(repo.GetGroupLimit(*tx, group, "summarizer")->unit_limit == 7);
  bool listed = false;
  for (const auto& g : repo.ListUsageGroups(*tx)) listed = listed || g.id == group;
  assert(listed);
  tx->Commit();
}

void VerifyHistory(Repository& repo, const std::string& user) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertHistory(*tx, HistoryRecord{user, "summarizer", user + "-j1", 1000}));
    assert(repo.InsertHistory(*tx, HistoryRecord{user, "summarizer", user + "-j2", 2000}));
    assert(repo.InsertHistory(*tx, HistoryRecord{user, "grader", user + "-j3", 3000}));
    assert(repo.InsertHistory(*tx, HistoryRecord{user, "summarizer", user + "-j4", 4000}));
    // same (module, job_key) again is ignored
    assert(repo.InsertHistory(*tx, HistoryRecord{user, "summarizer", user + "-j2", 9000}));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto all = repo.ListHistory(*tx, user, "", 0, 10);
    assert(all.size() == 4);
    assert(all[0].job_key == user + "-j4");
    assert(all[1].job_key == user + "-j3");
    assert(all[3].job_key == user + "-j1");

    auto summarizer = repo.ListHistory(*tx, user, "summarizer", 1500, 10);
    assert(summarizer.size() == 2);
    assert(summarizer[1].created_at_ms == 2000);

    assert(repo.ListHistory(*tx, user, "", 0, 2).size() == 2);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteHistoryBefore(*tx, 1500));
    assert(repo.TrimHistory(*tx, 1));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto left = repo.ListHistory(*tx, user, "", 0, 10);
  tx->Commit();
  assert(left.size() == 2);
  assert(left[0].job_key == user + "-j4");
  assert(left[1].job_key == user + "-j3");
}

void VerifyModuleSettings(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(!repo.GetModuleSettings(*tx, "grader").has_value());
    assert(repo.UpsertModuleSettings(*tx, ModuleSettingsRecord{"grader", R"({"models":["m1"]})", 10}));
    assert(repo.UpsertModuleSettings(*tx, ModuleSettingsRecord{"grader", R"({"models":["m2","m3"]})", 20}));
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto settings = repo.GetModuleSettings(*tx, "grader");
  tx->Commit();
  assert(settings.has_value());
  assert(settings->settings_json == R"({"models":["m2","m3"]})");
  assert(settings->updated_at_ms == 20);
}

void VerifyGlossary(Repository& repo, const std::string& prefix) {
  const auto upper = prefix + "-Cohort";
  const auto lower = prefix + "-cohort";
  {
    auto tx = repo.Begin();
    assert(repo.UpsertGlossaryTerm(*tx, GlossaryTermRecord{upper, "队列", "", 10, 10}));
    assert(repo.UpsertGlossaryTerm(*tx, GlossaryTermRecord{prefix + "-abstract", "摘要", "", 11, 11}));
    assert(repo.UpsertGlossaryTerm(*tx, GlossaryTermRecord{lower, "群组", "note", 30, 30}));
    tx->Commit();
  }

  std::vector<GlossaryTermRecord> mine;
  {
    auto tx = repo.Begin();
    for (auto& term : repo.ListGlossaryTerms(*tx)) {
      if (term.source_term.rfind(prefix, 0) == 0) mine.push_back(std::move(term));
    }
    tx->Commit();
  }
  assert(mine.size() == 2);
  assert(mine[0].source_term == prefix + "-abstract");
  assert(mine[1].source_term == lower);
  assert(mine[1].target_term == "群组");
  assert(mine[1].created_at_ms == 10);
  assert(mine[1].updated_at_ms == 30);

  auto tx = repo.Begin();
  assert(repo.DeleteGlossaryTerm(*tx, upper));
  assert(repo.DeleteGlossaryTerm(*tx, upper).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(id, "alice", 1000)));
    assert(repo.InsertHistory(*tx, HistoryRecord{"rollback-user", "summarizer", id, 1000}));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetJob(*tx, "summarizer", id).has_value());
  assert(repo.ListHistory(*tx, "rollback-user", "", 0, 10).empty());
  tx->Commit();
}

void VerifyUnknownModuleIsRejected(Repository& repo) {
  auto tx  = repo.Begin();
  auto job = MakeJob("bad-module-job", "alice", 1000);
  job.module = "Robert'); DROP TABLE usage_events;--";
  assert(!repo.InsertJob(*tx, job));
  tx->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertJob(*tx, MakeJob(id, "durable-user", NowMs())));
    assert(repo->InsertJobItem(*tx, "summarizer", MakeItem(id, 1, 0)));
    assert(repo->AppendUsageEvent(*tx, UsageEventRecord{id + "-usage", "durable-user", "summarizer", 77, 1, NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetJob(*tx, "summarizer", id).has_value());
  assert(repo->ListJobItems(*tx, "summarizer", id).size() == 1);
  assert(repo->SumUnits(*tx, "durable-user", "summarizer") == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if JOBMETER_DB_SQLITE
class SqliteExecutor final : public jobmeter::db::sql::MigrationExecutor {
 public:
  explicit SqliteExecutor(jobmeter::db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  jobmeter::db::sqlite::SqliteDB& db_;
};

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("jobmeter_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto           db = std::make_shared<jobmeter::db::sqlite::SqliteDB>(db_path);
    SqliteExecutor executor(*db);
    jobmeter::db::sql::RunMigrations(executor, jobmeter::db::sql::SqliteSchema(kModules));
    return std::make_shared<jobmeter::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if JOBMETER_DB_POSTGRES
class PostgresExecutor final : public jobmeter::db::sql::MigrationExecutor {
 public:
  explicit PostgresExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("JOBMETER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("JOBMETER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<jobmeter::db::postgres::PgPool>(conninfo);
    {
      auto             conn = pool->Acquire();
      pqxx::work       tx(*conn);
      PostgresExecutor executor(tx);
      jobmeter::db::sql::RunMigrations(executor, jobmeter::db::sql::PostgresSchema(kModules));
      tx.commit();
    }
    return std::make_shared<jobmeter::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // ids are unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyJobLifecycle(*repo, run + "-life");
  VerifyPurge(*repo, run + "-purge");
  VerifyUsageLedger(*repo, run + "-usage");
  VerifyQuotaTables(*repo, run + "-quota");
  VerifyHistory(*repo, run + "-history");
  VerifyGlossary(*repo, run + "-glossary");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyUnknownModuleIsRejected(*repo);
  if (backend.name != "postgres") VerifyModuleSettings(*repo);

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if JOBMETER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if JOBMETER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "jobmeter_integration_repository_parity: pass\n";
  return 0;
}
