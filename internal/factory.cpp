#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/core/job_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/history/history_index.hpp"
#include "internal/modules/glossary.hpp"
#include "internal/modules/module_settings.hpp"
#include "internal/modules/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/store/job_store.hpp"
#include "internal/usage/quota_policy.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/job_runner.hpp"
#include "internal/worker/job_scheduler.hpp"
#include "internal/worker/job_worker.hpp"
#if JOBMETER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if JOBMETER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace jobmeter::factory {

using namespace jobmeter;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kDefaultWorkerThreads = 4;
constexpr uint32_t kDefaultHistoryLimit  = 50;
constexpr uint32_t kDefaultPgPoolSize    = 8;

#if JOBMETER_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if JOBMETER_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const jobmeter::runtime::config::RuntimeConfig& config, const std::vector<std::string>& modules) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if JOBMETER_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema(modules));
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if JOBMETER_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() > 0 ? database.postgres().pool_size() : kDefaultPgPoolSize;
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema(modules));
      tx.commit();
    }
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const jobmeter::runtime::config::RuntimeConfig& config, std::shared_ptr<llm::Provider> provider) {
  Application app;

  // ------------------------------------------------------------------
  // Modules and persistence
  // ------------------------------------------------------------------
  app.registry   = modules::BuiltinModules(config);
  app.repository = BuildRepository(config, app.registry->Keys());

  const auto root = config.storage().root_path().empty() ? std::string("./storage") : config.storage().root_path();
  app.artifacts   = std::make_shared<storage::DiskArtifactStore>(root);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  usage::QuotaSettings quota_settings;
  quota_settings.token_window  = util::ParseDurationOr(config.quota().token_window(), quota_settings.token_window);
  quota_settings.default_group = config.quota().default_group();

  retention::RetentionSettings retention_settings;
  retention_settings.interval = util::ParseDurationOr(config.retention().interval(), retention_settings.interval);
  retention_settings.max_age  = util::ParseDurationOr(config.retention().max_age(), retention_settings.max_age);

  history::HistorySettings history_settings;
  history_settings.max_age = retention_settings.max_age;
  history_settings.limit   = config.retention().history_limit() > 0 ? config.retention().history_limit() : kDefaultHistoryLimit;

  app.store    = std::make_shared<store::JobStore>(app.repository);
  app.ledger   = std::make_shared<usage::UsageLedger>(app.repository);
  app.quota    = std::make_shared<usage::QuotaPolicy>(app.repository, app.ledger, quota_settings);
  app.settings = std::make_shared<modules::ModuleSettingsStore>(app.repository, app.registry);
  app.glossary = std::make_shared<modules::GlossaryStore>(app.repository);
  app.history  = std::make_shared<history::HistoryIndex>(app.repository, app.registry, history_settings);

  // ------------------------------------------------------------------
  // Job workers
  // ------------------------------------------------------------------
  if (provider) {
    app.scheduler = std::make_shared<worker::JobScheduler>();
    app.runner    = std::make_shared<worker::JobRunner>(app.repository, app.registry, app.store, app.ledger, app.settings, app.glossary,
                                                     app.artifacts, std::move(provider));

    const auto threads = config.worker().threads() > 0 ? config.worker().threads() : kDefaultWorkerThreads;
    for (uint32_t i = 0; i < threads; ++i) {
      auto worker = std::make_shared<worker::JobWorker>(app.scheduler, app.runner);
      worker->Start();
      app.workers.push_back(std::move(worker));
    }
  }

  app.engine  = std::make_shared<core::JobEngine>(app.repository, app.registry, app.store, app.ledger, app.quota, app.history, app.scheduler);
  app.sweeper = std::make_shared<retention::RetentionSweeper>(app.repository, app.registry, app.store, app.artifacts, app.history,
                                                              retention_settings);

  JOBMETER_LOG_INFO("application built", {StringField("storage_root", root), IntField("modules", static_cast<int64_t>(app.registry->All().size())),
                                          IntField("workers", static_cast<int64_t>(app.workers.size()))});
  return app;
}

void Application::Shutdown() {
  if (sweeper) sweeper->Stop();
  for (auto& worker : workers) {
    worker->Stop();
  }
}

} // namespace jobmeter::factory
