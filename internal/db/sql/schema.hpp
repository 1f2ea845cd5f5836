#pragma once

#include <string>
#include <vector>

namespace jobmeter::db::sql {

/*
  Schema bootstrap.

  Shared tables plus one <module>_jobs / <module>_job_items pair per
  registered module. Module keys end up in table names, so they are
  restricted to [a-z][a-z0-9_]* and checked before any SQL is built.
*/

bool IsValidModuleKey(const std::string& module);

// Throw std::invalid_argument for keys failing IsValidModuleKey.
std::string JobsTable(const std::string& module);
std::string ItemsTable(const std::string& module);

std::vector<std::string> SqliteSchema(const std::vector<std::string>& modules);
std::vector<std::string> PostgresSchema(const std::vector<std::string>& modules);

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Runs statements in order; the first failure propagates.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace jobmeter::db::sql
