#include "schema.hpp"

#include <stdexcept>

namespace jobmeter::db::sql {

bool IsValidModuleKey(const std::string& module) {
  if (module.empty() || module.size() > 48) {
    return false;
  }
  if (module[0] < 'a' || module[0] > 'z') {
    return false;
  }
  for (char c : module) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::string JobsTable(const std::string& module) {
  if (!IsValidModuleKey(module)) {
    throw std::invalid_argument("invalid module key: '" + module + "'");
  }
  return module + "_jobs";
}

std::string ItemsTable(const std::string& module) {
  if (!IsValidModuleKey(module)) {
    throw std::invalid_argument("invalid module key: '" + module + "'");
  }
  return module + "_job_items";
}

std::vector<std::string> SqliteSchema(const std::vector<std::string>& modules) {
  std::vector<std::string> sql = {
      "CREATE TABLE IF NOT EXISTS usage_groups (id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, token_budget INTEGER, token_window_sec INTEGER NOT "
      "NULL);",
      "CREATE TABLE IF NOT EXISTS usage_group_limits (group_id TEXT NOT NULL REFERENCES usage_groups(id) ON DELETE CASCADE, module_key TEXT NOT "
      "NULL, unit_limit INTEGER, PRIMARY KEY (group_id, module_key));",
      "CREATE TABLE IF NOT EXISTS user_groups (user_id TEXT PRIMARY KEY, group_id TEXT NOT NULL REFERENCES usage_groups(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS usage_events (id TEXT PRIMARY KEY, user_id TEXT NOT NULL, module_key TEXT NOT NULL, tokens INTEGER NOT NULL "
      "DEFAULT 0, units INTEGER NOT NULL DEFAULT 0, occurred_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_usage_events_window ON usage_events (user_id, module_key, occurred_at_ms);",
      "CREATE TABLE IF NOT EXISTS user_job_history (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, module TEXT NOT NULL, job_key "
      "TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE (module, job_key));",
      "CREATE INDEX IF NOT EXISTS idx_user_job_history_user_module_created ON user_job_history (user_id, module, created_at_ms DESC);",
      "CREATE TABLE IF NOT EXISTS module_configs (module_name TEXT PRIMARY KEY, settings TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS glossary_terms (source_key TEXT PRIMARY KEY, source_term TEXT NOT NULL, target_term TEXT NOT NULL, notes TEXT, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
  };

  for (const auto& module : modules) {
    const auto jobs  = JobsTable(module);
    const auto items = ItemsTable(module);
    sql.push_back("CREATE TABLE IF NOT EXISTS " + jobs +
                  " (id TEXT PRIMARY KEY, user_id TEXT NOT NULL, status INTEGER NOT NULL, status_detail TEXT, error_message TEXT, usage_delta "
                  "INTEGER NOT NULL DEFAULT 0, payload TEXT NOT NULL, output_path TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER "
                  "NOT NULL, files_purged_at_ms INTEGER);");
    sql.push_back("CREATE INDEX IF NOT EXISTS idx_" + jobs + "_retention ON " + jobs + " (files_purged_at_ms, created_at_ms);");
    sql.push_back("CREATE TABLE IF NOT EXISTS " + items + " (job_id TEXT NOT NULL REFERENCES " + jobs +
                  "(id) ON DELETE CASCADE, round INTEGER NOT NULL, item_index INTEGER NOT NULL, status INTEGER NOT NULL, status_detail TEXT, "
                  "attempt_count INTEGER NOT NULL DEFAULT 0, error_message TEXT, output_path TEXT, tokens_used INTEGER NOT NULL DEFAULT 0, "
                  "payload TEXT NOT NULL, result TEXT, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (job_id, round, item_index));");
  }
  return sql;
}

std::vector<std::string> PostgresSchema(const std::vector<std::string>& modules) {
  std::vector<std::string> sql = {
      "CREATE TABLE IF NOT EXISTS usage_groups (id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, token_budget BIGINT, token_window_sec BIGINT NOT "
      "NULL);",
      "CREATE TABLE IF NOT EXISTS usage_group_limits (group_id TEXT NOT NULL REFERENCES usage_groups(id) ON DELETE CASCADE, module_key TEXT NOT "
      "NULL, unit_limit BIGINT, PRIMARY KEY (group_id, module_key));",
      "CREATE TABLE IF NOT EXISTS user_groups (user_id TEXT PRIMARY KEY, group_id TEXT NOT NULL REFERENCES usage_groups(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS usage_events (id UUID PRIMARY KEY, user_id TEXT NOT NULL, module_key TEXT NOT NULL, tokens BIGINT NOT NULL "
      "DEFAULT 0, units BIGINT NOT NULL DEFAULT 0, occurred_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_usage_events_window ON usage_events (user_id, module_key, occurred_at_ms DESC);",
      "CREATE TABLE IF NOT EXISTS user_job_history (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, module TEXT NOT NULL, job_key TEXT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, UNIQUE (module, job_key));",
      "CREATE INDEX IF NOT EXISTS idx_user_job_history_user_module_created ON user_job_history (user_id, module, created_at_ms DESC);",
      "CREATE TABLE IF NOT EXISTS module_configs (module_name TEXT PRIMARY KEY, settings JSONB NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS glossary_terms (source_key TEXT PRIMARY KEY, source_term TEXT NOT NULL, target_term TEXT NOT NULL, notes TEXT, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
  };

  for (const auto& module : modules) {
    const auto jobs  = JobsTable(module);
    const auto items = ItemsTable(module);
    sql.push_back("CREATE TABLE IF NOT EXISTS " + jobs +
                  " (id UUID PRIMARY KEY, user_id TEXT NOT NULL, status SMALLINT NOT NULL, status_detail TEXT, error_message TEXT, usage_delta "
                  "BIGINT NOT NULL DEFAULT 0, payload JSONB NOT NULL, output_path TEXT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT "
                  "NULL, files_purged_at_ms BIGINT);");
    sql.push_back("CREATE INDEX IF NOT EXISTS idx_" + jobs + "_retention ON " + jobs + " (files_purged_at_ms, created_at_ms);");
    sql.push_back("CREATE TABLE IF NOT EXISTS " + items + " (job_id UUID NOT NULL REFERENCES " + jobs +
                  "(id) ON DELETE CASCADE, round INTEGER NOT NULL, item_index INTEGER NOT NULL, status SMALLINT NOT NULL, status_detail TEXT, "
                  "attempt_count INTEGER NOT NULL DEFAULT 0, error_message TEXT, output_path TEXT, tokens_used BIGINT NOT NULL DEFAULT 0, "
                  "payload JSONB NOT NULL, result TEXT, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (job_id, round, item_index));");
  }
  return sql;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

} // namespace jobmeter::db::sql
