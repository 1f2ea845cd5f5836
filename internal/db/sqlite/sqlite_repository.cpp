#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/schema.hpp"
#include "internal/util/text.hpp"

namespace jobmeter::db::sqlite {

using jobmeter::db::ErrorCode;
using jobmeter::db::Result;
using jobmeter::model::JobStatus;

namespace {

// Finalizes on scope exit.
class Stmt {
 public:
  Stmt(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw std::runtime_error("sqlite prepare: " + msg);
    }
  }
  ~Stmt() {
    sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // Reads only: errors other than DONE/ROW propagate.
  bool Next() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty string -> NULL
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// 0 -> NULL
void BindTimeOrNull(sqlite3_stmt* st, int idx, int64_t ms) {
  if (ms == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindI64(st, idx, ms);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

JobStatus ColStatus(sqlite3_stmt* st, int col) {
  auto status = jobmeter::model::FromInt(sqlite3_column_int(st, col));
  if (!status) throw std::runtime_error("unknown job status " + std::to_string(sqlite3_column_int(st, col)));
  return *status;
}

constexpr const char* kJobColumns =
    "id,user_id,status,status_detail,error_message,usage_delta,payload,output_path,created_at_ms,updated_at_ms,files_purged_at_ms";

model::JobRecord ReadJob(sqlite3_stmt* st, const std::string& module) {
  model::JobRecord r;
  r.id                 = ColText(st, 0);
  r.module             = module;
  r.user_id            = ColText(st, 1);
  r.status             = ColStatus(st, 2);
  r.status_detail      = ColText(st, 3);
  r.error_message      = ColText(st, 4);
  r.usage_delta        = ColI64(st, 5);
  r.payload_json       = ColText(st, 6);
  r.output_path        = ColText(st, 7);
  r.created_at_ms      = ColI64(st, 8);
  r.updated_at_ms      = ColI64(st, 9);
  r.files_purged_at_ms = ColI64(st, 10);
  return r;
}

constexpr const char* kItemColumns =
    "job_id,round,item_index,status,status_detail,attempt_count,error_message,output_path,tokens_used,payload,result,updated_at_ms";

model::JobItemRecord ReadItem(sqlite3_stmt* st) {
  model::JobItemRecord r;
  r.job_id        = ColText(st, 0);
  r.round         = static_cast<uint32_t>(sqlite3_column_int64(st, 1));
  r.index         = static_cast<uint32_t>(sqlite3_column_int64(st, 2));
  r.status        = ColStatus(st, 3);
  r.status_detail = ColText(st, 4);
  r.attempt_count = static_cast<uint32_t>(sqlite3_column_int64(st, 5));
  r.error_message = ColText(st, 6);
  r.output_path   = ColText(st, 7);
  r.tokens_used   = ColI64(st, 8);
  r.payload_json  = ColText(st, 9);
  r.result_text   = ColText(st, 10);
  r.updated_at_ms = ColI64(st, 11);
  return r;
}

model::UsageGroupRecord ReadGroup(sqlite3_stmt* st) {
  model::UsageGroupRecord r;
  r.id               = ColText(st, 0);
  r.name             = ColText(st, 1);
  r.token_budget     = ColOptI64(st, 2);
  r.token_window_sec = ColI64(st, 3);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (sqlite3_extended_errcode(db)) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  if (!sql::IsValidModuleKey(r.module)) return Result::Err(ErrorCode::Unsupported, "invalid module key: " + r.module);
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO " + sql::JobsTable(r.module) + "(" + kJobColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.user_id);
  BindI64(st.get(), 3, static_cast<int64_t>(r.status));
  BindOptText(st.get(), 4, r.status_detail);
  BindOptText(st.get(), 5, r.error_message);
  BindI64(st.get(), 6, r.usage_delta);
  BindText(st.get(), 7, r.payload_json.empty() ? "{}" : r.payload_json);
  BindOptText(st.get(), 8, r.output_path);
  BindI64(st.get(), 9, r.created_at_ms);
  BindI64(st.get(), 10, r.updated_at_ms);
  BindTimeOrNull(st.get(), 11, r.files_purged_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& module, const std::string& id) {
  auto* db = TX(t).Handle();

  Stmt st(db, std::string("SELECT ") + kJobColumns + " FROM " + sql::JobsTable(module) + " WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!st.Next()) return std::nullopt;
  return ReadJob(st.get(), module);
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "UPDATE " + sql::JobsTable(r.module) +
                  " SET status=?,status_detail=?,error_message=?,usage_delta=?,payload=?,output_path=?,updated_at_ms=?,files_purged_at_ms=? "
                  "WHERE id=?;");
  BindI64(st.get(), 1, static_cast<int64_t>(r.status));
  BindOptText(st.get(), 2, r.status_detail);
  BindOptText(st.get(), 3, r.error_message);
  BindI64(st.get(), 4, r.usage_delta);
  BindText(st.get(), 5, r.payload_json.empty() ? "{}" : r.payload_json);
  BindOptText(st.get(), 6, r.output_path);
  BindI64(st.get(), 7, r.updated_at_ms);
  BindTimeOrNull(st.get(), 8, r.files_purged_at_ms);
  BindText(st.get(), 9, r.id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return Result::Ok();
}

std::vector<model::JobRecord> SqliteRepository::ListPurgeCandidates(Transaction& t, const std::string& module, int64_t created_before_ms) {
  auto* db = TX(t).Handle();

  Stmt st(db, std::string("SELECT ") + kJobColumns + " FROM " + sql::JobsTable(module) +
                  " WHERE files_purged_at_ms IS NULL AND status IN (?,?) AND created_at_ms < ? ORDER BY created_at_ms ASC;");
  BindI64(st.get(), 1, static_cast<int64_t>(JobStatus::kCompleted));
  BindI64(st.get(), 2, static_cast<int64_t>(JobStatus::kFailed));
  BindI64(st.get(), 3, created_before_ms);

  std::vector<model::JobRecord> out;
  while (st.Next()) out.push_back(ReadJob(st.get(), module));
  return out;
}

Result SqliteRepository::MarkJobPurged(Transaction& t, const std::string& module, const std::string& id, int64_t purged_at_ms) {
  auto* db = TX(t).Handle();

  {
    Stmt st(db, "UPDATE " + sql::JobsTable(module) +
                    " SET output_path=NULL,files_purged_at_ms=?,updated_at_ms=? WHERE id=? AND files_purged_at_ms IS NULL AND status IN (?,?);");
    BindI64(st.get(), 1, purged_at_ms);
    BindI64(st.get(), 2, purged_at_ms);
    BindText(st.get(), 3, id);
    BindI64(st.get(), 4, static_cast<int64_t>(JobStatus::kCompleted));
    BindI64(st.get(), 5, static_cast<int64_t>(JobStatus::kFailed));

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  }

  Stmt items(db, "UPDATE " + sql::ItemsTable(module) + " SET output_path=NULL WHERE job_id=?;");
  BindText(items.get(), 1, id);
  return Translate(db, sqlite3_step(items.get()));
}

// ------------------------------------------------------------------
// Job items
// ------------------------------------------------------------------

Result SqliteRepository::InsertJobItem(Transaction& t, const std::string& module, const model::JobItemRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO " + sql::ItemsTable(module) + "(" + kItemColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.job_id);
  BindI64(st.get(), 2, r.round);
  BindI64(st.get(), 3, r.index);
  BindI64(st.get(), 4, static_cast<int64_t>(r.status));
  BindOptText(st.get(), 5, r.status_detail);
  BindI64(st.get(), 6, r.attempt_count);
  BindOptText(st.get(), 7, r.error_message);
  BindOptText(st.get(), 8, r.output_path);
  BindI64(st.get(), 9, r.tokens_used);
  BindText(st.get(), 10, r.payload_json.empty() ? "{}" : r.payload_json);
  BindOptText(st.get(), 11, r.result_text);
  BindI64(st.get(), 12, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateJobItem(Transaction& t, const std::string& module, const model::JobItemRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "UPDATE " + sql::ItemsTable(module) +
                  " SET status=?,status_detail=?,attempt_count=?,error_message=?,output_path=?,tokens_used=?,payload=?,result=?,updated_at_ms=? "
                  "WHERE job_id=? AND round=? AND item_index=?;");
  BindI64(st.get(), 1, static_cast<int64_t>(r.status));
  BindOptText(st.get(), 2, r.status_detail);
  BindI64(st.get(), 3, r.attempt_count);
  BindOptText(st.get(), 4, r.error_message);
  BindOptText(st.get(), 5, r.output_path);
  BindI64(st.get(), 6, r.tokens_used);
  BindText(st.get(), 7, r.payload_json.empty() ? "{}" : r.payload_json);
  BindOptText(st.get(), 8, r.result_text);
  BindI64(st.get(), 9, r.updated_at_ms);
  BindText(st.get(), 10, r.job_id);
  BindI64(st.get(), 11, r.round);
  BindI64(st.get(), 12, r.index);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.job_id);
  return Result::Ok();
}

std::vector<model::JobItemRecord> SqliteRepository::ListJobItems(Transaction& t, const std::string& module, const std::string& job_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, std::string("SELECT ") + kItemColumns + " FROM " + sql::ItemsTable(module) + " WHERE job_id=? ORDER BY round ASC, item_index ASC;");
  BindText(st.get(), 1, job_id);

  std::vector<model::JobItemRecord> out;
  while (st.Next()) out.push_back(ReadItem(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Usage ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendUsageEvent(Transaction& t, const model::UsageEventRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO usage_events(id,user_id,module_key,tokens,units,occurred_at_ms) VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.user_id);
  BindText(st.get(), 3, r.module);
  BindI64(st.get(), 4, r.tokens);
  BindI64(st.get(), 5, r.units);
  BindI64(st.get(), 6, r.occurred_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

int64_t SqliteRepository::SumTokensSince(Transaction& t, const std::string& user_id, int64_t since_ms) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT COALESCE(SUM(tokens),0) FROM usage_events WHERE user_id=? AND occurred_at_ms>=?;");
  BindText(st.get(), 1, user_id);
  BindI64(st.get(), 2, since_ms);

  return st.Next() ? ColI64(st.get(), 0) : 0;
}

int64_t SqliteRepository::SumUnits(Transaction& t, const std::string& user_id, const std::string& module) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT COALESCE(SUM(units),0) FROM usage_events WHERE user_id=? AND module_key=?;");
  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, module);

  return st.Next() ? ColI64(st.get(), 0) : 0;
}

// ------------------------------------------------------------------
// Quota policy
// ------------------------------------------------------------------

Result SqliteRepository::UpsertUsageGroup(Transaction& t, const model::UsageGroupRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO usage_groups(id,name,token_budget,token_window_sec) VALUES(?,?,?,?) "
          "ON CONFLICT(id) DO UPDATE SET name=excluded.name, token_budget=excluded.token_budget, token_window_sec=excluded.token_window_sec;");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindOptI64(st.get(), 3, r.token_budget);
  BindI64(st.get(), 4, r.token_window_sec);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::UsageGroupRecord> SqliteRepository::GetUsageGroup(Transaction& t, const std::string& group_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT id,name,token_budget,token_window_sec FROM usage_groups WHERE id=?;");
  BindText(st.get(), 1, group_id);

  if (!st.Next()) return std::nullopt;
  return ReadGroup(st.get());
}

std::vector<model::UsageGroupRecord> SqliteRepository::ListUsageGroups(Transaction& t) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT id,name,token_budget,token_window_sec FROM usage_groups ORDER BY name ASC;");

  std::vector<model::UsageGroupRecord> out;
  while (st.Next()) out.push_back(ReadGroup(st.get()));
  return out;
}

Result SqliteRepository::UpsertGroupLimit(Transaction& t, const model::GroupLimitRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO usage_group_limits(group_id,module_key,unit_limit) VALUES(?,?,?) "
          "ON CONFLICT(group_id,module_key) DO UPDATE SET unit_limit=excluded.unit_limit;");
  BindText(st.get(), 1, r.group_id);
  BindText(st.get(), 2, r.module);
  BindOptI64(st.get(), 3, r.unit_limit);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::GroupLimitRecord> SqliteRepository::GetGroupLimit(Transaction& t, const std::string& group_id, const std::string& module) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT group_id,module_key,unit_limit FROM usage_group_limits WHERE group_id=? AND module_key=?;");
  BindText(st.get(), 1, group_id);
  BindText(st.get(), 2, module);

  if (!st.Next()) return std::nullopt;
  return model::GroupLimitRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColOptI64(st.get(), 2)};
}

std::vector<model::GroupLimitRecord> SqliteRepository::ListGroupLimits(Transaction& t, const std::string& group_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT group_id,module_key,unit_limit FROM usage_group_limits WHERE group_id=? ORDER BY module_key ASC;");
  BindText(st.get(), 1, group_id);

  std::vector<model::GroupLimitRecord> out;
  while (st.Next()) out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColOptI64(st.get(), 2)});
  return out;
}

Result SqliteRepository::AssignUserGroup(Transaction& t, const std::string& user_id, const std::string& group_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO user_groups(user_id,group_id) VALUES(?,?) ON CONFLICT(user_id) DO UPDATE SET group_id=excluded.group_id;");
  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, group_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<std::string> SqliteRepository::GetUserGroup(Transaction& t, const std::string& user_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT group_id FROM user_groups WHERE user_id=?;");
  BindText(st.get(), 1, user_id);

  if (!st.Next()) return std::nullopt;
  return ColText(st.get(), 0);
}

// ------------------------------------------------------------------
// History index
// ------------------------------------------------------------------

Result SqliteRepository::InsertHistory(Transaction& t, const model::HistoryRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO user_job_history(user_id,module,job_key,created_at_ms) VALUES(?,?,?,?) ON CONFLICT(module,job_key) DO NOTHING;");
  BindText(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.module);
  BindText(st.get(), 3, r.job_key);
  BindI64(st.get(), 4, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::HistoryRecord> SqliteRepository::ListHistory(Transaction& t, const std::string& user_id, const std::string& module,
                                                                int64_t since_ms, uint32_t limit) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "SELECT user_id,module,job_key,created_at_ms FROM user_job_history "
          "WHERE user_id=?1 AND (?2='' OR module=?2) AND created_at_ms>=?3 "
          "ORDER BY created_at_ms DESC, id DESC LIMIT ?4;");
  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, module);
  BindI64(st.get(), 3, since_ms);
  BindI64(st.get(), 4, limit);

  std::vector<model::HistoryRecord> out;
  while (st.Next()) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2), ColI64(st.get(), 3)});
  }
  return out;
}

Result SqliteRepository::DeleteHistoryBefore(Transaction& t, int64_t cutoff_ms) {
  auto* db = TX(t).Handle();

  Stmt st(db, "DELETE FROM user_job_history WHERE created_at_ms<?;");
  BindI64(st.get(), 1, cutoff_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::TrimHistory(Transaction& t, uint32_t keep) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "DELETE FROM user_job_history WHERE id IN ("
          "SELECT id FROM (SELECT id, ROW_NUMBER() OVER (PARTITION BY user_id, module ORDER BY created_at_ms DESC, id DESC) AS rn "
          "FROM user_job_history) WHERE rn>?);");
  BindI64(st.get(), 1, keep);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Module settings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertModuleSettings(Transaction& t, const model::ModuleSettingsRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO module_configs(module_name,settings,updated_at_ms) VALUES(?,?,?) "
          "ON CONFLICT(module_name) DO UPDATE SET settings=excluded.settings, updated_at_ms=excluded.updated_at_ms;");
  BindText(st.get(), 1, r.module);
  BindText(st.get(), 2, r.settings_json);
  BindI64(st.get(), 3, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ModuleSettingsRecord> SqliteRepository::GetModuleSettings(Transaction& t, const std::string& module) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT module_name,settings,updated_at_ms FROM module_configs WHERE module_name=?;");
  BindText(st.get(), 1, module);

  if (!st.Next()) return std::nullopt;
  return model::ModuleSettingsRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColI64(st.get(), 2)};
}

// ------------------------------------------------------------------
// Glossary
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGlossaryTerm(Transaction& t, const model::GlossaryTermRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO glossary_terms(source_key,source_term,target_term,notes,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?) "
          "ON CONFLICT(source_key) DO UPDATE SET source_term=excluded.source_term, target_term=excluded.target_term, "
          "notes=excluded.notes, updated_at_ms=excluded.updated_at_ms;");
  BindText(st.get(), 1, util::LowerAscii(r.source_term));
  BindText(st.get(), 2, r.source_term);
  BindText(st.get(), 3, r.target_term);
  BindOptText(st.get(), 4, r.notes);
  BindI64(st.get(), 5, r.created_at_ms);
  BindI64(st.get(), 6, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::GlossaryTermRecord> SqliteRepository::ListGlossaryTerms(Transaction& t) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT source_term,target_term,notes,created_at_ms,updated_at_ms FROM glossary_terms ORDER BY source_term;");

  std::vector<model::GlossaryTermRecord> out;
  while (st.Next()) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2), ColI64(st.get(), 3), ColI64(st.get(), 4)});
  }
  return out;
}

Result SqliteRepository::DeleteGlossaryTerm(Transaction& t, const std::string& source_term) {
  auto* db = TX(t).Handle();

  Stmt st(db, "DELETE FROM glossary_terms WHERE source_key=?;");
  BindText(st.get(), 1, util::LowerAscii(source_term));

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "glossary term " + source_term);
  return Result::Ok();
}

} // namespace jobmeter::db::sqlite
