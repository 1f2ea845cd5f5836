#include "pg_repository.hpp"

#include <optional>

#include "internal/db/sql/schema.hpp"
#include "internal/util/text.hpp"

namespace jobmeter::db::postgres {

using jobmeter::model::JobStatus;

namespace {

std::optional<std::string> OptText(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<int64_t> OptTime(int64_t ms) {
  if (ms == 0) return std::nullopt;
  return ms;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

int64_t I64OrZero(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<int64_t>();
}

std::optional<int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

JobStatus Status(const pqxx::field& f) {
  auto status = jobmeter::model::FromInt(f.as<int>());
  if (!status) throw std::runtime_error("unknown job status " + std::string(f.c_str()));
  return *status;
}

constexpr const char* kJobSelect =
    "SELECT id::text,user_id,status,status_detail,error_message,usage_delta,payload::text,output_path,created_at_ms,updated_at_ms,"
    "files_purged_at_ms FROM ";

model::JobRecord ReadJob(const pqxx::row& row, const std::string& module) {
  model::JobRecord r;
  r.id                 = row[0].c_str();
  r.module             = module;
  r.user_id            = row[1].c_str();
  r.status             = Status(row[2]);
  r.status_detail      = Text(row[3]);
  r.error_message      = Text(row[4]);
  r.usage_delta        = row[5].as<int64_t>();
  r.payload_json       = row[6].c_str();
  r.output_path        = Text(row[7]);
  r.created_at_ms      = row[8].as<int64_t>();
  r.updated_at_ms      = row[9].as<int64_t>();
  r.files_purged_at_ms = I64OrZero(row[10]);
  return r;
}

constexpr const char* kItemSelect =
    "SELECT job_id::text,round,item_index,status,status_detail,attempt_count,error_message,output_path,tokens_used,payload::text,result,"
    "updated_at_ms FROM ";

model::JobItemRecord ReadItem(const pqxx::row& row) {
  model::JobItemRecord r;
  r.job_id        = row[0].c_str();
  r.round         = row[1].as<uint32_t>();
  r.index         = row[2].as<uint32_t>();
  r.status        = Status(row[3]);
  r.status_detail = Text(row[4]);
  r.attempt_count = row[5].as<uint32_t>();
  r.error_message = Text(row[6]);
  r.output_path   = Text(row[7]);
  r.tokens_used   = row[8].as<int64_t>();
  r.payload_json  = row[9].c_str();
  r.result_text   = Text(row[10]);
  r.updated_at_ms = row[11].as<int64_t>();
  return r;
}

model::UsageGroupRecord ReadGroup(const pqxx::row& row) {
  model::UsageGroupRecord r;
  r.id               = row[0].c_str();
  r.name             = row[1].c_str();
  r.token_budget     = OptI64(row[2]);
  r.token_window_sec = row[3].as<int64_t>();
  return r;
}

std::string JsonOrEmpty(const std::string& json) {
  return json.empty() ? "{}" : json;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  if (!sql::IsValidModuleKey(r.module)) return Result::Err(ErrorCode::Unsupported, "invalid module key: " + r.module);
  try {
    TX(t).Work().exec_params("INSERT INTO " + sql::JobsTable(r.module) +
                                 "(id,user_id,status,status_detail,error_message,usage_delta,payload,output_path,created_at_ms,updated_at_ms,"
                                 "files_purged_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9,$10,$11);",
                             r.id, r.user_id, static_cast<int>(r.status), OptText(r.status_detail), OptText(r.error_message), r.usage_delta,
                             JsonOrEmpty(r.payload_json), OptText(r.output_path), r.created_at_ms, r.updated_at_ms, OptTime(r.files_purged_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& module, const std::string& id) {
  auto res = TX(t).Work().exec_params(kJobSelect + sql::JobsTable(module) + " WHERE id=$1 FOR UPDATE;", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0], module);
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE " + sql::JobsTable(r.module) +
            " SET status=$2,status_detail=$3,error_message=$4,usage_delta=$5,payload=$6::jsonb,output_path=$7,updated_at_ms=$8,"
            "files_purged_at_ms=$9 WHERE id=$1;",
        r.id, static_cast<int>(r.status), OptText(r.status_detail), OptText(r.error_message), r.usage_delta, JsonOrEmpty(r.payload_json),
        OptText(r.output_path), r.updated_at_ms, OptTime(r.files_purged_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ListPurgeCandidates(Transaction& t, const std::string& module, int64_t created_before_ms) {
  auto res = TX(t).Work().exec_params(kJobSelect + sql::JobsTable(module) +
                                          " WHERE files_purged_at_ms IS NULL AND status IN ($1,$2) AND created_at_ms < $3 ORDER BY created_at_ms ASC;",
                                      static_cast<int>(JobStatus::kCompleted), static_cast<int>(JobStatus::kFailed), created_before_ms);

  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadJob(row, module));
  return out;
}

Result PgRepository::MarkJobPurged(Transaction& t, const std::string& module, const std::string& id, int64_t purged_at_ms) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_params("UPDATE " + sql::JobsTable(module) +
                                    " SET output_path=NULL,files_purged_at_ms=$2,updated_at_ms=$2 WHERE id=$1 AND files_purged_at_ms IS NULL AND "
                                    "status IN ($3,$4);",
                                id, purged_at_ms, static_cast<int>(JobStatus::kCompleted), static_cast<int>(JobStatus::kFailed));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);

    work.exec_params("UPDATE " + sql::ItemsTable(module) + " SET output_path=NULL WHERE job_id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Job items
// ------------------------------------------------------------------

Result PgRepository::InsertJobItem(Transaction& t, const std::string& module, const model::JobItemRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO " + sql::ItemsTable(module) +
                                 "(job_id,round,item_index,status,status_detail,attempt_count,error_message,output_path,tokens_used,payload,result,"
                                 "updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10::jsonb,$11,$12);",
                             r.job_id, r.round, r.index, static_cast<int>(r.status), OptText(r.status_detail), r.attempt_count,
                             OptText(r.error_message), OptText(r.output_path), r.tokens_used, JsonOrEmpty(r.payload_json), OptText(r.result_text),
                             r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateJobItem(Transaction& t, const std::string& module, const model::JobItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE " + sql::ItemsTable(module) +
                                            " SET status=$4,status_detail=$5,attempt_count=$6,error_message=$7,output_path=$8,tokens_used=$9,"
                                            "payload=$10::jsonb,result=$11,updated_at_ms=$12 WHERE job_id=$1 AND round=$2 AND item_index=$3;",
                                        r.job_id, r.round, r.index, static_cast<int>(r.status), OptText(r.status_detail), r.attempt_count,
                                        OptText(r.error_message), OptText(r.output_path), r.tokens_used, JsonOrEmpty(r.payload_json),
                                        OptText(r.result_text), r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.job_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobItemRecord> PgRepository::ListJobItems(Transaction& t, const std::string& module, const std::string& job_id) {
  auto res = TX(t).Work().exec_params(kItemSelect + sql::ItemsTable(module) + " WHERE job_id=$1 ORDER BY round ASC, item_index ASC;", job_id);

  std::vector<model::JobItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadItem(row));
  return out;
}

// ------------------------------------------------------------------
// Usage ledger
// ------------------------------------------------------------------

Result PgRepository::AppendUsageEvent(Transaction& t, const model::UsageEventRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO usage_events(id,user_id,module_key,tokens,units,occurred_at_ms) VALUES($1,$2,$3,$4,$5,$6);", r.id,
                             r.user_id, r.module, r.tokens, r.units, r.occurred_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

int64_t PgRepository::SumTokensSince(Transaction& t, const std::string& user_id, int64_t since_ms) {
  auto res = TX(t).Work().exec_params("SELECT COALESCE(SUM(tokens),0)::bigint FROM usage_events WHERE user_id=$1 AND occurred_at_ms>=$2;", user_id,
                                      since_ms);
  return res[0][0].as<int64_t>();
}

int64_t PgRepository::SumUnits(Transaction& t, const std::string& user_id, const std::string& module) {
  auto res =
      TX(t).Work().exec_params("SELECT COALESCE(SUM(units),0)::bigint FROM usage_events WHERE user_id=$1 AND module_key=$2;", user_id, module);
  return res[0][0].as<int64_t>();
}

// ------------------------------------------------------------------
// Quota policy
// ------------------------------------------------------------------

Result PgRepository::UpsertUsageGroup(Transaction& t, const model::UsageGroupRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO usage_groups(id,name,token_budget,token_window_sec) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,token_budget=EXCLUDED.token_budget,token_window_sec=EXCLUDED.token_window_sec;",
        r.id, r.name, r.token_budget, r.token_window_sec);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UsageGroupRecord> PgRepository::GetUsageGroup(Transaction& t, const std::string& group_id) {
  auto res = TX(t).Work().exec_params("SELECT id,name,token_budget,token_window_sec FROM usage_groups WHERE id=$1;", group_id);
  if (res.empty()) return std::nullopt;
  return ReadGroup(res[0]);
}

std::vector<model::UsageGroupRecord> PgRepository::ListUsageGroups(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,name,token_budget,token_window_sec FROM usage_groups ORDER BY name ASC;");

  std::vector<model::UsageGroupRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadGroup(row));
  return out;
}

Result PgRepository::UpsertGroupLimit(Transaction& t, const model::GroupLimitRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO usage_group_limits(group_id,module_key,unit_limit) VALUES($1,$2,$3) "
        "ON CONFLICT(group_id,module_key) DO UPDATE SET unit_limit=EXCLUDED.unit_limit;",
        r.group_id, r.module, r.unit_limit);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::GroupLimitRecord> PgRepository::GetGroupLimit(Transaction& t, const std::string& group_id, const std::string& module) {
  auto res = TX(t).Work().exec_params("SELECT group_id,module_key,unit_limit FROM usage_group_limits WHERE group_id=$1 AND module_key=$2;",
                                      group_id, module);
  if (res.empty()) return std::nullopt;
  return model::GroupLimitRecord{res[0][0].c_str(), res[0][1].c_str(), OptI64(res[0][2])};
}

std::vector<model::GroupLimitRecord> PgRepository::ListGroupLimits(Transaction& t, const std::string& group_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT group_id,module_key,unit_limit FROM usage_group_limits WHERE group_id=$1 ORDER BY module_key ASC;", group_id);

  std::vector<model::GroupLimitRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({row[0].c_str(), row[1].c_str(), OptI64(row[2])});
  return out;
}

Result PgRepository::AssignUserGroup(Transaction& t, const std::string& user_id, const std::string& group_id) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO user_groups(user_id,group_id) VALUES($1,$2) ON CONFLICT(user_id) DO UPDATE SET group_id=EXCLUDED.group_id;", user_id,
        group_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetUserGroup(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params("SELECT group_id FROM user_groups WHERE user_id=$1;", user_id);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

// ------------------------------------------------------------------
// History index
// ------------------------------------------------------------------

Result PgRepository::InsertHistory(Transaction& t, const model::HistoryRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO user_job_history(user_id,module,job_key,created_at_ms) VALUES($1,$2,$3,$4) ON CONFLICT(module,job_key) DO NOTHING;",
        r.user_id, r.module, r.job_key, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HistoryRecord> PgRepository::ListHistory(Transaction& t, const std::string& user_id, const std::string& module,
                                                            int64_t since_ms, uint32_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT user_id,module,job_key,created_at_ms FROM user_job_history "
      "WHERE user_id=$1 AND ($2='' OR module=$2) AND created_at_ms>=$3 "
      "ORDER BY created_at_ms DESC, id DESC LIMIT $4;",
      user_id, module, since_ms, static_cast<int64_t>(limit));

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].c_str(), row[1].c_str(), row[2].c_str(), row[3].as<int64_t>()});
  }
  return out;
}

Result PgRepository::DeleteHistoryBefore(Transaction& t, int64_t cutoff_ms) {
  try {
    TX(t).Work().exec_params("DELETE FROM user_job_history WHERE created_at_ms<$1;", cutoff_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TrimHistory(Transaction& t, uint32_t keep) {
  try {
    TX(t).Work().exec_params(
        "DELETE FROM user_job_history WHERE id IN ("
        "SELECT id FROM (SELECT id, ROW_NUMBER() OVER (PARTITION BY user_id, module ORDER BY created_at_ms DESC, id DESC) AS rn "
        "FROM user_job_history) ranked WHERE rn>$1);",
        static_cast<int64_t>(keep));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Module settings
// ------------------------------------------------------------------

Result PgRepository::UpsertModuleSettings(Transaction& t, const model::ModuleSettingsRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO module_configs(module_name,settings,updated_at_ms) VALUES($1,$2::jsonb,$3) "
        "ON CONFLICT(module_name) DO UPDATE SET settings=EXCLUDED.settings,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.module, r.settings_json, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ModuleSettingsRecord> PgRepository::GetModuleSettings(Transaction& t, const std::string& module) {
  auto res = TX(t).Work().exec_params("SELECT module_name,settings::text,updated_at_ms FROM module_configs WHERE module_name=$1;", module);
  if (res.empty()) return std::nullopt;
  return model::ModuleSettingsRecord{res[0][0].c_str(), res[0][1].c_str(), res[0][2].as<int64_t>()};
}

// ------------------------------------------------------------------
// Glossary
// ------------------------------------------------------------------

Result PgRepository::UpsertGlossaryTerm(Transaction& t, const model::GlossaryTermRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO glossary_terms(source_key,source_term,target_term,notes,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(source_key) DO UPDATE SET source_term=EXCLUDED.source_term,target_term=EXCLUDED.target_term,"
        "notes=EXCLUDED.notes,updated_at_ms=EXCLUDED.updated_at_ms;",
        util::LowerAscii(r.source_term), r.source_term, r.target_term, OptText(r.notes), r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GlossaryTermRecord> PgRepository::ListGlossaryTerms(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT source_term,target_term,notes,created_at_ms,updated_at_ms FROM glossary_terms ORDER BY source_term COLLATE \"C\";");

  std::vector<model::GlossaryTermRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({Text(row[0]), Text(row[1]), Text(row[2]), row[3].as<int64_t>(), row[4].as<int64_t>()});
  }
  return out;
}

Result PgRepository::DeleteGlossaryTerm(Transaction& t, const std::string& source_term) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM glossary_terms WHERE source_key=$1;", util::LowerAscii(source_term));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "glossary term " + source_term);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace jobmeter::db::postgres
