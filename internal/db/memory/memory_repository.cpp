#include "memory_repository.hpp"

#include <algorithm>

#include "internal/db/sql/schema.hpp"
#include "internal/util/text.hpp"
#include "memory_tx.hpp"

namespace jobmeter::db::memory {

using jobmeter::model::IsTerminal;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  if (!sql::IsValidModuleKey(r.module)) return Result::Err(ErrorCode::Unsupported, "invalid module key: " + r.module);
  auto& jobs = TX(t).Mutable().modules[r.module].jobs;
  if (jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& module, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        mt = s.modules.find(module);
  if (mt == s.modules.end()) return std::nullopt;
  auto it = mt->second.jobs.find(id);
  if (it == mt->second.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  mt = s.modules.find(r.module);
  if (mt == s.modules.end() || !mt->second.jobs.contains(r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  mt->second.jobs[r.id] = r;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ListPurgeCandidates(Transaction& t, const std::string& module, int64_t created_before_ms) {
  std::vector<model::JobRecord> out;

  const auto& s  = TX(t).View();
  auto        mt = s.modules.find(module);
  if (mt == s.modules.end()) return out;

  for (const auto& [_, job] : mt->second.jobs) {
    if (IsTerminal(job.status) && job.files_purged_at_ms == 0 && job.created_at_ms < created_before_ms) {
      out.push_back(job);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

Result MemoryRepository::MarkJobPurged(Transaction& t, const std::string& module, const std::string& id, int64_t purged_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  mt = s.modules.find(module);
  if (mt == s.modules.end()) return Result::Err(ErrorCode::NotFound, id);

  auto it = mt->second.jobs.find(id);
  if (it == mt->second.jobs.end() || it->second.files_purged_at_ms != 0 || !IsTerminal(it->second.status)) {
    return Result::Err(ErrorCode::NotFound, id);
  }

  it->second.output_path        = {};
  it->second.files_purged_at_ms = purged_at_ms;
  it->second.updated_at_ms      = purged_at_ms;

  for (auto& [key, item] : mt->second.items) {
    if (std::get<0>(key) == id) {
      item.output_path = {};
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Job items
// ------------------------------------------------------------------

Result MemoryRepository::InsertJobItem(Transaction& t, const std::string& module, const model::JobItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  mt = s.modules.find(module);
  if (mt == s.modules.end() || !mt->second.jobs.contains(r.job_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "job item references unknown job " + r.job_id);
  }

  ItemKey key{r.job_id, r.round, r.index};
  if (mt->second.items.contains(key)) return Result::Err(ErrorCode::AlreadyExists, r.job_id);
  mt->second.items[key] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateJobItem(Transaction& t, const std::string& module, const model::JobItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  mt = s.modules.find(module);
  if (mt == s.modules.end()) return Result::Err(ErrorCode::NotFound, r.job_id);

  auto it = mt->second.items.find(ItemKey{r.job_id, r.round, r.index});
  if (it == mt->second.items.end()) return Result::Err(ErrorCode::NotFound, r.job_id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::JobItemRecord> MemoryRepository::ListJobItems(Transaction& t, const std::string& module, const std::string& job_id) {
  std::vector<model::JobItemRecord> out;

  const auto& s  = TX(t).View();
  auto        mt = s.modules.find(module);
  if (mt == s.modules.end()) return out;

  // std::map keeps (job_id, round, index) order
  auto it = mt->second.items.lower_bound(ItemKey{job_id, 0, 0});
  for (; it != mt->second.items.end() && std::get<0>(it->first) == job_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Usage ledger
// ------------------------------------------------------------------

Result MemoryRepository::AppendUsageEvent(Transaction& t, const model::UsageEventRecord& r) {
  auto& events = TX(t).Mutable().usage_events;
  if (std::any_of(events.begin(), events.end(), [&](const auto& e) { return e.id == r.id; })) {
    return Result::Err(ErrorCode::AlreadyExists, r.id);
  }
  events.push_back(r);
  return Result::Ok();
}

int64_t MemoryRepository::SumTokensSince(Transaction& t, const std::string& user_id, int64_t since_ms) {
  int64_t total = 0;
  for (const auto& e : TX(t).View().usage_events) {
    if (e.user_id == user_id && e.occurred_at_ms >= since_ms) total += e.tokens;
  }
  return total;
}

int64_t MemoryRepository::SumUnits(Transaction& t, const std::string& user_id, const std::string& module) {
  int64_t total = 0;
  for (const auto& e : TX(t).View().usage_events) {
    if (e.user_id == user_id && e.module == module) total += e.units;
  }
  return total;
}

// ------------------------------------------------------------------
// Quota policy
// ------------------------------------------------------------------

Result MemoryRepository::UpsertUsageGroup(Transaction& t, const model::UsageGroupRecord& r) {
  auto& groups = TX(t).Mutable().groups;
  for (const auto& [id, group] : groups) {
    if (id != r.id && group.name == r.name) return Result::Err(ErrorCode::AlreadyExists, "group name in use: " + r.name);
  }
  groups[r.id] = r;
  return Result::Ok();
}

std::optional<model::UsageGroupRecord> MemoryRepository::GetUsageGroup(Transaction& t, const std::string& group_id) {
  const auto& groups = TX(t).View().groups;
  auto        it     = groups.find(group_id);
  if (it == groups.end()) return std::nullopt;
  return it->second;
}

std::vector<model::UsageGroupRecord> MemoryRepository::ListUsageGroups(Transaction& t) {
  std::vector<model::UsageGroupRecord> out;
  for (const auto& [_, group] : TX(t).View().groups) out.push_back(group);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
  return out;
}

Result MemoryRepository::UpsertGroupLimit(Transaction& t, const model::GroupLimitRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.groups.contains(r.group_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown group " + r.group_id);
  s.limits[{r.group_id, r.module}] = r;
  return Result::Ok();
}

std::optional<model::GroupLimitRecord> MemoryRepository::GetGroupLimit(Transaction& t, const std::string& group_id, const std::string& module) {
  const auto& limits = TX(t).View().limits;
  auto        it     = limits.find({group_id, module});
  if (it == limits.end()) return std::nullopt;
  return it->second;
}

std::vector<model::GroupLimitRecord> MemoryRepository::ListGroupLimits(Transaction& t, const std::string& group_id) {
  std::vector<model::GroupLimitRecord> out;
  for (const auto& [key, limit] : TX(t).View().limits) {
    if (key.first == group_id) out.push_back(limit);
  }
  return out;
}

Result MemoryRepository::AssignUserGroup(Transaction& t, const std::string& user_id, const std::string& group_id) {
  auto& s = TX(t).Mutable();
  if (!s.groups.contains(group_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown group " + group_id);
  s.user_groups[user_id] = group_id;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetUserGroup(Transaction& t, const std::string& user_id) {
  const auto& user_groups = TX(t).View().user_groups;
  auto        it          = user_groups.find(user_id);
  if (it == user_groups.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// History index
// ------------------------------------------------------------------

Result MemoryRepository::InsertHistory(Transaction& t, const model::HistoryRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& row : s.history) {
    if (row.record.module == r.module && row.record.job_key == r.job_key) return Result::Ok();
  }
  s.history.push_back(HistoryRow{s.next_history_seq++, r});
  return Result::Ok();
}

std::vector<model::HistoryRecord> MemoryRepository::ListHistory(Transaction& t, const std::string& user_id, const std::string& module,
                                                                int64_t since_ms, uint32_t limit) {
  std::vector<HistoryRow> rows;
  for (const auto& row : TX(t).View().history) {
    if (row.record.user_id != user_id) continue;
    if (!module.empty() && row.record.module != module) continue;
    if (row.record.created_at_ms < since_ms) continue;
    rows.push_back(row);
  }

  std::sort(rows.begin(), rows.end(), [](const HistoryRow& a, const HistoryRow& b) {
    if (a.record.created_at_ms != b.record.created_at_ms) return a.record.created_at_ms > b.record.created_at_ms;
    return a.seq > b.seq;
  });

  std::vector<model::HistoryRecord> out;
  for (const auto& row : rows) {
    if (out.size() >= limit) break;
    out.push_back(row.record);
  }
  return out;
}

Result MemoryRepository::DeleteHistoryBefore(Transaction& t, int64_t cutoff_ms) {
  auto& history = TX(t).Mutable().history;
  std::erase_if(history, [cutoff_ms](const HistoryRow& row) { return row.record.created_at_ms < cutoff_ms; });
  return Result::Ok();
}

Result MemoryRepository::TrimHistory(Transaction& t, uint32_t keep) {
  auto& history = TX(t).Mutable().history;

  std::vector<HistoryRow> ordered = history;
  std::sort(ordered.begin(), ordered.end(), [](const HistoryRow& a, const HistoryRow& b) {
    if (a.record.created_at_ms != b.record.created_at_ms) return a.record.created_at_ms > b.record.created_at_ms;
    return a.seq > b.seq;
  });

  std::map<std::pair<std::string, std::string>, uint32_t> seen;
  std::vector<uint64_t>                                   drop;
  for (const auto& row : ordered) {
    if (++seen[{row.record.user_id, row.record.module}] > keep) drop.push_back(row.seq);
  }

  std::erase_if(history, [&](const HistoryRow& row) { return std::find(drop.begin(), drop.end(), row.seq) != drop.end(); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Module settings
// ------------------------------------------------------------------

Result MemoryRepository::UpsertModuleSettings(Transaction& t, const model::ModuleSettingsRecord& r) {
  TX(t).Mutable().settings[r.module] = r;
  return Result::Ok();
}

std::optional<model::ModuleSettingsRecord> MemoryRepository::GetModuleSettings(Transaction& t, const std::string& module) {
  const auto& settings = TX(t).View().settings;
  auto        it       = settings.find(module);
  if (it == settings.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Glossary
// ------------------------------------------------------------------

Result MemoryRepository::UpsertGlossaryTerm(Transaction& t, const model::GlossaryTermRecord& r) {
  auto& glossary = TX(t).Mutable().glossary;
  auto  key      = util::LowerAscii(r.source_term);
  auto  row      = r;
  if (auto it = glossary.find(key); it != glossary.end()) row.created_at_ms = it->second.created_at_ms;
  glossary[std::move(key)] = std::move(row);
  return Result::Ok();
}

std::vector<model::GlossaryTermRecord> MemoryRepository::ListGlossaryTerms(Transaction& t) {
  std::vector<model::GlossaryTermRecord> out;
  for (const auto& [key, term] : TX(t).View().glossary) out.push_back(term);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.source_term < b.source_term; });
  return out;
}

Result MemoryRepository::DeleteGlossaryTerm(Transaction& t, const std::string& source_term) {
  if (TX(t).Mutable().glossary.erase(util::LowerAscii(source_term)) == 0) {
    return Result::Err(ErrorCode::NotFound, "glossary term " + source_term);
  }
  return Result::Ok();
}

} // namespace jobmeter::db::memory
