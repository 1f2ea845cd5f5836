#include "history_index.hpp"

#include <algorithm>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/modules/registry.hpp"
#include "internal/observability/logging.hpp"

namespace jobmeter::history {

HistoryIndex::HistoryIndex(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
                           HistorySettings settings)
    : repository_(std::move(repository)), registry_(std::move(registry)), settings_(settings) {
  if (settings_.limit == 0) settings_.limit = 1;
}

void HistoryIndex::RecordJobStart(db::Transaction& tx, const std::string& user_id, const std::string& module, const std::string& job_key,
                                  util::TimePoint now) {
  db::model::HistoryRecord record;
  record.user_id       = user_id;
  record.module        = module;
  record.job_key       = job_key;
  record.created_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->InsertHistory(tx, record), "record job history");
}

std::vector<v1::HistoryEntry> HistoryIndex::FetchRecent(const std::string& user_id, const std::string& module, uint32_t limit,
                                                        util::TimePoint now) {
  if (!module.empty()) registry_->Require(module);

  const auto clamped = std::clamp<uint32_t>(limit, 1, settings_.limit);
  const auto since   = util::ToUnixMillis(now - settings_.max_age);

  auto tx      = repository_->Begin();
  auto records = repository_->ListHistory(*tx, user_id, module, since, clamped);

  std::vector<v1::HistoryEntry> entries;
  for (const auto& record : records) {
    if (!registry_->Find(record.module)) continue;

    auto job = repository_->GetJob(*tx, record.module, record.job_key);
    if (!job) continue;

    v1::HistoryEntry entry;
    entry.set_module(record.module);
    entry.set_job_key(record.job_key);
    *entry.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
    entry.set_status(static_cast<v1::JobStatus>(job->status));
    entry.set_status_detail(job->status_detail);
    *entry.mutable_updated_at() = util::ToProto(util::FromUnixMillis(job->updated_at_ms));
    entry.set_files_purged(job->files_purged_at_ms != 0);
    entries.push_back(std::move(entry));
  }
  tx->Commit();
  return entries;
}

void HistoryIndex::PurgeStale(util::TimePoint now) {
  const auto cutoff = util::ToUnixMillis(now - settings_.max_age);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteHistoryBefore(*tx, cutoff), "delete stale history");
  db::ThrowIfDbError(repository_->TrimHistory(*tx, settings_.limit), "trim history");
  tx->Commit();

  JOBMETER_LOG_INFO("history pruned", {observability::IntField("cutoff_ms", cutoff), observability::IntField("keep", settings_.limit)});
}

} // namespace jobmeter::history
