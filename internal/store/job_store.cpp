#include "job_store.hpp"

#include <algorithm>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/util/errors.hpp"

namespace jobmeter::store {

using jobmeter::model::CanTransition;
using jobmeter::model::IsTerminal;
using jobmeter::model::JobStatus;
using jobmeter::model::ToString;

namespace {

std::string Edge(JobStatus from, JobStatus to) {
  return std::string(ToString(from)) + " -> " + std::string(ToString(to));
}

} // namespace

JobStore::JobStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void JobStore::Create(db::Transaction& tx, const db::model::JobRecord& job, const std::vector<db::model::JobItemRecord>& items) {
  if (job.status != JobStatus::kPending) {
    throw util::InvalidState("job " + job.id + " must be created pending");
  }
  db::ThrowIfDbError(repository_->InsertJob(tx, job), "insert job");
  for (const auto& item : items) {
    db::ThrowIfDbError(repository_->InsertJobItem(tx, job.module, item), "insert job item");
  }
}

std::optional<db::model::JobRecord> JobStore::Get(db::Transaction& tx, const std::string& module, const std::string& id) {
  return repository_->GetJob(tx, module, id);
}

db::model::JobRecord JobStore::Require(db::Transaction& tx, const std::string& module, const std::string& id) {
  auto job = repository_->GetJob(tx, module, id);
  if (!job) throw util::NotFound(module + " job " + id);
  return *job;
}

std::vector<db::model::JobItemRecord> JobStore::Items(db::Transaction& tx, const std::string& module, const std::string& id) {
  return repository_->ListJobItems(tx, module, id);
}

std::optional<db::model::JobRecord> JobStore::Claim(db::Transaction& tx, const std::string& module, const std::string& id, util::TimePoint now) {
  auto job = repository_->GetJob(tx, module, id);
  if (!job || job->status != JobStatus::kPending) return std::nullopt;

  job->status        = JobStatus::kProcessing;
  job->status_detail = "started";
  job->updated_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->UpdateJob(tx, *job), "claim job");
  return job;
}

void JobStore::SetDetail(db::Transaction& tx, const std::string& module, const std::string& id, const std::string& detail, util::TimePoint now) {
  auto job = Require(tx, module, id);
  if (IsTerminal(job.status)) {
    throw util::InvalidState("job " + id + " is " + std::string(ToString(job.status)));
  }
  job.status_detail = detail;
  job.updated_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->UpdateJob(tx, job), "update job detail");
}

void JobStore::AddUsage(db::Transaction& tx, const std::string& module, const std::string& id, int64_t units, util::TimePoint now) {
  if (units <= 0) return;
  auto job = Require(tx, module, id);
  job.usage_delta += units;
  job.updated_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->UpdateJob(tx, job), "update job usage");
}

db::model::JobRecord JobStore::Finish(db::Transaction& tx, const std::string& module, const std::string& id, JobStatus status,
                                      const std::string& detail, const std::string& error_message, const std::string& output_path,
                                      util::TimePoint now) {
  if (!IsTerminal(status)) {
    throw util::InvalidState("finish requires a terminal status, got " + std::string(ToString(status)));
  }

  auto job = Require(tx, module, id);
  if (!CanTransition(job.status, status)) {
    throw util::InvalidState("job " + id + ": illegal transition " + Edge(job.status, status));
  }

  job.status        = status;
  job.status_detail = detail;
  // error_message is only meaningful on Failed
  job.error_message = status == JobStatus::kFailed ? error_message : std::string{};
  job.output_path   = output_path;
  job.updated_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->UpdateJob(tx, job), "finish job");
  return job;
}

void JobStore::SaveItem(db::Transaction& tx, const std::string& module, const db::model::JobItemRecord& item, util::TimePoint now) {
  const auto items   = repository_->ListJobItems(tx, module, item.job_id);
  const auto current = std::find_if(items.begin(), items.end(), [&](const auto& row) { return row.round == item.round && row.index == item.index; });
  if (current == items.end()) {
    throw util::NotFound("job item " + item.job_id + "/" + std::to_string(item.round) + "/" + std::to_string(item.index));
  }

  if (current->status == item.status) {
    if (IsTerminal(item.status)) {
      throw util::InvalidState("job item " + item.job_id + " is already " + std::string(ToString(item.status)));
    }
  } else if (!CanTransition(current->status, item.status)) {
    throw util::InvalidState("job item " + item.job_id + ": illegal transition " + Edge(current->status, item.status));
  }

  auto row          = item;
  row.updated_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->UpdateJobItem(tx, module, row), "update job item");
}

std::vector<db::model::JobRecord> JobStore::PurgeCandidates(db::Transaction& tx, const std::string& module, util::TimePoint created_before) {
  return repository_->ListPurgeCandidates(tx, module, util::ToUnixMillis(created_before));
}

bool JobStore::MarkPurged(db::Transaction& tx, const std::string& module, const std::string& id, util::TimePoint now) {
  auto result = repository_->MarkJobPurged(tx, module, id, util::ToUnixMillis(now));
  if (result.code == db::ErrorCode::NotFound) return false;
  db::ThrowIfDbError(result, "mark job purged");
  return true;
}

} // namespace jobmeter::store
