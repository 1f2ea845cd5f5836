#include "job_engine.hpp"

#include <filesystem>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/history/history_index.hpp"
#include "internal/modules/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/job_store.hpp"
#include "internal/usage/quota_policy.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/job_scheduler.hpp"

namespace jobmeter::core {

using jobmeter::model::JobStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kResultArtifact = "result";

v1::JobStatus ToProtoStatus(JobStatus status) {
  return static_cast<v1::JobStatus>(static_cast<int>(status));
}

std::string ItemArtifact(uint32_t round, uint32_t index) {
  return "item/" + std::to_string(round) + "/" + std::to_string(index);
}

v1::UsageGroup ToProtoGroup(const db::model::UsageGroupRecord& record, const std::vector<db::model::GroupLimitRecord>& limits) {
  v1::UsageGroup group;
  group.set_id(record.id);
  group.set_name(record.name);
  if (record.token_budget) group.mutable_token_budget()->set_value(*record.token_budget);
  group.set_token_window_seconds(record.token_window_sec);
  for (const auto& limit : limits) {
    auto* out = group.add_limits();
    out->set_module(limit.module);
    if (limit.unit_limit) out->mutable_unit_limit()->set_value(*limit.unit_limit);
  }
  return group;
}

} // namespace

JobEngine::JobEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
                     std::shared_ptr<store::JobStore> store, std::shared_ptr<usage::UsageLedger> ledger, std::shared_ptr<usage::QuotaPolicy> quota,
                     std::shared_ptr<history::HistoryIndex> history, std::shared_ptr<worker::JobScheduler> scheduler,
                     std::function<util::TimePoint()> clock)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      store_(std::move(store)),
      ledger_(std::move(ledger)),
      quota_(std::move(quota)),
      history_(std::move(history)),
      scheduler_(std::move(scheduler)),
      clock_(std::move(clock)) {
}

v1::SubmitJobResponse JobEngine::SubmitJob(const std::string& user_id, const std::string& module, const std::string& payload_json) {
  if (!scheduler_) {
    throw util::InvalidState("job submission requires a running scheduler");
  }
  if (user_id.empty()) {
    throw util::ValidationFailed("user id is required");
  }

  const auto runtime = registry_->Require(module);

  observability::SpanScope span("jobmeter.job.submit");
  span.SetAttribute("module", module);

  const auto normalized = runtime->Validate(payload_json);
  const auto units      = runtime->ProjectedUnits(normalized);
  const auto tokens     = runtime->ProjectedTokens(units);
  const auto now        = clock_();

  db::model::JobRecord job;
  {
    auto tx = repository_->Begin();

    const auto decision = quota_->Check(*tx, user_id, module, units, tokens, now);
    if (!decision.admitted) {
      tx->Rollback();
      observability::Metrics::Instance().RecordQuotaRejection(module, decision.reason);
      JOBMETER_LOG_WARN("submission rejected", {StringField("module", module), StringField("user_id", user_id), StringField("reason", decision.reason),
                                                StringField("detail", decision.message)});
      throw util::QuotaExceeded(decision.message);
    }

    job.id            = util::NewJobId();
    job.module        = module;
    job.user_id       = user_id;
    job.status        = JobStatus::kPending;
    job.status_detail = "queued";
    job.payload_json  = normalized;
    job.created_at_ms = util::ToUnixMillis(now);
    job.updated_at_ms = job.created_at_ms;

    // a stopped scheduler would strand the job in Pending
    if (!scheduler_->Accepting()) {
      tx->Rollback();
      throw util::InvalidState("job scheduler is shut down");
    }

    store_->Create(*tx, job, runtime->Plan(job));
    history_->RecordJobStart(*tx, user_id, module, job.id, now);
    tx->Commit();
  }

  span.SetAttribute("job_id", job.id);
  JOBMETER_LOG_INFO("job admitted", {StringField("module", module), StringField("job_id", job.id), StringField("user_id", user_id),
                                     IntField("projected_units", units), IntField("projected_tokens", tokens)});

  try {
    scheduler_->Enqueue(worker::JobTask{module, job.id});
  } catch (const util::InvalidState& e) {
    // shutdown raced the commit
    AbandonQueued(module, job.id, e.what());
    throw;
  }

  v1::SubmitJobResponse response;
  response.set_job_id(job.id);
  response.set_module(module);
  return response;
}

void JobEngine::AbandonQueued(const std::string& module, const std::string& job_id, const std::string& error) {
  try {
    auto       tx  = repository_->Begin();
    const auto now = clock_();
    for (auto item : store_->Items(*tx, module, job_id)) {
      if (model::IsTerminal(item.status)) continue;
      item.status        = JobStatus::kFailed;
      item.status_detail = "aborted";
      item.error_message = error;
      store_->SaveItem(*tx, module, item, now);
    }
    store_->Finish(*tx, module, job_id, JobStatus::kFailed, "not queued", error, "", now);
    tx->Commit();
  } catch (const std::exception& e) {
    JOBMETER_LOG_ERROR("could not fail unqueued job", {StringField("module", module), StringField("job_id", job_id), StringField("error", e.what())});
    return;
  }
  JOBMETER_LOG_WARN("job not queued", {StringField("module", module), StringField("job_id", job_id), StringField("error", error)});
}

db::model::JobRecord JobEngine::RequireVisible(db::Transaction& tx, const std::string& module, const std::string& job_id,
                                               const Requester& requester) {
  registry_->Require(module);
  auto job = store_->Require(tx, module, job_id);
  if (!requester.is_admin && job.user_id != requester.user_id) {
    throw util::Forbidden("job " + job_id + " belongs to another user");
  }
  return job;
}

v1::JobStatusView JobEngine::GetStatus(const std::string& module, const std::string& job_id, const Requester& requester) {
  auto       tx    = repository_->Begin();
  const auto job   = RequireVisible(*tx, module, job_id, requester);
  const auto items = store_->Items(*tx, module, job_id);
  tx->Commit();

  v1::JobStatusView view;
  view.set_job_id(job.id);
  view.set_module(job.module);
  view.set_user_id(job.user_id);
  view.set_status(ToProtoStatus(job.status));
  view.set_status_detail(job.status_detail);
  view.set_error_message(job.error_message);
  view.set_usage_delta(job.usage_delta);
  *view.mutable_created_at() = util::ToProto(util::FromUnixMillis(job.created_at_ms));
  *view.mutable_updated_at() = util::ToProto(util::FromUnixMillis(job.updated_at_ms));

  const bool purged = job.files_purged_at_ms != 0;
  view.set_files_purged(purged);
  if (purged) {
    *view.mutable_files_purged_at() = util::ToProto(util::FromUnixMillis(job.files_purged_at_ms));
  }

  for (const auto& item : items) {
    auto* out = view.add_items();
    out->set_round(item.round);
    out->set_index(item.index);
    out->set_status(ToProtoStatus(item.status));
    out->set_status_detail(item.status_detail);
    out->set_attempt_count(item.attempt_count);
    out->set_error_message(item.error_message);
    out->set_has_output(!item.output_path.empty());
    out->set_tokens_used(item.tokens_used);
  }

  // Links stay listed after a purge so a download answers Gone, not NotFound.
  if (!job.output_path.empty() || (purged && job.status == JobStatus::kCompleted)) {
    auto* link = view.add_downloads();
    link->set_name(kResultArtifact);
    link->set_path(job.output_path);
  }
  for (const auto& item : items) {
    if (item.output_path.empty() && !(purged && item.status == JobStatus::kCompleted)) continue;
    auto* link = view.add_downloads();
    link->set_name(ItemArtifact(item.round, item.index));
    link->set_path(item.output_path);
  }
  return view;
}

std::string JobEngine::ResolveDownload(const std::string& module, const std::string& job_id, const Requester& requester,
                                       const std::string& artifact) {
  auto       tx  = repository_->Begin();
  const auto job = RequireVisible(*tx, module, job_id, requester);

  if (job.files_purged_at_ms != 0) {
    tx->Rollback();
    throw util::Gone("files of job " + job_id + " were removed by retention");
  }

  std::string path;
  if (artifact == kResultArtifact) {
    path = job.output_path;
  } else {
    const auto parts = util::Split(artifact, "/");
    if (parts.size() != 3 || parts[0] != "item") {
      throw util::NotFound("unknown artifact '" + artifact + "'");
    }
    for (const auto& item : store_->Items(*tx, module, job_id)) {
      if (ItemArtifact(item.round, item.index) == artifact) {
        path = item.output_path;
        break;
      }
    }
  }
  tx->Commit();

  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    throw util::NotFound("artifact '" + artifact + "' of job " + job_id + " is not available");
  }
  return path;
}

std::vector<v1::HistoryEntry> JobEngine::ListHistory(const std::string& user_id, const std::string& module, uint32_t limit) {
  return history_->FetchRecent(user_id, module, limit, clock_());
}

v1::UsageSnapshot JobEngine::UsageSnapshot(const std::string& user_id) {
  const auto now = clock_();
  auto       tx  = repository_->Begin();

  v1::UsageSnapshot snapshot;
  snapshot.set_user_id(user_id);

  const auto group  = quota_->ResolveGroup(*tx, user_id);
  auto       window = quota_->Settings().token_window;
  if (group) {
    snapshot.set_group_id(group->id);
    snapshot.set_group_name(group->name);
    if (group->token_budget) snapshot.mutable_token_budget()->set_value(*group->token_budget);
    if (group->token_window_sec > 0) window = std::chrono::seconds(group->token_window_sec);
  }
  snapshot.set_token_window_seconds(std::chrono::duration_cast<std::chrono::seconds>(window).count());
  snapshot.set_tokens_used(ledger_->TokensSince(*tx, user_id, now - window));

  for (const auto& runtime : registry_->All()) {
    const auto& descriptor = runtime->Descriptor();
    auto*       usage      = snapshot.add_modules();
    usage->set_module(descriptor.key);
    usage->set_label(descriptor.label);
    usage->set_unit_label(descriptor.unit_label);
    usage->set_units_used(ledger_->Units(*tx, user_id, descriptor.key));
    if (group) {
      const auto limit = repository_->GetGroupLimit(*tx, group->id, descriptor.key);
      if (limit && limit->unit_limit) usage->mutable_unit_limit()->set_value(*limit->unit_limit);
    }
  }
  tx->Commit();
  return snapshot;
}

v1::UsageGroup JobEngine::UpsertGroup(const std::string& group_id, const std::string& name, LimitEdit token_budget,
                                      std::optional<int64_t> token_window_sec) {
  if (group_id.empty()) throw util::ValidationFailed("group id is required");
  if (token_budget && *token_budget && **token_budget < 0) throw util::ValidationFailed("token budget must not be negative");
  if (token_window_sec && *token_window_sec <= 0) throw util::ValidationFailed("token window must be positive");

  auto tx = repository_->Begin();

  db::model::UsageGroupRecord record;
  if (auto existing = repository_->GetUsageGroup(*tx, group_id)) {
    record = *existing;
  } else {
    record.id               = group_id;
    record.token_window_sec = std::chrono::duration_cast<std::chrono::seconds>(quota_->Settings().token_window).count();
  }
  record.name = name.empty() ? (record.name.empty() ? group_id : record.name) : name;
  if (token_budget) record.token_budget = *token_budget;
  if (token_window_sec) record.token_window_sec = *token_window_sec;

  db::ThrowIfDbError(repository_->UpsertUsageGroup(*tx, record), "upsert usage group " + group_id);
  const auto limits = repository_->ListGroupLimits(*tx, group_id);
  tx->Commit();

  JOBMETER_LOG_INFO("usage group saved", {StringField("group_id", group_id), IntField("token_window_sec", record.token_window_sec)});
  return ToProtoGroup(record, limits);
}

void JobEngine::SetModuleLimit(const std::string& group_id, const std::string& module, std::optional<int64_t> unit_limit) {
  registry_->Require(module);
  if (unit_limit && *unit_limit < 0) throw util::ValidationFailed("unit limit must not be negative");

  auto tx = repository_->Begin();
  if (!repository_->GetUsageGroup(*tx, group_id)) {
    throw util::NotFound("usage group " + group_id);
  }
  db::ThrowIfDbError(repository_->UpsertGroupLimit(*tx, db::model::GroupLimitRecord{group_id, module, unit_limit}),
                     "set " + module + " limit of group " + group_id);
  tx->Commit();

  JOBMETER_LOG_INFO("module limit saved",
                    {StringField("group_id", group_id), StringField("module", module), IntField("unit_limit", unit_limit.value_or(-1))});
}

void JobEngine::AssignUser(const std::string& user_id, const std::string& group_id) {
  if (user_id.empty()) throw util::ValidationFailed("user id is required");

  auto tx = repository_->Begin();
  if (!repository_->GetUsageGroup(*tx, group_id)) {
    throw util::NotFound("usage group " + group_id);
  }
  db::ThrowIfDbError(repository_->AssignUserGroup(*tx, user_id, group_id), "assign " + user_id + " to " + group_id);
  tx->Commit();

  JOBMETER_LOG_INFO("user assigned", {StringField("user_id", user_id), StringField("group_id", group_id)});
}

} // namespace jobmeter::core
