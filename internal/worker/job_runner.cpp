#include "job_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>

#include "internal/modules/glossary.hpp"
#include "internal/modules/module_settings.hpp"
#include "internal/modules/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/job_store.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"

namespace jobmeter::worker {

using jobmeter::model::IsTerminal;
using jobmeter::model::JobStatus;
using observability::IntField;
using observability::StringField;

// Shared by the threads of one job.
struct JobRunner::Progress {
  std::mutex         mutex;
  uint32_t           processed = 0;
  uint32_t           total     = 0;
  std::exception_ptr fatal;

  bool Aborted() {
    std::lock_guard lock(mutex);
    return fatal != nullptr;
  }
};

JobRunner::JobRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
                     std::shared_ptr<store::JobStore> store, std::shared_ptr<usage::UsageLedger> ledger,
                     std::shared_ptr<modules::ModuleSettingsStore> settings, std::shared_ptr<modules::GlossaryStore> glossary,
                     storage::ArtifactStorePtr artifacts, std::shared_ptr<llm::Provider> provider, JobRunnerOptions options)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      store_(std::move(store)),
      ledger_(std::move(ledger)),
      settings_(std::move(settings)),
      glossary_(std::move(glossary)),
      artifacts_(std::move(artifacts)),
      provider_(std::move(provider)),
      options_(std::move(options)) {
  if (!provider_) throw std::invalid_argument("JobRunner requires an LLM provider");
  if (!glossary_) throw std::invalid_argument("JobRunner requires a glossary store");
}

std::optional<db::model::JobRecord> JobRunner::Run(const JobTask& task) {
  auto module = registry_->Find(task.module);
  if (!module) {
    JOBMETER_LOG_ERROR("job for unregistered module", {StringField("module", task.module), StringField("job_id", task.job_id)});
    return std::nullopt;
  }

  observability::SpanScope span("jobmeter.job.run");
  span.SetAttribute("module", task.module);
  span.SetAttribute("job_id", task.job_id);

  std::optional<db::model::JobRecord> claimed;
  {
    auto tx = repository_->Begin();
    claimed = store_->Claim(*tx, task.module, task.job_id, options_.clock());
    if (!claimed) {
      tx->Rollback();
      JOBMETER_LOG_INFO("job not pending, skipped", {StringField("module", task.module), StringField("job_id", task.job_id)});
      return std::nullopt;
    }
    tx->Commit();
  }
  const auto& job = *claimed;
  JOBMETER_LOG_INFO("job claimed", {StringField("module", job.module), StringField("job_id", job.id), StringField("user_id", job.user_id)});

  db::model::JobRecord finished;
  try {
    const auto settings = settings_->Load(job.module);
    const auto glossary = glossary_->List();
    const auto& policy  = module->Policy();

    Progress progress;
    for (const auto& item : LoadItems(job)) {
      if (!IsTerminal(item.status)) ++progress.total;
    }

    for (const auto& stage : policy.stages) {
      const auto items = LoadItems(job);
      RunStage(*module, job, stage, items, settings, glossary, progress);

      const auto tally = TallyStage(stage, LoadItems(job));
      if (!tally.met) {
        SkipLaterRounds(*module, job, stage);
        break;
      }
    }

    finished = Complete(*module, job);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    finished = Fail(job, e.what());
  }

  observability::Metrics::Instance().RecordJobFinished(job.module, model::ToString(finished.status));
  if (finished.status == JobStatus::kCompleted) {
    JOBMETER_LOG_INFO("job finished", {StringField("module", job.module), StringField("job_id", job.id), StringField("detail", finished.status_detail),
                                       IntField("usage_delta", finished.usage_delta)});
  } else {
    JOBMETER_LOG_WARN("job failed", {StringField("module", job.module), StringField("job_id", job.id), StringField("error", finished.error_message)});
  }
  return finished;
}

void JobRunner::RunStage(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& stage,
                         const std::vector<db::model::JobItemRecord>& items, const v1::ModuleSettings& settings,
                         const db::model::Glossary& glossary, Progress& progress) {
  std::vector<db::model::JobItemRecord> pending;
  std::vector<db::model::JobItemRecord> prior;
  for (const auto& item : items) {
    if (item.round == stage.round && item.status == JobStatus::kPending) pending.push_back(item);
    if (item.round < stage.round) prior.push_back(item);
  }
  if (pending.empty()) return;

  const auto workers = std::max<std::size_t>(1, std::min<std::size_t>(stage.concurrency_cap, pending.size()));
  std::atomic<std::size_t> cursor{0};

  auto drain = [&] {
    while (!progress.Aborted()) {
      const auto idx = cursor.fetch_add(1);
      if (idx >= pending.size()) return;
      try {
        RunItem(module, job, stage, pending[idx], prior, settings, glossary, progress);
      } catch (const std::exception&) {
        std::lock_guard lock(progress.mutex);
        if (!progress.fatal) progress.fatal = std::current_exception();
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers - 1);
  for (std::size_t i = 1; i < workers; ++i) threads.emplace_back(drain);
  drain();
  for (auto& thread : threads) thread.join();

  if (progress.fatal) std::rethrow_exception(progress.fatal);
}

void JobRunner::RunItem(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& stage,
                        db::model::JobItemRecord item, const std::vector<db::model::JobItemRecord>& prior, const v1::ModuleSettings& settings,
                        const db::model::Glossary& glossary, Progress& progress) {
  const auto& key = module.Descriptor().key;

  const auto blocked = module.BlockedBy(modules::ItemCall{job, item, prior, settings, glossary});
  if (!blocked.empty()) {
    item.status        = JobStatus::kFailed;
    item.status_detail = "not run";
    item.error_message = blocked;
    JOBMETER_LOG_INFO("item skipped", {StringField("module", key), StringField("job_id", job.id), IntField("round", item.round),
                                       IntField("index", item.index), StringField("reason", blocked)});
    Record(module, job, stage, item, 0, 0, progress);
    return;
  }

  {
    auto tx            = repository_->Begin();
    item.status        = JobStatus::kProcessing;
    item.status_detail = "running";
    store_->SaveItem(*tx, key, item, options_.clock());
    tx->Commit();
  }

  std::vector<std::string> samples;
  int64_t                  tokens = 0;

  auto outcome = RunBounded(stage.ToRetryPolicy(), options_.sleeper, [&](uint32_t attempt) {
    try {
      const auto request = module.BuildRequest(modules::ItemCall{job, item, prior, settings, glossary});

      const auto started  = std::chrono::steady_clock::now();
      auto       response = provider_->Execute(request);
      observability::Metrics::Instance().ObserveLlmLatencyMs(
          key, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());

      tokens += std::max<int64_t>(0, response.token_usage.total);
      samples.push_back(module.Interpret(item, response));
    } catch (const std::exception& e) {
      if (IsProviderFailure(e)) {
        JOBMETER_LOG_WARN("item attempt failed", {StringField("module", key), StringField("job_id", job.id), IntField("round", item.round),
                                                   IntField("index", item.index), IntField("attempt", attempt), StringField("error", e.what())});
      }
      throw;
    }
    return samples.size() >= stage.target_samples ? AttemptResult::kDone : AttemptResult::kContinue;
  });

  item.attempt_count = outcome.attempts;
  item.tokens_used   = tokens;

  int64_t units = 0;
  if (samples.size() >= stage.min_samples) {
    item.status        = JobStatus::kCompleted;
    item.error_message.clear();
    item.result_text   = module.FinishItem(item, samples);
    item.status_detail = stage.target_samples > 1
                             ? std::to_string(samples.size()) + " valid of " + std::to_string(outcome.attempts) + " attempts"
                             : "completed";

    const auto artifact = module.ItemArtifactName(item);
    if (!artifact.empty()) {
      item.output_path = artifacts_->Write(key, job.id, artifact, item.result_text);
    }
    units = stage.units_per_item;
  } else {
    item.status        = JobStatus::kFailed;
    item.status_detail = "failed after " + std::to_string(outcome.attempts) + " attempts";
    item.error_message = outcome.last_error.empty() ? "only " + std::to_string(samples.size()) + " valid replies, need " +
                                                          std::to_string(stage.min_samples)
                                                    : outcome.last_error;
    JOBMETER_LOG_WARN("item exhausted", {StringField("module", key), StringField("job_id", job.id), IntField("round", item.round),
                                         IntField("index", item.index), StringField("error", item.error_message)});
  }

  Record(module, job, stage, item, tokens, units, progress);
}

void JobRunner::Record(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& stage,
                       const db::model::JobItemRecord& item, int64_t tokens, int64_t units, Progress& progress) {
  const auto& key = module.Descriptor().key;

  uint32_t processed = 0;
  {
    std::lock_guard lock(progress.mutex);
    processed = ++progress.processed;
  }

  auto       tx  = repository_->Begin();
  const auto now = options_.clock();
  store_->SaveItem(*tx, key, item, now);
  if (tokens > 0 || units > 0) ledger_->Record(*tx, job.user_id, key, tokens, units, now);
  store_->AddUsage(*tx, key, job.id, units, now);

  std::string detail = std::to_string(processed) + "/" + std::to_string(progress.total) + " " + module.Descriptor().item_noun + " processed";
  if (module.Policy().stages.size() > 1) {
    detail = stage.name + " (round " + std::to_string(stage.round) + " of " + std::to_string(module.Policy().stages.size()) + "): " + detail;
  }
  store_->SetDetail(*tx, key, job.id, detail, now);
  tx->Commit();
}

void JobRunner::SkipLaterRounds(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& missed) {
  auto       tx  = repository_->Begin();
  const auto now = options_.clock();
  for (auto item : store_->Items(*tx, job.module, job.id)) {
    if (item.round <= missed.round || IsTerminal(item.status)) continue;
    item.status        = JobStatus::kFailed;
    item.status_detail = "not run";
    item.error_message = missed.name + " did not reach its success threshold";
    store_->SaveItem(*tx, module.Descriptor().key, item, now);
  }
  tx->Commit();
}

db::model::JobRecord JobRunner::Complete(const modules::ModuleRuntime& module, const db::model::JobRecord& job) {
  const auto items   = LoadItems(job);
  const auto verdict = EvaluateJob(module.Policy(), items);

  std::string output_path;
  if (verdict.status == JobStatus::kCompleted) {
    output_path = module.Assemble(job, items, *artifacts_);
  }

  auto       tx  = repository_->Begin();
  const auto now = options_.clock();
  if (verdict.status == JobStatus::kCompleted && module.Policy().units_on_completion > 0) {
    ledger_->Record(*tx, job.user_id, job.module, 0, module.Policy().units_on_completion, now);
    store_->AddUsage(*tx, job.module, job.id, module.Policy().units_on_completion, now);
  }
  auto finished = store_->Finish(*tx, job.module, job.id, verdict.status, verdict.detail, verdict.error_message, output_path, now);
  tx->Commit();
  return finished;
}

db::model::JobRecord JobRunner::Fail(const db::model::JobRecord& job, const std::string& error) {
  try {
    auto       tx  = repository_->Begin();
    const auto now = options_.clock();
    for (auto item : store_->Items(*tx, job.module, job.id)) {
      if (IsTerminal(item.status)) continue;
      item.status        = JobStatus::kFailed;
      item.status_detail = "aborted";
      item.error_message = error;
      store_->SaveItem(*tx, job.module, item, now);
    }
    auto failed = store_->Finish(*tx, job.module, job.id, JobStatus::kFailed, "failed", error, "", now);
    tx->Commit();
    return failed;
  } catch (const std::exception& e) {
    JOBMETER_LOG_ERROR("could not record job failure",
                       {StringField("module", job.module), StringField("job_id", job.id), StringField("cause", error), StringField("error", e.what())});
    auto failed          = job;
    failed.status        = JobStatus::kFailed;
    failed.error_message = error;
    return failed;
  }
}

std::vector<db::model::JobItemRecord> JobRunner::LoadItems(const db::model::JobRecord& job) {
  auto tx    = repository_->Begin();
  auto items = store_->Items(*tx, job.module, job.id);
  tx->Commit();
  return items;
}

} // namespace jobmeter::worker
