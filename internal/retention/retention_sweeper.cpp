#include "retention_sweeper.hpp"

#include "internal/history/history_index.hpp"
#include "internal/modules/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/job_store.hpp"

namespace jobmeter::retention {

using observability::IntField;
using observability::StringField;

RetentionSweeper::RetentionSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
                                   std::shared_ptr<store::JobStore> store, storage::ArtifactStorePtr artifacts,
                                   std::shared_ptr<history::HistoryIndex> history, RetentionSettings settings)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      store_(std::move(store)),
      artifacts_(std::move(artifacts)),
      history_(std::move(history)),
      settings_(settings) {
}

RetentionSweeper::~RetentionSweeper() {
  Stop();
}

void RetentionSweeper::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&RetentionSweeper::Loop, this);
}

void RetentionSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RetentionSweeper::Loop() {
  while (true) {
    try {
      SweepOnce(util::Now());
    } catch (const std::exception& e) {
      JOBMETER_LOG_ERROR("retention sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, settings_.interval, [&] { return !running_; })) return;
  }
}

SweepReport RetentionSweeper::SweepOnce(util::TimePoint now) {
  observability::SpanScope span("jobmeter.retention.sweep");

  SweepReport report;
  const auto  cutoff = now - settings_.max_age;

  for (const auto& module : registry_->All()) {
    const auto& key = module->Descriptor().key;

    std::vector<db::model::JobRecord> candidates;
    {
      auto tx    = repository_->Begin();
      candidates = store_->PurgeCandidates(*tx, key, cutoff);
      tx->Commit();
    }

    uint32_t purged = 0;
    for (const auto& job : candidates) {
      ++report.scanned;

      try {
        artifacts_->RemoveJobDir(key, job.id);
      } catch (const std::exception& e) {
        ++report.failed;
        JOBMETER_LOG_WARN("purge failed", {StringField("module", key), StringField("job_id", job.id), StringField("error", e.what())});
        continue;
      }

      try {
        auto tx      = repository_->Begin();
        bool changed = store_->MarkPurged(*tx, key, job.id, now);
        tx->Commit();
        if (changed) {
          ++purged;
          JOBMETER_LOG_INFO("job purged", {StringField("module", key), StringField("job_id", job.id)});
        }
      } catch (const std::exception& e) {
        ++report.failed;
        JOBMETER_LOG_WARN("purge failed", {StringField("module", key), StringField("job_id", job.id), StringField("error", e.what())});
      }
    }

    report.purged += purged;
    observability::Metrics::Instance().RecordPurged(key, purged);
  }

  if (history_) {
    try {
      history_->PurgeStale(now);
    } catch (const std::exception& e) {
      JOBMETER_LOG_WARN("history prune failed", {StringField("error", e.what())});
    }
  }

  span.SetAttribute("purged", static_cast<std::int64_t>(report.purged));
  JOBMETER_LOG_INFO("retention sweep done", {IntField("scanned", report.scanned), IntField("purged", report.purged), IntField("failed", report.failed)});
  return report;
}

} // namespace jobmeter::retention
