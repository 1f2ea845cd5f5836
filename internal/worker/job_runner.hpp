#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/jobmeter/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/llm/provider.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/time.hpp"
#include "job_task.hpp"
#include "retry.hpp"
#include "stage_policy.hpp"

namespace jobmeter::modules {
class GlossaryStore;
class ModuleRegistry;
class ModuleRuntime;
class ModuleSettingsStore;
} // namespace jobmeter::modules

namespace jobmeter::store {
class JobStore;
}

namespace jobmeter::usage {
class UsageLedger;
}

namespace jobmeter::worker {

struct JobRunnerOptions {
  Sleeper                           sleeper = ThreadSleeper();
  std::function<util::TimePoint()> clock   = util::Now;
};

/*
  Drives one admitted job from Pending to Completed or Failed.

  Flow:
    claim (Pending -> Processing)
    for each stage, in round order:
        fan the stage's items out to min(concurrency_cap, items) threads
        each item: skipped when a prior-round input is missing, else
                   bounded retries, then Completed or Failed, usage billed
        join; a stage that misses its threshold fails later rounds unrun
    EvaluateJob over the terminal items
    Completed -> Assemble + completion units, then Finish

  Any error outside an item's retry loop (storage, configuration,
  database) fails the job; nothing escapes Run() for a claimed job.
*/
class JobRunner {
 public:
  JobRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
            std::shared_ptr<store::JobStore> store, std::shared_ptr<usage::UsageLedger> ledger,
            std::shared_ptr<modules::ModuleSettingsStore> settings, std::shared_ptr<modules::GlossaryStore> glossary,
            storage::ArtifactStorePtr artifacts, std::shared_ptr<llm::Provider> provider, JobRunnerOptions options = {});

  // Final job record, or nullopt when the job was unknown or not Pending.
  std::optional<db::model::JobRecord> Run(const JobTask& task);

 private:
  struct Progress;

  void RunStage(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& stage,
                const std::vector<db::model::JobItemRecord>& items, const v1::ModuleSettings& settings,
                const db::model::Glossary& glossary, Progress& progress);

  void RunItem(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& stage,
               db::model::JobItemRecord item, const std::vector<db::model::JobItemRecord>& prior, const v1::ModuleSettings& settings,
               const db::model::Glossary& glossary, Progress& progress);

  // Saves the item and its billing, then the job's progress note.
  void Record(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& stage,
              const db::model::JobItemRecord& item, int64_t tokens, int64_t units, Progress& progress);

  void SkipLaterRounds(const modules::ModuleRuntime& module, const db::model::JobRecord& job, const StagePolicy& missed);

  db::model::JobRecord Complete(const modules::ModuleRuntime& module, const db::model::JobRecord& job);

  db::model::JobRecord Fail(const db::model::JobRecord& job, const std::string& error);

  std::vector<db::model::JobItemRecord> LoadItems(const db::model::JobRecord& job);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const modules::ModuleRegistry> registry_;
  std::shared_ptr<store::JobStore>              store_;
  std::shared_ptr<usage::UsageLedger>           ledger_;
  std::shared_ptr<modules::ModuleSettingsStore> settings_;
  std::shared_ptr<modules::GlossaryStore>       glossary_;
  storage::ArtifactStorePtr                     artifacts_;
  std::shared_ptr<llm::Provider>                provider_;
  JobRunnerOptions                              options_;
};

} // namespace jobmeter::worker
