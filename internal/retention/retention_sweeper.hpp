#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/time.hpp"

namespace jobmeter::modules {
class ModuleRegistry;
}

namespace jobmeter::store {
class JobStore;
}

namespace jobmeter::history {
class HistoryIndex;
}

namespace jobmeter::retention {

struct RetentionSettings {
  util::Duration interval = std::chrono::minutes(15);
  util::Duration max_age  = std::chrono::hours(24);
};

struct SweepReport {
  uint32_t scanned = 0;
  uint32_t purged  = 0;
  uint32_t failed  = 0; // left for the next pass
};

/*
  Periodically purges artifacts of terminal jobs older than max_age.

  Per job: remove <root>/<module>/<job_id>/, then clear every output path
  and stamp files_purged_at in one update. A directory that cannot be
  removed is logged and the job stays unpurged; the sweep goes on.
  Already purged jobs are never candidates, so passes are idempotent.
*/
class RetentionSweeper {
 public:
  RetentionSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry,
                   std::shared_ptr<store::JobStore> store, storage::ArtifactStorePtr artifacts, std::shared_ptr<history::HistoryIndex> history,
                   RetentionSettings settings);
  ~RetentionSweeper();

  // One pass now, then one per interval until Stop().
  void Start();
  void Stop();

  SweepReport SweepOnce(util::TimePoint now);

 private:
  void Loop();

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const modules::ModuleRegistry> registry_;
  std::shared_ptr<store::JobStore>              store_;
  storage::ArtifactStorePtr                     artifacts_;
  std::shared_ptr<history::HistoryIndex>        history_;
  RetentionSettings                             settings_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace jobmeter::retention
