#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "api/jobmeter/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobmeter::modules {
class ModuleRegistry;
}

namespace jobmeter::history {

struct HistorySettings {
  // entries older than this are neither listed nor kept
  util::Duration max_age = std::chrono::hours(24);
  // newest entries kept per (user, module)
  uint32_t limit = 50;
};

/*
  user_job_history: one row per submitted job, unique on (module, job_key).

  The index is a pointer, not a cache. Status is read from the module's
  job table every time an entry is listed.
*/
class HistoryIndex {
 public:
  HistoryIndex(std::shared_ptr<db::Repository> repository, std::shared_ptr<const modules::ModuleRegistry> registry, HistorySettings settings);

  // Inside the admission transaction. Re-recording a job is a no-op.
  void RecordJobStart(db::Transaction& tx, const std::string& user_id, const std::string& module, const std::string& job_key,
                      util::TimePoint now);

  /*
    Newest first, joined with live job status. `module` empty means all
    modules; an unregistered module throws util::NotFound. `limit` is
    clamped to [1, settings.limit].
  */
  std::vector<v1::HistoryEntry> FetchRecent(const std::string& user_id, const std::string& module, uint32_t limit, util::TimePoint now);

  // Drops entries past max_age, then trims every (user, module) to limit.
  void PurgeStale(util::TimePoint now);

  const HistorySettings& Settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const modules::ModuleRegistry> registry_;
  HistorySettings                               settings_;
};

} // namespace jobmeter::history
