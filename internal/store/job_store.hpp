#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace jobmeter::store {

/*
  Job Store: the only writer of job and item status.

  Every status write goes through model::CanTransition; an illegal edge
  throws util::InvalidState and leaves the row untouched. Calls run inside
  the caller's transaction so admission, progress and usage can commit
  together.
*/
class JobStore {
 public:
  explicit JobStore(std::shared_ptr<db::Repository> repository);

  // Inserts a Pending job with its planned items.
  void Create(db::Transaction& tx, const db::model::JobRecord& job, const std::vector<db::model::JobItemRecord>& items);

  std::optional<db::model::JobRecord> Get(db::Transaction& tx, const std::string& module, const std::string& id);

  // Throws util::NotFound.
  db::model::JobRecord Require(db::Transaction& tx, const std::string& module, const std::string& id);

  std::vector<db::model::JobItemRecord> Items(db::Transaction& tx, const std::string& module, const std::string& id);

  // Pending -> Processing. nullopt when the job is gone or already claimed.
  std::optional<db::model::JobRecord> Claim(db::Transaction& tx, const std::string& module, const std::string& id, util::TimePoint now);

  // Progress note on a non-terminal job.
  void SetDetail(db::Transaction& tx, const std::string& module, const std::string& id, const std::string& detail, util::TimePoint now);

  // usage_delta only grows
  void AddUsage(db::Transaction& tx, const std::string& module, const std::string& id, int64_t units, util::TimePoint now);

  // Moves a job to Completed or Failed.
  db::model::JobRecord Finish(db::Transaction& tx, const std::string& module, const std::string& id, model::JobStatus status,
                              const std::string& detail, const std::string& error_message, const std::string& output_path,
                              util::TimePoint now);

  // Writes an item. A status change must be a legal edge; a same-status
  // write is allowed only on a non-terminal item.
  void SaveItem(db::Transaction& tx, const std::string& module, const db::model::JobItemRecord& item, util::TimePoint now);

  std::vector<db::model::JobRecord> PurgeCandidates(db::Transaction& tx, const std::string& module, util::TimePoint created_before);

  // false when the job was already purged or is not terminal
  bool MarkPurged(db::Transaction& tx, const std::string& module, const std::string& id, util::TimePoint now);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace jobmeter::store
