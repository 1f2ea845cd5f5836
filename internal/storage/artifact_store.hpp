#pragma once

#include <memory>
#include <string>

namespace jobmeter::storage {

/*
  Job artifact storage.

  Every job owns one directory, <root>/<module>/<job_id>/. Paths handed
  back by Write() are what the job store persists as output_path.

  Implementations:
    DISK → local filesystem, atomic replace writes
*/

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist one artifact of a job and return its path.

    Throws util::StorageError on I/O failure and std::invalid_argument for
    a module, job id or file name that would escape the job directory.
  */
  virtual std::string Write(const std::string& module, const std::string& job_id, const std::string& filename, const std::string& content) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::string Read(const std::string& path) = 0;

  // ------------------------------------------------------------------
  // Remove
  // ------------------------------------------------------------------
  /*
    Delete a job's directory and everything in it. A directory that does
    not exist counts as removed. Throws util::StorageError otherwise.
  */
  virtual void RemoveJobDir(const std::string& module, const std::string& job_id) = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace jobmeter::storage
