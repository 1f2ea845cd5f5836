#pragma once

#include <filesystem>

#include "internal/storage/artifact_store.hpp"

namespace jobmeter::storage {

/*
  Local filesystem artifact store.

  Properties:
    - atomic replace writes (tmp file + rename)
    - job directories created on first write
*/

class DiskArtifactStore : public ArtifactStore {
 public:
  explicit DiskArtifactStore(std::filesystem::path root);

  std::string Write(const std::string& module, const std::string& job_id, const std::string& filename, const std::string& content) override;

  std::string Read(const std::string& path) override;

  void RemoveJobDir(const std::string& module, const std::string& job_id) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace jobmeter::storage
