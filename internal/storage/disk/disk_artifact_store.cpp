#include "disk_artifact_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace jobmeter::storage {

using namespace jobmeter::storage::common;

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

/*
  Atomic write:
      write tmp → flush → rename
*/
std::string DiskArtifactStore::Write(const std::string& module, const std::string& job_id, const std::string& filename,
                                     const std::string& content) {
  const auto final_path = ArtifactPath(root_, module, job_id, filename);
  const auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp");

  std::error_code ec;
  std::filesystem::create_directories(final_path.parent_path(), ec);
  if (ec) {
    throw util::StorageError("create " + final_path.parent_path().string() + ": " + ec.message());
  }

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw util::StorageError("open " + tmp_path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) throw util::StorageError("write " + tmp_path.string());
  }

  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw util::StorageError("rename " + final_path.string() + " failed");
  }
  return final_path.string();
}

std::string DiskArtifactStore::Read(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::NotFound("artifact " + path);

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void DiskArtifactStore::RemoveJobDir(const std::string& module, const std::string& job_id) {
  const auto dir = JobDir(root_, module, job_id);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw util::StorageError("remove " + dir.string() + ": " + ec.message());
  }
}

} // namespace jobmeter::storage
