#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace jobmeter::storage::common {

// Rejects anything that is not a single, plain path component.
inline void ValidateComponent(const std::string& component, const char* what) {
  if (component.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline std::filesystem::path JobDir(const std::filesystem::path& root, const std::string& module, const std::string& job_id) {
  ValidateComponent(module, "module");
  ValidateComponent(job_id, "job id");
  return root / module / job_id;
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& module, const std::string& job_id,
                                          const std::string& filename) {
  ValidateComponent(filename, "artifact name");
  return JobDir(root, module, job_id) / filename;
}

} // namespace jobmeter::storage::common
