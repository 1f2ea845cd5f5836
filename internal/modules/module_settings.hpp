#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "api/jobmeter/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "registry.hpp"

namespace jobmeter::modules {

/*
  Admin-editable model and prompt selection (module_configs).

  Read when a job's requests are built; a module without a row uses its
  built-in defaults.
*/
class ModuleSettingsStore {
 public:
  ModuleSettingsStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const ModuleRegistry> registry);

  // Writes the default row of every registered module that has none.
  // Returns the number of rows written.
  uint32_t EnsureDefaults(util::TimePoint now);

  // Throws util::NotFound for an unregistered module.
  v1::ModuleSettings Load(db::Transaction& tx, const std::string& module);
  v1::ModuleSettings Load(const std::string& module);

  // Empty model names are dropped; throws util::ValidationFailed when
  // none remain.
  v1::ModuleSettings UpdateModels(const std::string& module, const std::vector<std::string>& models, util::TimePoint now);

  // Merges into the stored prompts. Keys the module does not use are
  // rejected with util::ValidationFailed.
  v1::ModuleSettings UpdatePrompts(const std::string& module, const std::map<std::string, std::string>& prompts, util::TimePoint now);

 private:
  void Save(db::Transaction& tx, const std::string& module, const v1::ModuleSettings& settings, util::TimePoint now);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<const ModuleRegistry> registry_;
};

} // namespace jobmeter::modules
