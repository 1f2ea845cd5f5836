#include "registry.hpp"

#include <stdexcept>

#include "config/config.pb.h"
#include "internal/db/sql/schema.hpp"
#include "internal/modules/grader/grader_module.hpp"
#include "internal/modules/info_extract/info_extract_module.hpp"
#include "internal/modules/reviewer/reviewer_module.hpp"
#include "internal/modules/summarizer/summarizer_module.hpp"
#include "internal/modules/translatedocx/translate_module.hpp"

namespace jobmeter::modules {

void ModuleRegistry::Add(std::shared_ptr<ModuleRuntime> module) {
  if (!module) {
    throw std::invalid_argument("null module");
  }
  const auto& key = module->Descriptor().key;
  if (!db::sql::IsValidModuleKey(key)) {
    throw std::invalid_argument("invalid module key '" + key + "'");
  }
  if (Find(key)) {
    throw util::AlreadyExists("module " + key + " already registered");
  }
  modules_.push_back(std::move(module));
}

std::shared_ptr<ModuleRuntime> ModuleRegistry::Find(const std::string& key) const {
  for (const auto& module : modules_) {
    if (module->Descriptor().key == key) return module;
  }
  return nullptr;
}

std::shared_ptr<ModuleRuntime> ModuleRegistry::Require(const std::string& key) const {
  auto module = Find(key);
  if (!module) throw util::NotFound("unknown module '" + key + "'");
  return module;
}

std::vector<std::string> ModuleRegistry::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(modules_.size());
  for (const auto& module : modules_) keys.push_back(module->Descriptor().key);
  return keys;
}

std::shared_ptr<ModuleRegistry> BuiltinModules(const jobmeter::runtime::config::RuntimeConfig& config) {
  std::vector<std::shared_ptr<ModuleRuntime>> builtin = {
      std::make_shared<SummarizerModule>(), std::make_shared<TranslateModule>(), std::make_shared<GraderModule>(),
      std::make_shared<InfoExtractModule>(), std::make_shared<ReviewerModule>(),
  };

  for (const auto& module_cfg : config.modules()) {
    bool known = false;
    for (const auto& module : builtin) {
      if (module->Descriptor().key == module_cfg.key()) known = true;
    }
    if (!known) {
      throw std::invalid_argument("config names unknown module '" + module_cfg.key() + "'");
    }
  }

  auto registry = std::make_shared<ModuleRegistry>();
  for (auto& module : builtin) {
    bool disabled = false;
    for (const auto& module_cfg : config.modules()) {
      if (module_cfg.key() != module->Descriptor().key) continue;
      module->Configure(module_cfg);
      disabled = module_cfg.disabled();
    }
    if (!disabled) registry->Add(std::move(module));
  }
  return registry;
}

} // namespace jobmeter::modules
