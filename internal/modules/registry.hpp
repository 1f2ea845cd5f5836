#pragma once

#include <memory>
#include <string>
#include <vector>

#include "module.hpp"

namespace jobmeter::runtime::config {
class RuntimeConfig;
}

namespace jobmeter::modules {

/*
  Startup-time list of the modules this process serves.

  Built once by the composition root and handed to every component that
  needs to enumerate modules. Not modified after startup.
*/
class ModuleRegistry {
 public:
  // Throws std::invalid_argument for a key unusable as a table prefix,
  // util::AlreadyExists for a duplicate key.
  void Add(std::shared_ptr<ModuleRuntime> module);

  std::shared_ptr<ModuleRuntime> Find(const std::string& key) const;

  // Throws util::NotFound.
  std::shared_ptr<ModuleRuntime> Require(const std::string& key) const;

  std::vector<std::string> Keys() const;

  const std::vector<std::shared_ptr<ModuleRuntime>>& All() const {
    return modules_;
  }

 private:
  std::vector<std::shared_ptr<ModuleRuntime>> modules_;
};

// The five built-in modules with config overrides applied. Disabled
// modules are left out; config for an unknown module key throws
// std::invalid_argument.
std::shared_ptr<ModuleRegistry> BuiltinModules(const jobmeter::runtime::config::RuntimeConfig& config);

} // namespace jobmeter::modules
