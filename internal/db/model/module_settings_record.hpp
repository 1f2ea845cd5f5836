#pragma once

#include <cstdint>
#include <string>

namespace jobmeter::db::model {

struct ModuleSettingsRecord {
  std::string module;
  std::string settings_json; // jobmeter.modules.v1.ModuleSettings
  int64_t     updated_at_ms = 0;
};

} // namespace jobmeter::db::model
