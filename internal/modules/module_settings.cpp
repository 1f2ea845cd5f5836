#include "module_settings.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"

namespace jobmeter::modules {

ModuleSettingsStore::ModuleSettingsStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const ModuleRegistry> registry)
    : repository_(std::move(repository)), registry_(std::move(registry)) {
}

uint32_t ModuleSettingsStore::EnsureDefaults(util::TimePoint now) {
  auto     tx      = repository_->Begin();
  uint32_t written = 0;
  for (const auto& module : registry_->All()) {
    const auto& key = module->Descriptor().key;
    if (repository_->GetModuleSettings(*tx, key)) continue;

    Save(*tx, key, module->DefaultSettings(), now);
    ++written;
    JOBMETER_LOG_INFO("module settings initialized", {observability::StringField("module", key)});
  }
  tx->Commit();
  return written;
}

v1::ModuleSettings ModuleSettingsStore::Load(db::Transaction& tx, const std::string& module) {
  auto runtime = registry_->Require(module);

  auto row = repository_->GetModuleSettings(tx, module);
  if (!row) return runtime->DefaultSettings();

  v1::ModuleSettings settings;
  DecodeStored(row->settings_json, &settings, module + " settings");
  return settings;
}

v1::ModuleSettings ModuleSettingsStore::Load(const std::string& module) {
  auto tx       = repository_->Begin();
  auto settings = Load(*tx, module);
  tx->Commit();
  return settings;
}

v1::ModuleSettings ModuleSettingsStore::UpdateModels(const std::string& module, const std::vector<std::string>& models, util::TimePoint now) {
  auto tx       = repository_->Begin();
  auto settings = Load(*tx, module);

  settings.clear_models();
  for (const auto& model : models) {
    if (!model.empty()) settings.add_models(model);
  }
  if (settings.models_size() == 0) {
    throw util::ValidationFailed("at least one model is required");
  }

  Save(*tx, module, settings, now);
  tx->Commit();
  return settings;
}

v1::ModuleSettings ModuleSettingsStore::UpdatePrompts(const std::string& module, const std::map<std::string, std::string>& prompts,
                                                       util::TimePoint now) {
  auto       tx       = repository_->Begin();
  auto       settings = Load(*tx, module);
  const auto defaults = registry_->Require(module)->DefaultSettings();

  auto& stored = *settings.mutable_prompts();
  for (const auto& [key, text] : prompts) {
    if (defaults.prompts().find(key) == defaults.prompts().end()) {
      throw util::ValidationFailed("module " + module + " has no prompt '" + key + "'");
    }
    stored[key] = text;
  }

  Save(*tx, module, settings, now);
  tx->Commit();
  return settings;
}

void ModuleSettingsStore::Save(db::Transaction& tx, const std::string& module, const v1::ModuleSettings& settings, util::TimePoint now) {
  db::model::ModuleSettingsRecord row;
  row.module        = module;
  row.settings_json = util::ToJson(settings);
  row.updated_at_ms = util::ToUnixMillis(now);
  db::ThrowIfDbError(repository_->UpsertModuleSettings(tx, row), "save module settings");
}

} // namespace jobmeter::modules
