#include "module.hpp"

#include "config/config.pb.h"

namespace jobmeter::modules {

ModuleRuntime::ModuleRuntime(ModuleDescriptor descriptor, worker::ModulePolicy policy, int64_t estimated_tokens_per_unit)
    : descriptor_(std::move(descriptor)), policy_(std::move(policy)), estimated_tokens_per_unit_(estimated_tokens_per_unit) {
}

void ModuleRuntime::Configure(const jobmeter::runtime::config::ModuleConfig& config) {
  worker::ApplyOverrides(policy_, config);
  if (config.estimated_tokens_per_unit() > 0) {
    estimated_tokens_per_unit_ = static_cast<int64_t>(config.estimated_tokens_per_unit());
  }
  default_model_  = config.model();
  default_prompt_ = config.prompt();
}

v1::ModuleSettings ModuleRuntime::DefaultSettings() const {
  v1::ModuleSettings settings;
  if (!default_model_.empty()) {
    settings.add_models(default_model_);
  }
  auto& prompts = *settings.mutable_prompts();
  for (const auto& [key, text] : DefaultPrompts()) {
    prompts[key] = text;
  }
  if (!default_prompt_.empty()) {
    prompts[PrimaryPromptKey()] = default_prompt_;
  }
  return settings;
}

std::string ModuleRuntime::FinishItem(const db::model::JobItemRecord&, const std::vector<std::string>& samples) const {
  return samples.empty() ? std::string() : samples.back();
}

std::string ModuleRuntime::ItemArtifactName(const db::model::JobItemRecord&) const {
  return {};
}

std::string ModuleRuntime::ResolveModel(const std::string& requested, const v1::ModuleSettings& settings) const {
  if (!requested.empty()) return requested;
  if (settings.models_size() > 0 && !settings.models(0).empty()) return settings.models(0);
  if (!default_model_.empty()) return default_model_;
  throw util::InvalidState("no model configured for module " + descriptor_.key);
}

std::string ModuleRuntime::ResolvePrompt(const v1::ModuleSettings& settings, const std::string& key) const {
  auto it = settings.prompts().find(key);
  if (it != settings.prompts().end() && !it->second.empty()) return it->second;

  if (key == PrimaryPromptKey() && !default_prompt_.empty()) return default_prompt_;

  const auto builtin = DefaultPrompts();
  auto       found   = builtin.find(key);
  if (found == builtin.end()) {
    throw util::InvalidState("module " + descriptor_.key + " has no prompt '" + key + "'");
  }
  return found->second;
}

void DecodeStored(const std::string& json, google::protobuf::Message* message, const std::string& what) {
  try {
    util::FromJson(json, message);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidState("corrupt " + what + ": " + e.what());
  }
}

} // namespace jobmeter::modules
