#pragma once

#include "internal/modules/module.hpp"

namespace jobmeter::modules {

/*
  One summary per uploaded document, plus a combined file.

  Round 1 summarizes; every document must succeed and each completed
  document bills one unit. When the job asks for translation, round 2
  translates each summary with the admin glossary. Translation is best
  effort: a failed translation leaves the summary in place and bills
  nothing.
*/
class SummarizerModule final : public TypedModule<v1::SummarizerJob, v1::SummarizerItem> {
 public:
  SummarizerModule();

  std::string ItemArtifactName(const db::model::JobItemRecord& item) const override;

 protected:
  std::map<std::string, std::string> DefaultPrompts() const override;

  void                 Check(v1::SummarizerJob& payload) const override;
  int64_t              Units(const v1::SummarizerJob& payload) const override;
  std::vector<Planned> PlanItems(const v1::SummarizerJob& payload) const override;

  std::string Blocked(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior) const override;

  llm::Request Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                     const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const override;

  std::string Parse(const ItemView& item, const llm::Response& response) const override;

  std::string Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const override;
};

} // namespace jobmeter::modules
