#pragma once

#include "internal/modules/module.hpp"

namespace jobmeter::modules {

inline constexpr uint32_t kReviewSlots = 8;

/*
  Three-round peer review of one manuscript.

    round 1  eight independent reviews, at least four must succeed
    round 2  meta-review over the successful round-1 reviews
    round 3  fact check of the meta-review

  Every request carries the manuscript as an attachment.
*/
class ReviewerModule final : public TypedModule<v1::ReviewerJob, v1::ReviewerItem> {
 public:
  ReviewerModule();

  std::string ItemArtifactName(const db::model::JobItemRecord& item) const override;

 protected:
  std::map<std::string, std::string> DefaultPrompts() const override;

  std::string PrimaryPromptKey() const override {
    return "round1";
  }

  void                 Check(v1::ReviewerJob& payload) const override;
  int64_t              Units(const v1::ReviewerJob& payload) const override;
  std::vector<Planned> PlanItems(const v1::ReviewerJob& payload) const override;

  llm::Request Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                     const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const override;

  std::string Parse(const ItemView& item, const llm::Response& response) const override;

  std::string Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const override;
};

} // namespace jobmeter::modules
