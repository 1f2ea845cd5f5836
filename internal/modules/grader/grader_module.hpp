#pragma once

#include <array>
#include <vector>

#include "internal/modules/module.hpp"

namespace jobmeter::modules {

inline constexpr std::size_t             kGraderLevels = 6;
inline constexpr std::array<double, 6>   kLevelWeights = {4.0, 2.0, 1.0, 1.0, 1.0, 1.0};

/*
  Parses one grading reply:

    {"Level 1": 40, ..., "Level 6": 90, "justification": "..."}

  Scores are clamped to [0, 100] (non-finite -> 0). A reply whose levels
  decrease is not a valid sample. Throws util::ParseError.
*/
v1::GraderSample ParseGraderReply(const std::string& text);

double WeightedMean(const v1::GraderSample& sample);

struct InterquartileResult {
  double                   mean = 0.0;
  std::vector<std::size_t> kept; // indices into the input, ascending by value
};

// Drops ceil(n/4) values from each end when more than half would remain.
InterquartileResult InterquartileMean(const std::vector<double>& values);

// Aggregates valid samples into the job report.
v1::GraderReport BuildGraderReport(const std::vector<v1::GraderSample>& samples);

/*
  Manuscript grading by repeated sampling.

  A single item collects up to 12 valid replies over at most 30 attempts;
  8 valid replies are enough to grade. The report is the interquartile
  mean of the per-sample weighted scores.
*/
class GraderModule final : public TypedModule<v1::GraderJob, v1::GraderItem> {
 public:
  GraderModule();

  std::string FinishItem(const db::model::JobItemRecord& item, const std::vector<std::string>& samples) const override;

 protected:
  std::map<std::string, std::string> DefaultPrompts() const override;

  void                 Check(v1::GraderJob& payload) const override;
  int64_t              Units(const v1::GraderJob& payload) const override;
  std::vector<Planned> PlanItems(const v1::GraderJob& payload) const override;

  llm::Request Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                     const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const override;

  std::string Parse(const ItemView& item, const llm::Response& response) const override;

  std::string Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const override;
};

} // namespace jobmeter::modules
