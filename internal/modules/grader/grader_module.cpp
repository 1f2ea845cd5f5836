#include "grader_module.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "internal/util/text.hpp"

namespace jobmeter::modules {
namespace {

worker::ModulePolicy DefaultPolicy() {
  worker::StagePolicy sampling;
  sampling.name            = "sampling";
  sampling.round           = 1;
  sampling.attempt_cap     = 30;
  sampling.concurrency_cap = 1;
  sampling.retry_delay     = std::chrono::milliseconds(500);
  sampling.threshold       = worker::SuccessThreshold::RequireAll();
  sampling.target_samples  = 12;
  sampling.min_samples     = 8;

  worker::ModulePolicy policy;
  policy.stages.push_back(sampling);
  policy.units_on_completion = 1;
  return policy;
}

double Normalize(double value) {
  if (!std::isfinite(value) || value < 0.0) return 0.0;
  return std::min(value, 100.0);
}

} // namespace

v1::GraderSample ParseGraderReply(const std::string& text) {
  google::protobuf::Struct reply;
  try {
    util::FromJson(util::Trim(text), &reply);
  } catch (const std::invalid_argument& e) {
    throw util::ParseError(std::string("invalid grading JSON: ") + e.what());
  }

  const auto& fields = reply.fields();

  v1::GraderSample sample;
  for (std::size_t level = 1; level <= kGraderLevels; ++level) {
    const auto key = "Level " + std::to_string(level);
    auto       it  = fields.find(key);
    if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
      throw util::ParseError("grading reply lacks numeric '" + key + "'");
    }
    sample.add_levels(Normalize(it->second.number_value()));
  }

  for (int i = 1; i < sample.levels_size(); ++i) {
    if (sample.levels(i - 1) > sample.levels(i) + std::numeric_limits<double>::epsilon()) {
      throw util::ParseError("level scores decrease at Level " + std::to_string(i + 1));
    }
  }

  if (auto it = fields.find("justification"); it != fields.end() && it->second.kind_case() == google::protobuf::Value::kStringValue) {
    sample.set_justification(it->second.string_value());
  }
  return sample;
}

double WeightedMean(const v1::GraderSample& sample) {
  double numerator   = 0.0;
  double denominator = 0.0;
  for (std::size_t i = 0; i < kLevelWeights.size() && static_cast<int>(i) < sample.levels_size(); ++i) {
    numerator += sample.levels(static_cast<int>(i)) * kLevelWeights[i];
    denominator += kLevelWeights[i];
  }
  return denominator == 0.0 ? 0.0 : numerator / denominator;
}

InterquartileResult InterquartileMean(const std::vector<double>& values) {
  InterquartileResult result;
  if (values.empty()) return result;

  std::vector<std::size_t> order(values.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });

  const std::size_t n = values.size();
  const std::size_t k = (n + 3) / 4;
  if (n > 2 * k) {
    result.kept.assign(order.begin() + static_cast<std::ptrdiff_t>(k), order.end() - static_cast<std::ptrdiff_t>(k));
  } else {
    result.kept = order;
  }

  double sum = 0.0;
  for (auto idx : result.kept) sum += values[idx];
  result.mean = sum / static_cast<double>(result.kept.size());
  return result;
}

v1::GraderReport BuildGraderReport(const std::vector<v1::GraderSample>& samples) {
  v1::GraderReport report;
  report.set_valid_runs(static_cast<uint32_t>(samples.size()));

  std::vector<double> weighted;
  weighted.reserve(samples.size());
  for (const auto& sample : samples) weighted.push_back(WeightedMean(sample));

  const auto iqm = InterquartileMean(weighted);
  report.set_iqm_score(iqm.mean);
  report.set_kept_runs(static_cast<uint32_t>(iqm.kept.size()));

  std::array<double, kGraderLevels> per_level{};
  for (auto idx : iqm.kept) {
    for (std::size_t level = 0; level < kGraderLevels && static_cast<int>(level) < samples[idx].levels_size(); ++level) {
      per_level[level] += samples[idx].levels(static_cast<int>(level));
    }
  }
  for (auto value : per_level) {
    report.add_per_level(iqm.kept.empty() ? 0.0 : value / static_cast<double>(iqm.kept.size()));
  }

  for (const auto& sample : samples) {
    if (!sample.justification().empty()) {
      report.set_justification(sample.justification());
      break;
    }
  }

  report.set_decision_reason("Weighted score over " + std::to_string(samples.size()) + " valid runs; interquartile mean of " +
                             std::to_string(iqm.kept.size()) + " of them.");
  return report;
}

GraderModule::GraderModule()
    : TypedModule({"grader", "Manuscript grader", "manuscript", "samples"}, DefaultPolicy(), /*estimated_tokens_per_unit=*/150000) {
}

std::map<std::string, std::string> GraderModule::DefaultPrompts() const {
  return {
      {"system",
       "You grade academic manuscripts against six journal tiers, Level 1 being the most selective. For each level give the "
       "probability (0-100) that the manuscript would be accepted at that level; values must not decrease from Level 1 to "
       "Level 6. Reply with a single JSON object with the keys \"Level 1\" through \"Level 6\" and a short \"justification\"."},
  };
}

void GraderModule::Check(v1::GraderJob& payload) const {
  if (util::Trim(payload.manuscript().text()).empty()) {
    throw util::ValidationFailed("manuscript has no text");
  }
  if (payload.manuscript().filename().empty()) {
    payload.mutable_manuscript()->set_filename("manuscript");
  }
}

int64_t GraderModule::Units(const v1::GraderJob&) const {
  return 1;
}

std::vector<GraderModule::Planned> GraderModule::PlanItems(const v1::GraderJob&) const {
  return {Planned{1, 0, v1::GraderItem()}};
}

llm::Request GraderModule::Build(const JobView& job, const ItemView&, const std::vector<ItemView>&, const v1::ModuleSettings& settings,
                                 const db::model::Glossary&) const {
  llm::Request request;
  request.model = ResolveModel(job.payload.model(), settings);
  request.messages.push_back({llm::Role::kSystem, ResolvePrompt(settings, "system")});
  request.messages.push_back({llm::Role::kUser, "Manuscript to grade:\n\n" + job.payload.manuscript().text()});
  return request;
}

std::string GraderModule::Parse(const ItemView&, const llm::Response& response) const {
  return util::ToJson(ParseGraderReply(response.text));
}

std::string GraderModule::FinishItem(const db::model::JobItemRecord&, const std::vector<std::string>& samples) const {
  std::vector<v1::GraderSample> decoded;
  decoded.reserve(samples.size());
  for (const auto& json : samples) {
    v1::GraderSample sample;
    DecodeStored(json, &sample, "grader sample");
    decoded.push_back(std::move(sample));
  }
  return util::ToJson(BuildGraderReport(decoded));
}

std::string GraderModule::Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const {
  for (const auto& item : items) {
    if (item.record.status == jobmeter::model::JobStatus::kCompleted) {
      return store.Write(Descriptor().key, job.record.id, "report.json", item.record.result_text);
    }
  }
  throw util::InvalidState("grader job " + job.record.id + " has no completed sampling item");
}

} // namespace jobmeter::modules
