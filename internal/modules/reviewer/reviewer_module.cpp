#include "reviewer_module.hpp"

#include "internal/util/text.hpp"

namespace jobmeter::modules {
namespace {

using jobmeter::model::JobStatus;

worker::StagePolicy Stage(std::string name, uint32_t round, uint32_t concurrency, worker::SuccessThreshold threshold) {
  worker::StagePolicy stage;
  stage.name            = std::move(name);
  stage.round           = round;
  stage.attempt_cap     = 3;
  stage.concurrency_cap = concurrency;
  stage.retry_delay     = std::chrono::seconds(2);
  stage.threshold       = threshold;
  return stage;
}

worker::ModulePolicy DefaultPolicy() {
  worker::ModulePolicy policy;
  policy.stages.push_back(Stage("reviews", 1, kReviewSlots, worker::SuccessThreshold::RequireAtLeast(4)));
  policy.stages.push_back(Stage("meta_review", 2, 1, worker::SuccessThreshold::RequireAll()));
  policy.stages.push_back(Stage("fact_check", 3, 1, worker::SuccessThreshold::RequireAll()));
  policy.units_on_completion = 1;
  return policy;
}

llm::Attachment ManuscriptAttachment(const v1::SourceDocument& manuscript) {
  llm::Attachment attachment;
  attachment.filename     = manuscript.filename();
  attachment.content_type = "text/plain";
  attachment.kind         = llm::AttachmentKind::kText;
  attachment.bytes        = manuscript.text();
  return attachment;
}

} // namespace

ReviewerModule::ReviewerModule()
    : TypedModule({"reviewer", "Peer reviewer", "manuscript", "review rounds"}, DefaultPolicy(), /*estimated_tokens_per_unit=*/200000) {
}

std::map<std::string, std::string> ReviewerModule::DefaultPrompts() const {
  return {
      {"round1",
       "Act as an expert peer reviewer for the attached manuscript. Assess novelty, methodology, evidence, clarity and "
       "relevance, list major and minor concerns, and end with a recommendation."},
      {"round2",
       "You are the handling editor. Below are independent reviews of the attached manuscript. Consolidate them into a single "
       "review report: merge overlapping points, resolve disagreements, and keep only well supported criticism."},
      {"round3",
       "Fact-check the review report below against the attached manuscript. Remove or correct any claim the manuscript does not "
       "support and return the corrected report."},
  };
}

void ReviewerModule::Check(v1::ReviewerJob& payload) const {
  if (util::Trim(payload.manuscript().text()).empty()) {
    throw util::ValidationFailed("manuscript has no text");
  }
  if (payload.manuscript().filename().empty()) {
    payload.mutable_manuscript()->set_filename("manuscript.txt");
  }
}

int64_t ReviewerModule::Units(const v1::ReviewerJob&) const {
  return 1;
}

std::vector<ReviewerModule::Planned> ReviewerModule::PlanItems(const v1::ReviewerJob&) const {
  std::vector<Planned> planned;
  for (uint32_t i = 0; i < kReviewSlots; ++i) {
    Planned slot;
    slot.round = 1;
    slot.index = i;
    slot.payload.set_role("review");
    planned.push_back(std::move(slot));
  }

  Planned meta;
  meta.round = 2;
  meta.payload.set_role("meta_review");
  planned.push_back(std::move(meta));

  Planned fact_check;
  fact_check.round = 3;
  fact_check.payload.set_role("fact_check");
  planned.push_back(std::move(fact_check));
  return planned;
}

llm::Request ReviewerModule::Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                                   const v1::ModuleSettings& settings, const db::model::Glossary&) const {
  std::string prompt;
  switch (item.record.round) {
    case 1:
      prompt = ResolvePrompt(settings, "round1");
      break;
    case 2: {
      std::string combined;
      int         n = 0;
      for (const auto& review : prior) {
        if (review.record.round != 1 || review.record.status != JobStatus::kCompleted) continue;
        combined += "=== Review " + std::to_string(++n) + " ===\n\n" + review.record.result_text + "\n\n";
      }
      prompt = ResolvePrompt(settings, "round2") + "\n\n" + combined;
      break;
    }
    case 3: {
      std::string report;
      for (const auto& meta : prior) {
        if (meta.record.round == 2 && meta.record.status == JobStatus::kCompleted) report = meta.record.result_text;
      }
      if (report.empty()) {
        throw util::InvalidState("reviewer job " + job.record.id + " has no meta-review to check");
      }
      prompt = ResolvePrompt(settings, "round3") + "\n\n=== Review Report ===\n\n" + report;
      break;
    }
    default:
      throw util::InvalidState("reviewer has no round " + std::to_string(item.record.round));
  }

  llm::Request request;
  request.model = ResolveModel(job.payload.model(), settings);
  request.messages.push_back({llm::Role::kUser, std::move(prompt)});
  request.attachments.push_back(ManuscriptAttachment(job.payload.manuscript()));
  return request;
}

std::string ReviewerModule::Parse(const ItemView& item, const llm::Response& response) const {
  auto text = util::Trim(response.text);
  if (text.empty()) {
    throw util::ParseError("empty " + item.payload.role());
  }
  return text;
}

std::string ReviewerModule::ItemArtifactName(const db::model::JobItemRecord& item) const {
  switch (item.round) {
    case 1:
      return "review_" + std::to_string(item.index + 1) + ".txt";
    case 2:
      return "meta_review.txt";
    case 3:
      return "fact_check.txt";
    default:
      return {};
  }
}

std::string ReviewerModule::Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const {
  std::string meta;
  std::string checked;
  std::string reviews;
  int         n = 0;

  for (const auto& item : items) {
    if (item.record.status != JobStatus::kCompleted) continue;
    if (item.record.round == 1) {
      reviews += "=== Review " + std::to_string(++n) + " ===\n\n" + item.record.result_text + "\n\n";
    } else if (item.record.round == 2) {
      meta = item.record.result_text;
    } else if (item.record.round == 3) {
      checked = item.record.result_text;
    }
  }

  std::string report = "=== Final Report ===\n\n" + checked + "\n\n";
  report += "=== Meta Review ===\n\n" + meta + "\n\n";
  report += reviews;
  return store.Write(Descriptor().key, job.record.id, "final_report.txt", report);
}

} // namespace jobmeter::modules
