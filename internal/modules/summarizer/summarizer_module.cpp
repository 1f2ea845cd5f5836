#include "summarizer_module.hpp"

#include "internal/modules/glossary.hpp"
#include "internal/util/text.hpp"

namespace jobmeter::modules {
namespace {

constexpr uint32_t kMaxDocuments = 100;

worker::ModulePolicy DefaultPolicy() {
  worker::StagePolicy documents;
  documents.name            = "documents";
  documents.round           = 1;
  documents.attempt_cap     = 3;
  documents.concurrency_cap = 5;
  documents.retry_delay     = std::chrono::seconds(1);
  documents.threshold       = worker::SuccessThreshold::RequireAll();
  documents.units_per_item  = 1;

  worker::StagePolicy translations;
  translations.name            = "translations";
  translations.round           = 2;
  translations.attempt_cap     = 3;
  translations.concurrency_cap = 5;
  translations.retry_delay     = std::chrono::seconds(1);
  translations.threshold       = worker::SuccessThreshold::RequireNone();

  worker::ModulePolicy policy;
  policy.stages.push_back(documents);
  policy.stages.push_back(translations);
  return policy;
}

constexpr const char* kDefaultTranslationLanguage = "Chinese";

const JobItem<v1::SummarizerItem>* SummaryFor(uint32_t index, const std::vector<JobItem<v1::SummarizerItem>>& prior) {
  for (const auto& item : prior) {
    if (item.record.round == 1 && item.record.index == index && item.record.status == jobmeter::model::JobStatus::kCompleted) {
      return &item;
    }
  }
  return nullptr;
}

} // namespace

SummarizerModule::SummarizerModule()
    : TypedModule({"summarizer", "Summarizer", "document", "documents"}, DefaultPolicy(), /*estimated_tokens_per_unit=*/6000) {
}

std::map<std::string, std::string> SummarizerModule::DefaultPrompts() const {
  return {
      {"system",
       "You summarize academic and professional documents. Produce a faithful, well structured summary covering the purpose, "
       "methods, key findings and conclusions. Do not invent facts that are not in the text."},
      {"translation",
       "You are an expert translator for academic manuscripts. Maintain academic tone and style. Use the following glossary "
       "entries for consistent terminology (each line is source = target):\n{{GLOSSARY}}\nPreserve citations, references, and "
       "technical terms."},
  };
}

void SummarizerModule::Check(v1::SummarizerJob& payload) const {
  if (payload.documents_size() == 0) {
    throw util::ValidationFailed("at least one document is required");
  }
  if (payload.documents_size() > static_cast<int>(kMaxDocuments)) {
    throw util::ValidationFailed("at most " + std::to_string(kMaxDocuments) + " documents per job");
  }

  for (int i = 0; i < payload.documents_size(); ++i) {
    auto* doc = payload.mutable_documents(i);
    if (util::Trim(doc->text()).empty()) {
      throw util::ValidationFailed("document " + std::to_string(i + 1) + " has no text");
    }
    if (doc->filename().empty()) {
      doc->set_filename("document_" + std::to_string(i + 1));
    }
  }
  payload.set_target_language(util::Trim(payload.target_language()));

  if (payload.translate()) {
    payload.set_translation_language(util::Trim(payload.translation_language()));
    if (payload.translation_language().empty()) payload.set_translation_language(kDefaultTranslationLanguage);
    payload.set_translation_model(util::Trim(payload.translation_model()));
  } else {
    payload.clear_translation_language();
    payload.clear_translation_model();
  }
}

int64_t SummarizerModule::Units(const v1::SummarizerJob& payload) const {
  return payload.documents_size();
}

std::vector<SummarizerModule::Planned> SummarizerModule::PlanItems(const v1::SummarizerJob& payload) const {
  std::vector<Planned> planned;
  for (int i = 0; i < payload.documents_size(); ++i) {
    Planned item;
    item.round = 1;
    item.index = static_cast<uint32_t>(i);
    *item.payload.mutable_document() = payload.documents(i);
    planned.push_back(item);

    if (payload.translate()) {
      item.round = 2;
      planned.push_back(std::move(item));
    }
  }
  return planned;
}

std::string SummarizerModule::Blocked(const JobView&, const ItemView& item, const std::vector<ItemView>& prior) const {
  if (item.record.round != 2 || SummaryFor(item.record.index, prior)) return {};
  return "no summary to translate";
}

llm::Request SummarizerModule::Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                                     const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const {
  if (item.record.round == 2) {
    const auto* summary = SummaryFor(item.record.index, prior);
    if (!summary) {
      throw util::InvalidState("no summary for document " + std::to_string(item.record.index + 1));
    }

    llm::Request request;
    if (!job.payload.translation_model().empty()) {
      request.model = job.payload.translation_model();
    } else if (settings.models_size() > 1 && !settings.models(1).empty()) {
      request.model = settings.models(1);
    } else {
      request.model = ResolveModel(job.payload.model(), settings);
    }
    request.messages.push_back({llm::Role::kSystem, ApplyGlossary(ResolvePrompt(settings, "translation"), glossary)});
    request.messages.push_back({llm::Role::kUser, "Translate the following text to " + job.payload.translation_language() +
                                                      " while adhering to the glossary:\n\n" + summary->record.result_text});
    return request;
  }

  auto prompt = ResolvePrompt(settings, "system");
  if (!job.payload.target_language().empty()) {
    prompt += "\n\nWrite the summary in " + job.payload.target_language() + ".";
  }

  llm::Request request;
  request.model = ResolveModel(job.payload.model(), settings);
  request.messages.push_back({llm::Role::kSystem, prompt});
  request.messages.push_back({llm::Role::kUser, item.payload.document().text()});
  return request;
}

std::string SummarizerModule::Parse(const ItemView& item, const llm::Response& response) const {
  auto text = util::Trim(response.text);
  if (text.empty()) {
    throw util::ParseError(item.record.round == 2 ? "empty translation" : "empty summary");
  }
  return text;
}

std::string SummarizerModule::ItemArtifactName(const db::model::JobItemRecord& item) const {
  const auto* stem = item.round == 2 ? "translation_" : "summary_";
  return stem + std::to_string(item.index + 1) + ".txt";
}

std::string SummarizerModule::Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const {
  std::string combined;
  std::string translated;
  for (const auto& item : items) {
    if (item.record.status != jobmeter::model::JobStatus::kCompleted) continue;
    auto& target = item.record.round == 2 ? translated : combined;
    target += "## " + item.payload.document().filename() + "\n\n";
    target += item.record.result_text;
    target += "\n\n";
  }

  // written only when at least one translation came back
  if (!translated.empty()) {
    store.Write(Descriptor().key, job.record.id, "combined_translation.txt", translated);
  }
  return store.Write(Descriptor().key, job.record.id, "combined_summary.txt", combined);
}

} // namespace jobmeter::modules
