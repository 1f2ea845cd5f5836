#include "translate_module.hpp"

#include "internal/modules/glossary.hpp"
#include "internal/util/text.hpp"

namespace jobmeter::modules {
namespace {

const std::string kSeparator(kParagraphSeparator);

worker::ModulePolicy DefaultPolicy() {
  worker::StagePolicy chunks;
  chunks.name            = "chunks";
  chunks.round           = 1;
  chunks.attempt_cap     = 3;
  chunks.concurrency_cap = 4;
  chunks.retry_delay     = std::chrono::seconds(1);
  chunks.threshold       = worker::SuccessThreshold::RequireAll();

  worker::ModulePolicy policy;
  policy.stages.push_back(chunks);
  policy.units_on_completion = 1;
  return policy;
}

bool IsSpace(char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v' || c == U'\u3000' || c == U'\u00A0';
}

bool IsCjk(char32_t c) {
  return c >= U'\u4E00' && c <= U'\u9FFF';
}

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace

double EquivalentWords(std::string_view text) {
  double count   = 0.0;
  bool   in_word = false;

  for (char32_t c : util::DecodeUtf8(text)) {
    if (IsSpace(c)) {
      if (in_word) count += 1.0;
      in_word = false;
    } else if (IsCjk(c)) {
      if (in_word) count += 1.0;
      in_word = false;
      count += 0.7;
    } else {
      in_word = true;
    }
  }
  if (in_word) count += 1.0;
  return count;
}

std::vector<v1::TranslateChunk> PlanChunks(const std::vector<std::string>& paragraphs) {
  std::vector<v1::TranslateChunk> chunks;
  v1::TranslateChunk              current;
  double                          current_words = 0.0;

  auto flush = [&] {
    if (current.paragraphs_size() == 0) return;
    chunks.push_back(current);
    current.Clear();
    current_words = 0.0;
  };

  for (std::size_t i = 0; i < paragraphs.size(); ++i) {
    const auto text = util::Trim(paragraphs[i]);
    if (text.empty()) {
      flush();
      continue;
    }

    const double words = EquivalentWords(text);
    if (current.paragraphs_size() > 0 &&
        (static_cast<std::size_t>(current.paragraphs_size()) >= kChunkMaxParagraphs || current_words + words > kChunkMaxEquivalentWords)) {
      flush();
    }

    current.add_paragraph_indices(static_cast<uint32_t>(i));
    current.add_paragraphs(text);
    current_words += words;
  }
  flush();
  return chunks;
}

TranslateModule::TranslateModule()
    : TypedModule({"translatedocx", "Document translator", "document", "chunks"}, DefaultPolicy(), /*estimated_tokens_per_unit=*/40000) {
}

std::map<std::string, std::string> TranslateModule::DefaultPrompts() const {
  return {
      {"system",
       "You are a professional academic translator. Translate faithfully and fluently, keep terminology consistent, and never "
       "add commentary. Paragraph boundaries are marked with {{PARAGRAPH_SEPARATOR}}; reproduce every marker exactly where it "
       "appears. Use these glossary equivalents wherever a listed term occurs:\n{{GLOSSARY}}"},
  };
}

void TranslateModule::Check(v1::TranslateJob& payload) const {
  bool has_text = false;
  for (const auto& paragraph : payload.paragraphs()) {
    if (!util::Trim(paragraph).empty()) {
      has_text = true;
      break;
    }
  }
  if (!has_text) {
    throw util::ValidationFailed("document has no text to translate");
  }
  for (const auto& paragraph : payload.paragraphs()) {
    if (paragraph.find(kSeparator) != std::string::npos) {
      throw util::ValidationFailed("document contains the reserved paragraph marker");
    }
  }

  payload.set_source_language(util::Trim(payload.source_language()));
  payload.set_target_language(util::Trim(payload.target_language()));
  if (payload.source_language().empty() || payload.target_language().empty()) {
    throw util::ValidationFailed("source_language and target_language are required");
  }
  if (payload.source_language() == payload.target_language()) {
    throw util::ValidationFailed("source and target language are the same");
  }
  if (payload.filename().empty()) {
    payload.set_filename("document.docx");
  }
}

int64_t TranslateModule::Units(const v1::TranslateJob&) const {
  return 1;
}

std::vector<TranslateModule::Planned> TranslateModule::PlanItems(const v1::TranslateJob& payload) const {
  const std::vector<std::string> paragraphs(payload.paragraphs().begin(), payload.paragraphs().end());

  std::vector<Planned> planned;
  uint32_t             index = 0;
  for (auto& chunk : PlanChunks(paragraphs)) {
    Planned item;
    item.round   = 1;
    item.index   = index++;
    item.payload = std::move(chunk);
    planned.push_back(std::move(item));
  }
  return planned;
}

llm::Request TranslateModule::Build(const JobView& job, const ItemView& item, const std::vector<ItemView>&,
                                    const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const {
  const std::vector<std::string> parts(item.payload.paragraphs().begin(), item.payload.paragraphs().end());
  const auto                     separators = std::to_string(parts.empty() ? 0 : parts.size() - 1);

  std::string instruction = "Translate the following " + job.payload.source_language() + " paragraphs into " +
                            job.payload.target_language() + ". CRITICAL: You must preserve EXACTLY " + separators +
                            " occurrences of the separator " + kSeparator + " in your output. Each " + kSeparator +
                            " separator marks a paragraph boundary and must appear in the exact same positions in your translation."
                            "\n\nInput text:\n" +
                            util::Join(parts, kSeparator);

  llm::Request request;
  request.model = ResolveModel(job.payload.model(), settings);
  request.messages.push_back(
      {llm::Role::kSystem, ApplyGlossary(ReplaceAll(ResolvePrompt(settings, "system"), "{{PARAGRAPH_SEPARATOR}}", kSeparator), glossary)});
  request.messages.push_back({llm::Role::kUser, std::move(instruction)});
  return request;
}

std::string TranslateModule::Parse(const ItemView& item, const llm::Response& response) const {
  auto segments = util::Split(response.text, kSeparator);
  if (static_cast<int>(segments.size()) != item.payload.paragraphs_size()) {
    throw util::ParseError("expected " + std::to_string(item.payload.paragraphs_size()) + " paragraphs, got " +
                           std::to_string(segments.size()));
  }

  v1::TranslateChunk translated;
  *translated.mutable_paragraph_indices() = item.payload.paragraph_indices();
  for (const auto& segment : segments) {
    translated.add_paragraphs(util::Trim(segment));
  }
  return util::ToJson(translated);
}

std::string TranslateModule::Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const {
  std::vector<std::string> output(job.payload.paragraphs().begin(), job.payload.paragraphs().end());

  for (const auto& item : items) {
    if (item.record.status != jobmeter::model::JobStatus::kCompleted) continue;

    v1::TranslateChunk translated;
    DecodeStored(item.record.result_text, &translated, "translated chunk");
    for (int k = 0; k < translated.paragraph_indices_size() && k < translated.paragraphs_size(); ++k) {
      const auto index = translated.paragraph_indices(k);
      if (index < output.size()) output[index] = translated.paragraphs(k);
    }
  }

  return store.Write(Descriptor().key, job.record.id, "translated.txt", util::Join(output, "\n\n"));
}

} // namespace jobmeter::modules
