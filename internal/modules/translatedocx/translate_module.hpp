#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/modules/module.hpp"

namespace jobmeter::modules {

inline constexpr std::string_view kParagraphSeparator = "[[__PARAGRAPH_BREAK__]]";

inline constexpr std::size_t kChunkMaxParagraphs      = 20;
inline constexpr double      kChunkMaxEquivalentWords = 700.0;

// Whitespace-separated words count 1, each CJK ideograph 0.7.
double EquivalentWords(std::string_view text);

/*
  Groups paragraphs into translation chunks. A blank paragraph closes the
  current chunk and is left out; a chunk closes before it would pass 20
  paragraphs or 700 equivalent words.
*/
std::vector<v1::TranslateChunk> PlanChunks(const std::vector<std::string>& paragraphs);

/*
  Paragraph-preserving document translation.

  Each chunk is sent joined by kParagraphSeparator; the reply must carry
  the same number of segments or it is rejected and retried. Every chunk
  must succeed. One unit per completed document.
*/
class TranslateModule final : public TypedModule<v1::TranslateJob, v1::TranslateChunk> {
 public:
  TranslateModule();

 protected:
  std::map<std::string, std::string> DefaultPrompts() const override;

  void                 Check(v1::TranslateJob& payload) const override;
  int64_t              Units(const v1::TranslateJob& payload) const override;
  std::vector<Planned> PlanItems(const v1::TranslateJob& payload) const override;

  llm::Request Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                     const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const override;

  std::string Parse(const ItemView& item, const llm::Response& response) const override;

  std::string Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const override;
};

} // namespace jobmeter::modules
