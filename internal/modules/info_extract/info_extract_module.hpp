#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <vector>

#include "internal/modules/module.hpp"

namespace jobmeter::modules {

inline constexpr int         kMaxExtractDocuments = 100;
inline constexpr std::size_t kMaxDocumentChars    = 20000;

// JSON object in the reply, or the span from its first '{' to its last '}'.
// Throws util::ParseError.
google::protobuf::Struct ExtractObject(const std::string& reply);

// Flattens a JSON value into one CSV cell; lists join with "；".
std::string ValueToCell(const google::protobuf::Value& value);

// RFC 4180 field quoting.
std::string CsvField(const std::string& value);

/*
  Structured field extraction, one item per document.

  Any single successful document completes the job; each successful
  document bills one unit. The result is a CSV with one row per
  successful document.
*/
class InfoExtractModule final : public TypedModule<v1::InfoExtractJob, v1::InfoExtractItem> {
 public:
  InfoExtractModule();

 protected:
  std::map<std::string, std::string> DefaultPrompts() const override;

  void                 Check(v1::InfoExtractJob& payload) const override;
  int64_t              Units(const v1::InfoExtractJob& payload) const override;
  std::vector<Planned> PlanItems(const v1::InfoExtractJob& payload) const override;

  llm::Request Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                     const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const override;

  std::string Parse(const ItemView& item, const llm::Response& response) const override;

  std::string Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const override;
};

} // namespace jobmeter::modules
